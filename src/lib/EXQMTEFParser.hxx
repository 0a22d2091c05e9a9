/* -*- Mode: C++; c-default-style: "k&r"; indent-tabs-mode: nil; tab-width: 2; c-basic-offset: 2 -*- */
/* libexq
* Version: MPL 2.0 / LGPLv2+
*
* The contents of this file are subject to the Mozilla Public License Version
* 2.0 (the "License"); you may not use this file except in compliance with
* the License or as specified alternatively below. You may obtain a copy of
* the License at http://www.mozilla.org/MPL/
*
* Software distributed under the License is distributed on an "AS IS" basis,
* WITHOUT WARRANTY OF ANY KIND, either express or implied. See the License
* for the specific language governing rights and limitations under the
* License.
*
* For the list of contributors see the git repository.
*
* Alternatively, the contents of this file may be used under the terms of
* the GNU Lesser General Public License Version 2 or later (the "LGPLv2+"),
* in which case the provisions of the LGPLv2+ are applicable
* instead of those above.
*/

#ifndef EXQ_MTEF_PARSER
#define EXQ_MTEF_PARSER

#include <memory>
#include <string>
#include <vector>

#include <libexq/EXQEquationConverter.hxx>

#include "EXQInputStream.hxx"

namespace EXQMTEFParserInternal
{
struct Object;
struct State;
}

/** \brief the main class to read a MathType equation (MTEF v3 or v5) and to convert it in MathML
 *
 * The parser reads the records (lines, characters, templates, piles and
 * matrices) in a tree, then the tree is sent as MathML. The definition
 * records (fonts, sizes, colors, preferences, rulers) are skipped.
 */
class EXQMTEFParser
{
public:
  //! constructor: the data begins at the current input position and ends at endPos
  EXQMTEFParser(EXQInputStreamPtr const &input, long endPos);
  //! destructor
  ~EXQMTEFParser();
  /** tries to parse the data and creates the MathML element

      \note throws libexq::ParseException or libexq::FileException if the data are bad */
  bool parse(std::string &mathML);

protected:
  //! reads the MTEF header
  bool readHeader();
  /** reads a list of records until a END record and adds the objects in objects.

      \return false if the end of data is found before the END record */
  bool readRecords(std::vector<std::shared_ptr<EXQMTEFParserInternal::Object> > &objects);
  //! reads a LINE record (after the tag)
  std::shared_ptr<EXQMTEFParserInternal::Object> readLine(int options);
  //! reads a CHAR record (after the tag)
  std::shared_ptr<EXQMTEFParserInternal::Object> readChar(int options);
  //! reads a TMPL record (after the tag)
  std::shared_ptr<EXQMTEFParserInternal::Object> readTemplate(int options);
  //! reads a PILE record (after the tag)
  std::shared_ptr<EXQMTEFParserInternal::Object> readPile(int options);
  //! reads a MATRIX record (after the tag)
  std::shared_ptr<EXQMTEFParserInternal::Object> readMatrix(int options);
  //! reads a EMBELL record (after the tag)
  std::shared_ptr<EXQMTEFParserInternal::Object> readEmbellishment(int options);
  //! reads a list of records which must be ended by a END record
  void readChildren(EXQMTEFParserInternal::Object &object);
  //! reads a RULER record (after the tag)
  void readRulerData();
  //! reads a RULER record (with its tag)
  void readRuler();
  //! reads a SIZE record (after the tag)
  void readSize();
  //! reads a EQN_PREFS record (after the tag)
  void readPreferences();
  //! reads a list of dimensions stored in nibbles
  void readDimensions(int num);
  //! reads a nudge
  void readNudge();
  //! reads the options byte (v5) or returns the tag options (v3)
  int readOptions(int tagOptions);
  //! reads a byte
  int readByte();
  //! reads a 1 or 3 bytes unsigned integer (v5)
  int readUInt();
  //! skips a C string
  void skipCString();

  //
  // MathML
  //

  //! converts a list of objects and adds the result in elements
  void sendObjects(std::vector<std::shared_ptr<EXQMTEFParserInternal::Object> > const &objects,
                   std::vector<std::string> &elements) const;
  //! converts a line in one element
  std::string sendLine(std::shared_ptr<EXQMTEFParserInternal::Object> const &line) const;
  //! converts a template (which is not a script template) in one element
  std::string sendTemplate(EXQMTEFParserInternal::Object const &tmpl) const;
  //! converts a script template, the base is the previous element
  std::string sendScript(EXQMTEFParserInternal::Object const &tmpl, std::string const &base) const;
  //! converts a pile in a mtable
  std::string sendPile(EXQMTEFParserInternal::Object const &pile) const;
  //! converts a matrix in a mtable
  std::string sendMatrix(EXQMTEFParserInternal::Object const &matrix) const;
  //! returns the token tag and the utf8 text of a character, returns false if the character must be ignored
  bool getCharacter(EXQMTEFParserInternal::Object const &character, std::string &tag, std::string &text, bool &canMerge) const;
  //! adds the embellishments of a character
  std::string embellish(EXQMTEFParserInternal::Object const &character, std::string const &element) const;

private:
  EXQMTEFParser(EXQMTEFParser const &orig) = delete;
  EXQMTEFParser &operator=(EXQMTEFParser const &orig) = delete;
  //! the parser state
  std::shared_ptr<EXQMTEFParserInternal::State> m_state;
};

/** \brief the default converter of the embedded equation objects
 *
 * The object is an OLE2 file, its "Equation Native" stream contains a
 * 28 bytes header followed by the MTEF data. A not OLE2 block is read as
 * an "Equation Native" stream or as raw MTEF data.
 */
class EXQMTEFConverter final : public EXQEquationConverter
{
public:
  //! constructor
  EXQMTEFConverter();
  //! destructor
  ~EXQMTEFConverter() final;
  //! tries to convert the object data in MathML
  bool convert(librevenge::RVNGBinaryData const &data, std::string &mathML) final;
protected:
  //! checks if the stream begins with a equation header, if yes, updates the data limits
  static bool readEquationHeader(EXQInputStream &input, long &beginPos, long &endPos);
};
#endif
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
