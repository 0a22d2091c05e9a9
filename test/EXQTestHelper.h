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

#ifndef EXQ_TEST_HELPER_H
#define EXQ_TEST_HELPER_H

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <librevenge/librevenge.h>
#include <librevenge-stream/librevenge-stream.h>

#include "EXQXMLTree.hxx"

/** a namespace used to regroup the functions used to create documents in memory */
namespace EXQTest
{
//! returns a string containing the xml namespace declarations w, m, r, a, o, v and mc
std::string getNamespaces();
//! returns a paragraph with one run containing text (the text is escaped)
std::string paragraph(std::string const &text);
//! returns a run containing text; vertAlign is "", "superscript" or "subscript"
std::string run(std::string const &text, std::string const &vertAlign="");
//! returns a run containing a symbol character
std::string symbolRun(std::string const &font, std::string const &code);
//! returns a run containing a drawing which references the picture id
std::string drawingRun(std::string const &id);
//! returns a run containing an embedded equation object which references the object id
std::string objectRun(std::string const &id);
//! parses a xml fragment (the namespaces w, m, r, a, o, v, mc are declared in the root) and returns the root
EXQXMLNodePtr parseXML(std::string const &xml);
//! returns an input stream which reads data
std::shared_ptr<librevenge::RVNGInputStream> getStream(librevenge::RVNGBinaryData const &data);
//! returns a binary data from a list of bytes
librevenge::RVNGBinaryData getData(std::vector<unsigned char> const &bytes);
/** returns a OLE2 compound file which contains one stream at the root.

    \note the stream is padded with zero to 4096 bytes, so it is stored in
    the regular sectors and the file needs no mini stream */
librevenge::RVNGBinaryData getOLEFile(std::string const &streamName, std::vector<unsigned char> const &content);

/** a small class used to create a word processing document in memory */
class DocumentBuilder
{
public:
  //! constructor
  DocumentBuilder();
  //! sets the body content: the paragraphs
  void setBody(std::string const &body)
  {
    m_body=body;
  }
  //! adds a relationship from the main part
  void addRelationship(std::string const &id, std::string const &type, std::string const &target, bool external=false);
  //! adds a part
  void addPart(std::string const &name, librevenge::RVNGBinaryData const &data);
  //! adds a part
  void addPart(std::string const &name, std::string const &data);
  //! sets if the package relationships (_rels/.rels) are created
  void setWithPackageRelationships(bool with)
  {
    m_withPackageRelationships=with;
  }
  //! sets if the main part relationships are created
  void setWithRelationships(bool with)
  {
    m_withRelationships=with;
  }
  //! sets if the main part is created
  void setWithMainPart(bool with)
  {
    m_withMainPart=with;
  }
  //! creates the zip data
  librevenge::RVNGBinaryData getData() const;
protected:
  //! the body content
  std::string m_body;
  //! the relationships: id, type, target, mode
  std::vector<std::vector<std::string> > m_relationships;
  //! the other parts
  std::map<std::string, librevenge::RVNGBinaryData> m_parts;
  //! a flag to know if _rels/.rels is created
  bool m_withPackageRelationships;
  //! a flag to know if word/_rels/document.xml.rels is created
  bool m_withRelationships;
  //! a flag to know if word/document.xml is created
  bool m_withMainPart;
};
}
#endif
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
