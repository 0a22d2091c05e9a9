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

#ifndef EXQ_PACKAGE_H
#define EXQ_PACKAGE_H

#include <map>
#include <memory>
#include <string>

#include <librevenge/librevenge.h>

#include "EXQInputStream.hxx"
#include "EXQXMLTree.hxx"

namespace EXQPackageInternal
{
struct State;
}

/** \brief the class used to access the parts of a word processing document
 *
 * The document is a zip archive: the package relationships (_rels/.rels)
 * give the main part (by default word/document.xml), and the main part
 * relationships (word/_rels/document.xml.rels) associate an identifier
 * (r:id, r:embed) to the target parts: pictures, embedded objects, ...
 */
class EXQPackage
{
public:
  //! constructor
  explicit EXQPackage(EXQInputStreamPtr const &input);
  //! destructor
  ~EXQPackage();
  //! checks that the input is a zip archive and looks for the main part, returns false if the input is not a zip archive
  bool open();
  //! returns true if the main part is found
  bool hasMainPart() const;
  //! returns the main part name, ie. word/document.xml
  std::string const &getMainPartName() const;
  //! parses the main part and returns its root element
  EXQXMLNodePtr getMainDocument();
  //! reads the main part relationships, returns false if the relationships part does not exist
  bool readRelationships();
  //! returns the resolved path of the part corresponding to an identifier
  bool getTarget(std::string const &id, std::string &path) const;
  //! reads the data of a part
  bool getPart(std::string const &path, librevenge::RVNGBinaryData &data);
  //! returns the relationships part name of a part: dir/_rels/name.rels
  static std::string getRelationshipsPartName(std::string const &partName);
  //! returns a target path relative to a directory ("" for the root) after removing the ".." and "."
  static std::string resolvePath(std::string const &directory, std::string const &target);

protected:
  //! reads a relationships part and fills the map identifier to target (with its type)
  bool readRelationships(std::string const &partName, std::string const &directory,
                         std::map<std::string, std::string> &idToTargetMap,
                         std::map<std::string, std::string> *idToTypeMap);

private:
  EXQPackage(EXQPackage const &orig) = delete;
  EXQPackage &operator=(EXQPackage const &orig) = delete;
  //! the state
  std::shared_ptr<EXQPackageInternal::State> m_state;
};
#endif
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
