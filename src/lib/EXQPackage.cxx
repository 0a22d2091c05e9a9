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

#include <string>
#include <vector>

#include "libexq_internal.hxx"

#include "EXQPackage.hxx"

/** Internal: the structures of a EXQPackage */
namespace EXQPackageInternal
{
////////////////////////////////////////
//! Internal: the state of a EXQPackage
struct State {
  //! constructor
  State()
    : m_input()
    , m_mainPart()
    , m_idToTargetMap()
  {
  }
  //! the input
  EXQInputStreamPtr m_input;
  //! the main part name
  std::string m_mainPart;
  //! the map relationship identifier to the target part name
  std::map<std::string, std::string> m_idToTargetMap;
};

//! returns the directory of a part: "word" for "word/document.xml"
static std::string getDirectory(std::string const &partName)
{
  auto pos=partName.rfind('/');
  if (pos==std::string::npos) return "";
  return partName.substr(0, pos);
}

//! returns true if str ends with suffix
static bool endsWith(std::string const &str, char const *suffix)
{
  std::string const end(suffix);
  return str.size()>=end.size() && str.compare(str.size()-end.size(), end.size(), end)==0;
}
}

EXQPackage::EXQPackage(EXQInputStreamPtr const &input)
  : m_state(new EXQPackageInternal::State)
{
  m_state->m_input=input;
}

EXQPackage::~EXQPackage()
{
}

bool EXQPackage::open()
{
  auto &input=m_state->m_input;
  if (!input || !input->isStructured()) {
    EXQ_DEBUG_MSG(("EXQPackage::open: the input is not a zip archive\n"));
    return false;
  }
  m_state->m_mainPart.clear();
  std::map<std::string, std::string> idToTargetMap, idToTypeMap;
  if (readRelationships("_rels/.rels", "", idToTargetMap, &idToTypeMap)) {
    for (auto const &it : idToTypeMap) {
      if (!EXQPackageInternal::endsWith(it.second, "/officeDocument"))
        continue;
      auto const target=idToTargetMap.find(it.first);
      if (target==idToTargetMap.end() || !input->existsSubStream(target->second))
        continue;
      m_state->m_mainPart=target->second;
      break;
    }
  }
  if (m_state->m_mainPart.empty() && input->existsSubStream("word/document.xml"))
    m_state->m_mainPart="word/document.xml";
  if (m_state->m_mainPart.empty()) {
    EXQ_DEBUG_MSG(("EXQPackage::open: can not find the main part\n"));
  }
  return true;
}

bool EXQPackage::hasMainPart() const
{
  return !m_state->m_mainPart.empty();
}

std::string const &EXQPackage::getMainPartName() const
{
  return m_state->m_mainPart;
}

EXQXMLNodePtr EXQPackage::getMainDocument()
{
  librevenge::RVNGBinaryData data;
  if (!hasMainPart() || !getPart(m_state->m_mainPart, data))
    return EXQXMLNodePtr();
  auto root=EXQXMLParser::parse(data);
  if (!root) {
    EXQ_DEBUG_MSG(("EXQPackage::getMainDocument: can not parse %s\n", m_state->m_mainPart.c_str()));
  }
  return root;
}

bool EXQPackage::readRelationships()
{
  m_state->m_idToTargetMap.clear();
  if (!hasMainPart()) return false;
  return readRelationships(getRelationshipsPartName(m_state->m_mainPart),
                           EXQPackageInternal::getDirectory(m_state->m_mainPart),
                           m_state->m_idToTargetMap, nullptr);
}

bool EXQPackage::readRelationships(std::string const &partName, std::string const &directory,
                                   std::map<std::string, std::string> &idToTargetMap,
                                   std::map<std::string, std::string> *idToTypeMap)
{
  librevenge::RVNGBinaryData data;
  if (!getPart(partName, data))
    return false;
  auto root=EXQXMLParser::parse(data);
  if (!root) {
    EXQ_DEBUG_MSG(("EXQPackage::readRelationships: can not parse %s\n", partName.c_str()));
    return false;
  }
  std::vector<EXQXMLNodePtr> relations;
  root->findAll(libexq::NS_PACKAGE_RELATIONSHIPS, "Relationship", relations);
  for (auto const &rel : relations) {
    std::string const id=rel->getAttribute("", "Id");
    std::string const target=rel->getAttribute("", "Target");
    if (id.empty() || target.empty()) {
      EXQ_DEBUG_MSG(("EXQPackage::readRelationships: find a relation without id or target in %s\n", partName.c_str()));
      continue;
    }
    if (rel->getAttribute("", "TargetMode")=="External")
      continue;
    idToTargetMap[id]=resolvePath(directory, target);
    if (idToTypeMap)
      (*idToTypeMap)[id]=rel->getAttribute("", "Type");
  }
  return true;
}

bool EXQPackage::getTarget(std::string const &id, std::string &path) const
{
  auto it=m_state->m_idToTargetMap.find(id);
  if (it==m_state->m_idToTargetMap.end()) {
    EXQ_DEBUG_MSG(("EXQPackage::getTarget: can not find relation %s\n", id.c_str()));
    return false;
  }
  path=it->second;
  return true;
}

bool EXQPackage::getPart(std::string const &path, librevenge::RVNGBinaryData &data)
{
  data.clear();
  auto &input=m_state->m_input;
  if (!input || path.empty() || !input->existsSubStream(path))
    return false;
  auto partInput=input->getSubStreamByName(path);
  if (!partInput) {
    EXQ_DEBUG_MSG(("EXQPackage::getPart: can not open %s\n", path.c_str()));
    return false;
  }
  partInput->seek(0, librevenge::RVNG_SEEK_SET);
  if (!partInput->readEndDataBlock(data)) {
    EXQ_DEBUG_MSG(("EXQPackage::getPart: can not read %s\n", path.c_str()));
    return false;
  }
  return true;
}

std::string EXQPackage::getRelationshipsPartName(std::string const &partName)
{
  auto pos=partName.rfind('/');
  if (pos==std::string::npos)
    return "_rels/"+partName+".rels";
  return partName.substr(0, pos+1)+"_rels/"+partName.substr(pos+1)+".rels";
}

std::string EXQPackage::resolvePath(std::string const &directory, std::string const &target)
{
  std::string path;
  if (!target.empty() && target[0]=='/')
    path=target.substr(1);
  else if (directory.empty())
    path=target;
  else
    path=directory+"/"+target;

  std::vector<std::string> segments;
  size_t pos=0;
  while (pos<=path.size()) {
    size_t next=path.find('/', pos);
    if (next==std::string::npos) next=path.size();
    std::string const segment=path.substr(pos, next-pos);
    if (segment=="..") {
      if (!segments.empty())
        segments.pop_back();
    }
    else if (!segment.empty() && segment!=".")
      segments.push_back(segment);
    pos=next+1;
  }
  std::string res;
  for (auto const &segment : segments) {
    if (!res.empty()) res+='/';
    res+=segment;
  }
  return res;
}
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
