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

#include <cstring>
#include <string>
#include <vector>

#include <expat.h>

#include "libexq_internal.hxx"

#include "EXQXMLTree.hxx"

namespace EXQXMLTreeInternal
{
//! returns the key used to store a qualified name: "uri local" or "local"
static std::string getKey(char const *ns, char const *name)
{
  if (!ns || !*ns) return name;
  std::string res(ns);
  res+=' ';
  res+=name;
  return res;
}

//! splits a expat name "uri local" in its two parts
static void splitName(char const *expatName, std::string &ns, std::string &name)
{
  char const *sep=std::strrchr(expatName, ' ');
  if (!sep) {
    ns.clear();
    name=expatName;
    return;
  }
  ns.assign(expatName, size_t(sep-expatName));
  name=sep+1;
}

////////////////////////////////////////
//! Internal: the state of a EXQXMLParser
struct State {
  //! constructor
  explicit State(XML_Parser parser)
    : m_parser(parser)
    , m_root()
    , m_stack()
    , m_tooDeep(false)
  {
  }
  //! the expat parser
  XML_Parser m_parser;
  //! the root element
  EXQXMLNodePtr m_root;
  //! the stack of opened elements
  std::vector<EXQXMLNodePtr> m_stack;
  //! a flag to know if the parsing is stopped because the elements are nested too deeply
  bool m_tooDeep;
};
}

// expat callbacks, the names are "uri local" (see XML_ParserCreateNS)
class EXQXMLParserCallback
{
public:
  static void XMLCALL startElement(void *userData, XML_Char const *el, XML_Char const **attr)
  {
    auto *state=static_cast<EXQXMLTreeInternal::State *>(userData);
    if (state->m_stack.size()>=EXQXMLParser::MAX_DEPTH) {
      state->m_tooDeep=true;
      XML_StopParser(state->m_parser, XML_FALSE);
      return;
    }
    std::string ns, name;
    EXQXMLTreeInternal::splitName(el, ns, name);
    EXQXMLNodePtr node(new EXQXMLNode(ns, name));
    for (int i=0; attr[i] && attr[i+1]; i+=2) {
      std::string attrNs, attrName;
      EXQXMLTreeInternal::splitName(attr[i], attrNs, attrName);
      setAttribute(*node, EXQXMLTreeInternal::getKey(attrNs.c_str(), attrName.c_str()), attr[i+1]);
    }
    if (state->m_stack.empty()) {
      if (!state->m_root)
        state->m_root=node;
    }
    else
      addChild(*state->m_stack.back(), node);
    state->m_stack.push_back(node);
  }
  static void XMLCALL endElement(void *userData, XML_Char const *)
  {
    auto *state=static_cast<EXQXMLTreeInternal::State *>(userData);
    if (state->m_stack.empty())
      return;
    auto node=state->m_stack.back();
    state->m_stack.pop_back();
    if (node && node->is(libexq::NS_MARKUP_COMPATIBILITY, "AlternateContent"))
      selectAlternative(*node);
  }
  static void XMLCALL characterData(void *userData, XML_Char const *s, int len)
  {
    auto *state=static_cast<EXQXMLTreeInternal::State *>(userData);
    if (state->m_stack.empty() || len<=0) return;
    appendText(*state->m_stack.back(), s, size_t(len));
  }
protected:
  static void setAttribute(EXQXMLNode &node, std::string const &key, char const *value)
  {
    node.m_attributes[key]=value;
  }
  static void addChild(EXQXMLNode &node, EXQXMLNodePtr child)
  {
    node.m_children.push_back(child);
  }
  static void appendText(EXQXMLNode &node, char const *s, size_t len)
  {
    node.m_text.append(s, len);
  }
  //! keeps only the first mc:Choice of a mc:AlternateContent, or its mc:Fallback if there is no choice
  static void selectAlternative(EXQXMLNode &node)
  {
    EXQXMLNodePtr selected;
    for (auto const &child : node.m_children) {
      if (!child) continue;
      if (child->is(libexq::NS_MARKUP_COMPATIBILITY, "Choice")) {
        selected=child;
        break;
      }
      if (!selected && child->is(libexq::NS_MARKUP_COMPATIBILITY, "Fallback"))
        selected=child;
    }
    node.m_children.clear();
    if (selected)
      node.m_children.push_back(selected);
  }
};

////////////////////////////////////////////////////////////
// node
////////////////////////////////////////////////////////////
std::string EXQXMLNode::getAttribute(char const *ns, char const *name) const
{
  auto it=m_attributes.find(EXQXMLTreeInternal::getKey(ns, name));
  if (it==m_attributes.end()) return "";
  return it->second;
}

bool EXQXMLNode::hasAttribute(char const *ns, char const *name) const
{
  return m_attributes.find(EXQXMLTreeInternal::getKey(ns, name))!=m_attributes.end();
}

EXQXMLNodePtr EXQXMLNode::getChild(char const *ns, char const *name) const
{
  for (auto const &child : m_children) {
    if (child && child->is(ns, name))
      return child;
  }
  return EXQXMLNodePtr();
}

EXQXMLNodePtr EXQXMLNode::findFirst(char const *ns, char const *name) const
{
  for (auto const &child : m_children) {
    if (!child) continue;
    if (child->is(ns, name))
      return child;
    auto res=child->findFirst(ns, name);
    if (res) return res;
  }
  return EXQXMLNodePtr();
}

void EXQXMLNode::findAll(char const *ns, char const *name, std::vector<EXQXMLNodePtr> &res) const
{
  for (auto const &child : m_children) {
    if (!child) continue;
    if (child->is(ns, name))
      res.push_back(child);
    else
      child->findAll(ns, name, res);
  }
}

std::string EXQXMLNode::getAllText() const
{
  std::string res;
  if (m_children.empty())
    return m_text;
  for (auto const &child : m_children) {
    if (child)
      res+=child->getAllText();
  }
  return res;
}

////////////////////////////////////////////////////////////
// parser
////////////////////////////////////////////////////////////
size_t const EXQXMLParser::MAX_DEPTH=256;

EXQXMLNodePtr EXQXMLParser::parse(char const *data, size_t len)
{
  if (!data || !len) {
    EXQ_DEBUG_MSG(("EXQXMLParser::parse: called without data\n"));
    return EXQXMLNodePtr();
  }
  XML_Parser parser=XML_ParserCreateNS(nullptr, ' ');
  if (!parser) {
    EXQ_DEBUG_MSG(("EXQXMLParser::parse: can not create the expat parser\n"));
    return EXQXMLNodePtr();
  }
  EXQXMLTreeInternal::State state(parser);
  XML_SetUserData(parser, &state);
  XML_SetElementHandler(parser, EXQXMLParserCallback::startElement, EXQXMLParserCallback::endElement);
  XML_SetCharacterDataHandler(parser, EXQXMLParserCallback::characterData);
  bool ok=XML_Parse(parser, data, static_cast<int>(len), XML_TRUE)!=XML_STATUS_ERROR;
  if (state.m_tooDeep) {
    EXQ_DEBUG_MSG(("EXQXMLParser::parse: the elements are nested too deeply\n"));
  }
  else if (!ok) {
    EXQ_DEBUG_MSG(("EXQXMLParser::parse: find error %s at line %d\n", XML_ErrorString(XML_GetErrorCode(parser)),
                   int(XML_GetCurrentLineNumber(parser))));
  }
  XML_ParserFree(parser);
  if (!ok || state.m_tooDeep) return EXQXMLNodePtr();
  return state.m_root;
}

EXQXMLNodePtr EXQXMLParser::parse(librevenge::RVNGBinaryData const &data)
{
  if (data.empty() || !data.getDataBuffer())
    return EXQXMLNodePtr();
  return parse(reinterpret_cast<char const *>(data.getDataBuffer()), size_t(data.size()));
}
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
