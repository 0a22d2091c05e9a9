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

#ifndef EXQ_XML_TREE_H
#define EXQ_XML_TREE_H

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <librevenge/librevenge.h>

class EXQXMLNode;
//! a smart pointer of EXQXMLNode
typedef std::shared_ptr<EXQXMLNode> EXQXMLNodePtr;

/** \brief a element of a xml part
 *
 * The names are stored resolved: a node knows its namespace uri and its
 * local name, the prefixes used in the part are forgotten. The character
 * data found directly inside the element are concatenated in text().
 * A mc:AlternateContent element keeps only the branch which is read:
 * its first mc:Choice, or its mc:Fallback.
 */
class EXQXMLNode
{
public:
  //! constructor
  EXQXMLNode(std::string const &ns, std::string const &name)
    : m_namespace(ns)
    , m_name(name)
    , m_attributes()
    , m_children()
    , m_text()
  {
  }
  //! returns the namespace uri
  std::string const &getNamespace() const
  {
    return m_namespace;
  }
  //! returns the local name
  std::string const &getName() const
  {
    return m_name;
  }
  //! returns true if the node has this namespace and this local name
  bool is(char const *ns, char const *name) const
  {
    return m_name==name && m_namespace==ns;
  }
  //! returns the characters data stored in this element
  std::string const &text() const
  {
    return m_text;
  }
  //! returns the element children (in document order)
  std::vector<EXQXMLNodePtr> const &children() const
  {
    return m_children;
  }
  //! returns an attribute value or an empty string
  std::string getAttribute(char const *ns, char const *name) const;
  //! returns true if the attribute exists
  bool hasAttribute(char const *ns, char const *name) const;
  //! returns the first child with a given name (or an empty pointer)
  EXQXMLNodePtr getChild(char const *ns, char const *name) const;
  //! returns the first descendant with a given name (depth first, document order)
  EXQXMLNodePtr findFirst(char const *ns, char const *name) const;
  /** adds all the descendants with a given name in document order.

      \note the search does not look inside an element which is added */
  void findAll(char const *ns, char const *name, std::vector<EXQXMLNodePtr> &res) const;
  //! returns the concatenation of the text of all the descendants
  std::string getAllText() const;

protected:
  friend class EXQXMLParserCallback;
  //! the namespace uri
  std::string m_namespace;
  //! the local name
  std::string m_name;
  //! the map "uri local" -> value, "local" -> value for non qualified attribute
  std::map<std::string, std::string> m_attributes;
  //! the children
  std::vector<EXQXMLNodePtr> m_children;
  //! the character data
  std::string m_text;
};

/** \brief a small parser which converts a xml part in a tree of EXQXMLNode
 *
 * \note based on expat, the namespaces are resolved
 */
class EXQXMLParser
{
public:
  //! the maximum number of nested elements, a deeper part is rejected
  static size_t const MAX_DEPTH;
  //! parses a buffer and returns the root element, or an empty pointer if the buffer is not well-formed
  static EXQXMLNodePtr parse(char const *data, size_t len);
  //! parses a block of data and returns the root element
  static EXQXMLNodePtr parse(librevenge::RVNGBinaryData const &data);
  //! parses a string and returns the root element
  static EXQXMLNodePtr parse(std::string const &data)
  {
    return parse(data.c_str(), data.size());
  }
};

#endif
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
