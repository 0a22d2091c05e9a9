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

#include "libexq_internal.hxx"

#include "EXQOfficeMath.hxx"

namespace EXQOfficeMathInternal
{
//! the operators which are converted in mo
static char const *const s_operators[] = {
  "=", "+", "-", "*", "\xc3\x97" /* times */, "\xe2\x88\x92" /* minus */
};

//! returns the length of the operator which begins at pos, or 0
static size_t getOperatorLength(std::string const &text, size_t pos)
{
  for (auto const *op : s_operators) {
    size_t len=std::strlen(op);
    if (text.compare(pos, len, op)==0)
      return len;
  }
  return 0;
}

//! returns the value of the m:val attribute of a property child: node/prop/field, or def
static std::string getProperty(EXQXMLNode const &node, char const *prop, char const *field, char const *def)
{
  auto properties=node.getChild(libexq::NS_MATH, prop);
  if (!properties) return def;
  auto child=properties->getChild(libexq::NS_MATH, field);
  if (!child || !child->hasAttribute(libexq::NS_MATH, "val")) return def;
  return child->getAttribute(libexq::NS_MATH, "val");
}
}

std::string EXQOfficeMath::convert(EXQXMLNode const &oMath)
{
  std::vector<std::string> elements;
  convertChildren(oMath, elements);
  if (elements.empty())
    return "";
  std::string res("<math display=\"block\"><mrow>");
  for (auto const &elt : elements)
    res+=elt;
  res+="</mrow></math>";
  return res;
}

void EXQOfficeMath::convertChildren(EXQXMLNode const &node, std::vector<std::string> &elements)
{
  for (auto const &child : node.children()) {
    if (!child) continue;
    if (!convertChild(*child, elements)) {
      EXQ_DEBUG_MSG(("EXQOfficeMath::convertChildren: ignore %s element\n", child->getName().c_str()));
    }
  }
}

bool EXQOfficeMath::convertChild(EXQXMLNode const &child, std::vector<std::string> &elements)
{
  if (child.getNamespace()!=libexq::NS_MATH)
    return false;
  std::string const &name=child.getName();
  if (name=="r")
    convertRun(child, elements);
  else if (name=="sSub")
    elements.push_back(libexq::mathElement("msub", convertArgument(child, "e")+convertArgument(child, "sub")));
  else if (name=="sSup")
    elements.push_back(libexq::mathElement("msup", convertArgument(child, "e")+convertArgument(child, "sup")));
  else if (name=="sSubSup")
    elements.push_back(libexq::mathElement("msubsup", convertArgument(child, "e")+convertArgument(child, "sub")+convertArgument(child, "sup")));
  else if (name=="f")
    elements.push_back(libexq::mathElement("mfrac", convertFractionPart(child, "num")+convertFractionPart(child, "den")));
  else if (name=="rad")
    elements.push_back(convertRadical(child));
  else if (name=="d")
    elements.push_back(convertDelimiter(child));
  else
    return false;
  return true;
}

std::string EXQOfficeMath::convertArgument(EXQXMLNode const &node, char const *name)
{
  std::vector<std::string> elements;
  auto arg=node.getChild(libexq::NS_MATH, name);
  if (arg)
    convertChildren(*arg, elements);
  if (elements.empty())
    return "<mrow></mrow>";
  return libexq::mathRow(elements);
}

std::string EXQOfficeMath::convertFractionPart(EXQXMLNode const &node, char const *name)
{
  std::vector<std::string> elements;
  auto part=node.getChild(libexq::NS_MATH, name);
  if (part) {
    for (auto const &child : part->children()) {
      if (!child) continue;
      if (child->is(libexq::NS_MATH, "r") || child->is(libexq::NS_MATH, "sSub"))
        convertChild(*child, elements);
    }
  }
  std::string content;
  for (auto const &elt : elements)
    content+=elt;
  return libexq::mathElement("mrow", content);
}

void EXQOfficeMath::convertRun(EXQXMLNode const &run, std::vector<std::string> &elements)
{
  std::string text;
  for (auto const &child : run.children()) {
    if (child && child->is(libexq::NS_MATH, "t"))
      text+=child->text();
  }
  convertText(text, elements);
}

void EXQOfficeMath::convertText(std::string const &text, std::vector<std::string> &elements)
{
  std::string identifier;
  size_t pos=0;
  while (pos<text.size()) {
    size_t opLength=EXQOfficeMathInternal::getOperatorLength(text, pos);
    if (!opLength) {
      identifier+=text[pos++];
      continue;
    }
    std::string const id=libexq::trim(identifier);
    if (!id.empty())
      elements.push_back(libexq::mathToken("mi", id));
    identifier.clear();
    elements.push_back(libexq::mathToken("mo", text.substr(pos, opLength)));
    pos+=opLength;
  }
  std::string const id=libexq::trim(identifier);
  if (!id.empty())
    elements.push_back(libexq::mathToken("mi", id));
}

std::string EXQOfficeMath::convertRadical(EXQXMLNode const &rad)
{
  std::string const hide=EXQOfficeMathInternal::getProperty(rad, "radPr", "degHide", "0");
  std::vector<std::string> degree;
  auto deg=rad.getChild(libexq::NS_MATH, "deg");
  if (deg)
    convertChildren(*deg, degree);
  if (degree.empty() || hide=="1" || hide=="on" || hide=="true")
    return libexq::mathElement("msqrt", convertArgument(rad, "e"));
  return libexq::mathElement("mroot", convertArgument(rad, "e")+libexq::mathRow(degree));
}

std::string EXQOfficeMath::convertDelimiter(EXQXMLNode const &delim)
{
  std::string const begChr=EXQOfficeMathInternal::getProperty(delim, "dPr", "begChr", "(");
  std::string const sepChr=EXQOfficeMathInternal::getProperty(delim, "dPr", "sepChr", "|");
  std::string const endChr=EXQOfficeMathInternal::getProperty(delim, "dPr", "endChr", ")");
  std::string content;
  if (!begChr.empty())
    content+=libexq::mathToken("mo", begChr);
  bool first=true;
  for (auto const &child : delim.children()) {
    if (!child || !child->is(libexq::NS_MATH, "e")) continue;
    if (!first && !sepChr.empty())
      content+=libexq::mathToken("mo", sepChr);
    first=false;
    std::vector<std::string> elements;
    convertChildren(*child, elements);
    for (auto const &elt : elements)
      content+=elt;
  }
  if (!endChr.empty())
    content+=libexq::mathToken("mo", endChr);
  return libexq::mathElement("mrow", content);
}
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
