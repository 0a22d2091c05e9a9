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

#include "EXQSymbolTable.hxx"

#include "EXQRunMerger.hxx"

namespace EXQRunMergerInternal
{
//! returns the position of the final run of characters which verify func, or std::string::npos
static size_t findTrailing(std::string const &text, bool (*func)(char))
{
  size_t pos=text.size();
  while (pos>0 && func(text[pos-1]))
    --pos;
  return pos==text.size() ? std::string::npos : pos;
}

//! returns true if the text is a number, ie. an optional sign followed by digits and points
static bool isNumber(std::string const &text)
{
  bool hasDigit=false;
  for (size_t i=0; i<text.size(); ++i) {
    char c=text[i];
    if (libexq::isDigit(c))
      hasDigit=true;
    else if (c=='.' || (i==0 && (c=='-' || c=='+')))
      continue;
    else
      return false;
  }
  return hasDigit;
}
}

std::ostream &operator<<(std::ostream &o, EXQRunFragment const &fragment)
{
  switch (fragment.m_kind) {
  case EXQRunFragment::Superscript:
    o << "sup:";
    break;
  case EXQRunFragment::Subscript:
    o << "sub:";
    break;
  case EXQRunFragment::Normal:
  default:
    break;
  }
  o << "\"" << fragment.m_text << "\"";
  return o;
}

std::string EXQRunMerger::getParagraphText(EXQXMLNode const &paragraph)
{
  std::vector<EXQRunFragment> fragments;
  collectFragments(paragraph, fragments);
  return merge(fragments);
}

EXQRunFragment::Kind EXQRunMerger::getRunKind(EXQXMLNode const &run)
{
  auto properties=run.getChild(libexq::NS_WORD, "rPr");
  if (!properties) return EXQRunFragment::Normal;
  auto align=properties->getChild(libexq::NS_WORD, "vertAlign");
  if (!align) return EXQRunFragment::Normal;
  std::string const val=align->getAttribute(libexq::NS_WORD, "val");
  if (val=="superscript")
    return EXQRunFragment::Superscript;
  if (val=="subscript")
    return EXQRunFragment::Subscript;
  return EXQRunFragment::Normal;
}

std::string EXQRunMerger::getSymbolText(EXQXMLNode const &symbol)
{
  std::string const code=symbol.getAttribute(libexq::NS_WORD, "char");
  if (code.empty()) return "";
  std::string unicode;
  if (EXQSymbolTable::lookup(symbol.getAttribute(libexq::NS_WORD, "font"), code, unicode))
    return unicode;
  EXQ_DEBUG_MSG(("EXQRunMerger::getSymbolText: unknown symbol %s in font %s\n", code.c_str(),
                 symbol.getAttribute(libexq::NS_WORD, "font").c_str()));
  return "["+code+"]";
}

void EXQRunMerger::collectFragments(EXQXMLNode const &paragraph, std::vector<EXQRunFragment> &fragments)
{
  std::vector<EXQXMLNodePtr> runs;
  paragraph.findAll(libexq::NS_WORD, "r", runs);
  for (auto const &run : runs) {
    auto const kind=getRunKind(*run);
    for (auto const &child : run->children()) {
      if (!child) continue;
      std::string text;
      if (child->is(libexq::NS_WORD, "t"))
        text=child->text();
      else if (child->is(libexq::NS_WORD, "sym"))
        text=getSymbolText(*child);
      if (!text.empty())
        fragments.push_back(EXQRunFragment(kind, text));
    }
  }
}

std::string EXQRunMerger::merge(std::vector<EXQRunFragment> const &fragments)
{
  std::string res;
  // the previous normal fragment which is not yet sent
  std::string previous;
  bool hasPrevious=false;
  for (auto const &fragment : fragments) {
    if (fragment.m_kind==EXQRunFragment::Normal) {
      res+=previous;
      previous=fragment.m_text;
      hasPrevious=true;
      continue;
    }
    bool const isSup=fragment.m_kind==EXQRunFragment::Superscript;
    std::string const script=libexq::trim(fragment.m_text);
    size_t basePos=std::string::npos;
    if (hasPrevious && !script.empty())
      basePos=EXQRunMergerInternal::findTrailing(previous, isSup ? libexq::isDigit : libexq::isLetter);
    if (basePos==std::string::npos) {
      res+=previous;
      res+=fragment.m_text;
    }
    else {
      res+=previous.substr(0, basePos);
      std::string const base=previous.substr(basePos);
      if (isSup)
        res+="<math>"+libexq::mathElement("msup", libexq::mathToken("mn", base)+libexq::mathToken("mn", script))+"</math>";
      else {
        char const *scriptTag=EXQRunMergerInternal::isNumber(script) ? "mn" : "mi";
        res+="<math>"+libexq::mathElement("msub", libexq::mathToken("mi", base)+libexq::mathToken(scriptTag, script))+"</math>";
      }
    }
    previous.clear();
    hasPrevious=false;
  }
  res+=previous;
  return res;
}
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
