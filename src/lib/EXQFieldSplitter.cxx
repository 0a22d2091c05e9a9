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

#include "libexq_internal.hxx"

#include "EXQFieldSplitter.hxx"

namespace EXQFieldSplitterInternal
{
//! the first option letter
static char const s_firstOption='a';
//! the last option letter
static char const s_lastOption='d';
//! returns true if a option marker can not follow c: an ASCII letter or digit
static bool isWordCharacter(char c)
{
  return libexq::isLetter(c) || libexq::isDigit(c);
}
}

void EXQFieldSplitter::split(std::string const &text, EXQQuestion &question)
{
  question=EXQQuestion();
  std::string const str=libexq::trim(text);
  std::string content=str;
  int number;
  size_t prefixLength=libexq::matchNumberPrefix(str, 0, &number);
  if (prefixLength) {
    question.m_number=number;
    content=str.substr(prefixLength);
  }
  else {
    EXQ_DEBUG_MSG(("EXQFieldSplitter::split: can not find the question number\n"));
  }

  std::string main=content;
  auto pos=content.find("Hint:");
  if (pos!=std::string::npos) {
    main=content.substr(0, pos);
    question.m_hasHint=true;
    question.m_hint=truncateHint(content.substr(pos+5));
  }

  std::string optionText=main;
  pos=main.find("Key:");
  if (pos!=std::string::npos) {
    optionText=main.substr(0, pos);
    question.m_hasKey=true;
    question.m_key=libexq::trim(main.substr(pos+4));
  }

  splitOptions(optionText, question.m_stem, question.m_options);
}

std::string EXQFieldSplitter::truncateHint(std::string const &hint)
{
  for (size_t pos=1; pos<hint.size(); ++pos) {
    if (!libexq::isDigit(hint[pos]) || libexq::isDigit(hint[pos-1]))
      continue;
    if (libexq::matchQuestionPrefix(hint, pos))
      return libexq::trim(hint.substr(0, pos));
  }
  return libexq::trim(hint);
}

size_t EXQFieldSplitter::findOptionMarker(std::string const &text, size_t pos, char minLetter, char &letter, size_t &length)
{
  size_t const len=text.size();
  bool inMath=false;
  for (size_t actPos=pos; actPos<len; ++actPos) {
    if (text[actPos]=='<') {
      if (text.compare(actPos, 5, "<math")==0)
        inMath=true;
      else if (text.compare(actPos, 7, "</math>")==0)
        inMath=false;
      continue;
    }
    if (inMath || actPos+1>=len || text[actPos+1]!=')')
      continue;
    char c=text[actPos];
    if (c<EXQFieldSplitterInternal::s_firstOption || c>EXQFieldSplitterInternal::s_lastOption || c<=minLetter)
      continue;
    if (actPos>0 && text[actPos-1]=='(') {
      if (actPos>1 && EXQFieldSplitterInternal::isWordCharacter(text[actPos-2]))
        continue;
      letter=c;
      length=3;
      return actPos-1;
    }
    if (actPos>0 && EXQFieldSplitterInternal::isWordCharacter(text[actPos-1]))
      continue;
    letter=c;
    length=2;
    return actPos;
  }
  return std::string::npos;
}

void EXQFieldSplitter::splitOptions(std::string const &text, std::string &stem, std::map<char, std::string> &options)
{
  options.clear();
  char letter=0, nextLetter=0;
  size_t length=0, nextLength=0;
  size_t pos=findOptionMarker(text, 0, 0, letter, length);
  if (pos==std::string::npos) {
    stem=libexq::trim(text);
    return;
  }
  stem=libexq::trim(text.substr(0, pos));
  while (pos!=std::string::npos) {
    size_t begin=pos+length;
    size_t next=findOptionMarker(text, begin, letter, nextLetter, nextLength);
    size_t end=next==std::string::npos ? text.size() : next;
    options[letter]=libexq::trim(text.substr(begin, end-begin));
    pos=next;
    letter=nextLetter;
    length=nextLength;
  }
}
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
