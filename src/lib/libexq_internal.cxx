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

#include <cstdarg>
#include <cstdio>
#include <limits>
#include <string>

#include "libexq_internal.hxx"

/** namespace used to regroup all libexq functions, enumerations which we have redefined for internal usage */
namespace libexq
{
char const *const NS_WORD="http://schemas.openxmlformats.org/wordprocessingml/2006/main";
char const *const NS_MATH="http://schemas.openxmlformats.org/officeDocument/2006/math";
char const *const NS_RELATIONSHIPS="http://schemas.openxmlformats.org/officeDocument/2006/relationships";
char const *const NS_PACKAGE_RELATIONSHIPS="http://schemas.openxmlformats.org/package/2006/relationships";
char const *const NS_DRAWING="http://schemas.openxmlformats.org/drawingml/2006/main";
char const *const NS_OFFICE="urn:schemas-microsoft-com:office:office";
char const *const NS_VML="urn:schemas-microsoft-com:vml";
char const *const NS_MARKUP_COMPATIBILITY="http://schemas.openxmlformats.org/markup-compatibility/2006";

void appendUnicode(uint32_t val, std::string &buffer)
{
  uint8_t first;
  int len;
  if (val < 0x80) {
    first = 0;
    len = 1;
  }
  else if (val < 0x800) {
    first = 0xc0;
    len = 2;
  }
  else if (val < 0x10000) {
    first = 0xe0;
    len = 3;
  }
  else if (val < 0x110000) {
    first = 0xf0;
    len = 4;
  }
  else {
    EXQ_DEBUG_MSG(("libexq::appendUnicode: find an invalid unicode character %x\n", unsigned(val)));
    val=0xfffd;
    first = 0xe0;
    len = 3;
  }

  char outbuf[5];
  int i;
  for (i = len - 1; i > 0; --i) {
    outbuf[i] = char((val & 0x3f) | 0x80);
    val >>= 6;
  }
  outbuf[0] = char(val | first);
  outbuf[len] = 0;
  buffer.append(outbuf);
}

std::string trim(std::string const &str)
{
  size_t begin=0, end=str.size();
  while (begin<end && isSpace(str[begin])) ++begin;
  while (end>begin && isSpace(str[end-1])) --end;
  return str.substr(begin, end-begin);
}

std::string toLower(std::string const &str)
{
  std::string res(str);
  for (auto &c : res) {
    if (c>='A' && c<='Z') c=char(c-'A'+'a');
  }
  return res;
}

std::string toUpper(std::string const &str)
{
  std::string res(str);
  for (auto &c : res) {
    if (c>='a' && c<='z') c=char(c-'a'+'A');
  }
  return res;
}

size_t matchNumberPrefix(std::string const &text, size_t pos, int *number)
{
  size_t const len=text.size();
  size_t actPos=pos;
  int value=0;
  bool overflow=false;
  while (actPos<len && isDigit(text[actPos])) {
    int const digit=text[actPos]-'0';
    if (overflow || value>(std::numeric_limits<int>::max()-digit)/10)
      overflow=true;
    else
      value=10*value+digit;
    ++actPos;
  }
  if (actPos==pos || actPos>=len || text[actPos]!='.')
    return 0;
  if (number) *number=overflow ? -1 : value;
  return actPos+1-pos;
}

size_t matchQuestionPrefix(std::string const &text, size_t pos, int *number)
{
  int value;
  size_t actPos=matchNumberPrefix(text, pos, &value);
  if (!actPos) return 0;
  actPos+=pos;
  size_t const len=text.size();
  while (actPos<len && isSpace(text[actPos]))
    ++actPos;
  if (actPos>=len || text[actPos]<'A' || text[actPos]>'Z')
    return 0;
  if (number) *number=value;
  return actPos-pos;
}

std::string escapeXML(std::string const &text)
{
  std::string res;
  res.reserve(text.size());
  for (auto c : text) {
    switch (c) {
    case '&':
      res+="&amp;";
      break;
    case '<':
      res+="&lt;";
      break;
    case '>':
      res+="&gt;";
      break;
    case '"':
      res+="&quot;";
      break;
    default:
      res+=c;
      break;
    }
  }
  return res;
}

std::string mathToken(char const *tag, std::string const &text)
{
  return mathElement(tag, escapeXML(text));
}

std::string mathElement(char const *tag, std::string const &content)
{
  std::string res("<");
  res+=tag;
  res+=">";
  res+=content;
  res+="</";
  res+=tag;
  res+=">";
  return res;
}

std::string mathRow(std::vector<std::string> const &elements)
{
  if (elements.size()==1)
    return elements[0];
  std::string content;
  for (auto const &elt : elements)
    content+=elt;
  return mathElement("mrow", content);
}

#ifdef DEBUG
void printDebugMsg(const char *format, ...)
{
  va_list args;
  va_start(args, format);
  std::vfprintf(stderr, format, args);
  va_end(args);
}
#endif
}
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
