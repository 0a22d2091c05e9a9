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

#ifndef LIBEXQ_INTERNAL_H
#define LIBEXQ_INTERNAL_H
#ifdef DEBUG
#include <stdio.h>
#endif

#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include <librevenge-stream/librevenge-stream.h>
#include <librevenge/librevenge.h>

#  ifdef HAVE_CONFIG_H
#    include <config.h>
#  endif
#include <stdint.h>

#if defined(HAVE_FUNC_ATTRIBUTE_FORMAT)
#  define LIBEXQ_ATTRIBUTE_PRINTF(fmt, arg) __attribute__((format(printf, fmt, arg)))
#else
#  define LIBEXQ_ATTRIBUTE_PRINTF(fmt, arg)
#endif

#define EXQ_N_ELEMENTS(m) sizeof(m)/sizeof(m[0])

/* ---------- memory  --------------- */
/** an noop deleter used to transform a librevenge pointer in a false std::shared_ptr */
template <class T>
struct EXQ_shared_ptr_noop_deleter {
  void operator()(T *) {}
};

/* ---------- debug  --------------- */
#ifdef DEBUG
namespace libexq
{
void printDebugMsg(const char *format, ...) LIBEXQ_ATTRIBUTE_PRINTF(1,2);
}
#define EXQ_DEBUG_MSG(M) libexq::printDebugMsg M
#else
#define EXQ_DEBUG_MSG(M)
#endif

namespace libexq
{
// Various exceptions:
class FileException
{
};

class ParseException
{
};

//! a stream used to build debug strings
typedef std::stringstream DebugStream;
}

/* ---------- namespace ------------- */
namespace libexq
{
//! the word processing main namespace
extern char const *const NS_WORD;
//! the office math namespace
extern char const *const NS_MATH;
//! the office document relationships namespace (used by r:id, r:embed)
extern char const *const NS_RELATIONSHIPS;
//! the package relationships namespace (used by the .rels parts)
extern char const *const NS_PACKAGE_RELATIONSHIPS;
//! the drawingml main namespace
extern char const *const NS_DRAWING;
//! the legacy office namespace (o:OLEObject)
extern char const *const NS_OFFICE;
//! the vml namespace (v:imagedata)
extern char const *const NS_VML;
//! the markup compatibility namespace (mc)
extern char const *const NS_MARKUP_COMPATIBILITY;
}

/* ---------- string ----------------- */
namespace libexq
{
//! adds an unicode character to a string
void appendUnicode(uint32_t val, std::string &buffer);
//! returns a copy of the string without leading and trailing spaces
std::string trim(std::string const &str);
//! returns a copy of the string where each ASCII letter is in lower case
std::string toLower(std::string const &str);
//! returns a copy of the string where each ASCII letter is in upper case
std::string toUpper(std::string const &str);
//! returns true if c is an ASCII decimal digit
inline bool isDigit(char c)
{
  return c>='0' && c<='9';
}
//! returns true if c is an ASCII letter
inline bool isLetter(char c)
{
  return (c>='a' && c<='z') || (c>='A' && c<='Z');
}
//! returns true if c is an ASCII space character
inline bool isSpace(char c)
{
  return c==' ' || c=='\t' || c=='\n' || c=='\r' || c=='\f' || c=='\v';
}
/** returns the length of a question number prefix "digits. [A-Z]" found at pos,
    ie. the number of characters before the upper case letter, or 0 if there is no such prefix.

    \note when number is not null, it is filled with the digits value (or -1, see matchNumberPrefix) */
size_t matchQuestionPrefix(std::string const &text, size_t pos, int *number=nullptr);
/** returns the length of a number prefix "digits." found at pos or 0, fills number if it is not null

    \note number is set to -1 if the digits value does not fit in an int */
size_t matchNumberPrefix(std::string const &text, size_t pos, int *number=nullptr);
//! returns the text with the xml special characters replaced by their entities
std::string escapeXML(std::string const &text);
}

/* ---------- mathml ----------------- */
namespace libexq
{
//! returns a mathml token element: <tag>escaped text</tag>
std::string mathToken(char const *tag, std::string const &text);
//! returns a mathml element which contains already converted content: <tag>content</tag>
std::string mathElement(char const *tag, std::string const &content);
//! returns content if it is a single element, or <mrow>content</mrow>
std::string mathRow(std::vector<std::string> const &elements);
}

#endif /* LIBEXQ_INTERNAL_H */
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
