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

#ifndef EXQ_SYMBOL_TABLE_H
#define EXQ_SYMBOL_TABLE_H

#include <map>
#include <ostream>
#include <string>
#include <vector>

#include <stdint.h>

/** \brief the static table which converts a symbol font character code in unicode
 *
 * A character of a symbol font is stored in the documents as a font name
 * and a code (for instance "Symbol" and "F0B4"). The fonts and the codes
 * are compared without taking care of the case.
 */
class EXQSymbolTable
{
public:
  //! the informations known about a symbol
  struct SymbolInfo {
    //! constructor
    SymbolInfo()
      : m_code()
      , m_font()
      , m_unicode()
      , m_description()
    {
    }
    //! operator<<
    friend std::ostream &operator<<(std::ostream &o, SymbolInfo const &info);
    //! the normalized code (upper case)
    std::string m_code;
    //! the normalized font name (lower case)
    std::string m_font;
    //! the utf8 string
    std::string m_unicode;
    //! a small description
    std::string m_description;
  };
  //! the table statistics
  struct Statistics {
    //! constructor
    Statistics()
      : m_numFonts(0)
      , m_numSymbols(0)
      , m_fontToNumberMap()
    {
    }
    //! the number of fonts
    int m_numFonts;
    //! the total number of symbols
    int m_numSymbols;
    //! a map font name to its number of symbols
    std::map<std::string, int> m_fontToNumberMap;
  };

  /** looks for a (font, code) pair, if found, sets unicode to the utf8 string and returns true

      \note never fills unicode when the pair is unknown */
  static bool lookup(std::string const &font, std::string const &code, std::string &unicode);
  //! looks for a font and a 16-bit character code, for instance 0xF0B4
  static bool lookup(std::string const &font, uint32_t code, std::string &unicode);
  //! returns the information corresponding to a code
  static bool getSymbolInfo(std::string const &code, std::string const &font, SymbolInfo &info);
  //! returns the list of supported fonts (lower case)
  static std::vector<std::string> getSupportedFonts();
  //! returns the list of supported codes of a font (upper case), or an empty list
  static std::vector<std::string> getSupportedCodes(std::string const &font);
  //! returns true if the font is supported
  static bool isFontSupported(std::string const &font);
  //! returns the table statistics
  static Statistics getStatistics();
};
#endif
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
