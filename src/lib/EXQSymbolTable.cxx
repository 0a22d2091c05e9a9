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

#include <cstdio>
#include <string>

#include "libexq_internal.hxx"

#include "EXQSymbolTable.hxx"

/** Internal: the structures of a EXQSymbolTable */
namespace EXQSymbolTableInternal
{
//! Internal: a symbol of a font
struct Symbol {
  //! the character code in the font
  uint16_t m_code;
  //! the unicode character
  uint32_t m_unicode;
  //! the description
  char const *m_description;
};

static Symbol const s_symbolFont[] = {
  // arithmetic operators
  { 0xF02B, 0x2B, "Plus" },
  { 0xF02D, 0x2212, "Minus (Unicode minus, not hyphen)" },
  { 0xF0B4, 0xD7, "Multiplication operator" },
  { 0xF0B8, 0xF7, "Division operator" },
  { 0xF0B1, 0xB1, "Plus-minus" },
  { 0xF0F1, 0x2213, "Minus-plus" },
  { 0xF0D7, 0x22C5, "Dot operator" },

  // comparison and equality
  { 0xF03D, 0x3D, "Equals" },
  { 0xF0B9, 0x2260, "Not equal" },
  { 0xF03C, 0x3C, "Less than" },
  { 0xF03E, 0x3E, "Greater than" },
  { 0xF0A3, 0x2264, "Less than or equal" },
  { 0xF0B3, 0x2265, "Greater than or equal" },
  { 0xF0BB, 0x2248, "Approximately equal" },
  { 0xF040, 0x2245, "Congruent" },
  { 0xF07E, 0x223C, "Similar" },

  // greek letters (lowercase)
  { 0xF061, 0x3B1, "Alpha (lowercase)" },
  { 0xF062, 0x3B2, "Beta (lowercase)" },
  { 0xF067, 0x3B3, "Gamma (lowercase)" },
  { 0xF064, 0x3B4, "Delta (lowercase)" },
  { 0xF065, 0x3B5, "Epsilon (lowercase)" },
  { 0xF07A, 0x3B6, "Zeta (lowercase)" },
  { 0xF068, 0x3B7, "Eta (lowercase)" },
  { 0xF071, 0x3B8, "Theta (lowercase)" },
  { 0xF069, 0x3B9, "Iota (lowercase)" },
  { 0xF06B, 0x3BA, "Kappa (lowercase)" },
  { 0xF06C, 0x3BB, "Lambda (lowercase)" },
  { 0xF06D, 0x3BC, "Mu (lowercase)" },
  { 0xF06E, 0x3BD, "Nu (lowercase)" },
  { 0xF078, 0x3BE, "Xi (lowercase)" },
  { 0xF06F, 0x3BF, "Omicron (lowercase)" },
  { 0xF070, 0x3C0, "Pi" },
  { 0xF072, 0x3C1, "Rho (lowercase)" },
  { 0xF073, 0x3C3, "Sigma (lowercase)" },
  { 0xF074, 0x3C4, "Tau (lowercase)" },
  { 0xF075, 0x3C5, "Upsilon (lowercase)" },
  { 0xF066, 0x3C6, "Phi (lowercase)" },
  { 0xF063, 0x3C7, "Chi (lowercase)" },
  { 0xF079, 0x3C8, "Psi (lowercase)" },
  { 0xF077, 0x3C9, "Omega (lowercase)" },

  // greek letters (uppercase)
  { 0xF041, 0x391, "Alpha (uppercase)" },
  { 0xF042, 0x392, "Beta (uppercase)" },
  { 0xF047, 0x393, "Gamma (uppercase)" },
  { 0xF044, 0x394, "Delta (uppercase)" },
  { 0xF045, 0x395, "Epsilon (uppercase)" },
  { 0xF05A, 0x396, "Zeta (uppercase)" },
  { 0xF048, 0x397, "Eta (uppercase)" },
  { 0xF051, 0x398, "Theta (uppercase)" },
  { 0xF049, 0x399, "Iota (uppercase)" },
  { 0xF04B, 0x39A, "Kappa (uppercase)" },
  { 0xF04C, 0x39B, "Lambda (uppercase)" },
  { 0xF04D, 0x39C, "Mu (uppercase)" },
  { 0xF04E, 0x39D, "Nu (uppercase)" },
  { 0xF058, 0x39E, "Xi (uppercase)" },
  { 0xF04F, 0x39F, "Omicron (uppercase)" },
  { 0xF050, 0x3A0, "Pi (uppercase)" },
  { 0xF052, 0x3A1, "Rho (uppercase)" },
  { 0xF053, 0x3A3, "Sigma (uppercase)" },
  { 0xF054, 0x3A4, "Tau (uppercase)" },
  { 0xF055, 0x3A5, "Upsilon (uppercase)" },
  { 0xF046, 0x3A6, "Phi (uppercase)" },
  { 0xF043, 0x3A7, "Chi (uppercase)" },
  { 0xF059, 0x3A8, "Psi (uppercase)" },
  { 0xF057, 0x3A9, "Omega (uppercase)" },

  // mathematical operators and symbols
  { 0xF0A5, 0x221E, "Infinity" },
  { 0xF0D1, 0x2207, "Nabla (gradient)" },
  { 0xF0B6, 0x2202, "Partial derivative" },
  { 0xF0F2, 0x222B, "Integral" },
  { 0xF0E5, 0x2211, "Summation" },
  { 0xF0D5, 0x220F, "Product" },
  { 0xF0D6, 0x221A, "Square root" },
  { 0xF0D0, 0x2220, "Angle" },
  { 0xF0B0, 0xB0, "Degree" },
  { 0xF0A2, 0x2032, "Prime" },
  { 0xF0B2, 0x2033, "Double prime" },

  // set theory
  { 0xF0CE, 0x2208, "Element of" },
  { 0xF0CF, 0x220B, "Contains" },
  { 0xF0C9, 0x2209, "Not element of" },
  { 0xF0C7, 0x2229, "Intersection" },
  { 0xF0C8, 0x222A, "Union" },
  { 0xF0C6, 0x2205, "Empty set" },
  { 0xF0C5, 0x2282, "Subset of" },
  { 0xF0C3, 0x2283, "Superset of" },
  { 0xF0CA, 0x2286, "Subset of or equal" },
  { 0xF0CB, 0x2287, "Superset of or equal" },

  // logic
  { 0xF0D9, 0x2227, "Logical AND" },
  { 0xF0DA, 0x2228, "Logical OR" },
  { 0xF0D8, 0xAC, "Logical NOT" },
  { 0xF0A0, 0x2200, "For all (universal quantifier)" },
  { 0xF024, 0x2203, "There exists (existential quantifier)" },

  // arrows
  { 0xF0AC, 0x2190, "Left arrow" },
  { 0xF0AE, 0x2192, "Right arrow" },
  { 0xF0AD, 0x2191, "Up arrow" },
  { 0xF0AF, 0x2193, "Down arrow" },
  { 0xF0AB, 0x2194, "Left-right arrow" },
  { 0xF0DC, 0x21D0, "Left double arrow" },
  { 0xF0DE, 0x21D2, "Right double arrow" },
  { 0xF0DD, 0x21D1, "Up double arrow" },
  { 0xF0DF, 0x21D3, "Down double arrow" },
  { 0xF0DB, 0x21D4, "Left-right double arrow" },

  // fractions
  { 0xF0BD, 0xBD, "One half" },
  { 0xF0BC, 0xBC, "One quarter" },
  { 0xF0BE, 0xBE, "Three quarters" }
};

static Symbol const s_wingdingsFont[] = {
  { 0xF021, 0x2701, "Scissors" },
  { 0xF022, 0x2702, "Scissors (solid)" }
};

static Symbol const s_webdingsFont[] = {
  { 0xF021, 0x2660, "Spade suit" },
  { 0xF022, 0x2663, "Club suit" }
};

//! Internal: a font and its symbols
struct Font {
  //! the font name (lower case)
  char const *m_name;
  //! the first symbol
  Symbol const *m_symbols;
  //! the number of symbols
  size_t m_numSymbols;
};

static Font const s_fonts[] = {
  { "symbol", s_symbolFont, EXQ_N_ELEMENTS(s_symbolFont) },
  { "wingdings", s_wingdingsFont, EXQ_N_ELEMENTS(s_wingdingsFont) },
  { "webdings", s_webdingsFont, EXQ_N_ELEMENTS(s_webdingsFont) }
};

//! returns the font corresponding to a name or 0
static Font const *getFont(std::string const &font)
{
  std::string const name=libexq::toLower(libexq::trim(font));
  if (name.empty()) return nullptr;
  for (auto const &f : s_fonts) {
    if (name==f.m_name)
      return &f;
  }
  return nullptr;
}

//! returns the symbol code as a 4 hexadecimal upper case digits
static std::string getCodeString(uint16_t code)
{
  char buf[10];
  std::snprintf(buf, sizeof(buf), "%04X", unsigned(code));
  return buf;
}

//! returns the symbol corresponding to a code or 0
static Symbol const *getSymbol(Font const &font, std::string const &code)
{
  std::string const normalized=libexq::toUpper(libexq::trim(code));
  if (normalized.size()!=4) return nullptr;
  for (size_t s=0; s<font.m_numSymbols; ++s) {
    if (getCodeString(font.m_symbols[s].m_code)==normalized)
      return &font.m_symbols[s];
  }
  return nullptr;
}
}

std::ostream &operator<<(std::ostream &o, EXQSymbolTable::SymbolInfo const &info)
{
  o << info.m_font << "[" << info.m_code << "]=" << info.m_unicode;
  if (!info.m_description.empty())
    o << "[" << info.m_description << "]";
  return o;
}

bool EXQSymbolTable::lookup(std::string const &font, std::string const &code, std::string &unicode)
{
  auto const *f=EXQSymbolTableInternal::getFont(font);
  if (!f) return false;
  auto const *symbol=EXQSymbolTableInternal::getSymbol(*f, code);
  if (!symbol) return false;
  unicode.clear();
  libexq::appendUnicode(symbol->m_unicode, unicode);
  return true;
}

bool EXQSymbolTable::lookup(std::string const &font, uint32_t code, std::string &unicode)
{
  if (code>0xFFFF) return false;
  return lookup(font, EXQSymbolTableInternal::getCodeString(uint16_t(code)), unicode);
}

bool EXQSymbolTable::getSymbolInfo(std::string const &code, std::string const &font, SymbolInfo &info)
{
  auto const *f=EXQSymbolTableInternal::getFont(font);
  if (!f) return false;
  auto const *symbol=EXQSymbolTableInternal::getSymbol(*f, code);
  if (!symbol) return false;
  info=SymbolInfo();
  info.m_code=EXQSymbolTableInternal::getCodeString(symbol->m_code);
  info.m_font=f->m_name;
  libexq::appendUnicode(symbol->m_unicode, info.m_unicode);
  info.m_description=symbol->m_description;
  return true;
}

std::vector<std::string> EXQSymbolTable::getSupportedFonts()
{
  std::vector<std::string> res;
  for (auto const &f : EXQSymbolTableInternal::s_fonts)
    res.push_back(f.m_name);
  return res;
}

std::vector<std::string> EXQSymbolTable::getSupportedCodes(std::string const &font)
{
  std::vector<std::string> res;
  auto const *f=EXQSymbolTableInternal::getFont(font);
  if (!f) return res;
  for (size_t s=0; s<f->m_numSymbols; ++s)
    res.push_back(EXQSymbolTableInternal::getCodeString(f->m_symbols[s].m_code));
  return res;
}

bool EXQSymbolTable::isFontSupported(std::string const &font)
{
  return EXQSymbolTableInternal::getFont(font)!=nullptr;
}

EXQSymbolTable::Statistics EXQSymbolTable::getStatistics()
{
  Statistics stats;
  for (auto const &f : EXQSymbolTableInternal::s_fonts) {
    ++stats.m_numFonts;
    stats.m_numSymbols+=int(f.m_numSymbols);
    stats.m_fontToNumberMap[f.m_name]=int(f.m_numSymbols);
  }
  return stats;
}
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
