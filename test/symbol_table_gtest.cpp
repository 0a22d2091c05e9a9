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

#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "libexq_internal.hxx"

#include "EXQSymbolTable.hxx"

TEST(SymbolTable, LookupKnownSymbol)
{
  std::string unicode;
  ASSERT_TRUE(EXQSymbolTable::lookup("Symbol", "F0B4", unicode));
  EXPECT_EQ("\xc3\x97", unicode);
  ASSERT_TRUE(EXQSymbolTable::lookup("Symbol", "F070", unicode));
  EXPECT_EQ("\xcf\x80", unicode);
  ASSERT_TRUE(EXQSymbolTable::lookup("Wingdings", "F021", unicode));
  EXPECT_EQ("\xe2\x9c\x81", unicode);
}

TEST(SymbolTable, LookupIgnoresCase)
{
  for (auto const &font : EXQSymbolTable::getSupportedFonts()) {
    for (auto const &code : EXQSymbolTable::getSupportedCodes(font)) {
      std::string lower, upper;
      ASSERT_TRUE(EXQSymbolTable::lookup(libexq::toUpper(font), libexq::toLower(code), upper)) << font << ":" << code;
      ASSERT_TRUE(EXQSymbolTable::lookup(libexq::toLower(font), libexq::toUpper(code), lower)) << font << ":" << code;
      EXPECT_EQ(lower, upper);
      EXPECT_FALSE(lower.empty());
    }
  }
}

TEST(SymbolTable, LookupTrimsFontName)
{
  std::string unicode;
  EXPECT_TRUE(EXQSymbolTable::lookup("  SYMBOL ", "f0a5", unicode));
  EXPECT_EQ("\xe2\x88\x9e", unicode);
}

TEST(SymbolTable, UnknownPairIsNotFound)
{
  std::string unicode("unchanged");
  EXPECT_FALSE(EXQSymbolTable::lookup("Symbol", "0041", unicode));
  EXPECT_FALSE(EXQSymbolTable::lookup("Arial", "F0B4", unicode));
  EXPECT_FALSE(EXQSymbolTable::lookup("", "F0B4", unicode));
  EXPECT_FALSE(EXQSymbolTable::lookup("Symbol", "", unicode));
  EXPECT_EQ("unchanged", unicode);
}

TEST(SymbolTable, CodeMustMatchExactly)
{
  std::string unicode;
  EXPECT_FALSE(EXQSymbolTable::lookup("Symbol", "F0B", unicode));
  EXPECT_FALSE(EXQSymbolTable::lookup("Symbol", "F0B45", unicode));
  EXPECT_FALSE(EXQSymbolTable::lookup("Symbol", "0F0B4", unicode));
}

TEST(SymbolTable, LookupByValue)
{
  std::string unicode;
  ASSERT_TRUE(EXQSymbolTable::lookup("symbol", uint32_t(0xF0D6), unicode));
  EXPECT_EQ("\xe2\x88\x9a", unicode);
  EXPECT_FALSE(EXQSymbolTable::lookup("symbol", uint32_t(0x1F0D6), unicode));
}

TEST(SymbolTable, SymbolInfo)
{
  EXQSymbolTable::SymbolInfo info;
  ASSERT_TRUE(EXQSymbolTable::getSymbolInfo("f0b4", "SYMBOL", info));
  EXPECT_EQ("F0B4", info.m_code);
  EXPECT_EQ("symbol", info.m_font);
  EXPECT_EQ("\xc3\x97", info.m_unicode);
  EXPECT_EQ("Multiplication operator", info.m_description);
  std::stringstream s;
  s << info;
  EXPECT_EQ("symbol[F0B4]=\xc3\x97[Multiplication operator]", s.str());
  EXPECT_FALSE(EXQSymbolTable::getSymbolInfo("0000", "symbol", info));
}

TEST(SymbolTable, Fonts)
{
  EXPECT_TRUE(EXQSymbolTable::isFontSupported("Symbol"));
  EXPECT_TRUE(EXQSymbolTable::isFontSupported("webdings"));
  EXPECT_FALSE(EXQSymbolTable::isFontSupported("Times New Roman"));
  EXPECT_TRUE(EXQSymbolTable::getSupportedCodes("Times New Roman").empty());

  auto const stats=EXQSymbolTable::getStatistics();
  EXPECT_EQ(3, stats.m_numFonts);
  ASSERT_EQ(size_t(3), stats.m_fontToNumberMap.size());
  EXPECT_GE(stats.m_fontToNumberMap.find("symbol")->second, 90);
  int total=0;
  for (auto const &it : stats.m_fontToNumberMap) {
    EXPECT_EQ(size_t(it.second), EXQSymbolTable::getSupportedCodes(it.first).size());
    total+=it.second;
  }
  EXPECT_EQ(total, stats.m_numSymbols);
}
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
