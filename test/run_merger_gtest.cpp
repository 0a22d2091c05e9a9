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

#include "EXQRunMerger.hxx"

#include "EXQTestHelper.h"

namespace
{
std::string getParagraphText(std::string const &runs)
{
  auto root=EXQTest::parseXML("<w:p>"+runs+"</w:p>");
  if (!root || !root->getChild(libexq::NS_WORD, "p"))
    return "#error";
  return EXQRunMerger::getParagraphText(*root->getChild(libexq::NS_WORD, "p"));
}

std::vector<EXQRunFragment> getFragments(std::string const &runs)
{
  std::vector<EXQRunFragment> fragments;
  auto root=EXQTest::parseXML("<w:p>"+runs+"</w:p>");
  if (root && root->getChild(libexq::NS_WORD, "p"))
    EXQRunMerger::collectFragments(*root->getChild(libexq::NS_WORD, "p"), fragments);
  return fragments;
}
}

TEST(RunMerger, SuperscriptAfterDigits)
{
  std::vector<EXQRunFragment> fragments;
  fragments.push_back(EXQRunFragment(EXQRunFragment::Normal, "10"));
  fragments.push_back(EXQRunFragment(EXQRunFragment::Superscript, "-19"));
  EXPECT_EQ("<math><msup><mn>10</mn><mn>-19</mn></msup></math>", EXQRunMerger::merge(fragments));
}

TEST(RunMerger, SuperscriptKeepsPrefix)
{
  std::vector<EXQRunFragment> fragments;
  fragments.push_back(EXQRunFragment(EXQRunFragment::Normal, "The charge is 1.6 x 10"));
  fragments.push_back(EXQRunFragment(EXQRunFragment::Superscript, "-19"));
  fragments.push_back(EXQRunFragment(EXQRunFragment::Normal, " C"));
  EXPECT_EQ("The charge is 1.6 x <math><msup><mn>10</mn><mn>-19</mn></msup></math> C", EXQRunMerger::merge(fragments));
}

TEST(RunMerger, SubscriptAfterLetters)
{
  std::vector<EXQRunFragment> fragments;
  fragments.push_back(EXQRunFragment(EXQRunFragment::Normal, "speed v"));
  fragments.push_back(EXQRunFragment(EXQRunFragment::Subscript, "0"));
  EXPECT_EQ("speed <math><msub><mi>v</mi><mn>0</mn></msub></math>", EXQRunMerger::merge(fragments));

  fragments.clear();
  fragments.push_back(EXQRunFragment(EXQRunFragment::Normal, "v"));
  fragments.push_back(EXQRunFragment(EXQRunFragment::Subscript, "x"));
  EXPECT_EQ("<math><msub><mi>v</mi><mi>x</mi></msub></math>", EXQRunMerger::merge(fragments));
}

TEST(RunMerger, ScriptWithoutBaseStaysLiteral)
{
  std::vector<EXQRunFragment> fragments;
  fragments.push_back(EXQRunFragment(EXQRunFragment::Normal, "x = "));
  fragments.push_back(EXQRunFragment(EXQRunFragment::Superscript, "2"));
  EXPECT_EQ("x = 2", EXQRunMerger::merge(fragments));

  fragments.clear();
  fragments.push_back(EXQRunFragment(EXQRunFragment::Normal, "H2"));
  fragments.push_back(EXQRunFragment(EXQRunFragment::Subscript, "4"));
  EXPECT_EQ("H24", EXQRunMerger::merge(fragments));

  fragments.clear();
  fragments.push_back(EXQRunFragment(EXQRunFragment::Subscript, "2"));
  fragments.push_back(EXQRunFragment(EXQRunFragment::Normal, "O"));
  EXPECT_EQ("2O", EXQRunMerger::merge(fragments));
}

TEST(RunMerger, ScriptUsesOnlyThePreviousFragment)
{
  std::vector<EXQRunFragment> fragments;
  fragments.push_back(EXQRunFragment(EXQRunFragment::Normal, "x"));
  fragments.push_back(EXQRunFragment(EXQRunFragment::Subscript, "1"));
  fragments.push_back(EXQRunFragment(EXQRunFragment::Subscript, "2"));
  EXPECT_EQ("<math><msub><mi>x</mi><mn>1</mn></msub></math>2", EXQRunMerger::merge(fragments));
}

TEST(RunMerger, EscapesMathTokens)
{
  std::vector<EXQRunFragment> fragments;
  fragments.push_back(EXQRunFragment(EXQRunFragment::Normal, "a"));
  fragments.push_back(EXQRunFragment(EXQRunFragment::Subscript, "<"));
  EXPECT_EQ("<math><msub><mi>a</mi><mi>&lt;</mi></msub></math>", EXQRunMerger::merge(fragments));
}

TEST(RunMerger, CollectFragments)
{
  auto fragments=getFragments(EXQTest::run("E = mc")+EXQTest::run("2", "superscript")+
                              "<w:r><w:t></w:t></w:r>"+EXQTest::run(" ")+EXQTest::symbolRun("Symbol", "F070"));
  ASSERT_EQ(size_t(4), fragments.size());
  EXPECT_EQ(EXQRunFragment::Normal, fragments[0].m_kind);
  EXPECT_EQ(EXQRunFragment::Superscript, fragments[1].m_kind);
  EXPECT_EQ(" ", fragments[2].m_text);
  EXPECT_EQ("\xcf\x80", fragments[3].m_text);
  std::stringstream s;
  s << fragments[1];
  EXPECT_EQ("sup:\"2\"", s.str());
}

TEST(RunMerger, ParagraphText)
{
  EXPECT_EQ("E = m<math><msup><mn>2</mn><mn>2</mn></msup></math>",
            getParagraphText(EXQTest::run("E = m2")+EXQTest::run("2", "superscript")));
  EXPECT_EQ("water is <math><msub><mi>H</mi><mn>2</mn></msub></math>O",
            getParagraphText(EXQTest::run("water is H")+EXQTest::run("2", "subscript")+EXQTest::run("O")));
}

TEST(RunMerger, SymbolCharacters)
{
  EXPECT_EQ("2 \xc3\x97 3", getParagraphText(EXQTest::run("2 ")+EXQTest::symbolRun("Symbol", "F0B4")+EXQTest::run(" 3")));
  EXPECT_EQ("a [F0FF] b", getParagraphText(EXQTest::run("a ")+EXQTest::symbolRun("Symbol", "F0FF")+EXQTest::run(" b")));
  EXPECT_EQ("ab", getParagraphText(EXQTest::run("a")+"<w:r><w:sym w:font=\"Symbol\"/></w:r>"+EXQTest::run("b")));
}
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
