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

#include <gtest/gtest.h>

#include "libexq_internal.hxx"

#include "EXQXMLTree.hxx"

#include "EXQTestHelper.h"

TEST(XMLTree, ResolvesNamespaces)
{
  auto root=EXQTest::parseXML("<w:p><w:r><w:t>Hello</w:t></w:r><m:oMath/></w:p>");
  ASSERT_TRUE(bool(root));
  EXPECT_EQ("root", root->getName());
  EXPECT_TRUE(root->getNamespace().empty());
  auto paragraph=root->getChild(libexq::NS_WORD, "p");
  ASSERT_TRUE(bool(paragraph));
  ASSERT_EQ(size_t(2), paragraph->children().size());
  EXPECT_TRUE(paragraph->children()[0]->is(libexq::NS_WORD, "r"));
  EXPECT_TRUE(paragraph->children()[1]->is(libexq::NS_MATH, "oMath"));
  EXPECT_FALSE(paragraph->getChild(libexq::NS_MATH, "r"));
}

TEST(XMLTree, Attributes)
{
  auto root=EXQTest::parseXML("<w:sym w:font=\"Symbol\" w:char=\"F0B4\"/><Relationship Id=\"rId4\"/>");
  ASSERT_TRUE(bool(root));
  auto symbol=root->getChild(libexq::NS_WORD, "sym");
  ASSERT_TRUE(bool(symbol));
  EXPECT_EQ("Symbol", symbol->getAttribute(libexq::NS_WORD, "font"));
  EXPECT_TRUE(symbol->hasAttribute(libexq::NS_WORD, "char"));
  EXPECT_FALSE(symbol->hasAttribute("", "char"));
  EXPECT_EQ("", symbol->getAttribute(libexq::NS_WORD, "val"));
  auto rel=root->getChild("", "Relationship");
  ASSERT_TRUE(bool(rel));
  EXPECT_EQ("rId4", rel->getAttribute("", "Id"));
}

TEST(XMLTree, TextAndEntities)
{
  auto root=EXQTest::parseXML("<w:t>a &lt; b &amp; c</w:t>");
  ASSERT_TRUE(bool(root));
  auto text=root->getChild(libexq::NS_WORD, "t");
  ASSERT_TRUE(bool(text));
  EXPECT_EQ("a < b & c", text->text());
  EXPECT_EQ("a < b & c", root->getAllText());
}

TEST(XMLTree, FindInDocumentOrder)
{
  auto root=EXQTest::parseXML("<w:p><w:r><w:t>1</w:t></w:r><w:hyperlink><w:r><w:t>2</w:t></w:r></w:hyperlink>"
                              "<w:r><w:t>3</w:t></w:r></w:p>");
  ASSERT_TRUE(bool(root));
  std::vector<EXQXMLNodePtr> texts;
  root->findAll(libexq::NS_WORD, "t", texts);
  ASSERT_EQ(size_t(3), texts.size());
  EXPECT_EQ("1", texts[0]->text());
  EXPECT_EQ("2", texts[1]->text());
  EXPECT_EQ("3", texts[2]->text());
  auto first=root->findFirst(libexq::NS_WORD, "t");
  ASSERT_TRUE(bool(first));
  EXPECT_EQ("1", first->text());
  EXPECT_FALSE(root->findFirst(libexq::NS_MATH, "oMath"));
}

TEST(XMLTree, FindAllDoesNotLookInsideFoundElements)
{
  auto root=EXQTest::parseXML("<m:oMath><m:r/><m:oMath/></m:oMath><m:oMath/>");
  ASSERT_TRUE(bool(root));
  std::vector<EXQXMLNodePtr> maths;
  root->findAll(libexq::NS_MATH, "oMath", maths);
  EXPECT_EQ(size_t(2), maths.size());
}

TEST(XMLTree, MalformedInput)
{
  EXPECT_FALSE(EXQXMLParser::parse(std::string("<a><b></a>")));
  EXPECT_FALSE(EXQXMLParser::parse(std::string("")));
  EXPECT_FALSE(EXQXMLParser::parse(std::string("<w:p/>")));
  EXPECT_FALSE(EXQXMLParser::parse(librevenge::RVNGBinaryData()));
}

TEST(XMLTree, NestingLimit)
{
  std::string xml;
  for (int i=0; i<100; ++i) xml+="<w:r>";
  xml+="<w:t>deep</w:t>";
  for (int i=0; i<100; ++i) xml+="</w:r>";
  auto root=EXQTest::parseXML(xml);
  ASSERT_TRUE(bool(root));
  auto text=root->findFirst(libexq::NS_WORD, "t");
  ASSERT_TRUE(bool(text));
  EXPECT_EQ("deep", text->text());

  std::string tooDeep;
  for (size_t i=0; i<100000; ++i) tooDeep+="<a>";
  for (size_t i=0; i<100000; ++i) tooDeep+="</a>";
  EXPECT_FALSE(EXQXMLParser::parse(tooDeep));
  std::string limit, overLimit;
  for (size_t i=0; i<EXQXMLParser::MAX_DEPTH; ++i) limit+="<a>";
  for (size_t i=0; i<EXQXMLParser::MAX_DEPTH; ++i) limit+="</a>";
  EXPECT_TRUE(bool(EXQXMLParser::parse(limit)));
  overLimit="<b>"+limit+"</b>";
  EXPECT_FALSE(EXQXMLParser::parse(overLimit));
}

TEST(XMLTree, AlternateContentKeepsOneBranch)
{
  auto root=EXQTest::parseXML("<mc:AlternateContent><mc:Choice Requires=\"wps\"><w:t>choice</w:t></mc:Choice>"
                              "<mc:Choice><w:t>second</w:t></mc:Choice>"
                              "<mc:Fallback><w:t>fallback</w:t></mc:Fallback></mc:AlternateContent>"
                              "<mc:AlternateContent><mc:Fallback><w:t>only fallback</w:t></mc:Fallback></mc:AlternateContent>");
  ASSERT_TRUE(bool(root));
  std::vector<EXQXMLNodePtr> texts;
  root->findAll(libexq::NS_WORD, "t", texts);
  ASSERT_EQ(size_t(2), texts.size());
  EXPECT_EQ("choice", texts[0]->text());
  EXPECT_EQ("only fallback", texts[1]->text());
  auto const &alternatives=root->children();
  ASSERT_EQ(size_t(2), alternatives.size());
  ASSERT_EQ(size_t(1), alternatives[0]->children().size());
  EXPECT_TRUE(alternatives[0]->children()[0]->is(libexq::NS_MARKUP_COMPATIBILITY, "Choice"));
}
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
