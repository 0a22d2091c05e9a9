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

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <libexq/libexq.hxx>

#include "libexq_internal.hxx"

#include "EXQImageBinder.hxx"
#include "EXQInputStream.hxx"
#include "EXQPackage.hxx"
#include "EXQSymbolTable.hxx"

#include "EXQTestHelper.h"

namespace
{
std::string const s_imageType("http://schemas.openxmlformats.org/officeDocument/2006/relationships/image");
std::string const s_objectType("http://schemas.openxmlformats.org/officeDocument/2006/relationships/oleObject");
std::string const s_officeMath("<m:oMath><m:r><m:t>x=1</m:t></m:r></m:oMath>");
std::string const s_officeMathML("<math display=\"block\"><mrow><mi>x</mi><mo>=</mo><mi>1</mi></mrow></math>");

//! a converter which returns always the same equation
class FixedConverter : public EXQEquationConverter
{
public:
  FixedConverter() : m_numCalls(0) {}
  bool convert(librevenge::RVNGBinaryData const &data, std::string &mathML) override
  {
    ++m_numCalls;
    if (data.empty())
      return false;
    mathML="<math><mi>eq</mi></math>";
    return true;
  }
  int m_numCalls;
};

//! a converter which throws an exception
class ThrowingConverter : public EXQEquationConverter
{
public:
  bool convert(librevenge::RVNGBinaryData const &, std::string &) override
  {
    throw std::runtime_error("can not convert");
  }
};

std::string getString(librevenge::RVNGBinaryData const &data)
{
  if (data.empty()) return "";
  return std::string(reinterpret_cast<char const *>(data.getDataBuffer()), size_t(data.size()));
}

//! returns a document with some front matter and three questions
librevenge::RVNGBinaryData getExamDocument()
{
  EXQTest::DocumentBuilder builder;
  std::string body;
  body+=EXQTest::paragraph("Physics exam");
  body+=EXQTest::paragraph("Answer all the questions.");
  body+=EXQTest::paragraph("1.What is the SI unit of force?");
  body+=EXQTest::paragraph("a) Newton b) Joule");
  body+="<w:p/>";
  body+=EXQTest::paragraph("Key: a");
  body+="<w:p>"+EXQTest::run("2.The charge of an electron is 1.6 x 10")+EXQTest::run("-19", "superscript")+EXQTest::run(" C.")+
        EXQTest::drawingRun("rId10")+EXQTest::drawingRun("rIdMissing")+"</w:p>";
  body+=EXQTest::paragraph("a) true b) false");
  body+=EXQTest::paragraph("Key: a");
  // a paragraph in a table is not read
  body+="<w:tbl><w:tr><w:tc>"+EXQTest::paragraph("9.Not a question")+"</w:tc></w:tr></w:tbl>";
  body+="<w:p>"+EXQTest::run("3.Solve ")+EXQTest::objectRun("rId20")+s_officeMath+"</w:p>";
  body+=EXQTest::paragraph("a) 1 b) 2 Hint: easy 4.Not a question");
  builder.setBody(body);
  builder.addRelationship("rId10", s_imageType, "media/image1.png");
  builder.addRelationship("rId20", s_objectType, "embeddings/oleObject1.bin");
  builder.addPart("word/media/image1.png", "PNG-BYTES");
  builder.addPart("word/embeddings/oleObject1.bin", "OLE-BYTES");
  return builder.getData();
}

EXQDocument::Result extract(librevenge::RVNGBinaryData const &data, std::vector<EXQQuestion> &questions,
                            EXQEquationConverter *converter)
{
  auto stream=EXQTest::getStream(data);
  return EXQDocument::extractQuestions(stream.get(), questions, converter);
}
}

TEST(Document, ThreeQuestions)
{
  FixedConverter converter;
  std::vector<EXQQuestion> questions;
  ASSERT_EQ(EXQDocument::EXQ_R_OK, extract(getExamDocument(), questions, &converter));
  ASSERT_EQ(size_t(3), questions.size());
  EXPECT_EQ(1, converter.m_numCalls);

  auto const &q1=questions[0];
  EXPECT_EQ(1, q1.m_number);
  EXPECT_EQ("What is the SI unit of force?", q1.m_stem);
  EXPECT_EQ(size_t(2), q1.m_options.size());
  EXPECT_EQ("Newton", q1.getOption('a'));
  EXPECT_EQ("Joule", q1.getOption('b'));
  EXPECT_TRUE(q1.m_hasKey);
  EXPECT_EQ("a", q1.m_key);
  EXPECT_FALSE(q1.m_hasHint);
  EXPECT_TRUE(q1.m_images.empty());

  auto const &q2=questions[1];
  EXPECT_EQ(2, q2.m_number);
  EXPECT_EQ("The charge of an electron is 1.6 x <math><msup><mn>10</mn><mn>-19</mn></msup></math> C. "
            "<img src=\"image_1.png\"/>", q2.m_stem);
  EXPECT_EQ("true", q2.getOption('a'));
  EXPECT_EQ("false", q2.getOption('b'));
  ASSERT_EQ(size_t(1), q2.m_images.size());
  EXPECT_EQ("image_1.png", q2.m_images[0].m_name);
  EXPECT_EQ("PNG-BYTES", getString(q2.m_images[0].m_data));

  auto const &q3=questions[2];
  EXPECT_EQ(3, q3.m_number);
  EXPECT_EQ("Solve <math><mi>eq</mi></math> "+s_officeMathML, q3.m_stem);
  EXPECT_EQ("1", q3.getOption('a'));
  EXPECT_EQ("2", q3.getOption('b'));
  EXPECT_FALSE(q3.m_hasKey);
  EXPECT_TRUE(q3.m_hasHint);
  EXPECT_EQ("easy", q3.m_hint);
}

TEST(Document, AlternateContentIsReadOnce)
{
  EXQTest::DocumentBuilder builder;
  builder.setBody("<w:p>"+EXQTest::run("1.Look at the figure ")+
                  "<mc:AlternateContent><mc:Choice Requires=\"w14\">"+EXQTest::run("in a box")+"</mc:Choice>"
                  "<mc:Fallback>"+EXQTest::run("in a box")+"</mc:Fallback></mc:AlternateContent>"
                  "<w:r><mc:AlternateContent><mc:Choice Requires=\"wps\"><w:drawing><a:graphic><a:graphicData>"
                  "<a:blip r:embed=\"rId5\"/></a:graphicData></a:graphic></w:drawing></mc:Choice>"
                  "<mc:Fallback><w:pict><v:shape><v:imagedata r:id=\"rId5\"/></v:shape></w:pict></mc:Fallback>"
                  "</mc:AlternateContent></w:r></w:p>");
  builder.addRelationship("rId5", s_imageType, "media/figure.gif");
  builder.addPart("word/media/figure.gif", "GIF-BYTES");
  std::vector<EXQQuestion> questions;
  ASSERT_EQ(EXQDocument::EXQ_R_OK, extract(builder.getData(), questions, nullptr));
  ASSERT_EQ(size_t(1), questions.size());
  EXPECT_EQ("Look at the figure in a box <img src=\"image_1.gif\"/>", questions[0].m_stem);
  ASSERT_EQ(size_t(1), questions[0].m_images.size());
  EXPECT_EQ("image_1.gif", questions[0].m_images[0].m_name);
  EXPECT_EQ("GIF-BYTES", getString(questions[0].m_images[0].m_data));
}

TEST(Document, ExtractionIsRepeatable)
{
  auto const data=getExamDocument();
  FixedConverter converter;
  std::vector<EXQQuestion> first, second;
  ASSERT_EQ(EXQDocument::EXQ_R_OK, extract(data, first, &converter));
  ASSERT_EQ(EXQDocument::EXQ_R_OK, extract(data, second, &converter));
  std::string firstJSON, secondJSON;
  ASSERT_TRUE(EXQDocument::generateJSON(first, firstJSON));
  ASSERT_TRUE(EXQDocument::generateJSON(second, secondJSON));
  EXPECT_EQ(firstJSON, secondJSON);
  ASSERT_EQ(size_t(3), second.size());
  ASSERT_EQ(size_t(1), second[1].m_images.size());
  EXPECT_EQ("image_1.png", second[1].m_images[0].m_name);
}

TEST(Document, FailedEquationsAreDropped)
{
  auto const data=getExamDocument();
  std::vector<EXQQuestion> questions;
  // the object is not a MTEF equation
  ASSERT_EQ(EXQDocument::EXQ_R_OK, extract(data, questions, nullptr));
  ASSERT_EQ(size_t(3), questions.size());
  EXPECT_EQ("Solve "+s_officeMathML, questions[2].m_stem);

  ThrowingConverter converter;
  ASSERT_EQ(EXQDocument::EXQ_R_OK, extract(data, questions, &converter));
  ASSERT_EQ(size_t(3), questions.size());
  EXPECT_EQ("Solve "+s_officeMathML, questions[2].m_stem);
  EXPECT_EQ("easy", questions[2].m_hint);
}

TEST(Document, ExtractText)
{
  FixedConverter converter;
  auto const data=getExamDocument();
  auto stream=EXQTest::getStream(data);
  std::string text;
  ASSERT_EQ(EXQDocument::EXQ_R_OK, EXQDocument::extractText(stream.get(), text, &converter));
  EXPECT_EQ("1.What is the SI unit of force? a) Newton b) Joule Key: a\n\n"
            "2.The charge of an electron is 1.6 x <math><msup><mn>10</mn><mn>-19</mn></msup></math> C. "
            "<img src=\"image_1.png\"/> a) true b) false Key: a\n\n"
            "3.Solve <math><mi>eq</mi></math> "+s_officeMathML+" a) 1 b) 2 Hint: easy 4.Not a question", text);
}

TEST(Document, JSONRecords)
{
  FixedConverter converter;
  std::vector<EXQQuestion> questions;
  ASSERT_EQ(EXQDocument::EXQ_R_OK, extract(getExamDocument(), questions, &converter));
  std::string json;
  ASSERT_TRUE(EXQDocument::generateJSON(questions, json, false));
  EXPECT_EQ(std::string::npos, json.find('\n'));
  auto const records=nlohmann::json::parse(json);
  ASSERT_TRUE(records.is_array());
  ASSERT_EQ(size_t(3), records.size());
  EXPECT_EQ(1, records[0]["number"].get<int>());
  EXPECT_EQ("What is the SI unit of force?", records[0]["qstem"].get<std::string>());
  EXPECT_EQ("Newton", records[0]["optA"].get<std::string>());
  EXPECT_TRUE(records[0]["optC"].is_null());
  EXPECT_TRUE(records[0]["optD"].is_null());
  EXPECT_EQ("a", records[0]["key"].get<std::string>());
  EXPECT_TRUE(records[0]["hint"].is_null());
  EXPECT_TRUE(records[0]["images"].empty());
  ASSERT_EQ(size_t(1), records[1]["images"].size());
  EXPECT_EQ("image_1.png", records[1]["images"][0].get<std::string>());
  EXPECT_TRUE(records[2]["key"].is_null());
  EXPECT_EQ("easy", records[2]["hint"].get<std::string>());

  // the fields keep their order
  std::string pretty;
  ASSERT_TRUE(EXQDocument::generateJSON(questions, pretty));
  EXPECT_NE(std::string::npos, pretty.find('\n'));
  EXPECT_LT(pretty.find("\"number\""), pretty.find("\"qstem\""));
  EXPECT_LT(pretty.find("\"optD\""), pretty.find("\"key\""));
  EXPECT_LT(pretty.find("\"hint\""), pretty.find("\"images\""));
}

TEST(Document, JSONWithoutNumber)
{
  std::vector<EXQQuestion> questions(1);
  questions[0].m_stem="A question";
  std::string json;
  ASSERT_TRUE(EXQDocument::generateJSON(questions, json, false));
  auto const records=nlohmann::json::parse(json);
  EXPECT_TRUE(records[0]["number"].is_null());
  EXPECT_EQ("A question", records[0]["qstem"].get<std::string>());
  ASSERT_TRUE(EXQDocument::generateJSON(std::vector<EXQQuestion>(), json, false));
  EXPECT_EQ("[]", json);
}

TEST(Document, Package)
{
  FixedConverter converter;
  std::vector<EXQQuestion> questions;
  ASSERT_EQ(EXQDocument::EXQ_R_OK, extract(getExamDocument(), questions, &converter));
  // a second question with number 2
  questions.push_back(questions[1]);
  questions.back().m_images.clear();
  librevenge::RVNGBinaryData zip;
  ASSERT_TRUE(EXQDocument::generatePackage(questions, zip));

  auto stream=EXQTest::getStream(zip);
  EXQInputStreamPtr input(new EXQInputStream(stream.get()));
  EXQPackage package(input);
  ASSERT_TRUE(package.open());
  librevenge::RVNGBinaryData part;
  ASSERT_TRUE(package.getPart("manifest.json", part));
  auto const manifest=nlohmann::json::parse(getString(part));
  EXPECT_EQ(EXQDocument::JSON_SCHEMA_VERSION, manifest["schemaVersion"].get<int>());
  EXPECT_EQ(4, manifest["questions"].get<int>());

  ASSERT_TRUE(package.getPart("question_1/question.json", part));
  auto const record=nlohmann::json::parse(getString(part));
  EXPECT_EQ("Newton", record["optA"].get<std::string>());
  EXPECT_TRUE(package.getPart("question_3/question.json", part));
  EXPECT_TRUE(package.getPart("question_2/question.json", part));
  EXPECT_TRUE(package.getPart("question_2_2/question.json", part));
  ASSERT_TRUE(package.getPart("question_2/images/image_1.png", part));
  EXPECT_EQ("PNG-BYTES", getString(part));
  EXPECT_FALSE(package.getPart("question_2_2/images/image_1.png", part));
}

TEST(Document, PackageUsesIndexWithoutNumber)
{
  std::vector<EXQQuestion> questions(2);
  questions[1].m_number=7;
  librevenge::RVNGBinaryData zip;
  ASSERT_TRUE(EXQDocument::generatePackage(questions, zip));
  auto stream=EXQTest::getStream(zip);
  EXQInputStreamPtr input(new EXQInputStream(stream.get()));
  EXQPackage package(input);
  ASSERT_TRUE(package.open());
  librevenge::RVNGBinaryData part;
  EXPECT_TRUE(package.getPart("question_1/question.json", part));
  EXPECT_TRUE(package.getPart("question_7/question.json", part));
}

TEST(Document, FrontMatterOnly)
{
  EXQTest::DocumentBuilder builder;
  builder.setBody(EXQTest::paragraph("Exam")+EXQTest::paragraph("no question here: 3. is not at the beginning")+
                  EXQTest::paragraph("4.lower case is not a question"));
  std::vector<EXQQuestion> questions;
  EXPECT_EQ(EXQDocument::EXQ_R_OK, extract(builder.getData(), questions, nullptr));
  EXPECT_TRUE(questions.empty());
}

TEST(Document, MissingParts)
{
  std::vector<EXQQuestion> questions(1);
  EXQTest::DocumentBuilder noMainPart;
  noMainPart.setWithMainPart(false);
  EXPECT_EQ(EXQDocument::EXQ_R_OK, extract(noMainPart.getData(), questions, nullptr));
  EXPECT_TRUE(questions.empty());

  questions.resize(1);
  EXQTest::DocumentBuilder noRelationships;
  noRelationships.setBody(EXQTest::paragraph("1.A question"));
  noRelationships.setWithRelationships(false);
  EXPECT_EQ(EXQDocument::EXQ_R_OK, extract(noRelationships.getData(), questions, nullptr));
  EXPECT_TRUE(questions.empty());
}

TEST(Document, Errors)
{
  std::vector<EXQQuestion> questions;
  EXPECT_EQ(EXQDocument::EXQ_R_FILE_ACCESS_ERROR, EXQDocument::extractQuestions(nullptr, questions));
  EXPECT_EQ(EXQDocument::EXQ_R_PARSE_ERROR,
            extract(EXQTest::getData(std::vector<unsigned char>(64, 'x')), questions, nullptr));

  EXQTest::DocumentBuilder malformed;
  malformed.setWithMainPart(false);
  malformed.addPart("word/document.xml", "<w:document xmlns:w=\"x\"><w:body></w:document>");
  EXPECT_EQ(EXQDocument::EXQ_R_PARSE_ERROR, extract(malformed.getData(), questions, nullptr));
}

TEST(Document, FileFormat)
{
  EXPECT_EQ(EXQDocument::EXQ_C_NONE, EXQDocument::isFileFormatSupported(nullptr));
  auto const data=getExamDocument();
  auto stream=EXQTest::getStream(data);
  EXPECT_EQ(EXQDocument::EXQ_C_EXCELLENT, EXQDocument::isFileFormatSupported(stream.get()));
  auto const text=EXQTest::getData(std::vector<unsigned char>(64, 'x'));
  auto textStream=EXQTest::getStream(text);
  EXPECT_EQ(EXQDocument::EXQ_C_NONE, EXQDocument::isFileFormatSupported(textStream.get()));
}

TEST(ImageBinder, Names)
{
  EXQImageBinder binder;
  librevenge::RVNGBinaryData data;
  EXPECT_EQ("<img src=\"image_1.jpeg\"/>", binder.addImage(4, "word/media/photo.JPEG", data));
  EXPECT_EQ("<img/>", binder.addImage(-1, "word/media/lost.png", data));
  EXPECT_EQ("<img src=\"image_3.png\"/>", binder.addImage(4, "word/media.dir/noextension", data));
  EXPECT_EQ(3, binder.getNumImages());

  std::vector<EXQImage> images;
  binder.retrieveImages(5, images);
  EXPECT_TRUE(images.empty());
  binder.retrieveImages(4, images);
  ASSERT_EQ(size_t(2), images.size());
  EXPECT_EQ("image_1.jpeg", images[0].m_name);
  EXPECT_EQ("image_3.png", images[1].m_name);
  images.clear();
  binder.retrieveImages(4, images);
  EXPECT_TRUE(images.empty());
}

TEST(Document, SymbolStatistics)
{
  std::map<std::string, int> fontToNumberMap;
  EXQDocument::getSymbolStatistics(fontToNumberMap);
  auto const stats=EXQSymbolTable::getStatistics();
  EXPECT_EQ(size_t(stats.m_numFonts), fontToNumberMap.size());
  EXPECT_EQ(stats.m_fontToNumberMap, fontToNumberMap);
  ASSERT_EQ(size_t(1), fontToNumberMap.count("symbol"));
  EXPECT_LE(90, fontToNumberMap["symbol"]);
  EXPECT_EQ(size_t(1), fontToNumberMap.count("wingdings"));
  EXPECT_EQ(size_t(1), fontToNumberMap.count("webdings"));
}
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
