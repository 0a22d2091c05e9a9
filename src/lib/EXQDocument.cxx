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

#include <exception>
#include <string>
#include <vector>

#include <libexq/libexq.hxx>

#include "libexq_internal.hxx"

#include "EXQInputStream.hxx"
#include "EXQJSONGenerator.hxx"
#include "EXQMTEFParser.hxx"
#include "EXQPackage.hxx"
#include "EXQQuestionScanner.hxx"
#include "EXQSymbolTable.hxx"
#include "EXQZipWriter.hxx"

int const EXQDocument::JSON_SCHEMA_VERSION=1;

/** small namespace use to define private class/method used by EXQDocument */
namespace EXQDocumentInternal
{
/** reads the questions of a document and fills the list of questions and the list of texts

    \note may throw libexq::FileException or libexq::ParseException */
static EXQDocument::Result extract(librevenge::RVNGInputStream *input, EXQEquationConverter *converter,
                                   std::vector<EXQQuestion> &questions, std::vector<std::string> &texts)
{
  questions.clear();
  texts.clear();
  if (!input)
    return EXQDocument::EXQ_R_FILE_ACCESS_ERROR;
  EXQInputStreamPtr ip(new EXQInputStream(input));
  EXQPackage package(ip);
  if (!package.open())
    return EXQDocument::EXQ_R_PARSE_ERROR;
  if (!package.hasMainPart())
    return EXQDocument::EXQ_R_OK;
  if (!package.readRelationships()) {
    EXQ_DEBUG_MSG(("EXQDocumentInternal::extract: can not find the relationships of the main part\n"));
    return EXQDocument::EXQ_R_OK;
  }
  auto root=package.getMainDocument();
  if (!root)
    return EXQDocument::EXQ_R_PARSE_ERROR;
  auto body=root->getChild(libexq::NS_WORD, "body");
  if (!body) {
    EXQ_DEBUG_MSG(("EXQDocumentInternal::extract: can not find the document body\n"));
    return EXQDocument::EXQ_R_OK;
  }
  EXQMTEFConverter defaultConverter;
  EXQQuestionScanner scanner(package, converter ? *converter : defaultConverter);
  scanner.scan(*body, questions);
  texts=scanner.getQuestionTexts();
  return EXQDocument::EXQ_R_OK;
}
}

EXQDocument::Confidence EXQDocument::isFileFormatSupported(librevenge::RVNGInputStream *input)
try
{
  if (!input)
    return EXQ_C_NONE;
  EXQInputStreamPtr ip(new EXQInputStream(input));
  EXQPackage package(ip);
  if (!package.open() || !package.hasMainPart())
    return EXQ_C_NONE;
  return EXQ_C_EXCELLENT;
}
catch (libexq::FileException const &)
{
  EXQ_DEBUG_MSG(("EXQDocument::isFileFormatSupported: File exception trapped\n"));
  return EXQ_C_NONE;
}
catch (std::exception const &)
{
  EXQ_DEBUG_MSG(("EXQDocument::isFileFormatSupported: exception trapped\n"));
  return EXQ_C_NONE;
}

EXQDocument::Result EXQDocument::extractQuestions(librevenge::RVNGInputStream *input, std::vector<EXQQuestion> &questions, EXQEquationConverter *converter)
try
{
  std::vector<std::string> texts;
  return EXQDocumentInternal::extract(input, converter, questions, texts);
}
catch (libexq::FileException const &)
{
  EXQ_DEBUG_MSG(("EXQDocument::extractQuestions: File exception trapped\n"));
  questions.clear();
  return EXQ_R_FILE_ACCESS_ERROR;
}
catch (libexq::ParseException const &)
{
  EXQ_DEBUG_MSG(("EXQDocument::extractQuestions: Parse exception trapped\n"));
  questions.clear();
  return EXQ_R_PARSE_ERROR;
}
catch (std::exception const &)
{
  EXQ_DEBUG_MSG(("EXQDocument::extractQuestions: Unknown exception trapped\n"));
  questions.clear();
  return EXQ_R_UNKNOWN_ERROR;
}

EXQDocument::Result EXQDocument::extractText(librevenge::RVNGInputStream *input, std::string &text, EXQEquationConverter *converter)
try
{
  text.clear();
  std::vector<EXQQuestion> questions;
  std::vector<std::string> texts;
  Result res=EXQDocumentInternal::extract(input, converter, questions, texts);
  if (res!=EXQ_R_OK)
    return res;
  for (size_t i=0; i<texts.size(); ++i) {
    if (i) text+="\n\n";
    text+=texts[i];
  }
  return EXQ_R_OK;
}
catch (libexq::FileException const &)
{
  EXQ_DEBUG_MSG(("EXQDocument::extractText: File exception trapped\n"));
  text.clear();
  return EXQ_R_FILE_ACCESS_ERROR;
}
catch (libexq::ParseException const &)
{
  EXQ_DEBUG_MSG(("EXQDocument::extractText: Parse exception trapped\n"));
  text.clear();
  return EXQ_R_PARSE_ERROR;
}
catch (std::exception const &)
{
  EXQ_DEBUG_MSG(("EXQDocument::extractText: Unknown exception trapped\n"));
  text.clear();
  return EXQ_R_UNKNOWN_ERROR;
}

bool EXQDocument::generateJSON(std::vector<EXQQuestion> const &questions, std::string &json, bool pretty)
try
{
  json=EXQJSONGenerator::dump(EXQJSONGenerator::getRecords(questions), pretty);
  return true;
}
catch (std::exception const &)
{
  EXQ_DEBUG_MSG(("EXQDocument::generateJSON: can not create the json\n"));
  json.clear();
  return false;
}

bool EXQDocument::generatePackage(std::vector<EXQQuestion> const &questions, librevenge::RVNGBinaryData &zip)
try
{
  zip.clear();
  EXQZipWriter writer;
  for (size_t i=0; i<questions.size(); ++i) {
    auto const &question=questions[i];
    libexq::DebugStream s;
    s << "question_" << (question.hasNumber() ? long(question.m_number) : long(i+1));
    std::string folder=s.str();
    // two questions can have the same number
    for (int suffix=2; writer.exists(folder+"/question.json"); ++suffix) {
      libexq::DebugStream f;
      f << s.str() << "_" << suffix;
      folder=f.str();
    }
    if (!writer.add(folder+"/question.json", EXQJSONGenerator::dump(EXQJSONGenerator::getRecord(question), true)))
      return false;
    for (auto const &image : question.m_images) {
      if (!writer.add(folder+"/images/"+image.m_name, image.m_data))
        return false;
    }
  }
  if (!writer.add("manifest.json", EXQJSONGenerator::dump(EXQJSONGenerator::getManifest(questions.size()), true)))
    return false;
  writer.getData(zip);
  return true;
}
catch (std::exception const &)
{
  EXQ_DEBUG_MSG(("EXQDocument::generatePackage: can not create the package\n"));
  zip.clear();
  return false;
}

void EXQDocument::getSymbolStatistics(std::map<std::string, int> &fontToNumberMap)
{
  fontToNumberMap=EXQSymbolTable::getStatistics().m_fontToNumberMap;
}
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
