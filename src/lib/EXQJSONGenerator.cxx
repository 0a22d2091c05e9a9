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

#include <libexq/libexq.hxx>

#include "libexq_internal.hxx"

#include "EXQJSONGenerator.hxx"

nlohmann::ordered_json EXQJSONGenerator::getRecord(EXQQuestion const &question)
{
  nlohmann::ordered_json res;
  if (question.hasNumber())
    res["number"]=question.m_number;
  else
    res["number"]=nullptr;
  res["qstem"]=question.m_stem;
  char const *names[]= {"optA", "optB", "optC", "optD"};
  for (int i=0; i<4; ++i) {
    char letter=char('a'+i);
    if (question.hasOption(letter))
      res[names[i]]=question.getOption(letter);
    else
      res[names[i]]=nullptr;
  }
  if (question.m_hasKey)
    res["key"]=question.m_key;
  else
    res["key"]=nullptr;
  if (question.m_hasHint)
    res["hint"]=question.m_hint;
  else
    res["hint"]=nullptr;
  nlohmann::ordered_json images=nlohmann::ordered_json::array();
  for (auto const &image : question.m_images)
    images.push_back(image.m_name);
  res["images"]=images;
  return res;
}

nlohmann::ordered_json EXQJSONGenerator::getRecords(std::vector<EXQQuestion> const &questions)
{
  nlohmann::ordered_json res=nlohmann::ordered_json::array();
  for (auto const &question : questions)
    res.push_back(getRecord(question));
  return res;
}

nlohmann::ordered_json EXQJSONGenerator::getManifest(size_t numQuestions)
{
  nlohmann::ordered_json res;
  res["schemaVersion"]=EXQDocument::JSON_SCHEMA_VERSION;
  res["questions"]=numQuestions;
  return res;
}

std::string EXQJSONGenerator::dump(nlohmann::ordered_json const &json, bool pretty)
{
  // the texts come from the document, a invalid UTF-8 sequence must not abort the generation
  return json.dump(pretty ? 2 : -1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
