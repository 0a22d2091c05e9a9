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

#ifndef EXQ_JSON_GENERATOR_H
#define EXQ_JSON_GENERATOR_H

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <libexq/EXQQuestion.hxx>

/** \brief the class which creates the json records of the questions
 *
 * A question is stored as {"number","qstem","optA".."optD","key","hint","images"},
 * the unknown fields are stored as null.
 */
class EXQJSONGenerator
{
public:
  //! returns the json record of a question
  static nlohmann::ordered_json getRecord(EXQQuestion const &question);
  //! returns the json array of the questions
  static nlohmann::ordered_json getRecords(std::vector<EXQQuestion> const &questions);
  //! returns the package manifest: {"schemaVersion","questions"}
  static nlohmann::ordered_json getManifest(size_t numQuestions);
  //! converts a json value in a string (indented if pretty is set)
  static std::string dump(nlohmann::ordered_json const &json, bool pretty);
};
#endif
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
