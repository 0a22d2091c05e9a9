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

/** \file EXQDocument.hxx
 * libexq API: main interface functions of the libexq
 *
 * \see libexq.hxx
 */
#ifndef EXQDOCUMENT_HXX
#define EXQDOCUMENT_HXX

#include <map>
#include <string>
#include <vector>

#include "EXQEquationConverter.hxx"
#include "EXQQuestion.hxx"

namespace librevenge
{
class RVNGBinaryData;
class RVNGInputStream;
}

/**
This class provides all the functions needed by applications to extract the
questions stored in a word processing document (a zip archive of xml parts).
*/
class EXQDocument
{
public:
  /** an enum which defines if we have confidence that a file is supported */
  enum Confidence {
    EXQ_C_NONE=0/**< not supported */,
    EXQ_C_EXCELLENT /** supported */
  };
  /** an enum which defines the result of the file parsing */
  enum Result {
    EXQ_R_OK=0 /**< conversion ok*/,
    EXQ_R_FILE_ACCESS_ERROR /** problem when accessing file*/,
    EXQ_R_PARSE_ERROR /** problem when parsing the file*/,
    EXQ_R_UNKNOWN_ERROR /** unknown error*/
  };
  //! the version of the json records created by generateJSON
  static EXQLIB int const JSON_SCHEMA_VERSION;

  /** Analyzes the content of an input stream to see if it can be parsed
      \param input The input stream
      \return A confidence value which represents the likelyhood that the content from
      the input stream can be parsed */
  static EXQLIB Confidence isFileFormatSupported(librevenge::RVNGInputStream *input);

  /** Extracts the questions stored in the input stream.
     \param input The input stream
     \param questions The list of questions (in document order)
     \param converter The converter used to convert the embedded equation objects, if
     not set, the libexq MTEF converter is used

     \note a document without a main part or without relationships returns
     EXQ_R_OK and no question */
  static EXQLIB Result extractQuestions(librevenge::RVNGInputStream *input, std::vector<EXQQuestion> &questions, EXQEquationConverter *converter=nullptr);

  /** Extracts the questions text stored in the input stream, ie. the text of each
      question (before the options, key, hint separation) separated by an empty line.
     \param input The input stream
     \param text The result
     \param converter The converter used to convert the embedded equation objects */
  static EXQLIB Result extractText(librevenge::RVNGInputStream *input, std::string &text, EXQEquationConverter *converter=nullptr);

  /** Creates the json array corresponding to a list of questions.

      Each question is stored as
      {"number":int|null, "qstem":string, "optA":string|null, ..., "optD":string|null,
       "key":string|null, "hint":string|null, "images":[string]}

     \param questions The list of questions
     \param json The result
     \param pretty If true, the json is indented */
  static EXQLIB bool generateJSON(std::vector<EXQQuestion> const &questions, std::string &json, bool pretty=true);

  /** Creates a zip archive which contains a folder by question:
      question_N/question.json and question_N/images/image_M.ext, and a
      manifest.json file.
     \param questions The list of questions
     \param zip The zip data */
  static EXQLIB bool generatePackage(std::vector<EXQQuestion> const &questions, librevenge::RVNGBinaryData &zip);

  //! fills a map font name (lower case) to the number of its symbol codes which can be converted
  static EXQLIB void getSymbolStatistics(std::map<std::string, int> &fontToNumberMap);
};

#endif /* EXQDOCUMENT_HXX */
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
