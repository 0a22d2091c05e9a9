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

#include <stdio.h>
#include <string.h>
#include <unistd.h>

#include <cstdlib>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include <librevenge/librevenge.h>
#include <librevenge-stream/librevenge-stream.h>

#include <libexq/libexq.hxx>

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#include "helper.h"

#ifndef VERSION
#define VERSION "UNKNOWN VERSION"
#endif

static int printUsage()
{
  printf("Usage: exq2json [OPTION] <Word Processing Document>\n");
  printf("\n");
  printf("Options:\n");
  printf("\t-h:          Shows this help message\n");
  printf("\t-c:          Creates a compact json file (not indented)\n");
  printf("\t-l:          Output the symbol table statistics\n");
  printf("\t-o file:     Defines the output file\n");
  printf("\t-s:          Output a summary of the questions\n");
  printf("\t-t:          Output the questions text\n");
  printf("\t-v:          Output exq2json version\n");
  printf("\t-z:          Creates a zip file with a folder by question (needs -o)\n");
  printf("\n");
  printf("Example:\n");
  printf("\texq2json -o questions.json file.docx : Converts a file in json\n");
  printf("\texq2json -z -o questions.zip file.docx : Converts a file in a zip file\n");
  return -1;
}

static int printVersion()
{
  printf("exq2json %s\n", VERSION);
  return 0;
}

static void printSymbolStatistics()
{
  std::map<std::string, int> fontToNumberMap;
  EXQDocument::getSymbolStatistics(fontToNumberMap);
  int numSymbols=0;
  for (auto const &it : fontToNumberMap)
    numSymbols+=it.second;
  printf("Fonts: %d\n", int(fontToNumberMap.size()));
  printf("Symbols: %d\n", numSymbols);
  for (auto const &it : fontToNumberMap)
    printf("\t%s: %d\n", it.first.c_str(), it.second);
}

//! returns true if a string contains a MathML element
static bool hasMath(std::string const &text)
{
  return text.find("<math")!=std::string::npos;
}

static void printSummary(std::vector<EXQQuestion> const &questions)
{
  printf("Questions: %d\n", int(questions.size()));
  for (size_t i=0; i<questions.size(); ++i) {
    auto const &question=questions[i];
    bool math=hasMath(question.m_stem) || hasMath(question.m_hint);
    for (auto const &option : question.m_options)
      math = math || hasMath(option.second);
    std::string stem=question.m_stem;
    if (stem.size()>80)
      stem=stem.substr(0,77)+"...";
    if (question.hasNumber())
      printf("Question %d:\n", question.m_number);
    else
      printf("Question #%d (no number):\n", int(i+1));
    printf("\tStem: %s\n", stem.c_str());
    printf("\tOptions: %d\n", int(question.m_options.size()));
    printf("\tKey: %s\n", question.m_hasKey ? question.m_key.c_str() : "N/A");
    printf("\tHint: %s\n", question.m_hasHint ? "Yes" : "No");
    printf("\tMath: %s\n", math ? "Yes" : "No");
    printf("\tImages: %d\n", int(question.m_images.size()));
  }
}

int main(int argc, char *argv[])
{
  bool printHelp=false;
  bool compact=false, createZip=false, printText=false, printQuestionSummary=false;
  char const *output = nullptr;
  int ch;

  while ((ch = getopt(argc, argv, "hvlcztso:")) != -1) {
    switch (ch) {
    case 'c':
      compact=true;
      break;
    case 'l':
      printSymbolStatistics();
      return 0;
    case 'o':
      output=optarg;
      break;
    case 's':
      printQuestionSummary=true;
      break;
    case 't':
      printText=true;
      break;
    case 'z':
      createZip=true;
      break;
    case 'v':
      printVersion();
      return 0;
    default:
    case 'h':
      printHelp = true;
      break;
    }
  }
  if (argc != 1+optind || printHelp) {
    printUsage();
    return 1;
  }
  if (createZip && !output) {
    fprintf(stderr,"ERROR: the zip file needs a output file!\n");
    return 1;
  }
  char const *file=argv[optind];

  auto confidence = EXQDocument::EXQ_C_NONE;
  auto input=libexqHelper::isSupported(file, confidence);
  if (!input || confidence != EXQDocument::EXQ_C_EXCELLENT) {
    fprintf(stderr,"ERROR: Unsupported file format!\n");
    return 1;
  }

  if (printText) {
    std::string text;
    if (libexqHelper::checkErrorAndPrintMessage(EXQDocument::extractText(input.get(), text)))
      return 1;
    text += "\n";
    return libexqHelper::writeData(output, reinterpret_cast<unsigned char const *>(text.c_str()),
                                   static_cast<unsigned long>(text.size())) ? 0 : 1;
  }

  std::vector<EXQQuestion> questions;
  if (libexqHelper::checkErrorAndPrintMessage(EXQDocument::extractQuestions(input.get(), questions)))
    return 1;
  if (questions.empty()) {
    fprintf(stderr,"ERROR: can not find any question!\n");
  }

  if (printQuestionSummary) {
    printSummary(questions);
    return 0;
  }
  if (createZip) {
    librevenge::RVNGBinaryData zip;
    if (!EXQDocument::generatePackage(questions, zip)) {
      fprintf(stderr,"ERROR: can not create the zip file!\n");
      return 1;
    }
    return libexqHelper::writeData(output, zip.getDataBuffer(), zip.size()) ? 0 : 1;
  }
  std::string json;
  if (!EXQDocument::generateJSON(questions, json, !compact)) {
    fprintf(stderr,"ERROR: can not create the json file!\n");
    return 1;
  }
  json += "\n";
  return libexqHelper::writeData(output, reinterpret_cast<unsigned char const *>(json.c_str()),
                                 static_cast<unsigned long>(json.size())) ? 0 : 1;
}
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
