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

#include "libexq_internal.hxx"

#include "EXQFieldSplitter.hxx"
#include "EXQImageBinder.hxx"
#include "EXQOfficeMath.hxx"
#include "EXQPackage.hxx"
#include "EXQRunMerger.hxx"

#include "EXQQuestionScanner.hxx"

/** Internal: the structures of a EXQQuestionScanner */
namespace EXQQuestionScannerInternal
{
////////////////////////////////////////
//! Internal: the state of a EXQQuestionScanner
struct State {
  //! constructor
  State()
    : m_buffer()
    , m_insideQuestion(false)
    , m_binder()
    , m_questions(nullptr)
    , m_texts()
  {
  }
  //! returns the buffer text: the chunks separated by a space
  std::string getText() const
  {
    std::string res;
    for (size_t i=0; i<m_buffer.size(); ++i) {
      if (i) res+=' ';
      res+=m_buffer[i];
    }
    return libexq::trim(res);
  }
  //! the text chunks of the current question
  std::vector<std::string> m_buffer;
  //! a flag to know if we are inside a question
  bool m_insideQuestion;
  //! the picture binder
  EXQImageBinder m_binder;
  //! the list of created questions
  std::vector<EXQQuestion> *m_questions;
  //! the text of the created questions
  std::vector<std::string> m_texts;
};
}

EXQQuestionScanner::EXQQuestionScanner(EXQPackage &package, EXQEquationConverter &converter)
  : m_package(package)
  , m_converter(converter)
  , m_state(new EXQQuestionScannerInternal::State)
{
}

EXQQuestionScanner::~EXQQuestionScanner()
{
}

std::vector<std::string> const &EXQQuestionScanner::getQuestionTexts() const
{
  return m_state->m_texts;
}

bool EXQQuestionScanner::isQuestionStart(std::string const &text)
{
  std::string const str=libexq::trim(text);
  return !str.empty() && libexq::matchQuestionPrefix(str, 0)!=0;
}

void EXQQuestionScanner::scan(EXQXMLNode const &body, std::vector<EXQQuestion> &questions)
{
  m_state.reset(new EXQQuestionScannerInternal::State);
  m_state->m_questions=&questions;
  for (auto const &child : body.children()) {
    if (!child || !child->is(libexq::NS_WORD, "p"))
      continue;
    readParagraph(*child);
  }
  if (m_state->m_insideQuestion)
    flush();
  m_state->m_questions=nullptr;
}

void EXQQuestionScanner::readParagraph(EXQXMLNode const &paragraph)
{
  std::string const text=libexq::trim(EXQRunMerger::getParagraphText(paragraph));
  if (isQuestionStart(text)) {
    if (m_state->m_insideQuestion)
      flush();
    m_state->m_buffer.push_back(text);
    m_state->m_insideQuestion=true;
  }
  else if (!m_state->m_insideQuestion)
    return;
  else if (!text.empty())
    m_state->m_buffer.push_back(text);

  readPictures(paragraph);
  readEquationObjects(paragraph);
  readOfficeMaths(paragraph);
}

int EXQQuestionScanner::getCurrentNumber() const
{
  if (m_state->m_buffer.empty())
    return -1;
  int number;
  if (!libexq::matchNumberPrefix(libexq::trim(m_state->m_buffer[0]), 0, &number))
    return -1;
  return number;
}

void EXQQuestionScanner::findPictureIds(EXQXMLNode const &node, std::vector<std::string> &ids)
{
  for (auto const &child : node.children()) {
    if (!child) continue;
    // an equation object has also a preview picture, it is converted by readEquationObjects
    if (child->is(libexq::NS_WORD, "object"))
      continue;
    if (child->is(libexq::NS_WORD, "drawing")) {
      std::vector<EXQXMLNodePtr> blips;
      child->findAll(libexq::NS_DRAWING, "blip", blips);
      for (auto const &blip : blips) {
        std::string const id=blip->getAttribute(libexq::NS_RELATIONSHIPS, "embed");
        if (!id.empty()) ids.push_back(id);
      }
      continue;
    }
    if (child->is(libexq::NS_WORD, "pict")) {
      std::vector<EXQXMLNodePtr> images;
      child->findAll(libexq::NS_VML, "imagedata", images);
      for (auto const &image : images) {
        std::string const id=image->getAttribute(libexq::NS_RELATIONSHIPS, "id");
        if (!id.empty()) ids.push_back(id);
      }
      continue;
    }
    findPictureIds(*child, ids);
  }
}

void EXQQuestionScanner::readPictures(EXQXMLNode const &paragraph)
{
  std::vector<std::string> ids;
  findPictureIds(paragraph, ids);
  for (auto const &id : ids) {
    std::string target;
    if (!m_package.getTarget(id, target)) {
      EXQ_DEBUG_MSG(("EXQQuestionScanner::readPictures: can not find the picture %s\n", id.c_str()));
      continue;
    }
    librevenge::RVNGBinaryData data;
    if (!m_package.getPart(target, data)) {
      EXQ_DEBUG_MSG(("EXQQuestionScanner::readPictures: can not read the part %s\n", target.c_str()));
      continue;
    }
    m_state->m_buffer.push_back(m_state->m_binder.addImage(getCurrentNumber(), target, data));
  }
}

void EXQQuestionScanner::readEquationObjects(EXQXMLNode const &paragraph)
{
  std::vector<EXQXMLNodePtr> objects;
  paragraph.findAll(libexq::NS_OFFICE, "OLEObject", objects);
  for (auto const &object : objects) {
    std::string const id=object->getAttribute(libexq::NS_RELATIONSHIPS, "id");
    std::string target;
    if (id.empty() || !m_package.getTarget(id, target)) {
      EXQ_DEBUG_MSG(("EXQQuestionScanner::readEquationObjects: can not find the object %s\n", id.c_str()));
      continue;
    }
    librevenge::RVNGBinaryData data;
    if (!m_package.getPart(target, data)) {
      EXQ_DEBUG_MSG(("EXQQuestionScanner::readEquationObjects: can not read the part %s\n", target.c_str()));
      continue;
    }
    std::string mathML;
    try {
      if (!m_converter.convert(data, mathML))
        mathML.clear();
    }
    catch (libexq::FileException const &) {
      EXQ_DEBUG_MSG(("EXQQuestionScanner::readEquationObjects: get a file exception for %s\n", target.c_str()));
      mathML.clear();
    }
    catch (libexq::ParseException const &) {
      EXQ_DEBUG_MSG(("EXQQuestionScanner::readEquationObjects: get a parse exception for %s\n", target.c_str()));
      mathML.clear();
    }
    catch (std::exception const &e) {
      EXQ_DEBUG_MSG(("EXQQuestionScanner::readEquationObjects: get exception %s for %s\n", e.what(), target.c_str()));
      mathML.clear();
    }
    if (mathML.empty()) {
      EXQ_DEBUG_MSG(("EXQQuestionScanner::readEquationObjects: can not convert %s\n", target.c_str()));
      continue;
    }
    m_state->m_buffer.push_back(mathML);
  }
}

void EXQQuestionScanner::readOfficeMaths(EXQXMLNode const &paragraph)
{
  std::vector<EXQXMLNodePtr> maths;
  paragraph.findAll(libexq::NS_MATH, "oMath", maths);
  for (auto const &math : maths) {
    std::string const mathML=EXQOfficeMath::convert(*math);
    if (!mathML.empty())
      m_state->m_buffer.push_back(mathML);
  }
}

void EXQQuestionScanner::flush()
{
  std::string const text=m_state->getText();
  m_state->m_buffer.clear();
  m_state->m_insideQuestion=false;
  if (text.empty())
    return;
  m_state->m_texts.push_back(text);
  EXQQuestion question;
  EXQFieldSplitter::split(text, question);
  if (question.hasNumber())
    m_state->m_binder.retrieveImages(question.m_number, question.m_images);
  if (m_state->m_questions)
    m_state->m_questions->push_back(question);
}
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
