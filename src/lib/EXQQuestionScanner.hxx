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

#ifndef EXQ_QUESTION_SCANNER_H
#define EXQ_QUESTION_SCANNER_H

#include <memory>
#include <string>
#include <vector>

#include <libexq/EXQEquationConverter.hxx>
#include <libexq/EXQQuestion.hxx>

#include "EXQXMLTree.hxx"

class EXQPackage;

namespace EXQQuestionScannerInternal
{
struct State;
}

/** \brief the class which reads the paragraphs of the main part and creates the questions
 *
 * A paragraph whose text begins with "digits.[spaces]Upper" starts a new
 * question, the following non empty paragraphs are added to it. The
 * paragraphs found before the first question are ignored. For each
 * paragraph of a question, the pictures, then the equation objects, then
 * the office math elements are converted and added to the question text.
 *
 * \note the scanner state (buffer, picture counter, ...) is local to one
 * object, so a scanner must be created for each document.
 */
class EXQQuestionScanner
{
public:
  //! constructor
  EXQQuestionScanner(EXQPackage &package, EXQEquationConverter &converter);
  //! destructor
  ~EXQQuestionScanner();
  //! reads the paragraphs of a body element and fills the list of questions
  void scan(EXQXMLNode const &body, std::vector<EXQQuestion> &questions);
  //! returns the text of each question found by the last scan (before the fields separation)
  std::vector<std::string> const &getQuestionTexts() const;
  //! returns true if a text begins a question: "digits.[spaces]Upper"
  static bool isQuestionStart(std::string const &text);

protected:
  //! reads a paragraph
  void readParagraph(EXQXMLNode const &paragraph);
  //! adds the pictures of a paragraph in the current question
  void readPictures(EXQXMLNode const &paragraph);
  //! adds the equation objects of a paragraph in the current question
  void readEquationObjects(EXQXMLNode const &paragraph);
  //! adds the office math elements of a paragraph in the current question
  void readOfficeMaths(EXQXMLNode const &paragraph);
  //! creates a question with the current text and resets the buffer
  void flush();
  //! returns the current question number, or -1
  int getCurrentNumber() const;
  //! looks for the pictures identifiers (r:embed, r:id) of a node in document order
  static void findPictureIds(EXQXMLNode const &node, std::vector<std::string> &ids);

private:
  EXQQuestionScanner(EXQQuestionScanner const &orig) = delete;
  EXQQuestionScanner &operator=(EXQQuestionScanner const &orig) = delete;
  //! the package
  EXQPackage &m_package;
  //! the equation converter
  EXQEquationConverter &m_converter;
  //! the state
  std::shared_ptr<EXQQuestionScannerInternal::State> m_state;
};
#endif
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
