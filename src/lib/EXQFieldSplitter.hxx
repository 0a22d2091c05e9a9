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

#ifndef EXQ_FIELD_SPLITTER_H
#define EXQ_FIELD_SPLITTER_H

#include <map>
#include <string>

#include <libexq/EXQQuestion.hxx>

/** \brief the class which splits the text of a question in its fields
 *
 * The text "N.stem a) ... b) ... Key: ... Hint: ..." is read with an ordered
 * grammar: the leading number, then the first "Hint:" marker, then the
 * first "Key:" marker in the text before the hint, then the option markers
 * a), b), c), d) (first match wins).
 */
class EXQFieldSplitter
{
public:
  //! splits the question text and fills the question number, stem, options, key and hint
  static void split(std::string const &text, EXQQuestion &question);
  //! returns the hint text ended before the beginning of a new question ("7.Next ...")
  static std::string truncateHint(std::string const &hint);
  //! splits a text in a stem and a list of options
  static void splitOptions(std::string const &text, std::string &stem, std::map<char, std::string> &options);
  /** looks for the next option marker "x)" or "(x)" at or after pos whose letter is greater than minLetter,
      outside a math span and not directly after an ASCII letter or digit

      \return the marker position (or std::string::npos) and fills the letter and the marker length */
  static size_t findOptionMarker(std::string const &text, size_t pos, char minLetter, char &letter, size_t &length);
};
#endif
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
