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

#ifndef EXQ_RUN_MERGER_H
#define EXQ_RUN_MERGER_H

#include <ostream>
#include <string>
#include <vector>

#include "EXQXMLTree.hxx"

//! a piece of text of a run with its vertical position
struct EXQRunFragment {
  //! the vertical position
  enum Kind { Normal, Superscript, Subscript };
  //! constructor
  EXQRunFragment(Kind kind, std::string const &text)
    : m_kind(kind)
    , m_text(text)
  {
  }
  //! operator<<
  friend std::ostream &operator<<(std::ostream &o, EXQRunFragment const &fragment);
  //! the kind
  Kind m_kind;
  //! the text
  std::string m_text;
};

/** \brief the class which retrieves the text of a paragraph
 *
 * The runs are read in document order, each text (w:t) and each symbol
 * (w:sym) creates a fragment. Then a superscript which follows a number
 * and a subscript which follows a word are merged with the end of the
 * previous fragment in a MathML element.
 */
class EXQRunMerger
{
public:
  //! returns the merged text of a paragraph
  static std::string getParagraphText(EXQXMLNode const &paragraph);
  //! adds the fragments of the runs of a paragraph
  static void collectFragments(EXQXMLNode const &paragraph, std::vector<EXQRunFragment> &fragments);
  //! merges a list of fragments
  static std::string merge(std::vector<EXQRunFragment> const &fragments);
  //! returns the vertical position of a run (from w:rPr/w:vertAlign)
  static EXQRunFragment::Kind getRunKind(EXQXMLNode const &run);
  //! returns the unicode text of a symbol or a placeholder [code] if the symbol is unknown
  static std::string getSymbolText(EXQXMLNode const &symbol);
};
#endif
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
