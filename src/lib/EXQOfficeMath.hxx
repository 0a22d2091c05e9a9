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

#ifndef EXQ_OFFICE_MATH_H
#define EXQ_OFFICE_MATH_H

#include <string>
#include <vector>

#include "EXQXMLTree.hxx"

/** \brief a small converter of the native office math markup (m:oMath) in MathML
 *
 * Only the direct children of the m:oMath node are looked at, in
 * document order: m:r, m:sSub, m:sSup, m:sSubSup, m:f, m:rad and m:d are
 * converted, the other elements are ignored.
 */
class EXQOfficeMath
{
public:
  /** converts a m:oMath node in a <math display="block"> element.

      \note returns an empty string if nothing can be converted */
  static std::string convert(EXQXMLNode const &oMath);
  //! converts the text of a run: known operators become mo, the other parts mi
  static void convertText(std::string const &text, std::vector<std::string> &elements);

protected:
  //! converts the children of a node and adds the result in elements
  static void convertChildren(EXQXMLNode const &node, std::vector<std::string> &elements);
  //! converts a child, returns false if the child is not a known element
  static bool convertChild(EXQXMLNode const &child, std::vector<std::string> &elements);
  //! converts a m:e, m:sub, m:sup, m:deg child of node in one element
  static std::string convertArgument(EXQXMLNode const &node, char const *name);
  //! converts a fraction numerator or denominator: only its m:r and m:sSub children are kept
  static std::string convertFractionPart(EXQXMLNode const &node, char const *name);
  //! converts a m:r node
  static void convertRun(EXQXMLNode const &run, std::vector<std::string> &elements);
  //! converts a m:rad node
  static std::string convertRadical(EXQXMLNode const &rad);
  //! converts a m:d node
  static std::string convertDelimiter(EXQXMLNode const &delim);
};
#endif
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
