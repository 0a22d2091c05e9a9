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

#ifndef INCLUDED_LIBEXQ_LIBEXQ_HXX
#define INCLUDED_LIBEXQ_LIBEXQ_HXX

#include "EXQDocument.hxx"
#include "EXQEquationConverter.hxx"
#include "EXQQuestion.hxx"

/** \mainpage libexq documentation
 *
 * libexq extracts the questions (stem, options, answer key, hint,
 * pictures) stored in word processing documents. The mathematical
 * content (symbol fonts, office math, embedded equation objects) is
 * converted in MathML.
 *
 * \see EXQDocument
 */

#endif /* INCLUDED_LIBEXQ_LIBEXQ_HXX */
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
