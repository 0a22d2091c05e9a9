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

/** \file EXQEquationConverter.hxx
 * libexq API: the interface used to convert an embedded equation object in MathML
 *
 * \see libexq.hxx
 */
#ifndef EXQEQUATIONCONVERTER_HXX
#define EXQEQUATIONCONVERTER_HXX

#include <string>

#ifdef _WINDLL
#  ifdef BUILD_EXQ
#    define EXQLIB _declspec(dllexport)
#  else
#    define EXQLIB _declspec(dllimport)
#  endif
#else // !DLL_EXPORT
#  ifdef LIBEXQ_VISIBILITY
#    define EXQLIB __attribute__((visibility("default")))
#  else
#    define EXQLIB
#  endif
#endif

namespace librevenge
{
class RVNGBinaryData;
}

/**
This class defines the converter called for each embedded equation object
(legacy equation editor, MathType). An implementation must not throw.

By default, libexq uses its own converter which reads the MTEF data
stored in the "Equation Native" stream of the object.
*/
class EXQLIB EXQEquationConverter
{
public:
  //! destructor
  virtual ~EXQEquationConverter() {}
  /** converts the object data in a MathML element.

      \return false if the data can not be converted */
  virtual bool convert(librevenge::RVNGBinaryData const &data, std::string &mathML)=0;
};

#endif /* EXQEQUATIONCONVERTER_HXX */
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
