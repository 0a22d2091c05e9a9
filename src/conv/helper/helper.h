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

#ifndef HELPER_H
#  define HELPER_H

#ifdef HAVE_CONFIG_H
#  include "config.h"
#endif

#include <memory>
#include <string>

#  include <librevenge/librevenge.h>
#  include <libexq/libexq.hxx>

namespace libexqHelper
{
/** check if a file is supported, if so returns the input stream
 and the confidence. If not, returns an empty input stream.
*/
std::shared_ptr<librevenge::RVNGInputStream> isSupported
(char const *filename, EXQDocument::Confidence &confidence);
/** check for error, if yes, print an error message and returns
    true. If not return false */
bool checkErrorAndPrintMessage(EXQDocument::Result result);
/** writes some data in a file (or in the standard output if filename is null),
    returns false and prints an error message if the file can not be written */
bool writeData(char const *filename, unsigned char const *data, unsigned long size);
}
#endif
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
