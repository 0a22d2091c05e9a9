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

#include <exception>
#include <memory>

#include "helper.h"
#include <librevenge/librevenge.h>
#include <librevenge-stream/librevenge-stream.h>
#include <libexq/libexq.hxx>

namespace libexqHelper
{
std::shared_ptr<librevenge::RVNGInputStream> isSupported
(char const *filename, EXQDocument::Confidence &confidence)
{
  confidence = EXQDocument::EXQ_C_NONE;
  if (!filename)
    return std::shared_ptr<librevenge::RVNGInputStream>();
  std::shared_ptr<librevenge::RVNGInputStream> input(new librevenge::RVNGFileStream(filename));
  try {
    confidence = EXQDocument::isFileFormatSupported(input.get());
    if (confidence == EXQDocument::EXQ_C_EXCELLENT)
      return input;
  }
  catch (std::exception const &e) {
    fprintf(stderr, "ERROR: can not read %s: %s\n", filename, e.what());
  }
  return std::shared_ptr<librevenge::RVNGInputStream>();
}

bool checkErrorAndPrintMessage(EXQDocument::Result result)
{
  if (result == EXQDocument::EXQ_R_FILE_ACCESS_ERROR)
    fprintf(stderr, "ERROR: File Exception!\n");
  else if (result == EXQDocument::EXQ_R_PARSE_ERROR)
    fprintf(stderr, "ERROR: Parse Exception!\n");
  else if (result != EXQDocument::EXQ_R_OK)
    fprintf(stderr, "ERROR: Unknown Error!\n");
  else
    return false;
  return true;
}

bool writeData(char const *filename, unsigned char const *data, unsigned long size)
{
  FILE *file = filename ? fopen(filename, "wb") : stdout;
  if (!file) {
    fprintf(stderr, "ERROR: can not open %s!\n", filename);
    return false;
  }
  bool ok = size==0 || fwrite(data, 1, size, file) == size;
  if (filename) {
    if (fclose(file) != 0)
      ok = false;
  }
  else
    fflush(file);
  if (!ok)
    fprintf(stderr, "ERROR: can not write %s!\n", filename ? filename : "the output");
  return ok;
}

}
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
