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

#ifndef EXQ_IMAGE_BINDER_H
#define EXQ_IMAGE_BINDER_H

#include <map>
#include <string>
#include <vector>

#include <librevenge/librevenge.h>

#include <libexq/EXQQuestion.hxx>

/** \brief the class which stores the pictures found in the questions of a document
 *
 * Each picture receives a name image_N.ext, where N is a counter
 * incremented for each picture of the document, and is stored with the
 * number of the question which contains it. The pictures are retrieved
 * when the question is finished.
 */
class EXQImageBinder
{
public:
  //! constructor
  EXQImageBinder();
  /** adds a picture found in question number (or -1 if the number is unknown) and returns its placeholder

      \note if the number is unknown, the picture is not stored and the placeholder is <img/> */
  std::string addImage(int number, std::string const &target, librevenge::RVNGBinaryData const &data);
  //! removes the pictures of a question and adds them in images
  void retrieveImages(int number, std::vector<EXQImage> &images);
  //! returns the number of pictures already seen
  int getNumImages() const
  {
    return m_counter;
  }
  //! returns the lower case extension of a part name or "png"
  static std::string getExtension(std::string const &target);
protected:
  //! the picture counter
  int m_counter;
  //! the map question number to pictures
  std::map<int, std::vector<EXQImage> > m_numberToImagesMap;
};
#endif
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
