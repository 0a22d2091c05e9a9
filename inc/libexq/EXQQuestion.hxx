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

/** \file EXQQuestion.hxx
 * libexq API: the question record returned by the extraction
 *
 * \see libexq.hxx
 */
#ifndef EXQQUESTION_HXX
#define EXQQUESTION_HXX

#include <map>
#include <string>
#include <vector>

#include <librevenge/librevenge.h>

/** a picture found in a question: its synthetic name and its original bytes */
struct EXQImage {
  //! constructor
  EXQImage()
    : m_name()
    , m_data()
  {
  }
  //! constructor
  EXQImage(std::string const &name, librevenge::RVNGBinaryData const &data)
    : m_name(name)
    , m_data(data)
  {
  }
  //! the file name: image_N.ext
  std::string m_name;
  //! the picture data
  librevenge::RVNGBinaryData m_data;
};

/**
This class stores a question extracted from a document: its number, its stem,
its options, its answer key, its hint and its pictures.

The stem, the options, the key and the hint can contain MathML elements
(<math>...</math>) and picture placeholders (<img src="image_N.ext"/>).
*/
class EXQQuestion
{
public:
  //! constructor
  EXQQuestion()
    : m_number(-1)
    , m_stem()
    , m_options()
    , m_hasKey(false)
    , m_key()
    , m_hasHint(false)
    , m_hint()
    , m_images()
  {
  }
  //! returns true if the question number is known
  bool hasNumber() const
  {
    return m_number>=0;
  }
  //! returns true if an option with letter exists
  bool hasOption(char letter) const
  {
    return m_options.find(letter)!=m_options.end();
  }
  //! returns the option text or an empty string
  std::string getOption(char letter) const
  {
    auto it=m_options.find(letter);
    return it==m_options.end() ? std::string() : it->second;
  }

  //! the question number or -1
  int m_number;
  //! the question text without the number, the options, the key and the hint
  std::string m_stem;
  //! the options: letter (a, b, c, d) to text
  std::map<char, std::string> m_options;
  //! flag to know if the answer key is known
  bool m_hasKey;
  //! the answer key
  std::string m_key;
  //! flag to know if the hint is known
  bool m_hasHint;
  //! the hint
  std::string m_hint;
  //! the pictures (in document order)
  std::vector<EXQImage> m_images;
};

#endif /* EXQQUESTION_HXX */
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
