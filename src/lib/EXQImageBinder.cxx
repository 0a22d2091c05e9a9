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

#include <sstream>
#include <string>

#include "libexq_internal.hxx"

#include "EXQImageBinder.hxx"

EXQImageBinder::EXQImageBinder()
  : m_counter(0)
  , m_numberToImagesMap()
{
}

std::string EXQImageBinder::getExtension(std::string const &target)
{
  auto slash=target.rfind('/');
  std::string name=slash==std::string::npos ? target : target.substr(slash+1);
  auto dot=name.rfind('.');
  if (dot==std::string::npos || dot+1>=name.size())
    return "png";
  return libexq::toLower(name.substr(dot+1));
}

std::string EXQImageBinder::addImage(int number, std::string const &target, librevenge::RVNGBinaryData const &data)
{
  ++m_counter;
  if (number<0) {
    EXQ_DEBUG_MSG(("EXQImageBinder::addImage: can not find the question number of %s\n", target.c_str()));
    return "<img/>";
  }
  std::stringstream s;
  s << "image_" << m_counter << "." << getExtension(target);
  m_numberToImagesMap[number].push_back(EXQImage(s.str(), data));
  return "<img src=\""+s.str()+"\"/>";
}

void EXQImageBinder::retrieveImages(int number, std::vector<EXQImage> &images)
{
  auto it=m_numberToImagesMap.find(number);
  if (it==m_numberToImagesMap.end())
    return;
  images.insert(images.end(), it->second.begin(), it->second.end());
  m_numberToImagesMap.erase(it);
}
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
