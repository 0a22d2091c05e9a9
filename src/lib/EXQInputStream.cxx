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

#include <string>

#include <librevenge/librevenge.h>
#include <librevenge-stream/librevenge-stream.h>

#include "EXQInputStream.hxx"

EXQInputStream::EXQInputStream(std::shared_ptr<librevenge::RVNGInputStream> inp)
  : m_stream(inp)
  , m_streamSize(0)
{
  updateStreamSize();
}

EXQInputStream::EXQInputStream(librevenge::RVNGInputStream *inp)
  : m_stream()
  , m_streamSize(0)
{
  if (!inp) return;
  m_stream = std::shared_ptr<librevenge::RVNGInputStream>(inp, EXQ_shared_ptr_noop_deleter<librevenge::RVNGInputStream>());
  updateStreamSize();
}

EXQInputStream::~EXQInputStream()
{
}

EXQInputStreamPtr EXQInputStream::get(librevenge::RVNGBinaryData const &data)
{
  EXQInputStreamPtr res;
  if (data.empty() || !data.getDataBuffer())
    return res;
  std::shared_ptr<librevenge::RVNGInputStream> stream
  (new librevenge::RVNGStringStream(data.getDataBuffer(), static_cast<unsigned int>(data.size())));
  res.reset(new EXQInputStream(stream));
  return res;
}

void EXQInputStream::updateStreamSize()
{
  if (!m_stream)
    m_streamSize=0;
  else {
    long actPos = tell();
    m_stream->seek(0, librevenge::RVNG_SEEK_END);
    m_streamSize=tell();
    m_stream->seek(actPos, librevenge::RVNG_SEEK_SET);
  }
}

////////////////////////////////////////////////////////////
// position
////////////////////////////////////////////////////////////
int EXQInputStream::seek(long offset, librevenge::RVNG_SEEK_TYPE seekType)
{
  if (seekType == librevenge::RVNG_SEEK_CUR)
    offset += tell();
  else if (seekType==librevenge::RVNG_SEEK_END)
    offset += m_streamSize;

  if (offset < 0)
    offset = 0;
  if (offset > size())
    offset = size();

  if (!m_stream) return -1;
  return m_stream->seek(offset, librevenge::RVNG_SEEK_SET);
}

long EXQInputStream::tell()
{
  if (!m_stream) return 0;
  return m_stream->tell();
}

////////////////////////////////////////////////////////////
// read data
////////////////////////////////////////////////////////////
unsigned long EXQInputStream::readULong(int num)
{
  if (!m_stream || num<=0 || num>4) {
    EXQ_DEBUG_MSG(("EXQInputStream::readULong: called with bad size %d\n", num));
    throw libexq::FileException();
  }
  unsigned long numRead;
  uint8_t const *p=m_stream->read(static_cast<unsigned long>(num), numRead);
  if (!p || numRead!=static_cast<unsigned long>(num))
    throw libexq::FileException();
  unsigned long res=0;
  for (int i=num-1; i>=0; --i)
    res=(res<<8)+p[i];
  return res;
}

bool EXQInputStream::readDataBlock(long sz, librevenge::RVNGBinaryData &data)
{
  data.clear();
  if (!m_stream || sz < 0) return false;
  if (sz == 0) return true;
  long endPos=tell()+sz;
  if (endPos > size() || endPos < 0) return false;

  unsigned long sizeRead;
  const unsigned char *readData=m_stream->read(static_cast<unsigned long>(sz), sizeRead);
  if (!readData || long(sizeRead)!=sz)
    return false;
  data.append(readData, sizeRead);
  return true;
}

bool EXQInputStream::readEndDataBlock(librevenge::RVNGBinaryData &data)
{
  data.clear();
  if (!m_stream) return false;
  return readDataBlock(size()-tell(), data);
}

////////////////////////////////////////////////////////////
// structured stream
////////////////////////////////////////////////////////////
bool EXQInputStream::isStructured()
{
  if (!m_stream) return false;
  long pos=m_stream->tell();
  bool res=m_stream->isStructured();
  m_stream->seek(pos, librevenge::RVNG_SEEK_SET);
  return res;
}

bool EXQInputStream::existsSubStream(std::string const &name)
{
  if (!m_stream || !m_stream->isStructured() || name.empty())
    return false;
  return m_stream->existsSubStream(name.c_str());
}

EXQInputStreamPtr EXQInputStream::getSubStreamByName(std::string const &name)
{
  EXQInputStreamPtr empty;
  if (!m_stream || !m_stream->isStructured() || name.empty()) {
    EXQ_DEBUG_MSG(("EXQInputStream::getSubStreamByName: called on unstructured stream\n"));
    return empty;
  }

  long actPos = tell();
  seek(0, librevenge::RVNG_SEEK_SET);
  std::shared_ptr<librevenge::RVNGInputStream> res(m_stream->getSubStreamByName(name.c_str()));
  seek(actPos, librevenge::RVNG_SEEK_SET);

  if (!res)
    return empty;
  EXQInputStreamPtr inp(new EXQInputStream(res));
  inp->seek(0, librevenge::RVNG_SEEK_SET);
  return inp;
}
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
