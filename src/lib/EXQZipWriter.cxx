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
#include <vector>

#include <zlib.h>

#include "libexq_internal.hxx"

#include "EXQZipWriter.hxx"

/** Internal: the structures of a EXQZipWriter */
namespace EXQZipWriterInternal
{
//! the local file header signature
static unsigned long const s_localHeaderSignature=0x04034b50;
//! the central directory header signature
static unsigned long const s_centralHeaderSignature=0x02014b50;
//! the end of central directory signature
static unsigned long const s_endSignature=0x06054b50;
//! the version needed to extract: 2.0
static unsigned const s_version=20;
//! the general purpose flag: the names are stored in UTF-8
static unsigned const s_utf8Flag=0x0800;
//! the dos date 1980-01-01
static unsigned const s_dosDate=(1<<5)|1;
//! the size of a local header without the name
static uint64_t const s_localHeaderSize=30;
//! the size of a central directory header without the name
static uint64_t const s_centralHeaderSize=46;
//! the size of the end of central directory record
static uint64_t const s_endSize=22;
//! the maximum number of files
static size_t const s_maxFiles=0xFFFF;
//! the maximum size of the archive (the offsets are stored in 32 bits)
static uint64_t const s_maxArchiveSize=0xFFFFFFFF;

//! appends a little endian value in the buffer
static void append(std::vector<unsigned char> &buffer, unsigned long value, int numBytes)
{
  for (int i=0; i<numBytes; ++i) {
    buffer.push_back(static_cast<unsigned char>(value&0xFF));
    value>>=8;
  }
}
}

EXQZipWriter::EXQZipWriter()
  : m_entries()
  , m_names()
  , m_archiveSize(EXQZipWriterInternal::s_endSize)
{
}

EXQZipWriter::~EXQZipWriter()
{
}

bool EXQZipWriter::exists(std::string const &name) const
{
  return m_names.find(name)!=m_names.end();
}

bool EXQZipWriter::add(std::string const &name, librevenge::RVNGBinaryData const &data)
{
  return add(name, data.getDataBuffer(), data.size());
}

bool EXQZipWriter::add(std::string const &name, std::string const &data)
{
  return add(name, reinterpret_cast<unsigned char const *>(data.c_str()), static_cast<unsigned long>(data.size()));
}

bool EXQZipWriter::add(std::string const &name, unsigned char const *data, unsigned long size)
{
  if (name.empty() || name.size()>0xFFFF || exists(name)) {
    EXQ_DEBUG_MSG(("EXQZipWriter::add: can not add the file %s\n", name.c_str()));
    return false;
  }
  if (size && !data) {
    EXQ_DEBUG_MSG(("EXQZipWriter::add: called without data for %s\n", name.c_str()));
    return false;
  }
  if (m_entries.size()>=EXQZipWriterInternal::s_maxFiles || uint64_t(size)>EXQZipWriterInternal::s_maxArchiveSize) {
    EXQ_DEBUG_MSG(("EXQZipWriter::add: the archive can not contain %s\n", name.c_str()));
    return false;
  }
  Entry entry;
  entry.m_name=name;
  entry.m_size=size;
  entry.m_crc=crc32(0L, Z_NULL, 0);
  if (size)
    entry.m_crc=crc32(entry.m_crc, data, static_cast<uInt>(size));
  if (size && compress(data, size, entry.m_data) && entry.m_data.size()<size)
    entry.m_method=8;
  else {
    entry.m_method=0;
    entry.m_data.assign(data, data+size);
  }
  uint64_t const entrySize=EXQZipWriterInternal::s_localHeaderSize+EXQZipWriterInternal::s_centralHeaderSize
                           +2*uint64_t(name.size())+uint64_t(entry.m_data.size());
  if (m_archiveSize+entrySize>EXQZipWriterInternal::s_maxArchiveSize) {
    EXQ_DEBUG_MSG(("EXQZipWriter::add: the archive is too big to contain %s\n", name.c_str()));
    return false;
  }
  m_archiveSize+=entrySize;
  m_entries.push_back(entry);
  m_names.insert(name);
  return true;
}

bool EXQZipWriter::compress(unsigned char const *data, unsigned long size, std::vector<unsigned char> &res)
{
  res.clear();
  z_stream strm;
  strm.zalloc = Z_NULL;
  strm.zfree = Z_NULL;
  strm.opaque = Z_NULL;
  // negative window bits: raw deflate data without zlib header
  if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY)!=Z_OK) {
    EXQ_DEBUG_MSG(("EXQZipWriter::compress: can not initialize the stream\n"));
    return false;
  }
  res.resize(deflateBound(&strm, size));
  strm.next_in = const_cast<Bytef *>(data);
  strm.avail_in = static_cast<uInt>(size);
  strm.next_out = res.data();
  strm.avail_out = static_cast<uInt>(res.size());
  int ret = deflate(&strm, Z_FINISH);
  unsigned long written=strm.total_out;
  deflateEnd(&strm);
  if (ret!=Z_STREAM_END) {
    EXQ_DEBUG_MSG(("EXQZipWriter::compress: deflate fails with %d\n", ret));
    res.clear();
    return false;
  }
  res.resize(written);
  return true;
}

void EXQZipWriter::getData(librevenge::RVNGBinaryData &data) const
{
  using namespace EXQZipWriterInternal;
  std::vector<unsigned char> buffer, central;
  for (auto const &entry : m_entries) {
    unsigned long offset=static_cast<unsigned long>(buffer.size());
    // local header
    append(buffer, s_localHeaderSignature, 4);
    append(buffer, s_version, 2);
    append(buffer, s_utf8Flag, 2);
    append(buffer, entry.m_method, 2);
    append(buffer, 0, 2); // time
    append(buffer, s_dosDate, 2);
    append(buffer, entry.m_crc, 4);
    append(buffer, static_cast<unsigned long>(entry.m_data.size()), 4);
    append(buffer, entry.m_size, 4);
    append(buffer, static_cast<unsigned long>(entry.m_name.size()), 2);
    append(buffer, 0, 2); // extra length
    buffer.insert(buffer.end(), entry.m_name.begin(), entry.m_name.end());
    buffer.insert(buffer.end(), entry.m_data.begin(), entry.m_data.end());

    // central directory header
    append(central, s_centralHeaderSignature, 4);
    append(central, s_version, 2); // version made by
    append(central, s_version, 2);
    append(central, s_utf8Flag, 2);
    append(central, entry.m_method, 2);
    append(central, 0, 2);
    append(central, s_dosDate, 2);
    append(central, entry.m_crc, 4);
    append(central, static_cast<unsigned long>(entry.m_data.size()), 4);
    append(central, entry.m_size, 4);
    append(central, static_cast<unsigned long>(entry.m_name.size()), 2);
    append(central, 0, 2); // extra length
    append(central, 0, 2); // comment length
    append(central, 0, 2); // disk number
    append(central, 0, 2); // internal attributes
    append(central, 0, 4); // external attributes
    append(central, offset, 4);
    central.insert(central.end(), entry.m_name.begin(), entry.m_name.end());
  }
  unsigned long centralOffset=static_cast<unsigned long>(buffer.size());
  buffer.insert(buffer.end(), central.begin(), central.end());
  append(buffer, s_endSignature, 4);
  append(buffer, 0, 2); // disk number
  append(buffer, 0, 2); // disk with the central directory
  append(buffer, static_cast<unsigned long>(m_entries.size()), 2);
  append(buffer, static_cast<unsigned long>(m_entries.size()), 2);
  append(buffer, static_cast<unsigned long>(central.size()), 4);
  append(buffer, centralOffset, 4);
  append(buffer, 0, 2); // comment length

  data.clear();
  if (!buffer.empty())
    data.append(buffer.data(), buffer.size());
}
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
