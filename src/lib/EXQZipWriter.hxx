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

#ifndef EXQ_ZIP_WRITER_H
#define EXQ_ZIP_WRITER_H

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include <librevenge/librevenge.h>

/** \brief a small class used to create a zip archive in memory
 *
 * Each file is compressed with deflate (or stored when deflate does not
 * reduce its size). The archive is created by getData.
 *
 * \note no zip64 record is written: an archive is limited to 65535 files
 * and its size to 4GB, add fails when a file does not fit
 */
class EXQZipWriter
{
public:
  //! constructor
  EXQZipWriter();
  //! destructor
  ~EXQZipWriter();
  //! returns true if a file with this name is already added
  bool exists(std::string const &name) const;
  //! adds a file, returns false if the name is empty or already used or if the archive is full
  bool add(std::string const &name, librevenge::RVNGBinaryData const &data);
  //! adds a file
  bool add(std::string const &name, std::string const &data);
  //! adds a file
  bool add(std::string const &name, unsigned char const *data, unsigned long size);
  //! returns the number of files
  size_t size() const
  {
    return m_entries.size();
  }
  //! creates the archive data: the local files, the central directory and the end record
  void getData(librevenge::RVNGBinaryData &data) const;

protected:
  //! a file of the archive
  struct Entry {
    //! constructor
    Entry()
      : m_name()
      , m_method(0)
      , m_crc(0)
      , m_size(0)
      , m_data()
    {
    }
    //! the file name
    std::string m_name;
    //! the compression method: 0 (stored) or 8 (deflated)
    unsigned m_method;
    //! the crc32 of the uncompressed data
    unsigned long m_crc;
    //! the uncompressed size
    unsigned long m_size;
    //! the stored data
    std::vector<unsigned char> m_data;
  };
  //! tries to compress data with raw deflate, returns false if this fails
  static bool compress(unsigned char const *data, unsigned long size, std::vector<unsigned char> &res);
  //! the list of files
  std::vector<Entry> m_entries;
  //! the size of the archive: local headers and data, central directory and end record
  uint64_t m_archiveSize;
  //! the set of file names
  std::set<std::string> m_names;
};
#endif
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
