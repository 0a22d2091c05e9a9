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

#ifndef EXQ_INPUT_STREAM_H
#define EXQ_INPUT_STREAM_H

#include <memory>
#include <string>

#include <librevenge/librevenge.h>
#include <librevenge-stream/librevenge-stream.h>

#include "libexq_internal.hxx"

class EXQInputStream;
//! a smart pointer of EXQInputStream
typedef std::shared_ptr<EXQInputStream> EXQInputStreamPtr;

/*! \class EXQInputStream
 * \brief Internal class used to read the file stream
 *  Internal class used to read the file stream,
 *    this class adds some usefull functions to the basic librevenge::RVNGInputStream:
 *  - read little endian numbers,
 *  - read a block of data in a librevenge::RVNGBinaryData,
 *  - access to the zip/OLE sub streams as EXQInputStream.
 */
class EXQInputStream
{
public:
  /*!\brief creates a stream from a librevenge::RVNGInputStream
   *
   * \note the stream is not deleted
   */
  explicit EXQInputStream(librevenge::RVNGInputStream *input);
  //! creates a stream which owns inp
  explicit EXQInputStream(std::shared_ptr<librevenge::RVNGInputStream> inp);
  //! destructor
  ~EXQInputStream();

  //! creates a stream from a block of data, the data are copied
  static EXQInputStreamPtr get(librevenge::RVNGBinaryData const &data);

  //
  // Position: access
  //

  /*! \brief seeks to a offset position, from actual, beginning or ending position
   * \return 0 if ok
   */
  int seek(long offset, librevenge::RVNG_SEEK_TYPE seekType);
  //! returns actual offset position
  long tell();
  //! returns the stream size
  long size() const
  {
    return m_streamSize;
  }
  //! checks if a position is or not a valid file position
  bool checkPosition(long pos) const
  {
    return pos>=0 && pos<=m_streamSize;
  }

  //
  // get data
  //

  //! returns a uint8, uint16, uint32 readed from actualPos (little endian)
  unsigned long readULong(int num);
  /*! \brief reads a block of data
   * \return false if we can not read the whole block
   */
  bool readDataBlock(long size, librevenge::RVNGBinaryData &data);
  //! reads the remaining data
  bool readEndDataBlock(librevenge::RVNGBinaryData &data);

  //
  // structured zone: zip archive, OLE compound file
  //

  //! returns true if the stream is a zip archive or a OLE compound file
  bool isStructured();
  //! returns true if a substream with name exists
  bool existsSubStream(std::string const &name);
  //! return a new stream for a sub stream (or a empty pointer)
  EXQInputStreamPtr getSubStreamByName(std::string const &name);

protected:
  //! update the stream size ( must be called in the constructor )
  void updateStreamSize();

private:
  EXQInputStream(EXQInputStream const &orig) = delete;
  EXQInputStream &operator=(EXQInputStream const &orig) = delete;

protected:
  //! the initial input
  std::shared_ptr<librevenge::RVNGInputStream> m_stream;
  //! the stream size
  long m_streamSize;
};

#endif
// vim: set filetype=cpp tabstop=2 shiftwidth=2 cindent autoindent smartindent noexpandtab:
