#ifndef IcpDat_BinaryReader_h
#define IcpDat_BinaryReader_h
/* IcpDat: a library to decode and convert ICP-MS instrument DAT files.

 This library is free software; you can redistribute it and/or
 modify it under the terms of the GNU Lesser General Public
 License as published by the Free Software Foundation; either
 version 2.1 of the License, or (at your option) any later version.

 This library is distributed in the hope that it will be useful,
 but WITHOUT ANY WARRANTY; without even the implied warranty of
 MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 Lesser General Public License for more details.

 You should have received a copy of the GNU Lesser General Public
 License along with this library; if not, write to the Free Software
 Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
 */

#include "IcpDat_config.h"

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <type_traits>

#include "IcpDat/DatError.h"

namespace IcpDat
{
enum class ByteOrder : int
{
  Little,
  Big
};//enum class ByteOrder


/** Returns the byte order of the machine this code is running on. */
ByteOrder host_byte_order();


/** A cursor over an immutable, caller owned, byte buffer.

 All reads are bounds checked: if fewer bytes remain than a read requires, a
 #DatError with code #DatErrorCode::Truncated is thrown and the cursor is left
 where it was, so a value is never partially read.  Seeking past the end of
 the buffer throws #DatErrorCode::OutOfRange.

 The buffer must outlive the reader; no copy of it is made.

 Example use:
 \code{.cpp}
 BinaryReader reader( bytes );
 reader.seek( 0x10 );
 const uint32_t nwords = reader.read<uint32_t>();
 const double value = reader.read<double>( ByteOrder::Big );
 \endcode
 */
class BinaryReader
{
public:
  BinaryReader( const uint8_t *data, const size_t length );
  explicit BinaryReader( const std::vector<uint8_t> &data );

  /** Current offset, in bytes, from the start of the buffer. */
  size_t position() const;

  /** Total size, in bytes, of the buffer. */
  size_t size() const;

  /** Number of bytes between the cursor and the end of the buffer. */
  size_t remaining() const;

  /** Moves the cursor to an absolute offset.  An offset equal to size() is
   valid (the cursor is then at the end of the buffer).

   Throws #DatErrorCode::OutOfRange if offset is past the end of the buffer.
   */
  void seek( const size_t offset );

  /** Advances the cursor by nbytes; throws #DatErrorCode::OutOfRange if this
   would move past the end of the buffer.
   */
  void skip( const size_t nbytes );

  /** Reads an integral or floating point value of type T, stored in the
   given byte order, and advances the cursor by sizeof(T).
   */
  template<class T>
  T read( const ByteOrder order = ByteOrder::Little );

  /** Same as #read, but does not advance the cursor. */
  template<class T>
  T peek( const ByteOrder order = ByteOrder::Little ) const;

  /** Reads an unsigned integer whose width (1, 2, 4, or 8 bytes) is only
   known at runtime.

   Throws std::invalid_argument for any other width.
   */
  uint64_t read_uint( const size_t nbytes, const ByteOrder order = ByteOrder::Little );

  /** Signed version of #read_uint; the value is sign extended from nbytes. */
  int64_t read_int( const size_t nbytes, const ByteOrder order = ByteOrder::Little );

  /** Reads nbytes raw bytes. */
  std::vector<uint8_t> read_fixed( const size_t nbytes );

  /** Reads a fixed length text field; trailing NUL and space characters are
   removed (text fields in instrument files are usually padded with one or
   the other).
   */
  std::string read_fixed_string( const size_t nbytes );

  /** Reads a length prefixed field: first an unsigned integer of
   prefix_nbytes (1, 2, 4, or 8) giving the payload length, then that many
   bytes.  If the payload is truncated, the cursor is restored to before the
   length prefix.
   */
  std::vector<uint8_t> read_length_prefixed( const size_t prefix_nbytes,
                                             const ByteOrder order = ByteOrder::Little );

  /** Same as #read_length_prefixed, but returns the payload as a string
   (not trimmed).
   */
  std::string read_length_prefixed_string( const size_t prefix_nbytes,
                                           const ByteOrder order = ByteOrder::Little );

protected:
  /** Throws #DatErrorCode::Truncated unless nbytes are available at the
   cursor.
   */
  void require( const size_t nbytes, const char *what ) const;

  /** Copies nbytes from the cursor into dest, reversing the bytes if order is
   not the host byte order.  Caller must have called #require.
   */
  void copy_ordered( void *dest, const size_t nbytes, const ByteOrder order ) const;

  const uint8_t *m_data;
  size_t m_size;
  size_t m_pos;
};//class BinaryReader

}//namespace IcpDat


//Implementation
namespace IcpDat
{
  template<class T>
  T BinaryReader::read( const ByteOrder order )
  {
    const T value = peek<T>( order );
    m_pos += sizeof(T);
    return value;
  }//read<T>(...)


  template<class T>
  T BinaryReader::peek( const ByteOrder order ) const
  {
    static_assert( std::is_arithmetic<T>::value, "BinaryReader can only read arithmetic types" );

    require( sizeof(T), "value" );

    T value;
    copy_ordered( &value, sizeof(T), order );
    return value;
  }//peek<T>(...)
}//namespace IcpDat

#endif //IcpDat_BinaryReader_h
