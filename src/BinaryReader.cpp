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
#include <cstring>
#include <utility>
#include <stdexcept>

#include "IcpDat/BinaryReader.h"

using namespace std;

namespace
{
  void check_int_width( const size_t nbytes )
  {
    if( nbytes != 1 && nbytes != 2 && nbytes != 4 && nbytes != 8 )
      throw std::invalid_argument( "BinaryReader: invalid integer width "
                                   + std::to_string(nbytes) + " (must be 1, 2, 4, or 8)" );
  }
}//namespace


namespace IcpDat
{
ByteOrder host_byte_order()
{
  const uint16_t test = 0x0102;
  uint8_t first_byte;
  memcpy( &first_byte, &test, 1 );
  return (first_byte == 0x02) ? ByteOrder::Little : ByteOrder::Big;
}//ByteOrder host_byte_order()


BinaryReader::BinaryReader( const uint8_t *data, const size_t length )
  : m_data( data ),
    m_size( data ? length : size_t(0) ),
    m_pos( 0 )
{
}


BinaryReader::BinaryReader( const std::vector<uint8_t> &data )
  : m_data( data.empty() ? nullptr : &data[0] ),
    m_size( data.size() ),
    m_pos( 0 )
{
}


size_t BinaryReader::position() const
{
  return m_pos;
}


size_t BinaryReader::size() const
{
  return m_size;
}


size_t BinaryReader::remaining() const
{
  return m_size - m_pos;
}


void BinaryReader::seek( const size_t offset )
{
  if( offset > m_size )
    throw DatError( DatErrorCode::OutOfRange,
                    "Seek to offset " + std::to_string(offset)
                    + " is beyond the end of the " + std::to_string(m_size) + " byte buffer" );
  m_pos = offset;
}//void seek( const size_t offset )


void BinaryReader::skip( const size_t nbytes )
{
  if( nbytes > remaining() )
    throw DatError( DatErrorCode::OutOfRange,
                    "Skipping " + std::to_string(nbytes) + " bytes from offset "
                    + std::to_string(m_pos) + " goes beyond the end of the "
                    + std::to_string(m_size) + " byte buffer" );
  m_pos += nbytes;
}//void skip( const size_t nbytes )


void BinaryReader::require( const size_t nbytes, const char *what ) const
{
  if( nbytes > remaining() )
    throw DatError( DatErrorCode::Truncated,
                    string("Reading ") + what + " of " + std::to_string(nbytes)
                    + " bytes at offset " + std::to_string(m_pos) + " but only "
                    + std::to_string(remaining()) + " bytes remain" );
}//void require(...)


void BinaryReader::copy_ordered( void *dest, const size_t nbytes, const ByteOrder order ) const
{
  if( !nbytes )
    return;

  uint8_t *out = static_cast<uint8_t *>( dest );
  memcpy( out, m_data + m_pos, nbytes );

  if( order != host_byte_order() )
  {
    for( size_t i = 0; i < nbytes/2; ++i )
      std::swap( out[i], out[nbytes - 1 - i] );
  }
}//void copy_ordered(...)


uint64_t BinaryReader::read_uint( const size_t nbytes, const ByteOrder order )
{
  check_int_width( nbytes );

  switch( nbytes )
  {
    case 1: return read<uint8_t>( order );
    case 2: return read<uint16_t>( order );
    case 4: return read<uint32_t>( order );
  }

  return read<uint64_t>( order );
}//uint64_t read_uint(...)


int64_t BinaryReader::read_int( const size_t nbytes, const ByteOrder order )
{
  check_int_width( nbytes );

  switch( nbytes )
  {
    case 1: return read<int8_t>( order );
    case 2: return read<int16_t>( order );
    case 4: return read<int32_t>( order );
  }

  return read<int64_t>( order );
}//int64_t read_int(...)


std::vector<uint8_t> BinaryReader::read_fixed( const size_t nbytes )
{
  require( nbytes, "fixed length field" );

  vector<uint8_t> answer( m_data + m_pos, m_data + m_pos + nbytes );
  m_pos += nbytes;
  return answer;
}//read_fixed(...)


std::string BinaryReader::read_fixed_string( const size_t nbytes )
{
  require( nbytes, "fixed length text field" );

  string answer( reinterpret_cast<const char *>(m_data + m_pos), nbytes );
  m_pos += nbytes;

  const size_t last = answer.find_last_not_of( string(" \0", 2) );
  answer.erase( (last == string::npos) ? 0 : (last + 1) );

  return answer;
}//read_fixed_string(...)


std::vector<uint8_t> BinaryReader::read_length_prefixed( const size_t prefix_nbytes,
                                                         const ByteOrder order )
{
  const size_t start_pos = m_pos;
  const uint64_t length = read_uint( prefix_nbytes, order );

  if( length > remaining() )
  {
    const size_t nremaining = remaining();
    m_pos = start_pos;
    throw DatError( DatErrorCode::Truncated,
                    "Length prefixed field at offset " + std::to_string(start_pos)
                    + " declares " + std::to_string(length) + " bytes but only "
                    + std::to_string(nremaining) + " remain" );
  }//if( length > remaining() )

  return read_fixed( static_cast<size_t>(length) );
}//read_length_prefixed(...)


std::string BinaryReader::read_length_prefixed_string( const size_t prefix_nbytes,
                                                       const ByteOrder order )
{
  const vector<uint8_t> bytes = read_length_prefixed( prefix_nbytes, order );
  return string( bytes.begin(), bytes.end() );
}
}//namespace IcpDat
