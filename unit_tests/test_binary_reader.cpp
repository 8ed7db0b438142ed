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
#include <cstring>
#include <stdexcept>

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include "IcpDat/DatError.h"
#include "IcpDat/BinaryReader.h"

using namespace std;
using IcpDat::ByteOrder;
using IcpDat::DatError;
using IcpDat::DatErrorCode;
using IcpDat::BinaryReader;


namespace
{
  //Returns the code of the DatError thrown by fcn; fails the test if none is thrown.
  template<class F>
  DatErrorCode error_code_of( F fcn )
  {
    try
    {
      fcn();
    }catch( DatError &e )
    {
      return e.code();
    }

    FAIL( "Expected a DatError to be thrown" );
    return DatErrorCode::FileIO;
  }//error_code_of(...)
}//namespace


TEST_CASE( "Read integers in both byte orders" )
{
  const vector<uint8_t> bytes = { 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08 };
  BinaryReader reader( bytes );

  CHECK_EQ( reader.size(), 8 );
  CHECK_EQ( reader.remaining(), 8 );
  CHECK_EQ( reader.position(), 0 );

  CHECK_EQ( reader.peek<uint32_t>(), 0x04030201u );
  CHECK_EQ( reader.position(), 0 );

  CHECK_EQ( reader.read<uint32_t>(), 0x04030201u );
  CHECK_EQ( reader.position(), 4 );
  CHECK_EQ( reader.remaining(), 4 );

  CHECK_EQ( reader.read<uint16_t>( ByteOrder::Big ), 0x0506u );
  CHECK_EQ( reader.read<uint8_t>(), 0x07u );
  CHECK_EQ( reader.read<uint8_t>(), 0x08u );
  CHECK_EQ( reader.remaining(), 0 );

  reader.seek( 0 );
  CHECK_EQ( reader.read<uint64_t>( ByteOrder::Big ), 0x0102030405060708ull );

  reader.seek( 0 );
  CHECK_EQ( reader.read_uint( 2 ), 0x0201u );
  CHECK_EQ( reader.read_uint( 2, ByteOrder::Big ), 0x0304u );
  CHECK_EQ( reader.read_uint( 4 ), 0x08070605u );

  CHECK_THROWS_AS( reader.read_uint( 3 ), std::invalid_argument );
}//TEST_CASE( "Read integers in both byte orders" )


TEST_CASE( "Signed integers are sign extended" )
{
  const vector<uint8_t> bytes = { 0xFF, 0xFE, 0xFF, 0x80, 0x00, 0x00, 0x80 };
  BinaryReader reader( bytes );

  CHECK_EQ( reader.read_int( 1 ), -1 );
  CHECK_EQ( reader.read_int( 2 ), -2 );
  CHECK_EQ( reader.read_int( 4 ), static_cast<int64_t>( int32_t(0x80000080) ) );
  CHECK_EQ( reader.remaining(), 0 );

  reader.seek( 0 );
  CHECK_EQ( reader.read<int8_t>(), -1 );
}//TEST_CASE( "Signed integers are sign extended" )


TEST_CASE( "Read floating point values" )
{
  const float fval = 1.5f;
  const double dval = -1234.0625;

  vector<uint8_t> bytes( sizeof(fval) + sizeof(dval) );
  memcpy( &bytes[0], &fval, sizeof(fval) );
  memcpy( &bytes[sizeof(fval)], &dval, sizeof(dval) );

  //Values were copied in host order
  BinaryReader reader( bytes );
  CHECK_EQ( reader.read<float>( IcpDat::host_byte_order() ), fval );
  CHECK_EQ( reader.read<double>( IcpDat::host_byte_order() ), dval );

  //A big-endian 1.0f
  const vector<uint8_t> big = { 0x3F, 0x80, 0x00, 0x00 };
  BinaryReader bigreader( big );
  CHECK_EQ( bigreader.read<float>( ByteOrder::Big ), 1.0f );
}//TEST_CASE( "Read floating point values" )


TEST_CASE( "Truncated reads leave the cursor unchanged" )
{
  const vector<uint8_t> bytes = { 0x01, 0x02, 0x03 };
  BinaryReader reader( bytes );

  CHECK_EQ( error_code_of( [&](){ reader.read<uint32_t>(); } ), DatErrorCode::Truncated );
  CHECK_EQ( reader.position(), 0 );

  CHECK_EQ( reader.read<uint16_t>(), 0x0201u );
  CHECK_EQ( error_code_of( [&](){ reader.read<uint16_t>(); } ), DatErrorCode::Truncated );
  CHECK_EQ( error_code_of( [&](){ reader.peek<uint16_t>(); } ), DatErrorCode::Truncated );
  CHECK_EQ( error_code_of( [&](){ reader.read_fixed( 2 ); } ), DatErrorCode::Truncated );
  CHECK_EQ( error_code_of( [&](){ reader.read_fixed_string( 2 ); } ), DatErrorCode::Truncated );
  CHECK_EQ( reader.position(), 2 );

  CHECK_EQ( reader.read<uint8_t>(), 0x03u );
  CHECK_EQ( error_code_of( [&](){ reader.read<uint8_t>(); } ), DatErrorCode::Truncated );

  //An empty buffer
  BinaryReader empty( nullptr, 10 );
  CHECK_EQ( empty.size(), 0 );
  CHECK_EQ( error_code_of( [&](){ empty.read<uint8_t>(); } ), DatErrorCode::Truncated );
  CHECK( empty.read_fixed( 0 ).empty() );

  //The exception is also a std::runtime_error
  CHECK_THROWS_AS( empty.read<double>(), std::runtime_error );
}//TEST_CASE( "Truncated reads leave the cursor unchanged" )


TEST_CASE( "Seek and skip bounds" )
{
  const vector<uint8_t> bytes( 16, 0xAB );
  BinaryReader reader( bytes );

  reader.seek( 16 );
  CHECK_EQ( reader.remaining(), 0 );

  CHECK_EQ( error_code_of( [&](){ reader.seek( 17 ); } ), DatErrorCode::OutOfRange );
  CHECK_EQ( reader.position(), 16 );

  reader.seek( 4 );
  reader.skip( 12 );
  CHECK_EQ( reader.position(), 16 );

  reader.seek( 4 );
  CHECK_EQ( error_code_of( [&](){ reader.skip( 13 ); } ), DatErrorCode::OutOfRange );
  CHECK_EQ( reader.position(), 4 );
}//TEST_CASE( "Seek and skip bounds" )


TEST_CASE( "Fixed length and length prefixed fields" )
{
  vector<uint8_t> bytes;
  const string padded( "Li7\0\0 ", 6 );
  bytes.insert( bytes.end(), padded.begin(), padded.end() );

  //Little-endian 16 bit length prefix of 3, then "Be9"
  bytes.push_back( 0x03 );
  bytes.push_back( 0x00 );
  bytes.push_back( 'B' );
  bytes.push_back( 'e' );
  bytes.push_back( '9' );

  //A 1 byte length prefix claiming more bytes than remain
  bytes.push_back( 0x05 );
  bytes.push_back( 'x' );

  BinaryReader reader( bytes );
  CHECK_EQ( reader.read_fixed_string( 6 ), "Li7" );
  CHECK_EQ( reader.read_length_prefixed_string( 2 ), "Be9" );

  const size_t pos = reader.position();
  CHECK_EQ( error_code_of( [&](){ reader.read_length_prefixed( 1 ); } ), DatErrorCode::Truncated );
  CHECK_EQ( reader.position(), pos );

  const vector<uint8_t> raw = reader.read_fixed( 2 );
  REQUIRE_EQ( raw.size(), 2 );
  CHECK_EQ( raw[0], 0x05 );
  CHECK_EQ( raw[1], 'x' );

  //A field of only padding is empty
  const vector<uint8_t> spaces( 4, ' ' );
  BinaryReader spacereader( spaces );
  CHECK( spacereader.read_fixed_string( 4 ).empty() );
}//TEST_CASE( "Fixed length and length prefixed fields" )


TEST_CASE( "Error code names" )
{
  CHECK_EQ( string( IcpDat::to_str( DatErrorCode::Truncated ) ), "Truncated" );
  CHECK_EQ( string( IcpDat::to_str( DatErrorCode::MalformedHeader ) ), "MalformedHeader" );
  CHECK_EQ( string( IcpDat::to_str( DatErrorCode::MalformedRecord ) ), "MalformedRecord" );
  CHECK_EQ( string( IcpDat::to_str( DatErrorCode::UnsupportedVersion ) ), "UnsupportedVersion" );
  CHECK_EQ( string( IcpDat::to_str( DatErrorCode::OutOfRange ) ), "OutOfRange" );
  CHECK_EQ( string( IcpDat::to_str( DatErrorCode::FileIO ) ), "FileIO" );

  const DatError err( DatErrorCode::OutOfRange, "past the end" );
  CHECK_EQ( err.code(), DatErrorCode::OutOfRange );
  CHECK_EQ( string( err.what() ), "past the end" );
}//TEST_CASE( "Error code names" )
