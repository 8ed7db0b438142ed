#ifndef DatTestUtils_h
#define DatTestUtils_h
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

#include <string>
#include <vector>
#include <cstdio>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include "IcpDat/Filesystem.h"

/** Builds synthetic DAT file images for the unit tests.

 Example, a revision 1 file with two scans of one mass read by the pulse
 counting detector:
 \code{.cpp}
 std::vector<DatTestUtils::TestScan> scans;
 scans.push_back( DatTestUtils::TestScan( 1, 0 ) );
 scans.back().add_mass( 7.0, { DatTestUtils::pulse(100) } );
 scans.push_back( DatTestUtils::TestScan( 2, 250 ) );
 scans.back().add_mass( 7.0, { DatTestUtils::pulse(120) } );
 const std::vector<uint8_t> bytes = DatTestUtils::build_dat( 1, 1418066400, scans );
 \endcode
 */
namespace DatTestUtils
{
  const size_t sm_header_offset = 0x10;
  const size_t sm_num_header_words = 85;
  const size_t sm_header_end = sm_header_offset + 4*sm_num_header_words;
  const size_t sm_num_scan_header_words = 47;

  const uint32_t sm_end_of_scan = 0xF0000000u;

  inline uint32_t tag( const uint32_t key, const uint32_t value )
  {
    return (key << 28) | (value & 0x0FFFFFFFu);
  }

  inline uint32_t data_word( const uint32_t type, const uint32_t mantissa,
                             const uint32_t exponent = 0, const bool flagged = false )
  {
    return tag( 0x1, ((flagged ? 1u : 0u) << 24) | (type << 20) | (exponent << 16) | (mantissa & 0xFFFFu) );
  }

  inline uint32_t analog( const uint32_t mantissa, const uint32_t exponent = 0, const bool flagged = false )
  {
    return data_word( 0x0, mantissa, exponent, flagged );
  }

  inline uint32_t pulse( const uint32_t mantissa, const uint32_t exponent = 0, const bool flagged = false )
  {
    return data_word( 0x1, mantissa, exponent, flagged );
  }

  inline uint32_t faraday( const uint32_t mantissa, const uint32_t exponent = 0, const bool flagged = false )
  {
    return data_word( 0x8, mantissa, exponent, flagged );
  }

  inline uint32_t mass_word( const double amu )
  {
    return tag( 0x2, static_cast<uint32_t>( amu * 262144.0 + 0.5 ) );
  }

  inline uint32_t end_of_mass( const uint32_t duration )
  {
    return tag( 0x8, duration );
  }


  struct TestScan
  {
    TestScan( const uint32_t num, const uint32_t ms )
      : number( num ), time_ms( ms ), acf( 250 ), fcf( 0 ), edac( 0 ), body()
    {
    }

    /** Appends a mass block: the magnet mass, the readings, then the
     end-of-mass tag.
     */
    void add_mass( const double amu, const std::vector<uint32_t> &readings,
                   const uint32_t duration = 1000 )
    {
      body.push_back( mass_word( amu ) );
      body.insert( body.end(), readings.begin(), readings.end() );
      body.push_back( end_of_mass( duration ) );
    }

    uint32_t number;
    uint32_t time_ms;
    uint32_t acf;
    uint32_t fcf;
    uint32_t edac;

    /** Tagged words after the scan header, not including the end-of-scan tag. */
    std::vector<uint32_t> body;
  };//struct TestScan


  inline void append_word( std::vector<uint8_t> &bytes, const uint32_t word )
  {
    for( int i = 0; i < 4; ++i )
      bytes.push_back( static_cast<uint8_t>( (word >> (8*i)) & 0xFF ) );
  }

  inline void set_word( std::vector<uint8_t> &bytes, const size_t offset, const uint32_t word )
  {
    if( (offset + 4) > bytes.size() )
      throw std::runtime_error( "set_word: offset past end" );

    for( size_t i = 0; i < 4; ++i )
      bytes[offset + i] = static_cast<uint8_t>( (word >> (8*i)) & 0xFF );
  }

  inline uint32_t get_word( const std::vector<uint8_t> &bytes, const size_t offset )
  {
    uint32_t word = 0;
    for( size_t i = 0; i < 4; ++i )
      word |= (static_cast<uint32_t>( bytes.at(offset + i) ) << (8*i));
    return word;
  }


  /** Appends the scan header, body, and end-of-scan tag. */
  inline void append_scan( std::vector<uint8_t> &bytes, const TestScan &scan,
                           const uint32_t revision )
  {
    std::vector<uint32_t> header( sm_num_scan_header_words, 0 );
    header[3] = 0xD;
    header[4] = 0xE;
    header[5] = 0xF;
    header[9] = scan.number;
    header[12] = scan.acf;
    header[19] = scan.time_ms;
    header[31] = scan.edac;
    header[(revision == 1) ? 35 : 34] = scan.fcf;

    for( const uint32_t word : header )
      append_word( bytes, word );
    for( const uint32_t word : scan.body )
      append_word( bytes, word );
    append_word( bytes, sm_end_of_scan );
  }//append_scan(...)


  /** Byte offset of the scan header word of the scan at scan_offset. */
  inline size_t scan_word_offset( const size_t scan_offset, const size_t word )
  {
    return scan_offset + 4*word;
  }


  /** Builds a complete DAT file image.

   Scans are placed back to back after the file header.  For revision 1 the
   scan index follows the scans, and header word 39 is set to
   declared_count, or to the number of scans if declared_count is negative.

   \param scan_offsets If non-null, set to the byte offset of each scan.
   */
  inline std::vector<uint8_t> build_dat( const uint32_t revision, const uint32_t start_time,
                                         const std::vector<TestScan> &scans,
                                         const int64_t declared_count = -1,
                                         std::vector<size_t> *scan_offsets = nullptr )
  {
    std::vector<uint8_t> bytes;
    append_word( bytes, revision );
    for( int i = 0; i < 3; ++i )
      append_word( bytes, 0 );
    for( size_t i = 0; i < sm_num_header_words; ++i )
      append_word( bytes, 0 );

    set_word( bytes, sm_header_offset + 4*40, start_time );

    std::vector<size_t> offsets;
    for( const TestScan &scan : scans )
    {
      offsets.push_back( bytes.size() );
      append_scan( bytes, scan, revision );
    }

    if( revision == 1 )
    {
      const uint32_t index_pos = static_cast<uint32_t>( bytes.size() );
      append_word( bytes, 0 );  //the index entries start one word after header word 33
      for( const size_t offset : offsets )
        append_word( bytes, static_cast<uint32_t>( offset ) );

      const uint32_t count = (declared_count < 0) ? static_cast<uint32_t>( scans.size() )
                                                  : static_cast<uint32_t>( declared_count );
      set_word( bytes, sm_header_offset + 4*33, index_pos );
      set_word( bytes, sm_header_offset + 4*39, count );
    }//if( revision == 1 )

    if( scan_offsets )
      *scan_offsets = offsets;

    return bytes;
  }//build_dat(...)


  /** Scans numbered 1..nscans, 100 ms apart, each with the same masses; mass j
   (zero based) has one pulse reading of 10*(j+1) + scan number, and one
   analog reading of scan number.
   */
  inline std::vector<TestScan> simple_scans( const size_t nscans, const size_t nmasses )
  {
    std::vector<TestScan> scans;
    for( size_t i = 0; i < nscans; ++i )
    {
      const uint32_t number = static_cast<uint32_t>( i + 1 );
      scans.push_back( TestScan( number, static_cast<uint32_t>( 100*i ) ) );
      for( size_t j = 0; j < nmasses; ++j )
      {
        const uint32_t p = static_cast<uint32_t>( 10*(j+1) ) + number;
        scans.back().add_mass( 6.0 + j, { pulse(p), analog(number) } );
      }
    }//for( size_t i = 0; i < nscans; ++i )

    return scans;
  }//simple_scans(...)


  inline void write_bytes( const std::string &path, const std::vector<uint8_t> &bytes )
  {
    std::ofstream output( path.c_str(), std::ios::out | std::ios::binary );
    if( !output.is_open() )
      throw std::runtime_error( "Could not open " + path + " for writing" );
    if( !bytes.empty() )
      output.write( reinterpret_cast<const char *>( &bytes[0] ), static_cast<std::streamsize>( bytes.size() ) );
    if( !output )
      throw std::runtime_error( "Failed writing " + path );
  }//write_bytes(...)


  inline void write_text( const std::string &path, const std::string &text )
  {
    std::ofstream output( path.c_str(), std::ios::out | std::ios::binary );
    if( !output.is_open() )
      throw std::runtime_error( "Could not open " + path + " for writing" );
    output << text;
  }//write_text(...)


  inline std::string read_text( const std::string &path )
  {
    std::ifstream input( path.c_str(), std::ios::in | std::ios::binary );
    if( !input.is_open() )
      throw std::runtime_error( "Could not open " + path );
    return std::string( std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>() );
  }//read_text(...)


  /** A new, empty, directory in the temp directory.  When destructed, the
   files directly in it, then everything added to #extra, then the directory
   itself are removed.
   */
  struct ScratchDir
  {
    ScratchDir()
      : path( IcpDat::temp_file_name( "icpdat-test-%%%%%%%%", IcpDat::temp_dir() ) ),
        extra()
    {
      if( IcpDat::create_directory( path ) != 1 )
        throw std::runtime_error( "Could not create directory " + path );
    }

    ~ScratchDir()
    {
      for( const std::string &file : IcpDat::ls_files_in_directory( path ) )
        IcpDat::remove_file( file );
      for( auto iter = extra.rbegin(); iter != extra.rend(); ++iter )
        std::remove( iter->c_str() );
      std::remove( path.c_str() );
    }

    std::string file( const std::string &name ) const
    {
      return IcpDat::append_path( path, name );
    }

    void touch( const std::string &name ) const
    {
      write_text( file(name), "" );
    }

    const std::string path;

    /** Links and sub-directories to remove; removed in reverse order. */
    std::vector<std::string> extra;
  };//struct ScratchDir
}//namespace DatTestUtils

#endif //DatTestUtils_h
