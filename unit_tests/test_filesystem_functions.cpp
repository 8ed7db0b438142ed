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
#include <stdexcept>
#include <algorithm>

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include "IcpDat/Filesystem.h"

#include "DatTestUtils.h"

using namespace std;
using DatTestUtils::ScratchDir;


TEST_CASE( "Path manipulation" )
{
  CHECK_EQ( IcpDat::filename( "/path/to/some/file.txt"), "file.txt" );
  CHECK_EQ( IcpDat::filename( "/path/to/some"), "some" );
  CHECK_EQ( IcpDat::filename( "/usr/lib"), "lib" );
  CHECK_EQ( IcpDat::filename( "/usr/"), "" );
  CHECK_EQ( IcpDat::filename( "usr"), "usr" );
  CHECK_EQ( IcpDat::filename( "/"), "" );
  CHECK_EQ( IcpDat::filename( "."), "" );
  CHECK_EQ( IcpDat::filename( ".."), "" );
  CHECK_EQ( IcpDat::filename( "/data/.."), "" );
  CHECK_EQ( IcpDat::filename( ""), "" );

  CHECK_EQ( IcpDat::parent_path( "/usr/lib" ), "/usr" );
  CHECK_EQ( IcpDat::parent_path( "/usr/lib/" ), "/usr" );
  CHECK_EQ( IcpDat::parent_path( "/usr" ), "/" );
  CHECK_EQ( IcpDat::parent_path( "usr" ), "" );
  CHECK_EQ( IcpDat::parent_path( "/" ), "" );
  CHECK_EQ( IcpDat::parent_path( "" ), "" );
  CHECK_EQ( IcpDat::parent_path( R"str(/user/docs/Letter.txt)str" ), R"str(/user/docs)str" );
  CHECK_EQ( IcpDat::parent_path( R"str(./inthisdir)str" ), R"str(.)str" );
  CHECK_EQ( IcpDat::parent_path( R"str(../../greatgrandparent)str" ), R"str(../..)str" );
  CHECK_EQ( IcpDat::parent_path( R"str(2018/January.dat)str" ), R"str(2018)str" );
  CHECK_EQ( IcpDat::parent_path( "a//b" ), "a" );

  CHECK_EQ( IcpDat::file_extension( "/path/to/some/file.txt"), ".txt" );
  CHECK_EQ( IcpDat::file_extension( "/path/to/filename"), "" );
  CHECK_EQ( IcpDat::file_extension( "/path.d/filename"), "" );
  CHECK_EQ( IcpDat::file_extension( "run1.DAT"), ".DAT" );
  CHECK_EQ( IcpDat::file_extension( "archive.tar.gz"), ".gz" );
  CHECK_EQ( IcpDat::file_extension( ".profile"), ".profile" );
  CHECK_EQ( IcpDat::file_extension( "/path/"), "" );

  CHECK_EQ( IcpDat::filename_stem( "/data/run1.dat"), "run1" );
  CHECK_EQ( IcpDat::filename_stem( "run1.tar.dat"), "run1.tar" );
  CHECK_EQ( IcpDat::filename_stem( "noext"), "noext" );
  CHECK_EQ( IcpDat::filename_stem( "/path/.hidden"), "" );
  CHECK_EQ( IcpDat::filename_stem( "/path/"), "" );

  CHECK_EQ( IcpDat::append_path( "path", "file.txt"), "path/file.txt" );
  CHECK_EQ( IcpDat::append_path( "path/", "file.txt"), "path/file.txt" );
  CHECK_EQ( IcpDat::append_path( "path/", "/file.txt"), "path/file.txt" );
  CHECK_EQ( IcpDat::append_path( "path", "/file.txt"), "path/file.txt" );
  CHECK_EQ( IcpDat::append_path( "/path", "file.txt"), "/path/file.txt" );
  CHECK_EQ( IcpDat::append_path( "", "file.txt"), "file.txt" );
  CHECK_EQ( IcpDat::append_path( "path", ""), "path" );
  CHECK_EQ( IcpDat::append_path( "/", "file.txt"), "/file.txt" );
}//TEST_CASE( "Path manipulation" )


TEST_CASE( "Temporary names" )
{
  const string tmpdir = IcpDat::temp_dir();
  CHECK( !tmpdir.empty() );
  CHECK( IcpDat::is_directory( tmpdir ) );

  const string name = IcpDat::temp_file_name( "base", "/somedir" );
  CHECK_EQ( IcpDat::parent_path( name ), "/somedir" );
  CHECK_EQ( IcpDat::filename( name ).size(), 5 + 19 );
  CHECK_EQ( IcpDat::filename( name ).substr( 0, 5 ), "base_" );
  CHECK_EQ( name.find( '%' ), string::npos );

  const string::size_type dash = IcpDat::filename( name ).find( '-' );
  CHECK_EQ( dash, 9 );

  //Percent signs in the base are replaced too
  const string pattern = IcpDat::temp_file_name( "a%%b", "/d" );
  CHECK_EQ( pattern.find( '%' ), string::npos );
  CHECK_EQ( pattern.size(), 3 + 5 + 19 );
  CHECK_EQ( pattern.substr( 0, 4 ), "/d/a" );

  const string nobase = IcpDat::temp_file_name( "", "/d" );
  CHECK_EQ( IcpDat::filename( nobase ).size(), 19 );

  CHECK_NE( IcpDat::temp_file_name( "base", tmpdir ), IcpDat::temp_file_name( "base", tmpdir ) );
}//TEST_CASE( "Temporary names" )


TEST_CASE( "Create and query directories" )
{
  ScratchDir dir;

  CHECK( IcpDat::is_directory( dir.path ) );
  CHECK( !IcpDat::is_file( dir.path ) );
  CHECK_EQ( IcpDat::create_directory( dir.path ), -1 );

  const string sub = dir.file( "sub" );
  CHECK( !IcpDat::is_directory( sub ) );
  REQUIRE_EQ( IcpDat::create_directory( sub ), 1 );
  dir.extra.push_back( sub );
  CHECK( IcpDat::is_directory( sub ) );
  CHECK_EQ( IcpDat::create_directory( sub ), -1 );

  CHECK_EQ( IcpDat::create_directory( dir.file( "missing/sub" ) ), 0 );
  CHECK( !IcpDat::is_directory( dir.file( "missing" ) ) );

  dir.touch( "plain.dat" );
  CHECK( IcpDat::is_file( dir.file( "plain.dat" ) ) );
  CHECK( !IcpDat::is_directory( dir.file( "plain.dat" ) ) );
  CHECK_EQ( IcpDat::create_directory( dir.file( "plain.dat" ) ), 0 );
}//TEST_CASE( "Create and query directories" )


TEST_CASE( "List files in directory" )
{
  ScratchDir dir;
  DatTestUtils::write_text( dir.file( "a.dat" ), "1" );
  DatTestUtils::write_text( dir.file( "b.DAT" ), "12345" );
  DatTestUtils::write_text( dir.file( "c.txt" ), "" );

  const string sub = dir.file( "sub.dat" );
  REQUIRE_EQ( IcpDat::create_directory( sub ), 1 );
  dir.extra.push_back( sub );

  vector<string> files = IcpDat::ls_files_in_directory( dir.path, ".dat" );
  std::sort( files.begin(), files.end() );
  const vector<string> dat_files = { dir.file( "a.dat" ), dir.file( "b.DAT" ) };
  CHECK( files == dat_files );

  files = IcpDat::ls_files_in_directory( dir.path, "" );
  std::sort( files.begin(), files.end() );
  const vector<string> all_files = { dir.file( "a.dat" ), dir.file( "b.DAT" ), dir.file( "c.txt" ) };
  CHECK( files == all_files );

  files = IcpDat::ls_files_in_directory( dir.path, ".csv" );
  CHECK( files.empty() );

  //With a match function
  size_t min_size = 2;
  IcpDat::file_match_function_t larger = []( const std::string &filename, void *userdata ) -> bool {
    return IcpDat::file_size( filename ) >= *static_cast<size_t *>( userdata );
  };

  files = IcpDat::ls_files_in_directory( dir.path, larger, &min_size );
  REQUIRE_EQ( files.size(), 1 );
  CHECK_EQ( files[0], dir.file( "b.DAT" ) );

  files = IcpDat::ls_files_in_directory( dir.path, (IcpDat::file_match_function_t)0, nullptr );
  CHECK_EQ( files.size(), 3 );

  CHECK( IcpDat::ls_files_in_directory( dir.file( "not-a-dir" ), "" ).empty() );
}//TEST_CASE( "List files in directory" )


TEST_CASE( "File contents" )
{
  ScratchDir dir;

  const vector<uint8_t> bytes = { 0x01, 0x00, 0x00, 0x00, 0xFF, 0x0D, 0x0A, 0x1A, 0x00 };
  const string path = dir.file( "bytes.dat" );
  DatTestUtils::write_bytes( path, bytes );

  CHECK_EQ( IcpDat::file_size( path ), bytes.size() );
  CHECK_EQ( IcpDat::file_size( dir.path ), 0 );
  CHECK_EQ( IcpDat::file_size( dir.file( "missing.dat" ) ), 0 );

  vector<uint8_t> data;
  IcpDat::load_file_data( path, data );
  CHECK( data == bytes );

  const string empty = dir.file( "empty.dat" );
  DatTestUtils::write_bytes( empty, vector<uint8_t>() );
  data.push_back( 7 );
  IcpDat::load_file_data( empty, data );
  CHECK( data.empty() );

  data = bytes;
  CHECK_THROWS_AS( IcpDat::load_file_data( dir.file( "missing.dat" ), data ), std::runtime_error );
  CHECK( data.empty() );

  data = bytes;
  CHECK_THROWS_AS( IcpDat::load_file_data( dir.path, data ), std::runtime_error );
  CHECK( data.empty() );

  const string subdir = dir.file( "sub.dat" );
  REQUIRE_EQ( IcpDat::create_directory( subdir ), 1 );
  dir.extra.push_back( subdir );
  CHECK_THROWS_AS( IcpDat::load_file_data( subdir, data ), std::runtime_error );

  CHECK( IcpDat::remove_file( path ) );
  CHECK( !IcpDat::is_file( path ) );
  CHECK( !IcpDat::remove_file( path ) );
}//TEST_CASE( "File contents" )
