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

#include <set>
#include <string>
#include <vector>

#include <unistd.h>

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include "IcpDat/Filesystem.h"
#include "IcpDat/OutputNamer.h"

#include "DatTestUtils.h"

using namespace std;


using DatTestUtils::ScratchDir;


TEST_CASE( "First free name" )
{
  ScratchDir dir;

  CHECK_EQ( IcpDat::name_for( "F", ".csv", dir.path ), dir.file( "F.csv" ) );

  dir.touch( "F.csv" );
  CHECK_EQ( IcpDat::name_for( "F", ".csv", dir.path ), dir.file( "F-1.csv" ) );

  dir.touch( "F-1.csv" );
  dir.touch( "F-2.csv" );
  CHECK_EQ( IcpDat::name_for( "F", ".csv", dir.path ), dir.file( "F-3.csv" ) );

  //Gaps are filled
  dir.touch( "F-5.csv" );
  CHECK_EQ( IcpDat::name_for( "F", ".csv", dir.path ), dir.file( "F-3.csv" ) );

  //Other bases and suffixes are independent
  CHECK_EQ( IcpDat::name_for( "F", ".txt", dir.path ), dir.file( "F.txt" ) );
  CHECK_EQ( IcpDat::name_for( "F-1", ".csv", dir.path ), dir.file( "F-1-1.csv" ) );
  CHECK_EQ( IcpDat::name_for( "G", ".csv", dir.path ), dir.file( "G.csv" ) );

  //Computing a name does not create anything
  CHECK( !IcpDat::is_file( dir.file( "F-3.csv" ) ) );
}//TEST_CASE( "First free name" )


TEST_CASE( "Reserved names are skipped" )
{
  ScratchDir dir;
  dir.touch( "F.csv" );

  set<string> reserved;
  reserved.insert( dir.file( "F-1.csv" ) );
  reserved.insert( dir.file( "F-2.csv" ) );
  CHECK_EQ( IcpDat::name_for( "F", ".csv", dir.path, &reserved ), dir.file( "F-3.csv" ) );

  reserved.insert( dir.file( "G.csv" ) );
  CHECK_EQ( IcpDat::name_for( "G", ".csv", dir.path, &reserved ), dir.file( "G-1.csv" ) );
}//TEST_CASE( "Reserved names are skipped" )


TEST_CASE( "Broken symbolic link counts as existing" )
{
  ScratchDir dir;

  const string link = dir.file( "F.csv" );
  REQUIRE_EQ( symlink( dir.file( "does-not-exist" ).c_str(), link.c_str() ), 0 );
  dir.extra.push_back( link );

  CHECK( !IcpDat::is_file( link ) );
  CHECK_EQ( IcpDat::name_for( "F", ".csv", dir.path ), dir.file( "F-1.csv" ) );
}//TEST_CASE( "Broken symbolic link counts as existing" )


TEST_CASE( "Output paths of DAT files" )
{
  ScratchDir dir;
  const string input = dir.file( "run1.dat" );

  CHECK_EQ( IcpDat::per_run_output_path( input ), dir.file( "run1.csv" ) );
  CHECK_EQ( IcpDat::combined_output_path( input ), dir.file( "run1combined.csv" ) );

  dir.touch( "run1.csv" );
  dir.touch( "run1combined.csv" );
  CHECK_EQ( IcpDat::per_run_output_path( input ), dir.file( "run1-1.csv" ) );
  CHECK_EQ( IcpDat::combined_output_path( input ), dir.file( "run1combined-1.csv" ) );

  set<string> reserved;
  reserved.insert( dir.file( "run1-1.csv" ) );
  CHECK_EQ( IcpDat::per_run_output_path( input, &reserved ), dir.file( "run1-2.csv" ) );

  //Relative input path
  CHECK_EQ( IcpDat::filename( IcpDat::per_run_output_path( "no-such-dir-xyz/abc.DAT" ) ), "abc.csv" );
}//TEST_CASE( "Output paths of DAT files" )


TEST_CASE( "Write new files without overwriting" )
{
  ScratchDir dir;

  string written;
  REQUIRE( IcpDat::write_new_file( "F", ".csv", dir.path, "first", written ) );
  CHECK_EQ( written, dir.file( "F.csv" ) );
  CHECK_EQ( DatTestUtils::read_text( written ), "first" );

  REQUIRE( IcpDat::write_new_file( "F", ".csv", dir.path, "second", written ) );
  CHECK_EQ( written, dir.file( "F-1.csv" ) );
  CHECK_EQ( DatTestUtils::read_text( written ), "second" );
  CHECK_EQ( DatTestUtils::read_text( dir.file( "F.csv" ) ), "first" );

  dir.touch( "F-2.csv" );
  REQUIRE( IcpDat::write_new_file( "F", ".csv", dir.path, string(100000, 'x'), written ) );
  CHECK_EQ( written, dir.file( "F-3.csv" ) );
  CHECK_EQ( IcpDat::file_size( written ), 100000 );

  REQUIRE( IcpDat::write_new_file( "empty", ".csv", dir.path, "", written ) );
  CHECK( IcpDat::is_file( written ) );
  CHECK_EQ( IcpDat::file_size( written ), 0 );

  //Directory that does not exist
  CHECK( !IcpDat::write_new_file( "F", ".csv", dir.file( "missing" ), "x", written ) );
  CHECK( written.empty() );
}//TEST_CASE( "Write new files without overwriting" )
