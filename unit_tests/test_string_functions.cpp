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

#include <cmath>
#include <limits>
#include <random>
#include <string>
#include <vector>
#include <cstdlib>
#include <cstring>

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include "IcpDat/StringAlgo.h"

using namespace std;


TEST_CASE( "Trim" )
{
  string str = "  Li7p \t\r\n";
  IcpDat::trim( str );
  CHECK_EQ( str, "Li7p" );

  str = "\v\fBe 9\f";
  IcpDat::trim( str );
  CHECK_EQ( str, "Be 9" );

  str = " \t ";
  IcpDat::trim( str );
  CHECK( str.empty() );

  str = "";
  IcpDat::trim( str );
  CHECK( str.empty() );

  str = "NoSpace";
  IcpDat::trim( str );
  CHECK_EQ( str, "NoSpace" );

  CHECK_EQ( IcpDat::trim_copy( " Mass01 " ), "Mass01" );
  CHECK_EQ( IcpDat::trim_copy( "a b" ), "a b" );
  CHECK_EQ( IcpDat::trim_copy( "\n" ), "" );
}//TEST_CASE( "Trim" )


TEST_CASE( "Case insensitive compare" )
{
  CHECK( IcpDat::iequals_ascii( "RUN1.DAT", "run1.dat" ) );
  CHECK( IcpDat::iequals_ascii( "", "" ) );
  CHECK( !IcpDat::iequals_ascii( "run1.dat", "run1.da" ) );
  CHECK( !IcpDat::iequals_ascii( "run1.dat", "run2.dat" ) );

  CHECK( IcpDat::iends_with( "run1.DAT", ".dat" ) );
  CHECK( IcpDat::iends_with( "run1.dat", ".DAT" ) );
  CHECK( IcpDat::iends_with( ".dat", ".dat" ) );
  CHECK( !IcpDat::iends_with( "run1.dat2", ".dat" ) );
  CHECK( !IcpDat::iends_with( "dat", ".dat" ) );
  CHECK( !IcpDat::iends_with( "run1.dat", "" ) );
  CHECK( !IcpDat::iends_with( "", "" ) );
}//TEST_CASE( "Case insensitive compare" )


TEST_CASE( "Split without compressing delimiters" )
{
  vector<string> results;

  IcpDat::split_no_delim_compress( results, ",a,,b,", "," );
  const vector<string> expected = { "", "a", "", "b", "" };
  CHECK( results == expected );

  IcpDat::split_no_delim_compress( results, "Elements,Li7,Be9", "," );
  const vector<string> elements = { "Elements", "Li7", "Be9" };
  CHECK( results == elements );

  IcpDat::split_no_delim_compress( results, "no delimiter", "," );
  REQUIRE_EQ( results.size(), 1 );
  CHECK_EQ( results[0], "no delimiter" );

  IcpDat::split_no_delim_compress( results, ",", "," );
  const vector<string> two_empty = { "", "" };
  CHECK( results == two_empty );

  //Any of the delimiters ends a field
  IcpDat::split_no_delim_compress( results, "a,b\tc", ",\t" );
  const vector<string> mixed = { "a", "b", "c" };
  CHECK( results == mixed );

  //Previous results are cleared
  IcpDat::split_no_delim_compress( results, "", "," );
  CHECK( results.empty() );
}//TEST_CASE( "Split without compressing delimiters" )


TEST_CASE( "Parse double" )
{
  double value = -1.0;

  const char *str = "1.5";
  CHECK( IcpDat::parse_double( str, strlen(str), value ) );
  CHECK_EQ( value, 1.5 );

  str = "  -2.5e-3 \t";
  CHECK( IcpDat::parse_double( str, strlen(str), value ) );
  CHECK_EQ( value, -2.5e-3 );

  str = "1418066400.125";
  CHECK( IcpDat::parse_double( str, strlen(str), value ) );
  CHECK_EQ( value, 1418066400.125 );

  //Only the first length characters are used
  str = "12345";
  CHECK( IcpDat::parse_double( str, 2, value ) );
  CHECK_EQ( value, 12.0 );

  str = "1.5x";
  CHECK( !IcpDat::parse_double( str, strlen(str), value ) );
  CHECK_EQ( value, 0.0 );

  str = "1.5 2";
  CHECK( !IcpDat::parse_double( str, strlen(str), value ) );

  str = "   ";
  CHECK( !IcpDat::parse_double( str, strlen(str), value ) );

  str = "";
  CHECK( !IcpDat::parse_double( str, 0, value ) );
  CHECK( !IcpDat::parse_double( nullptr, 5, value ) );
}//TEST_CASE( "Parse double" )


TEST_CASE( "Print round trip" )
{
  CHECK_EQ( IcpDat::print_round_trip( 0.0 ), "0" );
  CHECK_EQ( IcpDat::print_round_trip( -0.0 ), "0" );
  CHECK_EQ( IcpDat::print_round_trip( 1.0 ), "1" );
  CHECK_EQ( IcpDat::print_round_trip( 1536.0 ), "1536" );
  CHECK_EQ( IcpDat::print_round_trip( -12.0 ), "-12" );
  CHECK_EQ( IcpDat::print_round_trip( 4294901760.0 ), "4294901760" );
  CHECK_EQ( IcpDat::print_round_trip( 1418066400.0 ), "1418066400" );

  CHECK_EQ( IcpDat::print_round_trip( 0.1 ), "0.1" );
  CHECK_EQ( IcpDat::print_round_trip( 2.5 ), "2.5" );
  CHECK_EQ( IcpDat::print_round_trip( 1418066400.125 ), "1418066400.125" );
  CHECK_EQ( IcpDat::print_round_trip( 1.0e-7 ), "1e-07" );
  CHECK_EQ( IcpDat::print_round_trip( 2.5e-7 ), "2.5e-07" );
  CHECK_EQ( IcpDat::print_round_trip( 1.0e20 ), "1e+20" );

  CHECK_EQ( IcpDat::print_round_trip( std::numeric_limits<double>::quiet_NaN() ), "nan" );
  CHECK_EQ( IcpDat::print_round_trip( std::numeric_limits<double>::infinity() ), "inf" );
  CHECK_EQ( IcpDat::print_round_trip( -std::numeric_limits<double>::infinity() ), "-inf" );

  //Every value reads back exactly
  std::mt19937 gen( 0x1CB );
  std::uniform_real_distribution<double> mantissa_dist( -1.0, 1.0 );
  std::uniform_int_distribution<int> exponent_dist( -30, 30 );

  for( size_t i = 0; i < 2000; ++i )
  {
    const double value = std::ldexp( mantissa_dist(gen), exponent_dist(gen) );
    const string printed = IcpDat::print_round_trip( value );
    CHECK_MESSAGE( strtod( printed.c_str(), nullptr ) == value, "Failed for " << printed );
    CHECK_LE( printed.size(), 24 );
  }

  const double third = 1.0 / 3.0;
  CHECK_EQ( strtod( IcpDat::print_round_trip( third ).c_str(), nullptr ), third );
}//TEST_CASE( "Print round trip" )
