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
#include <cctype>
#include <cstdio>
#include <string>
#include <vector>
#include <cstdlib>
#include <cstring>
#include <algorithm>

#if(PERFORM_DEVELOPER_CHECKS)
#include <boost/algorithm/string.hpp>
#endif

#include "IcpDat/StringAlgo.h"

using namespace std;

namespace
{
  bool is_space( const char c )
  {
    return std::isspace( static_cast<unsigned char>(c) ) != 0;
  }

  char lower_ascii( const char c )
  {
    return static_cast<char>( std::tolower( static_cast<unsigned char>(c) ) );
  }
}//namespace


namespace IcpDat
{
  void trim( std::string &s )
  {
    const auto first = std::find_if_not( s.begin(), s.end(), is_space );
    s.erase( s.begin(), first );

    const auto last = std::find_if_not( s.rbegin(), s.rend(), is_space );
    s.erase( last.base(), s.end() );

#if(PERFORM_DEVELOPER_CHECKS)
    if( !s.empty() && (is_space(s.front()) || is_space(s.back())) )
      log_developer_error( __func__, ("Failed to trim '" + s + "'").c_str() );
#endif
  }//void trim( std::string &s )


  std::string trim_copy( std::string str )
  {
    trim( str );
    return str;
  }


  bool iequals_ascii( const std::string &str, const std::string &test )
  {
    if( str.size() != test.size() )
      return false;

    for( size_t i = 0; i < str.size(); ++i )
    {
      if( lower_ascii(str[i]) != lower_ascii(test[i]) )
        return false;
    }

    return true;
  }//bool iequals_ascii(...)


  bool iends_with( const std::string &line, const std::string &label )
  {
    const size_t len1 = line.size();
    const size_t len2 = label.size();

    if( (len1 < len2) || !len2 )
      return false;

    const bool answer = iequals_ascii( line.substr( len1 - len2 ), label );

#if(PERFORM_DEVELOPER_CHECKS)
    const bool correctAnswer = boost::algorithm::iends_with( line, label );

    if( answer != correctAnswer )
    {
      char errormsg[1024];
      snprintf( errormsg, sizeof(errormsg),
               "Got %i when should have got %i for label '%s' and string '%s'",
               int(answer), int(correctAnswer), label.c_str(), line.c_str() );
      log_developer_error( __func__, errormsg );
    }//if( answer != correctAnswer )
#endif

    return answer;
  }//bool iends_with( const std::string &line, const std::string &label )


  void split_no_delim_compress( std::vector<std::string> &results,
                                const std::string &input, const char *delims )
  {
    results.clear();

    if( input.empty() )
      return;

    size_t field_start = 0;
    size_t delim_pos = input.find_first_of( delims, field_start );

    while( delim_pos != std::string::npos )
    {
      results.push_back( input.substr( field_start, delim_pos - field_start ) );
      field_start = delim_pos + 1;
      delim_pos = input.find_first_of( delims, field_start );
    }//while( delim_pos != std::string::npos )

    results.push_back( input.substr( field_start ) );

#if(PERFORM_DEVELOPER_CHECKS)
    vector<string> boost_results;
    boost::algorithm::split( boost_results, input, boost::algorithm::is_any_of(delims) );
    if( boost_results != results )
    {
      const string msg = "Split of '" + input + "' gave " + std::to_string(results.size())
                         + " fields, boost gave " + std::to_string(boost_results.size());
      log_developer_error( __func__, msg.c_str() );
    }
#endif
  }//void split_no_delim_compress(...)


  bool parse_double( const char *input, const size_t length, double &result )
  {
    result = 0.0;
    if( !input || !length )
      return false;

    string str( input, length );
    trim( str );
    if( str.empty() )
      return false;

    const char *begin = str.c_str();
    char *end = nullptr;
    const double value = strtod( begin, &end );

    if( end != (begin + str.size()) )
      return false;

    result = value;
    return true;
  }//bool parse_double(...)


  std::string print_round_trip( const double value )
  {
    if( std::isnan(value) )
      return "nan";

    if( std::isinf(value) )
      return value > 0.0 ? "inf" : "-inf";

    char buffer[64];

    // Integral values the DAT files produce (counts shifted by an exponent)
    //  are all well below 2^53, so print those without an exponent.
    if( (std::floor(value) == value) && (std::fabs(value) < 9007199254740992.0) )
    {
      snprintf( buffer, sizeof(buffer), "%.0f", value );
      if( strcmp( buffer, "-0" ) == 0 )
        return "0";
      return buffer;
    }

    for( int precision = 1; precision <= 17; ++precision )
    {
      snprintf( buffer, sizeof(buffer), "%.*g", precision, value );
      if( strtod( buffer, nullptr ) == value )
        break;
    }

    return buffer;
  }//std::string print_round_trip( const double value )
}//namespace IcpDat
