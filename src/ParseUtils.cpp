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
#include <fstream>

#include "IcpDat/ParseUtils.h"
#include "IcpDat/StringAlgo.h"
#include "IcpDat/Filesystem.h"

using namespace std;


namespace IcpDat
{
std::istream &safe_get_line( std::istream &is, std::string &t )
{
  return safe_get_line( is, t, 0 );
}


std::istream &safe_get_line( std::istream &is, std::string &t, const size_t maxlength )
{
  //from  http://stackoverflow.com/questions/6089231/getting-std-ifstream-to-handle-lf-cr-and-crlf
  t.clear();

  // Reading through the streambuf is much faster than through the istream,
  //  but must be guarded by a sentry object.
  std::istream::sentry se( is, true );
  std::streambuf *sb = is.rdbuf();

  while( !maxlength || (t.length() < maxlength) )
  {
    const int c = sb->sbumpc();

    if( c == '\n' )
      return is;

    if( c == '\r' )
    {
      if( sb->sgetc() == '\n' )
        sb->sbumpc();
      return is;
    }

    if( c == EOF )
    {
      // A last line without a terminator is still a line.
      if( t.empty() )
        is.setstate( ios::eofbit | ios::failbit );
      else
        is.setstate( ios::eofbit );
      return is;
    }

    t += static_cast<char>( c );
  }//while( not at max length )

  // Hit the length limit; swallow the line terminator, if thats what is next.
  int next = sb->sgetc();
  if( next == EOF )
  {
    is.setstate( ios::eofbit );
  }else
  {
    if( next == '\r' )
    {
      sb->sbumpc();
      next = sb->sgetc();
    }

    if( next == '\n' )
      sb->sbumpc();
  }//if( next == EOF ) / else

  return is;
}//safe_get_line(...)


std::vector<std::string> parse_element_list( std::istream &input )
{
  string line;
  for( size_t i = 0; i < sm_fin2_element_line; ++i )
  {
    if( !safe_get_line( input, line ) )
      return vector<string>();
  }

  vector<string> fields;
  split_no_delim_compress( fields, line, "," );

  if( fields.size() < 2 )
    return vector<string>();

  vector<string> elements( fields.begin() + 1, fields.end() );
  for( string &el : elements )
    trim( el );

  while( !elements.empty() && elements.back().empty() )
    elements.pop_back();

  return elements;
}//parse_element_list(...)


std::string element_list_path( const std::string &dat_path )
{
  const string ext = file_extension( dat_path );
  return dat_path.substr( 0, dat_path.size() - ext.size() ) + ".FIN2";
}


std::vector<std::string> load_element_list( const std::string &dat_path )
{
  const string path = element_list_path( dat_path );
  if( !is_file( path ) )
    return vector<string>();

  ifstream input( path.c_str(), ios::in | ios::binary );
  if( !input.is_open() )
    return vector<string>();

  return parse_element_list( input );
}//load_element_list(...)
}//namespace IcpDat
