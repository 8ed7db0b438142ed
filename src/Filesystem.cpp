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
#include <random>
#include <fstream>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

#include <dirent.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

#include "IcpDat/StringAlgo.h"
#include "IcpDat/Filesystem.h"

using namespace std;

namespace
{
  bool filter_ending( const std::string &path, void *user_match_data )
  {
    const std::string *ending = static_cast<const std::string *>( user_match_data );
    return IcpDat::iends_with( IcpDat::filename(path), *ending );
  }
}//namespace


namespace IcpDat
{
bool remove_file( const std::string &name )
{
  return (0 == unlink( name.c_str() ));
}//bool remove_file( const std::string &name )


bool is_file( const std::string &name )
{
  // stat() follows symbolic links, so a broken link is not a file.
  struct stat statbuf;
  if( stat( name.c_str(), &statbuf ) != 0 )
    return false;
  return S_ISREG(statbuf.st_mode);
}//bool is_file( const std::string &name )


bool is_directory( const std::string &name )
{
  struct stat statbuf;
  if( stat( name.c_str(), &statbuf ) != 0 )
    return false;
  return S_ISDIR(statbuf.st_mode);
}//bool is_directory( const std::string &name )


int create_directory( const std::string &name )
{
  if( is_directory(name) )
    return -1;

  const mode_t mode = 0755;
  if( mkdir( name.c_str(), mode ) != 0 )
    return 0;

  return 1;
}//int create_directory( const std::string &name )


std::string append_path( const std::string &base, const std::string &name )
{
  if( base.empty() || name.empty() )
    return base + name;

  const char separator = '/';
  const bool base_ends = (base[base.size()-1] == separator);
  const bool name_starts = (name[0] == separator);

  if( !base_ends && !name_starts )
    return base + separator + name;

  if( base_ends != name_starts )
    return base + name;

  //base ends in '/' and name starts with '/'
  return base + name.substr(1);
}//std::string append_path( const std::string &base, const std::string &name )


std::string filename( const std::string &path_and_name )
{
  // "/usr/lib" -> "lib"
  // "/usr/"    -> ""
  // "usr"      -> "usr"
  // "."        -> ""
  // ".."       -> ""
  if( path_and_name.empty() || (path_and_name.back() == '/') )
    return "";

  const size_t pos = path_and_name.find_last_of( '/' );
  const string answer = (pos == string::npos) ? path_and_name : path_and_name.substr( pos + 1 );

  if( answer == "." || answer == ".." )
    return "";

  return answer;
}//std::string filename( const std::string &path_and_name )


std::string parent_path( const std::string &path )
{
  // "/usr/lib"  -> "/usr"
  // "/usr/lib/" -> "/usr"
  // "/usr"      -> "/"
  // "usr"       -> ""
  string p = path;
  while( p.size() > 1 && p.back() == '/' )
    p.resize( p.size() - 1 );

  const size_t pos = p.find_last_of( '/' );
  if( pos == string::npos )
    return "";

  if( pos == 0 )
    return (p.size() > 1) ? string("/") : string("");

  string answer = p.substr( 0, pos );
  while( answer.size() > 1 && answer.back() == '/' )
    answer.resize( answer.size() - 1 );

  return answer;
}//std::string parent_path( const std::string &path )


std::string file_extension( const std::string &path )
{
  const string fn = filename( path );
  const size_t pos = fn.find_last_of( '.' );
  if( pos == string::npos )
    return "";
  return fn.substr(pos);
}


std::string filename_stem( const std::string &path )
{
  const string fn = filename( path );
  return fn.substr( 0, fn.size() - file_extension(fn).size() );
}


size_t file_size( const std::string &path )
{
  struct stat st;
  if( stat( path.c_str(), &st ) < 0 )
    return 0;

  if( S_ISDIR(st.st_mode) )
    return 0;

  return static_cast<size_t>( st.st_size );
}//size_t file_size( const std::string &path )


std::string temp_dir()
{
  const char *val = NULL;
  (val = std::getenv("TMPDIR" )) ||
  (val = std::getenv("TMP"    )) ||
  (val = std::getenv("TEMP"   )) ||
  (val = std::getenv("TEMPDIR"));

  if( val && is_directory(val) )
    return val;

  return "/tmp";
}//std::string temp_dir()


std::string temp_file_name( std::string base, std::string directory )
{
  if( !base.empty() )
    base += "_";
  base += "%%%%-%%%%-%%%%-%%%%";

  std::random_device randdev;
  std::uniform_int_distribution<int> distribution( 0, 15 );

  const char hex[] = "0123456789abcdef";
  static_assert( sizeof(hex) == 17, "" );

  for( size_t i = 0; i < base.size(); ++i )
  {
    if( base[i] == '%' )
      base[i] = hex[distribution(randdev)];
  }

  return append_path( directory, base );
}//temp_file_name


std::vector<std::string> ls_files_in_directory( const std::string &sourcedir,
                                                const std::string &ending )
{
  if( ending.empty() )
    return ls_files_in_directory( sourcedir, (file_match_function_t)0, 0 );

  string ending_copy = ending;
  return ls_files_in_directory( sourcedir, &filter_ending, static_cast<void *>(&ending_copy) );
}//ls_files_in_directory


std::vector<std::string> ls_files_in_directory( const std::string &sourcedir,
                                                file_match_function_t match_fcn,
                                                void *user_data )
{
  vector<string> files;

  errno = 0;
  DIR *dir = opendir( sourcedir.c_str() );
  if( !dir )
  {
#if(PERFORM_DEVELOPER_CHECKS)
    char errormsg[1024];
    snprintf( errormsg, sizeof(errormsg), "Failed to open directory '%s' with error: %s",
              sourcedir.c_str(), strerror(errno) );
    log_developer_error( __func__, errormsg );
#endif
    return files;
  }//if( couldnt open directory )

  struct dirent *dent = nullptr;
  while( (dent = readdir(dir)) && (files.size() < sm_ls_max_results) )
  {
    if( !strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..") )
      continue;

    const string path = append_path( sourcedir, dent->d_name );

    //Only stat when readdir couldnt tell us the type, or for symlinks.
    const bool isfile = (dent->d_type == DT_REG)
                        || (((dent->d_type == DT_LNK) || (dent->d_type == DT_UNKNOWN)) && is_file(path));

    if( isfile && (!match_fcn || match_fcn(path, user_data)) )
      files.push_back( path );
  }//while( dent )

  closedir( dir );

  return files;
}//ls_files_in_directory(...)


void load_file_data( const std::string &filename, std::vector<uint8_t> &data )
{
  data.clear();

  //A directory opens fine on some platforms, and a FIFO would block.
  if( !is_file( filename ) )
    throw runtime_error( "cannot open file " + filename + ", it is not a regular file" );

  ifstream stream( filename.c_str(), ios::in | ios::binary );
  if( !stream )
    throw runtime_error( "cannot open file " + filename );

  stream.seekg( 0, ios::end );
  const streamoff size = stream.tellg();
  stream.seekg( 0, ios::beg );

  if( size < 0 )
    throw runtime_error( "cannot determine size of file " + filename );

  data.resize( static_cast<size_t>(size) );
  if( size > 0 )
    stream.read( reinterpret_cast<char *>(&data[0]), static_cast<streamsize>(size) );

  if( !stream || (stream.gcount() != static_cast<streamsize>(size)) )
  {
    data.clear();
    throw runtime_error( "failed to read all " + std::to_string(size) + " bytes of " + filename );
  }
}//void load_file_data(...)
}//namespace IcpDat
