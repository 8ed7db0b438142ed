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
#include <cerrno>
#include <cstdio>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

#include "IcpDat/Filesystem.h"
#include "IcpDat/OutputNamer.h"

using namespace std;

namespace
{
  std::string candidate_path( const std::string &base, const std::string &suffix,
                              const std::string &directory, const size_t n )
  {
    if( !n )
      return IcpDat::append_path( directory, base + suffix );
    return IcpDat::append_path( directory, base + "-" + std::to_string(n) + suffix );
  }


  //Unlike IcpDat::is_file(), a broken symbolic link counts as existing.
  bool path_exists( const std::string &path )
  {
    struct stat statbuf;
    return (lstat( path.c_str(), &statbuf ) == 0);
  }


  bool write_all( const int fd, const std::string &contents )
  {
    const char *data = contents.data();
    size_t nleft = contents.size();

    while( nleft )
    {
      const ssize_t nwritten = write( fd, data, nleft );
      if( nwritten < 0 )
      {
        if( errno == EINTR )
          continue;
        return false;
      }

      data += nwritten;
      nleft -= static_cast<size_t>( nwritten );
    }//while( nleft )

    return true;
  }//write_all(...)
}//namespace


namespace IcpDat
{
std::string name_for( const std::string &base, const std::string &suffix,
                      const std::string &directory,
                      const std::set<std::string> *reserved )
{
  for( size_t n = 0; true; ++n )
  {
    const string path = candidate_path( base, suffix, directory, n );
    if( !path_exists( path ) && (!reserved || !reserved->count( path )) )
      return path;
  }
}//std::string name_for(...)


std::string per_run_output_path( const std::string &input_path,
                                 const std::set<std::string> *reserved )
{
  return name_for( filename_stem( input_path ), sm_output_suffix,
                   parent_path( input_path ), reserved );
}


std::string combined_output_path( const std::string &first_input_path,
                                  const std::set<std::string> *reserved )
{
  return name_for( filename_stem( first_input_path ) + sm_combined_tag, sm_output_suffix,
                   parent_path( first_input_path ), reserved );
}


bool write_new_file( const std::string &base, const std::string &suffix,
                     const std::string &directory, const std::string &contents,
                     std::string &written_path )
{
  written_path.clear();

  for( size_t n = 0; true; ++n )
  {
    const string path = candidate_path( base, suffix, directory, n );

    const int fd = open( path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644 );
    if( fd < 0 )
    {
      if( errno == EEXIST )
        continue;

#if(PERFORM_DEVELOPER_CHECKS)
      const string msg = "Failed to create '" + path + "': " + strerror(errno);
      log_developer_error( __func__, msg.c_str() );
#endif
      return false;
    }//if( fd < 0 )

    const bool wrote = write_all( fd, contents );
    const bool closed = (close( fd ) == 0);

    if( !wrote || !closed )
    {
      unlink( path.c_str() );
      return false;
    }

    written_path = path;
    return true;
  }//for( size_t n = 0; true; ++n )
}//bool write_new_file(...)
}//namespace IcpDat
