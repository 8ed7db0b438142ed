#ifndef IcpDat_Filesystem_h
#define IcpDat_Filesystem_h
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

/** Some functions for working with files and the filesystem, using POSIX
 calls rather than requiring boost::filesystem or C++17 <filesystem>.

 Only the functionality needed to locate DAT files, read them into memory,
 and place the CSV files next to them is provided.  All paths are UTF-8, and
 '/' is the path separator.
 */
namespace  IcpDat
{
  /** \brief Removes file from the filesystem, returning true if successful. */
  IcpDat_DLLEXPORT
  bool remove_file( const std::string &name );

  /** \brief Returns if the specified name corresponds to a file (or symlink
   to a file) that exists.
   */
  IcpDat_DLLEXPORT
  bool is_file( const std::string &name );

  /** \brief Returns if the specified name is a directory. */
  IcpDat_DLLEXPORT
  bool is_directory( const std::string &name );

  /** Creates the directory, returning 1 if created, -1 if it already
   existed, and 0 on failure.  Parent directories are not created.
   */
  IcpDat_DLLEXPORT
  int create_directory( const std::string &name );

  /** \brief Concatenates the two paths, putting exactly one separator between
   them; ex. append_path("/a/","/b.dat") -> "/a/b.dat".
   */
  IcpDat_DLLEXPORT
  std::string append_path( const std::string &base, const std::string &name );

  /** \brief Returns the filename of the path, including the extension.
   ex. "/path/to/run1.dat" -> "run1.dat", "/path/to/" -> "".
   */
  IcpDat_DLLEXPORT
  std::string filename( const std::string &path_and_name );

  /** \brief Returns the parent directory of the path.
   ex. "/path/to/run1.dat" -> "/path/to", "run1.dat" -> "".
   */
  IcpDat_DLLEXPORT
  std::string parent_path( const std::string &path );

  /** Returns the extension of the filename, including the leading period;
   ex. "/path/run1.dat" -> ".dat", "/path/run1" -> "".
   */
  IcpDat_DLLEXPORT
  std::string file_extension( const std::string &path );

  /** Returns the filename without its extension; ex. "/path/run1.dat" ->
   "run1", "/path/.hidden" -> "".
   */
  IcpDat_DLLEXPORT
  std::string filename_stem( const std::string &path );

  /** Returns the size of the file in bytes; zero if it does not exist or is
   a directory.
   */
  IcpDat_DLLEXPORT
  size_t file_size( const std::string &path );

  /** Returns the temporary directory of the system; checks the TMPDIR, TMP,
   TEMP, and TEMPDIR environment variables before falling back to "/tmp".
   */
  IcpDat_DLLEXPORT
  std::string temp_dir();

  /** Returns a path in directory whose filename is base followed by random
   hex digits.  The file is not created, and is not checked for existence.
   */
  IcpDat_DLLEXPORT
  std::string temp_file_name( std::string base, std::string directory );


  /** Limit on the number of files #ls_files_in_directory will return. */
  static const size_t sm_ls_max_results = 100000;

  /** Function signature for filtering which files are returned by
   #ls_files_in_directory.
   */
  typedef bool(*file_match_function_t)( const std::string &filename, void *userdata );

  /** Returns the regular files (or links to regular files) directly inside
   sourcedir whose filename ends with ending (case independent); an empty
   ending matches all files.  Subdirectories are not searched.

   Files are returned in the order the operating system lists them; callers
   that need a stable order must sort.
   */
  IcpDat_DLLEXPORT
  std::vector<std::string> ls_files_in_directory( const std::string &sourcedir,
                                                  const std::string &ending = "" );

  /** Same as other variant, but a file is returned only if match_fcn (if
   non-null) returns true for it.
   */
  IcpDat_DLLEXPORT
  std::vector<std::string> ls_files_in_directory( const std::string &sourcedir,
                                                  file_match_function_t match_fcn,
                                                  void *user_data );

  /** Reads the entire file into data.

   Throws std::runtime_error if the file is not a regular file (a directory
   or FIFO, for example), or can not be opened or fully read.
   */
  IcpDat_DLLEXPORT
  void load_file_data( const std::string &filename, std::vector<uint8_t> &data );
}//namespace  IcpDat

#endif //IcpDat_Filesystem_h
