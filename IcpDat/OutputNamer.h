#ifndef IcpDat_OutputNamer_h
#define IcpDat_OutputNamer_h
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

/** Choosing the names of output files so existing files are never
 overwritten.

 For base "run1" and suffix ".csv" the candidates, in order, are "run1.csv",
 "run1-1.csv", "run1-2.csv", ...
 */
namespace IcpDat
{
  /** Suffix of the combined output file name; ex. "run1combined.csv". */
  static const char * const sm_combined_tag = "combined";

  /** Suffix (extension) of all output files. */
  static const char * const sm_output_suffix = ".csv";

  /** Returns the first candidate path in directory that does not currently
   exist, and is not in reserved (if non-null).

   The path is only a candidate: nothing is created or reserved, so another
   process could create it before the caller does.  See #write_new_file.
   */
  std::string name_for( const std::string &base, const std::string &suffix,
                        const std::string &directory,
                        const std::set<std::string> *reserved = nullptr );

  /** Returns the output path for a DAT file: its base name with a ".csv"
   suffix, in the same directory; ex. "/data/run1.dat" -> "/data/run1.csv".
   */
  std::string per_run_output_path( const std::string &input_path,
                                   const std::set<std::string> *reserved = nullptr );

  /** Returns the path of the combined output of several DAT files, based on
   the first of them; ex. "/data/run1.dat" -> "/data/run1combined.csv".
   */
  std::string combined_output_path( const std::string &first_input_path,
                                    const std::set<std::string> *reserved = nullptr );

  /** Creates a new file, with the first free name according to #name_for, and
   writes contents to it.  The file is created with O_CREAT|O_EXCL, so if
   another process creates a file with the same name first, the next name is
   tried instead of overwriting it.

   \param written_path Set to the path of the created file on success.
   \returns true if the file was created and completely written.  On failure
            no partially written file is left behind.
   */
  bool write_new_file( const std::string &base, const std::string &suffix,
                       const std::string &directory, const std::string &contents,
                       std::string &written_path );
}//namespace IcpDat

#endif //IcpDat_OutputNamer_h
