#ifndef IcpDat_ParseUtils_h
#define IcpDat_ParseUtils_h
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
#include <istream>

/** Text parsing helpers that dont fit in other sections of code; mostly for
 the sidecar files the instrument software writes next to each DAT file.
 */
namespace  IcpDat
{
  /** \brief Gets a line from the input stream that may be terminated with
   either UNIX, old Mac, or Windows EOL characters.

   Like std::getline, the returned stream evaluates false once a read hits
   the end of the stream without reading a line terminator; a final line
   without a terminator is still placed in t.
  */
  std::istream &safe_get_line( std::istream &is, std::string &t );


  /** Same as other variant of #safe_get_line, except allows specifying the
   maximum number of bytes to read; specifying zero means no limit.  If the
   limit is hit, any line terminator immediately following is consumed.
   */
  std::istream &safe_get_line( std::istream &is, std::string &t, const size_t maxlength );


  /** The line (1-based) of a FIN2 method file that lists the acquired
   elements/isotopes.
   */
  static const size_t sm_fin2_element_line = 8;


  /** Reads the element (isotope) names out of a FIN2 method file.

   The names are on line #sm_fin2_element_line, comma separated, with the
   first field being a row label that is discarded.  Each name is trimmed, and
   trailing empty names are dropped (so "Elements,Li7,Be9,,," gives
   {"Li7","Be9"}).  Empty names between non-empty ones are kept, so the decoder
   can reject them.

   Returns an empty vector if the stream has fewer lines than required.
   */
  std::vector<std::string> parse_element_list( std::istream &input );


  /** Returns the path of the FIN2 sidecar for a DAT file; ex.
   "/data/run1.dat" -> "/data/run1.FIN2".
   */
  std::string element_list_path( const std::string &dat_path );


  /** Loads the element list from the FIN2 sidecar of the specified DAT file.

   A missing or unreadable sidecar is not an error; an empty vector is
   returned in that case.
   */
  std::vector<std::string> load_element_list( const std::string &dat_path );
}//namespace  IcpDat

#endif //IcpDat_ParseUtils_h
