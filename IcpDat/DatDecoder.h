#ifndef IcpDat_DatDecoder_h
#define IcpDat_DatDecoder_h
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

#include "IcpDat/DatFile.h"
#include "IcpDat/DatError.h"

namespace IcpDat
{
/** Format revisions the decoder understands; the revision is the first
 little-endian 32 bit word of the file.
 */
enum class DatRevision : uint32_t
{
  /** Header declares the number of scans and where the scan index is; each
   index entry is the byte offset of one scan.
   */
  Indexed = 1,

  /** Scans follow the header back to back until the end of the file. */
  Streamed = 2
};//enum class DatRevision


struct DecodeOptions
{
  DecodeOptions();

  /** Element (isotope) names of the acquired masses, in acquisition order; if
   empty, masses are named "Mass01", "Mass02", ...  If not empty, there must
   be exactly one name per acquired mass.
   */
  std::vector<std::string> element_names;

  /** Ignore the scan index, and instead search the file, byte by byte, for
   scan headers with consecutive scan numbers.  For files whose index is
   damaged.
   */
  bool recover_scans;
};//struct DecodeOptions


/** Decodes the contents of a DAT file.

 \param bytes The entire contents of the file.
 \param source_identity The path of the file; stored in the returned Run and
        used in messages.
 \param options See #DecodeOptions.

 Throws #DatError with code:
 - #DatErrorCode::Truncated if the data ends before the header, the scan
   index, or a scan is complete (including a partial scan at the end of a
   streamed file, and a scan index or index entry past the end of the data),
 - #DatErrorCode::MalformedHeader if there is no revision marker, no channels,
   duplicate channel labels, or the element names do not match the masses,
 - #DatErrorCode::MalformedRecord if a scan is structurally impossible,
 - #DatErrorCode::UnsupportedVersion for an unknown revision.

 Scans with unknown tags or data types are skipped, and a decrease in scan
 time is tolerated; both are noted in Run::parse_warnings().
 */
Run decode_dat( const std::vector<uint8_t> &bytes,
                const std::string &source_identity,
                const DecodeOptions &options = DecodeOptions() );

/** Returns the default label of the zero-based mass index; ex. 0 -> "Mass01". */
std::string default_mass_label( const size_t mass_index );
}//namespace IcpDat

#endif //IcpDat_DatDecoder_h
