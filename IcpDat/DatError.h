#ifndef IcpDat_DatError_h
#define IcpDat_DatError_h
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
#include <stdexcept>

namespace IcpDat
{
/** The kinds of failure decoding a DAT file can result in.

 All of these are per-file; when converting a batch of files, a file failing
 with any of these codes does not stop the other files from being converted.
 */
enum class DatErrorCode : int
{
  /** The buffer ended before a field, record, or the declared number of
   records was complete.
   */
  Truncated,

  /** The file header is structurally invalid or logically inconsistent (no
   revision marker, no channels, duplicate channel identifiers, element list
   not matching the number of acquired masses, ...).
   */
  MalformedHeader,

  /** A scan record is structurally impossible (bad scan signature where the
   index says a scan starts, an attribute given twice for one mass, ...).
   */
  MalformedRecord,

  /** The format revision is not one this library knows how to decode. */
  UnsupportedVersion,

  /** A seek went beyond the end of the buffer. */
  OutOfRange,

  /** The file could not be read from disk; only produced by the batch
   conversion layer, never by the decoder itself.
   */
  FileIO
};//enum class DatErrorCode


/** Returns a short, human readable, name for the error code; ex. "Truncated". */
const char *to_str( const DatErrorCode code );


/** Exception thrown by #BinaryReader and #decode_dat. */
class DatError : public std::runtime_error
{
public:
  DatError( const DatErrorCode code, const std::string &msg );

  DatErrorCode code() const noexcept;

protected:
  DatErrorCode m_code;
};//class DatError

}//namespace IcpDat

#endif //IcpDat_DatError_h
