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

#include "IcpDat/DatError.h"

using namespace std;

namespace IcpDat
{
const char *to_str( const DatErrorCode code )
{
  switch( code )
  {
    case DatErrorCode::Truncated:          return "Truncated";
    case DatErrorCode::MalformedHeader:    return "MalformedHeader";
    case DatErrorCode::MalformedRecord:    return "MalformedRecord";
    case DatErrorCode::UnsupportedVersion: return "UnsupportedVersion";
    case DatErrorCode::OutOfRange:         return "OutOfRange";
    case DatErrorCode::FileIO:             return "FileIO";
  }//switch( code )

  return "Unknown";
}//to_str( DatErrorCode )


DatError::DatError( const DatErrorCode code, const std::string &msg )
  : std::runtime_error( msg ),
    m_code( code )
{
}


DatErrorCode DatError::code() const noexcept
{
  return m_code;
}
}//namespace IcpDat
