#ifndef IcpDat_StringAlgo_h
#define IcpDat_StringAlgo_h
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


/** String-based functions used while decoding DAT files, reading their
 sidecar files, and writing CSV output.
 */
namespace  IcpDat
{
  /** \brief Removes leading and trailing whitespaces (ex, " \f\n\r\t\v") according to std::isspace. */
  IcpDat_DLLEXPORT
  void trim( std::string &str );

  /** \brief Removes leading and trailing whitespaces (" \f\n\r\t\v"). */
  IcpDat_DLLEXPORT
  std::string trim_copy( std::string str );

  /** \brief Case independent string comparison. Not UTF8 or locale aware. */
  IcpDat_DLLEXPORT
  bool iequals_ascii( const std::string &str, const std::string &test );

  /** \brief Returns if the input ends with the specified substr, case
   independent; is not UTF8 or locale aware.  An empty label never matches.
   */
  IcpDat_DLLEXPORT
  bool iends_with( const std::string &line, const std::string &label );

  /** \brief Splits an input string according to specified delimiters.

   Each delimiter ends a field, even if the field is empty (i.e., no delimiter
   compression), so ",a,,b," gives {"", "a", "", "b", ""}.

   \param results Where results of splitting are placed.  Will be cleared of
   any previous contents first.
   \param input input string to split.  An empty input gives zero results.
   \param delims Null terminated list of delimiters to split at.
   */
  IcpDat_DLLEXPORT
  void split_no_delim_compress( std::vector<std::string> &results,
                                const std::string &input, const char *delims );

  /** Parses a double from the input; leading and trailing whitespace is
   allowed, anything else must be part of the number.

   @returns true if the entire (trimmed) input was a valid number.
   */
  IcpDat_DLLEXPORT
  bool parse_double( const char *input, const size_t length, double &result );

  /** Gives the shortest decimal representation of value that parses back to
   exactly the same double.

   Integral values are printed without a decimal point or exponent, ex.
   "1536", "-12"; other values use the fewest significant digits (up to 17)
   that round trip, ex. "0.1", "1418066400.125", "2.5e-07".
   NaN gives "nan", and infinities "inf" and "-inf".
   */
  IcpDat_DLLEXPORT
  std::string print_round_trip( const double value );
}//namespace  IcpDat

#endif //IcpDat_StringAlgo_h
