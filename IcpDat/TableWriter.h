#ifndef IcpDat_TableWriter_h
#define IcpDat_TableWriter_h
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
#include <ostream>

namespace IcpDat
{
class Run;
struct ReconciledTable;


/** Options for writing delimited text. */
struct WriteOptions
{
  WriteOptions();

  /** Start each row with the "Scan", "Time", and "ACF" columns, plus "FCF" if
   any scan has faraday readings; the combined table additionally starts with
   a "File" column.  If false, the header row is exactly the channel labels.
   */
  bool scan_columns;

  /** Write flagged readings with a trailing '*'.  If false, flagged readings
   are written as negative numbers instead.
   */
  bool mark_flagged;

  /** Before the rows of each run, write a line "# <file> <unix time> <ISO time>".
   For the first run this line comes before the header row.
   */
  bool comments;

  /** Field separator; default ','. */
  char delimiter;

  /** Written for a channel a scan has no reading for; default empty. */
  std::string missing_value;

  /** Default "\r\n". */
  std::string line_ending;
};//struct WriteOptions


/** Writes the run as delimited text: one header row, then one row per scan,
 with channels in the run's order.  Numbers are written with the fewest
 digits that read back as the same value.

 Returns if the stream is still good.
 */
bool write_csv( std::ostream &output, const Run &run,
                const WriteOptions &options = WriteOptions() );

/** Same as other variant, but for the combined table of several runs. */
bool write_csv( std::ostream &output, const ReconciledTable &table,
                const WriteOptions &options = WriteOptions() );

/** Returns the delimited text of the run. */
std::string write_csv( const Run &run, const WriteOptions &options = WriteOptions() );

/** Returns the delimited text of the combined table. */
std::string write_csv( const ReconciledTable &table, const WriteOptions &options = WriteOptions() );

/** Returns field, quoted if it contains the delimiter, a double quote, or a
 line break; double quotes in it are then doubled.
 */
std::string quote_field( const std::string &field, const char delimiter );
}//namespace IcpDat

#endif //IcpDat_TableWriter_h
