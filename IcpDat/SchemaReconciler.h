#ifndef IcpDat_SchemaReconciler_h
#define IcpDat_SchemaReconciler_h
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

#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <functional>

#include "IcpDat/DatFile.h"

namespace IcpDat
{
/** One scan of one run, with its values placed in the columns of a
 #ReconciledTable.
 */
struct ReconciledRow
{
  std::string source_identity;
  size_t scan_index;
  double timestamp;
  uint32_t scan_number;
  double acf;
  double fcf;

  /** One value per ReconciledTable::columns; NaN where the source run does
   not have the channel (or did not report it for this scan).
   */
  std::vector<double> values;

  /** Same size as values. */
  std::vector<bool> flagged;
};//struct ReconciledRow


/** Where the rows of one run are in a #ReconciledTable. */
struct ReconciledSource
{
  std::string source_identity;
  uint32_t acquisition_time;
  boost::posix_time::ptime start_time;
  size_t first_row;
  size_t num_rows;
};//struct ReconciledSource


/** Scans of several runs with a common set of columns. */
struct ReconciledTable
{
  ReconciledTable();

  /** Union of the runs' channels, in order of first appearance. */
  std::vector<std::string> columns;

  /** One row per scan; all rows of the first run, then all of the second,
   etc.
   */
  std::vector<ReconciledRow> rows;

  /** One entry per input run, in input order. */
  std::vector<ReconciledSource> sources;

  /** True if any source run has faraday readings. */
  bool has_faraday;
};//struct ReconciledTable


/** Builds the combined table of the runs, in the order given.

 Columns are the union of the runs' channel labels, in the order each label
 is first seen going through the runs in order; labels are compared exactly
 (case sensitive, no trimming), so "Li7p" and "li7p" are different columns.
 Runs are not modified.

 The result depends only on the runs and their order.

 Throws std::invalid_argument if a run pointer is null.
 */
ReconciledTable reconcile( const std::vector<std::shared_ptr<const Run>> &runs );

/** Same as other variant, but for runs not held by shared pointers. */
ReconciledTable reconcile( const std::vector<std::reference_wrapper<const Run>> &runs );
}//namespace IcpDat

#endif //IcpDat_SchemaReconciler_h
