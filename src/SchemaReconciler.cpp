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

#include <map>
#include <cmath>
#include <limits>
#include <string>
#include <vector>
#include <utility>
#include <stdexcept>
#include <functional>

#include "IcpDat/DatFile.h"
#include "IcpDat/SchemaReconciler.h"

using namespace std;

namespace IcpDat
{
ReconciledTable::ReconciledTable()
  : columns(),
    rows(),
    sources(),
    has_faraday( false )
{
}


ReconciledTable reconcile( const std::vector<std::reference_wrapper<const Run>> &runs )
{
  ReconciledTable table;

  map<string,size_t> column_pos;
  size_t nrows = 0;

  for( const Run &run : runs )
  {
    for( const string &label : run.channels() )
    {
      if( column_pos.insert( make_pair( label, table.columns.size() ) ).second )
        table.columns.push_back( label );
    }

    nrows += run.num_scans();
    table.has_faraday = table.has_faraday || run.has_faraday();
  }//for( const Run &run : runs )

  const size_t ncolumns = table.columns.size();
  const double nan = std::numeric_limits<double>::quiet_NaN();

  table.rows.reserve( nrows );
  table.sources.reserve( runs.size() );

  for( const Run &run : runs )
  {
    //Position in table.columns of each of the run's channels.
    const vector<string> &channels = run.channels();
    vector<size_t> mapping( channels.size() );
    for( size_t i = 0; i < channels.size(); ++i )
      mapping[i] = column_pos[channels[i]];

    ReconciledSource source;
    source.source_identity = run.source_identity();
    source.acquisition_time = run.header().acquisition_time;
    source.start_time = run.header().start_time;
    source.first_row = table.rows.size();
    source.num_rows = run.num_scans();
    table.sources.push_back( source );

    for( const ScanRecord &scan : run.scans() )
    {
      ReconciledRow row;
      row.source_identity = run.source_identity();
      row.scan_index = scan.index();
      row.timestamp = scan.timestamp();
      row.scan_number = scan.number();
      row.acf = scan.acf();
      row.fcf = scan.fcf();
      row.values.resize( ncolumns, nan );
      row.flagged.resize( ncolumns, false );

      const vector<double> &values = scan.values();
      const vector<bool> &flagged = scan.flagged();
      for( size_t i = 0; i < values.size(); ++i )
      {
        row.values[mapping[i]] = values[i];
        row.flagged[mapping[i]] = flagged[i];
      }

      table.rows.push_back( std::move(row) );
    }//for( loop over scans )
  }//for( const Run &run : runs )

#if(PERFORM_DEVELOPER_CHECKS)
  if( table.rows.size() != nrows )
  {
    const string msg = "Reconciled table has " + std::to_string(table.rows.size())
                       + " rows, but runs have " + std::to_string(nrows) + " scans";
    log_developer_error( __func__, msg.c_str() );
  }
#endif

  return table;
}//ReconciledTable reconcile( const std::vector<std::reference_wrapper<const Run>> &runs )


ReconciledTable reconcile( const std::vector<std::shared_ptr<const Run>> &runs )
{
  vector<std::reference_wrapper<const Run>> refs;
  refs.reserve( runs.size() );

  for( size_t i = 0; i < runs.size(); ++i )
  {
    if( !runs[i] )
      throw std::invalid_argument( "reconcile: run " + std::to_string(i) + " is null" );
    refs.push_back( std::cref( *runs[i] ) );
  }

  return reconcile( refs );
}//ReconciledTable reconcile( const std::vector<std::shared_ptr<const Run>> &runs )
}//namespace IcpDat
