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

#include <cmath>
#include <string>
#include <vector>
#include <sstream>
#include <stdexcept>
#include <functional>

#include "IcpDat/DatFile.h"
#include "IcpDat/StringAlgo.h"
#include "IcpDat/TableWriter.h"
#include "IcpDat/SchemaReconciler.h"

using namespace std;

namespace
{
  void write_comment( std::ostream &output, const IcpDat::ReconciledSource &source,
                      const IcpDat::WriteOptions &options )
  {
    output << "# " << source.source_identity << " " << source.acquisition_time
           << " " << boost::posix_time::to_iso_extended_string( source.start_time )
           << options.line_ending;
  }//write_comment(...)


  std::string value_str( const double value, const bool flagged,
                         const IcpDat::WriteOptions &options )
  {
    if( std::isnan(value) )
      return options.missing_value;

    if( !flagged )
      return IcpDat::print_round_trip( value );

    if( options.mark_flagged )
      return IcpDat::print_round_trip( value ) + "*";

    return IcpDat::print_round_trip( -value );
  }//value_str(...)


  bool write_table( std::ostream &output, const IcpDat::ReconciledTable &table,
                    const IcpDat::WriteOptions &options, const bool file_column )
  {
    const char delim = options.delimiter;
    const string &endline = options.line_ending;
    const bool scan_columns = options.scan_columns;
    const bool fcf_column = scan_columns && table.has_faraday;

    if( options.comments && !table.sources.empty() )
      write_comment( output, table.sources[0], options );

    //Header row
    vector<string> headers;
    if( scan_columns )
    {
      if( file_column )
        headers.push_back( "File" );
      headers.push_back( "Scan" );
      headers.push_back( "Time" );
      headers.push_back( "ACF" );
      if( fcf_column )
        headers.push_back( "FCF" );
    }//if( scan_columns )

    headers.insert( headers.end(), table.columns.begin(), table.columns.end() );

    for( size_t i = 0; i < headers.size(); ++i )
      output << (i ? string(1,delim) : string()) << IcpDat::quote_field( headers[i], delim );
    output << endline;

    size_t next_source = 1;

    for( size_t rowindex = 0; rowindex < table.rows.size(); ++rowindex )
    {
      if( options.comments )
      {
        while( (next_source < table.sources.size())
               && (table.sources[next_source].first_row <= rowindex) )
        {
          write_comment( output, table.sources[next_source], options );
          ++next_source;
        }
      }//if( options.comments )

      const IcpDat::ReconciledRow &row = table.rows[rowindex];

      string line;
      if( scan_columns )
      {
        if( file_column )
          line += IcpDat::quote_field( row.source_identity, delim ) + delim;

        line += std::to_string( row.scan_number );
        line += delim;
        line += IcpDat::print_round_trip( row.timestamp );
        line += delim;
        line += IcpDat::print_round_trip( row.acf );

        if( fcf_column )
        {
          line += delim;
          line += std::isnan(row.fcf) ? options.missing_value : IcpDat::print_round_trip( row.fcf );
        }
      }//if( scan_columns )

      for( size_t i = 0; i < row.values.size(); ++i )
      {
        if( i || scan_columns )
          line += delim;
        line += IcpDat::quote_field( value_str( row.values[i], row.flagged[i], options ), delim );
      }

      output << line << endline;
    }//for( loop over rows )

    //Runs without any scans still get their comment line.
    if( options.comments )
    {
      for( ; next_source < table.sources.size(); ++next_source )
        write_comment( output, table.sources[next_source], options );
    }

    return !output.bad();
  }//write_table(...)
}//namespace


namespace IcpDat
{
WriteOptions::WriteOptions()
  : scan_columns( true ),
    mark_flagged( true ),
    comments( false ),
    delimiter( ',' ),
    missing_value(),
    line_ending( "\r\n" )
{
}


std::string quote_field( const std::string &field, const char delimiter )
{
  if( field.find_first_of( string(1,delimiter) + "\"\r\n" ) == string::npos )
    return field;

  string answer = "\"";
  for( const char c : field )
  {
    if( c == '"' )
      answer += '"';
    answer += c;
  }
  answer += "\"";

  return answer;
}//std::string quote_field(...)


bool write_csv( std::ostream &output, const Run &run, const WriteOptions &options )
{
  const vector<std::reference_wrapper<const Run>> runs( 1, std::cref(run) );
  return write_table( output, reconcile( runs ), options, false );
}


bool write_csv( std::ostream &output, const ReconciledTable &table, const WriteOptions &options )
{
  return write_table( output, table, options, true );
}


std::string write_csv( const Run &run, const WriteOptions &options )
{
  stringstream strm;
  if( !write_csv( strm, run, options ) )
    throw std::runtime_error( "Failed to write CSV of " + run.source_identity() );
  return strm.str();
}


std::string write_csv( const ReconciledTable &table, const WriteOptions &options )
{
  stringstream strm;
  if( !write_csv( strm, table, options ) )
    throw std::runtime_error( "Failed to write combined CSV" );
  return strm.str();
}
}//namespace IcpDat
