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
#include <memory>
#include <string>
#include <vector>
#include <stdexcept>
#include <algorithm>

#include "IcpDat/DatFile.h"
#include "IcpDat/DatError.h"
#include "IcpDat/Filesystem.h"
#include "IcpDat/DatDecoder.h"
#include "IcpDat/ParseUtils.h"
#include "IcpDat/IcpDatAsync.h"
#include "IcpDat/TableWriter.h"
#include "IcpDat/OutputNamer.h"
#include "IcpDat/BatchConverter.h"
#include "IcpDat/SchemaReconciler.h"

using namespace std;

namespace
{
  struct DecodeSlot
  {
    DecodeSlot() : run(), failed( false ), failure() {}

    std::shared_ptr<const IcpDat::Run> run;
    bool failed;
    IcpDat::FileFailure failure;
  };//struct DecodeSlot


  void decode_one( const std::string &path, const IcpDat::ConvertOptions &options,
                   DecodeSlot &slot )
  {
    vector<uint8_t> data;

    try
    {
      IcpDat::load_file_data( path, data );
    }catch( std::exception &e )
    {
      slot.failed = true;
      slot.failure.path = path;
      slot.failure.code = IcpDat::DatErrorCode::FileIO;
      slot.failure.message = e.what();
      return;
    }//try / catch

    IcpDat::DecodeOptions decode = options.decode;
    if( options.use_element_lists && decode.element_names.empty() )
      decode.element_names = IcpDat::load_element_list( path );

    try
    {
      slot.run = std::make_shared<const IcpDat::Run>( IcpDat::decode_dat( data, path, decode ) );
    }catch( IcpDat::DatError &e )
    {
      slot.failed = true;
      slot.failure.path = path;
      slot.failure.code = e.code();
      slot.failure.message = e.what();
    }//try / catch
  }//decode_one(...)


  IcpDat::OutputFile make_output( const std::string &base, const std::string &directory,
                                  const std::set<std::string> &reserved )
  {
    IcpDat::OutputFile output;
    output.directory = directory;
    output.base = base;
    output.suffix = IcpDat::sm_output_suffix;
    output.path = IcpDat::name_for( output.base, output.suffix, output.directory, &reserved );
    return output;
  }//make_output(...)
}//namespace


namespace IcpDat
{
ConvertOptions::ConvertOptions()
  : decode(),
    write(),
    order_by_acquisition_time( false ),
    use_element_lists( true ),
    num_threads( 0 )
{
}


ConversionResult::ConversionResult()
  : runs(),
    outputs(),
    failures(),
    warnings(),
    has_combined( false )
{
}


ConversionResult convert_dat_files( const std::vector<std::string> &paths,
                                    const ConvertOptions &options )
{
  ConversionResult result;

  vector<DecodeSlot> slots( paths.size() );

  {//begin decode files
    IcpDatAsync::ThreadPool pool( options.num_threads );
    for( size_t i = 0; i < paths.size(); ++i )
    {
      const string &path = paths[i];
      DecodeSlot &slot = slots[i];
      pool.post( [&path,&options,&slot](){ decode_one( path, options, slot ); } );
    }
    pool.join();
  }//end decode files

  for( const DecodeSlot &slot : slots )
  {
    if( slot.failed )
      result.failures.push_back( slot.failure );
    else
      result.runs.push_back( slot.run );
  }

  if( options.order_by_acquisition_time )
  {
    std::stable_sort( result.runs.begin(), result.runs.end(),
      []( const std::shared_ptr<const Run> &lhs, const std::shared_ptr<const Run> &rhs ) -> bool {
        return lhs->header().acquisition_time < rhs->header().acquisition_time;
    } );
  }//if( options.order_by_acquisition_time )

  set<string> reserved;

  for( const std::shared_ptr<const Run> &run : result.runs )
  {
    const string &source = run->source_identity();

    for( const string &msg : run->parse_warnings() )
    {
      FileWarning warning;
      warning.path = source;
      warning.message = msg;
      result.warnings.push_back( warning );
    }

    OutputFile output = make_output( filename_stem(source), parent_path(source), reserved );
    output.contents = write_csv( *run, options.write );
    output.sources.push_back( source );

    reserved.insert( output.path );
    result.outputs.push_back( output );
  }//for( loop over runs )

  if( (paths.size() > 1) && (result.runs.size() >= 2) )
  {
    // Named after the first path given, even if that file failed to decode;
    //  when ordering by time, after the earliest run instead.
    const string &first = options.order_by_acquisition_time ? result.runs.front()->source_identity()
                                                            : paths.front();

    OutputFile output = make_output( filename_stem(first) + sm_combined_tag, parent_path(first), reserved );
    output.contents = write_csv( reconcile( result.runs ), options.write );
    for( const std::shared_ptr<const Run> &run : result.runs )
      output.sources.push_back( run->source_identity() );

    reserved.insert( output.path );
    result.outputs.push_back( output );
    result.has_combined = true;
  }//if( produce combined output )

  return result;
}//ConversionResult convert_dat_files(...)


std::vector<std::string> expand_input_paths( const std::vector<std::string> &args )
{
  vector<string> answer;

  for( const string &arg : args )
  {
    if( !is_directory( arg ) )
    {
      answer.push_back( arg );
      continue;
    }

    vector<string> files = ls_files_in_directory( arg, ".dat" );
    std::sort( files.begin(), files.end() );
    answer.insert( answer.end(), files.begin(), files.end() );
  }//for( const string &arg : args )

  return answer;
}//std::vector<std::string> expand_input_paths(...)
}//namespace IcpDat
