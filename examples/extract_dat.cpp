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
#include <cstdlib>
#include <iostream>

#include "IcpDat/DatError.h"
#include "IcpDat/OutputNamer.h"
#include "IcpDat/BatchConverter.h"

using namespace std;

// Converts DAT files to CSV files next to them; see print_usage() below.

namespace
{
  void print_usage( const char *exe, std::ostream &strm )
  {
    strm << "Usage: " << exe << " [options] <file or directory> [...]\n"
         << "\tConverts each DAT file to a CSV file in the same directory, and if\n"
         << "\tmore than one file is given, also writes a combined CSV file.\n"
         << "\tDirectories are replaced by the .dat files in them.\n"
         << "\tExisting files are never overwritten; \"-1\", \"-2\", ... are\n"
         << "\tappended to the name instead.\n\n"
         << "Options:\n"
         << "  -c, --comments       add a comment line with the file and start time before each run\n"
         << "  -r, --recover        ignore the scan index, and search the file for scans\n"
         << "  -t, --time-order     order the files by acquisition time, not command line order\n"
         << "  -d, --delimiter=X    field delimiter; a single character, or \"tab\" (default ',')\n"
         << "  --no-scan-columns    only write the channel columns\n"
         << "  -v, --version        print the version and exit\n"
         << "  -h, --help           print this message and exit\n"
         << "\tex: " << exe << " -c run1.dat run2.dat\n";
  }//print_usage(...)


  bool parse_delimiter( const string &arg, char &delim )
  {
    if( arg == "tab" || arg == "\\t" || arg == "\t" )
    {
      delim = '\t';
      return true;
    }

    if( arg.size() != 1 || arg == "\n" || arg == "\r" || arg == "\"" )
      return false;

    delim = arg[0];
    return true;
  }//parse_delimiter(...)
}//namespace


int main( int argc, char **argv )
{
  IcpDat::ConvertOptions options;
  vector<string> args;

  for( int i = 1; i < argc; ++i )
  {
    const string arg = argv[i];

    if( arg == "-h" || arg == "--help" )
    {
      print_usage( argv[0], cout );
      return EXIT_SUCCESS;
    }else if( arg == "-v" || arg == "--version" )
    {
      cout << "extract_dat " << IcpDat_VERSION_STR << endl;
      return EXIT_SUCCESS;
    }else if( arg == "-c" || arg == "--comments" )
    {
      options.write.comments = true;
    }else if( arg == "-r" || arg == "--recover" )
    {
      options.decode.recover_scans = true;
    }else if( arg == "-t" || arg == "--time-order" )
    {
      options.order_by_acquisition_time = true;
    }else if( arg == "--no-scan-columns" )
    {
      options.write.scan_columns = false;
    }else if( arg == "-d" || arg.compare( 0, 12, "--delimiter=" ) == 0 )
    {
      string value;
      if( arg == "-d" )
      {
        if( (i + 1) >= argc )
        {
          cerr << "Option -d requires a value." << endl;
          print_usage( argv[0], cerr );
          return 1;
        }
        value = argv[++i];
      }else
      {
        value = arg.substr( 12 );
      }

      if( !parse_delimiter( value, options.write.delimiter ) )
      {
        cerr << "Invalid delimiter '" << value << "'." << endl;
        return 1;
      }
    }else if( arg == "--" )
    {
      for( ++i; i < argc; ++i )
        args.push_back( argv[i] );
    }else if( arg.size() > 1 && arg[0] == '-' )
    {
      cerr << "Unknown option '" << arg << "'." << endl;
      print_usage( argv[0], cerr );
      return 1;
    }else
    {
      args.push_back( arg );
    }
  }//for( loop over command line arguments )

  if( args.empty() )
  {
    print_usage( argv[0], cerr );
    return 1;
  }

  const vector<string> paths = IcpDat::expand_input_paths( args );
  if( paths.empty() )
  {
    cerr << "No DAT files found." << endl;
    return 2;
  }

  IcpDat::ConversionResult result;
  try
  {
    result = IcpDat::convert_dat_files( paths, options );
  }catch( std::exception &e )
  {
    cerr << "Conversion failed: " << e.what() << endl;
    return 2;
  }

  bool all_ok = result.failures.empty();

  for( const IcpDat::FileFailure &failure : result.failures )
    cerr << "Failed to convert '" << failure.path << "' (" << IcpDat::to_str(failure.code)
         << "): " << failure.message << endl;

  for( const IcpDat::FileWarning &warning : result.warnings )
    cerr << "Warning, '" << warning.path << "': " << warning.message << endl;

  for( const IcpDat::OutputFile &output : result.outputs )
  {
    string written;
    if( !IcpDat::write_new_file( output.base, output.suffix, output.directory,
                                 output.contents, written ) )
    {
      cerr << "Failed to write '" << output.path << "'" << endl;
      all_ok = false;
      continue;
    }

    cout << "Wrote '" << written << "'" << endl;
  }//for( loop over outputs )

  return all_ok ? EXIT_SUCCESS : 2;
}//main
