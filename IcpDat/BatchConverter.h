#ifndef IcpDat_BatchConverter_h
#define IcpDat_BatchConverter_h
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

#include "IcpDat/DatFile.h"
#include "IcpDat/DatError.h"
#include "IcpDat/DatDecoder.h"
#include "IcpDat/TableWriter.h"

/** Converting a set of DAT files to CSV text, without writing anything to
 disk: the caller gets the paths to write to and the text to write.

 Example use:
 \code{.cpp}
 const std::vector<std::string> paths = IcpDat::expand_input_paths( args );
 const IcpDat::ConversionResult result = IcpDat::convert_dat_files( paths );
 for( const IcpDat::OutputFile &output : result.outputs )
 {
   std::string written;
   if( !IcpDat::write_new_file( output.base, output.suffix, output.directory,
                                output.contents, written ) )
     std::cerr << "Failed to write " << output.path << std::endl;
 }
 \endcode
 */
namespace IcpDat
{
struct ConvertOptions
{
  ConvertOptions();

  DecodeOptions decode;
  WriteOptions write;

  /** Order the runs by their acquisition start time rather than the order
   the paths were given in.  Affects the order of the outputs and of the rows
   of the combined table.
   */
  bool order_by_acquisition_time;

  /** Use the element names from each file's FIN2 sidecar, if it has one and
   DecodeOptions::element_names is empty.
   */
  bool use_element_lists;

  /** Maximum number of files to decode at once; zero means one per CPU
   core.
   */
  size_t num_threads;
};//struct ConvertOptions


/** One file to be written. */
struct OutputFile
{
  /** Full path the file should be written to; equal to
   append_path(directory, base + suffix) or a "-N" variant of it.
   */
  std::string path;

  std::string directory;
  std::string base;
  std::string suffix;

  /** Text to write. */
  std::string contents;

  /** Source identities of the runs in this output. */
  std::vector<std::string> sources;
};//struct OutputFile


/** An input file that could not be converted. */
struct FileFailure
{
  std::string path;
  DatErrorCode code;
  std::string message;
};//struct FileFailure


/** A data quality problem found in an input file that was converted. */
struct FileWarning
{
  std::string path;
  std::string message;
};//struct FileWarning


struct ConversionResult
{
  ConversionResult();

  /** Successfully decoded runs, in output order. */
  std::vector<std::shared_ptr<const Run>> runs;

  /** One output per decoded run, in the same order as #runs, then the
   combined output if there is one.
   */
  std::vector<OutputFile> outputs;

  /** Inputs that failed, in input order. */
  std::vector<FileFailure> failures;

  std::vector<FileWarning> warnings;

  /** True if the combined output was produced. */
  bool has_combined;
};//struct ConversionResult


/** Decodes each of the paths and produces the per-file and combined CSV text.

 Each input gets its own output, "<base>.csv" in the input's directory.  If
 more than one path is given, and at least two decode, a combined table of
 all decoded runs is also produced, named "<base of first path>combined.csv"
 in the first path's directory.  Output names never collide with existing
 files or with each other.

 A file that fails to load or decode is reported in
 ConversionResult::failures, and does not stop the others.

 Files are decoded in parallel; the result does not depend on the number of
 threads.
 */
ConversionResult convert_dat_files( const std::vector<std::string> &paths,
                                    const ConvertOptions &options = ConvertOptions() );


/** Replaces each directory in args with the ".dat" files (case insensitive)
 in it, sorted by name; other arguments are kept as is, in order.
 */
std::vector<std::string> expand_input_paths( const std::vector<std::string> &args );
}//namespace IcpDat

#endif //IcpDat_BatchConverter_h
