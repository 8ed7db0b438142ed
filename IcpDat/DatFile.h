#ifndef IcpDat_DatFile_h
#define IcpDat_DatFile_h
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
#include <limits>
#include <cstdint>

#ifndef BOOST_DATE_TIME_NO_LIB
#define BOOST_DATE_TIME_NO_LIB
#endif
#include <boost/date_time/posix_time/posix_time.hpp>

/*
 The in-memory model of a decoded DAT file: a Run holds the header
 information, the ordered list of channels, and the ordered scans.  Runs are
 created by IcpDat::decode_dat(...) and are not modified afterwards, so the
 same Run can be written to its own CSV file and to a combined table.

 A "channel" is one detector reading of one acquired mass; ex. "Li7p" is the
 pulse counting reading of the mass labelled "Li7", and "Mass02a" the analog
 reading of the second mass when no element names are known.
 */

namespace IcpDat
{
/** Information the instrument gives about one acquired mass.  Taken from the
 first scan of the run that contains the mass.
 */
struct MassInfo
{
  MassInfo();

  /** Element/isotope name from the FIN2 file, or "MassNN". */
  std::string label;

  /** Magnet mass in amu; NaN if the instrument did not give one. */
  double magnet_mass;

  /** Accelerating voltage in volts; NaN if not given. */
  double accelerating_voltage;

  /** Raw channel time value; zero if not given. */
  uint32_t channel_time;

  /** Raw dwell duration value, from the end-of-mass marker. */
  uint32_t duration;
};//struct MassInfo


/** Header (acquisition) information of a run. */
struct RunHeader
{
  RunHeader();

  /** The format revision word at the start of the file. */
  uint32_t revision;

  /** Acquisition start in seconds since the unix epoch (UTC). */
  uint32_t acquisition_time;

  /** Same as #acquisition_time, for convenience. */
  boost::posix_time::ptime start_time;

  /** Whether the revision declares the number of scans in the header. */
  bool has_declared_scan_count;

  /** Number of scans the header declares; only valid if
   #has_declared_scan_count.
   */
  uint32_t declared_scan_count;

  /** The acquired masses, in acquisition order. */
  std::vector<MassInfo> masses;

  /** The 85 header words, as read from the file. */
  std::vector<uint32_t> raw_words;
};//struct RunHeader


/** One timestamped measurement over all channels of a run. */
class ScanRecord
{
public:
  /** Throws std::invalid_argument if flagged is not empty and not the same
   size as values.  An empty flagged vector means no readings are flagged.
   */
  ScanRecord( const size_t index, const double timestamp,
              const std::vector<double> &values,
              const std::vector<bool> &flagged,
              const uint32_t number = 0,
              const double acf = 0.0,
              const double fcf = std::numeric_limits<double>::quiet_NaN() );

  //index(): zero based position of the scan within its run.
  size_t index() const;

  //timestamp(): seconds since the unix epoch; acquisition start plus the
  //  scan time.
  double timestamp() const;

  //values(): one reading per channel of the owning run.  A channel the scan
  //  has no reading for is NaN.
  const std::vector<double> &values() const;

  //flagged(): same size as values(); true where the instrument flagged the
  //  reading.
  const std::vector<bool> &flagged() const;

  //number(): the scan number the instrument gave (starts at 1).
  uint32_t number() const;

  //acf(): the analog conversion factor of the scan.
  double acf() const;

  //fcf(): the faraday conversion factor; NaN if the scan has no faraday
  //  readings.
  double fcf() const;

  size_t num_values() const;

protected:
  size_t index_;
  double timestamp_;
  std::vector<double> values_;
  std::vector<bool> flagged_;
  uint32_t number_;
  double acf_;
  double fcf_;
};//class ScanRecord


/** One decoded DAT file. */
class Run
{
public:
  /** Throws std::invalid_argument if any scan does not have exactly one value
   per channel, or if a channel label is repeated.
   */
  Run( const std::string &source_identity,
       const RunHeader &header,
       const std::vector<std::string> &channels,
       const std::vector<ScanRecord> &scans,
       const std::vector<std::string> &parse_warnings = std::vector<std::string>() );

  //source_identity(): the path of the file the run was decoded from.
  const std::string &source_identity() const;

  const RunHeader &header() const;

  //channels(): channel labels, in acquisition order.
  const std::vector<std::string> &channels() const;

  const std::vector<ScanRecord> &scans() const;

  size_t num_channels() const;
  size_t num_scans() const;

  //channel_index(): returns the index of the channel with exactly the
  //  specified label, or std::string::npos if the run does not have it.
  size_t channel_index( const std::string &label ) const;

  //has_faraday(): returns true if any scan has a faraday conversion factor.
  bool has_faraday() const;

  //parse_warnings(): problems with the data that did not prevent decoding;
  //  ex. skipped scans, or a scan timestamp earlier than the one before it.
  const std::vector<std::string> &parse_warnings() const;

protected:
  std::string source_identity_;
  RunHeader header_;
  std::vector<std::string> channels_;
  std::vector<ScanRecord> scans_;
  std::vector<std::string> parse_warnings_;
};//class Run

}//namespace IcpDat

#endif //IcpDat_DatFile_h
