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
#include <cmath>
#include <string>
#include <vector>
#include <stdexcept>

#if(PERFORM_DEVELOPER_CHECKS)
#include <mutex>
#include <fstream>
#include <iostream>
#endif

#include "IcpDat/DatFile.h"

using namespace std;


#if(PERFORM_DEVELOPER_CHECKS)
void log_developer_error( const char *location, const char *error )
{
  static std::recursive_mutex s_dev_error_log_mutex;
  static ofstream s_dev_error_log( "developer_errors.log", ios::app | ios::out );

  std::unique_lock<std::recursive_mutex> loc( s_dev_error_log_mutex );

  const boost::posix_time::ptime time = boost::posix_time::second_clock::local_time();
  const string timestr = boost::posix_time::to_iso_extended_string( time );

  s_dev_error_log << timestr << ": " << location << endl << error << "\n\n" << endl;
  cerr << timestr << ": " << location << endl << error << "\n\n" << endl;
}//void log_developer_error( const char *location, const char *error )
#endif //#if(PERFORM_DEVELOPER_CHECKS)


namespace IcpDat
{
MassInfo::MassInfo()
  : label(),
    magnet_mass( std::numeric_limits<double>::quiet_NaN() ),
    accelerating_voltage( std::numeric_limits<double>::quiet_NaN() ),
    channel_time( 0 ),
    duration( 0 )
{
}


RunHeader::RunHeader()
  : revision( 0 ),
    acquisition_time( 0 ),
    start_time( boost::posix_time::from_time_t( 0 ) ),
    has_declared_scan_count( false ),
    declared_scan_count( 0 ),
    masses(),
    raw_words()
{
}


ScanRecord::ScanRecord( const size_t index, const double timestamp,
                        const std::vector<double> &values,
                        const std::vector<bool> &flagged,
                        const uint32_t number,
                        const double acf,
                        const double fcf )
  : index_( index ),
    timestamp_( timestamp ),
    values_( values ),
    flagged_( flagged ),
    number_( number ),
    acf_( acf ),
    fcf_( fcf )
{
  if( flagged_.empty() )
    flagged_.resize( values_.size(), false );

  if( flagged_.size() != values_.size() )
    throw std::invalid_argument( "ScanRecord: " + std::to_string(flagged_.size())
                                 + " flags given for " + std::to_string(values_.size()) + " values" );
}//ScanRecord constructor


size_t ScanRecord::index() const
{
  return index_;
}


double ScanRecord::timestamp() const
{
  return timestamp_;
}


const std::vector<double> &ScanRecord::values() const
{
  return values_;
}


const std::vector<bool> &ScanRecord::flagged() const
{
  return flagged_;
}


uint32_t ScanRecord::number() const
{
  return number_;
}


double ScanRecord::acf() const
{
  return acf_;
}


double ScanRecord::fcf() const
{
  return fcf_;
}


size_t ScanRecord::num_values() const
{
  return values_.size();
}


Run::Run( const std::string &source_identity,
          const RunHeader &header,
          const std::vector<std::string> &channels,
          const std::vector<ScanRecord> &scans,
          const std::vector<std::string> &parse_warnings )
  : source_identity_( source_identity ),
    header_( header ),
    channels_( channels ),
    scans_( scans ),
    parse_warnings_( parse_warnings )
{
  set<string> seen;
  for( const string &label : channels_ )
  {
    if( !seen.insert( label ).second )
      throw std::invalid_argument( "Run: channel '" + label + "' is given more than once" );
  }

  for( const ScanRecord &scan : scans_ )
  {
    if( scan.num_values() != channels_.size() )
      throw std::invalid_argument( "Run: scan " + std::to_string(scan.index()) + " has "
                                   + std::to_string(scan.num_values()) + " values for "
                                   + std::to_string(channels_.size()) + " channels" );
  }
}//Run constructor


const std::string &Run::source_identity() const
{
  return source_identity_;
}


const RunHeader &Run::header() const
{
  return header_;
}


const std::vector<std::string> &Run::channels() const
{
  return channels_;
}


const std::vector<ScanRecord> &Run::scans() const
{
  return scans_;
}


size_t Run::num_channels() const
{
  return channels_.size();
}


size_t Run::num_scans() const
{
  return scans_.size();
}


size_t Run::channel_index( const std::string &label ) const
{
  for( size_t i = 0; i < channels_.size(); ++i )
  {
    if( channels_[i] == label )
      return i;
  }

  return std::string::npos;
}//size_t channel_index( const std::string &label ) const


bool Run::has_faraday() const
{
  for( const ScanRecord &scan : scans_ )
  {
    if( !std::isnan( scan.fcf() ) )
      return true;
  }

  return false;
}//bool has_faraday() const


const std::vector<std::string> &Run::parse_warnings() const
{
  return parse_warnings_;
}
}//namespace IcpDat
