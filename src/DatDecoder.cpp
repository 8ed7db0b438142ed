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
#include <map>
#include <cmath>
#include <ctime>
#include <cstdio>
#include <limits>
#include <string>
#include <vector>
#include <algorithm>

#include "IcpDat/DatError.h"
#include "IcpDat/DatFile.h"
#include "IcpDat/StringAlgo.h"
#include "IcpDat/DatDecoder.h"
#include "IcpDat/BinaryReader.h"

using namespace std;

/*
 DAT file layout; all words are little-endian uint32.

 Byte offset  Words  Description
 0x00         1      Format revision (see IcpDat::DatRevision)
 0x04         3      Unknown
 0x10         85     File header:
                       word 33  byte offset of the scan index
                       word 39  number of scans in the index
                       word 40  acquisition start, unix time
                     (revision 2 files do not use words 33 and 39)
 0x164        ...    Scans (revision 2: back to back until end of file,
                     revision 1: wherever the index says)

 Revision 1 scan index: at (header word 33) + 4, one word per scan giving the
 byte offset of the scan.

 Scan: a 47 word header, then tagged words until an end-of-scan tag.
   Scan header word  3,4,5  0xD, 0xE, 0xF (scan signature)
                     7      time delta
                     9      scan number, starting at 1
                     12     ACF (analog conversion factor)
                     18     time of previous scan
                     19     scan time, ms since acquisition start
                     31     EDAC (used to calculate accelerating voltage)
                     34     FCF (faraday conversion factor), revision 2
                     35     FCF, revision 1

 Tagged word: tag is the high 4 bits, value the low 28 bits.
   0xF  end of scan
   0x8  end of mass; value is the dwell duration
   0xC  B-scan (ignored)
   0xB  unknown (ignored)
   0x4  accelerating voltage; volts = EDAC * 1000 / value / 2^18
   0x3  channel time; only once per mass
   0x2  magnet mass; amu = value / 2^18
   0x1  reading; bits 24-27 flag, 20-23 detector (0 analog, 1 pulse,
        8 faraday), 16-19 exponent, 0-15 mantissa.  reading = mantissa << exponent
 */

namespace
{
  const size_t sm_header_offset = 0x10;
  const size_t sm_num_header_words = 85;
  const size_t sm_header_end = sm_header_offset + 4*sm_num_header_words;
  const size_t sm_num_scan_header_words = 47;
  const size_t sm_scan_header_size = 4*sm_num_scan_header_words;

  const size_t HDR_INDEX_OFFSET = 33;
  const size_t HDR_INDEX_LEN = 39;
  const size_t HDR_TIMESTAMP = 40;

  const size_t SCAN_SIGNATURE = 3;
  const size_t SCAN_NUMBER = 9;
  const size_t SCAN_ACF = 12;
  const size_t SCAN_TIME = 19;
  const size_t SCAN_EDAC = 31;
  const size_t SCAN_FCF_STREAMED = 34;
  const size_t SCAN_FCF_INDEXED = 35;

  const uint32_t KEY_EOS = 0xF;
  const uint32_t KEY_EOM = 0x8;
  const uint32_t KEY_BSCAN = 0xC;
  const uint32_t KEY_B = 0xB;
  const uint32_t KEY_VOLT = 0x4;
  const uint32_t KEY_TIME = 0x3;
  const uint32_t KEY_MASS = 0x2;
  const uint32_t KEY_DATA = 0x1;

  const uint32_t DATA_ANALOG = 0x0;
  const uint32_t DATA_PULSE = 0x1;
  const uint32_t DATA_FARADAY = 0x8;

  const double sm_mass_scale = 262144.0;  //2^18

  //Order the detector modes are labelled and written in.
  enum DetectorMode
  {
    PulseMode = 0,
    AnalogMode = 1,
    FaradayMode = 2,
    NumDetectorModes = 3
  };

  const char sm_mode_suffix[NumDetectorModes] = { 'p', 'a', 'f' };


  struct Reading
  {
    double value;
    bool flagged;
  };


  struct MassBlock
  {
    MassBlock() : info(), has_channel_time( false ) {}

    IcpDat::MassInfo info;
    bool has_channel_time;
    std::vector<Reading> readings[NumDetectorModes];
  };


  struct ParsedScan
  {
    ParsedScan() : offset( 0 ), end_pos( 0 ), usable( true ) {}

    uint32_t number() const { return words[SCAN_NUMBER]; }

    size_t offset;
    size_t end_pos;  //Just after the end-of-scan tag, or where parsing stopped if not usable
    bool usable;
    std::string problem;
    std::vector<uint32_t> words;
    std::vector<MassBlock> masses;
  };


  //Identifies a channel as (mass index, detector mode, repeat); sorts in
  //  acquisition order.
  struct ChannelKey
  {
    size_t mass;
    int mode;
    size_t repeat;

    bool operator<( const ChannelKey &rhs ) const
    {
      if( mass != rhs.mass )
        return mass < rhs.mass;
      if( mode != rhs.mode )
        return mode < rhs.mode;
      return repeat < rhs.repeat;
    }
  };//struct ChannelKey


  std::string hex_str( const uint32_t value )
  {
    char buffer[32];
    snprintf( buffer, sizeof(buffer), "0x%x", static_cast<unsigned int>(value) );
    return buffer;
  }


  bool is_scan_header_at( IcpDat::BinaryReader &reader, const size_t offset,
                          const uint32_t expected_number )
  {
    if( (offset + sm_scan_header_size) > reader.size() )
      return false;

    reader.seek( offset + 4*SCAN_SIGNATURE );
    if( reader.read<uint32_t>() != 0xD
        || reader.read<uint32_t>() != 0xE
        || reader.read<uint32_t>() != 0xF )
      return false;

    reader.seek( offset + 4*SCAN_NUMBER );
    return (reader.read<uint32_t>() == expected_number);
  }//is_scan_header_at(...)


  /** Searches forward, one byte at a time, for the header of the scan with the
   expected number.  Returns std::string::npos if there is none.
   */
  size_t find_scan_header( IcpDat::BinaryReader &reader, size_t offset,
                           const uint32_t expected_number )
  {
    for( ; (offset + sm_scan_header_size) <= reader.size(); ++offset )
    {
      if( is_scan_header_at( reader, offset, expected_number ) )
        return offset;
    }

    return std::string::npos;
  }//find_scan_header(...)


  /** Parses the scan starting at offset.

   Throws DatErrorCode::Truncated if the data ends before the end-of-scan tag,
   and DatErrorCode::MalformedRecord if there is no scan signature or a mass
   block is impossible.  An unknown tag or detector type gives a scan that is
   not usable, with the problem described.
   */
  ParsedScan parse_scan( IcpDat::BinaryReader &reader, const size_t offset )
  {
    using IcpDat::DatError;
    using IcpDat::DatErrorCode;

    ParsedScan scan;
    scan.offset = offset;
    scan.words.resize( sm_num_scan_header_words );

    reader.seek( offset );
    for( size_t i = 0; i < sm_num_scan_header_words; ++i )
      scan.words[i] = reader.read<uint32_t>();

    if( scan.words[SCAN_SIGNATURE] != 0xD
        || scan.words[SCAN_SIGNATURE+1] != 0xE
        || scan.words[SCAN_SIGNATURE+2] != 0xF )
      throw DatError( DatErrorCode::MalformedRecord,
                      "No scan signature at offset " + std::to_string(offset) );

    const uint32_t edac = scan.words[SCAN_EDAC];
    const string scanstr = "scan " + std::to_string( scan.number() );

    MassBlock mass;

    while( true )
    {
      const size_t word_pos = reader.position();
      const uint32_t word = reader.read<uint32_t>();
      const uint32_t key = (word >> 28);
      const uint32_t value = (word & 0x0FFFFFFF);

      switch( key )
      {
        case KEY_EOS:
          scan.end_pos = reader.position();
          return scan;

        case KEY_EOM:
          mass.info.duration = value;
          scan.masses.push_back( mass );
          mass = MassBlock();
          break;

        case KEY_BSCAN:
        case KEY_B:
          break;

        case KEY_VOLT:
          if( !value )
            throw DatError( DatErrorCode::MalformedRecord,
                            "Zero accelerating voltage divisor in " + scanstr
                            + " at offset " + std::to_string(word_pos) );
          mass.info.accelerating_voltage = edac * 1000.0 / value / sm_mass_scale;
          break;

        case KEY_TIME:
          if( mass.has_channel_time )
            throw DatError( DatErrorCode::MalformedRecord,
                            "Channel time given twice for mass "
                            + std::to_string(scan.masses.size() + 1) + " of " + scanstr );
          mass.has_channel_time = true;
          mass.info.channel_time = value;
          break;

        case KEY_MASS:
          mass.info.magnet_mass = value / sm_mass_scale;
          break;

        case KEY_DATA:
        {
          const uint32_t flag = (value >> 24) & 0xF;
          const uint32_t type = (value >> 20) & 0xF;
          const uint32_t exponent = (value >> 16) & 0xF;
          const uint64_t mantissa = (value & 0xFFFF);

          Reading reading;
          reading.value = static_cast<double>( mantissa << exponent );
          reading.flagged = (flag != 0);

          switch( type )
          {
            case DATA_PULSE:   mass.readings[PulseMode].push_back( reading );   break;
            case DATA_ANALOG:  mass.readings[AnalogMode].push_back( reading );  break;
            case DATA_FARADAY: mass.readings[FaradayMode].push_back( reading ); break;
            default:
              scan.usable = false;
              scan.problem = "unknown data type " + hex_str(type) + " at offset " + std::to_string(word_pos);
              scan.end_pos = reader.position();
              return scan;
          }//switch( type )
          break;
        }//case KEY_DATA:

        default:
          scan.usable = false;
          scan.problem = "unknown tag " + hex_str(key) + " at offset " + std::to_string(word_pos);
          scan.end_pos = reader.position();
          return scan;
      }//switch( key )
    }//while( true )
  }//ParsedScan parse_scan(...)


  std::string skipped_scan_msg( const ParsedScan &scan )
  {
    return "Skipped scan " + std::to_string(scan.number()) + ": " + scan.problem;
  }


  void read_indexed_scans( IcpDat::BinaryReader &reader, IcpDat::RunHeader &header,
                           std::vector<ParsedScan> &scans, std::vector<std::string> &warnings )
  {
    using IcpDat::DatError;
    using IcpDat::DatErrorCode;

    const uint64_t index_pos = static_cast<uint64_t>( header.raw_words[HDR_INDEX_OFFSET] ) + 4;
    const uint32_t nscans = header.declared_scan_count;

    //The index follows the scans, so a file cut off anywhere loses the index.
    if( index_pos > reader.size() )
      throw DatError( DatErrorCode::Truncated,
                      "Scan index offset " + std::to_string(index_pos) + " is past the end of the "
                      + std::to_string(reader.size()) + " byte file" );

    reader.seek( static_cast<size_t>(index_pos) );

    if( (4*static_cast<uint64_t>(nscans)) > reader.remaining() )
      throw DatError( DatErrorCode::Truncated,
                      "Header declares " + std::to_string(nscans) + " scans, but the file ends after "
                      + std::to_string(reader.remaining()/4) + " scan index entries" );

    vector<uint32_t> offsets( nscans );
    for( uint32_t i = 0; i < nscans; ++i )
      offsets[i] = reader.read<uint32_t>();

    for( uint32_t i = 0; i < nscans; ++i )
    {
      if( offsets[i] >= reader.size() )
        throw DatError( DatErrorCode::Truncated,
                        "Scan index entry " + std::to_string(i) + " points to offset "
                        + std::to_string(offsets[i]) + ", past the end of the file" );

#if(PERFORM_DEVELOPER_CHECKS)
      if( i && (offsets[i] <= offsets[i-1]) )
      {
        const string msg = "Scan index offsets not increasing at entry " + std::to_string(i);
        log_developer_error( __func__, msg.c_str() );
      }
#endif

      const ParsedScan scan = parse_scan( reader, offsets[i] );

      if( !scan.usable )
      {
        warnings.push_back( skipped_scan_msg(scan) );
        continue;
      }

      if( scan.number() != (i + 1) )
        warnings.push_back( "Scan index entry " + std::to_string(i+1) + " has scan number "
                            + std::to_string(scan.number()) );

      scans.push_back( scan );
    }//for( uint32_t i = 0; i < nscans; ++i )
  }//read_indexed_scans(...)


  void read_streamed_scans( IcpDat::BinaryReader &reader, std::vector<ParsedScan> &scans,
                            std::vector<std::string> &warnings )
  {
    using IcpDat::DatError;
    using IcpDat::DatErrorCode;

    size_t pos = sm_header_end;
    uint32_t expected = 1;

    while( pos < reader.size() )
    {
      ParsedScan scan;

      try
      {
        scan = parse_scan( reader, pos );
      }catch( DatError &e )
      {
        if( e.code() != DatErrorCode::Truncated )
          throw;

        throw DatError( DatErrorCode::Truncated,
                        "Incomplete scan record at offset " + std::to_string(pos)
                        + " (expected scan " + std::to_string(expected) + "): " + e.what() );
      }//try / catch

      if( scan.number() != expected )
        throw DatError( DatErrorCode::MalformedRecord,
                        "Expected scan " + std::to_string(expected) + " at offset "
                        + std::to_string(pos) + ", but found scan " + std::to_string(scan.number()) );
      ++expected;

      if( scan.usable )
      {
        pos = scan.end_pos;
        scans.push_back( scan );
        continue;
      }

      //The length of an unusable scan is unknown, so look for the next one.
      warnings.push_back( skipped_scan_msg(scan) );

      const size_t next = find_scan_header( reader, scan.end_pos, expected );
      if( next == std::string::npos )
      {
        warnings.push_back( "No scan found after skipped scan " + std::to_string(scan.number())
                            + "; the last " + std::to_string(reader.size() - scan.end_pos)
                            + " bytes of the file were ignored" );
        break;
      }

      pos = next;
    }//while( pos < reader.size() )
  }//read_streamed_scans(...)


  void recover_scans( IcpDat::BinaryReader &reader, const IcpDat::RunHeader &header,
                      std::vector<ParsedScan> &scans, std::vector<std::string> &warnings )
  {
    using IcpDat::DatError;
    using IcpDat::DatErrorCode;

    size_t pos = sm_header_end;
    uint32_t expected = 1;

    while( true )
    {
      const size_t offset = find_scan_header( reader, pos, expected );
      if( offset == std::string::npos )
        break;

      ParsedScan scan;
      try
      {
        scan = parse_scan( reader, offset );
      }catch( DatError &e )
      {
        if( e.code() == DatErrorCode::Truncated )
        {
          warnings.push_back( "Ignored incomplete scan " + std::to_string(expected)
                              + " at offset " + std::to_string(offset) );
          break;
        }

        if( e.code() != DatErrorCode::MalformedRecord )
          throw;

        warnings.push_back( "Skipped scan " + std::to_string(expected) + ": " + e.what() );
        pos = offset + 1;
        ++expected;
        continue;
      }//try / catch

      ++expected;
      pos = scan.end_pos;

      if( scan.usable )
        scans.push_back( scan );
      else
        warnings.push_back( skipped_scan_msg(scan) );
    }//while( true )

    const uint32_t nfound = expected - 1;
    if( header.has_declared_scan_count && (nfound != header.declared_scan_count) )
      warnings.push_back( "Recovered " + std::to_string(nfound) + " scans, but the header declares "
                          + std::to_string(header.declared_scan_count) );
  }//recover_scans(...)


  IcpDat::Run build_run( const std::string &source_identity, IcpDat::RunHeader &header,
                         const IcpDat::DatRevision revision,
                         const std::vector<ParsedScan> &parsed,
                         const IcpDat::DecodeOptions &options,
                         std::vector<std::string> &warnings )
  {
    using IcpDat::DatError;
    using IcpDat::DatErrorCode;

    size_t nmasses = 0;
    for( const ParsedScan &scan : parsed )
      nmasses = std::max( nmasses, scan.masses.size() );

    const vector<string> &elements = options.element_names;
    if( !elements.empty() && (elements.size() != nmasses) )
      throw DatError( DatErrorCode::MalformedHeader,
                      std::to_string(elements.size()) + " element names given, but the file has "
                      + std::to_string(nmasses) + " masses" );

    vector<string> bases( nmasses );
    for( size_t j = 0; j < nmasses; ++j )
    {
      bases[j] = elements.empty() ? IcpDat::default_mass_label(j) : IcpDat::trim_copy( elements[j] );
      if( bases[j].empty() )
        throw DatError( DatErrorCode::MalformedHeader,
                        "Element name " + std::to_string(j+1) + " is empty" );
    }//for( size_t j = 0; j < nmasses; ++j )

    header.masses.resize( nmasses );
    vector<bool> have_mass_info( nmasses, false );

    set<ChannelKey> keys;
    for( const ParsedScan &scan : parsed )
    {
      for( size_t j = 0; j < scan.masses.size(); ++j )
      {
        const MassBlock &mass = scan.masses[j];

        if( !have_mass_info[j] )
        {
          have_mass_info[j] = true;
          header.masses[j] = mass.info;
        }

        for( int mode = 0; mode < NumDetectorModes; ++mode )
        {
          for( size_t k = 0; k < mass.readings[mode].size(); ++k )
          {
            const ChannelKey key = { j, mode, k };
            keys.insert( key );
          }
        }
      }//for( loop over masses )
    }//for( const ParsedScan &scan : parsed )

    for( size_t j = 0; j < nmasses; ++j )
      header.masses[j].label = bases[j];

    if( keys.empty() )
      throw DatError( DatErrorCode::MalformedHeader,
                      parsed.empty() ? string("File contains no scans, so has no channels")
                                     : string("Scans contain no readings, so the file has no channels") );

    vector<string> channels;
    map<ChannelKey,size_t> channel_pos;
    set<string> labels_seen;
    for( const ChannelKey &key : keys )
    {
      string label = bases[key.mass] + sm_mode_suffix[key.mode];
      if( key.repeat )
        label += "_" + std::to_string( key.repeat + 1 );

      if( !labels_seen.insert( label ).second )
        throw DatError( DatErrorCode::MalformedHeader,
                        "Channel '" + label + "' occurs more than once" );

      channel_pos[key] = channels.size();
      channels.push_back( label );
    }//for( const ChannelKey &key : keys )

    const size_t fcf_word = (revision == IcpDat::DatRevision::Indexed) ? SCAN_FCF_INDEXED
                                                                        : SCAN_FCF_STREAMED;
    const double nan = std::numeric_limits<double>::quiet_NaN();

    size_t nincomplete = 0;
    vector<IcpDat::ScanRecord> records;
    records.reserve( parsed.size() );

    for( size_t i = 0; i < parsed.size(); ++i )
    {
      const ParsedScan &scan = parsed[i];

      vector<double> values( channels.size(), nan );
      vector<bool> flagged( channels.size(), false );
      bool has_faraday = false;

      for( size_t j = 0; j < scan.masses.size(); ++j )
      {
        const MassBlock &mass = scan.masses[j];
        for( int mode = 0; mode < NumDetectorModes; ++mode )
        {
          for( size_t k = 0; k < mass.readings[mode].size(); ++k )
          {
            const ChannelKey key = { j, mode, k };
            const size_t col = channel_pos[key];
            values[col] = mass.readings[mode][k].value;
            flagged[col] = mass.readings[mode][k].flagged;
          }
        }

        has_faraday = has_faraday || !mass.readings[FaradayMode].empty();
      }//for( loop over masses )

      for( const double v : values )
      {
        if( std::isnan(v) )
        {
          ++nincomplete;
          break;
        }
      }

      const double timestamp = header.acquisition_time + scan.words[SCAN_TIME] / 1000.0;
      const double acf = scan.words[SCAN_ACF];
      const double fcf = has_faraday ? static_cast<double>(scan.words[fcf_word]) : nan;

      if( !records.empty() && (timestamp < records.back().timestamp()) )
        warnings.push_back( "Scan " + std::to_string(scan.number()) + " time ("
                            + IcpDat::print_round_trip(timestamp) + ") is before the previous scan ("
                            + IcpDat::print_round_trip(records.back().timestamp()) + ")" );

      records.emplace_back( records.size(), timestamp, values, flagged, scan.number(), acf, fcf );
    }//for( size_t i = 0; i < parsed.size(); ++i )

    if( nincomplete )
      warnings.push_back( std::to_string(nincomplete) + " of " + std::to_string(records.size())
                          + " scans are missing readings for some channels" );

    return IcpDat::Run( source_identity, header, channels, records, warnings );
  }//build_run(...)
}//namespace


namespace IcpDat
{
DecodeOptions::DecodeOptions()
  : element_names(),
    recover_scans( false )
{
}


std::string default_mass_label( const size_t mass_index )
{
  char buffer[32];
  snprintf( buffer, sizeof(buffer), "Mass%02u", static_cast<unsigned int>(mass_index + 1) );
  return buffer;
}


Run decode_dat( const std::vector<uint8_t> &bytes,
                const std::string &source_identity,
                const DecodeOptions &options )
{
  BinaryReader reader( bytes );
  RunHeader header;
  vector<string> warnings;

  if( reader.size() < 4 )
    throw DatError( DatErrorCode::Truncated,
                    "File is " + std::to_string(reader.size()) + " bytes, too short for a revision marker" );

  header.revision = reader.read<uint32_t>();

  if( header.revision == 0 )
    throw DatError( DatErrorCode::MalformedHeader, "File has no format revision marker" );

  if( header.revision != static_cast<uint32_t>(DatRevision::Indexed)
      && header.revision != static_cast<uint32_t>(DatRevision::Streamed) )
    throw DatError( DatErrorCode::UnsupportedVersion,
                    "Format revision " + std::to_string(header.revision) + " is not supported" );

  const DatRevision revision = static_cast<DatRevision>( header.revision );

  if( reader.size() < sm_header_end )
    throw DatError( DatErrorCode::Truncated,
                    "File is " + std::to_string(reader.size()) + " bytes, but the header is "
                    + std::to_string(sm_header_end) + " bytes" );

  reader.seek( sm_header_offset );
  header.raw_words.resize( sm_num_header_words );
  for( size_t i = 0; i < sm_num_header_words; ++i )
    header.raw_words[i] = reader.read<uint32_t>();

  header.acquisition_time = header.raw_words[HDR_TIMESTAMP];
  header.start_time = boost::posix_time::from_time_t( static_cast<std::time_t>(header.acquisition_time) );

  if( revision == DatRevision::Indexed )
  {
    header.has_declared_scan_count = true;
    header.declared_scan_count = header.raw_words[HDR_INDEX_LEN];
  }

  vector<ParsedScan> scans;

  if( options.recover_scans )
    recover_scans( reader, header, scans, warnings );
  else if( revision == DatRevision::Indexed )
    read_indexed_scans( reader, header, scans, warnings );
  else
    read_streamed_scans( reader, scans, warnings );

  return build_run( source_identity, header, revision, scans, options, warnings );
}//Run decode_dat(...)
}//namespace IcpDat
