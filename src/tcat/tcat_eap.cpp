/*
 * Copyright (C) 2005-2009 by Pieter Palmers
 *
 * This file is part of FFADO
 * FFADO = Free Firewire (pro-)audio drivers for linux
 *
 * FFADO is based upon FreeBoB
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 2 of the License, or
 * (at your option) version 3 of the License.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#include "tcat_eap.h"

#include "libutil/SystemTimeSource.h"

#include <cstring>

namespace Tcat {

IMPL_DEBUG_MODULE( EAP, EAP, DEBUG_LEVEL_NORMAL );

const char*
adatModeToString( enum eAdatMode m )
{
    switch ( m ) {
    case eAM_Normal: return "Normal";
    case eAM_SMUX2:  return "SMUX2";
    case eAM_SMUX4:  return "SMUX4";
    case eAM_Auto:   return "Auto";
    default:         return "unknown";
    }
}

const char*
wordClockModeToString( enum eWordClockMode m )
{
    switch ( m ) {
    case eWCM_Normal: return "Normal";
    case eWCM_Low:    return "Low";
    case eWCM_Middle: return "Middle";
    case eWCM_High:   return "High";
    default:          return "unknown";
    }
}

enum eStatus
buildStandalone( const StandaloneParameters& params,
                 fb_quadlet_t quads[TCAT_EAP_STANDALONE_SIZE / 4] )
{
    if ( params.word_clock.numerator < 1 || params.word_clock.denominator < 1
         || params.word_clock.numerator > ( TCAT_EAP_STANDALONE_WC_NUM_MASK >> TCAT_EAP_STANDALONE_WC_NUM_SHIFT ) + 1 ) {
        return eS_InvalidArgument;
    }

    quads[TCAT_EAP_STANDALONE_CLOCK_SRC / 4] = params.clock_source & 0xff;
    quads[TCAT_EAP_STANDALONE_AES_HIGH_RATE / 4] = params.aes_high_rate ? 1 : 0;
    quads[TCAT_EAP_STANDALONE_ADAT_MODE / 4] = params.adat_mode;

    fb_quadlet_t wc = params.word_clock.mode & TCAT_EAP_STANDALONE_WC_MODE_MASK;
    wc |= ( (fb_quadlet_t)( params.word_clock.numerator - 1 ) << TCAT_EAP_STANDALONE_WC_NUM_SHIFT )
          & TCAT_EAP_STANDALONE_WC_NUM_MASK;
    wc |= ( (fb_quadlet_t)( params.word_clock.denominator - 1 ) << TCAT_EAP_STANDALONE_WC_DEN_SHIFT )
          & TCAT_EAP_STANDALONE_WC_DEN_MASK;
    quads[TCAT_EAP_STANDALONE_WORD_CLOCK / 4] = wc;

    quads[TCAT_EAP_STANDALONE_INTERNAL_RATE / 4] = params.internal_rate & 0xff;
    return eS_Ok;
}

void
parseStandalone( const fb_quadlet_t quads[TCAT_EAP_STANDALONE_SIZE / 4],
                 StandaloneParameters& params )
{
    params.clock_source = clockSourceFromCode( quads[TCAT_EAP_STANDALONE_CLOCK_SRC / 4] & 0xff );
    params.aes_high_rate = quads[TCAT_EAP_STANDALONE_AES_HIGH_RATE / 4] != 0;

    switch ( quads[TCAT_EAP_STANDALONE_ADAT_MODE / 4] ) {
    case 0x01: params.adat_mode = eAM_SMUX2; break;
    case 0x02: params.adat_mode = eAM_SMUX4; break;
    case 0x03: params.adat_mode = eAM_Auto; break;
    default:   params.adat_mode = eAM_Normal; break;
    }

    fb_quadlet_t wc = quads[TCAT_EAP_STANDALONE_WORD_CLOCK / 4];
    params.word_clock.mode = static_cast<enum eWordClockMode>( wc & TCAT_EAP_STANDALONE_WC_MODE_MASK );
    params.word_clock.numerator =
        1 + ( ( wc & TCAT_EAP_STANDALONE_WC_NUM_MASK ) >> TCAT_EAP_STANDALONE_WC_NUM_SHIFT );
    params.word_clock.denominator =
        1 + ( ( wc & TCAT_EAP_STANDALONE_WC_DEN_MASK ) >> TCAT_EAP_STANDALONE_WC_DEN_SHIFT );

    params.internal_rate = clockRateFromCode( quads[TCAT_EAP_STANDALONE_INTERNAL_RATE / 4] & 0xff );
}

EAP::EAP( Device& d )
    : m_device( d )
{
}

EAP::~EAP()
{
}

void
EAP::setVerboseLevel( int l )
{
    setDebugLevel( l );
}

bool
EAP::init()
{
    fb_quadlet_t regs[TCAT_EAP_SECTIONS_SIZE / 4];
    if ( !readRegBlock( eRT_Base, 0, regs, TCAT_EAP_SECTIONS_SIZE ) ) {
        debugError( "Could not read the EAP section table\n" );
        return false;
    }

    Section* sections[] = {
        &m_capability, &m_cmd, &m_mixer, &m_peak, &m_new_routing,
        &m_new_stream_cfg, &m_curr_cfg, &m_standalone, &m_app,
    };
    // offsets and sizes are returned in quadlets, but we use byte values
    for ( unsigned int i = 0; i < sizeof( sections ) / sizeof( sections[0] ); ++i ) {
        sections[i]->offset = regs[2 * i] * 4;
        sections[i]->size = regs[2 * i + 1] * 4;
    }

    // initialize the capability info
    fb_quadlet_t tmp;
    if ( !readReg( eRT_Capability, TCAT_EAP_CAPABILITY_ROUTER, &tmp ) ) {
        debugError( "Could not read router capabilities\n" );
        return false;
    }
    m_caps.router.is_exposed = ( tmp >> TCAT_EAP_CAP_ROUTER_EXPOSED ) & 0x01;
    m_caps.router.is_readonly = ( tmp >> TCAT_EAP_CAP_ROUTER_READONLY ) & 0x01;
    m_caps.router.is_storable = ( tmp >> TCAT_EAP_CAP_ROUTER_FLASHSTORED ) & 0x01;
    m_caps.router.maximum_entry_count = ( tmp >> TCAT_EAP_CAP_ROUTER_MAXROUTES ) & 0xFFFF;

    if ( !readReg( eRT_Capability, TCAT_EAP_CAPABILITY_MIXER, &tmp ) ) {
        debugError( "Could not read mixer capabilities\n" );
        return false;
    }
    m_caps.mixer.is_exposed = ( tmp >> TCAT_EAP_CAP_MIXER_EXPOSED ) & 0x01;
    m_caps.mixer.is_readonly = ( tmp >> TCAT_EAP_CAP_MIXER_READONLY ) & 0x01;
    m_caps.mixer.is_storable = ( tmp >> TCAT_EAP_CAP_MIXER_FLASHSTORED ) & 0x01;
    m_caps.mixer.input_device_id = ( tmp >> TCAT_EAP_CAP_MIXER_IN_DEV ) & 0x000F;
    m_caps.mixer.output_device_id = ( tmp >> TCAT_EAP_CAP_MIXER_OUT_DEV ) & 0x000F;
    m_caps.mixer.input_count = ( tmp >> TCAT_EAP_CAP_MIXER_INPUTS ) & 0x00FF;
    m_caps.mixer.output_count = ( tmp >> TCAT_EAP_CAP_MIXER_OUTPUTS ) & 0x00FF;

    if ( !readReg( eRT_Capability, TCAT_EAP_CAPABILITY_GENERAL, &tmp ) ) {
        debugError( "Could not read general capabilities\n" );
        return false;
    }
    m_caps.general.dynamic_stream_format = ( tmp >> TCAT_EAP_CAP_GENERAL_STRM_CFG_EN ) & 0x01;
    m_caps.general.storage_avail = ( tmp >> TCAT_EAP_CAP_GENERAL_FLASH_EN ) & 0x01;
    m_caps.general.peak_avail = ( tmp >> TCAT_EAP_CAP_GENERAL_PEAK_EN ) & 0x01;
    m_caps.general.max_tx_streams = ( tmp >> TCAT_EAP_CAP_GENERAL_MAX_TX_STREAM ) & 0x0F;
    m_caps.general.max_rx_streams = ( tmp >> TCAT_EAP_CAP_GENERAL_MAX_RX_STREAM ) & 0x0F;
    m_caps.general.stream_format_is_storable = ( tmp >> TCAT_EAP_CAP_GENERAL_STRM_CFG_FLS ) & 0x01;
    m_caps.general.raw_chip = ( tmp >> TCAT_EAP_CAP_GENERAL_CHIP ) & 0xFFFF;
    switch ( m_caps.general.raw_chip ) {
    case TCAT_EAP_CAP_GENERAL_CHIP_DICEII:
        m_caps.general.chip = eC_DiceII;
        break;
    case TCAT_EAP_CAP_GENERAL_CHIP_TCD2210:
        m_caps.general.chip = eC_Tcd2210;
        break;
    case TCAT_EAP_CAP_GENERAL_CHIP_TCD2220:
        m_caps.general.chip = eC_Tcd2220;
        break;
    default:
        m_caps.general.chip = eC_Reserved;
        break;
    }

    if ( m_caps.router.maximum_entry_count > TCAT_EAP_ROUTER_MAX_ENTRIES ) {
        debugWarning( "Router reports %u entries, limiting to %d\n",
                      m_caps.router.maximum_entry_count, TCAT_EAP_ROUTER_MAX_ENTRIES );
        m_caps.router.maximum_entry_count = TCAT_EAP_ROUTER_MAX_ENTRIES;
    }
    if ( m_caps.mixer.input_count > TCAT_EAP_MIXER_MAX_INPUTS ) {
        m_caps.mixer.input_count = TCAT_EAP_MIXER_MAX_INPUTS;
    }
    if ( m_caps.mixer.output_count > TCAT_EAP_MIXER_MAX_OUTPUTS ) {
        m_caps.mixer.output_count = TCAT_EAP_MIXER_MAX_OUTPUTS;
    }
    return true;
}

const Section&
EAP::getSection( enum eRegBase base ) const
{
    switch ( base ) {
    case eRT_Capability:   return m_capability;
    case eRT_Command:      return m_cmd;
    case eRT_Mixer:        return m_mixer;
    case eRT_Peak:         return m_peak;
    case eRT_NewRouting:   return m_new_routing;
    case eRT_NewStreamCfg: return m_new_stream_cfg;
    case eRT_CurrentCfg:   return m_curr_cfg;
    case eRT_Standalone:   return m_standalone;
    case eRT_Application:  return m_app;
    default:               return m_none;
    }
}

// EAP load/store operations

enum EAP::eWaitReturn
EAP::operationBusy()
{
    fb_quadlet_t tmp;
    if ( !readReg( eRT_Command, TCAT_EAP_COMMAND_OPCODE, &tmp ) ) {
        debugError( "Could not read opcode register\n" );
        return eWR_Error;
    }
    if ( ( tmp & TCAT_EAP_CMD_OPCODE_FLAG_LD_EXECUTE ) == TCAT_EAP_CMD_OPCODE_FLAG_LD_EXECUTE ) {
        return eWR_Busy;
    } else {
        return eWR_Done;
    }
}

enum EAP::eWaitReturn
EAP::waitForOperationEnd( int max_wait_time_ms )
{
    int max_waits = max_wait_time_ms;

    while ( max_waits-- ) {
        enum eWaitReturn retval = operationBusy();
        switch ( retval ) {
        case eWR_Busy:
            break; // not done yet, keep waiting
        case eWR_Done:
            return eWR_Done;
        case eWR_Error:
        case eWR_Timeout:
            debugError( "Error while waiting for operation to end. (%d)\n", retval );
            return eWR_Error;
        }
        Util::SystemTimeSource::SleepUsecRelative( 1000 );
    }
    return eWR_Timeout;
}

bool
EAP::commandHelper( fb_quadlet_t cmd )
{
    // check whether another command is still running
    if ( operationBusy() != eWR_Done ) {
        debugError( "Other operation in progress\n" );
        return false;
    }

    // execute the command
    if ( !writeReg( eRT_Command, TCAT_EAP_COMMAND_OPCODE, cmd ) ) {
        debugError( "Could not write opcode register\n" );
        return false;
    }

    // wait for the operation to end
    enum eWaitReturn retval = waitForOperationEnd();
    switch ( retval ) {
    case eWR_Done:
        break; // do nothing
    case eWR_Timeout:
        debugWarning( "Time-out while waiting for operation to end. (%d)\n", retval );
        return false;
    case eWR_Error:
    case eWR_Busy: // can't be returned
        debugError( "Error while waiting for operation to end. (%d)\n", retval );
        return false;
    }

    // check the return value
    if ( !readReg( eRT_Command, TCAT_EAP_COMMAND_RETVAL, &cmd ) ) {
        debugError( "Could not read return value register\n" );
        return false;
    }
    if ( cmd != 0 ) {
        debugWarning( "Command failed: 0x%08" PRIX32 "\n", cmd );
        return false;
    } else {
        debugOutput( DEBUG_LEVEL_VERBOSE, "Command successful\n" );
        return true;
    }
}

fb_quadlet_t
EAP::rateModeFlag( enum eRateMode mode )
{
    switch ( mode ) {
    case eRM_Mid:
        return TCAT_EAP_CMD_OPCODE_FLAG_LD_MID;
    case eRM_High:
        return TCAT_EAP_CMD_OPCODE_FLAG_LD_HIGH;
    default:
        return TCAT_EAP_CMD_OPCODE_FLAG_LD_LOW;
    }
}

bool
EAP::loadRouter( enum eRateMode mode )
{
    if ( m_caps.router.is_readonly ) {
        debugError( "Router configuration is immutable\n" );
        return false;
    }
    fb_quadlet_t cmd = TCAT_EAP_CMD_OPCODE_LD_ROUTER;
    cmd |= rateModeFlag( mode );
    cmd |= TCAT_EAP_CMD_OPCODE_FLAG_LD_EXECUTE;
    return commandHelper( cmd );
}

bool
EAP::loadStreamConfig( enum eRateMode mode )
{
    if ( !m_caps.general.dynamic_stream_format ) {
        debugError( "Stream format configuration is immutable\n" );
        return false;
    }
    fb_quadlet_t cmd = TCAT_EAP_CMD_OPCODE_LD_STRM_CFG;
    cmd |= rateModeFlag( mode );
    cmd |= TCAT_EAP_CMD_OPCODE_FLAG_LD_EXECUTE;
    return commandHelper( cmd );
}

bool
EAP::loadRouterStreamConfig( enum eRateMode mode )
{
    if ( m_caps.router.is_readonly && !m_caps.general.dynamic_stream_format ) {
        debugError( "Any configuration is immutable\n" );
        return false;
    }
    fb_quadlet_t cmd = TCAT_EAP_CMD_OPCODE_LD_RTR_STRM_CFG;
    cmd |= rateModeFlag( mode );
    cmd |= TCAT_EAP_CMD_OPCODE_FLAG_LD_EXECUTE;
    return commandHelper( cmd );
}

bool
EAP::loadFlashConfig()
{
    if ( !m_caps.general.storage_avail ) {
        debugError( "Storage is not available\n" );
        return false;
    }
    fb_quadlet_t cmd = TCAT_EAP_CMD_OPCODE_LD_FLASH_CFG;
    cmd |= TCAT_EAP_CMD_OPCODE_FLAG_LD_EXECUTE;
    return commandHelper( cmd );
}

bool
EAP::storeFlashConfig()
{
    if ( !m_caps.general.storage_avail ) {
        debugError( "Storage is not available\n" );
        return false;
    }
    fb_quadlet_t cmd = TCAT_EAP_CMD_OPCODE_ST_FLASH_CFG;
    cmd |= TCAT_EAP_CMD_OPCODE_FLAG_LD_EXECUTE;
    return commandHelper( cmd );
}

// router, peak and stream configuration

bool
EAP::readEntries( enum eRegBase base, unsigned offset, RouterEntryVector& entries )
{
    fb_quadlet_t nb_routes;
    if ( !readReg( base, offset + TCAT_EAP_ROUTER_NB_ENTRIES, &nb_routes ) ) {
        debugError( "Failed to read number of entries\n" );
        return false;
    }
    if ( nb_routes > m_caps.router.maximum_entry_count ) {
        debugError( "Unexpected number of entries: %u > %u\n",
                    nb_routes, m_caps.router.maximum_entry_count );
        return false;
    }

    entries.clear();
    if ( nb_routes == 0 ) {
        debugOutput( DEBUG_LEVEL_VERBOSE, "No routes found. Base %d, offset 0x%x\n", base, offset );
        return true;
    }

    std::vector<fb_quadlet_t> tmp_entries( nb_routes );
    if ( !readRegBlock( base, offset + TCAT_EAP_ROUTER_ENTRIES, &tmp_entries[0], nb_routes * 4 ) ) {
        debugError( "Failed to read router config block information\n" );
        return false;
    }

    for ( unsigned int i = 0; i < nb_routes; ++i ) {
        entries.push_back( RouterEntry::decode( tmp_entries.at( i ) ) );
    }
    return true;
}

bool
EAP::readRouterEntries( RouterEntryVector& entries )
{
    return readEntries( eRT_NewRouting, 0, entries );
}

bool
EAP::writeRouterEntries( const RouterEntryVector& entries )
{
    unsigned int nb_routes_max = m_caps.router.maximum_entry_count;
    if ( entries.size() > nb_routes_max ) {
        debugError( "More than %u routes are not possible\n", nb_routes_max );
        return false;
    }
    if ( entries.empty() ) {
        debugWarning( "Writing 0 routes? This will deactivate routing and make the device very silent...\n" );
    }

    // stale entries behind the new ones are cleared as well
    std::vector<fb_quadlet_t> tmp_entries( nb_routes_max + 1, 0 );
    tmp_entries[0] = entries.size();
    for ( unsigned int i = 0; i < entries.size(); ++i ) {
        tmp_entries[1 + i] = entries.at( i ).encode();
    }

    if ( !writeRegBlock( eRT_NewRouting, TCAT_EAP_ROUTER_NB_ENTRIES,
                         &tmp_entries[0], tmp_entries.size() * 4 ) ) {
        debugError( "Failed to write router config block information\n" );
        return false;
    }
    return true;
}

bool
EAP::readPeakEntries( unsigned int count, RouterEntryVector& entries )
{
    entries.clear();
    if ( count == 0 ) {
        return true;
    }
    if ( count > m_caps.router.maximum_entry_count ) {
        count = m_caps.router.maximum_entry_count;
    }

    std::vector<fb_quadlet_t> tmp_entries( count );
    if ( !readRegBlock( eRT_Peak, 0, &tmp_entries[0], count * 4 ) ) {
        debugError( "Failed to read peak block information\n" );
        return false;
    }
    for ( unsigned int i = 0; i < count; ++i ) {
        RouterEntry entry = RouterEntry::decode( tmp_entries.at( i ) );
        // only 12 bits carry the level
        entry.peak &= 0x0fff;
        entries.push_back( entry );
    }
    return true;
}

bool
EAP::readFormatEntry( enum eRegBase base, unsigned offset, FormatEntry& entry )
{
    fb_quadlet_t buf[TCAT_EAP_STREAM_ENTRY_SIZE / 4];
    if ( !readRegBlock( base, offset, buf, TCAT_EAP_STREAM_ENTRY_SIZE ) ) {
        return false;
    }
    entry.pcm_count = buf[TCAT_EAP_STREAM_ENTRY_PCM / 4];
    entry.midi_count = buf[TCAT_EAP_STREAM_ENTRY_MIDI / 4];
    entry.labels = parseLabels( buf + TCAT_EAP_STREAM_ENTRY_NAMES / 4, TCAT_STREAM_NAMES_SIZE / 4 );
    entry.enable_ac3 = buf[TCAT_EAP_STREAM_ENTRY_AC3 / 4];
    return true;
}

bool
EAP::writeFormatEntry( enum eRegBase base, unsigned offset, const FormatEntry& entry )
{
    fb_quadlet_t buf[TCAT_EAP_STREAM_ENTRY_SIZE / 4];
    buf[TCAT_EAP_STREAM_ENTRY_PCM / 4] = entry.pcm_count;
    buf[TCAT_EAP_STREAM_ENTRY_MIDI / 4] = entry.midi_count;
    if ( !buildLabels( entry.labels, buf + TCAT_EAP_STREAM_ENTRY_NAMES / 4,
                       TCAT_STREAM_NAMES_SIZE / 4 ) ) {
        debugError( "Channel names do not fit\n" );
        return false;
    }
    buf[TCAT_EAP_STREAM_ENTRY_AC3 / 4] = entry.enable_ac3;
    return writeRegBlock( base, offset, buf, TCAT_EAP_STREAM_ENTRY_SIZE );
}

bool
EAP::readStreamConfig( enum eRegBase base, unsigned offset, StreamFormatConfig& config )
{
    fb_quadlet_t counts[2];
    if ( !readRegBlock( base, offset, counts, sizeof( counts ) ) ) {
        debugError( "Failed to read number of entries\n" );
        return false;
    }
    unsigned int nb_tx = counts[0];
    unsigned int nb_rx = counts[1];
    debugOutput( DEBUG_LEVEL_VERBOSE, " Entries: TX: %u, RX: %u\n", nb_tx, nb_rx );

    // the caps register has four bits per direction
    if ( nb_tx > 0xf || nb_rx > 0xf
         || offset + TCAT_EAP_STREAM_ENTRIES + ( nb_tx + nb_rx ) * TCAT_EAP_STREAM_ENTRY_SIZE
         > getSection( base ).size ) {
        debugError( "Stream config does not fit in its section: %u + %u entries\n", nb_tx, nb_rx );
        return false;
    }

    config.tx_entries.clear();
    config.rx_entries.clear();

    offset += TCAT_EAP_STREAM_ENTRIES;
    for ( unsigned int i = 0; i < nb_tx; i++ ) {
        FormatEntry entry;
        if ( !readFormatEntry( base, offset, entry ) ) {
            debugError( "Failed to read tx entry %u\n", i );
            return false;
        }
        config.tx_entries.push_back( entry );
        offset += TCAT_EAP_STREAM_ENTRY_SIZE;
    }
    for ( unsigned int i = 0; i < nb_rx; i++ ) {
        FormatEntry entry;
        if ( !readFormatEntry( base, offset, entry ) ) {
            debugError( "Failed to read rx entry %u\n", i );
            return false;
        }
        config.rx_entries.push_back( entry );
        offset += TCAT_EAP_STREAM_ENTRY_SIZE;
    }
    return true;
}

bool
EAP::readStreamConfig( StreamFormatConfig& config )
{
    return readStreamConfig( eRT_NewStreamCfg, 0, config );
}

bool
EAP::writeStreamConfig( const StreamFormatConfig& config )
{
    if ( !m_caps.general.dynamic_stream_format ) {
        debugError( "Stream format configuration is immutable\n" );
        return false;
    }
    if ( config.tx_entries.size() > m_caps.general.max_tx_streams
         || config.rx_entries.size() > m_caps.general.max_rx_streams ) {
        debugError( "Too many streams: %zd tx, %zd rx\n",
                    config.tx_entries.size(), config.rx_entries.size() );
        return false;
    }

    fb_quadlet_t counts[2];
    counts[0] = config.tx_entries.size();
    counts[1] = config.rx_entries.size();
    if ( !writeRegBlock( eRT_NewStreamCfg, TCAT_EAP_STREAM_NB_TX, counts, sizeof( counts ) ) ) {
        debugError( "Failed to write number of entries\n" );
        return false;
    }

    unsigned int offset = TCAT_EAP_STREAM_ENTRIES;
    for ( FormatEntryVector::const_iterator it = config.tx_entries.begin();
          it != config.tx_entries.end(); ++it ) {
        if ( !writeFormatEntry( eRT_NewStreamCfg, offset, *it ) ) {
            debugError( "Failed to write tx entry\n" );
            return false;
        }
        offset += TCAT_EAP_STREAM_ENTRY_SIZE;
    }
    for ( FormatEntryVector::const_iterator it = config.rx_entries.begin();
          it != config.rx_entries.end(); ++it ) {
        if ( !writeFormatEntry( eRT_NewStreamCfg, offset, *it ) ) {
            debugError( "Failed to write rx entry\n" );
            return false;
        }
        offset += TCAT_EAP_STREAM_ENTRY_SIZE;
    }
    return true;
}

unsigned int
EAP::currentRouterOffset( enum eRateMode mode )
{
    switch ( mode ) {
    case eRM_Mid:  return TCAT_EAP_CURRCFG_MID_ROUTER;
    case eRM_High: return TCAT_EAP_CURRCFG_HIGH_ROUTER;
    default:       return TCAT_EAP_CURRCFG_LOW_ROUTER;
    }
}

unsigned int
EAP::currentStreamOffset( enum eRateMode mode )
{
    switch ( mode ) {
    case eRM_Mid:  return TCAT_EAP_CURRCFG_MID_STREAM;
    case eRM_High: return TCAT_EAP_CURRCFG_HIGH_STREAM;
    default:       return TCAT_EAP_CURRCFG_LOW_STREAM;
    }
}

bool
EAP::readCurrentRouterEntries( enum eRateMode mode, RouterEntryVector& entries )
{
    return readEntries( eRT_CurrentCfg, currentRouterOffset( mode ), entries );
}

bool
EAP::readCurrentStreamConfig( enum eRateMode mode, StreamFormatConfig& config )
{
    return readStreamConfig( eRT_CurrentCfg, currentStreamOffset( mode ), config );
}

// mixer

bool
EAP::readMixerSaturation( std::vector<bool>& saturation )
{
    if ( !m_caps.mixer.is_exposed ) {
        debugError( "Mixer is not available\n" );
        return false;
    }
    fb_quadlet_t tmp;
    if ( !readReg( eRT_Mixer, TCAT_EAP_MIXER_SATURATION, &tmp ) ) {
        debugError( "Could not read mixer saturation\n" );
        return false;
    }
    saturation.resize( m_caps.mixer.output_count );
    for ( unsigned int i = 0; i < saturation.size(); ++i ) {
        saturation[i] = ( tmp & ( 1 << i ) ) != 0;
    }
    return true;
}

bool
EAP::readMixerCoefficients( MixerCoefficients& coefs )
{
    if ( !m_caps.mixer.is_exposed ) {
        debugError( "Mixer is not available\n" );
        return false;
    }

    const size_t nb_quads = TCAT_EAP_MIXER_MAX_OUTPUTS * TCAT_EAP_MIXER_MAX_INPUTS;
    fb_quadlet_t buf[nb_quads];
    if ( !readRegBlock( eRT_Mixer, TCAT_EAP_MIXER_COEFFICIENTS, buf, nb_quads * 4 ) ) {
        debugError( "Failed to read coefficients\n" );
        return false;
    }

    coefs.resize( m_caps.mixer.output_count );
    for ( unsigned int dst = 0; dst < coefs.size(); ++dst ) {
        coefs[dst].resize( m_caps.mixer.input_count );
        for ( unsigned int src = 0; src < coefs[dst].size(); ++src ) {
            coefs[dst][src] = (int16_t)( buf[dst * TCAT_EAP_MIXER_MAX_INPUTS + src] & 0xffff );
        }
    }
    return true;
}

bool
EAP::writeMixerRow( unsigned int dst, const fb_quadlet_t* quads, size_t nb_quads )
{
    if ( !m_caps.mixer.is_exposed || m_caps.mixer.is_readonly ) {
        debugError( "Mixer is not writable\n" );
        return false;
    }
    if ( dst >= TCAT_EAP_MIXER_MAX_OUTPUTS || nb_quads > TCAT_EAP_MIXER_MAX_INPUTS ) {
        debugError( "Mixer row %u with %zd coefficients out of range\n", dst, nb_quads );
        return false;
    }

    fb_quadlet_t buf[TCAT_EAP_MIXER_MAX_INPUTS];
    memcpy( buf, quads, nb_quads * 4 );
    unsigned int offset = TCAT_EAP_MIXER_COEFFICIENTS + dst * TCAT_EAP_MIXER_MAX_INPUTS * 4;
    if ( !writeRegBlock( eRT_Mixer, offset, buf, nb_quads * 4 ) ) {
        debugError( "Failed to write coefficients of output %u\n", dst );
        return false;
    }
    return true;
}

// standalone

bool
EAP::readStandalone( StandaloneParameters& params )
{
    fb_quadlet_t quads[TCAT_EAP_STANDALONE_SIZE / 4];
    if ( !readRegBlock( eRT_Standalone, 0, quads, TCAT_EAP_STANDALONE_SIZE ) ) {
        debugError( "Could not read standalone section\n" );
        return false;
    }
    parseStandalone( quads, params );
    return true;
}

enum eStatus
EAP::writeStandalone( const StandaloneParameters& params, const StandaloneParameters& prev )
{
    fb_quadlet_t new_quads[TCAT_EAP_STANDALONE_SIZE / 4];
    fb_quadlet_t old_quads[TCAT_EAP_STANDALONE_SIZE / 4];
    if ( buildStandalone( params, new_quads ) != eS_Ok ) {
        debugError( "Invalid word clock rate: %u / %u\n",
                    params.word_clock.numerator, params.word_clock.denominator );
        return eS_InvalidArgument;
    }
    // an invalid previous state forces a full write
    bool write_all = ( buildStandalone( prev, old_quads ) != eS_Ok );

    for ( unsigned int i = 0; i < TCAT_EAP_STANDALONE_SIZE / 4; ++i ) {
        if ( !write_all && new_quads[i] == old_quads[i] ) {
            continue;
        }
        if ( !writeReg( eRT_Standalone, i * 4, new_quads[i] ) ) {
            debugError( "Could not write standalone register 0x%02x\n", i * 4 );
            return eS_IoError;
        }
    }
    return eS_Ok;
}

// application

bool
EAP::readApplication( unsigned int offset, fb_quadlet_t* data, size_t length )
{
    return readRegBlock( eRT_Application, offset, data, length );
}

bool
EAP::writeApplication( unsigned int offset, fb_quadlet_t* data, size_t length )
{
    return writeRegBlock( eRT_Application, offset, data, length );
}

/*
  I/O operations
  */
bool
EAP::readReg( enum eRegBase base, unsigned offset, fb_quadlet_t* result )
{
    fb_nodeaddr_t addr = offsetGen( base, offset, 4 );
    return m_device.readReg( addr, result );
}

bool
EAP::writeReg( enum eRegBase base, unsigned offset, fb_quadlet_t data )
{
    fb_nodeaddr_t addr = offsetGen( base, offset, 4 );
    return m_device.writeReg( addr, data );
}

bool
EAP::readRegBlock( enum eRegBase base, unsigned offset, fb_quadlet_t* data, size_t length )
{
    fb_nodeaddr_t addr = offsetGen( base, offset, length );
    return m_device.readRegBlock( addr, data, length );
}

bool
EAP::writeRegBlock( enum eRegBase base, unsigned offset, fb_quadlet_t* data, size_t length )
{
    fb_nodeaddr_t addr = offsetGen( base, offset, length );
    return m_device.writeRegBlock( addr, data, length );
}

fb_nodeaddr_t
EAP::offsetGen( enum eRegBase base, unsigned offset, size_t length )
{
    fb_nodeaddr_t addr;
    fb_nodeaddr_t maxlen;
    if ( base == eRT_Base ) {
        addr = 0;
        maxlen = TCAT_EAP_MAX_SIZE;
    } else {
        const Section& section = getSection( base );
        if ( base == eRT_None ) {
            debugError( "Unsupported base address\n" );
            return TCAT_INVALID_OFFSET;
        }
        addr = section.offset;
        maxlen = section.size;
    }

    // out-of-range check
    if ( offset + length > maxlen ) {
        debugError( "requested range too large: 0x%x + %zd > %" PRIu64 "\n",
                    offset, length, maxlen );
        return TCAT_INVALID_OFFSET;
    }
    return TCAT_EAP_BASE + addr + offset;
}

void
EAP::show()
{
    printMessage( "== EAP ==\n" );
    printMessage( "Router caps:\n" );
    printMessage( "           exposed: %d\n", m_caps.router.is_exposed );
    printMessage( "          readonly: %d\n", m_caps.router.is_readonly );
    printMessage( "       flashstored: %d\n", m_caps.router.is_storable );
    printMessage( "        nb entries: %u\n", m_caps.router.maximum_entry_count );

    printMessage( "Mixer caps:\n" );
    printMessage( "           exposed: %d\n", m_caps.mixer.is_exposed );
    printMessage( "          readonly: %d\n", m_caps.mixer.is_readonly );
    printMessage( "       flashstored: %d\n", m_caps.mixer.is_storable );
    printMessage( "         tx id: (%u==eDB_MixerTx0) %s\n", m_caps.mixer.input_device_id,
                  ( m_caps.mixer.input_device_id == eDB_MixerTx0 ? "true" : "false" ) );
    printMessage( "         rx id: (%u==eSB_Mixer) %s\n", m_caps.mixer.output_device_id,
                  ( m_caps.mixer.output_device_id == eSB_Mixer ? "true" : "false" ) );
    printMessage( "         nb tx channels: %u\n", m_caps.mixer.input_count );
    printMessage( "         nb rx channels: %u\n", m_caps.mixer.output_count );

    printMessage( "General caps:\n" );
    printMessage( "        dynamic stream conf support: %d\n", m_caps.general.dynamic_stream_format );
    printMessage( "        flash load and store support: %d\n", m_caps.general.storage_avail );
    printMessage( "        peak metering support: %d\n", m_caps.general.peak_avail );
    printMessage( "        stream config flash: %d\n", m_caps.general.stream_format_is_storable );
    printMessage( "        max TX streams: %u\n", m_caps.general.max_tx_streams );
    printMessage( "        max RX streams: %u\n", m_caps.general.max_rx_streams );
    switch ( m_caps.general.chip ) {
    case eC_DiceII:
        printMessage( "        Chip: DICE-II\n" );
        break;
    case eC_Tcd2210:
        printMessage( "        Chip: TCD2210\n" );
        break;
    case eC_Tcd2220:
        printMessage( "        Chip: TCD2220\n" );
        break;
    default:
        printMessage( "        Chip: unknown (0x%04x)\n", m_caps.general.raw_chip );
        break;
    }
}

} // namespace Tcat
