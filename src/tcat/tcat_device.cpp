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

#include "tcat_device.h"

#include "libutil/ByteSwap.h"
#include "libutil/Mutex.h"

#include <cstring>
#include <cctype>
#include <algorithm>

namespace Tcat {

IMPL_DEBUG_MODULE( Device, Device, DEBUG_LEVEL_NORMAL );

// bit positions of the clock caps register
static const enum eClockRate clock_caps_rate_table[] = {
    eCR_32000, eCR_44100, eCR_48000, eCR_88200, eCR_96000, eCR_176400,
    eCR_192000, eCR_AnyLow, eCR_AnyMid, eCR_AnyHigh, eCR_None,
};

static const enum eClockSource clock_caps_src_table[] = {
    eCS_Aes1, eCS_Aes2, eCS_Aes3, eCS_Aes4, eCS_AesAny, eCS_Adat, eCS_Tdif,
    eCS_WordClock, eCS_Arx1, eCS_Arx2, eCS_Arx3, eCS_Arx4, eCS_Internal,
};

// bit positions of the extended status register
static const enum eClockSource external_clock_source_table[] = {
    eCS_Aes1, eCS_Aes2, eCS_Aes3, eCS_Aes4, eCS_Adat, eCS_Tdif,
    eCS_Arx1, eCS_Arx2, eCS_Arx3, eCS_Arx4, eCS_WordClock,
};

#define NB_ELEMENTS( a ) ( sizeof( a ) / sizeof( a[0] ) )

static bool
isStreamSource( enum eClockSource s )
{
    return s >= eCS_Arx1 && s <= eCS_Arx4;
}

static bool
isUnusedLabel( const std::string& label )
{
    std::string l( label );
    std::transform( l.begin(), l.end(), l.begin(), ::tolower );
    return l == "unused";
}

Device::Device( Ieee1394::Transport& transport, unsigned int timeout_ms )
    : m_transport( transport )
    , m_timeout_ms( timeout_ms )
    , m_has_source_override( false )
    , m_label_table( clock_caps_src_table,
                     clock_caps_src_table + NB_ELEMENTS( clock_caps_src_table ) )
{
}

Device::~Device()
{
}

void
Device::setVerboseLevel( int l )
{
    setDebugLevel( l );
}

void
Device::setAvailableClockSourceOverride( const ClockSourceVector& srcs )
{
    m_has_source_override = true;
    m_source_override = srcs;
}

void
Device::setClockSourceLabelTable( const ClockSourceVector& table )
{
    m_label_table = table;
}

bool
Device::readSection( fb_nodeaddr_t offset, Section& section, const char* name )
{
    fb_quadlet_t regs[2];
    if ( !readRegBlock( offset, regs, sizeof( regs ) ) ) {
        debugError( "Could not read the %s section descriptor\n", name );
        return false;
    }
    // offsets and sizes are returned in quadlets, but we use byte values
    section.offset = regs[0] * 4;
    section.size = regs[1] * 4;
    debugOutput( DEBUG_LEVEL_VERBOSE, " %-8s: offset=%04X size=%04d\n",
                 name, section.offset, section.size );
    return true;
}

bool
Device::init()
{
    debugOutput( DEBUG_LEVEL_VERBOSE, "General section info:\n" );
    if ( !readSection( TCAT_REGISTER_GLOBAL_PAR_SPACE_OFF, m_global, "global" ) ) {
        return false;
    }
    if ( !readSection( TCAT_REGISTER_TX_PAR_SPACE_OFF, m_tx_stream_format, "TX" ) ) {
        return false;
    }
    if ( !readSection( TCAT_REGISTER_RX_PAR_SPACE_OFF, m_rx_stream_format, "RX" ) ) {
        return false;
    }
    if ( !readSection( TCAT_REGISTER_EXT_SYNC_SPACE_OFF, m_ext_sync, "EXT_SYNC" ) ) {
        return false;
    }
    if ( !readSection( TCAT_REGISTER_RESERVED_SPACE_OFF, m_reserved, "RESERVED" ) ) {
        return false;
    }
    if ( m_global.size < TCAT_GLOBAL_LEGACY_SIZE ) {
        debugError( "Global section too small: %u bytes\n", m_global.size );
        return false;
    }
    return true;
}

void
Device::parseClockCaps( const fb_quadlet_t* regs, GlobalParameters& params ) const
{
    fb_quadlet_t caps = regs[TCAT_REGISTER_GLOBAL_CLOCKCAPABILITIES / 4];
    unsigned int rate_bits = caps & TCAT_CLOCKCAP_RATE_MASK;
    unsigned int src_bits = ( caps & TCAT_CLOCKCAP_SOURCE_MASK ) >> TCAT_CLOCKCAP_SOURCE_SHIFT;

    params.version = regs[TCAT_REGISTER_GLOBAL_VERSION / 4];

    params.avail_rates.clear();
    for ( unsigned int i = 0; i < NB_ELEMENTS( clock_caps_rate_table ); ++i ) {
        if ( rate_bits & ( 1 << i ) ) {
            params.avail_rates.push_back( clock_caps_rate_table[i] );
        }
    }

    stringlist names = parseLabels( regs + TCAT_REGISTER_GLOBAL_CLOCKSOURCENAMES / 4,
                                    TCAT_CLOCKSOURCENAMES_SIZE / 4 );

    ClockSourceLabelVector labels;
    for ( unsigned int i = 0; i < m_label_table.size() && i < names.size(); ++i ) {
        labels.push_back( ClockSourceLabel( m_label_table.at( i ), names.at( i ) ) );
    }

    // stream sources are always labelled "unused" though they show up
    // in the external states, name them here
    for ( ClockSourceLabelVector::iterator it = labels.begin(); it != labels.end(); ++it ) {
        if ( !isStreamSource( it->first ) ) {
            continue;
        }
        for ( unsigned int i = 0; i < NB_ELEMENTS( clock_caps_src_table ); ++i ) {
            if ( clock_caps_src_table[i] == it->first && ( src_bits & ( 1 << i ) ) ) {
                it->second = clockSourceToString( it->first );
            }
        }
    }

    params.avail_sources.clear();
    if ( m_has_source_override ) {
        params.avail_sources = m_source_override;
    } else {
        for ( unsigned int i = 0; i < NB_ELEMENTS( clock_caps_src_table ); ++i ) {
            enum eClockSource src = clock_caps_src_table[i];
            if ( !( src_bits & ( 1 << i ) ) || isStreamSource( src ) ) {
                continue;
            }
            for ( ClockSourceLabelVector::const_iterator it = labels.begin();
                  it != labels.end(); ++it ) {
                if ( it->first == src && !isUnusedLabel( it->second ) ) {
                    params.avail_sources.push_back( src );
                    break;
                }
            }
        }
    }

    params.clock_source_labels.clear();
    for ( ClockSourceLabelVector::const_iterator it = labels.begin(); it != labels.end(); ++it ) {
        if ( isUnusedLabel( it->second ) ) {
            continue;
        }
        if ( isStreamSource( it->first )
             || std::find( params.avail_sources.begin(), params.avail_sources.end(),
                           it->first ) != params.avail_sources.end() ) {
            params.clock_source_labels.push_back( *it );
        }
    }
}

void
Device::parseExternalStates( fb_quadlet_t reg, GlobalParameters& params ) const
{
    unsigned int locked_bits = reg & TCAT_EXT_STATUS_LOCKED_MASK;
    unsigned int slipped_bits = ( reg & TCAT_EXT_STATUS_SLIPPED_MASK ) >> TCAT_EXT_STATUS_SLIPPED_SHIFT;

    ExternalSourceStates& states = params.external_source_states;
    states.sources.clear();
    states.locked.clear();
    states.slipped.clear();

    for ( unsigned int i = 0; i < NB_ELEMENTS( external_clock_source_table ); ++i ) {
        enum eClockSource src = external_clock_source_table[i];
        for ( ClockSourceLabelVector::const_iterator it = params.clock_source_labels.begin();
              it != params.clock_source_labels.end(); ++it ) {
            if ( it->first == src ) {
                states.sources.push_back( src );
                states.locked.push_back( ( locked_bits & ( 1 << i ) ) != 0 );
                states.slipped.push_back( ( slipped_bits & ( 1 << i ) ) != 0 );
                break;
            }
        }
    }
}

static std::string
parseNickname( const fb_quadlet_t* quads )
{
    std::string name;
    for ( unsigned int i = 0; i < TCAT_NICK_NAME_SIZE; ++i ) {
        char c = ( quads[i / 4] >> ( 8 * ( i % 4 ) ) ) & 0xff;
        if ( c == '\0' ) {
            break;
        }
        name += c;
    }
    return name;
}

bool
Device::readGlobalParameters( GlobalParameters& params )
{
    size_t length = std::min<size_t>( m_global.size,
        TCAT_REGISTER_GLOBAL_CLOCKSOURCENAMES + TCAT_CLOCKSOURCENAMES_SIZE );
    if ( length < TCAT_GLOBAL_LEGACY_SIZE ) {
        debugError( "Global section not initialized\n" );
        return false;
    }

    fb_quadlet_t regs[( TCAT_REGISTER_GLOBAL_CLOCKSOURCENAMES + TCAT_CLOCKSOURCENAMES_SIZE ) / 4];
    memset( regs, 0, sizeof( regs ) );
    if ( !readGlobalRegBlock( 0, regs, length ) ) {
        debugError( "Could not read the global section\n" );
        return false;
    }

    if ( length > TCAT_GLOBAL_LEGACY_SIZE ) {
        parseClockCaps( regs, params );
    } else {
        params.version = 0;
        params.avail_rates.clear();
        params.avail_rates.push_back( eCR_44100 );
        params.avail_rates.push_back( eCR_48000 );
        params.avail_sources.clear();
        params.avail_sources.push_back( eCS_Internal );
        params.clock_source_labels.clear();
        params.clock_source_labels.push_back( ClockSourceLabel( eCS_Arx1, "Stream-1" ) );
        params.clock_source_labels.push_back( ClockSourceLabel( eCS_Internal, "internal" ) );
    }

    params.owner = ( (fb_octlet_t)regs[TCAT_REGISTER_GLOBAL_OWNER / 4] << 32 )
                 | regs[TCAT_REGISTER_GLOBAL_OWNER / 4 + 1];
    params.latest_notification = regs[TCAT_REGISTER_GLOBAL_NOTIFICATION / 4];
    params.nickname = parseNickname( regs + TCAT_REGISTER_GLOBAL_NICK_NAME / 4 );

    fb_quadlet_t tmp = regs[TCAT_REGISTER_GLOBAL_CLOCK_SELECT / 4];
    params.clock_config.src = clockSourceFromCode( tmp & TCAT_CLOCK_SELECT_SOURCE_MASK );
    params.clock_config.rate = clockRateFromCode(
        ( tmp & TCAT_CLOCK_SELECT_RATE_MASK ) >> TCAT_CLOCK_SELECT_RATE_SHIFT );

    params.enable = regs[TCAT_REGISTER_GLOBAL_ENABLE / 4] != 0;

    tmp = regs[TCAT_REGISTER_GLOBAL_STATUS / 4];
    params.clock_status.src_is_locked = ( tmp & TCAT_STATUS_SOURCE_LOCKED ) != 0;
    params.clock_status.rate = clockRateFromCode(
        ( tmp & TCAT_STATUS_NOMINAL_RATE_MASK ) >> TCAT_STATUS_NOMINAL_RATE_SHIFT );

    parseExternalStates( regs[TCAT_REGISTER_GLOBAL_EXTENDED_STATUS / 4], params );

    params.current_rate = regs[TCAT_REGISTER_GLOBAL_SAMPLE_RATE / 4];

    return true;
}

bool
Device::readNotification( fb_quadlet_t& notification )
{
    if ( !readGlobalReg( TCAT_REGISTER_GLOBAL_NOTIFICATION, &notification ) ) {
        debugError( "Could not read the notification register\n" );
        return false;
    }
    return true;
}

bool
Device::readExternalStates( GlobalParameters& params )
{
    fb_quadlet_t tmp;
    if ( !readGlobalReg( TCAT_REGISTER_GLOBAL_EXTENDED_STATUS, &tmp ) ) {
        debugError( "Could not read the extended status register\n" );
        return false;
    }
    parseExternalStates( tmp, params );
    return true;
}

bool
Device::readCurrentRate( unsigned int& rate )
{
    fb_quadlet_t tmp;
    if ( !readGlobalReg( TCAT_REGISTER_GLOBAL_SAMPLE_RATE, &tmp ) ) {
        debugError( "Could not read the sample rate register\n" );
        return false;
    }
    rate = tmp;
    return true;
}

bool
Device::getNickname( std::string& name )
{
    fb_quadlet_t quads[TCAT_NICK_NAME_SIZE / 4];
    if ( !readGlobalRegBlock( TCAT_REGISTER_GLOBAL_NICK_NAME, quads, TCAT_NICK_NAME_SIZE ) ) {
        debugError( "Could not read nickname string\n" );
        return false;
    }
    name = parseNickname( quads );
    return true;
}

bool
Device::setNickname( const std::string& name )
{
    if ( name.size() >= TCAT_NICK_NAME_SIZE ) {
        debugError( "Nickname too long: %zd characters\n", name.size() );
        return false;
    }

    fb_quadlet_t quads[TCAT_NICK_NAME_SIZE / 4];
    memset( quads, 0, sizeof( quads ) );
    for ( size_t i = 0; i < name.size(); ++i ) {
        quads[i / 4] |= ( (fb_quadlet_t)(unsigned char)name[i] ) << ( 8 * ( i % 4 ) );
    }

    if ( !writeGlobalRegBlock( TCAT_REGISTER_GLOBAL_NICK_NAME, quads, TCAT_NICK_NAME_SIZE ) ) {
        debugError( "Could not write nickname string\n" );
        return false;
    }
    return true;
}

bool
Device::writeClockConfig( const ClockConfig& config )
{
    if ( config.rate == eCR_Reserved || config.src == eCS_Reserved ) {
        debugError( "Reserved clock configuration\n" );
        return false;
    }

    fb_quadlet_t reg = ( config.src & TCAT_CLOCK_SELECT_SOURCE_MASK )
        | ( ( config.rate << TCAT_CLOCK_SELECT_RATE_SHIFT ) & TCAT_CLOCK_SELECT_RATE_MASK );

    debugOutput( DEBUG_LEVEL_VERBOSE, "Setting clock to %s, %s\n",
                 clockRateToString( config.rate ), clockSourceToString( config.src ) );

    Util::MutexLockHelper lock( m_transport.getDeviceLock() );
    if ( !writeGlobalReg( TCAT_REGISTER_GLOBAL_CLOCK_SELECT, reg ) ) {
        debugError( "Could not write the clock select register\n" );
        return false;
    }
    return true;
}

bool
Device::readTxStreamFormats( TxStreamFormatEntryVector& entries )
{
    fb_quadlet_t regs[2];
    if ( !readRegBlock( m_tx_stream_format.offset + TCAT_REGISTER_TX_NB_TX, regs, sizeof( regs ) ) ) {
        debugError( "Could not read the TX stream count\n" );
        return false;
    }
    unsigned int count = regs[0];
    size_t size = regs[1] * 4;

    if ( size < TCAT_STREAM_ENTRY_MIN_SIZE
         || TCAT_REGISTER_TX_PARAMETER_SPACE + size * count > m_tx_stream_format.size ) {
        debugError( "Invalid TX stream format layout: %u entries of %zd bytes\n", count, size );
        return false;
    }

    entries.clear();
    for ( unsigned int i = 0; i < count; ++i ) {
        fb_quadlet_t buf[TCAT_STREAM_ENTRY_AC3_SIZE / 4];
        memset( buf, 0, sizeof( buf ) );
        size_t todo = std::min<size_t>( size, TCAT_STREAM_ENTRY_AC3_SIZE );
        fb_nodeaddr_t offset = m_tx_stream_format.offset + TCAT_REGISTER_TX_PARAMETER_SPACE + size * i;
        if ( !readRegBlock( offset, buf, todo ) ) {
            debugError( "Could not read TX stream format %u\n", i );
            return false;
        }

        TxStreamFormatEntry entry;
        entry.iso_channel = (int8_t)( buf[TCAT_REGISTER_TX_ISOC_BASE / 4] & 0xff );
        entry.pcm = buf[TCAT_REGISTER_TX_NB_AUDIO_BASE / 4];
        entry.midi = buf[TCAT_REGISTER_TX_MIDI_BASE / 4];
        entry.speed = buf[TCAT_REGISTER_TX_SPEED_BASE / 4];
        entry.labels = parseLabels( buf + TCAT_REGISTER_TX_NAMES_BASE / 4,
                                    TCAT_STREAM_NAMES_SIZE / 4 );
        if ( todo >= TCAT_STREAM_ENTRY_AC3_SIZE ) {
            entry.iec60958_caps = buf[TCAT_REGISTER_TX_AC3_CAPS_BASE / 4];
            entry.iec60958_enable = buf[TCAT_REGISTER_TX_AC3_ENABLE_BASE / 4];
        }
        entries.push_back( entry );
    }
    return true;
}

bool
Device::readRxStreamFormats( RxStreamFormatEntryVector& entries )
{
    fb_quadlet_t regs[2];
    if ( !readRegBlock( m_rx_stream_format.offset + TCAT_REGISTER_RX_NB_RX, regs, sizeof( regs ) ) ) {
        debugError( "Could not read the RX stream count\n" );
        return false;
    }
    unsigned int count = regs[0];
    size_t size = regs[1] * 4;

    if ( size < TCAT_STREAM_ENTRY_MIN_SIZE
         || TCAT_REGISTER_RX_PARAMETER_SPACE + size * count > m_rx_stream_format.size ) {
        debugError( "Invalid RX stream format layout: %u entries of %zd bytes\n", count, size );
        return false;
    }

    entries.clear();
    for ( unsigned int i = 0; i < count; ++i ) {
        fb_quadlet_t buf[TCAT_STREAM_ENTRY_AC3_SIZE / 4];
        memset( buf, 0, sizeof( buf ) );
        size_t todo = std::min<size_t>( size, TCAT_STREAM_ENTRY_AC3_SIZE );
        fb_nodeaddr_t offset = m_rx_stream_format.offset + TCAT_REGISTER_RX_PARAMETER_SPACE + size * i;
        if ( !readRegBlock( offset, buf, todo ) ) {
            debugError( "Could not read RX stream format %u\n", i );
            return false;
        }

        RxStreamFormatEntry entry;
        entry.iso_channel = (int8_t)( buf[TCAT_REGISTER_RX_ISOC_BASE / 4] & 0xff );
        entry.start = buf[TCAT_REGISTER_RX_SEQ_START_BASE / 4];
        entry.pcm = buf[TCAT_REGISTER_RX_NB_AUDIO_BASE / 4];
        entry.midi = buf[TCAT_REGISTER_RX_MIDI_BASE / 4];
        entry.labels = parseLabels( buf + TCAT_REGISTER_RX_NAMES_BASE / 4,
                                    TCAT_STREAM_NAMES_SIZE / 4 );
        if ( todo >= TCAT_STREAM_ENTRY_AC3_SIZE ) {
            entry.iec60958_caps = buf[TCAT_REGISTER_RX_AC3_CAPS_BASE / 4];
            entry.iec60958_enable = buf[TCAT_REGISTER_RX_AC3_ENABLE_BASE / 4];
        }
        entries.push_back( entry );
    }
    return true;
}

// I/O routines
bool
Device::readReg( fb_nodeaddr_t offset, fb_quadlet_t* result )
{
    debugOutput( DEBUG_LEVEL_VERY_VERBOSE, "Reading base register offset 0x%08" PRIX64 "\n", offset );

    if ( offset >= TCAT_INVALID_OFFSET ) {
        debugError( "invalid offset: 0x%016" PRIX64 "\n", offset );
        return false;
    }

    fb_nodeaddr_t addr = TCAT_REGISTER_BASE + offset;
    if ( !m_transport.readQuadlet( addr, result, m_timeout_ms ) ) {
        debugError( "Could not read from addr 0x%012" PRIX64 "\n", addr );
        return false;
    }

    *result = CondSwapFromBus32( *result );

    debugOutput( DEBUG_LEVEL_VERY_VERBOSE, "Read result: 0x%08" PRIX32 "\n", *result );
    return true;
}

bool
Device::writeReg( fb_nodeaddr_t offset, fb_quadlet_t data )
{
    debugOutput( DEBUG_LEVEL_VERY_VERBOSE,
                 "Writing base register offset 0x%08" PRIX64 ", data: 0x%08" PRIX32 "\n",
                 offset, data );

    if ( offset >= TCAT_INVALID_OFFSET ) {
        debugError( "invalid offset: 0x%012" PRIX64 "\n", offset );
        return false;
    }

    fb_nodeaddr_t addr = TCAT_REGISTER_BASE + offset;
    if ( !m_transport.writeQuadlet( addr, CondSwapToBus32( data ), m_timeout_ms ) ) {
        debugError( "Could not write to addr 0x%012" PRIX64 "\n", addr );
        return false;
    }
    return true;
}

bool
Device::readRegBlock( fb_nodeaddr_t offset, fb_quadlet_t* data, size_t length )
{
    debugOutput( DEBUG_LEVEL_VERY_VERBOSE,
                 "Reading base register offset 0x%08" PRIX64 ", length %zd, to %p\n",
                 offset, length, data );

    if ( offset >= TCAT_INVALID_OFFSET ) {
        debugError( "invalid offset: 0x%012" PRIX64 "\n", offset );
        return false;
    }

    fb_nodeaddr_t addr = TCAT_REGISTER_BASE + offset;
    size_t quads_done = 0;
    // round to next full quadlet
    size_t length_quads = ( length + 3 ) / 4;
    while ( quads_done < length_quads ) {
        fb_nodeaddr_t curr_addr = addr + quads_done * 4;
        fb_quadlet_t* curr_data = data + quads_done;
        size_t quads_todo = length_quads - quads_done;
        if ( quads_todo > TCAT_MAX_FRAME_QUADS ) {
            debugOutput( DEBUG_LEVEL_VERY_VERBOSE, "Truncating read from %zd to %d quadlets\n",
                         quads_todo, TCAT_MAX_FRAME_QUADS );
            quads_todo = TCAT_MAX_FRAME_QUADS;
        }

        if ( !m_transport.read( curr_addr, quads_todo, curr_data, m_timeout_ms ) ) {
            debugError( "Could not read %zd quadlets from addr 0x%012" PRIX64 "\n",
                        quads_todo, curr_addr );
            return false;
        }
        quads_done += quads_todo;
    }

    byteSwapFromBus( data, length_quads );
    return true;
}

bool
Device::writeRegBlock( fb_nodeaddr_t offset, fb_quadlet_t* data, size_t length )
{
    debugOutput( DEBUG_LEVEL_VERY_VERBOSE,
                 "Writing base register offset 0x%08" PRIX64 ", length: %zd\n",
                 offset, length );

    if ( offset >= TCAT_INVALID_OFFSET ) {
        debugError( "invalid offset: 0x%012" PRIX64 "\n", offset );
        return false;
    }

    size_t length_quads = ( length + 3 ) / 4;
    if ( length_quads == 0 ) {
        return true;
    }
    std::vector<fb_quadlet_t> data_out( data, data + length_quads );
    byteSwapToBus( &data_out[0], length_quads );

    fb_nodeaddr_t addr = TCAT_REGISTER_BASE + offset;
    size_t quads_done = 0;
    while ( quads_done < length_quads ) {
        fb_nodeaddr_t curr_addr = addr + quads_done * 4;
        fb_quadlet_t* curr_data = &data_out[quads_done];
        size_t quads_todo = length_quads - quads_done;
        if ( quads_todo > TCAT_MAX_FRAME_QUADS ) {
            debugOutput( DEBUG_LEVEL_VERY_VERBOSE, "Truncating write from %zd to %d quadlets\n",
                         quads_todo, TCAT_MAX_FRAME_QUADS );
            quads_todo = TCAT_MAX_FRAME_QUADS;
        }

        if ( !m_transport.write( curr_addr, quads_todo, curr_data, m_timeout_ms ) ) {
            debugError( "Could not write %zd quadlets to addr 0x%012" PRIX64 "\n",
                        quads_todo, curr_addr );
            return false;
        }
        quads_done += quads_todo;
    }
    return true;
}

bool
Device::readGlobalReg( fb_nodeaddr_t offset, fb_quadlet_t* result )
{
    fb_nodeaddr_t offset_gl = globalOffsetGen( offset, sizeof( fb_quadlet_t ) );
    if ( offset_gl == TCAT_INVALID_OFFSET ) {
        return false;
    }
    return readReg( m_global.offset + offset_gl, result );
}

bool
Device::writeGlobalReg( fb_nodeaddr_t offset, fb_quadlet_t data )
{
    fb_nodeaddr_t offset_gl = globalOffsetGen( offset, sizeof( fb_quadlet_t ) );
    if ( offset_gl == TCAT_INVALID_OFFSET ) {
        return false;
    }
    return writeReg( m_global.offset + offset_gl, data );
}

bool
Device::readGlobalRegBlock( fb_nodeaddr_t offset, fb_quadlet_t* data, size_t length )
{
    fb_nodeaddr_t offset_gl = globalOffsetGen( offset, length );
    if ( offset_gl == TCAT_INVALID_OFFSET ) {
        return false;
    }
    return readRegBlock( m_global.offset + offset_gl, data, length );
}

bool
Device::writeGlobalRegBlock( fb_nodeaddr_t offset, fb_quadlet_t* data, size_t length )
{
    fb_nodeaddr_t offset_gl = globalOffsetGen( offset, length );
    if ( offset_gl == TCAT_INVALID_OFFSET ) {
        return false;
    }
    return writeRegBlock( m_global.offset + offset_gl, data, length );
}

fb_nodeaddr_t
Device::globalOffsetGen( fb_nodeaddr_t offset, size_t length )
{
    if ( m_global.size == 0 ) {
        debugError( "register offset not initialized yet\n" );
        return TCAT_INVALID_OFFSET;
    }
    // out-of-range check
    if ( offset + length > m_global.size ) {
        debugError( "register offset+length too large: 0x%04" PRIX64 "\n", offset + length );
        return TCAT_INVALID_OFFSET;
    }
    return offset;
}

void
Device::showGlobalParameters( const GlobalParameters& params ) const
{
    printMessage( "Global section\n" );
    printMessage( " Owner            : 0x%016" PRIX64 "\n", params.owner );
    printMessage( " Notification     : 0x%08" PRIX32 "\n", params.latest_notification );
    printMessage( " Nickname         : %s\n", params.nickname.c_str() );
    printMessage( " Clock            : %s, %s\n",
                  clockRateToString( params.clock_config.rate ),
                  clockSourceToString( params.clock_config.src ) );
    printMessage( " Enabled          : %s\n", params.enable ? "yes" : "no" );
    printMessage( " Status           : %s, %s\n",
                  params.clock_status.src_is_locked ? "locked" : "not locked",
                  clockRateToString( params.clock_status.rate ) );
    printMessage( " Sample rate      : %u\n", params.current_rate );
    printMessage( " Version          : 0x%08" PRIX32 "\n", params.version );

    printMessage( " Available rates  :" );
    for ( ClockRateVector::const_iterator it = params.avail_rates.begin();
          it != params.avail_rates.end(); ++it ) {
        printMessageShort( " %s", clockRateToString( *it ) );
    }
    printMessageShort( "\n" );

    printMessage( " Available sources:" );
    for ( ClockSourceVector::const_iterator it = params.avail_sources.begin();
          it != params.avail_sources.end(); ++it ) {
        printMessageShort( " %s", clockSourceToString( *it ) );
    }
    printMessageShort( "\n" );

    const ExternalSourceStates& states = params.external_source_states;
    for ( unsigned int i = 0; i < states.sources.size(); ++i ) {
        printMessage( "  %-12s: %s%s\n", clockSourceToString( states.sources.at( i ) ),
                      states.locked.at( i ) ? "locked" : "unlocked",
                      states.slipped.at( i ) ? ", slipped" : "" );
    }
    for ( ClockSourceLabelVector::const_iterator it = params.clock_source_labels.begin();
          it != params.clock_source_labels.end(); ++it ) {
        printMessage( "  label %-6s: %s\n", clockSourceToString( it->first ), it->second.c_str() );
    }
}

} // namespace Tcat
