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

#include "avc_generic.h"

#include "libutil/cmd_serialize.h"
#include "libieee1394/Transport.h"

#include <cstdio>
#include <cstring>

namespace AVC {

IMPL_DEBUG_MODULE( AVCCommand, AVCCommand, DEBUG_LEVEL_NORMAL );
IMPL_DEBUG_MODULE( IBusData, IBusData, DEBUG_LEVEL_VERBOSE );

AVCCommand::AVCCommand( Ieee1394::Transport& transport, opcode_t opcode )
    : m_transport( &transport )
    , m_ctype( eCT_Unknown )
    , m_subunit( 0xff )
    , m_opcode( opcode )
    , m_eResponse( eR_Unknown )
    , m_commandType( eCT_Unknown )
{
}

bool
AVCCommand::serialize( Util::Cmd::IOSSerialize& se )
{
    bool result = se.write( m_ctype, "AVCCommand ctype" );
    result &= se.write( m_subunit, "AVCCommand subunit" );
    result &= se.write( m_opcode, "AVCCommand opcode" );
    return result;
}

bool
AVCCommand::deserialize( Util::Cmd::IISDeserialize& de )
{
    bool result = de.read( &m_ctype );
    result &= de.read( &m_subunit );

    opcode_t opcode;
    result &= de.read( &opcode );
    if ( result && opcode != m_opcode ) {
        debugWarning( "response opcode 0x%02X does not match 0x%02X\n", opcode, m_opcode );
        return false;
    }
    return result;
}

bool
AVCCommand::setCommandType( ECommandType commandType )
{
    m_ctype = commandType;
    m_commandType = commandType;
    return true;
}

AVCCommand::ECommandType
AVCCommand::getCommandType()
{
    return m_commandType;
}

AVCCommand::EResponse
AVCCommand::getResponse()
{
    return m_eResponse;
}

bool
AVCCommand::setSubunitType( ESubunitType subunitType )
{
    fb_byte_t subT = subunitType;

    m_subunit = ( subT << 3 ) | ( m_subunit & 0x7 );
    return true;
}

bool
AVCCommand::setSubunitId( subunit_id_t subunitId )
{
    m_subunit = ( subunitId & 0x7 ) | ( m_subunit & 0xf8 );
    return true;
}

ESubunitType
AVCCommand::getSubunitType()
{
    return static_cast<ESubunitType>( ( m_subunit >> 3 ) );
}

subunit_id_t
AVCCommand::getSubunitId()
{
    return m_subunit & 0x7;
}

bool
AVCCommand::setVerbose( int verboseLevel )
{
    setDebugLevel( verboseLevel );
    return true;
}

int
AVCCommand::getVerboseLevel()
{
    return getDebugLevel();
}

void
AVCCommand::showFcpFrame( const unsigned char* buf,
                          unsigned short frameSize ) const
{
    // one line per 16 bytes keeps the message count low
    char msg[DEBUG_MAX_MESSAGE_LENGTH];
    int chars_written = 0;
    for ( int i = 0; i < frameSize; ++i ) {
        if ( ( i % 16 ) == 0 ) {
            if ( i > 0 ) {
                debugOutputShort( DEBUG_LEVEL_VERY_VERBOSE, "%s\n", msg );
                chars_written = 0;
            }
            chars_written += snprintf( msg + chars_written, DEBUG_MAX_MESSAGE_LENGTH - chars_written,
                                       "  %3d:\t", i );
        } else if ( ( i % 4 ) == 0 ) {
            chars_written += snprintf( msg + chars_written, DEBUG_MAX_MESSAGE_LENGTH - chars_written,
                                       " " );
        }
        chars_written += snprintf( msg + chars_written, DEBUG_MAX_MESSAGE_LENGTH - chars_written,
                                   "%02x ", buf[i] );
    }
    if ( chars_written != 0 ) {
        debugOutputShort( DEBUG_LEVEL_VERY_VERBOSE, "%s\n", msg );
    } else {
        debugOutputShort( DEBUG_LEVEL_VERY_VERBOSE, "\n" );
    }
}

bool
AVCCommand::fire( unsigned int timeout_ms )
{
    memset( &m_fcpFrame, 0x0, sizeof( m_fcpFrame ) );

    Util::Cmd::BufferSerialize se( m_fcpFrame, sizeof( m_fcpFrame ) );
    if ( !serialize( se ) ) {
        debugError( "fire: Could not serialize %s\n", getCmdName() );
        return false;
    }

    unsigned short fcpFrameSize = se.getNrOfProducesBytes();

    if ( getDebugLevel() >= DEBUG_LEVEL_VERY_VERBOSE ) {
        debugOutputShort( DEBUG_LEVEL_VERY_VERBOSE, "%s:\n", getCmdName() );
        debugOutputShort( DEBUG_LEVEL_VERY_VERBOSE, "  Request:\n" );
        showFcpFrame( m_fcpFrame, fcpFrameSize );
    }

    unsigned int resp_len = 0;
    fb_quadlet_t* resp = m_transport->transactionBlock( (fb_quadlet_t*)m_fcpFrame,
                                                        ( fcpFrameSize + 3 ) / 4,
                                                        &resp_len,
                                                        timeout_ms );
    if ( resp == NULL ) {
        debugWarning( "no response\n" );
        m_eResponse = eR_Unknown;
        return false;
    }

    bool result = false;
    resp_len *= 4;
    unsigned char* buf = (unsigned char*)resp;

    m_eResponse = (EResponse)( *buf );
    switch ( m_eResponse ) {
    case eR_Accepted:
    case eR_Implemented:
    case eR_Changed:
    {
        Util::Cmd::BufferDeserialize de( buf, resp_len );
        result = deserialize( de );

        debugOutputShort( DEBUG_LEVEL_VERY_VERBOSE, "  Response:\n" );
        showFcpFrame( buf, de.getNrOfConsumedBytes() );
        break;
    }
    case eR_Rejected:
    case eR_NotImplemented:
        debugOutput( DEBUG_LEVEL_VERBOSE, "%s: %s\n", getCmdName(),
                     responseToString( m_eResponse ) );
        showFcpFrame( buf, resp_len );
        break;
    default:
        debugWarning( "unexpected response received (0x%x)\n", m_eResponse );
        showFcpFrame( buf, resp_len );
    }

    if ( !m_transport->transactionBlockClose() ) {
        debugWarning( "Could not close the FCP transaction\n" );
    }
    return result;
}

static const char* subunitTypeStrings[] =
{
    "Monitor",
    "Audio",
    "Printer",
    "Disc recorder",
    "Tape recorder/VCR",
    "Tuner",
    "CA",
    "Video camera",
    "unknown",
    "Panel",
    "Bulletin board",
    "Camera storage",
    "Music",
};

const char*
subunitTypeToString( ESubunitType subunitType )
{
    if ( subunitType == eST_Unit ) {
        return "Unit";
    }
    if ( subunitType >= (int)( sizeof( subunitTypeStrings ) / sizeof( subunitTypeStrings[0] ) ) ) {
        return "unknown";
    }
    return subunitTypeStrings[subunitType];
}

const char*
responseToString( AVCCommand::EResponse eResponse )
{
    switch ( eResponse ) {
    case AVCCommand::eR_NotImplemented: return "not implemented";
    case AVCCommand::eR_Accepted:       return "accepted";
    case AVCCommand::eR_Rejected:       return "rejected";
    case AVCCommand::eR_InTransition:   return "in transition";
    case AVCCommand::eR_Implemented:    return "implemented/stable";
    case AVCCommand::eR_Changed:        return "changed";
    case AVCCommand::eR_Interim:        return "interim";
    default:                            return "unknown";
    }
}

}
