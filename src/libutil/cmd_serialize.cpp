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

#include "cmd_serialize.h"

#include <stdarg.h>
#include <stdio.h>
#include <string.h>

namespace Util {
  namespace Cmd {

IMPL_DEBUG_MODULE( BufferSerialize, BufferSerialize, DEBUG_LEVEL_NORMAL );
IMPL_DEBUG_MODULE( BufferDeserialize, BufferDeserialize, DEBUG_LEVEL_NORMAL );

void
StringSerializer::append( const char* fmt, ... )
{
    char line[128];
    va_list arg;
    va_start( arg, fmt );
    vsnprintf( line, sizeof(line), fmt, arg );
    va_end( arg );
    m_string += line;
}

bool
StringSerializer::write( byte_t d, const char* name )
{
    append( "  %3d:\t0x%02x\t%s\n", m_cnt, d, name );
    m_cnt += sizeof( byte_t );
    return true;
}

bool
StringSerializer::write( uint16_t d, const char* name )
{
    append( "  %3d:\t0x%04x\t%s\n", m_cnt, d, name );
    m_cnt += sizeof( uint16_t );
    return true;
}

bool
StringSerializer::write( quadlet_t d, const char* name )
{
    append( "  %3d:\t0x%08x\t%s\n", m_cnt, d, name );
    m_cnt += sizeof( quadlet_t );
    return true;
}

bool
StringSerializer::write( const byte_t * v, size_t len, const char* name )
{
    append( "  %3d:\t", m_cnt );
    for ( size_t i = 0; i < len; ++i ) {
        append( "%02x ", v[i] );
    }
    append( "\t%s\n", name );
    m_cnt += len;
    return true;
}

//////////////////////////////////////////////////

bool
BufferSerialize::write( byte_t value, const char* name )
{
    if ( !hasRoomFor( sizeof( byte_t ) ) ) {
        debugError( "no room for %s\n", name );
        return false;
    }
    *m_curPos = value;
    m_curPos += sizeof( byte_t );
    return true;
}

bool
BufferSerialize::write( uint16_t value, const char* name )
{
    if ( !hasRoomFor( sizeof( uint16_t ) ) ) {
        debugError( "no room for %s\n", name );
        return false;
    }
    *m_curPos++ = (value & 0xFF00) >> 8;
    *m_curPos++ = value & 0xFF;
    return true;
}

bool
BufferSerialize::write( quadlet_t value,  const char* name )
{
    if ( !hasRoomFor( sizeof( quadlet_t ) ) ) {
        debugError( "no room for %s\n", name );
        return false;
    }
    *m_curPos++ = (value >> 24) & 0xFF;
    *m_curPos++ = (value >> 16) & 0xFF;
    *m_curPos++ = (value >>  8) & 0xFF;
    *m_curPos++ = value & 0xFF;
    return true;
}

bool
BufferSerialize::write( const byte_t * v, size_t len, const char* name )
{
    // avoid write beyond buffer
    if ( !hasRoomFor( len ) ) {
        debugError( "no room for %s (%zu bytes)\n", name, len );
        return false;
    }
    memcpy(m_curPos, v, len);
    m_curPos += len;
    return true;
}

bool
BufferSerialize::hasRoomFor( size_t len ) const
{
    return static_cast<size_t>( m_curPos - m_buffer ) + len <= m_length;
}

//////////////////////////////////////////////////

bool
BufferDeserialize::read( byte_t* value )
{
    if ( !hasBytes( sizeof( byte_t ) ) ) {
        return false;
    }
    *value = *m_curPos;
    m_curPos += sizeof( byte_t );
    return true;
}

bool
BufferDeserialize::read( uint16_t* value )
{
    if ( !hasBytes( sizeof( uint16_t ) ) ) {
        return false;
    }
    *value = ( m_curPos[0] << 8 ) | m_curPos[1];
    m_curPos += sizeof( uint16_t );
    return true;
}

bool
BufferDeserialize::read( quadlet_t* value )
{
    if ( !hasBytes( sizeof( quadlet_t ) ) ) {
        return false;
    }
    *value = ( (quadlet_t)m_curPos[0] << 24 )
           | ( (quadlet_t)m_curPos[1] << 16 )
           | ( (quadlet_t)m_curPos[2] << 8 )
           | m_curPos[3];
    m_curPos += sizeof( quadlet_t );
    return true;
}

bool
BufferDeserialize::read( byte_t* values, size_t length )
{
    if ( !hasBytes( length ) ) {
        debugOutput( DEBUG_LEVEL_VERBOSE, "Read past end of response\n" );
        return false;
    }
    memcpy( values, m_curPos, length );
    m_curPos += length;
    return true;
}

bool
BufferDeserialize::peek( byte_t* value )
{
    if ( !hasBytes( sizeof( byte_t ) ) ) {
        return false;
    }
    *value = *m_curPos;
    return true;
}

bool
BufferDeserialize::peek( uint16_t* value, size_t offset )
{
    if ( !hasBytes( offset + sizeof( uint16_t ) ) ) {
        return false;
    }
    *value = ( m_curPos[offset] << 8 ) | m_curPos[offset + 1];
    return true;
}

bool
BufferDeserialize::skip( size_t length ) {
    if ( !hasBytes( length ) ) {
        return false;
    }
    m_curPos += length;
    return true;
}

bool
BufferDeserialize::hasBytes( size_t len ) const
{
    return static_cast<size_t>( m_curPos - m_buffer ) + len <= m_length;
}

  }
}
