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

#include "Raw1394Transport.h"

#include "libutil/ByteSwap.h"

#include <libraw1394/csr.h>
#include <libavc1394/avc1394.h>

#include <netinet/in.h>
#include <errno.h>
#include <string.h>

#define RAW1394TRANSPORT_MAX_FIREWIRE_PORTS 4
#define RAW1394TRANSPORT_AVC_RETRIES        10

namespace Ieee1394 {

IMPL_DEBUG_MODULE( Raw1394Transport, Raw1394Transport, DEBUG_LEVEL_NORMAL );

Raw1394Transport::Raw1394Transport()
    : m_handle( 0 )
    , m_port( -1 )
    , m_nodeId( INVALID_NODE_ID )
    , m_timeout_ms( 0 )
    , m_handle_lock( "HANDLE" )
    , m_device_lock( "DEVICE", true )
{
}

Raw1394Transport::~Raw1394Transport()
{
    if ( m_handle ) {
        raw1394_destroy_handle( m_handle );
    }
}

bool
Raw1394Transport::initialize( int port, fb_nodeid_t nodeId )
{
    raw1394handle_t tmp_handle = raw1394_new_handle();
    if ( tmp_handle == NULL ) {
        debugError("Could not get libraw1394 handle: %s\n", strerror(errno));
        return false;
    }
    struct raw1394_portinfo pinf[RAW1394TRANSPORT_MAX_FIREWIRE_PORTS];
    int nb_ports = raw1394_get_port_info( tmp_handle, pinf, RAW1394TRANSPORT_MAX_FIREWIRE_PORTS );
    raw1394_destroy_handle( tmp_handle );

    if ( nb_ports < 0 ) {
        debugError("Failed to detect number of ports\n");
        return false;
    }
    if ( port + 1 > nb_ports ) {
        debugFatal("Requested port (%d) out of range (# ports: %d)\n", port, nb_ports);
        return false;
    }

    m_handle = raw1394_new_handle_on_port( port );
    if ( !m_handle ) {
        if ( !errno ) {
            debugFatal("libraw1394 not compatible\n");
        } else {
            debugFatal("Could not get 1394 handle: %s\n", strerror(errno) );
            debugFatal("Is ieee1394 and raw1394 driver loaded?\n");
        }
        return false;
    }
    m_port = port;
    m_nodeId = nodeId;

    debugOutput( DEBUG_LEVEL_VERBOSE, "Bound to node %d on port %d (%d nodes)\n",
                 m_nodeId, m_port, getNodeCount() );
    return true;
}

int
Raw1394Transport::getNodeCount()
{
    Util::MutexLockHelper lock( m_handle_lock );
    return raw1394_get_nodecount( m_handle );
}

bool
Raw1394Transport::applyTimeout( unsigned int timeout_ms )
{
    if ( timeout_ms == m_timeout_ms ) {
        return true;
    }
    if ( !setSplitTimeoutUsecs( timeout_ms * 1000 ) ) {
        debugWarning("Could not set split timeout to %u ms\n", timeout_ms);
        return false;
    }
    m_timeout_ms = timeout_ms;
    return true;
}

bool
Raw1394Transport::read( fb_nodeaddr_t addr,
                        size_t length,
                        fb_quadlet_t* buffer,
                        unsigned int timeout_ms )
{
    // a device that refuses the split timeout still answers with its default
    applyTimeout( timeout_ms );
    Util::MutexLockHelper lock( m_handle_lock );
    return readNoLock( addr, length, buffer );
}

bool
Raw1394Transport::readNoLock( fb_nodeaddr_t addr,
                              size_t length,
                              fb_quadlet_t* buffer )
{
    if ( m_handle == NULL || m_nodeId == INVALID_NODE_ID ) {
        debugWarning("operation on invalid node\n");
        return false;
    }
    if ( raw1394_read( m_handle, 0xffc0 | m_nodeId, addr, length*4, buffer ) == 0 ) {
        debugOutput(DEBUG_LEVEL_VERY_VERBOSE,
            "read: node 0x%hX, addr = 0x%016" PRIX64 ", length = %zd\n",
            m_nodeId, addr, length);
        printBuffer( DEBUG_LEVEL_VERY_VERBOSE, length, buffer );
        return true;
    } else {
        debugOutput(DEBUG_LEVEL_VERBOSE,
                    "raw1394_read failed: node 0x%hX, addr = 0x%016" PRIX64 ", length = %zd\n",
                    m_nodeId, addr, length);
        return false;
    }
}

bool
Raw1394Transport::write( fb_nodeaddr_t addr,
                         size_t length,
                         fb_quadlet_t* data,
                         unsigned int timeout_ms )
{
    applyTimeout( timeout_ms );
    Util::MutexLockHelper lock( m_handle_lock );
    return writeNoLock( addr, length, data );
}

bool
Raw1394Transport::writeNoLock( fb_nodeaddr_t addr,
                               size_t length,
                               fb_quadlet_t* data )
{
    if ( m_handle == NULL || m_nodeId == INVALID_NODE_ID ) {
        debugWarning("operation on invalid node\n");
        return false;
    }

    debugOutput(DEBUG_LEVEL_VERY_VERBOSE,
                "write: node 0x%hX, addr = 0x%016" PRIX64 ", length = %zd\n",
                m_nodeId, addr, length);
    printBuffer( DEBUG_LEVEL_VERY_VERBOSE, length, data );

    if ( raw1394_write( m_handle, 0xffc0 | m_nodeId, addr, length*4, data ) != 0 ) {
        debugOutput(DEBUG_LEVEL_VERBOSE,
                    "raw1394_write failed: node 0x%hX, addr = 0x%016" PRIX64 ", length = %zd\n",
                    m_nodeId, addr, length);
        return false;
    }
    return true;
}

fb_quadlet_t*
Raw1394Transport::transactionBlock( fb_quadlet_t* buf,
                                    int len,
                                    unsigned int* resp_len,
                                    unsigned int timeout_ms )
{
    if ( m_handle == NULL || m_nodeId == INVALID_NODE_ID ) {
        debugWarning("operation on invalid node\n");
        return NULL;
    }
    applyTimeout( timeout_ms );

    // NOTE: this expects a call to transactionBlockClose to unlock
    m_handle_lock.Lock();

    for (int i = 0; i < len; ++i) {
        buf[i] = ntohl( buf[i] );
    }

    debugOutputShort(DEBUG_LEVEL_VERY_VERBOSE, "  pre avc1394_transaction_block2\n" );
    printBuffer( DEBUG_LEVEL_VERY_VERBOSE, len, buf );

    fb_quadlet_t* result =
        avc1394_transaction_block2( m_handle,
                                    m_nodeId,
                                    buf,
                                    len,
                                    resp_len,
                                    RAW1394TRANSPORT_AVC_RETRIES );
    if ( result == NULL ) {
        debugWarning("FCP transaction failed\n");
        *resp_len = 0;
        avc1394_transaction_block_close( m_handle );
        m_handle_lock.Unlock();
        return NULL;
    }

    debugOutputShort(DEBUG_LEVEL_VERY_VERBOSE, "  post avc1394_transaction_block2\n" );
    printBuffer( DEBUG_LEVEL_VERY_VERBOSE, *resp_len, result );

    for ( unsigned int i = 0; i < *resp_len; ++i ) {
        result[i] = htonl( result[i] );
    }
    return result;
}

bool
Raw1394Transport::transactionBlockClose()
{
    avc1394_transaction_block_close( m_handle );
    m_handle_lock.Unlock();
    return true;
}

bool
Raw1394Transport::setSplitTimeoutUsecs( unsigned int timeout )
{
    Util::MutexLockHelper lock( m_handle_lock );
    debugOutput(DEBUG_LEVEL_VERBOSE, "setting SPLIT_TIMEOUT on node 0x%X to %uusecs...\n", m_nodeId, timeout);
    unsigned int secs = timeout / 1000000;
    unsigned int usecs = timeout % 1000000;

    quadlet_t split_timeout_hi = CondSwapToBus32(secs & 7);
    quadlet_t split_timeout_low = CondSwapToBus32(((usecs / 125) & 0x1FFF) << 19);

    if ( !writeNoLock( CSR_REGISTER_BASE + CSR_SPLIT_TIMEOUT_HI, 1, &split_timeout_hi ) ) {
        debugOutput(DEBUG_LEVEL_VERBOSE, "write of CSR_SPLIT_TIMEOUT_HI failed\n");
        return false;
    }
    if ( !writeNoLock( CSR_REGISTER_BASE + CSR_SPLIT_TIMEOUT_LO, 1, &split_timeout_low ) ) {
        debugOutput(DEBUG_LEVEL_VERBOSE, "write of CSR_SPLIT_TIMEOUT_LO failed\n");
        return false;
    }
    return true;
}

int
Raw1394Transport::getSplitTimeoutUsecs()
{
    Util::MutexLockHelper lock( m_handle_lock );

    quadlet_t split_timeout_hi = 0;
    quadlet_t split_timeout_low = 0;

    if ( !readNoLock( CSR_REGISTER_BASE + CSR_SPLIT_TIMEOUT_HI, 1, &split_timeout_hi ) ) {
        debugOutput(DEBUG_LEVEL_VERBOSE, "read of CSR_SPLIT_TIMEOUT_HI failed\n");
        return 0;
    }
    if ( !readNoLock( CSR_REGISTER_BASE + CSR_SPLIT_TIMEOUT_LO, 1, &split_timeout_low ) ) {
        debugOutput(DEBUG_LEVEL_VERBOSE, "read of CSR_SPLIT_TIMEOUT_LO failed\n");
        return 0;
    }

    split_timeout_hi = CondSwapFromBus32(split_timeout_hi);
    split_timeout_low = CondSwapFromBus32(split_timeout_low);

    return (split_timeout_hi & 7) * 1000000 + (split_timeout_low >> 19) * 125;
}

void
Raw1394Transport::setVerboseLevel( int l )
{
    setDebugLevel( l );
    m_handle_lock.setVerboseLevel( l );
    m_device_lock.setVerboseLevel( l );
}

void
Raw1394Transport::printBuffer( unsigned int level, size_t length, fb_quadlet_t* buffer ) const
{
    for ( unsigned int i=0; i < length; ++i ) {
        if ( ( i % 4 ) == 0 ) {
            if ( i > 0 ) {
                debugOutputShort(level,"\n");
            }
            debugOutputShort(level," %4d: ",i*4);
        }
        debugOutputShort(level,"%08X ",buffer[i]);
    }
    debugOutputShort(level,"\n");
}

} // namespace Ieee1394
