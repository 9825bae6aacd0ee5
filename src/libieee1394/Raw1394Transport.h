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

#ifndef IEEE1394_RAW1394TRANSPORT_H
#define IEEE1394_RAW1394TRANSPORT_H

#include "Transport.h"

#include "debugmodule/debugmodule.h"
#include "libutil/PosixMutex.h"

#include <libraw1394/raw1394.h>

namespace Ieee1394 {

/**
 * @brief Transport on top of libraw1394 and libavc1394
 */
class Raw1394Transport : public Transport
{
public:
    Raw1394Transport();
    virtual ~Raw1394Transport();

    bool initialize( int port, fb_nodeid_t nodeId );

    int getPort()
        { return m_port; };
    virtual fb_nodeid_t getNodeId()
        { return m_nodeId; };
    int getNodeCount();

    virtual bool read( fb_nodeaddr_t addr,
                       size_t length,
                       fb_quadlet_t* buffer,
                       unsigned int timeout_ms );
    virtual bool write( fb_nodeaddr_t addr,
                        size_t length,
                        fb_quadlet_t* data,
                        unsigned int timeout_ms );

    virtual fb_quadlet_t* transactionBlock( fb_quadlet_t* buf,
                                            int len,
                                            unsigned int* resp_len,
                                            unsigned int timeout_ms );
    virtual bool transactionBlockClose();

    virtual Util::Mutex& getDeviceLock()
        { return m_device_lock; };

    bool setSplitTimeoutUsecs( unsigned int timeout );
    int getSplitTimeoutUsecs();

    void setVerboseLevel( int l );

private:
    bool applyTimeout( unsigned int timeout_ms );
    bool readNoLock( fb_nodeaddr_t addr, size_t length, fb_quadlet_t* buffer );
    bool writeNoLock( fb_nodeaddr_t addr, size_t length, fb_quadlet_t* data );
    void printBuffer( unsigned int level, size_t length, fb_quadlet_t* buffer ) const;

    raw1394handle_t  m_handle;
    int              m_port;
    fb_nodeid_t      m_nodeId;
    unsigned int     m_timeout_ms;

    Util::PosixMutex m_handle_lock;
    Util::PosixMutex m_device_lock;

    DECLARE_DEBUG_MODULE;
};

} // namespace Ieee1394

#endif // IEEE1394_RAW1394TRANSPORT_H
