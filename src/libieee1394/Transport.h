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

#ifndef IEEE1394_TRANSPORT_H
#define IEEE1394_TRANSPORT_H

#include "tcattypes.h"
#include "libutil/Mutex.h"

namespace Ieee1394 {

/**
 * @brief Asynchronous transaction primitives towards one device node
 *
 * All buffers carry quadlets in bus order. Every call is blocking and
 * either completes within the given timeout or fails.
 */
class Transport
{
public:
    Transport() {};
    virtual ~Transport() {};

    /**
     * @brief read a block of quadlets
     * @param addr register address
     * @param length number of quadlets
     * @param buffer receives length quadlets in bus order
     * @param timeout_ms transaction timeout
     * @return true on success
     */
    virtual bool read( fb_nodeaddr_t addr,
                       size_t length,
                       fb_quadlet_t* buffer,
                       unsigned int timeout_ms ) = 0;

    /**
     * @brief write a block of quadlets
     * @param addr register address
     * @param length number of quadlets
     * @param data length quadlets in bus order
     * @param timeout_ms transaction timeout
     * @return true on success
     */
    virtual bool write( fb_nodeaddr_t addr,
                        size_t length,
                        fb_quadlet_t* data,
                        unsigned int timeout_ms ) = 0;

    bool readQuadlet( fb_nodeaddr_t addr,
                      fb_quadlet_t* buffer,
                      unsigned int timeout_ms )
        { return read( addr, 1, buffer, timeout_ms ); };
    bool writeQuadlet( fb_nodeaddr_t addr,
                       fb_quadlet_t data,
                       unsigned int timeout_ms )
        { return write( addr, 1, &data, timeout_ms ); };

    /**
     * @brief send an FCP request and wait for the response
     *
     * The returned buffer stays valid until transactionBlockClose() is
     * called; every successful call has to be followed by one.
     *
     * @param buf request in bus order
     * @param len request length in quadlets
     * @param resp_len receives the response length in quadlets
     * @param timeout_ms transaction timeout
     * @return the response in bus order, NULL on failure
     */
    virtual fb_quadlet_t* transactionBlock( fb_quadlet_t* buf,
                                            int len,
                                            unsigned int* resp_len,
                                            unsigned int timeout_ms ) = 0;
    virtual bool transactionBlockClose() = 0;

    /**
     * @brief lock serializing write sequences against the device's own
     *        state changes
     */
    virtual Util::Mutex& getDeviceLock() = 0;

    virtual fb_nodeid_t getNodeId() = 0;
};

} // namespace Ieee1394

#endif // IEEE1394_TRANSPORT_H
