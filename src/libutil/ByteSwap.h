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

#ifndef __TCAT_BYTESWAP__
#define __TCAT_BYTESWAP__

#include "tcattypes.h"

#include <byteswap.h>
#include <inttypes.h>
#include <endian.h>

#define BYTESWAP32_CONST(x) ((((x) & 0x000000FF) << 24) |   \
                             (((x) & 0x0000FF00) << 8) |    \
                             (((x) & 0x00FF0000) >> 8) |    \
                             (((x) & 0xFF000000) >> 24))

static inline uint64_t
ByteSwap64(uint64_t d)
{
    return bswap_64(d);
}

static inline uint32_t
ByteSwap32(uint32_t d)
{
    return bswap_32(d);
}

static inline uint16_t
ByteSwap16(uint16_t d)
{
    return bswap_16(d);
}

static inline void
byteSwapBlock(fb_quadlet_t *data, unsigned int nb_elements)
{
    unsigned int i=0;
    for(; i<nb_elements; i++) {
        *data = ByteSwap32(*data);
        data++;
    }
}

#if __BYTE_ORDER == __BIG_ENDIAN

// no-op for big endian machines

#define CONDSWAPTOBUS32_CONST(x) (x)

static inline uint32_t
CondSwapToBus32(uint32_t d)
{
    return d;
}

static inline uint16_t
CondSwapToBus16(uint16_t d)
{
    return d;
}

static inline uint32_t
CondSwapFromBus32(uint32_t d)
{
    return d;
}

static inline uint16_t
CondSwapFromBus16(uint16_t d)
{
    return d;
}

static inline void
byteSwapToBus(fb_quadlet_t *data, unsigned int nb_elements)
{
    return;
}

static inline void
byteSwapFromBus(fb_quadlet_t *data, unsigned int nb_elements)
{
    return;
}

#else

#define CONDSWAPTOBUS32_CONST BYTESWAP32_CONST

static inline uint32_t
CondSwapToBus32(uint32_t d)
{
    return ByteSwap32(d);
}

static inline uint16_t
CondSwapToBus16(uint16_t d)
{
    return ByteSwap16(d);
}

static inline uint32_t
CondSwapFromBus32(uint32_t d)
{
    return ByteSwap32(d);
}

static inline uint16_t
CondSwapFromBus16(uint16_t d)
{
    return ByteSwap16(d);
}

static inline void
byteSwapToBus(fb_quadlet_t *data, unsigned int nb_elements)
{
    byteSwapBlock(data, nb_elements);
}

static inline void
byteSwapFromBus(fb_quadlet_t *data, unsigned int nb_elements)
{
    byteSwapBlock(data, nb_elements);
}

#endif // byte order

#endif // h
