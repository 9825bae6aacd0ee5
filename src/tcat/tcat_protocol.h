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

#ifndef TCAT_PROTOCOL_H
#define TCAT_PROTOCOL_H

#include "tcattypes.h"
#include "tcat_defines.h"

#include <string>
#include <vector>

namespace Tcat {

/**
 * @brief Nominal sampling rates, encoded as in the clock select register
 */
enum eClockRate {
    eCR_32000    = 0x00,
    eCR_44100    = 0x01,
    eCR_48000    = 0x02,
    eCR_88200    = 0x03,
    eCR_96000    = 0x04,
    eCR_176400   = 0x05,
    eCR_192000   = 0x06,
    eCR_AnyLow   = 0x07,
    eCR_AnyMid   = 0x08,
    eCR_AnyHigh  = 0x09,
    eCR_None     = 0x0A,
    eCR_Reserved = 0xFF,
};

/**
 * @brief Sampling clock sources, encoded as in the clock select register
 */
enum eClockSource {
    eCS_Aes1      = 0x00,
    eCS_Aes2      = 0x01,
    eCS_Aes3      = 0x02,
    eCS_Aes4      = 0x03,
    eCS_AesAny    = 0x04,
    eCS_Adat      = 0x05,
    eCS_Tdif      = 0x06,
    eCS_WordClock = 0x07,
    eCS_Arx1      = 0x08,
    eCS_Arx2      = 0x09,
    eCS_Arx3      = 0x0A,
    eCS_Arx4      = 0x0B,
    eCS_Internal  = 0x0C,
    eCS_Reserved  = 0xFF,
};

/**
 * @brief Coarse bucket of sampling rates
 *
 * The router and stream configuration is kept per mode since the
 * optical interfaces carry fewer channels at higher rates.
 */
enum eRateMode {
    eRM_Low = 0,
    eRM_Mid,
    eRM_High,
};

#define TCAT_NB_RATE_MODES 3

typedef std::vector<enum eClockRate> ClockRateVector;
typedef std::vector<enum eClockSource> ClockSourceVector;

enum eClockRate clockRateFromCode( unsigned int code );
enum eClockSource clockSourceFromCode( unsigned int code );

/// frequency in Hz, 0 for the wildcard and reserved codes
unsigned int clockRateToFrequency( enum eClockRate r );
enum eClockRate clockRateFromFrequency( unsigned int freq );

enum eRateMode rateModeFromFrequency( unsigned int freq );
enum eRateMode rateModeFromClockRate( enum eClockRate r );

const char* clockRateToString( enum eClockRate r );
const char* clockSourceToString( enum eClockSource s );
const char* rateModeToString( enum eRateMode m );

/**
 * @brief Function blocks feeding the router
 */
enum eSrcBlkId {
    eSB_Aes        = 0,
    eSB_Adat       = 1,
    eSB_Mixer      = 2,
    eSB_Ins0       = 4,
    eSB_Ins1       = 5,
    eSB_ArmApr     = 10,
    eSB_Avs0       = 11,
    eSB_Avs1       = 12,
    eSB_Mute       = 15,
    // not a wire value, encodes to TCAT_BLK_UNASSIGNED
    eSB_Unassigned = 0x100,
};

/**
 * @brief Function blocks fed by the router
 */
enum eDstBlkId {
    eDB_Aes        = 0,
    eDB_Adat       = 1,
    eDB_MixerTx0   = 2,
    eDB_MixerTx1   = 3,
    eDB_Ins0       = 4,
    eDB_Ins1       = 5,
    // undocumented, used by some firmwares for monitor outputs
    eDB_Reserved08 = 8,
    eDB_ArmApb     = 10,
    eDB_Avs0       = 11,
    eDB_Avs1       = 12,
    // not a wire value, encodes to TCAT_BLK_UNASSIGNED
    eDB_Unassigned = 0x100,
};

const char* srcBlkIdToString( enum eSrcBlkId id );
const char* dstBlkIdToString( enum eDstBlkId id );

/**
 * @brief One channel of a router source block
 */
struct SrcBlk {
    SrcBlk()
        : id( eSB_Unassigned ), ch( 0xff ) {};
    SrcBlk( enum eSrcBlkId i, uint8_t c )
        : id( i ), ch( c ) {};

    static SrcBlk unassigned()
        { return SrcBlk(); };
    bool isUnassigned() const
        { return id == eSB_Unassigned; };

    fb_byte_t encode() const;
    static SrcBlk decode( fb_byte_t val );

    bool operator==( const SrcBlk& other ) const
        { return id == other.id && ch == other.ch; };
    bool operator!=( const SrcBlk& other ) const
        { return !( *this == other ); };
    bool operator<( const SrcBlk& other ) const;

    enum eSrcBlkId id;
    uint8_t ch;
};

/**
 * @brief One channel of a router destination block
 */
struct DstBlk {
    DstBlk()
        : id( eDB_Unassigned ), ch( 0xff ) {};
    DstBlk( enum eDstBlkId i, uint8_t c )
        : id( i ), ch( c ) {};

    static DstBlk unassigned()
        { return DstBlk(); };
    bool isUnassigned() const
        { return id == eDB_Unassigned; };

    fb_byte_t encode() const;
    static DstBlk decode( fb_byte_t val );

    bool operator==( const DstBlk& other ) const
        { return id == other.id && ch == other.ch; };
    bool operator!=( const DstBlk& other ) const
        { return !( *this == other ); };
    bool operator<( const DstBlk& other ) const;

    enum eDstBlkId id;
    uint8_t ch;
};

typedef std::vector<SrcBlk> SrcBlkVector;
typedef std::vector<DstBlk> DstBlkVector;

/**
 * @brief One route, the peak field is only meaningful in the peak section
 */
struct RouterEntry {
    RouterEntry()
        : peak( 0 ) {};
    RouterEntry( const DstBlk& d, const SrcBlk& s, uint16_t p = 0 )
        : dst( d ), src( s ), peak( p ) {};

    fb_quadlet_t encode() const;
    static RouterEntry decode( fb_quadlet_t val );

    bool operator==( const RouterEntry& other ) const
        { return dst == other.dst && src == other.src && peak == other.peak; };
    bool operator!=( const RouterEntry& other ) const
        { return !( *this == other ); };

    DstBlk dst;
    SrcBlk src;
    uint16_t peak;
};

typedef std::vector<RouterEntry> RouterEntryVector;

/**
 * @brief Channel layout of one isochronous stream
 */
struct FormatEntry {
    FormatEntry()
        : pcm_count( 0 ), midi_count( 0 ), enable_ac3( 0 ) {};
    FormatEntry( unsigned int pcm, unsigned int midi )
        : pcm_count( pcm ), midi_count( midi ), enable_ac3( 0 ) {};

    bool operator==( const FormatEntry& other ) const;

    unsigned int pcm_count;
    unsigned int midi_count;
    stringlist labels;
    // bit i set when channel i carries IEC 61937 data
    uint32_t enable_ac3;
};

typedef std::vector<FormatEntry> FormatEntryVector;

/**
 * @brief decode a label list from host order quadlets
 *
 * Characters are packed least significant byte first, entries are
 * separated by a backslash and the list ends with a double backslash.
 */
stringlist parseLabels( const fb_quadlet_t* quads, size_t nb_quads );

/**
 * @brief encode a label list into host order quadlets
 * @return false if the list does not fit into nb_quads
 */
bool buildLabels( const stringlist& labels, fb_quadlet_t* quads, size_t nb_quads );

} // namespace Tcat

#endif // TCAT_PROTOCOL_H
