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

#include "tcat_protocol.h"

#include <cstring>

namespace Tcat {

enum eClockRate
clockRateFromCode( unsigned int code )
{
    if ( code <= eCR_None ) {
        return static_cast<enum eClockRate>( code );
    }
    return eCR_Reserved;
}

enum eClockSource
clockSourceFromCode( unsigned int code )
{
    if ( code <= eCS_Internal ) {
        return static_cast<enum eClockSource>( code );
    }
    return eCS_Reserved;
}

unsigned int
clockRateToFrequency( enum eClockRate r )
{
    switch ( r ) {
    case eCR_32000:  return 32000;
    case eCR_44100:  return 44100;
    case eCR_48000:  return 48000;
    case eCR_88200:  return 88200;
    case eCR_96000:  return 96000;
    case eCR_176400: return 176400;
    case eCR_192000: return 192000;
    default:         return 0;
    }
}

enum eClockRate
clockRateFromFrequency( unsigned int freq )
{
    switch ( freq ) {
    case 32000:  return eCR_32000;
    case 44100:  return eCR_44100;
    case 48000:  return eCR_48000;
    case 88200:  return eCR_88200;
    case 96000:  return eCR_96000;
    case 176400: return eCR_176400;
    case 192000: return eCR_192000;
    default:     return eCR_Reserved;
    }
}

enum eRateMode
rateModeFromFrequency( unsigned int freq )
{
    if ( freq <= 48000 ) {
        return eRM_Low;
    } else if ( freq <= 96000 ) {
        return eRM_Mid;
    } else {
        return eRM_High;
    }
}

enum eRateMode
rateModeFromClockRate( enum eClockRate r )
{
    switch ( r ) {
    case eCR_88200:
    case eCR_96000:
    case eCR_AnyMid:
        return eRM_Mid;
    case eCR_176400:
    case eCR_192000:
    case eCR_AnyHigh:
        return eRM_High;
    default:
        return eRM_Low;
    }
}

const char*
clockRateToString( enum eClockRate r )
{
    switch ( r ) {
    case eCR_32000:  return "32000";
    case eCR_44100:  return "44100";
    case eCR_48000:  return "48000";
    case eCR_88200:  return "88200";
    case eCR_96000:  return "96000";
    case eCR_176400: return "176400";
    case eCR_192000: return "192000";
    case eCR_AnyLow: return "Any-low";
    case eCR_AnyMid: return "Any-mid";
    case eCR_AnyHigh: return "Any-high";
    case eCR_None:   return "None";
    default:         return "Reserved";
    }
}

const char*
clockSourceToString( enum eClockSource s )
{
    switch ( s ) {
    case eCS_Aes1:      return "AES1";
    case eCS_Aes2:      return "AES2";
    case eCS_Aes3:      return "AES3";
    case eCS_Aes4:      return "AES4";
    case eCS_AesAny:    return "AES-any";
    case eCS_Adat:      return "ADAT";
    case eCS_Tdif:      return "TDIF";
    case eCS_WordClock: return "Word-clock";
    case eCS_Arx1:      return "Stream-1";
    case eCS_Arx2:      return "Stream-2";
    case eCS_Arx3:      return "Stream-3";
    case eCS_Arx4:      return "Stream-4";
    case eCS_Internal:  return "Internal";
    default:            return "Reserved";
    }
}

const char*
rateModeToString( enum eRateMode m )
{
    switch ( m ) {
    case eRM_Low:  return "low";
    case eRM_Mid:  return "middle";
    case eRM_High: return "high";
    default:       return "unknown";
    }
}

const char*
srcBlkIdToString( enum eSrcBlkId id )
{
    switch ( id ) {
    case eSB_Aes:        return "AES";
    case eSB_Adat:       return "ADAT";
    case eSB_Mixer:      return "Mixer";
    case eSB_Ins0:       return "InS0";
    case eSB_Ins1:       return "InS1";
    case eSB_ArmApr:     return "ARM";
    case eSB_Avs0:       return "AVS0";
    case eSB_Avs1:       return "AVS1";
    case eSB_Mute:       return "Mute";
    case eSB_Unassigned: return "Unassigned";
    default:             return "Reserved";
    }
}

const char*
dstBlkIdToString( enum eDstBlkId id )
{
    switch ( id ) {
    case eDB_Aes:        return "AES";
    case eDB_Adat:       return "ADAT";
    case eDB_MixerTx0:   return "MixerTx0";
    case eDB_MixerTx1:   return "MixerTx1";
    case eDB_Ins0:       return "InS0";
    case eDB_Ins1:       return "InS1";
    case eDB_ArmApb:     return "ARM";
    case eDB_Avs0:       return "AVS0";
    case eDB_Avs1:       return "AVS1";
    case eDB_Unassigned: return "Unassigned";
    default:             return "Reserved";
    }
}

fb_byte_t
SrcBlk::encode() const
{
    if ( id == eSB_Unassigned ) {
        return TCAT_BLK_UNASSIGNED;
    }
    return ( ( id << TCAT_BLK_ID_SHIFT ) & TCAT_BLK_ID_MASK ) | ( ch & TCAT_BLK_CH_MASK );
}

SrcBlk
SrcBlk::decode( fb_byte_t val )
{
    if ( val == TCAT_BLK_UNASSIGNED ) {
        return SrcBlk::unassigned();
    }
    return SrcBlk( static_cast<enum eSrcBlkId>( ( val & TCAT_BLK_ID_MASK ) >> TCAT_BLK_ID_SHIFT ),
                   val & TCAT_BLK_CH_MASK );
}

bool
SrcBlk::operator<( const SrcBlk& other ) const
{
    if ( id != other.id ) {
        return id < other.id;
    }
    return ch < other.ch;
}

fb_byte_t
DstBlk::encode() const
{
    if ( id == eDB_Unassigned ) {
        return TCAT_BLK_UNASSIGNED;
    }
    return ( ( id << TCAT_BLK_ID_SHIFT ) & TCAT_BLK_ID_MASK ) | ( ch & TCAT_BLK_CH_MASK );
}

DstBlk
DstBlk::decode( fb_byte_t val )
{
    if ( val == TCAT_BLK_UNASSIGNED ) {
        return DstBlk::unassigned();
    }
    return DstBlk( static_cast<enum eDstBlkId>( ( val & TCAT_BLK_ID_MASK ) >> TCAT_BLK_ID_SHIFT ),
                   val & TCAT_BLK_CH_MASK );
}

bool
DstBlk::operator<( const DstBlk& other ) const
{
    if ( id != other.id ) {
        return id < other.id;
    }
    return ch < other.ch;
}

fb_quadlet_t
RouterEntry::encode() const
{
    fb_quadlet_t val = dst.encode();
    val |= ( (fb_quadlet_t)src.encode() << TCAT_EAP_ROUTER_ENTRY_SRC_SHIFT );
    val |= ( (fb_quadlet_t)peak << TCAT_EAP_ROUTER_ENTRY_PEAK_SHIFT );
    return val;
}

RouterEntry
RouterEntry::decode( fb_quadlet_t val )
{
    return RouterEntry(
        DstBlk::decode( val & TCAT_EAP_ROUTER_ENTRY_DST_MASK ),
        SrcBlk::decode( ( val & TCAT_EAP_ROUTER_ENTRY_SRC_MASK ) >> TCAT_EAP_ROUTER_ENTRY_SRC_SHIFT ),
        ( val & TCAT_EAP_ROUTER_ENTRY_PEAK_MASK ) >> TCAT_EAP_ROUTER_ENTRY_PEAK_SHIFT );
}

bool
FormatEntry::operator==( const FormatEntry& other ) const
{
    return pcm_count == other.pcm_count
        && midi_count == other.midi_count
        && labels == other.labels
        && enable_ac3 == other.enable_ac3;
}

stringlist
parseLabels( const fb_quadlet_t* quads, size_t nb_quads )
{
    std::string in;
    for ( size_t i = 0; i < nb_quads; ++i ) {
        for ( int j = 0; j < 4; ++j ) {
            char c = ( quads[i] >> ( 8 * j ) ) & 0xff;
            if ( c == '\0' ) {
                i = nb_quads;
                break;
            }
            in += c;
        }
    }

    stringlist labels;
    size_t end = in.find( "\\\\" );
    if ( end == std::string::npos ) {
        // unterminated, keep what is there
        end = in.size();
    }
    in = in.substr( 0, end );
    if ( in.empty() ) {
        return labels;
    }
    return stringlist::splitString( in, "\\" );
}

bool
buildLabels( const stringlist& labels, fb_quadlet_t* quads, size_t nb_quads )
{
    std::string out;
    for ( stringlist::const_iterator it = labels.begin(); it != labels.end(); ++it ) {
        out += *it;
        out += '\\';
    }
    if ( labels.empty() ) {
        out += '\\';
    }
    out += '\\';

    if ( out.size() > nb_quads * 4 ) {
        return false;
    }

    memset( quads, 0, nb_quads * 4 );
    for ( size_t i = 0; i < out.size(); ++i ) {
        quads[i / 4] |= ( (fb_quadlet_t)(unsigned char)out[i] ) << ( 8 * ( i % 4 ) );
    }
    return true;
}

} // namespace Tcat
