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

#include "studio.h"

#include <cstring>

namespace Tcat {
namespace TcElectronic {

IMPL_DEBUG_MODULE( StudioOutGroups, StudioOutGroups, DEBUG_LEVEL_NORMAL );

#define OUT_GROUP_ASSIGN_QUAD           0
#define OUT_GROUP_BASS_MANAGEMENT_QUAD  1
#define OUT_GROUP_SUB_CHANNEL_QUAD      3
#define OUT_GROUP_CROSS_OVER_QUAD       4
#define OUT_GROUP_MAIN_LEVEL_QUAD       5
#define OUT_GROUP_SUB_LEVEL_QUAD        6
#define OUT_GROUP_MAIN_FILTER_QUAD      7
#define OUT_GROUP_SUB_FILTER_QUAD       8

#define NB_PHYS_OUTS ( STUDIO_PHYS_OUT_PAIR_COUNT * 2 )

// unset frequencies read back as 0xff
#define OUT_GROUP_FREQ_UNSET            0xff

OutGroup::OutGroup()
    : assigned_phys_outs( NB_PHYS_OUTS, false )
    , bass_management( false )
    , sub_channel( -1 )
    , main_cross_over_freq( eCOF_50 )
    , main_level_to_sub( 0 )
    , sub_level_to_sub( 0 )
    , main_filter_for_main( OUT_GROUP_FREQ_UNSET )
    , main_filter_for_sub( OUT_GROUP_FREQ_UNSET )
{
}

bool
OutGroup::operator==( const OutGroup& other ) const
{
    return assigned_phys_outs == other.assigned_phys_outs
        && bass_management == other.bass_management
        && sub_channel == other.sub_channel
        && main_cross_over_freq == other.main_cross_over_freq
        && main_level_to_sub == other.main_level_to_sub
        && sub_level_to_sub == other.sub_level_to_sub
        && main_filter_for_main == other.main_filter_for_main
        && main_filter_for_sub == other.main_filter_for_sub;
}

unsigned int
countAssignedOutputs( const OutGroup& group )
{
    unsigned int count = 0;
    for ( std::vector<bool>::const_iterator it = group.assigned_phys_outs.begin();
          it != group.assigned_phys_outs.end(); ++it ) {
        if ( *it ) {
            count++;
        }
    }
    return count;
}

enum eStatus
buildOutGroup( const OutGroup& group, fb_quadlet_t quads[STUDIO_OUT_GROUP_QUADS] )
{
    if ( group.assigned_phys_outs.size() > NB_PHYS_OUTS ) {
        return eS_InvalidArgument;
    }
    if ( countAssignedOutputs( group ) > STUDIO_MAX_SURROUND_CHANNELS ) {
        return eS_InvalidArgument;
    }
    if ( group.sub_channel >= NB_PHYS_OUTS ) {
        return eS_InvalidArgument;
    }

    memset( quads, 0, STUDIO_OUT_GROUP_SIZE );

    fb_quadlet_t assigned = 0;
    for ( unsigned int i = 0; i < group.assigned_phys_outs.size(); ++i ) {
        if ( group.assigned_phys_outs[i] ) {
            assigned |= 1 << i;
        }
    }
    quads[OUT_GROUP_ASSIGN_QUAD] = assigned;
    quads[OUT_GROUP_BASS_MANAGEMENT_QUAD] = group.bass_management ? 1 : 0;
    quads[OUT_GROUP_SUB_CHANNEL_QUAD] = ( group.sub_channel < 0 ) ? 0 : ( 1 << group.sub_channel );
    quads[OUT_GROUP_CROSS_OVER_QUAD] = group.main_cross_over_freq;
    quads[OUT_GROUP_MAIN_LEVEL_QUAD] = (fb_quadlet_t)group.main_level_to_sub;
    quads[OUT_GROUP_SUB_LEVEL_QUAD] = (fb_quadlet_t)group.sub_level_to_sub;
    quads[OUT_GROUP_MAIN_FILTER_QUAD] = group.main_filter_for_main;
    quads[OUT_GROUP_SUB_FILTER_QUAD] = group.main_filter_for_sub;
    return eS_Ok;
}

void
parseOutGroup( const fb_quadlet_t quads[STUDIO_OUT_GROUP_QUADS], OutGroup& group )
{
    group.assigned_phys_outs.assign( NB_PHYS_OUTS, false );
    for ( unsigned int i = 0; i < NB_PHYS_OUTS; ++i ) {
        group.assigned_phys_outs[i] = ( quads[OUT_GROUP_ASSIGN_QUAD] & ( 1 << i ) ) != 0;
    }
    group.bass_management = quads[OUT_GROUP_BASS_MANAGEMENT_QUAD] != 0;

    group.sub_channel = -1;
    for ( int i = 0; i < NB_PHYS_OUTS; ++i ) {
        if ( quads[OUT_GROUP_SUB_CHANNEL_QUAD] & ( 1 << i ) ) {
            group.sub_channel = i;
            break;
        }
    }
    group.main_cross_over_freq = quads[OUT_GROUP_CROSS_OVER_QUAD];
    group.main_level_to_sub = (int32_t)quads[OUT_GROUP_MAIN_LEVEL_QUAD];
    group.sub_level_to_sub = (int32_t)quads[OUT_GROUP_SUB_LEVEL_QUAD];
    group.main_filter_for_main = quads[OUT_GROUP_MAIN_FILTER_QUAD];
    group.main_filter_for_sub = quads[OUT_GROUP_SUB_FILTER_QUAD];
}

const char*
crossOverFreqToString( uint32_t freq )
{
    switch ( freq ) {
    case eCOF_50:  return "50Hz";
    case eCOF_80:  return "80Hz";
    case eCOF_95:  return "95Hz";
    case eCOF_110: return "110Hz";
    case eCOF_115: return "115Hz";
    case eCOF_120: return "120Hz";
    default:       return "reserved";
    }
}

StudioOutGroups::StudioOutGroups( EAP& eap )
    : m_eap( eap )
    , m_groups( STUDIO_OUTPUT_GROUP_COUNT )
{
}

StudioOutGroups::~StudioOutGroups()
{
}

enum eStatus
StudioOutGroups::cache()
{
    fb_quadlet_t quads[STUDIO_OUT_GROUP_QUADS * STUDIO_OUTPUT_GROUP_COUNT];
    if ( !m_eap.readApplication( STUDIO_PHYS_OUT_GROUPS_OFFSET, quads, sizeof( quads ) ) ) {
        debugError( "Could not read output groups\n" );
        return eS_IoError;
    }
    for ( unsigned int i = 0; i < STUDIO_OUTPUT_GROUP_COUNT; ++i ) {
        parseOutGroup( quads + i * STUDIO_OUT_GROUP_QUADS, m_groups[i] );
    }
    return eS_Ok;
}

enum eStatus
StudioOutGroups::writeGroup( unsigned int idx, const OutGroup& group )
{
    if ( idx >= STUDIO_OUTPUT_GROUP_COUNT ) {
        debugError( "Invalid output group %u\n", idx );
        return eS_InvalidArgument;
    }

    fb_quadlet_t quads[STUDIO_OUT_GROUP_QUADS];
    if ( buildOutGroup( group, quads ) != eS_Ok ) {
        debugError( "Output group %u: %u outputs assigned, at most %d allowed\n",
                    idx, countAssignedOutputs( group ), STUDIO_MAX_SURROUND_CHANNELS );
        return eS_InvalidArgument;
    }
    fb_quadlet_t old[STUDIO_OUT_GROUP_QUADS];
    if ( buildOutGroup( m_groups[idx], old ) != eS_Ok ) {
        // the cached state came from the device, rewrite it all
        memset( old, 0xff, sizeof( old ) );
    }

    unsigned int base = STUDIO_PHYS_OUT_GROUPS_OFFSET + idx * STUDIO_OUT_GROUP_SIZE;
    for ( unsigned int i = 0; i < STUDIO_OUT_GROUP_QUADS; ++i ) {
        if ( quads[i] == old[i] ) {
            continue;
        }
        if ( !m_eap.writeApplication( base + i * 4, &quads[i], 4 ) ) {
            debugError( "Could not write output group %u\n", idx );
            return eS_IoError;
        }
    }
    m_groups[idx] = group;
    return eS_Ok;
}

void
StudioOutGroups::show()
{
    printMessage( "== Studio output groups ==\n" );
    for ( unsigned int i = 0; i < m_groups.size(); ++i ) {
        const OutGroup& g = m_groups[i];
        printMessage( " group %u: %u outputs, bass management %s, sub %d, cross over %s\n",
                      i, countAssignedOutputs( g ), g.bass_management ? "on" : "off",
                      g.sub_channel, crossOverFreqToString( g.main_cross_over_freq ) );
    }
}

void
StudioOutGroups::setVerboseLevel( int l )
{
    setDebugLevel( l );
}

} // namespace TcElectronic
} // namespace Tcat
