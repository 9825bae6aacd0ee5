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

#include "tcd22xx_router.h"

#include <algorithm>

namespace Tcat {

IMPL_DEBUG_MODULE( RouterEngine, RouterEngine, DEBUG_LEVEL_NORMAL );

const char*
routerGroupToString( enum eRouterGroup g )
{
    switch ( g ) {
    case eRG_Output: return "output";
    case eRG_Stream: return "stream";
    case eRG_Mixer:  return "mixer";
    default:         return "unknown";
    }
}

RouterEngine::RouterEngine( EAP& eap, const DeviceProfile& profile )
    : m_eap( eap )
    , m_profile( profile )
    , m_cached( false )
    , m_rate_mode( eRM_Low )
{
}

RouterEngine::~RouterEngine()
{
}

enum eStatus
RouterEngine::cache( enum eRateMode mode )
{
    StreamFormatConfig streams;
    if ( !m_eap.readCurrentStreamConfig( mode, streams ) ) {
        debugError( "Could not read stream formats at %s rate\n", rateModeToString( mode ) );
        return eS_IoError;
    }

    BlockPair real = m_profile.computeAvailRealBlkPair( mode );
    BlockPair stream = m_profile.computeAvailStreamBlkPair( streams.tx_entries, streams.rx_entries );
    BlockPair mixer = m_profile.computeAvailMixerBlkPair( m_eap.getCaps(), mode );

    RouterEntryVector entries;
    if ( !m_eap.readCurrentRouterEntries( mode, entries ) ) {
        debugError( "Could not read router entries at %s rate\n", rateModeToString( mode ) );
        return eS_IoError;
    }

    m_real = real;
    m_stream = stream;
    m_mixer = mixer;
    m_rate_mode = mode;

    if ( m_eap.getCaps().router.is_readonly ) {
        debugOutput( DEBUG_LEVEL_VERBOSE, "Router is read-only, keeping entries as they are\n" );
        m_profile.refineRouterEntries( entries, getAvailBlkPair() );
    } else {
        enum eStatus status = update( entries );
        if ( status != eS_Ok ) {
            m_cached = false;
            return status;
        }
    }

    m_entries = entries;
    m_cached = true;
    debugOutput( DEBUG_LEVEL_VERBOSE, "Cached %zd router entries at %s rate\n",
                 m_entries.size(), rateModeToString( mode ) );
    return eS_Ok;
}

BlockPair
RouterEngine::getAvailBlkPair() const
{
    BlockPair pair = m_real;
    pair.srcs.insert( pair.srcs.end(), m_stream.srcs.begin(), m_stream.srcs.end() );
    pair.srcs.insert( pair.srcs.end(), m_mixer.srcs.begin(), m_mixer.srcs.end() );
    pair.dsts.insert( pair.dsts.end(), m_stream.dsts.begin(), m_stream.dsts.end() );
    pair.dsts.insert( pair.dsts.end(), m_mixer.dsts.begin(), m_mixer.dsts.end() );
    return pair;
}

const DstBlkVector&
RouterEngine::getDestinations( enum eRouterGroup g ) const
{
    switch ( g ) {
    case eRG_Stream: return m_stream.dsts;
    case eRG_Mixer:  return m_mixer.dsts;
    default:         return m_real.dsts;
    }
}

SrcBlkVector
RouterEngine::getSources( enum eRouterGroup g ) const
{
    SrcBlkVector srcs = m_real.srcs;
    if ( g != eRG_Stream ) {
        srcs.insert( srcs.end(), m_stream.srcs.begin(), m_stream.srcs.end() );
    }
    // the mixer does not feed itself
    if ( g != eRG_Mixer ) {
        srcs.insert( srcs.end(), m_mixer.srcs.begin(), m_mixer.srcs.end() );
    }
    return srcs;
}

stringlist
RouterEngine::getDestinationLabels( enum eRouterGroup g ) const
{
    stringlist labels;
    const DstBlkVector& dsts = getDestinations( g );
    for ( DstBlkVector::const_iterator it = dsts.begin(); it != dsts.end(); ++it ) {
        labels.push_back( m_profile.dstBlkLabel( *it, m_stream.dsts ) );
    }
    return labels;
}

stringlist
RouterEngine::getSourceLabels( enum eRouterGroup g ) const
{
    stringlist labels;
    labels.push_back( TCAT_ROUTER_NONE_LABEL );
    SrcBlkVector srcs = getSources( g );
    for ( SrcBlkVector::const_iterator it = srcs.begin(); it != srcs.end(); ++it ) {
        labels.push_back( m_profile.srcBlkLabel( *it, m_stream.srcs ) );
    }
    return labels;
}

bool
RouterEngine::resolveSource( enum eRouterGroup g, unsigned int idx, SrcBlk& src ) const
{
    if ( idx == 0 ) {
        src = SrcBlk::unassigned();
        return true;
    }
    SrcBlkVector srcs = getSources( g );
    if ( idx > srcs.size() ) {
        return false;
    }
    src = srcs.at( idx - 1 );
    return true;
}

void
RouterEngine::readSelection( enum eRouterGroup g, std::vector<unsigned int>& values ) const
{
    const DstBlkVector& dsts = getDestinations( g );
    SrcBlkVector srcs = getSources( g );

    values.assign( dsts.size(), 0 );
    for ( unsigned int i = 0; i < dsts.size(); ++i ) {
        for ( RouterEntryVector::const_iterator it = m_entries.begin(); it != m_entries.end(); ++it ) {
            if ( it->dst != dsts.at( i ) ) {
                continue;
            }
            // a source that is not offered any more reads as none
            SrcBlkVector::const_iterator pos = std::find( srcs.begin(), srcs.end(), it->src );
            if ( pos != srcs.end() ) {
                values[i] = 1 + ( pos - srcs.begin() );
            }
            break;
        }
    }
}

enum eStatus
RouterEngine::writeSelection( enum eRouterGroup g, const std::vector<unsigned int>& values )
{
    const DstBlkVector& dsts = getDestinations( g );
    if ( values.size() != dsts.size() ) {
        debugError( "Expected %zd values for %s destinations, got %zd\n",
                    dsts.size(), routerGroupToString( g ), values.size() );
        return eS_InvalidArgument;
    }

    SrcBlkVector selected( values.size() );
    for ( unsigned int i = 0; i < values.size(); ++i ) {
        if ( !resolveSource( g, values.at( i ), selected[i] ) ) {
            debugError( "Source index %u out of range for %s destination %u\n",
                        values.at( i ), routerGroupToString( g ), i );
            return eS_InvalidArgument;
        }
    }

    std::vector<unsigned int> current;
    readSelection( g, current );
    if ( current == values ) {
        debugOutput( DEBUG_LEVEL_VERBOSE, "Selection of %s unchanged\n", routerGroupToString( g ) );
        return eS_Ok;
    }

    RouterEntryVector entries = m_entries;
    for ( unsigned int i = 0; i < dsts.size(); ++i ) {
        RouterEntryVector::iterator it = entries.begin();
        while ( it != entries.end() && it->dst != dsts.at( i ) ) {
            ++it;
        }
        if ( it != entries.end() ) {
            it->src = selected.at( i );
        } else {
            entries.push_back( RouterEntry( dsts.at( i ), selected.at( i ) ) );
        }
    }

    enum eStatus status = update( entries );
    if ( status == eS_Ok ) {
        m_entries = entries;
    }
    return status;
}

enum eStatus
RouterEngine::writeRoute( const DstBlk& dst, const SrcBlk& src )
{
    BlockPair avail = getAvailBlkPair();
    if ( std::find( avail.dsts.begin(), avail.dsts.end(), dst ) == avail.dsts.end() ) {
        debugError( "Destination %s:%u not available\n", dstBlkIdToString( dst.id ), dst.ch );
        return eS_InvalidArgument;
    }
    if ( !src.isUnassigned()
         && std::find( avail.srcs.begin(), avail.srcs.end(), src ) == avail.srcs.end() ) {
        debugError( "Source %s:%u not available\n", srcBlkIdToString( src.id ), src.ch );
        return eS_InvalidArgument;
    }

    RouterEntryVector entries = m_entries;
    RouterEntryVector::iterator it = entries.begin();
    while ( it != entries.end() && it->dst != dst ) {
        ++it;
    }
    if ( it != entries.end() ) {
        if ( it->src == src ) {
            return eS_Ok;
        }
        it->src = src;
    } else {
        if ( src.isUnassigned() ) {
            return eS_Ok;
        }
        entries.push_back( RouterEntry( dst, src ) );
    }

    enum eStatus status = update( entries );
    if ( status == eS_Ok ) {
        m_entries = entries;
    }
    return status;
}

enum eStatus
RouterEngine::writeEntries( const RouterEntryVector& entries )
{
    RouterEntryVector tmp = entries;
    enum eStatus status = update( tmp );
    if ( status == eS_Ok ) {
        m_entries = tmp;
    }
    return status;
}

enum eStatus
RouterEngine::update( RouterEntryVector& entries )
{
    m_profile.refineRouterEntries( entries, getAvailBlkPair() );

    unsigned int max = m_eap.getCaps().router.maximum_entry_count;
    if ( entries.size() > max ) {
        debugError( "The router takes at most %u entries, not %zd\n", max, entries.size() );
        return eS_InvalidArgument;
    }

    if ( !m_eap.writeRouterEntries( entries ) ) {
        debugError( "Could not write router entries\n" );
        return eS_IoError;
    }
    if ( !m_eap.loadRouter( m_rate_mode ) ) {
        debugError( "Could not load router at %s rate\n", rateModeToString( m_rate_mode ) );
        return eS_IoError;
    }
    return eS_Ok;
}

void
RouterEngine::show()
{
    printMessage( "Router at %s rate, %zd entries\n",
                  rateModeToString( m_rate_mode ), m_entries.size() );
    for ( RouterEntryVector::const_iterator it = m_entries.begin(); it != m_entries.end(); ++it ) {
        printMessage( "  %-16s <- %s\n",
                      it->dst.isUnassigned() ? "(meter)"
                          : m_profile.dstBlkLabel( it->dst, m_stream.dsts ).c_str(),
                      it->src.isUnassigned() ? TCAT_ROUTER_NONE_LABEL
                          : m_profile.srcBlkLabel( it->src, m_stream.srcs ).c_str() );
    }
}

void
RouterEngine::setVerboseLevel( int l )
{
    setDebugLevel( l );
}

} // namespace Tcat
