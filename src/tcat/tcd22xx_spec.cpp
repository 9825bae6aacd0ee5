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

#include "tcd22xx_spec.h"

#include <algorithm>
#include <sstream>

namespace Tcat {

static const unsigned int s_mixer_out_ports[TCAT_NB_RATE_MODES] = { 16, 16, 8 };
static const unsigned int s_adat_channels[TCAT_NB_RATE_MODES] = { 8, 4, 2 };

struct MixerInPort {
    enum eDstBlkId id;
    unsigned int count;
};
static const MixerInPort s_mixer_in_ports[] = {
    { eDB_MixerTx0, 16 },
    { eDB_MixerTx1, 2 },
};
#define NB_MIXER_IN_PORTS ( sizeof( s_mixer_in_ports ) / sizeof( s_mixer_in_ports[0] ) )

unsigned int
DeviceProfile::getAdatChannelCount( enum eRateMode mode ) const
{
    return s_adat_channels[mode];
}

unsigned int
DeviceProfile::getMixerOutPortCount( enum eRateMode mode ) const
{
    return s_mixer_out_ports[mode];
}

unsigned int
DeviceProfile::getMixerInPortCount() const
{
    unsigned int count = 0;
    for ( unsigned int i = 0; i < NB_MIXER_IN_PORTS; ++i ) {
        count += s_mixer_in_ports[i].count;
    }
    return count;
}

BlockPair
DeviceProfile::computeAvailRealBlkPair( enum eRateMode mode ) const
{
    BlockPair pair;

    const BlockInputVector& inputs = getInputs();
    for ( BlockInputVector::const_iterator it = inputs.begin(); it != inputs.end(); ++it ) {
        unsigned int offset = it->offset;
        unsigned int count = it->count;
        // the channels of a second optical interface follow the first one
        if ( it->id == eSB_Adat ) {
            offset = 0;
            for ( SrcBlkVector::const_iterator s = pair.srcs.begin(); s != pair.srcs.end(); ++s ) {
                if ( s->id == eSB_Adat ) {
                    offset++;
                }
            }
            count = getAdatChannelCount( mode );
        }
        for ( unsigned int ch = offset; ch < offset + count; ++ch ) {
            pair.srcs.push_back( SrcBlk( it->id, ch ) );
        }
    }

    const BlockOutputVector& outputs = getOutputs();
    for ( BlockOutputVector::const_iterator it = outputs.begin(); it != outputs.end(); ++it ) {
        unsigned int offset = it->offset;
        unsigned int count = it->count;
        if ( it->id == eDB_Adat ) {
            offset = 0;
            for ( DstBlkVector::const_iterator d = pair.dsts.begin(); d != pair.dsts.end(); ++d ) {
                if ( d->id == eDB_Adat ) {
                    offset++;
                }
            }
            count = getAdatChannelCount( mode );
        }
        for ( unsigned int ch = offset; ch < offset + count; ++ch ) {
            pair.dsts.push_back( DstBlk( it->id, ch ) );
        }
    }

    return pair;
}

BlockPair
DeviceProfile::computeAvailStreamBlkPair( const FormatEntryVector& tx_entries,
                                          const FormatEntryVector& rx_entries ) const
{
    static const enum eDstBlkId tx_ids[] = { eDB_Avs0, eDB_Avs1 };
    static const enum eSrcBlkId rx_ids[] = { eSB_Avs0, eSB_Avs1 };
    BlockPair pair;

    // the router knows two stream blocks per direction
    for ( unsigned int i = 0; i < tx_entries.size() && i < 2; ++i ) {
        for ( unsigned int ch = 0; ch < tx_entries[i].pcm_count; ++ch ) {
            pair.dsts.push_back( DstBlk( tx_ids[i], ch ) );
        }
    }
    for ( unsigned int i = 0; i < rx_entries.size() && i < 2; ++i ) {
        for ( unsigned int ch = 0; ch < rx_entries[i].pcm_count; ++ch ) {
            pair.srcs.push_back( SrcBlk( rx_ids[i], ch ) );
        }
    }

    return pair;
}

BlockPair
DeviceProfile::computeAvailMixerBlkPair( const ExtensionCaps& caps, enum eRateMode mode ) const
{
    BlockPair pair;

    unsigned int nb_outputs = std::min( caps.mixer.output_count, getMixerOutPortCount( mode ) );
    for ( unsigned int ch = 0; ch < nb_outputs; ++ch ) {
        pair.srcs.push_back( SrcBlk( eSB_Mixer, ch ) );
    }

    for ( unsigned int i = 0; i < NB_MIXER_IN_PORTS; ++i ) {
        for ( unsigned int ch = 0; ch < s_mixer_in_ports[i].count; ++ch ) {
            if ( pair.dsts.size() >= caps.mixer.input_count ) {
                return pair;
            }
            pair.dsts.push_back( DstBlk( s_mixer_in_ports[i].id, ch ) );
        }
    }

    return pair;
}

BlockPair
DeviceProfile::computeAvailBlkPair( const ExtensionCaps& caps, enum eRateMode mode,
                                    const StreamFormatConfig& streams ) const
{
    BlockPair pair = computeAvailRealBlkPair( mode );
    BlockPair stream = computeAvailStreamBlkPair( streams.tx_entries, streams.rx_entries );
    BlockPair mixer = computeAvailMixerBlkPair( caps, mode );

    pair.srcs.insert( pair.srcs.end(), stream.srcs.begin(), stream.srcs.end() );
    pair.srcs.insert( pair.srcs.end(), mixer.srcs.begin(), mixer.srcs.end() );
    pair.dsts.insert( pair.dsts.end(), stream.dsts.begin(), stream.dsts.end() );
    pair.dsts.insert( pair.dsts.end(), mixer.dsts.begin(), mixer.dsts.end() );
    return pair;
}

static std::string
formatLabel( const char* name, unsigned int ch )
{
    std::ostringstream ostr;
    ostr << name << "-" << ch + 1;
    return ostr.str();
}

std::string
DeviceProfile::srcBlkLabel( const SrcBlk& src, const SrcBlkVector& stream_srcs ) const
{
    const BlockInputVector& inputs = getInputs();
    for ( BlockInputVector::const_iterator it = inputs.begin(); it != inputs.end(); ++it ) {
        if ( it->id == src.id && src.ch >= it->offset && src.ch < it->offset + it->count
             && it->label ) {
            return formatLabel( it->label, src.ch - it->offset );
        }
    }

    const char* name;
    switch ( src.id ) {
    case eSB_Aes:   name = "S/PDIF"; break;
    case eSB_Adat:  name = "ADAT"; break;
    case eSB_Mixer: name = "Mixer"; break;
    case eSB_Ins0:  name = "Analog-A"; break;
    case eSB_Ins1:  name = "Analog-B"; break;
    case eSB_Avs0:
        name = "Stream";
        for ( SrcBlkVector::const_iterator it = stream_srcs.begin(); it != stream_srcs.end(); ++it ) {
            if ( it->id == eSB_Avs1 ) {
                name = "Stream-A";
                break;
            }
        }
        break;
    case eSB_Avs1:  name = "Stream-B"; break;
    default:        name = "Unknown"; break;
    }
    return formatLabel( name, src.ch );
}

std::string
DeviceProfile::dstBlkLabel( const DstBlk& dst, const DstBlkVector& stream_dsts ) const
{
    const BlockOutputVector& outputs = getOutputs();
    for ( BlockOutputVector::const_iterator it = outputs.begin(); it != outputs.end(); ++it ) {
        if ( it->id == dst.id && dst.ch >= it->offset && dst.ch < it->offset + it->count
             && it->label ) {
            return formatLabel( it->label, dst.ch - it->offset );
        }
    }

    const char* name;
    switch ( dst.id ) {
    case eDB_Aes:      name = "S/PDIF"; break;
    case eDB_Adat:     name = "ADAT"; break;
    case eDB_MixerTx0: name = "Mixer-A"; break;
    case eDB_MixerTx1: name = "Mixer-B"; break;
    case eDB_Ins0:     name = "Analog-A"; break;
    case eDB_Ins1:     name = "Analog-B"; break;
    case eDB_Avs0:
        name = "Stream";
        for ( DstBlkVector::const_iterator it = stream_dsts.begin(); it != stream_dsts.end(); ++it ) {
            if ( it->id == eDB_Avs1 ) {
                name = "Stream-A";
                break;
            }
        }
        break;
    case eDB_Avs1:     name = "Stream-B"; break;
    default:           name = "Unknown"; break;
    }
    return formatLabel( name, dst.ch );
}

void
DeviceProfile::refineRouterEntries( RouterEntryVector& entries, const BlockPair& avail ) const
{
    RouterEntryVector refined;
    for ( RouterEntryVector::const_iterator it = entries.begin(); it != entries.end(); ++it ) {
        if ( std::find( avail.srcs.begin(), avail.srcs.end(), it->src ) == avail.srcs.end() ) {
            continue;
        }
        if ( std::find( avail.dsts.begin(), avail.dsts.end(), it->dst ) == avail.dsts.end() ) {
            continue;
        }
        refined.push_back( *it );
    }

    const SrcBlkVector& fixed = getFixed();
    for ( unsigned int i = 0; i < fixed.size(); ++i ) {
        unsigned int pos = 0;
        while ( pos < refined.size() && refined[pos].src != fixed[i] ) {
            pos++;
        }
        if ( pos < refined.size() ) {
            // a duplicated fixed source stays where it was placed first
            if ( pos >= i ) {
                std::swap( refined[i], refined[pos] );
            }
        } else {
            refined.insert( refined.begin() + std::min<size_t>( i, refined.size() ),
                            RouterEntry( DstBlk::unassigned(), fixed[i] ) );
        }
    }

    entries.swap( refined );
}

StaticDeviceProfile::StaticDeviceProfile( const char* name,
                                          fb_quadlet_t vendor_id, fb_quadlet_t model_id,
                                          const BlockInput* inputs, size_t nb_inputs,
                                          const BlockOutput* outputs, size_t nb_outputs,
                                          const SrcBlk* fixed, size_t nb_fixed,
                                          const enum eClockSource* clock_sources,
                                          size_t nb_clock_sources )
    : m_name( name )
    , m_vendor_id( vendor_id )
    , m_model_id( model_id )
    , m_inputs( inputs, inputs + nb_inputs )
    , m_outputs( outputs, outputs + nb_outputs )
    , m_fixed( fixed, fixed + nb_fixed )
{
    if ( clock_sources ) {
        m_clock_source_override.assign( clock_sources, clock_sources + nb_clock_sources );
    }
}

} // namespace Tcat
