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

#include "spro24dsp.h"

#include <cstring>
#include <cmath>

namespace Tcat {
namespace Focusrite {

IMPL_DEBUG_MODULE( SPro24DspEffects, SPro24DspEffects, DEBUG_LEVEL_NORMAL );

#define COMP_OUTPUT_MIN         0.0f
#define COMP_OUTPUT_MAX         64.0f
#define COMP_THRESHOLD_MIN      ( -1.25f )
#define COMP_THRESHOLD_MAX      0.0f
#define COMP_RATIO_MIN          0.03125f
#define COMP_RATIO_MAX          0.5f
#define COMP_ATTACK_MIN         ( -1.0f )
#define COMP_ATTACK_MAX         ( -0.9375f )
#define COMP_RELEASE_MIN        0.9375f
#define COMP_RELEASE_MAX        1.0f
#define EQ_OUTPUT_MIN           0.0f
#define EQ_OUTPUT_MAX           1.0f
#define REVERB_SIZE_MIN         0.0f
#define REVERB_SIZE_MAX         1.0f
#define REVERB_AIR_MIN          0.0f
#define REVERB_AIR_MAX          1.0f
#define REVERB_PRE_FILTER_MIN   ( -1.0f )
#define REVERB_PRE_FILTER_MAX   1.0f

// per band, ch 0 then ch 1
static const fb_quadlet_t s_eq_output_notices[2] = { 0x09, 0x0a };
static const fb_quadlet_t s_eq_band_notices[SPRO24DSP_EQ_BAND_COUNT][2] = {
    { 0x0c, 0x0d },
    { 0x0f, 0x10 },
    { 0x12, 0x13 },
    { 0x15, 0x16 },
};

CompressorState::CompressorState()
{
    for ( int ch = 0; ch < 2; ++ch ) {
        output[ch] = 0.0f;
        threshold[ch] = 0.0f;
        ratio[ch] = 0.0f;
        attack[ch] = 0.0f;
        release[ch] = 0.0f;
    }
}

bool
CompressorState::operator==( const CompressorState& other ) const
{
    for ( int ch = 0; ch < 2; ++ch ) {
        if ( output[ch] != other.output[ch] || threshold[ch] != other.threshold[ch]
             || ratio[ch] != other.ratio[ch] || attack[ch] != other.attack[ch]
             || release[ch] != other.release[ch] ) {
            return false;
        }
    }
    return true;
}

EqualizerState::EqualizerState()
{
    memset( bands, 0, sizeof( bands ) );
    output[0] = 0.0f;
    output[1] = 0.0f;
}

bool
EqualizerState::operator==( const EqualizerState& other ) const
{
    if ( output[0] != other.output[0] || output[1] != other.output[1] ) {
        return false;
    }
    for ( int ch = 0; ch < 2; ++ch ) {
        for ( int b = 0; b < SPRO24DSP_EQ_BAND_COUNT; ++b ) {
            for ( int i = 0; i < SPRO24DSP_EQ_BAND_COEF_COUNT; ++i ) {
                if ( bands[ch][b].coefs[i] != other.bands[ch][b].coefs[i] ) {
                    return false;
                }
            }
        }
    }
    return true;
}

ChannelStripFlags::ChannelStripFlags()
{
    for ( int ch = 0; ch < 2; ++ch ) {
        eq_after_comp[ch] = false;
        comp_enable[ch] = false;
        eq_enable[ch] = false;
    }
}

bool
ChannelStripFlags::operator==( const ChannelStripFlags& other ) const
{
    return buildChannelStripFlags( *this ) == buildChannelStripFlags( other );
}

fb_quadlet_t
floatToQuadlet( float val )
{
    fb_quadlet_t quad;
    memcpy( &quad, &val, sizeof( quad ) );
    return quad;
}

float
quadletToFloat( fb_quadlet_t quad )
{
    float val;
    memcpy( &val, &quad, sizeof( val ) );
    return val;
}

void
buildCompressorState( const CompressorState& state,
                      fb_quadlet_t quads[SPRO24DSP_COEF_PAIR_QUADS] )
{
    for ( int ch = 0; ch < 2; ++ch ) {
        fb_quadlet_t* blk = quads + ch * SPRO24DSP_COEF_BLOCK_QUADS;
        blk[SPRO24DSP_COMP_OUTPUT_OFFSET / 4] = floatToQuadlet( state.output[ch] );
        blk[SPRO24DSP_COMP_THRESHOLD_OFFSET / 4] = floatToQuadlet( state.threshold[ch] );
        blk[SPRO24DSP_COMP_RATIO_OFFSET / 4] = floatToQuadlet( state.ratio[ch] );
        blk[SPRO24DSP_COMP_ATTACK_OFFSET / 4] = floatToQuadlet( state.attack[ch] );
        blk[SPRO24DSP_COMP_RELEASE_OFFSET / 4] = floatToQuadlet( state.release[ch] );
    }
}

void
parseCompressorState( const fb_quadlet_t quads[SPRO24DSP_COEF_PAIR_QUADS],
                      CompressorState& state )
{
    for ( int ch = 0; ch < 2; ++ch ) {
        const fb_quadlet_t* blk = quads + ch * SPRO24DSP_COEF_BLOCK_QUADS;
        state.output[ch] = quadletToFloat( blk[SPRO24DSP_COMP_OUTPUT_OFFSET / 4] );
        state.threshold[ch] = quadletToFloat( blk[SPRO24DSP_COMP_THRESHOLD_OFFSET / 4] );
        state.ratio[ch] = quadletToFloat( blk[SPRO24DSP_COMP_RATIO_OFFSET / 4] );
        state.attack[ch] = quadletToFloat( blk[SPRO24DSP_COMP_ATTACK_OFFSET / 4] );
        state.release[ch] = quadletToFloat( blk[SPRO24DSP_COMP_RELEASE_OFFSET / 4] );
    }
}

void
buildEqualizerState( const EqualizerState& state,
                     fb_quadlet_t quads[SPRO24DSP_COEF_PAIR_QUADS] )
{
    for ( int ch = 0; ch < 2; ++ch ) {
        fb_quadlet_t* blk = quads + ch * SPRO24DSP_COEF_BLOCK_QUADS;
        blk[SPRO24DSP_EQ_OUTPUT_OFFSET / 4] = floatToQuadlet( state.output[ch] );

        fb_quadlet_t* coefs = blk + SPRO24DSP_EQ_LOW_FREQ_OFFSET / 4;
        for ( int b = 0; b < SPRO24DSP_EQ_BAND_COUNT; ++b ) {
            for ( int i = 0; i < SPRO24DSP_EQ_BAND_COEF_COUNT; ++i ) {
                *coefs++ = floatToQuadlet( state.bands[ch][b].coefs[i] );
            }
        }
    }
}

void
parseEqualizerState( const fb_quadlet_t quads[SPRO24DSP_COEF_PAIR_QUADS],
                     EqualizerState& state )
{
    for ( int ch = 0; ch < 2; ++ch ) {
        const fb_quadlet_t* blk = quads + ch * SPRO24DSP_COEF_BLOCK_QUADS;
        state.output[ch] = quadletToFloat( blk[SPRO24DSP_EQ_OUTPUT_OFFSET / 4] );

        const fb_quadlet_t* coefs = blk + SPRO24DSP_EQ_LOW_FREQ_OFFSET / 4;
        for ( int b = 0; b < SPRO24DSP_EQ_BAND_COUNT; ++b ) {
            for ( int i = 0; i < SPRO24DSP_EQ_BAND_COEF_COUNT; ++i ) {
                state.bands[ch][b].coefs[i] = quadletToFloat( *coefs++ );
            }
        }
    }
}

void
buildReverbState( const ReverbState& state, fb_quadlet_t quads[SPRO24DSP_COEF_BLOCK_QUADS] )
{
    quads[SPRO24DSP_REVERB_SIZE_OFFSET / 4] = floatToQuadlet( state.size );
    quads[SPRO24DSP_REVERB_AIR_OFFSET / 4] = floatToQuadlet( state.air );
    quads[SPRO24DSP_REVERB_ENABLE_OFFSET / 4] = floatToQuadlet( state.enabled ? 1.0f : 0.0f );
    quads[SPRO24DSP_REVERB_DISABLE_OFFSET / 4] = floatToQuadlet( state.enabled ? 0.0f : 1.0f );
    quads[SPRO24DSP_REVERB_PRE_FILTER_VALUE_OFFSET / 4] =
        floatToQuadlet( std::fabs( state.pre_filter ) );
    quads[SPRO24DSP_REVERB_PRE_FILTER_SIGN_OFFSET / 4] =
        floatToQuadlet( state.pre_filter > 0.0f ? 1.0f : 0.0f );
}

void
parseReverbState( const fb_quadlet_t quads[SPRO24DSP_COEF_BLOCK_QUADS], ReverbState& state )
{
    state.size = quadletToFloat( quads[SPRO24DSP_REVERB_SIZE_OFFSET / 4] );
    state.air = quadletToFloat( quads[SPRO24DSP_REVERB_AIR_OFFSET / 4] );
    state.enabled = quadletToFloat( quads[SPRO24DSP_REVERB_ENABLE_OFFSET / 4] ) > 0.0f;

    float val = quadletToFloat( quads[SPRO24DSP_REVERB_PRE_FILTER_VALUE_OFFSET / 4] );
    float sign = quadletToFloat( quads[SPRO24DSP_REVERB_PRE_FILTER_SIGN_OFFSET / 4] );
    state.pre_filter = ( sign == 0.0f ) ? -val : val;
}

fb_quadlet_t
buildChannelStripFlags( const ChannelStripFlags& flags )
{
    fb_quadlet_t quad = 0;
    for ( int ch = 0; ch < 2; ++ch ) {
        fb_quadlet_t bits = 0;
        if ( flags.eq_after_comp[ch] ) {
            bits |= SPRO24DSP_CH_STRIP_FLAG_EQ_AFTER_COMP;
        }
        if ( flags.comp_enable[ch] ) {
            bits |= SPRO24DSP_CH_STRIP_FLAG_COMP_ENABLE;
        }
        if ( flags.eq_enable[ch] ) {
            bits |= SPRO24DSP_CH_STRIP_FLAG_EQ_ENABLE;
        }
        quad |= bits << ( 16 * ch );
    }
    return quad;
}

void
parseChannelStripFlags( fb_quadlet_t quad, ChannelStripFlags& flags )
{
    for ( int ch = 0; ch < 2; ++ch ) {
        fb_quadlet_t bits = ( quad >> ( 16 * ch ) ) & 0xffff;
        flags.eq_after_comp[ch] = ( bits & SPRO24DSP_CH_STRIP_FLAG_EQ_AFTER_COMP ) != 0;
        flags.comp_enable[ch] = ( bits & SPRO24DSP_CH_STRIP_FLAG_COMP_ENABLE ) != 0;
        flags.eq_enable[ch] = ( bits & SPRO24DSP_CH_STRIP_FLAG_EQ_ENABLE ) != 0;
    }
}

static bool
inRange( float val, float min, float max )
{
    return val >= min && val <= max;
}

SPro24DspEffects::SPro24DspEffects( EAP& eap )
    : m_eap( eap )
{
}

SPro24DspEffects::~SPro24DspEffects()
{
}

enum eStatus
SPro24DspEffects::cache()
{
    fb_quadlet_t flags;
    if ( !m_eap.readApplication( SPRO24DSP_CH_STRIP_FLAG_OFFSET, &flags, 4 ) ) {
        debugError( "Could not read channel strip flags\n" );
        return eS_IoError;
    }

    // compressor and equalizer share the pair, reverb lives in its second block
    fb_quadlet_t quads[SPRO24DSP_COEF_PAIR_QUADS];
    if ( !m_eap.readApplication( SPRO24DSP_COEF_OFFSET
                                 + SPRO24DSP_COEF_BLOCK_SIZE * SPRO24DSP_COEF_BLOCK_COMP,
                                 quads, sizeof( quads ) ) ) {
        debugError( "Could not read coefficients\n" );
        return eS_IoError;
    }

    parseChannelStripFlags( flags, m_flags );
    parseCompressorState( quads, m_comp );
    parseEqualizerState( quads, m_eq );
    parseReverbState( quads + SPRO24DSP_COEF_BLOCK_QUADS
                      * ( SPRO24DSP_COEF_BLOCK_REVERB - SPRO24DSP_COEF_BLOCK_COMP ), m_reverb );
    return eS_Ok;
}

bool
SPro24DspEffects::writeNotice( fb_quadlet_t notice )
{
    debugOutput( DEBUG_LEVEL_VERBOSE, "software notice 0x%02X\n", notice );
    if ( !m_eap.writeApplication( SPRO24DSP_SW_NOTICE_OFFSET, &notice, 4 ) ) {
        debugError( "Could not write software notice 0x%02X\n", notice );
        return false;
    }
    return true;
}

bool
SPro24DspEffects::writeChangedQuadlets( unsigned int offset, const fb_quadlet_t* quads,
                                        const fb_quadlet_t* old, size_t nb_quads, bool& changed )
{
    changed = false;
    for ( size_t i = 0; i < nb_quads; ++i ) {
        if ( quads[i] == old[i] ) {
            continue;
        }
        fb_quadlet_t quad = quads[i];
        if ( !m_eap.writeApplication( offset + i * 4, &quad, 4 ) ) {
            debugError( "Could not write coefficient at 0x%04zX\n", offset + i * 4 );
            return false;
        }
        changed = true;
    }
    return true;
}

enum eStatus
SPro24DspEffects::writeChannelStripFlags( const ChannelStripFlags& flags )
{
    fb_quadlet_t quad = buildChannelStripFlags( flags );
    if ( quad == buildChannelStripFlags( m_flags ) ) {
        return eS_Ok;
    }
    if ( !m_eap.writeApplication( SPRO24DSP_CH_STRIP_FLAG_OFFSET, &quad, 4 )
         || !writeNotice( SPRO24DSP_CH_STRIP_FLAG_NOTICE ) ) {
        return eS_IoError;
    }
    m_flags = flags;
    return eS_Ok;
}

enum eStatus
SPro24DspEffects::writeCompressor( const CompressorState& state )
{
    for ( int ch = 0; ch < 2; ++ch ) {
        if ( !inRange( state.output[ch], COMP_OUTPUT_MIN, COMP_OUTPUT_MAX )
             || !inRange( state.threshold[ch], COMP_THRESHOLD_MIN, COMP_THRESHOLD_MAX )
             || !inRange( state.ratio[ch], COMP_RATIO_MIN, COMP_RATIO_MAX )
             || !inRange( state.attack[ch], COMP_ATTACK_MIN, COMP_ATTACK_MAX )
             || !inRange( state.release[ch], COMP_RELEASE_MIN, COMP_RELEASE_MAX ) ) {
            debugError( "Compressor parameter of ch %d out of range\n", ch );
            return eS_InvalidArgument;
        }
    }

    fb_quadlet_t quads[SPRO24DSP_COEF_PAIR_QUADS];
    fb_quadlet_t old[SPRO24DSP_COEF_PAIR_QUADS];
    memset( quads, 0, sizeof( quads ) );
    memset( old, 0, sizeof( old ) );
    buildCompressorState( state, quads );
    buildCompressorState( m_comp, old );

    bool changed;
    if ( !writeChangedQuadlets( SPRO24DSP_COEF_OFFSET
                                + SPRO24DSP_COEF_BLOCK_SIZE * SPRO24DSP_COEF_BLOCK_COMP,
                                quads, old, SPRO24DSP_COEF_PAIR_QUADS, changed ) ) {
        return eS_IoError;
    }
    if ( changed ) {
        if ( !writeNotice( SPRO24DSP_COMP_CH0_NOTICE )
             || !writeNotice( SPRO24DSP_COMP_CH1_NOTICE ) ) {
            return eS_IoError;
        }
    }
    m_comp = state;
    return eS_Ok;
}

enum eStatus
SPro24DspEffects::writeEqualizer( const EqualizerState& state )
{
    for ( int ch = 0; ch < 2; ++ch ) {
        if ( !inRange( state.output[ch], EQ_OUTPUT_MIN, EQ_OUTPUT_MAX ) ) {
            debugError( "Equalizer output of ch %d out of range\n", ch );
            return eS_InvalidArgument;
        }
    }

    fb_quadlet_t quads[SPRO24DSP_COEF_PAIR_QUADS];
    fb_quadlet_t old[SPRO24DSP_COEF_PAIR_QUADS];
    memset( quads, 0, sizeof( quads ) );
    memset( old, 0, sizeof( old ) );
    buildEqualizerState( state, quads );
    buildEqualizerState( m_eq, old );

    bool changed;
    if ( !writeChangedQuadlets( SPRO24DSP_COEF_OFFSET
                                + SPRO24DSP_COEF_BLOCK_SIZE * SPRO24DSP_COEF_BLOCK_EQ,
                                quads, old, SPRO24DSP_COEF_PAIR_QUADS, changed ) ) {
        return eS_IoError;
    }
    if ( changed ) {
        for ( int ch = 0; ch < 2; ++ch ) {
            if ( !writeNotice( s_eq_output_notices[ch] ) ) {
                return eS_IoError;
            }
        }
        for ( int b = 0; b < SPRO24DSP_EQ_BAND_COUNT; ++b ) {
            for ( int ch = 0; ch < 2; ++ch ) {
                if ( !writeNotice( s_eq_band_notices[b][ch] ) ) {
                    return eS_IoError;
                }
            }
        }
    }
    m_eq = state;
    return eS_Ok;
}

enum eStatus
SPro24DspEffects::writeReverb( const ReverbState& state )
{
    if ( !inRange( state.size, REVERB_SIZE_MIN, REVERB_SIZE_MAX )
         || !inRange( state.air, REVERB_AIR_MIN, REVERB_AIR_MAX )
         || !inRange( state.pre_filter, REVERB_PRE_FILTER_MIN, REVERB_PRE_FILTER_MAX ) ) {
        debugError( "Reverb parameter out of range\n" );
        return eS_InvalidArgument;
    }

    fb_quadlet_t quads[SPRO24DSP_COEF_BLOCK_QUADS];
    fb_quadlet_t old[SPRO24DSP_COEF_BLOCK_QUADS];
    memset( quads, 0, sizeof( quads ) );
    memset( old, 0, sizeof( old ) );
    buildReverbState( state, quads );
    buildReverbState( m_reverb, old );

    bool changed;
    if ( !writeChangedQuadlets( SPRO24DSP_COEF_OFFSET
                                + SPRO24DSP_COEF_BLOCK_SIZE * SPRO24DSP_COEF_BLOCK_REVERB,
                                quads, old, SPRO24DSP_COEF_BLOCK_QUADS, changed ) ) {
        return eS_IoError;
    }
    if ( changed && !writeNotice( SPRO24DSP_REVERB_NOTICE ) ) {
        return eS_IoError;
    }
    m_reverb = state;
    return eS_Ok;
}

enum eStatus
SPro24DspEffects::enableDsp( bool enable )
{
    fb_quadlet_t quad = enable ? 1 : 0;
    if ( !m_eap.writeApplication( SPRO24DSP_DSP_ENABLE_OFFSET, &quad, 4 )
         || !writeNotice( SPRO24DSP_DSP_ENABLE_NOTICE ) ) {
        return eS_IoError;
    }
    return eS_Ok;
}

void
SPro24DspEffects::show()
{
    printMessage( "== Saffire Pro 24 DSP effects ==\n" );
    for ( int ch = 0; ch < 2; ++ch ) {
        printMessage( " ch %d: eq %s, comp %s, eq after comp %s\n", ch,
                      m_flags.eq_enable[ch] ? "on" : "off",
                      m_flags.comp_enable[ch] ? "on" : "off",
                      m_flags.eq_after_comp[ch] ? "yes" : "no" );
        printMessage( "  comp: output %f threshold %f ratio %f attack %f release %f\n",
                      m_comp.output[ch], m_comp.threshold[ch], m_comp.ratio[ch],
                      m_comp.attack[ch], m_comp.release[ch] );
        printMessage( "  eq output: %f\n", m_eq.output[ch] );
    }
    printMessage( " reverb: %s size %f air %f pre filter %f\n",
                  m_reverb.enabled ? "on" : "off", m_reverb.size, m_reverb.air,
                  m_reverb.pre_filter );
}

void
SPro24DspEffects::setVerboseLevel( int l )
{
    setDebugLevel( l );
}

} // namespace Focusrite
} // namespace Tcat
