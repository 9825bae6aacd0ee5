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

#ifndef TCAT_FOCUSRITE_SPRO24DSP_H
#define TCAT_FOCUSRITE_SPRO24DSP_H

#include "debugmodule/debugmodule.h"

#include "tcat/tcat_eap.h"
#include "tcat/tcat_error.h"

/**
 *  Saffire Pro 24 DSP application space
 *    Changes take effect once the matching software notice is written.
 */
#define SPRO24DSP_SW_NOTICE_OFFSET          0x05ec

#define SPRO24DSP_DSP_ENABLE_OFFSET         0x0070
#define SPRO24DSP_DSP_ENABLE_NOTICE         0x1c

// low half for ch 0, high half for ch 1
#define SPRO24DSP_CH_STRIP_FLAG_OFFSET      0x0078
#define SPRO24DSP_CH_STRIP_FLAG_EQ_ENABLE   0x0001
#define SPRO24DSP_CH_STRIP_FLAG_COMP_ENABLE 0x0002
#define SPRO24DSP_CH_STRIP_FLAG_EQ_AFTER_COMP 0x0004
#define SPRO24DSP_CH_STRIP_FLAG_NOTICE      0x05

// eight coefficient blocks, the device uses block 2 and 3
#define SPRO24DSP_COEF_OFFSET               0x0190
#define SPRO24DSP_COEF_BLOCK_SIZE           0x88
#define SPRO24DSP_COEF_BLOCK_COMP           2
#define SPRO24DSP_COEF_BLOCK_EQ             2
#define SPRO24DSP_COEF_BLOCK_REVERB         3

#define SPRO24DSP_COMP_OUTPUT_OFFSET        0x04
#define SPRO24DSP_COMP_THRESHOLD_OFFSET     0x08
#define SPRO24DSP_COMP_RATIO_OFFSET         0x0c
#define SPRO24DSP_COMP_ATTACK_OFFSET        0x10
#define SPRO24DSP_COMP_RELEASE_OFFSET       0x14
#define SPRO24DSP_COMP_CH0_NOTICE           0x06
#define SPRO24DSP_COMP_CH1_NOTICE           0x07

#define SPRO24DSP_EQ_OUTPUT_OFFSET          0x18
#define SPRO24DSP_EQ_LOW_FREQ_OFFSET        0x20
#define SPRO24DSP_EQ_BAND_COEF_COUNT        5
#define SPRO24DSP_EQ_BAND_COUNT             4

#define SPRO24DSP_REVERB_SIZE_OFFSET        0x70
#define SPRO24DSP_REVERB_AIR_OFFSET         0x74
#define SPRO24DSP_REVERB_ENABLE_OFFSET      0x78
#define SPRO24DSP_REVERB_DISABLE_OFFSET     0x7c
#define SPRO24DSP_REVERB_PRE_FILTER_VALUE_OFFSET 0x80
#define SPRO24DSP_REVERB_PRE_FILTER_SIGN_OFFSET  0x84
#define SPRO24DSP_REVERB_NOTICE             0x1a

#define SPRO24DSP_COEF_PAIR_QUADS           ( SPRO24DSP_COEF_BLOCK_SIZE * 2 / 4 )
#define SPRO24DSP_COEF_BLOCK_QUADS          ( SPRO24DSP_COEF_BLOCK_SIZE / 4 )

namespace Tcat {
namespace Focusrite {

struct CompressorState {
    CompressorState();
    bool operator==( const CompressorState& other ) const;

    // 0.0 .. 64.0
    float output[2];
    // -1.25 .. 0.0
    float threshold[2];
    // 0.03125 .. 0.5
    float ratio[2];
    // -1.0 .. -0.9375
    float attack[2];
    // 0.9375 .. 1.0
    float release[2];
};

/**
 * @brief coefficients of one equalizer band
 *
 * Their meaning is not known, they are read and written verbatim.
 */
struct EqualizerBand {
    float coefs[SPRO24DSP_EQ_BAND_COEF_COUNT];
};

struct EqualizerState {
    EqualizerState();
    bool operator==( const EqualizerState& other ) const;

    // 0.0 .. 1.0
    float output[2];
    // low, low-middle, high-middle and high band per channel
    EqualizerBand bands[2][SPRO24DSP_EQ_BAND_COUNT];
};

struct ReverbState {
    ReverbState()
        : size( 0.0f ), air( 0.0f ), enabled( false ), pre_filter( 0.0f ) {};
    bool operator==( const ReverbState& other ) const
        { return size == other.size && air == other.air && enabled == other.enabled
                 && pre_filter == other.pre_filter; };

    float size;
    float air;
    bool enabled;
    // -1.0 .. 1.0, the sign selects high or low pass
    float pre_filter;
};

struct ChannelStripFlags {
    ChannelStripFlags();
    bool operator==( const ChannelStripFlags& other ) const;

    bool eq_after_comp[2];
    bool comp_enable[2];
    bool eq_enable[2];
};

fb_quadlet_t floatToQuadlet( float val );
float quadletToFloat( fb_quadlet_t quad );

/**
  @{
  @brief codecs for a pair of coefficient blocks in host order
  */
void buildCompressorState( const CompressorState& state,
                           fb_quadlet_t quads[SPRO24DSP_COEF_PAIR_QUADS] );
void parseCompressorState( const fb_quadlet_t quads[SPRO24DSP_COEF_PAIR_QUADS],
                           CompressorState& state );
void buildEqualizerState( const EqualizerState& state,
                          fb_quadlet_t quads[SPRO24DSP_COEF_PAIR_QUADS] );
void parseEqualizerState( const fb_quadlet_t quads[SPRO24DSP_COEF_PAIR_QUADS],
                          EqualizerState& state );
//@}
void buildReverbState( const ReverbState& state,
                       fb_quadlet_t quads[SPRO24DSP_COEF_BLOCK_QUADS] );
void parseReverbState( const fb_quadlet_t quads[SPRO24DSP_COEF_BLOCK_QUADS],
                       ReverbState& state );
fb_quadlet_t buildChannelStripFlags( const ChannelStripFlags& flags );
void parseChannelStripFlags( fb_quadlet_t quad, ChannelStripFlags& flags );

/**
 * @brief DSP effects of the Saffire Pro 24 DSP
 *
 * Every write sends only the quadlets that differ from the cached state,
 * then the software notices for the parameters involved.
 */
class SPro24DspEffects
{
public:
    SPro24DspEffects( EAP& eap );
    virtual ~SPro24DspEffects();

    enum eStatus cache();

    const ChannelStripFlags& getChannelStripFlags() const
        { return m_flags; };
    const CompressorState& getCompressor() const
        { return m_comp; };
    const EqualizerState& getEqualizer() const
        { return m_eq; };
    const ReverbState& getReverb() const
        { return m_reverb; };

    enum eStatus writeChannelStripFlags( const ChannelStripFlags& flags );
    enum eStatus writeCompressor( const CompressorState& state );
    enum eStatus writeEqualizer( const EqualizerState& state );
    enum eStatus writeReverb( const ReverbState& state );
    enum eStatus enableDsp( bool enable );

    void show();
    void setVerboseLevel( int l );

private:
    bool writeChangedQuadlets( unsigned int offset, const fb_quadlet_t* quads,
                               const fb_quadlet_t* old, size_t nb_quads, bool& changed );
    bool writeNotice( fb_quadlet_t notice );

    EAP& m_eap;
    ChannelStripFlags m_flags;
    CompressorState m_comp;
    EqualizerState m_eq;
    ReverbState m_reverb;

protected:
    DECLARE_DEBUG_MODULE;
};

} // namespace Focusrite
} // namespace Tcat

#endif // TCAT_FOCUSRITE_SPRO24DSP_H
