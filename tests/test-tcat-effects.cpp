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

#include "SpyTransport.h"
#include "TcatTestImage.h"

#include "tcat/tcat_device.h"
#include "tcat/tcat_eap.h"
#include "tcat/focusrite/spro24dsp.h"
#include "tcat/tcelectronic/studio.h"

#include <gtest/gtest.h>

using namespace Tcat;

class EffectsTest : public ::testing::Test
{
protected:
    EffectsTest()
        : m_image( m_transport )
        , m_device( m_transport )
        , m_eap( m_device )
        {}

    void init()
    {
        ASSERT_TRUE( m_device.init() );
        ASSERT_TRUE( m_eap.init() );
    }

    /// values written to the software notice register, in order
    std::vector<fb_quadlet_t> getNotices() const
    {
        std::vector<fb_quadlet_t> notices;
        const SpyTransport::WriteRecordVector& writes = m_transport.getWrites();
        for ( SpyTransport::WriteRecordVector::const_iterator it = writes.begin();
              it != writes.end(); ++it ) {
            if ( it->addr == TcatTestImage::appAddr( SPRO24DSP_SW_NOTICE_OFFSET ) ) {
                notices.push_back( it->values.at( 0 ) );
            }
        }
        return notices;
    }

    SpyTransport m_transport;
    TcatTestImage m_image;
    Device m_device;
    EAP m_eap;
};

static Focusrite::CompressorState
validCompressor()
{
    Focusrite::CompressorState state;
    for ( int ch = 0; ch < 2; ++ch ) {
        state.output[ch] = 1.0f;
        state.threshold[ch] = -0.5f;
        state.ratio[ch] = 0.25f;
        state.attack[ch] = -0.95f;
        state.release[ch] = 0.96f;
    }
    return state;
}

TEST( SPro24DspCodecTest, FloatQuadlets )
{
    EXPECT_EQ( 0x3f800000u, Focusrite::floatToQuadlet( 1.0f ) );
    EXPECT_EQ( 0xbf000000u, Focusrite::floatToQuadlet( -0.5f ) );
    EXPECT_FLOAT_EQ( 0.25f, Focusrite::quadletToFloat( 0x3e800000 ) );
}

TEST( SPro24DspCodecTest, ReverbPreFilterSign )
{
    Focusrite::ReverbState state;
    state.size = 0.5f;
    state.air = 0.25f;
    state.enabled = true;
    state.pre_filter = -0.75f;

    fb_quadlet_t quads[SPRO24DSP_COEF_BLOCK_QUADS];
    Focusrite::buildReverbState( state, quads );
    EXPECT_EQ( Focusrite::floatToQuadlet( 0.75f ), quads[SPRO24DSP_REVERB_PRE_FILTER_VALUE_OFFSET / 4] );
    EXPECT_EQ( Focusrite::floatToQuadlet( 0.0f ), quads[SPRO24DSP_REVERB_PRE_FILTER_SIGN_OFFSET / 4] );
    EXPECT_EQ( Focusrite::floatToQuadlet( 1.0f ), quads[SPRO24DSP_REVERB_ENABLE_OFFSET / 4] );
    EXPECT_EQ( Focusrite::floatToQuadlet( 0.0f ), quads[SPRO24DSP_REVERB_DISABLE_OFFSET / 4] );

    Focusrite::ReverbState parsed;
    Focusrite::parseReverbState( quads, parsed );
    EXPECT_EQ( state, parsed );
}

TEST( SPro24DspCodecTest, ChannelStripFlags )
{
    Focusrite::ChannelStripFlags flags;
    flags.eq_enable[0] = true;
    flags.comp_enable[0] = true;
    flags.eq_enable[1] = true;
    flags.eq_after_comp[1] = true;
    EXPECT_EQ( 0x00050003u, Focusrite::buildChannelStripFlags( flags ) );

    Focusrite::ChannelStripFlags parsed;
    Focusrite::parseChannelStripFlags( 0x00050003, parsed );
    EXPECT_EQ( flags, parsed );
}

TEST_F( EffectsTest, SPro24DspCache )
{
    m_transport.setQuadlet( TcatTestImage::appAddr( SPRO24DSP_CH_STRIP_FLAG_OFFSET ), 0x00000002 );
    fb_nodeaddr_t ch1_comp = SPRO24DSP_COEF_OFFSET
        + SPRO24DSP_COEF_BLOCK_SIZE * ( SPRO24DSP_COEF_BLOCK_COMP + 1 );
    m_transport.setQuadlet( TcatTestImage::appAddr( ch1_comp + SPRO24DSP_COMP_RATIO_OFFSET ),
                            Focusrite::floatToQuadlet( 0.125f ) );
    fb_nodeaddr_t reverb = SPRO24DSP_COEF_OFFSET
        + SPRO24DSP_COEF_BLOCK_SIZE * SPRO24DSP_COEF_BLOCK_REVERB;
    m_transport.setQuadlet( TcatTestImage::appAddr( reverb + SPRO24DSP_REVERB_SIZE_OFFSET ),
                            Focusrite::floatToQuadlet( 0.5f ) );
    init();

    Focusrite::SPro24DspEffects effects( m_eap );
    ASSERT_EQ( eS_Ok, effects.cache() );
    EXPECT_TRUE( effects.getChannelStripFlags().comp_enable[0] );
    EXPECT_FALSE( effects.getChannelStripFlags().eq_enable[0] );
    EXPECT_FLOAT_EQ( 0.125f, effects.getCompressor().ratio[1] );
    EXPECT_FLOAT_EQ( 0.5f, effects.getReverb().size );
}

TEST_F( EffectsTest, SPro24DspChannelStripNotice )
{
    init();
    Focusrite::SPro24DspEffects effects( m_eap );
    ASSERT_EQ( eS_Ok, effects.cache() );
    m_transport.resetCounters();

    Focusrite::ChannelStripFlags flags = effects.getChannelStripFlags();
    EXPECT_EQ( eS_Ok, effects.writeChannelStripFlags( flags ) );
    EXPECT_EQ( 0u, m_transport.getWriteCount() );

    flags.eq_enable[1] = true;
    ASSERT_EQ( eS_Ok, effects.writeChannelStripFlags( flags ) );
    EXPECT_EQ( 0x00010000u, m_transport.getQuadlet(
        TcatTestImage::appAddr( SPRO24DSP_CH_STRIP_FLAG_OFFSET ) ) );
    std::vector<fb_quadlet_t> notices = getNotices();
    ASSERT_EQ( 1u, notices.size() );
    EXPECT_EQ( (fb_quadlet_t)SPRO24DSP_CH_STRIP_FLAG_NOTICE, notices[0] );
}

TEST_F( EffectsTest, SPro24DspCompressor )
{
    init();
    Focusrite::SPro24DspEffects effects( m_eap );
    ASSERT_EQ( eS_Ok, effects.cache() );
    m_transport.resetCounters();

    Focusrite::CompressorState state = validCompressor();
    state.ratio[0] = 0.6f;
    EXPECT_EQ( eS_InvalidArgument, effects.writeCompressor( state ) );
    EXPECT_EQ( 0u, m_transport.getWriteCount() );

    state = validCompressor();
    ASSERT_EQ( eS_Ok, effects.writeCompressor( state ) );
    // five parameters per channel, then both notices
    EXPECT_EQ( 12u, m_transport.getWriteCount() );
    std::vector<fb_quadlet_t> notices = getNotices();
    ASSERT_EQ( 2u, notices.size() );
    EXPECT_EQ( (fb_quadlet_t)SPRO24DSP_COMP_CH0_NOTICE, notices[0] );
    EXPECT_EQ( (fb_quadlet_t)SPRO24DSP_COMP_CH1_NOTICE, notices[1] );

    fb_nodeaddr_t ch0_comp = SPRO24DSP_COEF_OFFSET
        + SPRO24DSP_COEF_BLOCK_SIZE * SPRO24DSP_COEF_BLOCK_COMP;
    EXPECT_EQ( Focusrite::floatToQuadlet( 0.25f ), m_transport.getQuadlet(
        TcatTestImage::appAddr( ch0_comp + SPRO24DSP_COMP_RATIO_OFFSET ) ) );

    // a second identical write sends nothing, not even a notice
    m_transport.resetCounters();
    ASSERT_EQ( eS_Ok, effects.writeCompressor( state ) );
    EXPECT_EQ( 0u, m_transport.getWriteCount() );
}

TEST_F( EffectsTest, SPro24DspEqualizerNotices )
{
    init();
    Focusrite::SPro24DspEffects effects( m_eap );
    ASSERT_EQ( eS_Ok, effects.cache() );
    m_transport.resetCounters();

    Focusrite::EqualizerState state = effects.getEqualizer();
    state.bands[1][0].coefs[2] = 0.5f;
    state.output[1] = 2.0f;
    EXPECT_EQ( eS_InvalidArgument, effects.writeEqualizer( state ) );

    state.output[1] = 1.0f;
    ASSERT_EQ( eS_Ok, effects.writeEqualizer( state ) );

    static const fb_quadlet_t expected[] = {
        0x09, 0x0a, 0x0c, 0x0d, 0x0f, 0x10, 0x12, 0x13, 0x15, 0x16,
    };
    std::vector<fb_quadlet_t> notices = getNotices();
    EXPECT_EQ( std::vector<fb_quadlet_t>( expected, expected + sizeof( expected ) / 4 ), notices );
    // output and one coefficient of ch 1
    EXPECT_EQ( 2u + notices.size(), m_transport.getWriteCount() );
}

TEST_F( EffectsTest, SPro24DspReverbAndEnable )
{
    init();
    Focusrite::SPro24DspEffects effects( m_eap );
    ASSERT_EQ( eS_Ok, effects.cache() );
    m_transport.resetCounters();

    Focusrite::ReverbState state;
    state.size = 1.5f;
    EXPECT_EQ( eS_InvalidArgument, effects.writeReverb( state ) );

    state.size = 0.75f;
    state.enabled = true;
    ASSERT_EQ( eS_Ok, effects.writeReverb( state ) );
    std::vector<fb_quadlet_t> notices = getNotices();
    ASSERT_EQ( 1u, notices.size() );
    EXPECT_EQ( (fb_quadlet_t)SPRO24DSP_REVERB_NOTICE, notices[0] );
    EXPECT_EQ( state, effects.getReverb() );

    m_transport.resetCounters();
    ASSERT_EQ( eS_Ok, effects.enableDsp( true ) );
    EXPECT_EQ( 1u, m_transport.getQuadlet( TcatTestImage::appAddr( SPRO24DSP_DSP_ENABLE_OFFSET ) ) );
    notices = getNotices();
    ASSERT_EQ( 1u, notices.size() );
    EXPECT_EQ( (fb_quadlet_t)SPRO24DSP_DSP_ENABLE_NOTICE, notices[0] );
}

TEST( StudioCodecTest, SurroundLimit )
{
    TcElectronic::OutGroup group;
    for ( unsigned int i = 0; i < STUDIO_MAX_SURROUND_CHANNELS; ++i ) {
        group.assigned_phys_outs[i] = true;
    }
    fb_quadlet_t quads[STUDIO_OUT_GROUP_QUADS];
    ASSERT_EQ( eS_Ok, TcElectronic::buildOutGroup( group, quads ) );
    EXPECT_EQ( 0x000000ffu, quads[0] );

    group.assigned_phys_outs[STUDIO_MAX_SURROUND_CHANNELS] = true;
    EXPECT_EQ( eS_InvalidArgument, TcElectronic::buildOutGroup( group, quads ) );

    group.assigned_phys_outs[STUDIO_MAX_SURROUND_CHANNELS] = false;
    group.sub_channel = STUDIO_PHYS_OUT_PAIR_COUNT * 2;
    EXPECT_EQ( eS_InvalidArgument, TcElectronic::buildOutGroup( group, quads ) );
}

TEST( StudioCodecTest, ReservedFrequencySurvives )
{
    fb_quadlet_t quads[STUDIO_OUT_GROUP_QUADS] = { 0x3, 1, 0, 0x2, 0x17, 0xfffffffa, 4, 1, 2 };
    TcElectronic::OutGroup group;
    TcElectronic::parseOutGroup( quads, group );

    EXPECT_EQ( 2u, TcElectronic::countAssignedOutputs( group ) );
    EXPECT_TRUE( group.bass_management );
    EXPECT_EQ( 1, group.sub_channel );
    EXPECT_EQ( 0x17u, group.main_cross_over_freq );
    EXPECT_STREQ( "reserved", TcElectronic::crossOverFreqToString( group.main_cross_over_freq ) );
    EXPECT_EQ( -6, group.main_level_to_sub );

    fb_quadlet_t built[STUDIO_OUT_GROUP_QUADS];
    ASSERT_EQ( eS_Ok, TcElectronic::buildOutGroup( group, built ) );
    for ( unsigned int i = 0; i < STUDIO_OUT_GROUP_QUADS; ++i ) {
        EXPECT_EQ( quads[i], built[i] );
    }
}

TEST_F( EffectsTest, StudioWriteGroup )
{
    // second group: outputs 0 and 1, cross over at 95 Hz
    fb_nodeaddr_t group1 = STUDIO_PHYS_OUT_GROUPS_OFFSET + STUDIO_OUT_GROUP_SIZE;
    m_transport.setQuadlet( TcatTestImage::appAddr( group1 ), 0x3 );
    m_transport.setQuadlet( TcatTestImage::appAddr( group1 + 16 ), TcElectronic::eCOF_95 );
    init();

    TcElectronic::StudioOutGroups groups( m_eap );
    ASSERT_EQ( eS_Ok, groups.cache() );
    ASSERT_EQ( 3u, groups.getGroups().size() );
    EXPECT_EQ( 2u, TcElectronic::countAssignedOutputs( groups.getGroups()[1] ) );
    EXPECT_EQ( (uint32_t)TcElectronic::eCOF_95, groups.getGroups()[1].main_cross_over_freq );
    m_transport.resetCounters();

    TcElectronic::OutGroup group = groups.getGroups()[0];
    for ( unsigned int i = 0; i < 6; ++i ) {
        group.assigned_phys_outs[i] = true;
    }
    group.bass_management = true;
    group.sub_channel = 5;
    ASSERT_EQ( eS_Ok, groups.writeGroup( 0, group ) );

    // assignment, bass management and sub channel
    EXPECT_EQ( 3u, m_transport.getWriteCount() );
    fb_nodeaddr_t group0 = STUDIO_PHYS_OUT_GROUPS_OFFSET;
    EXPECT_EQ( 0x3fu, m_transport.getQuadlet( TcatTestImage::appAddr( group0 ) ) );
    EXPECT_EQ( 1u, m_transport.getQuadlet( TcatTestImage::appAddr( group0 + 4 ) ) );
    EXPECT_EQ( 0x20u, m_transport.getQuadlet( TcatTestImage::appAddr( group0 + 12 ) ) );
    EXPECT_EQ( group, groups.getGroups()[0] );
}

TEST_F( EffectsTest, StudioRejectsTooManyOutputs )
{
    init();
    TcElectronic::StudioOutGroups groups( m_eap );
    ASSERT_EQ( eS_Ok, groups.cache() );
    m_transport.resetCounters();

    TcElectronic::OutGroup group = groups.getGroups()[2];
    for ( unsigned int i = 0; i < STUDIO_MAX_SURROUND_CHANNELS + 1; ++i ) {
        group.assigned_phys_outs[i] = true;
    }
    EXPECT_EQ( eS_InvalidArgument, groups.writeGroup( 2, group ) );
    EXPECT_EQ( eS_InvalidArgument, groups.writeGroup( STUDIO_OUTPUT_GROUP_COUNT,
                                                      groups.getGroups()[0] ) );
    EXPECT_EQ( 0u, m_transport.getWriteCount() );
    EXPECT_EQ( 0u, TcElectronic::countAssignedOutputs( groups.getGroups()[2] ) );
}
