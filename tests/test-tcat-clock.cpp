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

#include "tcat/tcat_clock.h"
#include "tcat/tcat_device.h"
#include "tcat/tcat_eap.h"

#include <gtest/gtest.h>

#include <algorithm>

using namespace Tcat;

class ClockEngineTest : public ::testing::Test
{
protected:
    ClockEngineTest()
        : m_image( m_transport )
        , m_device( m_transport )
        , m_clock( m_device )
        {}

    void init()
    {
        ASSERT_TRUE( m_device.init() );
        ASSERT_EQ( eS_Ok, m_clock.cache() );
        m_transport.resetCounters();
    }

    SpyTransport m_transport;
    TcatTestImage m_image;
    Device m_device;
    ClockEngine m_clock;
};

TEST_F( ClockEngineTest, Capabilities )
{
    init();

    const ClockRateVector& rates = m_clock.getRates();
    ASSERT_EQ( 7u, rates.size() );
    EXPECT_EQ( eCR_32000, rates.front() );
    EXPECT_EQ( eCR_192000, rates.back() );

    const ClockSourceVector& srcs = m_clock.getSources();
    ASSERT_EQ( 4u, srcs.size() );
    EXPECT_EQ( eCS_Aes1, srcs[0] );
    EXPECT_EQ( eCS_Adat, srcs[1] );
    EXPECT_EQ( eCS_WordClock, srcs[2] );
    EXPECT_EQ( eCS_Internal, srcs[3] );

    stringlist labels = m_clock.getSourceLabels();
    ASSERT_EQ( 4u, labels.size() );
    EXPECT_EQ( "S/PDIF", labels[0] );
    EXPECT_EQ( "Word Clock", labels[2] );

    unsigned int idx;
    ASSERT_TRUE( m_clock.readRateIndex( idx ) );
    EXPECT_EQ( 2u, idx );
    ASSERT_TRUE( m_clock.readSourceIndex( idx ) );
    EXPECT_EQ( 3u, idx );
    EXPECT_EQ( 48000u, m_clock.getCurrentRate() );
    EXPECT_EQ( eRM_Low, m_clock.getRateMode() );
}

TEST_F( ClockEngineTest, StreamSourcesAreNotSelectable )
{
    // the first stream source is announced, its label says "unused"
    m_image.setClockCaps( 0x0000007f, 0x11a1 );
    init();

    const ClockSourceVector& srcs = m_clock.getSources();
    EXPECT_EQ( 4u, srcs.size() );
    EXPECT_TRUE( std::find( srcs.begin(), srcs.end(), eCS_Arx1 ) == srcs.end() );
    EXPECT_EQ( "Stream-1", m_clock.getSourceLabel( eCS_Arx1 ) );
}

TEST_F( ClockEngineTest, UnusedLabelHidesSource )
{
    stringlist labels;
    labels.push_back( "S/PDIF" );
    labels.push_back( "unused" );
    labels.push_back( "unused" );
    labels.push_back( "unused" );
    labels.push_back( "unused" );
    labels.push_back( "Unused" );
    labels.push_back( "unused" );
    labels.push_back( "Word Clock" );
    labels.push_back( "unused" );
    labels.push_back( "unused" );
    labels.push_back( "unused" );
    labels.push_back( "unused" );
    labels.push_back( "Internal" );
    m_image.setClockSourceLabels( labels );
    init();

    const ClockSourceVector& srcs = m_clock.getSources();
    ASSERT_EQ( 3u, srcs.size() );
    EXPECT_EQ( eCS_WordClock, srcs[1] );
}

TEST_F( ClockEngineTest, SourceOverride )
{
    ClockSourceVector srcs;
    srcs.push_back( eCS_Aes1 );
    srcs.push_back( eCS_Internal );
    m_device.setAvailableClockSourceOverride( srcs );
    init();

    EXPECT_EQ( srcs, m_clock.getSources() );
    unsigned int idx;
    ASSERT_TRUE( m_clock.readSourceIndex( idx ) );
    EXPECT_EQ( 1u, idx );
}

TEST_F( ClockEngineTest, LegacyGlobalSection )
{
    m_transport.setQuadlet( TcatTestImage::baseAddr( TCAT_REGISTER_GLOBAL_PAR_SPACE_SZ ),
                            TCAT_GLOBAL_LEGACY_SIZE / 4 );
    init();

    ASSERT_EQ( 2u, m_clock.getRates().size() );
    EXPECT_EQ( eCR_44100, m_clock.getRates()[0] );
    ASSERT_EQ( 1u, m_clock.getSources().size() );
    EXPECT_EQ( eCS_Internal, m_clock.getSources()[0] );
}

TEST_F( ClockEngineTest, GlobalSectionTooSmall )
{
    m_transport.setQuadlet( TcatTestImage::baseAddr( TCAT_REGISTER_GLOBAL_PAR_SPACE_SZ ), 4 );
    EXPECT_FALSE( m_device.init() );
}

TEST_F( ClockEngineTest, WriteConfigUnderLock )
{
    init();
    ASSERT_EQ( eS_Ok, m_clock.writeConfig( ClockConfig( eCR_96000, eCS_Adat ) ) );

    const SpyTransport::WriteRecordVector& writes = m_transport.getWrites();
    ASSERT_EQ( 1u, writes.size() );
    EXPECT_EQ( TcatTestImage::globalAddr( TCAT_REGISTER_GLOBAL_CLOCK_SELECT ), writes[0].addr );
    EXPECT_EQ( 0x00000405u, writes[0].values[0] );
    EXPECT_TRUE( writes[0].locked );
    EXPECT_FALSE( m_transport.getDeviceLock().isLocked() );

    // the state is read back from the device
    EXPECT_GT( m_transport.getReadCount(), 0u );
    EXPECT_EQ( eCR_96000, m_clock.getParameters().clock_config.rate );
    EXPECT_EQ( eCS_Adat, m_clock.getParameters().clock_config.src );
}

TEST_F( ClockEngineTest, WriteByIndex )
{
    init();
    ASSERT_EQ( eS_Ok, m_clock.writeRateIndex( 0 ) );
    EXPECT_EQ( eCR_32000, m_clock.getParameters().clock_config.rate );
    EXPECT_EQ( eCS_Internal, m_clock.getParameters().clock_config.src );

    ASSERT_EQ( eS_Ok, m_clock.writeSourceIndex( 0 ) );
    EXPECT_EQ( eCS_Aes1, m_clock.getParameters().clock_config.src );
}

TEST_F( ClockEngineTest, InvalidConfigSendsNothing )
{
    init();
    EXPECT_EQ( eS_InvalidArgument, m_clock.writeConfig( ClockConfig( eCR_AnyLow, eCS_Internal ) ) );
    EXPECT_EQ( eS_InvalidArgument, m_clock.writeConfig( ClockConfig( eCR_48000, eCS_Tdif ) ) );
    EXPECT_EQ( eS_InvalidArgument, m_clock.writeRateIndex( 7 ) );
    EXPECT_EQ( eS_InvalidArgument, m_clock.writeSourceIndex( 4 ) );
    EXPECT_EQ( 0u, m_transport.getWriteCount() );
}

TEST_F( ClockEngineTest, WriteFailure )
{
    init();
    m_transport.setFailWrites( true );
    EXPECT_EQ( eS_IoError, m_clock.writeConfig( ClockConfig( eCR_96000, eCS_Internal ) ) );
    EXPECT_EQ( eCR_48000, m_clock.getParameters().clock_config.rate );
}

TEST_F( ClockEngineTest, Notification )
{
    init();
    EXPECT_EQ( eS_Ok, m_clock.parseNotification( TCAT_NOTIFY_RX_CFG_CHG ) );
    EXPECT_EQ( 0u, m_transport.getReadCount() );

    m_image.setGlobal( eCR_96000, eCS_Internal, 96000 );
    EXPECT_EQ( eS_Ok, m_clock.parseNotification( TCAT_NOTIFY_LOCK_CHG ) );
    EXPECT_GT( m_transport.getReadCount(), 0u );
    EXPECT_EQ( 96000u, m_clock.getCurrentRate() );
    EXPECT_EQ( eRM_Mid, m_clock.getRateMode() );
}

TEST_F( ClockEngineTest, ExternalStates )
{
    // S/PDIF and word clock locked, ADAT slipped
    m_transport.setQuadlet( TcatTestImage::globalAddr( TCAT_REGISTER_GLOBAL_EXTENDED_STATUS ),
                            ( 1 << 0 ) | ( 1 << 10 ) | ( 1 << ( 16 + 4 ) ) );
    init();

    const ExternalSourceStates& states = m_clock.getParameters().external_source_states;
    ASSERT_EQ( 3u, states.sources.size() );
    EXPECT_EQ( eCS_Aes1, states.sources[0] );
    EXPECT_EQ( eCS_Adat, states.sources[1] );
    EXPECT_EQ( eCS_WordClock, states.sources[2] );
    EXPECT_TRUE( states.locked[0] );
    EXPECT_FALSE( states.locked[1] );
    EXPECT_TRUE( states.locked[2] );
    EXPECT_FALSE( states.slipped[0] );
    EXPECT_TRUE( states.slipped[1] );
    EXPECT_FALSE( states.slipped[2] );
}

class StandaloneEngineTest : public ::testing::Test
{
protected:
    StandaloneEngineTest()
        : m_image( m_transport )
        , m_device( m_transport )
        , m_eap( m_device )
        , m_standalone( m_eap )
        {}

    virtual void SetUp()
    {
        // ADAT source, high rate S/PDIF, SMUX4, low word clock at half rate, 96 kHz
        m_transport.setQuadlet( TcatTestImage::standaloneAddr( TCAT_EAP_STANDALONE_CLOCK_SRC ), eCS_Adat );
        m_transport.setQuadlet( TcatTestImage::standaloneAddr( TCAT_EAP_STANDALONE_AES_HIGH_RATE ), 1 );
        m_transport.setQuadlet( TcatTestImage::standaloneAddr( TCAT_EAP_STANDALONE_ADAT_MODE ), 2 );
        m_transport.setQuadlet( TcatTestImage::standaloneAddr( TCAT_EAP_STANDALONE_WORD_CLOCK ),
                                0x00010001 );
        m_transport.setQuadlet( TcatTestImage::standaloneAddr( TCAT_EAP_STANDALONE_INTERNAL_RATE ),
                                eCR_96000 );
    }

    void init()
    {
        ASSERT_TRUE( m_device.init() );
        ASSERT_TRUE( m_eap.init() );
        ASSERT_EQ( eS_Ok, m_standalone.cache() );
        m_transport.resetCounters();
    }

    SpyTransport m_transport;
    TcatTestImage m_image;
    Device m_device;
    EAP m_eap;
    StandaloneEngine m_standalone;
};

TEST_F( StandaloneEngineTest, Cache )
{
    init();
    const StandaloneParameters& params = m_standalone.getParameters();
    EXPECT_EQ( eCS_Adat, params.clock_source );
    EXPECT_TRUE( params.aes_high_rate );
    EXPECT_EQ( eAM_SMUX4, params.adat_mode );
    EXPECT_EQ( eWCM_Low, params.word_clock.mode );
    EXPECT_EQ( 1, params.word_clock.numerator );
    EXPECT_EQ( 2, params.word_clock.denominator );
    EXPECT_EQ( eCR_96000, params.internal_rate );
}

TEST_F( StandaloneEngineTest, WriteOneField )
{
    init();
    ASSERT_EQ( eS_Ok, m_standalone.writeClockSource( eCS_WordClock ) );

    const SpyTransport::WriteRecordVector& writes = m_transport.getWrites();
    ASSERT_EQ( 1u, writes.size() );
    EXPECT_EQ( TcatTestImage::standaloneAddr( TCAT_EAP_STANDALONE_CLOCK_SRC ), writes[0].addr );
    EXPECT_EQ( (fb_quadlet_t)eCS_WordClock, writes[0].values[0] );
    EXPECT_EQ( eCS_WordClock, m_standalone.getParameters().clock_source );
}

TEST_F( StandaloneEngineTest, WordClockSharesQuadlet )
{
    init();
    ASSERT_EQ( eS_Ok, m_standalone.writeWordClockDenominator( 3 ) );

    const SpyTransport::WriteRecordVector& writes = m_transport.getWrites();
    ASSERT_EQ( 1u, writes.size() );
    EXPECT_EQ( TcatTestImage::standaloneAddr( TCAT_EAP_STANDALONE_WORD_CLOCK ), writes[0].addr );
    // mode and numerator unchanged
    EXPECT_EQ( 0x00020001u, writes[0].values[0] );
}

TEST_F( StandaloneEngineTest, FieldsAreWrittenOnFreshState )
{
    init();
    // the unit changed its internal rate meanwhile
    m_transport.setQuadlet( TcatTestImage::standaloneAddr( TCAT_EAP_STANDALONE_INTERNAL_RATE ),
                            eCR_48000 );
    ASSERT_EQ( eS_Ok, m_standalone.writeAesHighRate( false ) );

    const SpyTransport::WriteRecordVector& writes = m_transport.getWrites();
    ASSERT_EQ( 1u, writes.size() );
    EXPECT_EQ( TcatTestImage::standaloneAddr( TCAT_EAP_STANDALONE_AES_HIGH_RATE ), writes[0].addr );
    EXPECT_EQ( eCR_48000, m_standalone.getParameters().internal_rate );
    EXPECT_FALSE( m_standalone.getParameters().aes_high_rate );
}

TEST_F( StandaloneEngineTest, InvalidWordClock )
{
    init();
    EXPECT_EQ( eS_InvalidArgument, m_standalone.writeWordClockNumerator( 0 ) );
    EXPECT_EQ( eS_InvalidArgument, m_standalone.writeWordClockNumerator( 4097 ) );
    EXPECT_EQ( eS_InvalidArgument, m_standalone.writeWordClockDenominator( 0 ) );
    EXPECT_EQ( 0u, m_transport.getWriteCount() );

    StandaloneParameters params = m_standalone.getParameters();
    params.word_clock.numerator = 0;
    EXPECT_EQ( eS_InvalidArgument, m_standalone.write( params ) );
    EXPECT_EQ( 0u, m_transport.getWriteCount() );
}

TEST( StandaloneCodecTest, WordClockLimits )
{
    StandaloneParameters params;
    params.word_clock.mode = eWCM_High;
    params.word_clock.numerator = 4096;
    params.word_clock.denominator = 0xffff;

    fb_quadlet_t quads[TCAT_EAP_STANDALONE_SIZE / 4];
    ASSERT_EQ( eS_Ok, buildStandalone( params, quads ) );
    EXPECT_EQ( 0xfffefff3u, quads[TCAT_EAP_STANDALONE_WORD_CLOCK / 4] );

    StandaloneParameters parsed;
    parseStandalone( quads, parsed );
    EXPECT_EQ( params, parsed );

    params.word_clock.denominator = 0;
    EXPECT_EQ( eS_InvalidArgument, buildStandalone( params, quads ) );
}
