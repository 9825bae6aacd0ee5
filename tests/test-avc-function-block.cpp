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

#include "libavc/avc_function_block.h"

#include <gtest/gtest.h>

using namespace AVC;

typedef std::vector<fb_byte_t> Bytes;

static Bytes
bytes( const fb_byte_t* data, size_t len )
{
    return Bytes( data, data + len );
}

#define BYTES( arr ) bytes( arr, sizeof( arr ) )

static std::vector<int16_t>
levels( int16_t a, int16_t b )
{
    std::vector<int16_t> v;
    v.push_back( a );
    v.push_back( b );
    return v;
}

// a response frame: ctype, audio subunit 0, opcode, operands
static SpyTransport::Frame
response( fb_byte_t ctype, const Bytes& operands )
{
    SpyTransport::Frame frame;
    frame.push_back( ctype );
    frame.push_back( eST_Audio << 3 );
    frame.push_back( AVC_FUNCTION_BLOCK_OPCODE );
    frame.insert( frame.end(), operands.begin(), operands.end() );
    return frame;
}

class FunctionBlockTest : public ::testing::Test
{
protected:
    SpyTransport m_transport;
};

TEST( AudioChannelTest, Encoding )
{
    EXPECT_EQ( 0x00, AudioChannel( AudioChannel::eAC_Master ).encode() );
    EXPECT_EQ( 0x01, AudioChannel( AudioChannel::eAC_Each, 0 ).encode() );
    EXPECT_EQ( 0xfd, AudioChannel( AudioChannel::eAC_Each, 0xfc ).encode() );
    EXPECT_EQ( 0xfe, AudioChannel( AudioChannel::eAC_Void ).encode() );
    EXPECT_EQ( 0xff, AudioChannel( AudioChannel::eAC_All ).encode() );

    EXPECT_EQ( AudioChannel( AudioChannel::eAC_Each, 0x1b ), AudioChannel::decode( 0x1c ) );
    EXPECT_EQ( AudioChannel( AudioChannel::eAC_Master ), AudioChannel::decode( 0x00 ) );
    EXPECT_EQ( AudioChannel( AudioChannel::eAC_All ), AudioChannel::decode( 0xff ) );
}

TEST_F( FunctionBlockTest, ProcessingMixer )
{
    AudioProcessingCmd cmd( m_transport, 0x11, FunctionBlockCmd::eCA_Minimum, 0x22,
                            AudioChannel( AudioChannel::eAC_Each, 0x32 ),
                            AudioChannel( AudioChannel::eAC_Each, 0x43 ),
                            ProcessingControl::mixer( levels( 10, -10 ) ) );
    static const fb_byte_t expected[] = {
        0x82, 0x11, 0x02, 0x04, 0x22, 0x33, 0x44, 0x03, 0x04, 0x00, 0x0a, 0xff, 0xf6,
    };
    Bytes operands;
    ASSERT_TRUE( cmd.buildOperands( operands ) );
    EXPECT_EQ( BYTES( expected ), operands );

    ASSERT_TRUE( cmd.parseOperands( expected, sizeof( expected ) ) );
    EXPECT_FALSE( cmd.getParseError().isError() );
    EXPECT_EQ( ProcessingControl::mixer( levels( 10, -10 ) ), cmd.m_processing );
}

TEST_F( FunctionBlockTest, ProcessingEnable )
{
    AudioProcessingCmd cmd( m_transport, 0xf5, FunctionBlockCmd::eCA_Default, 0x71,
                            AudioChannel( AudioChannel::eAC_Each, 0xa8 ),
                            AudioChannel( AudioChannel::eAC_Each, 0x3e ),
                            ProcessingControl::enable( true ) );
    static const fb_byte_t expected[] = {
        0x82, 0xf5, 0x04, 0x04, 0x71, 0xa9, 0x3f, 0x01, 0x01, 0x70,
    };
    Bytes operands;
    ASSERT_TRUE( cmd.buildOperands( operands ) );
    EXPECT_EQ( BYTES( expected ), operands );

    static const fb_byte_t bad_flag[] = {
        0x82, 0xf5, 0x04, 0x04, 0x71, 0xa9, 0x3f, 0x01, 0x01, 0x42,
    };
    EXPECT_FALSE( cmd.parseOperands( bad_flag, sizeof( bad_flag ) ) );
    EXPECT_EQ( FunctionBlockParseError::eFBE_UnexpectedOperand, cmd.getParseError().getKind() );
    EXPECT_EQ( 9u, cmd.getParseError().getIndex() );

    static const fb_byte_t wrong_plug[] = {
        0x82, 0xf5, 0x04, 0x04, 0x72, 0xa9, 0x3f, 0x01, 0x01, 0x70,
    };
    EXPECT_FALSE( cmd.parseOperands( wrong_plug, sizeof( wrong_plug ) ) );
    EXPECT_EQ( 4u, cmd.getParseError().getIndex() );
}

TEST_F( FunctionBlockTest, Selector )
{
    AudioSelectorCmd cmd( m_transport, 0xe5, FunctionBlockCmd::eCA_Duration, 0x28 );
    static const fb_byte_t expected[] = { 0x80, 0xe5, 0x08, 0x02, 0x28, 0x01 };
    Bytes operands;
    ASSERT_TRUE( cmd.buildOperands( operands ) );
    EXPECT_EQ( BYTES( expected ), operands );

    // a status response reports the selected plug
    static const fb_byte_t selected[] = { 0x80, 0xe5, 0x08, 0x02, 0x03, 0x01 };
    ASSERT_TRUE( cmd.parseOperands( selected, sizeof( selected ) ) );
    EXPECT_EQ( 0x03, cmd.m_inputPlugId );

    static const fb_byte_t wrong_type[] = { 0x81, 0xe5, 0x08, 0x02, 0x28, 0x01 };
    EXPECT_FALSE( cmd.parseOperands( wrong_type, sizeof( wrong_type ) ) );
    EXPECT_EQ( FunctionBlockParseError::eFBE_UnexpectedOperand, cmd.getParseError().getKind() );
    EXPECT_EQ( 0u, cmd.getParseError().getIndex() );

    static const fb_byte_t wrong_attribute[] = { 0x80, 0xe5, 0x10, 0x02, 0x28, 0x01 };
    EXPECT_FALSE( cmd.parseOperands( wrong_attribute, sizeof( wrong_attribute ) ) );
    EXPECT_EQ( 2u, cmd.getParseError().getIndex() );
}

TEST_F( FunctionBlockTest, FeatureVolume )
{
    std::vector<int16_t> values;
    values.push_back( -1234 );
    values.push_back( 5678 );
    values.push_back( 3210 );
    AudioFeatureCmd cmd( m_transport, 0x03, FunctionBlockCmd::eCA_Minimum,
                         AudioChannel( AudioChannel::eAC_Each, 0x1b ),
                         FeatureControl::volume( values ) );
    static const fb_byte_t expected[] = {
        0x81, 0x03, 0x02, 0x02, 0x1c, 0x02, 0x06, 0xfb, 0x2e, 0x16, 0x2e, 0x0c, 0x8a,
    };
    Bytes operands;
    ASSERT_TRUE( cmd.buildOperands( operands ) );
    EXPECT_EQ( BYTES( expected ), operands );

    ASSERT_TRUE( cmd.parseOperands( expected, sizeof( expected ) ) );
    EXPECT_EQ( values, cmd.m_feature.m_levels );
}

TEST_F( FunctionBlockTest, FeatureTreble )
{
    std::vector<int8_t> values;
    values.push_back( 40 );
    values.push_back( -33 );
    values.push_back( 123 );
    values.push_back( -96 );
    AudioFeatureCmd cmd( m_transport, 0x33, FunctionBlockCmd::eCA_Resolution,
                         AudioChannel( AudioChannel::eAC_Each, 0xd8 ),
                         FeatureControl::treble( values ) );
    static const fb_byte_t expected[] = {
        0x81, 0x33, 0x01, 0x02, 0xd9, 0x07, 0x04, 0x28, 0xdf, 0x7b, 0xa0,
    };
    Bytes operands;
    ASSERT_TRUE( cmd.buildOperands( operands ) );
    EXPECT_EQ( BYTES( expected ), operands );

    ASSERT_TRUE( cmd.parseOperands( expected, sizeof( expected ) ) );
    EXPECT_EQ( values, cmd.m_feature.m_tones );
}

TEST_F( FunctionBlockTest, VolumeInfinity )
{
    AudioFeatureCmd cmd( m_transport, 0x01, FunctionBlockCmd::eCA_Current,
                         AudioChannel( AudioChannel::eAC_Master ),
                         FeatureControl::volume( levels( AVC_FB_VOLUME_INFINITY,
                                                         AVC_FB_VOLUME_NEG_INFINITY ) ) );
    static const fb_byte_t expected[] = {
        0x81, 0x01, 0x10, 0x02, 0x00, 0x02, 0x04, 0x7f, 0xfe, 0x80, 0x00,
    };
    Bytes operands;
    ASSERT_TRUE( cmd.buildOperands( operands ) );
    EXPECT_EQ( BYTES( expected ), operands );

    ASSERT_TRUE( cmd.parseOperands( expected, sizeof( expected ) ) );
    EXPECT_EQ( AVC_FB_VOLUME_INFINITY, cmd.m_feature.m_levels.at( 0 ) );
    EXPECT_EQ( AVC_FB_VOLUME_NEG_INFINITY, cmd.m_feature.m_levels.at( 1 ) );
}

TEST_F( FunctionBlockTest, FeatureErrors )
{
    AudioFeatureCmd cmd( m_transport, 0x03, FunctionBlockCmd::eCA_Minimum,
                         AudioChannel( AudioChannel::eAC_Each, 0x1b ),
                         FeatureControl::volume( levels( 0, 0 ) ) );

    static const fb_byte_t header_only[] = { 0x81, 0x03, 0x02 };
    EXPECT_FALSE( cmd.parseOperands( header_only, sizeof( header_only ) ) );
    EXPECT_EQ( FunctionBlockParseError::eFBE_TooShort, cmd.getParseError().getKind() );
    EXPECT_EQ( 4u, cmd.getParseError().getIndex() );

    // declared data length beyond the frame
    static const fb_byte_t truncated[] = {
        0x81, 0x03, 0x02, 0x02, 0x1c, 0x02, 0x06, 0xfb, 0x2e,
    };
    EXPECT_FALSE( cmd.parseOperands( truncated, sizeof( truncated ) ) );
    EXPECT_EQ( FunctionBlockParseError::eFBE_TooShort, cmd.getParseError().getKind() );
    EXPECT_EQ( 13u, cmd.getParseError().getIndex() );

    // odd number of level bytes
    static const fb_byte_t odd[] = {
        0x81, 0x03, 0x02, 0x02, 0x1c, 0x02, 0x03, 0xfb, 0x2e, 0x16,
    };
    EXPECT_FALSE( cmd.parseOperands( odd, sizeof( odd ) ) );
    EXPECT_EQ( FunctionBlockParseError::eFBE_TooShort, cmd.getParseError().getKind() );
    EXPECT_EQ( 11u, cmd.getParseError().getIndex() );

    static const fb_byte_t other_channel[] = {
        0x81, 0x03, 0x02, 0x02, 0x1d, 0x02, 0x02, 0x00, 0x00,
    };
    EXPECT_FALSE( cmd.parseOperands( other_channel, sizeof( other_channel ) ) );
    EXPECT_EQ( FunctionBlockParseError::eFBE_UnexpectedOperand, cmd.getParseError().getKind() );
    EXPECT_EQ( 4u, cmd.getParseError().getIndex() );

    static const fb_byte_t other_control[] = {
        0x81, 0x03, 0x02, 0x02, 0x1c, 0x01, 0x01, 0x70,
    };
    EXPECT_FALSE( cmd.parseOperands( other_control, sizeof( other_control ) ) );
    EXPECT_EQ( 5u, cmd.getParseError().getIndex() );
}

TEST_F( FunctionBlockTest, MuteFlags )
{
    std::vector<bool> flags;
    flags.push_back( true );
    flags.push_back( false );
    AudioFeatureCmd cmd( m_transport, 0x03, FunctionBlockCmd::eCA_Current,
                         AudioChannel( AudioChannel::eAC_All ),
                         FeatureControl::mute( flags ) );
    Bytes operands;
    ASSERT_TRUE( cmd.buildOperands( operands ) );
    ASSERT_EQ( 9u, operands.size() );
    EXPECT_EQ( AVC_FB_TRUE, operands[7] );
    EXPECT_EQ( AVC_FB_FALSE, operands[8] );

    static const fb_byte_t bad_flag[] = {
        0x81, 0x03, 0x10, 0x02, 0xff, 0x01, 0x02, 0x70, 0x55,
    };
    EXPECT_FALSE( cmd.parseOperands( bad_flag, sizeof( bad_flag ) ) );
    EXPECT_EQ( FunctionBlockParseError::eFBE_UnexpectedOperand, cmd.getParseError().getKind() );
    EXPECT_EQ( 8u, cmd.getParseError().getIndex() );
}

TEST_F( FunctionBlockTest, ReservedSelectorIsKeptVerbatim )
{
    static const fb_byte_t raw[] = { 0x12, 0x34, 0x56 };
    FeatureControl reserved = FeatureControl::reserved( 0x20, BYTES( raw ) );
    EXPECT_TRUE( reserved.isReserved() );
    EXPECT_FALSE( FeatureControl::mute( std::vector<bool>() ).isReserved() );

    AudioFeatureCmd cmd( m_transport, 0x04, FunctionBlockCmd::eCA_Current,
                         AudioChannel( AudioChannel::eAC_Master ), reserved );
    static const fb_byte_t expected[] = {
        0x81, 0x04, 0x10, 0x02, 0x00, 0x20, 0x03, 0x12, 0x34, 0x56,
    };
    Bytes operands;
    ASSERT_TRUE( cmd.buildOperands( operands ) );
    EXPECT_EQ( BYTES( expected ), operands );

    ASSERT_TRUE( cmd.parseOperands( expected, sizeof( expected ) ) );
    EXPECT_EQ( reserved, cmd.m_feature );
}

// encodes a control, checks the control data and decodes it again
static void
expectFeatureControl( const FeatureControl& ctl, fb_byte_t selector, const Bytes& data )
{
    FunctionBlockControl encoded;
    ASSERT_TRUE( ctl.toControl( encoded ) );
    EXPECT_EQ( selector, encoded.m_controlSelector );
    EXPECT_EQ( data, encoded.m_controlData );

    FeatureControl decoded;
    FunctionBlockParseError error;
    ASSERT_TRUE( decoded.fromControl( encoded, 7, error ) );
    EXPECT_FALSE( error.isError() );
    EXPECT_EQ( ctl, decoded );
}

static void
expectProcessingControl( const ProcessingControl& ctl, fb_byte_t selector, const Bytes& data )
{
    FunctionBlockControl encoded;
    ASSERT_TRUE( ctl.toControl( encoded ) );
    EXPECT_EQ( selector, encoded.m_controlSelector );
    EXPECT_EQ( data, encoded.m_controlData );

    ProcessingControl decoded;
    FunctionBlockParseError error;
    ASSERT_TRUE( decoded.fromControl( encoded, 9, error ) );
    EXPECT_FALSE( error.isError() );
    EXPECT_EQ( ctl, decoded );
}

static std::vector<bool>
flags( bool a, bool b, bool c )
{
    std::vector<bool> v;
    v.push_back( a );
    v.push_back( b );
    v.push_back( c );
    return v;
}

static std::vector<int8_t>
tones( const int8_t* values, size_t count )
{
    return std::vector<int8_t>( values, values + count );
}

TEST( FeatureControlTest, Balance )
{
    static const fb_byte_t lr[] = { 0xff, 0x85 };
    expectFeatureControl( FeatureControl::lrBalance( -123 ),
                          FeatureControl::eFCS_LRBalance, BYTES( lr ) );
    static const fb_byte_t fr[] = { 0x01, 0x41 };
    expectFeatureControl( FeatureControl::frBalance( 321 ),
                          FeatureControl::eFCS_FRBalance, BYTES( fr ) );
}

TEST( FeatureControlTest, BassAndMid )
{
    static const int8_t bass[] = { 10, -10, 20, -20 };
    static const fb_byte_t bass_data[] = { 0x0a, 0xf6, 0x14, 0xec };
    expectFeatureControl( FeatureControl::bass( tones( bass, 4 ) ),
                          FeatureControl::eFCS_Bass, BYTES( bass_data ) );

    static const int8_t mid[] = { 30, -30, -40, 40 };
    static const fb_byte_t mid_data[] = { 0x1e, 0xe2, 0xd8, 0x28 };
    expectFeatureControl( FeatureControl::mid( tones( mid, 4 ) ),
                          FeatureControl::eFCS_Mid, BYTES( mid_data ) );
}

TEST( FeatureControlTest, GraphicEqualizer )
{
    static const int8_t gains[] = {
        -1, -2, -3, 10, 14, -40, -100, 33, 87, 99, -123, 100, -76, -97, 18, 21,
    };
    static const fb_byte_t data[] = {
        0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07,
        0xff, 0xfe, 0xfd, 0x0a, 0x0e, 0xd8, 0x9c, 0x21,
        0x57, 0x63, 0x85, 0x64, 0xb4, 0x9f, 0x12, 0x15,
    };
    expectFeatureControl( FeatureControl::graphicEqualizer( 0x00010203, 0x04050607,
                                                            tones( gains, 16 ) ),
                          FeatureControl::eFCS_GraphicEqualizer, BYTES( data ) );

    // band masks without gains
    FunctionBlockControl short_eq( FeatureControl::eFCS_GraphicEqualizer, Bytes( 5, 0 ) );
    FeatureControl decoded;
    FunctionBlockParseError error;
    EXPECT_FALSE( decoded.fromControl( short_eq, 7, error ) );
    EXPECT_EQ( FunctionBlockParseError::eFBE_TooShort, error.getKind() );
    EXPECT_EQ( 15u, error.getIndex() );
}

TEST( FeatureControlTest, Switches )
{
    static const fb_byte_t off_on_off[] = { 0x60, 0x70, 0x60 };
    static const fb_byte_t on_off_on[] = { 0x70, 0x60, 0x70 };
    expectFeatureControl( FeatureControl::automaticGain( flags( false, true, false ) ),
                          FeatureControl::eFCS_AutomaticGain, BYTES( off_on_off ) );
    expectFeatureControl( FeatureControl::bassBoost( flags( true, false, true ) ),
                          FeatureControl::eFCS_BassBoost, BYTES( on_off_on ) );
    expectFeatureControl( FeatureControl::loudness( flags( false, true, false ) ),
                          FeatureControl::eFCS_Loudness, BYTES( off_on_off ) );
}

TEST( FeatureControlTest, Delay )
{
    std::vector<uint16_t> delays;
    delays.push_back( 0x1234 );
    delays.push_back( 0x3456 );
    delays.push_back( 0x789a );
    static const fb_byte_t data[] = { 0x12, 0x34, 0x34, 0x56, 0x78, 0x9a };
    expectFeatureControl( FeatureControl::delay( delays ),
                          FeatureControl::eFCS_Delay, BYTES( data ) );
}

TEST( ProcessingControlTest, ModeAndMixer )
{
    static const fb_byte_t modes[] = { 0xde, 0xad, 0xbe, 0xef };
    expectProcessingControl( ProcessingControl::mode( BYTES( modes ) ),
                             ProcessingControl::ePCS_Mode, BYTES( modes ) );

    static const fb_byte_t gains[] = { 0xff, 0xb7, 0xff, 0x63 };
    expectProcessingControl( ProcessingControl::mixer( levels( -73, -157 ) ),
                             ProcessingControl::ePCS_Mixer, BYTES( gains ) );

    static const fb_byte_t on[] = { 0x70 };
    expectProcessingControl( ProcessingControl::enable( true ),
                             ProcessingControl::ePCS_Enable, BYTES( on ) );
}

TEST_F( FunctionBlockTest, FeatureBalanceOperands )
{
    AudioFeatureCmd cmd( m_transport, 0x03, FunctionBlockCmd::eCA_Current,
                         AudioChannel( AudioChannel::eAC_Master ),
                         FeatureControl::lrBalance( -123 ) );
    static const fb_byte_t expected[] = {
        0x81, 0x03, 0x10, 0x02, 0x00, 0x03, 0x02, 0xff, 0x85,
    };
    Bytes operands;
    ASSERT_TRUE( cmd.buildOperands( operands ) );
    EXPECT_EQ( BYTES( expected ), operands );

    ASSERT_TRUE( cmd.parseOperands( expected, sizeof( expected ) ) );
    EXPECT_EQ( FeatureControl::lrBalance( -123 ), cmd.m_feature );

    // a balance carries exactly one level
    static const fb_byte_t two_levels[] = {
        0x81, 0x03, 0x10, 0x02, 0x00, 0x03, 0x04, 0xff, 0x85, 0x00, 0x01,
    };
    EXPECT_FALSE( cmd.parseOperands( two_levels, sizeof( two_levels ) ) );
    EXPECT_EQ( FunctionBlockParseError::eFBE_UnexpectedOperand, cmd.getParseError().getKind() );
    EXPECT_EQ( 9u, cmd.getParseError().getIndex() );
}

TEST_F( FunctionBlockTest, FireAccepted )
{
    AudioSelectorCmd cmd( m_transport, 0xe5, FunctionBlockCmd::eCA_Current, 0x02 );
    cmd.setCommandType( AVCCommand::eCT_Control );

    static const fb_byte_t operands[] = { 0x80, 0xe5, 0x10, 0x02, 0x02, 0x01 };
    m_transport.queueFcpResponse( response( AVCCommand::eR_Accepted, BYTES( operands ) ) );

    ASSERT_TRUE( cmd.fire( 100 ) );
    EXPECT_EQ( AVCCommand::eR_Accepted, cmd.getResponse() );
    EXPECT_FALSE( m_transport.isFcpOpen() );

    ASSERT_EQ( 1u, m_transport.getFcpRequests().size() );
    const SpyTransport::Frame& request = m_transport.getFcpRequests()[0];
    // padded to whole quadlets
    ASSERT_EQ( 12u, request.size() );
    EXPECT_EQ( AVCCommand::eCT_Control, request[0] );
    EXPECT_EQ( eST_Audio << 3, request[1] );
    EXPECT_EQ( AVC_FUNCTION_BLOCK_OPCODE, request[2] );
    EXPECT_EQ( BYTES( operands ), Bytes( request.begin() + 3, request.begin() + 9 ) );
}

TEST_F( FunctionBlockTest, FireStatusUpdatesValues )
{
    AudioFeatureCmd cmd( m_transport, 0x03, FunctionBlockCmd::eCA_Current,
                         AudioChannel( AudioChannel::eAC_Each, 0 ),
                         FeatureControl::volume( levels( 0, 0 ) ) );
    cmd.setCommandType( AVCCommand::eCT_Status );

    static const fb_byte_t operands[] = {
        0x81, 0x03, 0x10, 0x02, 0x01, 0x02, 0x04, 0xff, 0x00, 0x7f, 0xfe,
    };
    m_transport.queueFcpResponse( response( AVCCommand::eR_Implemented, BYTES( operands ) ) );

    ASSERT_TRUE( cmd.fire( 100 ) );
    EXPECT_EQ( AVCCommand::eR_Implemented, cmd.getResponse() );
    EXPECT_EQ( levels( -256, AVC_FB_VOLUME_INFINITY ), cmd.m_feature.m_levels );
}

TEST_F( FunctionBlockTest, FireRejectedOrSilent )
{
    AudioSelectorCmd cmd( m_transport, 0xe5, FunctionBlockCmd::eCA_Current, 0x02 );
    cmd.setCommandType( AVCCommand::eCT_Control );

    static const fb_byte_t operands[] = { 0x80, 0xe5, 0x10, 0x02, 0x02, 0x01 };
    m_transport.queueFcpResponse( response( AVCCommand::eR_Rejected, BYTES( operands ) ) );
    EXPECT_FALSE( cmd.fire( 100 ) );
    EXPECT_EQ( AVCCommand::eR_Rejected, cmd.getResponse() );
    EXPECT_FALSE( m_transport.isFcpOpen() );

    // no response queued
    EXPECT_FALSE( cmd.fire( 100 ) );
    EXPECT_EQ( AVCCommand::eR_Unknown, cmd.getResponse() );
}

TEST( FunctionBlockParseErrorTest, Messages )
{
    FunctionBlockParseError error;
    EXPECT_FALSE( error.isError() );
    EXPECT_EQ( "no error", error.toString() );

    error.set( FunctionBlockParseError::eFBE_TooShort, 13 );
    EXPECT_TRUE( error.isError() );
    EXPECT_EQ( "operands too short, 13 bytes needed", error.toString() );

    error.set( FunctionBlockParseError::eFBE_UnexpectedOperand, 4 );
    EXPECT_EQ( "unexpected operand at position 4", error.toString() );

    error.clear();
    EXPECT_FALSE( error.isError() );
}
