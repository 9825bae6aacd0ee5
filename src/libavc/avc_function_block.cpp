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

#include "avc_function_block.h"

#include "libutil/cmd_serialize.h"
#include "libieee1394/Transport.h"

#include <cstdio>

namespace AVC {

std::string
FunctionBlockParseError::toString() const
{
    char buf[64];
    switch ( m_kind ) {
    case eFBE_None:
        return "no error";
    case eFBE_TooShort:
        snprintf( buf, sizeof( buf ), "operands too short, %zu bytes needed", m_index );
        return buf;
    case eFBE_UnexpectedOperand:
        snprintf( buf, sizeof( buf ), "unexpected operand at position %zu", m_index );
        return buf;
    }
    return "unknown error";
}

/////////////////////////////////

fb_byte_t
AudioChannel::encode() const
{
    switch ( m_type ) {
    case eAC_Master: return 0x00;
    case eAC_Each:   return m_number + 1;
    case eAC_Void:   return 0xfe;
    case eAC_All:    return 0xff;
    }
    return 0xff;
}

AudioChannel
AudioChannel::decode( fb_byte_t value )
{
    switch ( value ) {
    case 0x00: return AudioChannel( eAC_Master );
    case 0xfe: return AudioChannel( eAC_Void );
    case 0xff: return AudioChannel( eAC_All );
    default:   return AudioChannel( eAC_Each, value - 1 );
    }
}

/////////////////////////////////

FunctionBlockControl::FunctionBlockControl()
    : IBusData()
    , m_controlSelector( 0 )
{
}

FunctionBlockControl::FunctionBlockControl( fb_byte_t selector,
                                            const std::vector<fb_byte_t>& data )
    : IBusData()
    , m_controlSelector( selector )
    , m_controlData( data )
{
}

bool
FunctionBlockControl::serialize( Util::Cmd::IOSSerialize& se )
{
    if ( m_controlData.size() > 0xff ) {
        debugError( "control data too long (%zu bytes)\n", m_controlData.size() );
        return false;
    }

    bool bStatus = se.write( m_controlSelector, "FunctionBlockControl controlSelector" );
    if ( !m_controlData.empty() ) {
        bStatus &= se.write( (fb_byte_t)m_controlData.size(),
                             "FunctionBlockControl controlDataLength" );
        bStatus &= se.write( &m_controlData[0], m_controlData.size(),
                             "FunctionBlockControl controlData" );
    }
    return bStatus;
}

bool
FunctionBlockControl::deserialize( Util::Cmd::IISDeserialize& de )
{
    m_controlData.clear();
    if ( !de.read( &m_controlSelector ) ) {
        return false;
    }
    if ( de.getNrOfRemainingBytes() <= 0 ) {
        return true;
    }

    fb_byte_t length;
    if ( !de.read( &length ) ) {
        return false;
    }
    if ( length == 0 ) {
        return true;
    }
    if ( de.getNrOfRemainingBytes() < length ) {
        return false;
    }
    m_controlData.resize( length );
    return de.read( &m_controlData[0], length );
}

FunctionBlockControl*
FunctionBlockControl::clone() const
{
    return new FunctionBlockControl( *this );
}

/////////////////////////////////

static void
appendInt16( std::vector<fb_byte_t>& data, uint16_t value )
{
    data.push_back( ( value >> 8 ) & 0xff );
    data.push_back( value & 0xff );
}

static uint16_t
getInt16( const std::vector<fb_byte_t>& data, size_t pos )
{
    return ( (uint16_t)data[pos] << 8 ) | data[pos + 1];
}

static void
appendQuadlet( std::vector<fb_byte_t>& data, fb_quadlet_t value )
{
    data.push_back( ( value >> 24 ) & 0xff );
    data.push_back( ( value >> 16 ) & 0xff );
    data.push_back( ( value >> 8 ) & 0xff );
    data.push_back( value & 0xff );
}

static fb_quadlet_t
getQuadlet( const std::vector<fb_byte_t>& data, size_t pos )
{
    return ( (fb_quadlet_t)data[pos] << 24 ) | ( (fb_quadlet_t)data[pos + 1] << 16 )
        | ( (fb_quadlet_t)data[pos + 2] << 8 ) | data[pos + 3];
}

static bool
decodeFlags( const std::vector<fb_byte_t>& data, size_t dataOffset,
             std::vector<bool>& flags, FunctionBlockParseError& error )
{
    flags.clear();
    for ( size_t i = 0; i < data.size(); ++i ) {
        if ( data[i] == AVC_FB_TRUE ) {
            flags.push_back( true );
        } else if ( data[i] == AVC_FB_FALSE ) {
            flags.push_back( false );
        } else {
            error.set( FunctionBlockParseError::eFBE_UnexpectedOperand, dataOffset + i );
            return false;
        }
    }
    return true;
}

static bool
decodeLevels( const std::vector<fb_byte_t>& data, size_t dataOffset,
              std::vector<int16_t>& levels, FunctionBlockParseError& error )
{
    levels.clear();
    if ( data.size() % 2 ) {
        error.set( FunctionBlockParseError::eFBE_TooShort, dataOffset + data.size() + 1 );
        return false;
    }
    for ( size_t i = 0; i < data.size(); i += 2 ) {
        levels.push_back( (int16_t)getInt16( data, i ) );
    }
    return true;
}

static bool
decodeBalance( const std::vector<fb_byte_t>& data, size_t dataOffset,
               std::vector<int16_t>& levels, FunctionBlockParseError& error )
{
    if ( data.size() < 2 ) {
        error.set( FunctionBlockParseError::eFBE_TooShort, dataOffset + 2 );
        return false;
    }
    if ( data.size() > 2 ) {
        error.set( FunctionBlockParseError::eFBE_UnexpectedOperand, dataOffset + 2 );
        return false;
    }
    levels.assign( 1, (int16_t)getInt16( data, 0 ) );
    return true;
}

/////////////////////////////////

FeatureControl::FeatureControl()
    : m_selector( 0 )
    , m_bandsPresent( 0 )
    , m_extBandsPresent( 0 )
{
}

FeatureControl
FeatureControl::mute( const std::vector<bool>& values )
{
    FeatureControl ctl;
    ctl.m_selector = eFCS_Mute;
    ctl.m_flags = values;
    return ctl;
}

FeatureControl
FeatureControl::volume( const std::vector<int16_t>& values )
{
    FeatureControl ctl;
    ctl.m_selector = eFCS_Volume;
    ctl.m_levels = values;
    return ctl;
}

FeatureControl
FeatureControl::lrBalance( int16_t value )
{
    FeatureControl ctl;
    ctl.m_selector = eFCS_LRBalance;
    ctl.m_levels.assign( 1, value );
    return ctl;
}

FeatureControl
FeatureControl::frBalance( int16_t value )
{
    FeatureControl ctl;
    ctl.m_selector = eFCS_FRBalance;
    ctl.m_levels.assign( 1, value );
    return ctl;
}

FeatureControl
FeatureControl::bass( const std::vector<int8_t>& values )
{
    FeatureControl ctl;
    ctl.m_selector = eFCS_Bass;
    ctl.m_tones = values;
    return ctl;
}

FeatureControl
FeatureControl::mid( const std::vector<int8_t>& values )
{
    FeatureControl ctl;
    ctl.m_selector = eFCS_Mid;
    ctl.m_tones = values;
    return ctl;
}

FeatureControl
FeatureControl::treble( const std::vector<int8_t>& values )
{
    FeatureControl ctl;
    ctl.m_selector = eFCS_Treble;
    ctl.m_tones = values;
    return ctl;
}

FeatureControl
FeatureControl::graphicEqualizer( const fb_quadlet_t bandsPresent,
                                  const fb_quadlet_t extBandsPresent,
                                  const std::vector<int8_t>& gains )
{
    FeatureControl ctl;
    ctl.m_selector = eFCS_GraphicEqualizer;
    ctl.m_bandsPresent = bandsPresent;
    ctl.m_extBandsPresent = extBandsPresent;
    ctl.m_tones = gains;
    return ctl;
}

FeatureControl
FeatureControl::automaticGain( const std::vector<bool>& values )
{
    FeatureControl ctl;
    ctl.m_selector = eFCS_AutomaticGain;
    ctl.m_flags = values;
    return ctl;
}

FeatureControl
FeatureControl::delay( const std::vector<uint16_t>& values )
{
    FeatureControl ctl;
    ctl.m_selector = eFCS_Delay;
    ctl.m_delays = values;
    return ctl;
}

FeatureControl
FeatureControl::bassBoost( const std::vector<bool>& values )
{
    FeatureControl ctl;
    ctl.m_selector = eFCS_BassBoost;
    ctl.m_flags = values;
    return ctl;
}

FeatureControl
FeatureControl::loudness( const std::vector<bool>& values )
{
    FeatureControl ctl;
    ctl.m_selector = eFCS_Loudness;
    ctl.m_flags = values;
    return ctl;
}

FeatureControl
FeatureControl::reserved( fb_byte_t selector, const std::vector<fb_byte_t>& data )
{
    FeatureControl ctl;
    ctl.m_selector = selector;
    ctl.m_raw = data;
    return ctl;
}

bool
FeatureControl::isReserved() const
{
    return m_selector < eFCS_Mute || m_selector > eFCS_Loudness;
}

bool
FeatureControl::toControl( FunctionBlockControl& control ) const
{
    control.m_controlSelector = m_selector;
    std::vector<fb_byte_t>& data = control.m_controlData;
    data.clear();

    switch ( m_selector ) {
    case eFCS_Mute:
    case eFCS_AutomaticGain:
    case eFCS_BassBoost:
    case eFCS_Loudness:
        for ( std::vector<bool>::const_iterator it = m_flags.begin();
              it != m_flags.end();
              ++it )
        {
            data.push_back( *it ? AVC_FB_TRUE : AVC_FB_FALSE );
        }
        break;
    case eFCS_Volume:
        for ( std::vector<int16_t>::const_iterator it = m_levels.begin();
              it != m_levels.end();
              ++it )
        {
            appendInt16( data, (uint16_t)*it );
        }
        break;
    case eFCS_LRBalance:
    case eFCS_FRBalance:
        if ( m_levels.size() != 1 ) {
            return false;
        }
        appendInt16( data, (uint16_t)m_levels[0] );
        break;
    case eFCS_Bass:
    case eFCS_Mid:
    case eFCS_Treble:
        for ( std::vector<int8_t>::const_iterator it = m_tones.begin();
              it != m_tones.end();
              ++it )
        {
            data.push_back( (fb_byte_t)*it );
        }
        break;
    case eFCS_GraphicEqualizer:
        appendQuadlet( data, m_bandsPresent );
        appendQuadlet( data, m_extBandsPresent );
        for ( std::vector<int8_t>::const_iterator it = m_tones.begin();
              it != m_tones.end();
              ++it )
        {
            data.push_back( (fb_byte_t)*it );
        }
        break;
    case eFCS_Delay:
        for ( std::vector<uint16_t>::const_iterator it = m_delays.begin();
              it != m_delays.end();
              ++it )
        {
            appendInt16( data, *it );
        }
        break;
    default:
        data = m_raw;
        break;
    }
    return data.size() <= 0xff;
}

bool
FeatureControl::fromControl( const FunctionBlockControl& control,
                             size_t dataOffset,
                             FunctionBlockParseError& error )
{
    const std::vector<fb_byte_t>& data = control.m_controlData;
    m_selector = control.m_controlSelector;
    m_flags.clear();
    m_levels.clear();
    m_tones.clear();
    m_delays.clear();
    m_raw.clear();
    m_bandsPresent = 0;
    m_extBandsPresent = 0;

    switch ( m_selector ) {
    case eFCS_Mute:
    case eFCS_AutomaticGain:
    case eFCS_BassBoost:
    case eFCS_Loudness:
        return decodeFlags( data, dataOffset, m_flags, error );
    case eFCS_Volume:
        return decodeLevels( data, dataOffset, m_levels, error );
    case eFCS_LRBalance:
    case eFCS_FRBalance:
        return decodeBalance( data, dataOffset, m_levels, error );
    case eFCS_Bass:
    case eFCS_Mid:
    case eFCS_Treble:
        for ( size_t i = 0; i < data.size(); ++i ) {
            m_tones.push_back( (int8_t)data[i] );
        }
        return true;
    case eFCS_GraphicEqualizer:
        if ( data.size() < 8 ) {
            error.set( FunctionBlockParseError::eFBE_TooShort, dataOffset + 8 );
            return false;
        }
        m_bandsPresent = getQuadlet( data, 0 );
        m_extBandsPresent = getQuadlet( data, 4 );
        for ( size_t i = 8; i < data.size(); ++i ) {
            m_tones.push_back( (int8_t)data[i] );
        }
        return true;
    case eFCS_Delay:
        if ( data.size() % 2 ) {
            error.set( FunctionBlockParseError::eFBE_TooShort, dataOffset + data.size() + 1 );
            return false;
        }
        for ( size_t i = 0; i < data.size(); i += 2 ) {
            m_delays.push_back( getInt16( data, i ) );
        }
        return true;
    default:
        m_raw = data;
        return true;
    }
}

bool
FeatureControl::operator==( const FeatureControl& other ) const
{
    return m_selector == other.m_selector
        && m_flags == other.m_flags
        && m_levels == other.m_levels
        && m_tones == other.m_tones
        && m_bandsPresent == other.m_bandsPresent
        && m_extBandsPresent == other.m_extBandsPresent
        && m_delays == other.m_delays
        && m_raw == other.m_raw;
}

/////////////////////////////////

ProcessingControl::ProcessingControl()
    : m_selector( 0 )
    , m_enable( false )
{
}

ProcessingControl
ProcessingControl::enable( bool value )
{
    ProcessingControl ctl;
    ctl.m_selector = ePCS_Enable;
    ctl.m_enable = value;
    return ctl;
}

ProcessingControl
ProcessingControl::mode( const std::vector<fb_byte_t>& values )
{
    ProcessingControl ctl;
    ctl.m_selector = ePCS_Mode;
    ctl.m_modes = values;
    return ctl;
}

ProcessingControl
ProcessingControl::mixer( const std::vector<int16_t>& values )
{
    ProcessingControl ctl;
    ctl.m_selector = ePCS_Mixer;
    ctl.m_gains = values;
    return ctl;
}

ProcessingControl
ProcessingControl::reserved( fb_byte_t selector, const std::vector<fb_byte_t>& data )
{
    ProcessingControl ctl;
    ctl.m_selector = selector;
    ctl.m_raw = data;
    return ctl;
}

bool
ProcessingControl::isReserved() const
{
    return m_selector < ePCS_Enable || m_selector > ePCS_Mixer;
}

bool
ProcessingControl::toControl( FunctionBlockControl& control ) const
{
    control.m_controlSelector = m_selector;
    std::vector<fb_byte_t>& data = control.m_controlData;
    data.clear();

    switch ( m_selector ) {
    case ePCS_Enable:
        data.push_back( m_enable ? AVC_FB_TRUE : AVC_FB_FALSE );
        break;
    case ePCS_Mode:
        data = m_modes;
        break;
    case ePCS_Mixer:
        for ( std::vector<int16_t>::const_iterator it = m_gains.begin();
              it != m_gains.end();
              ++it )
        {
            appendInt16( data, (uint16_t)*it );
        }
        break;
    default:
        data = m_raw;
        break;
    }
    return data.size() <= 0xff;
}

bool
ProcessingControl::fromControl( const FunctionBlockControl& control,
                                size_t dataOffset,
                                FunctionBlockParseError& error )
{
    const std::vector<fb_byte_t>& data = control.m_controlData;
    m_selector = control.m_controlSelector;
    m_enable = false;
    m_modes.clear();
    m_gains.clear();
    m_raw.clear();

    switch ( m_selector ) {
    case ePCS_Enable:
    {
        if ( data.empty() ) {
            error.set( FunctionBlockParseError::eFBE_TooShort, dataOffset + 1 );
            return false;
        }
        std::vector<bool> flags;
        if ( !decodeFlags( data, dataOffset, flags, error ) ) {
            return false;
        }
        m_enable = flags[0];
        return true;
    }
    case ePCS_Mode:
        m_modes = data;
        return true;
    case ePCS_Mixer:
        return decodeLevels( data, dataOffset, m_gains, error );
    default:
        m_raw = data;
        return true;
    }
}

bool
ProcessingControl::operator==( const ProcessingControl& other ) const
{
    return m_selector == other.m_selector
        && m_enable == other.m_enable
        && m_modes == other.m_modes
        && m_gains == other.m_gains
        && m_raw == other.m_raw;
}

/////////////////////////////////

FunctionBlockCmd::FunctionBlockCmd( Ieee1394::Transport& transport,
                                    EFunctionBlockType eType,
                                    fb_byte_t functionBlockId,
                                    EControlAttribute eCtrlAttrib )
    : AVCCommand( transport, AVC_FUNCTION_BLOCK_OPCODE )
    , m_functionBlockType( eType )
    , m_functionBlockId( functionBlockId )
    , m_controlAttribute( eCtrlAttrib )
{
    setSubunitType( eST_Audio );
    setSubunitId( 0 );
}

FunctionBlockCmd::~FunctionBlockCmd()
{
}

bool
FunctionBlockCmd::serializeOperands( Util::Cmd::IOSSerialize& se )
{
    if ( !buildFunctionBlock() ) {
        debugError( "%s: could not build function block\n", getCmdName() );
        return false;
    }
    if ( m_selectorData.size() >= 0xff ) {
        debugError( "%s: selector too long (%zu bytes)\n", getCmdName(), m_selectorData.size() );
        return false;
    }

    bool bStatus = se.write( (fb_byte_t)m_functionBlockType, "FunctionBlockCmd functionBlockType" );
    bStatus &= se.write( m_functionBlockId, "FunctionBlockCmd functionBlockId" );
    bStatus &= se.write( (fb_byte_t)m_controlAttribute, "FunctionBlockCmd controlAttribute" );
    bStatus &= se.write( (fb_byte_t)( m_selectorData.size() + 1 ), "FunctionBlockCmd selectorLength" );
    if ( !m_selectorData.empty() ) {
        bStatus &= se.write( &m_selectorData[0], m_selectorData.size(),
                             "FunctionBlockCmd selector" );
    }
    bStatus &= m_control.serialize( se );
    return bStatus;
}

bool
FunctionBlockCmd::deserializeOperands( Util::Cmd::IISDeserialize& de )
{
    m_parseError.clear();

    if ( de.getNrOfRemainingBytes() < 4 ) {
        m_parseError.set( FunctionBlockParseError::eFBE_TooShort, 4 );
        return false;
    }

    fb_byte_t type, id, attrib, selectorLength;
    bool bStatus = de.read( &type );
    bStatus &= de.read( &id );
    bStatus &= de.read( &attrib );
    bStatus &= de.read( &selectorLength );
    if ( !bStatus ) {
        m_parseError.set( FunctionBlockParseError::eFBE_TooShort, 4 );
        return false;
    }

    if ( type != m_functionBlockType ) {
        m_parseError.set( FunctionBlockParseError::eFBE_UnexpectedOperand, 0 );
        return false;
    }
    if ( id != m_functionBlockId ) {
        m_parseError.set( FunctionBlockParseError::eFBE_UnexpectedOperand, 1 );
        return false;
    }
    if ( attrib != m_controlAttribute ) {
        m_parseError.set( FunctionBlockParseError::eFBE_UnexpectedOperand, 2 );
        return false;
    }
    if ( selectorLength < 1 ) {
        m_parseError.set( FunctionBlockParseError::eFBE_UnexpectedOperand, 3 );
        return false;
    }

    // selector data plus the control selector
    if ( de.getNrOfRemainingBytes() < selectorLength ) {
        m_parseError.set( FunctionBlockParseError::eFBE_TooShort, 4 + selectorLength );
        return false;
    }
    m_selectorData.resize( selectorLength - 1 );
    if ( !m_selectorData.empty() ) {
        bStatus &= de.read( &m_selectorData[0], m_selectorData.size() );
    }
    bStatus &= de.read( &m_control.m_controlSelector );

    m_control.m_controlData.clear();
    if ( bStatus && de.getNrOfRemainingBytes() > 0 ) {
        fb_byte_t length;
        bStatus &= de.read( &length );
        if ( bStatus && length > 0 ) {
            if ( de.getNrOfRemainingBytes() < length ) {
                m_parseError.set( FunctionBlockParseError::eFBE_TooShort,
                                  getControlDataOffset() + length );
                return false;
            }
            m_control.m_controlData.resize( length );
            bStatus &= de.read( &m_control.m_controlData[0], length );
        }
    }
    if ( !bStatus ) {
        m_parseError.set( FunctionBlockParseError::eFBE_TooShort,
                          de.getNrOfConsumedBytes() + 1 );
        return false;
    }

    return parseFunctionBlock();
}

bool
FunctionBlockCmd::serialize( Util::Cmd::IOSSerialize& se )
{
    bool bStatus = AVCCommand::serialize( se );
    bStatus &= serializeOperands( se );
    return bStatus;
}

bool
FunctionBlockCmd::deserialize( Util::Cmd::IISDeserialize& de )
{
    if ( !AVCCommand::deserialize( de ) ) {
        return false;
    }
    if ( !deserializeOperands( de ) ) {
        debugWarning( "%s: %s\n", getCmdName(), m_parseError.toString().c_str() );
        return false;
    }
    return true;
}

bool
FunctionBlockCmd::buildOperands( std::vector<fb_byte_t>& operands )
{
    fcp_frame_t buf;
    Util::Cmd::BufferSerialize se( buf, sizeof( buf ) );
    if ( !serializeOperands( se ) ) {
        return false;
    }
    operands.assign( buf, buf + se.getNrOfProducesBytes() );
    return true;
}

bool
FunctionBlockCmd::parseOperands( const fb_byte_t* operands, size_t length )
{
    Util::Cmd::BufferDeserialize de( operands, length );
    return deserializeOperands( de );
}

/////////////////////////////////

AudioSelectorCmd::AudioSelectorCmd( Ieee1394::Transport& transport,
                                    fb_byte_t functionBlockId,
                                    EControlAttribute eCtrlAttrib,
                                    fb_byte_t inputPlugId )
    : FunctionBlockCmd( transport, eFBT_Selector, functionBlockId, eCtrlAttrib )
    , m_inputPlugId( inputPlugId )
{
}

bool
AudioSelectorCmd::buildFunctionBlock()
{
    m_selectorData.assign( 1, m_inputPlugId );
    m_control = FunctionBlockControl( eSCS_Selector, std::vector<fb_byte_t>() );
    return true;
}

bool
AudioSelectorCmd::parseFunctionBlock()
{
    if ( m_selectorData.size() != 1 ) {
        m_parseError.set( FunctionBlockParseError::eFBE_UnexpectedOperand, 3 );
        return false;
    }
    if ( m_control.m_controlSelector != eSCS_Selector ) {
        m_parseError.set( FunctionBlockParseError::eFBE_UnexpectedOperand,
                          getControlSelectorOffset() );
        return false;
    }
    if ( !m_control.m_controlData.empty() ) {
        m_parseError.set( FunctionBlockParseError::eFBE_UnexpectedOperand,
                          getControlLengthOffset() );
        return false;
    }
    // a status response reports the selected plug
    m_inputPlugId = m_selectorData[0];
    return true;
}

/////////////////////////////////

AudioFeatureCmd::AudioFeatureCmd( Ieee1394::Transport& transport,
                                  fb_byte_t functionBlockId,
                                  EControlAttribute eCtrlAttrib,
                                  const AudioChannel& channel,
                                  const FeatureControl& control )
    : FunctionBlockCmd( transport, eFBT_Feature, functionBlockId, eCtrlAttrib )
    , m_channel( channel )
    , m_feature( control )
{
}

bool
AudioFeatureCmd::buildFunctionBlock()
{
    m_selectorData.assign( 1, m_channel.encode() );
    return m_feature.toControl( m_control );
}

bool
AudioFeatureCmd::parseFunctionBlock()
{
    if ( m_selectorData.size() != 1 ) {
        m_parseError.set( FunctionBlockParseError::eFBE_UnexpectedOperand, 3 );
        return false;
    }
    if ( AudioChannel::decode( m_selectorData[0] ) != m_channel ) {
        m_parseError.set( FunctionBlockParseError::eFBE_UnexpectedOperand, 4 );
        return false;
    }
    if ( m_control.m_controlSelector != m_feature.m_selector ) {
        m_parseError.set( FunctionBlockParseError::eFBE_UnexpectedOperand,
                          getControlSelectorOffset() );
        return false;
    }
    return m_feature.fromControl( m_control, getControlDataOffset(), m_parseError );
}

/////////////////////////////////

AudioProcessingCmd::AudioProcessingCmd( Ieee1394::Transport& transport,
                                        fb_byte_t functionBlockId,
                                        EControlAttribute eCtrlAttrib,
                                        fb_byte_t inputPlugId,
                                        const AudioChannel& inputChannel,
                                        const AudioChannel& outputChannel,
                                        const ProcessingControl& control )
    : FunctionBlockCmd( transport, eFBT_Processing, functionBlockId, eCtrlAttrib )
    , m_inputPlugId( inputPlugId )
    , m_inputChannel( inputChannel )
    , m_outputChannel( outputChannel )
    , m_processing( control )
{
}

bool
AudioProcessingCmd::buildFunctionBlock()
{
    m_selectorData.clear();
    m_selectorData.push_back( m_inputPlugId );
    m_selectorData.push_back( m_inputChannel.encode() );
    m_selectorData.push_back( m_outputChannel.encode() );
    return m_processing.toControl( m_control );
}

bool
AudioProcessingCmd::parseFunctionBlock()
{
    if ( m_selectorData.size() != 3 ) {
        m_parseError.set( FunctionBlockParseError::eFBE_UnexpectedOperand, 3 );
        return false;
    }
    if ( m_selectorData[0] != m_inputPlugId ) {
        m_parseError.set( FunctionBlockParseError::eFBE_UnexpectedOperand, 4 );
        return false;
    }
    if ( AudioChannel::decode( m_selectorData[1] ) != m_inputChannel ) {
        m_parseError.set( FunctionBlockParseError::eFBE_UnexpectedOperand, 5 );
        return false;
    }
    if ( AudioChannel::decode( m_selectorData[2] ) != m_outputChannel ) {
        m_parseError.set( FunctionBlockParseError::eFBE_UnexpectedOperand, 6 );
        return false;
    }
    if ( m_control.m_controlSelector != m_processing.m_selector ) {
        m_parseError.set( FunctionBlockParseError::eFBE_UnexpectedOperand,
                          getControlSelectorOffset() );
        return false;
    }
    return m_processing.fromControl( m_control, getControlDataOffset(), m_parseError );
}

}
