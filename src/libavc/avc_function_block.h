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

#ifndef AVCFUNCTIONBLOCK_H
#define AVCFUNCTIONBLOCK_H

#include "avc_generic.h"

#include <vector>

#define AVC_FUNCTION_BLOCK_OPCODE  0xB8

#define AVC_FB_TRUE                0x70
#define AVC_FB_FALSE               0x60

// volume levels are 1/256 dB steps
#define AVC_FB_VOLUME_INFINITY     ((int16_t)0x7ffe)
#define AVC_FB_VOLUME_NEG_INFINITY ((int16_t)0x8000)

namespace AVC {

/**
 * Result of parsing the operands of a FUNCTION_BLOCK response.
 *
 * For eFBE_TooShort the index holds the number of operand bytes that would
 * have been needed, for eFBE_UnexpectedOperand it holds the position of the
 * offending operand byte.
 */
class FunctionBlockParseError {
public:
    enum EKind {
        eFBE_None,
        eFBE_TooShort,
        eFBE_UnexpectedOperand,
    };

    FunctionBlockParseError()
        : m_kind( eFBE_None )
        , m_index( 0 )
        {}

    void clear()
        { m_kind = eFBE_None; m_index = 0; }
    void set( EKind kind, size_t index )
        { m_kind = kind; m_index = index; }

    bool isError() const
        { return m_kind != eFBE_None; }
    EKind getKind() const
        { return m_kind; }
    size_t getIndex() const
        { return m_index; }

    std::string toString() const;

private:
    EKind  m_kind;
    size_t m_index;
};

struct AudioChannel {
    enum EType {
        eAC_Master,
        eAC_Each,
        eAC_Void,
        eAC_All,
    };

    AudioChannel()
        : m_type( eAC_Master )
        , m_number( 0 )
        {}
    AudioChannel( EType type, fb_byte_t number = 0 )
        : m_type( type )
        , m_number( type == eAC_Each ? number : 0 )
        {}

    // Each(n) travels as n + 1, so n stays below 0xfd
    fb_byte_t encode() const;
    static AudioChannel decode( fb_byte_t value );

    bool operator==( const AudioChannel& other ) const
        { return m_type == other.m_type && m_number == other.m_number; }
    bool operator!=( const AudioChannel& other ) const
        { return !( *this == other ); }

    EType     m_type;
    fb_byte_t m_number;
};

/**
 * Raw control part of a function block: the control selector followed by
 * an optional length-prefixed data block.
 */
class FunctionBlockControl : public IBusData
{
public:
    FunctionBlockControl();
    FunctionBlockControl( fb_byte_t selector, const std::vector<fb_byte_t>& data );
    virtual ~FunctionBlockControl() {}

    virtual bool serialize( Util::Cmd::IOSSerialize& se );
    virtual bool deserialize( Util::Cmd::IISDeserialize& de );
    virtual FunctionBlockControl* clone() const;

    fb_byte_t              m_controlSelector;
    std::vector<fb_byte_t> m_controlData;
};

class FeatureControl
{
public:
    enum EControlSelector {
        eFCS_Mute             = 0x01,
        eFCS_Volume           = 0x02,
        eFCS_LRBalance        = 0x03,
        eFCS_FRBalance        = 0x04,
        eFCS_Bass             = 0x05,
        eFCS_Mid              = 0x06,
        eFCS_Treble           = 0x07,
        eFCS_GraphicEqualizer = 0x08,
        eFCS_AutomaticGain    = 0x09,
        eFCS_Delay            = 0x0a,
        eFCS_BassBoost        = 0x0b,
        eFCS_Loudness         = 0x0c,
    };

    FeatureControl();

    static FeatureControl mute( const std::vector<bool>& values );
    static FeatureControl volume( const std::vector<int16_t>& values );
    static FeatureControl lrBalance( int16_t value );
    static FeatureControl frBalance( int16_t value );
    static FeatureControl bass( const std::vector<int8_t>& values );
    static FeatureControl mid( const std::vector<int8_t>& values );
    static FeatureControl treble( const std::vector<int8_t>& values );
    static FeatureControl graphicEqualizer( const fb_quadlet_t bandsPresent,
                                            const fb_quadlet_t extBandsPresent,
                                            const std::vector<int8_t>& gains );
    static FeatureControl automaticGain( const std::vector<bool>& values );
    static FeatureControl delay( const std::vector<uint16_t>& values );
    static FeatureControl bassBoost( const std::vector<bool>& values );
    static FeatureControl loudness( const std::vector<bool>& values );
    static FeatureControl reserved( fb_byte_t selector, const std::vector<fb_byte_t>& data );

    bool isReserved() const;

    bool toControl( FunctionBlockControl& control ) const;
    /**
     * @param dataOffset operand position of the first control data byte,
     *                   used for error reporting
     */
    bool fromControl( const FunctionBlockControl& control,
                      size_t dataOffset,
                      FunctionBlockParseError& error );

    bool operator==( const FeatureControl& other ) const;

    fb_byte_t              m_selector;
    std::vector<bool>      m_flags;
    std::vector<int16_t>   m_levels;
    std::vector<int8_t>    m_tones;
    fb_quadlet_t           m_bandsPresent;
    fb_quadlet_t           m_extBandsPresent;
    std::vector<uint16_t>  m_delays;
    std::vector<fb_byte_t> m_raw;
};

class ProcessingControl
{
public:
    enum EControlSelector {
        ePCS_Enable = 0x01,
        ePCS_Mode   = 0x02,
        ePCS_Mixer  = 0x03,
    };

    ProcessingControl();

    static ProcessingControl enable( bool value );
    static ProcessingControl mode( const std::vector<fb_byte_t>& values );
    static ProcessingControl mixer( const std::vector<int16_t>& values );
    static ProcessingControl reserved( fb_byte_t selector, const std::vector<fb_byte_t>& data );

    bool isReserved() const;

    bool toControl( FunctionBlockControl& control ) const;
    bool fromControl( const FunctionBlockControl& control,
                      size_t dataOffset,
                      FunctionBlockParseError& error );

    bool operator==( const ProcessingControl& other ) const;

    fb_byte_t              m_selector;
    bool                   m_enable;
    std::vector<fb_byte_t> m_modes;
    std::vector<int16_t>   m_gains;
    std::vector<fb_byte_t> m_raw;
};

/**
 * FUNCTION BLOCK command addressed to an audio subunit.
 *
 * Operands: function block type, id, control attribute, selector length
 * (one plus the selector data), selector data, control selector and, when
 * the control carries data, its length and the data itself.
 */
class FunctionBlockCmd: public AVCCommand
{
public:
    enum EFunctionBlockType {
        eFBT_Selector   = 0x80,
        eFBT_Feature    = 0x81,
        eFBT_Processing = 0x82,
    };

    enum EControlAttribute {
        eCA_Resolution = 0x01,
        eCA_Minimum    = 0x02,
        eCA_Maximum    = 0x03,
        eCA_Default    = 0x04,
        eCA_Duration   = 0x08,
        eCA_Current    = 0x10,
        eCA_Move       = 0x18,
        eCA_Delta      = 0x19,
    };

    FunctionBlockCmd( Ieee1394::Transport& transport,
                      EFunctionBlockType eType,
                      fb_byte_t functionBlockId,
                      EControlAttribute eCtrlAttrib );
    virtual ~FunctionBlockCmd();

    virtual bool serialize( Util::Cmd::IOSSerialize& se );
    virtual bool deserialize( Util::Cmd::IISDeserialize& de );

    // operand level access, without the ctype/subunit/opcode header
    bool buildOperands( std::vector<fb_byte_t>& operands );
    bool parseOperands( const fb_byte_t* operands, size_t length );

    const FunctionBlockParseError& getParseError() const
        { return m_parseError; }

    EFunctionBlockType getFunctionBlockType() const
        { return m_functionBlockType; }
    fb_byte_t getFunctionBlockId() const
        { return m_functionBlockId; }
    EControlAttribute getControlAttribute() const
        { return m_controlAttribute; }

    virtual const char* getCmdName() const = 0;

protected:
    // fill m_selectorData and m_control from the typed members
    virtual bool buildFunctionBlock() = 0;
    // check m_selectorData and m_control against the request
    virtual bool parseFunctionBlock() = 0;

    bool serializeOperands( Util::Cmd::IOSSerialize& se );
    bool deserializeOperands( Util::Cmd::IISDeserialize& de );

    size_t getControlSelectorOffset() const
        { return 4 + m_selectorData.size(); }
    size_t getControlLengthOffset() const
        { return 5 + m_selectorData.size(); }
    size_t getControlDataOffset() const
        { return 6 + m_selectorData.size(); }

    EFunctionBlockType     m_functionBlockType;
    fb_byte_t              m_functionBlockId;
    EControlAttribute      m_controlAttribute;
    std::vector<fb_byte_t> m_selectorData;
    FunctionBlockControl   m_control;
    FunctionBlockParseError m_parseError;
};

class AudioSelectorCmd: public FunctionBlockCmd
{
public:
    enum { eSCS_Selector = 0x01 };

    AudioSelectorCmd( Ieee1394::Transport& transport,
                      fb_byte_t functionBlockId,
                      EControlAttribute eCtrlAttrib,
                      fb_byte_t inputPlugId );
    virtual ~AudioSelectorCmd() {}

    virtual const char* getCmdName() const
        { return "AudioSelectorCmd"; }

    fb_byte_t m_inputPlugId;

protected:
    virtual bool buildFunctionBlock();
    virtual bool parseFunctionBlock();
};

class AudioFeatureCmd: public FunctionBlockCmd
{
public:
    AudioFeatureCmd( Ieee1394::Transport& transport,
                     fb_byte_t functionBlockId,
                     EControlAttribute eCtrlAttrib,
                     const AudioChannel& channel,
                     const FeatureControl& control );
    virtual ~AudioFeatureCmd() {}

    virtual const char* getCmdName() const
        { return "AudioFeatureCmd"; }

    AudioChannel   m_channel;
    FeatureControl m_feature;

protected:
    virtual bool buildFunctionBlock();
    virtual bool parseFunctionBlock();
};

class AudioProcessingCmd: public FunctionBlockCmd
{
public:
    AudioProcessingCmd( Ieee1394::Transport& transport,
                        fb_byte_t functionBlockId,
                        EControlAttribute eCtrlAttrib,
                        fb_byte_t inputPlugId,
                        const AudioChannel& inputChannel,
                        const AudioChannel& outputChannel,
                        const ProcessingControl& control );
    virtual ~AudioProcessingCmd() {}

    virtual const char* getCmdName() const
        { return "AudioProcessingCmd"; }

    fb_byte_t         m_inputPlugId;
    AudioChannel      m_inputChannel;
    AudioChannel      m_outputChannel;
    ProcessingControl m_processing;

protected:
    virtual bool buildFunctionBlock();
    virtual bool parseFunctionBlock();
};

}

#endif // AVCFUNCTIONBLOCK_H
