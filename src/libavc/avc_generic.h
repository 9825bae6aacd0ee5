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

#ifndef AVCGENERIC_H
#define AVCGENERIC_H

#include "debugmodule/debugmodule.h"

#include "tcattypes.h"

namespace Util {
    namespace Cmd {
        class IOSSerialize;
        class IISDeserialize;
    }
}

namespace Ieee1394 {
    class Transport;
}

namespace AVC {

const int fcpFrameMaxLength = 512;
typedef unsigned char fcp_frame_t[fcpFrameMaxLength];

typedef fb_byte_t ctype_t;
typedef fb_byte_t subunit_t;
typedef fb_byte_t opcode_t;
typedef fb_byte_t subunit_id_t;

enum ESubunitType {
    eST_Monitor       = 0x00,
    eST_Audio         = 0x01,
    eST_Printer       = 0x02,
    eST_Disc          = 0x03,
    eST_VCR           = 0x04,
    eST_Tuner         = 0x05,
    eST_CA            = 0x06,
    eST_Camera        = 0x07,
    eST_Panel         = 0x09,
    eST_BulltinBoard  = 0x0A,
    eST_CameraStorage = 0x0B,
    eST_Music         = 0x0C,
    eST_VendorUnique  = 0x1C,
    eST_Extended      = 0x1E,
    eST_Unit          = 0x1F,
};

class IBusData {
public:
    IBusData() {}
    virtual ~IBusData() {}

    virtual bool serialize( Util::Cmd::IOSSerialize& se ) = 0;
    virtual bool deserialize( Util::Cmd::IISDeserialize& de ) = 0;

    virtual IBusData* clone() const = 0;

protected:
    DECLARE_DEBUG_MODULE;
};

class AVCCommand
{
public:
    enum EResponse {
        eR_Unknown        = 0xff,
        eR_NotImplemented = 0x08,
        eR_Accepted       = 0x09,
        eR_Rejected       = 0x0a,
        eR_InTransition   = 0x0b,
        eR_Implemented    = 0x0c,
        eR_Changed        = 0x0d,
        eR_Interim        = 0x0f,
    };

    enum ECommandType {
        eCT_Control         = 0x00,
        eCT_Status          = 0x01,
        eCT_SpecificInquiry = 0x02,
        eCT_Notify          = 0x03,
        eCT_GeneralInquiry  = 0x04,
        eCT_Unknown         = 0xff,
    };

    virtual bool serialize( Util::Cmd::IOSSerialize& se );
    virtual bool deserialize( Util::Cmd::IISDeserialize& de );

    virtual bool setCommandType( ECommandType commandType );
    /**
     * @brief send the command and parse the response
     * @return true if the unit accepted the command (control) or reported
     *         its state (status) and the response could be parsed
     */
    virtual bool fire( unsigned int timeout_ms );

    EResponse getResponse();

    bool setSubunitType( ESubunitType subunitType );
    bool setSubunitId( subunit_id_t subunitId );

    ESubunitType getSubunitType();
    subunit_id_t getSubunitId();

    bool setVerbose( int verboseLevel );
    int getVerboseLevel();

    virtual const char* getCmdName() const = 0;

protected:
    void showFcpFrame( const unsigned char* buf,
                       unsigned short frameSize ) const;

protected:
    AVCCommand( Ieee1394::Transport& transport, opcode_t opcode );
    virtual ~AVCCommand() {}

    ECommandType getCommandType();

    Ieee1394::Transport* m_transport;

    fcp_frame_t      m_fcpFrame;

private:
    ctype_t      m_ctype;
    subunit_t    m_subunit;
    opcode_t     m_opcode;
    EResponse    m_eResponse;
    ECommandType m_commandType;

protected:
    DECLARE_DEBUG_MODULE;
};

const char* subunitTypeToString( ESubunitType subunitType );
const char* responseToString( AVCCommand::EResponse eResponse );

}

#endif // AVCGENERIC_H
