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

#ifndef TCAT_DEVICE_H
#define TCAT_DEVICE_H

#include "tcat_protocol.h"

#include "debugmodule/debugmodule.h"
#include "libieee1394/Transport.h"

#include <string>
#include <vector>
#include <utility>

namespace Tcat {

/**
 * @brief Location of a register section, both in bytes
 */
struct Section {
    Section()
        : offset( 0 ), size( 0 ) {};

    fb_quadlet_t offset;
    fb_quadlet_t size;
};

struct ClockConfig {
    ClockConfig()
        : rate( eCR_None ), src( eCS_Internal ) {};
    ClockConfig( enum eClockRate r, enum eClockSource s )
        : rate( r ), src( s ) {};

    bool operator==( const ClockConfig& other ) const
        { return rate == other.rate && src == other.src; };
    bool operator!=( const ClockConfig& other ) const
        { return !( *this == other ); };

    enum eClockRate rate;
    enum eClockSource src;
};

struct ClockStatus {
    ClockStatus()
        : src_is_locked( false ), rate( eCR_None ) {};

    bool src_is_locked;
    enum eClockRate rate;
};

/**
 * @brief Lock and slip state per external source with a label
 */
struct ExternalSourceStates {
    ClockSourceVector sources;
    std::vector<bool> locked;
    std::vector<bool> slipped;
};

typedef std::pair<enum eClockSource, std::string> ClockSourceLabel;
typedef std::vector<ClockSourceLabel> ClockSourceLabelVector;

struct GlobalParameters {
    GlobalParameters()
        : owner( 0 )
        , latest_notification( 0 )
        , enable( false )
        , current_rate( 0 )
        , version( 0 ) {};

    fb_octlet_t owner;
    fb_quadlet_t latest_notification;
    std::string nickname;
    ClockConfig clock_config;
    bool enable;
    ClockStatus clock_status;
    ExternalSourceStates external_source_states;
    // detected rate in Hz
    unsigned int current_rate;
    fb_quadlet_t version;
    ClockRateVector avail_rates;
    ClockSourceVector avail_sources;
    ClockSourceLabelVector clock_source_labels;
};

struct TxStreamFormatEntry {
    TxStreamFormatEntry()
        : iso_channel( -1 ), pcm( 0 ), midi( 0 ), speed( 0 )
        , iec60958_caps( 0 ), iec60958_enable( 0 ) {};

    int iso_channel;
    unsigned int pcm;
    unsigned int midi;
    unsigned int speed;
    stringlist labels;
    uint32_t iec60958_caps;
    uint32_t iec60958_enable;
};

struct RxStreamFormatEntry {
    RxStreamFormatEntry()
        : iso_channel( -1 ), start( 0 ), pcm( 0 ), midi( 0 )
        , iec60958_caps( 0 ), iec60958_enable( 0 ) {};

    int iso_channel;
    unsigned int start;
    unsigned int pcm;
    unsigned int midi;
    stringlist labels;
    uint32_t iec60958_caps;
    uint32_t iec60958_enable;
};

typedef std::vector<TxStreamFormatEntry> TxStreamFormatEntryVector;
typedef std::vector<RxStreamFormatEntry> RxStreamFormatEntryVector;

/**
 * @brief Access to the general register space of a TCD22xx based unit
 *
 * All register values handed in and out are in host order; offsets are
 * relative to TCAT_REGISTER_BASE and block lengths are in bytes.
 */
class Device
{
public:
    Device( Ieee1394::Transport& transport,
            unsigned int timeout_ms = TCAT_DEFAULT_TIMEOUT_MS );
    virtual ~Device();

    /// read the section table
    bool init();

    Ieee1394::Transport& getTransport()
        { return m_transport; };
    unsigned int getTimeout() const
        { return m_timeout_ms; };
    void setTimeout( unsigned int timeout_ms )
        { m_timeout_ms = timeout_ms; };

    /**
     * @brief replace the clock source list reported by the caps register
     *
     * Some firmwares report bits for sources they cannot lock to.
     */
    void setAvailableClockSourceOverride( const ClockSourceVector& srcs );
    /**
     * @brief order in which the clock source labels are reported
     */
    void setClockSourceLabelTable( const ClockSourceVector& table );

    const Section& getGlobalSection() const
        { return m_global; };
    const Section& getTxStreamFormatSection() const
        { return m_tx_stream_format; };
    const Section& getRxStreamFormatSection() const
        { return m_rx_stream_format; };
    const Section& getExtSyncSection() const
        { return m_ext_sync; };

    bool readGlobalParameters( GlobalParameters& params );
    bool readNotification( fb_quadlet_t& notification );
    /// refresh only the external lock and slip states of params
    bool readExternalStates( GlobalParameters& params );
    bool readCurrentRate( unsigned int& rate );

    bool getNickname( std::string& name );
    bool setNickname( const std::string& name );

    /**
     * @brief write the clock select register
     *
     * The write is done under the device lock.
     */
    bool writeClockConfig( const ClockConfig& config );

    bool readTxStreamFormats( TxStreamFormatEntryVector& entries );
    bool readRxStreamFormats( RxStreamFormatEntryVector& entries );

    bool readReg( fb_nodeaddr_t offset, fb_quadlet_t* result );
    bool writeReg( fb_nodeaddr_t offset, fb_quadlet_t data );
    bool readRegBlock( fb_nodeaddr_t offset, fb_quadlet_t* data, size_t length );
    bool writeRegBlock( fb_nodeaddr_t offset, fb_quadlet_t* data, size_t length );

    bool readGlobalReg( fb_nodeaddr_t offset, fb_quadlet_t* result );
    bool writeGlobalReg( fb_nodeaddr_t offset, fb_quadlet_t data );
    bool readGlobalRegBlock( fb_nodeaddr_t offset, fb_quadlet_t* data, size_t length );
    bool writeGlobalRegBlock( fb_nodeaddr_t offset, fb_quadlet_t* data, size_t length );

    void showGlobalParameters( const GlobalParameters& params ) const;
    void setVerboseLevel( int l );

private:
    bool readSection( fb_nodeaddr_t offset, Section& section, const char* name );
    fb_nodeaddr_t globalOffsetGen( fb_nodeaddr_t offset, size_t length );
    void parseClockCaps( const fb_quadlet_t* regs, GlobalParameters& params ) const;
    void parseExternalStates( fb_quadlet_t reg, GlobalParameters& params ) const;

    Ieee1394::Transport& m_transport;
    unsigned int m_timeout_ms;

    Section m_global;
    Section m_tx_stream_format;
    Section m_rx_stream_format;
    Section m_ext_sync;
    Section m_reserved;

    bool m_has_source_override;
    ClockSourceVector m_source_override;
    ClockSourceVector m_label_table;

protected:
    DECLARE_DEBUG_MODULE;
};

} // namespace Tcat

#endif // TCAT_DEVICE_H
