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

#ifndef TCAT_EAP_H
#define TCAT_EAP_H

#include "tcat_device.h"
#include "tcat_error.h"

#include <vector>

namespace Tcat {

struct RouterCaps {
    RouterCaps()
        : is_exposed( false ), is_readonly( false ), is_storable( false )
        , maximum_entry_count( 0 ) {};

    bool is_exposed;
    bool is_readonly;
    bool is_storable;
    unsigned int maximum_entry_count;
};

struct MixerCaps {
    MixerCaps()
        : is_exposed( false ), is_readonly( false ), is_storable( false )
        , input_device_id( 0 ), output_device_id( 0 )
        , input_count( 0 ), output_count( 0 ) {};

    bool is_exposed;
    bool is_readonly;
    bool is_storable;
    unsigned int input_device_id;
    unsigned int output_device_id;
    unsigned int input_count;
    unsigned int output_count;
};

enum eChip {
    eC_DiceII  = TCAT_EAP_CAP_GENERAL_CHIP_DICEII,
    eC_Tcd2210 = TCAT_EAP_CAP_GENERAL_CHIP_TCD2210,
    eC_Tcd2220 = TCAT_EAP_CAP_GENERAL_CHIP_TCD2220,
    eC_Reserved,
};

struct GeneralCaps {
    GeneralCaps()
        : dynamic_stream_format( false ), storage_avail( false ), peak_avail( false )
        , max_tx_streams( 0 ), max_rx_streams( 0 ), stream_format_is_storable( false )
        , chip( eC_Reserved ), raw_chip( 0 ) {};

    bool dynamic_stream_format;
    bool storage_avail;
    bool peak_avail;
    unsigned int max_tx_streams;
    unsigned int max_rx_streams;
    bool stream_format_is_storable;
    enum eChip chip;
    unsigned int raw_chip;
};

struct ExtensionCaps {
    RouterCaps router;
    MixerCaps mixer;
    GeneralCaps general;
};

struct StreamFormatConfig {
    FormatEntryVector tx_entries;
    FormatEntryVector rx_entries;
};

enum eAdatMode {
    eAM_Normal = 0,
    eAM_SMUX2,
    eAM_SMUX4,
    eAM_Auto,
};

enum eWordClockMode {
    eWCM_Normal = 0,
    eWCM_Low,
    eWCM_Middle,
    eWCM_High,
};

const char* adatModeToString( enum eAdatMode m );
const char* wordClockModeToString( enum eWordClockMode m );

struct WordClockParam {
    WordClockParam()
        : mode( eWCM_Normal ), numerator( 1 ), denominator( 1 ) {};

    bool operator==( const WordClockParam& other ) const
        { return mode == other.mode && numerator == other.numerator
                 && denominator == other.denominator; };

    enum eWordClockMode mode;
    // both at least 1
    uint16_t numerator;
    uint16_t denominator;
};

struct StandaloneParameters {
    StandaloneParameters()
        : clock_source( eCS_Internal ), aes_high_rate( false )
        , adat_mode( eAM_Auto ), internal_rate( eCR_48000 ) {};

    bool operator==( const StandaloneParameters& other ) const
        { return clock_source == other.clock_source && aes_high_rate == other.aes_high_rate
                 && adat_mode == other.adat_mode && word_clock == other.word_clock
                 && internal_rate == other.internal_rate; };
    bool operator!=( const StandaloneParameters& other ) const
        { return !( *this == other ); };

    enum eClockSource clock_source;
    bool aes_high_rate;
    enum eAdatMode adat_mode;
    WordClockParam word_clock;
    enum eClockRate internal_rate;
};

/**
 * @brief encode the standalone section
 * @return eS_InvalidArgument for a zero word clock numerator or denominator
 */
enum eStatus buildStandalone( const StandaloneParameters& params,
                              fb_quadlet_t quads[TCAT_EAP_STANDALONE_SIZE / 4] );
void parseStandalone( const fb_quadlet_t quads[TCAT_EAP_STANDALONE_SIZE / 4],
                      StandaloneParameters& params );

// rows by mixer output, columns by mixer input
typedef std::vector<int16_t> MixerRow;
typedef std::vector<MixerRow> MixerCoefficients;

/**
 * @brief Extended application protocol (EAP) of TCD22xx units
 *
 * Gives access to the router, mixer, stream format and standalone
 * configuration and runs the commands that make the device apply them.
 */
class EAP
{
public:
    /**
     * @brief Command status
     */
    enum eWaitReturn {
        eWR_Error,
        eWR_Timeout,
        eWR_Busy,
        eWR_Done,
    };

    /**
     * @brief Constants for the EAP spaces
     *
     * @see offsetGen for the calculation of the real offsets.
     */
    enum eRegBase {
        eRT_Base,
        eRT_Capability,
        eRT_Command,
        eRT_Mixer,
        eRT_Peak,
        eRT_NewRouting,
        eRT_NewStreamCfg,
        eRT_CurrentCfg,
        eRT_Standalone,
        eRT_Application,
        eRT_None,
    };

    EAP( Device& d );
    virtual ~EAP();

    /// read the section table and the capabilities
    bool init();

    Device& getDevice()
        { return m_device; };
    const ExtensionCaps& getCaps() const
        { return m_caps; };
    const Section& getSection( enum eRegBase base ) const;

    /// Is the current operation still busy?
    enum eWaitReturn operationBusy();
    /// Block until the current operation is done
    enum eWaitReturn waitForOperationEnd( int max_wait_time_ms = TCAT_EAP_CMD_MAX_WAIT_MS );

    bool loadRouter( enum eRateMode mode );
    bool loadStreamConfig( enum eRateMode mode );
    bool loadRouterStreamConfig( enum eRateMode mode );
    /// Restore from flash
    bool loadFlashConfig();
    /// Store to flash
    bool storeFlashConfig();

    /// read the router section which is applied by loadRouter()
    bool readRouterEntries( RouterEntryVector& entries );
    bool writeRouterEntries( const RouterEntryVector& entries );
    /// read count entries from the peak section
    bool readPeakEntries( unsigned int count, RouterEntryVector& entries );

    bool readStreamConfig( StreamFormatConfig& config );
    bool writeStreamConfig( const StreamFormatConfig& config );

    bool readCurrentRouterEntries( enum eRateMode mode, RouterEntryVector& entries );
    bool readCurrentStreamConfig( enum eRateMode mode, StreamFormatConfig& config );

    bool readMixerSaturation( std::vector<bool>& saturation );
    bool readMixerCoefficients( MixerCoefficients& coefs );
    /// write the quadlets of one mixer output, starting at its first input
    bool writeMixerRow( unsigned int dst, const fb_quadlet_t* quads, size_t nb_quads );

    bool readStandalone( StandaloneParameters& params );
    /**
     * @brief write the quadlets of the standalone section that differ
     *        from prev
     */
    enum eStatus writeStandalone( const StandaloneParameters& params,
                                  const StandaloneParameters& prev );

    bool readApplication( unsigned int offset, fb_quadlet_t* data, size_t length );
    bool writeApplication( unsigned int offset, fb_quadlet_t* data, size_t length );

    /**
      @{
      @brief Read and write registers on the device
      */
    bool readReg( enum eRegBase, unsigned offset, fb_quadlet_t* );
    bool writeReg( enum eRegBase, unsigned offset, fb_quadlet_t );
    bool readRegBlock( enum eRegBase, unsigned offset, fb_quadlet_t*, size_t );
    bool writeRegBlock( enum eRegBase, unsigned offset, fb_quadlet_t*, size_t );
    //@}

    /// Show information about the EAP
    void show();
    void setVerboseLevel( int l );

private:
    bool commandHelper( fb_quadlet_t cmd );
    fb_quadlet_t rateModeFlag( enum eRateMode mode );
    bool readEntries( enum eRegBase base, unsigned offset, RouterEntryVector& entries );
    bool readStreamConfig( enum eRegBase base, unsigned offset, StreamFormatConfig& config );
    bool readFormatEntry( enum eRegBase base, unsigned offset, FormatEntry& entry );
    bool writeFormatEntry( enum eRegBase base, unsigned offset, const FormatEntry& entry );
    unsigned int currentRouterOffset( enum eRateMode mode );
    unsigned int currentStreamOffset( enum eRateMode mode );

    /// Calculate the real offset for the different spaces
    fb_nodeaddr_t offsetGen( enum eRegBase, unsigned, size_t );

    Device& m_device;
    ExtensionCaps m_caps;

    Section m_capability;
    Section m_cmd;
    Section m_mixer;
    Section m_peak;
    Section m_new_routing;
    Section m_new_stream_cfg;
    Section m_curr_cfg;
    Section m_standalone;
    Section m_app;
    Section m_none;

protected:
    DECLARE_DEBUG_MODULE;
};

} // namespace Tcat

#endif // TCAT_EAP_H
