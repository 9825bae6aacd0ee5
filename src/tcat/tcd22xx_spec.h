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

#ifndef TCAT_TCD22XX_SPEC_H
#define TCAT_TCD22XX_SPEC_H

#include "tcat_protocol.h"
#include "tcat_eap.h"

#include <string>
#include <vector>

namespace Tcat {

/**
 * @brief Physical input ports of one block, feeding the router
 */
struct BlockInput {
    enum eSrcBlkId id;
    uint8_t offset;
    uint8_t count;
    // NULL for the generic label
    const char* label;
};

/**
 * @brief Physical output ports of one block, fed by the router
 */
struct BlockOutput {
    enum eDstBlkId id;
    uint8_t offset;
    uint8_t count;
    const char* label;
};

typedef std::vector<BlockInput> BlockInputVector;
typedef std::vector<BlockOutput> BlockOutputVector;

/**
 * @brief Source and destination blocks available at one time
 */
struct BlockPair {
    SrcBlkVector srcs;
    DstBlkVector dsts;
};

/**
 * @brief Port layout of a model built on the TCD2210/TCD2220
 *
 * The tables are fixed for a model; everything else is derived from them
 * and from what the device reports at runtime.
 */
class DeviceProfile
{
public:
    virtual ~DeviceProfile() {};

    virtual const char* getName() const = 0;
    virtual fb_quadlet_t getVendorId() const = 0;
    virtual fb_quadlet_t getModelId() const = 0;

    virtual const BlockInputVector& getInputs() const = 0;
    virtual const BlockOutputVector& getOutputs() const = 0;
    /// sources at fixed positions in the router entries, for the meters
    virtual const SrcBlkVector& getFixed() const = 0;

    /// sources to report instead of the clock caps register, empty for none
    virtual const ClockSourceVector& getClockSourceOverride() const = 0;

    unsigned int getAdatChannelCount( enum eRateMode mode ) const;
    unsigned int getMixerOutPortCount( enum eRateMode mode ) const;
    unsigned int getMixerInPortCount() const;

    /// physical ports at a rate mode, ADAT blocks shrink with the rate
    BlockPair computeAvailRealBlkPair( enum eRateMode mode ) const;
    /// stream channels carried by the negotiated tx and rx streams
    BlockPair computeAvailStreamBlkPair( const FormatEntryVector& tx_entries,
                                         const FormatEntryVector& rx_entries ) const;
    BlockPair computeAvailMixerBlkPair( const ExtensionCaps& caps,
                                        enum eRateMode mode ) const;

    /**
     * @brief all blocks available at a rate mode
     *
     * Real blocks first, then stream blocks, then mixer blocks.
     */
    BlockPair computeAvailBlkPair( const ExtensionCaps& caps, enum eRateMode mode,
                                   const StreamFormatConfig& streams ) const;

    /**
     * @brief label of a source
     * @param stream_srcs currently carried stream sources, to decide between
     *        "Stream" and "Stream-A"
     */
    std::string srcBlkLabel( const SrcBlk& src, const SrcBlkVector& stream_srcs ) const;
    std::string dstBlkLabel( const DstBlk& dst, const DstBlkVector& stream_dsts ) const;

    /**
     * @brief drop entries for unavailable blocks and put the fixed sources
     *        in front
     *
     * A fixed source without an entry gets one with an unassigned
     * destination so that its peak is still reported.
     */
    void refineRouterEntries( RouterEntryVector& entries, const BlockPair& avail ) const;
};

/**
 * @brief A profile defined by constant tables
 */
class StaticDeviceProfile : public DeviceProfile
{
public:
    StaticDeviceProfile( const char* name, fb_quadlet_t vendor_id, fb_quadlet_t model_id,
                         const BlockInput* inputs, size_t nb_inputs,
                         const BlockOutput* outputs, size_t nb_outputs,
                         const SrcBlk* fixed, size_t nb_fixed,
                         const enum eClockSource* clock_sources = NULL,
                         size_t nb_clock_sources = 0 );
    virtual ~StaticDeviceProfile() {};

    virtual const char* getName() const
        { return m_name; };
    virtual fb_quadlet_t getVendorId() const
        { return m_vendor_id; };
    virtual fb_quadlet_t getModelId() const
        { return m_model_id; };
    virtual const BlockInputVector& getInputs() const
        { return m_inputs; };
    virtual const BlockOutputVector& getOutputs() const
        { return m_outputs; };
    virtual const SrcBlkVector& getFixed() const
        { return m_fixed; };
    virtual const ClockSourceVector& getClockSourceOverride() const
        { return m_clock_source_override; };

private:
    const char* m_name;
    fb_quadlet_t m_vendor_id;
    fb_quadlet_t m_model_id;
    BlockInputVector m_inputs;
    BlockOutputVector m_outputs;
    SrcBlkVector m_fixed;
    ClockSourceVector m_clock_source_override;
};

} // namespace Tcat

#endif // TCAT_TCD22XX_SPEC_H
