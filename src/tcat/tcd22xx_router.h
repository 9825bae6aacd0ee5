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

#ifndef TCAT_TCD22XX_ROUTER_H
#define TCAT_TCD22XX_ROUTER_H

#include "debugmodule/debugmodule.h"

#include "tcd22xx_spec.h"
#include "tcat_eap.h"
#include "tcat_error.h"

#include <vector>

namespace Tcat {

/**
 * @brief Destination groups exposed as one control each
 *
 * The sources offered to a group never include the group's own blocks.
 */
enum eRouterGroup {
    eRG_Output = 0,
    eRG_Stream,
    eRG_Mixer,
};

#define TCAT_ROUTER_NONE_LABEL "None"

const char* routerGroupToString( enum eRouterGroup g );

/**
 * @brief Router of a TCD22xx unit
 *
 * Keeps the entries of the current rate mode and the blocks available at
 * that mode. A selection is an index per destination of a group: 0 for no
 * source, n for the (n-1)th source offered to the group.
 */
class RouterEngine
{
public:
    RouterEngine( EAP& eap, const DeviceProfile& profile );
    virtual ~RouterEngine();

    /**
     * @brief read the blocks and the entries of a rate mode
     *
     * The entries are refined against the available blocks and written
     * back so that the fixed sources keep their positions.
     */
    enum eStatus cache( enum eRateMode mode );
    bool isCached() const
        { return m_cached; };

    enum eRateMode getRateMode() const
        { return m_rate_mode; };
    const RouterEntryVector& getEntries() const
        { return m_entries; };

    const BlockPair& getRealBlkPair() const
        { return m_real; };
    const BlockPair& getStreamBlkPair() const
        { return m_stream; };
    const BlockPair& getMixerBlkPair() const
        { return m_mixer; };
    BlockPair getAvailBlkPair() const;

    const DstBlkVector& getDestinations( enum eRouterGroup g ) const;
    SrcBlkVector getSources( enum eRouterGroup g ) const;
    stringlist getDestinationLabels( enum eRouterGroup g ) const;
    /// the first label is the one of index 0
    stringlist getSourceLabels( enum eRouterGroup g ) const;

    /**
     * @brief translate an index of a group to a source
     * @return false if the index is out of range
     */
    bool resolveSource( enum eRouterGroup g, unsigned int idx, SrcBlk& src ) const;

    /// index per destination of the group, 0 for a silent destination
    void readSelection( enum eRouterGroup g, std::vector<unsigned int>& values ) const;
    /**
     * @brief select the sources of all destinations of a group
     *
     * Nothing is sent if the selection equals the current one.
     */
    enum eStatus writeSelection( enum eRouterGroup g, const std::vector<unsigned int>& values );
    /// route one destination, unassigned src silences it
    enum eStatus writeRoute( const DstBlk& dst, const SrcBlk& src );
    /// replace all entries
    enum eStatus writeEntries( const RouterEntryVector& entries );

    void show();
    void setVerboseLevel( int l );

private:
    /**
     * @brief refine the entries, write them and make the device load them
     *
     * entries holds the refined list on return.
     */
    enum eStatus update( RouterEntryVector& entries );

    EAP& m_eap;
    const DeviceProfile& m_profile;

    bool m_cached;
    enum eRateMode m_rate_mode;
    BlockPair m_real;
    BlockPair m_stream;
    BlockPair m_mixer;
    RouterEntryVector m_entries;

protected:
    DECLARE_DEBUG_MODULE;
};

} // namespace Tcat

#endif // TCAT_TCD22XX_ROUTER_H
