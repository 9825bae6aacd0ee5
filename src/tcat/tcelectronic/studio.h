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

#ifndef TCAT_TCELECTRONIC_STUDIO_H
#define TCAT_TCELECTRONIC_STUDIO_H

#include "debugmodule/debugmodule.h"

#include "tcat/tcat_eap.h"
#include "tcat/tcat_error.h"

#include <vector>

/**
 *  Studio Konnekt 48 physical output segment in the application space
 */
#define STUDIO_PHYS_OUT_OFFSET          0x03dc
#define STUDIO_PHYS_OUT_GROUPS_OFFSET   ( STUDIO_PHYS_OUT_OFFSET + 332 )
#define STUDIO_PHYS_OUT_PAIR_COUNT      11
#define STUDIO_OUTPUT_GROUP_COUNT       3
#define STUDIO_OUT_GROUP_SIZE           36
#define STUDIO_OUT_GROUP_QUADS          ( STUDIO_OUT_GROUP_SIZE / 4 )

// more assigned outputs than this freeze the ASIC of the unit
#define STUDIO_MAX_SURROUND_CHANNELS    8

namespace Tcat {
namespace TcElectronic {

enum eCrossOverFreq {
    eCOF_50 = 0,
    eCOF_80,
    eCOF_95,
    eCOF_110,
    eCOF_115,
    eCOF_120,
};

enum eHighPassFreq {
    eHPF_Off = 0,
    eHPF_Above12,
    eHPF_Above24,
};

enum eLowPassFreq {
    eLPF_Below12 = 1,
    eLPF_Below24,
};

/**
 * @brief a set of physical outputs forming one surround group
 *
 * The frequency fields keep the raw register value so that codes the
 * firmware reports outside the known enumerations survive a write.
 */
struct OutGroup {
    OutGroup();
    bool operator==( const OutGroup& other ) const;

    std::vector<bool> assigned_phys_outs;
    bool bass_management;
    // -1 without a sub channel
    int sub_channel;
    uint32_t main_cross_over_freq;
    int32_t main_level_to_sub;
    int32_t sub_level_to_sub;
    uint32_t main_filter_for_main;
    uint32_t main_filter_for_sub;
};

typedef std::vector<OutGroup> OutGroupVector;

unsigned int countAssignedOutputs( const OutGroup& group );

/**
 * @brief encode a group into host order quadlets
 * @return eS_InvalidArgument if more than STUDIO_MAX_SURROUND_CHANNELS
 *         outputs are assigned or the sub channel is out of range
 */
enum eStatus buildOutGroup( const OutGroup& group, fb_quadlet_t quads[STUDIO_OUT_GROUP_QUADS] );
void parseOutGroup( const fb_quadlet_t quads[STUDIO_OUT_GROUP_QUADS], OutGroup& group );

const char* crossOverFreqToString( uint32_t freq );

/**
 * @brief surround output groups of the Studio Konnekt 48
 */
class StudioOutGroups
{
public:
    StudioOutGroups( EAP& eap );
    virtual ~StudioOutGroups();

    enum eStatus cache();
    const OutGroupVector& getGroups() const
        { return m_groups; };

    /// write the quadlets of one group that differ from the cached state
    enum eStatus writeGroup( unsigned int idx, const OutGroup& group );

    void show();
    void setVerboseLevel( int l );

private:
    EAP& m_eap;
    OutGroupVector m_groups;

protected:
    DECLARE_DEBUG_MODULE;
};

} // namespace TcElectronic
} // namespace Tcat

#endif // TCAT_TCELECTRONIC_STUDIO_H
