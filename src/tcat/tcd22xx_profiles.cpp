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

#include "tcd22xx_profiles.h"

namespace Tcat {

#define NB_OF( table ) ( sizeof( table ) / sizeof( table[0] ) )

// Focusrite Saffire Pro 24

static const BlockInput spro24_inputs[] = {
    { eSB_Ins0, 2, 2, "Mic" },
    { eSB_Ins0, 0, 2, "Line" },
    // coaxial and optical S/PDIF share the optical interface with ADAT
    { eSB_Aes,  6, 2, "S/PDIF-coax" },
    { eSB_Adat, 0, 8, NULL },
    { eSB_Aes,  4, 2, "S/PDIF-opt" },
};
static const BlockOutput spro24_outputs[] = {
    { eDB_Ins0, 0, 6, NULL },
    { eDB_Aes,  6, 2, "S/PDIF-coax" },
};
// the first entries feed the hardware meters
static const SrcBlk spro24_fixed[] = {
    SrcBlk( eSB_Ins0, 2 ),
    SrcBlk( eSB_Ins0, 3 ),
    SrcBlk( eSB_Ins0, 0 ),
    SrcBlk( eSB_Ins0, 1 ),
};

// Focusrite Saffire Pro 24 DSP

// the effect blocks move to Ins0 4/6 at 88.2 and 96 kHz
static const BlockInput spro24dsp_inputs[] = {
    { eSB_Ins0, 2,  2, "Mic" },
    { eSB_Ins0, 0,  2, "Line" },
    { eSB_Ins0, 8,  2, "Ch-strip" },
    { eSB_Ins0, 14, 2, "Reverb" },
    { eSB_Aes,  6,  2, "S/PDIF-coax" },
    { eSB_Adat, 0,  8, NULL },
    { eSB_Aes,  4,  2, "S/PDIF-opt" },
};
static const BlockOutput spro24dsp_outputs[] = {
    { eDB_Ins0, 0,  6, NULL },
    { eDB_Aes,  6,  2, "S/PDIF-coax" },
    { eDB_Ins0, 8,  2, "Ch-strip" },
    { eDB_Ins0, 14, 2, "Reverb" },
};

// Focusrite Saffire Pro 14

static const BlockInput spro14_inputs[] = {
    { eSB_Ins0, 0, 4, NULL },
    { eSB_Aes,  6, 2, "S/PDIF" },
};
static const BlockOutput spro14_outputs[] = {
    { eDB_Ins0, 0, 4, NULL },
    { eDB_Aes,  6, 2, "S/PDIF" },
};
// signal detection
static const SrcBlk spro14_fixed[] = {
    SrcBlk( eSB_Ins0, 0 ),
    SrcBlk( eSB_Ins0, 1 ),
};

// Focusrite Saffire Pro 26

static const BlockInput spro26_inputs[] = {
    { eSB_Ins0, 0, 6, NULL },
    { eSB_Aes,  4, 2, "S/PDIF-coax" },
    { eSB_Adat, 0, 8, NULL },
    { eSB_Aes,  6, 2, "S/PDIF-opt" },
};
static const BlockOutput spro26_outputs[] = {
    { eDB_Ins0, 0, 6, NULL },
    { eDB_Aes,  4, 2, "S/PDIF-coax" },
    { eDB_Adat, 0, 8, NULL },
};
static const SrcBlk spro26_fixed[] = {
    SrcBlk( eSB_Ins0, 0 ),
    SrcBlk( eSB_Ins0, 1 ),
    SrcBlk( eSB_Ins0, 2 ),
    SrcBlk( eSB_Ins0, 3 ),
    SrcBlk( eSB_Ins0, 4 ),
    SrcBlk( eSB_Ins0, 5 ),
};

// Focusrite Liquid Saffire 56

static const BlockInput liquids56_inputs[] = {
    { eSB_Ins0, 0, 2, NULL },
    { eSB_Ins1, 2, 6, NULL },
    { eSB_Adat, 0, 8, NULL },
    { eSB_Aes,  0, 2, "S/PDIF-coax" },
    { eSB_Adat, 8, 8, NULL },
    { eSB_Aes,  6, 2, "S/PDIF-opt" },
};
static const BlockOutput liquids56_outputs[] = {
    { eDB_Ins0, 0, 2, NULL },
    { eDB_Ins1, 0, 8, NULL },
    { eDB_Adat, 0, 8, NULL },
    { eDB_Aes,  0, 2, "S/PDIF-coax" },
    { eDB_Adat, 8, 8, NULL },
    { eDB_Aes,  6, 2, "S/PDIF-opt" },
};
// the meters pick 8 of these entries
static const SrcBlk liquids56_fixed[] = {
    SrcBlk( eSB_Ins1, 0 ),  SrcBlk( eSB_Ins1, 1 ),  SrcBlk( eSB_Ins1, 2 ),
    SrcBlk( eSB_Ins1, 3 ),  SrcBlk( eSB_Ins1, 4 ),  SrcBlk( eSB_Ins1, 5 ),
    SrcBlk( eSB_Ins1, 6 ),  SrcBlk( eSB_Ins1, 7 ),
    SrcBlk( eSB_Aes, 0 ),   SrcBlk( eSB_Aes, 1 ),
    SrcBlk( eSB_Adat, 0 ),  SrcBlk( eSB_Adat, 1 ),  SrcBlk( eSB_Adat, 2 ),
    SrcBlk( eSB_Adat, 3 ),  SrcBlk( eSB_Adat, 4 ),  SrcBlk( eSB_Adat, 5 ),
    SrcBlk( eSB_Adat, 6 ),  SrcBlk( eSB_Adat, 7 ),  SrcBlk( eSB_Adat, 8 ),
    SrcBlk( eSB_Adat, 9 ),  SrcBlk( eSB_Adat, 10 ), SrcBlk( eSB_Adat, 11 ),
    SrcBlk( eSB_Adat, 12 ), SrcBlk( eSB_Adat, 13 ), SrcBlk( eSB_Adat, 14 ),
    SrcBlk( eSB_Adat, 15 ),
};

// Avid Mbox 3 Pro

static const BlockInput mbox3_inputs[] = {
    { eSB_Ins0, 0, 6, NULL },
    { eSB_Ins1, 0, 2, "Reverb" },
    { eSB_Aes,  0, 2, NULL },
};
static const BlockOutput mbox3_outputs[] = {
    { eDB_Ins0,       0, 6, NULL },
    { eDB_Ins1,       0, 4, "Headphone" },
    { eDB_Ins1,       4, 2, "Reverb" },
    { eDB_Aes,        0, 2, NULL },
    { eDB_Reserved08, 0, 2, "ControlRoom" },
};
static const SrcBlk mbox3_fixed[] = {
    SrcBlk( eSB_Ins0, 0 ),
    SrcBlk( eSB_Ins0, 1 ),
    SrcBlk( eSB_Ins0, 2 ),
    SrcBlk( eSB_Ins0, 3 ),
};

// M-Audio ProFire 2626

static const BlockInput pfire2626_inputs[] = {
    { eSB_Ins1, 0, 8, NULL },
    { eSB_Adat, 0, 8, NULL },
    { eSB_Adat, 8, 8, NULL },
    { eSB_Aes,  0, 2, NULL },
};
static const BlockOutput pfire2626_outputs[] = {
    { eDB_Ins1, 0, 8, NULL },
    { eDB_Adat, 0, 8, NULL },
    { eDB_Adat, 8, 8, NULL },
    { eDB_Aes,  0, 2, NULL },
};
static const SrcBlk pfire2626_fixed[] = {
    SrcBlk( eSB_Ins1, 0 ), SrcBlk( eSB_Ins1, 1 ),
    SrcBlk( eSB_Ins1, 2 ), SrcBlk( eSB_Ins1, 3 ),
    SrcBlk( eSB_Ins1, 4 ), SrcBlk( eSB_Ins1, 5 ),
    SrcBlk( eSB_Ins1, 6 ), SrcBlk( eSB_Ins1, 7 ),
};
// the caps register reports sources the firmware cannot lock to
static const enum eClockSource pfire2626_clock_sources[] = {
    eCS_Aes1, eCS_Aes4, eCS_Adat, eCS_Tdif, eCS_WordClock, eCS_Internal,
};

// M-Audio ProFire 610

static const BlockInput pfire610_inputs[] = {
    { eSB_Ins0, 0, 4, NULL },
    { eSB_Aes,  0, 2, NULL },
};
static const BlockOutput pfire610_outputs[] = {
    { eDB_Ins0, 0, 8, NULL },
    { eDB_Aes,  0, 2, NULL },
};
static const SrcBlk pfire610_fixed[] = {
    SrcBlk( eSB_Ins0, 0 ),
    SrcBlk( eSB_Ins0, 1 ),
};
static const enum eClockSource pfire610_clock_sources[] = {
    eCS_Aes1, eCS_Internal,
};

static DeviceProfileVector
listDeviceProfiles( const StaticDeviceProfile* profiles, size_t nb_profiles )
{
    DeviceProfileVector list;
    for ( size_t i = 0; i < nb_profiles; ++i ) {
        list.push_back( &profiles[i] );
    }
    return list;
}

const DeviceProfileVector&
getDeviceProfiles()
{
    static const StaticDeviceProfile profiles[] = {
        StaticDeviceProfile( "SPro14", TCAT_VENDOR_FOCUSRITE, TCAT_MODEL_SPRO14,
                             spro14_inputs, NB_OF( spro14_inputs ),
                             spro14_outputs, NB_OF( spro14_outputs ),
                             spro14_fixed, NB_OF( spro14_fixed ) ),
        StaticDeviceProfile( "SPro24", TCAT_VENDOR_FOCUSRITE, TCAT_MODEL_SPRO24,
                             spro24_inputs, NB_OF( spro24_inputs ),
                             spro24_outputs, NB_OF( spro24_outputs ),
                             spro24_fixed, NB_OF( spro24_fixed ) ),
        StaticDeviceProfile( "SPro24Dsp", TCAT_VENDOR_FOCUSRITE, TCAT_MODEL_SPRO24DSP,
                             spro24dsp_inputs, NB_OF( spro24dsp_inputs ),
                             spro24dsp_outputs, NB_OF( spro24dsp_outputs ),
                             spro24_fixed, NB_OF( spro24_fixed ) ),
        StaticDeviceProfile( "SPro26", TCAT_VENDOR_FOCUSRITE, TCAT_MODEL_SPRO26,
                             spro26_inputs, NB_OF( spro26_inputs ),
                             spro26_outputs, NB_OF( spro26_outputs ),
                             spro26_fixed, NB_OF( spro26_fixed ) ),
        StaticDeviceProfile( "LiquidS56", TCAT_VENDOR_FOCUSRITE, TCAT_MODEL_LIQUID_S56,
                             liquids56_inputs, NB_OF( liquids56_inputs ),
                             liquids56_outputs, NB_OF( liquids56_outputs ),
                             liquids56_fixed, NB_OF( liquids56_fixed ) ),
        StaticDeviceProfile( "Mbox3", TCAT_VENDOR_AVID, TCAT_MODEL_MBOX3,
                             mbox3_inputs, NB_OF( mbox3_inputs ),
                             mbox3_outputs, NB_OF( mbox3_outputs ),
                             mbox3_fixed, NB_OF( mbox3_fixed ) ),
        StaticDeviceProfile( "Pfire2626", TCAT_VENDOR_MAUDIO, TCAT_MODEL_PFIRE2626,
                             pfire2626_inputs, NB_OF( pfire2626_inputs ),
                             pfire2626_outputs, NB_OF( pfire2626_outputs ),
                             pfire2626_fixed, NB_OF( pfire2626_fixed ),
                             pfire2626_clock_sources, NB_OF( pfire2626_clock_sources ) ),
        StaticDeviceProfile( "Pfire610", TCAT_VENDOR_MAUDIO, TCAT_MODEL_PFIRE610,
                             pfire610_inputs, NB_OF( pfire610_inputs ),
                             pfire610_outputs, NB_OF( pfire610_outputs ),
                             pfire610_fixed, NB_OF( pfire610_fixed ),
                             pfire610_clock_sources, NB_OF( pfire610_clock_sources ) ),
    };
    static const DeviceProfileVector list = listDeviceProfiles( profiles, NB_OF( profiles ) );
    return list;
}

const DeviceProfile*
findDeviceProfile( fb_quadlet_t vendor_id, fb_quadlet_t model_id )
{
    const DeviceProfileVector& profiles = getDeviceProfiles();
    for ( DeviceProfileVector::const_iterator it = profiles.begin(); it != profiles.end(); ++it ) {
        if ( ( *it )->getVendorId() == vendor_id && ( *it )->getModelId() == model_id ) {
            return *it;
        }
    }
    return NULL;
}

const DeviceProfile*
findDeviceProfile( const std::string& name )
{
    const DeviceProfileVector& profiles = getDeviceProfiles();
    for ( DeviceProfileVector::const_iterator it = profiles.begin(); it != profiles.end(); ++it ) {
        if ( name == ( *it )->getName() ) {
            return *it;
        }
    }
    return NULL;
}

} // namespace Tcat
