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

#ifndef TCAT_TCD22XX_MIXER_H
#define TCAT_TCD22XX_MIXER_H

#include "debugmodule/debugmodule.h"

#include "tcat_eap.h"
#include "tcat_error.h"

#include <vector>

namespace Tcat {

// 2.14 fixed point
#define TCAT_MIXER_COEF_UNITY   0x4000
#define TCAT_MIXER_COEF_MIN     ( -32768 )
#define TCAT_MIXER_COEF_MAX     32767
#define TCAT_MIXER_DB_MIN       ( -60.0 )
#define TCAT_MIXER_DB_MAX       4.0

/**
 * @brief coefficients of one mixer output as written to the device
 */
struct MixerPatch {
    unsigned int dst;
    // bytes from the start of the mixer section
    unsigned int offset;
    std::vector<fb_quadlet_t> quads;
};

typedef std::vector<MixerPatch> MixerPatchVector;

/**
 * @brief compute the writes that turn old into coefs
 *
 * Each output with at least one changed coefficient gives one patch
 * holding all of its coefficients.
 *
 * @return false if the dimensions differ
 */
bool computeMixerPatch( const MixerCoefficients& old, const MixerCoefficients& coefs,
                        MixerPatchVector& patches );

/// gain in dB for display, clamped to the range of the mixer
double mixerCoefficientToDb( int16_t coef );

/**
 * @brief Mixer of a TCD22xx unit
 *
 * Reads are served from the cached coefficients; writes send only the
 * outputs that changed and update the cache on success.
 */
class MixerEngine
{
public:
    MixerEngine( EAP& eap );
    virtual ~MixerEngine();

    enum eStatus cache();
    bool isAvailable() const;

    unsigned int getOutputCount() const
        { return m_coefs.size(); };
    unsigned int getInputCount() const;
    const MixerCoefficients& getCoefficients() const
        { return m_coefs; };

    enum eStatus readRow( unsigned int dst, MixerRow& row ) const;
    enum eStatus writeRow( unsigned int dst, const MixerRow& row );
    enum eStatus writeCoefficient( unsigned int dst, unsigned int src, int16_t coef );
    enum eStatus writeCoefficients( const MixerCoefficients& coefs );

    void show();
    void setVerboseLevel( int l );

private:
    enum eStatus apply( const MixerCoefficients& coefs );

    EAP& m_eap;
    MixerCoefficients m_coefs;

protected:
    DECLARE_DEBUG_MODULE;
};

} // namespace Tcat

#endif // TCAT_TCD22XX_MIXER_H
