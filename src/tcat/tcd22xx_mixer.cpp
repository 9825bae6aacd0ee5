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

#include "tcd22xx_mixer.h"

#include <cmath>

namespace Tcat {

IMPL_DEBUG_MODULE( MixerEngine, MixerEngine, DEBUG_LEVEL_NORMAL );

bool
computeMixerPatch( const MixerCoefficients& old, const MixerCoefficients& coefs,
                   MixerPatchVector& patches )
{
    patches.clear();
    if ( old.size() != coefs.size() ) {
        return false;
    }

    for ( unsigned int dst = 0; dst < coefs.size(); ++dst ) {
        const MixerRow& row = coefs.at( dst );
        if ( row.size() != old.at( dst ).size() || row.size() > TCAT_EAP_MIXER_MAX_INPUTS ) {
            return false;
        }
        if ( row == old.at( dst ) ) {
            continue;
        }

        MixerPatch patch;
        patch.dst = dst;
        patch.offset = TCAT_EAP_MIXER_COEFFICIENTS + dst * TCAT_EAP_MIXER_MAX_INPUTS * 4;
        for ( MixerRow::const_iterator it = row.begin(); it != row.end(); ++it ) {
            patch.quads.push_back( (fb_quadlet_t)(uint16_t)*it );
        }
        patches.push_back( patch );
    }
    return true;
}

double
mixerCoefficientToDb( int16_t coef )
{
    double gain = std::fabs( (double)coef ) / TCAT_MIXER_COEF_UNITY;
    if ( gain <= 0.0 ) {
        return TCAT_MIXER_DB_MIN;
    }
    double db = 20.0 * std::log10( gain );
    if ( db < TCAT_MIXER_DB_MIN ) {
        return TCAT_MIXER_DB_MIN;
    }
    if ( db > TCAT_MIXER_DB_MAX ) {
        return TCAT_MIXER_DB_MAX;
    }
    return db;
}

MixerEngine::MixerEngine( EAP& eap )
    : m_eap( eap )
{
}

MixerEngine::~MixerEngine()
{
}

bool
MixerEngine::isAvailable() const
{
    return m_eap.getCaps().mixer.is_exposed;
}

unsigned int
MixerEngine::getInputCount() const
{
    if ( m_coefs.empty() ) {
        return 0;
    }
    return m_coefs.front().size();
}

enum eStatus
MixerEngine::cache()
{
    if ( !isAvailable() ) {
        debugOutput( DEBUG_LEVEL_VERBOSE, "No mixer exposed\n" );
        m_coefs.clear();
        return eS_Ok;
    }

    MixerCoefficients coefs;
    if ( !m_eap.readMixerCoefficients( coefs ) ) {
        debugError( "Could not read mixer coefficients\n" );
        return eS_IoError;
    }
    m_coefs = coefs;
    return eS_Ok;
}

enum eStatus
MixerEngine::readRow( unsigned int dst, MixerRow& row ) const
{
    if ( dst >= m_coefs.size() ) {
        debugError( "Mixer output %u out of range\n", dst );
        return eS_InvalidArgument;
    }
    row = m_coefs.at( dst );
    return eS_Ok;
}

enum eStatus
MixerEngine::writeRow( unsigned int dst, const MixerRow& row )
{
    if ( dst >= m_coefs.size() ) {
        debugError( "Mixer output %u out of range\n", dst );
        return eS_InvalidArgument;
    }
    if ( row.size() != m_coefs.at( dst ).size() ) {
        debugError( "Expected %zd coefficients for mixer output %u, got %zd\n",
                    m_coefs.at( dst ).size(), dst, row.size() );
        return eS_InvalidArgument;
    }

    MixerCoefficients coefs = m_coefs;
    coefs[dst] = row;
    return apply( coefs );
}

enum eStatus
MixerEngine::writeCoefficient( unsigned int dst, unsigned int src, int16_t coef )
{
    if ( dst >= m_coefs.size() || src >= m_coefs.at( dst ).size() ) {
        debugError( "Mixer coefficient %u:%u out of range\n", dst, src );
        return eS_InvalidArgument;
    }

    MixerCoefficients coefs = m_coefs;
    coefs[dst][src] = coef;
    return apply( coefs );
}

enum eStatus
MixerEngine::writeCoefficients( const MixerCoefficients& coefs )
{
    return apply( coefs );
}

enum eStatus
MixerEngine::apply( const MixerCoefficients& coefs )
{
    MixerPatchVector patches;
    if ( !computeMixerPatch( m_coefs, coefs, patches ) ) {
        debugError( "Mixer dimensions do not match %zd outputs x %u inputs\n",
                    m_coefs.size(), getInputCount() );
        return eS_InvalidArgument;
    }

    for ( MixerPatchVector::const_iterator it = patches.begin(); it != patches.end(); ++it ) {
        if ( !m_eap.writeMixerRow( it->dst, &it->quads[0], it->quads.size() ) ) {
            debugError( "Could not write mixer output %u\n", it->dst );
            // the rows written so far are in effect
            for ( MixerPatchVector::const_iterator done = patches.begin(); done != it; ++done ) {
                m_coefs[done->dst] = coefs.at( done->dst );
            }
            return eS_IoError;
        }
        debugOutput( DEBUG_LEVEL_VERBOSE, "Wrote mixer output %u at 0x%04X\n", it->dst, it->offset );
    }

    m_coefs = coefs;
    return eS_Ok;
}

void
MixerEngine::show()
{
    printMessage( "Mixer: %zd outputs, %u inputs\n", m_coefs.size(), getInputCount() );
    for ( unsigned int dst = 0; dst < m_coefs.size(); ++dst ) {
        printMessageShort( "  out %2u:", dst );
        for ( unsigned int src = 0; src < m_coefs[dst].size(); ++src ) {
            printMessageShort( " %6.1f", mixerCoefficientToDb( m_coefs[dst][src] ) );
        }
        printMessageShort( "\n" );
    }
}

void
MixerEngine::setVerboseLevel( int l )
{
    setDebugLevel( l );
}

} // namespace Tcat
