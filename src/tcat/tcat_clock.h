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

#ifndef TCAT_CLOCK_H
#define TCAT_CLOCK_H

#include "debugmodule/debugmodule.h"

#include "tcat_device.h"
#include "tcat_eap.h"
#include "tcat_error.h"

namespace Tcat {

/**
 * @brief Media clock of the unit
 *
 * The device is the reference: every write is followed by a read of the
 * global section, nothing is updated speculatively.
 */
class ClockEngine
{
public:
    ClockEngine( Device& device );
    virtual ~ClockEngine();

    enum eStatus cache();
    bool isCached() const
        { return m_cached; };

    const GlobalParameters& getParameters() const
        { return m_params; };
    const ClockRateVector& getRates() const
        { return m_params.avail_rates; };
    const ClockSourceVector& getSources() const
        { return m_params.avail_sources; };
    stringlist getRateLabels() const;
    stringlist getSourceLabels() const;
    std::string getSourceLabel( enum eClockSource src ) const;

    /// operating rate in Hz as detected by the device
    unsigned int getCurrentRate() const
        { return m_params.current_rate; };
    enum eRateMode getRateMode() const;

    /// @return false if the configured rate is not among the capabilities
    bool readRateIndex( unsigned int& idx ) const;
    bool readSourceIndex( unsigned int& idx ) const;

    enum eStatus writeRateIndex( unsigned int idx );
    enum eStatus writeSourceIndex( unsigned int idx );
    /// rate and source must be among the capabilities
    enum eStatus writeConfig( const ClockConfig& config );

    /**
     * @brief refresh after a notification
     *
     * The global section is read again when msg carries a clock related
     * bit.
     */
    enum eStatus parseNotification( fb_quadlet_t msg );
    /**
     * @brief read the lock and slip states
     *
     * Only the extended status register is read once the engine is
     * cached. Rate changes are picked up by parseNotification.
     */
    enum eStatus measure();

    void show();
    void setVerboseLevel( int l );

private:
    Device& m_device;
    bool m_cached;
    GlobalParameters m_params;

protected:
    DECLARE_DEBUG_MODULE;
};

/**
 * @brief Parameters used when the unit runs without a host
 *
 * Each field is written as a modification of the section read just
 * before the write, so fields sharing a quadlet stay consistent.
 */
class StandaloneEngine
{
public:
    StandaloneEngine( EAP& eap );
    virtual ~StandaloneEngine();

    enum eStatus cache();
    const StandaloneParameters& getParameters() const
        { return m_params; };

    enum eStatus writeClockSource( enum eClockSource src );
    enum eStatus writeAesHighRate( bool enable );
    enum eStatus writeAdatMode( enum eAdatMode mode );
    enum eStatus writeWordClockMode( enum eWordClockMode mode );
    enum eStatus writeWordClockNumerator( unsigned int numerator );
    enum eStatus writeWordClockDenominator( unsigned int denominator );
    enum eStatus writeInternalRate( enum eClockRate rate );
    /// replace the whole section
    enum eStatus write( const StandaloneParameters& params );

    void show();
    void setVerboseLevel( int l );

private:
    enum eStatus readFresh( StandaloneParameters& fresh );
    enum eStatus apply( const StandaloneParameters& params, const StandaloneParameters& fresh );

    EAP& m_eap;
    StandaloneParameters m_params;

protected:
    DECLARE_DEBUG_MODULE;
};

} // namespace Tcat

#endif // TCAT_CLOCK_H
