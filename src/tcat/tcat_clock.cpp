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

#include "tcat_clock.h"

#include <algorithm>

namespace Tcat {

IMPL_DEBUG_MODULE( ClockEngine, ClockEngine, DEBUG_LEVEL_NORMAL );
IMPL_DEBUG_MODULE( StandaloneEngine, StandaloneEngine, DEBUG_LEVEL_NORMAL );

ClockEngine::ClockEngine( Device& device )
    : m_device( device )
    , m_cached( false )
{
}

ClockEngine::~ClockEngine()
{
}

enum eStatus
ClockEngine::cache()
{
    GlobalParameters params;
    if ( !m_device.readGlobalParameters( params ) ) {
        debugError( "Could not read global parameters\n" );
        return eS_IoError;
    }
    m_params = params;
    m_cached = true;
    return eS_Ok;
}

stringlist
ClockEngine::getRateLabels() const
{
    stringlist labels;
    for ( ClockRateVector::const_iterator it = m_params.avail_rates.begin();
          it != m_params.avail_rates.end(); ++it ) {
        labels.push_back( clockRateToString( *it ) );
    }
    return labels;
}

std::string
ClockEngine::getSourceLabel( enum eClockSource src ) const
{
    for ( ClockSourceLabelVector::const_iterator it = m_params.clock_source_labels.begin();
          it != m_params.clock_source_labels.end(); ++it ) {
        if ( it->first == src ) {
            return it->second;
        }
    }
    return clockSourceToString( src );
}

stringlist
ClockEngine::getSourceLabels() const
{
    stringlist labels;
    for ( ClockSourceVector::const_iterator it = m_params.avail_sources.begin();
          it != m_params.avail_sources.end(); ++it ) {
        labels.push_back( getSourceLabel( *it ) );
    }
    return labels;
}

enum eRateMode
ClockEngine::getRateMode() const
{
    if ( m_params.current_rate == 0 ) {
        return rateModeFromClockRate( m_params.clock_config.rate );
    }
    return rateModeFromFrequency( m_params.current_rate );
}

bool
ClockEngine::readRateIndex( unsigned int& idx ) const
{
    ClockRateVector::const_iterator it = std::find( m_params.avail_rates.begin(),
                                                    m_params.avail_rates.end(),
                                                    m_params.clock_config.rate );
    if ( it == m_params.avail_rates.end() ) {
        debugWarning( "Rate %s is not among the capabilities\n",
                      clockRateToString( m_params.clock_config.rate ) );
        return false;
    }
    idx = it - m_params.avail_rates.begin();
    return true;
}

bool
ClockEngine::readSourceIndex( unsigned int& idx ) const
{
    ClockSourceVector::const_iterator it = std::find( m_params.avail_sources.begin(),
                                                      m_params.avail_sources.end(),
                                                      m_params.clock_config.src );
    if ( it == m_params.avail_sources.end() ) {
        debugWarning( "Source %s is not among the capabilities\n",
                      clockSourceToString( m_params.clock_config.src ) );
        return false;
    }
    idx = it - m_params.avail_sources.begin();
    return true;
}

enum eStatus
ClockEngine::writeRateIndex( unsigned int idx )
{
    if ( idx >= m_params.avail_rates.size() ) {
        debugError( "Rate index %u out of range, %zd rates available\n",
                    idx, m_params.avail_rates.size() );
        return eS_InvalidArgument;
    }
    return writeConfig( ClockConfig( m_params.avail_rates.at( idx ), m_params.clock_config.src ) );
}

enum eStatus
ClockEngine::writeSourceIndex( unsigned int idx )
{
    if ( idx >= m_params.avail_sources.size() ) {
        debugError( "Source index %u out of range, %zd sources available\n",
                    idx, m_params.avail_sources.size() );
        return eS_InvalidArgument;
    }
    return writeConfig( ClockConfig( m_params.clock_config.rate, m_params.avail_sources.at( idx ) ) );
}

enum eStatus
ClockEngine::writeConfig( const ClockConfig& config )
{
    if ( std::find( m_params.avail_rates.begin(), m_params.avail_rates.end(), config.rate )
         == m_params.avail_rates.end() ) {
        debugError( "Rate %s not supported\n", clockRateToString( config.rate ) );
        return eS_InvalidArgument;
    }
    if ( std::find( m_params.avail_sources.begin(), m_params.avail_sources.end(), config.src )
         == m_params.avail_sources.end() ) {
        debugError( "Source %s not supported\n", clockSourceToString( config.src ) );
        return eS_InvalidArgument;
    }

    if ( !m_device.writeClockConfig( config ) ) {
        debugError( "Could not write clock configuration\n" );
        return eS_IoError;
    }
    return cache();
}

enum eStatus
ClockEngine::parseNotification( fb_quadlet_t msg )
{
    if ( ( msg & TCAT_NOTIFY_CLOCK_MASK ) == 0 ) {
        return eS_Ok;
    }
    debugOutput( DEBUG_LEVEL_VERBOSE, "Clock notification 0x%08X\n", msg );
    return cache();
}

enum eStatus
ClockEngine::measure()
{
    if ( !m_cached ) {
        return cache();
    }
    if ( !m_device.readExternalStates( m_params ) ) {
        return eS_IoError;
    }
    return eS_Ok;
}

void
ClockEngine::show()
{
    m_device.showGlobalParameters( m_params );
}

void
ClockEngine::setVerboseLevel( int l )
{
    setDebugLevel( l );
}

StandaloneEngine::StandaloneEngine( EAP& eap )
    : m_eap( eap )
{
}

StandaloneEngine::~StandaloneEngine()
{
}

enum eStatus
StandaloneEngine::cache()
{
    return readFresh( m_params );
}

enum eStatus
StandaloneEngine::readFresh( StandaloneParameters& fresh )
{
    if ( !m_eap.readStandalone( fresh ) ) {
        debugError( "Could not read standalone parameters\n" );
        return eS_IoError;
    }
    return eS_Ok;
}

enum eStatus
StandaloneEngine::apply( const StandaloneParameters& params, const StandaloneParameters& fresh )
{
    enum eStatus status = m_eap.writeStandalone( params, fresh );
    if ( status == eS_Ok ) {
        m_params = params;
    } else {
        // the device state is known even if the write failed
        m_params = fresh;
    }
    return status;
}

enum eStatus
StandaloneEngine::writeClockSource( enum eClockSource src )
{
    StandaloneParameters fresh;
    enum eStatus status = readFresh( fresh );
    if ( status != eS_Ok ) {
        return status;
    }
    StandaloneParameters params = fresh;
    params.clock_source = src;
    return apply( params, fresh );
}

enum eStatus
StandaloneEngine::writeAesHighRate( bool enable )
{
    StandaloneParameters fresh;
    enum eStatus status = readFresh( fresh );
    if ( status != eS_Ok ) {
        return status;
    }
    StandaloneParameters params = fresh;
    params.aes_high_rate = enable;
    return apply( params, fresh );
}

enum eStatus
StandaloneEngine::writeAdatMode( enum eAdatMode mode )
{
    StandaloneParameters fresh;
    enum eStatus status = readFresh( fresh );
    if ( status != eS_Ok ) {
        return status;
    }
    StandaloneParameters params = fresh;
    params.adat_mode = mode;
    return apply( params, fresh );
}

enum eStatus
StandaloneEngine::writeWordClockMode( enum eWordClockMode mode )
{
    StandaloneParameters fresh;
    enum eStatus status = readFresh( fresh );
    if ( status != eS_Ok ) {
        return status;
    }
    StandaloneParameters params = fresh;
    params.word_clock.mode = mode;
    return apply( params, fresh );
}

enum eStatus
StandaloneEngine::writeWordClockNumerator( unsigned int numerator )
{
    if ( numerator < 1 || numerator > 4096 ) {
        debugError( "Word clock numerator %u out of range\n", numerator );
        return eS_InvalidArgument;
    }
    StandaloneParameters fresh;
    enum eStatus status = readFresh( fresh );
    if ( status != eS_Ok ) {
        return status;
    }
    StandaloneParameters params = fresh;
    params.word_clock.numerator = numerator;
    return apply( params, fresh );
}

enum eStatus
StandaloneEngine::writeWordClockDenominator( unsigned int denominator )
{
    if ( denominator < 1 || denominator > 0xffff ) {
        debugError( "Word clock denominator %u out of range\n", denominator );
        return eS_InvalidArgument;
    }
    StandaloneParameters fresh;
    enum eStatus status = readFresh( fresh );
    if ( status != eS_Ok ) {
        return status;
    }
    StandaloneParameters params = fresh;
    params.word_clock.denominator = denominator;
    return apply( params, fresh );
}

enum eStatus
StandaloneEngine::writeInternalRate( enum eClockRate rate )
{
    StandaloneParameters fresh;
    enum eStatus status = readFresh( fresh );
    if ( status != eS_Ok ) {
        return status;
    }
    StandaloneParameters params = fresh;
    params.internal_rate = rate;
    return apply( params, fresh );
}

enum eStatus
StandaloneEngine::write( const StandaloneParameters& params )
{
    StandaloneParameters fresh;
    enum eStatus status = readFresh( fresh );
    if ( status != eS_Ok ) {
        return status;
    }
    return apply( params, fresh );
}

void
StandaloneEngine::show()
{
    printMessage( "Standalone parameters:\n" );
    printMessage( "  clock source:   %s\n", clockSourceToString( m_params.clock_source ) );
    printMessage( "  AES high rate:  %s\n", m_params.aes_high_rate ? "yes" : "no" );
    printMessage( "  ADAT mode:      %s\n", adatModeToString( m_params.adat_mode ) );
    printMessage( "  word clock:     %s, %u / %u\n",
                  wordClockModeToString( m_params.word_clock.mode ),
                  m_params.word_clock.numerator, m_params.word_clock.denominator );
    printMessage( "  internal rate:  %s\n", clockRateToString( m_params.internal_rate ) );
}

void
StandaloneEngine::setVerboseLevel( int l )
{
    setDebugLevel( l );
}

} // namespace Tcat
