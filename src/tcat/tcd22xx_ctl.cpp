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

#include "tcd22xx_ctl.h"

#include "libutil/serialize.h"

#include <algorithm>
#include <sstream>

namespace Tcat {

IMPL_DEBUG_MODULE( Tcd22xxController, Tcd22xxController, DEBUG_LEVEL_NORMAL );

static const enum eAdatMode s_adat_modes[] = {
    eAM_Normal, eAM_SMUX2, eAM_SMUX4, eAM_Auto,
};
static const enum eWordClockMode s_wc_modes[] = {
    eWCM_Normal, eWCM_Low, eWCM_Middle, eWCM_High,
};
#define NB_ADAT_MODES ( sizeof( s_adat_modes ) / sizeof( s_adat_modes[0] ) )
#define NB_WC_MODES ( sizeof( s_wc_modes ) / sizeof( s_wc_modes[0] ) )

// elements that depend on the blocks available at the current rate
static const char* s_rate_dependent_elements[] = {
    TCAT_ELEM_ROUTER_OUT_SRC,
    TCAT_ELEM_ROUTER_STREAM_SRC,
    TCAT_ELEM_ROUTER_MIXER_SRC,
    TCAT_ELEM_MIXER_SRC_GAIN,
    TCAT_ELEM_OUT_METER,
    TCAT_ELEM_STREAM_METER,
    TCAT_ELEM_MIXER_METER,
    TCAT_ELEM_MIXER_SATURATION,
};

static bool
getSingleValue( const Control::ElementValue& value, int32_t& v )
{
    if ( value.size() != 1 ) {
        return false;
    }
    v = value.front();
    return true;
}

static void
fillMeter( std::vector<int32_t>& meter, const DstBlkVector& dsts, const RouterEntryVector& peaks )
{
    meter.assign( dsts.size(), 0 );
    for ( unsigned int i = 0; i < dsts.size(); ++i ) {
        for ( RouterEntryVector::const_iterator it = peaks.begin(); it != peaks.end(); ++it ) {
            if ( it->dst == dsts.at( i ) ) {
                meter[i] = it->peak;
                break;
            }
        }
    }
}

Tcd22xxController::Tcd22xxController( Device& device, const DeviceProfile& profile )
    : m_device( device )
    , m_profile( profile )
    , m_eap( device )
    , m_clock( device )
    , m_standalone( m_eap )
    , m_router( m_eap, profile )
    , m_mixer( m_eap )
    , m_registry( NULL )
    , m_current_rate( 0 )
{
}

Tcd22xxController::~Tcd22xxController()
{
}

bool
Tcd22xxController::init()
{
    if ( !m_profile.getClockSourceOverride().empty() ) {
        m_device.setAvailableClockSourceOverride( m_profile.getClockSourceOverride() );
    }
    if ( !m_eap.init() ) {
        debugError( "Could not initialize the extension sections\n" );
        return false;
    }
    debugOutput( DEBUG_LEVEL_VERBOSE, "Controller for %s initialized\n", m_profile.getName() );
    return true;
}

enum eStatus
Tcd22xxController::cacheWholeParams()
{
    enum eStatus status = m_clock.cache();
    if ( status != eS_Ok ) {
        return status;
    }

    status = m_router.cache( m_clock.getRateMode() );
    if ( status != eS_Ok ) {
        return status;
    }
    m_current_rate = m_clock.getCurrentRate();

    status = m_standalone.cache();
    if ( status != eS_Ok ) {
        return status;
    }
    status = m_mixer.cache();
    if ( status != eS_Ok ) {
        return status;
    }
    return cacheMeters();
}

enum eStatus
Tcd22xxController::cachePartialParams()
{
    enum eStatus status = m_clock.measure();
    if ( status != eS_Ok ) {
        return status;
    }
    return cacheMeters();
}

enum eStatus
Tcd22xxController::cacheMeters()
{
    const ExtensionCaps& caps = m_eap.getCaps();

    if ( caps.general.peak_avail ) {
        RouterEntryVector peaks;
        if ( !m_eap.readPeakEntries( caps.router.maximum_entry_count, peaks ) ) {
            debugError( "Could not read peak entries\n" );
            return eS_IoError;
        }
        fillMeter( m_real_meter, m_router.getRealBlkPair().dsts, peaks );
        fillMeter( m_stream_meter, m_router.getStreamBlkPair().dsts, peaks );
        fillMeter( m_mixer_meter, m_router.getMixerBlkPair().dsts, peaks );
    }

    if ( m_mixer.isAvailable() ) {
        std::vector<bool> saturation;
        if ( !m_eap.readMixerSaturation( saturation ) ) {
            debugError( "Could not read mixer saturation\n" );
            return eS_IoError;
        }
        saturation.resize( m_router.getMixerBlkPair().srcs.size(), false );
        m_saturation = saturation;
    }
    return eS_Ok;
}

bool
Tcd22xxController::isSourceSupported( enum eClockSource src ) const
{
    const ClockSourceVector& srcs = m_clock.getSources();
    return std::find( srcs.begin(), srcs.end(), src ) != srcs.end();
}

// loading of elements

bool
Tcd22xxController::load( Control::ElementRegistry& registry )
{
    m_registry = &registry;
    m_notified.clear();
    m_measured.clear();

    if ( !loadClockElements() ) {
        return false;
    }
    if ( !loadStandaloneElements() ) {
        return false;
    }
    if ( !loadRouterElements() ) {
        return false;
    }
    if ( !loadMixerElements() ) {
        return false;
    }
    return loadMeterElements();
}

bool
Tcd22xxController::loadClockElements()
{
    stringlist rates = m_clock.getRateLabels();
    if ( !rates.empty()
         && !m_registry->addEnumElements( TCAT_ELEM_CLOCK_RATE, 1, 1, rates, true, m_notified ) ) {
        return false;
    }
    stringlist srcs = m_clock.getSourceLabels();
    if ( !srcs.empty()
         && !m_registry->addEnumElements( TCAT_ELEM_CLOCK_SOURCE, 1, 1, srcs, true, m_notified ) ) {
        return false;
    }

    const ExternalSourceStates& states = m_clock.getParameters().external_source_states;
    if ( states.sources.empty() ) {
        return true;
    }
    if ( !m_registry->addBoolElements( TCAT_ELEM_LOCKED_CLOCK_SOURCE, 1, states.sources.size(),
                                       false, m_notified ) ) {
        return false;
    }
    return m_registry->addBoolElements( TCAT_ELEM_SLIPPED_CLOCK_SOURCE, 1, states.sources.size(),
                                        false, m_measured );
}

bool
Tcd22xxController::loadStandaloneElements()
{
    Control::ElementIdVector ids;

    stringlist srcs = m_clock.getSourceLabels();
    if ( !srcs.empty()
         && !m_registry->addEnumElements( TCAT_ELEM_STANDALONE_CLOCK_SOURCE, 1, 1, srcs, true, ids ) ) {
        return false;
    }

    if ( isSourceSupported( eCS_Aes1 ) || isSourceSupported( eCS_Aes2 )
         || isSourceSupported( eCS_Aes3 ) || isSourceSupported( eCS_Aes4 ) ) {
        if ( !m_registry->addBoolElements( TCAT_ELEM_STANDALONE_SPDIF_HIGH_RATE, 1, 1, true, ids ) ) {
            return false;
        }
    }

    if ( isSourceSupported( eCS_Adat ) ) {
        stringlist labels;
        for ( unsigned int i = 0; i < NB_ADAT_MODES; ++i ) {
            labels.push_back( adatModeToString( s_adat_modes[i] ) );
        }
        if ( !m_registry->addEnumElements( TCAT_ELEM_STANDALONE_ADAT_MODE, 1, 1, labels, true, ids ) ) {
            return false;
        }
    }

    if ( isSourceSupported( eCS_WordClock ) ) {
        stringlist labels;
        for ( unsigned int i = 0; i < NB_WC_MODES; ++i ) {
            labels.push_back( wordClockModeToString( s_wc_modes[i] ) );
        }
        if ( !m_registry->addEnumElements( TCAT_ELEM_STANDALONE_WC_MODE, 1, 1, labels, true, ids ) ) {
            return false;
        }
        if ( !m_registry->addIntElements( TCAT_ELEM_STANDALONE_WC_NUMERATOR, 1, 1, 4096, 1, 1,
                                          true, ids ) ) {
            return false;
        }
        if ( !m_registry->addIntElements( TCAT_ELEM_STANDALONE_WC_DENOMINATOR, 1, 1, 0xffff, 1, 1,
                                          true, ids ) ) {
            return false;
        }
    }

    stringlist rates = m_clock.getRateLabels();
    if ( !rates.empty()
         && !m_registry->addEnumElements( TCAT_ELEM_STANDALONE_INTERNAL_RATE, 1, 1, rates, true, ids ) ) {
        return false;
    }
    return true;
}

bool
Tcd22xxController::loadRouterElements()
{
    static const char* names[] = {
        TCAT_ELEM_ROUTER_OUT_SRC, TCAT_ELEM_ROUTER_STREAM_SRC, TCAT_ELEM_ROUTER_MIXER_SRC,
    };
    static const enum eRouterGroup groups[] = {
        eRG_Output, eRG_Stream, eRG_Mixer,
    };

    for ( unsigned int i = 0; i < 3; ++i ) {
        const DstBlkVector& dsts = m_router.getDestinations( groups[i] );
        if ( dsts.empty() ) {
            continue;
        }
        if ( !m_registry->addEnumElements( names[i], 1, dsts.size(),
                                           m_router.getSourceLabels( groups[i] ),
                                           true, m_notified ) ) {
            return false;
        }
    }
    return true;
}

bool
Tcd22xxController::loadMixerElements()
{
    if ( !m_mixer.isAvailable() ) {
        return true;
    }
    unsigned int nb_outputs = std::min<unsigned int>( m_router.getMixerBlkPair().srcs.size(),
                                                      m_mixer.getOutputCount() );
    unsigned int nb_inputs = m_mixer.getInputCount();
    if ( nb_outputs == 0 || nb_inputs == 0 ) {
        return true;
    }
    return m_registry->addIntElements( TCAT_ELEM_MIXER_SRC_GAIN, nb_outputs,
                                       TCAT_MIXER_COEF_MIN, TCAT_MIXER_COEF_MAX, 1,
                                       nb_inputs, true, m_notified );
}

bool
Tcd22xxController::loadMeterElements()
{
    if ( m_eap.getCaps().general.peak_avail ) {
        static const char* names[] = {
            TCAT_ELEM_OUT_METER, TCAT_ELEM_STREAM_METER, TCAT_ELEM_MIXER_METER,
        };
        const DstBlkVector* dsts[] = {
            &m_router.getRealBlkPair().dsts,
            &m_router.getStreamBlkPair().dsts,
            &m_router.getMixerBlkPair().dsts,
        };
        for ( unsigned int i = 0; i < 3; ++i ) {
            if ( dsts[i]->empty() ) {
                continue;
            }
            if ( !m_registry->addIntElements( names[i], 1, 0, TCAT_METER_MAX, 1, dsts[i]->size(),
                                              false, m_measured ) ) {
                return false;
            }
        }
    }

    unsigned int nb_outputs = m_router.getMixerBlkPair().srcs.size();
    if ( m_mixer.isAvailable() && nb_outputs > 0 ) {
        return m_registry->addBoolElements( TCAT_ELEM_MIXER_SATURATION, 1, nb_outputs,
                                            false, m_measured );
    }
    return true;
}

void
Tcd22xxController::forgetElements( const char* name )
{
    m_registry->removeElements( name );

    Control::ElementIdVector* lists[] = { &m_notified, &m_measured };
    for ( unsigned int i = 0; i < 2; ++i ) {
        Control::ElementIdVector::iterator it = lists[i]->begin();
        while ( it != lists[i]->end() ) {
            if ( it->name == name ) {
                it = lists[i]->erase( it );
            } else {
                ++it;
            }
        }
    }
}

bool
Tcd22xxController::reloadRateDependentElements()
{
    unsigned int nb = sizeof( s_rate_dependent_elements ) / sizeof( s_rate_dependent_elements[0] );
    for ( unsigned int i = 0; i < nb; ++i ) {
        forgetElements( s_rate_dependent_elements[i] );
    }
    return loadRouterElements() && loadMixerElements() && loadMeterElements();
}

// reading and writing of elements

bool
Tcd22xxController::read( const Control::ElementId& id, Control::ElementValue& value )
{
    if ( id.name == TCAT_ELEM_CLOCK_RATE ) {
        unsigned int idx = 0;
        if ( !m_clock.readRateIndex( idx ) ) {
            debugWarning( "Current rate is not in the available list\n" );
        }
        value.assign( 1, idx );
        return true;
    }
    if ( id.name == TCAT_ELEM_CLOCK_SOURCE ) {
        unsigned int idx = 0;
        if ( !m_clock.readSourceIndex( idx ) ) {
            debugWarning( "Current source is not in the available list\n" );
        }
        value.assign( 1, idx );
        return true;
    }
    if ( id.name == TCAT_ELEM_LOCKED_CLOCK_SOURCE || id.name == TCAT_ELEM_SLIPPED_CLOCK_SOURCE ) {
        const ExternalSourceStates& states = m_clock.getParameters().external_source_states;
        const std::vector<bool>& flags =
            ( id.name == TCAT_ELEM_LOCKED_CLOCK_SOURCE ) ? states.locked : states.slipped;
        value.assign( flags.begin(), flags.end() );
        return true;
    }

    if ( readStandalone( id, value ) ) {
        return true;
    }

    if ( id.name == TCAT_ELEM_MIXER_SRC_GAIN ) {
        if ( id.index >= m_router.getMixerBlkPair().srcs.size() ) {
            debugError( "Mixer output %u not available\n", id.index );
            return false;
        }
        MixerRow row;
        if ( m_mixer.readRow( id.index, row ) != eS_Ok ) {
            return false;
        }
        value.assign( row.begin(), row.end() );
        return true;
    }

    if ( readRouter( id, value ) ) {
        return true;
    }
    return readMeters( id, value );
}

bool
Tcd22xxController::write( const Control::ElementId& id, const Control::ElementValue& value,
                          enum eStatus& status )
{
    if ( m_registry && m_registry->hasElement( id ) && !m_registry->validate( id, value ) ) {
        status = eS_InvalidArgument;
        return true;
    }

    if ( id.name == TCAT_ELEM_CLOCK_RATE || id.name == TCAT_ELEM_CLOCK_SOURCE ) {
        int32_t v;
        if ( !getSingleValue( value, v ) || v < 0 ) {
            status = eS_InvalidArgument;
            return true;
        }
        if ( id.name == TCAT_ELEM_CLOCK_RATE ) {
            status = m_clock.writeRateIndex( v );
        } else {
            status = m_clock.writeSourceIndex( v );
        }
        if ( status == eS_Ok && m_clock.getCurrentRate() != m_current_rate ) {
            status = handleRateChange();
        }
        return true;
    }
    if ( id.name == TCAT_ELEM_LOCKED_CLOCK_SOURCE || id.name == TCAT_ELEM_SLIPPED_CLOCK_SOURCE ) {
        debugError( "%s is read-only\n", id.name.c_str() );
        status = eS_InvalidArgument;
        return true;
    }

    if ( writeStandalone( id, value, status ) ) {
        return true;
    }

    if ( id.name == TCAT_ELEM_MIXER_SRC_GAIN ) {
        if ( id.index >= m_router.getMixerBlkPair().srcs.size() ) {
            debugError( "Mixer output %u not available\n", id.index );
            status = eS_InvalidArgument;
            return true;
        }
        MixerRow row;
        for ( Control::ElementValue::const_iterator it = value.begin(); it != value.end(); ++it ) {
            if ( *it < TCAT_MIXER_COEF_MIN || *it > TCAT_MIXER_COEF_MAX ) {
                debugError( "Coefficient %d out of range\n", *it );
                status = eS_InvalidArgument;
                return true;
            }
            row.push_back( (int16_t)*it );
        }
        status = m_mixer.writeRow( id.index, row );
        return true;
    }

    if ( writeRouter( id, value, status ) ) {
        return true;
    }

    if ( id.name == TCAT_ELEM_OUT_METER || id.name == TCAT_ELEM_STREAM_METER
         || id.name == TCAT_ELEM_MIXER_METER || id.name == TCAT_ELEM_MIXER_SATURATION ) {
        debugError( "%s is read-only\n", id.name.c_str() );
        status = eS_InvalidArgument;
        return true;
    }
    return false;
}

bool
Tcd22xxController::readStandalone( const Control::ElementId& id, Control::ElementValue& value )
{
    const StandaloneParameters& params = m_standalone.getParameters();

    if ( id.name == TCAT_ELEM_STANDALONE_CLOCK_SOURCE ) {
        const ClockSourceVector& srcs = m_clock.getSources();
        ClockSourceVector::const_iterator it = std::find( srcs.begin(), srcs.end(),
                                                          params.clock_source );
        if ( it == srcs.end() ) {
            debugWarning( "Standalone source %s is not supported\n",
                          clockSourceToString( params.clock_source ) );
            value.assign( 1, 0 );
        } else {
            value.assign( 1, it - srcs.begin() );
        }
        return true;
    }
    if ( id.name == TCAT_ELEM_STANDALONE_SPDIF_HIGH_RATE ) {
        value.assign( 1, params.aes_high_rate ? 1 : 0 );
        return true;
    }
    if ( id.name == TCAT_ELEM_STANDALONE_ADAT_MODE && isSourceSupported( eCS_Adat ) ) {
        value.assign( 1, params.adat_mode );
        return true;
    }
    if ( isSourceSupported( eCS_WordClock ) ) {
        if ( id.name == TCAT_ELEM_STANDALONE_WC_MODE ) {
            value.assign( 1, params.word_clock.mode );
            return true;
        }
        if ( id.name == TCAT_ELEM_STANDALONE_WC_NUMERATOR ) {
            value.assign( 1, params.word_clock.numerator );
            return true;
        }
        if ( id.name == TCAT_ELEM_STANDALONE_WC_DENOMINATOR ) {
            value.assign( 1, params.word_clock.denominator );
            return true;
        }
    }
    if ( id.name == TCAT_ELEM_STANDALONE_INTERNAL_RATE ) {
        const ClockRateVector& rates = m_clock.getRates();
        ClockRateVector::const_iterator it = std::find( rates.begin(), rates.end(),
                                                        params.internal_rate );
        if ( it == rates.end() ) {
            debugWarning( "Standalone rate %s is not supported\n",
                          clockRateToString( params.internal_rate ) );
            value.assign( 1, 0 );
        } else {
            value.assign( 1, it - rates.begin() );
        }
        return true;
    }
    return false;
}

bool
Tcd22xxController::writeStandalone( const Control::ElementId& id, const Control::ElementValue& value,
                                    enum eStatus& status )
{
    bool handled = id.name == TCAT_ELEM_STANDALONE_CLOCK_SOURCE
        || id.name == TCAT_ELEM_STANDALONE_SPDIF_HIGH_RATE
        || id.name == TCAT_ELEM_STANDALONE_INTERNAL_RATE
        || ( id.name == TCAT_ELEM_STANDALONE_ADAT_MODE && isSourceSupported( eCS_Adat ) )
        || ( ( id.name == TCAT_ELEM_STANDALONE_WC_MODE
               || id.name == TCAT_ELEM_STANDALONE_WC_NUMERATOR
               || id.name == TCAT_ELEM_STANDALONE_WC_DENOMINATOR )
             && isSourceSupported( eCS_WordClock ) );
    if ( !handled ) {
        return false;
    }

    int32_t v;
    if ( !getSingleValue( value, v ) || v < 0 ) {
        status = eS_InvalidArgument;
        return true;
    }

    if ( id.name == TCAT_ELEM_STANDALONE_CLOCK_SOURCE ) {
        if ( (unsigned int)v >= m_clock.getSources().size() ) {
            debugError( "Invalid index of source: %d\n", v );
            status = eS_InvalidArgument;
        } else {
            status = m_standalone.writeClockSource( m_clock.getSources().at( v ) );
        }
    } else if ( id.name == TCAT_ELEM_STANDALONE_SPDIF_HIGH_RATE ) {
        status = m_standalone.writeAesHighRate( v != 0 );
    } else if ( id.name == TCAT_ELEM_STANDALONE_ADAT_MODE ) {
        if ( (unsigned int)v >= NB_ADAT_MODES ) {
            debugError( "Standalone ADAT mode not found for position %d\n", v );
            status = eS_InvalidArgument;
        } else {
            status = m_standalone.writeAdatMode( s_adat_modes[v] );
        }
    } else if ( id.name == TCAT_ELEM_STANDALONE_WC_MODE ) {
        if ( (unsigned int)v >= NB_WC_MODES ) {
            debugError( "Standalone word clock mode not found for position %d\n", v );
            status = eS_InvalidArgument;
        } else {
            status = m_standalone.writeWordClockMode( s_wc_modes[v] );
        }
    } else if ( id.name == TCAT_ELEM_STANDALONE_WC_NUMERATOR ) {
        status = m_standalone.writeWordClockNumerator( v );
    } else if ( id.name == TCAT_ELEM_STANDALONE_WC_DENOMINATOR ) {
        status = m_standalone.writeWordClockDenominator( v );
    } else {
        if ( (unsigned int)v >= m_clock.getRates().size() ) {
            debugError( "Invalid index of rate: %d\n", v );
            status = eS_InvalidArgument;
        } else {
            status = m_standalone.writeInternalRate( m_clock.getRates().at( v ) );
        }
    }
    return true;
}

static bool
routerGroupFromName( const std::string& name, enum eRouterGroup& g )
{
    if ( name == TCAT_ELEM_ROUTER_OUT_SRC ) {
        g = eRG_Output;
    } else if ( name == TCAT_ELEM_ROUTER_STREAM_SRC ) {
        g = eRG_Stream;
    } else if ( name == TCAT_ELEM_ROUTER_MIXER_SRC ) {
        g = eRG_Mixer;
    } else {
        return false;
    }
    return true;
}

bool
Tcd22xxController::readRouter( const Control::ElementId& id, Control::ElementValue& value )
{
    enum eRouterGroup g;
    if ( !routerGroupFromName( id.name, g ) ) {
        return false;
    }
    std::vector<unsigned int> selection;
    m_router.readSelection( g, selection );
    value.assign( selection.begin(), selection.end() );
    return true;
}

bool
Tcd22xxController::writeRouter( const Control::ElementId& id, const Control::ElementValue& value,
                                enum eStatus& status )
{
    enum eRouterGroup g;
    if ( !routerGroupFromName( id.name, g ) ) {
        return false;
    }
    std::vector<unsigned int> selection;
    for ( Control::ElementValue::const_iterator it = value.begin(); it != value.end(); ++it ) {
        if ( *it < 0 ) {
            status = eS_InvalidArgument;
            return true;
        }
        selection.push_back( *it );
    }
    status = m_router.writeSelection( g, selection );
    return true;
}

bool
Tcd22xxController::readMeters( const Control::ElementId& id, Control::ElementValue& value )
{
    if ( id.name == TCAT_ELEM_OUT_METER ) {
        value = m_real_meter;
    } else if ( id.name == TCAT_ELEM_STREAM_METER ) {
        value = m_stream_meter;
    } else if ( id.name == TCAT_ELEM_MIXER_METER ) {
        value = m_mixer_meter;
    } else if ( id.name == TCAT_ELEM_MIXER_SATURATION ) {
        value.assign( m_saturation.begin(), m_saturation.end() );
    } else {
        return false;
    }
    return true;
}

// notification and persistence

enum eStatus
Tcd22xxController::handleRateChange()
{
    debugOutput( DEBUG_LEVEL_NORMAL, "Operating rate %u Hz, refreshing router and mixer\n",
                 m_clock.getCurrentRate() );

    enum eStatus status = m_router.cache( m_clock.getRateMode() );
    if ( status != eS_Ok ) {
        return status;
    }
    m_current_rate = m_clock.getCurrentRate();

    status = m_mixer.cache();
    if ( status != eS_Ok ) {
        return status;
    }
    if ( m_registry && !reloadRateDependentElements() ) {
        debugError( "Could not rebuild the elements\n" );
        return eS_IoError;
    }
    return cacheMeters();
}

enum eStatus
Tcd22xxController::parseNotification( fb_quadlet_t msg )
{
    if ( msg == 0 ) {
        return eS_Ok;
    }
    enum eStatus status = m_clock.parseNotification( msg );
    if ( status != eS_Ok ) {
        return status;
    }

    bool streams_changed = ( msg & ( TCAT_NOTIFY_RX_CFG_CHG | TCAT_NOTIFY_TX_CFG_CHG ) ) != 0;
    if ( streams_changed || m_clock.getCurrentRate() != m_current_rate ) {
        return handleRateChange();
    }
    return eS_Ok;
}

enum eStatus
Tcd22xxController::storeConfiguration()
{
    if ( !m_eap.getCaps().general.storage_avail ) {
        debugError( "Device has no storage\n" );
        return eS_InvalidArgument;
    }
    if ( !m_eap.storeFlashConfig() ) {
        return eS_IoError;
    }
    return eS_Ok;
}

enum eStatus
Tcd22xxController::loadConfiguration()
{
    if ( !m_eap.getCaps().general.storage_avail ) {
        debugError( "Device has no storage\n" );
        return eS_InvalidArgument;
    }
    if ( !m_eap.loadFlashConfig() ) {
        return eS_IoError;
    }
    enum eStatus status = cacheWholeParams();
    if ( status != eS_Ok ) {
        return status;
    }
    if ( m_registry && !reloadRateDependentElements() ) {
        return eS_IoError;
    }
    return eS_Ok;
}

static std::string
memberName( const char* base, unsigned int i, const char* member )
{
    std::ostringstream ostr;
    ostr << base << i << "/" << member;
    return ostr.str();
}

bool
Tcd22xxController::saveState( const std::string& filename )
{
    Util::XMLSerialize ser( filename, getDebugLevel() );
    bool result = true;

    result &= ser.write( "Profile", std::string( m_profile.getName() ) );

    const RouterEntryVector& entries = m_router.getEntries();
    result &= ser.write( "Router/RateMode", (int)m_router.getRateMode() );
    result &= ser.write( "Router/Count", entries.size() );
    for ( unsigned int i = 0; i < entries.size(); ++i ) {
        result &= ser.write( memberName( "Router/Entry", i, "Destination" ), entries[i].dst.encode() );
        result &= ser.write( memberName( "Router/Entry", i, "Source" ), entries[i].src.encode() );
    }

    const MixerCoefficients& coefs = m_mixer.getCoefficients();
    result &= ser.write( "Mixer/Outputs", coefs.size() );
    result &= ser.write( "Mixer/Inputs", m_mixer.getInputCount() );
    for ( unsigned int dst = 0; dst < coefs.size(); ++dst ) {
        for ( unsigned int src = 0; src < coefs[dst].size(); ++src ) {
            std::ostringstream ostr;
            ostr << "Mixer/Output" << dst << "/Input" << src;
            result &= ser.write( ostr.str(), coefs[dst][src] );
        }
    }

    if ( !result ) {
        debugError( "Could not serialize state\n" );
        return false;
    }
    return ser.writeFile();
}

enum eStatus
Tcd22xxController::restoreState( const std::string& filename )
{
    Util::XMLDeserialize deser( filename, getDebugLevel() );
    if ( !deser.isValid() || !deser.checkVersion() ) {
        debugError( "Could not load state from %s\n", filename.c_str() );
        return eS_InvalidArgument;
    }

    std::string profile;
    if ( !deser.read( "Profile", profile ) || profile != m_profile.getName() ) {
        debugError( "State of '%s' does not match profile %s\n",
                    profile.c_str(), m_profile.getName() );
        return eS_InvalidArgument;
    }

    int mode = 0;
    unsigned int count = 0;
    if ( !deser.read( "Router/RateMode", mode ) || !deser.read( "Router/Count", count ) ) {
        debugError( "No router state\n" );
        return eS_InvalidArgument;
    }
    if ( mode != m_router.getRateMode() ) {
        debugWarning( "Router state saved at %s rate, device is at %s rate\n",
                      rateModeToString( (enum eRateMode)mode ),
                      rateModeToString( m_router.getRateMode() ) );
    }

    RouterEntryVector entries;
    for ( unsigned int i = 0; i < count; ++i ) {
        unsigned int dst, src;
        if ( !deser.read( memberName( "Router/Entry", i, "Destination" ), dst )
             || !deser.read( memberName( "Router/Entry", i, "Source" ), src ) ) {
            debugError( "Router entry %u incomplete\n", i );
            return eS_InvalidArgument;
        }
        entries.push_back( RouterEntry( DstBlk::decode( dst ), SrcBlk::decode( src ) ) );
    }

    MixerCoefficients coefs;
    unsigned int outputs = 0, inputs = 0;
    if ( deser.read( "Mixer/Outputs", outputs ) && deser.read( "Mixer/Inputs", inputs ) ) {
        coefs.resize( outputs, MixerRow( inputs, 0 ) );
        for ( unsigned int dst = 0; dst < outputs; ++dst ) {
            for ( unsigned int src = 0; src < inputs; ++src ) {
                std::ostringstream ostr;
                ostr << "Mixer/Output" << dst << "/Input" << src;
                if ( !deser.read( ostr.str(), coefs[dst][src] ) ) {
                    debugError( "Mixer coefficient %u:%u missing\n", dst, src );
                    return eS_InvalidArgument;
                }
            }
        }
    }

    enum eStatus status = m_router.writeEntries( entries );
    if ( status != eS_Ok ) {
        return status;
    }
    if ( m_mixer.isAvailable() && !coefs.empty() ) {
        status = m_mixer.writeCoefficients( coefs );
    }
    return status;
}

void
Tcd22xxController::show()
{
    printMessage( "Profile: %s\n", m_profile.getName() );
    m_clock.show();
    m_eap.show();
    m_router.show();
    if ( m_mixer.isAvailable() ) {
        m_mixer.show();
    }
    m_standalone.show();
}

void
Tcd22xxController::setVerboseLevel( int l )
{
    setDebugLevel( l );
    m_eap.setVerboseLevel( l );
    m_clock.setVerboseLevel( l );
    m_standalone.setVerboseLevel( l );
    m_router.setVerboseLevel( l );
    m_mixer.setVerboseLevel( l );
}

} // namespace Tcat
