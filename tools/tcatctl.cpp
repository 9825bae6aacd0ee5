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

#include "debugmodule/debugmodule.h"

#include "libieee1394/Raw1394Transport.h"
#include "libutil/Configuration.h"
#include "libutil/ByteSwap.h"
#include "libcontrol/ElementRegistry.h"

#include "tcat/tcat_device.h"
#include "tcat/tcd22xx_ctl.h"
#include "tcat/tcd22xx_profiles.h"

#include <argp.h>
#include <errno.h>
#include <stdlib.h>
#include <stdio.h>
#include <string.h>

#include <string>

using namespace Tcat;

DECLARE_GLOBAL_DEBUG_MODULE;
IMPL_GLOBAL_DEBUG_MODULE( tcatctl, DEBUG_LEVEL_NORMAL );

#ifndef TCATCTL_DEFAULT_CONFIG
#define TCATCTL_DEFAULT_CONFIG "/etc/tcatctl.conf"
#endif

#define MAX_ARGS 8

// configuration ROM of the node
#define CSR_CONFIG_ROM          0xFFFFF0000400ULL
#define CSR_KEY_MODULE_VENDOR   0x03
#define CSR_KEY_MODEL_ID        0x17

////////////////////////////////////////////////
// arg parsing
////////////////////////////////////////////////
const char *argp_program_version = "tcatctl 0.1";
const char *argp_program_bug_address = "<ffado-devel@lists.sf.net>";
static char doc[] = "tcatctl -- control the router, mixer and clock of TCD22xx based units\n\n"
                    "Commands:\n"
                    "  info                  show the general parameters\n"
                    "  router                list the router destinations and their sources\n"
                    "  route DST SRC         route source SRC to destination DST\n"
                    "  mixer                 show the mixer coefficients\n"
                    "  gain DST SRC VALUE    set a mixer coefficient (2.14 fixed point)\n"
                    "  clock [RATE SRC]      show or set the sampling clock\n"
                    "  standalone            show the standalone parameters\n"
                    "  meters                show the peak meters\n"
                    "  store                 store the configuration to flash\n"
                    "  save FILE             save router and mixer state\n"
                    "  restore FILE          restore router and mixer state";
static char args_doc[] = "COMMAND [ARGS...]";
static struct argp_option options[] = {
    {"verbose", 'v', "LEVEL",   0,  "Verbosity level" },
    {"port",    'p', "PORT",    0,  "IEEE1394 port" },
    {"node",    'n', "NODE",    0,  "Node id of the unit" },
    {"config",  'c', "FILE",    0,  "Configuration file" },
    {"model",   'm', "PROFILE", 0,  "Device profile, overrides detection" },
    { 0 }
};

struct arguments
{
    arguments()
        : nargs( 0 )
        , verbose( -1 )
        , port( -1 )
        , node( -1 )
        , config( NULL )
        , profile( NULL )
        {
            args[0] = 0;
        }

    char* args[MAX_ARGS];
    int   nargs;
    int   verbose;
    int   port;
    int   node;
    char* config;
    char* profile;
} arguments;

static error_t
parse_opt( int key, char* arg, struct argp_state* state )
{
    struct arguments* arguments = ( struct arguments* ) state->input;

    char* tail;
    switch (key) {
    case 'v':
        errno = 0;
        arguments->verbose = strtol( arg, &tail, 0 );
        if ( errno || *tail ) {
            fprintf( stderr, "Could not parse verbose level '%s'\n", arg );
            return ARGP_ERR_UNKNOWN;
        }
        break;
    case 'p':
        errno = 0;
        arguments->port = strtol( arg, &tail, 0 );
        if ( errno || *tail ) {
            fprintf( stderr, "Could not parse port '%s'\n", arg );
            return ARGP_ERR_UNKNOWN;
        }
        break;
    case 'n':
        errno = 0;
        arguments->node = strtol( arg, &tail, 0 );
        if ( errno || *tail ) {
            fprintf( stderr, "Could not parse node '%s'\n", arg );
            return ARGP_ERR_UNKNOWN;
        }
        break;
    case 'c':
        arguments->config = arg;
        break;
    case 'm':
        arguments->profile = arg;
        break;
    case ARGP_KEY_ARG:
        if ( state->arg_num >= MAX_ARGS ) {
            argp_usage( state );
        }
        arguments->args[state->arg_num] = arg;
        arguments->nargs++;
        break;
    case ARGP_KEY_END:
        if ( arguments->nargs < 1 ) {
            argp_usage( state );
        }
        break;
    default:
        return ARGP_ERR_UNKNOWN;
    }
    return 0;
}

static struct argp argp = { options, parse_opt, args_doc, doc };

////////////////////////////////////////////////
// helpers
////////////////////////////////////////////////

static bool
parseNumber( const char* arg, long& value )
{
    char* tail;
    errno = 0;
    value = strtol( arg, &tail, 0 );
    if ( errno || tail == arg || *tail ) {
        fprintf( stderr, "Invalid number '%s'\n", arg );
        return false;
    }
    return true;
}

/**
 * Walks the root directory of the configuration ROM for the vendor and
 * model entries.
 */
static bool
readUnitIds( Ieee1394::Transport& transport, unsigned int timeout_ms,
             fb_quadlet_t& vendor_id, fb_quadlet_t& model_id )
{
    fb_quadlet_t header;
    if ( !transport.readQuadlet( CSR_CONFIG_ROM, &header, timeout_ms ) ) {
        debugError( "Could not read the configuration ROM header\n" );
        return false;
    }
    header = CondSwapFromBus32( header );

    unsigned int info_length = ( header >> 24 ) & 0xff;
    fb_nodeaddr_t root = CSR_CONFIG_ROM + 4 * ( 1 + info_length );

    fb_quadlet_t root_header;
    if ( !transport.readQuadlet( root, &root_header, timeout_ms ) ) {
        debugError( "Could not read the root directory\n" );
        return false;
    }
    unsigned int root_length = ( CondSwapFromBus32( root_header ) >> 16 ) & 0xffff;

    bool has_vendor = false;
    bool has_model = false;
    for ( unsigned int i = 1; i <= root_length; ++i ) {
        fb_quadlet_t entry;
        if ( !transport.readQuadlet( root + 4 * i, &entry, timeout_ms ) ) {
            debugError( "Could not read root directory entry %u\n", i );
            return false;
        }
        entry = CondSwapFromBus32( entry );
        switch ( entry >> 24 ) {
        case CSR_KEY_MODULE_VENDOR:
            vendor_id = entry & 0x00ffffff;
            has_vendor = true;
            break;
        case CSR_KEY_MODEL_ID:
            model_id = entry & 0x00ffffff;
            has_model = true;
            break;
        default:
            break;
        }
    }
    return has_vendor && has_model;
}

static const DeviceProfile*
selectProfile( Util::Configuration& config, Ieee1394::Transport& transport,
               int32_t& timeout_ms )
{
    if ( arguments.profile ) {
        const DeviceProfile* profile = findDeviceProfile( arguments.profile );
        if ( profile == NULL ) {
            fprintf( stderr, "Unknown profile '%s', known profiles:\n", arguments.profile );
            const DeviceProfileVector& profiles = getDeviceProfiles();
            for ( DeviceProfileVector::const_iterator it = profiles.begin();
                  it != profiles.end();
                  ++it )
            {
                fprintf( stderr, "  %s\n", ( *it )->getName() );
            }
        }
        return profile;
    }

    fb_quadlet_t vendor_id = 0;
    fb_quadlet_t model_id = 0;
    if ( !readUnitIds( transport, timeout_ms, vendor_id, model_id ) ) {
        fprintf( stderr, "Could not identify the unit, use -m\n" );
        return NULL;
    }
    debugOutput( DEBUG_LEVEL_VERBOSE, "vendor 0x%06X, model 0x%06X\n", vendor_id, model_id );

    // per-device override of the transaction timeout
    config.getValueForDeviceSetting( vendor_id, model_id, "timeout_ms", timeout_ms );

    Util::Configuration::VendorModelEntry vme = config.findDeviceVME( vendor_id, model_id );
    if ( Util::Configuration::isValid( vme ) && !vme.profile.empty() ) {
        const DeviceProfile* profile = findDeviceProfile( vme.profile );
        if ( profile ) {
            printMessage( "%s %s uses profile %s\n", vme.vendor_name.c_str(),
                          vme.model_name.c_str(), profile->getName() );
            return profile;
        }
        debugWarning( "Configured profile '%s' is unknown\n", vme.profile.c_str() );
    }

    const DeviceProfile* profile = findDeviceProfile( vendor_id, model_id );
    if ( profile == NULL ) {
        fprintf( stderr, "Unit 0x%06X/0x%06X is not supported\n", vendor_id, model_id );
    }
    return profile;
}

static bool
checkStatus( enum eStatus status, const char* what )
{
    if ( status != eS_Ok ) {
        fprintf( stderr, "%s failed: %s\n", what, statusToString( status ) );
        return false;
    }
    return true;
}

static const enum eRouterGroup s_groups[] = { eRG_Output, eRG_Stream, eRG_Mixer };
#define NB_ROUTER_GROUPS ( sizeof( s_groups ) / sizeof( s_groups[0] ) )

////////////////////////////////////////////////
// commands
////////////////////////////////////////////////

static bool
doInfo( Tcd22xxController& ctl )
{
    GlobalParameters params;
    if ( !ctl.getDevice().readGlobalParameters( params ) ) {
        fprintf( stderr, "Could not read the general parameters\n" );
        return false;
    }
    ctl.getDevice().showGlobalParameters( params );
    ctl.getEAP().show();
    return true;
}

static bool
doRouter( Tcd22xxController& ctl )
{
    RouterEngine& router = ctl.getRouter();
    printMessage( "Router, %s rate mode\n", rateModeToString( router.getRateMode() ) );

    unsigned int global_idx = 0;
    for ( unsigned int g = 0; g < NB_ROUTER_GROUPS; ++g ) {
        stringlist dsts = router.getDestinationLabels( s_groups[g] );
        stringlist srcs = router.getSourceLabels( s_groups[g] );
        std::vector<unsigned int> selection;
        router.readSelection( s_groups[g], selection );

        printMessage( " %s destinations:\n", routerGroupToString( s_groups[g] ) );
        for ( unsigned int i = 0; i < dsts.size() && i < selection.size(); ++i ) {
            printMessage( "  %3u %-24s <- %s\n", global_idx + i, dsts[i].c_str(),
                          srcs.at( selection[i] ).c_str() );
        }
        printMessage( " %s sources:\n", routerGroupToString( s_groups[g] ) );
        for ( unsigned int i = 0; i < srcs.size(); ++i ) {
            printMessage( "  %3u %s\n", i, srcs[i].c_str() );
        }
        global_idx += dsts.size();
    }
    return true;
}

static bool
doRoute( Tcd22xxController& ctl, const char* dst_arg, const char* src_arg )
{
    long dst, src;
    if ( !parseNumber( dst_arg, dst ) || !parseNumber( src_arg, src ) ) {
        return false;
    }
    if ( dst < 0 || src < 0 ) {
        fprintf( stderr, "Indices are positive\n" );
        return false;
    }

    RouterEngine& router = ctl.getRouter();
    unsigned int idx = dst;
    for ( unsigned int g = 0; g < NB_ROUTER_GROUPS; ++g ) {
        const DstBlkVector& dsts = router.getDestinations( s_groups[g] );
        if ( idx >= dsts.size() ) {
            idx -= dsts.size();
            continue;
        }
        std::vector<unsigned int> selection;
        router.readSelection( s_groups[g], selection );
        selection.at( idx ) = src;
        return checkStatus( router.writeSelection( s_groups[g], selection ), "Routing" );
    }
    fprintf( stderr, "No destination %ld\n", dst );
    return false;
}

static bool
doGain( Tcd22xxController& ctl, const char* dst_arg, const char* src_arg, const char* value_arg )
{
    long dst, src, value;
    if ( !parseNumber( dst_arg, dst ) || !parseNumber( src_arg, src )
         || !parseNumber( value_arg, value ) )
    {
        return false;
    }
    if ( dst < 0 || src < 0 || value < TCAT_MIXER_COEF_MIN || value > TCAT_MIXER_COEF_MAX ) {
        fprintf( stderr, "Value out of range\n" );
        return false;
    }
    if ( !ctl.getMixer().isAvailable() ) {
        fprintf( stderr, "The unit has no mixer\n" );
        return false;
    }
    return checkStatus( ctl.getMixer().writeCoefficient( dst, src, value ), "Setting the gain" );
}

static bool
doClock( Tcd22xxController& ctl, const char* rate_arg, const char* src_arg )
{
    ClockEngine& clock = ctl.getClock();
    if ( rate_arg == NULL ) {
        clock.show();
        return true;
    }

    long freq;
    if ( !parseNumber( rate_arg, freq ) ) {
        return false;
    }
    enum eClockRate rate = clockRateFromFrequency( freq );
    if ( rate == eCR_Reserved ) {
        fprintf( stderr, "Unsupported rate %ld\n", freq );
        return false;
    }

    enum eClockSource src = eCS_Reserved;
    const ClockSourceVector& srcs = clock.getSources();
    for ( ClockSourceVector::const_iterator it = srcs.begin();
          it != srcs.end();
          ++it )
    {
        if ( strcasecmp( src_arg, clockSourceToString( *it ) ) == 0
             || strcasecmp( src_arg, clock.getSourceLabel( *it ).c_str() ) == 0 )
        {
            src = *it;
            break;
        }
    }
    if ( src == eCS_Reserved ) {
        fprintf( stderr, "Unknown clock source '%s', available:\n", src_arg );
        stringlist labels = clock.getSourceLabels();
        for ( stringlist::iterator it = labels.begin(); it != labels.end(); ++it ) {
            fprintf( stderr, "  %s\n", it->c_str() );
        }
        return false;
    }

    if ( !checkStatus( clock.writeConfig( ClockConfig( rate, src ) ), "Setting the clock" ) ) {
        return false;
    }
    clock.show();
    return true;
}

static bool
doMeters( Tcd22xxController& ctl )
{
    if ( !checkStatus( ctl.cachePartialParams(), "Reading the meters" ) ) {
        return false;
    }

    const Control::ElementIdVector& ids = ctl.getMeasuredElements();
    for ( Control::ElementIdVector::const_iterator it = ids.begin();
          it != ids.end();
          ++it )
    {
        Control::ElementValue value;
        if ( !ctl.read( *it, value ) ) {
            debugWarning( "Could not read %s\n", it->name.c_str() );
            continue;
        }
        std::string line;
        char buf[16];
        for ( Control::ElementValue::iterator v = value.begin(); v != value.end(); ++v ) {
            snprintf( buf, sizeof( buf ), " %5d", *v );
            line += buf;
        }
        printMessage( "%s:%s\n", it->name.c_str(), line.c_str() );
    }
    return true;
}

static bool
runCommand( Tcd22xxController& ctl )
{
    std::string cmd = arguments.args[0];
    int nargs = arguments.nargs - 1;

    if ( cmd == "info" ) {
        return doInfo( ctl );
    } else if ( cmd == "router" ) {
        return doRouter( ctl );
    } else if ( cmd == "route" && nargs == 2 ) {
        return doRoute( ctl, arguments.args[1], arguments.args[2] );
    } else if ( cmd == "mixer" ) {
        if ( !ctl.getMixer().isAvailable() ) {
            fprintf( stderr, "The unit has no mixer\n" );
            return false;
        }
        ctl.getMixer().show();
        return true;
    } else if ( cmd == "gain" && nargs == 3 ) {
        return doGain( ctl, arguments.args[1], arguments.args[2], arguments.args[3] );
    } else if ( cmd == "clock" && ( nargs == 0 || nargs == 2 ) ) {
        return doClock( ctl, nargs ? arguments.args[1] : NULL, nargs ? arguments.args[2] : NULL );
    } else if ( cmd == "standalone" ) {
        ctl.getStandalone().show();
        return true;
    } else if ( cmd == "meters" ) {
        return doMeters( ctl );
    } else if ( cmd == "store" ) {
        return checkStatus( ctl.storeConfiguration(), "Storing the configuration" );
    } else if ( cmd == "save" && nargs == 1 ) {
        if ( !ctl.saveState( arguments.args[1] ) ) {
            fprintf( stderr, "Could not save the state to %s\n", arguments.args[1] );
            return false;
        }
        return true;
    } else if ( cmd == "restore" && nargs == 1 ) {
        return checkStatus( ctl.restoreState( arguments.args[1] ), "Restoring the state" );
    }

    fprintf( stderr, "Unknown command or wrong number of arguments: %s\n", cmd.c_str() );
    return false;
}

///////////////////////////
// main
//////////////////////////
int
main( int argc, char **argv )
{
    if ( argp_parse( &argp, argc, argv, 0, 0, &arguments ) ) {
        fprintf( stderr, "Could not parse command line\n" );
        return -1;
    }

    Util::Configuration config;
    const char* config_file = arguments.config ? arguments.config : TCATCTL_DEFAULT_CONFIG;
    if ( !config.openFile( config_file ) ) {
        if ( arguments.config ) {
            fprintf( stderr, "Could not open configuration %s\n", config_file );
            return -1;
        }
        debugOutput( DEBUG_LEVEL_VERBOSE, "No configuration at %s\n", config_file );
    }

    int32_t level = DEBUG_LEVEL_NORMAL;
    config.getValueForSetting( "debug_level", level );
    if ( arguments.verbose >= 0 ) {
        level = arguments.verbose;
    }
    DebugModuleManager::instance()->setMgrDebugLevel( level );

    int32_t port = 0;
    config.getValueForSetting( "port", port );
    if ( arguments.port >= 0 ) {
        port = arguments.port;
    }
    if ( arguments.node < 0 ) {
        fprintf( stderr, "No node given, use -n\n" );
        return -1;
    }

    int32_t timeout_ms = TCAT_DEFAULT_TIMEOUT_MS;
    config.getValueForSetting( "timeout_ms", timeout_ms );

    Ieee1394::Raw1394Transport transport;
    if ( !transport.initialize( port, arguments.node ) ) {
        fprintf( stderr, "Could not open node %d on port %d\n", arguments.node, port );
        return -1;
    }

    const DeviceProfile* profile = selectProfile( config, transport, timeout_ms );
    if ( profile == NULL ) {
        return -1;
    }

    Device device( transport, timeout_ms );
    if ( !device.init() ) {
        fprintf( stderr, "Could not read the sections of the unit\n" );
        return -1;
    }

    Tcd22xxController ctl( device, *profile );
    if ( !ctl.init() ) {
        fprintf( stderr, "Could not initialize the controller\n" );
        return -1;
    }
    if ( !checkStatus( ctl.cacheWholeParams(), "Reading the unit state" ) ) {
        return -1;
    }

    Control::ElementRegistry registry;
    if ( !ctl.load( registry ) ) {
        fprintf( stderr, "Could not set up the control elements\n" );
        return -1;
    }

    bool result = runCommand( ctl );
    flushDebugOutput();
    return result ? 0 : -1;
}
