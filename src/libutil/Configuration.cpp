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

#include "Configuration.h"

#include <cstdlib>

using namespace libconfig;

namespace Util {

IMPL_DEBUG_MODULE( Configuration, Configuration, DEBUG_LEVEL_NORMAL );

// '~' at the start of a name is the user's home directory
static std::string
expandHome( const std::string& filename )
{
    if ( filename.empty() || filename[0] != '~' ) {
        return filename;
    }
    const char* home = getenv( "HOME" );
    if ( home == NULL ) {
        return filename;
    }
    return std::string( home ) + filename.substr( 1 );
}

Configuration::Configuration()
{
}

Configuration::~Configuration()
{
    for ( ConfigFileVector::iterator it = m_files.begin(); it != m_files.end(); ++it ) {
        delete *it;
    }
}

Configuration::ConfigFileVector::iterator
Configuration::findFile( const std::string& filename )
{
    ConfigFileVector::iterator it;
    for ( it = m_files.begin(); it != m_files.end(); ++it ) {
        if ( (*it)->name == filename ) {
            break;
        }
    }
    return it;
}

bool
Configuration::openFile( const std::string& filename )
{
    if ( findFile( filename ) != m_files.end() ) {
        debugError( "Config file %s is already open\n", filename.c_str() );
        return false;
    }

    ConfigFile* file = new ConfigFile;
    file->name = filename;
    try {
        file->config.readFile( expandHome( filename ).c_str() );
    } catch ( FileIOException& e ) {
        debugOutput( DEBUG_LEVEL_VERBOSE, "Could not read config file %s\n", filename.c_str() );
        delete file;
        return false;
    } catch ( ParseException& e ) {
        debugWarning( "Could not parse config file %s (line %d: %s)\n",
                      filename.c_str(), e.getLine(), e.getError() );
        delete file;
        return false;
    }

    debugOutput( DEBUG_LEVEL_VERBOSE, "Opened config file %s\n", filename.c_str() );
    m_files.push_back( file );
    return true;
}

bool
Configuration::closeFile( const std::string& filename )
{
    ConfigFileVector::iterator it = findFile( filename );
    if ( it == m_files.end() ) {
        debugError( "Config file %s is not open\n", filename.c_str() );
        return false;
    }
    delete *it;
    m_files.erase( it );
    return true;
}

Setting*
Configuration::getSetting( const std::string& path )
{
    for ( ConfigFileVector::iterator it = m_files.begin(); it != m_files.end(); ++it ) {
        if ( (*it)->config.exists( path ) ) {
            return &(*it)->config.lookup( path );
        }
    }
    debugOutput( DEBUG_LEVEL_VERBOSE, "No config file has setting '%s'\n", path.c_str() );
    return NULL;
}

bool
Configuration::getValueForSetting( const std::string& path, int32_t& ref )
{
    Setting* s = getSetting( path );
    if ( s == NULL ) {
        return false;
    }
    if ( s->getType() != Setting::TypeInt ) {
        debugWarning( "Setting '%s' is not an integer\n", path.c_str() );
        return false;
    }
    ref = *s;
    debugOutput( DEBUG_LEVEL_VERBOSE, "%s = %d\n", path.c_str(), ref );
    return true;
}

bool
Configuration::getValueForSetting( const std::string& path, int64_t& ref )
{
    Setting* s = getSetting( path );
    if ( s == NULL ) {
        return false;
    }
    switch ( s->getType() ) {
    case Setting::TypeInt64:
        ref = (long long)*s;
        break;
    case Setting::TypeInt:
        ref = (int)*s;
        break;
    default:
        debugWarning( "Setting '%s' is not an integer\n", path.c_str() );
        return false;
    }
    debugOutput( DEBUG_LEVEL_VERBOSE, "%s = %" PRId64 "\n", path.c_str(), ref );
    return true;
}

bool
Configuration::getValueForSetting( const std::string& path, std::string& ref )
{
    Setting* s = getSetting( path );
    if ( s == NULL ) {
        return false;
    }
    if ( s->getType() != Setting::TypeString ) {
        debugWarning( "Setting '%s' is not a string\n", path.c_str() );
        return false;
    }
    ref = (const char*)*s;
    debugOutput( DEBUG_LEVEL_VERBOSE, "%s = %s\n", path.c_str(), ref.c_str() );
    return true;
}

Setting*
Configuration::getDeviceSetting( unsigned int vendor_id, unsigned int model_id )
{
    for ( ConfigFileVector::iterator it = m_files.begin(); it != m_files.end(); ++it ) {
        if ( !(*it)->config.exists( "device_definitions" ) ) {
            continue;
        }
        Setting& list = (*it)->config.lookup( "device_definitions" );
        for ( int i = 0; i < list.getLength(); ++i ) {
            Setting& unit = list[i];
            unsigned int vid;
            unsigned int mid;
            if ( !unit.lookupValue( "vendorid", vid ) || !unit.lookupValue( "modelid", mid ) ) {
                debugWarning( "%s: device definition %d has no vendor/model id\n",
                              (*it)->name.c_str(), i );
                continue;
            }
            if ( vid == vendor_id && mid == model_id ) {
                debugOutput( DEBUG_LEVEL_VERBOSE, "Unit %06X:%06X is defined in %s\n",
                             vendor_id, model_id, (*it)->name.c_str() );
                return &unit;
            }
        }
    }
    return NULL;
}

bool
Configuration::getValueForDeviceSetting( unsigned int vendor_id, unsigned int model_id,
                                         const std::string& setting, int32_t& ref )
{
    Setting* unit = getDeviceSetting( vendor_id, model_id );
    int value;
    if ( unit == NULL || !unit->lookupValue( setting, value ) ) {
        return false;
    }
    ref = value;
    return true;
}

bool
Configuration::getValueForDeviceSetting( unsigned int vendor_id, unsigned int model_id,
                                         const std::string& setting, std::string& ref )
{
    Setting* unit = getDeviceSetting( vendor_id, model_id );
    std::string value;
    if ( unit == NULL || !unit->lookupValue( setting, value ) ) {
        return false;
    }
    ref = value;
    return true;
}

Configuration::VendorModelEntry
Configuration::findDeviceVME( unsigned int vendor_id, unsigned int model_id )
{
    VendorModelEntry vme;
    Setting* unit = getDeviceSetting( vendor_id, model_id );
    if ( unit == NULL ) {
        return vme;
    }
    VendorModelEntry found;
    found.vendor_id = vendor_id;
    found.model_id = model_id;
    if ( !unit->lookupValue( "vendorname", found.vendor_name )
         || !unit->lookupValue( "modelname", found.model_name )
         || !unit->lookupValue( "profile", found.profile ) ) {
        debugWarning( "Incomplete definition for unit %06X:%06X\n", vendor_id, model_id );
        return vme;
    }
    return found;
}

bool
Configuration::isDeviceVMEPresent( unsigned int vendor_id, unsigned int model_id )
{
    return isValid( findDeviceVME( vendor_id, model_id ) );
}

bool
Configuration::isValid( const VendorModelEntry& vme )
{
    return !( vme == VendorModelEntry() );
}

Configuration::VendorModelEntry::VendorModelEntry()
    : vendor_id( 0 )
    , model_id( 0 )
{
}

bool
Configuration::VendorModelEntry::operator == ( const VendorModelEntry& rhs ) const
{
    return vendor_id == rhs.vendor_id
        && model_id == rhs.model_id
        && vendor_name == rhs.vendor_name
        && model_name == rhs.model_name
        && profile == rhs.profile;
}

} // namespace Util
