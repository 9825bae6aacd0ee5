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

#ifndef TCATCTL_UTIL_CONFIGURATION_H
#define TCATCTL_UTIL_CONFIGURATION_H

#include "debugmodule/debugmodule.h"
#include "libconfig.h++"

#include <inttypes.h>

#include <vector>
#include <string>

namespace Util {

/**
 * A stack of libconfig files. A setting is taken from the first file
 * that has it, so a user file opened before the system file overrides it.
 *
 * Besides plain settings the files carry a 'device_definitions' list
 * that maps a vendor/model id pair to one of the built-in device
 * profiles, optionally with per-unit settings such as timeout_ms.
 *
 * note: not thread safe
 */
class Configuration {
public:
    struct VendorModelEntry {
        VendorModelEntry();
        bool operator == ( const VendorModelEntry& rhs ) const;

        unsigned int vendor_id;
        unsigned int model_id;
        std::string vendor_name;
        std::string model_name;
        // name of the built-in device profile handling this unit
        std::string profile;
    };

    Configuration();
    ~Configuration();

    bool openFile( const std::string& filename );
    bool closeFile( const std::string& filename );

    VendorModelEntry findDeviceVME( unsigned int vendor_id, unsigned int model_id );
    bool isDeviceVMEPresent( unsigned int vendor_id, unsigned int model_id );
    static bool isValid( const VendorModelEntry& vme );

    /**
     * @brief retrieves a top level setting
     *
     * ref is left alone when the setting is missing or has another type.
     *
     * @return true if ref was set
     */
    bool getValueForSetting( const std::string& path, int32_t& ref );
    bool getValueForSetting( const std::string& path, int64_t& ref );
    bool getValueForSetting( const std::string& path, std::string& ref );

    /**
     * @brief retrieves a setting from the definition of one unit
     *
     * @return true if the unit is defined and carries the setting
     */
    bool getValueForDeviceSetting( unsigned int vendor_id, unsigned int model_id,
                                   const std::string& setting, int32_t& ref );
    bool getValueForDeviceSetting( unsigned int vendor_id, unsigned int model_id,
                                   const std::string& setting, std::string& ref );

    void setVerboseLevel( int l ) { setDebugLevel( l ); }

private:
    struct ConfigFile {
        std::string       name;
        libconfig::Config config;
    };
    typedef std::vector< ConfigFile* > ConfigFileVector;

    libconfig::Setting* getSetting( const std::string& path );
    libconfig::Setting* getDeviceSetting( unsigned int vendor_id, unsigned int model_id );
    ConfigFileVector::iterator findFile( const std::string& filename );

    // vector order gives the lookup priority
    ConfigFileVector m_files;

    DECLARE_DEBUG_MODULE;
};

} // namespace Util

#endif
