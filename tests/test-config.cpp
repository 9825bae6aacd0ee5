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

#include "libutil/Configuration.h"
#include "tcat/tcd22xx_profiles.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

using Util::Configuration;

class ConfigurationTest : public ::testing::Test
{
protected:
    virtual void TearDown()
    {
        for ( std::vector<std::string>::iterator it = m_files.begin(); it != m_files.end(); ++it ) {
            remove( it->c_str() );
        }
    }

    std::string writeConfig( const std::string& name, const std::string& text )
    {
        std::string filename = ::testing::TempDir() + name;
        std::ofstream out( filename.c_str() );
        out << text;
        m_files.push_back( filename );
        return filename;
    }

    std::vector<std::string> m_files;
};

static const char* s_system_config =
    "timeout_ms = 100;\n"
    "port = 0;\n"
    "device_definitions = (\n"
    "    {\n"
    "        vendorid = 0x00130e;\n"
    "        modelid = 0x000012;\n"
    "        vendorname = \"Focusrite\";\n"
    "        modelname = \"Saffire Pro 26\";\n"
    "        profile = \"SPro26\";\n"
    "    },\n"
    "    {\n"
    "        vendorid = 0x000d6c;\n"
    "        modelid = 0x000010;\n"
    "        vendorname = \"M-Audio\";\n"
    "        modelname = \"ProFire 2626\";\n"
    "        profile = \"Pfire2626\";\n"
    "        timeout_ms = 200;\n"
    "    }\n"
    ");\n";

static const char* s_user_config =
    "port = 1;\n"
    "device_definitions = (\n"
    "    {\n"
    "        vendorid = 0x00130e;\n"
    "        modelid = 0x000012;\n"
    "        vendorname = \"Focusrite\";\n"
    "        modelname = \"My Pro 26\";\n"
    "        profile = \"SPro26\";\n"
    "        timeout_ms = 500;\n"
    "    }\n"
    ");\n";

TEST_F( ConfigurationTest, FirstFileWins )
{
    Configuration config;
    ASSERT_TRUE( config.openFile( writeConfig( "tcatctl-user.conf", s_user_config ) ) );
    ASSERT_TRUE( config.openFile( writeConfig( "tcatctl-system.conf", s_system_config ) ) );

    int32_t port = -1;
    ASSERT_TRUE( config.getValueForSetting( "port", port ) );
    EXPECT_EQ( 1, port );

    // only the system file has it
    int32_t timeout = 0;
    ASSERT_TRUE( config.getValueForSetting( "timeout_ms", timeout ) );
    EXPECT_EQ( 100, timeout );

    Configuration::VendorModelEntry vme = config.findDeviceVME( 0x00130e, 0x000012 );
    ASSERT_TRUE( Configuration::isValid( vme ) );
    EXPECT_EQ( "My Pro 26", vme.model_name );
    EXPECT_EQ( "SPro26", vme.profile );
}

TEST_F( ConfigurationTest, DeviceSettingOverridesGlobal )
{
    Configuration config;
    ASSERT_TRUE( config.openFile( writeConfig( "tcatctl-system.conf", s_system_config ) ) );

    int32_t timeout = 0;
    ASSERT_TRUE( config.getValueForDeviceSetting( 0x000d6c, 0x000010, "timeout_ms", timeout ) );
    EXPECT_EQ( 200, timeout );

    // no device specific value, the caller falls back to the global one
    timeout = 0;
    EXPECT_FALSE( config.getValueForDeviceSetting( 0x00130e, 0x000012, "timeout_ms", timeout ) );
    EXPECT_EQ( 0, timeout );

    std::string profile;
    ASSERT_TRUE( config.getValueForDeviceSetting( 0x000d6c, 0x000010, "profile", profile ) );
    EXPECT_EQ( "Pfire2626", profile );
}

TEST_F( ConfigurationTest, UnknownDevice )
{
    Configuration config;
    ASSERT_TRUE( config.openFile( writeConfig( "tcatctl-system.conf", s_system_config ) ) );

    EXPECT_FALSE( config.isDeviceVMEPresent( 0x00130e, 0x000001 ) );
    EXPECT_FALSE( Configuration::isValid( config.findDeviceVME( 0x00130e, 0x000001 ) ) );
    EXPECT_TRUE( config.isDeviceVMEPresent( 0x00130e, 0x000012 ) );
}

TEST_F( ConfigurationTest, WrongTypeLeavesValue )
{
    Configuration config;
    ASSERT_TRUE( config.openFile( writeConfig( "tcatctl-types.conf",
                                               "port = \"zero\";\nname = 5;\n" ) ) );
    int32_t port = 7;
    EXPECT_FALSE( config.getValueForSetting( "port", port ) );
    EXPECT_EQ( 7, port );

    std::string name = "unchanged";
    EXPECT_FALSE( config.getValueForSetting( "name", name ) );
    EXPECT_EQ( "unchanged", name );

    int64_t wide = 0;
    ASSERT_TRUE( config.getValueForSetting( "name", wide ) );
    EXPECT_EQ( 5, wide );
}

TEST_F( ConfigurationTest, BadFiles )
{
    Configuration config;
    EXPECT_FALSE( config.openFile( ::testing::TempDir() + "tcatctl-does-not-exist.conf" ) );
    EXPECT_FALSE( config.openFile( writeConfig( "tcatctl-broken.conf", "port = ;\n" ) ) );

    std::string filename = writeConfig( "tcatctl-system.conf", s_system_config );
    ASSERT_TRUE( config.openFile( filename ) );
    EXPECT_FALSE( config.openFile( filename ) );
    EXPECT_TRUE( config.closeFile( filename ) );
    EXPECT_FALSE( config.closeFile( filename ) );
}

TEST_F( ConfigurationTest, ShippedDefinitionsNameKnownProfiles )
{
    Configuration config;
    ASSERT_TRUE( config.openFile( TCATCTL_TEST_CONFIG ) );

    static const unsigned int units[][2] = {
        { 0x00130e, 0x000009 },
        { 0x00130e, 0x000007 },
        { 0x00130e, 0x000008 },
        { 0x00130e, 0x000012 },
        { 0x00130e, 0x000006 },
        { 0x00a07e, 0x000004 },
        { 0x000d6c, 0x000010 },
        { 0x000d6c, 0x000011 },
    };
    for ( unsigned int i = 0; i < sizeof( units ) / sizeof( units[0] ); ++i ) {
        Configuration::VendorModelEntry vme = config.findDeviceVME( units[i][0], units[i][1] );
        ASSERT_TRUE( Configuration::isValid( vme ) ) << "unit " << i;
        EXPECT_TRUE( Tcat::findDeviceProfile( vme.profile ) != NULL ) << vme.profile;
    }
}
