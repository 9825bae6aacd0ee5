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

#ifndef TCAT_TCD22XX_PROFILES_H
#define TCAT_TCD22XX_PROFILES_H

#include "tcd22xx_spec.h"

#include <string>
#include <vector>

namespace Tcat {

#define TCAT_VENDOR_FOCUSRITE       0x00130e
#define TCAT_VENDOR_AVID            0x00a07e
#define TCAT_VENDOR_MAUDIO          0x000d6c

#define TCAT_MODEL_LIQUID_S56       0x000006
#define TCAT_MODEL_SPRO24           0x000007
#define TCAT_MODEL_SPRO24DSP        0x000008
#define TCAT_MODEL_SPRO14           0x000009
#define TCAT_MODEL_SPRO26           0x000012
#define TCAT_MODEL_MBOX3            0x000004
#define TCAT_MODEL_PFIRE2626        0x000010
#define TCAT_MODEL_PFIRE610         0x000011

typedef std::vector<const DeviceProfile*> DeviceProfileVector;

/// all built-in profiles
const DeviceProfileVector& getDeviceProfiles();

/// NULL when no built-in profile matches
const DeviceProfile* findDeviceProfile( fb_quadlet_t vendor_id, fb_quadlet_t model_id );
const DeviceProfile* findDeviceProfile( const std::string& name );

} // namespace Tcat

#endif // TCAT_TCD22XX_PROFILES_H
