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

#ifndef __TCAT_SYSTEMTIMESOURCE__
#define __TCAT_SYSTEMTIMESOURCE__

#include <stdint.h>
#include <time.h>

typedef uint64_t tcat_microsecs_t;

namespace Util {

class SystemTimeSource
{
private: // don't allow objects to be created
    SystemTimeSource() {};
    virtual ~SystemTimeSource() {};

public:
    static bool setSource(clockid_t id);
    static clockid_t getSource(void);

    static tcat_microsecs_t getCurrentTimeAsUsecs();

    static void SleepUsecRelative(tcat_microsecs_t usecs);
};

} // end of namespace Util

#endif /* __TCAT_SYSTEMTIMESOURCE__ */
