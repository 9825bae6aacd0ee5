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

#include "SystemTimeSource.h"

namespace Util {

static clockid_t clock_id = CLOCK_MONOTONIC;

bool
SystemTimeSource::setSource(clockid_t id)
{
    struct timespec tp;
    // only switch when the kernel knows the clock
    if (clock_gettime(id, &tp) == 0) {
        clock_id = id;
        return true;
    }
    return false;
}

clockid_t
SystemTimeSource::getSource(void)
{
    return clock_id;
}

void
SystemTimeSource::SleepUsecRelative(tcat_microsecs_t usecs)
{
    struct timespec ts;
    ts.tv_sec = usecs / (1000000LL);
    ts.tv_nsec = (usecs % (1000000LL)) * 1000LL;

    clock_nanosleep(clock_id, 0, &ts, NULL);
}

tcat_microsecs_t
SystemTimeSource::getCurrentTimeAsUsecs()
{
    struct timespec ts;
    clock_gettime(clock_id, &ts);
    return (tcat_microsecs_t)(ts.tv_sec * 1000000LL + ts.tv_nsec / 1000LL);
}

} // end of namespace Util
