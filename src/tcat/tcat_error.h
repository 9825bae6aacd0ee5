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

#ifndef TCAT_ERROR_H
#define TCAT_ERROR_H

namespace Tcat {

/**
 * Outcome of an engine or controller operation.
 *
 * eS_InvalidArgument is reported before any transaction reached the
 * device; eS_IoError means the transport failed or the device returned
 * data that could not be interpreted.
 */
enum eStatus {
    eS_Ok = 0,
    eS_InvalidArgument,
    eS_IoError,
};

const char* statusToString( enum eStatus s );

} // namespace Tcat

#endif // TCAT_ERROR_H
