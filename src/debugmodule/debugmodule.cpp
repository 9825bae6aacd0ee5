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

#include "debugmodule.h"

#include <cstdarg>
#include <cstring>
#include <inttypes.h>
#include <time.h>

static const char*
levelTag( debug_level_t level )
{
    switch ( level ) {
    case DEBUG_LEVEL_MESSAGE: return "";
    case DEBUG_LEVEL_FATAL:   return "Fatal ";
    case DEBUG_LEVEL_ERROR:   return "Error ";
    case DEBUG_LEVEL_WARNING: return "Warning ";
    default:                  return "Debug ";
    }
}

// marks a message that did not fit in the buffer
static void
markTruncated( char* msg, int written )
{
    static const char tail[] = "...\n";
    if ( written >= DEBUG_MAX_MESSAGE_LENGTH ) {
        strcpy( msg + DEBUG_MAX_MESSAGE_LENGTH - sizeof( tail ), tail );
    }
}

DebugModule::DebugModule( const std::string& name, debug_level_t level )
    : m_name( name )
    , m_level( level )
{
    DebugModuleManager::instance()->registerModule( *this );
}

DebugModule::~DebugModule()
{
    DebugModuleManager::instance()->unregisterModule( *this );
}

void
DebugModule::printShort( debug_level_t level, const char* format, ... ) const
{
    if ( level > m_level ) {
        return;
    }

    char msg[DEBUG_MAX_MESSAGE_LENGTH];
    va_list arg;
    va_start( arg, format );
    int written = vsnprintf( msg, sizeof( msg ), format, arg );
    va_end( arg );
    if ( written < 0 ) {
        return;
    }
    markTruncated( msg, written );
    DebugModuleManager::instance()->print( msg );
}

void
DebugModule::print( debug_level_t level,
                    const char* file,
                    const char* function,
                    unsigned int line,
                    const char* format, ... ) const
{
    if ( level > m_level ) {
        return;
    }

    const char* slash = strrchr( file, '/' );
    const char* fname = slash ? slash + 1 : file;

    struct timespec ts;
    clock_gettime( CLOCK_MONOTONIC, &ts );
    uint64_t ts_usec = (uint64_t)ts.tv_sec * 1000000ULL + ts.tv_nsec / 1000;

    char msg[DEBUG_MAX_MESSAGE_LENGTH];
    int written = snprintf( msg, sizeof( msg ), "%011" PRIu64 ": %s%s (%s)[%4u] %s: ",
                            ts_usec, levelTag( level ), m_name.c_str(),
                            fname, line, function );
    if ( written < 0 ) {
        return;
    }
    if ( written < DEBUG_MAX_MESSAGE_LENGTH ) {
        va_list arg;
        va_start( arg, format );
        int body = vsnprintf( msg + written, sizeof( msg ) - written, format, arg );
        va_end( arg );
        if ( body > 0 ) {
            written += body;
        }
    }
    markTruncated( msg, written );
    DebugModuleManager::instance()->print( msg );
}

//--------------------------------------

DebugModuleManager::DebugModuleManager()
{
    pthread_mutex_init( &m_print_lock, NULL );
}

DebugModuleManager::~DebugModuleManager()
{
    fflush( stderr );
    pthread_mutex_destroy( &m_print_lock );
}

DebugModuleManager*
DebugModuleManager::instance()
{
    // modules are static objects, so the manager has to outlive all of them
    static DebugModuleManager* manager = new DebugModuleManager;
    return manager;
}

void
DebugModuleManager::registerModule( DebugModule& module )
{
    pthread_mutex_lock( &m_print_lock );
    m_modules.push_back( &module );
    pthread_mutex_unlock( &m_print_lock );
}

void
DebugModuleManager::unregisterModule( DebugModule& module )
{
    pthread_mutex_lock( &m_print_lock );
    for ( DebugModuleVectorIterator it = m_modules.begin(); it != m_modules.end(); ++it ) {
        if ( *it == &module ) {
            m_modules.erase( it );
            break;
        }
    }
    pthread_mutex_unlock( &m_print_lock );
}

bool
DebugModuleManager::setMgrDebugLevel( const std::string& name, debug_level_t level )
{
    bool found = false;
    pthread_mutex_lock( &m_print_lock );
    for ( DebugModuleVectorIterator it = m_modules.begin(); it != m_modules.end(); ++it ) {
        if ( (*it)->getName() == name ) {
            (*it)->setLevel( level );
            found = true;
        }
    }
    pthread_mutex_unlock( &m_print_lock );
    if ( !found ) {
        fprintf( stderr, "No debug module named '%s'\n", name.c_str() );
    }
    return found;
}

void
DebugModuleManager::setMgrDebugLevel( debug_level_t level )
{
    pthread_mutex_lock( &m_print_lock );
    for ( DebugModuleVectorIterator it = m_modules.begin(); it != m_modules.end(); ++it ) {
        (*it)->setLevel( level );
    }
    pthread_mutex_unlock( &m_print_lock );
}

void
DebugModuleManager::print( const char* msg )
{
    pthread_mutex_lock( &m_print_lock );
    fputs( msg, stderr );
    pthread_mutex_unlock( &m_print_lock );
}

void
DebugModuleManager::flush()
{
    fflush( stderr );
}
