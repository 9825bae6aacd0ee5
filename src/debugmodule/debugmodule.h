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

#ifndef TCATCTL_DEBUGMODULE_H
#define TCATCTL_DEBUGMODULE_H

#include <cstdio>
#include <string>
#include <vector>
#include <pthread.h>

#ifndef DEBUG_MAX_MESSAGE_LENGTH
#define DEBUG_MAX_MESSAGE_LENGTH 512
#endif

typedef short debug_level_t;

#define DEBUG_LEVEL_MESSAGE        0
#define DEBUG_LEVEL_FATAL          1
#define DEBUG_LEVEL_ERROR          2
#define DEBUG_LEVEL_WARNING        3
#define DEBUG_LEVEL_NORMAL         4
#define DEBUG_LEVEL_INFO           5
#define DEBUG_LEVEL_VERBOSE        6
#define DEBUG_LEVEL_VERY_VERBOSE   7
#define DEBUG_LEVEL_ULTRA_VERBOSE  8

#define debugFatal( format, args... )                                   \
    m_debugModule.print( DEBUG_LEVEL_FATAL, __FILE__, __FUNCTION__,     \
                         __LINE__, format, ##args )
#define debugError( format, args... )                                   \
    m_debugModule.print( DEBUG_LEVEL_ERROR, __FILE__, __FUNCTION__,     \
                         __LINE__, format, ##args )
#define debugWarning( format, args... )                                 \
    m_debugModule.print( DEBUG_LEVEL_WARNING, __FILE__, __FUNCTION__,   \
                         __LINE__, format, ##args )

// shown even when debug output is compiled out
#ifdef DEBUG_MESSAGES
#define printMessage( format, args... )                                 \
    m_debugModule.print( DEBUG_LEVEL_MESSAGE, __FILE__, __FUNCTION__,   \
                         __LINE__, format, ##args )
#else
#define printMessage( format, args... )                                 \
    m_debugModule.printShort( DEBUG_LEVEL_MESSAGE, format, ##args )
#endif
#define printMessageShort( format, args... )                            \
    m_debugModule.printShort( DEBUG_LEVEL_MESSAGE, format, ##args )

#ifdef DEBUG_MESSAGES
#define debugOutput( level, format, args... )                           \
    m_debugModule.print( level, __FILE__, __FUNCTION__,                 \
                         __LINE__, format, ##args )
#define debugOutputShort( level, format, args... )                      \
    m_debugModule.printShort( level, format, ##args )
#else
#define debugOutput( level, format, args... )
#define debugOutputShort( level, format, args... )
#endif

#define DECLARE_DEBUG_MODULE static DebugModule m_debugModule
#define IMPL_DEBUG_MODULE( ClassName, RegisterName, Level )             \
    DebugModule ClassName::m_debugModule( #RegisterName, Level )

#define DECLARE_GLOBAL_DEBUG_MODULE extern DebugModule m_debugModule
#define IMPL_GLOBAL_DEBUG_MODULE( RegisterName, Level )                 \
    DebugModule m_debugModule( #RegisterName, Level )

#define setDebugLevel( Level ) m_debugModule.setLevel( Level )
#define getDebugLevel() m_debugModule.getLevel()

#define flushDebugOutput() DebugModuleManager::instance()->flush()

/**
 * A named message source with its own verbosity. Every module registers
 * with the DebugModuleManager, which serializes the output on stderr.
 */
class DebugModule {
public:
    DebugModule( const std::string& name, debug_level_t level );
    ~DebugModule();

    void printShort( debug_level_t level, const char* format, ... ) const
        __attribute__((format(printf, 3, 4)));

    void print( debug_level_t level,
                const char* file,
                const char* function,
                unsigned int line,
                const char* format, ... ) const
        __attribute__((format(printf, 6, 7)));

    bool setLevel( debug_level_t level )
        { m_level = level; return true; }
    debug_level_t getLevel() const
        { return m_level; }
    const std::string& getName() const
        { return m_name; }

private:
    std::string   m_name;
    debug_level_t m_level;
};

class DebugModuleManager {
public:
    static DebugModuleManager* instance();

    void registerModule( DebugModule& module );
    void unregisterModule( DebugModule& module );

    bool setMgrDebugLevel( const std::string& name, debug_level_t level );
    // applies the level to every registered module
    void setMgrDebugLevel( debug_level_t level );

    void print( const char* msg );
    void flush();

private:
    DebugModuleManager();
    ~DebugModuleManager();

    typedef std::vector< DebugModule* > DebugModuleVector;
    typedef std::vector< DebugModule* >::iterator DebugModuleVectorIterator;

    pthread_mutex_t   m_print_lock;
    DebugModuleVector m_modules;
};

#endif
