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

#include "ElementRegistry.h"

#include "libutil/PosixMutex.h"

namespace Control {

IMPL_DEBUG_MODULE( ElementRegistry, ElementRegistry, DEBUG_LEVEL_NORMAL );

static const char*
elementTypeToString( enum eElementType t )
{
    switch ( t ) {
    case eET_Integer:    return "int";
    case eET_Boolean:    return "bool";
    case eET_Enumerated: return "enum";
    default:             return "unknown";
    }
}

ElementRegistry::ElementRegistry()
    : m_lock( new Util::PosixMutex( "ELREG", true ) )
{
}

ElementRegistry::~ElementRegistry()
{
    delete m_lock;
}

ElementInfoVector::iterator
ElementRegistry::findInfo( const std::string& name )
{
    for ( ElementInfoVector::iterator it = m_infos.begin(); it != m_infos.end(); ++it ) {
        if ( it->name == name ) {
            return it;
        }
    }
    return m_infos.end();
}

bool
ElementRegistry::addElements( const ElementInfo& info, ElementIdVector& ids )
{
    Util::MutexLockHelper lock( *m_lock );
    if ( findInfo( info.name ) != m_infos.end() ) {
        debugError( "Element %s already present\n", info.name.c_str() );
        return false;
    }
    if ( info.count == 0 || info.value_count == 0 ) {
        debugError( "Element %s without values\n", info.name.c_str() );
        return false;
    }

    m_infos.push_back( info );
    for ( unsigned int i = 0; i < info.count; ++i ) {
        ids.push_back( ElementId( info.name, i ) );
    }
    debugOutput( DEBUG_LEVEL_VERBOSE, "Added %u %s element(s) %s with %u value(s)\n",
                 info.count, elementTypeToString( info.type ), info.name.c_str(), info.value_count );
    return true;
}

bool
ElementRegistry::addIntElements( const std::string& name, unsigned int count,
                                 int32_t minimum, int32_t maximum, int32_t step,
                                 unsigned int value_count, bool writable, ElementIdVector& ids )
{
    if ( minimum > maximum || step <= 0 ) {
        debugError( "Invalid range %d..%d/%d for %s\n", minimum, maximum, step, name.c_str() );
        return false;
    }
    ElementInfo info;
    info.name = name;
    info.type = eET_Integer;
    info.count = count;
    info.value_count = value_count;
    info.minimum = minimum;
    info.maximum = maximum;
    info.step = step;
    info.writable = writable;
    return addElements( info, ids );
}

bool
ElementRegistry::addBoolElements( const std::string& name, unsigned int count,
                                  unsigned int value_count, bool writable, ElementIdVector& ids )
{
    ElementInfo info;
    info.name = name;
    info.type = eET_Boolean;
    info.count = count;
    info.value_count = value_count;
    info.minimum = 0;
    info.maximum = 1;
    info.writable = writable;
    return addElements( info, ids );
}

bool
ElementRegistry::addEnumElements( const std::string& name, unsigned int count,
                                  unsigned int value_count, const stringlist& labels,
                                  bool writable, ElementIdVector& ids )
{
    if ( labels.empty() ) {
        debugError( "Enumeration %s without labels\n", name.c_str() );
        return false;
    }
    ElementInfo info;
    info.name = name;
    info.type = eET_Enumerated;
    info.count = count;
    info.value_count = value_count;
    info.minimum = 0;
    info.maximum = labels.size() - 1;
    info.labels = labels;
    info.writable = writable;
    return addElements( info, ids );
}

bool
ElementRegistry::removeElements( const std::string& name )
{
    Util::MutexLockHelper lock( *m_lock );
    ElementInfoVector::iterator it = findInfo( name );
    if ( it == m_infos.end() ) {
        return false;
    }
    m_infos.erase( it );
    return true;
}

void
ElementRegistry::clearElements()
{
    Util::MutexLockHelper lock( *m_lock );
    m_infos.clear();
}

bool
ElementRegistry::hasElement( const ElementId& id )
{
    Util::MutexLockHelper lock( *m_lock );
    ElementInfoVector::iterator it = findInfo( id.name );
    return it != m_infos.end() && id.index < it->count;
}

bool
ElementRegistry::getInfo( const std::string& name, ElementInfo& info )
{
    Util::MutexLockHelper lock( *m_lock );
    ElementInfoVector::iterator it = findInfo( name );
    if ( it == m_infos.end() ) {
        return false;
    }
    info = *it;
    return true;
}

ElementIdVector
ElementRegistry::getElementIds()
{
    Util::MutexLockHelper lock( *m_lock );
    ElementIdVector ids;
    for ( ElementInfoVector::const_iterator it = m_infos.begin(); it != m_infos.end(); ++it ) {
        for ( unsigned int i = 0; i < it->count; ++i ) {
            ids.push_back( ElementId( it->name, i ) );
        }
    }
    return ids;
}

unsigned int
ElementRegistry::countElements()
{
    Util::MutexLockHelper lock( *m_lock );
    return m_infos.size();
}

bool
ElementRegistry::validate( const ElementId& id, const ElementValue& value )
{
    ElementInfo info;
    if ( !getInfo( id.name, info ) || id.index >= info.count ) {
        debugError( "No element %s:%u\n", id.name.c_str(), id.index );
        return false;
    }
    if ( value.size() != info.value_count ) {
        debugError( "Element %s takes %u value(s), got %zd\n",
                    id.name.c_str(), info.value_count, value.size() );
        return false;
    }
    for ( unsigned int i = 0; i < value.size(); ++i ) {
        if ( value[i] < info.minimum || value[i] > info.maximum ) {
            debugError( "Value %d of %s:%u out of range %d..%d\n",
                        value[i], id.name.c_str(), id.index, info.minimum, info.maximum );
            return false;
        }
    }
    return true;
}

void
ElementRegistry::show()
{
    Util::MutexLockHelper lock( *m_lock );
    printMessage( "Control elements (%zd):\n", m_infos.size() );
    for ( ElementInfoVector::iterator it = m_infos.begin(); it != m_infos.end(); ++it ) {
        printMessage( "  %-40s %-4s x%u, %u value(s), %d..%d%s\n",
                      it->name.c_str(), elementTypeToString( it->type ),
                      it->count, it->value_count, it->minimum, it->maximum,
                      it->writable ? "" : ", read-only" );
        for ( unsigned int i = 0; i < it->labels.size(); ++i ) {
            printMessage( "      %2u: %s\n", i, it->labels[i].c_str() );
        }
    }
}

void
ElementRegistry::setVerboseLevel( int l )
{
    setDebugLevel( l );
    m_lock->setVerboseLevel( l );
}

} // namespace Control
