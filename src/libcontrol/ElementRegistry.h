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

#ifndef CONTROL_ELEMENTREGISTRY_H
#define CONTROL_ELEMENTREGISTRY_H

#include "debugmodule/debugmodule.h"

#include "tcattypes.h"

#include "libutil/Mutex.h"

#include <vector>
#include <string>

namespace Control {

enum eElementType {
    eET_Integer,
    eET_Boolean,
    eET_Enumerated,
};

/**
 * @brief Identifies one element; elements added together share the name
 */
struct ElementId {
    ElementId()
        : index( 0 ) {};
    ElementId( const std::string& n, unsigned int i = 0 )
        : name( n ), index( i ) {};

    bool operator==( const ElementId& other ) const
        { return name == other.name && index == other.index; };
    bool operator<( const ElementId& other ) const
        { return name < other.name || ( name == other.name && index < other.index ); };

    std::string name;
    unsigned int index;
};

typedef std::vector<ElementId> ElementIdVector;
// integers, booleans as 0/1, enumerations as label index
typedef std::vector<int32_t> ElementValue;

struct ElementInfo {
    ElementInfo()
        : type( eET_Integer ), count( 0 ), value_count( 0 )
        , minimum( 0 ), maximum( 0 ), step( 1 ), writable( false ) {};

    std::string name;
    enum eElementType type;
    // elements sharing the name
    unsigned int count;
    // values per element
    unsigned int value_count;
    int32_t minimum;
    int32_t maximum;
    int32_t step;
    stringlist labels;
    bool writable;
};

typedef std::vector<ElementInfo> ElementInfoVector;

/**
 * @brief Typed control elements exposed by a device
 *
 * Only the description of the elements is kept here; their values are
 * produced and consumed by the controller that added them.
 */
class ElementRegistry
{
public:
    ElementRegistry();
    virtual ~ElementRegistry();

    /**
      @{
      @brief add count elements named name
      @param ids receives the ids of the new elements
      @return false if the name is taken or the description is invalid
      */
    bool addIntElements( const std::string& name, unsigned int count,
                         int32_t minimum, int32_t maximum, int32_t step,
                         unsigned int value_count, bool writable, ElementIdVector& ids );
    bool addBoolElements( const std::string& name, unsigned int count,
                          unsigned int value_count, bool writable, ElementIdVector& ids );
    bool addEnumElements( const std::string& name, unsigned int count,
                          unsigned int value_count, const stringlist& labels,
                          bool writable, ElementIdVector& ids );
    //@}

    bool removeElements( const std::string& name );
    void clearElements();

    bool hasElement( const ElementId& id );
    bool getInfo( const std::string& name, ElementInfo& info );
    ElementIdVector getElementIds();
    unsigned int countElements();

    /// check the value against the description of the element
    bool validate( const ElementId& id, const ElementValue& value );

    virtual void show();
    virtual void setVerboseLevel( int l );

private:
    bool addElements( const ElementInfo& info, ElementIdVector& ids );
    ElementInfoVector::iterator findInfo( const std::string& name );

    Util::Mutex* m_lock;
    ElementInfoVector m_infos;

protected:
    DECLARE_DEBUG_MODULE;
};

} // namespace Control

#endif // CONTROL_ELEMENTREGISTRY_H
