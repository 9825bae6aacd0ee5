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

#include "serialize.h"

#include <stdio.h>
#include <stdlib.h>

using namespace std;


IMPL_DEBUG_MODULE( Util::XMLSerialize,   XMLSerialize,   DEBUG_LEVEL_NORMAL );
IMPL_DEBUG_MODULE( Util::XMLDeserialize, XMLDeserialize, DEBUG_LEVEL_NORMAL );

Util::XMLSerialize::XMLSerialize( std::string fileName )
    : IOSerialize()
    , m_filepath( fileName )
    , m_valid( false )
{
    init();
}

Util::XMLSerialize::XMLSerialize( std::string fileName, int verboseLevel )
    : IOSerialize()
    , m_filepath( fileName )
    , m_valid( false )
{
    setDebugLevel(verboseLevel);
    init();
}

void
Util::XMLSerialize::init()
{
    try {
        m_doc.create_root_node( "tcat_state" );
        m_valid = writeVersion();
    } catch ( const xmlpp::exception& ex ) {
        debugError( "Could not create document: %s\n", ex.what() );
        m_valid = false;
    }
}

Util::XMLSerialize::~XMLSerialize()
{
}

bool
Util::XMLSerialize::writeFile()
{
    if ( !m_valid ) {
        debugError( "document for %s is not valid\n", m_filepath.c_str() );
        return false;
    }
    try {
        m_doc.write_to_file_formatted( m_filepath );
    } catch ( const xmlpp::exception& ex ) {
        debugError( "Could not write %s: %s\n", m_filepath.c_str(), ex.what() );
        return false;
    }
    return true;
}

bool
Util::XMLSerialize::writeVersion()
{
    return write( "StateVersion", std::string( TCAT_STATE_VERSION ) );
}

bool
Util::XMLSerialize::write( std::string strMemberName,
                           long long value )

{
    debugOutput( DEBUG_LEVEL_VERY_VERBOSE, "write %s = %lld\n",
                 strMemberName.c_str(), value );

    char valstr[32];
    snprintf( valstr, sizeof(valstr), "%lld", value );
    return write( strMemberName, std::string( valstr ) );
}

bool
Util::XMLSerialize::write( std::string strMemberName,
                           std::string str)
{
    debugOutput( DEBUG_LEVEL_VERY_VERBOSE, "write %s = %s\n",
                 strMemberName.c_str(), str.c_str() );

    stringlist tokens = stringlist::splitString( strMemberName, "/" );
    if ( tokens.empty() ) {
        debugWarning( "empty member name\n" );
        return false;
    }

    try {
        xmlpp::Node* pNode = m_doc.get_root_node();
        pNode = getNodePath( pNode, tokens );

        // element to be added
        xmlpp::Element* pElem = pNode->add_child( tokens[tokens.size() - 1] );
        pElem->set_child_text( str );
    } catch ( const xmlpp::exception& ex ) {
        debugError( "Could not add %s: %s\n", strMemberName.c_str(), ex.what() );
        m_valid = false;
        return false;
    }
    return true;
}

xmlpp::Node*
Util::XMLSerialize::getNodePath( xmlpp::Node* pRootNode,
                                 const stringlist& tokens )
{
    // returns the node on which the new element has to be added.
    // missing path components are created.

    if ( tokens.size() == 1 ) {
        return pRootNode;
    }

    unsigned int iTokenIdx = 0;
    xmlpp::Node* pCurNode = pRootNode;
    for (bool bFound = false;
         ( iTokenIdx < tokens.size() - 1 );
         bFound = false, iTokenIdx++ )
    {
        xmlpp::Node::NodeList nodeList = pCurNode->get_children();
        for ( xmlpp::Node::NodeList::iterator it = nodeList.begin();
              it != nodeList.end();
              ++it )
        {
            if ( ( *it )->get_name() == tokens[iTokenIdx] ) {
                pCurNode = *it;
                bFound = true;
                break;
            }
        }
        if ( !bFound ) {
            break;
        }
    }

    for ( unsigned int i = iTokenIdx; i < tokens.size() - 1; i++, iTokenIdx++ ) {
        pCurNode = pCurNode->add_child( tokens[iTokenIdx] );
    }
    return pCurNode;
}

/***********************************/

Util::XMLDeserialize::XMLDeserialize( std::string fileName )
    : IODeserialize()
    , m_filepath( fileName )
    , m_parsed( false )
{
    init();
}

Util::XMLDeserialize::XMLDeserialize( std::string fileName, int verboseLevel )
    : IODeserialize()
    , m_filepath( fileName )
    , m_parsed( false )
{
    setDebugLevel(verboseLevel);
    init();
}

void
Util::XMLDeserialize::init()
{
    try {
        // text content is resolved/unescaped automatically
        m_parser.set_substitute_entities();
        m_parser.parse_file( m_filepath );
        m_parsed = true;
    } catch ( const xmlpp::exception& ex ) {
        debugError( "Could not parse %s: %s\n", m_filepath.c_str(), ex.what() );
        m_parsed = false;
    }
}

Util::XMLDeserialize::~XMLDeserialize()
{
}

bool
Util::XMLDeserialize::isValid()
{
    return m_parsed && checkVersion();
}

bool
Util::XMLDeserialize::checkVersion()
{
    std::string savedVersion;
    if (read( "StateVersion", savedVersion )) {
        std::string expectedVersion = TCAT_STATE_VERSION;
        debugOutput( DEBUG_LEVEL_VERBOSE, "State version: %s, expected: %s.\n",
                     savedVersion.c_str(), expectedVersion.c_str() );
        return expectedVersion == savedVersion;
    } else return false;
}

const xmlpp::Element*
Util::XMLDeserialize::findElement( std::string strMemberName )
{
    if ( !m_parsed ) {
        return NULL;
    }
    xmlpp::Document *pDoc=m_parser.get_document();
    if(!pDoc) {
        debugWarning( "no document found\n" );
        return NULL;
    }
    xmlpp::Node* pNode = pDoc->get_root_node();
    if(!pNode) {
        return NULL;
    }

    xmlpp::NodeSet nodeSet;
    try {
        nodeSet = pNode->find( strMemberName );
    } catch ( const xmlpp::exception& ex ) {
        debugWarning( "bad member name %s: %s\n", strMemberName.c_str(), ex.what() );
        return NULL;
    }
    for ( xmlpp::NodeSet::iterator it = nodeSet.begin();
          it != nodeSet.end();
          ++it )
    {
        const xmlpp::Element* pElement =
            dynamic_cast< const xmlpp::Element* >( *it );
        if ( pElement ) {
            return pElement;
        }
    }
    return NULL;
}

bool
Util::XMLDeserialize::read( std::string strMemberName,
                            long long& value )

{
    debugOutput( DEBUG_LEVEL_VERY_VERBOSE, "lookup %s\n", strMemberName.c_str() );

    const xmlpp::Element* pElement = findElement( strMemberName );
    if ( pElement && pElement->has_child_text() ) {
        char* tail;
        std::string content = pElement->get_child_text()->get_content();
        value = strtoll( content.c_str(), &tail, 0 );
        if ( tail == content.c_str() ) {
            debugWarning( "node %s is not a number\n", strMemberName.c_str() );
            return false;
        }
        debugOutput( DEBUG_LEVEL_VERY_VERBOSE, "found %s = %lld\n",
                     strMemberName.c_str(), value );
        return true;
    }

    debugOutput( DEBUG_LEVEL_VERBOSE, "no such a node %s\n", strMemberName.c_str() );
    return false;
}

bool
Util::XMLDeserialize::read( std::string strMemberName,
                            std::string& str )
{
    debugOutput( DEBUG_LEVEL_VERY_VERBOSE, "lookup %s\n", strMemberName.c_str() );

    const xmlpp::Element* pElement = findElement( strMemberName );
    if ( pElement ) {
        if ( pElement->has_child_text() ) {
            str = pElement->get_child_text()->get_content();
        } else {
            str = "";
        }
        debugOutput( DEBUG_LEVEL_VERY_VERBOSE, "found %s = %s\n",
                     strMemberName.c_str(), str.c_str() );
        return true;
    }

    debugOutput( DEBUG_LEVEL_VERBOSE, "no such a node %s\n", strMemberName.c_str() );
    return false;
}

bool
Util::XMLDeserialize::isExisting( std::string strMemberName )
{
    return findElement( strMemberName ) != NULL;
}
