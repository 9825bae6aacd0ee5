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

#ifndef TCAT_UTIL_SERIALIZE_H
#define TCAT_UTIL_SERIALIZE_H

#include "debugmodule/debugmodule.h"
#include "tcattypes.h"

#include <libxml++/libxml++.h>

#include <string>
#include <vector>

#define TCAT_STATE_VERSION "1"

namespace Util {

    class IOSerialize {
    public:
        IOSerialize() {}
        virtual ~IOSerialize() {}

        virtual bool write( std::string strMemberName,
                            long long value ) = 0;
        virtual bool write( std::string strMemberName,
                            std::string str) = 0;

        template <typename T>  bool write( std::string strMemberName, T value );
    };

    class IODeserialize {
    public:
        IODeserialize() {}
        virtual ~IODeserialize() {}

        virtual bool read( std::string strMemberName,
                           long long& value ) = 0;
        virtual bool read( std::string strMemberName,
                           std::string& str ) = 0;

        template <typename T> bool read( std::string strMemberName, T& value );

        virtual bool isExisting( std::string strMemberName ) = 0;
    };

    /**
     * Collects members into an XML document. Member names are
     * slash separated paths below the document root, e.g.
     * "Router/Low/Entry0/Source". Nothing reaches the disk
     * before writeFile() is called.
     */
    class XMLSerialize: public IOSerialize {
    public:
        XMLSerialize( std::string fileName );
        XMLSerialize( std::string fileName, int verboseLevel );
        virtual ~XMLSerialize();

        virtual bool write( std::string strMemberName,
                            long long value );
        virtual bool write( std::string strMemberName,
                            std::string str);

        bool writeFile();
    private:
        void init();
        bool writeVersion();

        std::string      m_filepath;
        xmlpp::Document  m_doc;
        bool             m_valid;

        DECLARE_DEBUG_MODULE;

        xmlpp::Node* getNodePath( xmlpp::Node* pRootNode,
                                  const stringlist& tokens );
    };

    class XMLDeserialize: public IODeserialize {
    public:
        XMLDeserialize( std::string fileName );
        XMLDeserialize( std::string fileName, int verboseLevel );
        virtual ~XMLDeserialize();

        virtual bool read( std::string strMemberName,
                           long long& value );
        virtual bool read( std::string strMemberName,
                           std::string& str );

        virtual bool isExisting( std::string strMemberName );
        bool isValid();
        bool checkVersion();
    private:
        void init();
        const xmlpp::Element* findElement( std::string strMemberName );

        std::string      m_filepath;
        xmlpp::DomParser m_parser;
        bool             m_parsed;

        DECLARE_DEBUG_MODULE;
    };


//////////////////////////////////////////

    template <typename T> bool IOSerialize::write( std::string strMemberName,
                                                   T value )
    {
        return write( strMemberName, static_cast<long long>( value ) );
    }

    template <typename T> bool IODeserialize::read( std::string strMemberName,
                                                    T& value )
    {
        long long tmp;
        bool result = read( strMemberName, tmp );
        if ( result ) {
            value = static_cast<T>( tmp );
        }
        return result;
    }
}

#endif
