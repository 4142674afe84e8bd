/**
 *   Copyright (C) 2016 Oslandia <infos@oslandia.com>
 *
 *   This library is free software; you can redistribute it and/or
 *   modify it under the terms of the GNU Library General Public
 *   License as published by the Free Software Foundation; either
 *   version 2 of the License, or (at your option) any later version.
 *
 *   This library is distributed in the hope that it will be useful,
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 *   Library General Public License for more details.
 *   You should have received a copy of the GNU Library General Public
 *   License along with this library; if not, see <http://www.gnu.org/licenses/>.
 */

#include <stdexcept>
#include <stdarg.h>
#include <stdio.h>

#include "xml_helper.hh"

using namespace std;

namespace XML {

int init()
{
    xmlSetGenericErrorFunc( NULL, ErrorHandling::accumulate_error );
    return 0;
}

std::string ErrorHandling::xml_error_;
bool ErrorHandling::clear_errors_ = false;
void ErrorHandling::accumulate_error( void* /*ctx*/, const char* msg, ... )
{
    if ( clear_errors_ ) {
        xml_error_.clear();
        clear_errors_ = false;
    }

#define TMP_BUF_SIZE 1024
    char buffer[TMP_BUF_SIZE];
    va_list arg_ptr;

    va_start( arg_ptr, msg );
    vsnprintf( buffer, TMP_BUF_SIZE, msg, arg_ptr );
    va_end( arg_ptr );

    xml_error_ += buffer;
#undef TMP_BUF_SIZE
}

scoped_xmlDoc read_file( const std::string& filename )
{
    init();
    scoped_xmlDoc doc = xmlReadFile( filename.c_str(), /* encoding */ NULL, XML_PARSE_NOBLANKS );

    if ( doc.get() == NULL ) {
        ErrorHandling::clear_errors_ = true;
        throw std::invalid_argument( "Cannot parse " + filename + ": " + ErrorHandling::xml_error_ );
    }
    return doc;
}

void save_file( xmlDoc* doc, const std::string& filename )
{
    if ( xmlSaveFormatFileEnc( filename.c_str(), doc, "UTF-8", /* format */ 1 ) < 0 ) {
        throw std::runtime_error( "Cannot write " + filename );
    }
}

xmlNode* new_node( const std::string& name )
{
    return xmlNewNode( NULL, ( const xmlChar* )name.c_str() );
}

bool has_prop( const xmlNode* node, const std::string& key )
{
    return xmlHasProp( const_cast<xmlNode*>( node ), ( const xmlChar* )( key.c_str() ) ) != NULL;
}

std::string get_prop( const xmlNode* node, const std::string& key )
{
    xmlChar* value = xmlGetProp( const_cast<xmlNode*>( node ), ( const xmlChar* )( key.c_str() ) );
    if ( value == NULL ) {
        return std::string();
    }
    std::string r( ( const char* )value );
    xmlFree( value );
    return r;
}

void set_prop( xmlNode* node, const std::string& key, const std::string& value )
{
    xmlSetProp( node, ( const xmlChar* )key.c_str(), ( const xmlChar* )value.c_str() );
}

void add_child( xmlNode* node, xmlNode* child )
{
    xmlAddChild( node, child );
}

bool is_element( const xmlNode* node, const std::string& name )
{
    return node->type == XML_ELEMENT_NODE && name == ( const char* )node->name;
}

std::vector<xmlNode*> child_elements( const xmlNode* node, const std::string& name )
{
    std::vector<xmlNode*> r;
    for ( xmlNode* child = node->children; child; child = child->next ) {
        if ( is_element( child, name ) ) {
            r.push_back( child );
        }
    }
    return r;
}

} // XML namespace
