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

#include "fake_repairer.hh"
#include "xml_helper.hh"

namespace Footfall {

void FakeRepairer::repair( const std::string& network_file, const std::string& trips_path, const std::string& routes_path )
{
    n_calls_++;
    network_file_ = network_file;

    scoped_xmlDoc trips = XML::read_file( trips_path );
    const xmlNode* trips_root = xmlDocGetRootElement( trips.get() );

    scoped_xmlDoc doc = xmlNewDoc( ( const xmlChar* )"1.0" );
    xmlNode* root = XML::new_node( "routes" );
    xmlDocSetRootElement( doc.get(), root );
    XML::add_child( root, xmlNewComment( ( const xmlChar* )"generated by a fake duarouter" ) );

    std::vector<xmlNode*> persons = XML::child_elements( trips_root, "person" );
    for ( auto it = persons.rbegin(); it != persons.rend(); ++it ) {
        xmlNode* person = xmlCopyNode( *it, 1 );
        XML::set_prop( person, "depart", "0.00" );
        XML::add_child( root, person );
        if ( it == persons.rbegin() ) {
            for ( const xmlNode* vtype : XML::child_elements( trips_root, "vType" ) ) {
                XML::add_child( root, xmlCopyNode( const_cast<xmlNode*>( vtype ), 1 ) );
            }
        }
    }

    xmlNode* route = XML::new_node( "route" );
    XML::new_prop( route, "id", "r0" );
    XML::new_prop( route, "edges", "f0 f1" );
    XML::add_child( root, route );

    if ( add_unknown_person_ ) {
        xmlNode* person = XML::new_node( "person" );
        XML::new_prop( person, "id", "pedghost" );
        XML::new_prop( person, "depart", "0.00" );
        XML::add_child( root, person );
    }

    XML::save_file( doc.get(), routes_path );
}

} // Footfall namespace
