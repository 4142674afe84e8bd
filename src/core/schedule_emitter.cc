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

#include <map>
#include <algorithm>
#include <boost/format.hpp>

#include "schedule_emitter.hh"
#include "xml_helper.hh"
#include "process.hh"
#include "errors.hh"

namespace Footfall {

const char* PEDESTRIAN_TYPE_ID = "ped_pedestrian";

void DuarouterRepairer::repair( const std::string& network_file, const std::string& trips_path, const std::string& routes_path )
{
    std::vector<std::string> args;
    args.push_back( "duarouter" );
    args.push_back( "-W" );
    args.push_back( "-n" );
    args.push_back( network_file );
    args.push_back( "--repair" );
    args.push_back( "-r" );
    args.push_back( trips_path );
    args.push_back( "-o" );
    args.push_back( routes_path );
    run_process_checked( args );
}

ScheduleEmitter::ScheduleEmitter( const std::string& network_file, RouteRepairer& repairer ) :
    network_file_( network_file ),
    repairer_( repairer )
{
}

void ScheduleEmitter::store_trips( const TripSchedule& trips, const std::string& path ) const
{
    scoped_xmlDoc doc = xmlNewDoc( ( const xmlChar* )"1.0" );
    xmlNode* root = XML::new_node( "routes" );
    xmlDocSetRootElement( doc.get(), root );
    xmlNs* xsi = xmlNewNs( root, ( const xmlChar* )"http://www.w3.org/2001/XMLSchema-instance", ( const xmlChar* )"xsi" );
    xmlNewNsProp( root, xsi, ( const xmlChar* )"noNamespaceSchemaLocation", ( const xmlChar* )"http://sumo.dlr.de/xsd/routes_file.xsd" );

    xmlNode* vtype = XML::new_node( "vType" );
    XML::new_prop( vtype, "id", PEDESTRIAN_TYPE_ID );
    XML::new_prop( vtype, "vClass", "pedestrian" );
    XML::add_child( root, vtype );

    for ( const Trip& trip : trips ) {
        xmlNode* person = XML::new_node( "person" );
        XML::new_prop( person, "id", "ped" + trip.trip_id() );
        XML::new_prop( person, "depart", trip.start_time() );
        XML::new_prop( person, "type", PEDESTRIAN_TYPE_ID );

        const std::vector<Leg>& legs = trip.legs();
        for ( size_t k = 0; k < legs.size(); k++ ) {
            xmlNode* walk = XML::new_node( "walk" );
            XML::new_prop( walk, "from", legs[k].from );
            XML::new_prop( walk, "to", legs[k].to );
            XML::add_child( person, walk );

            if ( k + 1 < legs.size() ) {
                xmlNode* stop = XML::new_node( "stop" );
                XML::new_prop( stop, "lane", legs[k].to + "_0" );
                XML::new_prop( stop, "duration", ( boost::format( "%.3f" ) % double( trip.wait_times()[k] ) ).str() );
                XML::add_child( person, stop );
            }
        }
        XML::add_child( root, person );
    }

    XML::save_file( doc.get(), path );
    COUT << "Wrote " << trips.size() << " trips to " << path << std::endl;
}

void ScheduleEmitter::store_routes( const std::string& trips_path, const std::string& routes_path ) const
{
    repairer_.repair( network_file_, trips_path, routes_path );
    reconcile_departures( trips_path, routes_path );
}

namespace {

struct DepartingPerson {
    double depart;
    xmlNode* node;
};

bool depart_before( const DepartingPerson& a, const DepartingPerson& b )
{
    return a.depart < b.depart;
}

}

void reconcile_departures( const std::string& trips_path, const std::string& routes_path )
{
    // intended departures
    std::map<std::string, double> departures;
    {
        scoped_xmlDoc trips_doc = XML::read_file( trips_path );
        const xmlNode* root = xmlDocGetRootElement( trips_doc.get() );
        if ( root == NULL ) {
            throw ExternalOracleFailure( trips_path + " has no root element" );
        }
        for ( const xmlNode* person : XML::child_elements( root, "person" ) ) {
            departures[XML::get_prop( person, "id" )] = lexical_cast<double>( XML::get_prop( person, "depart" ) );
        }
    }

    scoped_xmlDoc doc;
    try {
        doc = XML::read_file( routes_path );
    }
    catch ( std::invalid_argument& e ) {
        throw ExternalOracleFailure( e.what() );
    }
    xmlNode* root = xmlDocGetRootElement( doc.get() );
    if ( root == NULL ) {
        throw ExternalOracleFailure( routes_path + " has no root element" );
    }

    std::vector<xmlNode*> vtypes;
    std::vector<DepartingPerson> persons;
    std::vector<xmlNode*> others;
    for ( xmlNode* child = root->children; child; child = child->next ) {
        if ( XML::is_element( child, "vType" ) ) {
            vtypes.push_back( child );
        }
        else if ( XML::is_element( child, "person" ) ) {
            const std::string id = XML::get_prop( child, "id" );
            auto it = departures.find( id );
            if ( it == departures.end() ) {
                throw ExternalOracleFailure( ( boost::format( "Person %1% of %2% is not in %3%" ) % id % routes_path % trips_path ).str() );
            }
            DepartingPerson p;
            p.depart = it->second;
            p.node = child;
            persons.push_back( p );
        }
        else {
            others.push_back( child );
        }
    }

    std::stable_sort( persons.begin(), persons.end(), depart_before );

    for ( xmlNode* node : others ) {
        xmlUnlinkNode( node );
        xmlFreeNode( node );
    }
    for ( xmlNode* node : vtypes ) {
        xmlUnlinkNode( node );
    }
    for ( const DepartingPerson& p : persons ) {
        xmlUnlinkNode( p.node );
    }

    for ( xmlNode* node : vtypes ) {
        XML::add_child( root, node );
    }
    for ( const DepartingPerson& p : persons ) {
        XML::set_prop( p.node, "depart", ( boost::format( "%.2f" ) % p.depart ).str() );
        XML::add_child( root, p.node );
    }

    XML::save_file( doc.get(), routes_path );
    COUT << "Restored departures of " << persons.size() << " persons in " << routes_path << std::endl;
}

} // Footfall namespace
