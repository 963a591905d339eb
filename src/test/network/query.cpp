/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "network/network.hpp"
#include "error/network.hpp"
#include "test/util.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace hnet;
using namespace hnet::test;

namespace {

auto natural( NodeRecord rec )
    -> NodeRecord
{
    rec.flags.natural_flow = true;

    return rec;
}

// END <- G1 <- CF, with CF fed by a tributary (T1 <- T2) and the main stem (D1 <- G2 <- R1).
auto make_basin()
    -> Network
{
    auto nw = Network{};
    auto t1 = natural( record( "T1", NodeType::streamflow, "CF", { "T2" } ) );
    auto g2 = natural( record( "G2", NodeType::streamflow, "D1", { "R1" } ) );

    t1.description = "Trib gage";
    g2.link = 42;

    auto const recs = NodeRecords{ record( "END", NodeType::end, "", { "G1" } )
                                 , natural( record( "G1", NodeType::streamflow, "END", { "CF" } ) )
                                 , record( "CF", NodeType::xconfluence, "G1", { "T1", "D1" } )
                                 , t1
                                 , record( "T2", NodeType::diversion, "T1", {} )
                                 , record( "D1", NodeType::diversion, "CF", { "G2" } )
                                 , g2
                                 , record( "R1", NodeType::reservoir, "G2", {} ) };

    HTRYE( nw.rebuild( recs, RebuildOrder::head_first ) );

    return nw;
}

} // namespace anon

SCENARIO( "collection queries follow computational order", "[network][query]" )
{
    GIVEN( "a basin with a tributary" )
    {
        auto const nw = make_basin();

        require_consistent( nw );

        THEN( "the walk climbs the main stem first" )
        {
            REQUIRE( walk_ids( nw ) == StringVec{ "R1", "G2", "D1", "T2", "T1", "CF", "G1", "END" } );
        }
        THEN( "real nodes exclude the confluence and end node" )
        {
            REQUIRE( ids( nw, REQUIRE_TRY( nw.fetch_real_nodes() ) ) == StringVec{ "R1", "G2", "D1", "T2", "T1", "G1" } );
        }
        THEN( "nodes of a type are collected" )
        {
            REQUIRE( ids( nw, REQUIRE_TRY( nw.fetch_nodes_for_type( NodeType::streamflow ) ) ) == StringVec{ "G2", "T1", "G1" } );
            REQUIRE( REQUIRE_TRY( nw.count_nodes( NodeType::diversion ) ) == 2 );
            REQUIRE( REQUIRE_TRY( nw.count_nodes( NodeType::well ) ) == 0 );
        }
        THEN( "natural flow nodes are collected" )
        {
            REQUIRE( ids( nw, REQUIRE_TRY( nw.fetch_natural_flow_nodes() ) ) == StringVec{ "G2", "T1", "G1" } );
        }
    }
}

SCENARIO( "find_node matches by id or attribute", "[network][query]" )
{
    GIVEN( "a basin with a tributary" )
    {
        auto const nw = make_basin();

        THEN( "ids match case-insensitively" )
        {
            auto const g2 = REQUIRE_TRY( nw.find_node( "g2" ) );

            REQUIRE( nw.node( g2 ).id == "G2" );
        }
        THEN( "an unknown id is not found" )
        {
            auto const res = nw.find_node( "nope" );

            REQUIRE( fail_with( res, error_code::network::node_not_found ) );
        }
        THEN( "a link number matches" )
        {
            auto const g2 = REQUIRE_TRY( nw.find_node( NodeData::link, NodeType::streamflow, "42" ) );

            REQUIRE( nw.node( g2 ).id == "G2" );
        }
        THEN( "a link number must be numeric" )
        {
            REQUIRE( fail_with( nw.find_node( NodeData::link, NodeType::streamflow, "abc" ), error_code::common::invalid_numeric ) );
        }
        THEN( "a description matches" )
        {
            auto const t1 = REQUIRE_TRY( nw.find_node( NodeData::description, NodeType::streamflow, "Trib gage" ) );

            REQUIRE( nw.node( t1 ).id == "T1" );
        }
        THEN( "the type must match too" )
        {
            REQUIRE( fail_with( nw.find_node( NodeData::id, NodeType::reservoir, "G2" ), error_code::network::node_not_found ) );
        }
    }
}

SCENARIO( "flow node searches", "[network][query]" )
{
    GIVEN( "a basin with a tributary" )
    {
        auto nw = make_basin();
        auto const at = [ & ]( std::string const& id ){ return REQUIRE_TRY( nw.find_node( id ) ); };
        auto const id_of = [ & ]( Optional< NodeIndex > const& ni ){ return ni ? nw.node( ni.value() ).id : std::string{}; };

        THEN( "the nearest upstream flow node on each branch" )
        {
            REQUIRE( ids( nw, REQUIRE_TRY( nw.find_upstream_flow_nodes( at( "END" ) ) ) ) == StringVec{ "G1" } );
            REQUIRE( ids( nw, REQUIRE_TRY( nw.find_upstream_flow_nodes( at( "G1" ) ) ) ) == StringVec{ "G2", "T1" } );
            REQUIRE( REQUIRE_TRY( nw.find_upstream_flow_nodes( at( "R1" ) ) ).empty() );
        }
        THEN( "an extra predicate widens the search" )
        {
            auto const diversions = []( Node const& n ){ return n.type == NodeType::diversion; };

            REQUIRE( ids( nw, REQUIRE_TRY( nw.find_upstream_flow_nodes( at( "G1" ), diversions ) ) ) == StringVec{ "D1", "T1" } );
        }
        THEN( "the nearest downstream flow node" )
        {
            REQUIRE( id_of( REQUIRE_TRY( nw.find_downstream_flow_node( at( "T2" ) ) ) ) == "T1" );
            REQUIRE( id_of( REQUIRE_TRY( nw.find_downstream_flow_node( at( "R1" ) ) ) ) == "G2" );
            REQUIRE( id_of( REQUIRE_TRY( nw.find_downstream_flow_node( at( "G1" ) ) ) ) == "" );
        }
        THEN( "downstream natural flow stays within the reach" )
        {
            REQUIRE( id_of( REQUIRE_TRY( nw.find_downstream_natural_flow_node_in_reach( at( "R1" ) ) ) ) == "G2" );
            REQUIRE( id_of( REQUIRE_TRY( nw.find_downstream_natural_flow_node_in_reach( at( "T1" ) ) ) ) == "" );
        }
        THEN( "upstream natural flow stays within the reach" )
        {
            REQUIRE( id_of( REQUIRE_TRY( nw.find_upstream_natural_flow_node_in_reach( at( "CF" ) ) ) ) == "G2" );
            REQUIRE( id_of( REQUIRE_TRY( nw.find_upstream_natural_flow_node_in_reach( at( "T1" ) ) ) ) == "" );
        }

        WHEN( "D1 is a dry river" )
        {
            REQUIRE_RES( nw.update_flags( at( "D1" ), NodeFlags{ .dry_river = true } ) );

            THEN( "it is not natural flow by default" )
            {
                REQUIRE( !nw.is_natural_flow_like( at( "D1" ) ) );
                REQUIRE( id_of( REQUIRE_TRY( nw.find_upstream_natural_flow_node_in_reach( at( "CF" ) ) ) ) == "G2" );
            }

            AND_WHEN( "dry rivers are treated as natural flow" )
            {
                nw.set_treat_dry_as_natural_flow( true );

                THEN( "it is found first" )
                {
                    REQUIRE( nw.is_natural_flow_like( at( "D1" ) ) );
                    REQUIRE( id_of( REQUIRE_TRY( nw.find_upstream_natural_flow_node_in_reach( at( "CF" ) ) ) ) == "D1" );
                }
            }
        }
    }
}

SCENARIO( "upstream node collection", "[network][query]" )
{
    GIVEN( "a basin with a tributary" )
    {
        auto const nw = make_basin();
        auto const cf = REQUIRE_TRY( nw.find_node( "CF" ) );

        THEN( "each branch is listed in turn" )
        {
            REQUIRE( ids( nw, REQUIRE_TRY( nw.find_upstream_nodes( cf, false ) ) ) == StringVec{ "T1", "T2", "D1", "G2", "R1" } );
        }
        THEN( "the start node can be included" )
        {
            REQUIRE( ids( nw, REQUIRE_TRY( nw.find_upstream_nodes( cf, true ) ) ) == StringVec{ "CF", "T1", "T2", "D1", "G2", "R1" } );
        }
        THEN( "a stop id ends its branch" )
        {
            REQUIRE( ids( nw, REQUIRE_TRY( nw.find_upstream_nodes( cf, false, { "g2" } ) ) ) == StringVec{ "T1", "T2", "D1", "G2" } );
        }
        THEN( "a '-' stop id ends its branch without itself" )
        {
            REQUIRE( ids( nw, REQUIRE_TRY( nw.find_upstream_nodes( cf, false, { "-G2" } ) ) ) == StringVec{ "T1", "T2", "D1" } );
        }
        THEN( "a headwater has nothing upstream" )
        {
            REQUIRE( REQUIRE_TRY( nw.find_upstream_nodes( REQUIRE_TRY( nw.find_node( "R1" ) ), false ) ).empty() );
        }
    }
}

SCENARIO( "downstream navigation", "[network][query]" )
{
    GIVEN( "a basin with a tributary" )
    {
        auto const nw = make_basin();
        auto const at = [ & ]( std::string const& id ){ return REQUIRE_TRY( nw.find_node( id ) ); };
        auto const id_of = [ & ]( Optional< NodeIndex > const& ni ){ return ni ? nw.node( ni.value() ).id : std::string{}; };

        THEN( "the path between two nodes passes through their meeting point" )
        {
            REQUIRE( ids( nw, REQUIRE_TRY( nw.node_sequence( at( "T2" ), at( "R1" ) ) ) ) == StringVec{ "T2", "T1", "CF", "D1", "G2", "R1" } );
            REQUIRE( ids( nw, REQUIRE_TRY( nw.node_sequence( at( "R1" ), at( "G1" ) ) ) ) == StringVec{ "R1", "G2", "D1", "CF", "G1" } );
            REQUIRE( ids( nw, REQUIRE_TRY( nw.node_sequence( at( "G1" ), at( "G1" ) ) ) ) == StringVec{ "G1" } );
        }
        THEN( "decorative nodes are skipped" )
        {
            REQUIRE( id_of( REQUIRE_TRY( nw.find_next_real_downstream_node( at( "T1" ) ) ) ) == "G1" );
            REQUIRE( id_of( REQUIRE_TRY( nw.find_next_real_or_xconfluence_downstream_node( at( "T1" ) ) ) ) == "CF" );
        }
        THEN( "the next confluence" )
        {
            REQUIRE( id_of( REQUIRE_TRY( nw.find_next_xconfluence_downstream_node( at( "T1" ) ) ) ) == "CF" );
            REQUIRE( id_of( REQUIRE_TRY( nw.find_next_xconfluence_downstream_node( at( "CF" ) ) ) ) == "" );
        }
        THEN( "most upstream real node in a reach" )
        {
            REQUIRE( !REQUIRE_TRY( nw.is_most_upstream_node_in_reach( at( "G2" ) ) ) );
            REQUIRE( REQUIRE_TRY( nw.is_most_upstream_node_in_reach( at( "R1" ) ) ) );
            REQUIRE( !REQUIRE_TRY( nw.is_most_upstream_node_in_reach( at( "T1" ) ) ) );
            REQUIRE( REQUIRE_TRY( nw.is_most_upstream_node_in_reach( at( "T2" ) ) ) );
        }
        THEN( "an invalid index fails" )
        {
            REQUIRE( fail_with( nw.find_next_real_downstream_node( NodeIndex{ 99 } ), error_code::network::invalid_node ) );
        }
    }
}
