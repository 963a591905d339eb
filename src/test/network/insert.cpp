/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "network/network.hpp"
#include "error/network.hpp"
#include "error/result.hpp"
#include "error/structure.hpp"
#include "test/util.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace hnet;
using namespace hnet::test;

SCENARIO( "insert_node assigns ordering along a single reach", "[network][insert]" )
{
    auto nw = make_network();

    GIVEN( "only the end node" )
    {
        REQUIRE( nw.size() == 1 );
        REQUIRE( lookup( nw, "END" ).serial == 1 );

        WHEN( "A is inserted downstream-anchored to END, then B to A" )
        {
            REQUIRE_TRY( nw.insert_node( NodeSpec{ .id = "A", .type = NodeType::diversion }, "END" ) );
            REQUIRE_TRY( nw.insert_node( NodeSpec{ .id = "B", .type = NodeType::streamflow }, "A" ) );

            THEN( "serial numbers increase upstream" )
            {
                REQUIRE( lookup( nw, "END" ).serial == 1 );
                REQUIRE( lookup( nw, "A" ).serial == 2 );
                REQUIRE( lookup( nw, "B" ).serial == 3 );
            }
            THEN( "computational order runs headwater to outlet" )
            {
                REQUIRE( walk_ids( nw ) == StringVec{ "B", "A", "END" } );
                REQUIRE( lookup( nw, "B" ).computational_order == 1 );
                REQUIRE( lookup( nw, "A" ).computational_order == 2 );
                REQUIRE( lookup( nw, "END" ).computational_order == 3 );
            }
            THEN( "all nodes share the main stem reach" )
            {
                REQUIRE( lookup( nw, "A" ).reach_counter == 1 );
                REQUIRE( lookup( nw, "A" ).node_in_reach == 2 );
                REQUIRE( lookup( nw, "B" ).reach_counter == 1 );
                REQUIRE( lookup( nw, "B" ).node_in_reach == 3 );
                REQUIRE( lookup( nw, "B" ).reach_level == 1 );
            }
            THEN( "structure is consistent" )
            {
                require_consistent( nw );
            }
        }
    }
}

SCENARIO( "insert_node opens a new branch at an existing confluence", "[network][insert]" )
{
    GIVEN( "END <- A <- B, tributaries added first" )
    {
        auto nw = make_network( UpstreamOrder::tribs_added_first );

        make_chain( nw, { "A", "B" } );

        WHEN( "C is inserted upstream of A" )
        {
            insert( nw, "C", "A" );

            THEN( "the new branch is visited first" )
            {
                REQUIRE( upstream_ids( nw, "A" ) == StringVec{ "B", "C" } );
                REQUIRE( walk_ids( nw ) == StringVec{ "C", "B", "A", "END" } );
            }
            THEN( "the new branch takes the highest serial" )
            {
                REQUIRE( lookup( nw, "C" ).serial == 4 );
                REQUIRE( lookup( nw, "B" ).serial == 3 );
                REQUIRE( lookup( nw, "A" ).serial == 2 );
                REQUIRE( lookup( nw, "END" ).serial == 1 );
            }
            THEN( "the new branch is a new reach" )
            {
                REQUIRE( lookup( nw, "C" ).reach_counter == 2 );
                REQUIRE( lookup( nw, "C" ).node_in_reach == 1 );
                REQUIRE( lookup( nw, "C" ).tributary_number == 2 );
                REQUIRE( lookup( nw, "C" ).reach_level == 2 );
            }
            THEN( "structure is consistent" )
            {
                require_consistent( nw );
            }
        }
    }
    GIVEN( "END <- A <- B, tributaries added last" )
    {
        auto nw = make_network( UpstreamOrder::tribs_added_last );

        make_chain( nw, { "A", "B" } );

        WHEN( "C is inserted upstream of A" )
        {
            insert( nw, "C", "A" );

            THEN( "branches are visited in the order added" )
            {
                REQUIRE( upstream_ids( nw, "A" ) == StringVec{ "B", "C" } );
                REQUIRE( walk_ids( nw ) == StringVec{ "B", "C", "A", "END" } );
            }
            THEN( "serial numbers follow the walk" )
            {
                REQUIRE( lookup( nw, "B" ).serial == 4 );
                REQUIRE( lookup( nw, "C" ).serial == 3 );
                REQUIRE( lookup( nw, "A" ).serial == 2 );
            }
            THEN( "structure is consistent" )
            {
                require_consistent( nw );
            }
        }
    }
}

SCENARIO( "insert_node splices into an existing branch", "[network][insert]" )
{
    GIVEN( "END <- A <- B" )
    {
        auto nw = make_network();

        make_chain( nw, { "A", "B" } );

        WHEN( "N is inserted between A and B" )
        {
            insert( nw, "N", "A", std::string{ "B" } );

            THEN( "N sits between its anchors" )
            {
                REQUIRE( upstream_ids( nw, "A" ) == StringVec{ "N" } );
                REQUIRE( upstream_ids( nw, "N" ) == StringVec{ "B" } );
                REQUIRE( walk_ids( nw ) == StringVec{ "B", "N", "A", "END" } );
            }
            THEN( "serial numbers shift above the splice" )
            {
                REQUIRE( lookup( nw, "B" ).serial == 4 );
                REQUIRE( lookup( nw, "N" ).serial == 3 );
                REQUIRE( lookup( nw, "A" ).serial == 2 );
            }
            THEN( "N takes B's place in the reach" )
            {
                REQUIRE( lookup( nw, "N" ).reach_counter == 1 );
                REQUIRE( lookup( nw, "N" ).node_in_reach == 3 );
                REQUIRE( lookup( nw, "B" ).node_in_reach == 4 );
            }
            THEN( "structure is consistent" )
            {
                require_consistent( nw );
            }
        }
    }
}

SCENARIO( "insert_node derives a location from its anchors", "[network][insert][geometry]" )
{
    GIVEN( "END at (0,0) and A at (0,10)" )
    {
        auto nw = make_network();

        make_chain( nw, { "A" } );

        auto const end = REQUIRE_TRY( nw.find_node( "END" ) );
        auto const a = REQUIRE_TRY( nw.find_node( "A" ) );

        REQUIRE_RES( nw.update_location( end, geometry::Point{ 0, 0 } ) );
        REQUIRE_RES( nw.update_location( a, geometry::Point{ 0, 10 } ) );

        WHEN( "B is inserted upstream of A" )
        {
            insert( nw, "B", "A" );

            THEN( "B continues the line from END through A" )
            {
                REQUIRE( lookup( nw, "B" ).location == geometry::Point{ 0, 20 } );
            }

            AND_WHEN( "N is spliced between A and B" )
            {
                insert( nw, "N", "A", std::string{ "B" } );

                THEN( "N is placed midway" )
                {
                    REQUIRE( lookup( nw, "N" ).location == geometry::Point{ 0, 15 } );
                }
            }
        }
    }
    GIVEN( "no locations" )
    {
        auto nw = make_network();

        WHEN( "A is inserted" )
        {
            insert( nw, "A", "END" );

            THEN( "A has no location" )
            {
                REQUIRE( !lookup( nw, "A" ).location );
            }
        }
    }
}

SCENARIO( "insert_node disambiguates a taken id", "[network][insert][advisory]" )
{
    GIVEN( "END <- A" )
    {
        auto nw = make_network();

        make_chain( nw, { "A" } );

        WHEN( "another 'a' is inserted" )
        {
            auto const ni = insert( nw, "a", "A" );

            THEN( "it is suffixed" )
            {
                REQUIRE( nw.node( ni ).id == "a_1" );
                REQUIRE( nw.size() == 3 );
            }
            THEN( "an advisory names the assigned id" )
            {
                REQUIRE( nw.advisories().size() == 1 );
                REQUIRE( nw.advisories().front().kind == AdvisoryKind::duplicate_id );
                REQUIRE( nw.advisories().front().node_id == "a_1" );
            }

            AND_WHEN( "'A' is inserted once more" )
            {
                auto const ni2 = insert( nw, "A", "END" );

                THEN( "the next suffix is used" )
                {
                    REQUIRE( nw.node( ni2 ).id == "A_2" );
                    require_consistent( nw );
                }
            }
        }
    }
}

SCENARIO( "insert_node leaves the network untouched on failure", "[network][insert]" )
{
    GIVEN( "END <- A <- B" )
    {
        auto nw = make_network();

        make_chain( nw, { "A", "B" } );

        auto const before = REQUIRE_TRY( nw.export_records() );

        THEN( "an unknown downstream anchor fails" )
        {
            auto const res = nw.insert_node( NodeSpec{ .id = "X" }, "Q" );

            REQUIRE( fail_with( res, error_code::network::anchor_not_found ) );
            REQUIRE( error_code::is_not_found( res.error() ) );
        }
        THEN( "an unknown upstream anchor fails" )
        {
            REQUIRE( fail_with( nw.insert_node( NodeSpec{ .id = "X" }, "A", std::string{ "Q" } ), error_code::network::anchor_not_found ) );
        }
        THEN( "an empty id fails" )
        {
            REQUIRE( fail_with( nw.insert_node( NodeSpec{}, "A" ), error_code::common::invalid_argument ) );
        }
        THEN( "a second end node fails" )
        {
            REQUIRE( fail_with( nw.insert_node( NodeSpec{ .id = "E2", .type = NodeType::end }, "A" ), error_code::network::end_node ) );
        }

        REQUIRE( nw.size() == 3 );
        REQUIRE( !nw.find_node( "X" ) );

        auto const after = REQUIRE_TRY( nw.export_records() );

        REQUIRE( after.size() == before.size() );

        for( auto i = std::size_t{ 0 }; i < after.size(); ++i )
        {
            REQUIRE( after[ i ].id == before[ i ].id );
            REQUIRE( after[ i ].upstream_ids == before[ i ].upstream_ids );
        }
    }
    GIVEN( "a network without an end node" )
    {
        auto nw = Network{ NetworkOptions{ .create_end_node = false } };

        THEN( "insert fails structurally" )
        {
            auto const res = nw.insert_node( NodeSpec{ .id = "A" }, "END" );

            REQUIRE( fail_with( res, error_code::structure::missing_end_node ) );
            REQUIRE( error_code::is_structural( res.error() ) );
            REQUIRE( nw.empty() );
        }
    }
}

SCENARIO( "anchor lookup failures", "[network][insert]" )
{
    GIVEN( "a lookup that found nothing" )
    {
        auto const found = Result< NodeIndex >{ HNET_MAKE_ERROR_MSG( error_code::network::node_not_found, "Q" ) };

        THEN( "it is reported as a missing anchor" )
        {
            auto const res = detail::as_anchor( found, "Q" );

            REQUIRE( fail_with( res, error_code::network::anchor_not_found ) );
            REQUIRE( error_code::is_not_found( res.error() ) );
        }
    }
    GIVEN( "a lookup that failed on a malformed graph" )
    {
        auto const found = Result< NodeIndex >{ HNET_MAKE_ERROR_MSG( error_code::structure::cycle_detected, "A" ) };

        THEN( "the structural error passes through" )
        {
            auto const res = detail::as_anchor( found, "A" );

            REQUIRE( fail_with( res, error_code::structure::cycle_detected ) );
            REQUIRE( error_code::is_structural( res.error() ) );
            REQUIRE( !error_code::is_not_found( res.error() ) );
        }
    }
    GIVEN( "a successful lookup" )
    {
        THEN( "the index is kept" )
        {
            REQUIRE( REQUIRE_TRY( detail::as_anchor( Result< NodeIndex >{ NodeIndex{ 3 } }, "A" ) ) == NodeIndex{ 3 } );
        }
    }
}
