/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "test/util.hpp"

#include <catch2/catch_test_macros.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <algorithm>
#include <set>

namespace hnet::test {

auto make_network( UpstreamOrder const order )
    -> Network
{
    return Network{ NetworkOptions{ .upstream_order = order } };
}

auto insert( Network& nw
           , std::string const& id
           , std::string const& downstream
           , Optional< std::string > const& upstream
           , NodeType const type )
    -> NodeIndex
{
    return HTRYE( nw.insert_node( NodeSpec{ .id = id, .type = type }, downstream, upstream ) );
}

auto make_chain( Network& nw
               , StringVec const& ids )
    -> void
{
    auto ds = HTRYE( nw.fetch_id( HTRYE( nw.end_node() ) ) );

    for( auto const& id : ids )
    {
        insert( nw, id, ds );

        ds = id;
    }
}

auto record( std::string const& id
           , NodeType const type
           , std::string const& downstream
           , StringVec const& upstream )
    -> NodeRecord
{
    return NodeRecord{ .id = id
                     , .type = type
                     , .downstream_id = downstream
                     , .upstream_ids = upstream };
}

auto lookup( Network const& nw
           , std::string const& id )
    -> Node const&
{
    return nw.node( HTRYE( nw.find_node( id ) ) );
}

auto ids( Network const& nw
        , NodeIndexVec const& nodes )
    -> StringVec
{
    return nodes
         | ranges::views::transform( [ & ]( auto const& e ){ return nw.node( e ).id; } )
         | ranges::to< StringVec >();
}

auto upstream_ids( Network const& nw
                 , std::string const& id )
    -> StringVec
{
    return ids( nw, lookup( nw, id ).upstream );
}

auto walk_ids( Network const& nw )
    -> StringVec
{
    return ids( nw, HTRYE( nw.walk() ) );
}

auto require_consistent( Network const& nw )
    -> void
{
    REQUIRE_RES( nw.validate() );

    auto const end = REQUIRE_TRY( nw.end_node() );
    auto const live = nw.store().live_nodes();
    auto const n = static_cast< uint32_t >( live.size() );

    REQUIRE( nw.size() == n );

    // Tree rooted at End, no repeats.
    for( auto const& ni : live )
    {
        auto seen = std::set< NodeIndex >{ ni };
        auto cur = ni;

        while( nw.node( cur ).downstream )
        {
            cur = nw.node( cur ).downstream.value();

            REQUIRE( seen.emplace( cur ).second );
        }

        REQUIRE( cur == end );
        REQUIRE( seen.size() <= n );
    }

    // Mutual adjacency, exactly once.
    for( auto const& ni : live )
    {
        if( auto const& ds = nw.node( ni ).downstream
          ; ds )
        {
            auto const& ups = nw.node( ds.value() ).upstream;

            REQUIRE( std::count( ups.begin(), ups.end(), ni ) == 1 );
        }
    }

    // Serial and computational order are dense, and the walk visits them in order.
    {
        auto const seq = REQUIRE_TRY( nw.walk() );
        auto serials = std::set< uint32_t >{};
        auto orders = std::set< uint32_t >{};

        REQUIRE( seq.size() == n );
        REQUIRE( seq.back() == end );

        for( auto i = std::size_t{ 0 }; i < seq.size(); ++i )
        {
            auto const& node = nw.node( seq[ i ] );

            serials.emplace( node.serial );
            orders.emplace( node.computational_order );

            REQUIRE( node.computational_order == i + 1 );

            if( node.downstream )
            {
                REQUIRE( node.serial > nw.node( node.downstream.value() ).serial );
            }
        }

        REQUIRE( serials.size() == n );
        REQUIRE( *serials.begin() == 1 );
        REQUIRE( *serials.rbegin() == n );
        REQUIRE( orders.size() == n );
        REQUIRE( *orders.rbegin() == n );
    }

    // Unique ids.
    {
        auto lowered = std::set< std::string >{};

        for( auto const& ni : live )
        {
            REQUIRE( lowered.emplace( boost::to_lower_copy( nw.node( ni ).id ) ).second );
        }
    }
}

} // namespace hnet::test
