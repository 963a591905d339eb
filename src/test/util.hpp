/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef HNET_TEST_UTIL_HPP
#define HNET_TEST_UTIL_HPP

// Assumes REQUIRE halts flow on failure.
#define REQUIRE_TRY( ... ) \
    ({ \
        auto&& res = ( __VA_ARGS__ ); \
        REQUIRE( hnet::test::succ( res ) ); \
        res.value(); \
    })
#define REQUIRE_RES( ... ) REQUIRE( hnet::test::succ( __VA_ARGS__ ) )
#define REQUIRE_RFAIL( ... ) REQUIRE( hnet::test::fail( __VA_ARGS__ ) )

#include <common.hpp>
#include "network/network.hpp"
#include "util/concepts.hpp"

#include <fmt/format.h>

#include <string>
#include <vector>

namespace hnet::test {

template< concepts::Boolean T >
auto succ( T const& t
         , const char* file = __builtin_FILE() /* TODO: replace with std::source_location */
         , unsigned line = __builtin_LINE() /* TODO: replace with std::source_location */ )
{
    if constexpr( requires{ t.error(); } )
    {
        if( !t )
        {
            fmt::print( stderr, "Expected Result 'success' at {}:{}:\n{}\n", file, line, to_string( t.error() ) );
        }
    }
    return static_cast< bool >( t );
}
template< concepts::Boolean T >
auto fail( T const& t )
{
    return !static_cast< bool >( t );
}
// Failure carrying exactly `ec`.
template< typename T
        , typename ErrorCode >
auto fail_with( Result< T > const& t
              , ErrorCode const ec )
{
    return !t && t.error().ec == ec;
}

auto make_network( UpstreamOrder const order = UpstreamOrder::tribs_added_first )
    -> Network;
/**
 * @brief Inserts `id` upstream of `downstream`, throwing on failure.
 */
auto insert( Network& nw
           , std::string const& id
           , std::string const& downstream
           , Optional< std::string > const& upstream = nullopt
           , NodeType const type = NodeType::other )
    -> NodeIndex;
/**
 * @brief Builds a single reach: each id upstream of the previous one, the first upstream of the end node.
 */
auto make_chain( Network& nw
               , StringVec const& ids )
    -> void;
auto record( std::string const& id
           , NodeType const type
           , std::string const& downstream
           , StringVec const& upstream )
    -> NodeRecord;
auto lookup( Network const& nw
           , std::string const& id )
    -> Node const&;
auto ids( Network const& nw
        , NodeIndexVec const& nodes )
    -> StringVec;
auto upstream_ids( Network const& nw
                 , std::string const& id )
    -> StringVec;
auto walk_ids( Network const& nw )
    -> StringVec;
/**
 * @brief REQUIREs every structural property a well-formed network holds: a tree rooted at End, mutual adjacency,
 *        dense and consistently ordered serial and computational numbers, unique ids.
 */
auto require_consistent( Network const& nw )
    -> void;

} // namespace hnet::test

#endif // HNET_TEST_UTIL_HPP
