/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "network/traverse.hpp"

#include "error/network.hpp"
#include "error/structure.hpp"
#include "util/result.hpp"

#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/find_if.hpp>

#include <algorithm>
#include <vector>

namespace hnet {

namespace {

// Branch followed by the absolute upstream walk. The computational walk visits it first.
auto leading_branch( Node const& n
                   , UpstreamOrder const order )
    -> NodeIndex
{
    return order == UpstreamOrder::tribs_added_first
         ? n.upstream.back()
         : n.upstream.front();
}

// Branch from which the computational walk arrives at its confluence.
auto trailing_branch( Node const& n
                    , UpstreamOrder const order )
    -> NodeIndex
{
    return order == UpstreamOrder::tribs_added_first
         ? n.upstream.front()
         : n.upstream.back();
}

auto linked_position( NodeStore const& store
                    , NodeIndex const& parent
                    , NodeIndex const& child )
    -> Result< uint32_t >
{
    auto rv = HNET_MAKE_RESULT( uint32_t );
    auto const& ups = store.at( parent ).upstream;

    if( auto const it = ranges::find( ups, child )
      ; it != ups.end() )
    {
        rv = static_cast< uint32_t >( std::distance( ups.begin(), it ) );
    }
    else
    {
        rv = HNET_MAKE_ERROR_MSG( error_code::structure::adjacency_mismatch
                                , fmt::format( "{} points downstream to {}, which does not list it upstream", store.at( child ).id, store.at( parent ).id ) );
    }

    return rv;
}

auto absolute_downstream( NodeStore const& store
                        , NodeIndex const& node )
    -> Result< NodeIndex >
{
    auto cur = node;
    auto steps = uint32_t{ 0 };

    while( store.at( cur ).downstream )
    {
        HNET_ENSURE_MSG( ++steps <= store.capacity(), error_code::structure::cycle_detected, store.at( node ).id );

        cur = store.at( cur ).downstream.value();
    }

    return cur;
}

auto absolute_upstream( NodeStore const& store
                      , NodeIndex const& node
                      , UpstreamOrder const order )
    -> Result< NodeIndex >
{
    auto cur = node;
    auto steps = uint32_t{ 0 };

    while( !store.at( cur ).upstream.empty() )
    {
        HNET_ENSURE_MSG( ++steps <= store.capacity(), error_code::structure::cycle_detected, store.at( node ).id );

        cur = leading_branch( store.at( cur ), order );
    }

    return cur;
}

auto reach_downstream( NodeStore const& store
                     , NodeIndex const& node )
    -> Result< NodeIndex >
{
    auto cur = node;
    auto steps = uint32_t{ 0 };

    while( store.at( cur ).node_in_reach != 1 )
    {
        HNET_ENSURE_MSG( ++steps <= store.capacity(), error_code::structure::cycle_detected, store.at( node ).id );

        auto const& c = store.at( cur );

        if( !c.downstream
         || store.at( c.downstream.value() ).reach_counter != c.reach_counter )
        {
            break;
        }

        cur = c.downstream.value();
    }

    return cur;
}

auto reach_upstream( NodeStore const& store
                   , NodeIndex const& node
                   , UpstreamOrder const order )
    -> Result< NodeIndex >
{
    auto cur = node;
    auto steps = uint32_t{ 0 };

    while( true )
    {
        HNET_ENSURE_MSG( ++steps <= store.capacity() + 1, error_code::structure::cycle_detected, store.at( node ).id );

        auto const& c = store.at( cur );

        if( c.upstream.empty()
         || ( is_confluence_type( c.type ) && c.upstream.size() == 1 ) )
        {
            break;
        }

        auto const same_reach = [ & ]( auto const& e ){ return store.at( e ).reach_counter == c.reach_counter; };
        auto next = Optional< NodeIndex >{};

        if( order == UpstreamOrder::tribs_added_first )
        {
            if( auto const it = std::find_if( c.upstream.rbegin(), c.upstream.rend(), same_reach )
              ; it != c.upstream.rend() )
            {
                next = *it;
            }
        }
        else
        {
            if( auto const it = ranges::find_if( c.upstream, same_reach )
              ; it != c.upstream.end() )
            {
                next = *it;
            }
        }

        if( !next )
        {
            break;
        }

        cur = next.value();
    }

    return cur;
}

auto computational_downstream( NodeStore const& store
                             , NodeIndex const& node
                             , UpstreamOrder const order )
    -> Result< NodeIndex >
{
    auto const& n = store.at( node );

    if( !n.downstream )
    {
        return node;
    }

    auto const ds = n.downstream.value();
    auto const& d = store.at( ds );
    auto const pos = HTRY( linked_position( store, ds, node ) );
    auto const count = static_cast< uint32_t >( d.upstream.size() );

    if( order == UpstreamOrder::tribs_added_first )
    {
        if( pos == 0 )
        {
            return ds;
        }
        else
        {
            return absolute_upstream( store, d.upstream[ pos - 1 ], order );
        }
    }
    else
    {
        if( pos + 1 == count )
        {
            return ds;
        }
        else
        {
            return absolute_upstream( store, d.upstream[ pos + 1 ], order );
        }
    }
}

// Walk predecessor: the confluence-side branch for an inner node; for a leaf, the sibling branch visited just before this one.
auto computational_upstream( NodeStore const& store
                           , NodeIndex const& node
                           , UpstreamOrder const order )
    -> Result< NodeIndex >
{
    auto const& n = store.at( node );

    if( !n.upstream.empty() )
    {
        return trailing_branch( n, order );
    }

    auto cur = node;
    auto steps = uint32_t{ 0 };

    while( store.at( cur ).downstream )
    {
        HNET_ENSURE_MSG( ++steps <= store.capacity(), error_code::structure::cycle_detected, n.id );

        auto const parent = store.at( cur ).downstream.value();
        auto const& ups = store.at( parent ).upstream;
        auto const pos = HTRY( linked_position( store, parent, cur ) );

        if( order == UpstreamOrder::tribs_added_first )
        {
            if( pos + 1 < ups.size() )
            {
                return ups[ pos + 1 ];
            }
        }
        else
        {
            if( pos > 0 )
            {
                return ups[ pos - 1 ];
            }
        }

        cur = parent;
    }

    return node; // Top of the system: first node of the walk.
}

} // namespace anon

auto fetch_downstream( NodeStore const& store
                     , NodeIndex const& node
                     , Position const pos
                     , UpstreamOrder const order )
    -> Result< NodeIndex >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "node", node );

    HNET_ENSURE( store.exists( node ), error_code::network::invalid_node );

    switch( pos )
    {
        case Position::relative:
        {
            if( auto const& ds = store.at( node ).downstream
              ; ds )
            {
                return ds.value();
            }

            return node;
        }
        case Position::absolute: return absolute_downstream( store, node );
        case Position::reach: return reach_downstream( store, node );
        case Position::computational: return computational_downstream( store, node, order );
    }

    return HNET_MAKE_ERROR( error_code::common::invalid_argument );
}

auto fetch_upstream( NodeStore const& store
                   , NodeIndex const& node
                   , Position const pos
                   , UpstreamOrder const order )
    -> Result< NodeIndex >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "node", node );

    HNET_ENSURE( store.exists( node ), error_code::network::invalid_node );

    switch( pos )
    {
        case Position::relative:
        {
            if( auto const& n = store.at( node )
              ; !n.upstream.empty() )
            {
                return leading_branch( n, order );
            }

            return node;
        }
        case Position::absolute: return absolute_upstream( store, node, order );
        case Position::reach: return reach_upstream( store, node, order );
        case Position::computational: return computational_upstream( store, node, order );
    }

    return HNET_MAKE_ERROR( error_code::common::invalid_argument );
}

auto fetch_upstream_in_reach( NodeStore const& store
                            , NodeIndex const& node )
    -> Result< Optional< NodeIndex > >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "node", node );

    HNET_ENSURE( store.exists( node ), error_code::network::invalid_node );

    auto const& n = store.at( node );

    if( auto const it = ranges::find_if( n.upstream, [ & ]( auto const& e ){ return store.at( e ).reach_counter == n.reach_counter; } )
      ; it != n.upstream.end() )
    {
        return Optional< NodeIndex >{ *it };
    }

    return Optional< NodeIndex >{};
}

auto walk( NodeStore const& store
         , NodeIndex const& from
         , UpstreamOrder const order )
    -> Result< NodeIndexVec >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "from", from );

    auto rv = HNET_MAKE_RESULT( NodeIndexVec );

    HNET_ENSURE( store.exists( from ), error_code::network::invalid_node );

    auto const bottom = HTRY( absolute_downstream( store, from ) );
    auto cur = HTRY( absolute_upstream( store, bottom, order ) );
    auto visited = std::vector< bool >( store.capacity(), false );
    auto seq = NodeIndexVec{};

    while( true )
    {
        HNET_ENSURE_MSG( !visited[ cur.value() ], error_code::structure::cycle_detected, store.at( cur ).id );

        visited[ cur.value() ] = true;
        seq.emplace_back( cur );

        if( !store.at( cur ).downstream )
        {
            break;
        }

        auto const next = HTRY( computational_downstream( store, cur, order ) );

        HNET_ENSURE_MSG( next != cur, error_code::structure::no_progress, store.at( cur ).id );

        cur = next;
    }

    rv = std::move( seq );

    return rv;
}

} // namespace hnet
