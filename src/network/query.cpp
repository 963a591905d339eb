/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "network/network.hpp"

#include "error/network.hpp"
#include "error/structure.hpp"
#include "util/result.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <range/v3/action/sort.hpp>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/view/reverse.hpp>

#include <charconv>
#include <vector>

namespace hnet {

namespace {

auto parse_link( std::string const& value )
    -> Result< int64_t >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "value", value );

    auto rv = HNET_MAKE_RESULT( int64_t );
    auto link = int64_t{};
    auto const [ ptr, ec ] = std::from_chars( value.data(), value.data() + value.size(), link );

    if( ec == std::errc{} && ptr == value.data() + value.size() )
    {
        rv = link;
    }
    else
    {
        rv = HNET_MAKE_ERROR_MSG( error_code::common::invalid_numeric, value );
    }

    return rv;
}

// The first stop id matching `id`, if any; the flag is whether the stop node itself is kept.
auto match_stop( StringVec const& stop_ids
               , std::string const& id )
    -> Optional< bool >
{
    for( auto const& stop : stop_ids )
    {
        if( !stop.empty() && stop.front() == '-' )
        {
            if( iequals_id( stop.substr( 1 ), id ) )
            {
                return false;
            }
        }
        else if( iequals_id( stop, id ) )
        {
            return true;
        }
    }

    return nullopt;
}

// Relative downstream chase from `node`, inclusive, ending at the terminal node.
auto downstream_path( NodeStore const& store
                    , NodeIndex const& node )
    -> Result< NodeIndexVec >
{
    HN_RESULT_PROLOG();

    auto rv = HNET_MAKE_RESULT( NodeIndexVec );
    auto path = NodeIndexVec{ node };

    while( store.at( path.back() ).downstream )
    {
        HNET_ENSURE_MSG( path.size() <= store.capacity(), error_code::structure::cycle_detected, store.at( node ).id );

        path.emplace_back( store.at( path.back() ).downstream.value() );
    }

    rv = std::move( path );

    return rv;
}

} // namespace anon

auto Network::find_node( std::string const& id ) const
    -> Result< NodeIndex >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "id", id );

    auto rv = HNET_MAKE_RESULT( NodeIndex );
    auto const seq = HTRY( walk() );

    if( auto const it = ranges::find_if( seq, [ & ]( auto const& e ){ return iequals_id( store_.at( e ).id, id ); } )
      ; it != seq.end() )
    {
        rv = *it;
    }
    else
    {
        rv = HNET_MAKE_ERROR_MSG( error_code::network::node_not_found, id );
    }

    return rv;
}

auto Network::find_node( NodeData const data
                       , NodeType const type
                       , std::string const& value ) const
    -> Result< NodeIndex >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "type", to_string( type ) );
        HN_RESULT_PUSH( "value", value );

    auto rv = HNET_MAKE_RESULT( NodeIndex );
    auto pred = NodePredicate{};

    switch( data )
    {
        case NodeData::id:
        {
            pred = [ & ]( Node const& n ){ return iequals_id( n.id, value ); };
            break;
        }
        case NodeData::description:
        {
            pred = [ & ]( Node const& n ){ return n.description == value; };
            break;
        }
        case NodeData::link:
        {
            auto const link = HTRY( parse_link( value ) );

            pred = [ link ]( Node const& n ){ return n.link == link; };
            break;
        }
    }

    auto const seq = HTRY( walk() );

    if( auto const it = ranges::find_if( seq, [ & ]( auto const& e ){ return store_.at( e ).type == type && pred( store_.at( e ) ); } )
      ; it != seq.end() )
    {
        rv = *it;
    }
    else
    {
        rv = HNET_MAKE_ERROR_MSG( error_code::network::node_not_found, fmt::format( "{} with {}", to_string( type ), value ) );
    }

    return rv;
}

auto Network::fetch_nodes_if( NodePredicate const& pred ) const
    -> Result< NodeIndexVec >
{
    HN_RESULT_PROLOG();

    auto rv = HNET_MAKE_RESULT( NodeIndexVec );
    auto nodes = NodeIndexVec{};

    for( auto const& ni : HTRY( walk() ) )
    {
        if( pred( store_.at( ni ) ) )
        {
            nodes.emplace_back( ni );
        }
    }

    rv = std::move( nodes );

    return rv;
}

auto Network::fetch_nodes_for_type( NodeType const type ) const
    -> Result< NodeIndexVec >
{
    return fetch_nodes_if( [ type ]( Node const& n ){ return n.type == type; } );
}

auto Network::fetch_real_nodes() const
    -> Result< NodeIndexVec >
{
    return fetch_nodes_if( []( Node const& n ){ return is_real_node_type( n.type ); } );
}

auto Network::fetch_natural_flow_nodes() const
    -> Result< NodeIndexVec >
{
    return fetch_nodes_if( []( Node const& n ){ return n.flags.natural_flow; } );
}

auto Network::count_nodes( NodeType const type ) const
    -> Result< uint32_t >
{
    HN_RESULT_PROLOG();

    return static_cast< uint32_t >( HTRY( fetch_nodes_for_type( type ) ).size() );
}

auto Network::is_natural_flow_like( NodeIndex const& node ) const
    -> bool
{
    auto const& flags = store_.at( node ).flags;

    return flags.natural_flow
        || ( treat_dry_as_natural_flow() && flags.dry_river );
}

auto Network::find_downstream_if( NodeIndex const& node
                                , NodePredicate const& pred ) const
    -> Result< Optional< NodeIndex > >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "node", node );

    HNET_ENSURE( exists( node ), error_code::network::invalid_node );

    auto const path = HTRY( downstream_path( store_, node ) );

    for( auto const& ni : path )
    {
        if( ni != node && pred( store_.at( ni ) ) )
        {
            return Optional< NodeIndex >{ ni };
        }
    }

    return Optional< NodeIndex >{};
}

// Gages recording natural flow.
auto Network::find_downstream_flow_node( NodeIndex const& node ) const
    -> Result< Optional< NodeIndex > >
{
    return find_downstream_if( node, []( Node const& n ){ return n.type == NodeType::streamflow && n.flags.natural_flow; } );
}

auto Network::find_downstream_natural_flow_node_in_reach( NodeIndex const& node ) const
    -> Result< Optional< NodeIndex > >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "node", node );

    HNET_ENSURE( exists( node ), error_code::network::invalid_node );

    auto const reach = store_.at( node ).reach_counter;

    for( auto const& ni : HTRY( downstream_path( store_, node ) ) )
    {
        if( store_.at( ni ).reach_counter != reach )
        {
            break;
        }
        else if( ni != node && is_natural_flow_like( ni ) )
        {
            return Optional< NodeIndex >{ ni };
        }
    }

    return Optional< NodeIndex >{};
}

auto Network::find_upstream_natural_flow_node_in_reach( NodeIndex const& node ) const
    -> Result< Optional< NodeIndex > >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "node", node );

    HNET_ENSURE( exists( node ), error_code::network::invalid_node );

    auto next = HTRY( fetch_upstream_in_reach( node ) );
    auto steps = uint32_t{ 0 };

    while( next )
    {
        HNET_ENSURE_MSG( ++steps <= store_.capacity(), error_code::structure::cycle_detected, store_.at( node ).id );

        if( is_natural_flow_like( next.value() ) )
        {
            return next;
        }

        next = HTRY( fetch_upstream_in_reach( next.value() ) );
    }

    return Optional< NodeIndex >{};
}

auto Network::find_upstream_flow_nodes( NodeIndex const& node
                                      , NodePredicate const& extra ) const
    -> Result< NodeIndexVec >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "node", node );

    HNET_ENSURE( exists( node ), error_code::network::invalid_node );

    struct Frame
    {
        NodeIndex start;
        bool include_start = false;
    };

    auto rv = HNET_MAKE_RESULT( NodeIndexVec );
    auto const is_flow = [ & ]( Node const& n )
    {
        return ( n.type == NodeType::streamflow && n.flags.natural_flow )
            || ( extra && extra( n ) );
    };
    auto found = NodeIndexVec{};
    auto stack = std::vector< Frame >{ Frame{ node, false } };
    auto steps = uint32_t{ 0 };

    while( !stack.empty() )
    {
        auto const frame = stack.back();
        auto cur = Optional< NodeIndex >{ frame.start };

        stack.pop_back();

        while( cur )
        {
            HNET_ENSURE_MSG( ++steps <= store_.capacity(), error_code::structure::cycle_detected, store_.at( node ).id );

            auto const& c = store_.at( cur.value() );

            if( ( cur.value() != frame.start || frame.include_start )
             && is_flow( c ) )
            {
                found.emplace_back( cur.value() );

                break;
            }

            for( auto const& ui : c.upstream )
            {
                if( store_.at( ui ).reach_counter != c.reach_counter )
                {
                    stack.emplace_back( Frame{ ui, true } );
                }
            }

            cur = HTRY( fetch_upstream_in_reach( cur.value() ) );
        }
    }

    found |= ranges::actions::sort( [ & ]( auto const& lhs, auto const& rhs ){ return store_.at( lhs ).computational_order < store_.at( rhs ).computational_order; } );

    rv = std::move( found );

    return rv;
}

auto Network::find_upstream_nodes( NodeIndex const& node
                                 , bool const include_self
                                 , StringVec const& stop_ids ) const
    -> Result< NodeIndexVec >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "node", node );

    HNET_ENSURE( exists( node ), error_code::network::invalid_node );

    struct Frame
    {
        NodeIndex start;
        bool add_first = false;
    };

    auto rv = HNET_MAKE_RESULT( NodeIndexVec );
    auto found = NodeIndexVec{};
    auto stack = std::vector< Frame >{ Frame{ node, include_self } };
    auto steps = uint32_t{ 0 };

    while( !stack.empty() )
    {
        auto const frame = stack.back();
        auto cur = frame.start;
        auto first = true;

        stack.pop_back();

        while( true )
        {
            HNET_ENSURE_MSG( ++steps <= store_.capacity(), error_code::structure::cycle_detected, store_.at( node ).id );

            auto const& c = store_.at( cur );

            if( !first || frame.add_first )
            {
                if( auto const stop = match_stop( stop_ids, c.id )
                  ; stop )
                {
                    if( stop.value() )
                    {
                        found.emplace_back( cur );
                    }

                    break;
                }

                found.emplace_back( cur );
            }

            first = false;

            if( c.upstream.empty() )
            {
                break;
            }
            else if( c.upstream.size() == 1 )
            {
                cur = c.upstream.front();
            }
            else
            {
                for( auto const& ui : c.upstream | ranges::views::reverse )
                {
                    stack.emplace_back( Frame{ ui, true } );
                }

                break;
            }
        }
    }

    rv = std::move( found );

    return rv;
}

auto Network::node_sequence( NodeIndex const& from
                           , NodeIndex const& to ) const
    -> Result< NodeIndexVec >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "from", from );
        HN_RESULT_PUSH( "to", to );

    HNET_ENSURE( exists( from ), error_code::network::invalid_node );
    HNET_ENSURE( exists( to ), error_code::network::invalid_node );

    auto rv = HNET_MAKE_RESULT( NodeIndexVec );
    auto const apath = HTRY( downstream_path( store_, from ) );
    auto const bpath = HTRY( downstream_path( store_, to ) );
    auto const meet = ranges::find_if( apath, [ & ]( auto const& e ){ return ranges::find( bpath, e ) != bpath.end(); } );

    if( meet != apath.end() )
    {
        auto seq = NodeIndexVec( apath.begin(), std::next( meet ) );
        auto const bmeet = ranges::find( bpath, *meet );

        seq.insert( seq.end()
                  , std::make_reverse_iterator( bmeet )
                  , bpath.rend() );

        rv = std::move( seq );
    }
    else
    {
        rv = HNET_MAKE_ERROR_MSG( error_code::network::node_not_found
                                , fmt::format( "{} and {} share no downstream node", store_.at( from ).id, store_.at( to ).id ) );
    }

    return rv;
}

auto Network::find_next_real_downstream_node( NodeIndex const& node ) const
    -> Result< Optional< NodeIndex > >
{
    return find_downstream_if( node, []( Node const& n ){ return !is_decorative_node_type( n.type ); } );
}

auto Network::find_next_real_or_xconfluence_downstream_node( NodeIndex const& node ) const
    -> Result< Optional< NodeIndex > >
{
    return find_downstream_if( node, []( Node const& n ){ return !is_decorative_node_type( n.type ) || n.type == NodeType::xconfluence; } );
}

auto Network::find_next_xconfluence_downstream_node( NodeIndex const& node ) const
    -> Result< Optional< NodeIndex > >
{
    return find_downstream_if( node, []( Node const& n ){ return n.type == NodeType::xconfluence; } );
}

auto Network::is_most_upstream_node_in_reach( NodeIndex const& node ) const
    -> Result< bool >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "node", node );

    HNET_ENSURE( exists( node ), error_code::network::invalid_node );

    auto next = HTRY( fetch_upstream_in_reach( node ) );
    auto steps = uint32_t{ 0 };

    while( next )
    {
        HNET_ENSURE_MSG( ++steps <= store_.capacity(), error_code::structure::cycle_detected, store_.at( node ).id );

        if( is_real_node_type( store_.at( next.value() ).type ) )
        {
            return false;
        }

        next = HTRY( fetch_upstream_in_reach( next.value() ) );
    }

    return true;
}

} // namespace hnet
