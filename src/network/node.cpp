/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "network/node.hpp"

#include "contract.hpp"
#include "error/network.hpp"
#include "util/result.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <range/v3/algorithm/count.hpp>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/find_if.hpp>

namespace hnet {

auto NodeStore::create( Node node )
    -> NodeIndex
{
    auto const idx = NodeIndex{ static_cast< uint32_t >( nodes_.size() ) };

    nodes_.emplace_back( std::move( node ) );

    return idx;
}

auto NodeStore::exists( NodeIndex const& idx ) const
    -> bool
{
    return idx.value() < nodes_.size()
        && !nodes_[ idx.value() ].detached;
}

auto NodeStore::at( NodeIndex const& idx ) const
    -> Node const&
{
    return nodes_.at( idx.value() );
}

auto NodeStore::at( NodeIndex const& idx )
    -> Node&
{
    return nodes_.at( idx.value() );
}

auto NodeStore::capacity() const
    -> uint32_t
{
    return static_cast< uint32_t >( nodes_.size() );
}

auto NodeStore::size() const
    -> uint32_t
{
    return static_cast< uint32_t >( ranges::count( nodes_, false, &Node::detached ) );
}

auto NodeStore::live_nodes() const
    -> NodeIndexVec
{
    auto rv = NodeIndexVec{};

    for( auto i = uint32_t{ 0 }; i < nodes_.size(); ++i )
    {
        if( !nodes_[ i ].detached )
        {
            rv.emplace_back( i );
        }
    }

    return rv;
}

auto NodeStore::find_index( std::string const& id ) const
    -> Optional< NodeIndex >
{
    for( auto i = uint32_t{ 0 }; i < nodes_.size(); ++i )
    {
        if( !nodes_[ i ].detached
         && iequals_id( nodes_[ i ].id, id ) )
        {
            return NodeIndex{ i };
        }
    }

    return nullopt;
}

auto NodeStore::fetch_upstream( NodeIndex const& self
                              , uint32_t const position ) const
    -> Result< NodeIndex >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "self", self );
        HN_RESULT_PUSH( "position", position );

    HNET_ENSURE( exists( self ), error_code::network::invalid_node );

    auto const& ups = at( self ).upstream;

    HNET_ENSURE_MSG( position < ups.size()
                   , error_code::network::upstream_out_of_range
                   , fmt::format( "{} has {} upstream nodes", at( self ).id, ups.size() ) );

    return ups[ position ];
}

auto NodeStore::fetch_upstream_position( NodeIndex const& parent
                                       , NodeIndex const& child ) const
    -> Result< uint32_t >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "parent", parent );
        HN_RESULT_PUSH( "child", child );

    auto rv = HNET_MAKE_RESULT( uint32_t );

    HNET_ENSURE( exists( parent ), error_code::network::invalid_node );

    auto const& ups = at( parent ).upstream;

    if( auto const it = ranges::find( ups, child )
      ; it != ups.end() )
    {
        rv = static_cast< uint32_t >( std::distance( ups.begin(), it ) );
    }
    else
    {
        rv = HNET_MAKE_ERROR_MSG( error_code::network::node_not_found
                                , fmt::format( "{} is not upstream of {}", at( child ).id, at( parent ).id ) );
    }

    return rv;
}

auto NodeStore::add_upstream_node( NodeIndex const& self
                                 , NodeIndex const& node )
    -> Result< void >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "self", self );
        HN_RESULT_PUSH( "node", node );

    auto rv = HNET_MAKE_RESULT( void );

    BC_CONTRACT()
        BC_POST([ & ]
        {
            if( rv )
            {
                BC_ASSERT( at( node ).downstream == self );
                BC_ASSERT( ranges::count( at( self ).upstream, node ) == 1 );
            }
        })
    ;

    HNET_ENSURE( exists( self ), error_code::network::invalid_node );
    HNET_ENSURE( exists( node ), error_code::network::invalid_node );
    HNET_ENSURE( self != node, error_code::network::invalid_node );
    HNET_ENSURE( !at( node ).downstream, error_code::network::invalid_node );

    auto& s = at( self );
    auto& n = at( node );

    s.upstream.emplace_back( node );
    n.downstream = self;
    n.tributary_number = static_cast< uint32_t >( s.upstream.size() );

    rv = outcome::success();

    return rv;
}

auto NodeStore::add_downstream_node( NodeIndex const& self
                                   , NodeIndex const& node )
    -> Result< void >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "self", self );
        HN_RESULT_PUSH( "node", node );

    auto rv = HNET_MAKE_RESULT( void );

    BC_CONTRACT()
        BC_POST([ & ]
        {
            if( rv )
            {
                BC_ASSERT( at( self ).downstream == node );
                BC_ASSERT( at( node ).upstream.size() == 1 );
            }
        })
    ;

    HNET_ENSURE( exists( self ), error_code::network::invalid_node );
    HNET_ENSURE( exists( node ), error_code::network::invalid_node );
    HNET_ENSURE( self != node, error_code::network::invalid_node );
    HNET_ENSURE( !at( node ).downstream && at( node ).upstream.empty(), error_code::network::invalid_node );

    auto const old_ds = at( self ).downstream;

    if( old_ds )
    {
        auto const pos = HTRY( fetch_upstream_position( old_ds.value(), self ) );

        at( old_ds.value() ).upstream[ pos ] = node;
        at( node ).tributary_number = at( self ).tributary_number;
    }
    else
    {
        at( node ).tributary_number = 1;
    }

    at( node ).downstream = old_ds;
    at( node ).upstream = { self };
    at( self ).downstream = node;
    at( self ).tributary_number = 1;

    rv = outcome::success();

    return rv;
}

auto NodeStore::detach( NodeIndex const& idx )
    -> Result< void >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "node", idx );

    HNET_ENSURE( exists( idx ), error_code::network::invalid_node );

    auto& n = at( idx );

    n.detached = true;
    n.downstream = nullopt;
    n.upstream.clear();

    return outcome::success();
}

auto iequals_id( std::string const& lhs
               , std::string const& rhs )
    -> bool
{
    return boost::iequals( lhs, rhs );
}

auto to_string( Node const& node )
    -> std::string
{
    return fmt::format( "{} ({}) serial={} comp={} reach={} nir={} trib={}"
                      , node.id
                      , to_string( node.type, TypeLabel::abbreviation )
                      , node.serial
                      , node.computational_order
                      , node.reach_counter
                      , node.node_in_reach
                      , node.tributary_number );
}

} // namespace hnet
