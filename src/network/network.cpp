/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "network/network.hpp"

#include "contract.hpp"
#include "error/network.hpp"
#include "error/structure.hpp"
#include "util/result.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <range/v3/algorithm/count.hpp>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/algorithm/max.hpp>
#include <range/v3/algorithm/min.hpp>
#include <range/v3/view/enumerate.hpp>
#include <range/v3/view/reverse.hpp>

#include <algorithm>
#include <set>

namespace hnet {

Network::Network( NetworkOptions const& opts )
    : options_{ opts }
{
    if( options_.create_end_node )
    {
        auto const end = store_.create( Node{ .id = options_.end_node_id
                                            , .type = NodeType::end
                                            , .serial = 1
                                            , .computational_order = 1
                                            , .reach_counter = 1
                                            , .node_in_reach = 1
                                            , .tributary_number = 1
                                            , .reach_level = 1 } );

        end_ = end;
    }
}

auto Network::options() const
    -> NetworkOptions const&
{
    return options_;
}

auto Network::upstream_order() const
    -> UpstreamOrder
{
    return options_.upstream_order;
}

auto Network::set_treat_dry_as_natural_flow( bool const treat )
    -> void
{
    options_.treat_dry_as_natural_flow = treat;
}

auto Network::treat_dry_as_natural_flow() const
    -> bool
{
    return options_.treat_dry_as_natural_flow;
}

auto Network::end_node() const
    -> Result< NodeIndex >
{
    HN_RESULT_PROLOG();

    auto rv = HNET_MAKE_RESULT( NodeIndex );

    if( end_ && store_.exists( end_.value() ) )
    {
        rv = end_.value();
    }
    else
    {
        rv = HNET_MAKE_ERROR( error_code::structure::missing_end_node );
    }

    return rv;
}

auto Network::exists( NodeIndex const& node ) const
    -> bool
{
    return store_.exists( node );
}

auto Network::fetch_node( NodeIndex const& node ) const
    -> Result< Node >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "node", node );

    HNET_ENSURE( exists( node ), error_code::network::invalid_node );

    return store_.at( node );
}

auto Network::fetch_id( NodeIndex const& node ) const
    -> Result< std::string >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "node", node );

    HNET_ENSURE( exists( node ), error_code::network::invalid_node );

    return store_.at( node ).id;
}

auto Network::node( NodeIndex const& node ) const
    -> Node const&
{
    return store_.at( node );
}

auto Network::size() const
    -> uint32_t
{
    return store_.size();
}

auto Network::empty() const
    -> bool
{
    return size() == 0;
}

auto Network::store() const
    -> NodeStore const&
{
    return store_;
}

auto Network::advisories() const
    -> Advisories const&
{
    return advisories_;
}

auto Network::clear_advisories()
    -> void
{
    advisories_.clear();
}

auto Network::push_advisory( Advisory const& advisory )
    -> void
{
    advisories_.emplace_back( advisory );
}

auto Network::fetch_downstream( NodeIndex const& node
                              , Position const pos ) const
    -> Result< NodeIndex >
{
    return hnet::fetch_downstream( store_, node, pos, upstream_order() );
}

auto Network::fetch_upstream( NodeIndex const& node
                            , Position const pos ) const
    -> Result< NodeIndex >
{
    return hnet::fetch_upstream( store_, node, pos, upstream_order() );
}

auto Network::fetch_upstream_at( NodeIndex const& node
                               , uint32_t const position ) const
    -> Result< NodeIndex >
{
    return store_.fetch_upstream( node, position );
}

auto Network::fetch_upstream_in_reach( NodeIndex const& node ) const
    -> Result< Optional< NodeIndex > >
{
    return hnet::fetch_upstream_in_reach( store_, node );
}

auto Network::most_upstream_node() const
    -> Result< NodeIndex >
{
    HN_RESULT_PROLOG();

    auto const end = HTRY( end_node() );

    return fetch_upstream( end, Position::absolute );
}

auto Network::walk() const
    -> Result< NodeIndexVec >
{
    HN_RESULT_PROLOG();

    auto const end = HTRY( end_node() );

    return hnet::walk( store_, end, upstream_order() );
}

auto Network::convert_legacy_node_types()
    -> Result< uint32_t >
{
    HN_RESULT_PROLOG();

    auto rv = HNET_MAKE_RESULT( uint32_t );
    auto count = uint32_t{ 0 };

    for( auto const& ni : HTRY( walk() ) )
    {
        auto& n = store_.at( ni );

        if( n.type == NodeType::baseflow )
        {
            n.type = NodeType::other;
            n.flags.natural_flow = true;

            HN_LOG_MSG( "network.convert", fmt::format( "{}: BFL -> OTH, natural flow", n.id ) );

            ++count;
        }
        else if( n.type == NodeType::import )
        {
            n.type = NodeType::other;
            n.flags.import = true;

            HN_LOG_MSG( "network.convert", fmt::format( "{}: IMP -> OTH, import", n.id ) );

            ++count;
        }
    }

    rv = count;

    return rv;
}

auto Network::reset_computational_order()
    -> Result< void >
{
    HN_RESULT_PROLOG();

    auto rv = HNET_MAKE_RESULT( void );
    auto const end = HTRY( end_node() );
    auto nstore = store_;

    HTRY( detail::assign_computational_order( nstore, end, upstream_order() ) );

    store_ = std::move( nstore );

    rv = outcome::success();

    return rv;
}

auto Network::validate() const
    -> Result< void >
{
    HN_RESULT_PROLOG();

    auto rv = HNET_MAKE_RESULT( void );
    auto const end = HTRY( end_node() );
    auto const live = store_.live_nodes();
    auto const count = static_cast< uint32_t >( live.size() );

    HNET_ENSURE_MSG( store_.at( end ).type == NodeType::end, error_code::structure::missing_end_node, store_.at( end ).id );
    HNET_ENSURE_MSG( !store_.at( end ).downstream, error_code::structure::adjacency_mismatch, store_.at( end ).id );

    {
        auto ids = std::set< std::string >{};

        for( auto const& ni : live )
        {
            auto const& n = store_.at( ni );

            HNET_ENSURE_MSG( ids.emplace( boost::to_lower_copy( n.id ) ).second, error_code::structure::duplicate_id, n.id );
            HNET_ENSURE_MSG( ni == end || n.type != NodeType::end, error_code::structure::multiple_end_nodes, n.id );
            HNET_ENSURE_MSG( ni == end || n.downstream, error_code::structure::multiple_end_nodes, n.id );

            if( n.downstream )
            {
                auto const ds = n.downstream.value();

                HNET_ENSURE_MSG( store_.exists( ds ), error_code::structure::adjacency_mismatch, n.id );

                auto const& dups = store_.at( ds ).upstream;

                HNET_ENSURE_MSG( ranges::count( dups, ni ) == 1, error_code::structure::adjacency_mismatch, n.id );
            }

            for( auto const& [ pos, ui ] : n.upstream | ranges::views::enumerate )
            {
                HNET_ENSURE_MSG( store_.exists( ui ) && store_.at( ui ).downstream == ni, error_code::structure::adjacency_mismatch, n.id );
                HNET_ENSURE_MSG( store_.at( ui ).tributary_number == pos + 1, error_code::structure::invalid_order, store_.at( ui ).id );
            }

            // Downstream chase must terminate at End in fewer than N steps.
            auto cur = ni;
            auto steps = uint32_t{ 0 };

            while( store_.at( cur ).downstream )
            {
                HNET_ENSURE_MSG( ++steps < count, error_code::structure::cycle_detected, n.id );

                auto const next = store_.at( cur ).downstream.value();

                HNET_ENSURE_MSG( store_.at( cur ).serial > store_.at( next ).serial, error_code::structure::invalid_order, store_.at( cur ).id );

                cur = next;
            }

            HNET_ENSURE_MSG( cur == end, error_code::structure::cycle_detected, n.id );
        }
    }

    auto const seq = HTRY( walk() );

    HNET_ENSURE_MSG( seq.size() == count
                   , error_code::structure::cycle_detected
                   , fmt::format( "walk visited {} of {} nodes", seq.size(), count ) );

    for( auto const& [ i, ni ] : seq | ranges::views::enumerate )
    {
        auto const& n = store_.at( ni );

        HNET_ENSURE_MSG( n.computational_order == i + 1, error_code::structure::invalid_order, n.id );
        HNET_ENSURE_MSG( n.serial >= 1 && n.serial <= count, error_code::structure::invalid_order, n.id );
    }

    {
        auto serials = std::set< uint32_t >{};

        for( auto const& ni : live )
        {
            serials.emplace( store_.at( ni ).serial );
        }

        HNET_ENSURE_MSG( serials.size() == count, error_code::structure::invalid_order, "serial numbers are not unique" );
    }

    rv = outcome::success();

    return rv;
}

auto Network::update_location( NodeIndex const& node
                             , geometry::Point const& location )
    -> Result< void >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "node", node );

    HNET_ENSURE( exists( node ), error_code::network::invalid_node );

    store_.at( node ).location = location;

    return outcome::success();
}

auto Network::clear_location( NodeIndex const& node )
    -> Result< void >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "node", node );

    HNET_ENSURE( exists( node ), error_code::network::invalid_node );

    store_.at( node ).location = nullopt;

    return outcome::success();
}

auto Network::update_flags( NodeIndex const& node
                          , NodeFlags const& flags )
    -> Result< void >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "node", node );

    HNET_ENSURE( exists( node ), error_code::network::invalid_node );

    store_.at( node ).flags = flags;

    return outcome::success();
}

auto Network::update_description( NodeIndex const& node
                                , std::string const& description )
    -> Result< void >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "node", node );
        HN_RESULT_PUSH( "description", description );

    HNET_ENSURE( exists( node ), error_code::network::invalid_node );

    store_.at( node ).description = description;

    return outcome::success();
}

auto Network::extent() const
    -> geometry::Extent
{
    auto xs = std::vector< double >{};
    auto ys = std::vector< double >{};

    for( auto const& ni : store_.live_nodes() )
    {
        if( auto const& loc = store_.at( ni ).location
          ; loc )
        {
            xs.emplace_back( loc->x );
            ys.emplace_back( loc->y );
        }
    }

    if( xs.empty() )
    {
        return geometry::Extent{};
    }

    auto rv = geometry::Extent{ .lx = ranges::min( xs )
                              , .by = ranges::min( ys )
                              , .rx = ranges::max( xs )
                              , .ty = ranges::max( ys ) };

    // A single point or a straight line still needs an area to lay out in.
    if( rv.width() <= 0.0 )
    {
        rv.rx = rv.lx + 1.0;
    }
    if( rv.height() <= 0.0 )
    {
        rv.ty = rv.by + 1.0;
    }

    return rv;
}

namespace detail {

auto assign_computational_order( NodeStore& store
                               , NodeIndex const& end
                               , UpstreamOrder const order )
    -> Result< NodeIndexVec >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "end", end );

    auto rv = HNET_MAKE_RESULT( NodeIndexVec );
    auto const seq = HTRY( hnet::walk( store, end, order ) );

    HNET_ENSURE_MSG( seq.size() == store.size()
                   , error_code::structure::cycle_detected
                   , fmt::format( "walk visited {} of {} nodes", seq.size(), store.size() ) );

    for( auto const& [ i, ni ] : seq | ranges::views::enumerate )
    {
        store.at( ni ).computational_order = static_cast< uint32_t >( i + 1 );
    }

    // Downstream neighbors come later in the walk, so a reverse pass sees each node's downstream level first.
    for( auto const& ni : seq | ranges::views::reverse )
    {
        auto& n = store.at( ni );

        if( !n.downstream )
        {
            n.reach_level = 1;
        }
        else
        {
            auto const& ds = store.at( n.downstream.value() );

            n.reach_level = ( ds.reach_counter == n.reach_counter )
                          ? ds.reach_level
                          : ds.reach_level + 1;
        }
    }

    rv = seq;

    return rv;
}

auto unique_id( NodeStore const& store
              , std::string const& id )
    -> std::string
{
    if( !store.find_index( id ) )
    {
        return id;
    }

    for( auto i = uint32_t{ 1 }; ; ++i )
    {
        auto const candidate = fmt::format( "{}_{}", id, i );

        if( !store.find_index( candidate ) )
        {
            return candidate;
        }
    }
}

auto as_anchor( Result< NodeIndex > const& found
              , std::string const& id )
    -> Result< NodeIndex >
{
    auto rv = found;

    if( !found && found.error().ec == error_code::network::node_not_found )
    {
        rv = HNET_MAKE_ERROR_MSG( error_code::network::anchor_not_found, id );
    }

    return rv;
}

} // namespace detail

} // namespace hnet
