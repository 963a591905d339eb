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
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/view/enumerate.hpp>

#include <algorithm>
#include <map>
#include <vector>

namespace hnet {

namespace {

struct ReachFrame
{
    NodeIndex node;
    NodeIndex parent;
    uint32_t position = 0;
};

// Preorder over the tree from `head`. The last upstream branch of a node continues its reach; every other branch opens
// the next reach number, allocated in visitation order.
auto assign_reaches( NodeStore& store
                   , NodeIndex const& head )
    -> Result< uint32_t >
{
    auto highest = uint32_t{ 1 };
    auto visited = uint32_t{ 1 };
    auto stack = std::vector< ReachFrame >{};
    auto const push_upstream = [ & ]( NodeIndex const& parent )
    {
        auto const& ups = store.at( parent ).upstream;

        for( auto i = ups.size(); i > 0; --i )
        {
            stack.emplace_back( ReachFrame{ ups[ i - 1 ], parent, static_cast< uint32_t >( i - 1 ) } );
        }
    };

    {
        auto& h = store.at( head );

        h.reach_counter = 1;
        h.node_in_reach = 1;
        h.tributary_number = 1;
    }

    push_upstream( head );

    while( !stack.empty() )
    {
        auto const frame = stack.back();

        stack.pop_back();

        auto const& p = store.at( frame.parent );
        auto& n = store.at( frame.node );

        if( frame.position + 1 == p.upstream.size() )
        {
            n.reach_counter = p.reach_counter;
            n.node_in_reach = p.node_in_reach + 1;
        }
        else
        {
            n.reach_counter = ++highest;
            n.node_in_reach = 1;
        }

        n.tributary_number = frame.position + 1;
        ++visited;

        HNET_ENSURE_MSG( visited <= store.size()
                       , error_code::structure::cycle_detected
                       , fmt::format( "{} revisited while numbering reaches", n.id ) );

        push_upstream( frame.node );
    }

    return visited;
}

} // namespace anon

auto Network::rebuild( NodeRecords const& records
                     , RebuildOrder const order )
    -> Result< void >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "records", std::to_string( records.size() ) );

    auto rv = HNET_MAKE_RESULT( void );

    BC_CONTRACT()
        BC_POST([ & ]
        {
            if( rv )
            {
                BC_ASSERT( size() == records.size() );
                BC_ASSERT( store_.at( end_.value() ).type == NodeType::end );
            }
        })
    ;

    HNET_ENSURE( !records.empty(), error_code::structure::empty_network );

    auto recs = records;

    if( order == RebuildOrder::tail_first )
    {
        std::reverse( recs.begin(), recs.end() );
    }

    auto const& head = recs.front();

    HNET_ENSURE_MSG( head.type == NodeType::end && head.downstream_id.empty()
                   , error_code::structure::missing_end_node
                   , fmt::format( "head record '{}' is not an end node", head.id ) );
    HNET_ENSURE_MSG( ranges::count_if( recs, []( auto const& r ){ return r.type == NodeType::end; } ) == 1
                   , error_code::structure::multiple_end_nodes
                   , "more than one end record" );

    auto nstore = NodeStore{};
    auto by_id = std::map< std::string, NodeIndex >{};

    for( auto const& r : recs )
    {
        auto const ni = nstore.create( Node{ .id = r.id
                                           , .type = r.type
                                           , .flags = r.flags
                                           , .description = r.description
                                           , .link = r.link
                                           , .location = r.location } );

        HNET_ENSURE_MSG( !r.id.empty(), error_code::common::invalid_argument, "record with empty id" );
        HNET_ENSURE_MSG( by_id.emplace( boost::to_lower_copy( r.id ), ni ).second, error_code::structure::duplicate_id, r.id );
    }

    auto const resolve = [ & ]( std::string const& rid ) -> Result< NodeIndex >
    {
        if( auto const it = by_id.find( boost::to_lower_copy( rid ) )
          ; it != by_id.end() )
        {
            return it->second;
        }

        return HNET_MAKE_ERROR_MSG( error_code::structure::unresolved_id, rid );
    };

    for( auto const& [ i, r ] : recs | ranges::views::enumerate )
    {
        auto const self = NodeIndex{ static_cast< uint32_t >( i ) };

        for( auto const& uid : r.upstream_ids )
        {
            auto const ui = HTRY( resolve( uid ) );

            HNET_ENSURE_MSG( ui != NodeIndex{ 0 }
                           , error_code::structure::cycle_detected
                           , fmt::format( "{} lists end node {} upstream", r.id, uid ) );
            HNET_ENSURE_MSG( ui != self && !nstore.at( ui ).downstream
                           , error_code::structure::adjacency_mismatch
                           , fmt::format( "{} is listed upstream of more than one node", uid ) );

            HTRY( nstore.add_upstream_node( self, ui ) );
        }
    }

    for( auto const& [ i, r ] : recs | ranges::views::enumerate )
    {
        auto const self = NodeIndex{ static_cast< uint32_t >( i ) };

        if( i == 0 )
        {
            continue;
        }

        HNET_ENSURE_MSG( !r.downstream_id.empty(), error_code::structure::multiple_end_nodes, r.id );

        auto const ds = HTRY( resolve( r.downstream_id ) );

        HNET_ENSURE_MSG( nstore.at( self ).downstream == ds
                       , error_code::structure::adjacency_mismatch
                       , fmt::format( "{} names {} downstream, which does not list it upstream", r.id, r.downstream_id ) );
    }

    auto const head_index = NodeIndex{ 0 };
    auto const reached = HTRY( assign_reaches( nstore, head_index ) );

    HNET_ENSURE_MSG( reached == nstore.size()
                   , error_code::structure::cycle_detected
                   , fmt::format( "{} of {} records are not connected to {}", nstore.size() - reached, nstore.size(), head.id ) );

    auto const seq = HTRY( detail::assign_computational_order( nstore, head_index, upstream_order() ) );
    auto const count = static_cast< uint32_t >( seq.size() );

    for( auto const& ni : seq )
    {
        auto& n = nstore.at( ni );

        n.serial = count + 1 - n.computational_order;
    }

    store_ = std::move( nstore );
    end_ = head_index;

    HN_LOG_MSG( "network.rebuild", fmt::format( "rebuilt {} nodes", count ) );

    rv = outcome::success();

    return rv;
}

auto Network::export_records() const
    -> Result< NodeRecords >
{
    HN_RESULT_PROLOG();

    auto rv = HNET_MAKE_RESULT( NodeRecords );
    auto recs = NodeRecords{};

    for( auto const& ni : HTRY( walk() ) )
    {
        auto const& n = store_.at( ni );
        auto rec = NodeRecord{ .id = n.id
                             , .type = n.type
                             , .flags = n.flags
                             , .description = n.description
                             , .link = n.link
                             , .location = n.location
                             , .downstream_id = n.downstream ? store_.at( n.downstream.value() ).id : std::string{} };

        for( auto const& ui : n.upstream )
        {
            rec.upstream_ids.emplace_back( store_.at( ui ).id );
        }

        recs.emplace_back( std::move( rec ) );
    }

    rv = std::move( recs );

    return rv;
}

} // namespace hnet
