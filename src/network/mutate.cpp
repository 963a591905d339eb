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
#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <algorithm>
#include <map>

namespace hnet {

namespace {

// Offset applied when a new node has nothing to be placed relative to but its downstream anchor.
constexpr auto location_epsilon = 0.001;

auto max_upstream_serial( NodeStore const& store
                        , NodeIndex const& root )
    -> uint32_t
{
    auto rv = store.at( root ).serial;
    auto stack = NodeIndexVec{ root };

    while( !stack.empty() )
    {
        auto const ni = stack.back();

        stack.pop_back();

        rv = std::max( rv, store.at( ni ).serial );

        for( auto const& ui : store.at( ni ).upstream )
        {
            stack.emplace_back( ui );
        }
    }

    return rv;
}

auto max_reach_counter( NodeStore const& store )
    -> uint32_t
{
    auto rv = uint32_t{ 0 };

    for( auto const& ni : store.live_nodes() )
    {
        rv = std::max( rv, store.at( ni ).reach_counter );
    }

    return rv;
}

auto derive_location( NodeStore const& store
                    , NodeIndex const& down
                    , Optional< NodeIndex > const& up )
    -> Optional< geometry::Point >
{
    auto const& dloc = store.at( down ).location;

    if( !dloc )
    {
        return nullopt;
    }

    if( up )
    {
        if( auto const& uloc = store.at( up.value() ).location
          ; uloc )
        {
            return geometry::midpoint( dloc.value(), uloc.value() );
        }
    }

    if( auto const& dds = store.at( down ).downstream
      ; dds )
    {
        if( auto const& ddloc = store.at( dds.value() ).location
          ; ddloc )
        {
            return dloc.value() + ( dloc.value() - ddloc.value() );
        }
    }

    return dloc.value() + geometry::Point{ location_epsilon, location_epsilon };
}

// Adjacency externalized to ids.
struct IdLinks
{
    std::string downstream = {};
    StringVec upstream = {};
};

} // namespace anon

auto Network::insert_node( NodeSpec const& spec
                         , std::string const& downstream_id
                         , Optional< std::string > const& upstream_id )
    -> Result< NodeIndex >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "id", spec.id );
        HN_RESULT_PUSH( "downstream", downstream_id );
        HN_RESULT_PUSH( "upstream", upstream_id ? upstream_id.value() : std::string{ "<none>" } );

    auto rv = HNET_MAKE_RESULT( NodeIndex );
    auto const prev_size = size();

    BC_CONTRACT()
        BC_POST([ & ]
        {
            if( rv )
            {
                auto const& n = store_.at( rv.value() );

                BC_ASSERT( n.downstream );
                BC_ASSERT( iequals_id( store_.at( n.downstream.value() ).id, downstream_id ) );
                BC_ASSERT( size() == prev_size + 1 );
            }
        })
    ;

    HNET_ENSURE_MSG( !spec.id.empty(), error_code::common::invalid_argument, "node id is empty" );
    HNET_ENSURE_MSG( spec.type != NodeType::end, error_code::network::end_node, spec.id );

    auto const end = HTRY( end_node() );
    auto const find_anchor = [ & ]( std::string const& id ){ return detail::as_anchor( find_node( id ), id ); };
    auto const d = HTRY( find_anchor( downstream_id ) );
    auto const u = upstream_id
                 ? Optional< NodeIndex >{ HTRY( find_anchor( upstream_id.value() ) ) }
                 : Optional< NodeIndex >{};
    auto nstore = store_;
    auto const existing_branch = u && ranges::find( nstore.at( d ).upstream, u.value() ) != nstore.at( d ).upstream.end();
    auto const d_had_upstream = !nstore.at( d ).upstream.empty();
    auto const id = detail::unique_id( nstore, spec.id );
    auto const serial_floor = [ & ]
    {
        if( existing_branch )
        {
            return nstore.at( u.value() ).serial - 1;
        }
        else if( upstream_order() == UpstreamOrder::tribs_added_first )
        {
            // The newest branch is walked first: above everything already upstream of the anchor.
            return max_upstream_serial( nstore, d );
        }
        else
        {
            // The newest branch is walked last: immediately before the anchor.
            return nstore.at( d ).serial;
        }
    }();
    auto const location = derive_location( nstore, d, u );
    auto const ni = nstore.create( Node{ .id = id
                                       , .type = spec.type
                                       , .flags = spec.flags
                                       , .description = spec.description
                                       , .link = spec.link
                                       , .location = location } );

    if( existing_branch )
    {
        auto const& un = nstore.at( u.value() );
        auto const reach = un.reach_counter;
        auto const nir = un.node_in_reach;

        HTRY( nstore.add_downstream_node( u.value(), ni ) );

        for( auto const& e : nstore.live_nodes() )
        {
            if( auto& n = nstore.at( e )
              ; e != ni && n.reach_counter == reach && n.node_in_reach >= nir )
            {
                ++n.node_in_reach;
            }
        }

        nstore.at( ni ).reach_counter = reach;
        nstore.at( ni ).node_in_reach = nir;
    }
    else
    {
        auto const next_reach = max_reach_counter( nstore ) + 1;

        HTRY( nstore.add_upstream_node( d, ni ) );

        if( d_had_upstream )
        {
            nstore.at( ni ).reach_counter = next_reach;
            nstore.at( ni ).node_in_reach = 1;
        }
        else
        {
            nstore.at( ni ).reach_counter = nstore.at( d ).reach_counter;
            nstore.at( ni ).node_in_reach = nstore.at( d ).node_in_reach + 1;
        }
    }

    for( auto const& e : nstore.live_nodes() )
    {
        if( auto& n = nstore.at( e )
          ; e != ni && n.serial > serial_floor )
        {
            ++n.serial;
        }
    }

    nstore.at( ni ).serial = serial_floor + 1;

    HTRY( detail::assign_computational_order( nstore, end, upstream_order() ) );

    store_ = std::move( nstore );

    if( id != spec.id )
    {
        auto const msg = fmt::format( "id '{}' is taken; assigned '{}'", spec.id, id );

        push_advisory( Advisory{ .kind = AdvisoryKind::duplicate_id
                               , .node_id = id
                               , .message = msg } );

        HN_LOG_MSG( "network.insert", msg );
    }

    HN_LOG_MSG( "network.insert", fmt::format( "inserted {}", to_string( store_.at( ni ) ) ) );

    rv = ni;

    return rv;
}

auto Network::erase_node( std::string const& id )
    -> Result< void >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "id", id );

    auto rv = HNET_MAKE_RESULT( void );

    BC_CONTRACT()
        BC_POST([ & ]
        {
            if( rv )
            {
                BC_ASSERT( !store_.find_index( id ) || store_.at( store_.find_index( id ).value() ).type == NodeType::end );
            }
        })
    ;

    auto const end = HTRY( end_node() );
    auto const x = HTRY( find_node( id ) );

    if( x == end )
    {
        HN_LOG_MSG( "network.erase", fmt::format( "{} is the end node; nothing erased", id ) );

        rv = outcome::success();

        return rv;
    }

    auto nstore = store_;
    auto const xn = nstore.at( x );

    HNET_ENSURE_MSG( xn.downstream, error_code::structure::adjacency_mismatch, xn.id );

    auto const d = xn.downstream.value();
    auto const d_id = nstore.at( d ).id;
    auto const live = nstore.live_nodes();
    auto links = std::map< NodeIndex, IdLinks >{};
    auto const id_of = [ & ]( NodeIndex const& e ){ return nstore.at( e ).id; };

    for( auto const& e : live )
    {
        auto const& n = nstore.at( e );

        links[ e ] = IdLinks{ .downstream = n.downstream ? id_of( n.downstream.value() ) : std::string{}
                            , .upstream = n.upstream | ranges::views::transform( id_of ) | ranges::to< StringVec >() };
    }

    // Rewrite every reference to the erased id.
    {
        auto& dups = links[ d ].upstream;
        auto const it = ranges::find_if( dups, [ & ]( auto const& e ){ return iequals_id( e, xn.id ); } );
        auto const xups = links[ x ].upstream;

        HNET_ENSURE_MSG( it != dups.end(), error_code::structure::adjacency_mismatch, xn.id );

        dups.insert( dups.erase( it ), xups.begin(), xups.end() );

        for( auto const& ui : xn.upstream )
        {
            links[ ui ].downstream = d_id;
        }

        links.erase( x );
    }

    auto by_id = std::map< std::string, NodeIndex >{};

    for( auto const& [ e, l ] : links )
    {
        by_id.emplace( boost::to_lower_copy( nstore.at( e ).id ), e );
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

    // Branches are ordered so that the walk still visits the highest serials first.
    {
        auto const serial_of = [ & ]( std::string const& sid ){ return nstore.at( by_id.at( boost::to_lower_copy( sid ) ) ).serial; };
        auto& dups = links[ d ].upstream;

        if( upstream_order() == UpstreamOrder::tribs_added_first )
        {
            std::stable_sort( dups.begin(), dups.end(), [ & ]( auto const& lhs, auto const& rhs ){ return serial_of( lhs ) < serial_of( rhs ); } );
        }
        else
        {
            std::stable_sort( dups.begin(), dups.end(), [ & ]( auto const& lhs, auto const& rhs ){ return serial_of( lhs ) > serial_of( rhs ); } );
        }
    }

    HTRY( nstore.detach( x ) );

    for( auto const& [ e, l ] : links )
    {
        nstore.at( e ).downstream = nullopt;
        nstore.at( e ).upstream.clear();
    }

    for( auto const& [ e, l ] : links )
    {
        for( auto const& uid : l.upstream )
        {
            HTRY( nstore.add_upstream_node( e, HTRY( resolve( uid ) ) ) );
        }
    }

    for( auto const& [ e, l ] : links )
    {
        if( !l.downstream.empty() )
        {
            auto const ds = HTRY( resolve( l.downstream ) );

            HNET_ENSURE_MSG( nstore.at( e ).downstream == ds
                           , error_code::structure::adjacency_mismatch
                           , nstore.at( e ).id );
        }
    }

    for( auto const& [ e, l ] : links )
    {
        auto& n = nstore.at( e );

        if( n.serial > xn.serial )
        {
            --n.serial;
        }
        if( n.reach_counter == xn.reach_counter
         && n.node_in_reach > xn.node_in_reach )
        {
            --n.node_in_reach;
        }
    }

    HTRY( detail::assign_computational_order( nstore, end, upstream_order() ) );

    store_ = std::move( nstore );

    HN_LOG_MSG( "network.erase", fmt::format( "erased {}; {} upstream node(s) reattached to {}", xn.id, xn.upstream.size(), d_id ) );

    rv = outcome::success();

    return rv;
}

} // namespace hnet
