/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "geometry/interpolate.hpp"

#include "error/structure.hpp"
#include "util/result.hpp"

#include <algorithm>
#include <vector>

namespace hnet::geometry {

namespace {

constexpr auto default_spacing_fraction = 0.06;
constexpr auto clamp_margin_fraction = 0.05;

// A zero component would stack nodes on a line; fall back to the layout spacing.
auto nonzero_step( Point const& step
                 , double const spacing )
    -> Point
{
    return Point{ step.x == 0.0 ? spacing : step.x
                , step.y == 0.0 ? spacing : step.y };
}

} // namespace anon

Interpolator::Interpolator( Network& nw )
    : Interpolator{ nw, nw.options().interpolation }
{
}

Interpolator::Interpolator( Network& nw
                          , InterpolationOptions const& opts )
    : nw_{ nw }
    , opts_{ opts }
{
}

auto Interpolator::bounds() const
    -> Extent const&
{
    return bounds_;
}

auto Interpolator::node_spacing() const
    -> double
{
    return spacing_;
}

auto Interpolator::fill_locations()
    -> Result< Advisories >
{
    HN_RESULT_PROLOG();

    auto rv = HNET_MAKE_RESULT( Advisories );

    advisories_.clear();

    bounds_ = opts_.bounds ? opts_.bounds.value() : nw_.extent();
    spacing_ = opts_.node_spacing > 0.0
             ? opts_.node_spacing
             : default_spacing_fraction * std::min( bounds_.width(), bounds_.height() );

    HN_LOG_MSG( "geometry.interpolate", fmt::format( "bounds ({}, {})-({}, {}), spacing {}", bounds_.lx, bounds_.by, bounds_.rx, bounds_.ty, spacing_ ) );

    auto const stem = HTRY( fetch_main_stem() );

    HTRY( fill_main_stem( stem ) );
    HTRY( fill_reach_downstream() );
    HTRY( fill_from_downstream() );

    auto const clamped = HTRY( final_check( bounds_, false ) );

    advisories_.insert( advisories_.end(), clamped.begin(), clamped.end() );

    rv = advisories_;

    return rv;
}

auto Interpolator::fetch_main_stem() const
    -> Result< NodeIndexVec >
{
    HN_RESULT_PROLOG();

    auto rv = HNET_MAKE_RESULT( NodeIndexVec );
    auto stem = NodeIndexVec{ HTRY( nw_.end_node() ) };

    while( true )
    {
        HNET_ENSURE( stem.size() <= nw_.size(), error_code::structure::cycle_detected );

        auto const next = HTRY( nw_.fetch_upstream_in_reach( stem.back() ) );

        if( !next )
        {
            break;
        }

        stem.emplace_back( next.value() );
    }

    std::reverse( stem.begin(), stem.end() );

    rv = std::move( stem );

    return rv;
}

auto Interpolator::fill_main_stem( NodeIndexVec const& stem )
    -> Result< void >
{
    HN_RESULT_PROLOG();

    auto rv = HNET_MAKE_RESULT( void );
    auto const loc = [ & ]( std::size_t const i ){ return nw_.node( stem[ i ] ).location.value(); };
    auto anchors = std::vector< std::size_t >{};

    for( auto i = std::size_t{ 0 }; i < stem.size(); ++i )
    {
        if( nw_.node( stem[ i ] ).location )
        {
            anchors.emplace_back( i );
        }
    }

    if( anchors.empty() )
    {
        for( auto i = std::size_t{ 0 }; i < stem.size(); ++i )
        {
            auto const offset = spacing_ * static_cast< double >( i + 1 );

            HTRY( extrapolate( stem[ i ], Point{ bounds_.lx + offset, bounds_.by + offset }, "main stem has no located node" ) );
        }
    }
    else if( anchors.size() == 1 )
    {
        auto const k = anchors.front();
        auto const anchor = loc( k );

        for( auto i = std::size_t{ 0 }; i < stem.size(); ++i )
        {
            if( i != k )
            {
                auto const steps = static_cast< double >( k ) - static_cast< double >( i );

                HTRY( extrapolate( stem[ i ], anchor + Point{ spacing_, spacing_ } * steps, "main stem has one located node" ) );
            }
        }
    }
    else
    {
        for( auto j = std::size_t{ 1 }; j < anchors.size(); ++j )
        {
            auto const a = anchors[ j - 1 ];
            auto const b = anchors[ j ];
            auto const pa = loc( a );
            auto const pb = loc( b );

            for( auto i = a + 1; i < b; ++i )
            {
                auto const t = static_cast< double >( i - a ) / static_cast< double >( b - a );

                HTRY( nw_.update_location( stem[ i ], pa + ( pb - pa ) * t ) );
            }
        }

        // Head: continue away from downstream.
        {
            auto const f = anchors[ 0 ];
            auto const n = anchors[ 1 ];
            auto const pf = loc( f );
            auto const step = nonzero_step( ( pf - loc( n ) ) * ( 1.0 / static_cast< double >( n - f ) ), spacing_ );

            for( auto i = std::size_t{ 0 }; i < f; ++i )
            {
                HTRY( extrapolate( stem[ i ], pf + step * static_cast< double >( f - i ), "upstream of the first located main stem node" ) );
            }
        }
        // Tail: continue downstream.
        {
            auto const l = anchors[ anchors.size() - 1 ];
            auto const p = anchors[ anchors.size() - 2 ];
            auto const pl = loc( l );
            auto const step = nonzero_step( ( pl - loc( p ) ) * ( 1.0 / static_cast< double >( l - p ) ), spacing_ );

            for( auto i = l + 1; i < stem.size(); ++i )
            {
                HTRY( extrapolate( stem[ i ], pl + step * static_cast< double >( i - l ), "downstream of the last located main stem node" ) );
            }
        }
    }

    rv = outcome::success();

    return rv;
}

auto Interpolator::fill_reach_downstream()
    -> Result< void >
{
    HN_RESULT_PROLOG();

    auto rv = HNET_MAKE_RESULT( void );

    for( auto const& ni : HTRY( nw_.walk() ) )
    {
        if( !nw_.node( ni ).location )
        {
            continue;
        }

        auto chain = NodeIndexVec{};
        auto cur = nw_.node( ni ).downstream;

        while( cur && !nw_.node( cur.value() ).location )
        {
            HNET_ENSURE( chain.size() < nw_.size(), error_code::structure::cycle_detected );

            chain.emplace_back( cur.value() );

            cur = nw_.node( cur.value() ).downstream;
        }

        if( !cur || chain.empty() )
        {
            continue;
        }

        auto const from = nw_.node( ni ).location.value();
        auto const to = nw_.node( cur.value() ).location.value();
        auto const segments = static_cast< double >( chain.size() + 1 );

        for( auto j = std::size_t{ 0 }; j < chain.size(); ++j )
        {
            HTRY( nw_.update_location( chain[ j ], from + ( to - from ) * ( static_cast< double >( j + 1 ) / segments ) ) );
        }
    }

    rv = outcome::success();

    return rv;
}

auto Interpolator::fill_from_downstream()
    -> Result< void >
{
    HN_RESULT_PROLOG();

    auto rv = HNET_MAKE_RESULT( void );

    for( auto const& ni : HTRY( nw_.walk() ) )
    {
        if( nw_.node( ni ).location )
        {
            continue;
        }

        auto steps = uint32_t{ 0 };
        auto cur = ni;

        while( !nw_.node( cur ).location )
        {
            auto const& ds = nw_.node( cur ).downstream;

            HNET_ENSURE_MSG( ds && steps < nw_.size(), error_code::structure::cycle_detected, nw_.node( ni ).id );

            cur = ds.value();
            ++steps;
        }

        auto const anchor = nw_.node( cur ).location.value();
        auto const& anchor_ds = nw_.node( cur ).downstream;
        auto const delta = [ & ]
        {
            if( anchor_ds && nw_.node( anchor_ds.value() ).location )
            {
                return nonzero_step( anchor - nw_.node( anchor_ds.value() ).location.value(), spacing_ );
            }

            return Point{ spacing_, spacing_ };
        }();

        HTRY( extrapolate( ni
                         , anchor + delta * static_cast< double >( steps )
                         , fmt::format( "extended from {}", nw_.node( cur ).id ) ) );
    }

    rv = outcome::success();

    return rv;
}

auto Interpolator::extrapolate( NodeIndex const& node
                              , Point const& location
                              , std::string const& how )
    -> Result< void >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "node", node );

    HTRY( nw_.update_location( node, location ) );

    auto const& n = nw_.node( node );
    auto const msg = fmt::format( "{} placed at {}: {}", n.id, to_string( location ), how );

    advisories_.emplace_back( Advisory{ .kind = AdvisoryKind::extrapolated_location
                                      , .node_id = n.id
                                      , .message = msg } );

    HN_LOG_MSG( "geometry.interpolate", msg );

    return outcome::success();
}

auto Interpolator::final_check( Extent const& bounds
                              , bool const clamp_to_zero )
    -> Result< Advisories >
{
    HN_RESULT_PROLOG();

    auto rv = HNET_MAKE_RESULT( Advisories );
    auto clamped = Advisories{};
    auto const wm = bounds.width() * clamp_margin_fraction;
    auto const hm = bounds.height() * clamp_margin_fraction;

    for( auto const& ni : HTRY( nw_.walk() ) )
    {
        auto const& n = nw_.node( ni );

        if( !n.location )
        {
            continue;
        }

        auto const before = n.location.value();
        auto after = before;

        if( clamp_to_zero )
        {
            if( after.x < 0.0 ) { after.x = bounds.lx + wm; }
            if( after.y < 0.0 ) { after.y = bounds.by + hm; }
        }
        else
        {
            if( after.x < bounds.lx ) { after.x = bounds.lx + wm; }
            else if( after.x > bounds.rx ) { after.x = bounds.rx - wm; }
            if( after.y < bounds.by ) { after.y = bounds.by + hm; }
            else if( after.y > bounds.ty ) { after.y = bounds.ty - hm; }
        }

        if( after != before )
        {
            auto const msg = fmt::format( "{} moved from {} to {}", n.id, to_string( before ), to_string( after ) );

            clamped.emplace_back( Advisory{ .kind = AdvisoryKind::bounds_clamp
                                          , .node_id = n.id
                                          , .message = msg } );

            HN_LOG_MSG( "geometry.interpolate", msg );

            HTRY( nw_.update_location( ni, after ) );
        }
    }

    rv = std::move( clamped );

    return rv;
}

} // namespace hnet::geometry
