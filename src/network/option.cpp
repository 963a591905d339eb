/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "network/option.hpp"

#include "util/json.hpp"
#include "util/result.hpp"

#include <boost/algorithm/string/predicate.hpp>

namespace hnet {

namespace {

// A missing key keeps the default; a present key of the wrong type is an error.
template< typename T
        , typename Fetch >
auto fetch_optional( boost::json::object const& obj
                   , std::string const& key
                   , Fetch&& fetch
                   , T& dst )
    -> Result< void >
{
    if( obj.contains( key ) )
    {
        dst = HTRY( fetch( obj, key ) );
    }

    return outcome::success();
}

auto fetch_extent( boost::json::object const& obj )
    -> Result< geometry::Extent >
{
    HN_RESULT_PROLOG();

    auto rv = HNET_MAKE_RESULT( geometry::Extent );
    auto const ext = geometry::Extent{ .lx = HTRY( fetch_float( obj, "lx" ) )
                                     , .by = HTRY( fetch_float( obj, "by" ) )
                                     , .rx = HTRY( fetch_float( obj, "rx" ) )
                                     , .ty = HTRY( fetch_float( obj, "ty" ) ) };

    HNET_ENSURE_MSG( ext.rx > ext.lx && ext.ty > ext.by
                   , error_code::common::invalid_argument
                   , "bounds must have positive width and height" );

    rv = ext;

    return rv;
}

} // namespace anon

auto NetworkOptions::from_json( boost::json::object const& obj )
    -> Result< NetworkOptions >
{
    HN_RESULT_PROLOG();

    auto rv = HNET_MAKE_RESULT( NetworkOptions );
    auto opts = NetworkOptions{};

    if( obj.contains( "upstream_order" ) )
    {
        opts.upstream_order = HTRY( upstream_order_from_string( HTRY( fetch_string( obj, "upstream_order" ) ) ) );
    }

    HTRY( fetch_optional( obj, "treat_dry_as_natural_flow", fetch_bool, opts.treat_dry_as_natural_flow ) );
    HTRY( fetch_optional( obj, "create_end_node", fetch_bool, opts.create_end_node ) );
    HTRY( fetch_optional( obj, "end_node_id", fetch_string, opts.end_node_id ) );

    HNET_ENSURE_MSG( !opts.end_node_id.empty(), error_code::common::invalid_argument, "end_node_id" );

    if( obj.contains( "interpolation" ) )
    {
        auto const interp = HTRY( fetch_object( obj, "interpolation" ) );

        HTRY( fetch_optional( interp, "node_spacing", fetch_float, opts.interpolation.node_spacing ) );

        HNET_ENSURE_MSG( opts.interpolation.node_spacing >= 0.0, error_code::common::invalid_numeric, "node_spacing" );

        if( interp.contains( "bounds" ) )
        {
            opts.interpolation.bounds = HTRY( fetch_extent( HTRY( fetch_object( interp, "bounds" ) ) ) );
        }
    }

    rv = opts;

    return rv;
}

auto NetworkOptions::from_json_string( std::string const& text )
    -> Result< NetworkOptions >
{
    HN_RESULT_PROLOG();

    return from_json( HTRY( parse_object( text ) ) );
}

auto to_string( UpstreamOrder const order )
    -> std::string
{
    switch( order )
    {
        case UpstreamOrder::tribs_added_first: return "tribs_added_first";
        case UpstreamOrder::tribs_added_last: return "tribs_added_last";
    }

    return "unknown";
}

auto upstream_order_from_string( std::string const& order )
    -> Result< UpstreamOrder >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "order", order );

    auto rv = HNET_MAKE_RESULT( UpstreamOrder );

    if( boost::iequals( order, "tribs_added_first" ) )
    {
        rv = UpstreamOrder::tribs_added_first;
    }
    else if( boost::iequals( order, "tribs_added_last" ) )
    {
        rv = UpstreamOrder::tribs_added_last;
    }
    else
    {
        rv = HNET_MAKE_ERROR_MSG( error_code::common::conversion_failed, order );
    }

    return rv;
}

} // namespace hnet
