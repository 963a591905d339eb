/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef HNET_NETWORK_OPTION_HPP
#define HNET_NETWORK_OPTION_HPP

#include <common.hpp>
#include "geometry/point.hpp"
#include "network/node.hpp"

#include <boost/json.hpp>

#include <string>

namespace hnet {

struct InterpolationOptions
{
    double node_spacing = 0.0; // 0 derives 6% of the smaller bounds dimension.
    Optional< geometry::Extent > bounds = {}; // Unset uses the extent of located nodes.
};

struct NetworkOptions
{
    UpstreamOrder upstream_order = UpstreamOrder::tribs_added_first;
    bool treat_dry_as_natural_flow = false;
    bool create_end_node = true;
    std::string end_node_id = "END";
    InterpolationOptions interpolation = {};

    /**
     * Recognized keys, all optional:
     *   "upstream_order": "tribs_added_first" | "tribs_added_last"
     *   "treat_dry_as_natural_flow": bool
     *   "create_end_node": bool
     *   "end_node_id": string
     *   "interpolation": { "node_spacing": number, "bounds": { "lx", "by", "rx", "ty" } }
     */
    static auto from_json( boost::json::object const& obj )
        -> Result< NetworkOptions >;
    static auto from_json_string( std::string const& text )
        -> Result< NetworkOptions >;
};

auto to_string( UpstreamOrder const order )
    -> std::string;
auto upstream_order_from_string( std::string const& order )
    -> Result< UpstreamOrder >;

} // namespace hnet

#endif // HNET_NETWORK_OPTION_HPP
