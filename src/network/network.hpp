/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef HNET_NETWORK_NETWORK_HPP
#define HNET_NETWORK_NETWORK_HPP

#include <common.hpp>
#include "geometry/point.hpp"
#include "network/advisory.hpp"
#include "network/node.hpp"
#include "network/option.hpp"
#include "network/record.hpp"
#include "network/traverse.hpp"

#include <functional>
#include <string>

namespace hnet {

// Caller-supplied attributes of a node to insert. Ordering metadata is always computed.
struct NodeSpec
{
    std::string id = {};
    NodeType type = NodeType::unknown;
    NodeFlags flags = {};
    std::string description = {};
    int64_t link = 0;
};

// Secondary attribute matched by Network::find_node( NodeData, ... ).
enum class NodeData
{
    id
,   description
,   link
};

using NodePredicate = std::function< bool( Node const& ) >;

/**
 * Owns a stream network rooted at a single End node.
 *
 * Every mutating operation computes its result on a copy of the node arena and commits only on success,
 * so a failed insert, erase or rebuild leaves the network untouched.
 */
class Network
{
    NetworkOptions options_;
    NodeStore store_ = {};
    Optional< NodeIndex > end_ = {};
    Advisories advisories_ = {};

public:
    explicit Network( NetworkOptions const& opts = {} );

    // Core
    [[ nodiscard ]]
    auto options() const
        -> NetworkOptions const&;
    [[ nodiscard ]]
    auto upstream_order() const
        -> UpstreamOrder;
    auto set_treat_dry_as_natural_flow( bool const treat )
        -> void;
    [[ nodiscard ]]
    auto treat_dry_as_natural_flow() const
        -> bool;
    auto end_node() const
        -> Result< NodeIndex >;
    [[ nodiscard ]]
    auto exists( NodeIndex const& node ) const
        -> bool;
    auto fetch_node( NodeIndex const& node ) const
        -> Result< Node >;
    auto fetch_id( NodeIndex const& node ) const
        -> Result< std::string >;
    // Unchecked: `node` must satisfy exists().
    auto node( NodeIndex const& node ) const
        -> Node const&;
    [[ nodiscard ]]
    auto size() const
        -> uint32_t;
    [[ nodiscard ]]
    auto empty() const
        -> bool;
    auto store() const
        -> NodeStore const&;
    auto advisories() const
        -> Advisories const&;
    auto clear_advisories()
        -> void;

    // Traversal
    auto fetch_downstream( NodeIndex const& node
                         , Position const pos ) const
        -> Result< NodeIndex >;
    auto fetch_upstream( NodeIndex const& node
                       , Position const pos ) const
        -> Result< NodeIndex >;
    auto fetch_upstream_at( NodeIndex const& node
                          , uint32_t const position ) const
        -> Result< NodeIndex >;
    auto fetch_upstream_in_reach( NodeIndex const& node ) const
        -> Result< Optional< NodeIndex > >;
    auto most_upstream_node() const
        -> Result< NodeIndex >;
    auto walk() const
        -> Result< NodeIndexVec >;

    // Mutation
    /**
     * @brief Links a new node upstream of `downstream_id`.
     *
     * When `upstream_id` names a node directly upstream of the downstream anchor, the new node is spliced into that branch.
     * Otherwise it starts a new branch. A taken id is disambiguated with a `_<n>` suffix and reported as an advisory.
     */
    auto insert_node( NodeSpec const& spec
                    , std::string const& downstream_id
                    , Optional< std::string > const& upstream_id = nullopt )
        -> Result< NodeIndex >;
    /**
     * @brief Removes `id`, reattaching its upstream children to its downstream neighbor. Erasing the End node is a no-op.
     */
    auto erase_node( std::string const& id )
        -> Result< void >;
    auto rebuild( NodeRecords const& records
                , RebuildOrder const order )
        -> Result< void >;
    auto export_records() const
        -> Result< NodeRecords >;

    // Maintenance
    auto convert_legacy_node_types()
        -> Result< uint32_t >;
    auto reset_computational_order()
        -> Result< void >;
    auto validate() const
        -> Result< void >;

    // Editor
    auto update_location( NodeIndex const& node
                        , geometry::Point const& location )
        -> Result< void >;
    auto clear_location( NodeIndex const& node )
        -> Result< void >;
    auto update_flags( NodeIndex const& node
                     , NodeFlags const& flags )
        -> Result< void >;
    auto update_description( NodeIndex const& node
                           , std::string const& description )
        -> Result< void >;

    // Query
    auto find_node( std::string const& id ) const
        -> Result< NodeIndex >;
    auto find_node( NodeData const data
                  , NodeType const type
                  , std::string const& value ) const
        -> Result< NodeIndex >;
    auto fetch_nodes_for_type( NodeType const type ) const
        -> Result< NodeIndexVec >;
    auto fetch_real_nodes() const
        -> Result< NodeIndexVec >;
    auto fetch_natural_flow_nodes() const
        -> Result< NodeIndexVec >;
    auto count_nodes( NodeType const type ) const
        -> Result< uint32_t >;
    [[ nodiscard ]]
    auto is_natural_flow_like( NodeIndex const& node ) const
        -> bool;
    auto find_downstream_flow_node( NodeIndex const& node ) const
        -> Result< Optional< NodeIndex > >;
    auto find_downstream_natural_flow_node_in_reach( NodeIndex const& node ) const
        -> Result< Optional< NodeIndex > >;
    auto find_upstream_natural_flow_node_in_reach( NodeIndex const& node ) const
        -> Result< Optional< NodeIndex > >;
    /**
     * @brief The nearest upstream flow node on `node`'s reach and on every tributary met while climbing it.
     *
     * `extra`, when set, marks further nodes to be treated as flow nodes.
     * Results are in computational order.
     */
    auto find_upstream_flow_nodes( NodeIndex const& node
                                 , NodePredicate const& extra = {} ) const
        -> Result< NodeIndexVec >;
    /**
     * @brief Every node upstream of `node`, stopping at (and including) any id in `stop_ids`.
     *
     * A stop id prefixed with '-' is excluded from the result. Results are in discovery order, each reach before its tributaries.
     */
    auto find_upstream_nodes( NodeIndex const& node
                            , bool const include_self
                            , StringVec const& stop_ids = {} ) const
        -> Result< NodeIndexVec >;
    auto node_sequence( NodeIndex const& from
                      , NodeIndex const& to ) const
        -> Result< NodeIndexVec >;
    auto find_next_real_downstream_node( NodeIndex const& node ) const
        -> Result< Optional< NodeIndex > >;
    auto find_next_real_or_xconfluence_downstream_node( NodeIndex const& node ) const
        -> Result< Optional< NodeIndex > >;
    auto find_next_xconfluence_downstream_node( NodeIndex const& node ) const
        -> Result< Optional< NodeIndex > >;
    auto is_most_upstream_node_in_reach( NodeIndex const& node ) const
        -> Result< bool >;
    [[ nodiscard ]]
    auto extent() const
        -> geometry::Extent;

protected:
    auto find_downstream_if( NodeIndex const& node
                           , NodePredicate const& pred ) const
        -> Result< Optional< NodeIndex > >;
    auto fetch_nodes_if( NodePredicate const& pred ) const
        -> Result< NodeIndexVec >;
    auto push_advisory( Advisory const& advisory )
        -> void;
};

/**
 * Ordering recomputation over an arena. Exposed for Network's implementation units.
 */
namespace detail {

// Assigns computational_order 1..N and reach_level from a full walk. Leaves serial untouched.
auto assign_computational_order( NodeStore& store
                               , NodeIndex const& end
                               , UpstreamOrder const order )
    -> Result< NodeIndexVec >;
auto unique_id( NodeStore const& store
              , std::string const& id )
    -> std::string;
// Reports a lookup that found nothing as network::anchor_not_found. Any other failure propagates unchanged.
auto as_anchor( Result< NodeIndex > const& found
              , std::string const& id )
    -> Result< NodeIndex >;

} // namespace detail

} // namespace hnet

#endif // HNET_NETWORK_NETWORK_HPP
