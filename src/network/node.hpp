/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef HNET_NETWORK_NODE_HPP
#define HNET_NETWORK_NODE_HPP

#include <common.hpp>
#include "geometry/point.hpp"
#include "network/node_type.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace hnet {

// Which upstream branch the absolute and computational walks prefer.
// tribs_added_first: the most recently added branch is walked first and the first-added branch is the one that leads into the confluence.
// tribs_added_last: branches are walked in the order they were added.
enum class UpstreamOrder
{
    tribs_added_first
,   tribs_added_last
};

struct NodeFlags
{
    bool natural_flow = false;
    bool import = false;
    bool dry_river = false;

    bool operator==( NodeFlags const& ) const = default;
};

struct Node
{
    std::string id = {};
    NodeType type = NodeType::unknown;
    NodeFlags flags = {};
    std::string description = {};
    int64_t link = 0;
    // Ordering metadata. Maintained by Network; not caller-settable.
    uint32_t serial = 0;
    uint32_t computational_order = 0;
    uint32_t reach_counter = 0;
    uint32_t node_in_reach = 0;
    uint32_t tributary_number = 0;
    uint32_t reach_level = 0;
    Optional< geometry::Point > location = {};
    Optional< NodeIndex > downstream = {};
    NodeIndexVec upstream = {};
    bool detached = false;
};

/**
 * Arena owning every node a Network has created. Indices are stable: deleted nodes are detached, not erased.
 * Mutual adjacency is maintained by the link operations, never by writing Node::downstream/upstream directly.
 */
class NodeStore
{
    std::vector< Node > nodes_ = {};

public:
    auto create( Node node )
        -> NodeIndex;
    auto exists( NodeIndex const& idx ) const
        -> bool;
    auto at( NodeIndex const& idx ) const
        -> Node const&;
    auto at( NodeIndex const& idx )
        -> Node&;
    auto capacity() const
        -> uint32_t;
    auto size() const
        -> uint32_t;
    auto live_nodes() const
        -> NodeIndexVec;
    auto find_index( std::string const& id ) const
        -> Optional< NodeIndex >;

    /**
     * @brief Bounds-checked access to the upstream list.
     */
    auto fetch_upstream( NodeIndex const& self
                       , uint32_t const position ) const
        -> Result< NodeIndex >;
    auto fetch_upstream_position( NodeIndex const& parent
                                , NodeIndex const& child ) const
        -> Result< uint32_t >;
    /**
     * @brief Appends `node` to `self`'s upstream list and points `node` downstream at `self`.
     */
    auto add_upstream_node( NodeIndex const& self
                          , NodeIndex const& node )
        -> Result< void >;
    /**
     * @brief Splices `node` between `self` and `self`'s downstream neighbor. The old neighbor's upstream entry for `self` is re-homed to `node`.
     */
    auto add_downstream_node( NodeIndex const& self
                            , NodeIndex const& node )
        -> Result< void >;
    auto detach( NodeIndex const& idx )
        -> Result< void >;
};

auto iequals_id( std::string const& lhs
               , std::string const& rhs )
    -> bool;
auto to_string( Node const& node )
    -> std::string;

} // namespace hnet

#endif // HNET_NETWORK_NODE_HPP
