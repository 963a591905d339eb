/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef HNET_NETWORK_TRAVERSE_HPP
#define HNET_NETWORK_TRAVERSE_HPP

#include <common.hpp>
#include "network/node.hpp"

namespace hnet {

enum class Position
{
    relative      // Immediate neighbor.
,   absolute      // Terminal node in the given direction.
,   reach         // End of the current reach in the given direction.
,   computational // Neighbor in the canonical visitation order.
};

/**
 * Traversal primitives. Each returns `node` itself when there is nowhere to go in the requested direction.
 * Walks that cannot terminate within the arena's size fail with error_code::structure::cycle_detected.
 */
auto fetch_downstream( NodeStore const& store
                     , NodeIndex const& node
                     , Position const pos
                     , UpstreamOrder const order )
    -> Result< NodeIndex >;
auto fetch_upstream( NodeStore const& store
                   , NodeIndex const& node
                   , Position const pos
                   , UpstreamOrder const order )
    -> Result< NodeIndex >;
/**
 * @brief The upstream neighbor continuing `node`'s reach, if any.
 */
auto fetch_upstream_in_reach( NodeStore const& store
                            , NodeIndex const& node )
    -> Result< Optional< NodeIndex > >;
/**
 * @brief Every node, in computational order, starting from the absolute upstream node of the tree containing `from`.
 *
 * Fails with structure::no_progress if a non-terminal node fails to advance, or structure::cycle_detected if the walk revisits a node.
 */
auto walk( NodeStore const& store
         , NodeIndex const& from
         , UpstreamOrder const order )
    -> Result< NodeIndexVec >;

} // namespace hnet

#endif // HNET_NETWORK_TRAVERSE_HPP
