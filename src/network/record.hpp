/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef HNET_NETWORK_RECORD_HPP
#define HNET_NETWORK_RECORD_HPP

#include <common.hpp>
#include "geometry/point.hpp"
#include "network/node.hpp"

#include <string>
#include <vector>

namespace hnet {

// Flat, id-linked view of a node. What a serialization layer reads and writes.
struct NodeRecord
{
    std::string id = {};
    NodeType type = NodeType::unknown;
    NodeFlags flags = {};
    std::string description = {};
    int64_t link = 0;
    Optional< geometry::Point > location = {};
    std::string downstream_id = {}; // Empty for the end node.
    StringVec upstream_ids = {};    // Order is significant: it is the tributary order.
};

using NodeRecords = std::vector< NodeRecord >;

enum class RebuildOrder
{
    head_first // End node is the first record.
,   tail_first // End node is the last record, as produced by Network::export_records.
};

} // namespace hnet

#endif // HNET_NETWORK_RECORD_HPP
