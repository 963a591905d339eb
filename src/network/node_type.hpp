/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef HNET_NETWORK_NODE_TYPE_HPP
#define HNET_NETWORK_NODE_TYPE_HPP

#include <common.hpp>

#include <string>

namespace hnet {

// Values match the legacy integer codes used by network files.
enum class NodeType
{
    blank = 0
,   diversion = 1
,   streamflow = 2
,   confluence = 3
,   instream_flow = 4
,   reservoir = 5
,   import = 6
,   baseflow = 7 // Legacy; see Network::convert_legacy_node_types.
,   end = 8
,   other = 9
,   unknown = 10
,   stream_top = 11
,   label = 12
,   formula = 13
,   well = 14
,   xconfluence = 15
,   diversion_and_well = 16
,   label_node = 17
,   plan = 18
};

enum class TypeLabel
{
    full         // As written in network files.
,   abbreviation // Three letters, as used in station names.
,   verbose      // For people.
};

auto to_string( NodeType const type
              , TypeLabel const label = TypeLabel::full )
    -> std::string;
/**
 * Accepts any full name, abbreviation or legacy alias, case-insensitive.
 */
auto lookup_type( std::string const& type )
    -> Result< NodeType >;
/**
 * Model stations: what "any real node" means for collection queries.
 */
auto is_real_node_type( NodeType const type )
    -> bool;
/**
 * Drawing or bookkeeping elements skipped when looking for the next real station downstream.
 */
auto is_decorative_node_type( NodeType const type )
    -> bool;
auto is_confluence_type( NodeType const type )
    -> bool;

} // namespace hnet

#endif // HNET_NETWORK_NODE_TYPE_HPP
