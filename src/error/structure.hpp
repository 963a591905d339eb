/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef HNET_EC_STRUCTURE_HPP
#define HNET_EC_STRUCTURE_HPP

#include "error/master.hpp"

namespace hnet::error_code
{

// Malformed graph conditions. Always fatal to the operation that meets them.
enum class structure
{
    success = 0
,   adjacency_mismatch
,   cycle_detected
,   duplicate_id
,   empty_network
,   invalid_order
,   missing_end_node
,   multiple_end_nodes
,   no_progress
,   unresolved_id
};

} // namespace hnet::error_code

namespace boost::system
{

template <>
struct is_error_code_enum< hnet::error_code::structure > : std::true_type
{
};

} // namespace boost::system

namespace hnet::error_code::detail
{

class structure_category : public boost::system::error_category
{
public:
    virtual const char* name() const noexcept override final { return "structure error"; }
    virtual std::string message( int c ) const override final
    {
        using namespace hnet::error_code;

        switch ( static_cast< structure >( c ) )
        {
        case structure::success: return "success";
        case structure::adjacency_mismatch: return "upstream/downstream references disagree";
        case structure::cycle_detected: return "cycle detected";
        case structure::duplicate_id: return "duplicate node id";
        case structure::empty_network: return "network has no nodes";
        case structure::invalid_order: return "ordering metadata inconsistent";
        case structure::missing_end_node: return "no end node";
        case structure::multiple_end_nodes: return "more than one end node";
        case structure::no_progress: return "traversal made no progress";
        case structure::unresolved_id: return "unresolved node id";
        }

        return "unknown";
    }
};

} // namespace hnet::error_code::detail

extern inline
auto structure_category()
    -> hnet::error_code::detail::structure_category const&
{
  static hnet::error_code::detail::structure_category c;

  return c;
}

namespace hnet::error_code
{

inline
auto make_error_code( structure ec )
    -> boost::system::error_code
{
  return { static_cast< int >( ec )
         , ::structure_category() };
}

} // namespace hnet::error_code

#endif // HNET_EC_STRUCTURE_HPP
