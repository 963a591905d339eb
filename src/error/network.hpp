/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef HNET_EC_NETWORK_HPP
#define HNET_EC_NETWORK_HPP

#include "error/master.hpp"

namespace hnet::error_code
{

enum class network
{
    success = 0
,   anchor_not_found
,   end_node
,   invalid_node
,   invalid_type
,   node_not_found
,   upstream_out_of_range
};

} // namespace hnet::error_code

namespace boost::system
{

template <>
struct is_error_code_enum< hnet::error_code::network > : std::true_type
{
};

} // namespace boost::system

namespace hnet::error_code::detail
{

class network_category : public boost::system::error_category
{
public:
    // Return a short descriptive name for the category
    virtual const char* name() const noexcept override final { return "network error"; }
    // Return what each enum means in text
    virtual std::string message( int c ) const override final
    {
        using namespace hnet::error_code;

        switch ( static_cast< network >( c ) )
        {
        case network::success: return "success";
        case network::anchor_not_found: return "anchor node not found";
        case network::end_node: return "operation not permitted on end node";
        case network::invalid_node: return "invalid node";
        case network::invalid_type: return "invalid node type";
        case network::node_not_found: return "node not found";
        case network::upstream_out_of_range: return "upstream index out of range";
        }

        return "unknown";
    }
};

} // namespace hnet::error_code::detail

// Note: Ensure this is in global scope
extern inline
auto network_category()
    -> hnet::error_code::detail::network_category const&
{
  static hnet::error_code::detail::network_category c;

  return c;
}

namespace hnet::error_code
{
// Note: make_error_code must be declared in same namespace as enum, for ADL.

inline
auto make_error_code( network ec )
    -> boost::system::error_code
{
  return { static_cast< int >( ec )
         , ::network_category() };
}

} // namespace hnet::error_code

#endif // HNET_EC_NETWORK_HPP
