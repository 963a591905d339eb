/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef HNET_ERROR_RESULT_HPP
#define HNET_ERROR_RESULT_HPP

#include "common.hpp"
#include "error/network.hpp"
#include "error/structure.hpp"

#include <concepts>

namespace hnet::result {

template< typename T
        , typename U >
    requires std::convertible_to< U, T >
auto value_or( hnet::Result< T > const& result
             , U const& u )
    -> T
{
    if( result )
    {
        return result.value();
    }
    else
    {
        return u;
    }
}

} // namespace hnet::result

namespace hnet::error_code {

// StructuralError: the graph itself is malformed.
inline
auto is_structural( Payload const& payload )
    -> bool
{
    return payload.ec.category() == ::structure_category();
}

// NotFoundError: a referenced id or anchor is absent.
inline
auto is_not_found( Payload const& payload )
    -> bool
{
    return payload.ec == network::node_not_found
        || payload.ec == network::anchor_not_found
        || payload.ec == network::upstream_out_of_range;
}

} // namespace hnet::error_code

#endif // HNET_ERROR_RESULT_HPP
