/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef HNET_UTIL_CONCEPT_HPP
#define HNET_UTIL_CONCEPT_HPP

#include <concepts>
#include <iterator>

namespace hnet::concepts {

template< typename T >
concept Result = requires( T t )
{
    t.has_value();
    t.has_error();
    t.error();
};

template< typename T >
concept Range = requires( T t )
{
    std::begin( t );
    std::end( t );
};

template< typename T >
concept Boolean = requires( T t )
{
    static_cast< bool >( t );
};

} // namespace hnet::concepts

#endif // HNET_UTIL_CONCEPT_HPP
