/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef HNET_COMMON_HPP
#define HNET_COMMON_HPP

#include "error/master.hpp"
#include <util/log/log.hpp> // Make logging common to all.

#include <boost/container_hash/hash.hpp>
#include <boost/functional/hash.hpp>
#include <boost/optional.hpp>
#include <boost/optional/optional_io.hpp>
#include <boost/outcome.hpp>

#include <compare>
#include <cstdint>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace hnet {

using StringSet = std::set< std::string >;
using StringVec = std::vector< std::string >;
template< typename T > using Optional = boost::optional< T >;
template< typename T > using Result = error_code::Result< T >;
inline auto const nullopt = boost::none; // To be replaced by std::nullopt if boost::optional is replaced with std::optional.
template< typename T > struct always_false : std::false_type {};

template< typename T
        , typename Tag >
class StrongType
{
public:
    using value_type = T;

    template< typename = std::enable_if< std::is_default_constructible< T >::value > >
    explicit constexpr StrongType() {}
    explicit constexpr StrongType( T const& t ) : t_{ t } {}
    explicit constexpr StrongType( T&& t ) : t_{ std::move( t ) } {}

    auto value() -> T& { return t_; }
    auto value() const -> T const& { return t_; }

    std::strong_ordering operator<=>( StrongType const& ) const = default;
    bool operator==( StrongType const& ) const = default;

private:
    T t_ = {};
};

template< typename T
        , typename Tag >
auto hash_value( StrongType< T, Tag > const& item )
    -> std::size_t
{
    return boost::hash< T >{}( item.value() );
}

template< typename T
        , typename Tag >
auto operator<<( std::ostream& os
               , StrongType< T, Tag > const& item )
    -> std::ostream&
{
    return os << item.value();
}

// Stable key into a Network's node arena. Never reused while the network lives.
using NodeIndex = StrongType< uint32_t, struct NodeIndexTag >;
using NodeIndexVec = std::vector< NodeIndex >;

} // namespace hnet

#endif // HNET_COMMON_HPP
