/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef HNET_UTIL_RESULT_HPP
#define HNET_UTIL_RESULT_HPP

#include <common.hpp>
#include <util/log/log.hpp>

#include <concepts>
#include <string>
#include <variant>
#include <vector>

#define HN_RESULT_PROLOG() \
    auto hn_result_local_state = hnet::result::LocalState{};
#define HN_RESULT_PUSH( key, value ) \
    hn_result_local_state.log.push( { key, hnet::result::to_log_value( value ) } );

namespace hnet::result {

class LocalLog
{
public:
    struct MultiValue
    {
        using ValueVariant = std::variant< std::string
                                         , std::vector< MultiValue > >;

        std::string key = {};
        ValueVariant value = {};
    };

private:
    std::string function_ = {};
    std::vector< MultiValue > kvs = {};

public:
    LocalLog( const char* function = __builtin_FUNCTION() /* TODO: replace with std::source_location */ );

    auto function() const
        -> std::string const&;
    auto push( MultiValue const& mv )
        -> void;
    auto values() const
        -> std::vector< MultiValue > const&;
};

struct LocalState
{
    LocalState( const char* function = __builtin_FUNCTION() /* TODO: replace with std::source_location */ );

    LocalLog log;
};

auto to_string( LocalLog const& state )
    -> std::string;
auto to_string( LocalLog::MultiValue const& mv )
    -> std::string;
auto to_string( std::vector< LocalLog::MultiValue > const& mvs )
    -> std::string;

inline
auto to_log_value( NodeIndex const& idx )
    -> LocalLog::MultiValue::ValueVariant
{
    return { std::to_string( idx.value() ) };
}

template< typename T >
auto to_log_value( T const& t )
    -> LocalLog::MultiValue::ValueVariant
{
    if constexpr( std::convertible_to< T, std::string >
               || std::convertible_to< T, std::vector< LocalLog::MultiValue > > )
    {
        return { t };
    }
    else
    {
        using std::to_string;

        return { to_string( t ) };
    }
}

} // namespace hnet::result

#endif // HNET_UTIL_RESULT_HPP
