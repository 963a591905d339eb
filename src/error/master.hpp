/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef HNET_EC_MASTER_HPP
#define HNET_EC_MASTER_HPP

#if HNET_DEBUG
    #define HNET_LOG_EXCEPTION 1
#endif // HNET_DEBUG

#define HNET_THROW_EXCEPTION_MSG( msg ) \
    ({ \
        hnet::log_exception( ( msg ), __PRETTY_FUNCTION__, __FILE__, __LINE__ ); \
        throw std::runtime_error( fmt::format( "Exception:\n\tmessage: {}\n\t{}|{}|{}", ( msg ), __LINE__, __PRETTY_FUNCTION__, __FILE__ ) ); \
    })
// TODO: Replace macros with std::source_location once the toolchains in use all ship it.
#define HNET_MAKE_RESULT_STACK_ELEM_MSG( msg ) \
    hnet::error_code::StackElement{ __LINE__ \
                                  , __PRETTY_FUNCTION__ \
                                  , __FILE__ \
                                  , ( msg ) }
#define HNET_MAKE_RESULT_STACK_ELEM() HNET_MAKE_RESULT_STACK_ELEM_MSG( "" )
#define HNET_MAKE_ERROR_MSG( ec, msg ) \
    hnet::error_code::Payload{ ( ec ) \
                             , { HNET_MAKE_RESULT_STACK_ELEM_MSG( msg ) } }
#define HNET_MAKE_ERROR( ec ) HNET_MAKE_ERROR_MSG( ec, "" )
#define HNET_MAKE_RESULT_EC( type, ec ) Result< type >{ HNET_MAKE_ERROR( ( ec ) ) }
#define HNET_MAKE_RESULT( type ) HNET_MAKE_RESULT_EC( type, hnet::error_code::common::uncategorized  )
#define HNET_ENSURE_MSG( pred, ec, msg ) \
    { \
        auto&& res = ( pred ); \
        if( !( res ) ) \
        { \
            { \
                return ensure_propagate_error( res, ec, HNET_MAKE_RESULT_STACK_ELEM_MSG( ( fmt::format( "predicate: {}\n\tmessage: {}", #pred, msg ) ) ) ); \
            } \
        } \
    }
#define HNET_ENSURE( pred, ec ) HNET_ENSURE_MSG( ( pred ), ( ec ), "" )
// Inspired by BOOST_OUTCOME_TRYX, with the addition of appending to the stack.
#define HNET_TRY( ... ) \
    ({ \
        auto&& res = ( __VA_ARGS__ ); \
        if( BOOST_OUTCOME_V2_NAMESPACE::try_operation_has_value( res ) ) \
            ; \
        else \
        { \
            res.error().stack.emplace_back( HNET_MAKE_RESULT_STACK_ELEM() ); \
            return BOOST_OUTCOME_V2_NAMESPACE::try_operation_return_as( static_cast< decltype( res )&& >( res ) ); \
        } \
        BOOST_OUTCOME_V2_NAMESPACE::try_operation_extract_value( static_cast< decltype( res )&& >( res ) ); \
    })
// Throw exception on failure.
#define HNET_TRYE( ... ) \
    ({ \
        auto&& res = ( __VA_ARGS__ ); \
        if( BOOST_OUTCOME_V2_NAMESPACE::try_operation_has_value( res ) ) \
            ; \
        else \
        { \
            res.error().stack.emplace_back( HNET_MAKE_RESULT_STACK_ELEM() ); \
            HNET_THROW_EXCEPTION_MSG( hnet::error_code::to_string( res.error() ) ); \
        } \
        BOOST_OUTCOME_V2_NAMESPACE::try_operation_extract_value( static_cast< decltype( res )&& >( res ) ); \
    })
#define HTRY( ... ) HNET_TRY( __VA_ARGS__ )
#define HTRYE( ... ) HNET_TRYE( __VA_ARGS__ )

#include <boost/outcome.hpp>
#include <boost/system/error_code.hpp>
#include <fmt/format.h>

#include <cstdarg> // Needed for __VA_ARGS__
#include <cstdint>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>
#include <stdexcept>

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

namespace hnet {

inline
auto log_exception( std::string const& msg
                  , std::string const& fn
                  , std::string const& file
                  , uint64_t const& line )
    -> void
{
#if HNET_LOG_EXCEPTION
    fmt::print( stderr, "exception:\n\tmessage: {}\n\tfunction: {}\n\tfile: {}\nline: {}\n", msg, fn, file, line );
#endif
}

} // namespace hnet

namespace hnet::error_code {

struct StackElement
{
    uint32_t line = {};
    std::string function = {};
    std::string file = {};
    std::string message = {};
};

struct Payload
{
    boost::system::error_code ec = {};
    std::vector< StackElement > stack = {};
};

template< typename T
        , typename E = Payload
        , typename NoValuePolicy = outcome::policy::default_policy< T, E, void > >
using Result = outcome::result< T
                              , E
                              , NoValuePolicy >;

enum class common
{
    uncategorized = 1 // 0 should never be an error.
,   data_not_found
,   conversion_failed
,   invalid_numeric
,   invalid_argument
};

// This is a helper function to propagate a Result<> if input is Result<> or make one if the input is bool.
template< typename Pred
        , typename ErrorCode >
auto ensure_propagate_error( Pred const& pred
                           , ErrorCode const& ec
                           , hnet::error_code::StackElement const& se )
{
    if constexpr( requires{ pred.as_failure(); } )
    {
        auto tpred = pred;
        tpred.error().stack.emplace_back( se );
        return tpred.as_failure();
    }
    else
    {
        return hnet::error_code::Payload{ ec, { se } };
    }
}

inline
auto make_error_code( Payload const& sp )
    -> boost::system::error_code
{
     return sp.ec;
}

auto to_string( Payload const& sp )
    -> std::string;

inline
auto outcome_throw_as_system_error_with_payload( Payload payload )
    -> void
{
    HNET_THROW_EXCEPTION_MSG( to_string( payload ) );
}

} // namespace hnet::error_code

namespace boost::system {

template <>
struct is_error_code_enum< hnet::error_code::common > : std::true_type
{
};

} // namespace boost::system

namespace hnet::error_code::detail {

class common_category : public boost::system::error_category
{
public:
    // Return a short descriptive name for the category
    virtual const char* name() const noexcept override final { return "common error"; }
    // Return what each enum means in text
    virtual std::string message( int c ) const override final
    {
        using namespace hnet::error_code;

        switch ( static_cast< common >( c ) )
        {
        case common::uncategorized: return "uncategorized";
        case common::data_not_found: return "data not found";
        case common::conversion_failed: return "conversion failed";
        case common::invalid_numeric: return "invalid numeric";
        case common::invalid_argument: return "invalid argument";
        }

        return "unknown";
    }
};

} // hnet::error_code::detail

// Global ns
extern inline
auto common_category()
    -> hnet::error_code::detail::common_category const&
{
  static hnet::error_code::detail::common_category c;

  return c;
}

namespace hnet::error_code {

inline
auto make_error_code( common ec )
    -> boost::system::error_code
{
  return { static_cast< int >( ec )
         , ::common_category() };
}

template< typename T >
auto operator<<( std::ostream& os, hnet::error_code::Result< T > const& lhs )
    -> std::ostream&
{
    if( lhs )
    {
        constexpr bool has_to_string = requires( T const& t )
        {
            to_string( t );
        };

        if constexpr( has_to_string )
        {
            os << to_string( lhs.value() );
        }
        else
        {
            os << "result valid, no to_string";
        }
    }
    else
    {
        os << lhs.error().ec.message();
    }

    return os;
}

} // namespace hnet::error_code

#endif // HNET_EC_MASTER_HPP
