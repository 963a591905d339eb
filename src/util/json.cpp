/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include <util/json.hpp>

#include <util/result.hpp>

#include <boost/json.hpp>

#include <string>

namespace bjn = boost::json;

namespace hnet {

auto fetch_bool( bjn::object const& obj
               , std::string const& key )
    -> Result< bool >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "key", key );

    auto const at = HTRY( fetch_value( obj, key ) );

    HNET_ENSURE( at.is_bool(), error_code::common::conversion_failed );

    return at.as_bool();
}

auto fetch_float( bjn::object const& obj
                , std::string const& key )
    -> Result< double >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "key", key );

    auto const at = HTRY( fetch_value( obj, key ) );

    HNET_ENSURE( at.is_number(), error_code::common::conversion_failed );

    return at.to_number< double >(); // Use to_number to avoid exact conversion failure case for when v is e.g., 0.0, and is converted to integer type automatically.
}

auto fetch_object( bjn::object const& obj
                 , std::string const& key )
    -> Result< bjn::object >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "key", key );

    auto const at = HTRY( fetch_value( obj, key ) );

    HNET_ENSURE( at.is_object(), error_code::common::conversion_failed );

    return at.as_object();
}

auto fetch_string( bjn::object const& obj
                 , std::string const& key )
    -> Result< std::string >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "key", key );

    auto const at = HTRY( fetch_value( obj, key ) );

    HNET_ENSURE( at.is_string(), error_code::common::conversion_failed );

    return std::string{ at.as_string() };
}

auto fetch_value( bjn::object const& obj
                , std::string const& key )
    -> Result< bjn::value >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "key", key );

    HNET_ENSURE( obj.contains( key ), error_code::common::data_not_found );

    return obj.at( key );
}

auto parse_object( std::string const& text )
    -> Result< bjn::object >
{
    HN_RESULT_PROLOG();

    auto rv = HNET_MAKE_RESULT( bjn::object );
    auto ec = bjn::error_code{};
    auto const parsed = bjn::parse( text, ec );

    HNET_ENSURE_MSG( !ec, error_code::common::conversion_failed, ec.message() );
    HNET_ENSURE( parsed.is_object(), error_code::common::conversion_failed );

    rv = parsed.as_object();

    return rv;
}

} // namespace hnet
