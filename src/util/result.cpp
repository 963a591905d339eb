/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include <util/result.hpp>

#include <boost/algorithm/string/join.hpp>
#include <fmt/format.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <string>
#include <variant>
#include <vector>

namespace rvs = ranges::views;

namespace hnet::result {

LocalLog::LocalLog( const char* function )
    : function_{ function }
{
}

LocalState::LocalState( const char* function )
    : log{ function }
{
}

auto LocalLog::function() const
    -> std::string const&
{
    return function_;
}

auto LocalLog::push( LocalLog::MultiValue const& mv )
    -> void
{
#if HNET_LOG
    if( HN_LOG_IS_ENABLED()
     && util::log::Singleton::instance().is_tag_enabled( "result" ) )
    {
        auto const msg = [ & ]
        {
            HN_LOG_PAUSE_SCOPE(); // Must pause logging to avoid recursion through to_string().

            return fmt::format( "{}: {}", function_, to_string( mv ) );
        }();

        HN_LOG_MSG( "result", msg );
    }
#endif // HNET_LOG

    kvs.emplace_back( mv );
}

auto LocalLog::values() const
    -> std::vector< MultiValue > const&
{
    return kvs;
}

auto to_string( LocalLog const& state )
    -> std::string
{
    return fmt::format( "{}{{{}}}", state.function(), to_string( state.values() ) );
}

auto to_string( LocalLog::MultiValue const& mv )
    -> std::string
{
    auto const value = std::visit( []( auto const& v ) -> std::string
    {
        using T = std::decay_t< decltype( v ) >;

        if constexpr( std::is_same_v< T, std::string > )
        {
            return v;
        }
        else
        {
            return fmt::format( "[{}]", to_string( v ) );
        }
    }
    , mv.value );

    return fmt::format( "{}={}", mv.key, value );
}

auto to_string( std::vector< LocalLog::MultiValue > const& mvs )
    -> std::string
{
    auto const strs = mvs
                    | rvs::transform( []( auto const& e ){ return to_string( e ); } )
                    | ranges::to< std::vector< std::string > >();

    return boost::algorithm::join( strs, ", " );
}

} // namespace hnet::result
