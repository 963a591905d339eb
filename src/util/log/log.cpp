/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include <util/log/log.hpp>

#include <common.hpp>

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>
#include <range/v3/algorithm/any_of.hpp>

#include <algorithm>

#if HNET_LOG
namespace hnet::util::log {

ScopedPauser::ScopedPauser()
    : logging_enabled_{ HN_LOG_IS_ENABLED() }
{
    hnet::util::log::Singleton::instance().flags.enable_logging = false;
}

ScopedPauser::~ScopedPauser()
{
    hnet::util::log::Singleton::instance().flags.enable_logging = logging_enabled_;
}

auto split_tags( std::string const& tags )
    -> std::vector< std::string >
{
    auto rv = std::vector< std::string >{};

    boost::split( rv, tags, boost::is_any_of( ", " ), boost::token_compress_on );

    rv.erase( std::remove( rv.begin(), rv.end(), "" ), rv.end() );

    return rv;
}

auto GlobalState::disable( std::string const& tags )
    -> void
{
    auto const ts = split_tags( tags );

    if( ts.empty() || ranges::any_of( ts, []( auto const& t ){ return t == "*"; } ) )
    {
        tags_.clear();
        flags.enable_logging = false;
    }
    else
    {
        for( auto const& t : ts )
        {
            tags_.erase( t );
        }

        flags.enable_logging = !tags_.empty();
    }
}

auto GlobalState::enable( std::string const& tags )
    -> void
{
    for( auto const& t : split_tags( tags ) )
    {
        tags_.emplace( t );
    }

    flags.enable_logging = true;
}

auto GlobalState::is_tag_enabled( std::string const& tag ) const
    -> bool
{
    if( tags_.empty() || tags_.contains( "*" ) || tags_.contains( tag ) )
    {
        return true;
    }

    // "network" enables "network.insert", etc.
    return ranges::any_of( tags_, [ & ]( auto const& t ){ return boost::starts_with( tag, t + "." ); } );
}

auto GlobalState::push( std::string const& tags
                      , std::string const& msg )
    -> void
{
    if( !HN_LOG_IS_ENABLED() )
    {
        return;
    }

    for( auto const& tag : split_tags( tags ) )
    {
        if( is_tag_enabled( tag ) )
        {
            if( sink_ )
            {
                sink_( tag, msg );
            }
            else
            {
                fmt::print( "[log][{}] {}\n", tag, msg );
            }

            break;
        }
    }
}

auto GlobalState::set_sink( Sink const& sink )
    -> void
{
    sink_ = sink;
}

std::unique_ptr< GlobalState > Singleton::inst_ = {};

GlobalState& Singleton::instance()
{
    if( !inst_ )
    {
        inst_ = std::make_unique< GlobalState >();
    }

    return *inst_;
}

} // namespace hnet::util::log

#endif // HNET_LOG
