/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef HNET_UTIL_LOG_LOG_HPP
#define HNET_UTIL_LOG_LOG_HPP

#if HNET_LOG

#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

    #define HN_LOG_ENABLE( tags ) hnet::util::log::Singleton::instance().enable( tags );
    #define HN_LOG_DISABLE( tags ) hnet::util::log::Singleton::instance().disable( tags );
    #define HN_LOG_PAUSE_SCOPE() auto hn_log_scoped_pauser = hnet::util::log::ScopedPauser{};
    #define HN_LOG_IS_ENABLED() hnet::util::log::Singleton::instance().flags.enable_logging
    #define HN_LOG_MSG( tags, msg ) hnet::util::log::Singleton::instance().push( tags, msg );

namespace hnet::util::log {

class GlobalState
{
public:
    using Tags = std::set< std::string >;
    using Sink = std::function< void( std::string const& tag, std::string const& msg ) >;

private:
    Tags tags_ = {}; // Empty, or containing "*", means every tag.
    Sink sink_ = {};

public:
    GlobalState() = default;

    struct
    {
        bool enable_logging = false;
    } flags;

    auto disable( std::string const& tags )
        -> void;
    auto enable( std::string const& tags )
        -> void;
    auto is_tag_enabled( std::string const& tag ) const
        -> bool;
    auto push( std::string const& tags
             , std::string const& msg )
        -> void;
    auto set_sink( Sink const& sink )
        -> void;
};

class Singleton
{
    static std::unique_ptr< GlobalState > inst_;

public:
    static GlobalState& instance();
};

class ScopedPauser
{
    bool logging_enabled_;

public:
    ScopedPauser();
    ~ScopedPauser();
};

auto split_tags( std::string const& tags )
    -> std::vector< std::string >;

} // namespace hnet::util::log

#else // HNET_LOG
    #define HN_LOG_DISABLE( tags )
    #define HN_LOG_ENABLE( tags )
    #define HN_LOG_IS_ENABLED() false
    #define HN_LOG_MSG( tags, msg )
    #define HN_LOG_PAUSE_SCOPE()
#endif // HNET_LOG

#endif // HNET_UTIL_LOG_LOG_HPP
