/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef HNET_UTIL_JSON_HPP
#define HNET_UTIL_JSON_HPP

#include <common.hpp>

#include <boost/json.hpp>

namespace hnet {

auto fetch_bool( boost::json::object const& obj
               , std::string const& key )
    -> Result< bool >;
auto fetch_float( boost::json::object const& obj
                , std::string const& key )
    -> Result< double >;
auto fetch_object( boost::json::object const& obj
                 , std::string const& key )
    -> Result< boost::json::object >;
auto fetch_string( boost::json::object const& obj
                 , std::string const& key )
    -> Result< std::string >;
auto fetch_value( boost::json::object const& obj
                , std::string const& key )
    -> Result< boost::json::value >;
auto parse_object( std::string const& text )
    -> Result< boost::json::object >;

} // namespace hnet

#endif // HNET_UTIL_JSON_HPP
