/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include <common.hpp>
#include "network/network.hpp"
#include "test/util.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <utility>
#include <vector>

using namespace hnet;
using namespace hnet::test;

#if HNET_LOG

SCENARIO( "log tags select messages", "[util][log]" )
{
    auto& state = util::log::Singleton::instance();
    auto captured = std::vector< std::pair< std::string, std::string > >{};

    state.set_sink( [ & ]( auto const& tag, auto const& msg ){ captured.emplace_back( tag, msg ); } );

    GIVEN( "the network tag enabled" )
    {
        HN_LOG_ENABLE( "network" );

        THEN( "child tags are enabled" )
        {
            REQUIRE( state.is_tag_enabled( "network.insert" ) );
            REQUIRE( !state.is_tag_enabled( "networks" ) );
            REQUIRE( !state.is_tag_enabled( "geometry.interpolate" ) );
        }

        WHEN( "a taken id is inserted" )
        {
            auto nw = make_network();

            insert( nw, "A", "END" );
            insert( nw, "A", "END" );

            THEN( "the reassignment is logged" )
            {
                REQUIRE( !captured.empty() );
                REQUIRE( std::any_of( captured.begin(), captured.end(), []( auto const& e ){ return e.first == "network.insert" && e.second.find( "A_1" ) != std::string::npos; } ) );
            }
        }
        WHEN( "logging is paused" )
        {
            {
                HN_LOG_PAUSE_SCOPE();

                HN_LOG_MSG( "network.insert", "hidden" );
            }

            HN_LOG_MSG( "network.insert", "shown" );

            THEN( "only the message after the pause is kept" )
            {
                REQUIRE( captured.size() == 1 );
                REQUIRE( captured.front().second == "shown" );
            }
        }

        HN_LOG_DISABLE( "*" );
    }
    GIVEN( "logging disabled" )
    {
        HN_LOG_DISABLE( "*" );

        HN_LOG_MSG( "network.insert", "dropped" );

        THEN( "nothing is captured" )
        {
            REQUIRE( captured.empty() );
            REQUIRE( !HN_LOG_IS_ENABLED() );
        }
    }

    state.set_sink( {} );
}

SCENARIO( "tag lists are split on commas and spaces", "[util][log]" )
{
    REQUIRE( util::log::split_tags( "network, geometry.interpolate  result" ) == StringVec{ "network", "geometry.interpolate", "result" } );
    REQUIRE( util::log::split_tags( "" ).empty() );
}

#endif // HNET_LOG
