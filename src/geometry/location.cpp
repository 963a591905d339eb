/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "geometry/location.hpp"

#include "network/network.hpp"
#include "util/result.hpp"

#include <boost/algorithm/string/case_conv.hpp>

namespace hnet::geometry {

MapLocationSource::MapLocationSource( std::map< std::string, Point > const& locations )
{
    for( auto const& [ id, loc ] : locations )
    {
        insert( id, loc );
    }
}

auto MapLocationSource::insert( std::string const& id
                              , Point const& location )
    -> void
{
    locations_.insert_or_assign( boost::to_lower_copy( id ), location );
}

auto MapLocationSource::fetch_location( std::string const& id ) const
    -> Optional< Point >
{
    if( auto const it = locations_.find( boost::to_lower_copy( id ) )
      ; it != locations_.end() )
    {
        return it->second;
    }

    return nullopt;
}

auto MapLocationSource::size() const
    -> std::size_t
{
    return locations_.size();
}

auto apply_locations( Network& nw
                    , LocationSource const& source
                    , bool const overwrite )
    -> Result< uint32_t >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "overwrite", std::string{ overwrite ? "true" : "false" } );

    auto rv = HNET_MAKE_RESULT( uint32_t );
    auto count = uint32_t{ 0 };

    for( auto const& ni : HTRY( nw.walk() ) )
    {
        auto const& n = nw.node( ni );

        if( n.location && !overwrite )
        {
            continue;
        }

        if( auto const loc = source.fetch_location( n.id )
          ; loc )
        {
            HTRY( nw.update_location( ni, loc.value() ) );

            ++count;
        }
    }

    HN_LOG_MSG( "geometry.location", fmt::format( "applied {} location(s)", count ) );

    rv = count;

    return rv;
}

} // namespace hnet::geometry
