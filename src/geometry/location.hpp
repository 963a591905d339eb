/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef HNET_GEOMETRY_LOCATION_HPP
#define HNET_GEOMETRY_LOCATION_HPP

#include <common.hpp>
#include "geometry/point.hpp"

#include <map>
#include <string>

namespace hnet {
class Network;
}

namespace hnet::geometry {

/**
 * Supplies known coordinates by node id, e.g. from a station database.
 */
class LocationSource
{
public:
    virtual ~LocationSource() = default;

    virtual auto fetch_location( std::string const& id ) const
        -> Optional< Point > = 0;
};

// Case-insensitive on id.
class MapLocationSource : public LocationSource
{
    std::map< std::string, Point > locations_ = {};

public:
    MapLocationSource() = default;
    MapLocationSource( std::map< std::string, Point > const& locations );
    virtual ~MapLocationSource() = default;

    auto insert( std::string const& id
               , Point const& location )
        -> void;
    auto fetch_location( std::string const& id ) const
        -> Optional< Point > override;
    auto size() const
        -> std::size_t;
};

/**
 * @brief Copies locations from `source` onto matching nodes.
 * @param overwrite When false, nodes that already have a location keep it.
 * @return The number of nodes updated.
 */
auto apply_locations( Network& nw
                    , LocationSource const& source
                    , bool const overwrite )
    -> Result< uint32_t >;

} // namespace hnet::geometry

#endif // HNET_GEOMETRY_LOCATION_HPP
