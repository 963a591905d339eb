/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef HNET_GEOMETRY_POINT_HPP
#define HNET_GEOMETRY_POINT_HPP

#include <string>

namespace hnet::geometry {

struct Point
{
    double x = 0.0;
    double y = 0.0;

    bool operator==( Point const& ) const = default;
};

// Axis-aligned bounds, left/bottom/right/top.
struct Extent
{
    double lx = 0.0;
    double by = 0.0;
    double rx = 1.0;
    double ty = 1.0;

    auto width() const -> double { return rx - lx; }
    auto height() const -> double { return ty - by; }
    auto contains( Point const& p ) const
        -> bool
    {
        return p.x >= lx && p.x <= rx
            && p.y >= by && p.y <= ty;
    }

    bool operator==( Extent const& ) const = default;
};

inline
auto operator+( Point const& lhs, Point const& rhs )
    -> Point
{
    return { lhs.x + rhs.x, lhs.y + rhs.y };
}

inline
auto operator-( Point const& lhs, Point const& rhs )
    -> Point
{
    return { lhs.x - rhs.x, lhs.y - rhs.y };
}

inline
auto operator*( Point const& lhs, double const s )
    -> Point
{
    return { lhs.x * s, lhs.y * s };
}

inline
auto midpoint( Point const& lhs, Point const& rhs )
    -> Point
{
    return { ( lhs.x + rhs.x ) / 2.0, ( lhs.y + rhs.y ) / 2.0 };
}

auto to_string( Point const& p )
    -> std::string;

} // namespace hnet::geometry

#endif // HNET_GEOMETRY_POINT_HPP
