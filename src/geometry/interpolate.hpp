/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef HNET_GEOMETRY_INTERPOLATE_HPP
#define HNET_GEOMETRY_INTERPOLATE_HPP

#include <common.hpp>
#include "geometry/point.hpp"
#include "network/advisory.hpp"
#include "network/network.hpp"
#include "network/option.hpp"

namespace hnet::geometry {

/**
 * Fills in missing node locations so that a partially-located network can be drawn.
 *
 * The main stem (reach 1) is completed first, by interpolation between known points and extrapolation past the outermost ones.
 * Every other node is then interpolated toward, or extrapolated from, its nearest located downstream node.
 * Locations derived without a pair of anchors, and locations clamped back into bounds, are reported as advisories.
 */
class Interpolator
{
    Network& nw_;
    InterpolationOptions opts_;
    Extent bounds_ = {};
    double spacing_ = 0.0;
    Advisories advisories_ = {};

public:
    explicit Interpolator( Network& nw );
    Interpolator( Network& nw
                , InterpolationOptions const& opts );

    auto fill_locations()
        -> Result< Advisories >;
    /**
     * @brief Moves located nodes back inside `bounds`, 5% of the extent in from the violated edge.
     * @param clamp_to_zero When set, only negative coordinates are corrected.
     */
    auto final_check( Extent const& bounds
                    , bool const clamp_to_zero )
        -> Result< Advisories >;

    auto bounds() const
        -> Extent const&;
    auto node_spacing() const
        -> double;

protected:
    auto fetch_main_stem() const
        -> Result< NodeIndexVec >;
    auto fill_main_stem( NodeIndexVec const& stem )
        -> Result< void >;
    auto fill_reach_downstream()
        -> Result< void >;
    auto fill_from_downstream()
        -> Result< void >;
    auto extrapolate( NodeIndex const& node
                    , Point const& location
                    , std::string const& how )
        -> Result< void >;
};

} // namespace hnet::geometry

#endif // HNET_GEOMETRY_INTERPOLATE_HPP
