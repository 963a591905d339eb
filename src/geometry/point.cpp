/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "geometry/point.hpp"

#include <fmt/format.h>

namespace hnet::geometry {

auto to_string( Point const& p )
    -> std::string
{
    return fmt::format( "({:.3f}, {:.3f})", p.x, p.y );
}

} // namespace hnet::geometry
