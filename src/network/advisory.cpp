/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "network/advisory.hpp"

#include <fmt/format.h>

namespace hnet {

auto to_string( AdvisoryKind const kind )
    -> std::string
{
    switch( kind )
    {
        case AdvisoryKind::duplicate_id: return "duplicate_id";
        case AdvisoryKind::extrapolated_location: return "extrapolated_location";
        case AdvisoryKind::bounds_clamp: return "bounds_clamp";
        case AdvisoryKind::missing_location: return "missing_location";
    }

    return "unknown";
}

auto to_string( Advisory const& advisory )
    -> std::string
{
    return fmt::format( "[{}] {}: {}", to_string( advisory.kind ), advisory.node_id, advisory.message );
}

} // namespace hnet
