/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef HNET_NETWORK_ADVISORY_HPP
#define HNET_NETWORK_ADVISORY_HPP

#include <string>
#include <vector>

namespace hnet {

enum class AdvisoryKind
{
    duplicate_id          // Requested id was taken; a suffixed id was assigned.
,   extrapolated_location // Location derived without a downstream and upstream anchor pair.
,   bounds_clamp          // Location moved back inside the layout bounds.
,   missing_location      // No location could be derived.
};

// Diagnostics that accompany a successful operation. Never a failure.
struct Advisory
{
    AdvisoryKind kind = {};
    std::string node_id = {};
    std::string message = {};
};

using Advisories = std::vector< Advisory >;

auto to_string( AdvisoryKind const kind )
    -> std::string;
auto to_string( Advisory const& advisory )
    -> std::string;

} // namespace hnet

#endif // HNET_NETWORK_ADVISORY_HPP
