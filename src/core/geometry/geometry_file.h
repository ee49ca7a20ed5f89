#pragma once

// MoldCheck - Geometry summary files
// JSON form of a GeometrySummary, as written by the CAD reduction step or by hand.

#include <string>

#include "../molding/molding_types.h"
#include "../types.h"

namespace mc {
namespace geometry {

// Missing or malformed fields are logged and yield nullopt. Value ranges are
// left to the analysis validation.
Result<molding::GeometrySummary> fromJsonString(const std::string& jsonStr);
Result<molding::GeometrySummary> loadFile(const Path& path);

std::string toJsonString(const molding::GeometrySummary& geometry);

} // namespace geometry
} // namespace mc
