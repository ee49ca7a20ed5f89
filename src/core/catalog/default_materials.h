#pragma once

#include <vector>

#include "../molding/molding_types.h"

namespace mc {

// Built-in thermoplastic grades used when no material catalog file is configured.
// Ids are assigned 1..N in list order.
std::vector<molding::MaterialProperties> getDefaultMaterials();

} // namespace mc
