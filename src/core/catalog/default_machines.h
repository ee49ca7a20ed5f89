#pragma once

#include <vector>

#include "../molding/molding_types.h"

namespace mc {

// Built-in generic machine line (80T - 1300T), ascending tonnage, ids 1..N
std::vector<molding::MachineSpec> getDefaultMachines();

} // namespace mc
