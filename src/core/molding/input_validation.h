#pragma once

// MoldCheck - Input validation
// Precondition checks run by the orchestrator before any calculation.
// Each returns the first violated precondition, or nullopt when the input is usable.

#include <optional>
#include <vector>

#include "analysis_error.h"
#include "molding_types.h"

namespace mc {
namespace molding {

// Safety factor bounds; >= 1 keeps recommended tonnage at or above the minimum
inline constexpr f64 kMinSafetyFactor = 1.0;
inline constexpr f64 kMaxSafetyFactor = 3.0;

std::optional<AnalysisError> checkGeometry(const GeometrySummary& geometry);
std::optional<AnalysisError> checkMaterial(const MaterialProperties& material);

// Gate location is checked against the part bounding box
std::optional<AnalysisError> checkConfig(const ProcessConfig& config,
                                         const GeometrySummary& geometry);

std::optional<AnalysisError> checkMachine(const MachineSpec& machine);
std::optional<AnalysisError> checkMachines(const std::vector<MachineSpec>& machines);

} // namespace molding
} // namespace mc
