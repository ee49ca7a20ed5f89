#include "input_validation.h"

#include <cmath>
#include <string>
#include <utility>

namespace mc {
namespace molding {

namespace {

std::optional<AnalysisError> fail(AnalysisErrorCode code, std::string message) {
    return AnalysisError{code, std::move(message)};
}

bool positive(f64 v) {
    return std::isfinite(v) && v > 0.0;
}

bool validRange(const Range& r) {
    return std::isfinite(r.min) && std::isfinite(r.max) && r.max >= r.min;
}

} // namespace

std::optional<AnalysisError> checkGeometry(const GeometrySummary& g) {
    constexpr auto code = AnalysisErrorCode::InvalidGeometry;

    if (!positive(g.volumeCm3)) return fail(code, "volume must be > 0 cm3");
    if (!positive(g.projectedAreaCm2)) return fail(code, "projected area must be > 0 cm2");
    if (!positive(g.minThicknessMm)) return fail(code, "min thickness must be > 0 mm");
    if (!std::isfinite(g.avgThicknessMm) || g.avgThicknessMm < g.minThicknessMm) {
        return fail(code, "avg thickness must be >= min thickness");
    }
    if (!std::isfinite(g.maxThicknessMm) || g.maxThicknessMm < g.avgThicknessMm) {
        return fail(code, "max thickness must be >= avg thickness");
    }
    if (!positive(g.bbox.x) || !positive(g.bbox.y) || !positive(g.bbox.z)) {
        return fail(code, "bounding box dimensions must all be > 0 mm");
    }
    return std::nullopt;
}

std::optional<AnalysisError> checkMaterial(const MaterialProperties& m) {
    constexpr auto code = AnalysisErrorCode::InvalidMaterial;

    if (!validRange(m.meltTempC)) return fail(code, "melt temperature max must be >= min");
    if (!validRange(m.moldTempC)) return fail(code, "mold temperature max must be >= min");
    if (!positive(m.densityGPerCm3)) return fail(code, "density must be > 0 g/cm3");
    if (!validRange(m.shrinkagePct) || m.shrinkagePct.min < 0.0) {
        return fail(code, "shrinkage range must satisfy max >= min >= 0");
    }
    if (!positive(m.maxFlowLengthRatio)) {
        return fail(code, "max flow length ratio must be > 0");
    }
    if (!validRange(m.cavityPressureMpa) || !(m.cavityPressureMpa.min > 0.0)) {
        return fail(code, "cavity pressure range must satisfy max >= min > 0 MPa");
    }
    return std::nullopt;
}

std::optional<AnalysisError> checkConfig(const ProcessConfig& c, const GeometrySummary& g) {
    constexpr auto code = AnalysisErrorCode::InvalidConfig;

    if (c.cavityCount < 1) return fail(code, "cavity count must be >= 1");
    if (!std::isfinite(c.safetyFactor) || c.safetyFactor < kMinSafetyFactor ||
        c.safetyFactor > kMaxSafetyFactor) {
        return fail(code, "safety factor must be within [1.0, 3.0]");
    }
    if (c.gateDiameterMm && !positive(*c.gateDiameterMm)) {
        return fail(code, "gate diameter must be > 0 mm");
    }
    if (c.runnerDiameterMm && !positive(*c.runnerDiameterMm)) {
        return fail(code, "runner diameter must be > 0 mm");
    }
    if (c.gateLocationMm) {
        const Point3& p = *c.gateLocationMm;
        const bool inside = std::isfinite(p.x) && std::isfinite(p.y) && std::isfinite(p.z) &&
                            p.x >= 0.0 && p.x <= g.bbox.x && p.y >= 0.0 && p.y <= g.bbox.y &&
                            p.z >= 0.0 && p.z <= g.bbox.z;
        if (!inside) return fail(code, "gate location must lie inside the bounding box");
    }
    return std::nullopt;
}

std::optional<AnalysisError> checkMachine(const MachineSpec& m) {
    constexpr auto code = AnalysisErrorCode::InvalidMachine;
    const std::string who = "machine " + std::to_string(m.id) + ": ";

    if (!positive(m.tonnage)) return fail(code, who + "tonnage must be > 0 t");
    if (!positive(m.maxShotVolumeCm3)) return fail(code, who + "max shot volume must be > 0 cm3");
    if (!std::isfinite(m.platenWidthMm) || !std::isfinite(m.platenHeightMm) ||
        m.platenWidthMm < 0.0 || m.platenHeightMm < 0.0) {
        return fail(code, who + "platen dimensions must be >= 0 mm");
    }
    if (!std::isfinite(m.tieBarSpacingHMm) || !std::isfinite(m.tieBarSpacingVMm) ||
        m.tieBarSpacingHMm < 0.0 || m.tieBarSpacingVMm < 0.0) {
        return fail(code, who + "tie-bar spacing must be >= 0 mm");
    }
    return std::nullopt;
}

std::optional<AnalysisError> checkMachines(const std::vector<MachineSpec>& machines) {
    for (const auto& m : machines) {
        if (auto err = checkMachine(m)) return err;
    }
    return std::nullopt;
}

} // namespace molding
} // namespace mc
