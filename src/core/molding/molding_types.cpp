#include "molding_types.h"

#include "../utils/string_utils.h"

namespace mc {
namespace molding {

Morphology morphologyOf(PolymerFamily family) {
    switch (family) {
    case PolymerFamily::PP:
    case PolymerFamily::PE:
    case PolymerFamily::PA:
    case PolymerFamily::POM:
    case PolymerFamily::PBT:
    case PolymerFamily::PET:
        return Morphology::Crystalline;
    case PolymerFamily::ABS:
    case PolymerFamily::PC:
    case PolymerFamily::PS:
    case PolymerFamily::PMMA:
    case PolymerFamily::SAN:
    case PolymerFamily::PCABS:
        return Morphology::Amorphous;
    }
    return Morphology::Amorphous;
}

const char* provenanceLabel(GeometrySource source) {
    switch (source) {
    case GeometrySource::FromCad: return "CAD Geometry";
    case GeometrySource::ManualEstimate: return "Estimated - No CAD";
    }
    return "CAD Geometry";
}

// --- GeometrySource ---

const char* geometrySourceToString(GeometrySource source) {
    switch (source) {
    case GeometrySource::FromCad: return "cad";
    case GeometrySource::ManualEstimate: return "manual";
    }
    return "cad";
}

Result<GeometrySource> parseGeometrySource(std::string_view str) {
    const std::string s = str::toLower(str::trim(str));
    if (s == "cad" || s == "stl" || s == "step") return GeometrySource::FromCad;
    if (s == "manual") return GeometrySource::ManualEstimate;
    return std::nullopt;
}

// --- PolymerFamily ---

const char* polymerFamilyToString(PolymerFamily family) {
    switch (family) {
    case PolymerFamily::ABS: return "ABS";
    case PolymerFamily::PP: return "PP";
    case PolymerFamily::PC: return "PC";
    case PolymerFamily::PA: return "PA";
    case PolymerFamily::PS: return "PS";
    case PolymerFamily::PE: return "PE";
    case PolymerFamily::POM: return "POM";
    case PolymerFamily::PMMA: return "PMMA";
    case PolymerFamily::PBT: return "PBT";
    case PolymerFamily::PET: return "PET";
    case PolymerFamily::SAN: return "SAN";
    case PolymerFamily::PCABS: return "PC/ABS";
    }
    return "ABS";
}

Result<PolymerFamily> parsePolymerFamily(std::string_view str) {
    const std::string s = str::toLower(str::trim(str));
    if (s == "abs") return PolymerFamily::ABS;
    if (s == "pp") return PolymerFamily::PP;
    if (s == "pc") return PolymerFamily::PC;
    if (s == "pa") return PolymerFamily::PA;
    if (s == "ps") return PolymerFamily::PS;
    if (s == "pe") return PolymerFamily::PE;
    if (s == "pom") return PolymerFamily::POM;
    if (s == "pmma") return PolymerFamily::PMMA;
    if (s == "pbt") return PolymerFamily::PBT;
    if (s == "pet") return PolymerFamily::PET;
    if (s == "san") return PolymerFamily::SAN;
    if (s == "pc/abs" || s == "pc+abs") return PolymerFamily::PCABS;
    return std::nullopt;
}

const char* morphologyToString(Morphology morphology) {
    return morphology == Morphology::Crystalline ? "crystalline" : "amorphous";
}

// --- ViscosityClass ---

const char* viscosityClassToString(ViscosityClass viscosity) {
    switch (viscosity) {
    case ViscosityClass::Low: return "low";
    case ViscosityClass::Medium: return "medium";
    case ViscosityClass::High: return "high";
    }
    return "medium";
}

Result<ViscosityClass> parseViscosityClass(std::string_view str) {
    const std::string s = str::toLower(str::trim(str));
    if (s == "low") return ViscosityClass::Low;
    if (s == "medium") return ViscosityClass::Medium;
    if (s == "high") return ViscosityClass::High;
    return std::nullopt;
}

// --- GateType ---

const char* gateTypeToString(GateType gate) {
    switch (gate) {
    case GateType::Edge: return "edge";
    case GateType::Pin: return "pin";
    case GateType::Fan: return "fan";
    case GateType::Submarine: return "submarine";
    }
    return "edge";
}

Result<GateType> parseGateType(std::string_view str) {
    const std::string s = str::toLower(str::trim(str));
    if (s == "edge") return GateType::Edge;
    if (s == "pin") return GateType::Pin;
    if (s == "fan") return GateType::Fan;
    if (s == "submarine") return GateType::Submarine;
    return std::nullopt;
}

// --- Result vocabulary ---

const char* severityToString(Severity severity) {
    switch (severity) {
    case Severity::Low: return "low";
    case Severity::Medium: return "medium";
    case Severity::High: return "high";
    }
    return "low";
}

const char* warningKindToString(WarningKind kind) {
    switch (kind) {
    case WarningKind::ThickSection: return "thick_section";
    case WarningKind::VeryThickSection: return "very_thick_section";
    case WarningKind::ThinSection: return "thin_section";
    case WarningKind::HighFlowRatio: return "high_flow_ratio";
    case WarningKind::BorderlineFlowRatio: return "borderline_flow_ratio";
    case WarningKind::LargeProjectedArea: return "large_projected_area";
    case WarningKind::HighTonnage: return "high_tonnage";
    case WarningKind::NoSuitableMachine: return "no_suitable_machine";
    }
    return "unknown";
}

const char* feasibilityStatusToString(FeasibilityStatus status) {
    switch (status) {
    case FeasibilityStatus::Feasible: return "feasible";
    case FeasibilityStatus::Borderline: return "borderline";
    case FeasibilityStatus::NotRecommended: return "not_recommended";
    }
    return "not_recommended";
}

const char* suitabilityToString(Suitability suitability) {
    switch (suitability) {
    case Suitability::Ideal: return "ideal";
    case Suitability::Acceptable: return "acceptable";
    case Suitability::Borderline: return "borderline";
    case Suitability::Excluded: return "excluded";
    }
    return "excluded";
}

} // namespace molding
} // namespace mc
