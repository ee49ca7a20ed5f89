#pragma once

// MoldCheck - Molding domain records
// Geometry summaries, material and machine records, process configuration
// and the warning/suitability vocabulary shared by every calculator.

#include <optional>
#include <string>
#include <string_view>

#include "../types.h"

namespace mc {
namespace molding {

// Where a geometry summary came from
enum class GeometrySource {
    FromCad,        // Reduced from an uploaded STL/STEP file
    ManualEstimate  // Built from hand-entered dimensions
};

// Axis-aligned part envelope in millimetres
struct BoundingBox {
    f64 x = 0.0;
    f64 y = 0.0;
    f64 z = 0.0;
};

// Point in part coordinates, millimetres from the bounding box minimum corner
struct Point3 {
    f64 x = 0.0;
    f64 y = 0.0;
    f64 z = 0.0;
};

struct GeometrySummary {
    i64 partId = 0;
    f64 volumeCm3 = 0.0;
    f64 projectedAreaCm2 = 0.0;
    f64 minThicknessMm = 0.0;
    f64 avgThicknessMm = 0.0;
    f64 maxThicknessMm = 0.0;
    BoundingBox bbox;
    GeometrySource source = GeometrySource::FromCad;
};

// Polymer family as listed in material datasheets
enum class PolymerFamily { ABS, PP, PC, PA, PS, PE, POM, PMMA, PBT, PET, SAN, PCABS };

// Crystalline polymers need longer cooling than amorphous ones
enum class Morphology { Crystalline, Amorphous };

enum class ViscosityClass { Low, Medium, High };

// Closed numeric range [min, max]
struct Range {
    f64 min = 0.0;
    f64 max = 0.0;

    f64 midpoint() const { return (min + max) / 2.0; }
};

struct MaterialProperties {
    i64 id = 0;
    std::string name;
    std::string manufacturer;
    std::string grade;
    PolymerFamily family = PolymerFamily::ABS;
    Range meltTempC;              // deg C
    Range moldTempC;              // deg C
    f64 densityGPerCm3 = 0.0;
    Range shrinkagePct;           // percent
    ViscosityClass viscosity = ViscosityClass::Medium;
    f64 maxFlowLengthRatio = 0.0; // flow length / wall thickness
    Range cavityPressureMpa;      // recommended cavity pressure
};

struct MachineSpec {
    i64 id = 0;
    std::string name;
    std::string manufacturer;
    f64 tonnage = 0.0;            // metric tons
    f64 maxShotVolumeCm3 = 0.0;
    f64 screwDiameterMm = 0.0;
    f64 platenWidthMm = 0.0;
    f64 platenHeightMm = 0.0;
    f64 tieBarSpacingHMm = 0.0;
    f64 tieBarSpacingVMm = 0.0;
    std::string typicalUse;
};

enum class GateType { Edge, Pin, Fan, Submarine };

struct ProcessConfig {
    int cavityCount = 1;
    GateType gateType = GateType::Edge;
    f64 safetyFactor = 1.15;
    std::optional<f64> gateDiameterMm;    // derived from wall thickness when absent
    std::optional<f64> runnerDiameterMm;  // derived from gate diameter when absent
    std::optional<Point3> gateLocationMm; // centre of largest face when absent
};

enum class Severity { Low, Medium, High };

// Warning kinds in rule-table order; NoSuitableMachine is raised by the
// orchestrator after machine matching.
enum class WarningKind {
    ThickSection,
    VeryThickSection,
    ThinSection,
    HighFlowRatio,
    BorderlineFlowRatio,
    LargeProjectedArea,
    HighTonnage,
    NoSuitableMachine
};

struct Warning {
    WarningKind kind = WarningKind::ThickSection;
    Severity severity = Severity::Low;
    std::string designerMessage;
    std::string customerMessage;
    std::optional<std::string> remediation;
};

enum class FeasibilityStatus { Feasible, Borderline, NotRecommended };

enum class Suitability { Ideal, Acceptable, Borderline, Excluded };

// --- Classification ---

Morphology morphologyOf(PolymerFamily family);

// "Estimated - No CAD" for manual estimates
const char* provenanceLabel(GeometrySource source);

// --- String conversion ---
// Parsers return nullopt for unrecognised text; callers decide how to report it.

const char* geometrySourceToString(GeometrySource source);
Result<GeometrySource> parseGeometrySource(std::string_view str);

const char* polymerFamilyToString(PolymerFamily family);
Result<PolymerFamily> parsePolymerFamily(std::string_view str);

const char* morphologyToString(Morphology morphology);

const char* viscosityClassToString(ViscosityClass viscosity);
Result<ViscosityClass> parseViscosityClass(std::string_view str);

const char* gateTypeToString(GateType gate);
Result<GateType> parseGateType(std::string_view str);

const char* severityToString(Severity severity);
const char* warningKindToString(WarningKind kind);
const char* feasibilityStatusToString(FeasibilityStatus status);
const char* suitabilityToString(Suitability suitability);

} // namespace molding
} // namespace mc
