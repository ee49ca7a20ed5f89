#pragma once

// MoldCheck - Analysis Engine
// Validates the four inputs, runs the calculators, evaluates warnings and
// ranks machines. Pure and synchronous: no logging, no I/O, no globals.

#include <string>
#include <vector>

#include "../types.h"
#include "analysis_error.h"
#include "cycle_time_calculator.h"
#include "feasibility_evaluator.h"
#include "flow_calculator.h"
#include "machine_recommender.h"
#include "molding_types.h"
#include "tonnage_calculator.h"

namespace mc {
namespace molding {

struct AnalysisResult {
    i64 partId = 0;
    i64 materialId = 0;
    ProcessConfig config;
    GeometrySource provenance = GeometrySource::FromCad;

    TonnageEstimate tonnage;
    f64 cavityPressureMpa = 0.0;   // Midpoint of the material range
    FlowEstimate flow;
    f64 flowRatioLimit = 0.0;      // Material max L/t
    CycleTimeBreakdown cycle;

    f64 partWeightGrams = 0.0;
    f64 shotWeightGrams = 0.0;
    f64 requiredShotVolumeCm3 = 0.0;

    FeasibilityAssessment feasibility;
    std::vector<Warning> warnings;                       // Evaluation order
    std::vector<MachineRecommendation> recommendations;  // Best first

    const char* provenanceLabel() const { return molding::provenanceLabel(provenance); }
};

using AnalysisOutcome = Outcome<AnalysisResult>;

class AnalysisEngine {
  public:
    // Success carries the full result; failure carries the first violated
    // precondition or a ComputationOverflow. Never a partial result.
    static AnalysisOutcome run(const GeometrySummary& geometry, const MaterialProperties& material,
                               const std::vector<MachineSpec>& machines,
                               const ProcessConfig& config);
};

} // namespace molding
} // namespace mc
