#pragma once

// MoldCheck - Machine Recommender
// Classifies catalog machines against the required clamp tonnage and shot
// volume, then ranks them ideal -> acceptable -> borderline, smallest first.

#include <string>
#include <vector>

#include "../types.h"
#include "molding_types.h"

namespace mc {
namespace molding {

struct MachineRequirement {
    f64 tonnage = 0.0;          // Recommended clamp tonnage (t)
    f64 shotVolumeCm3 = 0.0;    // Part volume * cavities
    f64 partWidthMm = 0.0;      // Footprint used for the platen note
    f64 partHeightMm = 0.0;
};

// A classified machine with notes for the designer
struct MachineRecommendation {
    MachineSpec machine;
    Suitability suitability = Suitability::Excluded;
    f64 tonnageUtilizationPct = 0.0;  // required / machine tonnage
    f64 shotUtilizationPct = 0.0;     // required / machine max shot
    std::vector<std::string> notes;
};

class MachineRecommender {
  public:
    // Band for one machine; notes never feed back into this
    static Suitability classify(const MachineSpec& machine, const MachineRequirement& req);

    // Ranked, non-excluded machines, at most kMaxRecommendations.
    // Ties within a band keep catalog order.
    static std::vector<MachineRecommendation> recommend(const std::vector<MachineSpec>& machines,
                                                        const MachineRequirement& req);

    static constexpr int kMaxRecommendations = 5;

    static constexpr f64 kIdealUpperRatio = 1.3;
    static constexpr f64 kAcceptableUpperRatio = 1.8;
    static constexpr f64 kAcceptableLowerRatio = 0.9;
    static constexpr f64 kShotHeadroomRatio = 1.3;
    static constexpr f64 kPlatenMarginRatio = 1.5;

  private:
    static std::vector<std::string> buildNotes(const MachineSpec& machine,
                                               Suitability suitability,
                                               const MachineRequirement& req);
};

} // namespace molding
} // namespace mc
