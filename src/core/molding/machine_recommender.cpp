#include "machine_recommender.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace mc {
namespace molding {

namespace {

int bandRank(Suitability s) {
    switch (s) {
    case Suitability::Ideal: return 0;
    case Suitability::Acceptable: return 1;
    case Suitability::Borderline: return 2;
    case Suitability::Excluded: return 3;
    }
    return 3;
}

} // namespace

Suitability MachineRecommender::classify(const MachineSpec& machine,
                                         const MachineRequirement& req) {
    if (machine.maxShotVolumeCm3 < req.shotVolumeCm3) {
        return Suitability::Excluded;
    }

    const f64 t = machine.tonnage;
    if (t >= req.tonnage && t <= req.tonnage * kIdealUpperRatio) {
        return Suitability::Ideal;
    }
    if (t > req.tonnage * kIdealUpperRatio && t <= req.tonnage * kAcceptableUpperRatio) {
        return Suitability::Acceptable;
    }
    if (t >= req.tonnage * kAcceptableLowerRatio && t < req.tonnage) {
        return Suitability::Acceptable;
    }
    return Suitability::Borderline;
}

std::vector<MachineRecommendation> MachineRecommender::recommend(
    const std::vector<MachineSpec>& machines, const MachineRequirement& req) {
    std::vector<MachineRecommendation> ranked;

    for (const auto& m : machines) {
        const Suitability s = classify(m, req);
        if (s == Suitability::Excluded) continue;

        MachineRecommendation rec;
        rec.machine = m;
        rec.suitability = s;
        if (m.tonnage > 0.0) {
            rec.tonnageUtilizationPct = req.tonnage / m.tonnage * 100.0;
        }
        if (m.maxShotVolumeCm3 > 0.0) {
            rec.shotUtilizationPct = req.shotVolumeCm3 / m.maxShotVolumeCm3 * 100.0;
        }
        rec.notes = buildNotes(m, s, req);
        ranked.push_back(std::move(rec));
    }

    // Band first, then smallest machine; stable keeps catalog order on ties
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const MachineRecommendation& a, const MachineRecommendation& b) {
                         const int ra = bandRank(a.suitability);
                         const int rb = bandRank(b.suitability);
                         if (ra != rb) return ra < rb;
                         return a.machine.tonnage < b.machine.tonnage;
                     });

    if (static_cast<int>(ranked.size()) > kMaxRecommendations) {
        ranked.resize(static_cast<size_t>(kMaxRecommendations));
    }
    return ranked;
}

std::vector<std::string> MachineRecommender::buildNotes(const MachineSpec& machine,
                                                        Suitability suitability,
                                                        const MachineRequirement& req) {
    std::vector<std::string> notes;
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(0);

    if (machine.tonnage > 0.0) {
        ss << "Tonnage " << machine.tonnage << "T is " << (req.tonnage / machine.tonnage * 100.0)
           << "% utilised (" << req.tonnage << "T required)";
        notes.push_back(ss.str());
        ss.str("");
    }

    if (machine.tonnage < req.tonnage) {
        ss << "Tonnage is below the recommended " << req.tonnage << "T";
        notes.push_back(ss.str());
        ss.str("");
    } else if (suitability == Suitability::Borderline) {
        notes.push_back("Machine is heavily oversized for this part");
    } else if (suitability == Suitability::Acceptable) {
        notes.push_back("Machine may be oversized for this part");
    }

    if (machine.maxShotVolumeCm3 < req.shotVolumeCm3 * kShotHeadroomRatio) {
        ss << "Shot volume " << machine.maxShotVolumeCm3 << " cm3 is near the limit";
        notes.push_back(ss.str());
        ss.str("");
    }

    // Zero platen dimensions mean unknown
    const bool platenKnown = machine.platenWidthMm > 0.0 && machine.platenHeightMm > 0.0;
    if (platenKnown && (machine.platenWidthMm < req.partWidthMm * kPlatenMarginRatio ||
                        machine.platenHeightMm < req.partHeightMm * kPlatenMarginRatio)) {
        notes.push_back("Platen size may be tight for the mold");
    }

    if (notes.size() == 1 && suitability == Suitability::Ideal) {
        notes.push_back("Good match for tonnage, shot volume and platen size");
    }
    return notes;
}

} // namespace molding
} // namespace mc
