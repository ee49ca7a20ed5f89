#include "default_machines.h"

#include <string>

namespace mc {

using molding::MachineSpec;

namespace {

// Generic line: square platens and tie-bar spacing
MachineSpec makeStandard(double tonnage, double shotVolume, double screw, double platen,
                         double tieBar, const std::string& typicalUse) {
    MachineSpec m;
    m.name = std::to_string(static_cast<int>(tonnage)) + "T Standard";
    m.manufacturer = "Generic";
    m.tonnage = tonnage;
    m.maxShotVolumeCm3 = shotVolume;
    m.screwDiameterMm = screw;
    m.platenWidthMm = platen;
    m.platenHeightMm = platen;
    m.tieBarSpacingHMm = tieBar;
    m.tieBarSpacingVMm = tieBar;
    m.typicalUse = typicalUse;
    return m;
}

} // namespace

std::vector<MachineSpec> getDefaultMachines() {
    std::vector<MachineSpec> machines = {
        makeStandard(80, 100, 32, 400, 320, "Small parts, low volume"),
        makeStandard(120, 180, 36, 450, 360, "Small-medium parts"),
        makeStandard(180, 300, 40, 500, 410, "Medium parts"),
        makeStandard(250, 500, 50, 600, 480, "Medium parts"),
        makeStandard(350, 800, 55, 700, 560, "Medium-large parts"),
        makeStandard(500, 1200, 65, 800, 650, "Large parts"),
        makeStandard(650, 1800, 70, 900, 730, "Large parts"),
        makeStandard(850, 2500, 80, 1000, 820, "Very large parts"),
        makeStandard(1000, 3500, 90, 1100, 900, "Very large parts"),
        makeStandard(1300, 5000, 100, 1200, 980, "Extra large parts"),
    };

    for (size_t i = 0; i < machines.size(); ++i) {
        machines[i].id = static_cast<i64>(i + 1);
    }
    return machines;
}

} // namespace mc
