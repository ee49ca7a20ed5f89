#include "default_materials.h"

#include <string>

namespace mc {

using molding::MaterialProperties;
using molding::PolymerFamily;
using molding::Range;
using molding::ViscosityClass;

namespace {

MaterialProperties makeGrade(const std::string& name,
                             const std::string& manufacturer,
                             const std::string& grade,
                             PolymerFamily family,
                             Range melt,
                             Range mold,
                             double density,
                             Range shrinkage,
                             ViscosityClass viscosity,
                             double maxFlowRatio,
                             Range pressure) {
    MaterialProperties m;
    m.name = name;
    m.manufacturer = manufacturer;
    m.grade = grade;
    m.family = family;
    m.meltTempC = melt;
    m.moldTempC = mold;
    m.densityGPerCm3 = density;
    m.shrinkagePct = shrinkage;
    m.viscosity = viscosity;
    m.maxFlowLengthRatio = maxFlowRatio;
    m.cavityPressureMpa = pressure;
    return m;
}

} // namespace

std::vector<MaterialProperties> getDefaultMaterials() {
    constexpr auto Low = ViscosityClass::Low;
    constexpr auto Medium = ViscosityClass::Medium;
    constexpr auto High = ViscosityClass::High;

    std::vector<MaterialProperties> materials = {
        // ABS
        makeGrade("ABS General Purpose", "Generic", "GP", PolymerFamily::ABS,
                  {220, 260}, {50, 80}, 1.05, {0.4, 0.7}, Medium, 150, {80, 120}),
        makeGrade("SABIC Cycolac MG47", "SABIC", "Cycolac MG47", PolymerFamily::ABS,
                  {230, 260}, {60, 80}, 1.05, {0.4, 0.6}, Medium, 160, {80, 110}),
        makeGrade("LG ABS HI121H", "LG Chem", "HI121H", PolymerFamily::ABS,
                  {220, 250}, {50, 70}, 1.04, {0.4, 0.7}, Medium, 150, {75, 115}),

        // PP
        makeGrade("PP Homopolymer", "Generic", "Homo", PolymerFamily::PP,
                  {200, 250}, {20, 50}, 0.91, {1.5, 2.0}, Low, 250, {60, 100}),
        makeGrade("SABIC PP 500P", "SABIC", "500P", PolymerFamily::PP,
                  {200, 240}, {20, 50}, 0.905, {1.5, 2.0}, Medium, 200, {70, 110}),
        makeGrade("LyondellBasell Moplen HP500N", "LyondellBasell", "Moplen HP500N",
                  PolymerFamily::PP, {200, 250}, {20, 50}, 0.90, {1.4, 1.9}, Low, 260, {60, 100}),

        // PC
        makeGrade("PC General Purpose", "Generic", "GP", PolymerFamily::PC,
                  {280, 320}, {80, 120}, 1.20, {0.5, 0.7}, High, 100, {100, 150}),
        makeGrade("Covestro Makrolon 2405", "Covestro", "Makrolon 2405", PolymerFamily::PC,
                  {280, 320}, {80, 110}, 1.20, {0.5, 0.7}, High, 100, {100, 140}),
        makeGrade("SABIC Lexan 141R", "SABIC", "Lexan 141R", PolymerFamily::PC,
                  {280, 310}, {80, 120}, 1.20, {0.5, 0.7}, High, 105, {100, 145}),

        // PA (nylon)
        makeGrade("PA6 General", "Generic", "PA6", PolymerFamily::PA,
                  {240, 280}, {60, 90}, 1.13, {1.0, 1.5}, Medium, 150, {80, 120}),
        makeGrade("BASF Ultramid B3S", "BASF", "Ultramid B3S", PolymerFamily::PA,
                  {250, 280}, {70, 90}, 1.13, {0.8, 1.5}, Low, 180, {70, 110}),
        makeGrade("DuPont Zytel 101L", "DuPont", "Zytel 101L", PolymerFamily::PA,
                  {270, 295}, {70, 100}, 1.14, {1.0, 1.5}, Medium, 140, {80, 120}),

        // Commodity and engineering
        makeGrade("HIPS", "Generic", "High Impact PS", PolymerFamily::PS,
                  {180, 230}, {30, 60}, 1.05, {0.4, 0.6}, Low, 200, {60, 100}),
        makeGrade("HDPE", "Generic", "High Density", PolymerFamily::PE,
                  {200, 280}, {20, 60}, 0.95, {2.0, 3.0}, Low, 200, {60, 100}),
        makeGrade("POM (Acetal)", "Generic", "Copolymer", PolymerFamily::POM,
                  {190, 210}, {60, 90}, 1.41, {1.8, 2.2}, Medium, 100, {80, 120}),
        makeGrade("DuPont Delrin 500P", "DuPont", "Delrin 500P", PolymerFamily::POM,
                  {200, 220}, {80, 100}, 1.42, {1.9, 2.1}, Low, 120, {75, 115}),
        makeGrade("PC+ABS Blend", "Generic", "Blend", PolymerFamily::PCABS,
                  {240, 280}, {60, 90}, 1.15, {0.5, 0.7}, Medium, 120, {80, 120}),
        makeGrade("Covestro Bayblend T65 XF", "Covestro", "Bayblend T65 XF",
                  PolymerFamily::PCABS, {250, 280}, {60, 80}, 1.13, {0.5, 0.7}, Medium, 130,
                  {80, 115}),
        makeGrade("PMMA (Acrylic)", "Generic", "General", PolymerFamily::PMMA,
                  {220, 260}, {50, 80}, 1.18, {0.4, 0.7}, High, 100, {80, 120}),
        makeGrade("PBT", "Generic", "Unreinforced", PolymerFamily::PBT,
                  {240, 270}, {60, 90}, 1.31, {1.5, 2.0}, Medium, 100, {80, 120}),
        makeGrade("PET", "Generic", "Unreinforced", PolymerFamily::PET,
                  {260, 290}, {80, 120}, 1.34, {1.2, 2.0}, Medium, 110, {80, 120}),
    };

    for (size_t i = 0; i < materials.size(); ++i) {
        materials[i].id = static_cast<i64>(i + 1);
    }
    return materials;
}

} // namespace mc
