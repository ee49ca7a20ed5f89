// moldcheck - CLI front end for the injection molding feasibility analysis.
// Loads config and catalogs, builds a geometry summary from a JSON file or
// hand-entered dimensions, runs the analysis and prints the JSON report.
//
// Usage: moldcheck [--config FILE] (--geometry FILE | --manual L W H T)
//                  --material ID [--cavities N] [--gate TYPE] [--safety F]
//                  [--gate-diameter MM] [--runner-diameter MM]
//                  [--gate-location X,Y,Z] [--view designer|customer]
//        moldcheck [--config FILE] --list-materials | --list-machines
//        moldcheck [--config FILE] [--cavities N] [--gate TYPE] [--safety F]
//                  --write-config FILE
//
// Exit codes: 0 success, 1 usage or I/O error, 2 analysis failure.

#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/catalog/machine_catalog.h"
#include "core/catalog/material_catalog.h"
#include "core/config/config.h"
#include "core/geometry/geometry_file.h"
#include "core/geometry/manual_geometry.h"
#include "core/molding/analysis_engine.h"
#include "core/molding/input_validation.h"
#include "core/report/analysis_report.h"
#include "core/utils/log.h"
#include "core/utils/string_utils.h"

using namespace mc;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitAnalysis = 2;

struct Options {
    Path configPath;
    Path writeConfigPath;
    Path geometryPath;
    std::optional<geometry::ManualDimensions> manual;
    std::optional<i64> materialId;
    std::optional<int> cavities;
    std::optional<molding::GateType> gateType;
    std::optional<f64> safetyFactor;
    std::optional<f64> gateDiameter;
    std::optional<f64> runnerDiameter;
    std::optional<molding::Point3> gateLocation;
    report::ReportView view = report::ReportView::Designer;
    bool listMaterials = false;
    bool listMachines = false;
    bool help = false;
};

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [--config FILE] (--geometry FILE | --manual L W H T) --material ID\n"
                 "       [--cavities N] [--gate edge|pin|fan|submarine] [--safety F]\n"
                 "       [--gate-diameter MM] [--runner-diameter MM] [--gate-location X,Y,Z]\n"
                 "       [--view designer|customer]\n"
              << "       " << argv0 << " [--config FILE] --list-materials | --list-machines\n"
              << "       " << argv0
              << " [--config FILE] [--cavities N] [--gate TYPE] [--safety F] --write-config FILE\n";
}

bool parseNumber(const std::string& flag, const char* text, f64& out) {
    if (str::parseDouble(text, out)) return true;
    std::cerr << "Error: " << flag << " expects a number, got '" << text << "'\n";
    return false;
}

bool parsePoint(const char* text, molding::Point3& out) {
    auto parts = str::split(text, ',');
    if (parts.size() != 3) return false;
    return str::parseDouble(str::trim(parts[0]), out.x) &&
           str::parseDouble(str::trim(parts[1]), out.y) &&
           str::parseDouble(str::trim(parts[2]), out.z);
}

// Returns false on malformed arguments (message already printed)
bool parseArgs(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto needs = [&](int count) {
            if (i + count < argc) return true;
            std::cerr << "Error: " << arg << " expects " << count << " value(s)\n";
            return false;
        };

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--list-materials") {
            opts.listMaterials = true;
        } else if (arg == "--list-machines") {
            opts.listMachines = true;
        } else if (arg == "--config") {
            if (!needs(1)) return false;
            opts.configPath = argv[++i];
        } else if (arg == "--write-config") {
            if (!needs(1)) return false;
            opts.writeConfigPath = argv[++i];
        } else if (arg == "--geometry") {
            if (!needs(1)) return false;
            opts.geometryPath = argv[++i];
        } else if (arg == "--manual") {
            if (!needs(4)) return false;
            geometry::ManualDimensions d;
            if (!parseNumber(arg, argv[++i], d.lengthMm) ||
                !parseNumber(arg, argv[++i], d.widthMm) ||
                !parseNumber(arg, argv[++i], d.heightMm) ||
                !parseNumber(arg, argv[++i], d.wallThicknessMm)) {
                return false;
            }
            opts.manual = d;
        } else if (arg == "--material") {
            if (!needs(1)) return false;
            long long id = 0;
            if (!str::parseInt64(argv[++i], id)) {
                std::cerr << "Error: --material expects an integer id\n";
                return false;
            }
            opts.materialId = static_cast<i64>(id);
        } else if (arg == "--cavities") {
            if (!needs(1)) return false;
            int n = 0;
            if (!str::parseInt(argv[++i], n)) {
                std::cerr << "Error: --cavities expects an integer\n";
                return false;
            }
            opts.cavities = n;
        } else if (arg == "--gate") {
            if (!needs(1)) return false;
            opts.gateType = molding::parseGateType(argv[++i]);
            if (!opts.gateType) {
                std::cerr << "Error: unknown gate type '" << argv[i] << "'\n";
                return false;
            }
        } else if (arg == "--safety") {
            if (!needs(1)) return false;
            f64 v = 0.0;
            if (!parseNumber(arg, argv[++i], v)) return false;
            opts.safetyFactor = v;
        } else if (arg == "--gate-diameter") {
            if (!needs(1)) return false;
            f64 v = 0.0;
            if (!parseNumber(arg, argv[++i], v)) return false;
            opts.gateDiameter = v;
        } else if (arg == "--runner-diameter") {
            if (!needs(1)) return false;
            f64 v = 0.0;
            if (!parseNumber(arg, argv[++i], v)) return false;
            opts.runnerDiameter = v;
        } else if (arg == "--gate-location") {
            if (!needs(1)) return false;
            molding::Point3 p;
            if (!parsePoint(argv[++i], p)) {
                std::cerr << "Error: --gate-location expects X,Y,Z in mm\n";
                return false;
            }
            opts.gateLocation = p;
        } else if (arg == "--view") {
            if (!needs(1)) return false;
            auto view = report::parseReportView(argv[++i]);
            if (!view) {
                std::cerr << "Error: --view expects designer or customer\n";
                return false;
            }
            opts.view = *view;
        } else {
            std::cerr << "Error: unknown option '" << arg << "'\n";
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    log::setLevel(log::Level::Info);

    Options opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage(argv[0]);
        return kExitUsage;
    }
    if (opts.help) {
        printUsage(argv[0]);
        return kExitOk;
    }

    auto& config = Config::instance();
    if (!opts.configPath.empty() && !config.load(opts.configPath)) {
        return kExitUsage;
    }
    log::setLevel(log::levelFromInt(config.getLogLevel()));
    if (!config.getLogFile().empty() && !log::setLogFile(config.getLogFile().string())) {
        log::warningf("MoldCheck", "Cannot open log file %s, logging to console only",
                      config.getLogFile().string().c_str());
    }

    // Persist command-line defaults and stop
    if (!opts.writeConfigPath.empty()) {
        if ((opts.cavities && *opts.cavities < 1) ||
            (opts.safetyFactor && (*opts.safetyFactor < molding::kMinSafetyFactor ||
                                   *opts.safetyFactor > molding::kMaxSafetyFactor))) {
            std::cerr << "Error: cavities must be >= 1 and safety factor within [1.0, 3.0]\n";
            return kExitUsage;
        }
        if (opts.cavities) config.setDefaultCavityCount(*opts.cavities);
        if (opts.gateType) config.setDefaultGateType(*opts.gateType);
        if (opts.safetyFactor) config.setDefaultSafetyFactor(*opts.safetyFactor);
        if (!config.save(opts.writeConfigPath)) return kExitUsage;
        log::infof("MoldCheck", "Wrote %s", opts.writeConfigPath.string().c_str());
        return kExitOk;
    }

    // Catalog snapshots
    MaterialCatalog materials = MaterialCatalog::builtIn();
    if (!config.getMaterialsPath().empty()) {
        auto loaded = MaterialCatalog::loadFile(config.getMaterialsPath());
        if (!loaded) return kExitUsage;
        materials = std::move(*loaded);
    }
    MachineCatalog machines = MachineCatalog::builtIn();
    if (!config.getMachinesPath().empty()) {
        auto loaded = MachineCatalog::loadFile(config.getMachinesPath());
        if (!loaded) return kExitUsage;
        machines = std::move(*loaded);
    }

    if (opts.listMaterials || opts.listMachines) {
        if (opts.listMaterials) std::cout << materials.toJsonString() << "\n";
        if (opts.listMachines) std::cout << machines.toJsonString() << "\n";
        return kExitOk;
    }

    // Geometry
    molding::GeometrySummary geometry;
    if (opts.manual) {
        auto estimate = geometry::estimateManualGeometry(*opts.manual);
        if (!estimate) {
            log::errorf("MoldCheck", "%s", estimate.error.describe().c_str());
            return kExitAnalysis;
        }
        geometry = estimate.get();
    } else if (!opts.geometryPath.empty()) {
        auto loaded = geometry::loadFile(opts.geometryPath);
        if (!loaded) return kExitUsage;
        geometry = *loaded;
    } else {
        std::cerr << "Error: --geometry or --manual is required\n";
        printUsage(argv[0]);
        return kExitUsage;
    }

    // Material
    if (!opts.materialId) {
        std::cerr << "Error: --material is required\n";
        printUsage(argv[0]);
        return kExitUsage;
    }
    const auto* material = materials.findById(*opts.materialId);
    if (material == nullptr) {
        log::errorf("MoldCheck", "No material with id %lld",
                    static_cast<long long>(*opts.materialId));
        return kExitUsage;
    }

    // Process configuration: command line over config defaults
    molding::ProcessConfig process;
    process.cavityCount = opts.cavities.value_or(config.getDefaultCavityCount());
    process.gateType = opts.gateType.value_or(config.getDefaultGateType());
    process.safetyFactor = opts.safetyFactor.value_or(config.getDefaultSafetyFactor());
    process.gateDiameterMm = opts.gateDiameter;
    process.runnerDiameterMm = opts.runnerDiameter;
    process.gateLocationMm = opts.gateLocation;

    log::debugf("MoldCheck", "Analysing part %lld with %s (%zu machines)",
                static_cast<long long>(geometry.partId), material->name.c_str(),
                machines.size());

    auto outcome = molding::AnalysisEngine::run(geometry, *material, machines.all(), process);
    if (!outcome) {
        log::errorf("MoldCheck", "Analysis failed: %s", outcome.error.describe().c_str());
        return kExitAnalysis;
    }

    std::cout << report::toJsonString(outcome.get(), opts.view) << "\n";
    return kExitOk;
}
