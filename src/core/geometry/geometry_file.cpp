#include "geometry_file.h"

#include <nlohmann/json.hpp>

#include "../utils/file_utils.h"
#include "../utils/json_fields.h"
#include "../utils/log.h"

namespace mc {
namespace geometry {

using molding::GeometrySummary;

namespace {

constexpr const char* kLogModule = "Geometry";

} // namespace

Result<GeometrySummary> fromJsonString(const std::string& jsonStr) {
    auto j = nlohmann::json::parse(jsonStr, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        log::error(kLogModule, "Geometry file is not a JSON object");
        return std::nullopt;
    }

    GeometrySummary g;
    json::readInt(j, "part_id", g.partId);

    struct Field {
        const char* key;
        f64* target;
    };
    const Field required[] = {
        {"volume_cm3", &g.volumeCm3},
        {"projected_area_cm2", &g.projectedAreaCm2},
        {"min_thickness", &g.minThicknessMm},
        {"avg_thickness", &g.avgThicknessMm},
        {"max_thickness", &g.maxThicknessMm},
        {"bbox_x", &g.bbox.x},
        {"bbox_y", &g.bbox.y},
        {"bbox_z", &g.bbox.z},
    };
    for (const auto& f : required) {
        if (!json::readNumber(j, f.key, *f.target)) {
            log::errorf(kLogModule, "Geometry field '%s' is missing or not a number", f.key);
            return std::nullopt;
        }
    }

    std::string source;
    if (json::readString(j, "source", source)) {
        auto parsed = molding::parseGeometrySource(source);
        if (!parsed) {
            log::errorf(kLogModule, "Unknown geometry source '%s'", source.c_str());
            return std::nullopt;
        }
        g.source = *parsed;
    }
    return g;
}

Result<GeometrySummary> loadFile(const Path& path) {
    auto text = file::readText(path);
    if (!text) return std::nullopt;
    return fromJsonString(*text);
}

std::string toJsonString(const GeometrySummary& g) {
    nlohmann::json j{
        {"part_id", g.partId},
        {"volume_cm3", g.volumeCm3},
        {"projected_area_cm2", g.projectedAreaCm2},
        {"min_thickness", g.minThicknessMm},
        {"avg_thickness", g.avgThicknessMm},
        {"max_thickness", g.maxThicknessMm},
        {"bbox_x", g.bbox.x},
        {"bbox_y", g.bbox.y},
        {"bbox_z", g.bbox.z},
        {"source", molding::geometrySourceToString(g.source)},
    };
    return j.dump(2);
}

} // namespace geometry
} // namespace mc
