#include "material_catalog.h"

#include <set>
#include <utility>

#include <nlohmann/json.hpp>

#include "../utils/file_utils.h"
#include "../utils/json_fields.h"
#include "../utils/log.h"
#include "default_materials.h"

namespace mc {

using molding::MaterialProperties;

namespace {

constexpr const char* kLogModule = "Catalog";

bool readRange(const nlohmann::json& j, const char* minKey, const char* maxKey,
               molding::Range& out) {
    return json::readNumber(j, minKey, out.min) && json::readNumber(j, maxKey, out.max);
}

// Returns the name of the first missing or malformed field, empty on success
std::string parseMaterial(const nlohmann::json& j, MaterialProperties& m) {
    if (!j.is_object()) return "<entry>";
    if (!json::readString(j, "name", m.name)) return "name";
    json::readString(j, "manufacturer", m.manufacturer);
    json::readString(j, "grade", m.grade);

    std::string text;
    if (!json::readString(j, "category", text)) return "category";
    auto family = molding::parsePolymerFamily(text);
    if (!family) return "category";
    m.family = *family;

    if (!json::readString(j, "viscosity_class", text)) return "viscosity_class";
    auto viscosity = molding::parseViscosityClass(text);
    if (!viscosity) return "viscosity_class";
    m.viscosity = *viscosity;

    if (!readRange(j, "melt_temp_min", "melt_temp_max", m.meltTempC)) return "melt_temp";
    if (!readRange(j, "mold_temp_min", "mold_temp_max", m.moldTempC)) return "mold_temp";
    if (!json::readNumber(j, "density", m.densityGPerCm3)) return "density";
    if (!readRange(j, "shrinkage_min", "shrinkage_max", m.shrinkagePct)) return "shrinkage";
    if (!json::readNumber(j, "max_flow_length_ratio", m.maxFlowLengthRatio)) {
        return "max_flow_length_ratio";
    }
    if (!readRange(j, "recommended_pressure_min", "recommended_pressure_max",
                   m.cavityPressureMpa)) {
        return "recommended_pressure";
    }
    return {};
}

} // namespace

MaterialCatalog::MaterialCatalog(std::vector<MaterialProperties> materials)
    : m_materials(std::move(materials)) {}

MaterialCatalog MaterialCatalog::builtIn() {
    return MaterialCatalog(getDefaultMaterials());
}

Result<MaterialCatalog> MaterialCatalog::fromJsonString(const std::string& jsonStr) {
    auto j = nlohmann::json::parse(jsonStr, nullptr, false);
    if (j.is_discarded()) {
        log::error(kLogModule, "Material catalog is not valid JSON");
        return std::nullopt;
    }
    auto list = j.find("materials");
    if (!j.is_object() || list == j.end() || !list->is_array()) {
        log::error(kLogModule, "Material catalog has no \"materials\" array");
        return std::nullopt;
    }

    std::vector<MaterialProperties> materials;
    std::set<i64> seen;
    for (usize i = 0; i < list->size(); ++i) {
        const auto& entry = (*list)[i];
        MaterialProperties m;
        const std::string bad = parseMaterial(entry, m);
        if (!bad.empty()) {
            log::errorf(kLogModule, "Material entry %zu: missing or malformed %s", i,
                        bad.c_str());
            return std::nullopt;
        }
        m.id = static_cast<i64>(i + 1);
        if (entry.is_object() && entry.contains("id") && !json::readInt(entry, "id", m.id)) {
            log::errorf(kLogModule, "Material entry %zu: id must be an integer", i);
            return std::nullopt;
        }
        if (!seen.insert(m.id).second) {
            log::errorf(kLogModule, "Duplicate material id %lld", static_cast<long long>(m.id));
            return std::nullopt;
        }
        materials.push_back(std::move(m));
    }

    log::debugf(kLogModule, "Parsed %zu materials", materials.size());
    return MaterialCatalog(std::move(materials));
}

Result<MaterialCatalog> MaterialCatalog::loadFile(const Path& path) {
    auto text = file::readText(path);
    if (!text) return std::nullopt;

    auto catalog = fromJsonString(*text);
    if (catalog) {
        log::infof(kLogModule, "Loaded %zu materials from %s", catalog->size(),
                   path.string().c_str());
    }
    return catalog;
}

std::string MaterialCatalog::toJsonString() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& m : m_materials) {
        list.push_back({
            {"id", m.id},
            {"name", m.name},
            {"manufacturer", m.manufacturer},
            {"grade", m.grade},
            {"category", molding::polymerFamilyToString(m.family)},
            {"melt_temp_min", m.meltTempC.min},
            {"melt_temp_max", m.meltTempC.max},
            {"mold_temp_min", m.moldTempC.min},
            {"mold_temp_max", m.moldTempC.max},
            {"density", m.densityGPerCm3},
            {"shrinkage_min", m.shrinkagePct.min},
            {"shrinkage_max", m.shrinkagePct.max},
            {"viscosity_class", molding::viscosityClassToString(m.viscosity)},
            {"max_flow_length_ratio", m.maxFlowLengthRatio},
            {"recommended_pressure_min", m.cavityPressureMpa.min},
            {"recommended_pressure_max", m.cavityPressureMpa.max},
        });
    }
    nlohmann::json j{{"materials", list}};
    return j.dump(2);
}

const MaterialProperties* MaterialCatalog::findById(i64 id) const {
    for (const auto& m : m_materials) {
        if (m.id == id) return &m;
    }
    return nullptr;
}

} // namespace mc
