#include "machine_catalog.h"

#include <set>
#include <utility>

#include <nlohmann/json.hpp>

#include "../utils/file_utils.h"
#include "../utils/json_fields.h"
#include "../utils/log.h"
#include "default_machines.h"

namespace mc {

using molding::MachineSpec;

namespace {

constexpr const char* kLogModule = "Catalog";

std::string parseMachine(const nlohmann::json& j, MachineSpec& m) {
    if (!j.is_object()) return "<entry>";
    if (!json::readString(j, "name", m.name)) return "name";
    json::readString(j, "manufacturer", m.manufacturer);
    json::readString(j, "typical_use", m.typicalUse);
    if (!json::readNumber(j, "tonnage", m.tonnage)) return "tonnage";
    if (!json::readNumber(j, "shot_volume_max", m.maxShotVolumeCm3)) return "shot_volume_max";
    // Optional dimensions default to 0 (unknown)
    json::readNumber(j, "screw_diameter", m.screwDiameterMm);
    json::readNumber(j, "platen_width", m.platenWidthMm);
    json::readNumber(j, "platen_height", m.platenHeightMm);
    json::readNumber(j, "tie_bar_spacing_h", m.tieBarSpacingHMm);
    json::readNumber(j, "tie_bar_spacing_v", m.tieBarSpacingVMm);
    return {};
}

} // namespace

MachineCatalog::MachineCatalog(std::vector<MachineSpec> machines)
    : m_machines(std::move(machines)) {}

MachineCatalog MachineCatalog::builtIn() {
    return MachineCatalog(getDefaultMachines());
}

Result<MachineCatalog> MachineCatalog::fromJsonString(const std::string& jsonStr) {
    auto j = nlohmann::json::parse(jsonStr, nullptr, false);
    if (j.is_discarded()) {
        log::error(kLogModule, "Machine catalog is not valid JSON");
        return std::nullopt;
    }
    auto list = j.find("machines");
    if (!j.is_object() || list == j.end() || !list->is_array()) {
        log::error(kLogModule, "Machine catalog has no \"machines\" array");
        return std::nullopt;
    }

    std::vector<MachineSpec> machines;
    std::set<i64> seen;
    for (usize i = 0; i < list->size(); ++i) {
        const auto& entry = (*list)[i];
        MachineSpec m;
        const std::string bad = parseMachine(entry, m);
        if (!bad.empty()) {
            log::errorf(kLogModule, "Machine entry %zu: missing or malformed %s", i,
                        bad.c_str());
            return std::nullopt;
        }
        m.id = static_cast<i64>(i + 1);
        if (entry.contains("id") && !json::readInt(entry, "id", m.id)) {
            log::errorf(kLogModule, "Machine entry %zu: id must be an integer", i);
            return std::nullopt;
        }
        if (!seen.insert(m.id).second) {
            log::errorf(kLogModule, "Duplicate machine id %lld", static_cast<long long>(m.id));
            return std::nullopt;
        }
        machines.push_back(std::move(m));
    }

    log::debugf(kLogModule, "Parsed %zu machines", machines.size());
    return MachineCatalog(std::move(machines));
}

Result<MachineCatalog> MachineCatalog::loadFile(const Path& path) {
    auto text = file::readText(path);
    if (!text) return std::nullopt;

    auto catalog = fromJsonString(*text);
    if (catalog) {
        log::infof(kLogModule, "Loaded %zu machines from %s", catalog->size(),
                   path.string().c_str());
    }
    return catalog;
}

std::string MachineCatalog::toJsonString() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& m : m_machines) {
        list.push_back({
            {"id", m.id},
            {"name", m.name},
            {"manufacturer", m.manufacturer},
            {"tonnage", m.tonnage},
            {"shot_volume_max", m.maxShotVolumeCm3},
            {"screw_diameter", m.screwDiameterMm},
            {"platen_width", m.platenWidthMm},
            {"platen_height", m.platenHeightMm},
            {"tie_bar_spacing_h", m.tieBarSpacingHMm},
            {"tie_bar_spacing_v", m.tieBarSpacingVMm},
            {"typical_use", m.typicalUse},
        });
    }
    nlohmann::json j{{"machines", list}};
    return j.dump(2);
}

const MachineSpec* MachineCatalog::findById(i64 id) const {
    for (const auto& m : m_machines) {
        if (m.id == id) return &m;
    }
    return nullptr;
}

} // namespace mc
