#include "config.h"

#include <sstream>

#include "../molding/input_validation.h"
#include "../utils/file_utils.h"
#include "../utils/log.h"
#include "../utils/string_utils.h"

namespace mc {

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    m_defaultCavityCount = 1;
    m_defaultGateType = molding::GateType::Edge;
    m_defaultSafetyFactor = 1.15;
    m_materialsPath.clear();
    m_machinesPath.clear();
    m_logLevel = 1;
    m_logFile.clear();
}

bool Config::load(const Path& path) {
    if (!file::exists(path)) {
        log::infof("Config", "No config file at %s, using defaults", path.string().c_str());
        return true;
    }

    auto content = file::readText(path);
    if (!content) {
        log::error("Config", "Failed to read config file");
        return false;
    }

    std::istringstream stream(*content);
    std::string line;
    std::string section;

    while (std::getline(stream, line)) {
        line = str::trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[' && line.back() == ']') {
            section = line.substr(1, line.length() - 2);
            continue;
        }

        auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        parseLine(section, str::trim(line.substr(0, pos)), str::trim(line.substr(pos + 1)));
    }

    log::infof("Config", "Loaded from %s", path.string().c_str());
    return true;
}

void Config::parseLine(const std::string& section, const std::string& key,
                       const std::string& value) {
    if (section == "analysis") {
        if (key == "cavity_count") {
            int count = 0;
            if (str::parseInt(value, count) && count >= 1) {
                m_defaultCavityCount = count;
            } else {
                log::warningf("Config", "Ignoring cavity_count=%s", value.c_str());
            }
        } else if (key == "gate_type") {
            if (auto gate = molding::parseGateType(value)) {
                m_defaultGateType = *gate;
            } else {
                log::warningf("Config", "Ignoring gate_type=%s", value.c_str());
            }
        } else if (key == "safety_factor") {
            f64 factor = 0.0;
            if (str::parseDouble(value, factor) && factor >= molding::kMinSafetyFactor &&
                factor <= molding::kMaxSafetyFactor) {
                m_defaultSafetyFactor = factor;
            } else {
                log::warningf("Config", "Ignoring safety_factor=%s", value.c_str());
            }
        }
    } else if (section == "catalog") {
        if (key == "materials_path") {
            m_materialsPath = value;
        } else if (key == "machines_path") {
            m_machinesPath = value;
        }
    } else if (section == "logging") {
        if (key == "level") {
            int level = 0;
            if (str::parseInt(value, level)) {
                m_logLevel = level;
            } else {
                log::warningf("Config", "Ignoring level=%s", value.c_str());
            }
        } else if (key == "log_file") {
            m_logFile = value;
        }
    }
}

bool Config::save(const Path& path) const {
    if (!file::createDirectories(path.parent_path())) {
        log::error("Config", "Failed to create config directory");
        return false;
    }

    std::ostringstream ss;
    ss << "# MoldCheck Configuration\n\n";

    ss << "[analysis]\n";
    ss << "cavity_count=" << m_defaultCavityCount << "\n";
    ss << "gate_type=" << molding::gateTypeToString(m_defaultGateType) << "\n";
    ss << "safety_factor=" << str::formatFixed(m_defaultSafetyFactor, 3) << "\n";
    ss << "\n";

    ss << "[catalog]\n";
    ss << "materials_path=" << m_materialsPath.string() << "\n";
    ss << "machines_path=" << m_machinesPath.string() << "\n";
    ss << "\n";

    ss << "[logging]\n";
    ss << "level=" << m_logLevel << "\n";
    ss << "log_file=" << m_logFile.string() << "\n";

    if (!file::writeTextAtomic(path, ss.str())) {
        log::error("Config", "Failed to save config file");
        return false;
    }

    log::debugf("Config", "Saved to %s", path.string().c_str());
    return true;
}

} // namespace mc
