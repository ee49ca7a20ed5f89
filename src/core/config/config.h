#pragma once

#include <string>

#include "../molding/molding_types.h"
#include "../types.h"

namespace mc {

// Tool configuration persisted as INI. Supplies CLI defaults only; the
// analysis engine takes every value as an explicit argument.
class Config {
  public:
    // Singleton access
    static Config& instance();

    // Missing file is not an error (defaults stay in effect)
    bool load(const Path& path);
    bool save(const Path& path) const;

    // Restore built-in defaults
    void reset();

    // [analysis]
    int getDefaultCavityCount() const { return m_defaultCavityCount; }
    void setDefaultCavityCount(int count) { m_defaultCavityCount = count; }

    molding::GateType getDefaultGateType() const { return m_defaultGateType; }
    void setDefaultGateType(molding::GateType type) { m_defaultGateType = type; }

    f64 getDefaultSafetyFactor() const { return m_defaultSafetyFactor; }
    void setDefaultSafetyFactor(f64 factor) { m_defaultSafetyFactor = factor; }

    // [catalog] - empty means use the built-in lists
    const Path& getMaterialsPath() const { return m_materialsPath; }
    void setMaterialsPath(const Path& path) { m_materialsPath = path; }

    const Path& getMachinesPath() const { return m_machinesPath; }
    void setMachinesPath(const Path& path) { m_machinesPath = path; }

    // [logging] level: 0=Debug 1=Info 2=Warning 3=Error
    int getLogLevel() const { return m_logLevel; }
    void setLogLevel(int level) { m_logLevel = level; }

    const Path& getLogFile() const { return m_logFile; }
    void setLogFile(const Path& path) { m_logFile = path; }

  private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void parseLine(const std::string& section, const std::string& key, const std::string& value);

    int m_defaultCavityCount = 1;
    molding::GateType m_defaultGateType = molding::GateType::Edge;
    f64 m_defaultSafetyFactor = 1.15;

    Path m_materialsPath;
    Path m_machinesPath;

    int m_logLevel = 1;
    Path m_logFile;
};

} // namespace mc
