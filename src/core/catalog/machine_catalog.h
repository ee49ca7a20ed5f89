#pragma once

// MoldCheck - Machine Catalog
// Read-only snapshot of molding machine records.

#include <string>
#include <vector>

#include "../molding/molding_types.h"
#include "../types.h"

namespace mc {

class MachineCatalog {
  public:
    MachineCatalog() = default;
    explicit MachineCatalog(std::vector<molding::MachineSpec> machines);

    static MachineCatalog builtIn();

    // {"machines": [...]}; nullopt (logged) on malformed input or duplicate ids
    static Result<MachineCatalog> fromJsonString(const std::string& jsonStr);
    static Result<MachineCatalog> loadFile(const Path& path);

    std::string toJsonString() const;

    const molding::MachineSpec* findById(i64 id) const;

    const std::vector<molding::MachineSpec>& all() const { return m_machines; }
    usize size() const { return m_machines.size(); }
    bool empty() const { return m_machines.empty(); }

  private:
    std::vector<molding::MachineSpec> m_machines;
};

} // namespace mc
