#pragma once

// MoldCheck - Material Catalog
// Read-only snapshot of material records, loaded once and passed by
// reference to whoever needs lookups.

#include <string>
#include <vector>

#include "../molding/molding_types.h"
#include "../types.h"

namespace mc {

class MaterialCatalog {
  public:
    MaterialCatalog() = default;
    explicit MaterialCatalog(std::vector<molding::MaterialProperties> materials);

    // Built-in grades
    static MaterialCatalog builtIn();

    // {"materials": [...]}; nullopt (logged) on malformed input or duplicate ids
    static Result<MaterialCatalog> fromJsonString(const std::string& jsonStr);
    static Result<MaterialCatalog> loadFile(const Path& path);

    std::string toJsonString() const;

    // nullptr when no record has the id
    const molding::MaterialProperties* findById(i64 id) const;

    const std::vector<molding::MaterialProperties>& all() const { return m_materials; }
    usize size() const { return m_materials.size(); }
    bool empty() const { return m_materials.empty(); }

  private:
    std::vector<molding::MaterialProperties> m_materials;
};

} // namespace mc
