#ifndef SUBMODULE_HPP
#define SUBMODULE_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief One entry of the superproject's `.gitmodules`.
 */
struct SubmoduleSpec {
    std::string name;
    std::string path;            ///< Relative to the superproject root
    std::string declared_branch; ///< `submodule.<name>.branch`, may be empty
    bool skip = false;           ///< Excluded by configuration
};

/**
 * @brief Configuration overrides for a single submodule.
 */
struct SubmoduleOverride {
    std::optional<std::string> branch;
    bool skip = false;
};

/**
 * @brief Read the submodules declared in `<root>/.gitmodules` in file order.
 *
 * @return The submodules, possibly none, or `std::nullopt` when the manifest
 *         is missing or unreadable.
 */
std::optional<std::vector<SubmoduleSpec>> read_manifest(const fs::path& root,
                                                        std::string* error = nullptr);

/**
 * @brief Apply per-submodule overrides keyed by submodule name or path.
 */
void apply_submodule_overrides(std::vector<SubmoduleSpec>& specs,
                               const std::map<std::string, SubmoduleOverride>& overrides);

#endif // SUBMODULE_HPP
