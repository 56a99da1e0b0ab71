#include "submodule.hpp"

#include "git_utils.hpp"

namespace {

struct ManifestScan {
    std::vector<SubmoduleSpec> specs;
};

int collect_path(const git_config_entry* entry, void* payload) {
    auto* scan = static_cast<ManifestScan*>(payload);
    const std::string key = entry->name;
    const std::string prefix = "submodule.";
    const std::string suffix = ".path";
    if (key.size() <= prefix.size() + suffix.size())
        return 0;
    SubmoduleSpec spec;
    spec.name = key.substr(prefix.size(), key.size() - prefix.size() - suffix.size());
    spec.path = entry->value ? entry->value : "";
    while (!spec.path.empty() && spec.path.back() == '/')
        spec.path.pop_back();
    if (!spec.path.empty())
        scan->specs.push_back(std::move(spec));
    return 0;
}

} // namespace

std::optional<std::vector<SubmoduleSpec>> read_manifest(const fs::path& root, std::string* error) {
    fs::path manifest = root / ".gitmodules";
    std::error_code ec;
    if (!fs::is_regular_file(manifest, ec)) {
        if (error)
            *error = "no submodule manifest at " + manifest.string();
        return std::nullopt;
    }
    git_config* raw = nullptr;
    if (git_config_open_ondisk(&raw, manifest.string().c_str()) != 0) {
        if (error) {
            const git_error* e = git_error_last();
            *error = "cannot read " + manifest.string() + ": " +
                     (e && e->message ? e->message : "unknown error");
        }
        return std::nullopt;
    }
    git::config_ptr cfg(raw);
    ManifestScan scan;
    if (git_config_foreach_match(cfg.get(), R"(^submodule\..+\.path$)", collect_path, &scan) != 0) {
        if (error) {
            const git_error* e = git_error_last();
            *error = "cannot parse " + manifest.string() + ": " +
                     (e && e->message ? e->message : "unknown error");
        }
        return std::nullopt;
    }
    for (auto& spec : scan.specs) {
        git_config_entry* entry = nullptr;
        std::string key = "submodule." + spec.name + ".branch";
        if (git_config_get_entry(&entry, cfg.get(), key.c_str()) == 0) {
            if (entry->value)
                spec.declared_branch = entry->value;
            git_config_entry_free(entry);
        }
    }
    return scan.specs;
}

void apply_submodule_overrides(std::vector<SubmoduleSpec>& specs,
                               const std::map<std::string, SubmoduleOverride>& overrides) {
    for (auto& spec : specs) {
        auto it = overrides.find(spec.name);
        if (it == overrides.end())
            it = overrides.find(spec.path);
        if (it == overrides.end())
            continue;
        if (it->second.branch)
            spec.declared_branch = *it->second.branch;
        spec.skip = spec.skip || it->second.skip;
    }
}
