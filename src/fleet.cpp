#include "fleet.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

#include "logger.hpp"

static bool is_markdown(const std::string& path) {
    if (path.size() < 3)
        return false;
    std::string ext = path.substr(path.size() - 3);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".md";
}

bool has_markdown_change(const std::vector<std::string>& files) {
    return std::any_of(files.begin(), files.end(), is_markdown);
}

FleetDecision decide(const std::vector<ReconciliationResult>& results) {
    FleetDecision decision;
    for (const auto& r : results) {
        if (has_markdown_change(r.changed_files) || has_markdown_change(r.session_changed_files))
            decision.any_markdown_changed = true;
        if (r.ahead_count > 0 || r.had_head_change)
            decision.updated_modules.push_back(r);
    }
    return decision;
}

Fleet::Fleet(FleetConfig config, Reconciler& reconciler, Publisher& publisher)
    : config_(std::move(config)), reconciler_(reconciler), publisher_(publisher) {}

static void print_files(const std::string& title, const std::vector<std::string>& files) {
    if (files.empty())
        return;
    log_info("    " + title + ":");
    for (const auto& f : files)
        log_info("      " + f);
}

static std::vector<std::string> markdown_only(const std::vector<std::string>& files) {
    std::vector<std::string> out;
    std::copy_if(files.begin(), files.end(), std::back_inserter(out), is_markdown);
    return out;
}

void Fleet::report(const FleetDecision& decision) const {
    if (decision.updated_modules.empty()) {
        log_info("No submodules are ahead of origin.");
    } else {
        log_info("Updated submodules (commits ahead of origin):");
        for (const auto& r : decision.updated_modules) {
            log_info("  - " + r.name + " (" + r.path + ") on " + r.working_branch + ": ahead " +
                     std::to_string(r.ahead_count) + (r.had_head_change ? " (head changed)" : ""));
            print_files("changed files", r.changed_files);
            if (r.session_changed_files != r.changed_files)
                print_files("session changed files", r.session_changed_files);
            auto md = markdown_only(r.changed_files);
            auto md_session = markdown_only(r.session_changed_files);
            print_files("md files", md);
            if (md_session != md)
                print_files("md files (session)", md_session);
        }
    }
    if (config_.dry_run) {
        size_t ahead = std::count_if(decision.updated_modules.begin(),
                                     decision.updated_modules.end(),
                                     [](const ReconciliationResult& r) { return r.ahead_count > 0; });
        size_t moved = std::count_if(
            decision.updated_modules.begin(), decision.updated_modules.end(),
            [](const ReconciliationResult& r) { return r.had_head_change; });
        log_info("Dry run: " + std::to_string(decision.updated_modules.size()) +
                 " submodule(s) updated this run.");
        log_info("  - with commits to push (ahead): " + std::to_string(ahead));
        log_info("  - with head changed (fast-forward/merge): " + std::to_string(moved));
        log_info(std::string("Dry run gating: .md changes detected across submodules = ") +
                 (decision.any_markdown_changed ? "true" : "false"));
    }
}

bool Fleet::push_updated(const std::vector<ReconciliationResult>& updated) {
    for (const auto& r : updated) {
        if (config_.dry_run) {
            log_info("Dry run: would push " + r.path + " " + r.working_branch + ":" +
                     r.working_branch + " to origin");
            continue;
        }
        log_info("Pushing " + r.path + " to origin " + r.working_branch);
        std::string err;
        if (!git::push_branch(config_.root / r.path, "origin", r.working_branch, r.working_branch,
                              &config_.auth, &err)) {
            log_error("Failed to push submodule '" + r.path + "' to origin", err);
            return false;
        }
    }
    return true;
}

bool Fleet::run(const std::vector<SubmoduleSpec>& specs) {
    results_.clear();
    if (specs.empty()) {
        log_info("No submodules found.");
        return true;
    }
    for (const auto& spec : specs) {
        ReconciliationResult r = reconciler_.reconcile(spec);
        if (!r.ok) {
            log_error("Aborting: submodule '" + r.name + "' (" + r.path + ") failed at step '" +
                      reconcile_step_name(r.failed_step) + "': " + r.error);
            results_.push_back(std::move(r));
            return false;
        }
        results_.push_back(std::move(r));
    }

    FleetDecision decision = decide(results_);
    report(decision);
    if (!decision.any_markdown_changed) {
        log_info("No .md changes detected across submodules; skipping push and PR.");
        return true;
    }
    if (decision.updated_modules.empty()) {
        log_info("No updated submodules to publish.");
        return true;
    }
    log_info("Detected .md changes; pushing all updated submodules (" +
             std::to_string(decision.updated_modules.size()) + ").");
    if (!push_updated(decision.updated_modules))
        return false;
    log_info("Creating superproject branch and opening PR for submodule pointer updates.");
    return publisher_.publish(decision.updated_modules);
}
