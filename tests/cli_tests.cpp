#include "test_common.hpp"
#include "cli_commands.hpp"

using namespace autosubsync::test_support;

namespace {

Options sync_options(const fs::path& root, bool dry_run) {
    Options opts;
    opts.root = root;
    opts.dry_run = dry_run;
    opts.logging.silent = true;
    return opts;
}

// Superproject tracking `libs/core`, whose origin gained @a file after the
// pointer was recorded.
fs::path behind_origin(const TempDir& tmp, const std::string& file) {
    fs::path core = tmp / "core.git";
    fs::path seed = tmp / "core-seed";
    make_seeded_bare(core, seed);
    fs::path super = make_superproject(tmp.path(), {{"libs/core", core}});
    push_change(seed, file, "content\n", "add " + file);
    return super;
}

} // namespace

TEST_CASE("run_sync rejects roots that are not superprojects") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    TempDir tmp("cli_roots");
    FakeHttpClient http;

    REQUIRE(cli::run_sync(sync_options(tmp / "missing", true), http) == 1);

    fs::path plain = tmp / "plain";
    fs::create_directories(plain);
    REQUIRE(git_ok(plain, "init"));
    REQUIRE(cli::run_sync(sync_options(plain, true), http) == 1);
    REQUIRE(http.requests().empty());
}

TEST_CASE("dry run reconciles and commits locally") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    TempDir tmp("cli_dry");
    fs::path super = behind_origin(tmp, "docs/guide.md");
    FakeHttpClient http;

    REQUIRE(cli::run_sync(sync_options(super, true), http) == 0);
    REQUIRE(http.requests().empty());
    REQUIRE(git_out(super / "libs/core", "rev-parse HEAD") ==
            git_out(tmp / "core.git", "rev-parse main"));
    REQUIRE(git_out(super, "rev-parse --abbrev-ref HEAD") == "auto/submodule-updates");
    REQUIRE(git_out(super, "log -1 --format=%s") == PUBLISH_COMMIT_TITLE);
    REQUIRE(git_out(tmp / "super.git", "branch --list auto/submodule-updates").empty());
}

TEST_CASE("a full run pushes the automation branch") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    TempDir tmp("cli_push");
    fs::path super = behind_origin(tmp, "docs/guide.md");
    FakeHttpClient http;

    REQUIRE(cli::run_sync(sync_options(super, false), http) == 0);
    REQUIRE(git_out(tmp / "super.git", "rev-parse auto/submodule-updates") ==
            git_out(super, "rev-parse auto/submodule-updates"));
    REQUIRE(git_out(tmp / "super.git", "rev-parse auto/submodule-updates:libs/core") ==
            git_out(tmp / "core.git", "rev-parse main"));
    // Neither a GitHub origin nor a token is available, so no PR is attempted.
    REQUIRE(http.requests().empty());
}

TEST_CASE("runs without markdown changes publish nothing") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    TempDir tmp("cli_code_only");
    fs::path super = behind_origin(tmp, "src/core.cpp");
    FakeHttpClient http;

    REQUIRE(cli::run_sync(sync_options(super, false), http) == 0);
    REQUIRE(git_out(super, "branch --list auto/submodule-updates").empty());
    REQUIRE(git_out(tmp / "super.git", "branch --list auto/submodule-updates").empty());
}

TEST_CASE("configured skips leave submodules untouched") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    git::GitInitGuard guard;
    TempDir tmp("cli_skip");
    fs::path super = behind_origin(tmp, "docs/guide.md");
    std::string before = git_out(super / "libs/core", "rev-parse HEAD");
    FakeHttpClient http;

    Options opts = sync_options(super, true);
    SubmoduleOverride skip;
    skip.skip = true;
    opts.submodule_overrides["libs/core"] = skip;
    REQUIRE(cli::run_sync(opts, http) == 0);
    REQUIRE(git_out(super / "libs/core", "rev-parse HEAD") == before);
    REQUIRE(git_out(super, "rev-parse --abbrev-ref HEAD") == "main");
}
