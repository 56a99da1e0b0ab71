#include "test_common.hpp"
#include "fleet.hpp"

#include <map>

using namespace autosubsync::test_support;

namespace {

class ScriptedReconciler : public Reconciler {
  public:
    std::map<std::string, ReconciliationResult> script;
    std::vector<std::string> visited;

    ReconciliationResult reconcile(const SubmoduleSpec& spec) override {
        visited.push_back(spec.path);
        auto it = script.find(spec.path);
        if (it != script.end())
            return it->second;
        ReconciliationResult r;
        r.name = spec.name;
        r.path = spec.path;
        r.working_branch = "main";
        return r;
    }
};

class RecordingPublisher : public Publisher {
  public:
    std::vector<std::vector<ReconciliationResult>> calls;
    bool outcome = true;

    bool publish(const std::vector<ReconciliationResult>& updated) override {
        calls.push_back(updated);
        return outcome;
    }
};

ReconciliationResult result(const std::string& path, size_t ahead, bool moved,
                            std::vector<std::string> changed,
                            std::vector<std::string> session = {}) {
    ReconciliationResult r;
    r.name = path;
    r.path = path;
    r.working_branch = "main";
    r.ahead_count = ahead;
    r.had_head_change = moved;
    r.changed_files = std::move(changed);
    r.session_changed_files = std::move(session);
    return r;
}

std::vector<SubmoduleSpec> specs(std::initializer_list<const char*> paths) {
    std::vector<SubmoduleSpec> out;
    for (const char* p : paths)
        out.push_back(SubmoduleSpec{p, p, "", false});
    return out;
}

FleetConfig dry_config() {
    FleetConfig cfg;
    cfg.root = fs::temp_directory_path();
    cfg.dry_run = true;
    return cfg;
}

} // namespace

TEST_CASE("markdown detection ignores case") {
    REQUIRE(has_markdown_change({"src/a.cpp", "docs/GUIDE.MD"}));
    REQUIRE(has_markdown_change({"README.md"}));
    REQUIRE_FALSE(has_markdown_change({"notes.mdx", "md", "src/md.cpp"}));
    REQUIRE_FALSE(has_markdown_change({}));
}

TEST_CASE("decide looks at both change sets") {
    std::vector<ReconciliationResult> results{
        result("a", 0, true, {}, {"docs/intro.md"}),
        result("b", 3, false, {"src/x.cpp"}),
        result("c", 0, false, {}),
    };
    FleetDecision d = decide(results);
    REQUIRE(d.any_markdown_changed);
    REQUIRE(d.updated_modules.size() == 2);
    REQUIRE(d.updated_modules[0].path == "a");
    REQUIRE(d.updated_modules[1].path == "b");

    FleetDecision from_origin = decide({result("d", 1, false, {"CHANGELOG.md"})});
    REQUIRE(from_origin.any_markdown_changed);

    FleetDecision none = decide({result("e", 2, true, {"a.txt"}, {"b.txt"})});
    REQUIRE_FALSE(none.any_markdown_changed);
    REQUIRE(none.updated_modules.size() == 1);
}

TEST_CASE("fleet publishes only when markdown changed") {
    ScriptedReconciler reconciler;
    RecordingPublisher publisher;
    Fleet fleet(dry_config(), reconciler, publisher);

    SECTION("code only changes are not published") {
        reconciler.script["libs/a"] = result("libs/a", 2, true, {"src/a.cpp"}, {"src/a.cpp"});
        REQUIRE(fleet.run(specs({"libs/a", "libs/b"})));
        REQUIRE(reconciler.visited.size() == 2);
        REQUIRE(publisher.calls.empty());
    }

    SECTION("a markdown change publishes every updated module") {
        reconciler.script["libs/a"] = result("libs/a", 2, true, {"src/a.cpp"}, {"src/a.cpp"});
        reconciler.script["libs/b"] = result("libs/b", 0, true, {}, {"docs/b.md"});
        REQUIRE(fleet.run(specs({"libs/a", "libs/b", "libs/c"})));
        REQUIRE(publisher.calls.size() == 1);
        const auto& published = publisher.calls.front();
        REQUIRE(published.size() == 2);
        REQUIRE(published[0].path == "libs/a");
        REQUIRE(published[1].path == "libs/b");
        REQUIRE(fleet.results().size() == 3);
    }

    SECTION("publisher failure fails the run") {
        reconciler.script["libs/a"] = result("libs/a", 1, false, {"README.md"});
        publisher.outcome = false;
        REQUIRE_FALSE(fleet.run(specs({"libs/a"})));
        REQUIRE(publisher.calls.size() == 1);
    }
}

TEST_CASE("fleet stops at the first failed submodule") {
    ScriptedReconciler reconciler;
    RecordingPublisher publisher;
    Fleet fleet(dry_config(), reconciler, publisher);

    reconciler.script["libs/a"] = result("libs/a", 1, true, {"README.md"}, {"README.md"});
    ReconciliationResult broken = result("libs/b", 0, false, {});
    broken.ok = false;
    broken.failed_step = ReconcileStep::MERGE;
    broken.error = "merge conflict in submodule 'libs/b'";
    reconciler.script["libs/b"] = broken;

    REQUIRE_FALSE(fleet.run(specs({"libs/a", "libs/b", "libs/c"})));
    REQUIRE(reconciler.visited == std::vector<std::string>{"libs/a", "libs/b"});
    REQUIRE(publisher.calls.empty());
    REQUIRE(fleet.results().size() == 2);
    REQUIRE_FALSE(fleet.results().back().ok);
}

TEST_CASE("skipped and unchanged submodules are not published") {
    ScriptedReconciler reconciler;
    RecordingPublisher publisher;
    Fleet fleet(dry_config(), reconciler, publisher);

    ReconciliationResult skipped;
    skipped.name = skipped.path = "libs/off";
    skipped.skipped = true;
    reconciler.script["libs/off"] = skipped;
    reconciler.script["libs/docs"] = result("libs/docs", 0, true, {}, {"guide.md"});

    REQUIRE(fleet.run(specs({"libs/off", "libs/same", "libs/docs"})));
    REQUIRE(publisher.calls.size() == 1);
    REQUIRE(publisher.calls.front().size() == 1);
    REQUIRE(publisher.calls.front().front().path == "libs/docs");
}

TEST_CASE("an empty manifest succeeds without publishing") {
    ScriptedReconciler reconciler;
    RecordingPublisher publisher;
    Fleet fleet(dry_config(), reconciler, publisher);
    REQUIRE(fleet.run({}));
    REQUIRE(reconciler.visited.empty());
    REQUIRE(publisher.calls.empty());
}
