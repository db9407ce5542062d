#include <niyama/niyama.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>

using namespace niyama;

// ═══════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════

std::string fresh_dir(const std::string& name) {
    fs::path dir = fs::path("/tmp") / ("niyama_test_" + name);
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir);
    return dir.string();
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::vector<std::string> list_files(const std::string& dir) {
    std::vector<std::string> out;
    std::error_code ec;
    if (!fs::exists(dir, ec)) return out;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file()) out.push_back(entry.path().string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

json git_document() {
    return json::parse(R"json({
        "tool_category": "git",
        "description": "Git conventions",
        "auto_convert": true,
        "syntax_rules": {"commit_style": "conventional"},
        "preferences": {"sign_commits": false},
        "auto_corrections": {
            "teh": {"pattern": "\\bteh\\b", "replacement": "the"}
        }
    })json");
}

// In-process memory service
class FakeMemory : public MemoryService {
public:
    bool fail_store = false;
    bool throw_on_search = false;

    MemoryResult store(const std::string& content,
                       const std::vector<std::string>& tags,
                       const json& metadata) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_store) return MemoryResult::failure("store rejected");
        contents_.push_back(content);
        tags_.push_back(tags);
        metadata_.push_back(metadata);
        MemoryResult r;
        r.success = true;
        r.memory_id = "mem-" + std::to_string(contents_.size());
        return r;
    }

    MemoryResult recall(const std::string& query, int limit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        queries_.push_back(query);
        MemoryResult r;
        r.success = true;
        for (int i = 0; i < std::min(limit, 2); ++i) {
            MemoryRecord rec;
            rec.content = query + " note " + std::to_string(i);
            rec.relevance = 0.9 - 0.1 * i;
            rec.tags = {"note"};
            r.results.push_back(rec);
        }
        return r;
    }

    MemoryResult search_by_tag(const std::vector<std::string>& tags, int) override {
        if (throw_on_search) throw std::runtime_error("search backend down");
        MemoryResult r;
        r.success = true;
        MemoryRecord rec;
        rec.content = "tagged";
        rec.tags = tags;
        r.results.push_back(rec);
        return r;
    }

    MemoryResult stats() override {
        std::lock_guard<std::mutex> lock(mutex_);
        MemoryResult r;
        r.success = true;
        r.stats.total_memories = static_cast<int64_t>(contents_.size());
        r.stats.storage_backend = "fake";
        r.stats.service_status = "healthy";
        return r;
    }

    std::vector<std::string> contents() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return contents_;
    }

    std::vector<std::vector<std::string>> tags() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tags_;
    }

    std::vector<json> metadata() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return metadata_;
    }

    std::vector<std::string> queries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queries_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> contents_;
    std::vector<std::vector<std::string>> tags_;
    std::vector<json> metadata_;
    std::vector<std::string> queries_;
};

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

// ═══════════════════════════════════════════════════════════════════
// Names and validation
// ═══════════════════════════════════════════════════════════════════

void test_names() {
    std::cout << "Testing context names..." << std::endl;

    assert(valid_name("git"));
    assert(valid_name("docker-compose_v2"));
    assert(!valid_name(""));
    assert(!valid_name("has space"));
    assert(!valid_name("dot.json"));
    assert(!valid_name(std::string(51, 'a')));
    assert(valid_name(std::string(50, 'a')));
    assert(!valid_name("system"));
    assert(!valid_name("admin"));
    assert(valid_name("System"));  // case-sensitive

    std::cout << "  PASS" << std::endl;
}

void test_validator() {
    std::cout << "Testing Validator..." << std::endl;

    auto report = validate(git_document());
    assert(report.ok());
    assert(report.warnings.empty());

    assert(!validate(json::array()).ok());

    json missing = {{"tool_category", "git"}};
    report = validate(missing);
    assert(report.errors.size() == 1);
    assert(report.errors[0] == "Missing required field: description");

    json bad_category = git_document();
    bad_category["tool_category"] = "git tools";
    assert(!validate(bad_category).ok());

    json bad_section = git_document();
    bad_section["syntax_rules"] = "nope";
    report = validate(bad_section);
    assert(report.errors.size() == 1);
    assert(report.errors[0] == "syntax_rules must be an object");

    json bad_convert = git_document();
    bad_convert["auto_convert"] = "yes";
    assert(!validate(bad_convert).ok());

    // Non-semver version warns but stays persistable
    json loose_version = git_document();
    loose_version["metadata"] = {{"version", "1.0"}};
    report = validate(loose_version);
    assert(report.ok());
    assert(report.warnings.size() == 1);

    json numeric_version = git_document();
    numeric_version["metadata"] = {{"version", 1}};
    assert(!validate(numeric_version).ok());

    json bad_count = git_document();
    bad_count["metadata"] = {{"optimization_count", "3"}};
    assert(!validate(bad_count).ok());

    json session = git_document();
    session["session_initialization"] = {{"enabled", "true"}};
    assert(!validate(session).ok());

    session["session_initialization"] = json::parse(
        R"json({"enabled": true, "actions": {"on_startup": [{"parameters": {}}]}})json");
    report = validate(session);
    assert(report.errors.size() == 1);
    assert(report.errors[0].find("on_startup[0]") != std::string::npos);

    session["session_initialization"]["actions"] = json::array();
    assert(!validate(session).ok());

    std::cout << "  PASS" << std::endl;
}

void test_check_files() {
    std::cout << "Testing check_files..." << std::endl;

    std::string dir = fresh_dir("check_files");
    std::string good = dir + "/good_context.json";
    std::string old = dir + "/old_context.json";
    std::string broken = dir + "/broken_context.json";
    write_file(good, git_document().dump(2));
    write_file(old, R"json({"tool_category": "old", "description": "d", "metadata": {"version": "1.0"}})json");
    write_file(broken, "{ \"tool_category\": ");

    std::ostringstream out;
    assert(check_files({good, old}, out) == 0);
    assert(out.str().find("[OK] " + good) != std::string::npos);
    assert(out.str().find("[WARN] " + old + ": metadata.version") != std::string::npos);
    assert(out.str().find("[OK] " + old) != std::string::npos);
    assert(out.str().find("2 of 2 file(s) valid") != std::string::npos);

    out.str("");
    assert(check_files({good, broken, dir + "/missing.json"}, out) == 1);
    assert(out.str().find("[ERROR] " + broken + ": invalid JSON") != std::string::npos);
    assert(out.str().find("[ERROR] " + dir + "/missing.json: cannot open file") != std::string::npos);
    assert(out.str().find("1 of 3 file(s) valid") != std::string::npos);

    auto report = validate_file(broken);
    assert(!report.ok());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Backups
// ═══════════════════════════════════════════════════════════════════

void test_backup_manager() {
    std::cout << "Testing BackupManager..." << std::endl;

    std::string dir = fresh_dir("backup");
    BackupManager backups(dir + "/backups");

    // Nothing to back up
    assert(!backups.backup(dir + "/absent_context.json", "absent"));
    assert(!fs::exists(dir + "/backups"));

    std::string source = dir + "/git_context.json";
    write_file(source, "{\"a\": 1}\n");

    auto first = backups.backup(source, "git");
    assert(first.has_value());
    assert(read_file(*first) == "{\"a\": 1}\n");
    assert(fs::path(*first).filename().string().rfind("git_", 0) == 0);

    // Same second: a second backup must not overwrite the first
    write_file(source, "{\"a\": 2}\n");
    auto second = backups.backup(source, "git");
    assert(second.has_value());
    assert(*second != *first);
    assert(read_file(*first) == "{\"a\": 1}\n");
    assert(read_file(*second) == "{\"a\": 2}\n");
    assert(list_files(dir + "/backups").size() == 2);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Document model
// ═══════════════════════════════════════════════════════════════════

void test_document_roundtrip() {
    std::cout << "Testing ContextDocument round trip..." << std::endl;

    json raw = json::parse(R"json({
        "tool_category": "shell",
        "description": "Shell rules",
        "auto_corrections": {
            "second": {"pattern": "b", "replacement": "c"},
            "first": {"pattern": "a", "replacement": "b"},
            "broken": {"pattern": "x"}
        },
        "session_initialization": {
            "enabled": true,
            "actions": {
                "on_startup": [
                    {"action": "recall_memory", "parameters": {"query": "shell"}, "description": "warm up", "retry": 2}
                ],
                "on_shutdown": []
            }
        },
        "metadata": {"version": "2.1.0", "priority": "high", "owner": "ops"},
        "custom_section": {"kept": true}
    })json");

    auto doc = ContextDocument::from_json(raw);
    assert(doc.to_json() == raw);

    auto rules = doc.corrections();
    assert(rules.size() == 2);
    assert(rules[0].name == "second");
    assert(rules[1].name == "first");

    assert(doc.session_initialization->is_enabled());
    assert(doc.startup_actions().size() == 1);
    assert(doc.startup_actions()[0].param<std::string>("query", "") == "shell");
    assert(doc.startup_actions()[0].param<int>("limit", 5) == 5);
    assert(!doc.should_auto_convert());

    std::cout << "  PASS" << std::endl;
}

std::vector<std::string> top_keys(const json& j) {
    std::vector<std::string> keys;
    for (auto it = j.begin(); it != j.end(); ++it) keys.push_back(it.key());
    return keys;
}

void test_document_key_order() {
    std::cout << "Testing ContextDocument key order..." << std::endl;

    json raw = json::parse(R"json({
        "metadata": {"priority": "low", "version": "1.2.0"},
        "description": "Reordered",
        "custom": 1,
        "tool_category": "make",
        "syntax_rules": {"z": 1, "a": 2}
    })json");

    auto doc = ContextDocument::from_json(raw);
    json out = doc.to_json();
    assert(out == raw);
    assert((top_keys(out) == std::vector<std::string>{
        "metadata", "description", "custom", "tool_category", "syntax_rules"}));
    assert((top_keys(out["metadata"]) == std::vector<std::string>{"priority", "version"}));

    // Fields set after reading go after the authored keys
    doc.auto_convert = true;
    out = doc.to_json();
    assert(top_keys(out).front() == "metadata");
    assert(top_keys(out).back() == "auto_convert");

    // Built in code: canonical order
    ContextDocument fresh;
    fresh.tool_category = "make";
    fresh.description = "d";
    fresh.extra["custom"] = 1;
    assert((top_keys(fresh.to_json()) == std::vector<std::string>{"tool_category", "description", "custom"}));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Context store
// ═══════════════════════════════════════════════════════════════════

void test_store_load() {
    std::cout << "Testing ContextStore load_all..." << std::endl;

    std::string dir = fresh_dir("load");
    json git = git_document();
    write_file(dir + "/git_context.json", git.dump(2));

    json shadow = git_document();
    shadow["description"] = "Shadowed";
    write_file(dir + "/git.json", shadow.dump(2));

    json docker = {{"tool_category", "docker"}, {"description", "Docker rules"}};
    write_file(dir + "/docker.json", docker.dump(2));

    write_file(dir + "/broken_context.json", "{ not json");
    write_file(dir + "/invalid_context.json", R"json({"tool_category": "x"})json");
    write_file(dir + "/notes.txt", "ignored");

    ContextStore store(dir, true);
    assert(store.load_all() == 2);
    assert(store.names() == std::vector<std::string>({"docker", "git"}));
    assert(store.get("git")->description == "Git conventions");
    assert(store.file_path("git") == dir + "/git_context.json");

    ContextStore disabled(dir, false);
    assert(disabled.load_all() == 0);
    assert(disabled.size() == 0);

    ContextStore missing(dir + "/does_not_exist", true);
    assert(missing.load_all() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_store_resolution() {
    std::cout << "Testing ContextStore tool resolution..." << std::endl;

    std::string dir = fresh_dir("resolve");
    write_file(dir + "/git_context.json", git_document().dump(2));

    ContextStore store(dir, true);
    store.load_all();

    auto a = store.get_by_tool("git:commit");
    auto b = store.get_by_tool("git:push");
    assert(a && a == b);
    assert(store.get_by_tool("git") == a);
    assert(!store.get_by_tool("svn:commit"));
    assert(!store.get_by_tool(""));

    assert(store.get_syntax_rules("git:log")["commit_style"] == "conventional");
    assert(store.get_preferences("git")["sign_commits"] == false);
    assert(store.should_auto_convert("git:commit"));
    assert(!store.should_auto_convert("svn"));
    assert(store.get_syntax_rules("svn").empty());

    std::cout << "  PASS" << std::endl;
}

void test_store_create() {
    std::cout << "Testing ContextStore create..." << std::endl;

    std::string dir = fresh_dir("create");
    ContextStore store(dir, true);
    store.load_all();

    json rules = {
        {"preferences", {{"compose_version", "3.8"}}},
        {"description", "Docker rules"},
        {"metadata", {{"priority", "high"}, {"version", "9.9.9"}}}
    };
    auto r = store.create("docker", "docker", rules);
    assert(r.success);
    assert(fs::exists(dir + "/docker_context.json"));

    auto doc = store.get("docker");
    assert(doc->tool_category == "docker");
    assert(doc->metadata->version == std::string("1.0.0"));
    assert(doc->metadata->priority == std::string("high"));
    assert(doc->metadata->created_by == std::string(ContextStore::DEFAULT_CREATED_BY));
    assert(doc->metadata->optimization_count == int64_t(0));
    assert(doc->metadata->applies_to_tools == std::vector<std::string>({"docker"}));
    assert(doc->metadata->last_updated.has_value());

    // Duplicates, bad names, bad categories
    auto dup = store.create("docker", "docker", rules);
    assert(!dup.success);
    assert(dup.fields["available_contexts"] == json::array({"docker"}));

    write_file(dir + "/legacy.json", R"json({"tool_category": "legacy", "description": "on disk only"})json");
    assert(!store.create("legacy", "legacy", {{"description", "again"}}).success);

    assert(!store.create("bad name", "x", {{"description", "d"}}).success);
    assert(!store.create("okname", "bad category", {{"description", "d"}}).success);
    assert(!store.create("nodesc", "nodesc", json::object()).success);
    assert(!fs::exists(dir + "/nodesc_context.json"));
    assert(!store.create("arr", "arr", json::array()).success);

    std::cout << "  PASS" << std::endl;
}

void test_store_update() {
    std::cout << "Testing ContextStore update..." << std::endl;

    std::string dir = fresh_dir("update");
    write_file(dir + "/git_context.json", git_document().dump(2));
    ContextStore store(dir, true);
    store.load_all();

    auto r = store.update("git", {
        {"preferences", {{"sign_commits", true}}},
        {"metadata", {{"priority", "high"}, {"optimization_count", 4}}}
    });
    assert(r.success);
    assert(r.fields.contains("backup_path"));
    assert(r.fields["updated_fields"] == json::array({"preferences", "metadata"}));

    auto doc = store.get("git");
    assert(doc->preferences["sign_commits"] == true);
    assert(doc->syntax_rules["commit_style"] == "conventional");
    assert(doc->metadata->priority == std::string("high"));
    assert(doc->metadata->optimization_count == int64_t(4));

    // In-memory copy and file agree
    json on_disk = json::parse(read_file(dir + "/git_context.json"));
    assert(on_disk == doc->to_json());

    // Count never goes down
    r = store.update("git", {{"metadata", {{"optimization_count", 1}}}});
    assert(r.success);
    assert(store.get("git")->metadata->optimization_count == int64_t(4));

    assert(!store.update("git", json::array()).success);

    std::cout << "  PASS" << std::endl;
}

void test_store_update_keeps_key_order() {
    std::cout << "Testing ContextStore update keeps key order..." << std::endl;

    std::string dir = fresh_dir("update_order");
    write_file(dir + "/make_context.json", R"json({
        "preferences": {"jobs": 4},
        "description": "Make rules",
        "tool_category": "make"
    })json");
    ContextStore store(dir, true);
    store.load_all();

    auto r = store.update("make", {{"description", "Make and ninja rules"}});
    assert(r.success);

    json on_disk = json::parse(read_file(dir + "/make_context.json"));
    assert(on_disk["description"] == "Make and ninja rules");
    assert((top_keys(on_disk) == std::vector<std::string>{
        "preferences", "description", "tool_category", "metadata"}));
    assert(top_keys(store.get("make")->to_json()) == top_keys(on_disk));

    std::cout << "  PASS" << std::endl;
}

void test_store_add_pattern() {
    std::cout << "Testing ContextStore add_pattern..." << std::endl;

    std::string dir = fresh_dir("pattern");
    write_file(dir + "/git_context.json", git_document().dump(2));
    ContextStore store(dir, true);
    store.load_all();

    json config = {{"keywords", {"decided", "agreed"}}, {"confidence_threshold", 0.7}};
    auto r = store.add_pattern("git", "auto_store_triggers", "decisions", config);
    assert(r.success);
    assert(store.get("git")->auto_store_triggers["decisions"] == config);

    json replaced = {{"keywords", {"settled"}}};
    assert(store.add_pattern("git", "auto_store_triggers", "decisions", replaced).success);
    assert(store.get("git")->auto_store_triggers["decisions"] == replaced);
    assert(store.get("git")->auto_store_triggers.size() == 1);

    assert(!store.add_pattern("git", "syntax_rules", "x", config).success);
    assert(!store.add_pattern("git", "auto_retrieve_triggers", "", config).success);
    assert(!store.add_pattern("git", "auto_retrieve_triggers", "x", json("str")).success);
    assert(!store.add_pattern("missing", "auto_retrieve_triggers", "x", config).success);

    std::cout << "  PASS" << std::endl;
}

void test_store_mark_optimized() {
    std::cout << "Testing ContextStore mark_optimized..." << std::endl;

    std::string dir = fresh_dir("optimized");
    write_file(dir + "/git_context.json", git_document().dump(2));
    ContextStore store(dir, true);
    store.load_all();

    assert(store.mark_optimized("git", "tightened rules").success);
    assert(store.mark_optimized("git", "").success);
    assert(store.get("git")->metadata->optimization_count == int64_t(2));
    assert(!store.mark_optimized("missing", "").success);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Store properties
// ═══════════════════════════════════════════════════════════════════

void test_created_document_survives_reload() {
    std::cout << "Testing created document round trip through reload..." << std::endl;

    std::string dir = fresh_dir("prop_roundtrip");
    ContextStore store(dir, true);
    store.load_all();

    json rules = {
        {"description", "Kubernetes rules"},
        {"syntax_rules", {{"manifest", "yaml"}, {"indent", 2}}},
        {"auto_corrections", {
            {"z_first", {{"pattern", "kubctl"}, {"replacement", "kubectl"}}},
            {"a_second", {{"pattern", "namepsace"}, {"replacement", "namespace"}}}
        }}
    };
    assert(store.create("k8s", "kubernetes", rules).success);
    json before = store.get("k8s")->to_json();

    ContextStore reloaded(dir, true);
    reloaded.load_all();
    json after = reloaded.get("k8s")->to_json();
    assert(after == before);

    after.erase("metadata");
    json expected = rules;
    expected["tool_category"] = "kubernetes";
    for (auto it = expected.begin(); it != expected.end(); ++it) {
        assert(after[it.key()] == it.value());
    }
    assert(after.size() == expected.size());

    std::cout << "  PASS" << std::endl;
}

void test_failed_update_leaves_file_untouched() {
    std::cout << "Testing failed update leaves file untouched..." << std::endl;

    std::string dir = fresh_dir("prop_failed");
    write_file(dir + "/git_context.json", git_document().dump(2));
    ContextStore store(dir, true);
    store.load_all();

    std::string before = read_file(dir + "/git_context.json");
    auto before_doc = store.get("git");

    auto r = store.update("git", {{"syntax_rules", "not an object"}});
    assert(!r.success);
    assert(r.fields.contains("validation_errors"));
    assert(r.fields.contains("backup_path"));
    assert(read_file(dir + "/git_context.json") == before);
    assert(store.get("git") == before_doc);

    std::cout << "  PASS" << std::endl;
}

void test_mutation_writes_one_backup() {
    std::cout << "Testing one backup per mutation..." << std::endl;

    std::string dir = fresh_dir("prop_backup");
    write_file(dir + "/git_context.json", git_document().dump(2));
    ContextStore store(dir, true);
    store.load_all();

    std::string prior = read_file(dir + "/git_context.json");
    auto r = store.update("git", {{"description", "Updated"}});
    assert(r.success);
    auto backups = list_files(dir + "/backups");
    assert(backups.size() == 1);
    assert(read_file(backups[0]) == prior);
    assert(r.fields["backup_path"] == backups[0]);

    prior = read_file(dir + "/git_context.json");
    r = store.add_pattern("git", "auto_retrieve_triggers", "history", {{"keywords", {"before"}}});
    assert(r.success);
    backups = list_files(dir + "/backups");
    assert(backups.size() == 2);
    assert(read_file(r.fields["backup_path"].get<std::string>()) == prior);

    std::cout << "  PASS" << std::endl;
}

void test_update_unknown_context() {
    std::cout << "Testing update of unknown context..." << std::endl;

    std::string dir = fresh_dir("prop_unknown");
    write_file(dir + "/git_context.json", git_document().dump(2));
    ContextStore store(dir, true);
    store.load_all();

    auto names = store.names();
    auto r = store.update("nonexistent", {{"description", "x"}});
    assert(!r.success);
    assert(r.fields["available_contexts"] == json::array({"git"}));
    assert(store.names() == names);
    assert(!fs::exists(dir + "/nonexistent_context.json"));

    std::cout << "  PASS" << std::endl;
}

void test_reserved_name_rejected() {
    std::cout << "Testing reserved name rejected..." << std::endl;

    std::string dir = fresh_dir("prop_reserved");
    ContextStore store(dir, true);

    auto r = store.create("system", "x", json::object());
    assert(!r.success);
    assert(r.error.find("Invalid context name") != std::string::npos);
    assert(!fs::exists(dir + "/system_context.json"));

    std::cout << "  PASS" << std::endl;
}

void test_docker_create_then_reload() {
    std::cout << "Testing create then reload..." << std::endl;

    std::string dir = fresh_dir("prop_docker");
    ContextStore store(dir, true);
    store.load_all();
    assert(store.create("docker", "docker", {{"description", "Docker rules"}}).success);

    assert(store.load_all() == 1);
    assert(contains(store.names(), "docker"));
    assert(store.get("docker")->description == "Docker rules");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Correction engine
// ═══════════════════════════════════════════════════════════════════

void test_translate_replacement() {
    std::cout << "Testing replacement translation..." << std::endl;

    assert(translate_replacement("the") == "the");
    assert(translate_replacement("\\1") == "$1");
    assert(translate_replacement("\\2 at \\1") == "$2 at $1");
    assert(translate_replacement("\\g<3>x") == "$3x");
    assert(translate_replacement("\\0!") == "$&!");
    assert(translate_replacement("cost: $5") == "cost: $$5");
    assert(translate_replacement("a\\nb") == "a\nb");
    assert(translate_replacement("a\\\\b") == "a\\b");
    assert(translate_replacement("trailing\\") == "trailing\\");

    std::cout << "  PASS" << std::endl;
}

void test_corrections_chain() {
    std::cout << "Testing corrections apply in order..." << std::endl;

    ContextDocument doc = ContextDocument::from_json(json::parse(R"json({
        "tool_category": "chain",
        "description": "chained",
        "auto_corrections": {
            "a_to_b": {"pattern": "a", "replacement": "b"},
            "b_to_c": {"pattern": "b", "replacement": "c"}
        }
    })json"));
    assert(apply_corrections(doc, "a").text == "c");

    // Order matters
    ContextDocument reversed = ContextDocument::from_json(json::parse(R"json({
        "tool_category": "chain",
        "description": "chained",
        "auto_corrections": {
            "b_to_c": {"pattern": "b", "replacement": "c"},
            "a_to_b": {"pattern": "a", "replacement": "b"}
        }
    })json"));
    assert(apply_corrections(reversed, "a").text == "b");

    std::cout << "  PASS" << std::endl;
}

void test_corrections_patterns() {
    std::cout << "Testing correction patterns..." << std::endl;

    ContextDocument doc = ContextDocument::from_json(json::parse(R"json({
        "tool_category": "misc",
        "description": "misc",
        "auto_corrections": {
            "broken": {"pattern": "(unclosed", "replacement": "x"},
            "line_start": {"pattern": "^- ", "replacement": "* "},
            "swap": {"pattern": "(\\w+)@(\\w+)", "replacement": "\\2 at \\1"},
            "no_replacement": {"pattern": "keep"},
            "price": {"pattern": "USD", "replacement": "$"}
        }
    })json"));

    std::string text = "- one\n- two keep\nuser@host costs 5 USD";
    std::string out = apply_corrections(doc, text).text;
    assert(out == "* one\n* two keep\nhost at user costs 5 $");

    ContextDocument empty = ContextDocument::from_json(
        json{{"tool_category", "empty"}, {"description", "no rules"}});
    assert(apply_corrections(empty, "unchanged").text == "unchanged");

    std::cout << "  PASS" << std::endl;
}

void test_corrections_via_store() {
    std::cout << "Testing corrections resolved by tool..." << std::endl;

    std::string dir = fresh_dir("corrections");
    write_file(dir + "/git_context.json", git_document().dump(2));
    ContextStore store(dir, true);
    store.load_all();

    assert(apply_corrections(store, "git:commit", "teh commit").text == "the commit");
    assert(apply_corrections(store, "git", "tehran teh").text == "tehran the");
    assert(apply_corrections(store, "svn:commit", "teh commit").text == "teh commit");

    std::cout << "  PASS" << std::endl;
}

void test_corrections_input_limit() {
    std::cout << "Testing corrections input limit..." << std::endl;

    // Shipped git rules include "^(\\w+: .*)\\.$"
    ContextStore store(NIYAMA_CONTEXTS_DIR, true);
    assert(store.load_all() >= 1);
    assert(store.get("git"));

    std::string huge = "feat: " + std::string(1024 * 1024, 'x') + ".";
    auto r = apply_corrections(store, "git:commit", huge);
    assert(!r.success);
    assert(r.error.find(std::to_string(MAX_CORRECTION_INPUT)) != std::string::npos);
    assert(r.text == huge);

    std::string body(4000, 'x');
    r = apply_corrections(store, "git:commit", "feature: " + body + ".");
    assert(r.success);
    assert(r.text == "feat: " + body);

    // No rules, no limit
    r = apply_corrections(store, "svn:commit", huge);
    assert(r.success);
    assert(r.text.size() == huge.size());

    FakeMemory memory;
    SessionInitializer init(store, memory);
    rpc::Handler handler(store, init, memory);
    json response = json::parse(handler.handle(json({
        {"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/call"},
        {"params", {{"name", "apply_auto_corrections"},
                    {"arguments", {{"tool_name", "git:commit"}, {"text", huge}}}}}
    }).dump()));
    assert(response["result"]["isError"] == true);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Session initializer
// ═══════════════════════════════════════════════════════════════════

void test_session_initializer() {
    std::cout << "Testing SessionInitializer..." << std::endl;

    std::string dir = fresh_dir("session");
    write_file(dir + "/alpha_context.json", R"json({
        "tool_category": "alpha",
        "description": "alpha",
        "session_initialization": {
            "enabled": true,
            "actions": {"on_startup": [
                {"action": "recall_memory", "parameters": {"query": "recent decisions", "limit": 3}},
                {"action": "summon_spirits", "parameters": {}},
                {"action": "store_memory", "parameters": {"content": "session started", "tags": ["session"]}}
            ]}
        }
    })json");
    write_file(dir + "/beta_context.json", R"json({
        "tool_category": "beta",
        "description": "beta",
        "session_initialization": {
            "enabled": true,
            "actions": {"on_startup": [
                {"action": "search_by_tag", "parameters": {"tags": ["beta"]}},
                {"action": "recall_memory", "parameters": {"query": "beta history"}}
            ]}
        }
    })json");
    write_file(dir + "/gamma_context.json", R"json({
        "tool_category": "gamma",
        "description": "gamma",
        "session_initialization": {
            "enabled": false,
            "actions": {"on_startup": [{"action": "recall_memory", "parameters": {"query": "never"}}]}
        }
    })json");

    ContextStore store(dir, true);
    assert(store.load_all() == 3);

    FakeMemory memory;
    memory.throw_on_search = true;
    SessionInitializer init(store, memory);
    assert(!init.status().initialized);

    auto status = init.run();
    assert(status.initialized);
    assert(!status.initialization_time.empty());
    assert(status.initialized_contexts == std::vector<std::string>({"alpha", "beta"}));
    assert(status.executed_actions.size() == 5);

    assert(status.executed_actions[0].action == "recall_memory");
    assert(status.executed_actions[0].success);
    assert(!status.executed_actions[1].success);
    assert(status.executed_actions[1].summary == "Unknown action: summon_spirits");
    assert(status.executed_actions[2].success);
    assert(!status.executed_actions[3].success);          // search threw
    assert(status.executed_actions[4].success);           // processing continued

    assert(status.errors.size() == 1);
    assert(status.errors[0].find("search backend down") != std::string::npos);

    assert(status.memory_retrieval_results.contains("alpha_recall_memory"));
    assert(status.memory_retrieval_results["alpha_recall_memory"].size() == 2);
    assert(status.memory_retrieval_results.contains("beta_recall_memory"));
    assert(!status.memory_retrieval_results.contains("beta_search_by_tag"));

    assert(memory.queries() == std::vector<std::string>({"recent decisions", "beta history"}));
    assert(memory.contents() == std::vector<std::string>({"session started"}));

    assert(init.status().initialized);
    assert(init.status().executed_actions.size() == 5);

    // A later run replaces the status wholesale
    memory.throw_on_search = false;
    auto second = init.run();
    assert(second.errors.empty());
    assert(init.status().errors.empty());
    assert(init.status().memory_retrieval_results.contains("beta_search_by_tag"));

    json j = second.to_json();
    assert(j["initialized"] == true);
    assert(j["executed_actions"].size() == 5);

    std::cout << "  PASS" << std::endl;
}

void test_session_unconfigured_memory() {
    std::cout << "Testing SessionInitializer without memory service..." << std::endl;

    std::string dir = fresh_dir("session_unconfigured");
    write_file(dir + "/alpha_context.json", R"json({
        "tool_category": "alpha",
        "description": "alpha",
        "session_initialization": {
            "enabled": true,
            "actions": {"on_startup": [{"action": "recall_memory", "parameters": {"query": "x"}}]}
        }
    })json");
    ContextStore store(dir, true);
    store.load_all();

    UnconfiguredMemoryService memory;
    SessionInitializer init(store, memory);
    auto status = init.run();
    assert(status.initialized);
    assert(status.errors.size() == 1);
    assert(!status.executed_actions[0].success);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Audit hook
// ═══════════════════════════════════════════════════════════════════

void test_audit_hook() {
    std::cout << "Testing AuditHook..." << std::endl;

    std::string dir = fresh_dir("audit");
    FakeMemory memory;
    AuditHook audit(memory);
    audit.start();

    ContextStore store(dir, true, &audit);
    store.load_all();
    assert(store.create("docker", "docker", {{"description", "Docker rules"}}).success);
    assert(store.update("docker", {{"preferences", {{"compose", true}}}}).success);
    assert(store.add_pattern("docker", "auto_store_triggers", "builds", {{"keywords", {"build"}}}).success);
    assert(store.mark_optimized("docker", "merged rules").success);

    // A rejected mutation is not audited
    assert(!store.update("docker", {{"description", 42}}).success);

    assert(audit.drain(5000));
    auto stats = audit.stats();
    assert(stats.enqueued == 4);
    assert(stats.delivered == 4);
    assert(stats.failed == 0);

    auto tags = memory.tags();
    assert(tags.size() == 4);
    assert(tags[0] == std::vector<std::string>({"context_change", "created", "docker", "automated"}));
    assert(tags[1][1] == "updated");
    assert(tags[2][1] == "pattern_added");
    assert(tags[3][1] == "optimized");

    auto meta = memory.metadata();
    assert(meta[0]["operation"] == "created");
    assert(meta[0]["context_name"] == "docker");
    assert(meta[0]["timestamp"].get<std::string>().back() == 'Z');
    assert(meta[3]["details"]["optimization_count"] == 1);

    auto contents = memory.contents();
    assert(contents[0].find("docker") != std::string::npos);
    assert(contents[3].find("merged rules") != std::string::npos);

    audit.stop();
    std::cout << "  PASS" << std::endl;
}

void test_audit_overflow_and_failure() {
    std::cout << "Testing AuditHook overflow and failures..." << std::endl;

    FakeMemory memory;
    AuditHook audit(memory, 2);

    // Worker not started yet: the queue fills and drops the oldest
    audit.record(AuditOp::Created, "one");
    audit.record(AuditOp::Created, "two");
    audit.record(AuditOp::Created, "three");
    auto stats = audit.stats();
    assert(stats.enqueued == 3);
    assert(stats.dropped == 1);

    audit.start();
    assert(audit.drain(5000));
    auto contents = memory.contents();
    assert(contents.size() == 2);
    assert(contents[0].find("'two'") != std::string::npos);
    assert(contents[1].find("'three'") != std::string::npos);

    // Delivery failures are counted, never raised
    memory.fail_store = true;
    audit.record(AuditOp::Updated, "four");
    assert(audit.drain(5000));
    assert(audit.stats().failed == 1);

    audit.stop();
    assert(!audit.is_running());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// Memory client
// ═══════════════════════════════════════════════════════════════════

void test_memory_client_unreachable() {
    std::cout << "Testing SocketMemoryService without a server..." << std::endl;

    SocketMemoryService client("/tmp/niyama_test_no_such.sock", 200);
    auto r = client.recall("anything", 5);
    assert(!r.success);
    assert(!r.error.empty());

    auto s = client.stats();
    assert(!s.success);
    assert(s.stats_json()["success"] == false);

    std::cout << "  PASS" << std::endl;
}

// Listens but never accepts: connects succeed, replies never come
int listen_silent(const std::string& path) {
    unlink(path.c_str());
    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    assert(fd >= 0);
    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    int rc = bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    assert(rc == 0);
    rc = listen(fd, 4);
    assert(rc == 0);
    return fd;
}

// Recall goes to a real socket client, everything else stays fake
class SocketRecallMemory : public FakeMemory {
public:
    explicit SocketRecallMemory(SocketMemoryService& client) : client_(client) {}
    MemoryResult recall(const std::string& query, int limit) override {
        return client_.recall(query, limit);
    }
private:
    SocketMemoryService& client_;
};

void test_memory_client_timeout() {
    std::cout << "Testing SocketMemoryService against a silent server..." << std::endl;

    std::string path = "/tmp/niyama_test_silent.sock";
    int server = listen_silent(path);

    SocketMemoryService client(path, 200);
    auto started = std::chrono::steady_clock::now();
    auto r = client.recall("anything", 5);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    assert(!r.success);
    assert(r.error.find("Timed out") != std::string::npos);
    assert(elapsed >= 150);
    assert(elapsed < 2000);

    // A stalled recall fails its action; the next action still runs
    std::string dir = fresh_dir("session_timeout");
    write_file(dir + "/alpha_context.json", R"json({
        "tool_category": "alpha",
        "description": "alpha",
        "session_initialization": {
            "enabled": true,
            "actions": {"on_startup": [
                {"action": "recall_memory", "parameters": {"query": "recent work"}},
                {"action": "store_memory", "parameters": {"content": "session started"}}
            ]}
        }
    })json");
    ContextStore store(dir, true);
    store.load_all();

    SocketRecallMemory memory(client);
    SessionInitializer init(store, memory);
    auto status = init.run();
    assert(status.initialized);
    assert(status.executed_actions.size() == 2);
    assert(!status.executed_actions[0].success);
    assert(status.executed_actions[1].success);
    assert(status.errors.size() == 1);
    assert(status.errors[0].find("Timed out") != std::string::npos);
    assert(memory.contents().size() == 1);

    close(server);
    unlink(path.c_str());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════
// RPC handler
// ═══════════════════════════════════════════════════════════════════

json call(rpc::Handler& handler, const json& request) {
    return json::parse(handler.handle(request.dump()));
}

json call_tool(rpc::Handler& handler, const std::string& name, const json& args) {
    return call(handler, {
        {"jsonrpc", "2.0"}, {"id", 7}, {"method", "tools/call"},
        {"params", {{"name", name}, {"arguments", args}}}
    });
}

void test_rpc_protocol() {
    std::cout << "Testing RPC protocol..." << std::endl;

    std::string dir = fresh_dir("rpc_protocol");
    ContextStore store(dir, true);
    FakeMemory memory;
    SessionInitializer init(store, memory);
    rpc::Handler handler(store, init, memory);

    auto r = call(handler, {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}});
    assert(r["id"] == 1);
    assert(r["result"]["serverInfo"]["name"] == NIYAMA_SERVER_NAME);
    assert(r["result"]["protocolVersion"] == NIYAMA_PROTOCOL_VERSION);

    r = call(handler, {{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}});
    assert(r["result"]["tools"].size() == 14);
    assert(handler.tools().size() == 14);

    r = json::parse(handler.handle("{ not json"));
    assert(r["error"]["code"] == rpc::error::PARSE_ERROR);

    r = call(handler, {{"id", 3}, {"method", "tools/list"}});
    assert(r["error"]["code"] == rpc::error::INVALID_REQUEST);

    r = call(handler, {{"jsonrpc", "2.0"}, {"id", 4}, {"method", "resources/list"}});
    assert(r["error"]["code"] == rpc::error::METHOD_NOT_FOUND);

    r = call_tool(handler, "no_such_tool", json::object());
    assert(r["error"]["code"] == rpc::error::TOOL_NOT_FOUND);

    // Notifications get no response
    assert(handler.handle(R"json({"jsonrpc": "2.0", "method": "notifications/initialized"})json").empty());

    r = call(handler, {{"jsonrpc", "2.0"}, {"id", 5}, {"method", "shutdown"}});
    assert(r["result"]["status"] == "ok");
    assert(handler.shutdown_requested());

    assert(rpc::sanitize_utf8("ok\xff") == "ok\xEF\xBF\xBD");

    std::cout << "  PASS" << std::endl;
}

void test_rpc_tools() {
    std::cout << "Testing RPC tools..." << std::endl;

    std::string dir = fresh_dir("rpc_tools");
    write_file(dir + "/git_context.json", git_document().dump(2));
    ContextStore store(dir, true);
    store.load_all();
    FakeMemory memory;
    SessionInitializer init(store, memory);
    rpc::Handler handler(store, init, memory);

    auto r = call_tool(handler, "get_tool_context", {{"tool_name", "git:commit"}});
    assert(r["result"]["isError"] == false);
    assert(r["result"]["structuredContent"]["tool_category"] == "git");

    r = call_tool(handler, "get_tool_context", {{"tool_name", "svn"}});
    assert(r["result"]["isError"] == false);
    assert(r["result"]["structuredContent"].empty());

    r = call_tool(handler, "get_tool_context", json::object());
    assert(r["result"]["isError"] == true);

    r = call_tool(handler, "apply_auto_corrections", {{"tool_name", "git:commit"}, {"text", "fix teh bug"}});
    assert(r["result"]["content"][0]["text"] == "fix the bug");

    r = call_tool(handler, "apply_auto_corrections", {{"tool_name", "git"}});
    assert(r["result"]["isError"] == true);

    r = call_tool(handler, "should_auto_convert", {{"tool_name", "git:push"}});
    assert(r["result"]["structuredContent"]["auto_convert"] == true);

    r = call_tool(handler, "get_syntax_rules", {{"tool_name", "git"}});
    assert(r["result"]["structuredContent"]["commit_style"] == "conventional");

    r = call_tool(handler, "create_context_file", {
        {"context_name", "docker"}, {"tool_category", "docker"},
        {"rules", {{"description", "Docker rules"}}}
    });
    assert(r["result"]["isError"] == false);
    assert(r["result"]["structuredContent"]["success"] == true);

    r = call_tool(handler, "create_context_file", {
        {"context_name", "server"}, {"tool_category", "x"}, {"rules", json::object()}
    });
    assert(r["result"]["isError"] == true);
    assert(r["result"]["structuredContent"]["success"] == false);

    r = call_tool(handler, "update_context_rules", {{"context_name", "nope"}, {"updates", {{"a", 1}}}});
    assert(r["result"]["isError"] == true);
    assert(r["result"]["structuredContent"]["available_contexts"] == json::array({"docker", "git"}));

    r = call_tool(handler, "add_context_pattern", {
        {"context_name", "docker"}, {"pattern_section", "auto_retrieve_triggers"},
        {"pattern_name", "compose"}, {"pattern_config", {{"keywords", {"compose"}}}}
    });
    assert(r["result"]["isError"] == false);

    r = call_tool(handler, "mark_context_optimized", {{"context_name", "docker"}});
    assert(r["result"]["structuredContent"]["optimization_count"] == 1);

    r = call_tool(handler, "list_available_contexts", json::object());
    assert(r["result"]["structuredContent"]["contexts"] == json::array({"docker", "git"}));

    r = call_tool(handler, "reload_contexts", json::object());
    assert(r["result"]["structuredContent"]["loaded"] == 2);

    r = call_tool(handler, "get_session_status", json::object());
    assert(r["result"]["structuredContent"]["initialized"] == false);

    r = call_tool(handler, "execute_session_initialization", json::object());
    assert(r["result"]["structuredContent"]["initialized"] == true);

    r = call_tool(handler, "get_memory_stats", json::object());
    assert(r["result"]["structuredContent"]["storage_backend"] == "fake");

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Niyama Tests ===" << std::endl;
    std::cout << std::endl;

    test_names();
    test_validator();
    test_check_files();
    test_backup_manager();
    test_document_roundtrip();
    test_document_key_order();

    std::cout << std::endl;
    std::cout << "=== Context Store ===" << std::endl;
    test_store_load();
    test_store_resolution();
    test_store_create();
    test_store_update();
    test_store_update_keeps_key_order();
    test_store_add_pattern();
    test_store_mark_optimized();
    test_created_document_survives_reload();
    test_failed_update_leaves_file_untouched();
    test_mutation_writes_one_backup();
    test_update_unknown_context();
    test_reserved_name_rejected();
    test_docker_create_then_reload();

    std::cout << std::endl;
    std::cout << "=== Corrections ===" << std::endl;
    test_translate_replacement();
    test_corrections_chain();
    test_corrections_patterns();
    test_corrections_via_store();
    test_corrections_input_limit();

    std::cout << std::endl;
    std::cout << "=== Session and Audit ===" << std::endl;
    test_session_initializer();
    test_session_unconfigured_memory();
    test_audit_hook();
    test_audit_overflow_and_failure();
    test_memory_client_unreachable();
    test_memory_client_timeout();

    std::cout << std::endl;
    std::cout << "=== RPC ===" << std::endl;
    test_rpc_protocol();
    test_rpc_tools();

    std::cout << std::endl;
    std::cout << "All tests passed!" << std::endl;
    return 0;
}
