#include "chronicle/sqlite_storage.hpp"
#include "chronicle/undo_stack.hpp"
#include "recording_storage.hpp"
#include <cassert>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace chronicle;

static int64_t count(IStorage& db, const char* table) {
    auto row = db.queryOne(std::string("SELECT COUNT(*) AS n FROM ") + table, {});
    assert(row.has_value());
    return row->integer("n").value_or(-1);
}

static UndoStackInput change(const std::string& target, const std::string& before, const std::string& after) {
    UndoStackInput in;
    in.target_type = TargetType::Strand;
    in.target_id = target;
    in.before_state = before;
    in.after_state = after;
    return in;
}

// Live "document": target id -> last applied state
struct Document {
    std::map<std::string, std::string> states;
    ApplyStateHandler handler() {
        return [this](TargetType, const std::string& id, const std::string& state, bool) {
            states[id] = state;
            return true;
        };
    }
};

static void test_empty_stack() {
    SqliteStorage db(":memory:");
    ensure_schema(db);
    UndoRedoStack stack(db, UndoConfig {});
    Document doc;
    stack.registerHandler(TargetType::Strand, doc.handler());

    auto u = stack.undo("s1");
    assert(!u.success);
    assert(u.error == std::string("Nothing to undo"));
    assert(!u.entry.has_value());
    auto r = stack.redo("s1");
    assert(!r.success);
    assert(r.error == std::string("Nothing to redo"));

    auto info = stack.getUndoStackInfo("s1");
    assert(info.total_entries == 0);
    assert(info.active_entries == 0);
    assert(info.current_position == -1);
    assert(doc.states.empty());
}

static void test_push_undo_redo_scenario() {
    SqliteStorage db(":memory:");
    ensure_schema(db);
    UndoRedoStack stack(db, UndoConfig {});
    Document doc;
    stack.registerHandler(TargetType::Strand, doc.handler());

    auto id = stack.pushUndoableAction("s1", change("strand_1", "{\"v\":1}", "{\"v\":2}"));
    assert(id.has_value());
    assert(id->rfind("undo_", 0) == 0);

    auto u = stack.undo("s1");
    assert(u.success);
    assert(u.applied_state == std::string("{\"v\":1}"));
    assert(u.entry.has_value() && u.entry->id == *id && !u.entry->is_active);
    assert(doc.states["strand_1"] == "{\"v\":1}");
    assert(stack.getUndoStackInfo("s1").current_position == -1);

    auto r = stack.redo("s1");
    assert(r.success);
    assert(r.applied_state == std::string("{\"v\":2}"));
    assert(r.entry->is_active);
    assert(doc.states["strand_1"] == "{\"v\":2}");
    assert(stack.getUndoStackInfo("s1").current_position == 0);
}

static void test_push_n_and_round_trip() {
    SqliteStorage db(":memory:");
    ensure_schema(db);
    UndoRedoStack stack(db, UndoConfig {});
    Document doc;
    stack.registerHandler(TargetType::Strand, doc.handler());

    const int N = 6;
    for (int i = 0; i < N; ++i) {
        assert(stack.pushUndoableAction("s1", change("t", std::to_string(i), std::to_string(i + 1))));
    }
    auto info = stack.getUndoStackInfo("s1");
    assert(info.total_entries == N);
    assert(info.active_entries == N);
    assert(info.current_position == N - 1);

    auto entries = stack.listEntries("s1");
    assert(entries.size() == static_cast<size_t>(N));
    for (int i = 0; i < N; ++i) assert(entries[i].stack_position == i);

    // undo then redo restores the active set and cursor exactly
    assert(stack.undo("s1").success);
    assert(stack.undo("s1").success);
    auto mid = stack.getUndoStackInfo("s1");
    assert(mid.current_position == N - 3);
    assert(mid.active_entries == N - 2);
    std::vector<bool> before_active;
    for (const auto& e : stack.listEntries("s1")) before_active.push_back(e.is_active);

    assert(stack.undo("s1").success);
    assert(stack.redo("s1").success);
    auto after = stack.getUndoStackInfo("s1");
    assert(after.current_position == mid.current_position);
    assert(after.active_entries == mid.active_entries);
    std::vector<bool> after_active;
    for (const auto& e : stack.listEntries("s1")) after_active.push_back(e.is_active);
    assert(before_active == after_active);

    // Active entries stay a contiguous prefix
    bool seen_inactive = false;
    for (bool active : after_active) {
        if (!active) seen_inactive = true;
        assert(!(active && seen_inactive));
    }
}

static void test_push_after_undo_discards_redo_branch() {
    SqliteStorage db(":memory:");
    ensure_schema(db);
    UndoRedoStack stack(db, UndoConfig {});
    Document doc;
    stack.registerHandler(TargetType::Strand, doc.handler());

    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i) ids.push_back(*stack.pushUndoableAction("s1", change("t", "a", "b")));
    assert(stack.setMetadata(ids[2], "selection", "[1,2]").has_value());

    assert(stack.undo("s1").success);
    assert(stack.undo("s1").success);
    assert(stack.getUndoStackInfo("s1").current_position == 0);

    auto fresh = stack.pushUndoableAction("s1", change("t", "b", "c"));
    assert(fresh.has_value());
    auto info = stack.getUndoStackInfo("s1");
    assert(info.total_entries == 2);
    assert(info.active_entries == 2);
    assert(info.current_position == 1);

    auto entries = stack.listEntries("s1");
    assert(entries[0].id == ids[0]);
    assert(entries[1].id == *fresh);
    assert(entries[1].stack_position == 1);

    // abandoned entries are gone for good, their metadata with them
    auto r = stack.redo("s1");
    assert(!r.success);
    assert(r.error == std::string("Nothing to redo"));
    assert(count(db, "undo_metadata") == 0);
}

static void test_handler_failure_leaves_stack_untouched() {
    SqliteStorage db(":memory:");
    ensure_schema(db);
    UndoRedoStack stack(db, UndoConfig {});
    bool accept = false;
    stack.registerHandler(TargetType::Strand,
                          [&](TargetType, const std::string&, const std::string&, bool) { return accept; });

    assert(stack.pushUndoableAction("s1", change("t", "a", "b")));
    auto u = stack.undo("s1");
    assert(!u.success);
    assert(u.error == std::string("Failed to apply undo state"));
    auto info = stack.getUndoStackInfo("s1");
    assert(info.active_entries == 1 && info.current_position == 0);

    accept = true;
    assert(stack.undo("s1").success);
    accept = false;
    auto r = stack.redo("s1");
    assert(!r.success);
    assert(r.error == std::string("Failed to apply redo state"));
    assert(stack.getUndoStackInfo("s1").current_position == -1);

    // a throwing handler counts as a rejection
    stack.registerHandler(TargetType::Strand, [](TargetType, const std::string&, const std::string&, bool) -> bool {
        throw std::runtime_error("document locked");
    });
    assert(!stack.redo("s1").success);
    assert(stack.getUndoStackInfo("s1").current_position == -1);
}

static void test_missing_handler_and_fallback() {
    SqliteStorage db(":memory:");
    ensure_schema(db);
    UndoRedoStack stack(db, UndoConfig {});
    assert(stack.pushUndoableAction("s1", change("t", "a", "b")));

    assert(!stack.undo("s1").success);
    assert(stack.getUndoStackInfo("s1").active_entries == 1);

    std::vector<TargetType> seen;
    stack.setFallbackHandler([&](TargetType type, const std::string&, const std::string&, bool is_undo) {
        assert(is_undo);
        seen.push_back(type);
        return true;
    });
    assert(stack.undo("s1").success);
    assert(seen.size() == 1 && seen[0] == TargetType::Strand);
}

static void test_clear_stack_deletes_metadata_first() {
    SqliteStorage db(":memory:");
    RecordingStorage rec(db);
    ensure_schema(rec);
    UndoRedoStack stack(rec, UndoConfig {});

    auto a = stack.pushUndoableAction("s1", change("t", "a", "b"));
    auto b = stack.pushUndoableAction("s1", change("t", "b", "c"));
    assert(a && b);
    assert(stack.setMetadata(*a, "cursor", "12"));
    assert(stack.setMetadata(*b, "cursor", "15"));
    assert(stack.pushUndoableAction("other", change("t", "x", "y")));

    rec.clearLog();
    assert(stack.clearStack("s1"));
    auto deletes = rec.statementsContaining("DELETE FROM");
    assert(deletes.size() == 2);
    assert(deletes[0].find("DELETE FROM undo_metadata") == 0);
    assert(deletes[1].find("DELETE FROM undo_stack") == 0);

    assert(stack.getUndoStackInfo("s1").total_entries == 0);
    assert(stack.getUndoStackInfo("other").total_entries == 1);
    assert(count(db, "undo_metadata") == 0);

    // empty stack clears fine
    assert(stack.clearStack("s1"));
    assert(stack.clearStack("never-seen"));

    // storage failure: false, nothing half-deleted
    assert(stack.setMetadata(stack.listEntries("other")[0].id, "k", "v"));
    rec.failOn("DELETE FROM undo_stack");
    assert(!stack.clearStack("other"));
    rec.disarm();
    assert(stack.getUndoStackInfo("other").total_entries == 1);
    assert(count(db, "undo_metadata") == 1);
}

static void test_overflow_evicts_oldest() {
    SqliteStorage db(":memory:");
    ensure_schema(db);
    UndoConfig cfg;
    cfg.max_stack_size = 3;
    UndoRedoStack stack(db, cfg);
    Document doc;
    stack.registerHandler(TargetType::Strand, doc.handler());

    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(*stack.pushUndoableAction("s1", change("t", std::to_string(i), std::to_string(i + 1))));
        assert(stack.setMetadata(ids.back(), "n", std::to_string(i)));
    }
    auto info = stack.getUndoStackInfo("s1");
    assert(info.total_entries == 3);
    assert(info.active_entries == 3);
    assert(info.current_position == 4);

    auto entries = stack.listEntries("s1");
    assert(entries.front().id == ids[2]);
    assert(entries.back().id == ids[4]);
    assert(count(db, "undo_metadata") == 3);
    assert(stack.getMetadata(ids[0]).empty());
    assert(stack.getMetadata(ids[3]).at("n") == "3");

    for (int i = 0; i < 3; ++i) assert(stack.undo("s1").success);
    assert(!stack.undo("s1").success);
    assert(doc.states["t"] == "2");
    auto r = stack.redo("s1");
    assert(r.success && r.entry->id == ids[2]);
}

static void test_storage_errors_become_results() {
    SqliteStorage db(":memory:");
    RecordingStorage rec(db);
    ensure_schema(rec);
    UndoRedoStack stack(rec, UndoConfig {});
    Document doc;
    stack.registerHandler(TargetType::Strand, doc.handler());
    assert(stack.pushUndoableAction("s1", change("t", "a", "b")));

    rec.failOn("INSERT INTO undo_stack");
    assert(!stack.pushUndoableAction("s1", change("t", "b", "c")).has_value());
    rec.disarm();
    assert(stack.getUndoStackInfo("s1").total_entries == 1);

    rec.failOn("SELECT");
    auto u = stack.undo("s1");
    assert(!u.success && u.error.has_value());
    assert(stack.listEntries("s1").empty());
    assert(stack.getUndoStackInfo("s1").current_position == -1);
    rec.disarm();

    // cursor update fails after the handler ran: entry stays active, retry works
    rec.failOn("UPDATE undo_stack", 1);
    assert(!stack.undo("s1").success);
    assert(stack.getUndoStackInfo("s1").active_entries == 1);
    assert(stack.undo("s1").success);
    assert(doc.states["t"] == "a");
}

static void test_metadata() {
    SqliteStorage db(":memory:");
    ensure_schema(db);
    UndoRedoStack stack(db, UndoConfig {});
    auto id = stack.pushUndoableAction("s1", change("t", "a", "b"));
    assert(id);

    auto m1 = stack.setMetadata(*id, "relatedItems", "[\"item1\",\"item2\"]");
    auto m2 = stack.setMetadata(*id, "relatedItems", "[\"item3\"]");
    assert(m1 && m2 && *m1 == *m2);
    assert(m1->rfind("meta_", 0) == 0);
    assert(stack.setMetadata(*id, "origin", "toolbar"));
    auto meta = stack.getMetadata(*id);
    assert(meta.size() == 2);
    assert(meta["relatedItems"] == "[\"item3\"]");
    assert(!stack.setMetadata("undo_missing", "k", "v").has_value());
}

static void test_concurrent_sessions() {
    SqliteStorage db(":memory:");
    ensure_schema(db);
    UndoConfig cfg;
    cfg.max_stack_size = 0;
    UndoRedoStack stack(db, cfg);

    // Several writers on one session: positions stay unique and gap-free
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&stack, t] {
            for (int i = 0; i < 10; ++i) {
                auto id = stack.pushUndoableAction("shared", change("t" + std::to_string(t), "a", "b"));
                assert(id.has_value());
            }
        });
    }
    // ...while other sessions proceed independently
    for (int t = 0; t < 3; ++t) {
        threads.emplace_back([&stack, t] {
            const std::string session = "own" + std::to_string(t);
            for (int i = 0; i < 10; ++i) assert(stack.pushUndoableAction(session, change("x", "a", "b")));
        });
    }
    for (auto& th : threads) th.join();

    auto shared = stack.listEntries("shared");
    assert(shared.size() == 40);
    std::set<int64_t> positions;
    for (const auto& e : shared) positions.insert(e.stack_position);
    assert(positions.size() == 40);
    assert(*positions.begin() == 0 && *positions.rbegin() == 39);
    for (int t = 0; t < 3; ++t) {
        auto info = stack.getUndoStackInfo("own" + std::to_string(t));
        assert(info.total_entries == 10 && info.current_position == 9);
    }
}

int main() {
    test_empty_stack();
    test_push_undo_redo_scenario();
    test_push_n_and_round_trip();
    test_push_after_undo_discards_redo_branch();
    test_handler_failure_leaves_stack_untouched();
    test_missing_handler_and_fallback();
    test_clear_stack_deletes_metadata_first();
    test_overflow_evicts_oldest();
    test_storage_errors_become_results();
    test_metadata();
    test_concurrent_sessions();
    return 0;
}
