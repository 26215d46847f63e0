// Unit tests for the storage-independent parts of the engine.
#include "chronicle/clock.hpp"
#include "chronicle/config.hpp"
#include "chronicle/storage.hpp"
#include "chronicle/types.hpp"
#include <cassert>
#include <limits>
#include <set>
#include <string>

using namespace chronicle;

int main() {
    // Closed sets use their wire names and reject anything else
    assert(std::string(to_string(ActionType::Navigation)) == "navigation");
    assert(std::string(to_string(TargetType::FlashcardDeck)) == "flashcard_deck");
    assert(std::string(to_string(Source::Autosave)) == "autosave");
    assert(parse_action_type("api") == ActionType::Api);
    assert(parse_target_type("glossary_term") == TargetType::GlossaryTerm);
    assert(parse_source("redo") == Source::Redo);
    assert(!parse_action_type("File").has_value());
    assert(!parse_target_type("").has_value());
    assert(!parse_source("robot").has_value());

    // Timestamps: fixed width, millisecond precision, UTC
    auto t0 = parse_timestamp("2024-01-01T00:00:00.000Z");
    assert(t0.has_value());
    assert(format_timestamp(*t0) == "2024-01-01T00:00:00.000Z");
    assert(format_timestamp(*t0 + std::chrono::milliseconds(1500)) == "2024-01-01T00:00:01.500Z");
    assert(format_timestamp(*t0 - std::chrono::hours(24)) == "2023-12-31T00:00:00.000Z");
    assert(parse_timestamp("2024-01-01T00:00:00Z") == t0);
    assert(!parse_timestamp("2024-01-01 00:00:00").has_value());
    assert(!parse_timestamp("2024-13-01T00:00:00.000Z").has_value());

    // Lexicographic order of formatted stamps follows time order
    const std::string a = format_timestamp(*t0 + std::chrono::milliseconds(999));
    const std::string b = format_timestamp(*t0 + std::chrono::seconds(10));
    assert(a < b);

    assert(format_date(*t0 + std::chrono::hours(36)) == "2024-01-02");
    assert(parse_date("2024-01-02") == *t0 + std::chrono::hours(24));
    assert(!parse_date("2024-1-2").has_value());

    // Offsets saturate at the epoch instead of overflowing
    assert(hours_before(*t0, 48) == *t0 - std::chrono::hours(48));
    assert(hours_before(*t0, int64_t {200000} * 24) == TimePoint {});
    assert(format_timestamp(hours_before(*t0, std::numeric_limits<int64_t>::max())) == "1970-01-01T00:00:00.000Z");

    // Ids carry their prefix and do not collide
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) ids.insert(make_id("undo"));
    assert(ids.size() == 1000);
    assert(ids.begin()->rfind("undo_", 0) == 0);

    // Row conversions
    Row row;
    row.set("n", int64_t {42});
    row.set("s", std::string("7"));
    row.set("z", std::monostate {});
    assert(row.integer("n") == 42);
    assert(row.text("n") == std::string("42"));
    assert(row.integer("s") == 7);
    assert(row.isNull("z"));
    assert(!row.text("z").has_value());
    assert(row.isNull("missing"));
    assert(!row.has("missing"));
    row.set("n", int64_t {43});
    assert(row.integer("n") == 43);
    assert(row.columns().size() == 3);

    // Stack info derived counters
    UndoStackInfo info;
    assert(info.current_position == -1);
    assert(!info.canUndo() && !info.canRedo());
    info.total_entries = 5;
    info.active_entries = 3;
    info.current_position = 2;
    assert(info.canUndo() && info.canRedo());
    assert(info.undoCount() == 3 && info.redoCount() == 2);

    // Defaults
    EngineConfig cfg;
    assert(cfg.audit.retention_days == 90);
    assert(!cfg.audit.log_navigation && cfg.audit.log_learning);
    assert(cfg.undo.max_stack_size == 50);
    assert(cfg.lifecycle.session_max_age_hours == 24);
    assert(cfg.clock);

    auto failed = UndoRedoResult::failure("Nothing to undo");
    assert(!failed.success);
    assert(failed.error == std::string("Nothing to undo"));
    assert(!failed.entry.has_value() && !failed.applied_state.has_value());

    return 0;
}
