#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chronicle {

enum class ActionType : uint8_t {
    File = 0,
    Content,
    Metadata,
    Tree,
    Learning,
    Navigation,
    Settings,
    Bookmark,
    Api,
};

enum class TargetType : uint8_t {
    Strand = 0,
    Weave,
    Loom,
    Fabric,
    Flashcard,
    FlashcardDeck,
    Quiz,
    QuizQuestion,
    GlossaryTerm,
    Bookmark,
    Draft,
    Setting,
    SearchQuery,
    ApiToken,
};

enum class Source : uint8_t {
    User = 0,
    Autosave,
    Sync,
    Import,
    Undo,
    Redo,
    System,
    Api,
};

// Canonical lower-case names, as stored in the audit_log / undo_stack tables.
const char* to_string(ActionType t);
const char* to_string(TargetType t);
const char* to_string(Source s);

// Unknown names yield std::nullopt rather than a fallback value.
std::optional<ActionType> parse_action_type(std::string_view s);
std::optional<TargetType> parse_target_type(std::string_view s);
std::optional<Source> parse_source(std::string_view s);

// Immutable record of one state-changing action.
struct AuditLogEntry {
    std::string id;
    std::string timestamp; // UTC ISO-8601, millisecond precision
    std::string session_id;
    ActionType action_type {ActionType::Content};
    std::string action_name;
    TargetType target_type {TargetType::Strand};
    std::optional<std::string> target_id;
    std::optional<std::string> target_path;
    std::optional<std::string> old_value; // opaque snapshot
    std::optional<std::string> new_value; // opaque snapshot
    bool is_undoable {false};
    std::optional<std::string> undo_group_id;
    std::optional<int64_t> duration_ms;
    Source source {Source::User};
};

struct AuditLogInput {
    ActionType action_type {ActionType::Content};
    std::string action_name;
    TargetType target_type {TargetType::Strand};
    std::optional<std::string> target_id;
    std::optional<std::string> target_path;
    std::optional<std::string> old_value;
    std::optional<std::string> new_value;
    bool is_undoable {false};
    std::optional<std::string> undo_group_id;
    std::optional<int64_t> duration_ms;
    Source source {Source::User};
};

enum class SortOrder : uint8_t { Ascending, Descending };

// All filters are conjunctive; unset filters match everything.
struct AuditQueryOptions {
    std::optional<ActionType> action_type;
    std::optional<std::string> action_name;
    std::optional<TargetType> target_type;
    std::optional<std::string> target_id;
    std::optional<std::string> target_path_prefix;
    std::optional<std::string> session_id;
    std::optional<Source> source;
    bool undoable_only {false};
    std::optional<std::string> start_time; // inclusive
    std::optional<std::string> end_time;   // exclusive
    int limit {100};
    int offset {0};
    SortOrder order {SortOrder::Descending};
};

struct AuditStats {
    int64_t total_entries {0};
    int64_t undoable_entries {0};
    int64_t unique_sessions {0};
    std::optional<std::string> oldest_entry;
    std::optional<std::string> newest_entry;
    std::map<std::string, int64_t> entries_by_type;
};

struct DayCount {
    std::string date; // YYYY-MM-DD
    int64_t count {0};
};

struct TypeCount {
    std::string type;
    int64_t count {0};
};

struct PathCount {
    std::string path;
    int64_t count {0};
};

struct ActivitySummary {
    std::vector<DayCount> activity_by_day;
    std::vector<TypeCount> by_action_type;
    DayCount peak_day;
    double average_daily {0.0};
    int64_t total_actions {0};
    int64_t session_count {0};
};

struct UndoStackEntry {
    std::string id;
    std::string session_id;
    int64_t stack_position {0};
    std::optional<std::string> audit_log_id;
    TargetType target_type {TargetType::Strand};
    std::string target_id;
    std::string before_state;
    std::string after_state;
    bool is_active {true};
};

struct UndoStackInput {
    TargetType target_type {TargetType::Strand};
    std::string target_id;
    std::string before_state;
    std::string after_state;
    std::optional<std::string> audit_log_id;
};

struct UndoMetadata {
    std::string id;
    std::string undo_stack_id;
    std::string key;
    std::string value;
};

struct UndoRedoResult {
    bool success {false};
    std::optional<UndoStackEntry> entry;
    std::optional<std::string> applied_state;
    std::optional<std::string> error;
    int steps {0};

    static UndoRedoResult failure(std::string message) {
        UndoRedoResult r;
        r.error = std::move(message);
        return r;
    }
};

struct UndoStackInfo {
    int64_t total_entries {0};
    int64_t active_entries {0};
    int64_t current_position {-1};

    bool canUndo() const { return active_entries > 0; }
    bool canRedo() const { return total_entries > active_entries; }
    int64_t undoCount() const { return active_entries; }
    int64_t redoCount() const { return total_entries - active_entries; }
};

} // namespace chronicle
