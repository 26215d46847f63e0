#pragma once

#include "chronicle/storage.hpp"
#include "chronicle/types.hpp"
#include "chronicle/undo_stack.hpp"
#include <atomic>
#include <optional>
#include <string>

namespace chronicle {

// Minimal host document model: one opaque state per (target type, target id),
// kept in a `documents` table next to the history tables.
class DocumentStore {
public:
    explicit DocumentStore(IStorage& storage);

    void ensureTable();
    void put(TargetType type, const std::string& id, const std::string& state);
    std::optional<std::string> get(TargetType type, const std::string& id);

    // Apply-state handler for UndoRedoStack; storage faults count as a rejected apply.
    ApplyStateHandler applyHandler();

    int applied() const { return applied_.load(); }

private:
    IStorage& storage_;
    std::atomic<int> applied_ {0};
};

} // namespace chronicle
