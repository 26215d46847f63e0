#pragma once

#include "chronicle/clock.hpp"
#include <chrono>

namespace chronicle {

struct AuditConfig {
    int batch_delay_ms {100};      // <= 0 flushes synchronously inside logAction
    int max_log_entries {10000};   // 0 disables the cap
    int retention_days {90};
    bool log_navigation {false};
    bool log_learning {true};
};

struct UndoConfig {
    int max_stack_size {50};       // <= 0 disables eviction
    bool persist_across_refresh {false};
};

struct LifecycleConfig {
    int session_max_age_hours {24};
    std::chrono::seconds sweep_interval {3600};
};

struct EngineConfig {
    AuditConfig audit;
    UndoConfig undo;
    LifecycleConfig lifecycle;
    Clock clock {system_clock()};
};

} // namespace chronicle
