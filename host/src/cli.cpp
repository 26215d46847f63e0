#include "chronicle/cli.hpp"
#include <stdexcept>

namespace chronicle {

namespace {

int to_int(const std::string& flag, const std::string& value) {
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(value, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    }
    if (used != value.size()) throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
    return v;
}

} // namespace

std::optional<std::string> get_arg(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc - 1; ++i) {
        if (flag == argv[i]) return std::string(argv[i + 1]);
    }
    return std::nullopt;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) return true;
    }
    return false;
}

RunnerOptions options_from_args(int argc, char** argv) {
    RunnerOptions o;
    if (auto v = get_arg(argc, argv, "--db")) o.db_path = *v;
    if (auto v = get_arg(argc, argv, "--log-level")) o.log_level = *v;
    o.maintain = has_flag(argc, argv, "--maintain");

    AuditConfig& audit = o.engine.audit;
    if (auto v = get_arg(argc, argv, "--batch-delay-ms")) audit.batch_delay_ms = to_int("--batch-delay-ms", *v);
    if (auto v = get_arg(argc, argv, "--max-log-entries")) audit.max_log_entries = to_int("--max-log-entries", *v);
    if (auto v = get_arg(argc, argv, "--retention-days")) audit.retention_days = to_int("--retention-days", *v);

    UndoConfig& undo = o.engine.undo;
    if (auto v = get_arg(argc, argv, "--max-stack")) undo.max_stack_size = to_int("--max-stack", *v);
    undo.persist_across_refresh = has_flag(argc, argv, "--persist");

    LifecycleConfig& life = o.engine.lifecycle;
    if (auto v = get_arg(argc, argv, "--session-max-age-hours")) {
        life.session_max_age_hours = to_int("--session-max-age-hours", *v);
    }
    if (auto v = get_arg(argc, argv, "--sweep-interval-s")) {
        life.sweep_interval = std::chrono::seconds(to_int("--sweep-interval-s", *v));
    }
    return o;
}

const char* runner_usage() {
    return "usage: chronicle_runner [--db PATH] [--log-level LEVEL] [--batch-delay-ms N]\n"
           "                        [--max-log-entries N] [--retention-days N] [--max-stack N] [--persist]\n"
           "                        [--session-max-age-hours N] [--sweep-interval-s N] [--maintain]\n";
}

} // namespace chronicle
