#include "chronicle/audit_log.hpp"
#include "chronicle/logging.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>

namespace chronicle {

namespace {

constexpr const char* kInsertAudit =
    "INSERT INTO audit_log(id, timestamp, session_id, action_type, action_name, target_type,"
    " target_id, target_path, old_value, new_value, is_undoable, undo_group_id, duration_ms, source)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?)";

// Clears the single in-flight prune flag on every exit path.
struct InFlightGuard {
    std::atomic<bool>& flag;
    ~InFlightGuard() { flag.store(false); }
};

} // namespace

std::optional<AuditLogEntry> audit_entry_from_row(const Row& row) {
    auto action_type = parse_action_type(row.text("action_type").value_or(""));
    auto target_type = parse_target_type(row.text("target_type").value_or(""));
    auto source = parse_source(row.text("source").value_or("user"));
    auto id = row.text("id");
    if (!action_type || !target_type || !source || !id) return std::nullopt;

    AuditLogEntry e;
    e.id = *id;
    e.timestamp = row.text("timestamp").value_or("");
    e.session_id = row.text("session_id").value_or("");
    e.action_type = *action_type;
    e.action_name = row.text("action_name").value_or("");
    e.target_type = *target_type;
    e.target_id = row.text("target_id");
    e.target_path = row.text("target_path");
    e.old_value = row.text("old_value");
    e.new_value = row.text("new_value");
    e.is_undoable = row.integer("is_undoable").value_or(0) != 0;
    e.undo_group_id = row.text("undo_group_id");
    e.duration_ms = row.integer("duration_ms");
    e.source = *source;
    return e;
}

AuditLogStore::AuditLogStore(IStorage& storage, AuditConfig config, Clock clock,
                             std::shared_ptr<spdlog::logger> logger)
    : storage_(storage),
      config_(config),
      clock_(clock ? std::move(clock) : system_clock()),
      logger_(logger_or_default(std::move(logger))) {
    if (config_.batch_delay_ms > 0) startWriter();
}

AuditLogStore::~AuditLogStore() {
    stopWriter();
    if (!flush()) {
        logger_->error("audit log closed with {} unwritten entries", pendingCount());
    }
}

bool AuditLogStore::shouldLog(ActionType type) const {
    if (type == ActionType::Navigation) return config_.log_navigation;
    if (type == ActionType::Learning) return config_.log_learning;
    return true;
}

std::string AuditLogStore::nextTimestamp() {
    std::lock_guard<std::mutex> lock(stamp_mutex_);
    TimePoint now = std::chrono::time_point_cast<TimePoint::duration>(
        std::chrono::time_point_cast<std::chrono::milliseconds>(clock_()));
    if (now <= last_stamp_) now = last_stamp_ + std::chrono::milliseconds(1);
    last_stamp_ = now;
    return format_timestamp(now);
}

std::optional<std::string> AuditLogStore::logAction(const std::string& session_id, const AuditLogInput& input) {
    if (!shouldLog(input.action_type)) {
        logger_->debug("skipping {} action '{}' (category disabled)", to_string(input.action_type), input.action_name);
        return std::nullopt;
    }

    AuditLogEntry e;
    e.id = make_id("audit");
    e.timestamp = nextTimestamp();
    e.session_id = session_id;
    e.action_type = input.action_type;
    e.action_name = input.action_name;
    e.target_type = input.target_type;
    e.target_id = input.target_id;
    e.target_path = input.target_path;
    e.old_value = input.old_value;
    e.new_value = input.new_value;
    e.is_undoable = input.is_undoable;
    e.undo_group_id = input.undo_group_id;
    e.duration_ms = input.duration_ms;
    e.source = input.source;
    std::string id = e.id;

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.push_back(std::move(e));
    }
    if (running_.load()) {
        pending_cv_.notify_one();
    } else if (!flush()) {
        logger_->debug("audit entry {} queued for retry", id);
    }
    return id;
}

void AuditLogStore::insertEntry(const AuditLogEntry& e) {
    storage_.write(kInsertAudit,
                   {e.id, e.timestamp, e.session_id, std::string(to_string(e.action_type)), e.action_name,
                    std::string(to_string(e.target_type)), to_value(e.target_id), to_value(e.target_path),
                    to_value(e.old_value), to_value(e.new_value), int64_t {e.is_undoable ? 1 : 0},
                    to_value(e.undo_group_id), to_value(e.duration_ms), std::string(to_string(e.source))});
}

bool AuditLogStore::flush() {
    std::lock_guard<std::mutex> flush_lock(flush_mutex_);
    std::vector<AuditLogEntry> batch;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        batch.swap(pending_);
    }
    if (batch.empty()) return true;

    try {
        in_transaction(storage_, [&] {
            for (const auto& e : batch) insertEntry(e);
        });
    } catch (const StorageError& err) {
        logger_->warn("audit flush of {} entries failed, keeping them queued: {}", batch.size(), err.what());
        std::lock_guard<std::mutex> lock(pending_mutex_);
        // Entries logged while we were writing go after the failed batch.
        pending_.insert(pending_.begin(), std::make_move_iterator(batch.begin()),
                        std::make_move_iterator(batch.end()));
        return false;
    }
    logger_->debug("flushed {} audit entries", batch.size());

    try {
        deleteBeyondCap();
    } catch (const StorageError& err) {
        logger_->error("audit cap enforcement failed: {}", err.what());
    }
    return true;
}

void AuditLogStore::drainPending() {
    if (!flush()) logger_->debug("reading audit log with {} entries still queued", pendingCount());
}

size_t AuditLogStore::pendingCount() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

std::vector<AuditLogEntry> AuditLogStore::query(const AuditQueryOptions& options) {
    drainPending();

    std::vector<std::string> where;
    Params params;
    if (options.action_type) {
        where.emplace_back("action_type = ?");
        params.emplace_back(std::string(to_string(*options.action_type)));
    }
    if (options.action_name) {
        where.emplace_back("action_name = ?");
        params.emplace_back(*options.action_name);
    }
    if (options.target_type) {
        where.emplace_back("target_type = ?");
        params.emplace_back(std::string(to_string(*options.target_type)));
    }
    if (options.target_id) {
        where.emplace_back("target_id = ?");
        params.emplace_back(*options.target_id);
    }
    if (options.target_path_prefix) {
        where.emplace_back("substr(target_path, 1, length(?)) = ?");
        params.emplace_back(*options.target_path_prefix);
        params.emplace_back(*options.target_path_prefix);
    }
    if (options.session_id) {
        where.emplace_back("session_id = ?");
        params.emplace_back(*options.session_id);
    }
    if (options.source) {
        where.emplace_back("source = ?");
        params.emplace_back(std::string(to_string(*options.source)));
    }
    if (options.undoable_only) where.emplace_back("is_undoable = 1");
    if (options.start_time) {
        where.emplace_back("timestamp >= ?");
        params.emplace_back(*options.start_time);
    }
    if (options.end_time) {
        where.emplace_back("timestamp < ?");
        params.emplace_back(*options.end_time);
    }

    std::string sql = "SELECT * FROM audit_log";
    for (size_t i = 0; i < where.size(); ++i) {
        sql += (i == 0 ? " WHERE " : " AND ");
        sql += where[i];
    }
    sql += options.order == SortOrder::Ascending ? " ORDER BY timestamp ASC, id ASC"
                                                 : " ORDER BY timestamp DESC, id DESC";
    sql += " LIMIT ? OFFSET ?";
    params.emplace_back(int64_t {options.limit > 0 ? options.limit : -1});
    params.emplace_back(int64_t {std::max(options.offset, 0)});

    std::vector<AuditLogEntry> out;
    try {
        for (const auto& row : storage_.queryMany(sql, params)) {
            if (auto e = audit_entry_from_row(row)) {
                out.push_back(std::move(*e));
            } else {
                logger_->warn("skipping unreadable audit row {}", row.text("id").value_or("?"));
            }
        }
    } catch (const StorageError& err) {
        logger_->error("audit query failed: {}", err.what());
        return {};
    }
    return out;
}

std::optional<AuditLogEntry> AuditLogStore::getEntry(const std::string& id) {
    drainPending();
    try {
        auto row = storage_.queryOne("SELECT * FROM audit_log WHERE id = ?", {id});
        if (!row) return std::nullopt;
        return audit_entry_from_row(*row);
    } catch (const StorageError& err) {
        logger_->error("audit lookup of {} failed: {}", id, err.what());
        return std::nullopt;
    }
}

std::vector<AuditLogEntry> AuditLogStore::getRecentActions(int limit) {
    AuditQueryOptions o;
    o.limit = limit;
    return query(o);
}

std::vector<AuditLogEntry> AuditLogStore::getActionsByType(ActionType type, int limit) {
    AuditQueryOptions o;
    o.action_type = type;
    o.limit = limit;
    return query(o);
}

std::vector<AuditLogEntry> AuditLogStore::getActionsForTarget(TargetType type, const std::string& target_id, int limit) {
    AuditQueryOptions o;
    o.target_type = type;
    o.target_id = target_id;
    o.limit = limit;
    return query(o);
}

AuditStats AuditLogStore::getStats() {
    drainPending();
    AuditStats stats;
    try {
        auto row = storage_.queryOne(
            "SELECT COUNT(*) AS total, COALESCE(SUM(is_undoable), 0) AS undoable,"
            " COUNT(DISTINCT session_id) AS sessions, MIN(timestamp) AS oldest, MAX(timestamp) AS newest"
            " FROM audit_log",
            {});
        if (row) {
            stats.total_entries = row->integer("total").value_or(0);
            stats.undoable_entries = row->integer("undoable").value_or(0);
            stats.unique_sessions = row->integer("sessions").value_or(0);
            stats.oldest_entry = row->text("oldest");
            stats.newest_entry = row->text("newest");
        }
        for (const auto& r : storage_.queryMany(
                 "SELECT action_type, COUNT(*) AS n FROM audit_log GROUP BY action_type", {})) {
            stats.entries_by_type[r.text("action_type").value_or("")] = r.integer("n").value_or(0);
        }
    } catch (const StorageError& err) {
        logger_->error("audit stats failed: {}", err.what());
        return AuditStats {};
    }
    return stats;
}

ActivitySummary AuditLogStore::getActivity(const std::string& since_date, const std::string& until_date) {
    const auto since = parse_date(since_date);
    const auto until = parse_date(until_date);
    if (!since || !until || *until < *since) {
        logger_->warn("invalid activity range '{}'..'{}'", since_date, until_date);
        return {};
    }
    drainPending();

    const std::string lower = format_timestamp(*since);
    const std::string upper = format_timestamp(*until + std::chrono::hours(24));
    ActivitySummary summary;
    std::map<std::string, int64_t> per_day;
    try {
        for (const auto& r : storage_.queryMany(
                 "SELECT substr(timestamp, 1, 10) AS day, COUNT(*) AS n FROM audit_log"
                 " WHERE timestamp >= ? AND timestamp < ? GROUP BY day ORDER BY day ASC",
                 {lower, upper})) {
            per_day[r.text("day").value_or("")] = r.integer("n").value_or(0);
        }
        for (const auto& r : storage_.queryMany(
                 "SELECT action_type, COUNT(*) AS n FROM audit_log"
                 " WHERE timestamp >= ? AND timestamp < ? GROUP BY action_type ORDER BY n DESC, action_type ASC",
                 {lower, upper})) {
            summary.by_action_type.push_back(TypeCount {r.text("action_type").value_or(""), r.integer("n").value_or(0)});
        }
        auto sessions = storage_.queryOne(
            "SELECT COUNT(DISTINCT session_id) AS n FROM audit_log WHERE timestamp >= ? AND timestamp < ?",
            {lower, upper});
        summary.session_count = sessions ? sessions->integer("n").value_or(0) : 0;
    } catch (const StorageError& err) {
        logger_->error("audit activity query failed: {}", err.what());
        return {};
    }

    int64_t active_days = 0;
    for (TimePoint day = *since; day <= *until; day += std::chrono::hours(24)) {
        DayCount dc {format_date(day), 0};
        auto it = per_day.find(dc.date);
        if (it != per_day.end()) dc.count = it->second;
        summary.total_actions += dc.count;
        if (dc.count > 0) ++active_days;
        if (dc.count > summary.peak_day.count) summary.peak_day = dc;
        summary.activity_by_day.push_back(std::move(dc));
    }
    if (active_days > 0) {
        const double avg = static_cast<double>(summary.total_actions) / static_cast<double>(active_days);
        summary.average_daily = std::round(avg * 10.0) / 10.0;
    }
    return summary;
}

std::vector<PathCount> AuditLogStore::getMostEditedPaths(int limit) {
    drainPending();
    std::vector<PathCount> out;
    try {
        for (const auto& r : storage_.queryMany(
                 "SELECT target_path, COUNT(*) AS n FROM audit_log"
                 " WHERE target_path IS NOT NULL AND action_type != 'navigation'"
                 " GROUP BY target_path ORDER BY n DESC, target_path ASC LIMIT ?",
                 {int64_t {limit > 0 ? limit : -1}})) {
            out.push_back(PathCount {r.text("target_path").value_or(""), r.integer("n").value_or(0)});
        }
    } catch (const StorageError& err) {
        logger_->error("most-edited query failed: {}", err.what());
        return {};
    }
    return out;
}

int64_t AuditLogStore::pruneAuditLog(int retention_days) {
    if (retention_days <= 0) {
        logger_->warn("refusing to prune audit log with non-positive retention ({} days)", retention_days);
        return 0;
    }
    bool expected = false;
    if (!pruning_.compare_exchange_strong(expected, true)) {
        logger_->warn("audit prune already in progress");
        return 0;
    }
    InFlightGuard guard {pruning_};

    drainPending();
    const std::string cutoff = format_timestamp(hours_before(clock_(), int64_t {retention_days} * 24));
    try {
        const int64_t removed = storage_.write("DELETE FROM audit_log WHERE timestamp < ?", {cutoff});
        if (removed > 0) logger_->info("pruned {} audit entries older than {}", removed, cutoff);
        return removed;
    } catch (const StorageError& err) {
        logger_->error("audit prune failed: {}", err.what());
        return 0;
    }
}

int64_t AuditLogStore::deleteBeyondCap() {
    if (config_.max_log_entries <= 0) return 0;
    int64_t removed = 0;
    in_transaction(storage_, [&] {
        auto row = storage_.queryOne("SELECT COUNT(*) AS n FROM audit_log", {});
        const int64_t total = row ? row->integer("n").value_or(0) : 0;
        if (total <= config_.max_log_entries) return;
        removed = storage_.write(
            "DELETE FROM audit_log WHERE id IN"
            " (SELECT id FROM audit_log ORDER BY timestamp DESC, id DESC LIMIT -1 OFFSET ?)",
            {int64_t {config_.max_log_entries}});
    });
    if (removed == 0) return 0;
    logger_->info("audit log over cap ({}), removed {} oldest entries", config_.max_log_entries, removed);
    return removed;
}

int64_t AuditLogStore::enforceMaxEntries() {
    drainPending();
    try {
        return deleteBeyondCap();
    } catch (const StorageError& err) {
        logger_->error("audit cap enforcement failed: {}", err.what());
        return 0;
    }
}

void AuditLogStore::startWriter() {
    if (running_.exchange(true)) return;
    writer_ = std::thread([this] { run(); });
}

void AuditLogStore::stopWriter() {
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (!running_.exchange(false)) return;
    }
    pending_cv_.notify_all();
    if (writer_.joinable()) writer_.join();
}

void AuditLogStore::run() {
    const auto delay = std::chrono::milliseconds(config_.batch_delay_ms);
    std::unique_lock<std::mutex> lock(pending_mutex_);
    while (running_.load()) {
        pending_cv_.wait(lock, [this] { return !running_.load() || !pending_.empty(); });
        if (!running_.load()) break;
        // Coalesce everything logged within the window into one flush.
        pending_cv_.wait_for(lock, delay, [this] { return !running_.load(); });
        lock.unlock();
        if (!flush()) logger_->debug("audit writer retrying in {} ms", config_.batch_delay_ms);
        lock.lock();
    }
}

} // namespace chronicle
