/**
 * @file logger_adapter.cpp
 * @brief logger_system backed application log and the job audit trail
 */

#include <docmig/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <nlohmann/json.hpp>

#include <array>
#include <atomic>
#include <ctime>
#include <fstream>
#include <memory>
#include <mutex>

namespace docmig::integration {

namespace {

constexpr std::array<std::string_view, 9> job_event_names{
    "JOB_CREATED",  "DOCUMENTS_QUEUED",     "JOB_STARTED",
    "JOB_PAUSED",   "JOB_RESUMED",          "JOB_CANCEL_REQUESTED",
    "JOB_CANCELLED", "JOB_RETRIED",         "JOB_SETTLED"};

auto to_kcenon_level(log_level level) -> kcenon::logger::log_level {
    using kcenon_level = kcenon::logger::log_level;
    switch (level) {
        case log_level::trace: return kcenon_level::trace;
        case log_level::debug: return kcenon_level::debug;
        case log_level::info: return kcenon_level::info;
        case log_level::warn: return kcenon_level::warn;
        case log_level::error: return kcenon_level::error;
        case log_level::fatal: return kcenon_level::fatal;
        case log_level::off: break;
    }
    return kcenon_level::off;
}

/// UTC with millisecond precision, e.g. 2024-05-01T12:00:00.250Z
auto utc_timestamp() -> std::string {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);
    return compat::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                          utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                          utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
}

/**
 * @brief Append-only JSON-lines file of job lifecycle events
 *
 * Every line carries a sequence number so a reader can spot gaps left by a
 * crash between two writes.
 */
class audit_trail {
public:
    auto open(const std::filesystem::path& path) -> bool {
        std::lock_guard lock(mutex_);
        stream_.open(path, std::ios::out | std::ios::app);
        path_ = stream_ ? path : std::filesystem::path{};
        sequence_ = 0;
        return static_cast<bool>(stream_);
    }

    void close() {
        std::lock_guard lock(mutex_);
        if (stream_.is_open()) {
            stream_.close();
        }
        path_.clear();
    }

    [[nodiscard]] auto path() const -> std::filesystem::path {
        std::lock_guard lock(mutex_);
        return path_;
    }

    void append(std::string_view event_name, const std::string& job_id,
                const std::map<std::string, std::string>& fields) {
        std::lock_guard lock(mutex_);
        if (!stream_.is_open()) {
            return;
        }

        nlohmann::json entry = {{"seq", ++sequence_},
                                {"timestamp", utc_timestamp()},
                                {"event_type", std::string(event_name)},
                                {"job_id", job_id}};
        for (const auto& [key, value] : fields) {
            entry.emplace(key, value);
        }
        stream_ << entry.dump() << '\n' << std::flush;
    }

private:
    mutable std::mutex mutex_;
    std::ofstream stream_;
    std::filesystem::path path_;
    std::uint64_t sequence_{0};
};

}  // namespace

auto log_level_from_string(std::string_view name) -> std::optional<log_level> {
    static const std::map<std::string_view, log_level> names{
        {"trace", log_level::trace},   {"debug", log_level::debug},
        {"info", log_level::info},     {"warn", log_level::warn},
        {"warning", log_level::warn},  {"error", log_level::error},
        {"fatal", log_level::fatal},   {"critical", log_level::fatal},
        {"off", log_level::off}};

    auto it = names.find(name);
    if (it == names.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ─────────────────────────────────────────────────────
// Adapter state
// ─────────────────────────────────────────────────────

class logger_adapter::impl {
public:
    ~impl() { stop(); }

    void start(const logger_config& config) {
        std::lock_guard lock(mutex_);
        if (logger_) {
            return;
        }

        config_ = config;
        min_level_ = config.min_level;

        if (config.enable_file || config.enable_audit_log) {
            std::error_code ec;
            std::filesystem::create_directories(config.log_directory, ec);
        }

        auto logger = std::make_unique<kcenon::logger::logger>(config.async_mode,
                                                                config.buffer_size);
        logger->set_min_level(to_kcenon_level(config.min_level));
        if (config.enable_console) {
            logger->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }
        if (config.enable_file) {
            logger->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                (config.log_directory / "docmig.log").string(),
                config.max_file_size_mb * 1024 * 1024, config.max_files));
        }
        logger->start();
        logger_ = std::move(logger);
        active_ = true;

        if (config.enable_audit_log &&
            !audit_.open(config.log_directory / "audit.json")) {
            logger_->log(kcenon::logger::log_level::warn,
                         "Cannot open audit trail in " + config.log_directory.string());
        }
    }

    void stop() {
        std::lock_guard lock(mutex_);
        if (!logger_) {
            return;
        }
        active_ = false;
        audit_.close();
        logger_->flush();
        logger_->stop();
        logger_.reset();
    }

    [[nodiscard]] auto active() const noexcept -> bool { return active_; }

    void write(log_level level, const std::string& message) {
        std::lock_guard lock(mutex_);
        if (logger_ && enabled(level)) {
            logger_->log(to_kcenon_level(level), message);
        }
    }

    [[nodiscard]] auto enabled(log_level level) const noexcept -> bool {
        return level != log_level::off && level >= min_level_.load();
    }

    void flush() {
        std::lock_guard lock(mutex_);
        if (logger_) {
            logger_->flush();
        }
    }

    void set_min_level(log_level level) {
        std::lock_guard lock(mutex_);
        min_level_ = level;
        if (logger_) {
            logger_->set_min_level(to_kcenon_level(level));
        }
    }

    [[nodiscard]] auto min_level() const noexcept -> log_level { return min_level_; }
    [[nodiscard]] auto config() const -> const logger_config& { return config_; }
    [[nodiscard]] auto audit() -> audit_trail& { return audit_; }

private:
    std::mutex mutex_;
    std::atomic<bool> active_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> logger_;
    audit_trail audit_;
};

auto logger_adapter::state() -> impl& {
    static impl instance;
    return instance;
}

// ─────────────────────────────────────────────────────
// Public interface
// ─────────────────────────────────────────────────────

void logger_adapter::initialize(const logger_config& config) { state().start(config); }

void logger_adapter::shutdown() { state().stop(); }

auto logger_adapter::is_initialized() noexcept -> bool { return state().active(); }

void logger_adapter::log(log_level level, const std::string& message) {
    state().write(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return state().enabled(level);
}

void logger_adapter::flush() { state().flush(); }

void logger_adapter::log_job_event(job_event event,
                                   const std::string& job_id,
                                   const std::map<std::string, std::string>& fields) {
    const auto name = job_event_name(event);

    std::string context;
    for (const auto& [key, value] : fields) {
        context += compat::format(" {}={}", key, value);
    }
    info("Job {} {}{}", job_id, name, context);

    state().audit().append(name, job_id, fields);
}

void logger_adapter::set_min_level(log_level level) { state().set_min_level(level); }

auto logger_adapter::get_min_level() noexcept -> log_level { return state().min_level(); }

auto logger_adapter::get_config() -> const logger_config& { return state().config(); }

auto logger_adapter::audit_log_path() -> std::filesystem::path {
    return state().audit().path();
}

auto logger_adapter::job_event_name(job_event event) -> std::string_view {
    const auto index = static_cast<std::size_t>(event);
    return index < job_event_names.size() ? job_event_names[index] : "UNKNOWN";
}

}  // namespace docmig::integration
