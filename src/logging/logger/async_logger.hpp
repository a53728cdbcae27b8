#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include "configs/logging_config.hpp"
#include <atomic>
#include <condition_variable>
#include <fstream>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace BeanTrader {
namespace Logging {

// Thread tags are padded or cut to this width so columns line up
constexpr size_t LOG_TAG_WIDTH = 6;

/**
 * AsyncLogger - background writer for the application log.
 *
 * Producers enqueue fully formatted lines; a single worker thread writes them
 * to the console and the log file in arrival order. stop() drains whatever is
 * still queued before returning.
 */
class AsyncLogger {
public:
    explicit AsyncLogger(const std::string& log_file_path);
    ~AsyncLogger();

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    void start();
    void enqueue(const std::string& formatted_line);
    void stop();

    const std::string& get_file_path() const { return file_path; }

private:
    std::string file_path;
    std::ofstream log_file;

    std::mutex mtx;
    std::condition_variable cv;
    std::queue<std::string> queue;
    std::atomic<bool> running{false};
    std::thread worker_thread;

    std::mutex console_mutex;

    void process_logging_queue();
    void output_log_line_internal(const std::string& log_line);

    // Caller holds mtx
    void collect_all_available_messages_internal(std::vector<std::string>& message_buffer);
};

inline std::string fit_thread_tag(const std::string& tag_value) {
    std::string fitted_tag = tag_value.substr(0, LOG_TAG_WIDTH);
    fitted_tag.resize(LOG_TAG_WIDTH, ' ');
    return fitted_tag;
}

// Per-process logging state, installed on each thread that logs
struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;
    std::mutex console_mutex;
    std::atomic<bool> debug_enabled{false};
    std::string thread_tag = fit_thread_tag("MAIN");

    void set_thread_tag(const std::string& tag_value) { thread_tag = fit_thread_tag(tag_value); }
};

// Writes one line. Without an installed context the line goes straight to the console
// (and to log_file_path when one is given).
void log_message(const std::string& message, const std::string& log_file_path);

// No-ops unless the installed context has debug output enabled
void log_debug(const std::string& message);
bool is_debug_enabled();

void set_log_thread_tag(const std::string& thread_tag_value);

// logs/bean_trader.log -> logs/bean_trader_DD-HH-MM.log
std::string generate_timestamped_log_filename(const std::string& base_filename);

// Creates the log directory, starts the AsyncLogger and installs the context on the calling thread
std::shared_ptr<AsyncLogger> initialize_application_logging(LoggingContext& context, const Config::LoggingConfig& config);
void shutdown_application_logging(LoggingContext& context);

// get_logging_context throws std::runtime_error when none is installed on the calling thread
LoggingContext* get_logging_context();
void set_logging_context(LoggingContext& context);
void clear_logging_context();

} // namespace Logging
} // namespace BeanTrader

#endif // ASYNC_LOGGER_HPP
