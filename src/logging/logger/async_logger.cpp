#include "async_logger.hpp"
#include "utils/time_utils.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace BeanTrader {
namespace Logging {

namespace {

thread_local LoggingContext* current_logging_context = nullptr;

const char* const DEFAULT_THREAD_TAG = "MAIN  ";

void report_logging_failure(const std::string& failure_description) {
    std::cerr << "[logging] " << failure_description << std::endl;
}

std::string build_log_line(const std::string& message, const std::string& thread_tag) {
    std::string line_timestamp;
    try {
        line_timestamp = TimeUtils::get_current_human_readable_time();
    } catch (const std::exception& clock_error) {
        report_logging_failure("timestamp unavailable: " + std::string(clock_error.what()));
        line_timestamp = "????-??-?? ??:??:??";
    }
    return line_timestamp + " [" + thread_tag + "]   " + message + "\n";
}

// Console plus optional side file, bypassing the async queue
void write_line_synchronously(const std::string& log_line, const std::string& side_file_path) {
    std::cout << log_line << std::flush;
    if (side_file_path.empty()) {
        return;
    }
    std::ofstream side_file(side_file_path, std::ios::app);
    if (!side_file) {
        report_logging_failure("cannot append to " + side_file_path);
        return;
    }
    side_file << log_line;
}

} // namespace

LoggingContext* get_logging_context() {
    if (current_logging_context == nullptr) {
        throw std::runtime_error("No logging context installed on this thread");
    }
    return current_logging_context;
}

void set_logging_context(LoggingContext& context) {
    current_logging_context = &context;
}

void clear_logging_context() {
    current_logging_context = nullptr;
}

void set_log_thread_tag(const std::string& thread_tag_value) {
    get_logging_context()->set_thread_tag(thread_tag_value);
}

void log_message(const std::string& message, const std::string& log_file_path) {
    LoggingContext* context = current_logging_context;
    if (context == nullptr) {
        write_line_synchronously(build_log_line(message, DEFAULT_THREAD_TAG), log_file_path);
        return;
    }

    const std::string log_line = build_log_line(message, context->thread_tag);
    if (context->async_logger) {
        try {
            context->async_logger->enqueue(log_line);
            return;
        } catch (const std::exception& enqueue_error) {
            report_logging_failure("async enqueue failed: " + std::string(enqueue_error.what()));
        }
    }

    std::lock_guard<std::mutex> console_lock(context->console_mutex);
    write_line_synchronously(log_line, log_file_path);
}

bool is_debug_enabled() {
    return current_logging_context != nullptr && current_logging_context->debug_enabled.load();
}

void log_debug(const std::string& message) {
    if (is_debug_enabled()) {
        log_message("[debug] " + message, "");
    }
}

std::string generate_timestamped_log_filename(const std::string& base_filename) {
    std::time_t now_seconds = std::time(nullptr);
    std::tm local_time{};
    localtime_r(&now_seconds, &local_time);

    std::ostringstream stamp;
    stamp << std::put_time(&local_time, TimeUtils::LOG_FILENAME);

    // logs/bean_trader.log -> logs/bean_trader_DD-HH-MM.log
    std::filesystem::path log_path(base_filename);
    std::filesystem::path stamped_name = log_path.stem();
    stamped_name += "_" + stamp.str();
    stamped_name += log_path.extension();
    return (log_path.parent_path() / stamped_name).string();
}

std::shared_ptr<AsyncLogger> initialize_application_logging(LoggingContext& context, const Config::LoggingConfig& config) {
    const std::string log_file_path = generate_timestamped_log_filename(config.log_file);

    const std::filesystem::path log_directory = std::filesystem::path(log_file_path).parent_path();
    if (!log_directory.empty()) {
        std::error_code directory_error;
        std::filesystem::create_directories(log_directory, directory_error);
        if (directory_error) {
            throw std::runtime_error("Failed to create log directory " + log_directory.string() + ": " +
                                     directory_error.message());
        }
    }

    std::shared_ptr<AsyncLogger> application_logger = std::make_shared<AsyncLogger>(log_file_path);
    application_logger->start();

    context.async_logger = application_logger;
    context.debug_enabled.store(config.debug_mode);
    set_logging_context(context);
    set_log_thread_tag(DEFAULT_THREAD_TAG);

    return application_logger;
}

void shutdown_application_logging(LoggingContext& context) {
    if (!context.async_logger) {
        return;
    }
    context.async_logger->stop();
    context.async_logger.reset();
}

AsyncLogger::AsyncLogger(const std::string& log_file_path) : file_path(log_file_path) {
    log_file.open(file_path, std::ios::out | std::ios::app);
    if (!log_file.is_open()) {
        throw std::runtime_error("Failed to open log file: " + file_path);
    }
}

AsyncLogger::~AsyncLogger() {
    stop();
}

void AsyncLogger::start() {
    if (running.exchange(true)) {
        return;
    }
    worker_thread = std::thread(&AsyncLogger::process_logging_queue, this);
}

void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> queue_lock(mtx);
        running.store(false);
    }
    cv.notify_all();
    if (worker_thread.joinable()) {
        worker_thread.join();
    }

    // Whatever arrived after the worker's last pass
    std::vector<std::string> leftover_lines;
    {
        std::lock_guard<std::mutex> queue_lock(mtx);
        collect_all_available_messages_internal(leftover_lines);
    }
    for (const std::string& leftover_line : leftover_lines) {
        output_log_line_internal(leftover_line);
    }
}

void AsyncLogger::enqueue(const std::string& formatted_line) {
    {
        std::lock_guard<std::mutex> queue_lock(mtx);
        queue.push(formatted_line);
    }
    cv.notify_one();
}

void AsyncLogger::collect_all_available_messages_internal(std::vector<std::string>& message_buffer) {
    for (; !queue.empty(); queue.pop()) {
        message_buffer.push_back(std::move(queue.front()));
    }
}

void AsyncLogger::output_log_line_internal(const std::string& log_line) {
    {
        std::lock_guard<std::mutex> console_lock(console_mutex);
        std::cout << log_line << std::flush;
    }
    if (log_file.is_open()) {
        log_file << log_line << std::flush;
    }
}

void AsyncLogger::process_logging_queue() {
    std::vector<std::string> pending_lines;
    for (;;) {
        {
            std::unique_lock<std::mutex> queue_lock(mtx);
            cv.wait(queue_lock, [this] { return !queue.empty() || !running.load(); });
            if (queue.empty() && !running.load()) {
                return;
            }
            collect_all_available_messages_internal(pending_lines);
        }

        // Written outside the lock so producers never wait on I/O
        for (const std::string& pending_line : pending_lines) {
            output_log_line_internal(pending_line);
        }
        pending_lines.clear();
    }
}

} // namespace Logging
} // namespace BeanTrader
