#include "async_logger.hpp"
#include "configs/config_loader.hpp"
#include "utils/time_utils.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <filesystem>

namespace QuantSignal {
namespace Logging {

thread_local LoggingContext* thread_local_logging_context_pointer = nullptr;

namespace {

void log_message_to_stderr(const std::string& error_message) {
    std::cerr << error_message << std::endl;
}

std::string extract_base_filename(const std::string& full_path) {
    size_t last_slash = full_path.find_last_of('/');
    if (last_slash != std::string::npos) {
        return full_path.substr(last_slash + 1);
    }
    return full_path;
}

std::string format_log_line(const std::string& thread_tag_string, const std::string& message) {
    std::string timestamp_string;
    try {
        timestamp_string = TimeUtils::get_current_human_readable_time();
    } catch (const std::exception& time_exception_error) {
        log_message_to_stderr("ERROR: TimeUtils failed: " + std::string(time_exception_error.what()));
        timestamp_string = "ERROR-TIME";
    }
    std::stringstream log_stream;
    log_stream << timestamp_string << " [" << thread_tag_string << "]   " << message << std::endl;
    return log_stream.str();
}

} // anonymous namespace

LoggingContext* get_logging_context() {
    LoggingContext* thread_logging_context_ptr = thread_local_logging_context_pointer;
    if (!thread_logging_context_ptr) {
        throw std::runtime_error("Logging context not initialized for current thread");
    }
    return thread_logging_context_ptr;
}

bool has_logging_context() {
    return thread_local_logging_context_pointer != nullptr;
}

void set_logging_context(LoggingContext& context) {
    thread_local_logging_context_pointer = &context;
}

void clear_logging_context() {
    thread_local_logging_context_pointer = nullptr;
}

void set_log_thread_tag(const std::string& thread_tag_value) {
    LoggingContext* thread_logging_context_ptr = get_logging_context();
    thread_logging_context_ptr->set_thread_tag(thread_tag_value);
}

void log_message(const std::string& message, const std::string& log_file_path) {
    LoggingContext* thread_logging_context_ptr = thread_local_logging_context_pointer;
    if (!thread_logging_context_ptr) {
        std::cerr << format_log_line("------", message) << std::flush;
        return;
    }

    try {
        std::string log_formatted_string = format_log_line(thread_logging_context_ptr->get_thread_tag(), message);

        if (thread_logging_context_ptr->async_logger) {
            try {
                thread_logging_context_ptr->async_logger->enqueue(log_formatted_string);
                return;
            } catch (const std::exception& logger_exception_error) {
                log_message_to_stderr("ERROR: Async logger enqueue failed: " + std::string(logger_exception_error.what()));
            }
        }

        if (thread_logging_context_ptr->console_output_enabled.load()) {
            std::lock_guard<std::mutex> console_guard(thread_logging_context_ptr->console_mutex);
            std::clog << log_formatted_string << std::flush;
        }

        if (!log_file_path.empty()) {
            std::ofstream log_file_stream(log_file_path, std::ios::app);
            if (log_file_stream.is_open()) {
                log_file_stream << log_formatted_string;
            } else {
                log_message_to_stderr("ERROR: Failed to open log file: " + log_file_path);
            }
        }
    } catch (const std::exception& critical_exception_error) {
        log_message_to_stderr("CRITICAL ERROR: Logging system failure: " + std::string(critical_exception_error.what()));
        std::cerr << message << std::endl;
    }
}

std::string create_unique_run_folder(const std::string& run_folder_root) {
    std::time_t now = std::time(nullptr);
    std::tm local_tm_buf;
    localtime_r(&now, &local_tm_buf);

    // Create unique run folder: <root>/run_DD-HH-MM
    std::stringstream ss;
    ss << run_folder_root << "/run_" << std::put_time(&local_tm_buf, TimeUtils::LOG_FILENAME);

    std::string run_folder = ss.str();

    try {
        std::filesystem::create_directories(run_folder);
    } catch (const std::exception& filesystem_exception_error) {
        log_message(std::string("CRITICAL ERROR: Failed to create run folder: ") + filesystem_exception_error.what(), "");
        throw std::runtime_error("Failed to create run folder: " + run_folder);
    }

    return run_folder;
}

std::string generate_timestamped_log_filename(const std::string& base_filename) {
    std::time_t now = std::time(nullptr);
    std::tm local_tm_buf;
    localtime_r(&now, &local_tm_buf);

    std::string base_name = base_filename;
    std::string extension = "";

    size_t dot_pos = base_filename.find_last_of('.');
    size_t slash_pos = base_filename.find_last_of('/');
    if (dot_pos != std::string::npos && (slash_pos == std::string::npos || dot_pos > slash_pos)) {
        base_name = base_filename.substr(0, dot_pos);
        extension = base_filename.substr(dot_pos);
    }

    // base_name_DD-HH-MM.extension
    std::stringstream ss;
    ss << base_name << "_" << std::put_time(&local_tm_buf, TimeUtils::LOG_FILENAME) << extension;
    return ss.str();
}

void shutdown_global_logger(AsyncLogger& logger) {
    logger.stop();
}

std::shared_ptr<AsyncLogger> initialize_application_foundation(const QuantSignal::Config::SystemConfig& config) {
    LoggingContext* thread_logging_context_ptr = get_logging_context();

    std::string configuration_error_message;
    if (!validate_config(config, configuration_error_message)) {
        log_message_to_stderr("ERROR: Config error: " + configuration_error_message);
        throw std::runtime_error("Configuration validation failed: " + configuration_error_message);
    }

    thread_logging_context_ptr->console_output_enabled.store(config.logging.enable_console_output);

    std::string timestamped_log_filename;
    if (config.logging.enable_file_output) {
        thread_logging_context_ptr->run_folder = create_unique_run_folder(config.logging.run_folder_root);
        std::string base_filename_string = thread_logging_context_ptr->run_folder + "/" + extract_base_filename(config.logging.log_file);
        timestamped_log_filename = generate_timestamped_log_filename(base_filename_string);
    }

    auto logger_instance = std::make_shared<AsyncLogger>(timestamped_log_filename, config.logging.enable_console_output,
                                                         config.logging.log_poll_interval_milliseconds);
    logger_instance->start();

    thread_logging_context_ptr->async_logger = logger_instance;
    set_log_thread_tag("MAIN  ");

    return logger_instance;
}

// AsyncLogger implementation
AsyncLogger::~AsyncLogger() {
    stop();
}

void AsyncLogger::start() {
    if (running.load()) {
        return;
    }
    running.store(true);
    writer_thread = std::thread(&AsyncLogger::writer_loop, this);
}

void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        running.store(false);
    }
    cv.notify_all();
    if (writer_thread.joinable()) {
        writer_thread.join();
    }
}

void AsyncLogger::enqueue(const std::string& formatted_line) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        queue.push(formatted_line);
    }
    cv.notify_one();
}

void AsyncLogger::writer_loop() {
    std::ofstream log_file;
    if (!file_path.empty()) {
        log_file.open(file_path, std::ios::app);
        if (!log_file.is_open()) {
            log_message_to_stderr("ERROR: Failed to open log file: " + file_path);
        }
    }

    while (running.load()) {
        process_logging_queue_with_timeout(log_file);
    }

    // Drain whatever arrived before stop()
    std::vector<std::string> message_buffer;
    collect_all_available_messages(message_buffer);
    write_buffered_messages_to_log(message_buffer, log_file);
}

void AsyncLogger::collect_all_available_messages(std::vector<std::string>& message_buffer) {
    std::unique_lock<std::mutex> lock(mtx);
    while (!queue.empty()) {
        message_buffer.push_back(std::move(queue.front()));
        queue.pop();
    }
}

// Console lines go to stderr; stdout is reserved for the analysis result
void AsyncLogger::output_log_line_internal(const std::string& log_line, std::ofstream& log_file) {
    if (console_output_enabled) {
        std::lock_guard<std::mutex> cguard(console_mutex);
        std::clog << log_line << std::flush;
    }

    if (log_file.is_open()) {
        log_file << log_line;
        log_file.flush();
    }
}

void AsyncLogger::write_buffered_messages_to_log(const std::vector<std::string>& message_buffer, std::ofstream& log_file) {
    for (const auto& log_line : message_buffer) {
        output_log_line_internal(log_line, log_file);
    }
}

void AsyncLogger::process_logging_queue_with_timeout(std::ofstream& log_file) {
    std::unique_lock<std::mutex> lock(mtx);

    // Wake periodically so a stop request is noticed even without new messages
    auto timeout_duration = std::chrono::milliseconds(poll_interval_milliseconds);
    cv.wait_for(lock, timeout_duration, [&]{ return !queue.empty() || !running.load(); });

    while (!queue.empty()) {
        std::string line = std::move(queue.front());
        queue.pop();
        lock.unlock();

        output_log_line_internal(line, log_file);

        lock.lock();
    }
}

} // namespace Logging
} // namespace QuantSignal
