#include <flow_log/logger.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <mutex>

namespace flow_log {

namespace {

const char* logger_name = "flowguard";
const char* log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> shared_logger;

std::shared_ptr<spdlog::logger> make_stderr_logger() {
    auto existing = spdlog::get(logger_name);
    if (existing) return existing;
    return spdlog::stderr_color_mt(logger_name);
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (shared_logger) return shared_logger;

    try {
        shared_logger = make_stderr_logger();
        shared_logger->set_pattern(log_pattern);
        shared_logger->set_level(spdlog::level::info);
    } catch (const spdlog::spdlog_ex&) {
        shared_logger = spdlog::default_logger();
    }
    return shared_logger;
}

void configure_logging(const std::string& level, const std::string& log_file) {
    std::lock_guard<std::mutex> lock(logger_mutex);
    spdlog::drop(logger_name);

    try {
        if (log_file.empty()) {
            shared_logger = spdlog::stderr_color_mt(logger_name);
        } else {
            const std::filesystem::path path(log_file);
            if (path.has_parent_path())
                std::filesystem::create_directories(path.parent_path());
            shared_logger = spdlog::basic_logger_mt(logger_name, path.string(), true);
            shared_logger->flush_on(spdlog::level::info);
        }
    } catch (const spdlog::spdlog_ex&) {
        shared_logger = spdlog::default_logger();
    } catch (const std::filesystem::filesystem_error&) {
        shared_logger = spdlog::default_logger();
    }

    shared_logger->set_pattern(log_pattern);
    // from_str maps unknown names to "off"; treat those as info.
    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") lvl = spdlog::level::info;
    shared_logger->set_level(lvl);
    shared_logger->info("Logger initialized. level={} sink={}", spdlog::level::to_string_view(lvl),
        log_file.empty() ? std::string("stderr") : log_file);
}

} // namespace flow_log
