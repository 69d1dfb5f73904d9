#include "tile_config/logging.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace tile_config {

namespace {
std::once_flag logger_once_flag;
std::shared_ptr<spdlog::logger> shared_logger;
constexpr char k_logger_name[] = "tile_config";
constexpr char k_log_file_name[] = "tile_config.log";
constexpr std::size_t k_max_file_size_bytes{10 * 1024 * 1024};
constexpr std::size_t k_max_files{5};

// %* writes the message payload as an escaped JSON string literal.
class JsonMessageFlag final : public spdlog::custom_flag_formatter {
  public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        const std::string payload(msg.payload.data(), msg.payload.size());
        const std::string escaped = nlohmann::json(payload).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        dest.append(escaped.data(), escaped.data() + escaped.size());
    }

    std::unique_ptr<spdlog::custom_flag_formatter> clone() const override {
        return std::make_unique<JsonMessageFlag>();
    }
};

spdlog::sink_ptr make_console_sink() {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%l] %v");
    return console_sink;
}

// One JSON object per line.
spdlog::sink_ptr make_file_sink(const std::filesystem::path& path_log_dir) {
    std::error_code error_directory;
    std::filesystem::create_directories(path_log_dir, error_directory);
    if (error_directory) {
        throw std::runtime_error("Unable to create log directory at " + path_log_dir.string());
    }

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (path_log_dir / k_log_file_name).string(),
        k_max_file_size_bytes,
        k_max_files
    );
    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<JsonMessageFlag>('*').set_pattern(R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","logger":"%n","msg":%*})");
    file_sink->set_formatter(std::move(formatter));
    return file_sink;
}
}  // namespace

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory) {
    std::call_once(logger_once_flag, [&log_directory]() {
        spdlog::sinks_init_list sinks{make_console_sink(), make_file_sink(log_directory)};
        auto logger = std::make_shared<spdlog::logger>(k_logger_name, sinks);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
        shared_logger = std::move(logger);
    });
    return shared_logger;
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (!shared_logger) {
        throw std::runtime_error("Logger not initialized");
    }
    return shared_logger;
}

void set_log_level(const std::string& str_level) {
    if (!shared_logger) {
        return;
    }
    // from_str maps unrecognized names to off; only an explicit "off" may silence the logger.
    const auto level = spdlog::level::from_str(str_level);
    if (level == spdlog::level::off && str_level != "off") {
        shared_logger->warn("Unknown log level {}; keeping {}", str_level, spdlog::level::to_string_view(shared_logger->level()));
        return;
    }
    shared_logger->set_level(level);
    shared_logger->debug("Log level set to {}", str_level);
}

std::shared_ptr<spdlog::logger> make_stderr_logger(const std::string& name) {
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    stderr_sink->set_pattern("%n %v");
    return std::make_shared<spdlog::logger>(name, stderr_sink);
}

}  // namespace tile_config
