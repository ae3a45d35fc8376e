#include "unclobber/Logging.hpp"
#include "unclobber/Errors.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <ctime>
#include <memory>
#include <vector>

namespace unclobber {

std::filesystem::path setup_logging(const std::filesystem::path& log_root,
                                    const std::string& name, bool verbose) {
    std::time_t now = std::time(nullptr);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &local);

    std::filesystem::path run_dir = log_root / (name + "-" + stamp);
    std::error_code ec;
    std::filesystem::create_directories(run_dir, ec);
    if (ec) {
        throw IoError(run_dir.string(), "Cannot create log directory (" + ec.message() + ")");
    }
    std::filesystem::path log_file = run_dir / "out.log";

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(verbose ? spdlog::level::debug : spdlog::level::info);

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), true);
    file_sink->set_level(spdlog::level::debug);

    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::info);

    spdlog::info("Logging to {}", log_file.string());
    return run_dir;
}

} // namespace unclobber
