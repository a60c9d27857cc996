#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace lw::log {

void Registry::init(const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[log::Registry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = logDir;
    main_log_path_  = log_dir_ / "lockwright.log";
    audit_log_path_ = log_dir_ / "audit.log";

    namespace fs = std::filesystem;
    if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

    const auto& cnf = config::ConfigRegistry::get().logging;

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cnf.levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, main_file_sink_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("lockwright", sub_levels.lockwright);
    makeLogger("locks",      sub_levels.locks);
    makeLogger("db",         sub_levels.db);
    makeLogger("http",       sub_levels.http);

    // audit: file-only sink (append)
    {
        audit_file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            audit_log_path_.string(), /*truncate=*/false);
        std::vector<spdlog::sink_ptr> sinks = { audit_file_sink_ };
        const auto logger = std::make_shared<spdlog::logger>("audit", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
    spdlog::get("lockwright")->debug("[log::Registry] Initialized in {}", log_dir_.string());
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[log::Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[log::Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

void Registry::replaceSinkEverywhere_(
    const std::shared_ptr<spdlog::sinks::sink>& old_sink,
    const std::shared_ptr<spdlog::sinks::sink>& new_sink)
{
    spdlog::apply_all([&](const std::shared_ptr<spdlog::logger>& lg) {
        auto sinks_copy = lg->sinks();
        bool touched = false;
        for (auto& s : sinks_copy) {
            if (s.get() == old_sink.get()) {
                s = new_sink;
                touched = true;
            }
        }
        if (touched) {
            lg->flush();
            lg->sinks() = std::move(sinks_copy);
        }
    });
}

void Registry::reopenMainLog() {
    if (!initialized_) return;

    auto fresh = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);

    fresh->set_level(main_file_sink_->level());
    fresh->set_pattern(LOG_FORMAT);

    replaceSinkEverywhere_(main_file_sink_, fresh);
    main_file_sink_ = std::move(fresh);
}

}
