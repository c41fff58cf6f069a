#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace tally::log {

class Registry {
public:
    // Builds every subsystem logger from ConfigRegistry::get().logging.
    // An empty log_dir keeps output on the console only.
    static void init();

    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> tally()  { return get("tally"); }
    static std::shared_ptr<spdlog::logger> sync()   { return get("sync"); }
    static std::shared_ptr<spdlog::logger> ledger() { return get("ledger"); }
    static std::shared_ptr<spdlog::logger> db()     { return get("db"); }
    static std::shared_ptr<spdlog::logger> http()   { return get("http"); }
    static std::shared_ptr<spdlog::logger> auth()   { return get("auth"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
