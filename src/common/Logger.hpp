#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/cfg/env.h>

#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

struct LoggerConfig {
    spdlog::level::level_enum level = spdlog::level::info;

    // Пустой путь — только консоль
    std::string file_path;
    size_t max_file_size = 1024 * 1024 * 5;
    size_t max_files = 3;

    // Очередь и число потоков для фоновой записи
    size_t queue_size = 8192;
    size_t worker_threads = 1;

    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

class Logger {
public:
    static constexpr const char *NAME = "chunkbuf";

    static std::shared_ptr<spdlog::logger> get() {
        static std::shared_ptr<spdlog::logger> logger = create_logger();
        return logger;
    }

    // Вызывать до первого get(), иначе игнорируется
    static void configure(const LoggerConfig &cfg) {
        if (created()) {
            get()->warn("[Logger] configure() called after logger creation, ignored");
            return;
        }
        config() = cfg;
    }

    static const LoggerConfig &current_config() { return config(); }

    static void init_thread_pool() {
        const auto &cfg = config();
        spdlog::init_thread_pool(cfg.queue_size, cfg.worker_threads);
    }

    static void shutdown() {
        if (created()) {
            get()->flush();
        }
        spdlog::shutdown();
    }

private:
    static LoggerConfig &config() {
        static LoggerConfig cfg;
        return cfg;
    }

    static std::atomic<bool> &created() {
        static std::atomic<bool> flag{false};
        return flag;
    }

    static std::shared_ptr<spdlog::logger> create_logger() {
        try {
            const auto &cfg = config();

            if (!spdlog::thread_pool()) {
                init_thread_pool();
            }

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(spdlog::level::trace);

            std::vector<spdlog::sink_ptr> sinks{console_sink};

            if (!cfg.file_path.empty()) {
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                        cfg.file_path, cfg.max_file_size, cfg.max_files);
                file_sink->set_level(spdlog::level::trace);
                sinks.push_back(file_sink);
            }

            auto logger = std::make_shared<spdlog::async_logger>(
                    NAME,
                    sinks.begin(),
                    sinks.end(),
                    spdlog::thread_pool(),
                    spdlog::async_overflow_policy::block
            );

            logger->set_level(cfg.level);
            logger->set_pattern(cfg.pattern);

            spdlog::register_logger(logger);

            // SPDLOG_LEVEL=debug / SPDLOG_LEVEL=chunkbuf=trace
            spdlog::cfg::load_env_levels();

            created().store(true);

            return logger;

        } catch (const spdlog::spdlog_ex &ex) {
            std::cerr << "Logger init failed: " << ex.what() << std::endl;
            throw;
        }
    }
};
