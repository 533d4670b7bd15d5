#pragma once

#include "../providers/ILogger.hpp"
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace conductor {
namespace logging {

/**
 * @brief ILogger backed by an spdlog logger
 *
 * Records render as `event {"field":...}`. Bound fields are merged under the
 * call-site fields.
 *
 * @threadsafety Safe when the underlying spdlog logger is a `_mt` logger.
 */
class SpdlogLogger : public providers::ILogger {
public:
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger, Value bound = Value::object())
        : logger_(std::move(logger))
        , bound_(std::move(bound))
    {}

    /**
     * @brief Logger writing to a colored stderr sink
     *
     * Reuses the spdlog registry entry when one with the same name exists.
     */
    static std::shared_ptr<SpdlogLogger> create(
        const std::string& name = "conductor",
        spdlog::level::level_enum level = spdlog::level::info
    ) {
        auto logger = spdlog::get(name);
        if (!logger) {
            logger = spdlog::stderr_color_mt(name);
        }
        logger->set_level(level);
        return std::make_shared<SpdlogLogger>(std::move(logger));
    }

    void debug(const std::string& event, const Value& fields) override {
        write(spdlog::level::debug, event, fields);
    }

    void info(const std::string& event, const Value& fields) override {
        write(spdlog::level::info, event, fields);
    }

    void warn(const std::string& event, const Value& fields) override {
        write(spdlog::level::warn, event, fields);
    }

    void error(const std::string& event, const Value& fields) override {
        write(spdlog::level::err, event, fields);
    }

    std::shared_ptr<providers::ILogger> bind(const Value& fields) override {
        return std::make_shared<SpdlogLogger>(logger_, providers::merge_fields(bound_, fields));
    }

    const std::shared_ptr<spdlog::logger>& underlying() const { return logger_; }

private:
    void write(spdlog::level::level_enum level, const std::string& event, const Value& fields) {
        if (!logger_->should_log(level)) {
            return;
        }
        const Value merged = providers::merge_fields(bound_, fields);
        if (merged.empty()) {
            logger_->log(level, "{}", event);
        } else {
            logger_->log(level, "{} {}", event, merged.dump());
        }
    }

    std::shared_ptr<spdlog::logger> logger_;
    Value bound_;
};

} // namespace logging
} // namespace conductor
