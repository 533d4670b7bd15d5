#pragma once

#include "../types.hpp"
#include <memory>
#include <string>

namespace conductor {
namespace providers {

/**
 * @brief Leveled structured logger
 *
 * Every record is an event name plus a JSON object of fields. bind() returns
 * a child logger whose fields are merged into every record it writes.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void debug(const std::string& event, const Value& fields = Value::object()) = 0;
    virtual void info(const std::string& event, const Value& fields = Value::object()) = 0;
    virtual void warn(const std::string& event, const Value& fields = Value::object()) = 0;
    virtual void error(const std::string& event, const Value& fields = Value::object()) = 0;

    virtual std::shared_ptr<ILogger> bind(const Value& fields) = 0;
};

/** @brief Logger that discards everything. */
class NullLogger : public ILogger {
public:
    void debug(const std::string&, const Value&) override {}
    void info(const std::string&, const Value&) override {}
    void warn(const std::string&, const Value&) override {}
    void error(const std::string&, const Value&) override {}

    std::shared_ptr<ILogger> bind(const Value&) override {
        return std::make_shared<NullLogger>();
    }
};

/**
 * @brief Merges two field objects; entries in `extra` win.
 */
inline Value merge_fields(const Value& base, const Value& extra) {
    Value merged = base.is_object() ? base : Value::object();
    if (extra.is_object()) {
        for (auto it = extra.begin(); it != extra.end(); ++it) {
            merged[it.key()] = it.value();
        }
    }
    return merged;
}

} // namespace providers
} // namespace conductor
