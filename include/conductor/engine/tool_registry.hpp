#pragma once

#include "../types.hpp"
#include "../cancellation.hpp"
#include "../providers/IToolExecutor.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <vector>

namespace conductor {
namespace engine {

/** @brief Callable executing one tool; receives validated JSON arguments. */
using ToolHandler = std::function<Expected<Value>(const Value&)>;

namespace detail {

template<typename T>
struct schema_type;

template<> struct schema_type<int> { static constexpr const char* name = "integer"; };
template<> struct schema_type<int64_t> { static constexpr const char* name = "integer"; };
template<> struct schema_type<float> { static constexpr const char* name = "number"; };
template<> struct schema_type<double> { static constexpr const char* name = "number"; };
template<> struct schema_type<bool> { static constexpr const char* name = "boolean"; };
template<> struct schema_type<std::string> { static constexpr const char* name = "string"; };

template<typename T>
struct callable_signature : callable_signature<decltype(&T::operator())> {};

template<typename R, typename... Args>
struct callable_signature<R(*)(Args...)> {
    using args = std::tuple<std::decay_t<Args>...>;
    static constexpr size_t arity = sizeof...(Args);
};

template<typename C, typename R, typename... Args>
struct callable_signature<R(C::*)(Args...) const> {
    using args = std::tuple<std::decay_t<Args>...>;
    static constexpr size_t arity = sizeof...(Args);
};

template<typename C, typename R, typename... Args>
struct callable_signature<R(C::*)(Args...)> {
    using args = std::tuple<std::decay_t<Args>...>;
    static constexpr size_t arity = sizeof...(Args);
};

template<typename R, typename... Args>
struct callable_signature<std::function<R(Args...)>> {
    using args = std::tuple<std::decay_t<Args>...>;
    static constexpr size_t arity = sizeof...(Args);
};

template<typename Args, size_t... Is>
Value object_schema(const std::vector<std::string>& names, std::index_sequence<Is...>) {
    Value properties = Value::object();
    Value required = Value::array();
    ((properties[names[Is]] = Value{{"type", schema_type<std::tuple_element_t<Is, Args>>::name}},
      required.push_back(names[Is])), ...);
    return Value{{"type", "object"}, {"properties", properties}, {"required", required}};
}

template<typename Func, typename Args, size_t... Is>
auto call_with_args(const Func& func, const Value& args, const std::vector<std::string>& names,
                    std::index_sequence<Is...>) {
    return func(args.at(names[Is]).template get<std::tuple_element_t<Is, Args>>()...);
}

// A tool returning a JSON object passes it through; anything else is wrapped.
template<typename T>
Value to_tool_result(T&& value) {
    Value j = std::forward<T>(value);
    if (j.is_object()) return j;
    return Value{{"result", std::move(j)}};
}

} // namespace detail

/** @brief Metadata and handler for a single registered tool. */
struct ToolEntry {
    std::string name;
    std::string description;
    Value parameters_schema;   ///< JSON Schema object for the arguments
    ToolHandler handler;
};

// ============================================================================
// ToolRegistry
// ============================================================================

/**
 * @brief In-process tool executor with schema-checked invocation.
 *
 * Tools are registered either from a typed callable, whose parameter types
 * produce the JSON schema, or with an explicit schema and raw handler.
 * execute() validates arguments against the schema before calling the
 * handler and converts handler exceptions into ToolExecutionFailed.
 *
 * @threadsafety All public methods are thread-safe. Lookups take a shared
 * lock; registration takes an exclusive lock.
 */
class ToolRegistry : public providers::IToolExecutor {
public:
    /**
     * @brief Register a typed callable.
     *
     * @param name Tool name
     * @param description Tool description
     * @param param_names Argument names, one per callable parameter
     * @param func Callable; its return value must convert to JSON
     * @throws std::invalid_argument if the name count does not match the arity
     */
    template<typename Func>
    void register_tool(const std::string& name, const std::string& description,
                       const std::vector<std::string>& param_names, Func func) {
        using signature = detail::callable_signature<Func>;
        using args = typename signature::args;
        constexpr size_t arity = signature::arity;

        if (param_names.size() != arity) {
            throw std::invalid_argument(
                "Tool '" + name + "' declares " + std::to_string(param_names.size()) +
                " parameter names for a callable of arity " + std::to_string(arity));
        }

        Value schema = detail::object_schema<args>(param_names, std::make_index_sequence<arity>{});

        ToolHandler handler = [f = std::move(func), names = param_names](const Value& call_args) -> Expected<Value> {
            return detail::to_tool_result(
                detail::call_with_args<Func, args>(f, call_args, names, std::make_index_sequence<arity>{}));
        };

        register_tool(name, description, std::move(schema), std::move(handler));
    }

    /** @brief Register a handler with an explicit parameters schema. Replaces any existing entry. */
    void register_tool(const std::string& name, const std::string& description,
                       Value schema, ToolHandler handler) {
        std::unique_lock lock(mutex_);
        tools_.insert_or_assign(name, ToolEntry{name, description, std::move(schema), std::move(handler)});
    }

    bool has_tool(const std::string& name) const {
        std::shared_lock lock(mutex_);
        return tools_.find(name) != tools_.end();
    }

    std::vector<std::string> tool_names() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> names;
        names.reserve(tools_.size());
        for (const auto& [name, entry] : tools_) {
            names.push_back(name);
        }
        return names;
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return tools_.size();
    }

    /** @brief Parameters schema of a tool, or null if unknown. */
    Value parameters_schema(const std::string& name) const {
        std::shared_lock lock(mutex_);
        auto it = tools_.find(name);
        return it == tools_.end() ? Value(nullptr) : it->second.parameters_schema;
    }

    /**
     * @brief Validate arguments against a parameters schema.
     *
     * Checks that arguments form an object, every required field is present,
     * and every provided field with a declared type has that type.
     *
     * @return Empty string if valid, otherwise a description of the problem
     */
    static std::string validate_args(const Value& schema, const Value& args) {
        if (!args.is_object()) {
            return std::string("Arguments must be an object, got ") + type_name(args);
        }
        if (auto req = schema.find("required"); req != schema.end() && req->is_array()) {
            for (const auto& field : *req) {
                if (field.is_string() && !args.contains(field.get_ref<const std::string&>())) {
                    return "Missing required argument: " + field.get<std::string>();
                }
            }
        }
        if (auto props = schema.find("properties"); props != schema.end() && props->is_object()) {
            for (auto it = props->begin(); it != props->end(); ++it) {
                auto arg = args.find(it.key());
                auto type = it.value().find("type");
                if (arg == args.end() || type == it.value().end() || !type->is_string()) {
                    continue;
                }
                const auto& expected = type->get_ref<const std::string&>();
                if (!type_matches(*arg, expected)) {
                    return "Argument '" + it.key() + "' has wrong type: expected " + expected +
                           ", got " + type_name(*arg);
                }
            }
        }
        return "";
    }

    /**
     * @brief Validate and invoke a tool.
     *
     * @return Tool result, or ToolNotFound / InvalidToolArguments /
     *         ToolExecutionFailed / cancellation errors
     */
    Expected<Value> execute(const std::string& tool_name, const Value& params,
                            const CancellationToken& cancel) override {
        if (auto stop = cancel.check()) {
            return tl::unexpected(*stop);
        }

        ToolHandler handler;
        Value schema;
        {
            std::shared_lock lock(mutex_);
            auto it = tools_.find(tool_name);
            if (it == tools_.end()) {
                return tl::unexpected(Error{ErrorCode::ToolNotFound, "Tool not found: " + tool_name, tool_name});
            }
            handler = it->second.handler;
            schema = it->second.parameters_schema;
        }

        const Value args = params.is_null() ? Value::object() : params;
        if (auto problem = validate_args(schema, args); !problem.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidToolArguments, problem, tool_name});
        }

        try {
            return handler(args);
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{
                ErrorCode::ToolExecutionFailed,
                std::string("JSON argument error: ") + e.what(),
                tool_name
            });
        } catch (const std::exception& e) {
            return tl::unexpected(Error{
                ErrorCode::ToolExecutionFailed,
                std::string("Tool execution failed: ") + e.what(),
                tool_name
            });
        }
    }

private:
    static bool type_matches(const Value& val, std::string_view expected) {
        if (expected == "integer") return val.is_number_integer();
        if (expected == "number") return val.is_number();
        if (expected == "string") return val.is_string();
        if (expected == "boolean") return val.is_boolean();
        if (expected == "object") return val.is_object();
        if (expected == "array") return val.is_array();
        return true;
    }

    static const char* type_name(const Value& val) {
        if (val.is_null()) return "null";
        if (val.is_boolean()) return "boolean";
        if (val.is_number_integer()) return "integer";
        if (val.is_number_float()) return "number";
        if (val.is_string()) return "string";
        if (val.is_array()) return "array";
        if (val.is_object()) return "object";
        return "unknown";
    }

    std::map<std::string, ToolEntry> tools_;
    mutable std::shared_mutex mutex_;
};

} // namespace engine
} // namespace conductor
