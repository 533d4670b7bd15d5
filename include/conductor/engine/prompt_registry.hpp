#pragma once

#include "../types.hpp"
#include "../providers/IPromptRegistry.hpp"
#include <map>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <string>

namespace conductor {
namespace engine {

/**
 * @brief Prompt registry rendering `{{name}}` placeholders from the context.
 *
 * String values are inserted verbatim; any other value is inserted as
 * compact JSON. Placeholders naming a missing key render as empty text.
 * An unterminated `{{` is copied through unchanged.
 *
 * @threadsafety register_prompt() may run concurrently with get().
 */
class TemplatePromptRegistry : public providers::IPromptRegistry {
public:
    TemplatePromptRegistry() = default;

    explicit TemplatePromptRegistry(std::map<std::string, std::string> templates)
        : templates_(std::move(templates))
    {}

    void register_prompt(const std::string& key, std::string tmpl) {
        std::unique_lock lock(mutex_);
        templates_.insert_or_assign(key, std::move(tmpl));
    }

    bool has_prompt(const std::string& key) const {
        std::shared_lock lock(mutex_);
        return templates_.count(key) > 0;
    }

    Expected<std::string> get(const std::string& key, const Value& context) const override {
        std::string tmpl;
        {
            std::shared_lock lock(mutex_);
            auto it = templates_.find(key);
            if (it == templates_.end()) {
                return tl::unexpected(Error{ErrorCode::PromptNotFound, "Prompt not found: " + key, key});
            }
            tmpl = it->second;
        }
        return render(tmpl, context);
    }

    static std::string render(const std::string& tmpl, const Value& context) {
        std::ostringstream out;
        size_t pos = 0;
        while (pos < tmpl.size()) {
            auto open = tmpl.find("{{", pos);
            if (open == std::string::npos) {
                out << tmpl.substr(pos);
                break;
            }
            auto close = tmpl.find("}}", open + 2);
            if (close == std::string::npos) {
                out << tmpl.substr(pos);
                break;
            }
            out << tmpl.substr(pos, open - pos);
            out << lookup(context, trim(tmpl.substr(open + 2, close - open - 2)));
            pos = close + 2;
        }
        return out.str();
    }

private:
    static std::string lookup(const Value& context, const std::string& name) {
        if (!context.is_object()) return "";
        auto it = context.find(name);
        if (it == context.end() || it->is_null()) return "";
        if (it->is_string()) return it->get<std::string>();
        return it->dump();
    }

    static std::string trim(const std::string& s) {
        const auto first = s.find_first_not_of(" \t");
        if (first == std::string::npos) return "";
        const auto last = s.find_last_not_of(" \t");
        return s.substr(first, last - first + 1);
    }

    std::map<std::string, std::string> templates_;
    mutable std::shared_mutex mutex_;
};

} // namespace engine
} // namespace conductor
