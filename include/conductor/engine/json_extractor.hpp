#pragma once

#include "../types.hpp"
#include <cctype>
#include <optional>
#include <string>

namespace conductor {
namespace engine {

// ============================================================================
// JsonExtractor
// ============================================================================

/**
 * @brief Extracts a structured JSON object from free-form model output.
 *
 * Attempts, in order:
 * 1. the whole text as JSON (comments ignored)
 * 2. the body of a fenced ```json (or bare ```) block
 * 3. every balanced `{...}` region, left to right
 *
 * Each candidate is retried once with trailing commas removed. Only JSON
 * objects are accepted.
 */
class JsonExtractor {
public:
    /**
     * @brief Extract the first JSON object from text.
     *
     * @param text Raw text output from the model
     * @return Expected<Value> Parsed object, or LlmResponseParseFailed
     */
    static Expected<Value> extract_object(const std::string& text) {
        if (auto direct = try_parse(trim(text))) {
            return *direct;
        }

        if (auto fenced = extract_fenced_block(text)) {
            if (auto parsed = try_parse(*fenced)) {
                return *parsed;
            }
        }

        auto pos = text.find('{');
        while (pos != std::string::npos) {
            auto end_pos = find_json_object_end(text, pos);
            if (end_pos != std::string::npos) {
                if (auto parsed = try_parse(text.substr(pos, end_pos - pos + 1))) {
                    return *parsed;
                }
            }
            pos = text.find('{', pos + 1);
        }

        constexpr size_t kPreviewLength = 200;
        std::string preview = text.size() > kPreviewLength ? text.substr(0, kPreviewLength) + "..." : text;
        return tl::unexpected(Error{
            ErrorCode::LlmResponseParseFailed,
            "No JSON object found in model response",
            std::move(preview)
        });
    }

    /**
     * @brief Remove commas that directly precede a closing `}` or `]`.
     *
     * Commas inside string literals are preserved.
     */
    static std::string remove_trailing_commas(const std::string& text) {
        std::string out;
        out.reserve(text.size());
        bool in_string = false;
        bool escape_next = false;

        for (size_t i = 0; i < text.size(); ++i) {
            char c = text[i];
            if (escape_next) {
                escape_next = false;
                out.push_back(c);
                continue;
            }
            if (c == '\\' && in_string) {
                escape_next = true;
                out.push_back(c);
                continue;
            }
            if (c == '"') {
                in_string = !in_string;
            }
            if (c == ',' && !in_string) {
                size_t next = i + 1;
                while (next < text.size() && std::isspace(static_cast<unsigned char>(text[next])) != 0) {
                    ++next;
                }
                if (next < text.size() && (text[next] == '}' || text[next] == ']')) {
                    continue;
                }
            }
            out.push_back(c);
        }
        return out;
    }

private:
    static std::optional<Value> try_parse(const std::string& candidate) {
        if (candidate.empty()) return std::nullopt;

        Value parsed = Value::parse(candidate, nullptr, false, true);
        if (parsed.is_discarded()) {
            parsed = Value::parse(remove_trailing_commas(candidate), nullptr, false, true);
        }
        if (parsed.is_discarded() || !parsed.is_object()) {
            return std::nullopt;
        }
        return parsed;
    }

    static std::optional<std::string> extract_fenced_block(const std::string& text) {
        auto open = text.find("```");
        if (open == std::string::npos) return std::nullopt;

        // Skip the info string ("json", "JSON", ...) up to the end of the line
        auto body_start = text.find('\n', open + 3);
        if (body_start == std::string::npos) return std::nullopt;
        ++body_start;

        auto close = text.find("```", body_start);
        if (close == std::string::npos) return std::nullopt;
        return trim(text.substr(body_start, close - body_start));
    }

    static std::string trim(const std::string& text) {
        size_t begin = 0;
        size_t end = text.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) ++begin;
        while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) --end;
        return text.substr(begin, end - begin);
    }

    /**
     * @brief Find the end position of a balanced JSON object starting at start.
     *
     * Handles string escaping and nested objects.
     *
     * @return Position of the matching closing brace, or std::string::npos if unbalanced
     */
    static size_t find_json_object_end(const std::string& text, size_t start) {
        if (start >= text.size() || text[start] != '{') return std::string::npos;

        int depth = 0;
        bool in_string = false;
        bool escape_next = false;

        for (size_t i = start; i < text.size(); ++i) {
            char c = text[i];

            if (escape_next) {
                escape_next = false;
                continue;
            }
            if (c == '\\' && in_string) {
                escape_next = true;
                continue;
            }
            if (c == '"') {
                in_string = !in_string;
                continue;
            }
            if (!in_string) {
                if (c == '{') {
                    ++depth;
                } else if (c == '}') {
                    if (--depth == 0) {
                        return i;
                    }
                }
            }
        }
        return std::string::npos;
    }
};

} // namespace engine
} // namespace conductor
