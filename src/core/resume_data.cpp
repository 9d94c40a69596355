/**
 * @file resume_data.cpp
 * @brief Resume data codec
 */

#include "kcenon/task_session/core/resume_data.h"

#include <kcenon/task_session/core/request.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace kcenon::task_session {

// ============================================================================
// JSON helpers (simple implementation without external library)
// ============================================================================

namespace {

auto escape_json_string(const std::string& s) -> std::string {
    std::ostringstream o;
    for (auto c : s) {
        switch (c) {
            case '"': o << "\\\""; break;
            case '\\': o << "\\\\"; break;
            case '\n': o << "\\n"; break;
            case '\r': o << "\\r"; break;
            case '\t': o << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    o << "\\u" << std::hex << std::setw(4)
                      << std::setfill('0') << static_cast<int>(c);
                } else {
                    o << c;
                }
        }
    }
    return o.str();
}

auto unescape_json_string(const std::string& s) -> std::string {
    std::string out;
    out.reserve(s.size());

    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size()) {
            switch (s[i + 1]) {
                case '"': out += '"'; ++i; break;
                case '\\': out += '\\'; ++i; break;
                case 'n': out += '\n'; ++i; break;
                case 'r': out += '\r'; ++i; break;
                case 't': out += '\t'; ++i; break;
                case 'u':
                    if (i + 5 < s.size()) {
                        auto hex = s.substr(i + 2, 4);
                        if (hex.find_first_not_of("0123456789abcdefABCDEF") == std::string::npos) {
                            out += static_cast<char>(std::stoi(hex, nullptr, 16));
                        }
                        i += 5;
                    }
                    break;
                default: out += s[i]; break;
            }
        } else {
            out += s[i];
        }
    }
    return out;
}

auto extract_json_value(const std::string& json, const std::string& key)
    -> std::optional<std::string> {
    auto key_pos = json.find("\"" + key + "\"");
    if (key_pos == std::string::npos) {
        return std::nullopt;
    }

    auto colon_pos = json.find(':', key_pos);
    if (colon_pos == std::string::npos) {
        return std::nullopt;
    }

    auto value_start = colon_pos + 1;
    while (value_start < json.size() &&
           (json[value_start] == ' ' || json[value_start] == '\n' ||
            json[value_start] == '\t')) {
        ++value_start;
    }
    if (value_start >= json.size()) {
        return std::nullopt;
    }

    if (json[value_start] == '"') {
        auto string_end = value_start + 1;
        while (string_end < json.size()) {
            if (json[string_end] == '"' && json[string_end - 1] != '\\') {
                break;
            }
            ++string_end;
        }
        if (string_end >= json.size()) {
            return std::nullopt;
        }
        return unescape_json_string(json.substr(value_start + 1, string_end - value_start - 1));
    }

    auto value_end = value_start;
    while (value_end < json.size() &&
           json[value_end] != ',' && json[value_end] != '\n' &&
           json[value_end] != '}') {
        ++value_end;
    }

    auto value = json.substr(value_start, value_end - value_start);
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
        value.pop_back();
    }
    return value;
}

}  // namespace

auto encode_resume_data(const resume_state& state) -> resume_data {
    std::ostringstream oss;
    oss << "{";
    oss << "\"url\": \"" << escape_json_string(state.url) << "\", ";
    oss << "\"bytes_received\": " << state.bytes_received << ", ";
    oss << "\"partial_path\": \"" << escape_json_string(state.partial_path.string()) << "\"";
    oss << "}";

    auto json = oss.str();
    resume_data data(json.size());
    for (std::size_t i = 0; i < json.size(); ++i) {
        data[i] = static_cast<std::byte>(json[i]);
    }
    return data;
}

auto decode_resume_data(const resume_data& data) -> result<resume_state> {
    if (data.empty()) {
        return unexpected{error{error_code::invalid_resume_data, "resume data is empty"}};
    }

    std::string json;
    json.reserve(data.size());
    for (auto b : data) {
        json.push_back(static_cast<char>(b));
    }
    if (json.front() != '{' || json.back() != '}') {
        return unexpected{error{error_code::invalid_resume_data, "resume data is not an object"}};
    }

    resume_state state;

    auto url = extract_json_value(json, "url");
    if (!url || !is_valid_url(*url)) {
        return unexpected{error{error_code::invalid_resume_data, "resume data has no valid url"}};
    }
    state.url = *url;

    auto received = extract_json_value(json, "bytes_received");
    if (!received) {
        return unexpected{error{error_code::invalid_resume_data,
            "resume data has no bytes_received"}};
    }
    try {
        state.bytes_received = std::stoull(*received);
    } catch (const std::exception&) {
        return unexpected{error{error_code::invalid_resume_data,
            "invalid bytes_received field"}};
    }

    if (auto partial = extract_json_value(json, "partial_path")) {
        state.partial_path = *partial;
    }
    return state;
}

}  // namespace kcenon::task_session
