// ============================================================================
// jsonc.cpp — implementation for jsonc.hpp
// ============================================================================

#include "jsonc.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;
namespace sideload {

/*
 * strip_jsonc()
 * -------------
 * Two passes over the text, both string-aware (backslash escapes honoured):
 *   1) drop line and block comments (a line comment keeps its newline),
 *   2) drop a comma whose next non-space character closes an object or array.
 */
std::string strip_jsonc(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    bool in_string = false;
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        const char next = (i + 1 < text.size()) ? text[i + 1] : '\0';

        if (in_string) {
            out.push_back(c);
            if (c == '\\' && i + 1 < text.size()) {
                out.push_back(next);
                ++i;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }

        if (c == '"') {
            in_string = true;
            out.push_back(c);
        } else if (c == '/' && next == '/') {
            while (i < text.size() && text[i] != '\n') ++i;
            if (i < text.size()) out.push_back('\n');
        } else if (c == '/' && next == '*') {
            i += 2;
            while (i + 1 < text.size() && !(text[i] == '*' && text[i + 1] == '/')) ++i;
            ++i;  // land on '/', loop increment steps past it
        } else {
            out.push_back(c);
        }
    }

    // trailing commas: drop ',' whose next non-space char is '}' or ']'
    std::string cleaned;
    cleaned.reserve(out.size());
    in_string = false;
    for (size_t i = 0; i < out.size(); ++i) {
        const char c = out[i];
        if (in_string) {
            cleaned.push_back(c);
            if (c == '\\' && i + 1 < out.size()) cleaned.push_back(out[++i]);
            else if (c == '"') in_string = false;
            continue;
        }
        if (c == '"') in_string = true;
        if (c == ',') {
            size_t j = out.find_first_not_of(" \t\r\n", i + 1);
            if (j != std::string::npos && (out[j] == '}' || out[j] == ']')) continue;
        }
        cleaned.push_back(c);
    }
    return cleaned;
}

bool read_jsonc_file(const fs::path& path, nlohmann::json& out, std::string& err) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        err = "not_found:" + path.string();
        return false;
    }
    std::ifstream in(path);
    if (!in) {
        err = "read_failed:" + path.string();
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    try {
        out = nlohmann::json::parse(strip_jsonc(ss.str()));
    } catch (const nlohmann::json::parse_error& e) {
        err = "parse_error:" + path.string() + ": " + e.what();
        return false;
    }
    return true;
}

} // namespace sideload
