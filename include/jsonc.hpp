#pragma once
/**
 * @file jsonc.hpp
 * @brief Read editor-style JSON (comments, trailing commas) with nlohmann::json.
 *
 * @details
 * Project documents (`.vscode/tasks.json`, `.vscode/launch.json`,
 * `bsconfig.json`) are written by humans and editors that accept `//` and
 * block comments plus trailing commas. strip_jsonc() removes those outside
 * string literals, so the result parses as strict JSON.
 */

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace sideload {

/// Remove comments and trailing commas outside string literals.
std::string strip_jsonc(const std::string& text);

/**
 * @brief Load and parse a JSONC file.
 * @return false with err = "not_found:<path>", "read_failed:<path>" or
 *         "parse_error:<path>: <detail>".
 */
bool read_jsonc_file(const std::filesystem::path& path, nlohmann::json& out, std::string& err);

} // namespace sideload
