// ============================================================================
// project.cpp — implementation for project.hpp
// ============================================================================

#include "sideload/project.hpp"

#include <algorithm>
#include <cctype>

namespace sideload {

// ---- is_build_like() — heuristic over task label and group
bool is_build_like(const BuildTask& t) {
    if (t.group == "build") return true;

    std::string label = t.label;
    std::transform(label.begin(), label.end(), label.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const char* word : {"build", "compile", "package", "deploy"}) {
        if (label.find(word) != std::string::npos) return true;
    }
    return false;
}

} // namespace sideload
