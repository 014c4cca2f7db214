// ============================================================================
// device.cpp — implementation for device.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "sideload/device.hpp"

namespace sideload {

// Decode the five predefined XML entities; anything else passes through.
static std::string decode_entities(const std::string& s) {
    if (s.find('&') == std::string::npos) return s;

    static const struct { const char* ent; char ch; } table[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''},
    };

    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size();) {
        bool matched = false;
        if (s[i] == '&') {
            for (const auto& e : table) {
                const std::string ent(e.ent);
                if (s.compare(i, ent.size(), ent) == 0) {
                    out.push_back(e.ch);
                    i += ent.size();
                    matched = true;
                    break;
                }
            }
        }
        if (!matched) out.push_back(s[i++]);
    }
    return out;
}

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::string extract_tag(const std::string& body, const std::string& tag) {
    const std::string open  = "<" + tag + ">";
    const std::string close = "</" + tag + ">";

    auto b = body.find(open);
    if (b == std::string::npos) return {};
    b += open.size();
    auto e = body.find(close, b);
    if (e == std::string::npos) return {};
    return decode_entities(trim(body.substr(b, e - b)));
}

bool has_device_info_marker(const std::string& body) {
    return body.find("<device-info>") != std::string::npos;
}

// ---- parse_device_info() — fill a Device with fallbacks
// POLICY: the first non-empty tag wins within each fallback chain.
// OUT:    always a complete record; optional fields stay empty when the tag is missing.
Device parse_device_info(const std::string& address, const std::string& body) {
    Device d;
    d.address = address;

    d.name = extract_tag(body, "friendly-device-name");
    if (d.name.empty()) d.name = extract_tag(body, "user-device-name");
    if (d.name.empty()) d.name = "device-" + address;

    d.model = extract_tag(body, "model-name");
    if (d.model.empty()) d.model = extract_tag(body, "model-number");
    if (d.model.empty()) d.model = "unknown";

    d.serial = extract_tag(body, "serial-number");
    if (d.serial.empty()) d.serial = "unknown";

    if (auto v = extract_tag(body, "software-version"); !v.empty()) d.software_version = v;
    if (auto c = extract_tag(body, "device-type"); !c.empty()) d.device_class = c;
    return d;
}

std::string describe(const Device& d) {
    return d.name + " (" + d.model + ") at " + d.address;
}

} // namespace sideload
