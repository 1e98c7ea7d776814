#include "core/version.hpp"
#include "core/errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <limits>

using json = nlohmann::json;

// ════════════════════════════════════════════════════════════════
// Helpers
// ════════════════════════════════════════════════════════════════

static bool is_numeric(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

static bool is_identifier_char(unsigned char c) {
    return std::isalnum(c) || c == '-';
}

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        auto pos = s.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

static uint64_t parse_core_number(const std::string& field, const std::string& text) {
    if (!is_numeric(field)) {
        throw UpdateError(ErrorKind::Parse, "invalid version \"" + text + "\": expected a number, got \"" + field + "\"");
    }
    if (field.size() > 1 && field[0] == '0') {
        throw UpdateError(ErrorKind::Parse, "invalid version \"" + text + "\": leading zero in \"" + field + "\"");
    }
    uint64_t value = 0;
    for (char c : field) {
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            throw UpdateError(ErrorKind::Parse, "invalid version \"" + text + "\": number too large");
        }
        value = value * 10 + digit;
    }
    return value;
}

static std::vector<std::string> parse_identifiers(const std::string& field,
                                                  const std::string& text,
                                                  bool reject_leading_zero) {
    std::vector<std::string> ids = split(field, '.');
    for (const auto& id : ids) {
        if (id.empty()) {
            throw UpdateError(ErrorKind::Parse, "invalid version \"" + text + "\": empty identifier");
        }
        for (char c : id) {
            if (!is_identifier_char(static_cast<unsigned char>(c))) {
                throw UpdateError(ErrorKind::Parse, "invalid version \"" + text + "\": bad character in \"" + id + "\"");
            }
        }
        if (reject_leading_zero && is_numeric(id) && id.size() > 1 && id[0] == '0') {
            throw UpdateError(ErrorKind::Parse, "invalid version \"" + text + "\": leading zero in \"" + id + "\"");
        }
    }
    return ids;
}

/// Compare two numeric identifiers without converting (they may exceed 64 bits).
static int compare_numeric(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
    int c = a.compare(b);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

static int compare_identifiers(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        bool a_num = is_numeric(a[i]);
        bool b_num = is_numeric(b[i]);
        int c = 0;
        if (a_num && b_num) {
            c = compare_numeric(a[i], b[i]);
        } else if (a_num) {
            c = -1;  // numeric identifiers have lower precedence
        } else if (b_num) {
            c = 1;
        } else {
            int raw = a[i].compare(b[i]);
            c = raw < 0 ? -1 : (raw > 0 ? 1 : 0);
        }
        if (c != 0) return c;
    }
    if (a.size() == b.size()) return 0;
    return a.size() < b.size() ? -1 : 1;
}

static std::string join(const std::vector<std::string>& parts, char sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

// ════════════════════════════════════════════════════════════════
// Version
// ════════════════════════════════════════════════════════════════

Version Version::parse(const std::string& text) {
    if (text.empty()) {
        throw UpdateError(ErrorKind::Parse, "invalid version: empty string");
    }

    std::string rest = text;
    Version v;

    auto plus = rest.find('+');
    if (plus != std::string::npos) {
        v.build = parse_identifiers(rest.substr(plus + 1), text, false);
        rest = rest.substr(0, plus);
    }

    auto dash = rest.find('-');
    if (dash != std::string::npos) {
        v.prerelease = parse_identifiers(rest.substr(dash + 1), text, true);
        rest = rest.substr(0, dash);
    }

    auto core = split(rest, '.');
    if (core.size() != 3) {
        throw UpdateError(ErrorKind::Parse, "invalid version \"" + text + "\": expected MAJOR.MINOR.PATCH");
    }
    v.major = parse_core_number(core[0], text);
    v.minor = parse_core_number(core[1], text);
    v.patch = parse_core_number(core[2], text);
    return v;
}

std::string Version::to_string() const {
    std::string s = std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    if (!prerelease.empty()) s += "-" + join(prerelease, '.');
    if (!build.empty()) s += "+" + join(build, '.');
    return s;
}

int Version::compare(const Version& a, const Version& b) {
    if (a.major != b.major) return a.major < b.major ? -1 : 1;
    if (a.minor != b.minor) return a.minor < b.minor ? -1 : 1;
    if (a.patch != b.patch) return a.patch < b.patch ? -1 : 1;

    // A pre-release sorts before the release it precedes
    if (a.prerelease.empty() != b.prerelease.empty()) {
        return a.prerelease.empty() ? 1 : -1;
    }
    int c = compare_identifiers(a.prerelease, b.prerelease);
    if (c != 0) return c;

    // Tie-break on build metadata so the order is total
    if (a.build.empty() != b.build.empty()) {
        return a.build.empty() ? -1 : 1;
    }
    return compare_identifiers(a.build, b.build);
}

// ════════════════════════════════════════════════════════════════
// Payload parsing
// ════════════════════════════════════════════════════════════════

Version parse_version_payload(const std::string& payload) {
    json j;
    try {
        j = json::parse(payload);
    } catch (const json::parse_error& e) {
        throw UpdateError(ErrorKind::Parse, std::string("malformed version payload: ") + e.what());
    }

    if (!j.is_object()) {
        throw UpdateError(ErrorKind::Parse, "malformed version payload: expected a JSON object");
    }

    const char* key = nullptr;
    if (j.contains("version")) {
        key = "version";
    } else if (j.contains("name")) {
        key = "name";
    } else {
        throw UpdateError(ErrorKind::Parse, "version payload has neither \"version\" nor \"name\"");
    }

    if (!j[key].is_string()) {
        throw UpdateError(ErrorKind::Parse, std::string("version payload field \"") + key + "\" is not a string");
    }
    return Version::parse(j[key].get<std::string>());
}
