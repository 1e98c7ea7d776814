#pragma once

#include <cstdint>
#include <string>
#include <vector>

/// Semantic version (https://semver.org) with a total order.
/// Pre-release identifiers take part in precedence; build metadata is only
/// used as a last tie-break so that ordering stays consistent with equality.
struct Version {
    uint64_t major = 0;
    uint64_t minor = 0;
    uint64_t patch = 0;
    std::vector<std::string> prerelease;  // dot-separated identifiers after '-'
    std::vector<std::string> build;       // dot-separated identifiers after '+'

    Version() = default;
    Version(uint64_t maj, uint64_t min, uint64_t pat)
        : major(maj), minor(min), patch(pat) {}

    /// Parse a strict semver string like "0.0.76" or "1.2.3-beta.1+sha.abc".
    /// Throws UpdateError(ErrorKind::Parse) on malformed input.
    static Version parse(const std::string& text);

    std::string to_string() const;

    /// <0, 0, >0 like strcmp
    static int compare(const Version& a, const Version& b);
};

inline bool operator==(const Version& a, const Version& b) { return Version::compare(a, b) == 0; }
inline bool operator!=(const Version& a, const Version& b) { return Version::compare(a, b) != 0; }
inline bool operator<(const Version& a, const Version& b)  { return Version::compare(a, b) < 0; }
inline bool operator>(const Version& a, const Version& b)  { return Version::compare(a, b) > 0; }
inline bool operator<=(const Version& a, const Version& b) { return Version::compare(a, b) <= 0; }
inline bool operator>=(const Version& a, const Version& b) { return Version::compare(a, b) >= 0; }

/// Parse a JSON object carrying the version under "version" (or "name").
/// Throws UpdateError(ErrorKind::Parse) on malformed JSON or version text.
Version parse_version_payload(const std::string& payload);
