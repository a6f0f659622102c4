// Runtime policy for diagnostics: decides whether paths and user names may
// appear in log output. Credentials are never logged regardless of policy.
#pragma once

#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <string>

namespace openxfer {

struct LogPolicy {
    bool devEnvironment = false;
    bool sensitive = false; // paths and user names in clear

    // Sensitive output needs both OPEN_XFER_ENV=dev (or development, local,
    // debug) and OPEN_XFER_LOG_SENSITIVE=1 (or true, yes, on).
    static LogPolicy fromEnvironment();
};

namespace detail {

// Lowercased variable value without surrounding blanks; "" when unset.
inline std::string envToken(const char *name) {
    const char *raw = name ? std::getenv(name) : nullptr;
    if (!raw)
        return {};
    std::string v(raw);
    const auto first = v.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    v = v.substr(first, v.find_last_not_of(" \t\r\n") - first + 1);
    for (char &c : v)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return v;
}

inline bool isOneOf(const std::string &v,
                    std::initializer_list<const char *> accepted) {
    for (const char *a : accepted)
        if (v == a)
            return true;
    return false;
}

} // namespace detail

inline LogPolicy LogPolicy::fromEnvironment() {
    LogPolicy p;
    p.devEnvironment = detail::isOneOf(detail::envToken("OPEN_XFER_ENV"),
                                       {"dev", "development", "local", "debug"});
    p.sensitive = p.devEnvironment &&
                  detail::isOneOf(detail::envToken("OPEN_XFER_LOG_SENSITIVE"),
                                  {"1", "true", "yes", "on"});
    return p;
}

inline bool sensitiveLoggingEnabled() {
    return LogPolicy::fromEnvironment().sensitive;
}

inline std::string redactedForLog(const std::string &value) {
    if (value.empty() || sensitiveLoggingEnabled())
        return value;
    return "<redacted>";
}

} // namespace openxfer
