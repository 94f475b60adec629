#include "utils.hpp"
#include "types.hpp"
#include <chrono>
#include <ctime>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <climits>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:          return "none";
        case ErrorKind::NotFound:      return "not-found";
        case ErrorKind::Conflict:      return "conflict";
        case ErrorKind::AlreadyExists: return "already-exists";
        case ErrorKind::Invalid:       return "invalid";
        case ErrorKind::Transient:     return "transient";
    }
    return "unknown";
}

std::string format_rfc3339(long long unix_secs) {
    std::time_t t = static_cast<std::time_t>(unix_secs);
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return std::string(buf);
}

std::string now_rfc3339() {
    return format_rfc3339(now_unix());
}

long long now_unix() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();
}

int safe_stoi(const std::string& s, int fallback) {
    int v;
    return parse_int(s, v) ? v : fallback;
}

bool parse_int(const std::string& s, int& out) {
    std::string t = s;
    trim(t);
    if (t.empty()) return false;

    errno = 0;
    char* end = nullptr;
    long v = std::strtol(t.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || v < INT_MIN || v > INT_MAX) return false;
    out = static_cast<int>(v);
    return true;
}

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

namespace {

// Move a cut position back so it does not land inside a UTF-8 sequence.
size_t utf8_boundary(const std::string& s, size_t pos) {
    while (pos > 0 && (static_cast<unsigned char>(s[pos]) & 0xC0) == 0x80) --pos;
    return pos;
}

} // namespace

std::string truncate_message(const std::string& msg, size_t cap) {
    if (msg.size() <= cap) return msg;
    if (cap <= 3) return msg.substr(0, utf8_boundary(msg, cap));
    return msg.substr(0, utf8_boundary(msg, cap - 3)) + "...";
}
