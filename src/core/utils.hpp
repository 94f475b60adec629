#pragma once

#include <string>
#include <ctime>
#include "types.hpp"

// Generate an RFC 3339 UTC timestamp (YYYY-MM-DDTHH:MM:SSZ) for the given unix time.
std::string format_rfc3339(long long unix_secs);

// Same as format_rfc3339 for the current time.
std::string now_rfc3339();

// Current time as unix seconds.
long long now_unix();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Strict integer parse: false unless the whole string is a base-10 integer.
bool parse_int(const std::string& s, int& out);

std::string to_lower(std::string s);

// Clip a status message to at most `cap` bytes, marking the cut with "...".
// Never splits a UTF-8 sequence.
std::string truncate_message(const std::string& msg, size_t cap);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
