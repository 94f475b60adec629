#pragma once

#include <string>
#include <core/types.hpp>

// Append every log line to this file in addition to stderr. Empty disables the file.
void set_log_file(const std::string& path);

// Silence stderr output (tests). File output is unaffected.
void set_log_quiet(bool quiet);

void forgeop_log(const std::string& msg);
void forgeop_log_warn(const std::string& msg);
void forgeop_log_error(const std::string& msg);

// Log a child command with its exit code and the head of its output.
void forgeop_log_cmd(const std::string& label, const std::string& cmd,
                     const CommandResult& r);
