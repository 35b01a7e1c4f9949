#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace observability {

using FieldValue = std::variant<std::string, int64_t, double>;
// Emitted in the order given.
using Fields = std::vector<std::pair<std::string, FieldValue>>;

enum class LogLevel { DEBUG = 1, INFO = 2, WARN = 3, ERROR = 4 };

void log_debug(const std::string& msg, const Fields& fields = {});
void log_info(const std::string& msg, const Fields& fields = {});
void log_warn(const std::string& msg, const Fields& fields = {});
void log_error(const std::string& msg, const Fields& fields = {});

void set_log_level(LogLevel level);
LogLevel log_level();
LogLevel parse_log_level(const std::string& name);

// nullptr restores std::cout.
void set_log_sink(std::ostream* sink);

}
