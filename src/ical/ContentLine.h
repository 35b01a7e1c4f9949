#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "Kinds.h"

namespace ical {

struct Parameter {
    std::string name;
    std::vector<std::string> values;

    bool operator==(const Parameter& o) const { return name == o.name && values == o.values; }
    bool operator!=(const Parameter& o) const { return !(*this == o); }
};

// One property. For text-valued kinds `value` is unescaped; for the rest it
// is the raw value as it appeared on the wire.
struct ContentLine {
    std::string name;
    std::vector<Parameter> parameters;
    std::string value;

    PropertyKind kind() const { return classify_property(name); }
    bool is(std::string_view other) const { return iequals(name, other); }
    const Parameter* find_parameter(std::string_view pname) const;

    bool operator==(const ContentLine& o) const { return name == o.name && parameters == o.parameters && value == o.value; }
    bool operator!=(const ContentLine& o) const { return !(*this == o); }
};

// Throws IcalError(MalformedContentLine); `line_no` is only used for the message.
ContentLine parse_content_line(std::string_view line, std::size_t line_no = 0);

// Wire form of the line, without folding and without the trailing CRLF.
std::string format_content_line(const ContentLine& cl);

std::string unescape_text(std::string_view raw);
std::string escape_text(std::string_view text);

// Quotes the value when it contains ':', ';' or ','.
std::string format_param_value(std::string_view v);

}
