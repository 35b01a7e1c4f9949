#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include "Document.h"

namespace ical {

// RFC 5545 limit on a line, CRLF excluded.
constexpr std::size_t kMaxLineOctets = 75;

std::string serialize(const Component& root);

// Appends `line` to `out`, folded to kMaxLineOctets, terminated with CRLF.
void append_folded(std::string& out, std::string_view line);

}
