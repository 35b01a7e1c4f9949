#pragma once

#include <cstddef>
#include <string>
#include "ical/Document.h"

namespace transform {

struct FilterConfig {
    std::string match_value;
};

// Drops every event-like component whose SUMMARY is exactly cfg.match_value,
// whether it sits in a VCALENDAR or directly at the top of the document.
// Everything else is left untouched.
ical::Component filter(ical::Component root, const FilterConfig& cfg);

// Same scope as filter(): VCALENDAR children plus top-level components.
std::size_t count_event_like(const ical::Component& root);

}
