#include "Filter.h"

#include <algorithm>
#include <vector>

namespace transform {

static bool summary_matches(const ical::Component& c, const FilterConfig& cfg) {
    if (!ical::is_event_like(c.component_kind())) return false;
    const auto* summary = c.find_property("SUMMARY");
    return summary && summary->value == cfg.match_value;
}

static void drop_matches(std::vector<ical::Component>& children, const FilterConfig& cfg) {
    children.erase(std::remove_if(children.begin(), children.end(), [&](const ical::Component& c) { return summary_matches(c, cfg); }), children.end());
}

static std::size_t count_in(const std::vector<ical::Component>& children) {
    return static_cast<std::size_t>(std::count_if(children.begin(), children.end(), [](const ical::Component& c) { return ical::is_event_like(c.component_kind()); }));
}

ical::Component filter(ical::Component root, const FilterConfig& cfg) {
    drop_matches(root.children, cfg);
    for (auto& top : root.children) {
        if (top.component_kind() == ical::ComponentKind::Calendar) drop_matches(top.children, cfg);
    }
    return root;
}

std::size_t count_event_like(const ical::Component& root) {
    std::size_t n = count_in(root.children);
    for (const auto& top : root.children) {
        if (top.component_kind() == ical::ComponentKind::Calendar) n += count_in(top.children);
    }
    return n;
}

}
