#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "ContentLine.h"
#include "Kinds.h"

namespace ical {

class LineUnfolder;

// A BEGIN/END block. The document root has an empty kind and holds the
// top-level containers as children.
struct Component {
    std::string kind;
    std::vector<ContentLine> properties;
    std::vector<Component> children;

    ComponentKind component_kind() const { return classify_component(kind); }
    bool is_root() const { return kind.empty(); }

    const ContentLine* find_property(std::string_view name) const;
    ContentLine* find_property(std::string_view name);

    // Replaces the value of the first property called `name`, appending one
    // when there is none. Parameters of an existing property are kept.
    void set_property(std::string_view name, std::string value);

    bool operator==(const Component& o) const { return kind == o.kind && properties == o.properties && children == o.children; }
    bool operator!=(const Component& o) const { return !(*this == o); }
};

// Consumes every logical line of the unfolder and returns the root.
// Throws IcalError on structural errors.
Component build_document(LineUnfolder& lines);

Component parse_document(std::string_view doc);

}
