#include "Document.h"
#include "Errors.h"
#include "Unfolder.h"

namespace ical {

const ContentLine* Component::find_property(std::string_view name) const {
    for (const auto& p : properties) {
        if (p.is(name)) return &p;
    }
    return nullptr;
}

ContentLine* Component::find_property(std::string_view name) {
    for (auto& p : properties) {
        if (p.is(name)) return &p;
    }
    return nullptr;
}

void Component::set_property(std::string_view name, std::string value) {
    if (auto* p = find_property(name)) {
        p->value = std::move(value);
        return;
    }
    ContentLine cl;
    cl.name.assign(name.data(), name.size());
    cl.value = std::move(value);
    properties.push_back(std::move(cl));
}

Component build_document(LineUnfolder& lines) {
    // stack.front() is the implicit root; the rest are the open blocks.
    std::vector<Component> stack(1);
    LogicalLine ll;
    while (lines.next(ll)) {
        if (ll.text.empty()) continue;
        ContentLine cl = parse_content_line(ll.text, ll.line_no);
        if (cl.is("BEGIN")) {
            if (cl.value.empty()) throw IcalError(ErrorKind::MalformedContentLine, "BEGIN without a component name", ll.line_no);
            Component c;
            c.kind = std::move(cl.value);
            stack.push_back(std::move(c));
        } else if (cl.is("END")) {
            if (stack.size() == 1) {
                throw IcalError(ErrorKind::UnbalancedBlock, "END:" + cl.value + " with no open block", ll.line_no);
            }
            if (!iequals(stack.back().kind, cl.value)) {
                throw IcalError(ErrorKind::UnbalancedBlock, "END:" + cl.value + " closes BEGIN:" + stack.back().kind, ll.line_no);
            }
            Component done = std::move(stack.back());
            stack.pop_back();
            stack.back().children.push_back(std::move(done));
        } else {
            stack.back().properties.push_back(std::move(cl));
        }
    }
    if (stack.size() > 1) {
        throw IcalError(ErrorKind::UnterminatedBlock, "BEGIN:" + stack.back().kind + " is never closed");
    }
    return std::move(stack.front());
}

Component parse_document(std::string_view doc) {
    LineUnfolder lines(doc);
    return build_document(lines);
}

}
