#include "Serializer.h"

namespace ical {

static bool is_utf8_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// An odd run of backslashes right before `pos` means line[pos] is the second
// half of an escape pair.
static bool splits_escape(std::string_view line, std::size_t pos) {
    std::size_t n = 0;
    while (pos > n && line[pos - n - 1] == '\\') ++n;
    return n % 2 == 1;
}

void append_folded(std::string& out, std::string_view line) {
    std::size_t start = 0;
    std::size_t budget = kMaxLineOctets;
    while (line.size() - start > budget) {
        std::size_t cut = start + budget;
        while (cut > start + 1 && (is_utf8_continuation(line[cut]) || splits_escape(line, cut))) --cut;
        out.append(line.data() + start, cut - start);
        out += "\r\n ";
        start = cut;
        budget = kMaxLineOctets - 1;
    }
    out.append(line.data() + start, line.size() - start);
    out += "\r\n";
}

static void serialize_component(std::string& out, const Component& c) {
    if (!c.is_root()) append_folded(out, "BEGIN:" + c.kind);
    for (const auto& p : c.properties) append_folded(out, format_content_line(p));
    for (const auto& child : c.children) serialize_component(out, child);
    if (!c.is_root()) append_folded(out, "END:" + c.kind);
}

std::string serialize(const Component& root) {
    std::string out;
    serialize_component(out, root);
    return out;
}

}
