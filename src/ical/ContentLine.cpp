#include "ContentLine.h"
#include "Errors.h"

#include <cctype>

namespace ical {

static bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

static std::size_t scan_name(std::string_view s, std::size_t pos) {
    while (pos < s.size() && is_name_char(s[pos])) ++pos;
    return pos;
}

[[noreturn]] static void malformed(const std::string& what, std::size_t line_no) {
    throw IcalError(ErrorKind::MalformedContentLine, what, line_no);
}

const Parameter* ContentLine::find_parameter(std::string_view pname) const {
    for (const auto& p : parameters) {
        if (iequals(p.name, pname)) return &p;
    }
    return nullptr;
}

ContentLine parse_content_line(std::string_view line, std::size_t line_no) {
    ContentLine cl;
    std::size_t pos = scan_name(line, 0);
    if (pos == 0) malformed("missing property name", line_no);
    cl.name.assign(line.data(), pos);

    while (pos < line.size() && line[pos] == ';') {
        std::size_t pstart = pos + 1;
        pos = scan_name(line, pstart);
        if (pos == pstart) malformed("missing parameter name in " + cl.name, line_no);
        Parameter p;
        p.name.assign(line.data() + pstart, pos - pstart);
        if (pos >= line.size() || line[pos] != '=') malformed("parameter " + p.name + " has no '='", line_no);
        ++pos;
        for (;;) {
            if (pos < line.size() && line[pos] == '"') {
                std::size_t close = line.find('"', pos + 1);
                if (close == std::string_view::npos) malformed("unterminated quote in parameter " + p.name, line_no);
                p.values.emplace_back(line.substr(pos + 1, close - pos - 1));
                pos = close + 1;
            } else {
                std::size_t vstart = pos;
                while (pos < line.size() && line[pos] != ';' && line[pos] != ':' && line[pos] != ',' && line[pos] != '"') ++pos;
                if (pos < line.size() && line[pos] == '"') malformed("stray quote in parameter " + p.name, line_no);
                p.values.emplace_back(line.substr(vstart, pos - vstart));
            }
            if (pos < line.size() && line[pos] == ',') { ++pos; continue; }
            break;
        }
        cl.parameters.push_back(std::move(p));
    }

    if (pos >= line.size() || line[pos] != ':') malformed("expected ':' after " + cl.name, line_no);
    std::string_view raw = line.substr(pos + 1);
    if (is_text_valued(cl.kind())) cl.value = unescape_text(raw);
    else cl.value.assign(raw.data(), raw.size());
    return cl;
}

std::string unescape_text(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        char c = raw[i];
        if (c != '\\' || i + 1 >= raw.size()) { out.push_back(c); continue; }
        char n = raw[i + 1];
        switch (n) {
            case '\\': case ';': case ',': out.push_back(n); ++i; break;
            case 'n': case 'N': out.push_back('\n'); ++i; break;
            default:
                // unknown escape: keep it verbatim
                out.push_back(c);
                break;
        }
    }
    return out;
}

std::string escape_text(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 8);
    for (char c : text) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case ';': out += "\\;"; break;
            case ',': out += "\\,"; break;
            case '\n': out += "\\n"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

std::string format_param_value(std::string_view v) {
    if (v.find_first_of(":;,") == std::string_view::npos) return std::string(v);
    std::string out;
    out.reserve(v.size() + 2);
    out.push_back('"');
    out.append(v.data(), v.size());
    out.push_back('"');
    return out;
}

std::string format_content_line(const ContentLine& cl) {
    std::string out = cl.name;
    for (const auto& p : cl.parameters) {
        out.push_back(';');
        out += p.name;
        out.push_back('=');
        for (std::size_t i = 0; i < p.values.size(); ++i) {
            if (i) out.push_back(',');
            out += format_param_value(p.values[i]);
        }
    }
    out.push_back(':');
    if (is_text_valued(cl.kind())) out += escape_text(cl.value);
    else out += cl.value;
    return out;
}

}
