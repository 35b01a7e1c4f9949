#include "Unfolder.h"
#include "Errors.h"

namespace ical {

static constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

static bool is_continuation(std::string_view line) {
    return !line.empty() && (line[0] == ' ' || line[0] == '\t');
}

LineUnfolder::LineUnfolder(std::string_view doc) : doc_(doc) { reset(); }

void LineUnfolder::reset() {
    pos_ = 0;
    if (doc_.substr(0, kUtf8Bom.size()) == kUtf8Bom) pos_ = kUtf8Bom.size();
    physical_no_ = 0;
    has_pending_ = false;
    pending_ = {};
    pending_no_ = 0;
}

bool LineUnfolder::next_physical(std::string_view& line) {
    if (pos_ >= doc_.size()) return false;
    std::size_t nl = doc_.find('\n', pos_);
    std::size_t end = nl == std::string_view::npos ? doc_.size() : nl;
    line = doc_.substr(pos_, end - pos_);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    pos_ = nl == std::string_view::npos ? doc_.size() : nl + 1;
    ++physical_no_;
    return true;
}

bool LineUnfolder::next(LogicalLine& out) {
    std::string_view first;
    std::size_t first_no = 0;
    if (has_pending_) {
        first = pending_;
        first_no = pending_no_;
        has_pending_ = false;
    } else {
        if (!next_physical(first)) return false;
        first_no = physical_no_;
    }
    if (is_continuation(first)) {
        throw IcalError(ErrorKind::MalformedFold, "continuation line has no preceding line", first_no);
    }

    out.text.assign(first.data(), first.size());
    out.line_no = first_no;

    std::string_view line;
    while (next_physical(line)) {
        if (!is_continuation(line)) {
            pending_ = line;
            pending_no_ = physical_no_;
            has_pending_ = true;
            break;
        }
        line.remove_prefix(1);
        out.text.append(line.data(), line.size());
    }
    return true;
}

}
