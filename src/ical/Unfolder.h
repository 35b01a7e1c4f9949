#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace ical {

struct LogicalLine {
    std::string text;
    std::size_t line_no = 0;  // physical line where the logical line starts
};

// Lazily turns a folded document into logical lines. Holds a view, so the
// document must outlive the unfolder.
class LineUnfolder {
public:
    explicit LineUnfolder(std::string_view doc);

    // Fills `out` with the next logical line; false at end of input.
    // Throws IcalError(MalformedFold) for a continuation with no predecessor.
    bool next(LogicalLine& out);

    void reset();

private:
    bool next_physical(std::string_view& line);

    std::string_view doc_;
    std::size_t pos_ = 0;
    std::size_t physical_no_ = 0;
    bool has_pending_ = false;
    std::string_view pending_;
    std::size_t pending_no_ = 0;
};

}
