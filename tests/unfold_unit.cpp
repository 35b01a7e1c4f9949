#include <iostream>
#include <string>
#include <vector>
#include "ical/Unfolder.h"
#include "ical/Errors.h"
#include "test_util.h"

using ical::LineUnfolder;
using ical::LogicalLine;

static std::vector<LogicalLine> all_lines(const std::string& doc) {
    LineUnfolder u(doc);
    std::vector<LogicalLine> out;
    LogicalLine ll;
    while (u.next(ll)) out.push_back(ll);
    return out;
}

int main() {
    {
        auto lines = all_lines("SUMMARY:Hel\r\n lo wor\r\n ld\r\nDTSTART:20240101T090000Z\r\n");
        if (lines.size() != 2) return fail("expected 2 logical lines got " + std::to_string(lines.size()));
        if (lines[0].text != "SUMMARY:Hello world") return fail("unfold mismatch: " + lines[0].text);
        if (lines[0].line_no != 1) return fail("first line_no should be 1");
        if (lines[1].text != "DTSTART:20240101T090000Z") return fail("second line mismatch: " + lines[1].text);
        if (lines[1].line_no != 4) return fail("second line_no should be 4 got " + std::to_string(lines[1].line_no));
    }

    // LF-only terminators and a tab continuation
    {
        auto lines = all_lines("A:one\n\ttwo\nB:three\n");
        if (lines.size() != 2) return fail("LF input: expected 2 lines");
        if (lines[0].text != "A:onetwo") return fail("tab continuation mismatch: " + lines[0].text);
        if (lines[1].text != "B:three") return fail("LF second line mismatch");
    }

    // only the first whitespace character of a continuation is dropped
    {
        auto lines = all_lines("A:b\r\n  c\r\n");
        if (lines.size() != 1 || lines[0].text != "A:b c") return fail("double space continuation mismatch");
    }

    // missing final terminator
    {
        auto lines = all_lines("A:1\r\nB:2");
        if (lines.size() != 2 || lines[1].text != "B:2") return fail("unterminated last line lost");
    }

    // BOM is skipped
    {
        auto lines = all_lines("\xEF\xBB\xBF" "BEGIN:VCALENDAR\r\nEND:VCALENDAR\r\n");
        if (lines.size() != 2 || lines[0].text != "BEGIN:VCALENDAR") return fail("BOM not stripped");
    }

    {
        if (!all_lines("").empty()) return fail("empty document should yield nothing");
        auto blank = all_lines("\r\n\r\n");
        if (blank.size() != 2 || !blank[0].text.empty()) return fail("blank lines should come through as empty logical lines");
    }

    // continuation with nothing before it
    {
        try {
            all_lines(" SUMMARY:x\r\n");
            return fail("expected MalformedFold");
        } catch (const ical::IcalError& e) {
            if (e.kind() != ical::ErrorKind::MalformedFold) return fail("wrong kind for leading continuation");
            if (e.line() != 1) return fail("MalformedFold line should be 1");
        }
    }

    // restartable
    {
        std::string doc = "A:1\r\n 2\r\nB:3\r\n";
        LineUnfolder u(doc);
        LogicalLine ll;
        int n = 0;
        while (u.next(ll)) ++n;
        u.reset();
        if (!u.next(ll) || ll.text != "A:12") return fail("reset did not restart the sequence");
        if (n != 2) return fail("first pass count mismatch");
    }

    std::cout << "unfold_unit ok\n";
    return 0;
}
