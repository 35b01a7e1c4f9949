#include <iostream>
#include <string>
#include "transform/Anonymize.h"
#include "crypto/Digest.h"
#include "ical/Document.h"
#include "ical/Errors.h"
#include "ical/Serializer.h"
#include "test_util.h"

using namespace ical;
using transform::AnonymizeConfig;
using transform::Disposition;

static AnonymizeConfig base_config() {
    AnonymizeConfig cfg;
    cfg.calendar_name = "Jane (busy times)";
    cfg.redaction_message = "busy";
    cfg.seed = "s1";
    return cfg;
}

int main() {
    if (transform::event_disposition(PropertyKind::Summary) != Disposition::Redact) return fail("SUMMARY should be redacted");
    if (transform::event_disposition(PropertyKind::Uid) != Disposition::HideUid) return fail("UID should be hidden");
    if (transform::event_disposition(PropertyKind::RRule) != Disposition::Keep) return fail("RRULE should be kept");
    if (transform::event_disposition(PropertyKind::Attendee) != Disposition::Remove) return fail("ATTENDEE should be removed");
    if (transform::event_disposition(PropertyKind::Unrecognized) != Disposition::Unknown) return fail("unrecognized should be unknown");
    if (transform::calendar_disposition(PropertyKind::XWrCalName) != Disposition::Rename) return fail("X-WR-CALNAME should be renamed");
    if (transform::calendar_disposition(PropertyKind::XWrCalDesc) != Disposition::Remove) return fail("X-WR-CALDESC should be removed");
    if (transform::component_disposition(PropertyKind::Organizer) != Disposition::Remove) return fail("ORGANIZER should be removed from other components");
    if (transform::component_disposition(PropertyKind::FreeBusy) != Disposition::Keep) return fail("FREEBUSY should be kept");

    // the dentist event
    {
        Component root = transform::anonymize(parse_document(dentist_doc()), base_config());
        const Component& cal = root.children[0];
        const auto* name = cal.find_property("X-WR-CALNAME");
        if (!name || name->value != "Jane (busy times)") return fail("calendar name not added");
        if (!cal.find_property("VERSION") || !cal.find_property("PRODID")) return fail("VERSION/PRODID dropped");
        const Component& ev = cal.children[0];
        if (ev.find_property("SUMMARY")->value != "busy") return fail("SUMMARY not replaced");
        if (ev.find_property("UID")->value != crypto::hide_uid("abc123", "s1")) return fail("UID not hidden");
        if (ev.find_property("DTSTART")->value != "20240101T090000Z") return fail("DTSTART changed");
        if (ev.find_property("DTEND")->value != "20240101T100000Z") return fail("DTEND changed");
        if (ev.find_property("DESCRIPTION") || ev.find_property("LOCATION")) return fail("DESCRIPTION/LOCATION survived");
    }

    // the rich document
    {
        Component in = parse_document(rich_doc());
        Component root = transform::anonymize(in, base_config());
        const Component& cal = root.children[0];
        if (cal.find_property("X-WR-CALNAME")->value != "Jane (busy times)") return fail("existing name not replaced");
        if (cal.find_property("X-WR-CALDESC")) return fail("calendar description survived");
        if (!cal.find_property("X-WR-TIMEZONE") || !cal.find_property("CALSCALE") || !cal.find_property("METHOD")) return fail("calendar scheduling properties dropped");
        if (cal.children[0] != in.children[0].children[0]) return fail("VTIMEZONE must be untouched");

        const Component& ev = cal.children[1];
        const auto* summary = ev.find_property("SUMMARY");
        if (!summary || summary->value != "busy" || !summary->parameters.empty()) return fail("SUMMARY parameters not cleared");
        if (!ev.children.empty()) return fail("VALARM survived");
        for (const char* gone : {"DESCRIPTION", "LOCATION", "ORGANIZER", "ATTENDEE", "CATEGORIES", "CLASS"}) {
            if (ev.find_property(gone)) return fail(std::string(gone) + " survived");
        }
        for (const char* kept : {"DTSTART", "DTEND", "RRULE", "EXDATE", "STATUS", "TRANSP", "SEQUENCE", "DTSTAMP"}) {
            if (!ev.find_property(kept)) return fail(std::string(kept) + " dropped");
        }
        if (ev.find_property("DTSTART")->find_parameter("TZID") == nullptr) return fail("DTSTART lost its TZID");

        const Component& todo = cal.children[2];
        if (todo.find_property("SUMMARY")->value != "busy" || todo.find_property("PRIORITY")) return fail("VTODO not rewritten");
        if (!todo.find_property("DUE")) return fail("VTODO DUE dropped");

        const Component& lunch = cal.children[3];
        if (lunch.find_property("URL")) return fail("URL survived");
        if (!lunch.find_property("DURATION")) return fail("DURATION dropped");
    }

    // an event with no SUMMARY gets one; duplicates collapse to one
    {
        std::string doc = crlf({"BEGIN:VCALENDAR", "BEGIN:VEVENT", "UID:1", "DTSTART:20240101T090000Z", "END:VEVENT",
                                "BEGIN:VEVENT", "UID:2", "SUMMARY:a", "SUMMARY:b", "END:VEVENT", "END:VCALENDAR"});
        Component root = transform::anonymize(parse_document(doc), base_config());
        const Component& first = root.children[0].children[0];
        if (!first.find_property("SUMMARY") || first.find_property("SUMMARY")->value != "busy") return fail("missing SUMMARY not added");
        const Component& second = root.children[0].children[1];
        std::size_t n = 0;
        for (const auto& p : second.properties) if (p.is("SUMMARY")) ++n;
        if (n != 1) return fail("duplicate SUMMARY not collapsed");
    }

    // NAME is renamed like X-WR-CALNAME and no second name is added beside it
    {
        std::string doc = crlf({"BEGIN:VCALENDAR", "NAME:Jane", "X-WR-CALNAME:Jane", "END:VCALENDAR"});
        Component root = transform::anonymize(parse_document(doc), base_config());
        const Component& cal = root.children[0];
        if (cal.properties.size() != 2) return fail("calendar name properties duplicated");
        if (cal.find_property("NAME")->value != "Jane (busy times)") return fail("NAME not renamed");
    }

    // unknown property gate
    {
        std::string doc = crlf({"BEGIN:VCALENDAR", "BEGIN:VEVENT", "UID:1", "SUMMARY:x", "X-SECRET-NOTE:hi", "END:VEVENT", "END:VCALENDAR"});
        try {
            transform::anonymize(parse_document(doc), base_config());
            return fail("unknown property accepted");
        } catch (const IcalError& e) {
            if (e.kind() != ErrorKind::UnknownProperty || e.property() != "X-SECRET-NOTE") return fail("wrong error for unknown property");
        }
        AnonymizeConfig lenient = base_config();
        lenient.ignore_unknown_properties = true;
        Component root = transform::anonymize(parse_document(doc), lenient);
        if (root.children[0].children[0].find_property("X-SECRET-NOTE")) return fail("unknown property not dropped");
    }

    // the gate also covers the calendar itself and other component types
    {
        std::string on_cal = crlf({"BEGIN:VCALENDAR", "X-ORIGINAL-URL:https://example.com/jane.ics", "END:VCALENDAR"});
        std::string in_fb = crlf({"BEGIN:VCALENDAR", "BEGIN:VFREEBUSY", "X-OWNER:jane", "END:VFREEBUSY", "END:VCALENDAR"});
        for (const std::string& doc : {on_cal, in_fb}) {
            bool thrown = false;
            try {
                transform::anonymize(parse_document(doc), base_config());
            } catch (const IcalError& e) {
                thrown = e.kind() == ErrorKind::UnknownProperty;
            }
            if (!thrown) return fail("unknown property outside events accepted");
        }
    }

    // free/busy and availability blocks keep their times but lose identities
    {
        std::string doc = crlf({
            "BEGIN:VCALENDAR",
            "BEGIN:VAVAILABILITY",
            "UID:avail-1",
            "ORGANIZER;CN=Jane:mailto:jane@secret.example",
            "DTSTART:20240101T080000Z",
            "BEGIN:AVAILABLE",
            "SUMMARY:Therapy with Dr Who",
            "LOCATION:Clinic 9",
            "DTSTART:20240102T090000Z",
            "DTEND:20240102T100000Z",
            "END:AVAILABLE",
            "END:VAVAILABILITY",
            "BEGIN:VFREEBUSY",
            "ORGANIZER:mailto:jane@secret.example",
            "ATTENDEE:mailto:bob@secret.example",
            "COMMENT:Therapy",
            "CONTACT:Dr Who office",
            "URL:https://clinic.example/jane",
            "FREEBUSY:20240103T090000Z/PT1H",
            "END:VFREEBUSY",
            "BEGIN:X-WRAPPER",
            "DESCRIPTION:wrapper notes",
            "BEGIN:VEVENT",
            "UID:nested",
            "SUMMARY:Nested secret",
            "DTSTART:20240104T090000Z",
            "END:VEVENT",
            "END:X-WRAPPER",
            "END:VCALENDAR",
        });
        Component root = transform::anonymize(parse_document(doc), base_config());
        std::string out = serialize(root);
        for (const char* secret : {"Therapy", "Dr Who", "Clinic 9", "jane@secret.example", "bob@secret.example", "clinic.example", "wrapper notes", "Nested secret", "avail-1", "CN=Jane"}) {
            if (contains(out, secret)) return fail(std::string("leaked ") + secret + ":\n" + out);
        }
        const Component& cal = root.children[0];
        const Component& avail = cal.children[0];
        if (!avail.find_property("DTSTART") || avail.find_property("UID")->value != crypto::hide_uid("avail-1", "s1")) return fail("VAVAILABILITY times or UID");
        const Component& slot = avail.children[0];
        if (slot.find_property("SUMMARY")->value != "busy" || !slot.find_property("DTEND")) return fail("AVAILABLE not redacted");
        if (slot.find_property("LOCATION")) return fail("AVAILABLE LOCATION kept");
        const Component& fb = cal.children[1];
        if (!fb.find_property("FREEBUSY") || fb.find_property("SUMMARY")) return fail("VFREEBUSY should keep FREEBUSY and gain no SUMMARY");
        const Component& nested = cal.children[2].children[0];
        if (nested.find_property("SUMMARY")->value != "busy" || nested.find_property("UID")->value != crypto::hide_uid("nested", "s1")) return fail("nested event not rewritten");
    }

    // timezones are passed through, vendor extensions included
    {
        Component root = transform::anonymize(parse_document(rich_doc()), base_config());
        if (!root.children[0].children[0].find_property("X-LIC-LOCATION")) return fail("X-LIC-LOCATION removed from VTIMEZONE");
    }

    std::cout << "anonymize_unit ok\n";
    return 0;
}
