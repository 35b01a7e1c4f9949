#include "Kinds.h"

#include <cctype>
#include <cstddef>

namespace ical {

namespace {

struct PropertyEntry {
    std::string_view name;
    PropertyKind kind;
};

constexpr PropertyEntry kProperties[] = {
    {"SUMMARY", PropertyKind::Summary},
    {"DESCRIPTION", PropertyKind::Description},
    {"LOCATION", PropertyKind::Location},
    {"ATTENDEE", PropertyKind::Attendee},
    {"ORGANIZER", PropertyKind::Organizer},
    {"COMMENT", PropertyKind::Comment},
    {"CATEGORIES", PropertyKind::Categories},
    {"CLASS", PropertyKind::Class},
    {"CONTACT", PropertyKind::Contact},
    {"RESOURCES", PropertyKind::Resources},
    {"URL", PropertyKind::Url},
    {"GEO", PropertyKind::Geo},
    {"ATTACH", PropertyKind::Attach},
    {"RELATED-TO", PropertyKind::RelatedTo},
    {"PRIORITY", PropertyKind::Priority},
    {"REQUEST-STATUS", PropertyKind::RequestStatus},
    {"CONFERENCE", PropertyKind::Conference},
    {"IMAGE", PropertyKind::Image},
    {"X-ALT-DESC", PropertyKind::XAltDesc},
    {"COLOR", PropertyKind::Color},
    {"UID", PropertyKind::Uid},
    {"DTSTART", PropertyKind::DtStart},
    {"DTEND", PropertyKind::DtEnd},
    {"DURATION", PropertyKind::Duration},
    {"DUE", PropertyKind::Due},
    {"RRULE", PropertyKind::RRule},
    {"RDATE", PropertyKind::RDate},
    {"EXDATE", PropertyKind::ExDate},
    {"EXRULE", PropertyKind::ExRule},
    {"RECURRENCE-ID", PropertyKind::RecurrenceId},
    {"STATUS", PropertyKind::Status},
    {"TRANSP", PropertyKind::Transp},
    {"SEQUENCE", PropertyKind::Sequence},
    {"DTSTAMP", PropertyKind::DtStamp},
    {"CREATED", PropertyKind::Created},
    {"LAST-MODIFIED", PropertyKind::LastModified},
    {"COMPLETED", PropertyKind::Completed},
    {"PERCENT-COMPLETE", PropertyKind::PercentComplete},
    {"FREEBUSY", PropertyKind::FreeBusy},
    {"TZID", PropertyKind::TzId},
    {"TZNAME", PropertyKind::TzName},
    {"TZOFFSETFROM", PropertyKind::TzOffsetFrom},
    {"TZOFFSETTO", PropertyKind::TzOffsetTo},
    {"TZURL", PropertyKind::TzUrl},
    {"ACTION", PropertyKind::Action},
    {"TRIGGER", PropertyKind::Trigger},
    {"REPEAT", PropertyKind::Repeat},
    {"PRODID", PropertyKind::ProdId},
    {"VERSION", PropertyKind::Version},
    {"CALSCALE", PropertyKind::CalScale},
    {"METHOD", PropertyKind::Method},
    {"NAME", PropertyKind::Name},
    {"SOURCE", PropertyKind::Source},
    {"REFRESH-INTERVAL", PropertyKind::RefreshInterval},
    {"X-WR-CALNAME", PropertyKind::XWrCalName},
    {"X-WR-CALDESC", PropertyKind::XWrCalDesc},
    {"X-WR-TIMEZONE", PropertyKind::XWrTimezone},
    {"X-PUBLISHED-TTL", PropertyKind::XPublishedTtl},
};

struct ComponentEntry {
    std::string_view name;
    ComponentKind kind;
};

constexpr ComponentEntry kComponents[] = {
    {"VCALENDAR", ComponentKind::Calendar},
    {"VEVENT", ComponentKind::Event},
    {"VTODO", ComponentKind::Todo},
    {"VJOURNAL", ComponentKind::Journal},
    {"VFREEBUSY", ComponentKind::FreeBusy},
    {"VTIMEZONE", ComponentKind::Timezone},
    {"STANDARD", ComponentKind::Standard},
    {"DAYLIGHT", ComponentKind::Daylight},
    {"VALARM", ComponentKind::Alarm},
    {"VAVAILABILITY", ComponentKind::Availability},
};

}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) != std::toupper(static_cast<unsigned char>(b[i]))) return false;
    }
    return true;
}

PropertyKind classify_property(std::string_view name) {
    for (const auto& e : kProperties) {
        if (iequals(e.name, name)) return e.kind;
    }
    return PropertyKind::Unrecognized;
}

ComponentKind classify_component(std::string_view kind) {
    for (const auto& e : kComponents) {
        if (iequals(e.name, kind)) return e.kind;
    }
    return ComponentKind::Unrecognized;
}

bool is_text_valued(PropertyKind kind) {
    switch (kind) {
        case PropertyKind::Summary:
        case PropertyKind::Description:
        case PropertyKind::Location:
        case PropertyKind::Comment:
        case PropertyKind::Contact:
        case PropertyKind::Uid:
        case PropertyKind::XAltDesc:
        case PropertyKind::TzId:
        case PropertyKind::TzName:
        case PropertyKind::ProdId:
        case PropertyKind::Name:
        case PropertyKind::XWrCalName:
        case PropertyKind::XWrCalDesc:
        case PropertyKind::XWrTimezone:
            return true;
        default:
            return false;
    }
}

bool is_event_like(ComponentKind kind) {
    return kind == ComponentKind::Event || kind == ComponentKind::Todo || kind == ComponentKind::Journal;
}

}
