#pragma once

#include <string_view>

namespace ical {

// Every property name the engine knows about. Anything else is Unrecognized.
enum class PropertyKind {
    // descriptive / identity
    Summary,
    Description,
    Location,
    Attendee,
    Organizer,
    Comment,
    Categories,
    Class,
    Contact,
    Resources,
    Url,
    Geo,
    Attach,
    RelatedTo,
    Priority,
    RequestStatus,
    Conference,
    Image,
    XAltDesc,
    Color,
    // schedule
    Uid,
    DtStart,
    DtEnd,
    Duration,
    Due,
    RRule,
    RDate,
    ExDate,
    ExRule,
    RecurrenceId,
    Status,
    Transp,
    Sequence,
    DtStamp,
    Created,
    LastModified,
    Completed,
    PercentComplete,
    FreeBusy,
    // timezone
    TzId,
    TzName,
    TzOffsetFrom,
    TzOffsetTo,
    TzUrl,
    // alarm
    Action,
    Trigger,
    Repeat,
    // calendar
    ProdId,
    Version,
    CalScale,
    Method,
    Name,
    Source,
    RefreshInterval,
    XWrCalName,
    XWrCalDesc,
    XWrTimezone,
    XPublishedTtl,

    Unrecognized
};

enum class ComponentKind {
    Calendar,
    Event,
    Todo,
    Journal,
    FreeBusy,
    Timezone,
    Standard,
    Daylight,
    Alarm,
    Availability,
    Unrecognized
};

PropertyKind classify_property(std::string_view name);
ComponentKind classify_component(std::string_view kind);

// Whether values of this property are TEXT and therefore carry backslash
// escapes. List-valued and structured values are kept raw.
bool is_text_valued(PropertyKind kind);

// VEVENT, VTODO and VJOURNAL.
bool is_event_like(ComponentKind kind);

bool iequals(std::string_view a, std::string_view b);

}
