#pragma once

#include <string>
#include "ical/Document.h"
#include "ical/Kinds.h"

namespace transform {

struct AnonymizeConfig {
    std::string calendar_name;
    std::string redaction_message;
    std::string seed;
    bool ignore_unknown_properties = false;
};

// What happens to a property of a given kind.
enum class Disposition { Keep, Redact, HideUid, Rename, Remove, Unknown };

Disposition event_disposition(ical::PropertyKind kind);
Disposition calendar_disposition(ical::PropertyKind kind);
// Components that are neither events nor timezones.
Disposition component_disposition(ical::PropertyKind kind);

// Rewrites the tree so that only scheduling information survives.
// Throws ical::IcalError(UnknownProperty) when an unrecognized property is
// met and cfg.ignore_unknown_properties is false.
ical::Component anonymize(ical::Component root, const AnonymizeConfig& cfg);

}
