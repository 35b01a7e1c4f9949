#include "Anonymize.h"
#include "crypto/Digest.h"
#include "ical/Errors.h"
#include "observability/Logging.h"

#include <utility>
#include <vector>

namespace transform {

using ical::Component;
using ical::ComponentKind;
using ical::ContentLine;
using ical::PropertyKind;

Disposition event_disposition(PropertyKind kind) {
    switch (kind) {
        case PropertyKind::Summary:
            return Disposition::Redact;
        case PropertyKind::Uid:
            return Disposition::HideUid;

        case PropertyKind::DtStart:
        case PropertyKind::DtEnd:
        case PropertyKind::Duration:
        case PropertyKind::Due:
        case PropertyKind::RRule:
        case PropertyKind::RDate:
        case PropertyKind::ExDate:
        case PropertyKind::ExRule:
        case PropertyKind::RecurrenceId:
        case PropertyKind::Status:
        case PropertyKind::Transp:
        case PropertyKind::Sequence:
        case PropertyKind::DtStamp:
            return Disposition::Keep;

        case PropertyKind::Description:
        case PropertyKind::Location:
        case PropertyKind::Attendee:
        case PropertyKind::Organizer:
        case PropertyKind::Comment:
        case PropertyKind::Categories:
        case PropertyKind::Class:
        case PropertyKind::Contact:
        case PropertyKind::Resources:
        case PropertyKind::Url:
        case PropertyKind::Geo:
        case PropertyKind::Attach:
        case PropertyKind::RelatedTo:
        case PropertyKind::Priority:
        case PropertyKind::RequestStatus:
        case PropertyKind::Conference:
        case PropertyKind::Image:
        case PropertyKind::XAltDesc:
        case PropertyKind::Color:
        case PropertyKind::Created:
        case PropertyKind::LastModified:
        case PropertyKind::Completed:
        case PropertyKind::PercentComplete:
            return Disposition::Remove;

        // known, but they have no business inside an event
        case PropertyKind::FreeBusy:
        case PropertyKind::TzId:
        case PropertyKind::TzName:
        case PropertyKind::TzOffsetFrom:
        case PropertyKind::TzOffsetTo:
        case PropertyKind::TzUrl:
        case PropertyKind::Action:
        case PropertyKind::Trigger:
        case PropertyKind::Repeat:
        case PropertyKind::ProdId:
        case PropertyKind::Version:
        case PropertyKind::CalScale:
        case PropertyKind::Method:
        case PropertyKind::Name:
        case PropertyKind::Source:
        case PropertyKind::RefreshInterval:
        case PropertyKind::XWrCalName:
        case PropertyKind::XWrCalDesc:
        case PropertyKind::XWrTimezone:
        case PropertyKind::XPublishedTtl:
            return Disposition::Remove;

        case PropertyKind::Unrecognized:
            return Disposition::Unknown;
    }
    return Disposition::Unknown;
}

Disposition calendar_disposition(PropertyKind kind) {
    switch (kind) {
        case PropertyKind::XWrCalName:
        case PropertyKind::Name:
            return Disposition::Rename;

        case PropertyKind::ProdId:
        case PropertyKind::Version:
        case PropertyKind::CalScale:
        case PropertyKind::Method:
        case PropertyKind::XWrTimezone:
        case PropertyKind::RefreshInterval:
        case PropertyKind::XPublishedTtl:
        case PropertyKind::Color:
            return Disposition::Keep;

        case PropertyKind::XWrCalDesc:
        case PropertyKind::Description:
        case PropertyKind::Url:
        case PropertyKind::Source:
        case PropertyKind::Image:
        case PropertyKind::Summary:
        case PropertyKind::Location:
        case PropertyKind::Attendee:
        case PropertyKind::Organizer:
        case PropertyKind::Comment:
        case PropertyKind::Categories:
        case PropertyKind::Class:
        case PropertyKind::Contact:
        case PropertyKind::Resources:
        case PropertyKind::Geo:
        case PropertyKind::Attach:
        case PropertyKind::RelatedTo:
        case PropertyKind::Priority:
        case PropertyKind::RequestStatus:
        case PropertyKind::Conference:
        case PropertyKind::XAltDesc:
        case PropertyKind::Uid:
        case PropertyKind::DtStart:
        case PropertyKind::DtEnd:
        case PropertyKind::Duration:
        case PropertyKind::Due:
        case PropertyKind::RRule:
        case PropertyKind::RDate:
        case PropertyKind::ExDate:
        case PropertyKind::ExRule:
        case PropertyKind::RecurrenceId:
        case PropertyKind::Status:
        case PropertyKind::Transp:
        case PropertyKind::Sequence:
        case PropertyKind::DtStamp:
        case PropertyKind::Created:
        case PropertyKind::LastModified:
        case PropertyKind::Completed:
        case PropertyKind::PercentComplete:
        case PropertyKind::FreeBusy:
        case PropertyKind::TzId:
        case PropertyKind::TzName:
        case PropertyKind::TzOffsetFrom:
        case PropertyKind::TzOffsetTo:
        case PropertyKind::TzUrl:
        case PropertyKind::Action:
        case PropertyKind::Trigger:
        case PropertyKind::Repeat:
            return Disposition::Remove;

        case PropertyKind::Unrecognized:
            return Disposition::Unknown;
    }
    return Disposition::Unknown;
}

Disposition component_disposition(PropertyKind kind) {
    switch (kind) {
        case PropertyKind::Summary:
            return Disposition::Redact;
        case PropertyKind::Uid:
            return Disposition::HideUid;

        case PropertyKind::Description:
        case PropertyKind::Location:
        case PropertyKind::Attendee:
        case PropertyKind::Organizer:
        case PropertyKind::Comment:
        case PropertyKind::Categories:
        case PropertyKind::Contact:
        case PropertyKind::Resources:
        case PropertyKind::Url:
        case PropertyKind::Geo:
        case PropertyKind::Attach:
        case PropertyKind::RelatedTo:
        case PropertyKind::RequestStatus:
        case PropertyKind::Conference:
        case PropertyKind::Image:
        case PropertyKind::XAltDesc:
        case PropertyKind::Name:
        case PropertyKind::Source:
        case PropertyKind::XWrCalName:
        case PropertyKind::XWrCalDesc:
            return Disposition::Remove;

        case PropertyKind::Class:
        case PropertyKind::Priority:
        case PropertyKind::Color:
        case PropertyKind::DtStart:
        case PropertyKind::DtEnd:
        case PropertyKind::Duration:
        case PropertyKind::Due:
        case PropertyKind::RRule:
        case PropertyKind::RDate:
        case PropertyKind::ExDate:
        case PropertyKind::ExRule:
        case PropertyKind::RecurrenceId:
        case PropertyKind::Status:
        case PropertyKind::Transp:
        case PropertyKind::Sequence:
        case PropertyKind::DtStamp:
        case PropertyKind::Created:
        case PropertyKind::LastModified:
        case PropertyKind::Completed:
        case PropertyKind::PercentComplete:
        case PropertyKind::FreeBusy:
        case PropertyKind::TzId:
        case PropertyKind::TzName:
        case PropertyKind::TzOffsetFrom:
        case PropertyKind::TzOffsetTo:
        case PropertyKind::TzUrl:
        case PropertyKind::Action:
        case PropertyKind::Trigger:
        case PropertyKind::Repeat:
        case PropertyKind::ProdId:
        case PropertyKind::Version:
        case PropertyKind::CalScale:
        case PropertyKind::Method:
        case PropertyKind::RefreshInterval:
        case PropertyKind::XWrTimezone:
        case PropertyKind::XPublishedTtl:
            return Disposition::Keep;

        case PropertyKind::Unrecognized:
            return Disposition::Unknown;
    }
    return Disposition::Unknown;
}

namespace {

void reject_or_drop(const ContentLine& p, const Component& owner, const AnonymizeConfig& cfg) {
    if (!cfg.ignore_unknown_properties) {
        throw ical::IcalError(ical::ErrorKind::UnknownProperty, "unrecognized property " + p.name + " in " + owner.kind, 0, p.name);
    }
    observability::log_debug("unknown_property_dropped", {{"property", p.name}, {"component", owner.kind}});
}

void rewrite_calendar(Component& cal, const AnonymizeConfig& cfg, bool ensure_name) {
    std::vector<ContentLine> kept;
    kept.reserve(cal.properties.size() + 1);
    bool named = false;
    for (auto& p : cal.properties) {
        switch (calendar_disposition(p.kind())) {
            case Disposition::Keep:
                kept.push_back(std::move(p));
                break;
            case Disposition::Rename:
                if (p.kind() == PropertyKind::XWrCalName) named = true;
                p.value = cfg.calendar_name;
                kept.push_back(std::move(p));
                break;
            case Disposition::Unknown:
                reject_or_drop(p, cal, cfg);
                break;
            case Disposition::Redact:
            case Disposition::HideUid:
            case Disposition::Remove:
                break;
        }
    }
    cal.properties = std::move(kept);
    if (ensure_name && !named) cal.set_property("X-WR-CALNAME", cfg.calendar_name);
}

// Applies `disposition` to every property of `c`; true when a SUMMARY was redacted.
bool apply_dispositions(Component& c, const AnonymizeConfig& cfg, Disposition (*disposition)(PropertyKind)) {
    std::vector<ContentLine> kept;
    kept.reserve(c.properties.size() + 1);
    bool redacted = false;
    for (auto& p : c.properties) {
        switch (disposition(p.kind())) {
            case Disposition::Keep:
                kept.push_back(std::move(p));
                break;
            case Disposition::Redact:
                if (redacted) break;
                redacted = true;
                p.parameters.clear();
                p.value = cfg.redaction_message;
                kept.push_back(std::move(p));
                break;
            case Disposition::HideUid:
                p.parameters.clear();
                p.value = crypto::hide_uid(p.value, cfg.seed);
                kept.push_back(std::move(p));
                break;
            case Disposition::Unknown:
                reject_or_drop(p, c, cfg);
                break;
            case Disposition::Rename:
            case Disposition::Remove:
                break;
        }
    }
    c.properties = std::move(kept);
    return redacted;
}

void rewrite_event(Component& ev, const AnonymizeConfig& cfg) {
    if (!apply_dispositions(ev, cfg, event_disposition)) ev.set_property("SUMMARY", cfg.redaction_message);
    ev.children.clear();
}

void rewrite_child(Component& c, const AnonymizeConfig& cfg);

// VFREEBUSY, VAVAILABILITY and unknown blocks: times survive, identities do not.
void scrub_component(Component& c, const AnonymizeConfig& cfg) {
    apply_dispositions(c, cfg, component_disposition);
    for (auto& child : c.children) rewrite_child(child, cfg);
}

void rewrite_child(Component& c, const AnonymizeConfig& cfg) {
    ComponentKind k = c.component_kind();
    if (k == ComponentKind::Timezone) return;
    if (ical::is_event_like(k)) rewrite_event(c, cfg);
    else scrub_component(c, cfg);
}

}

Component anonymize(Component root, const AnonymizeConfig& cfg) {
    rewrite_calendar(root, cfg, false);
    for (auto& top : root.children) {
        if (top.component_kind() != ComponentKind::Calendar) {
            rewrite_child(top, cfg);
            continue;
        }
        rewrite_calendar(top, cfg, true);
        for (auto& child : top.children) rewrite_child(child, cfg);
    }
    return root;
}

}
