#pragma once

#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include "ical/Document.h"
#include "ical/Errors.h"
#include "ical/Serializer.h"
#include "observability/Logging.h"
#include "transform/Anonymize.h"
#include "transform/Filter.h"

namespace core {

struct CoreResult {
    bool ok = false;
    std::string body;
    std::optional<ical::CoreError> error;
};

// raw feed in, rewritten feed out; errors come back in `error`, never as exceptions
CoreResult anonymize(std::string_view raw, const transform::AnonymizeConfig& cfg);
CoreResult filter(std::string_view raw, const transform::FilterConfig& cfg);

// parse, rewrite, serialize. IcalError keeps its kind; any other exception
// from the rewrite is reported as ErrorKind::Internal.
template <typename Rewrite>
CoreResult run_pipeline(const char* name, std::string_view raw, Rewrite&& rewrite) {
    CoreResult res;
    try {
        ical::Component doc = ical::parse_document(raw);
        std::size_t events_in = transform::count_event_like(doc);
        ical::Component out = rewrite(std::move(doc));
        res.body = ical::serialize(out);
        res.ok = true;
        observability::log_debug("pipeline_done", {
            {"transform", std::string(name)},
            {"bytes_in", int64_t(raw.size())},
            {"bytes_out", int64_t(res.body.size())},
            {"events_in", int64_t(events_in)},
            {"events_out", int64_t(transform::count_event_like(out))}});
    } catch (const ical::IcalError& e) {
        res.ok = false;
        res.body.clear();
        res.error = e.to_core_error();
        observability::log_debug("pipeline_failed", {{"transform", std::string(name)}, {"kind", std::string(ical::error_kind_name(e.kind()))}, {"error", std::string(e.what())}});
    } catch (const std::exception& e) {
        res.ok = false;
        res.body.clear();
        ical::CoreError err;
        err.kind = ical::ErrorKind::Internal;
        err.message = e.what();
        res.error = std::move(err);
        observability::log_error("pipeline_internal_error", {{"transform", std::string(name)}, {"error", std::string(e.what())}});
    }
    return res;
}

}
