#include "Pipeline.h"

namespace core {

CoreResult anonymize(std::string_view raw, const transform::AnonymizeConfig& cfg) {
    return run_pipeline("anonymize", raw, [&cfg](ical::Component doc) { return transform::anonymize(std::move(doc), cfg); });
}

CoreResult filter(std::string_view raw, const transform::FilterConfig& cfg) {
    return run_pipeline("filter", raw, [&cfg](ical::Component doc) { return transform::filter(std::move(doc), cfg); });
}

}
