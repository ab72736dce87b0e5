#pragma once

#include <dftracer/utils/core/common/logging.h>
#include <dftracer/utils/core/utilities/utility.h>
#include <re2/re2.h>

#include <algorithm>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

#include "filter_compiler_utility.hpp"
#include "query_config.hpp"
#include "query_error.hpp"
#include "trace_event.hpp"

using namespace dftracer::utils;

enum class EventOrder {
    SOURCE,     // as loaded
    FIELD,      // by text of sort_field, ascending
    TIMESTAMP,  // by numeric timestamp, ascending
};

struct EventViewInput {
    TraceEvents events;
    std::string filter;
    EventOrder order = EventOrder::SOURCE;
    std::string sort_field;
    std::size_t limit = std::numeric_limits<std::size_t>::max();
    QueryConfig config;

    static EventViewInput from_events(const TraceEvents& events) {
        EventViewInput input;
        input.events = events;
        return input;
    }

    EventViewInput& with_filter(const std::string& query) {
        filter = query;
        return *this;
    }

    EventViewInput& sorted_by(const std::string& field) {
        order = EventOrder::FIELD;
        sort_field = field;
        return *this;
    }

    EventViewInput& by_timestamp() {
        order = EventOrder::TIMESTAMP;
        return *this;
    }

    EventViewInput& with_limit(std::size_t max_events) {
        limit = max_events;
        return *this;
    }

    EventViewInput& with_config(const QueryConfig& cfg) {
        config = cfg;
        return *this;
    }
};

struct EventViewOutput {
    TraceEvents events;
    std::size_t total_matched = 0;  // before the limit
};

/**
 * @brief Filter, order and truncate a loaded event set.
 *
 * Sorting is stable. Field order compares text representations, with
 * missing values first.
 */
class EventViewUtility
    : public utilities::Utility<EventViewInput, EventViewOutput> {
   public:
    EventViewOutput process(const EventViewInput& input) override {
        EventPredicate predicate = compile_filter(input.filter, input.config);

        EventViewOutput output;
        output.events = filter_events(input.events, predicate);
        output.total_matched = output.events.size();

        if (input.order == EventOrder::FIELD) {
            const std::string field =
                input.config.resolve_field(input.sort_field);
            std::stable_sort(output.events.begin(), output.events.end(),
                             [&field](const TraceEvent& a,
                                      const TraceEvent& b) {
                                 return a.field(field).as_text().value_or("") <
                                        b.field(field).as_text().value_or("");
                             });
        } else if (input.order == EventOrder::TIMESTAMP) {
            const std::string& ts_field = input.config.timestamp_field;
            std::stable_sort(output.events.begin(), output.events.end(),
                             [&ts_field](const TraceEvent& a,
                                         const TraceEvent& b) {
                                 return a.timestamp(ts_field) <
                                        b.timestamp(ts_field);
                             });
        }

        if (output.events.size() > input.limit) {
            output.events.resize(input.limit);
        }
        return output;
    }
};

inline EventViewOutput select_events(const TraceEvents& events,
                                     const std::string& filter,
                                     const QueryConfig& config = {}) {
    return EventViewUtility{}.process(EventViewInput::from_events(events)
                                          .with_filter(filter)
                                          .with_config(config)
                                          .with_limit(config.default_limit));
}

inline TraceEvents timeline(const TraceEvents& events,
                            const std::string& filter = "",
                            const QueryConfig& config = {}) {
    return EventViewUtility{}
        .process(EventViewInput::from_events(events)
                     .with_filter(filter)
                     .with_config(config)
                     .by_timestamp())
        .events;
}

/**
 * @brief Events whose error fields match the configured error pattern.
 *
 * @throws QueryError (CONFIG) if the error pattern does not compile
 */
inline TraceEvents find_error_events(const TraceEvents& events,
                                     const std::string& filter = "",
                                     const QueryConfig& config = {}) {
    re2::RE2::Options options;
    options.set_log_errors(false);
    re2::RE2 pattern(config.error_pattern, options);
    if (!pattern.ok()) {
        throw QueryError(QueryStage::CONFIG, "invalid error pattern \"" +
                                                 config.error_pattern +
                                                 "\": " + pattern.error());
    }

    EventPredicate predicate = compile_filter(filter, config);
    TraceEvents hits;
    for (const auto& event : events) {
        if (hits.size() >= config.max_error_events) break;
        if (!predicate(event)) continue;

        for (const auto& field : config.error_fields) {
            auto text = event.field(config.resolve_field(field)).as_text();
            if (text && re2::RE2::PartialMatch(*text, pattern)) {
                hits.push_back(event);
                break;
            }
        }
    }

    DFTRACER_UTILS_LOG_INFO("Found %zu error events among %zu", hits.size(),
                            events.size());
    return hits;
}
