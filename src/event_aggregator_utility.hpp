#pragma once

#include <dftracer/utils/core/common/logging.h>
#include <dftracer/utils/core/utilities/utility.h>

#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

#include "aggregation_metrics.hpp"
#include "composite_key.hpp"
#include "query_config.hpp"
#include "trace_event.hpp"

using namespace dftracer::utils;

struct EventAggregatorInput {
    TraceEvents events;
    AggregateRequest request;

    static EventAggregatorInput from_events(const TraceEvents& events) {
        EventAggregatorInput input;
        input.events = events;
        return input;
    }

    EventAggregatorInput& with_request(const AggregateRequest& req) {
        request = req;
        return *this;
    }

    EventAggregatorInput& with_config(const QueryConfig& config) {
        if (!request.field.empty()) {
            request.field = config.resolve_field(request.field);
        }
        return *this;
    }
};

/**
 * @brief Computes one scalar statistic over a set of events.
 *
 * COUNT counts events regardless of field. The other ops coerce the field
 * of every event to a number and silently drop events where that fails,
 * including events without the field.
 */
class EventAggregatorUtility
    : public utilities::Utility<EventAggregatorInput, AggregateResult> {
   public:
    static AggregateResult aggregate(const TraceEvents& events,
                                     const AggregateRequest& request) {
        request.validate();

        if (request.op == AggregateOp::COUNT) {
            AggregateResult result;
            result.op = AggregateOp::COUNT;
            result.count = events.size();
            result.value = static_cast<double>(events.size());
            return result;
        }

        NumericAccumulator accumulator;
        for (const auto& event : events) {
            auto number = event.field(request.field).as_number();
            if (number) accumulator.update(*number);
        }

        DFTRACER_UTILS_LOG_DEBUG(
            "%s(%s): %llu of %zu events numeric, stddev %.6g",
            to_string(request.op), request.field.c_str(),
            static_cast<unsigned long long>(accumulator.count), events.size(),
            accumulator.get_stddev());
        return accumulator.to_result(request.op);
    }

    AggregateResult process(const EventAggregatorInput& input) override {
        return aggregate(input.events, input.request);
    }
};

inline AggregateResult aggregate(const TraceEvents& events,
                                 const AggregateRequest& request) {
    return EventAggregatorUtility::aggregate(events, request);
}

// ============================================================================
// Grouped aggregation
// ============================================================================

struct GroupedAggregatorInput {
    TraceEvents events;
    std::vector<std::string> group_by;
    AggregateRequest request;
    std::string separator = "|";

    static GroupedAggregatorInput from_events(const TraceEvents& events) {
        GroupedAggregatorInput input;
        input.events = events;
        return input;
    }

    GroupedAggregatorInput& with_group_by(
        const std::vector<std::string>& fields) {
        group_by = fields;
        return *this;
    }

    GroupedAggregatorInput& with_request(const AggregateRequest& req) {
        request = req;
        return *this;
    }

    GroupedAggregatorInput& with_config(const QueryConfig& config) {
        group_by = config.resolve_fields(group_by);
        if (!request.field.empty()) {
            request.field = config.resolve_field(request.field);
        }
        separator = config.flow_key_separator;
        return *this;
    }
};

struct GroupAggregate {
    std::string key;
    std::size_t events = 0;
    AggregateResult result;
};

using GroupedAggregatorOutput = std::vector<GroupAggregate>;

/**
 * @brief Partitions events by the joined values of group_by fields and
 * aggregates each partition. Groups appear in first-appearance order;
 * missing values group under empty text.
 */
class GroupedAggregatorUtility
    : public utilities::Utility<GroupedAggregatorInput,
                                GroupedAggregatorOutput> {
   public:
    GroupedAggregatorOutput process(
        const GroupedAggregatorInput& input) override {
        input.request.validate();

        std::vector<std::string> keys;
        std::unordered_map<std::string, TraceEvents> partitions;
        for (const auto& event : input.events) {
            CompositeKey key =
                build_composite_key(event, input.group_by, input.separator);
            auto it = partitions.find(key.joined);
            if (it == partitions.end()) {
                keys.push_back(key.joined);
                it = partitions.emplace(key.joined, TraceEvents{}).first;
            }
            it->second.push_back(event);
        }

        GroupedAggregatorOutput output;
        output.reserve(keys.size());
        for (const auto& key : keys) {
            const TraceEvents& members = partitions.at(key);
            GroupAggregate group;
            group.key = key;
            group.events = members.size();
            group.result =
                EventAggregatorUtility::aggregate(members, input.request);
            output.push_back(std::move(group));
        }

        DFTRACER_UTILS_LOG_INFO("Aggregated %zu events into %zu groups (%s)",
                                input.events.size(), output.size(),
                                to_string(input.request.op));
        return output;
    }
};

// ============================================================================
// Top-K field values
// ============================================================================

struct ValueCount {
    std::string value;
    std::size_t count = 0;
};

/**
 * @brief Most frequent text values of a field, by descending count with
 * ties in first-appearance order. Events without the field are ignored.
 */
inline std::vector<ValueCount> top_k_values(const TraceEvents& events,
                                            const std::string& field,
                                            std::size_t k) {
    std::vector<ValueCount> counts;
    std::unordered_map<std::string, std::size_t> position;
    for (const auto& event : events) {
        auto text = event.field(field).as_text();
        if (!text) continue;

        auto it = position.find(*text);
        if (it == position.end()) {
            position.emplace(*text, counts.size());
            counts.push_back(ValueCount{*text, 1});
        } else {
            counts[it->second].count++;
        }
    }

    std::stable_sort(counts.begin(), counts.end(),
                     [](const ValueCount& a, const ValueCount& b) {
                         return a.count > b.count;
                     });
    if (counts.size() > k) counts.resize(k);
    return counts;
}

// Field alias resolved and K taken from the configuration
inline std::vector<ValueCount> top_k_values(const TraceEvents& events,
                                            const std::string& field,
                                            const QueryConfig& config) {
    return top_k_values(events, config.resolve_field(field), config.top_k);
}
