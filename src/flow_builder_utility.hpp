#pragma once

#include <dftracer/utils/core/common/logging.h>
#include <dftracer/utils/core/utilities/utility.h>

#include <algorithm>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "composite_key.hpp"
#include "query_config.hpp"
#include "trace_event.hpp"

using namespace dftracer::utils;

struct FlowBuilderInput {
    TraceEvents events;
    std::vector<std::string> key_fields;
    std::string separator = "|";
    std::string timestamp_field = "timestamp";

    static FlowBuilderInput from_events(const TraceEvents& events) {
        FlowBuilderInput input;
        input.events = events;
        return input;
    }

    FlowBuilderInput& with_keys(const std::vector<std::string>& keys) {
        key_fields = keys;
        return *this;
    }

    // Takes separator, timestamp field, aliases and default keys
    FlowBuilderInput& with_config(const QueryConfig& config) {
        if (key_fields.empty()) key_fields = config.correlation_keys;
        key_fields = config.resolve_fields(key_fields);
        separator = config.flow_key_separator;
        timestamp_field = config.timestamp_field;
        return *this;
    }
};

// Events sharing one composite key, ordered by timestamp
struct FlowGroup {
    std::string key;
    TraceEvents events;
};

struct FlowBuilderOutput {
    std::vector<FlowGroup> flows;  // first-appearance order of keys
    std::unordered_map<std::string, std::size_t> index;
    std::size_t events_excluded = 0;  // blank composite key
    std::string timestamp_field = "timestamp";

    const FlowGroup* find(const std::string& key) const {
        auto it = index.find(key);
        return it != index.end() ? &flows[it->second] : nullptr;
    }

    std::size_t size() const { return flows.size(); }
};

/**
 * @brief Groups events into flows by composite key.
 *
 * Events whose key fields are all missing or empty belong to no flow.
 * Each flow is stable-sorted by timestamp (missing timestamp is 0), so
 * events with equal timestamps keep their source order.
 */
class FlowBuilderUtility
    : public utilities::Utility<FlowBuilderInput, FlowBuilderOutput> {
   public:
    FlowBuilderOutput process(const FlowBuilderInput& input) override {
        FlowBuilderOutput output;
        output.timestamp_field = input.timestamp_field;

        if (input.key_fields.empty()) {
            DFTRACER_UTILS_LOG_WARN("%s",
                                    "No flow keys given, no flows built");
            output.events_excluded = input.events.size();
            return output;
        }

        for (const auto& event : input.events) {
            CompositeKey key =
                build_composite_key(event, input.key_fields, input.separator);
            if (key.blank()) {
                output.events_excluded++;
                continue;
            }

            auto it = output.index.find(key.joined);
            if (it == output.index.end()) {
                it = output.index.emplace(key.joined, output.flows.size())
                         .first;
                output.flows.push_back(FlowGroup{key.joined, {}});
            }
            output.flows[it->second].events.push_back(event);
        }

        const std::string& ts_field = input.timestamp_field;
        for (auto& flow : output.flows) {
            std::stable_sort(flow.events.begin(), flow.events.end(),
                             [&ts_field](const TraceEvent& a,
                                         const TraceEvent& b) {
                                 return a.timestamp(ts_field) <
                                        b.timestamp(ts_field);
                             });
        }

        DFTRACER_UTILS_LOG_INFO(
            "Built %zu flows from %zu events (%zu without a flow key)",
            output.flows.size(), input.events.size(), output.events_excluded);
        return output;
    }
};

inline FlowBuilderOutput build_flow(const TraceEvents& events,
                                    const std::vector<std::string>& keys) {
    return FlowBuilderUtility{}.process(
        FlowBuilderInput::from_events(events).with_keys(keys));
}

struct FlowSummary {
    std::string key;
    std::size_t count = 0;
    double first_timestamp = 0.0;
    double last_timestamp = 0.0;
};

inline std::vector<FlowSummary> summarize_flows(const FlowBuilderOutput& output) {
    std::vector<FlowSummary> summaries;
    summaries.reserve(output.flows.size());
    for (const auto& flow : output.flows) {
        FlowSummary summary;
        summary.key = flow.key;
        summary.count = flow.events.size();
        if (!flow.events.empty()) {
            summary.first_timestamp =
                flow.events.front().timestamp(output.timestamp_field);
            summary.last_timestamp =
                flow.events.back().timestamp(output.timestamp_field);
        }
        summaries.push_back(std::move(summary));
    }
    return summaries;
}
