#pragma once

#include <dftracer/utils/core/common/logging.h>
#include <dftracer/utils/core/utilities/utility.h>

#include <cstddef>
#include <fstream>
#include <functional>
#include <istream>
#include <map>
#include <sstream>
#include <string>

#include "query_error.hpp"
#include "trace_event.hpp"
#include "trace_parser.hpp"

using namespace dftracer::utils;

// Field name -> number of events carrying it
using FieldFrequencyTable = std::map<std::string, std::size_t>;

/**
 * @brief Source of newline-delimited JSON records: a file or a string.
 */
struct EventLoaderInput {
    std::string file_path;
    std::string content;
    bool in_memory = false;

    static EventLoaderInput from_file(const std::string& path) {
        EventLoaderInput input;
        input.file_path = path;
        return input;
    }

    static EventLoaderInput from_string(const std::string& text) {
        EventLoaderInput input;
        input.content = text;
        input.in_memory = true;
        return input;
    }

    std::string describe() const {
        return in_memory ? std::string("<memory>") : file_path;
    }
};

/**
 * @brief Counters shared by the batch and streaming entry points.
 */
struct EventStreamStats {
    std::size_t lines_read = 0;
    std::size_t blank_lines = 0;
    std::size_t lines_skipped = 0;  // malformed records
    std::size_t events_parsed = 0;
    FieldFrequencyTable field_counts;
};

struct EventLoaderOutput {
    TraceEvents events;
    FieldFrequencyTable field_counts;
    std::size_t lines_read = 0;
    std::size_t lines_skipped = 0;
    bool success = false;
};

using EventCallback = std::function<void(const TraceEvent&)>;

/**
 * @brief Loads trace events from line-oriented JSON.
 *
 * Each line is parsed on its own. Blank lines are ignored, malformed lines
 * are counted and skipped, and events keep source order. An unreadable
 * source raises QueryError (LOAD); the stream is closed on every exit path.
 *
 * process() materialises the events; stream() hands each event to a
 * callback instead. Both run the same per-line routine.
 */
class EventLoaderUtility
    : public utilities::Utility<EventLoaderInput, EventLoaderOutput> {
   private:
    void consume_line(const std::string& line, EventStreamStats& stats,
                      const EventCallback& on_event) const {
        stats.lines_read++;

        TraceEvent event;
        switch (TraceParser::parse_line(line, event)) {
            case LineParseStatus::BLANK:
                stats.blank_lines++;
                return;
            case LineParseStatus::MALFORMED:
                stats.lines_skipped++;
                DFTRACER_UTILS_LOG_DEBUG("Skipping malformed record at line %zu",
                                         stats.lines_read);
                return;
            case LineParseStatus::PARSED:
                break;
        }

        for (const auto& name : event.field_names()) {
            stats.field_counts[name]++;
        }
        stats.events_parsed++;
        on_event(event);
    }

    EventStreamStats scan(std::istream& in, const std::string& source,
                          const EventCallback& on_event) const {
        EventStreamStats stats;
        std::string line;
        while (std::getline(in, line)) {
            consume_line(line, stats, on_event);
        }
        if (in.bad()) {
            throw QueryError(QueryStage::LOAD,
                             "read error after line " +
                                 std::to_string(stats.lines_read) + " of " +
                                 source);
        }

        DFTRACER_UTILS_LOG_INFO(
            "Loaded %zu events from %s (%zu lines, %zu malformed skipped)",
            stats.events_parsed, source.c_str(), stats.lines_read,
            stats.lines_skipped);
        return stats;
    }

   public:
    EventStreamStats stream(const EventLoaderInput& input,
                            const EventCallback& on_event) const {
        if (input.in_memory) {
            std::istringstream in(input.content);
            return scan(in, input.describe(), on_event);
        }

        std::ifstream in(input.file_path);
        if (!in.is_open()) {
            DFTRACER_UTILS_LOG_ERROR("Failed to open trace file: %s",
                                     input.file_path.c_str());
            throw QueryError(QueryStage::LOAD,
                             "cannot open trace file: " + input.file_path);
        }
        return scan(in, input.file_path, on_event);
    }

    EventLoaderOutput process(const EventLoaderInput& input) override {
        EventLoaderOutput output;
        auto stats = stream(input, [&output](const TraceEvent& event) {
            output.events.push_back(event);
        });

        output.field_counts = std::move(stats.field_counts);
        output.lines_read = stats.lines_read;
        output.lines_skipped = stats.lines_skipped;
        output.success = true;
        return output;
    }
};

inline EventLoaderOutput load_events(const std::string& path) {
    return EventLoaderUtility{}.process(EventLoaderInput::from_file(path));
}
