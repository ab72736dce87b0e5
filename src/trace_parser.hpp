#pragma once

#include <yyjson.h>

#include <string_view>

#include "trace_event.hpp"

enum class LineParseStatus { PARSED, BLANK, MALFORMED };

/**
 * @brief Per-line record parsing shared by every loader entry point.
 */
class TraceParser {
   public:
    static bool is_space(char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
               c == '\v';
    }

    static std::string_view trim(std::string_view line) {
        std::size_t begin = 0;
        std::size_t end = line.size();
        while (begin < end && is_space(line[begin])) begin++;
        while (end > begin && is_space(line[end - 1])) end--;
        return line.substr(begin, end - begin);
    }

    /**
     * @brief Parse one line into an event.
     * @param line Raw line without its terminating newline
     * @param event Receives the event when PARSED is returned
     *
     * A line whose JSON root is not an object is MALFORMED.
     */
    static LineParseStatus parse_line(std::string_view line,
                                      TraceEvent& event) {
        std::string_view trimmed = trim(line);
        if (trimmed.empty()) return LineParseStatus::BLANK;

        // Without YYJSON_READ_INSITU the input is copied into the document
        yyjson_doc* doc = yyjson_read(trimmed.data(), trimmed.size(),
                                      YYJSON_READ_NOFLAG);
        if (!doc) return LineParseStatus::MALFORMED;

        yyjson_val* root = yyjson_doc_get_root(doc);
        if (!root || !yyjson_is_obj(root)) {
            yyjson_doc_free(doc);
            return LineParseStatus::MALFORMED;
        }

        event = TraceEvent(doc);
        return LineParseStatus::PARSED;
    }
};
