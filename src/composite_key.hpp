#pragma once

#include <string>
#include <vector>

#include "trace_event.hpp"

/**
 * @brief Key built from an ordered list of field values.
 *
 * Missing and null values contribute empty text. The joined form places
 * the separator between values, e.g. "7|checkout" for {"thread", "fn"}.
 */
struct CompositeKey {
    std::vector<std::string> parts;
    std::string joined;

    // True when no field resolved to non-empty text
    bool blank() const {
        for (const auto& part : parts) {
            if (!part.empty()) return false;
        }
        return true;
    }

    bool operator==(const CompositeKey& other) const {
        return parts == other.parts;
    }

    bool operator<(const CompositeKey& other) const {
        return parts < other.parts;
    }
};

inline CompositeKey build_composite_key(const TraceEvent& event,
                                        const std::vector<std::string>& fields,
                                        const std::string& separator) {
    CompositeKey key;
    key.parts.reserve(fields.size());

    JsonValue json = event.json();
    for (std::size_t i = 0; i < fields.size(); ++i) {
        auto text = json.at(fields[i]).as_text();
        key.parts.push_back(text ? std::move(*text) : std::string());

        if (i > 0) key.joined += separator;
        key.joined += key.parts.back();
    }
    return key;
}
