#pragma once

#include <dftracer/utils/core/common/logging.h>
#include <dftracer/utils/core/utilities/utility.h>

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "filter_ast.hpp"
#include "filter_parser.hpp"
#include "filter_tokenizer.hpp"
#include "query_config.hpp"
#include "trace_event.hpp"
#include "trace_parser.hpp"

using namespace dftracer::utils;

/**
 * @brief Compiled filter: a pure test over one event.
 *
 * Holds an immutable AST; copies share it.
 */
class EventPredicate {
   private:
    FilterNodePtr root_;
    std::string source_;
    std::size_t recovered_tokens_ = 0;

   public:
    EventPredicate() : root_(std::make_shared<TrueNode>()) {}

    EventPredicate(FilterNodePtr root, std::string source,
                   std::size_t recovered_tokens = 0)
        : root_(std::move(root)),
          source_(std::move(source)),
          recovered_tokens_(recovered_tokens) {}

    bool operator()(const TraceEvent& event) const {
        return root_->evaluate(event.json());
    }

    const std::string& source() const { return source_; }
    std::size_t recovered_tokens() const { return recovered_tokens_; }
    std::string describe() const { return root_->describe(); }
};

struct FilterCompileInput {
    std::string query;
    FilterParseMode mode = FilterParseMode::PERMISSIVE;
    std::unordered_map<std::string, std::string> field_aliases;

    static FilterCompileInput from_query(std::string_view query) {
        FilterCompileInput input;
        input.query = std::string(query);
        return input;
    }

    FilterCompileInput& with_mode(FilterParseMode parse_mode) {
        mode = parse_mode;
        return *this;
    }

    FilterCompileInput& with_config(const QueryConfig& config) {
        mode = config.strict_filters ? FilterParseMode::STRICT
                                     : FilterParseMode::PERMISSIVE;
        field_aliases = config.field_aliases;
        return *this;
    }
};

/**
 * @brief Compiles a filter query into an EventPredicate.
 *
 * A blank query compiles to the identity filter. Syntax problems are
 * recovered (PERMISSIVE) or raised as QueryError (STRICT); see
 * FilterParser. Patterns for ~= are compiled here, once per query.
 */
class FilterCompilerUtility
    : public utilities::Utility<FilterCompileInput, EventPredicate> {
   public:
    EventPredicate process(const FilterCompileInput& input) override {
        if (TraceParser::trim(input.query).empty()) {
            return EventPredicate(std::make_shared<TrueNode>(), input.query);
        }

        auto tokens = FilterTokenizer(input.query).tokenize();
        FilterParser parser(std::move(tokens), input.mode, input.field_aliases);
        FilterParseResult parsed = parser.parse();

        for (const auto& message : parsed.diagnostics) {
            DFTRACER_UTILS_LOG_WARN("Filter \"%s\": %s", input.query.c_str(),
                                    message.c_str());
        }
        for (const auto& message : parsed.invalid_patterns) {
            DFTRACER_UTILS_LOG_WARN("Filter \"%s\": invalid pattern %s",
                                    input.query.c_str(), message.c_str());
        }

        DFTRACER_UTILS_LOG_DEBUG("Compiled filter \"%s\" -> %s",
                                 input.query.c_str(),
                                 parsed.root->describe().c_str());
        return EventPredicate(parsed.root, input.query,
                              parsed.recovered_tokens);
    }
};

inline EventPredicate compile_filter(
    std::string_view query,
    FilterParseMode mode = FilterParseMode::PERMISSIVE) {
    return FilterCompilerUtility{}.process(
        FilterCompileInput::from_query(query).with_mode(mode));
}

inline EventPredicate compile_filter(std::string_view query,
                                     const QueryConfig& config) {
    return FilterCompilerUtility{}.process(
        FilterCompileInput::from_query(query).with_config(config));
}

// Matching events in original order
inline TraceEvents filter_events(const TraceEvents& events,
                                 const EventPredicate& predicate) {
    TraceEvents matched;
    for (const auto& event : events) {
        if (predicate(event)) matched.push_back(event);
    }
    return matched;
}

inline std::vector<bool> evaluate_mask(const TraceEvents& events,
                                       const EventPredicate& predicate) {
    std::vector<bool> mask;
    mask.reserve(events.size());
    for (const auto& event : events) {
        mask.push_back(predicate(event));
    }
    return mask;
}
