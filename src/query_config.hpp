#pragma once

#include <dftracer/utils/core/common/logging.h>
#include <yyjson.h>

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "json_parser_utility.hpp"
#include "query_error.hpp"

struct QueryConfig {
    // Ordering
    std::string timestamp_field = "timestamp";

    // Flow reconstruction
    std::string flow_key_separator = "|";
    std::vector<std::string>
        correlation_keys;  // e.g., {"thread", "traceId"}

    // Error detection
    std::vector<std::string> error_fields = {"result"};
    std::string error_pattern = "(?i)(error|exception|fail|500|NOK)";

    // alias -> real field name
    std::unordered_map<std::string, std::string> field_aliases;

    // Filter parsing
    bool strict_filters = false;

    // Result limits
    std::size_t default_limit = 200;
    std::size_t max_error_events = 500;
    std::size_t top_k = 20;

    std::string resolve_field(const std::string& name) const {
        auto it = field_aliases.find(name);
        return it != field_aliases.end() ? it->second : name;
    }

    std::vector<std::string> resolve_fields(
        const std::vector<std::string>& names) const {
        std::vector<std::string> resolved;
        resolved.reserve(names.size());
        for (const auto& name : names) {
            resolved.push_back(resolve_field(name));
        }
        return resolved;
    }

    QueryConfig& with_timestamp_field(const std::string& field) {
        timestamp_field = field;
        return *this;
    }

    QueryConfig& with_flow_key_separator(const std::string& separator) {
        flow_key_separator = separator;
        return *this;
    }

    QueryConfig& with_correlation_keys(const std::vector<std::string>& keys) {
        correlation_keys = keys;
        return *this;
    }

    QueryConfig& with_error_fields(const std::vector<std::string>& fields) {
        error_fields = fields;
        return *this;
    }

    QueryConfig& with_error_pattern(const std::string& pattern) {
        error_pattern = pattern;
        return *this;
    }

    QueryConfig& with_field_alias(const std::string& alias,
                                  const std::string& field) {
        field_aliases[alias] = field;
        return *this;
    }

    QueryConfig& with_strict_filters(bool strict) {
        strict_filters = strict;
        return *this;
    }

    QueryConfig& with_default_limit(std::size_t limit) {
        default_limit = limit;
        return *this;
    }

    QueryConfig& with_max_error_events(std::size_t limit) {
        max_error_events = limit;
        return *this;
    }

    QueryConfig& with_top_k(std::size_t k) {
        top_k = k;
        return *this;
    }

    /**
     * @brief Read configuration from JSON text.
     *
     * Recognised keys: timestampField, flowKeySeparator, correlationKeys,
     * errorFields, errorPattern, fieldAliases, strictFilters, defaultLimit,
     * maxErrorEvents, topK. Unknown keys are ignored; a key of the wrong
     * type keeps its default.
     *
     * @throws QueryError (CONFIG) if the text is not a JSON object
     */
    static QueryConfig from_json(const std::string& text) {
        yyjson_read_err err;
        yyjson_doc* doc =
            yyjson_read_opts(const_cast<char*>(text.data()), text.size(),
                             YYJSON_READ_NOFLAG, nullptr, &err);
        if (!doc) {
            throw QueryError(QueryStage::CONFIG,
                             std::string("invalid configuration JSON: ") +
                                 (err.msg ? err.msg : "unknown error") +
                                 " at byte " + std::to_string(err.pos));
        }
        return from_document(doc);
    }

    /**
     * @brief Read configuration from a JSON file.
     * @throws QueryError (CONFIG) if the file cannot be read or parsed
     */
    static QueryConfig from_file(const std::string& path) {
        yyjson_read_err err;
        yyjson_doc* doc = yyjson_read_file(path.c_str(), YYJSON_READ_NOFLAG,
                                           nullptr, &err);
        if (!doc) {
            throw QueryError(QueryStage::CONFIG,
                             "cannot read configuration " + path + ": " +
                                 (err.msg ? err.msg : "unknown error"));
        }
        DFTRACER_UTILS_LOG_INFO("Loading query configuration from %s",
                                path.c_str());
        return from_document(doc);
    }

   private:
    // Takes ownership of doc
    static QueryConfig from_document(yyjson_doc* doc) {
        std::shared_ptr<yyjson_doc> owned(doc, [](yyjson_doc* d) {
            if (d) yyjson_doc_free(d);
        });

        JsonValue root(yyjson_doc_get_root(doc));
        if (!root.is_object()) {
            throw QueryError(QueryStage::CONFIG,
                             "configuration root must be a JSON object");
        }

        QueryConfig config;
        read_string(root, "timestampField", config.timestamp_field);
        read_string(root, "flowKeySeparator", config.flow_key_separator);
        read_string_list(root, "correlationKeys", config.correlation_keys);
        read_string_list(root, "errorFields", config.error_fields);
        read_string(root, "errorPattern", config.error_pattern);
        read_size(root, "defaultLimit", config.default_limit);
        read_size(root, "maxErrorEvents", config.max_error_events);
        read_size(root, "topK", config.top_k);

        JsonValue strict = root["strictFilters"];
        if (strict.exists()) {
            if (strict.is_bool()) {
                config.strict_filters = strict.get<bool>();
            } else {
                warn_type("strictFilters", "a boolean");
            }
        }

        JsonValue aliases = root["fieldAliases"];
        if (aliases.is_object()) {
            yyjson_obj_iter iter;
            yyjson_obj_iter_init(aliases.raw(), &iter);
            yyjson_val* key;
            while ((key = yyjson_obj_iter_next(&iter))) {
                JsonValue target(yyjson_obj_iter_get_val(key));
                if (target.is_string()) {
                    config.field_aliases[yyjson_get_str(key)] =
                        target.get<std::string>();
                }
            }
        } else if (aliases.exists()) {
            warn_type("fieldAliases", "an object");
        }

        return config;
    }

    static void warn_type(const char* key, const char* expected) {
        DFTRACER_UTILS_LOG_WARN(
            "Configuration key '%s' must be %s, keeping default", key,
            expected);
    }

    static void read_string(const JsonValue& root, const char* key,
                            std::string& target) {
        JsonValue value = root[key];
        if (!value.exists()) return;
        if (value.is_string()) {
            target = value.get<std::string>();
        } else {
            warn_type(key, "a string");
        }
    }

    static void read_size(const JsonValue& root, const char* key,
                          std::size_t& target) {
        JsonValue value = root[key];
        if (!value.exists()) return;
        if (value.is_number() && yyjson_is_int(value.raw()) &&
            value.get<std::int64_t>(-1) >= 0) {
            target = value.get<std::size_t>();
        } else {
            warn_type(key, "a non-negative integer");
        }
    }

    static void read_string_list(const JsonValue& root, const char* key,
                                 std::vector<std::string>& target) {
        JsonValue value = root[key];
        if (!value.exists()) return;
        if (!value.is_array()) {
            warn_type(key, "an array of strings");
            return;
        }

        std::vector<std::string> items;
        std::size_t idx, max;
        yyjson_val* item;
        yyjson_arr_foreach(value.raw(), idx, max, item) {
            if (yyjson_is_str(item)) {
                items.emplace_back(yyjson_get_str(item), yyjson_get_len(item));
            }
        }
        target = std::move(items);
    }
};
