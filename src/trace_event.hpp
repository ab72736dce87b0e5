#pragma once

#include <yyjson.h>

#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "json_parser_utility.hpp"

/**
 * @brief One structured trace record.
 *
 * Wraps the root object of an immutable yyjson document. Copies share the
 * document, which is freed when the last copy goes away, so JsonValue
 * handles obtained from an event stay valid while the event is alive.
 */
class TraceEvent {
   private:
    std::shared_ptr<yyjson_doc> doc_;

   public:
    TraceEvent() = default;

    explicit TraceEvent(yyjson_doc* doc)
        : doc_(doc, [](yyjson_doc* d) {
              if (d) yyjson_doc_free(d);
          }) {}

    bool valid() const { return doc_ != nullptr; }

    JsonValue json() const {
        return JsonValue(doc_ ? yyjson_doc_get_root(doc_.get()) : nullptr);
    }

    // Resolve a dotted field path ("args.user.id")
    JsonValue field(std::string_view path) const { return json().at(path); }

    // Numeric value of the ordering field; missing or non-numeric is 0
    double timestamp(std::string_view field_name = "timestamp") const {
        auto value = field(field_name).as_number();
        return value ? *value : 0.0;
    }

    // Distinct top-level field names in record order
    std::vector<std::string> field_names() const {
        std::vector<std::string> names;
        yyjson_val* root = json().raw();
        if (!root || !yyjson_is_obj(root)) return names;

        std::unordered_set<std::string> seen;
        yyjson_obj_iter iter;
        yyjson_obj_iter_init(root, &iter);
        yyjson_val* key;
        while ((key = yyjson_obj_iter_next(&iter))) {
            std::string name(yyjson_get_str(key), yyjson_get_len(key));
            if (seen.insert(name).second) {
                names.push_back(std::move(name));
            }
        }
        return names;
    }

    std::string to_json() const { return json().to_json(); }
};

using TraceEvents = std::vector<TraceEvent>;
