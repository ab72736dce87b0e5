#pragma once

#include <yyjson.h>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

/**
 * @brief Parse text as a decimal number.
 *
 * Accepts surrounding whitespace and the form [+-]digits[.digits][e[+-]digits]
 * (leading or trailing digits around the dot may be omitted, not both).
 * Anything else, including empty text, yields std::nullopt.
 */
inline std::optional<double> coerce_number(std::string_view text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end &&
           (text[begin] == ' ' || text[begin] == '\t' || text[begin] == '\n' ||
            text[begin] == '\r' || text[begin] == '\f' || text[begin] == '\v'))
        begin++;
    while (end > begin &&
           (text[end - 1] == ' ' || text[end - 1] == '\t' ||
            text[end - 1] == '\n' || text[end - 1] == '\r' ||
            text[end - 1] == '\f' || text[end - 1] == '\v'))
        end--;
    if (begin == end) return std::nullopt;

    std::size_t pos = begin;
    if (text[pos] == '+' || text[pos] == '-') pos++;

    std::size_t int_digits = 0;
    while (pos < end && text[pos] >= '0' && text[pos] <= '9') {
        pos++;
        int_digits++;
    }
    std::size_t frac_digits = 0;
    if (pos < end && text[pos] == '.') {
        pos++;
        while (pos < end && text[pos] >= '0' && text[pos] <= '9') {
            pos++;
            frac_digits++;
        }
    }
    if (int_digits + frac_digits == 0) return std::nullopt;

    if (pos < end && (text[pos] == 'e' || text[pos] == 'E')) {
        pos++;
        if (pos < end && (text[pos] == '+' || text[pos] == '-')) pos++;
        std::size_t exp_digits = 0;
        while (pos < end && text[pos] >= '0' && text[pos] <= '9') {
            pos++;
            exp_digits++;
        }
        if (exp_digits == 0) return std::nullopt;
    }
    if (pos != end) return std::nullopt;

    // strtod needs a null-terminated buffer
    std::string buffer(text.substr(begin, end - begin));
    return std::strtod(buffer.c_str(), nullptr);
}

/**
 * @brief Format a double the way it reads best: integral values without a
 * fraction, others in the shortest precision that round-trips.
 */
inline std::string format_number(double value) {
    char temp[64];
    if (value > -9007199254740992.0 && value < 9007199254740992.0 &&
        value == static_cast<double>(static_cast<std::int64_t>(value))) {
        std::snprintf(temp, sizeof(temp), "%lld",
                      static_cast<long long>(value));
        return temp;
    }
    std::snprintf(temp, sizeof(temp), "%.15g", value);
    if (std::strtod(temp, nullptr) != value) {
        std::snprintf(temp, sizeof(temp), "%.17g", value);
    }
    return temp;
}

/**
 * @brief Lightweight zero-cost wrapper around yyjson_val* with convenient
 * accessors.
 *
 * - Fluent chaining: json["args"]["method"]
 * - Dotted paths: json.at("request.headers.host")
 * - Template get<T>() with defaults for missing or wrongly typed fields
 * - Coercion to text and to number for filter and aggregation semantics
 *
 * IMPORTANT: JsonValue is only valid while the yyjson_doc is alive.
 * TraceEvent keeps the document alive for as long as any copy exists.
 */
class JsonValue {
   private:
    yyjson_val* val_;

   public:
    explicit JsonValue(yyjson_val* val = nullptr) : val_(val) {}

    bool is_null() const { return !val_ || yyjson_is_null(val_); }
    bool is_bool() const { return val_ && yyjson_is_bool(val_); }
    bool is_string() const { return val_ && yyjson_is_str(val_); }
    bool is_number() const { return val_ && yyjson_is_num(val_); }
    bool is_object() const { return val_ && yyjson_is_obj(val_); }
    bool is_array() const { return val_ && yyjson_is_arr(val_); }
    bool exists() const { return val_ != nullptr; }

    // Defined and not JSON null
    bool has_value() const { return val_ && !yyjson_is_null(val_); }

    JsonValue operator[](const char* key) const {
        return JsonValue(val_ ? yyjson_obj_get(val_, key) : nullptr);
    }

    JsonValue operator[](const std::string& key) const {
        return (*this)[key.c_str()];
    }

    JsonValue operator[](std::string_view key) const {
        return JsonValue(
            val_ ? yyjson_obj_getn(val_, key.data(), key.size()) : nullptr);
    }

    /**
     * @brief Navigate to a nested field using dot notation.
     * @param path Dot-separated path like "args.ret" or "request.user.id"
     * @return JsonValue at the path, or null JsonValue if any segment is
     * missing or an intermediate value is not an object
     *
     * Empty segments ("a..b") are skipped.
     */
    JsonValue at(std::string_view path) const {
        if (!val_) return JsonValue(nullptr);

        JsonValue current(val_);
        std::size_t start = 0;
        while (start <= path.size()) {
            std::size_t end = path.find('.', start);
            if (end == std::string_view::npos) end = path.size();

            if (end > start) {
                current = current[path.substr(start, end - start)];
                if (!current.exists()) return JsonValue(nullptr);
            }
            start = end + 1;
        }
        return current;
    }

    JsonValue at(const std::string& path) const {
        return at(std::string_view(path));
    }

    JsonValue at(const char* path) const {
        return path ? at(std::string_view(path)) : JsonValue(nullptr);
    }

    /**
     * @brief Extract value as type T with optional default.
     *
     * Supported types: std::string, std::string_view, bool, double,
     * std::int64_t, std::uint64_t and other integral types.
     */
    template <typename T>
    T get(const T& default_val = T{}) const {
        if constexpr (std::is_same_v<T, bool>) {
            return val_ && yyjson_is_bool(val_) ? yyjson_get_bool(val_)
                                                : default_val;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return (val_ && yyjson_is_str(val_))
                       ? std::string(yyjson_get_str(val_), yyjson_get_len(val_))
                       : default_val;
        } else if constexpr (std::is_same_v<T, std::string_view>) {
            if (val_ && yyjson_is_str(val_)) {
                return std::string_view(yyjson_get_str(val_),
                                        yyjson_get_len(val_));
            }
            return default_val;
        } else if constexpr (std::is_same_v<T, std::uint64_t>) {
            if (!val_) return default_val;
            if (yyjson_is_uint(val_)) return yyjson_get_uint(val_);
            if (yyjson_is_sint(val_)) {
                auto v = yyjson_get_sint(val_);
                return v >= 0 ? static_cast<std::uint64_t>(v) : default_val;
            }
            return default_val;
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            if (!val_) return default_val;
            if (yyjson_is_sint(val_)) return yyjson_get_sint(val_);
            if (yyjson_is_uint(val_)) {
                auto v = yyjson_get_uint(val_);
                return v <= static_cast<std::uint64_t>(
                                std::numeric_limits<std::int64_t>::max())
                           ? static_cast<std::int64_t>(v)
                           : default_val;
            }
            return default_val;
        } else if constexpr (std::is_same_v<T, double>) {
            if (!val_) return default_val;
            if (yyjson_is_real(val_)) return yyjson_get_real(val_);
            if (yyjson_is_sint(val_))
                return static_cast<double>(yyjson_get_sint(val_));
            if (yyjson_is_uint(val_))
                return static_cast<double>(yyjson_get_uint(val_));
            return default_val;
        } else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>) {
            return static_cast<T>(
                get<std::uint64_t>(static_cast<std::uint64_t>(default_val)));
        } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
            return static_cast<T>(
                get<std::int64_t>(static_cast<std::int64_t>(default_val)));
        } else {
            static_assert(!sizeof(T),
                          "Unsupported type for JsonValue::get<T>(). "
                          "Supported: string, integral types, double, bool");
        }
    }

    /**
     * @brief Text representation used by equality, pattern matching and
     * composite keys.
     * @return std::nullopt for missing or null values
     */
    std::optional<std::string> as_text() const {
        if (!has_value()) return std::nullopt;

        switch (yyjson_get_type(val_)) {
            case YYJSON_TYPE_STR:
                return std::string(yyjson_get_str(val_), yyjson_get_len(val_));
            case YYJSON_TYPE_BOOL:
                return std::string(yyjson_get_bool(val_) ? "true" : "false");
            case YYJSON_TYPE_NUM:
                if (yyjson_is_uint(val_)) {
                    return std::to_string(yyjson_get_uint(val_));
                }
                if (yyjson_is_sint(val_)) {
                    return std::to_string(yyjson_get_sint(val_));
                }
                return format_number(yyjson_get_real(val_));
            default:
                return to_json();
        }
    }

    /**
     * @brief Best-effort numeric coercion; never throws.
     * @return std::nullopt when the value is missing, null, a container, or
     * text that is not a decimal number
     */
    std::optional<double> as_number() const {
        if (!has_value()) return std::nullopt;
        if (yyjson_is_num(val_)) return get<double>();
        if (yyjson_is_bool(val_)) return yyjson_get_bool(val_) ? 1.0 : 0.0;
        if (yyjson_is_str(val_)) {
            return coerce_number(
                std::string_view(yyjson_get_str(val_), yyjson_get_len(val_)));
        }
        return std::nullopt;
    }

    // Compact JSON encoding, "null" for a missing value
    std::string to_json() const {
        if (!val_) return "null";
        std::size_t len = 0;
        char* json = yyjson_val_write(val_, YYJSON_WRITE_NOFLAG, &len);
        if (!json) return "null";
        std::string result(json, len);
        std::free(json);
        return result;
    }

    yyjson_val* raw() const { return val_; }

    explicit operator bool() const { return exists(); }
};
