#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include "query_error.hpp"

enum class AggregateOp { COUNT, SUM, AVG, MAX, MIN };

inline const char* to_string(AggregateOp op) {
    switch (op) {
        case AggregateOp::COUNT:
            return "count";
        case AggregateOp::SUM:
            return "sum";
        case AggregateOp::AVG:
            return "avg";
        case AggregateOp::MAX:
            return "max";
        case AggregateOp::MIN:
            return "min";
    }
    return "unknown";
}

inline AggregateOp parse_aggregate_op(std::string_view name) {
    if (name == "count") return AggregateOp::COUNT;
    if (name == "sum") return AggregateOp::SUM;
    if (name == "avg") return AggregateOp::AVG;
    if (name == "max") return AggregateOp::MAX;
    if (name == "min") return AggregateOp::MIN;
    throw QueryError(QueryStage::AGGREGATE,
                     "unknown aggregate op '" + std::string(name) +
                         "' (expected count, sum, avg, max or min)");
}

struct AggregateRequest {
    AggregateOp op = AggregateOp::COUNT;
    std::string field;  // required for every op except count

    static AggregateRequest count() { return AggregateRequest{}; }

    static AggregateRequest of(AggregateOp op, const std::string& field) {
        AggregateRequest request;
        request.op = op;
        request.field = field;
        return request;
    }

    static AggregateRequest parse(std::string_view op,
                                  const std::string& field = "") {
        return of(parse_aggregate_op(op), field);
    }

    void validate() const {
        if (op != AggregateOp::COUNT && field.empty()) {
            throw QueryError(QueryStage::AGGREGATE,
                             std::string("op '") + to_string(op) +
                                 "' requires a field");
        }
    }
};

/**
 * @brief Scalar outcome of one aggregation.
 *
 * count is the number of input events for COUNT and the number of values
 * that survived numeric coercion otherwise. value is empty ("no value")
 * only for MAX and MIN over zero numeric values; AVG of nothing is 0.
 */
struct AggregateResult {
    AggregateOp op = AggregateOp::COUNT;
    std::uint64_t count = 0;
    std::optional<double> value;

    bool has_value() const { return value.has_value(); }
    bool is_integer() const { return op == AggregateOp::COUNT; }
};

struct NumericAccumulator {
    std::uint64_t count = 0;
    double sum = 0.0;
    double min = std::numeric_limits<double>::infinity();
    double max = -std::numeric_limits<double>::infinity();
    double mean = 0.0;
    double m2 = 0.0;  // For Welford's algorithm

    void update(double value) {
        count++;
        sum += value;

        if (value < min) min = value;
        if (value > max) max = value;

        // Welford's online algorithm for mean and variance
        double delta = value - mean;
        mean += delta / count;
        double delta2 = value - mean;
        m2 += delta * delta2;
    }

    double get_stddev() const {
        if (count < 2) return 0.0;
        return std::sqrt(m2 / (count - 1));
    }

    AggregateResult to_result(AggregateOp op) const {
        AggregateResult result;
        result.op = op;
        result.count = count;
        switch (op) {
            case AggregateOp::COUNT:
                result.value = static_cast<double>(count);
                break;
            case AggregateOp::SUM:
                result.value = sum;
                break;
            case AggregateOp::AVG:
                result.value = count > 0 ? sum / count : 0.0;
                break;
            case AggregateOp::MAX:
                if (count > 0) result.value = max;
                break;
            case AggregateOp::MIN:
                if (count > 0) result.value = min;
                break;
        }
        return result;
    }
};
