#pragma once

#include <re2/re2.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "json_parser_utility.hpp"

enum class FilterComparator {
    EXISTS,
    EQUAL,
    MATCH,
    LESS,
    GREATER,
    LESS_EQUAL,
    GREATER_EQUAL
};

inline const char* to_string(FilterComparator cmp) {
    switch (cmp) {
        case FilterComparator::EXISTS:
            return "exists";
        case FilterComparator::EQUAL:
            return "==";
        case FilterComparator::MATCH:
            return "~=";
        case FilterComparator::LESS:
            return "<";
        case FilterComparator::GREATER:
            return ">";
        case FilterComparator::LESS_EQUAL:
            return "<=";
        case FilterComparator::GREATER_EQUAL:
            return ">=";
    }
    return "?";
}

/**
 * @brief Immutable node of a compiled filter.
 *
 * evaluate() takes the event's root object and has no side effects, so one
 * tree may be evaluated any number of times.
 */
class FilterNode {
   public:
    virtual ~FilterNode() = default;
    virtual bool evaluate(const JsonValue& event) const = 0;
    // S-expression rendering, e.g. (or (and a b) c)
    virtual std::string describe() const = 0;
};

using FilterNodePtr = std::shared_ptr<const FilterNode>;

// Matches everything; produced by empty filters and recovered residue
class TrueNode : public FilterNode {
   public:
    bool evaluate(const JsonValue&) const override { return true; }
    std::string describe() const override { return "true"; }
};

class PredicateNode : public FilterNode {
   private:
    std::string field_;
    FilterComparator cmp_;
    std::optional<std::string> value_;

    // Prepared once at construction
    std::optional<double> numeric_value_;
    std::shared_ptr<const re2::RE2> pattern_;

    bool compare_numbers(double lhs, double rhs) const {
        switch (cmp_) {
            case FilterComparator::LESS:
                return lhs < rhs;
            case FilterComparator::GREATER:
                return lhs > rhs;
            case FilterComparator::LESS_EQUAL:
                return lhs <= rhs;
            case FilterComparator::GREATER_EQUAL:
                return lhs >= rhs;
            default:
                return false;
        }
    }

   public:
    PredicateNode(std::string field, FilterComparator cmp,
                  std::optional<std::string> value = std::nullopt)
        : field_(std::move(field)), cmp_(cmp), value_(std::move(value)) {
        const std::string rhs = value_.value_or("");
        if (cmp_ == FilterComparator::MATCH) {
            re2::RE2::Options options;
            options.set_log_errors(false);
            pattern_ = std::make_shared<const re2::RE2>(rhs, options);
        } else if (cmp_ != FilterComparator::EXISTS &&
                   cmp_ != FilterComparator::EQUAL) {
            numeric_value_ = coerce_number(rhs);
        }
    }

    const std::string& field() const { return field_; }
    FilterComparator comparator() const { return cmp_; }
    const std::optional<std::string>& value() const { return value_; }

    // False for a ~= predicate whose pattern does not compile
    bool pattern_ok() const { return !pattern_ || pattern_->ok(); }

    std::string pattern_error() const {
        return pattern_ ? pattern_->error() : std::string();
    }

    bool evaluate(const JsonValue& event) const override {
        JsonValue resolved = event.at(field_);
        if (cmp_ == FilterComparator::EXISTS) return resolved.has_value();

        auto text = resolved.as_text();
        if (!text) return false;

        switch (cmp_) {
            case FilterComparator::EQUAL:
                return *text == value_.value_or("");
            case FilterComparator::MATCH:
                return pattern_->ok() && re2::RE2::PartialMatch(*text, *pattern_);
            default: {
                // Ordering coerces the text form, so booleans never compare
                auto lhs = coerce_number(*text);
                if (!lhs || !numeric_value_) return false;
                return compare_numbers(*lhs, *numeric_value_);
            }
        }
    }

    std::string describe() const override {
        if (cmp_ == FilterComparator::EXISTS) return "(exists " + field_ + ")";
        return std::string("(") + to_string(cmp_) + " " + field_ + " \"" +
               value_.value_or("") + "\")";
    }
};

class NotNode : public FilterNode {
   private:
    FilterNodePtr operand_;

   public:
    explicit NotNode(FilterNodePtr operand) : operand_(std::move(operand)) {}

    bool evaluate(const JsonValue& event) const override {
        return !operand_->evaluate(event);
    }

    std::string describe() const override {
        return "(not " + operand_->describe() + ")";
    }
};

enum class LogicalOp { AND, OR };

/**
 * @brief Conjunction or disjunction of two or more operands.
 *
 * Chains such as "a and b and c" are held flat, so tree depth follows the
 * nesting of parentheses and "not" only.
 */
class LogicalNode : public FilterNode {
   private:
    LogicalOp op_;
    std::vector<FilterNodePtr> operands_;

   public:
    LogicalNode(LogicalOp op, std::vector<FilterNodePtr> operands)
        : op_(op), operands_(std::move(operands)) {}

    LogicalOp op() const { return op_; }
    std::size_t size() const { return operands_.size(); }

    // Every operand is evaluated
    bool evaluate(const JsonValue& event) const override {
        bool result = op_ == LogicalOp::AND;
        for (const auto& operand : operands_) {
            bool value = operand->evaluate(event);
            result = op_ == LogicalOp::AND ? (result && value)
                                           : (result || value);
        }
        return result;
    }

    std::string describe() const override {
        std::string text = op_ == LogicalOp::AND ? "(and" : "(or";
        for (const auto& operand : operands_) {
            text += ' ';
            text += operand->describe();
        }
        return text + ")";
    }
};
