#pragma once

#include <cctype>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "filter_ast.hpp"
#include "filter_tokenizer.hpp"
#include "query_error.hpp"

enum class FilterParseMode { PERMISSIVE, STRICT };

struct FilterParseResult {
    FilterNodePtr root;
    // Tokens skipped or structure assumed during permissive recovery
    std::size_t recovered_tokens = 0;
    std::vector<std::string> diagnostics;
    // ~= patterns that failed to compile; those predicates never match
    std::vector<std::string> invalid_patterns;
};

/**
 * @brief Recursive descent parser for the filter language.
 *
 * Precedence, lowest first: or, and, not, primary.
 *
 *   or_expr  := and_expr ("or" and_expr)*
 *   and_expr := primary ("and" primary)*
 *   primary  := "(" or_expr ")" | "not" primary
 *             | "exists" "(" field ")"
 *             | field [comparator value]
 *
 * In PERMISSIVE mode malformed input never fails: an unexpected token at
 * the start of a primary is consumed and becomes a TrueNode, a missing ")"
 * is assumed, a comparator without a value compares against empty text,
 * and tokens left after a complete expression are dropped (the same as
 * conjunction with TrueNode). Each recovery is counted and described in
 * the result. STRICT mode raises QueryError (COMPILE) at the first of
 * these instead.
 *
 * Parentheses and "not" nest at most MAX_NESTING_DEPTH levels. Deeper input
 * is a recovery in PERMISSIVE mode (the remainder of the filter is dropped
 * and the innermost condition becomes a TrueNode) and a QueryError in
 * STRICT mode.
 *
 * Field names found in the alias map are replaced by their target.
 */
class FilterParser {
   public:
    static constexpr std::size_t MAX_NESTING_DEPTH = 256;

   private:
    std::vector<FilterToken> tokens_;
    std::size_t pos_ = 0;
    FilterParseMode mode_;
    std::unordered_map<std::string, std::string> aliases_;
    FilterParseResult result_;
    std::size_t depth_ = 0;
    bool truncated_ = false;

    std::string resolve(const std::string& field) const {
        auto it = aliases_.find(field);
        return it != aliases_.end() ? it->second : field;
    }

    const FilterToken* peek(std::size_t offset = 0) const {
        return pos_ + offset < tokens_.size() ? &tokens_[pos_ + offset]
                                              : nullptr;
    }

    bool check(TokenType type, std::size_t offset = 0) const {
        const FilterToken* tok = peek(offset);
        return tok && tok->type == type;
    }

    std::string describe_position(const FilterToken* tok) const {
        return tok ? "'" + tok->text + "' at position " +
                         std::to_string(tok->position)
                   : std::string("end of filter");
    }

    void recover(const std::string& message) {
        if (mode_ == FilterParseMode::STRICT) {
            throw QueryError(QueryStage::COMPILE, message);
        }
        result_.recovered_tokens++;
        result_.diagnostics.push_back(message);
    }

    static FilterComparator to_comparator(TokenType type) {
        switch (type) {
            case TokenType::EQUAL:
                return FilterComparator::EQUAL;
            case TokenType::MATCH:
                return FilterComparator::MATCH;
            case TokenType::LESS:
                return FilterComparator::LESS;
            case TokenType::GREATER:
                return FilterComparator::GREATER;
            case TokenType::LESS_EQUAL:
                return FilterComparator::LESS_EQUAL;
            case TokenType::GREATER_EQUAL:
                return FilterComparator::GREATER_EQUAL;
            default:
                throw QueryError(QueryStage::COMPILE,
                                 "token is not a comparator");
        }
    }

    FilterNodePtr parse_or() {
        std::vector<FilterNodePtr> operands{parse_and()};
        while (check(TokenType::OR)) {
            pos_++;
            operands.push_back(parse_and());
        }
        if (operands.size() == 1) return operands.front();
        return std::make_shared<LogicalNode>(LogicalOp::OR,
                                             std::move(operands));
    }

    FilterNodePtr parse_and() {
        std::vector<FilterNodePtr> operands{parse_primary()};
        while (check(TokenType::AND)) {
            pos_++;
            operands.push_back(parse_primary());
        }
        if (operands.size() == 1) return operands.front();
        return std::make_shared<LogicalNode>(LogicalOp::AND,
                                             std::move(operands));
    }

    // Enter one "(" or "not" level; past the limit the rest of the filter
    // is dropped
    bool enter_nested(const FilterToken& tok) {
        if (depth_ < MAX_NESTING_DEPTH) {
            depth_++;
            return true;
        }
        recover("nesting deeper than " + std::to_string(MAX_NESTING_DEPTH) +
                " at " + describe_position(&tok));
        result_.recovered_tokens += tokens_.size() - pos_;
        pos_ = tokens_.size();
        truncated_ = true;
        return false;
    }

    FilterNodePtr parse_primary() {
        const FilterToken* tok = peek();
        if (!tok) {
            if (truncated_) return std::make_shared<TrueNode>();
            recover("expected a condition but reached end of filter");
            return std::make_shared<TrueNode>();
        }

        switch (tok->type) {
            case TokenType::LPAREN: {
                if (!enter_nested(*tok)) return std::make_shared<TrueNode>();
                pos_++;
                FilterNodePtr inner = parse_or();
                depth_--;
                if (check(TokenType::RPAREN)) {
                    pos_++;
                } else if (!truncated_) {
                    recover("missing ')' before " + describe_position(peek()));
                }
                return inner;
            }
            case TokenType::NOT: {
                if (!enter_nested(*tok)) return std::make_shared<TrueNode>();
                pos_++;
                FilterNodePtr operand = parse_primary();
                depth_--;
                return std::make_shared<NotNode>(operand);
            }
            case TokenType::IDENTIFIER:
                return parse_comparison();
            default:
                recover("unexpected " + describe_position(tok));
                pos_++;
                return std::make_shared<TrueNode>();
        }
    }

    FilterNodePtr parse_comparison() {
        std::string field = resolve(tokens_[pos_++].text);

        const FilterToken* cmp = peek();
        if (cmp && is_comparator(cmp->type)) {
            pos_++;
            const FilterToken* value = peek();
            if (value && (value->type == TokenType::STRING ||
                          value->type == TokenType::IDENTIFIER)) {
                pos_++;
                auto predicate = std::make_shared<PredicateNode>(
                    field, to_comparator(cmp->type), value->text);
                if (!predicate->pattern_ok()) {
                    result_.invalid_patterns.push_back(
                        field + " ~= \"" + value->text +
                        "\": " + predicate->pattern_error());
                }
                return predicate;
            }
            recover("missing value after " + describe_position(cmp));
            return std::make_shared<PredicateNode>(field,
                                                   to_comparator(cmp->type));
        }

        if (equals_exists_keyword(tokens_[pos_ - 1].text) && check(TokenType::LPAREN) &&
            check(TokenType::IDENTIFIER, 1) && check(TokenType::RPAREN, 2)) {
            std::string target = resolve(tokens_[pos_ + 1].text);
            pos_ += 3;
            return std::make_shared<PredicateNode>(target,
                                                   FilterComparator::EXISTS);
        }

        return std::make_shared<PredicateNode>(field, FilterComparator::EXISTS);
    }

    static bool equals_exists_keyword(const std::string& word) {
        static const char keyword[] = "exists";
        if (word.size() != sizeof(keyword) - 1) return false;
        for (std::size_t i = 0; i < word.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(word[i])) !=
                keyword[i]) {
                return false;
            }
        }
        return true;
    }

   public:
    explicit FilterParser(
        std::vector<FilterToken> tokens,
        FilterParseMode mode = FilterParseMode::PERMISSIVE,
        std::unordered_map<std::string, std::string> aliases = {})
        : tokens_(std::move(tokens)), mode_(mode), aliases_(std::move(aliases)) {}

    FilterParseResult parse() {
        pos_ = 0;
        depth_ = 0;
        truncated_ = false;
        result_ = FilterParseResult{};

        if (tokens_.empty()) {
            result_.root = std::make_shared<TrueNode>();
            return result_;
        }

        result_.root = parse_or();
        if (pos_ < tokens_.size()) {
            if (mode_ == FilterParseMode::STRICT) {
                throw QueryError(QueryStage::COMPILE,
                                 "unexpected trailing " +
                                     describe_position(peek()));
            }
            result_.recovered_tokens += tokens_.size() - pos_;
            result_.diagnostics.push_back("ignored trailing " +
                                          describe_position(peek()));
            pos_ = tokens_.size();
        }
        return result_;
    }
};
