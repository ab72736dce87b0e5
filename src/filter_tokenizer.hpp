#pragma once

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

enum class TokenType {
    IDENTIFIER,  // field name or bare literal: method, args.id, 42
    STRING,      // "quoted literal"
    LPAREN,
    RPAREN,
    EQUAL,          // ==
    MATCH,          // ~=
    LESS,           // <
    GREATER,        // >
    LESS_EQUAL,     // <=
    GREATER_EQUAL,  // >=
    AND,
    OR,
    NOT,
    UNKNOWN  // any other character
};

struct FilterToken {
    TokenType type;
    std::string text;
    std::size_t position;  // byte offset in the query
};

inline bool is_comparator(TokenType type) {
    return type == TokenType::EQUAL || type == TokenType::MATCH ||
           type == TokenType::LESS || type == TokenType::GREATER ||
           type == TokenType::LESS_EQUAL || type == TokenType::GREATER_EQUAL;
}

/**
 * @brief Splits a filter query into tokens.
 *
 * Quoted literals run verbatim to the next '"' (or the end of input) with no
 * escape processing. Two-character comparators are matched before '<' and
 * '>'. The keywords and/or/not are case-insensitive and only recognised as
 * whole words.
 */
class FilterTokenizer {
   private:
    std::string_view input_;

    static bool is_identifier_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' ||
               c == '.';
    }

    static bool equals_ignore_case(std::string_view word, const char* keyword) {
        std::size_t i = 0;
        for (; i < word.size() && keyword[i]; ++i) {
            if (std::tolower(static_cast<unsigned char>(word[i])) !=
                keyword[i]) {
                return false;
            }
        }
        return i == word.size() && keyword[i] == '\0';
    }

    static TokenType classify_word(std::string_view word) {
        if (equals_ignore_case(word, "and")) return TokenType::AND;
        if (equals_ignore_case(word, "or")) return TokenType::OR;
        if (equals_ignore_case(word, "not")) return TokenType::NOT;
        return TokenType::IDENTIFIER;
    }

   public:
    explicit FilterTokenizer(std::string_view input) : input_(input) {}

    std::vector<FilterToken> tokenize() const {
        std::vector<FilterToken> tokens;
        std::size_t i = 0;

        while (i < input_.size()) {
            char c = input_[i];

            if (std::isspace(static_cast<unsigned char>(c))) {
                i++;
                continue;
            }

            if (c == '"') {
                std::size_t close = input_.find('"', i + 1);
                std::size_t end =
                    close == std::string_view::npos ? input_.size() : close;
                tokens.push_back({TokenType::STRING,
                                  std::string(input_.substr(i + 1, end - i - 1)),
                                  i});
                i = close == std::string_view::npos ? input_.size() : close + 1;
                continue;
            }

            if (c == '(' || c == ')') {
                tokens.push_back({c == '(' ? TokenType::LPAREN
                                           : TokenType::RPAREN,
                                  std::string(1, c), i});
                i++;
                continue;
            }

            if (i + 1 < input_.size() && input_[i + 1] == '=') {
                TokenType two = TokenType::UNKNOWN;
                switch (c) {
                    case '=':
                        two = TokenType::EQUAL;
                        break;
                    case '~':
                        two = TokenType::MATCH;
                        break;
                    case '<':
                        two = TokenType::LESS_EQUAL;
                        break;
                    case '>':
                        two = TokenType::GREATER_EQUAL;
                        break;
                    default:
                        break;
                }
                if (two != TokenType::UNKNOWN) {
                    tokens.push_back({two, std::string(input_.substr(i, 2)), i});
                    i += 2;
                    continue;
                }
            }

            if (c == '<' || c == '>') {
                tokens.push_back({c == '<' ? TokenType::LESS
                                           : TokenType::GREATER,
                                  std::string(1, c), i});
                i++;
                continue;
            }

            if (is_identifier_char(c)) {
                std::size_t start = i;
                while (i < input_.size() && is_identifier_char(input_[i])) i++;
                std::string_view word = input_.substr(start, i - start);
                tokens.push_back({classify_word(word), std::string(word), start});
                continue;
            }

            tokens.push_back({TokenType::UNKNOWN, std::string(1, c), i});
            i++;
        }

        return tokens;
    }
};
