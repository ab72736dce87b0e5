#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "filter_compiler_utility.hpp"
#include "query_config.hpp"
#include "query_error.hpp"
#include "test_events.hpp"

namespace {

class filter_engine : public ::testing::Test {
   protected:
    TraceEvents events;

    void SetUp() override {
        events = load_events(fixture_path("checkout_trace.jsonl")).events;
        ASSERT_EQ(events.size(), 8u);
    }

    std::size_t count(const std::string& query,
                      FilterParseMode mode = FilterParseMode::PERMISSIVE) {
        return filter_events(events, compile_filter(query, mode)).size();
    }
};

}  // namespace

TEST_F(filter_engine, blank_query_matches_everything) {
    EXPECT_EQ(count(""), events.size());
    EXPECT_EQ(count("   "), events.size());
    EXPECT_EQ(compile_filter("").describe(), "true");
}

TEST_F(filter_engine, equality) {
    auto matched = filter_events(events, compile_filter("method == \"checkout\""));
    ASSERT_EQ(matched.size(), 2u);
    EXPECT_EQ(matched[0].field("event").as_text(), "ENTER");
    EXPECT_EQ(matched[1].field("event").as_text(), "EXIT");

    EXPECT_EQ(count("event == EXIT"), 2u);
    EXPECT_EQ(count("args.orderId == \"A-17\""), 3u);
    EXPECT_EQ(count("args.items == 3"), 1u);
}

TEST_F(filter_engine, bare_field_tests_presence) {
    // null durationMicros on the heartbeat does not count
    EXPECT_EQ(count("durationMicros"), 3u);
    EXPECT_EQ(count("exists(result)"), 3u);
    EXPECT_EQ(count("EXISTS ( args )"), 3u);
    EXPECT_EQ(count("not exists(timestamp)"), 1u);
}

TEST_F(filter_engine, ordering_coerces_numbers) {
    EXPECT_EQ(count("durationMicros >= 850"), 3u);
    EXPECT_EQ(count("durationMicros > 20000"), 1u);
    EXPECT_EQ(count("timestamp < 1010"), 2u);
    EXPECT_EQ(count("timestamp <= 1012"), 3u);
    // Non-numeric right-hand side never matches
    EXPECT_EQ(count("timestamp > soon"), 0u);
    // Non-numeric field text never matches
    EXPECT_EQ(count("method > 0"), 0u);
}

TEST_F(filter_engine, pattern_match) {
    EXPECT_EQ(count("result ~= \"(?i)exception\""), 1u);
    EXPECT_EQ(count("class ~= \"Service$\""), 7u);
    EXPECT_EQ(count("method ~= \"^re\""), 3u);
    EXPECT_EQ(count("missing ~= \".*\""), 0u);
}

TEST_F(filter_engine, invalid_pattern_never_matches) {
    EventPredicate predicate;
    ASSERT_NO_THROW(predicate = compile_filter("method ~= \"(\""));
    EXPECT_EQ(filter_events(events, predicate).size(), 0u);
    EXPECT_EQ(count("not method ~= \"(\""), events.size());
}

TEST_F(filter_engine, precedence_and_binds_tighter) {
    EventPredicate predicate = compile_filter("a and b or c");
    EXPECT_EQ(predicate.describe(),
              "(or (and (exists a) (exists b)) (exists c))");

    EXPECT_TRUE(predicate(make_event(R"({"c":1})")));
    EXPECT_TRUE(predicate(make_event(R"({"a":1,"b":1})")));
    EXPECT_FALSE(predicate(make_event(R"({"a":1})")));

    EXPECT_EQ(compile_filter("not a and b").describe(),
              "(and (not (exists a)) (exists b))");
    EXPECT_EQ(compile_filter("a and (b or c)").describe(),
              "(and (exists a) (or (exists b) (exists c)))");
}

TEST_F(filter_engine, combined_conditions) {
    EXPECT_EQ(count("thread == main and not (event == ENTER)"), 3u);
    EXPECT_EQ(count("event == EXCEPTION or durationMicros > 10000"), 3u);
    EXPECT_EQ(count("class == \"MailService\" AND result"), 1u);
}

TEST_F(filter_engine, booleans_compare_by_text_only) {
    TraceEvent event = make_event(R"({"ok":true,"n":null})");
    EXPECT_TRUE(compile_filter("ok == true")(event));
    EXPECT_FALSE(compile_filter("ok > 0")(event));
    EXPECT_FALSE(compile_filter("n == null")(event));
    EXPECT_FALSE(compile_filter("n")(event));
}

TEST_F(filter_engine, evaluation_is_deterministic) {
    EventPredicate predicate =
        compile_filter("thread == main and (durationMicros or args)");
    auto first = evaluate_mask(events, predicate);
    auto second = evaluate_mask(events, predicate);
    EXPECT_EQ(first, second);

    std::vector<bool> expected{true, true, true, true,
                               false, false, true, false};
    EXPECT_EQ(first, expected);
}

TEST_F(filter_engine, permissive_recovery) {
    EventPredicate trailing = compile_filter("method == \"checkout\" leftover");
    EXPECT_EQ(trailing.recovered_tokens(), 1u);
    EXPECT_EQ(filter_events(events, trailing).size(), 2u);

    EventPredicate unclosed = compile_filter("(method == \"checkout\"");
    EXPECT_EQ(unclosed.recovered_tokens(), 1u);
    EXPECT_EQ(filter_events(events, unclosed).size(), 2u);

    // Comparator without a value compares against empty text
    EventPredicate no_value = compile_filter("method ==");
    EXPECT_EQ(no_value.recovered_tokens(), 1u);
    EXPECT_TRUE(no_value(make_event(R"({"method":""})")));
    EXPECT_EQ(filter_events(events, no_value).size(), 0u);

    // Unexpected token where a condition starts becomes true
    EventPredicate stray = compile_filter("= or method == reserve");
    EXPECT_EQ(stray.describe(), "(or true (== method \"reserve\"))");
    EXPECT_EQ(filter_events(events, stray).size(), events.size());
}

TEST_F(filter_engine, strict_mode_rejects_malformed_queries) {
    const std::vector<std::string> bad{
        "method ==",          "(method == checkout", "method == x leftover",
        "== checkout",        "a and",               "a = b"};
    for (const auto& query : bad) {
        SCOPED_TRACE(query);
        try {
            compile_filter(query, FilterParseMode::STRICT);
            FAIL() << "expected QueryError";
        } catch (const QueryError& e) {
            EXPECT_EQ(e.stage(), QueryStage::COMPILE);
        }
    }

    EXPECT_NO_THROW(compile_filter("", FilterParseMode::STRICT));
    EXPECT_EQ(count("(method == checkout) and not result",
                    FilterParseMode::STRICT),
              1u);
}

TEST_F(filter_engine, aliases_resolve_field_names) {
    QueryConfig config;
    config.with_field_alias("fn", "method").with_field_alias("id", "args.orderId");

    EventPredicate predicate = compile_filter("fn == checkout and id", config);
    EXPECT_EQ(predicate.describe(),
              "(and (== method \"checkout\") (exists args.orderId))");
    EXPECT_EQ(filter_events(events, predicate).size(), 1u);
    EXPECT_EQ(filter_events(events, compile_filter("exists(fn)", config)).size(),
              7u);
}

TEST_F(filter_engine, strict_flag_from_config) {
    QueryConfig config;
    config.with_strict_filters(true);
    EXPECT_THROW(compile_filter("method ==", config), QueryError);
}

TEST(filter_properties, equality_on_present_and_absent_field) {
    EventPredicate predicate = compile_filter("field == \"X\"");
    EXPECT_TRUE(predicate(make_event(R"({"field":"X"})")));
    EXPECT_FALSE(predicate(make_event("{}")));
}

TEST(filter_properties, and_binds_before_or) {
    // a false, b true, c true
    TraceEvent event = make_event(R"({"b":1,"c":1})");
    EXPECT_TRUE(compile_filter("a and b or c")(event));
    EXPECT_FALSE(compile_filter("a and (b or c)")(event));
}

static std::string repeat(const std::string& text, std::size_t times) {
    std::string out;
    out.reserve(text.size() * times);
    for (std::size_t i = 0; i < times; ++i) out += text;
    return out;
}

TEST(filter_nesting, deep_parentheses_are_truncated) {
    const std::size_t depth = 100000;
    TraceEvent event = make_event(R"({"a":1})");

    EventPredicate open_only = compile_filter(std::string(depth, '('));
    EXPECT_GT(open_only.recovered_tokens(), 0u);
    EXPECT_EQ(open_only.describe(), "true");
    EXPECT_TRUE(open_only(event));

    EventPredicate balanced = compile_filter(
        std::string(depth, '(') + "a == 2" + std::string(depth, ')'));
    EXPECT_GT(balanced.recovered_tokens(), 0u);
    EXPECT_TRUE(balanced(event));
}

TEST(filter_nesting, deep_not_chain_is_truncated) {
    EventPredicate predicate = compile_filter(repeat("not ", 100000) + "a");
    EXPECT_GT(predicate.recovered_tokens(), 0u);

    // An even number of negations survives around the dropped remainder
    EXPECT_TRUE(predicate(make_event(R"({"a":1})")));
    EXPECT_TRUE(predicate(make_event("{}")));
}

TEST(filter_nesting, limit_depth_is_accepted) {
    const std::size_t limit = FilterParser::MAX_NESTING_DEPTH;
    std::string query =
        std::string(limit, '(') + "a == 1" + std::string(limit, ')');

    EventPredicate predicate = compile_filter(query, FilterParseMode::STRICT);
    EXPECT_EQ(predicate.recovered_tokens(), 0u);
    EXPECT_EQ(predicate.describe(), "(== a \"1\")");
    EXPECT_TRUE(predicate(make_event(R"({"a":1})")));
    EXPECT_FALSE(predicate(make_event(R"({"a":2})")));

    std::string negated = repeat("not ", limit) + "a";
    EXPECT_FALSE(compile_filter(negated, FilterParseMode::STRICT)(
        make_event("{}")));
}

TEST(filter_nesting, strict_mode_rejects_excess_depth) {
    const std::size_t depth = FilterParser::MAX_NESTING_DEPTH + 1;
    const std::vector<std::string> queries{
        std::string(100000, '('),
        repeat("not ", 100000) + "a",
        std::string(depth, '(') + "a" + std::string(depth, ')'),
        repeat("not ", depth) + "a"};

    for (const auto& query : queries) {
        SCOPED_TRACE(query.substr(0, 16));
        try {
            compile_filter(query, FilterParseMode::STRICT);
            FAIL() << "expected QueryError";
        } catch (const QueryError& e) {
            EXPECT_EQ(e.stage(), QueryStage::COMPILE);
        }
    }
}

TEST(filter_nesting, long_flat_chains) {
    EventPredicate any = compile_filter(repeat("a or ", 100000) + "b");
    EXPECT_EQ(any.recovered_tokens(), 0u);
    EXPECT_TRUE(any(make_event(R"({"b":1})")));
    EXPECT_FALSE(any(make_event(R"({"c":1})")));

    EventPredicate all = compile_filter(repeat("a and ", 100000) + "b");
    EXPECT_TRUE(all(make_event(R"({"a":1,"b":1})")));
    EXPECT_FALSE(all(make_event(R"({"b":1})")));

    EXPECT_EQ(compile_filter("a and b and c").describe(),
              "(and (exists a) (exists b) (exists c))");
}

TEST(filter_properties, each_comparator_compiles_to_itself) {
    EXPECT_EQ(compile_filter("n == 1").describe(), "(== n \"1\")");
    EXPECT_EQ(compile_filter("n ~= 1").describe(), "(~= n \"1\")");
    EXPECT_EQ(compile_filter("n < 1").describe(), "(< n \"1\")");
    EXPECT_EQ(compile_filter("n > 1").describe(), "(> n \"1\")");
    EXPECT_EQ(compile_filter("n <= 1").describe(), "(<= n \"1\")");
    EXPECT_EQ(compile_filter("n >= 1").describe(), "(>= n \"1\")");

    TraceEvent event = make_event(R"({"n":1})");
    EXPECT_TRUE(compile_filter("n >= 1")(event));
    EXPECT_FALSE(compile_filter("n > 1")(event));
}
