#include <gtest/gtest.h>

#include "json_parser_utility.hpp"
#include "test_events.hpp"

TEST(coerce_number, decimal_grammar) {
    EXPECT_EQ(coerce_number("42"), 42.0);
    EXPECT_EQ(coerce_number("  -3.5 "), -3.5);
    EXPECT_EQ(coerce_number("+7"), 7.0);
    EXPECT_EQ(coerce_number("1e3"), 1000.0);
    EXPECT_EQ(coerce_number("2.5E-1"), 0.25);
}

TEST(coerce_number, rejects_non_numbers) {
    EXPECT_FALSE(coerce_number(""));
    EXPECT_FALSE(coerce_number("   "));
    EXPECT_FALSE(coerce_number("abc"));
    EXPECT_FALSE(coerce_number("12abc"));
    EXPECT_FALSE(coerce_number("1.2.3"));
    EXPECT_FALSE(coerce_number("e5"));
}

TEST(format_number, integral_and_fractional) {
    EXPECT_EQ(format_number(150.0), "150");
    EXPECT_EQ(format_number(-2.0), "-2");
    EXPECT_EQ(format_number(0.5), "0.5");
    EXPECT_EQ(format_number(1.25), "1.25");
}

TEST(json_value, text_form_of_scalars) {
    TraceEvent event = make_event(
        R"({"s":"abc","i":7,"n":-3,"r":2.5,"t":true,"f":false,"z":null})");

    EXPECT_EQ(event.field("s").as_text(), "abc");
    EXPECT_EQ(event.field("i").as_text(), "7");
    EXPECT_EQ(event.field("n").as_text(), "-3");
    EXPECT_EQ(event.field("r").as_text(), "2.5");
    EXPECT_EQ(event.field("t").as_text(), "true");
    EXPECT_EQ(event.field("f").as_text(), "false");
    EXPECT_FALSE(event.field("z").as_text());
    EXPECT_FALSE(event.field("missing").as_text());
}

TEST(json_value, text_form_of_containers_is_compact_json) {
    TraceEvent event = make_event(R"({"a":[1, 2, "x"],"o":{"k" : 1}})");
    EXPECT_EQ(event.field("a").as_text(), R"([1,2,"x"])");
    EXPECT_EQ(event.field("o").as_text(), R"({"k":1})");
}

TEST(json_value, numeric_coercion) {
    TraceEvent event = make_event(
        R"({"i":10,"s":"31000","bad":"fast","e":"","t":true,"z":null,"a":[1]})");

    EXPECT_EQ(event.field("i").as_number(), 10.0);
    EXPECT_EQ(event.field("s").as_number(), 31000.0);
    EXPECT_EQ(event.field("t").as_number(), 1.0);
    EXPECT_FALSE(event.field("bad").as_number());
    EXPECT_FALSE(event.field("e").as_number());
    EXPECT_FALSE(event.field("z").as_number());
    EXPECT_FALSE(event.field("a").as_number());
    EXPECT_FALSE(event.field("missing").as_number());
}

TEST(json_value, dotted_paths) {
    TraceEvent event =
        make_event(R"({"args":{"user":{"id":"u-9"}},"args.flat":1})");

    EXPECT_EQ(event.field("args.user.id").as_text(), "u-9");
    EXPECT_TRUE(event.field("args.user").is_object());
    EXPECT_FALSE(event.field("args.user.name").exists());
    EXPECT_FALSE(event.field("args.user.id.deeper").exists());
}

TEST(json_value, null_is_present_but_has_no_value) {
    TraceEvent event = make_event(R"({"z":null})");
    EXPECT_TRUE(event.field("z").exists());
    EXPECT_TRUE(event.field("z").is_null());
    EXPECT_FALSE(event.field("z").has_value());
    EXPECT_EQ(event.field("z").to_json(), "null");
}

TEST(trace_event, timestamp_defaults_to_zero) {
    EXPECT_EQ(make_event(R"({"timestamp":1005})").timestamp(), 1005.0);
    EXPECT_EQ(make_event(R"({"timestamp":"17"})").timestamp(), 17.0);
    EXPECT_EQ(make_event(R"({"timestamp":"soon"})").timestamp(), 0.0);
    EXPECT_EQ(make_event(R"({"event":"x"})").timestamp(), 0.0);
    EXPECT_EQ(make_event(R"({"ts":3})").timestamp("ts"), 3.0);
}

TEST(trace_event, field_names_in_record_order) {
    TraceEvent event = make_event(R"({"b":1,"a":2,"c":{"d":3}})");
    std::vector<std::string> expected{"b", "a", "c"};
    EXPECT_EQ(event.field_names(), expected);
}

TEST(trace_event, copies_share_document) {
    TraceEvent copy;
    {
        TraceEvent original = make_event(R"({"method":"checkout"})");
        copy = original;
    }
    ASSERT_TRUE(copy.valid());
    EXPECT_EQ(copy.field("method").as_text(), "checkout");
}
