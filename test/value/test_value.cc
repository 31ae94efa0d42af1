#include <entiform/value.hh>
#include <entiform/text_codec.hh>
#include <doctest/doctest.h>

using namespace entiform;

TEST_SUITE("Value Model") {

    TEST_CASE("Kinds of constructed values") {
        CHECK(value().kind() == value_kind::null);
        CHECK(value(nullptr).is_null());
        CHECK(value(true).kind() == value_kind::boolean);
        CHECK(value(42).kind() == value_kind::integer);
        CHECK(value(1.5).kind() == value_kind::number);
        CHECK(value("text").kind() == value_kind::string);
        CHECK(value(binary{1, 2, 3}).kind() == value_kind::binary);
        CHECK(value(date_time{1000}).kind() == value_kind::date);
        CHECK(value(array{1, 2}).kind() == value_kind::array);
        CHECK(value(object{{"a", 1}}).kind() == value_kind::object);

        CHECK(value(42).is_number());
        CHECK_FALSE(value(1.5).is_integer());
    }

    TEST_CASE("Integers and numbers compare numerically") {
        CHECK(value(3) == value(3.0));
        CHECK(value(3.5) != value(3));
        CHECK(value(1) != value(true));
        CHECK(value(0) != value());
        CHECK(value(7).as_number() == doctest::Approx(7.0));
    }

    TEST_CASE("Object keeps insertion order") {
        object o{{"b", 1}, {"a", 2}};
        o.set("c", 3);
        o.set("b", 10);

        std::vector<std::string> keys;
        for (const auto& [key, _] : o) {
            keys.push_back(key);
        }
        CHECK(keys == std::vector<std::string>{"b", "a", "c"});
        REQUIRE(o.find("b") != nullptr);
        CHECK(*o.find("b") == value(10));
        CHECK(o.find("missing") == nullptr);

        CHECK(o.erase("a"));
        CHECK_FALSE(o.erase("a"));
        CHECK(o.size() == 2);
    }

    TEST_CASE("Object equality ignores member order") {
        object lhs{{"x", 1}, {"y", "two"}};
        object rhs{{"y", "two"}, {"x", 1}};
        CHECK(lhs == rhs);

        rhs.set("z", nullptr);
        CHECK_FALSE(lhs == rhs);
    }

    TEST_CASE("Nested containers compare deeply") {
        value a(array{object{{"tags", array{"x", "y"}}}});
        value b(array{object{{"tags", array{"x", "y"}}}});
        value c(array{object{{"tags", array{"x"}}}});
        CHECK(a == b);
        CHECK(a != c);
    }

    TEST_CASE("Debug rendering") {
        CHECK(value().to_string() == "null");
        CHECK(value(12).to_string() == "12");
        CHECK(value(false).to_string() == "false");
        CHECK(value(array{1, 2}).to_string() == "[1, 2]");
        CHECK(value(binary{1, 2, 3}).to_string() == "<binary 3 bytes>");
        CHECK(value(date_time{0}).to_string() == "date(1970-01-01T00:00:00.000Z)");
    }

    TEST_CASE("Kind names") {
        CHECK(std::string(value_kind_name(value_kind::object)) == "object");
        CHECK(std::string(value_kind_name(value_kind::entity)) == "entity");
    }
}

TEST_SUITE("Text Codecs") {

    TEST_CASE("Numbers") {
        CHECK(format_number(1.5) == "1.5");
        CHECK(format_number(499.0) == "499");

        auto integral = parse_number("12");
        REQUIRE(integral.has_value());
        CHECK(integral->is_integer());
        CHECK(integral->as_integer() == 12);

        auto fractional = parse_number("-0.25");
        REQUIRE(fractional.has_value());
        CHECK_FALSE(fractional->is_integer());
        CHECK(fractional->as_number() == doctest::Approx(-0.25));

        CHECK_FALSE(parse_number("").has_value());
        CHECK_FALSE(parse_number("12abc").has_value());
        CHECK_FALSE(parse_number(" 12").has_value());
    }

    TEST_CASE("Base64") {
        CHECK(base64_encode(binary{'M', 'a', 'n'}) == "TWFu");
        CHECK(base64_encode(binary{'M', 'a'}) == "TWE=");
        CHECK(base64_encode(binary{}) == "");

        auto decoded = base64_decode("TWE=");
        REQUIRE(decoded.has_value());
        CHECK(*decoded == binary{'M', 'a'});

        CHECK_FALSE(base64_decode("T!E=").has_value());
        CHECK_FALSE(base64_decode("TWE").has_value());
    }

    TEST_CASE("ISO-8601 formatting") {
        CHECK(format_iso8601(date_time{0}) == "1970-01-01T00:00:00.000Z");
        CHECK(format_iso8601(date_time{1704067200123}) == "2024-01-01T00:00:00.123Z");
    }

    TEST_CASE("ISO-8601 parsing") {
        auto day = parse_iso8601("2024-01-02");
        REQUIRE(day.has_value());
        CHECK(day->millis == 1704153600000);

        auto utc = parse_iso8601("2024-01-01T00:00:00.123Z");
        REQUIRE(utc.has_value());
        CHECK(utc->millis == 1704067200123);

        auto offset = parse_iso8601("2024-01-01T02:00:00+02:00");
        REQUIRE(offset.has_value());
        CHECK(offset->millis == 1704067200000);

        auto spaced = parse_iso8601("2024-01-01 00:00");
        REQUIRE(spaced.has_value());
        CHECK(spaced->millis == 1704067200000);

        CHECK_FALSE(parse_iso8601("yesterday").has_value());
        CHECK_FALSE(parse_iso8601("2024-13-01").has_value());
    }

    TEST_CASE("ISO-8601 days are checked against the month") {
        CHECK_FALSE(parse_iso8601("2024-02-31").has_value());
        CHECK_FALSE(parse_iso8601("2024-04-31T10:00:00Z").has_value());
        CHECK_FALSE(parse_iso8601("2023-02-29").has_value());
        CHECK_FALSE(parse_iso8601("1900-02-29").has_value());

        REQUIRE(parse_iso8601("2024-02-29").has_value());
        CHECK(format_iso8601(*parse_iso8601("2024-02-29")) == "2024-02-29T00:00:00.000Z");
        CHECK(parse_iso8601("2000-02-29").has_value());
        CHECK(parse_iso8601("2024-12-31").has_value());
    }
}
