#include <catch2/catch_all.hpp>
#include <gql/json.h>
#include <limits>

using namespace gql;
using Catch::Matchers::ContainsSubstring;

namespace {
Object obj(std::vector<std::pair<Name, Value>> pairs) { return *objectFromList(std::move(pairs)); }
}

TEST_CASE("Object fields are written in insertion order", "[json][dump]") {
    Object o = obj({{Name("b"), Value(1)}, {Name("a"), Value(2)}});
    REQUIRE(dump(o) == R"({"b":1,"a":2})");
    REQUIRE(dump(Value(o)) == R"({"b":1,"a":2})");
}

TEST_CASE("Scalars use their JSON equivalents", "[json][dump]") {
    REQUIRE(dump(Value(-12)) == "-12");
    REQUIRE(dump(Value(true)) == "true");
    REQUIRE(dump(Value::null()) == "null");
    REQUIRE(dump(Value(String("hi"))) == R"("hi")");
    REQUIRE(dump(Value(Name("GREEN"))) == R"("GREEN")");
    REQUIRE(dump(Value(List())) == "[]");
    REQUIRE(dump(Value(Object())) == "{}");
    REQUIRE(dump(Value(List({Value(1), Value::null(), Value(String("x"))}))) == R"([1,null,"x"])");
}

TEST_CASE("Int extremes are written exactly", "[json][dump]") {
    REQUIRE(dump(Value(std::numeric_limits<int32_t>::max())) == "2147483647");
    REQUIRE(dump(Value(std::numeric_limits<int32_t>::min())) == "-2147483648");
}

TEST_CASE("Floats keep full precision and stay floats", "[json][dump]") {
    REQUIRE(dump(Value(1.0)) == "1.0");
    REQUIRE(dump(Value(-0.5)) == "-0.5");
    REQUIRE(dump(Value(0.1)) == "0.1");
    REQUIRE(dump(Value(1e200)) == "1e+200");

    double third = 1.0 / 3.0;
    REQUIRE(parse_json(dump(Value(third))) == Value(third));
}

TEST_CASE("Non-finite floats are written as null", "[json][dump]") {
    REQUIRE(dump(Value(std::numeric_limits<double>::infinity())) == "null");
    REQUIRE(dump(Value(std::numeric_limits<double>::quiet_NaN())) == "null");
}

TEST_CASE("Strings are escaped", "[json][dump]") {
    REQUIRE(escape_json_string("a\"b\\c") == R"("a\"b\\c")");
    REQUIRE(escape_json_string("line\nnext\ttab") == R"("line\nnext\ttab")");
    REQUIRE(escape_json_string(std::string("\x01", 1)) == R"("\u0001")");
}

TEST_CASE("Pretty print keeps order and indents nested values", "[json][dump]") {
    Object inner = obj({{Name("z"), Value(1)}, {Name("y"), Value(List({Value(1), Value(2)}))}});
    Object o = obj({{Name("name"), Value(String("gql"))}, {Name("inner"), Value(inner)}});
    std::string expected = R"({
    "name": "gql",
    "inner": {
        "z": 1,
        "y": [1,2]
    }
})";
    REQUIRE(dump(o, 4) == expected);
}

TEST_CASE("Pretty print expands long or nested lists", "[json][dump]") {
    Value l(List({Value(1), Value(2), Value(3), Value(4)}));
    std::string expected = "[\n  1,\n  2,\n  3,\n  4\n]";
    REQUIRE(dump(l, 2) == expected);
}

TEST_CASE("Parse JSON into canonical values", "[json][parse]") {
    Value v = parse_json(R"({"id": 7, "ratio": 0.5, "tags": ["a", null], "ok": true, "none": null})");
    REQUIRE(v.isObject());
    auto fields = objectFields(v.asObject());
    REQUIRE(fields.size() == 5);
    REQUIRE(fields[0].name.str() == "id");
    REQUIRE(fields[0].value == Value(7));
    REQUIRE(fields[1].value == Value(0.5));
    REQUIRE(fields[2].value == Value(List({Value(String("a")), Value::null()})));
    REQUIRE(fields[3].value == Value(true));
    REQUIRE(fields[4].value.isNull());
}

TEST_CASE("Numbers outside the Int range become floats", "[json][parse]") {
    REQUIRE(parse_json("2147483647") == Value(2147483647));
    REQUIRE(parse_json("-2147483648") == Value(std::numeric_limits<int32_t>::min()));
    REQUIRE(parse_json("2147483648") == Value(2147483648.0));
    REQUIRE(parse_json("1.0") == Value(1.0));
    REQUIRE(parse_json("1e2") == Value(100.0));
}

TEST_CASE("Unicode escapes decode to UTF-8", "[json][parse]") {
    REQUIRE(parse_json(R"("\u00e9")") == Value(String("\xc3\xa9")));
    REQUIRE(parse_json(R"("\ud83d\ude00")") == Value(String("\xf0\x9f\x98\x80")));
    REQUIRE_THROWS_AS(parse_json(R"("\ud83d")"), JsonParseError);
}

TEST_CASE("A NUL byte is not the end of input", "[json][parse][exception]") {
    REQUIRE_THROWS_WITH(parse_json(std::string("[1]\0x", 5)), ContainsSubstring("extra data after JSON value"));
    REQUIRE_THROWS_AS(parse_json(std::string("[1]\0", 4)), JsonParseError);
    REQUIRE_THROWS_WITH(parse_json(std::string("[1,\0]", 5)), ContainsSubstring("unexpected character"));
    REQUIRE_THROWS_WITH(parse_json(std::string("\"a\0b\"", 5)), ContainsSubstring("unescaped control character"));
    REQUIRE(parse_json(R"("a\u0000b")") == Value(String(std::string("a\0b", 3))));
}

TEST_CASE("Malformed UTF-8 is replaced on output and rejected on input", "[json][utf8]") {
    REQUIRE(dump(Value(String("\xff"))) == R"("\ufffd")");
    REQUIRE(dump(Value(String("a\xc3"))) == R"("a\ufffd")");
    // encoded surrogate
    REQUIRE(dump(Value(String("\xed\xa0\x80"))) == R"("\ufffd\ufffd\ufffd")");
    REQUIRE(dump(Value(String("\xc3\xa9"))) == "\"\xc3\xa9\"");

    REQUIRE_THROWS_WITH(parse_json("\"\xff\""), ContainsSubstring("invalid UTF-8"));
    // overlong '/'
    REQUIRE_THROWS_AS(parse_json("\"\xc0\xaf\""), JsonParseError);
    REQUIRE(parse_json(dump(Value(String("\xff")))) == Value(String("\xef\xbf\xbd")));

    REQUIRE(utf8_sequence_length("\xf0\x9f\x98\x80", 0) == 4);
    REQUIRE(utf8_sequence_length("\xf4\x90\x80\x80", 0) == 0);
    REQUIRE(utf8_sequence_length("a", 1) == 0);
}

TEST_CASE("Duplicate keys are a parse error", "[json][parse][exception]") {
    REQUIRE_THROWS_AS(parse_json(R"({"a": 1, "a": 2})"), JsonParseError);
    REQUIRE_THROWS_WITH(parse_json(R"({"a": 1, "a": 2})"), ContainsSubstring("duplicate object key 'a'"));
}

TEST_CASE("Keys must be GraphQL names", "[json][parse][exception]") {
    REQUIRE_THROWS_WITH(parse_json(R"({"not a name": 1})"), ContainsSubstring("not a valid GraphQL name"));
}

TEST_CASE("Malformed JSON reports line and column", "[json][parse][exception]") {
    try {
        parse_json("{\n  \"a\": 1,\n  \"b\" 2\n}");
        FAIL("expected a parse error");
    } catch (const JsonParseError& e) {
        REQUIRE(e.line == 3);
        REQUIRE_THAT(std::string(e.what()), ContainsSubstring("expected ':' after object key"));
        REQUIRE_THAT(std::string(e.what()), ContainsSubstring("opened at line 1"));
    }
    REQUIRE_THROWS_AS(parse_json("[1, 2"), JsonParseError);
    REQUIRE_THROWS_AS(parse_json("[1] 2"), JsonParseError);
    REQUIRE_THROWS_AS(parse_json("01"), JsonParseError);
    REQUIRE_THROWS_AS(parse_json(""), JsonParseError);
    REQUIRE_THROWS_AS(parse_json("True"), JsonParseError);
}

TEST_CASE("Nesting deeper than the limit is rejected", "[json][parse][exception]") {
    REQUIRE_NOTHROW(parse_json("[[[1]]]", 3));
    REQUIRE_THROWS_WITH(parse_json("[[[1]]]", 2), ContainsSubstring("maximum nesting depth"));
    REQUIRE_THROWS_AS(parse_json(std::string(100000, '['), 512), JsonParseError);
}

TEST_CASE("Dumped values read back unchanged", "[json][parse][roundtrip]") {
    Object o = obj({{Name("b"), Value(1)},
                    {Name("a"), Value(List({Value(2.5), Value(String("q\"uote")), Value(Object())}))},
                    {Name("c"), Value::null()}});
    REQUIRE(parse_json(dump(o)) == Value(o));
    REQUIRE(parse_json(dump(o, 2)) == Value(o));
}

TEST_CASE("JSON literal helper", "[json][parse]") {
    using namespace gql::json_literals;
    Value v = R"({"x": [1, 2]})"_json;
    REQUIRE(v.asObject().lookup(Name("x"))->asList().size() == 2);
}
