#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/generators/catch_generators_range.hpp>
#include <gql/gqlvalue.h>
#include <cmath>
#include <limits>
#include <random>
#include <set>

using namespace gql;

namespace {

// Seeded generators for arbitrary values, so every failure is reproducible
// from the seed Catch reports.
class Arbitrary {
  public:
    explicit Arbitrary(uint32_t seed) : rng_(seed) {}

    int pick(int lo, int hi) { return std::uniform_int_distribution<int>(lo, hi)(rng_); }
    bool coin() { return pick(0, 1) == 1; }

    int32_t int32() {
        return std::uniform_int_distribution<int32_t>(std::numeric_limits<int32_t>::min(),
                                                      std::numeric_limits<int32_t>::max())(rng_);
    }

    double float64() {
        switch (pick(0, 3)) {
            case 0: return std::uniform_real_distribution<double>(-1.0, 1.0)(rng_);
            case 1: return std::uniform_real_distribution<double>(-1e9, 1e9)(rng_);
            case 2: return static_cast<double>(pick(-1000, 1000));
            default: return std::ldexp(std::uniform_real_distribution<double>(0.5, 1.0)(rng_), pick(-900, 900));
        }
    }

    std::string text() {
        static const char* const extras[] = {"\xc3\xa9", "\xe2\x82\xac", "\n", "\t", "\"", "\\", "\x01"};
        std::string out;
        int n = pick(0, 12);
        for (int i = 0; i < n; ++i) {
            if (pick(0, 5) == 0)
                out += extras[pick(0, 6)];
            else
                out.push_back(static_cast<char>(pick(0x20, 0x7e)));
        }
        return out;
    }

    // A small pool makes repeated field names likely.
    Name name(bool small_pool = false) {
        static const char first[] = "_abcxyzABCXYZ";
        static const char rest[] = "_abcxyzABCXYZ0123456789";
        std::string s(1, first[pick(0, small_pool ? 2 : 12)]);
        int extra = small_pool ? 0 : pick(0, 6);
        for (int i = 0; i < extra; ++i) s.push_back(rest[pick(0, 22)]);
        return Name(s);
    }

    Value scalar(bool with_enums) {
        switch (pick(0, with_enums ? 5 : 4)) {
            case 0: return Value(int32());
            case 1: return Value(float64());
            case 2: return Value(coin());
            case 3: return Value(String(text()));
            case 4: return Value::null();
            default: return Value(name());
        }
    }

    // Objects and lists at most `depth` levels deep.
    Value value(int depth, bool with_enums = true) {
        if (depth <= 0 or pick(0, 2) == 0) return scalar(with_enums);
        int n = pick(0, 4);
        if (coin()) {
            std::vector<Value> out;
            for (int i = 0; i < n; ++i) out.push_back(value(depth - 1, with_enums));
            return Value(List(std::move(out)));
        }
        std::vector<std::pair<Name, Value>> fields;
        std::set<Name> used;
        for (int i = 0; i < n; ++i) {
            Name key = name();
            if (not used.insert(key).second) continue;
            fields.emplace_back(key, value(depth - 1, with_enums));
        }
        return Value(*objectFromList(std::move(fields)));
    }

    // Parser-shaped nodes: may hold variables and repeated field names.
    ast::Value astValue(int depth) {
        if (depth <= 0 or pick(0, 2) == 0) {
            switch (pick(0, 6)) {
                case 0: return ast::Value(int32());
                case 1: return ast::Value(float64());
                case 2: return ast::Value(coin());
                case 3: return ast::Value(ast::StringValue{text()});
                case 4: return ast::Value(name());
                case 5: return ast::Value(ast::NullValue{});
                default: return ast::Value(ast::Variable{name()});
            }
        }
        int n = pick(0, 3);
        if (coin()) {
            ast::ListValue out;
            for (int i = 0; i < n; ++i) out.values.push_back(astValue(depth - 1));
            return ast::Value(std::move(out));
        }
        ast::ObjectValue out;
        for (int i = 0; i < n; ++i) out.fields.emplace_back(name(true), astValue(depth - 1));
        return ast::Value(std::move(out));
    }

  private:
    std::mt19937 rng_;
};

template <typename T>
bool roundtrips(const T& x) {
    auto back = fromValue<T>(toValue(x));
    return back.ok() and back.value() == x;
}

}  // namespace

TEST_CASE("AST literals convert to values and back unchanged", "[roundtrip][property][ast_bridge]") {
    auto seed = GENERATE(range(1u, 301u));
    Arbitrary gen(seed);
    ast::Value node = gen.astValue(4);

    auto v = astToValue(node);
    if (v) {
        REQUIRE(valueToAST(*v) == node);
    } else {
        SUCCEED("node has a variable or a repeated field name");
    }
}

TEST_CASE("Values convert to AST and back unchanged", "[roundtrip][property][ast_bridge]") {
    auto seed = GENERATE(range(1u, 301u));
    Arbitrary gen(seed);
    Value v = gen.value(4);

    auto back = astToValue(valueToAST(v));
    REQUIRE(back.has_value());
    REQUIRE(*back == v);
}

TEST_CASE("Native values convert to values and back unchanged", "[roundtrip][property][marshal]") {
    auto seed = GENERATE(range(1u, 101u));
    Arbitrary gen(seed);

    REQUIRE(roundtrips(gen.int32()));
    REQUIRE(roundtrips(gen.float64()));
    REQUIRE(roundtrips(gen.coin()));
    REQUIRE(roundtrips(gen.text()));
    REQUIRE(roundtrips(gen.name()));
    REQUIRE(roundtrips(gen.value(3)));

    std::vector<int32_t> ints;
    for (int i = gen.pick(0, 6); i > 0; --i) ints.push_back(gen.int32());
    REQUIRE(roundtrips(ints));

    std::optional<std::vector<int32_t>> maybe_ints;
    if (gen.coin()) maybe_ints = ints;
    REQUIRE(roundtrips(maybe_ints));

    NonEmptyList<double> floats(gen.float64(), {gen.float64(), gen.float64()});
    REQUIRE(roundtrips(floats));

    std::vector<std::optional<std::string>> sparse;
    for (int i = gen.pick(0, 4); i > 0; --i) {
        if (gen.coin())
            sparse.push_back(gen.text());
        else
            sparse.push_back(std::nullopt);
    }
    REQUIRE(roundtrips(sparse));
}

TEST_CASE("Serialized values parse back unchanged", "[roundtrip][property][json]") {
    auto seed = GENERATE(range(1u, 201u));
    Arbitrary gen(seed);
    // Enums are written as plain JSON strings, so they cannot come back.
    Value v = gen.value(4, false);

    REQUIRE(parse_json(dump(v)) == v);
    REQUIRE(parse_json(dump(v, 2)) == v);
}
