#include <type-map/optional.hh>
#include <type-map/to_debug_string.hh>

#include <nexus/test.hh>

#include <array>
#include <list>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

// =========================================================================================================
// Helper types for testing dispatch priorities
// =========================================================================================================

// Type with both ADL to_string AND iterability
struct HasAdlAndIterable
{
    std::vector<int> data = {10, 20, 30};

    auto begin() const { return data.begin(); }
    auto end() const { return data.end(); }
};

std::string to_string(HasAdlAndIterable const&)
{
    return "ADL_to_string";
}

// Type with member to_string() AND iterability
struct HasMemberAndIterable
{
    std::vector<int> data = {40, 50};

    std::string to_string() const { return "member_to_string"; }
    auto begin() const { return data.begin(); }
    auto end() const { return data.end(); }
};

// Type rendering itself for debugging, wins over everything else
struct HasDebugAndMember
{
    std::string to_debug_string() const { return "debug"; }
    std::string to_string() const { return "member"; }
};

struct CustomStringable
{
    int value;
    std::string to_string() const { return std::to_string(value) + "_custom"; }
};

// Opaque struct for memory dump fallback
struct OpaqueType
{
    uint32_t a;
    uint16_t b;
    uint8_t c;
};

struct EmptyStruct
{
};

// =========================================================================================================
// Scalars
// =========================================================================================================

TEST("to_debug_string - scalars")
{
    CHECK(tmap::to_debug_string(42) == "42");
    CHECK(tmap::to_debug_string(-7) == "-7");
    CHECK(tmap::to_debug_string(tmap::u64(18446744073709551615ull)) == "18446744073709551615");
    CHECK(tmap::to_debug_string(0.5) == "0.5");
    CHECK(tmap::to_debug_string(1.5f) == "1.5");
    CHECK(tmap::to_debug_string(true) == "true");
    CHECK(tmap::to_debug_string(false) == "false");
}

TEST("to_debug_string - chars are quoted and escaped")
{
    CHECK(tmap::to_debug_string('a') == "'a'");
    CHECK(tmap::to_debug_string(' ') == "' '");
    CHECK(tmap::to_debug_string('\n') == "'\\n'");
    CHECK(tmap::to_debug_string('\t') == "'\\t'");
    CHECK(tmap::to_debug_string('\0') == "'\\0'");
    CHECK(tmap::to_debug_string('\'') == "'\\''");
    CHECK(tmap::to_debug_string('\\') == "'\\\\'");
    CHECK(tmap::to_debug_string(char(1)) == "'\\x01'");
    CHECK(tmap::to_debug_string(char(127)) == "'\\x7F'");
}

TEST("to_debug_string - strings are quoted")
{
    CHECK(tmap::to_debug_string(std::string("hello")) == "\"hello\"");
    CHECK(tmap::to_debug_string(std::string_view("view")) == "\"view\"");
    CHECK(tmap::to_debug_string("literal") == "\"literal\"");

    // empty strings stay visible
    CHECK(tmap::to_debug_string(std::string()) == "\"\"");
}

TEST("to_debug_string - optionals")
{
    CHECK(tmap::to_debug_string(tmap::optional<int>()) == "nullopt");
    CHECK(tmap::to_debug_string(tmap::optional<int>(3)) == "3");
    CHECK(tmap::to_debug_string(tmap::optional<std::string>("x")) == "\"x\"");
}

// =========================================================================================================
// Dispatch priorities
// =========================================================================================================

TEST("to_debug_string - dispatch priorities")
{
    CHECK(tmap::to_debug_string(HasDebugAndMember{}) == "debug");

    // ADL to_string takes precedence over iteration
    CHECK(tmap::to_debug_string(HasAdlAndIterable{}) == "ADL_to_string");

    // member to_string() takes precedence over iteration
    CHECK(tmap::to_debug_string(HasMemberAndIterable{}) == "member_to_string");

    CHECK(tmap::to_debug_string(CustomStringable{1}) == "1_custom");
}

// =========================================================================================================
// Collections and tuples
// =========================================================================================================

TEST("to_debug_string - collections")
{
    CHECK(tmap::to_debug_string(std::vector<int>{}) == "[]");
    CHECK(tmap::to_debug_string(std::vector<int>{42}) == "[42]");
    CHECK(tmap::to_debug_string(std::vector<int>{1, 2, 3}) == "[1, 2, 3]");
    CHECK(tmap::to_debug_string(std::list<int>{10, 20, 30}) == "[10, 20, 30]");
    CHECK(tmap::to_debug_string(std::array<int, 3>{5, 10, 15}) == "[5, 10, 15]");
    CHECK(tmap::to_debug_string(std::vector<std::string>{"hello", "world"}) == "[\"hello\", \"world\"]");
    CHECK(tmap::to_debug_string(std::vector<std::vector<int>>{{1, 2}, {}, {3}}) == "[[1, 2], [], [3]]");
}

TEST("to_debug_string - tuples")
{
    CHECK(tmap::to_debug_string(std::tuple<>()) == "()");
    CHECK(tmap::to_debug_string(std::tuple<int>(42)) == "(42)");
    CHECK(tmap::to_debug_string(std::pair<int, int>(10, 20)) == "(10, 20)");

    auto const mixed = std::tuple<int, std::string, std::vector<int>>(42, "hello", {1, 2, 3});
    CHECK(tmap::to_debug_string(mixed) == "(42, \"hello\", [1, 2, 3])");

    auto const custom = std::tuple<int, CustomStringable, int>(10, CustomStringable{99}, 20);
    CHECK(tmap::to_debug_string(custom) == "(10, 99_custom, 20)");

    std::vector<std::pair<int, std::string>> pairs;
    pairs.push_back({1, "a"});
    pairs.push_back({2, "b"});
    CHECK(tmap::to_debug_string(pairs) == "[(1, \"a\"), (2, \"b\")]");
}

// =========================================================================================================
// max_length truncation
// =========================================================================================================

TEST("to_debug_string - large collections truncate with ellipsis")
{
    std::vector<int> large;
    for (int i = 0; i < 1000; ++i)
        large.push_back(i);

    auto const result = tmap::to_debug_string(large, tmap::debug_string_config{100});
    CHECK(result.ends_with(", ...]"));
    CHECK(result.size() < 200);

    auto const tuple = std::make_tuple(1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16, 17, 18, 19, 20, 21, 22, 23,
                                       24, 25, 26, 27, 28, 29, 30);
    auto const tuple_result = tmap::to_debug_string(tuple, tmap::debug_string_config{50});
    CHECK(tuple_result.ends_with(", ...)"));
    CHECK(tuple_result.size() < 100);
}

// =========================================================================================================
// Memory dump fallback
// =========================================================================================================

TEST("to_debug_string - opaque types produce a hex dump")
{
    auto const result = tmap::to_debug_string(OpaqueType{0x12345678, 0xABCD, 0xEF});
    CHECK(result.starts_with("0x"));
    CHECK(result.find('_') != std::string::npos); // separator every alignof(OpaqueType) bytes

    auto all_hex = true;
    for (size_t i = 2; i < result.size(); ++i)
    {
        auto const c = result[i];
        all_hex = all_hex && (c == '_' || (c >= '0' && c <= '9') || (c >= 'A' && c <= 'F'));
    }
    CHECK(all_hex);

    // empty structs still occupy one byte
    CHECK(tmap::to_debug_string(EmptyStruct{}).size() == 4);
}
