#include <type-map/assert-handler.hh>
#include <type-map/assert.hh>

#include <nexus/test.hh>

#include <optional>
#include <string>
#include <vector>

namespace
{
struct assertion_thrown
{
    std::string message;
};

// installs a handler that records every report and unwinds with assertion_thrown
struct recording_handler
{
    std::vector<tmap::impl::assertion_info> reports;
    tmap::impl::scoped_assertion_handler scope;

    recording_handler()
      : scope(
            [this](tmap::impl::assertion_info const& info)
            {
                reports.push_back(info);
                throw assertion_thrown{info.message};
            })
    {
    }
};
} // namespace

TEST("assertions - report contents")
{
    auto rec = recording_handler();

    int const expected_line = __LINE__ + 3;
    try
    {
        TMAP_ASSERT_ALWAYS(1 + 1 == 3, "arithmetic is broken");
        CHECK(false);
    }
    catch (assertion_thrown const& e)
    {
        CHECK(e.message == "arithmetic is broken");
    }

    REQUIRE(rec.reports.size() == 1);
    auto const& info = rec.reports[0];
    CHECK(info.expression == "1 + 1 == 3");
    CHECK(std::string(info.location.file_name()).ends_with("assert-test.cc"));
    CHECK(int(info.location.line()) == expected_line);

    auto const report = info.to_report();
    CHECK(report.starts_with("type-map assertion failed: `1 + 1 == 3` (arithmetic is broken) at "));
    CHECK(report.find("assert-test.cc:" + std::to_string(expected_line) + " in ") != std::string::npos);
}

TEST("assertions - holding conditions are silent")
{
    auto rec = recording_handler();

    TMAP_ASSERT_ALWAYS(true, "unused");
    TMAP_ASSERT(2 > 1, "unused");

    CHECK(rec.reports.empty());
}

TEST("assertions - conditions are evaluated once")
{
    auto rec = recording_handler();

    auto calls = 0;
    auto const count = [&] { return ++calls > 0; };
    TMAP_ASSERT_ALWAYS(count(), "unused");
    CHECK(calls == 1);
}

TEST("assertions - the innermost handler receives the failure")
{
    auto outer = recording_handler();

    {
        auto inner = recording_handler();
        try
        {
            TMAP_ASSERT_ALWAYS(false, "inner");
        }
        catch (assertion_thrown const&) // NOLINT(bugprone-empty-catch)
        {
        }
        CHECK(inner.reports.size() == 1);
        CHECK(outer.reports.empty());
    }

    // the inner handler is popped even though it threw
    try
    {
        TMAP_ASSERT_ALWAYS(false, "outer");
    }
    catch (assertion_thrown const&) // NOLINT(bugprone-empty-catch)
    {
    }
    REQUIRE(outer.reports.size() == 1);
    CHECK(outer.reports[0].message == "outer");
}

#if TMAP_ASSERT_ENABLED
TEST("assertions - TMAP_ASSERT reports when enabled")
{
    auto rec = recording_handler();

    auto caught = std::optional<std::string>();
    try
    {
        TMAP_ASSERT(1 > 2, "debug check");
    }
    catch (assertion_thrown const& e)
    {
        caught = e.message;
    }

    REQUIRE(caught.has_value());
    CHECK(caught.value() == "debug check");
}
#endif
