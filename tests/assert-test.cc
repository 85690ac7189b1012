#include <bounded-buffer/assert-handler.hh>
#include <bounded-buffer/assert.hh>
#include <bounded-buffer/bounded_buffer.hh>

#include <nexus/test.hh>

#include "assert-helper.hh"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace
{
struct captured_failure
{
};

bool ends_with(std::string_view s, std::string_view suffix)
{
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}
} // namespace

TEST("assertions - out-of-bounds pop_at reaches the installed handler")
{
    auto b = bb::bounded_buffer<int>::create_with_capacity(4);
    REQUIRE(b.try_push_back(1));
    REQUIRE(b.try_push_back(2));

    std::optional<bb::impl::assertion_info> captured;
    {
        auto handler = bb::impl::scoped_assertion_handler(
            [&](bb::impl::assertion_info const& info)
            {
                captured = info;
                throw captured_failure{};
            });

        try
        {
            (void)b.pop_at(2);
        }
        catch (captured_failure const&) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    REQUIRE(captured.has_value());
    CHECK(captured->message == "index out of bounds");
    CHECK(captured->expression.find("idx") != std::string::npos);
    CHECK(ends_with(captured->location.file_name(), "bounded_buffer.hh"));

    // the failed call left the buffer untouched
    CHECK(b.size() == 2);
    CHECK(b[0] == 1);
    CHECK(b[1] == 2);

    CHECK(test::triggers_assertion([&] { (void)b.pop_at(-1); }));
    CHECK(test::triggers_assertion([&] { b.remove_at(5); }));
    CHECK(b.size() == 2);
}

TEST("assertions - BB_ASSERT is gated, BB_ASSERT_ALWAYS is not")
{
    SECTION("passing conditions never call the handler")
    {
        CHECK(!test::triggers_assertion([] { BB_ASSERT(true, "unreachable"); }));
        CHECK(!test::triggers_assertion([] { BB_ASSERT_ALWAYS(true, "unreachable"); }));
    }

    SECTION("BB_ASSERT_ALWAYS fires in every build")
    {
        CHECK(test::triggers_assertion([] { BB_ASSERT_ALWAYS(false, "always checked"); }));
    }

    SECTION("BB_ASSERT follows BB_ASSERT_ENABLED")
    {
        CHECK(test::triggers_assertion([] { BB_ASSERT(false, "debug only"); }) == bool(BB_ASSERT_ENABLED));
    }

    SECTION("BB_ASSERT evaluates its condition only when enabled")
    {
        int evaluations = 0;
        (void)test::triggers_assertion([&] { BB_ASSERT(++evaluations > 0, "side effect"); });
        CHECK(evaluations == (BB_ASSERT_ENABLED ? 1 : 0));
    }

#if BB_ASSERT_ENABLED
    SECTION("unchecked appends are caught while BB_ASSERT is on")
    {
        auto b = bb::bounded_buffer<int>::create_with_capacity(1);
        REQUIRE(b.try_push_back(1));
        CHECK(test::triggers_assertion([&] { (void)b.emplace_back_unchecked(2); }));
        CHECK(b.size() == 1);
    }
#endif
}

TEST("assertions - default report text")
{
    auto const loc = bb::source_location::current();
    auto const info = bb::impl::assertion_info{"0 <= idx && idx < size()", "index out of bounds", loc};

    auto const text = bb::impl::format_assertion(info);

    CHECK(text.starts_with("bounded-buffer assertion failed: 0 <= idx && idx < size()\n"));
    CHECK(text.find("\n  message:  index out of bounds\n") != std::string::npos);
    CHECK(text.find("  location: ") != std::string::npos);
    CHECK(text.find(loc.file_name()) != std::string::npos);
    CHECK(text.find(":" + std::to_string(loc.line()) + ":") != std::string::npos);
    CHECK(text.find(loc.function_name()) != std::string::npos);
    CHECK(ends_with(text, ")\n"));
}

TEST("assertions - only the innermost handler runs")
{
    std::vector<int> calls;
    {
        auto outer = bb::impl::scoped_assertion_handler(
            [&](bb::impl::assertion_info const&)
            {
                calls.push_back(1);
                throw captured_failure{};
            });

        {
            auto inner = bb::impl::scoped_assertion_handler(
                [&](bb::impl::assertion_info const&)
                {
                    calls.push_back(2);
                    throw captured_failure{};
                });
            try
            {
                BB_ASSERT_ALWAYS(false, "inner");
            }
            catch (captured_failure const&) // NOLINT(bugprone-empty-catch)
            {
            }
        }

        // inner was popped even though its handler threw
        try
        {
            BB_ASSERT_ALWAYS(false, "outer");
        }
        catch (captured_failure const&) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    CHECK(calls == std::vector<int>{2, 1});
}
