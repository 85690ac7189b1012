#include <bounded-buffer/span.hh>

#include <nexus/test.hh>

#include "assert-helper.hh"

static_assert(std::is_trivially_copyable_v<bb::span<int>>);
static_assert(std::is_convertible_v<bb::span<int>, bb::span<int const>>);
static_assert(!std::is_convertible_v<bb::span<int const>, bb::span<int>>);

TEST("span - views exactly the given range")
{
    int data[] = {10, 20, 30, 40, 50};

    SECTION("default is empty")
    {
        auto const s = bb::span<int>{};
        CHECK(s.data() == nullptr);
        CHECK(s.empty());
        CHECK(s.begin() == s.end());
    }

    SECTION("sub range")
    {
        auto const s = bb::span<int>{data + 1, data + 4};
        CHECK(s.data() == data + 1);
        CHECK(s.size() == 3);
        CHECK(s[0] == 20);
        CHECK(s[2] == 40);
        CHECK(s.end() == data + 4);
    }

    SECTION("writes go through to the viewed elements")
    {
        auto const s = bb::span<int>{data, data + 5};
        for (auto& v : s)
            v += 1;
        CHECK(data[0] == 11);
        CHECK(data[4] == 51);
    }
}

#if BB_ASSERT_ENABLED
TEST("span - invalid ranges and indices are caught")
{
    int data[] = {1, 2, 3};
    auto const s = bb::span<int>{data, data + 3};

    CHECK(test::triggers_assertion([&] { (void)s[3]; }));
    CHECK(test::triggers_assertion([&] { (void)s[-1]; }));
    CHECK(test::triggers_assertion([&] { (void)bb::span<int>(data + 2, data); }));
}
#endif
