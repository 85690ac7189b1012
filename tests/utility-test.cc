#include <bounded-buffer/utility.hh>

#include <nexus/test.hh>

#include <memory>
#include <string>

namespace
{
struct Counted
{
    static inline int live_count = 0;

    Counted() { ++live_count; }
    ~Counted() { --live_count; }
};
} // namespace

TEST("utility - move and forward preserve value categories")
{
    int x = 1;
    static_assert(std::is_same_v<decltype(bb::move(x)), int&&>);
    static_assert(std::is_same_v<decltype(bb::forward<int&>(x)), int&>);
    static_assert(std::is_same_v<decltype(bb::forward<int>(x)), int&&>);

    auto p = std::make_unique<int>(3);
    auto q = bb::move(p);
    CHECK(p == nullptr);
    CHECK(*q == 3);
}

TEST("utility - exchange replaces value and returns old")
{
    SECTION("integer exchange")
    {
        int v = 1;
        auto const old = bb::exchange(v, 2);
        CHECK(old == 1);
        CHECK(v == 2);
    }

    SECTION("pointer exchange")
    {
        int data = 0;
        int* p = &data;
        auto const old = bb::exchange(p, nullptr);
        CHECK(old == &data);
        CHECK(p == nullptr);
    }

    SECTION("move-only exchange")
    {
        auto p = std::make_unique<int>(5);
        auto old = bb::exchange(p, std::make_unique<int>(6));
        CHECK(*old == 5);
        CHECK(*p == 6);
    }
}

TEST("utility - is_power_of_two truth table")
{
    CHECK(bb::is_power_of_two(1));
    CHECK(bb::is_power_of_two(2));
    CHECK(bb::is_power_of_two(64));
    CHECK(bb::is_power_of_two(bb::isize(1) << 40));

    CHECK(!bb::is_power_of_two(3));
    CHECK(!bb::is_power_of_two(12));
    CHECK(!bb::is_power_of_two(100));
}

TEST("utility - storage_for leaves lifetime to the owner")
{
    static_assert(std::is_trivially_destructible_v<bb::storage_for<int>>);
    static_assert(!std::is_trivially_destructible_v<bb::storage_for<std::string>>);
    static_assert(sizeof(bb::storage_for<std::string>) == sizeof(std::string));
    static_assert(alignof(bb::storage_for<std::string>) == alignof(std::string));

    Counted::live_count = 0;
    {
        bb::storage_for<Counted> storage;
        CHECK(Counted::live_count == 0);

        new (bb::placement_new, &storage.value) Counted();
        CHECK(Counted::live_count == 1);

        storage.value.~Counted();
        CHECK(Counted::live_count == 0);
    }
    CHECK(Counted::live_count == 0);
}
