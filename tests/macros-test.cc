#include <bounded-buffer/macros.hh>
#include <nexus/test.hh>


// exactly one compiler family
#if defined(BB_COMPILER_MSVC) == defined(BB_COMPILER_POSIX)
#error "expected exactly one of BB_COMPILER_MSVC and BB_COMPILER_POSIX"
#endif

// at most one allocation/debugger backend
#if defined(BB_OS_WINDOWS) && defined(BB_OS_LINUX)
#error "BB_OS_WINDOWS and BB_OS_LINUX are mutually exclusive"
#endif

namespace
{
BB_FORCE_INLINE int forced(int v) { return v + 1; }

BB_COLD_FUNC int cold_path(int v) { return -v; }
} // namespace

TEST("macros - function attributes do not change semantics")
{
    CHECK(forced(1) == 2);
    CHECK(cold_path(4) == -4);
}

TEST("macros - BB_UNUSED does not evaluate")
{
    int calls = 0;
    auto f = [&]
    {
        ++calls;
        return 1;
    };

    BB_UNUSED(f());
    CHECK(calls == 0);
}
