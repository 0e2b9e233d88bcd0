#include <type-map/macros.hh>
#include <type-map/utility.hh>

#include <nexus/test.hh>

#include <string>

// =========================================================================================================
// Preprocessor-level compile-time checks
// =========================================================================================================

#if defined(TMAP_COMPILER_MSVC) + defined(TMAP_COMPILER_CLANG) + defined(TMAP_COMPILER_GCC) != 1
#error "Expected exactly one compiler family macro to be defined"
#endif

#if defined(TMAP_OS_WINDOWS) + defined(TMAP_OS_LINUX) + defined(TMAP_OS_APPLE) + defined(TMAP_OS_BSD) != 1
#error "Expected exactly one OS macro to be defined"
#endif

#if TMAP_ASSERT_ENABLED != 0 && TMAP_ASSERT_ENABLED != 1
#error "TMAP_ASSERT_ENABLED must be 0 or 1"
#endif

#if defined(TMAP_DEBUG) && !TMAP_ASSERT_ENABLED
#error "assertions must be active in debug builds"
#endif

// =========================================================================================================
// Helper types for testing
// =========================================================================================================

namespace
{
struct MoveOnly
{
    int id;

    explicit MoveOnly(int i = 0) : id(i) {}
    MoveOnly(MoveOnly const&) = delete;
    MoveOnly& operator=(MoveOnly const&) = delete;
    MoveOnly(MoveOnly&& other) noexcept : id(other.id) { other.id = -1; }
    MoveOnly& operator=(MoveOnly&& other) noexcept
    {
        id = other.id;
        other.id = -1;
        return *this;
    }
};

struct Box
{
    int v;
    bool operator<(Box const& rhs) const { return v < rhs.v; }
};
} // namespace

// storage_for stays trivial for trivial types
static_assert(std::is_trivially_destructible_v<tmap::storage_for<int>>);
static_assert(!std::is_trivially_destructible_v<tmap::storage_for<std::string>>);
static_assert(sizeof(tmap::storage_for<std::string>) == sizeof(std::string));
static_assert(alignof(tmap::storage_for<double>) == alignof(double));

static_assert(std::is_same_v<tmap::function_ptr<int(float)>, int (*)(float)>);
static_assert(std::is_same_v<tmap::function_ptr<void(void*) noexcept>, void (*)(void*) noexcept>);

static_assert(tmap::is_power_of_two(1));
static_assert(tmap::is_power_of_two(64));
static_assert(!tmap::is_power_of_two(0));
static_assert(!tmap::is_power_of_two(12));
static_assert(!tmap::is_power_of_two(-8));

TEST("utility - move and exchange")
{
    auto a = MoveOnly(5);
    auto b = tmap::move(a);
    CHECK(b.id == 5);
    CHECK(a.id == -1); // NOLINT(bugprone-use-after-move)

    auto p = new int(3);
    auto const old = tmap::exchange(p, nullptr);
    CHECK(p == nullptr);
    CHECK(*old == 3);
    delete old;

    auto c = MoveOnly(7);
    auto const previous = tmap::exchange(c, MoveOnly(8));
    CHECK(previous.id == 7);
    CHECK(c.id == 8);
}

TEST("utility - min and max")
{
    CHECK(tmap::max(1, 2) == 2);
    CHECK(tmap::min(1, 2) == 1);

    // equivalent values return the first argument
    auto const x = Box{1};
    auto const y = Box{1};
    CHECK(&tmap::max(x, y) == &x);
    CHECK(&tmap::min(x, y) == &x);
}

TEST("utility - storage_for and placement_new")
{
    auto storage = tmap::storage_for<std::string>();
    auto const s = new (tmap::placement_new, &storage.value) std::string("constructed in place");
    CHECK(s == &storage.value);
    CHECK(storage.value == "constructed in place");
    storage.value.~basic_string();
}
