#include <type-map/memory_resource.hh>
#include <type-map/type_map.hh>

#include <nexus/test.hh>

#include <string>
#include <vector>

namespace
{
// forwards to the default resource and tracks what is currently allocated
struct counting_resource
{
    tmap::isize live_allocations = 0;
    tmap::isize live_bytes = 0;
    tmap::isize total_allocations = 0;

    tmap::memory_resource resource;

    counting_resource()
    {
        resource.userdata = this;
        resource.allocate_bytes = [](tmap::isize bytes, tmap::isize alignment, void* userdata) -> tmap::byte*
        {
            auto const self = static_cast<counting_resource*>(userdata);
            auto const p = tmap::default_memory_resource->allocate_bytes(bytes, alignment, tmap::default_memory_resource->userdata);
            ++self->live_allocations;
            ++self->total_allocations;
            self->live_bytes += bytes;
            return p;
        };
        resource.try_allocate_bytes = resource.allocate_bytes;
        resource.deallocate_bytes = [](tmap::byte* p, tmap::isize bytes, tmap::isize alignment, void* userdata)
        {
            auto const self = static_cast<counting_resource*>(userdata);
            tmap::default_memory_resource->deallocate_bytes(p, bytes, alignment, tmap::default_memory_resource->userdata);
            --self->live_allocations;
            self->live_bytes -= bytes;
        };
    }
};

struct Label
{
    using value_type = std::string;
};

struct Numbers
{
    using value_type = std::vector<int>;
};
} // namespace

TEST("memory_resource - default resource")
{
    auto const r = tmap::default_memory_resource;
    REQUIRE(r != nullptr);
    CHECK(tmap::resource_or_default(nullptr) == r);

    SECTION("allocate and deallocate")
    {
        auto const p = r->allocate_bytes(100, 8, r->userdata);
        REQUIRE(p != nullptr);
        CHECK(reinterpret_cast<uintptr_t>(p) % 8 == 0); // NOLINT

        // memory is writable
        for (auto i = 0; i < 100; ++i)
            p[i] = tmap::byte(i);
        CHECK(p[99] == tmap::byte(99));

        r->deallocate_bytes(p, 100, 8, r->userdata);
    }

    SECTION("large alignment")
    {
        auto const p = r->try_allocate_bytes(64, 256, r->userdata);
        REQUIRE(p != nullptr);
        CHECK(reinterpret_cast<uintptr_t>(p) % 256 == 0); // NOLINT
        r->deallocate_bytes(p, 64, 256, r->userdata);
    }

    SECTION("zero bytes")
    {
        CHECK(r->allocate_bytes(0, 8, r->userdata) == nullptr);
    }
}

TEST("memory_resource - custom resource")
{
    auto counter = counting_resource();
    CHECK(tmap::resource_or_default(&counter.resource) == &counter.resource);

    SECTION("type map allocates values and table from its resource")
    {
        {
            auto m = tmap::type_map(&counter.resource);
            CHECK(m.resource() == &counter.resource);

            // an empty map does not allocate
            CHECK(counter.total_allocations == 0);

            m.insert<Label>("label");
            CHECK(counter.live_allocations == 2); // table + value

            m.insert<Numbers>({1, 2, 3});
            CHECK(counter.live_allocations == 3);

            m.insert<Label>("other"); // replaces the value node
            CHECK(counter.live_allocations == 3);

            m.remove<Numbers>();
            CHECK(counter.live_allocations == 2);

            // moving keeps the resource
            auto moved = tmap::move(m);
            CHECK(moved.resource() == &counter.resource);
            CHECK(counter.live_allocations == 2);
        }

        // everything is returned to the resource
        CHECK(counter.live_allocations == 0);
        CHECK(counter.live_bytes == 0);
    }

    SECTION("clones allocate from the same resource")
    {
        {
            auto m = tmap::clone_type_map(&counter.resource);
            m.insert<Label>("label");

            auto copy = m;
            CHECK(copy.resource() == &counter.resource);
            CHECK(counter.live_allocations == 4);
        }
        CHECK(counter.live_allocations == 0);
    }
}
