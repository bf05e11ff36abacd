/// @file test_host_allocator.cpp
/// @brief Tests for the C allocator table exposed to artifacts

#include <catch2/catch_test_macros.hpp>
#include <hotline/memory/host_allocator.hpp>

#include <cstdint>

using namespace hotline_memory;

TEST_CASE("HostAllocator: api table", "[memory][host]") {
    HostAllocator host(1024);
    const hotline_allocator_api_v1* api = host.api();

    REQUIRE(api->abi_version == HOTLINE_ABI_VERSION_V1);
    REQUIRE(api->ctx == &host);
    REQUIRE(api->alloc != nullptr);
    REQUIRE(api->free != nullptr);
    REQUIRE(api->resize != nullptr);
    REQUIRE(api->temp_alloc != nullptr);
}

TEST_CASE("HostAllocator: allocations go through tracking", "[memory][host]") {
    HostAllocator host(1024);
    const hotline_allocator_api_v1* api = host.api();

    void* ptr = HOTLINE_ALLOC(api, 48, 16);
    REQUIRE(ptr != nullptr);
    REQUIRE(host.tracking().is_tracked(ptr));
    REQUIRE(host.tracking().find(ptr)->site.line > 0);

    ptr = HOTLINE_RESIZE(api, ptr, 96, 16);
    REQUIRE(host.tracking().live_bytes() == 96);

    HOTLINE_FREE(api, ptr);
    REQUIRE(host.tracking().live_count() == 0);
    REQUIRE_FALSE(host.tracking().has_bad_frees());
}

TEST_CASE("HostAllocator: bad free through the table", "[memory][host]") {
    HostAllocator host(1024);
    const hotline_allocator_api_v1* api = host.api();

    int local = 0;
    HOTLINE_FREE(api, &local);
    REQUIRE(host.tracking().has_bad_frees());
}

TEST_CASE("HostAllocator: temp allocations reset at end of frame", "[memory][host]") {
    HostAllocator host(256);
    const hotline_allocator_api_v1* api = host.api();

    void* first = HOTLINE_TEMP_ALLOC(api, 128, 8);
    REQUIRE(first != nullptr);
    REQUIRE(HOTLINE_TEMP_ALLOC(api, 200, 8) == nullptr);
    REQUIRE(host.tracking().live_count() == 0);

    host.end_frame();
    REQUIRE(host.scratch().used() == 0);
    REQUIRE(HOTLINE_TEMP_ALLOC(api, 200, 8) != nullptr);
}

TEST_CASE("HostAllocator: oversized temp allocation is rejected", "[memory][host]") {
    HostAllocator host(64);
    const hotline_allocator_api_v1* api = host.api();

    void* first = HOTLINE_TEMP_ALLOC(api, 8, 8);
    REQUIRE(first != nullptr);
    REQUIRE(HOTLINE_TEMP_ALLOC(api, SIZE_MAX - 7, 8) == nullptr);
    REQUIRE(host.scratch().used() == 8);

    void* next = HOTLINE_TEMP_ALLOC(api, 16, 8);
    REQUIRE(next != nullptr);
    REQUIRE(next != first);
}

TEST_CASE("HostAllocator: custom backing", "[memory][host]") {
    SystemAllocator backing;
    HostAllocator host(backing, 64);

    void* ptr = HOTLINE_ALLOC(host.api(), 32, 8);
    REQUIRE(backing.used() == 32);
    HOTLINE_FREE(host.api(), ptr);
    REQUIRE(backing.used() == 0);
}
