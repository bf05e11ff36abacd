/// @file test_engine.cpp
/// @brief Tests for the reload decision engine

#include <catch2/catch_test_macros.hpp>
#include <hotline/reload/engine.hpp>

#include "fake_binder.hpp"
#include "../fixtures/fixture_support.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace hotline_reload;
using namespace hotline_test;

namespace {

/// Registry, allocator and memory record wired to a binder, with version 0 started
template<typename Binder>
struct EngineRig {
    Binder& binder;
    hotline_memory::HostAllocator allocator{4096};
    VersionRegistry registry;
    ApplicationMemory memory;

    explicit EngineRig(Binder& b) : binder(b), registry(b) {
        auto bound = binder.bind(registry.next_version());
        REQUIRE(bound.is_ok());
        registry.advance_version();
        registry.install(std::move(bound.value()));
        registry.active()->attach_allocator(allocator.api());
        registry.active()->api().init();
        memory = ApplicationMemory::from(*registry.active());
    }
};

std::size_t index_of(const std::vector<std::string>& calls, const std::string& name) {
    return static_cast<std::size_t>(std::find(calls.begin(), calls.end(), name) - calls.begin());
}

} // anonymous namespace

// =============================================================================
// State machine (fake binder)
// =============================================================================

TEST_CASE("ReloadEngine: idle without changes", "[reload][engine]") {
    fake() = FakeArtifact{};
    FakeBinder binder;
    EngineRig<FakeBinder> rig(binder);
    ReloadEngine engine(binder, rig.registry, rig.allocator, rig.memory);

    for (int frame = 0; frame < 10; ++frame) {
        REQUIRE(engine.evaluate() == ReloadOutcome::None);
    }
    REQUIRE(engine.state() == ReloadState::Idle);
    REQUIRE(binder.bind_calls == 1);
    REQUIRE(binder.stat_calls == 10);
}

TEST_CASE("ReloadEngine: timestamp change hot swaps", "[reload][engine]") {
    fake() = FakeArtifact{};
    FakeBinder binder;
    EngineRig<FakeBinder> rig(binder);
    ReloadEngine engine(binder, rig.registry, rig.allocator, rig.memory);

    void* address = rig.memory.address;
    fake().calls.clear();

    binder.touch();
    REQUIRE(engine.decide() == ReloadState::HotSwapPending);
    REQUIRE(engine.evaluate() == ReloadOutcome::HotSwapped);

    REQUIRE(rig.registry.active()->version() == 1);
    REQUIRE(rig.registry.retired().size() == 1);
    REQUIRE(rig.registry.retired()[0].version() == 0);
    REQUIRE(binder.released.empty());

    // Allocator attached before the continuation callback, same block handed over
    REQUIRE(fake().calls == std::vector<std::string>{"attach_allocator", "hot_reloaded"});
    REQUIRE(fake().hot_reloaded_with == address);
    REQUIRE(rig.memory.address == address);

    REQUIRE(engine.state() == ReloadState::Idle);
    REQUIRE(engine.stats().hot_swaps == 1);

    // New handle carries the new timestamp, so nothing more happens
    REQUIRE(engine.evaluate() == ReloadOutcome::None);
}

TEST_CASE("ReloadEngine: force reload hot swaps", "[reload][engine]") {
    fake() = FakeArtifact{};
    FakeBinder binder;
    EngineRig<FakeBinder> rig(binder);
    ReloadEngine engine(binder, rig.registry, rig.allocator, rig.memory);

    fake().force_reload = true;
    REQUIRE(engine.evaluate() == ReloadOutcome::HotSwapped);
    REQUIRE(rig.registry.retired().size() == 1);
}

TEST_CASE("ReloadEngine: force restart rebuilds memory", "[reload][engine]") {
    fake() = FakeArtifact{};
    FakeBinder binder;
    EngineRig<FakeBinder> rig(binder);
    ReloadEngine engine(binder, rig.registry, rig.allocator, rig.memory);

    fake().force_reload = true;
    REQUIRE(engine.evaluate() == ReloadOutcome::HotSwapped);
    fake().calls.clear();

    fake().force_restart = true;
    REQUIRE(engine.evaluate() == ReloadOutcome::Restarted);

    const auto& calls = fake().calls;
    REQUIRE(index_of(calls, "shutdown") < index_of(calls, "attach_allocator"));
    REQUIRE(index_of(calls, "attach_allocator") < index_of(calls, "init"));
    REQUIRE(index_of(calls, "hot_reloaded") == calls.size());

    REQUIRE(binder.released == std::vector<std::uint32_t>{0, 1});
    REQUIRE(rig.registry.retired().empty());
    REQUIRE(rig.registry.active()->version() == 2);
    REQUIRE(engine.stats().restarts == 1);
}

TEST_CASE("ReloadEngine: restart wins over reload", "[reload][engine]") {
    fake() = FakeArtifact{};
    FakeBinder binder;
    EngineRig<FakeBinder> rig(binder);
    ReloadEngine engine(binder, rig.registry, rig.allocator, rig.memory);

    fake().force_reload = true;
    fake().force_restart = true;
    binder.touch();

    REQUIRE(engine.evaluate() == ReloadOutcome::Restarted);
    REQUIRE(engine.stats().hot_swaps == 0);
}

TEST_CASE("ReloadEngine: memory size change escalates to restart", "[reload][engine]") {
    fake() = FakeArtifact{};
    FakeBinder binder;
    EngineRig<FakeBinder> rig(binder);
    ReloadEngine engine(binder, rig.registry, rig.allocator, rig.memory);
    REQUIRE(rig.memory.size == 128);

    binder.large_memory = true;
    binder.touch();
    fake().calls.clear();

    REQUIRE(engine.evaluate() == ReloadOutcome::Restarted);
    REQUIRE(rig.memory.size == 256);
    REQUIRE(engine.stats().escalated_restarts == 1);
    REQUIRE(index_of(fake().calls, "hot_reloaded") == fake().calls.size());
    REQUIRE(index_of(fake().calls, "init") < fake().calls.size());
}

TEST_CASE("ReloadEngine: bind failure changes nothing", "[reload][engine]") {
    fake() = FakeArtifact{};
    FakeBinder binder;
    EngineRig<FakeBinder> rig(binder);
    ReloadEngine engine(binder, rig.registry, rig.allocator, rig.memory);

    const ApplicationMemory before = rig.memory;
    fake().calls.clear();

    binder.fail_binds = 1;
    binder.touch();

    REQUIRE(engine.evaluate() == ReloadOutcome::BindFailed);
    REQUIRE(engine.state() == ReloadState::Idle);
    REQUIRE(engine.stats().failed_binds == 1);
    REQUIRE(rig.registry.active()->version() == 0);
    REQUIRE(rig.registry.retired().empty());
    REQUIRE(rig.registry.next_version() == 1);
    REQUIRE(rig.memory.address == before.address);
    REQUIRE(fake().calls.empty());

    // Retried next frame, reusing the version number
    REQUIRE(engine.evaluate() == ReloadOutcome::HotSwapped);
    REQUIRE(rig.registry.active()->version() == 1);
}

TEST_CASE("ReloadEngine: unreadable source timestamp is ignored", "[reload][engine]") {
    fake() = FakeArtifact{};
    FakeBinder binder;
    EngineRig<FakeBinder> rig(binder);
    ReloadEngine engine(binder, rig.registry, rig.allocator, rig.memory);

    binder.source_available = false;
    REQUIRE(engine.evaluate() == ReloadOutcome::None);
    REQUIRE(binder.bind_calls == 1);
}

TEST_CASE("ReloadEngine: poll interval", "[reload][engine]") {
    fake() = FakeArtifact{};
    FakeBinder binder;
    EngineRig<FakeBinder> rig(binder);

    auto now = ReloadConfig::Clock::time_point{} + std::chrono::hours(1);
    ReloadConfig config;
    config.poll_interval = std::chrono::milliseconds(100);
    config.clock = [&now] { return now; };
    ReloadEngine engine(binder, rig.registry, rig.allocator, rig.memory, config);

    REQUIRE(engine.evaluate() == ReloadOutcome::None);
    REQUIRE(binder.stat_calls == 1);

    binder.touch();
    now += std::chrono::milliseconds(50);
    REQUIRE(engine.evaluate() == ReloadOutcome::None);
    REQUIRE(binder.stat_calls == 1);

    SECTION("force flags are not rate limited") {
        fake().force_reload = true;
        REQUIRE(engine.evaluate() == ReloadOutcome::HotSwapped);
    }

    SECTION("change seen once the interval elapses") {
        now += std::chrono::milliseconds(50);
        REQUIRE(engine.evaluate() == ReloadOutcome::HotSwapped);
        REQUIRE(binder.stat_calls == 2);
    }
}

TEST_CASE("ReloadEngine: restart drains leaks", "[reload][engine]") {
    fake() = FakeArtifact{};
    FakeBinder binder;
    EngineRig<FakeBinder> rig(binder);
    ReloadEngine engine(binder, rig.registry, rig.allocator, rig.memory);

    void* leaked = HOTLINE_ALLOC(fake().allocator, 24, 8);
    REQUIRE(leaked != nullptr);

    fake().force_restart = true;
    REQUIRE(engine.evaluate() == ReloadOutcome::Restarted);
    REQUIRE(engine.last_leak_report().count() == 1);
    REQUIRE(engine.last_leak_report().total_bytes == 24);
    REQUIRE(engine.stats().leak_reports == 1);
    REQUIRE(rig.allocator.tracking().live_count() == 0);
}

TEST_CASE("ReloadEngine: hot swap keeps live allocations", "[reload][engine]") {
    fake() = FakeArtifact{};
    FakeBinder binder;
    EngineRig<FakeBinder> rig(binder);
    ReloadEngine engine(binder, rig.registry, rig.allocator, rig.memory);

    void* block = HOTLINE_ALLOC(fake().allocator, 24, 8);

    fake().force_reload = true;
    REQUIRE(engine.evaluate() == ReloadOutcome::HotSwapped);
    REQUIRE(rig.allocator.tracking().is_tracked(block));

    HOTLINE_FREE(fake().allocator, block);
    REQUIRE_FALSE(rig.allocator.tracking().has_bad_frees());
}

// =============================================================================
// End to end (fixture libraries)
// =============================================================================

TEST_CASE("ReloadEngine: fixture hot swap preserves state", "[reload][engine][fixture]") {
    ScratchDir dir("engine_swap");
    stage_artifact(dir.path(), HOTLINE_FIXTURE_BASIC);

    hotline_artifact::ArtifactBinder binder({artifact_path(dir.path()), "game_"});
    EngineRig<hotline_artifact::ArtifactBinder> rig(binder);
    ReloadEngine engine(binder, rig.registry, rig.allocator, rig.memory);

    auto* state = static_cast<FixtureState*>(rig.memory.address);
    REQUIRE(state->build_tag == 1);
    REQUIRE(rig.allocator.tracking().is_tracked(state));

    rig.registry.active()->api().update();
    rig.registry.active()->api().update();
    REQUIRE(engine.evaluate() == ReloadOutcome::None);

    stage_artifact(dir.path(), HOTLINE_FIXTURE_ALT);
    REQUIRE(engine.evaluate() == ReloadOutcome::HotSwapped);

    REQUIRE(rig.memory.address == state);
    REQUIRE(rig.registry.active()->api().get_memory() == state);
    REQUIRE(build_tag(*rig.registry.active()) == 2);
    REQUIRE(state->updates == 2);
    REQUIRE(state->hot_reloads == 1);
    REQUIRE(state->last_reload_tag == 2);
    REQUIRE(state->build_tag == 1);

    // The superseded version is still loaded and its copy still on disk
    REQUIRE(rig.registry.retired().size() == 1);
    REQUIRE(rig.registry.retired()[0].library().is_loaded());
    REQUIRE(std::filesystem::exists(binder.copy_path_for(0)));

    rig.registry.active()->api().update();
    REQUIRE(state->updates == 3);

    rig.registry.active()->api().shutdown();
    rig.registry.shutdown();
    REQUIRE_FALSE(std::filesystem::exists(binder.copy_path_for(0)));
    REQUIRE_FALSE(std::filesystem::exists(binder.copy_path_for(1)));
}

TEST_CASE("ReloadEngine: fixture size change restarts", "[reload][engine][fixture]") {
    ScratchDir dir("engine_restart");
    stage_artifact(dir.path(), HOTLINE_FIXTURE_BASIC);

    hotline_artifact::ArtifactBinder binder({artifact_path(dir.path()), "game_"});
    EngineRig<hotline_artifact::ArtifactBinder> rig(binder);
    ReloadEngine engine(binder, rig.registry, rig.allocator, rig.memory);

    stage_artifact(dir.path(), HOTLINE_FIXTURE_ALT);
    REQUIRE(engine.evaluate() == ReloadOutcome::HotSwapped);

    rig.registry.active()->api().update();

    stage_artifact(dir.path(), HOTLINE_FIXTURE_RESIZED);
    REQUIRE(engine.evaluate() == ReloadOutcome::Restarted);

    REQUIRE(rig.memory.size == 256);
    auto* state = static_cast<FixtureState*>(rig.memory.address);
    REQUIRE(state->build_tag == 3);
    REQUIRE(state->updates == 0);
    REQUIRE(state->hot_reloads == 0);

    // Old block freed by shutdown(), nothing leaked, only the new block live
    REQUIRE_FALSE(engine.last_leak_report().has_leaks());
    REQUIRE(rig.allocator.tracking().live_count() == 1);
    REQUIRE(rig.allocator.tracking().is_tracked(state));

    REQUIRE(rig.registry.retired().empty());
    REQUIRE_FALSE(std::filesystem::exists(binder.copy_path_for(0)));
    REQUIRE_FALSE(std::filesystem::exists(binder.copy_path_for(1)));
    REQUIRE(std::filesystem::exists(binder.copy_path_for(2)));

    rig.registry.active()->api().shutdown();
}

TEST_CASE("ReloadEngine: fixture force requests", "[reload][engine][fixture]") {
    ScratchDir dir("engine_force");
    stage_artifact(dir.path(), HOTLINE_FIXTURE_BASIC);

    hotline_artifact::ArtifactBinder binder({artifact_path(dir.path()), "game_"});
    EngineRig<hotline_artifact::ArtifactBinder> rig(binder);
    ReloadEngine engine(binder, rig.registry, rig.allocator, rig.memory);

    request(*rig.registry.active(), true, false);
    REQUIRE(engine.evaluate() == ReloadOutcome::HotSwapped);

    request(*rig.registry.active(), true, true);
    REQUIRE(engine.evaluate() == ReloadOutcome::Restarted);
    REQUIRE(rig.registry.active()->version() == 2);

    rig.registry.active()->api().shutdown();
}

TEST_CASE("ReloadEngine: fixture leak reported on restart", "[reload][engine][fixture]") {
    ScratchDir dir("engine_leak");
    stage_artifact(dir.path(), HOTLINE_FIXTURE_LEAK);

    hotline_artifact::ArtifactBinder binder({artifact_path(dir.path()), "game_"});
    EngineRig<hotline_artifact::ArtifactBinder> rig(binder);
    ReloadEngine engine(binder, rig.registry, rig.allocator, rig.memory);

    request(*rig.registry.active(), false, true);
    REQUIRE(engine.evaluate() == ReloadOutcome::Restarted);

    const auto& report = engine.last_leak_report();
    REQUIRE(report.count() == 1);
    REQUIRE(report.total_bytes == 32);
    REQUIRE(std::string(report.leaks[0].site.file).find("fixture_artifact.cpp") != std::string::npos);

    rig.registry.active()->api().shutdown();
}

TEST_CASE("ReloadEngine: fixture copy failure keeps the active version", "[reload][engine][fixture]") {
    ScratchDir dir("engine_copy");
    stage_artifact(dir.path(), HOTLINE_FIXTURE_BASIC);

    hotline_artifact::ArtifactBinder binder({artifact_path(dir.path()), "game_"});
    EngineRig<hotline_artifact::ArtifactBinder> rig(binder);
    ReloadEngine engine(binder, rig.registry, rig.allocator, rig.memory);

    auto* state = static_cast<FixtureState*>(rig.memory.address);
    rig.registry.active()->api().update();

    // Block the copy for version 1
    const auto blocker = binder.copy_path_for(1);
    std::filesystem::create_directories(blocker);
    std::ofstream(blocker / "keep") << "keep";

    stage_artifact(dir.path(), HOTLINE_FIXTURE_ALT);
    REQUIRE(engine.evaluate() == ReloadOutcome::BindFailed);
    REQUIRE(engine.evaluate() == ReloadOutcome::BindFailed);

    REQUIRE(engine.state() == ReloadState::Idle);
    REQUIRE(engine.stats().failed_binds == 2);
    REQUIRE(rig.registry.active()->version() == 0);
    REQUIRE(build_tag(*rig.registry.active()) == 1);
    REQUIRE(rig.registry.retired().empty());
    REQUIRE(rig.registry.next_version() == 1);
    REQUIRE(rig.memory.address == state);

    // Still runnable, and the retry succeeds once the copy can be written
    rig.registry.active()->api().update();
    REQUIRE(state->updates == 2);

    std::filesystem::remove_all(blocker);
    REQUIRE(engine.evaluate() == ReloadOutcome::HotSwapped);
    REQUIRE(rig.registry.active()->version() == 1);
    REQUIRE(build_tag(*rig.registry.active()) == 2);
    REQUIRE(state->hot_reloads == 1);

    rig.registry.active()->api().shutdown();
}
