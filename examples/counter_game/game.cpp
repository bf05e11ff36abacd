/// @file game.cpp
/// @brief Headless example artifact for the hotline host
///
/// Build it as build/hot_reload/game.<ext> and run `hotline`. Edit the
/// update rule, rebuild, and the running host picks up the new code while
/// the counters keep their values. Changing GameMemory's layout forces a
/// restart.
///
/// Files in the working directory steer it:
/// - `force_reload`  : hot swap on the next frame
/// - `force_restart` : full restart on the next frame
/// - `quit`          : close

#include <hotline/artifact/abi.h>

#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <new>
#include <thread>

namespace {

struct GameMemory {
    unsigned long long frame = 0;
    unsigned long long reloads = 0;
    double elapsed = 0.0;
    int* history = nullptr;  // Ring buffer of recent frame numbers
    std::size_t history_size = 0;
};

constexpr std::size_t k_history_size = 64;
constexpr double k_frame_seconds = 1.0 / 60.0;

GameMemory* g_mem = nullptr;
const hotline_allocator_api_v1* g_alloc = nullptr;

bool consume_marker(const char* name) {
    std::error_code ec;
    if (!std::filesystem::exists(name, ec)) {
        return false;
    }
    std::filesystem::remove(name, ec);
    return true;
}

void* game_alloc(std::size_t size, std::size_t align) {
    if (g_alloc) {
        return HOTLINE_ALLOC(g_alloc, size, align);
    }
    return ::operator new(size, std::align_val_t(align));
}

void game_free(void* ptr, std::size_t align) {
    if (g_alloc) {
        HOTLINE_FREE(g_alloc, ptr);
        return;
    }
    ::operator delete(ptr, std::align_val_t(align));
}

} // anonymous namespace

HOTLINE_ARTIFACT_EXPORT void game_attach_allocator(const hotline_allocator_api_v1* api) {
    g_alloc = api;
}

HOTLINE_ARTIFACT_EXPORT void game_init_window(void) {
    std::printf("[game] window opened\n");
}

HOTLINE_ARTIFACT_EXPORT void game_init(void) {
    void* block = game_alloc(sizeof(GameMemory), alignof(GameMemory));
    g_mem = new (block) GameMemory{};

    g_mem->history_size = k_history_size;
    g_mem->history = static_cast<int*>(game_alloc(sizeof(int) * k_history_size, alignof(int)));
    std::memset(g_mem->history, 0, sizeof(int) * k_history_size);
}

HOTLINE_ARTIFACT_EXPORT void game_update(void) {
    g_mem->history[g_mem->frame % g_mem->history_size] = static_cast<int>(g_mem->frame);
    ++g_mem->frame;
    g_mem->elapsed += k_frame_seconds;

    if (g_alloc) {
        // Per-frame scratch, released by the host after this frame
        char* line = static_cast<char*>(HOTLINE_TEMP_ALLOC(g_alloc, 128, 1));
        if (line && g_mem->frame % 60 == 0) {
            std::snprintf(line, 128, "[game] frame %llu, %.1fs, %llu reload(s)",
                g_mem->frame, g_mem->elapsed, g_mem->reloads);
            std::printf("%s\n", line);
        }
    }

    std::this_thread::sleep_for(std::chrono::duration<double>(k_frame_seconds));
}

HOTLINE_ARTIFACT_EXPORT bool game_should_close(void) {
    return consume_marker("quit");
}

HOTLINE_ARTIFACT_EXPORT void game_shutdown(void) {
    if (!g_mem) {
        return;
    }
    game_free(g_mem->history, alignof(int));
    g_mem->~GameMemory();
    game_free(g_mem, alignof(GameMemory));
    g_mem = nullptr;
}

HOTLINE_ARTIFACT_EXPORT void game_shutdown_window(void) {
    std::printf("[game] window closed\n");
}

HOTLINE_ARTIFACT_EXPORT void* game_get_memory(void) {
    return g_mem;
}

HOTLINE_ARTIFACT_EXPORT size_t game_get_memory_size(void) {
    return sizeof(GameMemory);
}

HOTLINE_ARTIFACT_EXPORT void game_hot_reloaded(void* memory) {
    g_mem = static_cast<GameMemory*>(memory);
    ++g_mem->reloads;
    std::printf("[game] hot reloaded at frame %llu\n", g_mem->frame);
}

HOTLINE_ARTIFACT_EXPORT bool game_force_reload_requested(void) {
    return consume_marker("force_reload");
}

HOTLINE_ARTIFACT_EXPORT bool game_force_restart_requested(void) {
    return consume_marker("force_restart");
}
