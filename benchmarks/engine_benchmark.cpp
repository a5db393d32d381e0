// bimcollab benchmarks — measures throughput of the conflict engine.

#include <bimcollab/bimcollab.hpp>
#include <bimcollab/json.hpp>

#include <benchmark/benchmark.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using namespace bimcollab;

static auto make_change(std::string id, std::string user, std::string element,
                        Timestamp at) -> Change {
    return Change{
        .change_id = std::move(id),
        .user_id = std::move(user),
        .timestamp = at,
        .change_type = ChangeType::resize,
        .element_id = std::move(element),
        .element_type = "wall",
        .old_value = std::nullopt,
        .new_value = PropertyMap{{"height", std::int64_t{10}}},
        .description = {},
        .metadata = {},
    };
}

static auto populated_journal(std::size_t n) -> ChangeJournal {
    const auto now = Clock::now();
    auto journal = ChangeJournal{};
    for (std::size_t i = 0; i < n; ++i) {
        journal.append(make_change("c" + std::to_string(i), "u" + std::to_string(i % 8),
                                   "wall_" + std::to_string(i % 64), now));
    }
    return journal;
}

// =============================================================================
// Detection
// =============================================================================

static void bm_detect_conflicts(benchmark::State& state) {
    const auto journal = populated_journal(static_cast<std::size_t>(state.range(0)));
    const auto incoming = make_change("x", "other", "wall_7", Clock::now());
    for (auto _ : state) {
        auto rivals = detect_conflicts(journal, incoming);
        benchmark::DoNotOptimize(rivals);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_detect_conflicts)->Range(8, 4096);

static void bm_merge_change_set(benchmark::State& state) {
    const auto now = Clock::now();
    auto changes = std::vector<Change>{};
    for (int i = 0; i < state.range(0); ++i) {
        auto c = make_change("c" + std::to_string(i), "u" + std::to_string(i), "wall_1",
                             now + std::chrono::milliseconds{i});
        c.new_value["key_" + std::to_string(i)] = std::int64_t{i};
        changes.push_back(std::move(c));
    }
    for (auto _ : state) {
        auto merged = merge_change_set(changes, "m", now);
        benchmark::DoNotOptimize(merged);
    }
}
BENCHMARK(bm_merge_change_set)->Range(2, 256);

// =============================================================================
// Engine
// =============================================================================

static void bm_make_change_throughput(benchmark::State& state) {
    auto engine = Engine{};
    auto sid = engine.create_session("model-1", "alice", "Alice", "alice@example.com");
    std::int64_t i = 0;
    for (auto _ : state) {
        engine.make_change(sid, "alice", ChangeType::create, "wall_" + std::to_string(i % 512),
                           "wall", PropertyMap{{"height", i}});
        ++i;
    }
    engine.wait_until_idle();
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_make_change_throughput);

static void bm_merge_branch(benchmark::State& state) {
    const auto n = static_cast<int>(state.range(0));
    auto config = EngineConfig{};
    config.version_interval = 1'000'000;
    for (auto _ : state) {
        state.PauseTiming();
        auto engine = Engine{config};
        auto target = engine.create_session("model-1", "alice", "Alice", "alice@example.com");
        engine.join_session(target, "bob", "Bob", "bob@example.com", Role::editor);
        auto branch = engine.create_branch(target, "bob", "bulk", "");
        for (int i = 0; i < n; ++i) {
            engine.make_change(target, "alice", ChangeType::resize,
                               "wall_" + std::to_string(i * 2), "wall", PropertyMap{});
            engine.make_change(branch, "bob", ChangeType::resize,
                               "wall_" + std::to_string(i), "wall", PropertyMap{});
        }
        engine.wait_until_idle();
        state.ResumeTiming();

        engine.merge_branch(target, branch, "alice", Resolution::last_writer_wins);
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_merge_branch)->Range(16, 1024);

static void bm_export_archive(benchmark::State& state) {
    auto config = EngineConfig{};
    config.version_interval = 100;
    auto engine = Engine{config};
    auto sid = engine.create_session("model-1", "alice", "Alice", "alice@example.com");
    for (int i = 0; i < state.range(0); ++i) {
        engine.make_change(sid, "alice", ChangeType::create, "wall_" + std::to_string(i),
                           "wall", PropertyMap{{"height", std::int64_t{i}}});
    }
    engine.wait_until_idle();
    for (auto _ : state) {
        auto archive = export_archive(engine, sid, "alice");
        benchmark::DoNotOptimize(archive);
    }
}
BENCHMARK(bm_export_archive)->Range(10, 1000);
