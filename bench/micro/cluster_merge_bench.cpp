#include <benchmark/benchmark.h>

#include "chronicle/cluster/cluster_merge.hpp"

#include <algorithm>
#include <random>
#include <string>
#include <vector>

using namespace chronicle;
using namespace chronicle::cluster;

namespace {

// Hour-bucketed clusters over \p keys (type, description) pairs, one per bucket
// with a random number of members, shuffled as the store might return them.
std::vector<EventCluster> make_clusters(std::size_t n, std::size_t keys, std::uint32_t seed = 12345) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<std::int64_t> offset(0, 3599);
    std::uniform_int_distribution<int> members(1, 16);
    std::vector<EventCluster> out;
    out.reserve(n);
    std::uint64_t next_id = 1;
    for (std::size_t i = 0; i < n; ++i) {
        const auto key = i % keys;
        const auto bucket = static_cast<std::int64_t>(i / keys) * 3600;
        const auto a = bucket + offset(rng);
        const auto b = bucket + offset(rng);
        id_set ids;
        const int count = members(rng);
        for (int m = 0; m < count; ++m) ids.add(next_id++);
        id_set hits;
        if (count > 8) hits.add(ids.minimum());
        out.emplace_back(time_range{std::min(a, b), std::max(a, b) + 1},
                         event_types::web_history + static_cast<event_type_id>(key % 2),
                         "host-" + std::to_string(key), description_lod::short_form, std::move(ids),
                         std::move(hits), id_set{});
    }
    std::shuffle(out.begin(), out.end(), rng);
    return out;
}

} // namespace

static void BM_MergeClusters(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto clusters = make_clusters(n, 64);
    for (auto _ : state) {
        auto merged = merge_clusters(clusters, time_unit::hours, 4);
        if (!merged) {
            state.SkipWithError(merged.error().message.c_str());
            break;
        }
        benchmark::DoNotOptimize(merged->data());
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}

static void BM_ToStripes(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto merged = merge_clusters(make_clusters(n, 64), time_unit::hours, 4);
    if (!merged) {
        state.SkipWithError(merged.error().message.c_str());
        return;
    }
    state.counters["clusters"] = static_cast<double>(merged->size());
    for (auto _ : state) {
        auto stripes = to_stripes(*merged);
        if (!stripes) {
            state.SkipWithError(stripes.error().message.c_str());
            break;
        }
        benchmark::DoNotOptimize(stripes->data());
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}

static void BM_ParseIdSet(benchmark::State& state) {
    std::string payload;
    for (std::int64_t i = 0; i < state.range(0); ++i) {
        if (i) payload += ',';
        payload += std::to_string(1000000 + i * 3);
    }
    for (auto _ : state) {
        auto ids = parse_id_set(payload);
        benchmark::DoNotOptimize(ids);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations()) * static_cast<std::int64_t>(payload.size()));
}

BENCHMARK(BM_MergeClusters)->RangeMultiplier(4)->Range(256, 65536);
BENCHMARK(BM_ToStripes)->RangeMultiplier(4)->Range(256, 65536);
BENCHMARK(BM_ParseIdSet)->Arg(16)->Arg(1024)->Arg(65536);

BENCHMARK_MAIN();
