// SPDX-License-Identifier: MIT
#include <benchmark/benchmark.h>
#include "src/report/json_output.hpp"
#include "src/report/skew_report.hpp"
#include "src/surface/surface_reshaper.hpp"
#include <vector>

using namespace volbatch;

namespace {

// Weekly expiries over two years, strikes every 2.5 around the grid
std::vector<RawSurfacePoint> make_surface(size_t n_expiries) {
    const Date obs(2024, 6, 21);
    std::vector<RawSurfacePoint> points;
    for (size_t e = 0; e < n_expiries; ++e) {
        Date expiry{obs.days() + std::chrono::days{static_cast<int>(7 * (e + 1))}};
        for (double k = 70.0; k <= 130.0; k += 2.5) {
            double vol = 18.0 + (100.0 - k) * 0.08 + 0.01 * static_cast<double>(e);
            points.push_back({expiry, k, vol, std::nullopt});
        }
    }
    return points;
}

}  // namespace

static void BM_ReshapeSurface(benchmark::State& state) {
    const auto points = make_surface(static_cast<size_t>(state.range(0)));
    const Date obs(2024, 6, 21);

    for (auto _ : state) {
        auto grid = reshape_surface(points, obs);
        benchmark::DoNotOptimize(grid);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(points.size()));
}
BENCHMARK(BM_ReshapeSurface)->Arg(13)->Arg(52)->Arg(104);

static void BM_BuildAndEncodeReport(benchmark::State& state) {
    const Date obs(2024, 6, 21);
    SurfaceSummary summary;
    summary.observation = obs;
    summary.surface.ticker = "SPY";
    summary.surface.points = make_surface(static_cast<size_t>(state.range(0)));
    auto grid = reshape_surface(summary.surface.points, obs).value();

    SkewReportBuilder builder;
    for (auto _ : state) {
        auto result = builder.build("SPY", obs, summary, grid);
        auto text = dump_json(to_json(result));
        benchmark::DoNotOptimize(text);
    }

    state.SetLabel("points=" + std::to_string(summary.surface.points.size()));
}
BENCHMARK(BM_BuildAndEncodeReport)->Arg(13)->Arg(104);

BENCHMARK_MAIN();
