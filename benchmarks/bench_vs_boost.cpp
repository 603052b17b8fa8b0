/// @file bench_vs_boost.cpp
/// @brief lexjson vs Boost.JSON on identical input.
///
/// Inputs stay inside the subset lexjson accepts: no exponents, and no string
/// escapes other than \" and \\. Each scenario registers one variant per library.

#include <lexjson/lexjson.hpp>

#include <boost/json.hpp>

#include <benchmark/benchmark.h>

#include <string>

namespace {

/// Service configuration exported by an admin tool: pretty, shallow, key-heavy.
std::string service_config(int services) {
    std::string s = "{\n  \"cluster\": \"eu-west\",\n  \"services\": [\n";
    for (int i = 0; i < services; ++i) {
        s += "    {\"name\": \"svc" + std::to_string(i) + "\", \"port\": ";
        s += std::to_string(8000 + i);
        s += ", \"replicas\": " + std::to_string(1 + i % 5);
        s += ", \"cpu\": 0." + std::to_string(25 + i % 75);
        s += ", \"path\": \"C:\\\\srv\\\\svc" + std::to_string(i) + "\"";
        s += ", \"public\": ";
        s += (i % 4 == 0) ? "true" : "false";
        s += (i + 1 < services) ? "},\n" : "}\n";
    }
    s += "  ]\n}\n";
    return s;
}

/// Column of meter readings: numbers only, compact.
std::string meter_readings(int count) {
    std::string s = "[";
    for (int i = 0; i < count; ++i) {
        if (i) s += ',';
        s += std::to_string(i * 13 % 9973) + "." + std::to_string(i % 1000);
    }
    s += ']';
    return s;
}

template <typename Fn>
void run(benchmark::State& state, const std::string& input, Fn&& fn) {
    for (auto _ : state) fn(input);
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Parse
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ParseConfig_Lexjson(benchmark::State& state) {
    run(state, service_config(static_cast<int>(state.range(0))), [](const std::string& in) {
        auto v = lexjson::parse(in);
        benchmark::DoNotOptimize(v);
    });
}
BENCHMARK(BM_ParseConfig_Lexjson)->Arg(10)->Arg(1000);

static void BM_ParseConfig_BoostJson(benchmark::State& state) {
    run(state, service_config(static_cast<int>(state.range(0))), [](const std::string& in) {
        auto v = boost::json::parse(in);
        benchmark::DoNotOptimize(v);
    });
}
BENCHMARK(BM_ParseConfig_BoostJson)->Arg(10)->Arg(1000);

static void BM_ParseReadings_Lexjson(benchmark::State& state) {
    run(state, meter_readings(5000), [](const std::string& in) {
        auto v = lexjson::parse(in);
        benchmark::DoNotOptimize(v);
    });
}
BENCHMARK(BM_ParseReadings_Lexjson);

static void BM_ParseReadings_BoostJson(benchmark::State& state) {
    run(state, meter_readings(5000), [](const std::string& in) {
        auto v = boost::json::parse(in);
        benchmark::DoNotOptimize(v);
    });
}
BENCHMARK(BM_ParseReadings_BoostJson);

// ═══════════════════════════════════════════════════════════════════════════════
// Reformat (parse, then write compact)
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Reformat_Lexjson(benchmark::State& state) {
    run(state, service_config(1000), [](const std::string& in) {
        auto s = lexjson::format(lexjson::parse(in));
        benchmark::DoNotOptimize(s);
    });
}
BENCHMARK(BM_Reformat_Lexjson);

static void BM_Reformat_BoostJson(benchmark::State& state) {
    run(state, service_config(1000), [](const std::string& in) {
        auto s = boost::json::serialize(boost::json::parse(in));
        benchmark::DoNotOptimize(s);
    });
}
BENCHMARK(BM_Reformat_BoostJson);

// ═══════════════════════════════════════════════════════════════════════════════
// Escaped output (Boost.JSON always escapes; lexjson only on request)
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_SerializeEscaped_Lexjson(benchmark::State& state) {
    const auto v = lexjson::parse(service_config(1000));
    lexjson::FormatOptions opts;
    opts.escape_strings = true;
    for (auto _ : state) {
        auto s = lexjson::format(v, opts);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeEscaped_Lexjson);

static void BM_SerializeEscaped_BoostJson(benchmark::State& state) {
    const auto v = boost::json::parse(service_config(1000));
    for (auto _ : state) {
        auto s = boost::json::serialize(v);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeEscaped_BoostJson);
