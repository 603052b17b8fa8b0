/// @file bench_lexjson.cpp
/// @brief Performance benchmarks for the lexjson library.
///
/// Measured operations:
///   - Lexer pull loop over compact and hand-indented text
///   - Parsing of record lists, number-heavy arrays and nested containers
///   - Formatting in compact, pretty and escaped modes
///   - beautify() end to end, including lenient input
///   - Object lookup below and above the hash-index threshold

#include <lexjson/lexjson.hpp>

#include <benchmark/benchmark.h>

#include <sstream>
#include <string>
#include <vector>

using namespace lexjson;

namespace {

// ═══════════════════════════════════════════════════════════════════════════════
// Documents
// ═══════════════════════════════════════════════════════════════════════════════

/// Sensor log: `rows` readings, one object per line, as a logger would write it.
std::string sensor_log(int rows) {
    std::string s = "[\n";
    for (int i = 0; i < rows; ++i) {
        s += "\t{\"sensor\": \"sensor-";
        s += std::to_string(i % 16);
        s += "\", \"seq\": ";
        s += std::to_string(i);
        s += ", \"celsius\": ";
        s += std::to_string(i % 40) + "." + std::to_string((i * 7) % 100);
        s += ", \"ok\": ";
        s += (i % 11 == 0) ? "false" : "true";
        s += ", \"note\": ";
        s += (i % 5 == 0) ? "\"said \\\"recalibrate\\\" at C:\\\\logs\"" : "null";
        s += (i + 1 < rows) ? "},\n" : "}\n";
    }
    s += "]\n";
    return s;
}

/// Signed decimals with up to 17 significant digits (slow conversion path).
std::string decimal_series(int count) {
    std::string s = "[";
    for (int i = 0; i < count; ++i) {
        if (i) s += ',';
        s += (i % 2) ? "-" : "+";
        s += std::to_string(i * 37 % 1000);
        s += ".00390625";
        s += std::to_string(i % 100000000);
    }
    s += ']';
    return s;
}

/// Alternating arrays and objects, `depth` levels deep.
std::string nested_mix(int depth) {
    std::string open;
    std::string close;
    for (int i = 0; i < depth; ++i) {
        if (i % 2) {
            open += "[" + std::to_string(i) + ",";
            close.insert(0, "]");
        } else {
            open += "{\"d" + std::to_string(i) + "\":";
            close.insert(0, "}");
        }
    }
    return open + "\"leaf\"" + close;
}

Value keyed_object(int keys) {
    Value obj = Value::object();
    for (int i = 0; i < keys; ++i) obj.insert("field_" + std::to_string(i), Value(i));
    return obj;
}

void set_bytes(benchmark::State& state, const std::string& input) {
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Lexer
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_LexSensorLog(benchmark::State& state) {
    const auto input = sensor_log(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        Lexer lexer(input);
        size_t significant = 0;
        while (auto tok = lexer.next()) significant += tok->is_space() ? 0 : 1;
        benchmark::DoNotOptimize(significant);
    }
    set_bytes(state, input);
}
BENCHMARK(BM_LexSensorLog)->Arg(100)->Arg(2000);

static void BM_Tokenize(benchmark::State& state) {
    const auto input = sensor_log(500);
    for (auto _ : state) {
        auto tokens = tokenize(input);
        benchmark::DoNotOptimize(tokens.data());
    }
    set_bytes(state, input);
}
BENCHMARK(BM_Tokenize);

// ═══════════════════════════════════════════════════════════════════════════════
// Parser
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ParseSensorLog(benchmark::State& state) {
    const auto input = sensor_log(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto v = parse(input);
        benchmark::DoNotOptimize(v);
    }
    set_bytes(state, input);
}
BENCHMARK(BM_ParseSensorLog)->Arg(100)->Arg(2000);

static void BM_ParseDecimals(benchmark::State& state) {
    const auto input = decimal_series(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto v = parse(input);
        benchmark::DoNotOptimize(v);
    }
    set_bytes(state, input);
}
BENCHMARK(BM_ParseDecimals)->Arg(1000);

static void BM_ParseNestedMix(benchmark::State& state) {
    const auto input = nested_mix(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto v = parse(input);
        benchmark::DoNotOptimize(v);
    }
    set_bytes(state, input);
}
BENCHMARK(BM_ParseNestedMix)->Arg(16)->Arg(256);

static void BM_TryParseRejects(benchmark::State& state) {
    auto input = sensor_log(200);
    input.insert(input.size() / 2, "1e5");
    for (auto _ : state) {
        auto res = try_parse(input);
        benchmark::DoNotOptimize(res.ec);
    }
}
BENCHMARK(BM_TryParseRejects);

// ═══════════════════════════════════════════════════════════════════════════════
// Formatter
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_FormatModes(benchmark::State& state) {
    const auto v = parse(sensor_log(1000));
    FormatOptions opts;
    opts.pretty = state.range(0) != 0;
    opts.escape_strings = state.range(1) != 0;
    for (auto _ : state) {
        auto s = format(v, opts);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_FormatModes)->Args({0, 0})->Args({1, 0})->Args({0, 1});

static void BM_FormatDecimals(benchmark::State& state) {
    const auto v = parse(decimal_series(1000));
    for (auto _ : state) {
        auto s = format(v);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_FormatDecimals);

static void BM_FormatStream(benchmark::State& state) {
    const auto v = parse(sensor_log(1000));
    for (auto _ : state) {
        std::ostringstream os;
        format(os, v, FormatOptions{true, false, false});
        benchmark::DoNotOptimize(os);
    }
}
BENCHMARK(BM_FormatStream);

// ═══════════════════════════════════════════════════════════════════════════════
// beautify
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Beautify(benchmark::State& state) {
    const auto input = sensor_log(500);
    for (auto _ : state) {
        auto s = beautify(input);
        benchmark::DoNotOptimize(s);
    }
    set_bytes(state, input);
}
BENCHMARK(BM_Beautify);

static void BM_BeautifyTruncated(benchmark::State& state) {
    auto input = sensor_log(500);
    input.resize(input.rfind(','));
    input += ',';
    const auto opts = ParseOptions::lenient();
    for (auto _ : state) {
        auto s = beautify(input, opts);
        benchmark::DoNotOptimize(s);
    }
    set_bytes(state, input);
}
BENCHMARK(BM_BeautifyTruncated);

// ═══════════════════════════════════════════════════════════════════════════════
// Object lookup (linear scan below LEXJSON_OBJECT_INDEX_THRESHOLD, hashed above)
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ObjectFind(benchmark::State& state) {
    const int keys = static_cast<int>(state.range(0));
    const Value obj = keyed_object(keys);
    std::vector<std::string> keys_to_find;
    for (int i = 0; i < keys; i += 3) keys_to_find.push_back("field_" + std::to_string(i));
    keys_to_find.push_back("absent");
    size_t next = 0;
    for (auto _ : state) {
        const Value* hit = obj.find(keys_to_find[next]);
        benchmark::DoNotOptimize(hit);
        next = (next + 1) % keys_to_find.size();
    }
}
BENCHMARK(BM_ObjectFind)->Arg(8)->Arg(LEXJSON_OBJECT_INDEX_THRESHOLD)->Arg(512);
