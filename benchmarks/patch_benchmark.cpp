// json-patch-cpp benchmarks: measures throughput of patch application.

#include <json-patch-cpp/json_patch.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace json_patch_cpp;
using json = nlohmann::json;

static auto make_doc(std::int64_t width) -> json {
    auto doc = json::object();
    for (std::int64_t i = 0; i < width; ++i) {
        doc["key" + std::to_string(i)] = json{{"n", i}, {"tags", json::array({"a", "b"})}};
    }
    doc["list"] = json::array();
    return doc;
}

// =============================================================================
// Single operations
// =============================================================================

static void bm_add_object_member(benchmark::State& state) {
    auto doc = make_doc(state.range(0));
    const auto op = Operation{.op = OpType::add, .path = "/key0/extra", .value = json(1)};
    for (auto _ : state) {
        apply_operation(doc, op);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_add_object_member)->Arg(10)->Arg(1000);

static void bm_append_to_array(benchmark::State& state) {
    auto doc = make_doc(1);
    const auto op = Operation{.op = OpType::add, .path = "/list/-", .value = json("item")};
    for (auto _ : state) {
        apply_operation(doc, op);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_append_to_array);

static void bm_test_deep_equal(benchmark::State& state) {
    auto doc = make_doc(state.range(0));
    const auto op = Operation{.op = OpType::test, .path = "", .value = doc};
    for (auto _ : state) {
        auto result = apply_operation(doc, op);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_test_deep_equal)->Arg(10)->Arg(1000);

// =============================================================================
// Sequences: in place vs copy, with and without validation
// =============================================================================

static auto make_patch(std::int64_t length) -> std::vector<Operation> {
    auto patch = std::vector<Operation>{};
    for (std::int64_t i = 0; i < length; ++i) {
        auto key = "/key" + std::to_string(i);
        patch.push_back(Operation{.op = OpType::replace, .path = key + "/n", .value = json(i * 2)});
        patch.push_back(Operation{.op = OpType::add, .path = key + "/tags/-", .value = json("c")});
    }
    return patch;
}

static void bm_apply_patch(benchmark::State& state) {
    const auto validate = state.range(1) != 0;
    auto doc = make_doc(state.range(0));
    const auto patch = make_patch(state.range(0));
    const auto options = ApplyOptions{.validate = validate};
    for (auto _ : state) {
        auto results = apply_patch(doc, patch, options);
        benchmark::DoNotOptimize(results);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(patch.size()));
    state.SetLabel(validate ? "validated" : "unvalidated");
}
BENCHMARK(bm_apply_patch)->Args({100, 0})->Args({100, 1});

static void bm_apply_patch_to_copy(benchmark::State& state) {
    const auto doc = make_doc(state.range(0));
    const auto patch = make_patch(10);
    for (auto _ : state) {
        auto out = apply_patch_to_copy(doc, patch);
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_apply_patch_to_copy)->Arg(10)->Arg(1000);

static void bm_validate_sequence(benchmark::State& state) {
    const auto doc = make_doc(state.range(0));
    const auto patch = make_patch(state.range(0));
    for (auto _ : state) {
        auto error = validate_sequence(patch, &doc);
        benchmark::DoNotOptimize(error);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(patch.size()));
}
BENCHMARK(bm_validate_sequence)->Arg(100);

// =============================================================================
// Extended operations: graft into the live document
// =============================================================================

static void bm_extended_increment(benchmark::State& state) {
    auto registry = ExtendedOperationRegistry{};
    auto config = ExtendedOperationConfig{};
    config.arr = [](const Operation&, json&, std::size_t, json&) -> std::optional<ExtendedResult> {
        return std::nullopt;
    };
    config.obj = [](const Operation&, json& container, const std::string& key, json& document)
        -> std::optional<ExtendedResult> {
        container[key] = container.value(key, 0) + 1;
        return ExtendedResult{document, std::nullopt};
    };
    config.validator = [](const Operation&, std::size_t, const json*, const std::optional<std::string>&) {};
    registry.register_operation("x-inc", config);

    auto doc = make_doc(state.range(0));
    const auto op = Operation{.op = OpType::x, .path = "/key0/n", .xid = "x-inc"};
    const auto options = ApplyOptions{.registry = &registry};
    for (auto _ : state) {
        apply_operation(doc, op, options);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_extended_increment)->Arg(10)->Arg(1000);

// =============================================================================
// Pointer resolution
// =============================================================================

static void bm_find_by_pointer(benchmark::State& state) {
    const auto doc = make_doc(state.range(0));
    const auto pointer = "/key" + std::to_string(state.range(0) - 1) + "/tags/1";
    for (auto _ : state) {
        benchmark::DoNotOptimize(find_by_pointer(doc, pointer));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_find_by_pointer)->Arg(10)->Arg(1000);

BENCHMARK_MAIN();
