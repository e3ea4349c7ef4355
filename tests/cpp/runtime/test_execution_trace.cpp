#include <catch2/catch_test_macros.hpp>

#include <syncdl/runtime/batch_loader.h>
#include <syncdl/runtime/execution_context.h>
#include <syncdl/runtime/observers/execution_trace.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
    using syncdl::FieldNode;
    using syncdl::ResolveInfo;
    using syncdl::ResolveResult;
    using syncdl::Value;

    struct TracedGraph {
        syncdl::BatchScope scope;
        syncdl::BatchLoader<std::string, Value> loader{scope, [](const std::vector<std::string> &keys) {
            std::vector<syncdl::BatchLoader<std::string, Value>::result_type> results;
            for (const auto &key : keys) {
                if (key == "bad") {
                    results.emplace_back(std::make_exception_ptr(std::runtime_error("bad key")));
                } else {
                    results.emplace_back(Value{key});
                }
            }
            return results;
        }, syncdl::BatchLoaderOptions{.name = "keys"}};
        syncdl::Schema schema;

        TracedGraph() {
            auto &query = schema.object_type("Query");
            query.add_field("item", schema.string_type(), [this](const Value &, const ResolveInfo &info) -> ResolveResult {
                return loader.load(info.argument("key").as_string());
            });
            schema.set_query_type(query);
        }

        std::string run(syncdl::ExecutionTrace &trace) {
            syncdl::ExecutionContext context{schema, scope, {.observers = {&trace}}};
            auto result = context.execute({FieldNode{.name = "item", .alias = "good", .arguments = {{"key", "a"}}},
                                           FieldNode{.name = "item", .alias = "other", .arguments = {{"key", "bad"}}}});
            return result.data.to_string();
        }
    };
} // namespace

TEST_CASE("Execution trace logs every step", "[trace]") {
    TracedGraph graph;
    std::ostringstream out;
    syncdl::ExecutionTrace trace{std::nullopt, true, true, true, true, &out};

    REQUIRE(graph.run(trace) == R"({"good":"a","other":null})");
    auto log = out.str();
    REQUIRE(log.find("Starting query") != std::string::npos);
    REQUIRE(log.find("good Query.item [IN]") != std::string::npos);
    REQUIRE(log.find("good -> String [OUT]") != std::string::npos);
    REQUIRE(log.find("other [DEFERRED]") != std::string::npos);
    REQUIRE(log.find("[keys] dispatching 2 key(s)") != std::string::npos);
    REQUIRE(log.find("Drain Start (1 queued)") != std::string::npos);
    REQUIRE(log.find("other [ERROR] bad key") != std::string::npos);
    REQUIRE(log.find("Finished query with 1 error(s)") != std::string::npos);
}

TEST_CASE("Execution trace filters by path and event group", "[trace]") {
    TracedGraph graph;
    std::ostringstream out;
    syncdl::ExecutionTrace trace{std::string{"other"}, false, true, false, false, &out};

    graph.run(trace);
    auto log = out.str();
    REQUIRE(log.find("other Query.item [IN]") != std::string::npos);
    REQUIRE(log.find("good") == std::string::npos);
    REQUIRE(log.find("Starting") == std::string::npos);
    REQUIRE(log.find("dispatching") == std::string::npos);
    REQUIRE(log.find("Drain") == std::string::npos);
}
