#include <catch2/catch_test_macros.hpp>

#include <syncdl/runtime/batch_loader.h>
#include <syncdl/runtime/execution_observer.h>

#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
    using Loader = syncdl::BatchLoader<std::string, std::string>;

    // Echoes keys back upper-cased and records every batch it was asked for
    struct RecordingFetch {
        std::vector<std::vector<std::string>> *batches;

        std::vector<Loader::result_type> operator()(const std::vector<std::string> &keys) const {
            batches->push_back(keys);
            std::vector<Loader::result_type> results;
            for (const auto &key : keys) {
                if (key.starts_with("bad")) {
                    results.emplace_back(std::make_exception_ptr(std::invalid_argument("no such key: " + key)));
                } else {
                    std::string value{key};
                    for (auto &c : value) { c = static_cast<char>(std::toupper(c)); }
                    results.emplace_back(std::move(value));
                }
            }
            return results;
        }
    };

    struct DispatchRecorder : syncdl::ExecutionLifeCycleObserver {
        std::vector<std::pair<std::string, std::size_t>> dispatches;

        void on_batch_dispatch(std::string_view name, std::size_t count) override {
            dispatches.emplace_back(std::string{name}, count);
        }
    };
} // namespace

TEST_CASE("Loads made in one pass are fetched in a single de-duplicated batch", "[batch_loader]") {
    using namespace syncdl;
    BatchScope scope;
    std::vector<std::vector<std::string>> batches;
    Loader loader{scope, RecordingFetch{&batches}};

    BatchScope::Activation activation{scope};
    auto b = loader.load("b");
    auto a = loader.load("a");
    auto b_again = loader.load("b");
    REQUIRE(b == b_again);
    REQUIRE(loader.queued() == 2);
    REQUIRE(scope.pending() == 1);
    REQUIRE(batches.empty());

    activation.close();
    REQUIRE(batches == std::vector<std::vector<std::string>>{{"b", "a"}});
    REQUIRE(a.get_result() == "A");
    REQUIRE(b.get_result() == "B");
    REQUIRE(loader.queued() == 0);
}

TEST_CASE("Cached keys are never fetched again", "[batch_loader]") {
    using namespace syncdl;
    BatchScope scope;
    std::vector<std::vector<std::string>> batches;
    Loader loader{scope, RecordingFetch{&batches}};

    {
        BatchScope::Activation activation{scope};
        (void)loader.load("x");
        activation.close();
    }
    {
        BatchScope::Activation activation{scope};
        auto x = loader.load("x");
        auto y = loader.load("y");
        REQUIRE(x.is_done());
        activation.close();
        REQUIRE(x.get_result() == "X");
        REQUIRE(y.get_result() == "Y");
    }
    REQUIRE(batches == std::vector<std::vector<std::string>>{{"x"}, {"y"}});
    REQUIRE(loader.cached() == 2);
}

TEST_CASE("Loading without an active scope is a configuration error", "[batch_loader]") {
    using namespace syncdl;
    BatchScope scope;
    std::vector<std::vector<std::string>> batches;
    Loader loader{scope, RecordingFetch{&batches}};
    REQUIRE_THROWS_AS(loader.load("a"), ConfigurationError);
    REQUIRE(loader.queued() == 0);
}

TEST_CASE("A per key error only fails that key", "[batch_loader]") {
    using namespace syncdl;
    BatchScope scope;
    std::vector<std::vector<std::string>> batches;
    Loader loader{scope, RecordingFetch{&batches}};

    BatchScope::Activation activation{scope};
    auto good = loader.load("good");
    auto bad = loader.load("bad-1");
    activation.close();

    REQUIRE(good.get_result() == "GOOD");
    REQUIRE(bad.is_failed());
    REQUIRE_THROWS_AS(bad.get_result(), std::invalid_argument);
    REQUIRE(batches.size() == 1);
}

TEST_CASE("A throwing fetch fails every key of the batch and evicts them", "[batch_loader]") {
    using namespace syncdl;
    BatchScope scope;
    int calls{0};
    Loader loader{scope, [&](const std::vector<std::string> &keys) -> std::vector<Loader::result_type> {
        if (++calls == 1) { throw std::runtime_error("database is down"); }
        return std::vector<Loader::result_type>(keys.begin(), keys.end());
    }};

    {
        BatchScope::Activation activation{scope};
        auto a = loader.load("a");
        auto b = loader.load("b");
        REQUIRE_NOTHROW(activation.close());
        REQUIRE(a.is_failed());
        REQUIRE(b.is_failed());
        REQUIRE_THROWS_AS(a.get_result(), std::runtime_error);
    }
    REQUIRE_FALSE(loader.is_cached("a"));
    REQUIRE_FALSE(loader.is_cached("b"));

    BatchScope::Activation activation{scope};
    auto retried = loader.load("a");
    activation.close();
    REQUIRE(retried.get_result() == "a");
    REQUIRE(calls == 2);
}

TEST_CASE("A fetch returning the wrong number of results is a contract error", "[batch_loader]") {
    using namespace syncdl;
    BatchScope scope;
    Loader loader{scope, [](const std::vector<std::string> &) -> std::vector<Loader::result_type> {
        return {std::string{"only one"}};
    }};

    BatchScope::Activation activation{scope};
    auto a = loader.load("a");
    auto b = loader.load("b");
    REQUIRE_THROWS_AS(activation.close(), BatchContractError);

    REQUIRE(a.is_failed());
    REQUIRE(b.is_failed());
    REQUIRE_THROWS_AS(b.get_result(), BatchContractError);
    REQUIRE_FALSE(loader.is_cached("a"));
    REQUIRE_FALSE(scope.is_active());
}

TEST_CASE("Dependent loads are fetched in consecutive batches", "[batch_loader]") {
    using namespace syncdl;
    BatchScope scope;
    std::vector<std::vector<std::string>> batches;
    Loader refs{scope, [&](const std::vector<std::string> &keys) {
        batches.push_back(keys);
        std::vector<Loader::result_type> results;
        for (const auto &key : keys) { results.emplace_back(key == "x" ? std::string{"ref-of-x"} : key + "!"); }
        return results;
    }};

    BatchScope::Activation activation{scope};
    auto resolved = refs.load("x").then([&](const std::string &ref) { return refs.load(ref); });
    activation.close();

    REQUIRE(resolved.get_result() == "ref-of-x!");
    REQUIRE(batches == std::vector<std::vector<std::string>>{{"x"}, {"ref-of-x"}});
}

TEST_CASE("A key loaded again while its batch is settling hits the cache", "[batch_loader]") {
    using namespace syncdl;
    BatchScope scope;
    std::vector<std::vector<std::string>> batches;
    Loader loader{scope, RecordingFetch{&batches}};

    BatchScope::Activation activation{scope};
    auto first = loader.load("a");
    Deferred<std::string> reloaded;
    first.on_done([&](const Deferred<std::string> &) { reloaded = loader.load("a"); });
    activation.close();

    REQUIRE(reloaded == first);
    REQUIRE(batches.size() == 1);
}

TEST_CASE("clear, clear_all and prime manage the cache", "[batch_loader]") {
    using namespace syncdl;
    BatchScope scope;
    std::vector<std::vector<std::string>> batches;
    Loader loader{scope, RecordingFetch{&batches}};

    REQUIRE(loader.prime("p", "primed"));
    REQUIRE_FALSE(loader.prime("p", "again"));
    {
        BatchScope::Activation activation{scope};
        auto p = loader.load("p");
        auto q = loader.load("q");
        REQUIRE(p.get_result() == "primed");
        activation.close();
        REQUIRE(q.get_result() == "Q");
    }
    REQUIRE(batches == std::vector<std::vector<std::string>>{{"q"}});

    loader.clear("q");
    REQUIRE_FALSE(loader.is_cached("q"));
    REQUIRE(loader.is_cached("p"));
    loader.clear_all();
    REQUIRE(loader.cached() == 0);

    BatchScope::Activation activation{scope};
    auto p = loader.load("p");
    activation.close();
    REQUIRE(p.get_result() == "P");
    REQUIRE(batches.size() == 2);
}

TEST_CASE("load_many settles with the values in key order", "[batch_loader]") {
    using namespace syncdl;
    BatchScope scope;
    std::vector<std::vector<std::string>> batches;
    Loader loader{scope, RecordingFetch{&batches}};

    BatchScope::Activation activation{scope};
    auto many = loader.load_many({"c", "a", "c"});
    auto failing = loader.load_many({"a", "bad"});
    activation.close();

    REQUIRE(many.get_result() == std::vector<std::string>{"C", "A", "C"});
    REQUIRE(failing.is_failed());
    REQUIRE(batches == std::vector<std::vector<std::string>>{{"c", "a", "bad"}});
}

TEST_CASE("max_batch_size splits a dispatch into chunks", "[batch_loader]") {
    using namespace syncdl;
    BatchScope scope;
    std::vector<std::vector<std::string>> batches;
    Loader loader{scope, RecordingFetch{&batches}, BatchLoaderOptions{.max_batch_size = 2, .name = "chunked"}};
    DispatchRecorder recorder;
    scope.add_observer(&recorder);

    BatchScope::Activation activation{scope};
    for (const auto *key : {"a", "b", "c", "d", "e"}) { (void)loader.load(key); }
    activation.close();

    REQUIRE(batches == std::vector<std::vector<std::string>>{{"a", "b"}, {"c", "d"}, {"e"}});
    REQUIRE(recorder.dispatches.size() == 1);
    REQUIRE(recorder.dispatches[0] == std::pair<std::string, std::size_t>{"chunked", 5});
}

TEST_CASE("Without caching every load is queued", "[batch_loader]") {
    using namespace syncdl;
    BatchScope scope;
    std::vector<std::vector<std::string>> batches;
    Loader loader{scope, RecordingFetch{&batches}, BatchLoaderOptions{.cache = false}};

    BatchScope::Activation activation{scope};
    auto first = loader.load("a");
    auto second = loader.load("a");
    REQUIRE_FALSE(first == second);
    activation.close();

    REQUIRE(batches == std::vector<std::vector<std::string>>{{"a", "a"}});
    REQUIRE(loader.cached() == 0);
    REQUIRE_FALSE(loader.prime("a", "x"));
}

TEST_CASE("The dispatch hint fetches early and the queued dispatch becomes a no-op", "[batch_loader]") {
    using namespace syncdl;
    BatchScope scope;
    std::vector<std::vector<std::string>> batches;
    Loader loader{scope, RecordingFetch{&batches}};

    BatchScope::Activation activation{scope};
    auto a = loader.load("a");
    auto hint = a.dispatch_hint();
    hint();
    REQUIRE(a.get_result() == "A");
    REQUIRE(scope.pending() == 1);
    activation.close();
    REQUIRE(batches.size() == 1);
}

TEST_CASE("A loader requires a batch load function", "[batch_loader]") {
    using namespace syncdl;
    BatchScope scope;
    REQUIRE_THROWS_AS(Loader(scope, Loader::batch_load_fn{}), ConfigurationError);
}

TEST_CASE("Keys queued when an activation fails are released for the next activation", "[batch_loader]") {
    using namespace syncdl;
    BatchScope scope;
    std::vector<std::vector<std::string>> batches;
    Loader loader{scope, RecordingFetch{&batches}};

    Deferred<std::string> stranded;
    REQUIRE_THROWS_AS(([&] {
        BatchScope::Activation activation{scope};
        stranded = loader.load("a");
        throw std::runtime_error("sibling resolver failed");
    })(), std::runtime_error);

    REQUIRE(stranded.is_failed());
    REQUIRE_THROWS_AS(stranded.get_result(), InvalidStateError);
    REQUIRE(loader.queued() == 0);
    REQUIRE_FALSE(loader.is_cached("a"));
    REQUIRE(scope.pending() == 0);
    REQUIRE(batches.empty());

    BatchScope::Activation activation{scope};
    auto a = loader.load("a");
    auto b = loader.load("b");
    REQUIRE(scope.pending() == 1);
    activation.close();
    REQUIRE(a.get_result() == "A");
    REQUIRE(b.get_result() == "B");
    REQUIRE(batches == std::vector<std::vector<std::string>>{{"a", "b"}});
}

TEST_CASE("A loader queued behind a failing dispatch or an abandoned scope fetches again later", "[batch_loader]") {
    using namespace syncdl;
    BatchScope scope;
    std::vector<std::vector<std::string>> batches;
    Loader broken{scope, [](const std::vector<std::string> &) -> std::vector<Loader::result_type> { return {}; }};
    Loader loader{scope, RecordingFetch{&batches}};

    {
        BatchScope::Activation activation{scope};
        (void)broken.load("x");
        auto a = loader.load("a");
        REQUIRE_THROWS_AS(activation.close(), BatchContractError);
        REQUIRE(a.is_failed());
        REQUIRE(loader.queued() == 0);
    }
    {
        BatchScope::Activation activation{scope};
        auto c = loader.load("c");
        activation.abandon();
        REQUIRE(c.is_failed());
        REQUIRE(loader.queued() == 0);
    }
    REQUIRE(batches.empty());

    BatchScope::Activation activation{scope};
    auto a = loader.load("a");
    auto c = loader.load("c");
    activation.close();
    REQUIRE(a.get_result() == "A");
    REQUIRE(c.get_result() == "C");
    REQUIRE(batches == std::vector<std::vector<std::string>>{{"a", "c"}});
}

TEST_CASE("Clearing a queued key drops it from the cache but not from its batch", "[batch_loader]") {
    using namespace syncdl;
    BatchScope scope;
    std::vector<std::vector<std::string>> batches;
    Loader loader{scope, RecordingFetch{&batches}};

    Deferred<std::string> first;
    {
        BatchScope::Activation activation{scope};
        first = loader.load("a");
        loader.clear("a");
        REQUIRE_FALSE(loader.is_cached("a"));
        REQUIRE(loader.queued() == 1);
        activation.close();
    }
    REQUIRE(first.get_result() == "A");
    REQUIRE_FALSE(loader.is_cached("a"));

    BatchScope::Activation activation{scope};
    auto again = loader.load("a");
    REQUIRE_FALSE(again == first);
    activation.close();
    REQUIRE(again.get_result() == "A");
    REQUIRE(batches == std::vector<std::vector<std::string>>{{"a"}, {"a"}});
}

TEST_CASE("Callbacks and dispatch hints left behind by a destroyed loader do nothing", "[batch_loader]") {
    using namespace syncdl;
    BatchScope scope;
    std::vector<std::vector<std::string>> batches;
    Deferred<std::string> orphan;

    BatchScope::Activation activation{scope};
    {
        Loader loader{scope, RecordingFetch{&batches}};
        orphan = loader.load("a");
    }
    auto hint = orphan.dispatch_hint();
    REQUIRE(hint);
    hint();
    REQUIRE_NOTHROW(activation.close());
    REQUIRE_FALSE(orphan.is_done());
    REQUIRE(batches.empty());
}
