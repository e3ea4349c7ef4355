#ifndef SYNCDL_RUNTIME_BATCH_LOADER_H
#define SYNCDL_RUNTIME_BATCH_LOADER_H

#include <syncdl/runtime/batch_scope.h>
#include <syncdl/runtime/deferred.h>
#include <syncdl/util/errors.h>

#include <ankerl/unordered_dense.h>
#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace syncdl {

    struct BatchLoaderOptions {
        // Largest number of keys handed to the fetch function in one call, 0 means unlimited.
        // A larger queue is fetched in consecutive chunks within the same dispatch.
        std::size_t max_batch_size{0};
        // When false every load creates a new Deferred and queues the key, even if it was requested before.
        bool cache{true};
        // Reported to observers of the scope on dispatch.
        std::string name{"loader"};
    };

    /**
     * Key de-duplicating, batch dispatching loader built on Deferred.
     *
     * The first load of a cycle registers dispatch() on the scope, every load until the scope drains is queued
     * behind it, and dispatch() hands all the queued keys to the fetch function in a single call. Results are
     * cached per key for the life-time of the loader (or until cleared), so a key requested twice returns the
     * same Deferred and is only ever fetched once.
     *
     * The fetch function must return one entry per key, in key order, each either a value or the error for
     * that key. If it throws, every key of the batch fails with that error and is evicted from the cache.
     *
     * If the activation ends without draining (an error, or an abandoned scope) the queued keys fail with
     * InvalidStateError and are evicted, so the next activation starts from an empty queue.
     *
     * The callbacks registered on the scope and the dispatch hints on pending Deferreds only hold a weak reference
     * to the loader, once it is destroyed they do nothing. Keys still queued at that point never settle.
     */
    template<typename K, typename V, typename Hash = ankerl::unordered_dense::hash<K>,
             typename KeyEqual = std::equal_to<K>>
    class BatchLoader {
    public:
        using key_type = K;
        using value_type = V;
        using deferred_type = Deferred<V>;
        using result_type = std::variant<V, std::exception_ptr>;
        using batch_load_fn = std::function<std::vector<result_type>(const std::vector<K> &)>;

        BatchLoader(BatchScope &scope, batch_load_fn batch_load, BatchLoaderOptions options = {})
            : _scope{&scope}, _batch_load{std::move(batch_load)}, _options{std::move(options)} {
            if (!_batch_load) { throw ConfigurationError("BatchLoader requires a batch load function"); }
        }

        BatchLoader(const BatchLoader &) = delete;

        BatchLoader &operator=(const BatchLoader &) = delete;

        [[nodiscard]] deferred_type load(const K &key) {
            if (_options.cache) {
                if (auto it = _cache.find(key); it != _cache.end()) { return it->second; }
            }
            if (!_scope->is_active()) {
                throw_error<ConfigurationError>("No active batch scope, cannot load from '{}'.", _options.name);
            }

            deferred_type deferred;
            bool needs_dispatch = _queue.empty();
            _queue.emplace_back(key, deferred);
            std::weak_ptr<BatchLoader *> self{_self};
            if (needs_dispatch) {
                _scope->add_callback(
                    [self] {
                        if (auto loader = self.lock()) { (*loader)->dispatch(); }
                    },
                    [self] {
                        if (auto loader = self.lock()) { (*loader)->discard_queue(); }
                    });
            }
            if (_options.cache) { _cache.emplace(key, deferred); }
            deferred.set_dispatch_hint([self] {
                if (auto loader = self.lock()) { (*loader)->dispatch(); }
            });
            return deferred;
        }

        [[nodiscard]] Deferred<std::vector<V>> load_many(const std::vector<K> &keys) {
            std::vector<deferred_type> loads;
            loads.reserve(keys.size());
            for (const auto &key : keys) { loads.push_back(load(key)); }
            return gather(loads);
        }

        /**
         * Removes the key from the cache only, a batch that already holds the key still settles its Deferred.
         */
        void clear(const K &key) { _cache.erase(key); }

        void clear_all() { _cache.clear(); }

        /**
         * Seeds the cache with an already settled value. Returns false (and leaves the cache untouched) when the
         * key is already cached.
         */
        bool prime(const K &key, V value) {
            if (!_options.cache || _cache.contains(key)) { return false; }
            _cache.emplace(key, deferred_type::resolved(std::move(value)));
            return true;
        }

        [[nodiscard]] bool is_cached(const K &key) const { return _cache.contains(key); }

        [[nodiscard]] std::size_t cached() const noexcept { return _cache.size(); }

        [[nodiscard]] std::size_t queued() const noexcept { return _queue.size(); }

        [[nodiscard]] BatchScope &scope() const noexcept { return *_scope; }

        [[nodiscard]] const BatchLoaderOptions &options() const noexcept { return _options; }

        /**
         * Fetches everything queued so far. A no-op when nothing is queued, so an early dispatch (through a
         * Deferred's dispatch hint) leaves the callback registered on the scope harmless.
         * Throws BatchContractError if the fetch function returned the wrong number of results, after failing the
         * keys of that batch with the same error.
         */
        void dispatch() {
            if (_queue.empty()) { return; }
            auto queue = std::exchange(_queue, {});
            _scope->notify_batch_dispatch(_options.name, queue.size());

            std::size_t chunk = _options.max_batch_size == 0 ? queue.size() : _options.max_batch_size;
            std::exception_ptr contract_error;
            for (std::size_t begin = 0; begin < queue.size(); begin += chunk) {
                auto end = std::min(queue.size(), begin + chunk);
                std::vector<entry_type> batch(std::make_move_iterator(queue.begin() + begin),
                                              std::make_move_iterator(queue.begin() + end));
                try {
                    dispatch_batch(batch);
                } catch (const BatchContractError &) {
                    if (!contract_error) { contract_error = std::current_exception(); }
                }
            }
            if (contract_error) { std::rethrow_exception(contract_error); }
        }

    private:
        using entry_type = std::pair<K, deferred_type>;

        void dispatch_batch(const std::vector<entry_type> &batch) {
            std::vector<K> keys;
            keys.reserve(batch.size());
            for (const auto &[key, _] : batch) { keys.push_back(key); }

            std::vector<result_type> results;
            try {
                results = _batch_load(keys);
            } catch (...) {
                // The error belongs to every key of the batch, it is delivered through their Deferreds.
                fail_batch(batch, std::current_exception());
                return;
            }

            if (results.size() != keys.size()) {
                auto error = std::make_exception_ptr(BatchContractError(fmt::format(
                    "The batch load function of '{}' returned {} results for {} keys, expected one result per key.",
                    _options.name, results.size(), keys.size())));
                fail_batch(batch, error);
                std::rethrow_exception(error);
            }

            std::size_t index{0};
            try {
                for (; index < batch.size(); ++index) {
                    const auto &deferred = batch[index].second;
                    if (auto *error = std::get_if<std::exception_ptr>(&results[index])) {
                        deferred.set_error(*error);
                    } else {
                        deferred.set_result(std::move(std::get<V>(results[index])));
                    }
                }
            } catch (...) {
                // A continuation raised a contract error, the keys not yet settled would otherwise never settle.
                auto error = std::current_exception();
                fail_batch(batch, error);
                std::rethrow_exception(error);
            }
        }

        void discard_queue() {
            if (_queue.empty()) { return; }
            auto queue = std::exchange(_queue, {});
            fail_batch(queue, std::make_exception_ptr(InvalidStateError(fmt::format(
                "The batch scope of '{}' closed before its {} queued key(s) were dispatched.", _options.name,
                queue.size()))));
        }

        void fail_batch(const std::vector<entry_type> &batch, const std::exception_ptr &error) {
            for (const auto &[key, deferred] : batch) {
                if (auto it = _cache.find(key); it != _cache.end() && it->second == deferred) { _cache.erase(it); }
            }
            for (const auto &[key, deferred] : batch) {
                if (!deferred.is_done() && !deferred.is_following()) { deferred.set_error(error); }
            }
        }

        BatchScope *_scope;
        batch_load_fn _batch_load;
        BatchLoaderOptions _options;
        ankerl::unordered_dense::map<K, deferred_type, Hash, KeyEqual> _cache{};
        std::vector<entry_type> _queue{};
        // Expires with the loader, see the weak references handed out in load()
        std::shared_ptr<BatchLoader *> _self{std::make_shared<BatchLoader *>(this)};
    };

} // namespace syncdl

#endif // SYNCDL_RUNTIME_BATCH_LOADER_H
