#pragma once
#ifndef XOR_RACE_H
#define XOR_RACE_H

#include <iostream>
#include <string>
#include <vector>
#include <atomic>
#include <memory>
#include <thread>
#include <chrono>
#include <random>
#include <limits>
#include <bitset>
#include <cstdint>
#include <type_traits>
#include <utility>
#include <system_error>

namespace xr {

    template<typename...> struct make_void { typedef void type; };
    template<typename... Ts> using void_t = typename make_void<Ts...>::type;

    // To take part in the race a counter must be a copyable handle with create(), get(), fetch_xor(n)
    // and must claim to be safe for sharing between threads (thread_shareable == true).
    template<typename T, typename = void>
    struct is_race_counter : std::false_type {};

    template<typename T>
    struct is_race_counter<T, void_t<
        decltype(T::create()),
        decltype(std::declval<T const&>().get()),
        decltype(std::declval<T const&>().fetch_xor(uint64_t())),
        decltype(T::thread_shareable)> >
        : std::integral_constant<bool,
            std::is_copy_constructible<T>::value &&
            std::is_same<decltype(T::create()), T>::value &&
            std::is_same<decltype(std::declval<T const&>().get()), uint64_t>::value &&
            T::thread_shareable> {};
    // ---------------------------------------------------------------

    // Every copy shares one std::atomic<uint64_t>. fetch_xor() is a single indivisible RMW,
    // relaxed ordering is enough: no other data is published through this value.
    class atomic_counter_t {
        std::shared_ptr<std::atomic<uint64_t>> value_ptr;

        explicit atomic_counter_t(std::shared_ptr<std::atomic<uint64_t>> ptr) : value_ptr(std::move(ptr)) {}
    public:
        static constexpr bool thread_shareable = true;

        static atomic_counter_t create() { return atomic_counter_t(std::make_shared<std::atomic<uint64_t>>(uint64_t(0))); }

        uint64_t get() const { return value_ptr->load(std::memory_order_relaxed); }
        void fetch_xor(uint64_t n) const { value_ptr->fetch_xor(n, std::memory_order_relaxed); }

        long use_count() const { return value_ptr.use_count(); }
    };
    // ---------------------------------------------------------------

    // UNSOUND: everything in this namespace claims thread_shareable without any synchronization.
    // Concurrent fetch_xor() is a data race (undefined behavior) and loses updates.
    // Do not "fix" it - the race is what the demo shows.
    namespace unsound {

        // unchecked mutable cell: gives a mutable pointer through a const reference, no exclusive-access check
        template<typename T>
        class unsync_cell_t {
            mutable T value;
        public:
            explicit unsync_cell_t(T const& init_value) : value(init_value) {}
            T * get() const { return &value; }
        };

        class unsync_counter_t {
            std::shared_ptr<unsync_cell_t<uint64_t>> cell_ptr;

            explicit unsync_counter_t(std::shared_ptr<unsync_cell_t<uint64_t>> ptr) : cell_ptr(std::move(ptr)) {}
        public:
            static constexpr bool thread_shareable = true;     // a lie

            static unsync_counter_t create() { return unsync_counter_t(std::make_shared<unsync_cell_t<uint64_t>>(uint64_t(0))); }

            uint64_t get() const { return *cell_ptr->get(); }

            void fetch_xor(uint64_t n) const {
                volatile uint64_t * const value = cell_ptr->get();    // volatile: keep the load and store as two separate accesses
                uint64_t const old_value = *value;
                *value = old_value ^ n;     // overwrites any update made by another thread after the load
            }

            long use_count() const { return cell_ptr.use_count(); }
        };
    }
    // ---------------------------------------------------------------

    struct race_config_t {
        size_t threads_count;       // worker threads
        size_t outer_iterations;    // random operands per thread
        size_t inner_repeats;       // applications of each operand to every counter

        race_config_t(size_t threads = 32, size_t outer = 256, size_t inner = 2048) :
            threads_count(threads), outer_iterations(outer), inner_repeats(inner) {}
    };

    // each worker seeds its own generator, no shared seed - runs are not reproducible
    class entropy_operand_source_t {
        std::mt19937_64 generator;
        std::uniform_int_distribution<uint64_t> distribution;

        static std::mt19937_64 seeded_generator() {
            std::random_device rd;
            std::seed_seq seq{ rd(), rd(), rd(), rd() };
            return std::mt19937_64(seq);
        }
    public:
        // worker_index is unused: every operand source is constructed from it, this one ignores it
        explicit entropy_operand_source_t(size_t /*worker_index*/) :
            generator(seeded_generator()), distribution(0, std::numeric_limits<uint64_t>::max()) {}
        uint64_t operator()() { return distribution(generator); }
    };
    // ---------------------------------------------------------------

    // applies n to every counter, left to right
    template<typename... counters_t>
    void do_xors(uint64_t n, counters_t const&... counters) {
        int order[] = { 0, (counters.fetch_xor(n), 0)... };
        (void)order;
    }

    template<typename operand_source_t, typename... counters_t>
    void race_worker(race_config_t const config, size_t const worker_index,
        std::atomic<size_t> *active_workers, counters_t const... counters)
    {
        operand_source_t operand_source(worker_index);
        for (size_t i = 0; i < config.outer_iterations; ++i) {
            uint64_t const n = operand_source();
            for (size_t k = 0; k < config.inner_repeats; ++k)
                do_xors(n, counters...);
        }
        active_workers->fetch_sub(1, std::memory_order_release);
    }

    // Owns the worker threads. An exception thrown inside a worker is not caught: std::terminate.
    class worker_group_t {
        std::vector<std::thread> vec_thread;
        std::atomic<size_t> active_workers;
    public:
        worker_group_t() : active_workers(0) {}
        ~worker_group_t() { join_all(); }
        worker_group_t(worker_group_t const&) = delete;
        worker_group_t& operator=(worker_group_t const&) = delete;

        // every worker gets its own copy of each counter handle
        template<typename operand_source_t, typename... counters_t>
        void spawn(race_config_t const& config, counters_t const&... counters) {
            static_assert(sizeof...(counters_t) > 0, "nothing to race on");
            vec_thread.reserve(vec_thread.size() + config.threads_count);
            for (size_t i = 0; i < config.threads_count; ++i) {
                std::atomic<size_t> * const active_ptr = &active_workers;
                active_workers.fetch_add(1, std::memory_order_relaxed);
                try {
                    vec_thread.emplace_back([config, i, active_ptr, counters...]() {
                        race_worker<operand_source_t>(config, i, active_ptr, counters...);
                    });
                }
                catch (std::system_error &) { active_workers.fetch_sub(1, std::memory_order_relaxed); throw; }
            }
        }

        // join barrier: blocks until every worker has returned, no timeout
        void join_all() {
            for (auto &i : vec_thread) if (i.joinable()) i.join();
        }

        size_t active_count() const { return active_workers.load(std::memory_order_acquire); }
        size_t size() const { return vec_thread.size(); }
    };
    // ---------------------------------------------------------------

    struct race_result_t {
        uint64_t unsync_value;
        uint64_t atomic_value;
        std::chrono::nanoseconds took;
        size_t active_workers_at_read;      // must be 0: counters are read only after the join barrier
    };

    template<typename operand_source_t = entropy_operand_source_t, typename atomic_t, typename unsync_t>
    race_result_t run_race_with(race_config_t const& config, atomic_t const& atomic, unsync_t const& unsync) {
        static_assert(is_race_counter<atomic_t>::value, "atomic_t does not satisfy the race counter contract");
        static_assert(is_race_counter<unsync_t>::value, "unsync_t does not satisfy the race counter contract");

        std::chrono::steady_clock::time_point const steady_start = std::chrono::steady_clock::now();
        worker_group_t workers;
        workers.spawn<operand_source_t>(config, atomic, unsync);
        workers.join_all();

        race_result_t result;
        result.active_workers_at_read = workers.active_count();
        result.unsync_value = unsync.get();
        result.atomic_value = atomic.get();
        result.took = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - steady_start);
        return result;
    }

    template<typename operand_source_t = entropy_operand_source_t>
    race_result_t run_race(race_config_t const& config = race_config_t()) {
        auto const unsync = unsound::unsync_counter_t::create();
        auto const atomic = atomic_counter_t::create();
        return run_race_with<operand_source_t>(config, atomic, unsync);
    }
    // ---------------------------------------------------------------

    inline std::string to_binary_string(uint64_t value) { return std::bitset<64>(value).to_string(); }

    // whole units, rounded half up: "2s", "5ms", "850µs", "12ns"
    inline std::string format_duration(std::chrono::nanoseconds took) {
        uint64_t const nanos = (took.count() < 0) ? 0 : static_cast<uint64_t>(took.count());
        uint64_t unit = 1;
        const char *suffix = "ns";
        if (nanos >= 1000000000) { unit = 1000000000; suffix = "s"; }
        else if (nanos >= 1000000) { unit = 1000000; suffix = "ms"; }
        else if (nanos >= 1000) { unit = 1000; suffix = "\xC2\xB5s"; }     // µs

        uint64_t whole = nanos / unit;
        if ((nanos % unit) * 2 >= unit) ++whole;
        return std::to_string(whole) + suffix;
    }

    inline void print_race_result(std::ostream &out, race_result_t const& result) {
        out << "unsync: " << to_binary_string(result.unsync_value) << "\n";
        out << "atomic: " << to_binary_string(result.atomic_value) << "\n";
        out << "took " << format_duration(result.took) << std::endl;
    }

}

#endif // #ifndef XOR_RACE_H
