#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace isoholdem::parallel {

// Performance metrics for one parallel map
struct MapMetrics {
    double wall_time_ms = 0.0;
    std::size_t units = 0;
    int num_threads = 1;
};

inline int resolve_num_threads(int num_threads) {
    if (num_threads > 0) return num_threads;
#ifdef _OPENMP
    return omp_get_max_threads();
#else
    int n = static_cast<int>(std::thread::hardware_concurrency());
    return n > 0 ? n : 4;  // fallback
#endif
}

// Computes results[i] = fn(i) for every i in [0, n).
// Each unit writes only its own slot. The first exception thrown by any unit
// is rethrown on the calling thread once all workers have stopped.
// Uses OpenMP when available, otherwise a std::thread pool over chunks.
template<typename Result, typename Func>
std::vector<Result> parallel_map(std::size_t n, Func&& fn, int num_threads = 0,
                                 MapMetrics* metrics = nullptr) {
    auto start = std::chrono::high_resolution_clock::now();

    std::vector<Result> results(n);
    const int threads = resolve_num_threads(num_threads);

    std::exception_ptr first_error;
    std::mutex error_mutex;
    std::atomic<bool> failed{false};

    auto run_unit = [&](std::size_t i) {
        if (failed.load(std::memory_order_relaxed)) return;
        try {
            results[i] = fn(i);
        } catch (...) {
            std::lock_guard<std::mutex> lock(error_mutex);
            if (!first_error) first_error = std::current_exception();
            failed = true;
        }
    };

#ifdef _OPENMP
    const long long count = static_cast<long long>(n);
    #pragma omp parallel for schedule(dynamic) num_threads(threads)
    for (long long i = 0; i < count; ++i) {
        run_unit(static_cast<std::size_t>(i));
    }
#else
    // Divide units among threads
    auto worker = [&](std::size_t begin, std::size_t end) {
        for (std::size_t i = begin; i < end; ++i) {
            run_unit(i);
        }
    };

    std::vector<std::thread> pool;
    const std::size_t per_thread = (n + threads - 1) / threads;
    for (int t = 0; t < threads; ++t) {
        std::size_t begin = t * per_thread;
        std::size_t end = std::min(begin + per_thread, n);
        if (begin < end) {
            pool.emplace_back(worker, begin, end);
        }
    }
    for (auto& t : pool) {
        t.join();
    }
#endif

    if (metrics) {
        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
        metrics->wall_time_ms = duration.count() / 1000.0;
        metrics->units = n;
        metrics->num_threads = threads;
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    return results;
}

} // namespace isoholdem::parallel
