#ifndef DYNSCOPE_RUNTIME_TASK_POOL_H
#define DYNSCOPE_RUNTIME_TASK_POOL_H

#include <dynscope/runtime/cancellation.h>
#include <dynscope/scope/scope_runner.h>
#include <dynscope/util/errors.h>
#include <dynscope/util/lifecycle.h>

#include <condition_variable>
#include <deque>
#include <exception>
#include <future>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace dynscope {

    /**
     * TaskPool - Fixed set of worker threads that honours the inheritance contract.
     *
     * Every submitted task runs under the inheritable bindings of the submitting unit, captured at submission, with
     * the pool's cancellation token bound under cancellation_key() on top. Workers are created in start and joined in
     * stop; tasks still queued at stop never run and their futures fail with CancelledError.
     *
     *   TaskPool pool{4};
     *   StartStopContext running{pool};
     *   auto f = pool.submit([] { return get(request_id); });
     */
    class DYNSCOPE_EXPORT TaskPool : public ComponentLifeCycle {
    public:
        explicit TaskPool(size_t worker_count = std::thread::hardware_concurrency());

        ~TaskPool() override;

        TaskPool(const TaskPool &) = delete;
        TaskPool &operator=(const TaskPool &) = delete;

        [[nodiscard]] size_t worker_count() const noexcept { return _worker_count; }

        [[nodiscard]] size_t pending() const;

        /**
         * The token cancelled when the pool stops, a new one is issued on each start.
         */
        [[nodiscard]] CancellationToken cancellation() const;

        template<typename F>
        auto submit(F &&fn) {
            return submit_with(Snapshot::capture(), std::forward<F>(fn));
        }

        /**
         * Submit ``fn`` to run under an explicitly provided snapshot.
         */
        template<typename F>
        auto submit_with(Snapshot snapshot, F &&fn) {
            using result_t = std::invoke_result_t<std::decay_t<F> &>;
            auto promise = std::make_shared<std::promise<result_t>>();
            auto future = promise->get_future();
            enqueue([promise, snapshot = std::move(snapshot), fn = std::forward<F>(fn)](const CancellationToken &token,
                                                                                        bool cancelled) mutable {
                if (cancelled) {
                    promise->set_exception(std::make_exception_ptr(CancelledError("Task cancelled before it started")));
                    return;
                }
                try {
                    auto carrier = where(cancellation_key(), token);
                    if constexpr (std::is_void_v<result_t>) {
                        call_with_snapshot(snapshot, [&]() { run(carrier, fn); });
                        promise->set_value();
                    } else {
                        promise->set_value(call_with_snapshot(snapshot, [&]() -> result_t { return call(carrier, fn); }));
                    }
                } catch (...) {
                    // Delivered to the submitter through the future
                    promise->set_exception(std::current_exception());
                }
            });
            return future;
        }

    protected:
        void start() override;

        void stop() override;

    private:
        using task_t = std::function<void(const CancellationToken &, bool)>;

        void enqueue(task_t task);

        void worker_loop();

        size_t _worker_count;
        mutable std::mutex _mutex;
        std::condition_variable _cv;
        std::deque<task_t> _queue;
        std::vector<std::thread> _workers;
        CancellationToken _cancellation;
        bool _accepting{false};
        bool _stopping{false};
    };

    /**
     * Apply ``fn`` to every element of [first, last) on ``pool``. All elements run under one snapshot captured by the
     * caller. Waits for every element; the first failure, if any, is rethrown afterwards.
     */
    template<typename It, typename F>
    void parallel_for_each(TaskPool &pool, It first, It last, F fn) {
        const Snapshot snapshot = Snapshot::capture();
        std::vector<std::future<void>> futures;
        std::exception_ptr first_error;
        try {
            for (; first != last; ++first) {
                futures.push_back(pool.submit_with(snapshot, [&fn, item = &*first]() { fn(*item); }));
            }
        } catch (...) {
            // Submitted elements still refer to fn and the range, wait for them before reporting the failed submission
            first_error = std::current_exception();
        }
        for (auto &future : futures) {
            try {
                future.get();
            } catch (...) {
                if (!first_error) { first_error = std::current_exception(); }
            }
        }
        if (first_error) { std::rethrow_exception(first_error); }
    }

} // namespace dynscope

#endif // DYNSCOPE_RUNTIME_TASK_POOL_H
