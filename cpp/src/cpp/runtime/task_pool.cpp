#include <dynscope/runtime/task_pool.h>

#include <cstdio>

namespace dynscope {

    TaskPool::TaskPool(size_t worker_count) : _worker_count{worker_count == 0 ? 1 : worker_count} {}

    TaskPool::~TaskPool() {
        try {
            stop_component(*this);
        } catch (const std::exception &e) {
            std::fprintf(stderr, "Warning: exception stopping TaskPool: %s\n", e.what());
        } catch (...) {
            std::fprintf(stderr, "Warning: unknown exception stopping TaskPool\n");
        }
    }

    size_t TaskPool::pending() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _queue.size();
    }

    CancellationToken TaskPool::cancellation() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _cancellation;
    }

    void TaskPool::start() {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _cancellation = CancellationToken{};
            _stopping = false;
            _accepting = true;
        }
        _workers.reserve(_worker_count);
        for (size_t i = 0; i < _worker_count; ++i) { _workers.emplace_back([this] { worker_loop(); }); }
    }

    void TaskPool::stop() {
        std::deque<task_t> abandoned;
        CancellationToken token;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _accepting = false;
            _stopping = true;
            _cancellation.request_cancel();
            token = _cancellation;
            abandoned.swap(_queue);
        }
        _cv.notify_all();
        for (auto &worker : _workers) {
            if (worker.joinable()) { worker.join(); }
        }
        _workers.clear();
        for (auto &task : abandoned) { task(token, true); }
    }

    void TaskPool::enqueue(task_t task) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (!_accepting) { throw_error<DynscopeError>("TaskPool is not started"); }
            _queue.push_back(std::move(task));
        }
        _cv.notify_one();
    }

    void TaskPool::worker_loop() {
        for (;;) {
            task_t task;
            CancellationToken token;
            {
                std::unique_lock<std::mutex> lock(_mutex);
                _cv.wait(lock, [this] { return _stopping || !_queue.empty(); });
                if (_stopping) { return; }
                task = std::move(_queue.front());
                _queue.pop_front();
                token = _cancellation;
            }
            task(token, false);
        }
    }

} // namespace dynscope
