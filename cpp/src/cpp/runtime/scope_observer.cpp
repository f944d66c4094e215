#include <dynscope/runtime/scope_observer.h>

#include <algorithm>
#include <atomic>
#include <mutex>

namespace dynscope {

    namespace {
        using observer_list = std::vector<ScopeObserver::s_ptr>;

        struct ObserverRegistry {
            std::mutex mutex;
            // Copy-on-write, notifications iterate a snapshot of the list without holding the lock
            std::shared_ptr<const observer_list> observers{std::make_shared<const observer_list>()};
            std::atomic<bool> any{false};
        };

        ObserverRegistry &registry() {
            static ObserverRegistry instance;
            return instance;
        }

        std::shared_ptr<const observer_list> observers_snapshot() {
            auto &r = registry();
            std::lock_guard<std::mutex> lock(r.mutex);
            return r.observers;
        }
    } // namespace

    void ScopeObservers::add_observer(ScopeObserver::s_ptr observer) {
        if (!observer) { return; }
        auto &r = registry();
        std::lock_guard<std::mutex> lock(r.mutex);
        auto updated = std::make_shared<observer_list>(*r.observers);
        updated->push_back(std::move(observer));
        r.observers = std::move(updated);
        r.any.store(true, std::memory_order_release);
    }

    void ScopeObservers::remove_observer(const ScopeObserver::s_ptr &observer) {
        auto &r = registry();
        std::lock_guard<std::mutex> lock(r.mutex);
        auto updated = std::make_shared<observer_list>(*r.observers);
        updated->erase(std::remove(updated->begin(), updated->end(), observer), updated->end());
        r.any.store(!updated->empty(), std::memory_order_release);
        r.observers = std::move(updated);
    }

    void ScopeObservers::clear() {
        auto &r = registry();
        std::lock_guard<std::mutex> lock(r.mutex);
        r.observers = std::make_shared<const observer_list>();
        r.any.store(false, std::memory_order_release);
    }

    bool ScopeObservers::has_observers() noexcept { return registry().any.load(std::memory_order_relaxed); }

    size_t ScopeObservers::observer_count() { return observers_snapshot()->size(); }

    void ScopeObservers::notify_enter(FrameTransition transition, const BindingFrame *frame, const BindingFrame *previous) {
        for (const auto &observer : *observers_snapshot()) { observer->on_enter_frame(transition, frame, previous); }
    }

    void ScopeObservers::notify_exit(FrameTransition transition, const BindingFrame *exited, const BindingFrame *restored) {
        for (const auto &observer : *observers_snapshot()) { observer->on_exit_frame(transition, exited, restored); }
    }

    void ScopeObservers::notify_capture(const BindingFrame *source, const BindingFrame *captured) {
        for (const auto &observer : *observers_snapshot()) { observer->on_capture(source, captured); }
    }

} // namespace dynscope
