#include <dynscope/scope/unit_state.h>
#include <dynscope/runtime/scope_observer.h>

#include <cstdio>
#include <exception>

namespace dynscope {

    std::string_view to_string(FrameTransition transition) {
        switch (transition) {
            case FrameTransition::PUSH: return "PUSH";
            case FrameTransition::SNAPSHOT: return "SNAPSHOT";
            case FrameTransition::CONTINUATION: return "CONTINUATION";
        }
        return "UNKNOWN";
    }

    bool ResolutionCache::lookup(uint64_t epoch, uint64_t key_id, const Value *&value) noexcept {
        if (epoch != _epoch) {
            reset_to(epoch);
            ++_misses;
            return false;
        }
        const Entry &entry = _entries[key_id & (SLOTS - 1)];
        if (entry.key_id != key_id) {
            ++_misses;
            return false;
        }
        ++_hits;
        value = entry.value;
        return true;
    }

    void ResolutionCache::store(uint64_t epoch, uint64_t key_id, const Value *value) noexcept {
        if (epoch != _epoch) { reset_to(epoch); }
        _entries[key_id & (SLOTS - 1)] = Entry{key_id, value};
    }

    void ResolutionCache::clear() noexcept { _entries.fill(Entry{}); }

    void ResolutionCache::reset_to(uint64_t epoch) noexcept {
        clear();
        _epoch = epoch;
    }

    ExecutionUnitState &ExecutionUnitState::current() noexcept {
        thread_local ExecutionUnitState state;
        return state;
    }

    BindingFrame::ptr ExecutionUnitState::install(BindingFrame::ptr frame, FrameTransition transition) {
        // Observers see the transition before it happens, a throwing observer leaves the unit untouched
        if (ScopeObservers::has_observers()) { ScopeObservers::notify_enter(transition, frame.get(), _frame.get()); }
        BindingFrame::ptr previous = std::exchange(_frame, std::move(frame));
        ++_epoch;
        return previous;
    }

    void ExecutionUnitState::restore(BindingFrame::ptr previous, FrameTransition transition) noexcept {
        BindingFrame::ptr exited = std::exchange(_frame, std::move(previous));
        ++_epoch;
        if (ScopeObservers::has_observers()) {
            try {
                ScopeObservers::notify_exit(transition, exited.get(), _frame.get());
            } catch (const std::exception &e) {
                std::fprintf(stderr, "Warning: exception in scope observer during restore: %s\n", e.what());
            } catch (...) {
                std::fprintf(stderr, "Warning: unknown exception in scope observer during restore\n");
            }
        }
    }

} // namespace dynscope
