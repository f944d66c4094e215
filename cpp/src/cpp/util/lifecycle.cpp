#include <dynscope/util/lifecycle.h>

#include <cstdio>
#include <exception>

namespace dynscope {
    bool ComponentLifeCycle::is_started() const { return _started; }

    bool ComponentLifeCycle::is_starting() const { return _transitioning && !_started; }

    bool ComponentLifeCycle::is_stopping() const { return _transitioning && _started; }

    struct TransitionGuard {
        explicit TransitionGuard(ComponentLifeCycle &component) : _component{component} { _component._transitioning = true; }
        ~TransitionGuard() { _component._transitioning = false; }

    private:
        ComponentLifeCycle &_component;
    };

    /*
     * NOTE the life-cycle methods are expected to be called from the owning thread, the guard clauses
     * only prevent accidental double starts/stops.
     */

    void start_component(ComponentLifeCycle &component) {
        if (component.is_started() || component.is_starting()) { return; }
        TransitionGuard guard{component};
        component.start();
        // If start throws the started flag is left false; the guard still clears the transition.
        component._started = true;
    }

    void stop_component(ComponentLifeCycle &component) {
        if (!component.is_started() || component.is_stopping()) { return; }
        TransitionGuard guard{component};
        component.stop();
        component._started = false;
    }

    StartStopContext::StartStopContext(ComponentLifeCycle &component) : _component{component} {
        start_component(_component);
    }

    StartStopContext::~StartStopContext() noexcept {
        try {
            stop_component(_component);
        } catch (const std::exception &e) {
            std::fprintf(stderr, "Warning: exception during stop_component: %s\n", e.what());
        } catch (...) {
            std::fprintf(stderr, "Warning: unknown exception during stop_component\n");
        }
    }
} // namespace dynscope
