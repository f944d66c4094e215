#ifndef DYNSCOPE_RUNTIME_SCOPE_OBSERVER_H
#define DYNSCOPE_RUNTIME_SCOPE_OBSERVER_H

#include <dynscope/scope/unit_state.h>

namespace dynscope {

    // ScopeObserver - externally managed observer of frame transitions on every execution unit.
    // Callbacks run on the unit making the transition, so implementations must be thread-safe.
    struct ScopeObserver {
        using ptr = ScopeObserver *;
        using s_ptr = scope_observer_s_ptr;

        virtual ~ScopeObserver() = default;

        // ``frame`` is about to become current, replacing ``previous`` (either may be null, the root)
        virtual void on_enter_frame(FrameTransition, const BindingFrame * /*frame*/, const BindingFrame * /*previous*/) {
        };

        // ``exited`` has stopped being current and ``restored`` is current again
        virtual void on_exit_frame(FrameTransition, const BindingFrame * /*exited*/, const BindingFrame * /*restored*/) {
        };

        // A snapshot of ``source`` was captured as ``captured``
        virtual void on_capture(const BindingFrame * /*source*/, const BindingFrame * /*captured*/) {
        };
    };

    /**
     * Process-wide registry of scope observers. With no observers registered the notification paths reduce to a
     * single relaxed atomic load.
     */
    class DYNSCOPE_EXPORT ScopeObservers {
    public:
        static void add_observer(ScopeObserver::s_ptr observer);

        static void remove_observer(const ScopeObserver::s_ptr &observer);

        static void clear();

        [[nodiscard]] static bool has_observers() noexcept;

        [[nodiscard]] static size_t observer_count();

        static void notify_enter(FrameTransition transition, const BindingFrame *frame, const BindingFrame *previous);

        static void notify_exit(FrameTransition transition, const BindingFrame *exited, const BindingFrame *restored);

        static void notify_capture(const BindingFrame *source, const BindingFrame *captured);
    };

} // namespace dynscope

#endif // DYNSCOPE_RUNTIME_SCOPE_OBSERVER_H
