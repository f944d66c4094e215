//
// Component life-cycle used by the long-lived runtime collaborators (worker pools, etc.).
//

#ifndef DYNSCOPE_LIFECYCLE_H
#define DYNSCOPE_LIFECYCLE_H

#include <dynscope/dynscope_base.h>

namespace dynscope {
    struct ComponentLifeCycle;

    void DYNSCOPE_EXPORT start_component(ComponentLifeCycle &component);

    void DYNSCOPE_EXPORT stop_component(ComponentLifeCycle &component);

    struct TransitionGuard;

    /**
     * Starts the component in the constructor and stops it in the destructor.
     * Call stop_component explicitly first if a failure to stop must propagate.
     */
    struct DYNSCOPE_EXPORT StartStopContext {
        explicit StartStopContext(ComponentLifeCycle &component);

        ~StartStopContext() noexcept;
    private:
        ComponentLifeCycle &_component;
    };


    /**
     * The life-cycle and associated method calls are as follows:
     *
     * * The component is constructed, additional properties may be set after this.
     *
     * * start is called prior to normal operation, for a worker pool this is where threads are created.
     *
     * * stop is called once normal operation is expected to cease, threads are joined here.
     *
     * * The component is destroyed, a component still started is stopped first.
     *
     * NOTE: start and stop may be called numerous times during the life-time of the component. The component must be
     *       able to start again cleanly after stop.
     */
    struct DYNSCOPE_EXPORT ComponentLifeCycle {
        virtual ~ComponentLifeCycle() = default;

        /**
         * The component is started (true) or stopped (false).
         * By default, this is stopped.
         */
        [[nodiscard]] bool is_started() const;

        /**
         * The component is in the process of starting.
         */
        [[nodiscard]] bool is_starting() const;

        /**
         * The component is in the process of stopping.
         */
        [[nodiscard]] bool is_stopping() const;

    protected:
        /**
         * Acquire whatever is needed for normal operation. is_started becomes true once this returns.
         */
        virtual void start() = 0;

        /**
         * Halt the activities of the component. is_started becomes false once this returns.
         */
        virtual void stop() = 0;

    private:
        bool _started{false};
        bool _transitioning{false};

        friend TransitionGuard;

        friend void start_component(ComponentLifeCycle &component);

        friend void stop_component(ComponentLifeCycle &component);
    };
}

#endif //DYNSCOPE_LIFECYCLE_H
