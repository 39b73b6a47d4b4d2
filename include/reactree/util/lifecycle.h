#ifndef REACTREE_LIFECYCLE_H
#define REACTREE_LIFECYCLE_H

#include <reactree/reactree_base.h>

namespace reactree {
    struct ComponentLifeCycle;

    /**
     * Drive a component through its life-cycle. Each call is a no-op when the component is already in (or moving to)
     * the requested state, and initialise / start are no-ops once the component has been disposed.
     */
    REACTREE_EXPORT void initialise_component(ComponentLifeCycle &component);

    /**
     * Starts the component, initialising it first when required.
     */
    REACTREE_EXPORT void start_component(ComponentLifeCycle &component);

    REACTREE_EXPORT void stop_component(ComponentLifeCycle &component);

    /**
     * Disposes the component. A started component is not stopped first; dispose is expected to release everything
     * start acquired.
     */
    REACTREE_EXPORT void dispose_component(ComponentLifeCycle &component);

    /**
     * The life-cycle of a component:
     *
     * * initialise is called once, after construction, to set up state.
     *
     * * start brings the component into operation (for a UI component: mounting it). start and stop can alternate
     *   any number of times, a component must be able to start again cleanly after stop.
     *
     * * stop suspends operation without releasing resources.
     *
     * * dispose is called once, at the end of the life of the component, and releases everything it holds. A disposed
     *   component can not be initialised or started again.
     *
     * The transition flags are updated on exit from the call, also when the call throws.
     */
    struct REACTREE_EXPORT ComponentLifeCycle {
        virtual ~ComponentLifeCycle() = default;

        [[nodiscard]] bool is_initialised() const { return _initialised; }

        [[nodiscard]] bool is_initialising() const { return _initialise_transition && !_initialised; }

        [[nodiscard]] bool is_disposing() const { return _initialise_transition && _initialised; }

        [[nodiscard]] bool is_disposed() const { return _disposed; }

        [[nodiscard]] bool is_started() const { return _started; }

        [[nodiscard]] bool is_starting() const { return _start_transition && !_started; }

        [[nodiscard]] bool is_stopping() const { return _start_transition && _started; }

    protected:
        virtual void initialise() = 0;

        virtual void start() = 0;

        virtual void stop() = 0;

        virtual void dispose() = 0;

    private:
        struct Transition;

        bool _initialised{false};
        bool _disposed{false};
        bool _started{false};
        bool _initialise_transition{false};
        bool _start_transition{false};

        friend void initialise_component(ComponentLifeCycle &component);

        friend void start_component(ComponentLifeCycle &component);

        friend void stop_component(ComponentLifeCycle &component);

        friend void dispose_component(ComponentLifeCycle &component);
    };
} // namespace reactree

#endif  // REACTREE_LIFECYCLE_H
