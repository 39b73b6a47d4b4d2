#include <reactree/util/lifecycle.h>

namespace reactree {
    /**
     * Raises the transition flag for the duration of a life-cycle call. The target state is only set once the call
     * returns, a call that throws leaves the component where it was.
     */
    struct ComponentLifeCycle::Transition {
        explicit Transition(bool &in_transition) : _in_transition{in_transition} { _in_transition = true; }

        ~Transition() { _in_transition = false; }

        Transition(const Transition &) = delete;

        Transition &operator=(const Transition &) = delete;

    private:
        bool &_in_transition;
    };

    void initialise_component(ComponentLifeCycle &component) {
        if (component._disposed || component._initialised || component._initialise_transition) { return; }
        ComponentLifeCycle::Transition transition{component._initialise_transition};
        component.initialise();
        component._initialised = true;
    }

    void start_component(ComponentLifeCycle &component) {
        if (component._disposed || component._started || component._start_transition) { return; }
        initialise_component(component);
        ComponentLifeCycle::Transition transition{component._start_transition};
        component.start();
        component._started = true;
    }

    void stop_component(ComponentLifeCycle &component) {
        if (!component._started || component._start_transition) { return; }
        ComponentLifeCycle::Transition transition{component._start_transition};
        component.stop();
        component._started = false;
    }

    void dispose_component(ComponentLifeCycle &component) {
        if (!component._initialised || component._initialise_transition) { return; }
        ComponentLifeCycle::Transition transition{component._initialise_transition};
        component.dispose();
        component._initialised = false;
        component._started = false;
        component._disposed = true;
    }
} // namespace reactree
