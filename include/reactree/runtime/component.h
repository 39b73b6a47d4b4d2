#ifndef REACTREE_COMPONENT_H
#define REACTREE_COMPONENT_H

#include <reactree/runtime/computed.h>
#include <reactree/runtime/scheduler.h>
#include <reactree/types/interceptor.h>
#include <reactree/util/lifecycle.h>
#include <reactree/util/string_hash.h>
#include <reactree/vdom/patch.h>

#include <exception>
#include <functional>
#include <vector>

namespace reactree {
    REACTREE_EXPORT std::uint64_t next_component_definition_id();

    struct PlaceholderHooks;

    /**
     * The resolved options of a component type.
     */
    struct REACTREE_EXPORT ComponentDefinition {
        using data_factory_type = std::function<object_s_ptr()>;
        using render_type = std::function<vnode_s_ptr(Component &component)>;
        using render_error_type = std::function<vnode_s_ptr(Component &component, const std::exception_ptr &error)>;
        using hook_type = std::function<void(Component &component)>;
        using computed_type = std::function<Value(Component &component)>;
        using watch_callback_type =
            std::function<void(Component &component, const Value &new_value, const Value &old_value)>;

        struct ComputedDefinition {
            std::string name;
            computed_type getter;
        };

        struct WatchDefinition {
            // A dot-delimited path into the component data, or the label of getter when one is supplied
            std::string expression;
            watch_callback_type callback;
            computed_type getter;
            bool deep{false};
            bool immediate{false};
            bool sync{false};
        };

        std::string name;
        std::vector<std::string> props;
        // Returns the root data object of a new instance
        data_factory_type data;
        std::vector<ComputedDefinition> computed;
        std::vector<WatchDefinition> watch;
        render_type render;
        // Renders in place of render when render raised
        render_error_type render_error;
        // Style scope applied to every host element rendered by the component
        std::optional<std::string> scope_id;

        hook_type created;
        hook_type before_mount;
        hook_type mounted;
        hook_type before_update;
        hook_type updated;
        hook_type activated;
        hook_type deactivated;
        hook_type before_destroy;
        hook_type destroyed;

        // Distinguishes definitions sharing a name in placeholder tags
        std::uint64_t cid{next_component_definition_id()};
    };

    /**
     * A live component: reactive state, a render watcher and the render tree it retains.
     *
     * initialise sets up props, data, computed values and watchers; start mounts (or re-activates a stopped
     * component); stop deactivates; dispose destroys. Re-rendering is driven by the render watcher through the
     * scheduler, every patch goes through the shared Patcher.
     *
     * Child components are created by the hooks of the placeholders returned from create_component_vnode, and owned by
     * those placeholders.
     */
    class REACTREE_EXPORT Component : public ComponentLifeCycle,
                                      public ComponentInstance,
                                      public std::enable_shared_from_this<Component> {
    public:
        struct Options {
            component_definition_s_ptr definition;
            Scheduler *scheduler{nullptr};
            Patcher *patcher{nullptr};
            Component *parent{nullptr};
            // The placeholder this component renders for, nullptr for a root component
            vnode_ptr parent_vnode{nullptr};
            object_s_ptr props_data;
            vnode_list_s_ptr render_children;
        };

        /**
         * Create and initialise a root component.
         */
        static component_s_ptr create(Scheduler &scheduler, Patcher &patcher, component_definition_s_ptr definition,
                                      object_s_ptr props_data = {});

        /**
         * Create and initialise a component from fully specified options.
         */
        static component_s_ptr create(Options options);

        Component(const Component &) = delete;

        Component &operator=(const Component &) = delete;

        ~Component() override;

        /**
         * Mount the component, replacing el (or hydrating it) when supplied, otherwise rendering a detached tree.
         */
        void mount(NodeHandle el = NULL_NODE, bool hydrating = false);

        /**
         * Destroy the component.
         */
        void destroy();

        /**
         * Schedule a re-render.
         */
        void force_update();

        /**
         * Run fn once the scheduler's tick host next runs its pending callbacks.
         */
        void next_tick(std::function<void()> fn);

        /**
         * Watch a dot-delimited path into the component data, the watcher is torn down with the component.
         */
        watcher_s_ptr watch(std::string_view expression, Watcher::callback_type callback, WatchOptions options = {});

        watcher_s_ptr watch(Watcher::getter_type getter, Watcher::callback_type callback, WatchOptions options = {});

        /**
         * The value of a computed property, throws std::out_of_range for unknown names.
         */
        [[nodiscard]] Value computed(std::string_view name) const;

        [[nodiscard]] Value prop(std::string_view name) const;

        /**
         * Look up name in props, then computed values, then data.
         */
        [[nodiscard]] Value get(std::string_view name) const;

        /**
         * Write a data property through the reactive path.
         */
        void set(std::string_view name, Value value);

        [[nodiscard]] const object_s_ptr &data() const { return _data; }

        [[nodiscard]] const object_s_ptr &props() const { return _props; }

        [[nodiscard]] const ComponentDefinition &definition() const { return *_definition; }

        [[nodiscard]] const std::string &name() const { return _definition->name; }

        [[nodiscard]] std::uint64_t uid() const { return _uid; }

        [[nodiscard]] Component *parent() const { return _parent; }

        [[nodiscard]] const std::vector<component_ptr> &children() const { return _children; }

        [[nodiscard]] Component &root();

        [[nodiscard]] vnode_ptr parent_vnode() const { return _parent_vnode; }

        /**
         * Children passed to the component by its placeholder (slot content).
         */
        [[nodiscard]] const vnode_list_s_ptr &render_children() const { return _render_children; }

        [[nodiscard]] const watcher_s_ptr &render_watcher() const { return _watcher; }

        [[nodiscard]] Scheduler &scheduler() const { return *_scheduler; }

        [[nodiscard]] Patcher &patcher() const { return *_patcher; }

        [[nodiscard]] bool is_mounted() const { return _is_mounted; }

        [[nodiscard]] bool is_being_destroyed() const { return _is_being_destroyed; }

        [[nodiscard]] bool is_destroyed() const { return _is_destroyed; }

        [[nodiscard]] bool is_inactive() const { return _inactive.value_or(false); }

        [[nodiscard]] NodeHandle root_element() const override { return _el; }

        [[nodiscard]] vnode_ptr root_vnode() const override { return _vnode.get(); }

        [[nodiscard]] const std::optional<std::string> &scope_id() const override { return _definition->scope_id; }

        /**
         * Re-activate a deactivated (kept-alive) component. When direct is false the call comes from an ancestor.
         */
        void activate(bool direct);

        /**
         * Deactivate a kept-alive component. When direct is false the call comes from an ancestor.
         */
        void deactivate(bool direct);

    protected:
        explicit Component(Options options);

        void initialise() override;

        void start() override;

        void stop() override;

        void dispose() override;

    private:
        friend struct PlaceholderHooks;

        /**
         * Apply new props and slot content from an updated placeholder.
         */
        void update_from_placeholder(const object_s_ptr &props_data, VNode &parent_vnode,
                                     const vnode_list_s_ptr &render_children);

        /**
         * Runs a hook of the definition with dependency collection suspended, reporting errors through handle_error.
         */
        void call_hook(ComponentDefinition::hook_type ComponentDefinition::*hook, std::string_view hook_name);

        void init_props();

        void init_data();

        void init_computed();

        void init_watch();

        void mount_component();

        vnode_s_ptr render();

        void update(const vnode_s_ptr &vnode, bool hydrating);

        [[nodiscard]] bool is_in_inactive_tree() const;

        void teardown_watchers();

        [[nodiscard]] std::string perf_name() const;

        component_definition_s_ptr _definition;
        Scheduler *_scheduler;
        Patcher *_patcher;
        Component *_parent;
        vnode_ptr _parent_vnode;
        object_s_ptr _props_data;
        vnode_list_s_ptr _render_children;
        std::uint64_t _uid;

        object_s_ptr _props;
        object_s_ptr _data;
        string_map<computed_s_ptr> _computed;
        std::vector<watcher_s_ptr> _watchers;
        watcher_s_ptr _watcher;

        std::vector<component_ptr> _children;
        vnode_s_ptr _vnode;
        NodeHandle _el;
        NodeHandle _mount_target;
        bool _hydrating{false};

        bool _is_mounted{false};
        bool _is_being_destroyed{false};
        bool _is_destroyed{false};
        // Unset until the component is first activated or deactivated
        std::optional<bool> _inactive;
        bool _direct_inactive{false};
    };

    /**
     * A placeholder node for a child component of definition. The child is created, updated, inserted and destroyed
     * by the placeholder's hooks while the surrounding component patches its tree.
     */
    REACTREE_EXPORT vnode_s_ptr create_component_vnode(component_definition_s_ptr definition,
                                                       object_s_ptr props_data = {},
                                                       std::optional<VNodeKey> key = std::nullopt,
                                                       VNodeList children = {});
} // namespace reactree

#endif  // REACTREE_COMPONENT_H
