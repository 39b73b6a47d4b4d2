#include <reactree/config.h>
#include <reactree/runtime/component.h>
#include <reactree/runtime/evaluation_stack.h>
#include <reactree/util/diagnostics.h>
#include <reactree/util/errors.h>
#include <reactree/util/perf.h>

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <utility>

namespace reactree {
    namespace {
        std::uint64_t next_component_uid() {
            static std::atomic<std::uint64_t> counter{0};
            return counter++;
        }

        bool has_entries(const vnode_list_s_ptr &list) { return list != nullptr && !list->empty(); }
    } // namespace

    std::uint64_t next_component_definition_id() {
        static std::atomic<std::uint64_t> counter{0};
        return ++counter;
    }

    /**
     * The hooks installed on component placeholders, they create, update, insert and destroy the child component while
     * the owning component patches its tree.
     */
    struct PlaceholderHooks {
        static void init(VNode &vnode, bool hydrating) {
            if (vnode.component_instance != nullptr && vnode.data->keep_alive && !instance_of(vnode).is_destroyed()) {
                // Kept alive, treat as a patch of the placeholder onto itself
                prepatch(vnode, vnode);
                return;
            }
            auto *parent = dynamic_cast<Component *>(ComponentInstance::active());
            if (parent == nullptr) {
                throw_error<std::logic_error>("Component placeholder <{}> was patched outside of a component",
                                              vnode.tag);
            }
            const auto &options = options_of(vnode);
            auto child = Component::create(Component::Options{
                .definition = options.definition,
                .scheduler = parent->_scheduler,
                .patcher = parent->_patcher,
                .parent = parent,
                .parent_vnode = &vnode,
                .props_data = options.props_data,
                .render_children = options.children,
            });
            vnode.component_instance = child;
            child->mount(hydrating ? vnode.elm : NULL_NODE, hydrating);
        }

        static void prepatch(VNode &old_vnode, VNode &vnode) {
            vnode.component_instance = old_vnode.component_instance;
            const auto &options = options_of(vnode);
            instance_of(vnode).update_from_placeholder(options.props_data, vnode, options.children);
        }

        static void insert(VNode &vnode) {
            auto &child = instance_of(vnode);
            if (!child._is_mounted) {
                child._is_mounted = true;
                child.call_hook(&ComponentDefinition::mounted, "mounted");
            }
            if (!vnode.data->keep_alive) { return; }

            const auto *context = dynamic_cast<const Component *>(vnode.context);
            if (context != nullptr && context->is_mounted()) {
                // Activated once the flush completes, so a child activated by its parent's update sees the whole
                // tree updated
                child._inactive = false;
                child._scheduler->queue_activated([weak = child.weak_from_this()] {
                    if (auto component = weak.lock(); component != nullptr) {
                        component->_inactive = true;
                        component->activate(true);
                    }
                });
            } else {
                child.activate(true);
            }
        }

        static void destroy(VNode &vnode) {
            auto *child = dynamic_cast<Component *>(vnode.component_instance.get());
            if (child == nullptr || child->is_destroyed()) { return; }
            if (vnode.data->keep_alive) {
                child->deactivate(true);
            } else {
                child->destroy();
            }
        }

    private:
        static Component &instance_of(const VNode &vnode) {
            auto *component = dynamic_cast<Component *>(vnode.component_instance.get());
            if (component == nullptr) {
                throw_error<std::logic_error>("Component placeholder <{}> has no component instance", vnode.tag);
            }
            return *component;
        }

        static const VNodeComponentOptions &options_of(const VNode &vnode) {
            if (vnode.component_options == nullptr) {
                throw_error<std::logic_error>("Component placeholder <{}> has no component options", vnode.tag);
            }
            return *vnode.component_options;
        }
    };

    component_s_ptr Component::create(Scheduler &scheduler, Patcher &patcher, component_definition_s_ptr definition,
                                      object_s_ptr props_data) {
        return create(Options{
            .definition = std::move(definition),
            .scheduler = &scheduler,
            .patcher = &patcher,
            .props_data = std::move(props_data),
        });
    }

    component_s_ptr Component::create(Options options) {
        if (!options.definition) { throw std::invalid_argument("A component requires a definition"); }
        if (options.scheduler == nullptr || options.patcher == nullptr) {
            throw_error<std::invalid_argument>("Component <{}> requires a scheduler and a patcher",
                                               options.definition->name);
        }
        // Not make_shared, the constructor is not public
        auto component = component_s_ptr{new Component(std::move(options))};
        initialise_component(*component);
        return component;
    }

    Component::Component(Options options)
        : _definition{std::move(options.definition)}, _scheduler{options.scheduler}, _patcher{options.patcher},
          _parent{options.parent}, _parent_vnode{options.parent_vnode}, _props_data{std::move(options.props_data)},
          _render_children{std::move(options.render_children)}, _uid{next_component_uid()} {}

    Component::~Component() {
        teardown_watchers();
        for (auto *child : _children) { child->_parent = nullptr; }
        if (_parent != nullptr) { std::erase(_parent->_children, this); }
    }

    void Component::mount(NodeHandle el, bool hydrating) {
        _mount_target = el;
        _hydrating = hydrating;
        start_component(*this);
    }

    void Component::destroy() { dispose_component(*this); }

    void Component::force_update() {
        if (_watcher) { _watcher->invalidate(); }
    }

    void Component::next_tick(std::function<void()> fn) { _scheduler->tick_host().run_before_next_render(std::move(fn)); }

    watcher_s_ptr Component::watch(std::string_view expression, Watcher::callback_type callback, WatchOptions options) {
        auto watcher = reactree::watch(*_scheduler, Value{_data}, expression, std::move(callback), std::move(options));
        _watchers.push_back(watcher);
        return watcher;
    }

    watcher_s_ptr Component::watch(Watcher::getter_type getter, Watcher::callback_type callback, WatchOptions options) {
        auto watcher = reactree::watch(*_scheduler, std::move(getter), std::move(callback), std::move(options));
        _watchers.push_back(watcher);
        return watcher;
    }

    Value Component::computed(std::string_view name) const {
        auto it = _computed.find(name);
        if (it == _computed.end()) {
            throw_error<std::out_of_range>("Unknown computed property \"{}\" on {}", name, perf_name());
        }
        return it->second->get();
    }

    Value Component::prop(std::string_view name) const { return _props->get(name); }

    Value Component::get(std::string_view name) const {
        if (_props->has(name)) { return _props->get(name); }
        if (auto it = _computed.find(name); it != _computed.end()) { return it->second->get(); }
        return _data->get(name);
    }

    void Component::set(std::string_view name, Value value) {
        if (_props->has(name)) {
            warn("Avoid mutating a prop directly since the value will be overwritten whenever the parent component "
                 "re-renders. Prop being mutated: \"{}\"", name);
        }
        _data->put(name, std::move(value));
    }

    Component &Component::root() {
        auto *current = this;
        while (current->_parent != nullptr) { current = current->_parent; }
        return *current;
    }

    void Component::activate(bool direct) {
        if (direct) {
            _direct_inactive = false;
            if (is_in_inactive_tree()) { return; }
        } else if (_direct_inactive) {
            return;
        }
        if (!_inactive.has_value() || *_inactive) {
            _inactive = false;
            for (auto *child : std::vector<component_ptr>{_children}) { child->activate(false); }
            call_hook(&ComponentDefinition::activated, "activated");
        }
    }

    void Component::deactivate(bool direct) {
        if (direct) {
            _direct_inactive = true;
            if (is_in_inactive_tree()) { return; }
        }
        if (!_inactive.value_or(false)) {
            _inactive = true;
            for (auto *child : std::vector<component_ptr>{_children}) { child->deactivate(false); }
            call_hook(&ComponentDefinition::deactivated, "deactivated");
        }
    }

    void Component::initialise() {
        bool performance = config().performance;
        auto start_tag = fmt::format("reactree-perf-start:{}", _uid);
        auto end_tag = fmt::format("reactree-perf-end:{}", _uid);
        if (performance) { mark(start_tag); }

        if (_parent != nullptr) { _parent->_children.push_back(this); }
        init_props();
        init_data();
        init_computed();
        init_watch();
        call_hook(&ComponentDefinition::created, "created");

        if (performance) {
            mark(end_tag);
            measure(fmt::format("reactree {} init", perf_name()), start_tag, end_tag);
        }
    }

    void Component::start() {
        if (_is_mounted) {
            activate(true);
        } else {
            mount_component();
        }
    }

    void Component::stop() { deactivate(true); }

    void Component::dispose() {
        if (_is_being_destroyed) { return; }
        call_hook(&ComponentDefinition::before_destroy, "beforeDestroy");
        _is_being_destroyed = true;

        if (_parent != nullptr) {
            std::erase(_parent->_children, this);
            _parent = nullptr;
        }
        teardown_watchers();
        if (auto interceptor = _data ? _data->interceptor() : nullptr; interceptor != nullptr) {
            interceptor->release_root();
        }
        _is_destroyed = true;
        // Runs the destroy hooks of the rendered tree, which destroys the child components
        _patcher->patch(_vnode, nullptr);
        call_hook(&ComponentDefinition::destroyed, "destroyed");
    }

    void Component::update_from_placeholder(const object_s_ptr &props_data, VNode &parent_vnode,
                                            const vnode_list_s_ptr &render_children) {
        // Slot content can not be compared, any slot content forces a re-render
        bool needs_force_update = has_entries(render_children) || has_entries(_render_children);

        _parent_vnode = &parent_vnode;
        if (_vnode) { _vnode->parent = &parent_vnode; }
        _render_children = render_children;

        if (props_data && !_definition->props.empty()) {
            ObservingScope observing{false};
            for (const auto &key : _definition->props) { _props->put(key, props_data->peek(key)); }
            _props_data = props_data;
        }

        if (needs_force_update) { force_update(); }
    }

    void Component::call_hook(ComponentDefinition::hook_type ComponentDefinition::*hook, std::string_view hook_name) {
        const auto &fn = (*_definition).*hook;
        if (!fn) { return; }
        UntrackedScope untracked;
        invoke_with_error_handling(fmt::format("{} hook", hook_name), fn, *this);
    }

    void Component::init_props() {
        _props = Object::make();
        // Values passed down by a parent are already observed (or deliberately not) by the parent
        std::optional<ObservingScope> observing;
        if (_parent != nullptr) { observing.emplace(false); }
        for (const auto &key : _definition->props) {
            Interceptor::define_reactive(*_props, key, _props_data ? _props_data->peek(key) : Value{});
        }
    }

    void Component::init_data() {
        if (_definition->data) {
            UntrackedScope untracked;
            try {
                _data = _definition->data();
            } catch (...) {
                handle_error(std::current_exception(), "data()");
            }
        }
        if (!_data) {
            if (_definition->data) { warn("data functions should return an object, in {}", perf_name()); }
            _data = Object::make();
        }
        for (const auto &key : _data->keys()) {
            if (_props->has(key)) {
                warn("The data property \"{}\" is already declared as a prop. Use prop default value instead.", key);
            }
        }
        Interceptor::instrument(Value{_data}, true);
    }

    void Component::init_computed() {
        for (const auto &definition : _definition->computed) {
            if (!definition.getter) {
                warn("Getter is missing for computed property \"{}\".", definition.name);
                continue;
            }
            if (_data->has(definition.name)) {
                warn("The computed property \"{}\" is already defined in data.", definition.name);
                continue;
            }
            if (_props->has(definition.name)) {
                warn("The computed property \"{}\" is already defined as a prop.", definition.name);
                continue;
            }
            auto getter = [this, fn = definition.getter] { return fn(*this); };
            _computed.insert_or_assign(definition.name, Computed::make(*_scheduler, std::move(getter), definition.name));
        }
    }

    void Component::init_watch() {
        for (const auto &definition : _definition->watch) {
            Watcher::callback_type callback;
            if (definition.callback) {
                callback = [this, fn = definition.callback](const Value &new_value, const Value &old_value) {
                    fn(*this, new_value, old_value);
                };
            }
            WatchOptions options{
                .deep = definition.deep,
                .immediate = definition.immediate,
                .sync = definition.sync,
                .expression = definition.expression,
            };
            if (definition.getter) {
                watch([this, fn = definition.getter] { return fn(*this); }, std::move(callback), std::move(options));
            } else {
                watch(std::string_view{definition.expression}, std::move(callback), std::move(options));
            }
        }
    }

    void Component::mount_component() {
        _el = _mount_target;
        if (!_definition->render) {
            warn("Failed to mount component {}: render function not defined.", perf_name());
        }
        call_hook(&ComponentDefinition::before_mount, "beforeMount");

        auto getter = [this]() -> Value {
            bool hydrating = std::exchange(_hydrating, false);
            if (!config().performance) {
                update(render(), hydrating);
                return {};
            }
            auto name = perf_name();
            auto start_tag = fmt::format("reactree-perf-start:{}", _uid);
            auto end_tag = fmt::format("reactree-perf-end:{}", _uid);
            mark(start_tag);
            auto vnode = render();
            mark(end_tag);
            measure(fmt::format("reactree {} render", name), start_tag, end_tag);
            mark(start_tag);
            update(vnode, hydrating);
            mark(end_tag);
            measure(fmt::format("reactree {} patch", name), start_tag, end_tag);
            return {};
        };
        WatcherOptions options{
            .render = true,
            .before =
                [this] {
                    if (_is_mounted && !_is_destroyed) { call_hook(&ComponentDefinition::before_update, "beforeUpdate"); }
                },
            .after =
                [this] {
                    if (_is_mounted && !_is_destroyed) { call_hook(&ComponentDefinition::updated, "updated"); }
                },
            .expression = fmt::format("render of {}", perf_name()),
        };
        _watcher = Watcher::create(*_scheduler, std::move(getter), {}, std::move(options));

        // Child components are marked mounted by their placeholder's insert hook
        if (_parent_vnode == nullptr) {
            _is_mounted = true;
            call_hook(&ComponentDefinition::mounted, "mounted");
        }
    }

    vnode_s_ptr Component::render() {
        vnode_s_ptr vnode;
        {
            RenderingInstanceScope rendering{this};
            try {
                if (_definition->render) { vnode = _definition->render(*this); }
            } catch (...) {
                auto error = std::current_exception();
                handle_error(error, "render");
                // Keep the previous tree unless an error render is available
                vnode = _vnode;
                if (_definition->render_error) {
                    try {
                        vnode = _definition->render_error(*this, error);
                    } catch (...) {
                        handle_error(std::current_exception(), "renderError");
                        vnode = _vnode;
                    }
                }
            }
        }
        if (!vnode) { vnode = create_empty_vnode(); }
        vnode->parent = _parent_vnode;
        return vnode;
    }

    void Component::update(const vnode_s_ptr &vnode, bool hydrating) {
        auto previous = _vnode;
        ActiveInstanceScope active{this};
        _vnode = vnode;
        if (!previous) {
            _el = _patcher->patch(_el, vnode, hydrating, false);
        } else {
            _el = _patcher->patch(previous, vnode);
        }
        // A parent whose root is this component shares its root element
        if (_parent != nullptr && _parent_vnode != nullptr && _parent_vnode == _parent->_vnode.get()) {
            _parent->_el = _el;
        }
    }

    bool Component::is_in_inactive_tree() const {
        for (auto *ancestor = _parent; ancestor != nullptr; ancestor = ancestor->_parent) {
            if (ancestor->_inactive.value_or(false)) { return true; }
        }
        return false;
    }

    void Component::teardown_watchers() {
        if (_watcher) { _watcher->teardown(); }
        for (const auto &watcher : _watchers) { watcher->teardown(); }
        for (const auto &[name, computed] : _computed) { computed->teardown(); }
    }

    std::string Component::perf_name() const {
        if (_parent == nullptr && _parent_vnode == nullptr) { return "<Root>"; }
        return _definition->name.empty() ? std::string{"<Anonymous>"} : fmt::format("<{}>", _definition->name);
    }

    vnode_s_ptr create_component_vnode(component_definition_s_ptr definition, object_s_ptr props_data,
                                       std::optional<VNodeKey> key, VNodeList children) {
        if (!definition) { throw std::invalid_argument("A component placeholder requires a definition"); }

        auto vnode = std::make_shared<VNode>();
        vnode->kind = VNodeKind::COMPONENT;
        vnode->tag = definition->name.empty()
                         ? fmt::format("{}-{}", COMPONENT_TAG_PREFIX, definition->cid)
                         : fmt::format("{}-{}-{}", COMPONENT_TAG_PREFIX, definition->cid, definition->name);
        vnode->key = key;

        VNodeData data;
        data.key = std::move(key);
        data.hook.init = &PlaceholderHooks::init;
        data.hook.prepatch = &PlaceholderHooks::prepatch;
        data.hook.insert = &PlaceholderHooks::insert;
        data.hook.destroy = &PlaceholderHooks::destroy;
        vnode->data = std::move(data);
        vnode->context = ComponentInstance::rendering();

        auto name = definition->name;
        vnode->component_options = std::make_shared<VNodeComponentOptions>(VNodeComponentOptions{
            .definition = std::move(definition),
            .props_data = std::move(props_data),
            .children = children.empty() ? nullptr : std::make_shared<VNodeList>(std::move(children)),
            .tag = std::move(name),
        });
        return vnode;
    }
} // namespace reactree
