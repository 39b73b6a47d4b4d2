#include <reactree/config.h>
#include <reactree/vdom/vnode.h>

namespace reactree {
    std::string_view to_string(VNodeKind kind) {
        switch (kind) {
            case VNodeKind::ELEMENT: return "element";
            case VNodeKind::TEXT: return "text";
            case VNodeKind::COMMENT: return "comment";
            case VNodeKind::COMPONENT: return "component";
            case VNodeKind::ASYNC_PLACEHOLDER: return "async-placeholder";
        }
        return "unknown";
    }

    std::string to_string(const VNodeKey &key) {
        return std::visit([](const auto &k) { return fmt::format("{}", k); }, key);
    }

    RemoveCallback::RemoveCallback(std::function<void()> on_complete, std::size_t listeners)
        : _state{std::make_shared<State>(State{listeners, std::move(on_complete)})} {}

    void RemoveCallback::operator()() const {
        if (_state->listeners == 0) { return; }
        if (--_state->listeners == 0 && _state->on_complete) { _state->on_complete(); }
    }

    void RemoveCallback::add_listeners(std::size_t count) const { _state->listeners += count; }

    std::size_t RemoveCallback::listeners() const { return _state->listeners; }

    bool VNodeHooks::any() const {
        return init || prepatch || create || insert || update || postpatch || remove || destroy;
    }

    bool VNodeData::needs_create_on_hydrate() const {
        return !style.empty() || !dom_props.empty() || !on.empty() || hook.any() || keep_alive || transition || pre;
    }

    namespace {
        ComponentInstance *&active_instance() {
            static ComponentInstance *instance{nullptr};
            return instance;
        }

        const ComponentInstance *&rendering_instance() {
            static const ComponentInstance *instance{nullptr};
            return instance;
        }
    } // namespace

    ComponentInstance *ComponentInstance::active() { return active_instance(); }

    const ComponentInstance *ComponentInstance::rendering() { return rendering_instance(); }

    ActiveInstanceScope::ActiveInstanceScope(ComponentInstance *instance) : _previous{active_instance()} {
        active_instance() = instance;
    }

    ActiveInstanceScope::~ActiveInstanceScope() { active_instance() = _previous; }

    RenderingInstanceScope::RenderingInstanceScope(const ComponentInstance *instance)
        : _previous{rendering_instance()} {
        rendering_instance() = instance;
    }

    RenderingInstanceScope::~RenderingInstanceScope() { rendering_instance() = _previous; }

    std::string VNode::to_string() const {
        switch (kind) {
            case VNodeKind::TEXT: return fmt::format("\"{}\"", text.value_or(""));
            case VNodeKind::COMMENT:
            case VNodeKind::ASYNC_PLACEHOLDER: return fmt::format("<!--{}-->", text.value_or(""));
            case VNodeKind::ELEMENT:
            case VNodeKind::COMPONENT: {
                auto key_text = key.has_value() ? fmt::format(" key={}", reactree::to_string(*key)) : std::string{};
                return fmt::format("<{}{}>", tag, key_text);
            }
        }
        return {};
    }

    vnode_s_ptr create_element_vnode(std::string tag, std::optional<VNodeData> data, VNodeList children) {
        auto vnode = std::make_shared<VNode>();
        vnode->kind = VNodeKind::ELEMENT;
        vnode->context = ComponentInstance::rendering();
        vnode->key = data.has_value() ? data->key : std::nullopt;
        vnode->data = std::move(data);
        vnode->children = std::make_shared<VNodeList>(std::move(children));
        if (auto ns = config().tag_namespace(tag); ns.has_value()) {
            vnode->tag = std::move(tag);
            apply_namespace(*vnode, std::move(ns));
        } else {
            vnode->tag = std::move(tag);
        }
        return vnode;
    }

    vnode_s_ptr create_text_element_vnode(std::string tag, std::optional<VNodeData> data, std::string text) {
        auto vnode = create_element_vnode(std::move(tag), std::move(data));
        vnode->children = nullptr;
        vnode->text = std::move(text);
        return vnode;
    }

    vnode_s_ptr create_text_vnode(std::string text) {
        auto vnode = std::make_shared<VNode>();
        vnode->kind = VNodeKind::TEXT;
        vnode->context = ComponentInstance::rendering();
        vnode->text = std::move(text);
        return vnode;
    }

    vnode_s_ptr create_comment_vnode(std::string text) {
        auto vnode = std::make_shared<VNode>();
        vnode->kind = VNodeKind::COMMENT;
        vnode->context = ComponentInstance::rendering();
        vnode->text = std::move(text);
        return vnode;
    }

    vnode_s_ptr create_empty_vnode(std::string text) { return create_comment_vnode(std::move(text)); }

    vnode_s_ptr create_async_placeholder(async_factory_s_ptr factory, std::optional<VNodeData> data) {
        auto vnode = std::make_shared<VNode>();
        vnode->kind = VNodeKind::ASYNC_PLACEHOLDER;
        vnode->context = ComponentInstance::rendering();
        vnode->text = std::string{};
        vnode->key = data.has_value() ? data->key : std::nullopt;
        vnode->data = std::move(data);
        vnode->async_factory = std::move(factory);
        return vnode;
    }

    vnode_s_ptr clone_vnode(const VNode &vnode) {
        auto cloned = std::make_shared<VNode>();
        cloned->kind = vnode.kind;
        cloned->tag = vnode.tag;
        cloned->ns = vnode.ns;
        cloned->data = vnode.data;
        // Copy the list so the clone can be patched without disturbing the original's siblings
        cloned->children = vnode.children ? std::make_shared<VNodeList>(*vnode.children) : nullptr;
        cloned->text = vnode.text;
        cloned->key = vnode.key;
        cloned->elm = vnode.elm;
        cloned->context = vnode.context;
        cloned->component_options = vnode.component_options;
        cloned->async_factory = vnode.async_factory;
        cloned->fn_scope_id = vnode.fn_scope_id;
        cloned->is_static = vnode.is_static;
        cloned->is_cloned = true;
        return cloned;
    }

    void apply_namespace(VNode &vnode, std::optional<std::string> ns, bool force) {
        vnode.ns = ns;
        if (vnode.tag == "foreignObject") {
            ns.reset();
            force = true;
        }
        if (!vnode.children) { return; }
        for (const auto &child : *vnode.children) {
            if (child && child->has_tag() && (!child->ns.has_value() || (force && child->tag != "svg"))) {
                apply_namespace(*child, ns, force);
            }
        }
    }
} // namespace reactree
