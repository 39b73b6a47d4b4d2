#include <reactree/config.h>
#include <reactree/util/diagnostics.h>
#include <reactree/vdom/patch.h>

#include <ankerl/unordered_dense.h>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace reactree {
    namespace {
        struct VNodeKeyHash {
            std::uint64_t operator()(const VNodeKey &key) const noexcept {
                return std::visit(
                    [](const auto &k) -> std::uint64_t {
                        return ankerl::unordered_dense::hash<std::decay_t<decltype(k)>>{}(k);
                    },
                    key);
            }
        };

        using key_index_type = ankerl::unordered_dense::map<VNodeKey, std::ptrdiff_t, VNodeKeyHash>;

        bool is_text_input_type(const std::optional<std::string> &type) {
            if (!type.has_value()) { return false; }
            static constexpr std::string_view text_types[]{"text", "number", "password", "search", "email", "tel", "url"};
            return std::ranges::find(text_types, *type) != std::end(text_types);
        }

        std::optional<std::string> input_type(const VNode &vnode) {
            if (!vnode.data.has_value()) { return std::nullopt; }
            auto it = vnode.data->attrs.find("type");
            if (it == vnode.data->attrs.end()) { return std::nullopt; }
            return it->second;
        }

        bool same_input_type(const VNode &a, const VNode &b) {
            if (a.tag != "input") { return true; }
            auto type_a = input_type(a);
            auto type_b = input_type(b);
            return type_a == type_b || (is_text_input_type(type_a) && is_text_input_type(type_b));
        }

        key_index_type create_key_to_old_idx(const VNodeList &children, std::ptrdiff_t begin, std::ptrdiff_t end) {
            key_index_type index;
            for (auto i = begin; i <= end; ++i) {
                const auto &child = children[i];
                // First occurrence wins for duplicate keys
                if (child && child->key.has_value()) { index.emplace(*child->key, i); }
            }
            return index;
        }

        std::string to_lower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        vnode_s_ptr child_at(const VNodeList &list, std::ptrdiff_t index) {
            if (index < 0 || index >= static_cast<std::ptrdiff_t>(list.size())) { return nullptr; }
            return list[index];
        }
    } // namespace

    Patcher::Patcher(NodeOps &node_ops, std::vector<Module> modules)
        : _node_ops{node_ops}, _modules{std::move(modules)} {
        for (const auto &module : _modules) {
            if (module.create) { _cbs.create.push_back(module.create); }
            if (module.activate) { _cbs.activate.push_back(module.activate); }
            if (module.update) { _cbs.update.push_back(module.update); }
            if (module.remove) { _cbs.remove.push_back(module.remove); }
            if (module.destroy) { _cbs.destroy.push_back(module.destroy); }
        }
        _empty_node.kind = VNodeKind::ELEMENT;
        _empty_node.data = VNodeData{};
        _empty_node.children = std::make_shared<VNodeList>();
    }

    NodeHandle Patcher::patch(const vnode_s_ptr &old_vnode, const vnode_s_ptr &vnode, bool remove_only) {
        if (!vnode) {
            if (old_vnode) { invoke_destroy_hook(*old_vnode); }
            return NULL_NODE;
        }

        bool is_initial_patch{false};
        insert_queue queue;

        if (!old_vnode) {
            is_initial_patch = true;
            create_elm(vnode, queue, NULL_NODE, NULL_NODE, false, nullptr, 0);
        } else if (same_vnode(*old_vnode, *vnode)) {
            patch_vnode(old_vnode, vnode, queue, nullptr, 0, remove_only);
        } else {
            replace(old_vnode, vnode, queue);
        }

        invoke_insert_hook(*vnode, queue, is_initial_patch);
        return vnode->elm;
    }

    NodeHandle Patcher::patch(NodeHandle old_elm, const vnode_s_ptr &vnode, bool hydrating, bool remove_only) {
        if (!old_elm) { return patch(vnode_s_ptr{}, vnode, remove_only); }
        // A bare host node carries no hooks to destroy
        if (!vnode) { return NULL_NODE; }

        insert_queue queue;
        if (_node_ops.node_type(old_elm) == HostNodeType::ELEMENT && _node_ops.has_attribute(old_elm, SSR_ATTR)) {
            _node_ops.remove_attribute(old_elm, SSR_ATTR);
            hydrating = true;
        }
        if (hydrating) {
            if (hydrate(old_elm, vnode, queue, false)) {
                invoke_insert_hook(*vnode, queue, true);
                return old_elm;
            }
            warn("The client-side rendered virtual DOM tree is not matching server-rendered content. This is likely "
                 "caused by incorrect HTML markup, for example nesting block-level elements inside <p>, or missing "
                 "<tbody>. Bailing hydration and performing full client-side render.");
        }

        replace(empty_node_at(old_elm), vnode, queue);
        invoke_insert_hook(*vnode, queue, false);
        return vnode->elm;
    }

    bool Patcher::same_vnode(const VNode &a, const VNode &b) {
        if (a.key != b.key || a.async_factory != b.async_factory) { return false; }
        if (a.tag == b.tag && a.is_comment() == b.is_comment() && a.data.has_value() == b.data.has_value() &&
            same_input_type(a, b)) {
            return true;
        }
        return a.is_async_placeholder && b.async_factory != nullptr && !b.async_factory->error;
    }

    void Patcher::replace(const vnode_s_ptr &old_vnode, const vnode_s_ptr &vnode, insert_queue &queue) {
        auto old_elm = old_vnode->elm;
        auto parent_elm = old_elm ? _node_ops.parent_node(old_elm) : NULL_NODE;

        create_elm(vnode, queue, parent_elm, old_elm ? _node_ops.next_sibling(old_elm) : NULL_NODE, false, nullptr, 0);

        // The new root replaces the root of one or more components, update their placeholders
        if (vnode->parent != nullptr) {
            auto patchable = is_patchable(*vnode);
            for (auto ancestor = vnode->parent; ancestor != nullptr; ancestor = ancestor->parent) {
                for (const auto &cb : _cbs.destroy) { cb(*ancestor); }
                ancestor->elm = vnode->elm;
                if (patchable) {
                    for (const auto &cb : _cbs.create) { cb(_empty_node, *ancestor); }
                }
            }
        }

        if (parent_elm) {
            VNodeList old_list{old_vnode};
            remove_vnodes(old_list, 0, 0);
        } else if (old_vnode->has_tag()) {
            invoke_destroy_hook(*old_vnode);
        }
    }

    vnode_s_ptr Patcher::empty_node_at(NodeHandle elm) const {
        auto vnode = std::make_shared<VNode>();
        vnode->kind = VNodeKind::ELEMENT;
        vnode->tag = to_lower(_node_ops.tag_name(elm));
        vnode->data = VNodeData{};
        vnode->children = std::make_shared<VNodeList>();
        vnode->elm = elm;
        return vnode;
    }

    void Patcher::create_elm(vnode_s_ptr vnode, insert_queue &queue, NodeHandle parent_elm, NodeHandle ref_elm,
                             bool nested, VNodeList *owner, std::size_t index) {
        if (vnode->elm && owner != nullptr) {
            // Already materialized elsewhere, materialize a copy instead
            vnode = clone_vnode(*vnode);
            (*owner)[index] = vnode;
        }

        vnode->is_root_insert = !nested;

        if (create_component(*vnode, queue, parent_elm, ref_elm)) { return; }

        if (vnode->has_tag()) {
            bool in_pre = vnode->data.has_value() && vnode->data->pre;
            if (in_pre) { ++_creating_elm_in_pre; }
            if (is_unknown_element(*vnode, _creating_elm_in_pre > 0)) {
                warn("Unknown custom element: <{}> - did you register the component correctly? For recursive "
                     "components, make sure to provide the \"name\" option.",
                     vnode->tag);
            }

            vnode->elm = vnode->ns.has_value() ? _node_ops.create_element_ns(*vnode->ns, vnode->tag)
                                               : _node_ops.create_element(vnode->tag, *vnode);
            set_scope(*vnode);

            create_children(*vnode, queue);
            if (vnode->data.has_value()) { invoke_create_hooks(*vnode, queue); }
            insert(parent_elm, vnode->elm, ref_elm);

            if (in_pre) { --_creating_elm_in_pre; }
        } else if (vnode->is_comment()) {
            vnode->elm = _node_ops.create_comment(vnode->text.value_or(""));
            insert(parent_elm, vnode->elm, ref_elm);
        } else {
            vnode->elm = _node_ops.create_text_node(vnode->text.value_or(""));
            insert(parent_elm, vnode->elm, ref_elm);
        }
    }

    bool Patcher::create_component(VNode &vnode, insert_queue &queue, NodeHandle parent_elm, NodeHandle ref_elm) {
        if (!vnode.data.has_value()) { return false; }

        bool is_reactivated = vnode.component_instance != nullptr && vnode.data->keep_alive;
        if (vnode.data->hook.init) { vnode.data->hook.init(vnode, false); }

        // init has created and mounted the child instance, the placeholder takes over its root element
        if (vnode.component_instance == nullptr) { return false; }

        init_component(vnode, queue);
        insert(parent_elm, vnode.elm, ref_elm);
        if (is_reactivated) { reactivate_component(vnode, queue, parent_elm, ref_elm); }
        return true;
    }

    void Patcher::init_component(VNode &vnode, insert_queue &queue) {
        if (vnode.data->pending_insert.has_value()) {
            queue.insert(queue.end(), vnode.data->pending_insert->begin(), vnode.data->pending_insert->end());
            vnode.data->pending_insert.reset();
        }
        vnode.elm = vnode.component_instance->root_element();
        if (is_patchable(vnode)) {
            invoke_create_hooks(vnode, queue);
            set_scope(vnode);
        } else {
            // Empty component root, skip element modules but still run the insert hook
            queue.push_back(&vnode);
        }
    }

    void Patcher::reactivate_component(VNode &vnode, insert_queue &queue, NodeHandle parent_elm, NodeHandle ref_elm) {
        // The inner nodes of a reactivated component are not created again, so transitions bound to the first root
        // with one are activated here
        vnode_ptr inner = &vnode;
        while (inner->component_instance != nullptr) {
            inner = inner->component_instance->root_vnode();
            if (inner == nullptr) { break; }
            if (inner->data.has_value() && inner->data->transition) {
                for (const auto &cb : _cbs.activate) { cb(_empty_node, *inner); }
                queue.push_back(inner);
                break;
            }
        }
        // A reactivated keep-alive component does not insert itself
        insert(parent_elm, vnode.elm, ref_elm);
    }

    void Patcher::insert(NodeHandle parent, NodeHandle elm, NodeHandle ref) {
        if (!parent) { return; }
        if (ref) {
            if (_node_ops.parent_node(ref) == parent) { _node_ops.insert_before(parent, elm, ref); }
        } else {
            _node_ops.append_child(parent, elm);
        }
    }

    void Patcher::create_children(VNode &vnode, insert_queue &queue) {
        if (auto children = vnode.children; children) {
            check_duplicate_keys(*children);
            for (std::size_t i = 0; i < children->size(); ++i) {
                create_elm((*children)[i], queue, vnode.elm, NULL_NODE, true, children.get(), i);
            }
        } else if (vnode.text.has_value()) {
            _node_ops.append_child(vnode.elm, _node_ops.create_text_node(*vnode.text));
        }
    }

    bool Patcher::is_patchable(const VNode &vnode) {
        const VNode *current = &vnode;
        while (current->component_instance != nullptr && current->component_instance->root_vnode() != nullptr) {
            current = current->component_instance->root_vnode();
        }
        return current->has_tag();
    }

    void Patcher::invoke_create_hooks(VNode &vnode, insert_queue &queue) {
        for (const auto &cb : _cbs.create) { cb(_empty_node, vnode); }
        if (!vnode.data.has_value()) { return; }
        const auto &hook = vnode.data->hook;
        if (hook.create) { hook.create(_empty_node, vnode); }
        if (hook.insert) { queue.push_back(&vnode); }
    }

    void Patcher::set_scope(const VNode &vnode) {
        if (vnode.fn_scope_id.has_value()) {
            _node_ops.set_style_scope(vnode.elm, *vnode.fn_scope_id);
        } else {
            for (const VNode *ancestor = &vnode; ancestor != nullptr; ancestor = ancestor->parent) {
                if (ancestor->context != nullptr && ancestor->context->scope_id().has_value()) {
                    _node_ops.set_style_scope(vnode.elm, *ancestor->context->scope_id());
                }
            }
        }
        // Slot content also takes the scope of the instance being patched
        const auto *active = ComponentInstance::active();
        if (active != nullptr && active != vnode.context && active->scope_id().has_value()) {
            _node_ops.set_style_scope(vnode.elm, *active->scope_id());
        }
    }

    void Patcher::add_vnodes(NodeHandle parent_elm, NodeHandle ref_elm, VNodeList &vnodes, index_type start,
                             index_type end, insert_queue &queue) {
        for (; start <= end; ++start) {
            create_elm(vnodes[start], queue, parent_elm, ref_elm, false, &vnodes, static_cast<std::size_t>(start));
        }
    }

    void Patcher::invoke_destroy_hook(VNode &vnode) {
        if (vnode.data.has_value()) {
            if (vnode.data->hook.destroy) { vnode.data->hook.destroy(vnode); }
            for (const auto &cb : _cbs.destroy) { cb(vnode); }
        }
        if (auto children = vnode.children; children) {
            for (const auto &child : *children) {
                if (child) { invoke_destroy_hook(*child); }
            }
        }
    }

    void Patcher::remove_vnodes(VNodeList &vnodes, index_type start, index_type end) {
        for (; start <= end; ++start) {
            auto child = vnodes[start];
            if (!child) { continue; }
            if (child->has_tag()) {
                remove_and_invoke_remove_hook(*child, nullptr);
                invoke_destroy_hook(*child);
            } else {
                remove_node(child->elm);
            }
        }
    }

    void Patcher::remove_and_invoke_remove_hook(VNode &vnode, const RemoveCallback *remove) {
        if (remove == nullptr && !vnode.data.has_value()) {
            remove_node(vnode.elm);
            return;
        }

        auto listeners = _cbs.remove.size() + 1;
        std::optional<RemoveCallback> owned;
        if (remove != nullptr) {
            // Passed down from a component placeholder, this node's listeners join the same count
            remove->add_listeners(listeners);
        } else {
            owned.emplace([this, elm = vnode.elm]() { remove_node(elm); }, listeners);
            remove = &*owned;
        }

        if (vnode.component_instance != nullptr) {
            auto root = vnode.component_instance->root_vnode();
            if (root != nullptr && root->data.has_value()) { remove_and_invoke_remove_hook(*root, remove); }
        }
        for (const auto &cb : _cbs.remove) { cb(vnode, *remove); }
        if (vnode.data.has_value() && vnode.data->hook.remove) {
            vnode.data->hook.remove(vnode, *remove);
        } else {
            (*remove)();
        }
    }

    void Patcher::remove_node(NodeHandle elm) {
        if (!elm) { return; }
        // The node may already be detached, e.g. when its parent replaced its content
        if (auto parent = _node_ops.parent_node(elm); parent) { _node_ops.remove_child(parent, elm); }
    }

    void Patcher::update_children(NodeHandle parent_elm, VNodeList &old_ch, VNodeList &new_ch, insert_queue &queue,
                                  bool remove_only) {
        index_type old_start_idx{0};
        index_type new_start_idx{0};
        index_type old_end_idx{static_cast<index_type>(old_ch.size()) - 1};
        index_type new_end_idx{static_cast<index_type>(new_ch.size()) - 1};
        auto old_start_vnode = child_at(old_ch, old_start_idx);
        auto old_end_vnode = child_at(old_ch, old_end_idx);
        auto new_start_vnode = child_at(new_ch, new_start_idx);
        auto new_end_vnode = child_at(new_ch, new_end_idx);
        std::optional<key_index_type> old_key_to_idx;

        bool can_move = !remove_only;

        check_duplicate_keys(new_ch);

        while (old_start_idx <= old_end_idx && new_start_idx <= new_end_idx) {
            if (!old_start_vnode) {
                // Moved left by an earlier keyed match
                old_start_vnode = child_at(old_ch, ++old_start_idx);
            } else if (!old_end_vnode) {
                old_end_vnode = child_at(old_ch, --old_end_idx);
            } else if (same_vnode(*old_start_vnode, *new_start_vnode)) {
                patch_vnode(old_start_vnode, new_start_vnode, queue, &new_ch, new_start_idx, false);
                old_start_vnode = child_at(old_ch, ++old_start_idx);
                new_start_vnode = child_at(new_ch, ++new_start_idx);
            } else if (same_vnode(*old_end_vnode, *new_end_vnode)) {
                patch_vnode(old_end_vnode, new_end_vnode, queue, &new_ch, new_end_idx, false);
                old_end_vnode = child_at(old_ch, --old_end_idx);
                new_end_vnode = child_at(new_ch, --new_end_idx);
            } else if (same_vnode(*old_start_vnode, *new_end_vnode)) {
                // Moved right
                patch_vnode(old_start_vnode, new_end_vnode, queue, &new_ch, new_end_idx, false);
                if (can_move) {
                    _node_ops.insert_before(parent_elm, old_start_vnode->elm, _node_ops.next_sibling(old_end_vnode->elm));
                }
                old_start_vnode = child_at(old_ch, ++old_start_idx);
                new_end_vnode = child_at(new_ch, --new_end_idx);
            } else if (same_vnode(*old_end_vnode, *new_start_vnode)) {
                // Moved left
                patch_vnode(old_end_vnode, new_start_vnode, queue, &new_ch, new_start_idx, false);
                if (can_move) { _node_ops.insert_before(parent_elm, old_end_vnode->elm, old_start_vnode->elm); }
                old_end_vnode = child_at(old_ch, --old_end_idx);
                new_start_vnode = child_at(new_ch, ++new_start_idx);
            } else {
                if (!old_key_to_idx.has_value()) {
                    old_key_to_idx = create_key_to_old_idx(old_ch, old_start_idx, old_end_idx);
                }
                std::optional<index_type> idx_in_old;
                if (new_start_vnode->key.has_value()) {
                    if (auto it = old_key_to_idx->find(*new_start_vnode->key); it != old_key_to_idx->end()) {
                        idx_in_old = it->second;
                    }
                } else {
                    idx_in_old = find_idx_in_old(*new_start_vnode, old_ch, old_start_idx, old_end_idx);
                }

                if (!idx_in_old.has_value() || !old_ch[*idx_in_old]) {
                    create_elm(new_start_vnode, queue, parent_elm, old_start_vnode->elm, false, &new_ch,
                               static_cast<std::size_t>(new_start_idx));
                } else {
                    auto vnode_to_move = old_ch[*idx_in_old];
                    if (same_vnode(*vnode_to_move, *new_start_vnode)) {
                        patch_vnode(vnode_to_move, new_start_vnode, queue, &new_ch, new_start_idx, false);
                        old_ch[*idx_in_old] = nullptr;
                        if (can_move) { _node_ops.insert_before(parent_elm, vnode_to_move->elm, old_start_vnode->elm); }
                    } else {
                        // Same key but a different node, treat as new
                        create_elm(new_start_vnode, queue, parent_elm, old_start_vnode->elm, false, &new_ch,
                                   static_cast<std::size_t>(new_start_idx));
                    }
                }
                new_start_vnode = child_at(new_ch, ++new_start_idx);
            }
        }

        if (old_start_idx > old_end_idx) {
            auto after = child_at(new_ch, new_end_idx + 1);
            auto ref_elm = after ? after->elm : NULL_NODE;
            add_vnodes(parent_elm, ref_elm, new_ch, new_start_idx, new_end_idx, queue);
        } else if (new_start_idx > new_end_idx) {
            remove_vnodes(old_ch, old_start_idx, old_end_idx);
        }
    }

    void Patcher::check_duplicate_keys(const VNodeList &children) {
        ankerl::unordered_dense::set<VNodeKey, VNodeKeyHash> seen_keys;
        for (const auto &vnode : children) {
            if (!vnode || !vnode->key.has_value()) { continue; }
            if (!seen_keys.insert(*vnode->key).second) {
                warn("Duplicate keys detected: '{}'. This may cause an update error.", to_string(*vnode->key));
            }
        }
    }

    std::optional<Patcher::index_type> Patcher::find_idx_in_old(const VNode &node, const VNodeList &old_ch,
                                                                index_type start, index_type end) {
        for (auto i = start; i <= end; ++i) {
            const auto &c = old_ch[i];
            if (c && same_vnode(node, *c)) { return i; }
        }
        return std::nullopt;
    }

    void Patcher::patch_vnode(const vnode_s_ptr &old_vnode, vnode_s_ptr vnode, insert_queue &queue, VNodeList *owner,
                              std::size_t index, bool remove_only) {
        if (old_vnode == vnode) { return; }

        if (vnode->elm && owner != nullptr) {
            vnode = clone_vnode(*vnode);
            (*owner)[index] = vnode;
        }

        auto elm = vnode->elm = old_vnode->elm;

        if (old_vnode->is_async_placeholder) {
            if (vnode->async_factory != nullptr && vnode->async_factory->is_resolved()) {
                if (!hydrate(old_vnode->elm, vnode, queue, false)) {
                    warn("Async component content for <{}> does not match the host node it replaces", vnode->tag);
                }
            } else {
                vnode->is_async_placeholder = true;
            }
            return;
        }

        // Static subtrees are reused as they are, only for cloned or once-rendered nodes
        if (vnode->is_static && old_vnode->is_static && vnode->key == old_vnode->key &&
            (vnode->is_cloned || vnode->is_once)) {
            vnode->component_instance = old_vnode->component_instance;
            return;
        }

        if (vnode->data.has_value() && vnode->data->hook.prepatch) { vnode->data->hook.prepatch(*old_vnode, *vnode); }

        auto old_ch = old_vnode->children;
        auto ch = vnode->children;
        if (vnode->data.has_value() && is_patchable(*vnode)) {
            for (const auto &cb : _cbs.update) { cb(*old_vnode, *vnode); }
            if (vnode->data->hook.update) { vnode->data->hook.update(*old_vnode, *vnode); }
        }

        if (!vnode->text.has_value()) {
            if (old_ch && ch) {
                if (old_ch != ch) { update_children(elm, *old_ch, *ch, queue, remove_only); }
            } else if (ch) {
                check_duplicate_keys(*ch);
                if (old_vnode->text.has_value()) { _node_ops.set_text_content(elm, ""); }
                add_vnodes(elm, NULL_NODE, *ch, 0, static_cast<index_type>(ch->size()) - 1, queue);
            } else if (old_ch) {
                remove_vnodes(*old_ch, 0, static_cast<index_type>(old_ch->size()) - 1);
            } else if (old_vnode->text.has_value()) {
                _node_ops.set_text_content(elm, "");
            }
        } else if (old_vnode->text != vnode->text) {
            _node_ops.set_text_content(elm, *vnode->text);
        }

        if (vnode->data.has_value() && vnode->data->hook.postpatch) {
            vnode->data->hook.postpatch(*old_vnode, *vnode);
        }
    }

    void Patcher::invoke_insert_hook(VNode &vnode, insert_queue &queue, bool initial) {
        // Insert hooks of a component root wait until the component itself is inserted
        if (initial && vnode.parent != nullptr) {
            if (!vnode.parent->data.has_value()) { vnode.parent->data.emplace(); }
            vnode.parent->data->pending_insert = std::move(queue);
            return;
        }
        for (auto *inserted : queue) {
            if (inserted->data.has_value() && inserted->data->hook.insert) { inserted->data->hook.insert(*inserted); }
        }
    }

    bool Patcher::hydrate(NodeHandle elm, const vnode_s_ptr &vnode, insert_queue &queue, bool in_pre) {
        auto &data = vnode->data;
        in_pre = in_pre || (data.has_value() && data->pre);
        vnode->elm = elm;

        if (vnode->is_comment() && vnode->async_factory != nullptr) {
            vnode->is_async_placeholder = true;
            return true;
        }
        if (!assert_node_match(elm, *vnode, in_pre)) { return false; }

        if (data.has_value()) {
            if (data->hook.init) { data->hook.init(*vnode, true); }
            if (vnode->component_instance != nullptr) {
                // The child component has hydrated its own tree
                init_component(*vnode, queue);
                return true;
            }
        }

        if (vnode->has_tag()) {
            if (auto children = vnode->children; children) {
                if (!_node_ops.has_child_nodes(elm)) {
                    // Empty host element, the client populates the children
                    create_children(*vnode, queue);
                } else {
                    bool children_match{true};
                    auto child_node = _node_ops.first_child(elm);
                    for (const auto &child : *children) {
                        if (!child_node || !hydrate(child_node, child, queue, in_pre)) {
                            children_match = false;
                            break;
                        }
                        child_node = _node_ops.next_sibling(child_node);
                    }
                    // A remaining child_node means the host has more children than the render tree
                    if (!children_match || child_node) {
                        if (!_hydration_bailed) {
                            _hydration_bailed = true;
                            warn("Mismatching childNodes vs. VNodes under <{}>: {} render children", vnode->tag,
                                 children->size());
                        }
                        return false;
                    }
                }
            }
            if (data.has_value() && data->needs_create_on_hydrate()) { invoke_create_hooks(*vnode, queue); }
        } else if (auto text = vnode->text.value_or(""); _node_ops.text_content(elm) != text) {
            _node_ops.set_text_content(elm, text);
        }
        return true;
    }

    bool Patcher::assert_node_match(NodeHandle node, const VNode &vnode, bool in_pre) const {
        if (vnode.has_tag()) {
            return vnode.tag.starts_with(COMPONENT_TAG_PREFIX) ||
                   (!is_unknown_element(vnode, in_pre) &&
                    _node_ops.node_type(node) == HostNodeType::ELEMENT &&
                    to_lower(vnode.tag) == to_lower(_node_ops.tag_name(node)));
        }
        return _node_ops.node_type(node) == (vnode.is_comment() ? HostNodeType::COMMENT : HostNodeType::TEXT);
    }

    bool Patcher::is_unknown_element(const VNode &vnode, bool in_pre) {
        return !in_pre && !vnode.ns.has_value() && config().unknown_element(vnode.tag);
    }
} // namespace reactree
