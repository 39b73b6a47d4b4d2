#ifndef REACTREE_PATCH_H
#define REACTREE_PATCH_H

#include <reactree/vdom/module.h>
#include <reactree/vdom/node_ops.h>
#include <reactree/vdom/vnode.h>

#include <cstddef>
#include <vector>

namespace reactree {
    // Attribute marking a host element as server rendered, patching onto such an element hydrates it
    inline constexpr std::string_view SSR_ATTR{"data-server-rendered"};

    /**
     * The reconciler. Turns one render tree into another through the minimum of NodeOps calls the two-ended keyed
     * diff finds, running module callbacks and node hooks along the way.
     *
     * Children lists must not contain null entries; the reconciler uses null to mark old children it has consumed.
     */
    class REACTREE_EXPORT Patcher {
    public:
        explicit Patcher(NodeOps &node_ops, std::vector<Module> modules = {});

        Patcher(const Patcher &) = delete;

        Patcher &operator=(const Patcher &) = delete;

        /**
         * Reconcile old_vnode into vnode and return the host root of vnode.
         *
         * - vnode null: run destroy hooks over old_vnode (unmount), returns NULL_NODE.
         * - old_vnode null: create vnode detached (initial render), insert hooks are handed to the placeholder of a
         *   component root.
         * - same node: patch in place.
         * - otherwise: create vnode beside old_vnode, then remove old_vnode.
         *
         * remove_only suppresses moves of the top level children (a leaving transition holds the list).
         */
        NodeHandle patch(const vnode_s_ptr &old_vnode, const vnode_s_ptr &vnode, bool remove_only = false);

        /**
         * Mount vnode in place of an existing host element. When hydrating (or when the element carries SSR_ATTR)
         * the existing subtree is adopted instead of recreated, falling back to a full render on mismatch.
         */
        NodeHandle patch(NodeHandle old_elm, const vnode_s_ptr &vnode, bool hydrating = false, bool remove_only = false);

        /**
         * The sameness predicate: two nodes describe the same position and can be patched into each other.
         */
        [[nodiscard]] static bool same_vnode(const VNode &a, const VNode &b);

        [[nodiscard]] NodeOps &node_ops() const { return _node_ops; }

        [[nodiscard]] const std::vector<Module> &modules() const { return _modules; }

    private:
        using insert_queue = std::vector<vnode_ptr>;
        using index_type = std::ptrdiff_t;

        struct Callbacks {
            std::vector<Module::hook_type> create;
            std::vector<Module::hook_type> activate;
            std::vector<Module::hook_type> update;
            std::vector<Module::remove_type> remove;
            std::vector<Module::destroy_type> destroy;
        };

        void replace(const vnode_s_ptr &old_vnode, const vnode_s_ptr &vnode, insert_queue &queue);

        vnode_s_ptr empty_node_at(NodeHandle elm) const;

        void create_elm(vnode_s_ptr vnode, insert_queue &queue, NodeHandle parent_elm, NodeHandle ref_elm, bool nested,
                        VNodeList *owner, std::size_t index);

        bool create_component(VNode &vnode, insert_queue &queue, NodeHandle parent_elm, NodeHandle ref_elm);

        void init_component(VNode &vnode, insert_queue &queue);

        void reactivate_component(VNode &vnode, insert_queue &queue, NodeHandle parent_elm, NodeHandle ref_elm);

        void insert(NodeHandle parent, NodeHandle elm, NodeHandle ref);

        void create_children(VNode &vnode, insert_queue &queue);

        [[nodiscard]] static bool is_patchable(const VNode &vnode);

        void invoke_create_hooks(VNode &vnode, insert_queue &queue);

        void set_scope(const VNode &vnode);

        void add_vnodes(NodeHandle parent_elm, NodeHandle ref_elm, VNodeList &vnodes, index_type start, index_type end,
                        insert_queue &queue);

        void invoke_destroy_hook(VNode &vnode);

        void remove_vnodes(VNodeList &vnodes, index_type start, index_type end);

        void remove_and_invoke_remove_hook(VNode &vnode, const RemoveCallback *remove);

        void remove_node(NodeHandle elm);

        void update_children(NodeHandle parent_elm, VNodeList &old_ch, VNodeList &new_ch, insert_queue &queue,
                             bool remove_only);

        static void check_duplicate_keys(const VNodeList &children);

        [[nodiscard]] static std::optional<index_type> find_idx_in_old(const VNode &node, const VNodeList &old_ch,
                                                                       index_type start, index_type end);

        void patch_vnode(const vnode_s_ptr &old_vnode, vnode_s_ptr vnode, insert_queue &queue, VNodeList *owner,
                         std::size_t index, bool remove_only);

        static void invoke_insert_hook(VNode &vnode, insert_queue &queue, bool initial);

        bool hydrate(NodeHandle elm, const vnode_s_ptr &vnode, insert_queue &queue, bool in_pre);

        [[nodiscard]] bool assert_node_match(NodeHandle node, const VNode &vnode, bool in_pre) const;

        [[nodiscard]] static bool is_unknown_element(const VNode &vnode, bool in_pre);

        NodeOps &_node_ops;
        std::vector<Module> _modules;
        Callbacks _cbs;
        // Stands in for the old node when running create callbacks
        VNode _empty_node;
        int _creating_elm_in_pre{0};
        bool _hydration_bailed{false};
    };
} // namespace reactree

#endif  // REACTREE_PATCH_H
