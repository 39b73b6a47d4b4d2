#ifndef REACTREE_NODE_OPS_H
#define REACTREE_NODE_OPS_H

#include <reactree/vdom/node_handle.h>

namespace reactree {
    /**
     * The host capability the reconciler drives. All structural changes to the materialized tree go through here.
     */
    struct REACTREE_EXPORT NodeOps {
        virtual ~NodeOps() = default;

        virtual NodeHandle create_element(std::string_view tag, const VNode &vnode) = 0;

        virtual NodeHandle create_element_ns(std::string_view ns, std::string_view tag) = 0;

        virtual NodeHandle create_text_node(std::string_view text) = 0;

        virtual NodeHandle create_comment(std::string_view text) = 0;

        /**
         * Insert node before reference under parent, detaching it from its current position first.
         */
        virtual void insert_before(NodeHandle parent, NodeHandle node, NodeHandle reference) = 0;

        virtual void remove_child(NodeHandle parent, NodeHandle child) = 0;

        virtual void append_child(NodeHandle parent, NodeHandle child) = 0;

        [[nodiscard]] virtual NodeHandle parent_node(NodeHandle node) const = 0;

        [[nodiscard]] virtual NodeHandle next_sibling(NodeHandle node) const = 0;

        [[nodiscard]] virtual std::string tag_name(NodeHandle node) const = 0;

        virtual void set_text_content(NodeHandle node, std::string_view text) = 0;

        virtual void set_style_scope(NodeHandle node, std::string_view scope_id) = 0;

        // Queries used when adopting an existing (server rendered) tree

        [[nodiscard]] virtual HostNodeType node_type(NodeHandle node) const = 0;

        [[nodiscard]] virtual NodeHandle first_child(NodeHandle node) const = 0;

        [[nodiscard]] virtual bool has_child_nodes(NodeHandle node) const = 0;

        [[nodiscard]] virtual std::string text_content(NodeHandle node) const = 0;

        [[nodiscard]] virtual bool has_attribute(NodeHandle node, std::string_view name) const = 0;

        virtual void remove_attribute(NodeHandle node, std::string_view name) = 0;
    };
} // namespace reactree

#endif  // REACTREE_NODE_OPS_H
