#ifndef REACTREE_HOST_TREE_H
#define REACTREE_HOST_TREE_H

#include <reactree/vdom/node_ops.h>

#include <reactree/util/string_hash.h>

#include <vector>

namespace reactree {
    /**
     * In-memory host tree implementing NodeOps.
     *
     * Nodes live in an arena addressed by NodeHandle (slot 0 is the null node) and are never reclaimed, so a handle
     * stays valid for the lifetime of the tree. Every structural operation is counted, which makes the tree the
     * observation point for reconciler behaviour.
     */
    class REACTREE_EXPORT HostTree : public NodeOps {
    public:
        struct OperationCounts {
            std::size_t created_elements{0};
            std::size_t created_text_nodes{0};
            std::size_t created_comments{0};
            // insert_before / append_child of a detached node
            std::size_t inserts{0};
            // insert_before / append_child of a node that already had a parent
            std::size_t moves{0};
            std::size_t removes{0};
            std::size_t text_updates{0};

            [[nodiscard]] std::size_t creates() const { return created_elements + created_text_nodes + created_comments; }
        };

        HostTree();

        /**
         * Create a detached container element. Not counted as an operation.
         */
        NodeHandle create_root(std::string_view tag = "div");

        NodeHandle create_element(std::string_view tag, const VNode &vnode) override;

        NodeHandle create_element_ns(std::string_view ns, std::string_view tag) override;

        NodeHandle create_text_node(std::string_view text) override;

        NodeHandle create_comment(std::string_view text) override;

        void insert_before(NodeHandle parent, NodeHandle node, NodeHandle reference) override;

        void remove_child(NodeHandle parent, NodeHandle child) override;

        void append_child(NodeHandle parent, NodeHandle child) override;

        [[nodiscard]] NodeHandle parent_node(NodeHandle node) const override;

        [[nodiscard]] NodeHandle next_sibling(NodeHandle node) const override;

        [[nodiscard]] std::string tag_name(NodeHandle node) const override;

        void set_text_content(NodeHandle node, std::string_view text) override;

        void set_style_scope(NodeHandle node, std::string_view scope_id) override;

        [[nodiscard]] HostNodeType node_type(NodeHandle node) const override;

        [[nodiscard]] NodeHandle first_child(NodeHandle node) const override;

        [[nodiscard]] bool has_child_nodes(NodeHandle node) const override;

        [[nodiscard]] std::string text_content(NodeHandle node) const override;

        [[nodiscard]] bool has_attribute(NodeHandle node, std::string_view name) const override;

        void remove_attribute(NodeHandle node, std::string_view name) override;

        void set_attribute(NodeHandle node, std::string_view name, std::string_view value);

        [[nodiscard]] std::optional<std::string> attribute(NodeHandle node, std::string_view name) const;

        [[nodiscard]] const std::vector<NodeHandle> &children(NodeHandle node) const;

        [[nodiscard]] const std::optional<std::string> &namespace_of(NodeHandle node) const;

        [[nodiscard]] const std::vector<std::string> &style_scopes(NodeHandle node) const;

        /**
         * Markup-like rendering of the subtree rooted at node, attributes sorted by name.
         */
        [[nodiscard]] std::string serialize(NodeHandle node) const;

        [[nodiscard]] std::size_t node_count() const { return _nodes.size() - 1; }

        [[nodiscard]] const OperationCounts &counts() const { return _counts; }

        void reset_counts() { _counts = {}; }

        /**
         * Log every structural operation to stderr.
         */
        void set_trace(bool enable) { _trace = enable; }

    private:
        struct Node {
            HostNodeType type{HostNodeType::ELEMENT};
            std::string tag;
            std::optional<std::string> ns;
            // Text of text and comment nodes
            std::string text;
            string_map<std::string> attributes;
            std::vector<std::string> style_scopes;
            std::vector<NodeHandle> children;
            NodeHandle parent;
        };

        NodeHandle allocate(Node node);

        [[nodiscard]] Node &node_at(NodeHandle handle);

        [[nodiscard]] const Node &node_at(NodeHandle handle) const;

        void detach(NodeHandle node);

        void serialize(NodeHandle node, std::string &out) const;

        std::vector<Node> _nodes;
        OperationCounts _counts;
        bool _trace{false};
    };
} // namespace reactree

#endif  // REACTREE_HOST_TREE_H
