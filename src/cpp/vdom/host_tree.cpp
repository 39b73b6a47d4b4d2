#include <reactree/util/errors.h>
#include <reactree/vdom/host_tree.h>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace reactree {
    HostTree::HostTree() {
        // Slot 0 is the null node
        _nodes.emplace_back();
    }

    NodeHandle HostTree::create_root(std::string_view tag) { return allocate(Node{.tag = std::string{tag}}); }

    NodeHandle HostTree::create_element(std::string_view tag, const VNode &) {
        ++_counts.created_elements;
        auto handle = allocate(Node{.tag = std::string{tag}});
        if (_trace) { fmt::print(stderr, "[HOST_TRACE] create_element <{}> -> {}\n", tag, handle); }
        return handle;
    }

    NodeHandle HostTree::create_element_ns(std::string_view ns, std::string_view tag) {
        ++_counts.created_elements;
        auto handle = allocate(Node{.tag = std::string{tag}, .ns = std::string{ns}});
        if (_trace) { fmt::print(stderr, "[HOST_TRACE] create_element_ns {}:<{}> -> {}\n", ns, tag, handle); }
        return handle;
    }

    NodeHandle HostTree::create_text_node(std::string_view text) {
        ++_counts.created_text_nodes;
        auto handle = allocate(Node{.type = HostNodeType::TEXT, .text = std::string{text}});
        if (_trace) { fmt::print(stderr, "[HOST_TRACE] create_text_node \"{}\" -> {}\n", text, handle); }
        return handle;
    }

    NodeHandle HostTree::create_comment(std::string_view text) {
        ++_counts.created_comments;
        auto handle = allocate(Node{.type = HostNodeType::COMMENT, .text = std::string{text}});
        if (_trace) { fmt::print(stderr, "[HOST_TRACE] create_comment \"{}\" -> {}\n", text, handle); }
        return handle;
    }

    void HostTree::insert_before(NodeHandle parent, NodeHandle node, NodeHandle reference) {
        auto &parent_node_ = node_at(parent);
        if (parent_node_.type != HostNodeType::ELEMENT) {
            throw_error<std::invalid_argument>("Cannot insert node {} into non-element node {}", node, parent);
        }
        auto &child = node_at(node);
        bool was_attached = !child.parent.is_null();
        detach(node);
        auto &siblings = node_at(parent).children;
        auto position = siblings.end();
        if (reference) {
            position = std::find(siblings.begin(), siblings.end(), reference);
            if (position == siblings.end()) {
                throw_error<std::invalid_argument>("Reference node {} is not a child of {}", reference, parent);
            }
        }
        siblings.insert(position, node);
        child.parent = parent;
        if (was_attached) {
            ++_counts.moves;
        } else {
            ++_counts.inserts;
        }
        if (_trace) {
            fmt::print(stderr, "[HOST_TRACE] {} {} into {} before {}\n", was_attached ? "move" : "insert", node, parent,
                       reference);
        }
    }

    void HostTree::remove_child(NodeHandle parent, NodeHandle child) {
        auto &node = node_at(child);
        if (node.parent != parent) {
            throw_error<std::invalid_argument>("Node {} is not a child of {}", child, parent);
        }
        detach(child);
        ++_counts.removes;
        if (_trace) { fmt::print(stderr, "[HOST_TRACE] remove {} from {}\n", child, parent); }
    }

    void HostTree::append_child(NodeHandle parent, NodeHandle child) { insert_before(parent, child, NULL_NODE); }

    NodeHandle HostTree::parent_node(NodeHandle node) const { return node_at(node).parent; }

    NodeHandle HostTree::next_sibling(NodeHandle node) const {
        auto parent = node_at(node).parent;
        if (!parent) { return NULL_NODE; }
        const auto &siblings = node_at(parent).children;
        auto it = std::find(siblings.begin(), siblings.end(), node);
        if (it == siblings.end() || ++it == siblings.end()) { return NULL_NODE; }
        return *it;
    }

    std::string HostTree::tag_name(NodeHandle node) const {
        const auto &n = node_at(node);
        if (n.type != HostNodeType::ELEMENT) { return {}; }
        std::string upper{n.tag};
        std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return upper;
    }

    void HostTree::set_text_content(NodeHandle node, std::string_view text) {
        auto &n = node_at(node);
        ++_counts.text_updates;
        if (_trace) { fmt::print(stderr, "[HOST_TRACE] set_text_content {} \"{}\"\n", node, text); }
        if (n.type != HostNodeType::ELEMENT) {
            n.text = std::string{text};
            return;
        }
        // Elements replace their children with a single text node
        for (auto child : std::vector<NodeHandle>{n.children}) { detach(child); }
        if (!text.empty()) {
            auto text_node = allocate(Node{.type = HostNodeType::TEXT, .text = std::string{text}});
            node_at(node).children.push_back(text_node);
            node_at(text_node).parent = node;
        }
    }

    void HostTree::set_style_scope(NodeHandle node, std::string_view scope_id) {
        auto &scopes = node_at(node).style_scopes;
        if (std::find(scopes.begin(), scopes.end(), scope_id) == scopes.end()) { scopes.emplace_back(scope_id); }
    }

    HostNodeType HostTree::node_type(NodeHandle node) const { return node_at(node).type; }

    NodeHandle HostTree::first_child(NodeHandle node) const {
        const auto &children_ = node_at(node).children;
        return children_.empty() ? NULL_NODE : children_.front();
    }

    bool HostTree::has_child_nodes(NodeHandle node) const { return !node_at(node).children.empty(); }

    std::string HostTree::text_content(NodeHandle node) const {
        const auto &n = node_at(node);
        if (n.type != HostNodeType::ELEMENT) { return n.text; }
        std::string result;
        for (auto child : n.children) {
            if (node_at(child).type != HostNodeType::COMMENT) { result += text_content(child); }
        }
        return result;
    }

    bool HostTree::has_attribute(NodeHandle node, std::string_view name) const {
        return node_at(node).attributes.contains(std::string{name});
    }

    void HostTree::remove_attribute(NodeHandle node, std::string_view name) {
        node_at(node).attributes.erase(std::string{name});
    }

    void HostTree::set_attribute(NodeHandle node, std::string_view name, std::string_view value) {
        node_at(node).attributes.insert_or_assign(std::string{name}, std::string{value});
    }

    std::optional<std::string> HostTree::attribute(NodeHandle node, std::string_view name) const {
        const auto &attributes = node_at(node).attributes;
        auto it = attributes.find(std::string{name});
        if (it == attributes.end()) { return std::nullopt; }
        return it->second;
    }

    const std::vector<NodeHandle> &HostTree::children(NodeHandle node) const { return node_at(node).children; }

    const std::optional<std::string> &HostTree::namespace_of(NodeHandle node) const { return node_at(node).ns; }

    const std::vector<std::string> &HostTree::style_scopes(NodeHandle node) const { return node_at(node).style_scopes; }

    std::string HostTree::serialize(NodeHandle node) const {
        std::string out;
        serialize(node, out);
        return out;
    }

    NodeHandle HostTree::allocate(Node node) {
        _nodes.push_back(std::move(node));
        return NodeHandle{static_cast<std::uint32_t>(_nodes.size() - 1)};
    }

    HostTree::Node &HostTree::node_at(NodeHandle handle) {
        if (handle.is_null() || handle.index >= _nodes.size()) {
            throw_error<std::out_of_range>("Invalid host node handle: {}", handle);
        }
        return _nodes[handle.index];
    }

    const HostTree::Node &HostTree::node_at(NodeHandle handle) const {
        if (handle.is_null() || handle.index >= _nodes.size()) {
            throw_error<std::out_of_range>("Invalid host node handle: {}", handle);
        }
        return _nodes[handle.index];
    }

    void HostTree::detach(NodeHandle node) {
        auto &child = node_at(node);
        if (child.parent.is_null()) { return; }
        auto &siblings = node_at(child.parent).children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), node), siblings.end());
        child.parent = NULL_NODE;
    }

    void HostTree::serialize(NodeHandle node, std::string &out) const {
        const auto &n = node_at(node);
        switch (n.type) {
            case HostNodeType::TEXT: out += n.text; return;
            case HostNodeType::COMMENT: fmt::format_to(std::back_inserter(out), "<!--{}-->", n.text); return;
            case HostNodeType::ELEMENT: break;
        }
        std::vector<std::pair<std::string, std::string>> attributes(n.attributes.begin(), n.attributes.end());
        std::sort(attributes.begin(), attributes.end());
        fmt::format_to(std::back_inserter(out), "<{}", n.tag);
        for (const auto &[name, value] : attributes) { fmt::format_to(std::back_inserter(out), " {}=\"{}\"", name, value); }
        out += '>';
        for (auto child : n.children) { serialize(child, out); }
        fmt::format_to(std::back_inserter(out), "</{}>", n.tag);
    }
} // namespace reactree
