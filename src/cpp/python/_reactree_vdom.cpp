#include <reactree/python/nb_wiring.h>
#include <reactree/vdom/host_tree.h>
#include <reactree/vdom/modules/attrs.h>
#include <reactree/vdom/patch.h>
#include <reactree/vdom/vnode.h>

#include <nanobind/stl/variant.h>

namespace {
    using namespace reactree;

    VNodeList to_children(const std::optional<nb::list> &children) {
        VNodeList result;
        if (!children) { return result; }
        for (auto child : *children) {
            if (nb::isinstance<nb::str>(child)) {
                result.push_back(create_text_vnode(nb::cast<std::string>(child)));
            } else {
                result.push_back(nb::cast<vnode_s_ptr>(child));
            }
        }
        return result;
    }

    vnode_s_ptr h(std::string tag, std::optional<nb::dict> attrs, std::optional<nb::list> children,
                  std::optional<VNodeKey> key, std::optional<std::string> text) {
        std::optional<VNodeData> data;
        if (attrs || key) {
            data.emplace();
            data->key = key;
            if (attrs) {
                for (auto [name, value] : *attrs) {
                    auto attribute = nb::cast<std::string>(nb::str(name));
                    auto rendered = nb::cast<std::string>(nb::str(value));
                    if (attribute == "class") {
                        data->class_name = std::move(rendered);
                    } else if (attribute == "style") {
                        data->style = std::move(rendered);
                    } else {
                        data->attrs.insert_or_assign(std::move(attribute), std::move(rendered));
                    }
                }
            }
        }
        if (text) { return create_text_element_vnode(std::move(tag), std::move(data), std::move(*text)); }
        return create_element_vnode(std::move(tag), std::move(data), to_children(children));
    }

    /**
     * A reconciler over a host tree with the attrs module installed.
     */
    struct PyPatcher {
        explicit PyPatcher(HostTree &tree) : patcher{tree, {make_attrs_module(tree)}} {}

        Patcher patcher;
    };
} // namespace

void export_vdom(nb::module_ &m) {
    using namespace reactree;

    nb::enum_<VNodeKind>(m, "VNodeKind")
        .value("ELEMENT", VNodeKind::ELEMENT)
        .value("TEXT", VNodeKind::TEXT)
        .value("COMMENT", VNodeKind::COMMENT)
        .value("COMPONENT", VNodeKind::COMPONENT)
        .value("ASYNC_PLACEHOLDER", VNodeKind::ASYNC_PLACEHOLDER);

    nb::class_<VNode>(m, "VNode")
        .def_ro("kind", &VNode::kind)
        .def_ro("tag", &VNode::tag)
        .def_ro("text", &VNode::text)
        .def_ro("key", &VNode::key)
        .def_prop_ro("elm", [](const VNode &self) { return self.elm.index; })
        .def_prop_ro("children", [](const VNode &self) { return self.children ? *self.children : VNodeList{}; })
        .def("__repr__", &VNode::to_string);

    m.def("h", &h, "tag"_a, "attrs"_a = nb::none(), "children"_a = nb::none(), "key"_a = nb::none(),
          "text"_a = nb::none(), "Create an element node, str children become text nodes");
    m.def("text", &create_text_vnode, "text"_a);
    m.def("comment", &create_comment_vnode, "text"_a);

    nb::class_<HostTree::OperationCounts>(m, "OperationCounts")
        .def_ro("created_elements", &HostTree::OperationCounts::created_elements)
        .def_ro("created_text_nodes", &HostTree::OperationCounts::created_text_nodes)
        .def_ro("created_comments", &HostTree::OperationCounts::created_comments)
        .def_ro("inserts", &HostTree::OperationCounts::inserts)
        .def_ro("moves", &HostTree::OperationCounts::moves)
        .def_ro("removes", &HostTree::OperationCounts::removes)
        .def_ro("text_updates", &HostTree::OperationCounts::text_updates)
        .def_prop_ro("creates", &HostTree::OperationCounts::creates);

    nb::class_<HostTree>(m, "HostTree")
        .def(nb::init<>())
        .def("create_root", [](HostTree &self, std::string_view tag) { return self.create_root(tag).index; },
             "tag"_a = "div")
        .def("append", [](HostTree &self, std::uint32_t parent, std::uint32_t child) {
            self.append_child(NodeHandle{parent}, NodeHandle{child});
        })
        .def("serialize", [](const HostTree &self, std::uint32_t node) { return self.serialize(NodeHandle{node}); })
        .def_prop_ro("counts", &HostTree::counts)
        .def("reset_counts", &HostTree::reset_counts)
        .def_prop_ro("node_count", &HostTree::node_count)
        .def("set_trace", &HostTree::set_trace);

    nb::class_<PyPatcher>(m, "Patcher")
        .def(nb::init<HostTree &>(), "tree"_a, nb::keep_alive<1, 2>())
        .def("patch",
             [](PyPatcher &self, std::optional<vnode_s_ptr> old_vnode, std::optional<vnode_s_ptr> vnode) {
                 return self.patcher.patch(old_vnode.value_or(nullptr), vnode.value_or(nullptr)).index;
             },
             "old_vnode"_a.none(), "vnode"_a.none())
        .def("mount",
             [](PyPatcher &self, std::uint32_t elm, const vnode_s_ptr &vnode, bool hydrating) {
                 return self.patcher.patch(NodeHandle{elm}, vnode, hydrating).index;
             },
             "elm"_a, "vnode"_a, "hydrating"_a = false);
}
