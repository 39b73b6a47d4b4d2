#include <reactree/vdom/host_tree.h>
#include <reactree/vdom/modules/attrs.h>

namespace reactree {
    namespace {
        VNodeData::string_map effective_attrs(const VNode &vnode) {
            VNodeData::string_map attrs;
            if (!vnode.data.has_value()) { return attrs; }
            attrs = vnode.data->attrs;
            if (!vnode.data->class_name.empty()) { attrs.insert_or_assign("class", vnode.data->class_name); }
            if (!vnode.data->style.empty()) { attrs.insert_or_assign("style", vnode.data->style); }
            return attrs;
        }

        void update_attrs(HostTree &tree, const VNode &old_vnode, const VNode &vnode) {
            if (!vnode.elm || vnode.kind != VNodeKind::ELEMENT) { return; }
            auto old_attrs = effective_attrs(old_vnode);
            auto attrs = effective_attrs(vnode);
            if (old_attrs.empty() && attrs.empty()) { return; }
            for (const auto &[name, value] : attrs) {
                auto old = old_attrs.find(name);
                if (old == old_attrs.end() || old->second != value) { tree.set_attribute(vnode.elm, name, value); }
            }
            for (const auto &[name, _] : old_attrs) {
                if (!attrs.contains(name)) { tree.remove_attribute(vnode.elm, name); }
            }
        }
    } // namespace

    Module make_attrs_module(HostTree &tree) {
        auto update = [&tree](VNode &old_vnode, VNode &vnode) { update_attrs(tree, old_vnode, vnode); };
        return Module{.name = "attrs", .create = update, .update = update};
    }
} // namespace reactree
