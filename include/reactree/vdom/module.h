#ifndef REACTREE_MODULE_H
#define REACTREE_MODULE_H

#include <reactree/vdom/vnode.h>

#include <functional>

namespace reactree {
    /**
     * A set of reconciler callbacks for one concern (attributes, classes, styles, events, ...).
     * Unset callbacks are skipped.
     */
    struct REACTREE_EXPORT Module {
        using hook_type = std::function<void(VNode &old_vnode, VNode &vnode)>;
        using remove_type = std::function<void(VNode &vnode, const RemoveCallback &remove)>;
        using destroy_type = std::function<void(VNode &vnode)>;

        std::string name;
        hook_type create;
        hook_type activate;
        hook_type update;
        remove_type remove;
        destroy_type destroy;
    };
} // namespace reactree

#endif  // REACTREE_MODULE_H
