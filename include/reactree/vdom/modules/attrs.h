#ifndef REACTREE_MODULES_ATTRS_H
#define REACTREE_MODULES_ATTRS_H

#include <reactree/vdom/module.h>

namespace reactree {
    /**
     * Keeps host attributes in line with VNodeData::attrs, class_name (as "class") and style (as "style").
     * Attributes are only written when their value changed and removed when no longer present.
     */
    REACTREE_EXPORT Module make_attrs_module(HostTree &tree);
} // namespace reactree

#endif  // REACTREE_MODULES_ATTRS_H
