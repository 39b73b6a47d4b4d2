#ifndef REACTREE_TRAVERSE_H
#define REACTREE_TRAVERSE_H

#include <reactree/types/value.h>

namespace reactree {
    /**
     * Reactively read every nested property of value so the current evaluation depends on all of them.
     * Frozen and raw containers are skipped, cycles are visited once.
     */
    REACTREE_EXPORT void traverse(const Value &value);
} // namespace reactree

#endif  // REACTREE_TRAVERSE_H
