#ifndef REACTREE_COMPUTED_H
#define REACTREE_COMPUTED_H

#include <reactree/runtime/watcher.h>

namespace reactree {
    /**
     * A lazily evaluated, cached value derived from reactive state.
     *
     * The underlying watcher only marks itself dirty when a dependency notifies; the value is recomputed on the next
     * read. Reading a computed value inside another evaluation makes that evaluation depend on the computed value's
     * own dependencies.
     */
    class REACTREE_EXPORT Computed {
    public:
        Computed(Scheduler &scheduler, Watcher::getter_type getter, std::string name = {});

        static computed_s_ptr make(Scheduler &scheduler, Watcher::getter_type getter, std::string name = {});

        [[nodiscard]] Value get();

        [[nodiscard]] const watcher_s_ptr &watcher() const { return _watcher; }

        [[nodiscard]] const std::string &name() const { return _watcher->expression(); }

        [[nodiscard]] bool dirty() const { return _watcher->dirty(); }

        void teardown();

    private:
        watcher_s_ptr _watcher;
    };
} // namespace reactree

#endif  // REACTREE_COMPUTED_H
