#ifndef REACTREE_SUBSCRIBER_H
#define REACTREE_SUBSCRIBER_H

#include <reactree/reactree_base.h>

namespace reactree {
    /**
     * Something that can be registered with a Subject and told when it changes.
     * Watchers are the main implementation; tests provide simple recording implementations.
     */
    struct REACTREE_EXPORT Subscriber {
        virtual ~Subscriber() = default;

        /**
         * Creation ordered identifier, used to order synchronous notification and scheduling.
         */
        [[nodiscard]] virtual std::uint64_t id() const = 0;

        /**
         * Called by Subject::depend while this subscriber is the current evaluation target.
         */
        virtual void add_dependency(const subject_s_ptr &subject) = 0;

        /**
         * Called by Subject::notify.
         */
        virtual void invalidate() = 0;
    };
} // namespace reactree

#endif  // REACTREE_SUBSCRIBER_H
