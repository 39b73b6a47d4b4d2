#ifndef REACTREE_SUBJECT_H
#define REACTREE_SUBJECT_H

#include <reactree/types/subscriber.h>

#include <memory>
#include <vector>

namespace reactree {
    /**
     * A publish point for one piece of observable state (a property, an array's contents or an object's shape).
     *
     * Subscribers are held weakly, a subscriber that has been destroyed is skipped and pruned. The subscriber list
     * never contains the same subscriber twice.
     */
    struct REACTREE_EXPORT Subject : std::enable_shared_from_this<Subject> {
        using id_type = std::uint64_t;

        Subject(const Subject &) = delete;

        Subject &operator=(const Subject &) = delete;

        /**
         * Subjects are always shared, depend() hands this subject to the evaluating subscriber.
         */
        static subject_s_ptr make();

        [[nodiscard]] id_type id() const { return _id; }

        void subscribe(const subscriber_s_ptr &subscriber);

        void unsubscribe(subscriber_ptr subscriber);

        [[nodiscard]] bool is_subscribed(subscriber_ptr subscriber) const;

        /**
         * Number of live subscribers.
         */
        [[nodiscard]] std::size_t subscriber_count() const;

        /**
         * Register this subject with the subscriber currently evaluating, if there is one.
         */
        void depend();

        /**
         * Invalidate every subscriber present at the time of the call. Subscribers added or removed while notifying
         * do not affect the current pass.
         */
        void notify();

    private:
        Subject();

        struct Entry {
            subscriber_ptr subscriber;
            subscriber_w_ptr ref;
        };

        void prune();

        id_type _id;
        std::vector<Entry> _subscribers;
    };
} // namespace reactree

#endif  // REACTREE_SUBJECT_H
