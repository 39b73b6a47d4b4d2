#include <reactree/config.h>
#include <reactree/runtime/evaluation_stack.h>
#include <reactree/types/subject.h>

#include <algorithm>
#include <atomic>

namespace reactree {
    namespace {
        Subject::id_type next_subject_id() {
            static std::atomic<Subject::id_type> counter{0};
            return ++counter;
        }
    } // namespace

    Subject::Subject() : _id{next_subject_id()} {}

    subject_s_ptr Subject::make() {
        // Not make_shared, the constructor is not public
        return subject_s_ptr{new Subject()};
    }

    void Subject::subscribe(const subscriber_s_ptr &subscriber) {
        if (!subscriber) { return; }
        prune();
        if (is_subscribed(subscriber.get())) { return; }
        _subscribers.push_back({subscriber.get(), subscriber});
    }

    void Subject::unsubscribe(subscriber_ptr subscriber) {
        auto it = std::ranges::find_if(_subscribers, [subscriber](const Entry &e) { return e.subscriber == subscriber; });
        if (it != _subscribers.end()) { _subscribers.erase(it); }
    }

    bool Subject::is_subscribed(subscriber_ptr subscriber) const {
        return std::ranges::any_of(_subscribers, [subscriber](const Entry &e) {
            return e.subscriber == subscriber && !e.ref.expired();
        });
    }

    std::size_t Subject::subscriber_count() const {
        return static_cast<std::size_t>(
            std::ranges::count_if(_subscribers, [](const Entry &e) { return !e.ref.expired(); }));
    }

    void Subject::depend() {
        if (auto target = EvaluationStack::current(); target != nullptr) { target->add_dependency(shared_from_this()); }
    }

    void Subject::notify() {
        // Lock the snapshot so subscribers released while notifying stay valid until the pass completes
        std::vector<subscriber_s_ptr> snapshot;
        snapshot.reserve(_subscribers.size());
        for (const auto &entry : _subscribers) {
            if (auto s = entry.ref.lock(); s) { snapshot.push_back(std::move(s)); }
        }
        if (!config().async) {
            // Synchronous flushing has no scheduler sort, keep creation order here instead
            std::ranges::sort(snapshot, {}, [](const subscriber_s_ptr &s) { return s->id(); });
        }
        for (const auto &subscriber : snapshot) { subscriber->invalidate(); }
    }

    void Subject::prune() {
        std::erase_if(_subscribers, [](const Entry &e) { return e.ref.expired(); });
    }
} // namespace reactree
