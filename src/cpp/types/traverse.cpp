#include <reactree/types/array.h>
#include <reactree/types/interceptor.h>
#include <reactree/types/object.h>
#include <reactree/types/traverse.h>

#include <ankerl/unordered_dense.h>

namespace reactree {
    namespace {
        struct TraverseState {
            ankerl::unordered_dense::set<Subject::id_type> seen_subjects;
            // Uninstrumented containers have no subject, guard those by address
            ankerl::unordered_dense::set<const void *> seen_plain;

            bool visit(const void *address, const subject_s_ptr &subject) {
                if (subject) { return seen_subjects.insert(subject->id()).second; }
                return seen_plain.insert(address).second;
            }
        };

        void traverse_impl(const Value &value, TraverseState &state) {
            if (value.is_array()) {
                const auto &array = *value.as_array();
                if (array.is_frozen() || array.is_raw()) { return; }
                if (!state.visit(&array, Interceptor::subject_of(value))) { return; }
                for (auto i = array.size(); i-- > 0;) { traverse_impl(array.at(i), state); }
            } else if (value.is_object()) {
                const auto &object = *value.as_object();
                if (object.is_frozen() || object.is_raw()) { return; }
                if (!state.visit(&object, Interceptor::subject_of(value))) { return; }
                auto keys = object.keys();
                for (auto i = keys.size(); i-- > 0;) { traverse_impl(object.get(keys[i]), state); }
            }
        }
    } // namespace

    void traverse(const Value &value) {
        TraverseState state;
        traverse_impl(value, state);
    }
} // namespace reactree
