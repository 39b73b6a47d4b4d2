#ifndef REACTREE_INTERCEPTOR_H
#define REACTREE_INTERCEPTOR_H

#include <reactree/types/array.h>
#include <reactree/types/object.h>
#include <reactree/types/subject.h>

namespace reactree {
    /**
     * The reactive instrumentation attached to one Object or Array.
     *
     * The interceptor owns the "shape" subject: for objects it is notified when properties are added or removed
     * through set / del, for arrays it is the collection subject notified by every intercepted mutator. Per-property
     * subjects live on the Object's properties.
     *
     * vm_count tracks how many live components use the object as their root data; properties can not be added to or
     * removed from root data at runtime.
     */
    class REACTREE_EXPORT Interceptor {
    public:
        Interceptor();

        Interceptor(const Interceptor &) = delete;

        Interceptor &operator=(const Interceptor &) = delete;

        [[nodiscard]] const subject_s_ptr &subject() const { return _subject; }

        [[nodiscard]] std::size_t vm_count() const { return _vm_count; }

        void retain_root() { ++_vm_count; }

        void release_root() {
            if (_vm_count > 0) { --_vm_count; }
        }

        /**
         * Attach an interceptor to value if it is an Object or Array that is not frozen and not raw, and observation
         * is currently enabled. Returns the (new or existing) interceptor, or nullptr when the value is not
         * instrumentable. Existing interceptors are returned even while observation is suspended.
         */
        static interceptor_ptr instrument(const Value &value, bool as_root_data = false);

        /**
         * Install an accessor for key on object, instrumenting value unless shallow.
         */
        static void define_reactive(Object &object, std::string_view key, Value value, bool shallow = false);

        /**
         * Suspend (false) or resume (true) instrumentation of new values.
         */
        static void toggle_observing(bool value);

        [[nodiscard]] static bool should_observe();

        /**
         * Register the current evaluation with the collection subject of every instrumented element of array,
         * recursively.
         */
        static void depend_array(const Array &array);

        /**
         * The shape subject of value, or nullptr when value is not instrumented.
         */
        [[nodiscard]] static subject_s_ptr subject_of(const Value &value);

    private:
        friend class Object;
        friend class Array;

        [[nodiscard]] static Value reactive_get(const Object::Property &property);

        static void reactive_set(Object::Property &property, Value value);

        static void observe_array(const Array::storage_type &values);

        subject_s_ptr _subject;
        std::size_t _vm_count{0};
    };

    /**
     * RAII suspension of instrumentation, restoring the previous setting on exit.
     */
    struct REACTREE_EXPORT ObservingScope {
        explicit ObservingScope(bool value);

        ~ObservingScope();

        ObservingScope(const ObservingScope &) = delete;

        ObservingScope &operator=(const ObservingScope &) = delete;

    private:
        bool _previous;
    };

    /**
     * Add or update a property so that the change is observed. New properties on an instrumented object are given
     * an accessor and the object's shape subject is notified. Root component data is refused with a warning.
     */
    REACTREE_EXPORT Value set(const object_s_ptr &target, std::string_view key, Value value);

    /**
     * Set an array element through the intercepted splice, growing the array first when index is past the end.
     */
    REACTREE_EXPORT Value set(const array_s_ptr &target, std::size_t index, Value value);

    /**
     * Dispatches on the target type. Undefined, null or primitive targets are reported and ignored. Array targets
     * require a non-negative integer key, object targets a string key.
     */
    REACTREE_EXPORT Value set(const Value &target, const Value &key, Value value);

    /**
     * Delete a property and notify the object's shape subject. Root component data is refused with a warning.
     */
    REACTREE_EXPORT void del(const object_s_ptr &target, std::string_view key);

    /**
     * Remove an array element through the intercepted splice.
     */
    REACTREE_EXPORT void del(const array_s_ptr &target, std::size_t index);

    REACTREE_EXPORT void del(const Value &target, const Value &key);
} // namespace reactree

#endif  // REACTREE_INTERCEPTOR_H
