#ifndef REACTREE_ARRAY_H
#define REACTREE_ARRAY_H

#include <reactree/types/value.h>

#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <vector>

namespace reactree {
    /**
     * A mutable ordered sequence of values.
     *
     * Element reads, index assignment and resize are plain operations. The seven mutators (push, pop, shift, unshift,
     * splice, sort and reverse) are intercepted once the array is instrumented: the mutation is applied, inserted
     * elements are instrumented and then the array's collection Subject is notified.
     */
    class REACTREE_EXPORT Array {
    public:
        using storage_type = std::vector<Value>;
        using const_iterator = storage_type::const_iterator;
        using comparator_type = std::function<bool(const Value &lhs, const Value &rhs)>;

        Array();

        Array(std::initializer_list<Value> values);

        explicit Array(storage_type values);

        Array(const Array &) = delete;

        Array &operator=(const Array &) = delete;

        ~Array();

        static array_s_ptr make();

        static array_s_ptr make(std::initializer_list<Value> values);

        static array_s_ptr make(storage_type values);

        [[nodiscard]] std::size_t size() const;

        [[nodiscard]] bool empty() const;

        /**
         * Element at index, throws std::out_of_range when the index is not within bounds.
         */
        [[nodiscard]] const Value &at(std::size_t index) const;

        [[nodiscard]] const storage_type &values() const;

        [[nodiscard]] const_iterator begin() const;

        [[nodiscard]] const_iterator end() const;

        // Plain, unobserved operations

        /**
         * Assign an element, growing the array with Undefined when index is past the end.
         */
        void assign(std::size_t index, Value value);

        void resize(std::size_t size);

        // Intercepted mutators

        std::size_t push(Value value);

        std::size_t push(storage_type values);

        Value pop();

        Value shift();

        std::size_t unshift(Value value);

        std::size_t unshift(storage_type values);

        /**
         * Remove delete_count elements at start (all remaining elements when not supplied) and insert items in their
         * place. Negative start counts back from the end; both start and count are clamped to the array bounds.
         * Returns the removed elements.
         */
        storage_type splice(std::int64_t start, std::optional<std::int64_t> delete_count = std::nullopt,
                            storage_type items = {});

        /**
         * Stable sort. Without a comparator elements are ordered by their string rendering, undefined last.
         */
        void sort(const comparator_type &comparator = {});

        void reverse();

        void freeze();

        [[nodiscard]] bool is_frozen() const;

        void mark_raw();

        [[nodiscard]] bool is_raw() const;

        [[nodiscard]] interceptor_ptr interceptor() const;

        [[nodiscard]] bool is_instrumented() const;

    private:
        friend class Interceptor;

        void mutated(const storage_type &inserted);

        storage_type _values;
        std::unique_ptr<Interceptor> _interceptor;
        bool _frozen{false};
        bool _raw{false};
    };
} // namespace reactree

#endif  // REACTREE_ARRAY_H
