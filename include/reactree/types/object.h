#ifndef REACTREE_OBJECT_H
#define REACTREE_OBJECT_H

#include <reactree/types/value.h>
#include <reactree/util/string_hash.h>

#include <functional>
#include <initializer_list>
#include <memory>
#include <utility>
#include <vector>

namespace reactree {
    /**
     * A mutable, insertion-ordered property bag.
     *
     * Until an Interceptor is attached an Object is plain data: reads and writes are not tracked. Once instrumented,
     * every property that existed at that point (or was later added through reactree::set) carries its own Subject and
     * get / put go through the reactive read / write path. A property added with put after instrumentation is a plain
     * property and is not observed, use reactree::set to add observable properties.
     */
    class REACTREE_EXPORT Object {
    public:
        struct Property {
            Value value;
            // Present once the property has an accessor installed
            subject_s_ptr subject;
            bool shallow{false};
        };

        using map_type = string_map<Property>;

        Object();

        Object(std::initializer_list<std::pair<std::string, Value>> properties);

        Object(const Object &) = delete;

        Object &operator=(const Object &) = delete;

        ~Object();

        static object_s_ptr make();

        static object_s_ptr make(std::initializer_list<std::pair<std::string, Value>> properties);

        /**
         * Read a property, registering the current evaluation with it when the property is reactive.
         * Missing properties read as Undefined.
         */
        [[nodiscard]] Value get(std::string_view key) const;

        /**
         * Write a property. Reactive properties notify their subscribers when the value changes identity; unknown
         * keys are defined as plain (unobserved) properties. Writes to a frozen object are ignored.
         */
        void put(std::string_view key, Value value);

        /**
         * Read a property without tracking.
         */
        [[nodiscard]] Value peek(std::string_view key) const;

        [[nodiscard]] bool has(std::string_view key) const;

        [[nodiscard]] bool is_reactive_property(std::string_view key) const;

        /**
         * Plain delete, nothing is notified. Returns true when the key existed.
         */
        bool remove(std::string_view key);

        [[nodiscard]] std::vector<std::string> keys() const;

        [[nodiscard]] std::size_t size() const;

        [[nodiscard]] bool empty() const;

        void freeze();

        [[nodiscard]] bool is_frozen() const;

        /**
         * Marks the object as never to be instrumented.
         */
        void mark_raw();

        [[nodiscard]] bool is_raw() const;

        [[nodiscard]] interceptor_ptr interceptor() const;

        [[nodiscard]] bool is_instrumented() const;

    private:
        friend class Interceptor;

        [[nodiscard]] Property *find_property(std::string_view key);

        [[nodiscard]] const Property *find_property(std::string_view key) const;

        map_type _properties;
        std::unique_ptr<Interceptor> _interceptor;
        bool _frozen{false};
        bool _raw{false};
    };
} // namespace reactree

#endif  // REACTREE_OBJECT_H
