#ifndef REACTREE_VALUE_H
#define REACTREE_VALUE_H

#include <reactree/reactree_base.h>

#include <concepts>
#include <variant>

namespace reactree {
    struct Undefined {
        friend bool operator==(const Undefined &, const Undefined &) = default;
    };

    struct Null {
        friend bool operator==(const Null &, const Null &) = default;
    };

    enum class ValueType : std::uint8_t {
        UNDEFINED = 0,
        NULL_VALUE = 1,
        BOOL = 2,
        INT = 3,
        DOUBLE = 4,
        STRING = 5,
        OBJECT = 6,
        ARRAY = 7
    };

    REACTREE_EXPORT std::string_view to_string(ValueType type);

    /**
     * A single slot in the mutable data graph.
     *
     * Primitives are held by value, objects and arrays by shared reference. Two values holding the same Object are
     * the same value; two distinct Objects with identical contents are not. This identity semantic is what the
     * property setters use to decide whether a write is a change.
     */
    class REACTREE_EXPORT Value {
    public:
        using variant_t = std::variant<Undefined, Null, bool, std::int64_t, double, std::string, object_s_ptr, array_s_ptr>;

        Value() = default;

        Value(Undefined) {}

        Value(Null v) : _value{v} {}

        Value(std::nullptr_t) : _value{Null{}} {}

        Value(bool v) : _value{v} {}

        template<std::integral T>
            requires (!std::same_as<T, bool>)
        Value(T v) : _value{static_cast<std::int64_t>(v)} {}

        template<std::floating_point T>
        Value(T v) : _value{static_cast<double>(v)} {}

        Value(const char *v) : _value{std::string{v}} {}

        Value(std::string v) : _value{std::move(v)} {}

        Value(std::string_view v) : _value{std::string{v}} {}

        Value(object_s_ptr v);

        Value(array_s_ptr v);

        [[nodiscard]] ValueType type() const { return static_cast<ValueType>(_value.index()); }

        [[nodiscard]] bool is_undefined() const { return type() == ValueType::UNDEFINED; }

        [[nodiscard]] bool is_null() const { return type() == ValueType::NULL_VALUE; }

        [[nodiscard]] bool is_nullish() const { return is_undefined() || is_null(); }

        [[nodiscard]] bool is_bool() const { return type() == ValueType::BOOL; }

        [[nodiscard]] bool is_int() const { return type() == ValueType::INT; }

        [[nodiscard]] bool is_double() const { return type() == ValueType::DOUBLE; }

        [[nodiscard]] bool is_number() const { return is_int() || is_double(); }

        [[nodiscard]] bool is_string() const { return type() == ValueType::STRING; }

        [[nodiscard]] bool is_object() const { return type() == ValueType::OBJECT; }

        [[nodiscard]] bool is_array() const { return type() == ValueType::ARRAY; }

        /**
         * True for objects and arrays, the values that can carry an Interceptor.
         */
        [[nodiscard]] bool is_reference() const { return is_object() || is_array(); }

        [[nodiscard]] bool is_primitive() const { return !is_reference(); }

        [[nodiscard]] bool as_bool() const;

        [[nodiscard]] std::int64_t as_int() const;

        [[nodiscard]] double as_double() const;

        /**
         * Numeric value of an INT or DOUBLE.
         */
        [[nodiscard]] double as_number() const;

        [[nodiscard]] const std::string &as_string() const;

        [[nodiscard]] const object_s_ptr &as_object() const;

        [[nodiscard]] const array_s_ptr &as_array() const;

        /**
         * Truthiness in the usual scripting sense: undefined, null, false, 0, NaN and "" are false.
         */
        [[nodiscard]] bool truthy() const;

        [[nodiscard]] const variant_t &variant() const { return _value; }

        /**
         * A short, human readable rendering used in diagnostics. Nested containers are rendered to a fixed depth.
         */
        [[nodiscard]] std::string to_string(std::size_t max_depth = 3) const;

        /**
         * The identity comparison used by reactive setters.
         */
        friend REACTREE_EXPORT bool same_value(const Value &lhs, const Value &rhs);

        friend bool operator==(const Value &lhs, const Value &rhs) { return same_value(lhs, rhs); }

    private:
        variant_t _value{Undefined{}};
    };

    REACTREE_EXPORT bool same_value(const Value &lhs, const Value &rhs);
} // namespace reactree

#endif  // REACTREE_VALUE_H
