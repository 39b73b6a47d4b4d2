#include <reactree/types/array.h>
#include <reactree/types/object.h>
#include <reactree/types/value.h>
#include <reactree/util/errors.h>

#include <fmt/ranges.h>

#include <cmath>

namespace reactree {
    std::string_view to_string(ValueType type) {
        switch (type) {
            case ValueType::UNDEFINED: return "undefined";
            case ValueType::NULL_VALUE: return "null";
            case ValueType::BOOL: return "bool";
            case ValueType::INT: return "int";
            case ValueType::DOUBLE: return "double";
            case ValueType::STRING: return "string";
            case ValueType::OBJECT: return "object";
            case ValueType::ARRAY: return "array";
        }
        return "unknown";
    }

    Value::Value(object_s_ptr v) {
        if (v) { _value = std::move(v); } else { _value = Null{}; }
    }

    Value::Value(array_s_ptr v) {
        if (v) { _value = std::move(v); } else { _value = Null{}; }
    }

    bool Value::as_bool() const {
        if (!is_bool()) { throw_error<bad_value_access>("bool", reactree::to_string(type())); }
        return std::get<bool>(_value);
    }

    std::int64_t Value::as_int() const {
        if (!is_int()) { throw_error<bad_value_access>("int", reactree::to_string(type())); }
        return std::get<std::int64_t>(_value);
    }

    double Value::as_double() const {
        if (!is_double()) { throw_error<bad_value_access>("double", reactree::to_string(type())); }
        return std::get<double>(_value);
    }

    double Value::as_number() const {
        if (is_int()) { return static_cast<double>(std::get<std::int64_t>(_value)); }
        if (is_double()) { return std::get<double>(_value); }
        throw_error<bad_value_access>("number", reactree::to_string(type()));
    }

    const std::string &Value::as_string() const {
        if (!is_string()) { throw_error<bad_value_access>("string", reactree::to_string(type())); }
        return std::get<std::string>(_value);
    }

    const object_s_ptr &Value::as_object() const {
        if (!is_object()) { throw_error<bad_value_access>("object", reactree::to_string(type())); }
        return std::get<object_s_ptr>(_value);
    }

    const array_s_ptr &Value::as_array() const {
        if (!is_array()) { throw_error<bad_value_access>("array", reactree::to_string(type())); }
        return std::get<array_s_ptr>(_value);
    }

    bool Value::truthy() const {
        switch (type()) {
            case ValueType::UNDEFINED:
            case ValueType::NULL_VALUE: return false;
            case ValueType::BOOL: return std::get<bool>(_value);
            case ValueType::INT: return std::get<std::int64_t>(_value) != 0;
            case ValueType::DOUBLE: {
                auto d = std::get<double>(_value);
                return d != 0.0 && !std::isnan(d);
            }
            case ValueType::STRING: return !std::get<std::string>(_value).empty();
            case ValueType::OBJECT:
            case ValueType::ARRAY: return true;
        }
        return false;
    }

    std::string Value::to_string(std::size_t max_depth) const {
        switch (type()) {
            case ValueType::UNDEFINED: return "undefined";
            case ValueType::NULL_VALUE: return "null";
            case ValueType::BOOL: return std::get<bool>(_value) ? "true" : "false";
            case ValueType::INT: return fmt::format("{}", std::get<std::int64_t>(_value));
            case ValueType::DOUBLE: return fmt::format("{}", std::get<double>(_value));
            case ValueType::STRING: return std::get<std::string>(_value);
            case ValueType::OBJECT: {
                if (max_depth == 0) { return "{...}"; }
                const auto &obj = std::get<object_s_ptr>(_value);
                std::vector<std::string> parts;
                for (const auto &key : obj->keys()) {
                    auto v = obj->peek(key);
                    parts.push_back(fmt::format("{}: {}", key,
                                                v.is_string() ? fmt::format("\"{}\"", v.as_string())
                                                              : v.to_string(max_depth - 1)));
                }
                return fmt::format("{{{}}}", fmt::join(parts, ", "));
            }
            case ValueType::ARRAY: {
                if (max_depth == 0) { return "[...]"; }
                const auto &arr = std::get<array_s_ptr>(_value);
                std::vector<std::string> parts;
                for (const auto &v : *arr) {
                    parts.push_back(v.is_string() ? fmt::format("\"{}\"", v.as_string()) : v.to_string(max_depth - 1));
                }
                return fmt::format("[{}]", fmt::join(parts, ", "));
            }
        }
        return {};
    }

    bool same_value(const Value &lhs, const Value &rhs) {
        if (lhs.type() != rhs.type()) { return false; }
        switch (lhs.type()) {
            case ValueType::UNDEFINED:
            case ValueType::NULL_VALUE: return true;
            case ValueType::BOOL: return std::get<bool>(lhs._value) == std::get<bool>(rhs._value);
            case ValueType::INT: return std::get<std::int64_t>(lhs._value) == std::get<std::int64_t>(rhs._value);
            case ValueType::DOUBLE: {
                auto l = std::get<double>(lhs._value);
                auto r = std::get<double>(rhs._value);
                // NaN is never equal to itself, treat two NaNs as the same value so they do not notify forever
                return l == r || (std::isnan(l) && std::isnan(r));
            }
            case ValueType::STRING: return std::get<std::string>(lhs._value) == std::get<std::string>(rhs._value);
            case ValueType::OBJECT: return std::get<object_s_ptr>(lhs._value) == std::get<object_s_ptr>(rhs._value);
            case ValueType::ARRAY: return std::get<array_s_ptr>(lhs._value) == std::get<array_s_ptr>(rhs._value);
        }
        return false;
    }
} // namespace reactree
