#include <reactree/types/interceptor.h>
#include <reactree/types/object.h>

namespace reactree {
    Object::Object() = default;

    Object::Object(std::initializer_list<std::pair<std::string, Value>> properties) {
        for (const auto &[key, value] : properties) { _properties.insert_or_assign(key, Property{value, nullptr, false}); }
    }

    Object::~Object() = default;

    object_s_ptr Object::make() { return std::make_shared<Object>(); }

    object_s_ptr Object::make(std::initializer_list<std::pair<std::string, Value>> properties) {
        return std::make_shared<Object>(properties);
    }

    Value Object::get(std::string_view key) const {
        auto property = find_property(key);
        if (property == nullptr) { return {}; }
        if (property->subject) { return Interceptor::reactive_get(*property); }
        return property->value;
    }

    void Object::put(std::string_view key, Value value) {
        if (_frozen) { return; }
        if (auto property = find_property(key); property != nullptr) {
            if (property->subject) {
                Interceptor::reactive_set(*property, std::move(value));
            } else {
                property->value = std::move(value);
            }
            return;
        }
        _properties.emplace(std::string{key}, Property{std::move(value), nullptr, false});
    }

    Value Object::peek(std::string_view key) const {
        auto property = find_property(key);
        return property == nullptr ? Value{} : property->value;
    }

    bool Object::has(std::string_view key) const { return find_property(key) != nullptr; }

    bool Object::is_reactive_property(std::string_view key) const {
        auto property = find_property(key);
        return property != nullptr && property->subject != nullptr;
    }

    bool Object::remove(std::string_view key) {
        if (_frozen) { return false; }
        auto it = _properties.find(key);
        if (it == _properties.end()) { return false; }
        // erase() moves the last entry into the hole, rebuild instead to keep insertion order
        auto index = static_cast<std::size_t>(it - _properties.begin());
        auto values = _properties.extract();
        values.erase(values.begin() + static_cast<std::ptrdiff_t>(index));
        _properties.replace(std::move(values));
        return true;
    }

    std::vector<std::string> Object::keys() const {
        std::vector<std::string> result;
        result.reserve(_properties.size());
        for (const auto &[key, _] : _properties) { result.push_back(key); }
        return result;
    }

    std::size_t Object::size() const { return _properties.size(); }

    bool Object::empty() const { return _properties.empty(); }

    void Object::freeze() { _frozen = true; }

    bool Object::is_frozen() const { return _frozen; }

    void Object::mark_raw() { _raw = true; }

    bool Object::is_raw() const { return _raw; }

    interceptor_ptr Object::interceptor() const { return _interceptor.get(); }

    bool Object::is_instrumented() const { return _interceptor != nullptr; }

    Object::Property *Object::find_property(std::string_view key) {
        auto it = _properties.find(key);
        return it == _properties.end() ? nullptr : &it->second;
    }

    const Object::Property *Object::find_property(std::string_view key) const {
        auto it = _properties.find(key);
        return it == _properties.end() ? nullptr : &it->second;
    }
} // namespace reactree
