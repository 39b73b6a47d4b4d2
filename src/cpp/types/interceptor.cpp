#include <reactree/runtime/evaluation_stack.h>
#include <reactree/types/interceptor.h>
#include <reactree/util/diagnostics.h>

#include <ankerl/unordered_dense.h>

#include <charconv>
#include <cmath>
#include <limits>

namespace reactree {
    namespace {
        bool &observing_flag() {
            static bool observing{true};
            return observing;
        }

        void depend_array_impl(const Array &array, ankerl::unordered_dense::set<const Array *> &seen) {
            if (!seen.insert(&array).second) { return; }
            for (const auto &element : array) {
                if (auto subject = Interceptor::subject_of(element); subject) { subject->depend(); }
                if (element.is_array()) { depend_array_impl(*element.as_array(), seen); }
            }
        }

        std::optional<std::size_t> array_index(const Value &key) {
            if (key.is_int()) {
                auto i = key.as_int();
                return i >= 0 ? std::optional<std::size_t>{static_cast<std::size_t>(i)} : std::nullopt;
            }
            if (key.is_double()) {
                auto d = key.as_double();
                if (std::isfinite(d) && d >= 0 && std::floor(d) == d &&
                    d < static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
                    return static_cast<std::size_t>(d);
                }
                return std::nullopt;
            }
            if (key.is_string()) {
                const auto &s = key.as_string();
                std::size_t index{0};
                auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), index);
                if (ec == std::errc{} && ptr == s.data() + s.size() && !s.empty()) { return index; }
            }
            return std::nullopt;
        }

        std::string property_key(const Value &key) { return key.is_string() ? key.as_string() : key.to_string(); }
    } // namespace

    Interceptor::Interceptor() : _subject{Subject::make()} {}

    interceptor_ptr Interceptor::instrument(const Value &value, bool as_root_data) {
        interceptor_ptr result{nullptr};
        if (value.is_object()) {
            auto &object = *value.as_object();
            if (object._interceptor) {
                result = object._interceptor.get();
            } else if (should_observe() && !object._frozen && !object._raw) {
                // Attach before walking so cycles back to this object find the existing interceptor
                object._interceptor = std::make_unique<Interceptor>();
                result = object._interceptor.get();
                for (auto &[key, property] : object._properties) {
                    if (!property.subject) {
                        property.subject = Subject::make();
                        property.shallow = false;
                    }
                    if (!property.shallow) { instrument(property.value); }
                }
            }
        } else if (value.is_array()) {
            auto &array = *value.as_array();
            if (array._interceptor) {
                result = array._interceptor.get();
            } else if (should_observe() && !array._frozen && !array._raw) {
                array._interceptor = std::make_unique<Interceptor>();
                result = array._interceptor.get();
                observe_array(array._values);
            }
        }
        if (as_root_data && result != nullptr) { result->retain_root(); }
        return result;
    }

    void Interceptor::define_reactive(Object &object, std::string_view key, Value value, bool shallow) {
        if (object._frozen) { return; }
        auto property = object.find_property(key);
        if (property == nullptr) {
            property = &object._properties.emplace(std::string{key}, Object::Property{}).first->second;
        }
        property->value = std::move(value);
        property->subject = Subject::make();
        property->shallow = shallow;
        if (!shallow) { instrument(property->value); }
    }

    void Interceptor::toggle_observing(bool value) { observing_flag() = value; }

    bool Interceptor::should_observe() { return observing_flag(); }

    void Interceptor::depend_array(const Array &array) {
        ankerl::unordered_dense::set<const Array *> seen;
        depend_array_impl(array, seen);
    }

    subject_s_ptr Interceptor::subject_of(const Value &value) {
        if (value.is_object()) {
            if (auto interceptor = value.as_object()->interceptor(); interceptor != nullptr) {
                return interceptor->subject();
            }
        } else if (value.is_array()) {
            if (auto interceptor = value.as_array()->interceptor(); interceptor != nullptr) {
                return interceptor->subject();
            }
        }
        return nullptr;
    }

    Value Interceptor::reactive_get(const Object::Property &property) {
        auto value = property.value;
        if (EvaluationStack::current() != nullptr) {
            auto subject = property.subject;
            subject->depend();
            if (!property.shallow) {
                if (auto child = instrument(value); child != nullptr) {
                    child->subject()->depend();
                    if (value.is_array()) { depend_array(*value.as_array()); }
                }
            }
        }
        return value;
    }

    void Interceptor::reactive_set(Object::Property &property, Value value) {
        if (same_value(property.value, value)) { return; }
        property.value = std::move(value);
        if (!property.shallow) { instrument(property.value); }
        // Notifying can run synchronous watchers that reshape the owning object, so do not touch property after this
        auto subject = property.subject;
        subject->notify();
    }

    void Interceptor::observe_array(const Array::storage_type &values) {
        for (const auto &value : values) { instrument(value); }
    }

    ObservingScope::ObservingScope(bool value) : _previous{Interceptor::should_observe()} {
        Interceptor::toggle_observing(value);
    }

    ObservingScope::~ObservingScope() { Interceptor::toggle_observing(_previous); }

    Value set(const object_s_ptr &target, std::string_view key, Value value) {
        if (!target) {
            warn("Cannot set reactive property on undefined, null, or primitive value: null");
            return value;
        }
        if (target->is_frozen()) { return value; }
        if (target->has(key)) {
            target->put(key, value);
            return value;
        }
        auto interceptor = target->interceptor();
        if (interceptor != nullptr && interceptor->vm_count() > 0) {
            warn("Avoid adding reactive properties to a component's root data at runtime - declare it upfront in the "
                 "data function.");
            return value;
        }
        if (interceptor == nullptr) {
            target->put(key, value);
            return value;
        }
        Interceptor::define_reactive(*target, key, value);
        auto subject = interceptor->subject();
        subject->notify();
        return value;
    }

    Value set(const array_s_ptr &target, std::size_t index, Value value) {
        if (!target) {
            warn("Cannot set reactive property on undefined, null, or primitive value: null");
            return value;
        }
        if (target->is_frozen()) { return value; }
        if (index > target->size()) { target->resize(index); }
        target->splice(static_cast<std::int64_t>(index), 1, {value});
        return value;
    }

    Value set(const Value &target, const Value &key, Value value) {
        if (target.is_array()) {
            if (auto index = array_index(key); index.has_value()) { return set(target.as_array(), *index, std::move(value)); }
            warn("Cannot set key '{}' on an array, only non-negative integer indices are supported", key.to_string());
            return value;
        }
        if (target.is_object()) { return set(target.as_object(), property_key(key), std::move(value)); }
        warn("Cannot set reactive property on undefined, null, or primitive value: {}", target.to_string());
        return value;
    }

    void del(const object_s_ptr &target, std::string_view key) {
        if (!target) {
            warn("Cannot delete reactive property on undefined, null, or primitive value: null");
            return;
        }
        if (target->is_frozen()) { return; }
        auto interceptor = target->interceptor();
        if (interceptor != nullptr && interceptor->vm_count() > 0) {
            warn("Avoid deleting properties on a component's root data - just set it to null.");
            return;
        }
        if (!target->remove(key)) { return; }
        if (interceptor == nullptr) { return; }
        auto subject = interceptor->subject();
        subject->notify();
    }

    void del(const array_s_ptr &target, std::size_t index) {
        if (!target) {
            warn("Cannot delete reactive property on undefined, null, or primitive value: null");
            return;
        }
        if (target->is_frozen() || index >= target->size()) { return; }
        target->splice(static_cast<std::int64_t>(index), 1);
    }

    void del(const Value &target, const Value &key) {
        if (target.is_array()) {
            if (auto index = array_index(key); index.has_value()) { del(target.as_array(), *index); }
            return;
        }
        if (target.is_object()) {
            del(target.as_object(), property_key(key));
            return;
        }
        warn("Cannot delete reactive property on undefined, null, or primitive value: {}", target.to_string());
    }
} // namespace reactree
