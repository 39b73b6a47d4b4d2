#include <reactree/types/array.h>
#include <reactree/types/interceptor.h>
#include <reactree/util/errors.h>

#include <algorithm>

namespace reactree {
    Array::Array() = default;

    Array::Array(std::initializer_list<Value> values) : _values{values} {}

    Array::Array(storage_type values) : _values{std::move(values)} {}

    Array::~Array() = default;

    array_s_ptr Array::make() { return std::make_shared<Array>(); }

    array_s_ptr Array::make(std::initializer_list<Value> values) { return std::make_shared<Array>(values); }

    array_s_ptr Array::make(storage_type values) { return std::make_shared<Array>(std::move(values)); }

    std::size_t Array::size() const { return _values.size(); }

    bool Array::empty() const { return _values.empty(); }

    const Value &Array::at(std::size_t index) const {
        if (index >= _values.size()) {
            throw_error<std::out_of_range>("Array index {} out of range for size {}", index, _values.size());
        }
        return _values[index];
    }

    const Array::storage_type &Array::values() const { return _values; }

    Array::const_iterator Array::begin() const { return _values.begin(); }

    Array::const_iterator Array::end() const { return _values.end(); }

    void Array::assign(std::size_t index, Value value) {
        if (_frozen) { return; }
        if (index >= _values.size()) { _values.resize(index + 1); }
        _values[index] = std::move(value);
    }

    void Array::resize(std::size_t size) {
        if (_frozen) { return; }
        _values.resize(size);
    }

    std::size_t Array::push(Value value) { return push(storage_type{std::move(value)}); }

    std::size_t Array::push(storage_type values) {
        if (_frozen) { return _values.size(); }
        _values.insert(_values.end(), values.begin(), values.end());
        mutated(values);
        return _values.size();
    }

    Value Array::pop() {
        if (_frozen) { return {}; }
        Value result;
        if (!_values.empty()) {
            result = std::move(_values.back());
            _values.pop_back();
        }
        mutated({});
        return result;
    }

    Value Array::shift() {
        if (_frozen) { return {}; }
        Value result;
        if (!_values.empty()) {
            result = std::move(_values.front());
            _values.erase(_values.begin());
        }
        mutated({});
        return result;
    }

    std::size_t Array::unshift(Value value) { return unshift(storage_type{std::move(value)}); }

    std::size_t Array::unshift(storage_type values) {
        if (_frozen) { return _values.size(); }
        _values.insert(_values.begin(), values.begin(), values.end());
        mutated(values);
        return _values.size();
    }

    Array::storage_type Array::splice(std::int64_t start, std::optional<std::int64_t> delete_count, storage_type items) {
        if (_frozen) { return {}; }
        auto length = static_cast<std::int64_t>(_values.size());
        auto actual_start = start < 0 ? std::max<std::int64_t>(length + start, 0) : std::min(start, length);
        auto actual_count = delete_count.has_value()
                                ? std::clamp<std::int64_t>(*delete_count, 0, length - actual_start)
                                : length - actual_start;

        auto first = _values.begin() + actual_start;
        auto last = first + actual_count;
        storage_type removed{std::make_move_iterator(first), std::make_move_iterator(last)};
        auto position = _values.erase(first, last);
        _values.insert(position, items.begin(), items.end());
        mutated(items);
        return removed;
    }

    void Array::sort(const comparator_type &comparator) {
        if (_frozen) { return; }
        std::ranges::stable_sort(_values, [&comparator](const Value &lhs, const Value &rhs) {
            // Undefined always sorts to the end and is never passed to the comparator
            if (lhs.is_undefined() || rhs.is_undefined()) { return !lhs.is_undefined() && rhs.is_undefined(); }
            if (comparator) { return comparator(lhs, rhs); }
            return lhs.to_string() < rhs.to_string();
        });
        mutated({});
    }

    void Array::reverse() {
        if (_frozen) { return; }
        std::ranges::reverse(_values);
        mutated({});
    }

    void Array::freeze() { _frozen = true; }

    bool Array::is_frozen() const { return _frozen; }

    void Array::mark_raw() { _raw = true; }

    bool Array::is_raw() const { return _raw; }

    interceptor_ptr Array::interceptor() const { return _interceptor.get(); }

    bool Array::is_instrumented() const { return _interceptor != nullptr; }

    void Array::mutated(const storage_type &inserted) {
        if (!_interceptor) { return; }
        if (!inserted.empty()) { Interceptor::observe_array(inserted); }
        // Hold the subject, a subscriber may drop the last reference to this array while being notified
        auto subject = _interceptor->subject();
        subject->notify();
    }
} // namespace reactree
