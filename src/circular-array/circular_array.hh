#pragma once

#include <circular-array/assertf.hh>
#include <circular-array/circular_array_error.hh>
#include <circular-array/fixed_array.hh>
#include <circular-array/fwd.hh>
#include <circular-array/optional.hh>
#include <circular-array/result.hh>
#include <circular-array/to_debug_string.hh>
#include <circular-array/utility.hh>

#include <algorithm>
#include <concepts>
#include <format>
#include <initializer_list>
#include <iterator>
#include <string>


/// Fixed-capacity ring buffer that keeps the N most recently pushed elements.
/// push() never fails: once N elements are held, each push overwrites the oldest one.
///
/// Elements are addressed by logical index, 0 being the oldest live element and size() - 1 the newest.
/// The physical slot of a logical index moves as the buffer wraps:
///   len() <  N: logical i lives in slot i, slots [len(), N) hold filler
///   len() >= N: logical i lives in slot (_next_write + i) % N, _next_write is the oldest element
///
/// len() counts every push ever made and may exceed N; size() is the number of live elements.
///
/// Access styles:
///   arr[i]                   - asserts 0 <= i < size()
///   arr.get(i) / get_mut(i)  - empty optional for indices that are not live
///   arr.replace(i, v)        - result with circular_array_error::index_out_of_range
///
/// Storage is inline (a fixed_array<T, N>), all slots value-initialized at construction.
/// Not thread-safe; any mutation invalidates running iterations.
template <class T, ca::isize N>
struct ca::circular_array
{
    static_assert(N >= 1, "circular_array capacity must be at least 1");
    static_assert(std::default_initializable<T> && std::copyable<T>,
                  "circular_array elements must be default-constructible and copyable");

    using iterator = circular_array_iterator<T, N>;

    // construction
public:
    /// Empty buffer: len() == 0, every slot holds T{}.
    constexpr circular_array() = default;

    /// Pushes each element of values in order.
    /// More than N values keep only the last N.
    [[nodiscard]] static constexpr circular_array create_from(std::initializer_list<T> values)
    {
        circular_array arr;
        for (auto const& v : values)
            arr.push(v);
        return arr;
    }

    // insertion
public:
    /// Appends value as the newest element, overwriting the oldest one if the buffer is full.
    constexpr void push(T const& value)
    {
        _data[_next_write] = value;
        impl_advance();
    }
    constexpr void push(T&& value)
    {
        _data[_next_write] = ca::move(value);
        impl_advance();
    }

    /// Constructs a T from args and pushes it.
    /// Returns the new newest element.
    template <class... Args>
    constexpr T& emplace(Args&&... args)
    {
        auto& slot = _data[_next_write];
        slot = T(ca::forward<Args>(args)...);
        impl_advance();
        return slot;
    }

    /// Forgets all elements: len() == 0 and every slot is reset to T{}.
    constexpr void clear()
    {
        for (auto& v : _data)
            v = T{};
        _next_write = 0;
        _count = 0;
    }

    // element access
public:
    /// Element at logical index i.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i)
    {
        CA_ASSERTF(0 <= i && i < size(), "logical index {} out of bounds (live elements: {}, capacity: {})", i,
                   size(), N);
        return _data[impl_physical_index(i)];
    }
    [[nodiscard]] constexpr T const& operator[](isize i) const
    {
        CA_ASSERTF(0 <= i && i < size(), "logical index {} out of bounds (live elements: {}, capacity: {})", i,
                   size(), N);
        return _data[impl_physical_index(i)];
    }

    /// Element at logical index i, or nullopt if i is not in [0, size()).
    [[nodiscard]] constexpr optional<T const&> get(isize i) const
    {
        if (i < 0 || i >= size())
            return nullopt;
        return _data[impl_physical_index(i)];
    }

    /// Writable element at logical index i, or nullopt if i is not in [0, size()).
    [[nodiscard]] constexpr optional<T&> get_mut(isize i)
    {
        if (i < 0 || i >= size())
            return nullopt;
        return _data[impl_physical_index(i)];
    }

    /// Overwrites the element at logical index i and returns its previous value.
    /// An index outside [0, size()) yields index_out_of_range and leaves the buffer unchanged.
    [[nodiscard]] result<T, circular_array_error> replace(isize i, T value)
    {
        if (i < 0 || i >= size())
            return ca::error(circular_array_error{
                .kind = circular_array_error_kind::index_out_of_range,
                .index = i,
                .size = size(),
            });

        return ca::exchange(_data[impl_physical_index(i)], ca::move(value));
    }

    /// Most recently pushed element, nullopt if nothing was pushed.
    [[nodiscard]] constexpr optional<T const&> last() const
    {
        if (_count == 0)
            return nullopt;
        return _data[ca::wrapped_decrement(_next_write, N)];
    }
    [[nodiscard]] constexpr optional<T&> last()
    {
        if (_count == 0)
            return nullopt;
        return _data[ca::wrapped_decrement(_next_write, N)];
    }

    /// Oldest live element, nullopt if nothing was pushed.
    [[nodiscard]] constexpr optional<T const&> first() const
    {
        if (_count == 0)
            return nullopt;
        return _data[impl_physical_index(0)];
    }

    /// Copy of all N slots in logical order.
    /// Positions [0, size()) hold the live elements oldest first.
    /// While the buffer is still filling, positions [size(), N) are filler holding T{}, not elements.
    [[nodiscard]] constexpr fixed_array<T, N> to_array() const
    {
        fixed_array<T, N> res = {};
        if (is_full() && _next_write > 0)
        {
            // [oldest .. end of storage) then [start of storage .. newest]
            auto const oldest = _data.begin() + _next_write;
            auto const out = std::copy(oldest, _data.end(), res.begin());
            std::copy(_data.begin(), oldest, out);
        }
        else
        {
            std::copy(_data.begin(), _data.end(), res.begin());
        }
        return res;
    }

    // queries
public:
    /// Number of pushes since construction (or the last clear()).
    /// NOT capped at N, use size() for the number of live elements.
    [[nodiscard]] constexpr isize len() const { return _count; }

    /// Number of live elements, min(len(), N).
    [[nodiscard]] constexpr isize size() const { return is_full() ? N : _count; }

    [[nodiscard]] static constexpr isize capacity() { return N; }

    [[nodiscard]] constexpr bool empty() const { return _count == 0; }

    /// True once at least N elements were pushed; every further push overwrites.
    [[nodiscard]] constexpr bool is_full() const { return _count >= N; }

    // iteration
public:
    /// Fresh iterator over the live elements, oldest first.
    /// Borrows *this, which must outlive it and must not be mutated while it is in use.
    [[nodiscard]] constexpr iterator iter() const { return iterator(*this); }

    [[nodiscard]] constexpr iterator begin() const { return iterator(*this); }
    [[nodiscard]] constexpr ca::sentinel end() const { return {}; }

    // comparison & debug
public:
    /// Equal if both saw the same number of pushes and hold equal live elements.
    /// Filler slots do not participate.
    [[nodiscard]] friend constexpr bool operator==(circular_array const& lhs, circular_array const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs._count != rhs._count)
            return false;
        for (isize i = 0; i < lhs.size(); ++i)
            if (!(lhs[i] == rhs[i]))
                return false;
        return true;
    }

    /// e.g. "circular_array<3>{len: 4, [2, 3, 4]}"
    [[nodiscard]] std::string to_string() const
    {
        auto s = std::format("circular_array<{}>{{len: {}, ", N, _count);
        s += ca::to_debug_string(iter());
        s += '}';
        return s;
    }

    // helper
private:
    constexpr void impl_advance()
    {
        _next_write = ca::wrapped_increment(_next_write, N);
        ++_count;
    }

    /// Maps a logical index to its slot, without bounds checks.
    [[nodiscard]] constexpr isize impl_physical_index(isize i) const
    {
        if (!is_full())
            return i;

        auto const p = _next_write + i;
        return p >= N ? p - N : p;
    }

    // members
private:
    fixed_array<T, N> _data = {};
    isize _next_write = 0;
    isize _count = 0;
};

/// Forward cursor over the live elements of a circular_array, oldest first.
/// Usable both as a pull-style cursor (next() until it returns nullopt) and as a C++ input range:
///   for (auto const& v : arr.iter()) ...
///   for (auto it = arr.begin(); it != arr.end(); ++it) ...
/// Each iterator is a single traversal; call circular_array::iter() again to restart.
/// Holds a pointer to the array: the array must outlive the iterator and must not be mutated
/// while the iterator is in use.
template <class T, ca::isize N>
struct ca::circular_array_iterator
{
    using value_type = T;
    using difference_type = isize;
    using reference = T const&;
    using iterator_concept = std::input_iterator_tag;

    // construction
public:
    constexpr circular_array_iterator() = default;
    explicit constexpr circular_array_iterator(circular_array<T, N> const& arr) : _array(&arr) {}

    // cursor API
public:
    /// Element at the cursor, then advances.
    /// Returns nullopt once all live elements were produced, and keeps doing so.
    [[nodiscard]] constexpr optional<T const&> next()
    {
        if (is_exhausted())
            return nullopt;
        return (*_array)[_index++];
    }

    /// Logical index of the element next() would produce.
    [[nodiscard]] constexpr isize index() const { return _index; }

    /// Number of elements next() will still produce.
    [[nodiscard]] constexpr isize remaining() const { return is_exhausted() ? 0 : _array->size() - _index; }

    [[nodiscard]] constexpr bool is_exhausted() const { return _array == nullptr || _index >= _array->size(); }

    // iterator API
public:
    /// Precondition: !is_exhausted().
    [[nodiscard]] constexpr T const& operator*() const
    {
        CA_ASSERT(!is_exhausted(), "dereferencing an exhausted circular_array_iterator");
        return (*_array)[_index];
    }

    constexpr circular_array_iterator& operator++()
    {
        CA_ASSERT(!is_exhausted(), "incrementing an exhausted circular_array_iterator");
        ++_index;
        return *this;
    }
    constexpr circular_array_iterator operator++(int)
    {
        auto const prev = *this;
        ++*this;
        return prev;
    }

    [[nodiscard]] constexpr bool operator==(ca::sentinel) const { return is_exhausted(); }

    // the iterator is its own range, so `for (auto v : arr.iter())` works
    [[nodiscard]] constexpr circular_array_iterator begin() const { return *this; }
    [[nodiscard]] constexpr ca::sentinel end() const { return {}; }

    // members
private:
    circular_array<T, N> const* _array = nullptr;
    isize _index = 0;
};
