#pragma once

#include <circular-array/assert.hh>
#include <circular-array/fwd.hh>
#include <circular-array/utility.hh>

#include <type_traits>

/// Wrapper marking a value as the error alternative of a result.
/// Created via ca::error(e); converts into any result<T, E> whose E is constructible from it.
template <class E>
struct ca::as_error_t
{
    E value;
};

namespace ca
{
/// Marks e as an error for result construction.
/// Usage: return ca::error(circular_array_error{...});
template <class E>
[[nodiscard]] constexpr as_error_t<std::remove_cvref_t<E>> error(E&& e)
{
    return as_error_t<std::remove_cvref_t<E>>{ca::forward<E>(e)};
}
} // namespace ca

/// Sum type representing either a success value T or an error value E.
/// Used for operations that can fail in expected ways, e.g. writing to a logical index
/// that is not live in a circular_array.
/// A default-constructed result holds a default-constructed error.
/// Like optional, there is no operator* or operator->: access goes through value() / error(),
/// which assert on the wrong alternative.
/// Trivially copyable when both T and E are trivially copyable.
template <class T, class E>
struct ca::result
{
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>, "result does not support references");

    static constexpr bool is_trivial_copy = std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>;
    static constexpr bool is_trivial_destroy
        = std::is_trivially_destructible_v<T> && std::is_trivially_destructible_v<E>;

    // construction
public:
    /// Holds E{}.
    result()
        requires std::is_default_constructible_v<E>
      : _has_value(false)
    {
        new (ca::placement_new, &_storage.error) E();
    }

    /// Holds a value constructed from value.
    template <class U = std::remove_cv_t<T>>
        requires std::is_constructible_v<T, U&&>
    result(U&& value) : _has_value(true) // NOLINT
    {
        new (ca::placement_new, &_storage.value) T(ca::forward<U>(value));
    }

    /// Holds an error constructed from the wrapped value.
    template <class G>
        requires std::is_constructible_v<E, G&&>
    result(as_error_t<G>&& err) : _has_value(false) // NOLINT
    {
        new (ca::placement_new, &_storage.error) E(ca::move(err.value));
    }
    template <class G>
        requires std::is_constructible_v<E, G const&>
    result(as_error_t<G> const& err) : _has_value(false) // NOLINT
    {
        new (ca::placement_new, &_storage.error) E(err.value);
    }

    // trivial copy/move/destroy
public:
    result(result&&)
        requires is_trivial_copy
    = default;
    result(result const&)
        requires is_trivial_copy
    = default;
    result& operator=(result&&)
        requires is_trivial_copy
    = default;
    result& operator=(result const&)
        requires is_trivial_copy
    = default;
    ~result()
        requires is_trivial_destroy
    = default;

    // non-trivial copy/move/destroy
public:
    /// Move-constructs the active alternative; rhs keeps its alternative in a moved-from state.
    result(result&& rhs) noexcept
        requires(!is_trivial_copy)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (ca::placement_new, &_storage.value) T(ca::move(rhs._storage.value));
        else
            new (ca::placement_new, &_storage.error) E(ca::move(rhs._storage.error));
    }

    result(result const& rhs)
        requires(!is_trivial_copy && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (ca::placement_new, &_storage.value) T(rhs._storage.value);
        else
            new (ca::placement_new, &_storage.error) E(rhs._storage.error);
    }

    /// Same alternative: move-assigns. Different alternative: destroys ours, move-constructs theirs.
    result& operator=(result&& rhs) noexcept
        requires(!is_trivial_copy)
    {
        if (this == &rhs)
            return *this;

        if (_has_value == rhs._has_value)
        {
            if (_has_value)
                _storage.value = ca::move(rhs._storage.value);
            else
                _storage.error = ca::move(rhs._storage.error);
        }
        else
        {
            impl_destroy();
            _has_value = rhs._has_value;
            if (_has_value)
                new (ca::placement_new, &_storage.value) T(ca::move(rhs._storage.value));
            else
                new (ca::placement_new, &_storage.error) E(ca::move(rhs._storage.error));
        }
        return *this;
    }

    result& operator=(result const& rhs)
        requires(!is_trivial_copy && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>
                 && std::is_copy_assignable_v<T> && std::is_copy_assignable_v<E>)
    {
        if (this == &rhs)
            return *this;

        if (_has_value == rhs._has_value)
        {
            if (_has_value)
                _storage.value = rhs._storage.value;
            else
                _storage.error = rhs._storage.error;
        }
        else
        {
            impl_destroy();
            _has_value = rhs._has_value;
            if (_has_value)
                new (ca::placement_new, &_storage.value) T(rhs._storage.value);
            else
                new (ca::placement_new, &_storage.error) E(rhs._storage.error);
        }
        return *this;
    }

    ~result()
        requires(!is_trivial_destroy)
    {
        impl_destroy();
    }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }
    [[nodiscard]] bool has_error() const { return !_has_value; }

    /// Returns the success value, preserving the value category of the result.
    /// Precondition: has_value() == true.
    template <class Self>
    [[nodiscard]] auto&& value(this Self&& self)
    {
        CA_ASSERT(self.has_value(), "attempted to access value of a result holding an error");
        return static_cast<Self&&>(self)._storage.value;
    }

    /// Returns the error, preserving the value category of the result.
    /// Precondition: has_error() == true.
    template <class Self>
    [[nodiscard]] auto&& error(this Self&& self)
    {
        CA_ASSERT(self.has_error(), "attempted to access error of a result holding a value");
        return static_cast<Self&&>(self)._storage.error;
    }

    // helper
private:
    void impl_destroy()
    {
        if (_has_value)
            _storage.value.~T();
        else
            _storage.error.~E();
    }

    // members
private:
    union storage_t
    {
        T value;
        E error;

        storage_t() {}
        ~storage_t()
            requires is_trivial_destroy
        = default;
        ~storage_t()
            requires(!is_trivial_destroy)
        {
        }
    };

    storage_t _storage;
    bool _has_value;
};
