#pragma once

#include <circular-array/assert.hh>
#include <circular-array/fwd.hh>

#include <type_traits>

/// Tag for "no value": return ca::nullopt from functions returning optional<T&>.
/// Not default-constructible so that `opt = {}` stays unambiguous.
struct ca::nullopt_t
{
    struct tag_t
    {
    };
    explicit constexpr nullopt_t(tag_t) {}
};

namespace ca
{
inline constexpr nullopt_t nullopt = nullopt_t{nullopt_t::tag_t{}};
}

/// Nullable reference to a T, the answer type of lookups that may find nothing
/// (circular_array::get, last, first and iterator next).
///
/// optional<T&> is a rebindable non-owning pointer with an explicit emptiness check:
///   - copies refer to the same object
///   - writing through value() writes the referred-to object
///   - comparisons compare referred-to values, never addresses
///   - optional<T const&> is read-only, optional<T&> converts to it
///
/// No operator* / operator-> and no conversion to bool, access is always spelled out:
///   if (auto v = arr.get(i); v.has_value())
///       use(v.value());
///
/// Only the reference form exists, owned values are returned as plain T or ca::result.
template <class T>
struct ca::optional<T&>
{
    // construction
public:
    constexpr optional() = default;
    constexpr optional(nullopt_t) {}       // NOLINT
    constexpr optional(T& ref) : _ptr(&ref) {} // NOLINT

    /// optional<int&> -> optional<int const&>
    template <class U>
        requires(!std::is_same_v<U, T> && std::is_convertible_v<U*, T*>)
    constexpr optional(optional<U&> const& rhs) : _ptr(rhs.has_value() ? &rhs.value() : nullptr) // NOLINT
    {
    }

    // would dangle at the end of the full expression
    optional(std::remove_cv_t<T>&&) = delete;

    // access
public:
    [[nodiscard]] constexpr bool has_value() const { return _ptr != nullptr; }

    /// Precondition: has_value()
    [[nodiscard]] constexpr T& value() const
    {
        CA_ASSERT(_ptr != nullptr, "accessing the value of an empty optional");
        return *_ptr;
    }

    /// Copy of the referred-to object, or fallback if empty.
    [[nodiscard]] constexpr std::remove_cv_t<T> value_or(std::remove_cv_t<T> fallback) const
    {
        if (_ptr == nullptr)
            return fallback;
        return *_ptr;
    }

    // comparison
public:
    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T& v) { bool(v == v); }
    {
        if (lhs._ptr == nullptr || rhs._ptr == nullptr)
            return lhs._ptr == rhs._ptr;
        return *lhs._ptr == *rhs._ptr;
    }

    /// false when empty
    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, std::remove_cv_t<T> const& rhs)
        requires requires(T& v) { bool(v == v); }
    {
        return lhs._ptr != nullptr && *lhs._ptr == rhs;
    }

    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, nullopt_t) { return lhs._ptr == nullptr; }

    // `opt == true` almost always means has_value() was intended
    bool operator==(bool) const
        requires(!std::is_same_v<std::remove_cv_t<T>, bool>)
    = delete;

private:
    T* _ptr = nullptr;
};
