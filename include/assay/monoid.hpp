#pragma once


/*
    ------------------------------------------
    Assay::Semigroup / Assay::Monoid - algebra
    ------------------------------------------
    Minimal algebra used throughout Assay:

    - `Semigroup<A>`:
        * `concat(a, b) -> A`, must be associative
    - `Monoid<A>`:
        * a semigroup plus `empty() -> A`, a two-sided identity for `concat`

    Both are plain aggregates of `std::function`s, so a monoid is a value that
    can be stored, copied and passed to the monoid constructors in
    `decode_monoid.hpp`. Instances are built with `make_monoid(...)`

    ----
    Laws
    ----
    For every lawful monoid `m` and all `a`, `b`, `c`:
        m.concat(m.concat(a, b), c) == m.concat(a, m.concat(b, c))
        m.concat(m.empty(), a) == a
        m.concat(a, m.empty()) == a
    Nothing here checks the laws; they are the caller's contract

    ---------------
    Stock instances
    ---------------
    - `string_monoid()`   : concatenation, empty string
    - `sum_monoid<T>()`   : addition, `T{}`
    - `vector_monoid<T>()`: concatenation, empty vector
*/


#include <functional>
#include <string>
#include <utility>
#include <vector>

/// @defgroup AssayMonoid Semigroups and Monoids
/// @ingroup Assay
/// @brief Associative combination with an identity element

namespace Assay {

    /// @ingroup AssayMonoid
    /// @brief An associative binary operation over `A`
    template<typename A>
    struct Semigroup {
        std::function<A(const A&, const A&)> concat; ///< Associative combination
    };

    /// @ingroup AssayMonoid
    /// @brief A semigroup with an identity element
    ///
    /// @details
    /// `empty` is a thunk rather than a value so that the identity of a monoid
    /// over decoders can be built on demand.
    template<typename A>
    struct Monoid : Semigroup<A> {
        std::function<A()> empty; ///< Two-sided identity for `concat`
    };

    /// @ingroup AssayMonoid
    /// @brief Builds a monoid from a combination function and an identity value
    ///
    /// Example:
    /// @code
    /// auto product = Assay::make_monoid<int>(
    ///     [](const int& a, const int& b) { return a * b; }, 1);
    /// product.concat(6, 7); // 42
    /// @endcode
    template<typename A, typename F>
    [[nodiscard]] Monoid<A> make_monoid(F concat, A empty) {
        Monoid<A> m;
        m.concat = std::move(concat);
        m.empty = [e = std::move(empty)] { return e; };
        return m;
    }

    /// @ingroup AssayMonoid
    /// @brief Builds a monoid whose identity is produced lazily
    template<typename A, typename F, typename E>
    [[nodiscard]] Monoid<A> make_lazy_monoid(F concat, E empty) {
        Monoid<A> m;
        m.concat = std::move(concat);
        m.empty = std::move(empty);
        return m;
    }

    /// @ingroup AssayMonoid
    /// @brief Left fold of @p items with @p m, starting at `m.empty()`
    template<typename A, typename Range>
    [[nodiscard]] A concat_all(const Monoid<A>& m, const Range& items) {
        A acc = m.empty();
        for (const auto& item : items) acc = m.concat(acc, item);
        return acc;
    }

    /// @ingroup AssayMonoid
    /// @brief String concatenation with the empty string as identity
    [[nodiscard]] inline Monoid<std::string> string_monoid() {
        return make_monoid<std::string>(
            [](const std::string& a, const std::string& b) { return a + b; },
            std::string{});
    }

    /// @ingroup AssayMonoid
    /// @brief Addition with `T{}` as identity
    template<typename T>
    [[nodiscard]] Monoid<T> sum_monoid() {
        return make_monoid<T>([](const T& a, const T& b) { return a + b; }, T{});
    }

    /// @ingroup AssayMonoid
    /// @brief Vector concatenation, left entries first
    template<typename T>
    [[nodiscard]] Monoid<std::vector<T>> vector_monoid() {
        return make_monoid<std::vector<T>>(
            [](const std::vector<T>& a, const std::vector<T>& b) {
                std::vector<T> out;
                out.reserve(a.size() + b.size());
                out.insert(out.end(), a.begin(), a.end());
                out.insert(out.end(), b.begin(), b.end());
                return out;
            },
            std::vector<T>{});
    }

} // namespace Assay
