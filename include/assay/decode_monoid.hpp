#pragma once


/*
    -------------------------------------------------------
    Assay decoder monoids - Lifting combination into Decode
    -------------------------------------------------------
    Three ways to obtain a `Monoid<Decode<I, A>>`:

    - `applicative_monoid<I>(m)`:
        * `empty()`         = `of<I>(m.empty())`
        * `concat(d1, d2)`  = both run on the same input; two successes are
                              combined with `m.concat`, failures accumulate
                              as with `ap`
    - `alternative_monoid<I>(m)`:
        * `empty()`         = `of<I>(m.empty())`
        * `concat(d1, d2)`  = the applicative combination, falling back to
                              `d1` alone and then `d2` alone. Two successes are
                              combined, a single success is used standalone,
                              and when everything fails the errors of every
                              attempt are kept in attempt order:
                              `[e1, e2, e1, e2]`
    - `alt_monoid(zero)`:
        * `empty()`         = `zero()`, which may itself fail
        * `concat(d1, d2)`  = `alt(d1, d2)`, first success wins, no value
                              combination

    ----
    Laws
    ----
    All laws below are up to the behaviour observable by invoking
    deterministic decoders

    - `applicative_monoid`: a lawful monoid whenever `m` is
    - `alternative_monoid`: identity and associativity hold only for
      operands that succeed. A failing `x` is not preserved by the identity:
      `concat(x, empty())` and `concat(empty(), x)` both fall back to
      `empty()` and succeed with `m.empty()`. When every operand fails, the
      two groupings of three operands repeat errors in different orders
    - `alt_monoid`: a lawful monoid when `zero()` fails with no errors; a
      succeeding `zero()` acts as a final default instead
*/


#include <functional>
#include <type_traits>
#include <utility>

#include "assay/decode.hpp"
#include "assay/monoid.hpp"

/// @defgroup AssayDecodeMonoid Decoder Monoids
/// @ingroup Assay
/// @brief Monoid instances over `Decode`

namespace Assay {

    /// @ingroup AssayDecodeMonoid
    /// @brief Runs both decoders and combines their values with @p m
    ///
    /// Example:
    /// @code
    /// auto m = Assay::applicative_monoid<std::string>(Assay::string_monoid());
    /// auto hello = m.concat(Assay::of<std::string>(std::string{ "Hello" }),
    ///                       Assay::of<std::string>(std::string{ " World" }));
    /// hello("any input"); // success("Hello World")
    /// @endcode
    template<typename I, typename A>
    [[nodiscard]] Monoid<Decode<I, A>> applicative_monoid(Monoid<A> m) {
        return make_lazy_monoid<Decode<I, A>>(
            [m](const Decode<I, A>& d1, const Decode<I, A>& d2) {
                auto curried = map(d1, [m](const A& a) {
                    return std::function<A(const A&)>{ [m, a](const A& b) { return m.concat(a, b); } };
                });
                return ap(curried, d2);
            },
            [m] { return of<I>(m.empty()); });
    }

    /// @ingroup AssayDecodeMonoid
    /// @brief Applicative combination with per-operand fallback
    template<typename I, typename A>
    [[nodiscard]] Monoid<Decode<I, A>> alternative_monoid(Monoid<A> m) {
        Monoid<Decode<I, A>> both = applicative_monoid<I>(std::move(m));
        return make_lazy_monoid<Decode<I, A>>(
            [both](const Decode<I, A>& d1, const Decode<I, A>& d2) {
                return alt(both.concat(d1, d2), [d1, d2] {
                    return alt(d1, [d2] { return d2; });
                });
            },
            both.empty);
    }

    /// @ingroup AssayDecodeMonoid
    /// @brief First-success-wins combination with a caller supplied identity
    ///
    /// @details
    /// @p zero is a thunk producing the identity decoder; it is invoked each
    /// time `empty()` is requested.
    ///
    /// Example:
    /// @code
    /// auto m = Assay::alt_monoid([] { return Assay::of<std::string>(0); });
    /// auto port = m.concat(m.concat(from_env, from_file), Assay::of<std::string>(8080));
    /// @endcode
    template<typename Z>
        requires std::invocable<const Z&> && DecodeType<std::invoke_result_t<const Z&>>
    [[nodiscard]] auto alt_monoid(Z zero) {
        using D = detail::result_of_t<const Z&>;
        return make_lazy_monoid<D>(
            [](const D& d1, const D& d2) { return alt(d1, [d2] { return d2; }); },
            std::move(zero));
    }

} // namespace Assay
