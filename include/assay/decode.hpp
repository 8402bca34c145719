#pragma once


/*
    -----------------------------------------
    Assay::Decode - Composable input decoders
    -----------------------------------------
    A `Decode<I, A>` is a function value from a raw input `I` to a
    `Validation<A>`. It is the unit of composition in Assay: small decoders
    are combined into larger ones, and the way they are combined decides how
    failures are reported

    ---------
    Semantics
    ---------
    - Decoders hold no mutable state; invoking one has no effect other than
      what the wrapped function does. A decoder may be invoked any number of
      times, from any thread, provided the wrapped function is pure
    - Copying a decoder copies a `std::function`; captured state is shared
      by value semantics, not by reference

    -----------
    Combinators
    -----------
    - `of<I>(a)`            : always succeeds with `a`
    - `left<I, A>(errs)`    : always fails with `errs`
    - `map(d, f)`           : transforms a success
    - `chain(d, f)`         : sequential, fail-fast. `f(a)` runs against the
                              same input that `d` saw
    - `chain_left(d, f)`    : recovery. When the recovery decoder fails too,
      `or_else(d, f)`         the original errors are kept, followed by the new
    - `ap(df, da)`          : both decoders always run; all failures are kept,
                              `df`'s first
    - `alt(d, second)`      : `second` is a thunk, called only when `d` fails

    Every combinator also has a one-argument form returning an operator that
    is applied with `operator|`:

        auto port = text
                  | Assay::chain(parse_int)
                  | Assay::map([](int n) { return Port{ n }; })
                  | Assay::alt([] { return Assay::of<std::string>(Port{ 8080 }); });
*/


#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

#include "assay/error.hpp"
#include "assay/validation.hpp"

/// @defgroup AssayDecode Decoders
/// @ingroup Assay
/// @brief The `Decode` function type and its combinator algebra

namespace Assay {

    /// @ingroup AssayDecode
    /// @brief A pure function from input `I` to `Validation<A>`
    ///
    /// @details
    /// Any callable accepting `const I&` and returning something convertible
    /// to `Validation<A>` can be turned into a `Decode<I, A>`:
    ///
    /// @code
    /// Assay::Decode<std::string, int> length{ [](const std::string& s) {
    ///     return Assay::success(static_cast<int>(s.size()));
    /// }};
    /// @endcode
    template<typename I, typename A>
    class Decode {
    public:
        using input_type = I;
        using value_type = A;
        using function_type = std::function<Validation<A>(const I&)>;

        Decode() = default;

        template<typename F>
            requires (!std::same_as<std::remove_cvref_t<F>, Decode>)
                  && std::is_invocable_r_v<Validation<A>, const std::remove_cvref_t<F>&, const I&>
        Decode(F&& f) : m_Fn{ std::forward<F>(f) } {}

        /// @brief Runs the decoder against @p input
        /// @throws std::bad_function_call If the decoder is default-constructed
        Validation<A> operator()(const I& input) const { return m_Fn(input); }

        /// @brief Checks whether the decoder wraps a function
        explicit operator bool() const noexcept { return static_cast<bool>(m_Fn); }

    private:
        function_type m_Fn{};
    };

    /// @ingroup AssayDecode
    /// @brief Arrow from a plain value to a decoder, the unit of `chain`
    template<typename I, typename A, typename B>
    using Kleisli = std::function<Decode<I, B>(const A&)>;

    namespace detail {
        template<typename T>
        struct decode_traits : std::false_type {};

        template<typename I, typename A>
        struct decode_traits<Decode<I, A>> : std::true_type {
            using input_type = I;
            using value_type = A;
        };
    } // namespace detail

    /// @ingroup AssayDecode
    /// @brief Satisfied by `Decode<I, A>` for any `I` and `A`
    template<typename T>
    concept DecodeType = detail::decode_traits<std::remove_cvref_t<T>>::value;

    /// @ingroup AssayDecode
    /// @brief Satisfied by callables mapping `const A&` to a `Decode` over input `I`
    template<typename F, typename I, typename A>
    concept KleisliFor = std::invocable<const F&, const A&>
        && DecodeType<std::invoke_result_t<const F&, const A&>>
        && std::same_as<typename detail::result_of_t<const F&, const A&>::input_type, I>;

#pragma region Construction

    /// @ingroup AssayDecode
    /// @brief A decoder that ignores its input and succeeds with @p a
    template<typename I, typename A>
    [[nodiscard]] Decode<I, std::decay_t<A>> of(A&& a) {
        return Decode<I, std::decay_t<A>>{ [v = std::decay_t<A>(std::forward<A>(a))](const I&) {
            return Validation<std::decay_t<A>>{ v };
        }};
    }

    /// @ingroup AssayDecode
    /// @brief A decoder that ignores its input and fails with @p errs
    template<typename I, typename A>
    [[nodiscard]] Decode<I, A> left(Errors errs) {
        return Decode<I, A>{ [errs = std::move(errs)](const I&) {
            return failures<A>(errs);
        }};
    }

#pragma endregion

#pragma region Combinators

    /// @ingroup AssayDecode
    /// @brief Transforms the value of a successful decode; @p f never sees a failure
    template<typename I, typename A, typename F>
        requires std::invocable<const F&, const A&>
    [[nodiscard]] auto map(const Decode<I, A>& fa, F f) {
        using B = detail::result_of_t<const F&, const A&>;
        return Decode<I, B>{ [fa, f = std::move(f)](const I& input) {
            return map(fa(input), f);
        }};
    }

    /// @ingroup AssayDecode
    /// @brief Sequential composition
    ///
    /// @details
    /// On success `f(a)` is run against the same input @p fa received. On
    /// failure @p f is not invoked and the failure is returned as-is.
    template<typename I, typename A, typename F>
        requires KleisliFor<F, I, A>
    [[nodiscard]] auto chain(const Decode<I, A>& fa, F f) {
        using B = typename detail::result_of_t<const F&, const A&>::value_type;
        return Decode<I, B>{ [fa, f = std::move(f)](const I& input) -> Validation<B> {
            Validation<A> va = fa(input);
            if (!va) return std::unexpected(std::move(va).error());
            return std::invoke(f, *va)(input);
        }};
    }

    /// @ingroup AssayDecode
    /// @brief Recovers from a failed decode
    ///
    /// @details
    /// On success the result of @p fa is returned and @p f is not invoked.
    /// On failure `f(errors)` is run against the same input; its success
    /// replaces the failure, its failure is appended to the original errors.
    template<typename I, typename A, typename F>
        requires KleisliFor<F, I, Errors>
              && std::same_as<typename detail::result_of_t<const F&, const Errors&>::value_type, A>
    [[nodiscard]] Decode<I, A> chain_left(const Decode<I, A>& fa, F f) {
        return Decode<I, A>{ [fa, f = std::move(f)](const I& input) {
            return chain_left(fa(input), [&](const Errors& errs) {
                return std::invoke(f, errs)(input);
            });
        }};
    }

    /// @ingroup AssayDecode
    /// @brief Alias of `chain_left`
    template<typename I, typename A, typename F>
        requires KleisliFor<F, I, Errors>
              && std::same_as<typename detail::result_of_t<const F&, const Errors&>::value_type, A>
    [[nodiscard]] Decode<I, A> or_else(const Decode<I, A>& fa, F f) {
        return chain_left(fa, std::move(f));
    }

    /// @ingroup AssayDecode
    /// @brief Applies a decoded function to a decoded value
    ///
    /// @details
    /// Both decoders are always run against the input, @p fab first. If both
    /// fail, the errors of @p fab precede those of @p fa.
    template<typename I, typename Fn, typename A>
        requires std::invocable<const Fn&, const A&>
    [[nodiscard]] auto ap(const Decode<I, Fn>& fab, const Decode<I, A>& fa) {
        using B = detail::result_of_t<const Fn&, const A&>;
        return Decode<I, B>{ [fab, fa](const I& input) {
            Validation<Fn> vf = fab(input);
            Validation<A> va = fa(input);
            return ap(vf, va);
        }};
    }

    /// @ingroup AssayDecode
    /// @brief Falls back to a lazily built decoder when @p first fails
    ///
    /// @details
    /// @p second is invoked only after @p first has failed on the current
    /// input, and at most once per evaluation. When both fail the errors of
    /// @p first come first.
    template<typename I, typename A>
    [[nodiscard]] Decode<I, A> alt(const Decode<I, A>& first, std::type_identity_t<Lazy<Decode<I, A>>> second) {
        return chain_left(first, [second = std::move(second)](const Errors&) { return second(); });
    }

#pragma endregion

#pragma region Operators

    /// @ingroup AssayDecode
    /// @brief Applies a one-argument combinator: `d | op` is `op(d)`
    template<typename I, typename A, typename Op>
        requires std::invocable<Op&, const Decode<I, A>&>
    auto operator|(const Decode<I, A>& fa, Op op) {
        return std::invoke(op, fa);
    }

    /// @ingroup AssayDecode
    /// @brief Operator form of `map`
    template<typename F>
    [[nodiscard]] auto map(F f) {
        return [f = std::move(f)]<typename I, typename A>(const Decode<I, A>& fa) { return map(fa, f); };
    }

    /// @ingroup AssayDecode
    /// @brief Operator form of `chain`
    template<typename F>
    [[nodiscard]] auto chain(F f) {
        return [f = std::move(f)]<typename I, typename A>(const Decode<I, A>& fa) { return chain(fa, f); };
    }

    /// @ingroup AssayDecode
    /// @brief Operator form of `chain_left`
    template<typename F>
    [[nodiscard]] auto chain_left(F f) {
        return [f = std::move(f)]<typename I, typename A>(const Decode<I, A>& fa) { return chain_left(fa, f); };
    }

    /// @ingroup AssayDecode
    /// @brief Operator form of `or_else`
    template<typename F>
    [[nodiscard]] auto or_else(F f) {
        return chain_left(std::move(f));
    }

    /// @ingroup AssayDecode
    /// @brief Operator form of `ap`, applied to the decoder of functions: `df | ap(da)`
    template<typename I, typename A>
    [[nodiscard]] auto ap(const Decode<I, A>& fa) {
        return [fa]<typename Fn>(const Decode<I, Fn>& fab) { return ap(fab, fa); };
    }

    /// @ingroup AssayDecode
    /// @brief Operator form of `alt`
    template<typename L>
    [[nodiscard]] auto alt(L second) {
        return [second = std::move(second)]<typename I, typename A>(const Decode<I, A>& first) {
            return alt(first, Lazy<Decode<I, A>>{ second });
        };
    }

#pragma endregion

} // namespace Assay
