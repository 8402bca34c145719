#pragma once


/*
    ------------------------------------------------
    Assay::Validation - Success value or Errors list
    ------------------------------------------------
    `Validation<A>` is the result of every validation in Assay:

        std::expected<A, Errors>

    Exactly one of the two is populated. A failure always carries the
    complete ordered list of `ValidationError` records relevant to the way
    the result was composed

    -----------
    Combinators
    -----------
    The same algebra exists for `Decode` in `decode.hpp`, where each
    combinator is defined by running the decoders and delegating here

    - `map(v, f)`        : applies `f` to a success, failures pass through
    - `chain(v, f)`      : sequential; `f` is not called on failure
    - `chain_left(v, f)` : recovery; on failure calls `f(errors)`. If the
                           recovery fails too, the result holds the original
                           errors followed by the new ones
    - `or_else(v, f)`    : alias of `chain_left`
    - `ap(vf, va)`       : applicative apply; failures of both operands are
                           concatenated, function side first
    - `alt(v, second)`   : `second` is called only when `v` failed

    ------------------
    Leaving Validation
    ------------------
    - `fold(v, on_failure, on_success)`
    - `to_result(v)`     : `std::expected<A, ValidationErrors>`
    - `value_or_throw(v)`: the value, or throws `ValidationErrors`
*/


#include <any>
#include <concepts>
#include <exception>
#include <expected>
#include <functional>
#include <string_view>
#include <type_traits>
#include <utility>

#include "assay/context.hpp"
#include "assay/error.hpp"

/// @defgroup AssayValidation Validation Results
/// @ingroup Assay
/// @brief The success-or-errors result type and its combinators

namespace Assay {

    /// @ingroup AssayValidation
    /// @brief Result of a validation: a value of type `A` or accumulated `Errors`
    template<typename A>
    using Validation = std::expected<A, Errors>;

    /// @ingroup AssayValidation
    /// @brief Deferred computation, invoked at most once and only on demand
    template<typename A>
    using Lazy = std::function<A()>;

    namespace detail {
        template<typename F, typename... Args>
        using result_of_t = std::remove_cvref_t<std::invoke_result_t<F, Args...>>;

        template<typename T>
        struct validation_traits : std::false_type {};

        template<typename A>
        struct validation_traits<std::expected<A, Errors>> : std::true_type {
            using value_type = A;
        };
    } // namespace detail

    /// @ingroup AssayValidation
    /// @brief Satisfied by `Validation<A>` for any `A`
    template<typename T>
    concept ValidationType = detail::validation_traits<std::remove_cvref_t<T>>::value;

    // ------------------------------------------------------------
    // Construction
    // ------------------------------------------------------------

    /// @ingroup AssayValidation
    /// @brief Wraps @p a in a successful validation
    template<typename A>
    [[nodiscard]] Validation<std::decay_t<A>> success(A&& a) {
        return Validation<std::decay_t<A>>{ std::forward<A>(a) };
    }

    /// @ingroup AssayValidation
    /// @brief Builds a failed validation holding @p errs
    template<typename A>
    [[nodiscard]] Validation<A> failures(Errors errs) {
        return std::unexpected(std::move(errs));
    }

    /// @ingroup AssayValidation
    /// @brief Builds a failed validation holding a single error record
    ///
    /// Example:
    /// @code
    /// if (n < 0) return Assay::failure_with_message<int>(n, "must be positive", ctx);
    /// @endcode
    template<typename A>
    [[nodiscard]] Validation<A> failure_with_message(std::any value, std::string_view message, const Context& ctx = {}) {
        return failures<A>(Errors{ ValidationError::make(std::move(value), ctx, message) });
    }

    /// @ingroup AssayValidation
    /// @brief Builds a failed validation wrapping a lower-level error
    ///
    /// Example:
    /// @code
    /// try {
    ///     return Assay::success(std::stoi(text));
    /// } catch (const std::exception&) {
    ///     return Assay::failure_with_error<int>(text, "not an integer", std::current_exception(), ctx);
    /// }
    /// @endcode
    template<typename A>
    [[nodiscard]] Validation<A> failure_with_error(std::any value, std::string_view message, std::exception_ptr cause, const Context& ctx = {}) {
        return failures<A>(Errors{ ValidationError::make(std::move(value), ctx, message, std::move(cause)) });
    }

    // ------------------------------------------------------------
    // Combinators
    // ------------------------------------------------------------

    /// @ingroup AssayValidation
    /// @brief Applies @p f to a successful value; failures pass through unchanged
    template<typename A, typename F>
        requires std::invocable<const F&, const A&>
    [[nodiscard]] Validation<detail::result_of_t<const F&, const A&>> map(const Validation<A>& fa, const F& f) {
        if (!fa) return std::unexpected(fa.error());
        return std::invoke(f, *fa);
    }

    /// @ingroup AssayValidation
    /// @brief Monadic bind; @p f is only invoked on success
    template<typename A, typename F>
        requires std::invocable<const F&, const A&> && ValidationType<std::invoke_result_t<const F&, const A&>>
    [[nodiscard]] detail::result_of_t<const F&, const A&> chain(const Validation<A>& fa, const F& f) {
        if (!fa) return std::unexpected(fa.error());
        return std::invoke(f, *fa);
    }

    /// @ingroup AssayValidation
    /// @brief Recovers from a failure with @p f
    ///
    /// @details
    /// On success @p fa is returned and @p f is not invoked. On failure
    /// `f(errors)` is evaluated: its success replaces the failure and the
    /// original errors are dropped; its failure is appended to the original
    /// errors, so no diagnostic is lost.
    template<typename A, typename F>
        requires std::is_invocable_r_v<Validation<A>, const F&, const Errors&>
    [[nodiscard]] Validation<A> chain_left(const Validation<A>& fa, const F& f) {
        if (fa) return fa;
        Validation<A> recovered = std::invoke(f, fa.error());
        if (recovered) return recovered;
        return std::unexpected(errors_monoid().concat(fa.error(), recovered.error()));
    }

    /// @ingroup AssayValidation
    /// @brief Alias of `chain_left`
    template<typename A, typename F>
        requires std::is_invocable_r_v<Validation<A>, const F&, const Errors&>
    [[nodiscard]] Validation<A> or_else(const Validation<A>& fa, const F& f) {
        return chain_left(fa, f);
    }

    /// @ingroup AssayValidation
    /// @brief Applicative apply with error accumulation
    ///
    /// @details
    /// Both operands are already evaluated. If both failed, the result holds
    /// the errors of @p fab followed by those of @p fa.
    template<typename Fn, typename A>
        requires std::invocable<const Fn&, const A&>
    [[nodiscard]] Validation<detail::result_of_t<const Fn&, const A&>> ap(const Validation<Fn>& fab, const Validation<A>& fa) {
        if (fab && fa) return std::invoke(*fab, *fa);
        if (fab) return std::unexpected(fa.error());
        if (fa) return std::unexpected(fab.error());
        return std::unexpected(errors_monoid().concat(fab.error(), fa.error()));
    }

    /// @ingroup AssayValidation
    /// @brief Falls back to @p second when @p first failed
    ///
    /// @details
    /// @p second is not invoked when @p first succeeded. When both fail the
    /// errors of @p first come first.
    template<typename A, typename L>
        requires std::is_invocable_r_v<Validation<A>, const L&>
    [[nodiscard]] Validation<A> alt(const Validation<A>& first, const L& second) {
        return chain_left(first, [&second](const Errors&) -> Validation<A> { return std::invoke(second); });
    }

    // ------------------------------------------------------------
    // Elimination
    // ------------------------------------------------------------

    /// @ingroup AssayValidation
    /// @brief Collapses @p v with one handler per case
    template<typename A, typename OnFailure, typename OnSuccess>
    [[nodiscard]] auto fold(const Validation<A>& v, const OnFailure& on_failure, const OnSuccess& on_success) {
        using R = std::common_type_t<
            detail::result_of_t<const OnFailure&, const Errors&>,
            detail::result_of_t<const OnSuccess&, const A&>>;
        if (v) return static_cast<R>(std::invoke(on_success, *v));
        return static_cast<R>(std::invoke(on_failure, v.error()));
    }

    /// @ingroup AssayValidation
    /// @brief Converts the error side into a single `ValidationErrors` exception object
    template<typename A>
    [[nodiscard]] std::expected<A, ValidationErrors> to_result(Validation<A> v) {
        if (v) return std::move(*v);
        return std::unexpected(ValidationErrors{ std::move(v).error() });
    }

    /// @ingroup AssayValidation
    /// @brief Returns the value of @p v
    /// @throws ValidationErrors If @p v is a failure
    template<typename A>
    [[nodiscard]] A value_or_throw(Validation<A> v) {
        if (!v) throw ValidationErrors{ std::move(v).error() };
        return std::move(*v);
    }

} // namespace Assay
