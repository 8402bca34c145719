#pragma once


/*
    --------------------------------------------
    Assay::Validate - Decoders that track a path
    --------------------------------------------
    A `Validate<I, A>` is a decoder whose input is paired with the `Context`
    at which it is being validated:

        Validate<I, A> = Decode<Located<I>, A>
        Located<I>     = { I value; Context context; }

    Because it is an ordinary `Decode`, every combinator, monoid and
    do-notation stage applies unchanged. What this header adds is the
    handling of the context itself:

    - `fail<I, A>(message)`         : error record built from the current
                                      input and path
    - `from_predicate<I>(p, msg)`   : passes the input through when `p` holds
    - `from_result<I>(f, msg)`      : lifts a fallible `f(i)` returning
                                      `std::expected<A, std::exception_ptr>`,
                                      or throwing; the error becomes the cause
    - `succeed<I>(a)`               : `of<Located<I>>(a)`
    - `at(entry, v)`                : runs `v` one level deeper
    - `focus(key, type, get, v)`    : runs `v` on a part of the input, one
                                      level deeper
    - `run(v, input, ctx)`          : evaluates `v` starting at `ctx`
    - `to_decode(v, ctx)`           : a plain `Decode<I, A>` starting at `ctx`

    -------
    Example
    -------
        struct Address { std::string zip; };
        struct User { Address address; };

        auto zip = Assay::from_predicate<std::string>(
            [](const std::string& s) { return s.size() == 5; }, "expected 5 digits");
        auto user_zip = Assay::focus("address", "Address", &User::address,
                        Assay::focus("zip", "string", &Address::zip, zip));

        // failure rendered as "User.address.zip: expected 5 digits"
        auto r = Assay::run(user_zip, user, { { "", "User" } });
*/


#include <concepts>
#include <exception>
#include <expected>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

#include "assay/context.hpp"
#include "assay/decode.hpp"
#include "assay/validation.hpp"

/// @defgroup AssayValidate Context-aware validation
/// @ingroup Assay
/// @brief Decoders whose input carries the path being validated

namespace Assay {

    /// @ingroup AssayValidate
    /// @brief An input value together with the path at which it is validated
    template<typename I>
    struct Located {
        I value;            ///< The input at this position
        Context context;    ///< Path from the root to `value`
    };

    /// @ingroup AssayValidate
    /// @brief A decoder over located input
    template<typename I, typename A>
    using Validate = Decode<Located<I>, A>;

    /// @ingroup AssayValidate
    /// @brief Always fails with @p message at the current path
    ///
    /// @details
    /// The error record keeps the input as its `value`.
    template<typename I, typename A>
    [[nodiscard]] Validate<I, A> fail(std::string message) {
        return Validate<I, A>{ [message = std::move(message)](const Located<I>& in) {
            return failure_with_message<A>(in.value, message, in.context);
        }};
    }

    /// @ingroup AssayValidate
    /// @brief Always succeeds with @p a
    template<typename I, typename A>
    [[nodiscard]] Validate<I, std::decay_t<A>> succeed(A&& a) {
        return of<Located<I>>(std::forward<A>(a));
    }

    /// @ingroup AssayValidate
    /// @brief Passes the input through when @p pred holds, otherwise fails with @p message
    template<typename I, typename P>
        requires std::predicate<const P&, const I&>
    [[nodiscard]] Validate<I, I> from_predicate(P pred, std::string message) {
        return Validate<I, I>{ [pred = std::move(pred), message = std::move(message)](const Located<I>& in) {
            if (std::invoke(pred, in.value)) return success(in.value);
            return failure_with_message<I>(in.value, message, in.context);
        }};
    }

    namespace detail {
        template<typename T>
        struct fallible_traits : std::false_type {};

        template<typename A>
        struct fallible_traits<std::expected<A, std::exception_ptr>> : std::true_type {
            using value_type = A;
        };

        template<typename F, typename I>
        concept Fallible = std::invocable<const F&, const I&>
            && fallible_traits<result_of_t<const F&, const I&>>::value;
    } // namespace detail

    /// @ingroup AssayValidate
    /// @brief Lifts a function reporting failure through `std::exception_ptr`
    ///
    /// @details
    /// On failure the error record holds the input, the current path,
    /// @p message and the returned exception as its cause.
    ///
    /// Example:
    /// @code
    /// auto half = Assay::from_result<int>([](const int& n) -> std::expected<int, std::exception_ptr> {
    ///     if (n % 2 != 0) return std::unexpected(std::make_exception_ptr(std::domain_error("odd")));
    ///     return n / 2;
    /// });
    /// @endcode
    template<typename I, typename F>
        requires detail::Fallible<F, I>
    [[nodiscard]] auto from_result(F f, std::string message = "unable to decode") {
        using A = typename detail::fallible_traits<detail::result_of_t<const F&, const I&>>::value_type;
        return Validate<I, A>{ [f = std::move(f), message = std::move(message)](const Located<I>& in) -> Validation<A> {
            auto r = std::invoke(f, in.value);
            if (r) return std::move(*r);
            return failure_with_error<A>(in.value, message, r.error(), in.context);
        }};
    }

    /// @ingroup AssayValidate
    /// @brief Lifts a function that throws on failure
    ///
    /// @details
    /// A `std::exception` escaping @p f becomes the cause of the error record.
    /// Anything else propagates.
    template<typename I, typename F>
        requires std::invocable<const F&, const I&> && (!detail::Fallible<F, I>)
    [[nodiscard]] auto from_result(F f, std::string message = "unable to decode") {
        using A = detail::result_of_t<const F&, const I&>;
        return Validate<I, A>{ [f = std::move(f), message = std::move(message)](const Located<I>& in) -> Validation<A> {
            try {
                return std::invoke(f, in.value);
            } catch (const std::exception&) {
                return failure_with_error<A>(in.value, message, std::current_exception(), in.context);
            }
        }};
    }

    /// @ingroup AssayValidate
    /// @brief Runs @p v with @p entry appended to the context
    template<typename I, typename A>
    [[nodiscard]] Validate<I, A> at(ContextEntry entry, Validate<I, A> v) {
        return Validate<I, A>{ [entry = std::move(entry), v = std::move(v)](const Located<I>& in) {
            return v(Located<I>{ in.value, push(in.context, entry) });
        }};
    }

    /// @ingroup AssayValidate
    /// @brief Runs @p v on the part of the input selected by @p get, one level deeper
    ///
    /// @details
    /// `I` must be named explicitly when @p get is not a data member pointer.
    template<typename I, typename G, typename J, typename A>
        requires std::invocable<const G&, const I&> && std::convertible_to<std::invoke_result_t<const G&, const I&>, J>
    [[nodiscard]] Validate<I, A> focus(std::string key, std::string type, G get, Validate<J, A> v) {
        ContextEntry entry{ std::move(key), std::move(type) };
        return Validate<I, A>{ [entry = std::move(entry), get = std::move(get), v = std::move(v)](const Located<I>& in) {
            return v(Located<J>{ static_cast<J>(std::invoke(get, in.value)), push(in.context, entry) });
        }};
    }

    /// @ingroup AssayValidate
    /// @brief `focus` on a data member
    template<typename I, typename J, typename A>
    [[nodiscard]] Validate<I, A> focus(std::string key, std::string type, J I::* member, Validate<J, A> v) {
        return focus<I>(std::move(key), std::move(type), [member](const I& s) -> const J& { return s.*member; }, std::move(v));
    }

    /// @ingroup AssayValidate
    /// @brief Evaluates @p v on @p input starting at path @p ctx
    template<typename I, typename A>
    [[nodiscard]] Validation<A> run(const Validate<I, A>& v, std::type_identity_t<I> input, Context ctx = {}) {
        return v(Located<I>{ std::move(input), std::move(ctx) });
    }

    /// @ingroup AssayValidate
    /// @brief A plain decoder that evaluates @p v starting at path @p ctx
    template<typename I, typename A>
    [[nodiscard]] Decode<I, A> to_decode(Validate<I, A> v, Context ctx = {}) {
        return Decode<I, A>{ [v = std::move(v), ctx = std::move(ctx)](const I& input) {
            return v(Located<I>{ input, ctx });
        }};
    }

} // namespace Assay
