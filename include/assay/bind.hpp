#pragma once


/*
    --------------------------------------------------
    Assay do-notation - Building structs from decoders
    --------------------------------------------------
    A pipeline starts from an initial struct and populates it field by field:

        auto person = Assay::do_<Input>(Person{})
                    | Assay::ap_s(set_name, name_decoder)
                    | Assay::ap_s(set_age, age_decoder)
                    | Assay::let(set_label, [](const Person& p) { return p.name + "!"; });

    Setters take the current struct and the new field value and return the
    updated struct: `setter(s, t) -> S2`

    ------
    Stages
    ------
    - `bind(setter, f)`     : sequential. `f(s)` may read fields bound so far.
                              A failure stops later `bind` and `let` stages.
                              Later `ap_s` stages still run and append their
                              errors
    - `ap_s(setter, fa)`    : parallel. `fa` does not see the struct; it runs
                              even when earlier stages failed, and its errors
                              are appended to theirs
    - `let(setter, f)`      : pure field computed from the struct, never fails
    - `let_to(setter, b)`   : pure constant field, never fails
    - `bind_to(setter)`     : starts a struct from a decoded value

    Lens variants (`bind_l`, `let_l`, `let_to_l`, `ap_s_l`) take a
    `Lens<S, T>` instead of a setter and keep the aggregation behaviour of
    the stage they wrap. `bind_l` and `let_l` pass the current field value to
    their function rather than the whole struct
*/


#include <functional>
#include <type_traits>
#include <utility>

#include "assay/decode.hpp"
#include "assay/lens.hpp"

/// @defgroup AssayBind Do-notation
/// @ingroup Assay
/// @brief Stage-by-stage construction of aggregate values

namespace Assay {

    /// @ingroup AssayBind
    /// @brief Starts a pipeline with @p empty; always succeeds
    template<typename I, typename S>
    [[nodiscard]] Decode<I, std::decay_t<S>> do_(S&& empty) {
        return of<I>(std::forward<S>(empty));
    }

    /// @ingroup AssayBind
    /// @brief Sequential stage: decodes a field from the struct built so far
    template<typename Setter, typename F>
    [[nodiscard]] auto bind(Setter setter, F f) {
        return [setter = std::move(setter), f = std::move(f)]<typename I, typename S1>(const Decode<I, S1>& fa) {
            return chain(fa, [setter, f](const S1& s) {
                return map(std::invoke(f, s), [setter, s](const auto& t) { return std::invoke(setter, s, t); });
            });
        };
    }

    /// @ingroup AssayBind
    /// @brief Lifts a decoded value into a struct
    template<typename Setter>
    [[nodiscard]] auto bind_to(Setter setter) {
        return [setter = std::move(setter)]<typename I, typename T>(const Decode<I, T>& fa) {
            return map(fa, setter);
        };
    }

    /// @ingroup AssayBind
    /// @brief Pure stage: computes a field from the struct
    template<typename Setter, typename F>
    [[nodiscard]] auto let(Setter setter, F f) {
        return [setter = std::move(setter), f = std::move(f)]<typename I, typename S1>(const Decode<I, S1>& fa) {
            return map(fa, [setter, f](const S1& s) { return std::invoke(setter, s, std::invoke(f, s)); });
        };
    }

    /// @ingroup AssayBind
    /// @brief Pure stage: sets a field to a constant
    template<typename Setter, typename B>
    [[nodiscard]] auto let_to(Setter setter, B b) {
        return [setter = std::move(setter), b = std::move(b)]<typename I, typename S1>(const Decode<I, S1>& fa) {
            return map(fa, [setter, b](const S1& s) { return std::invoke(setter, s, b); });
        };
    }

    /// @ingroup AssayBind
    /// @brief Parallel stage: decodes a field independently and accumulates errors
    ///
    /// @details
    /// Both the pipeline so far and @p fb are run against the input. If both
    /// fail, the pipeline's errors come first.
    template<typename Setter, typename I, typename T>
    [[nodiscard]] auto ap_s(Setter setter, Decode<I, T> fb) {
        return [setter = std::move(setter), fb = std::move(fb)]<typename S1>(const Decode<I, S1>& fa) {
            using S2 = detail::result_of_t<const Setter&, const S1&, const T&>;
            auto fs = map(fa, [setter](const S1& s) {
                return std::function<S2(const T&)>{ [setter, s](const T& t) { return std::invoke(setter, s, t); } };
            });
            return ap(fs, fb);
        };
    }

    /// @ingroup AssayBind
    /// @brief `bind` through a lens; @p f receives the current field value
    template<typename S, typename T, typename F>
    [[nodiscard]] auto bind_l(Lens<S, T> lens, F f) {
        auto get = lens.get;
        return Assay::bind(lens.set, [get, f = std::move(f)](const S& s) { return std::invoke(f, get(s)); });
    }

    /// @ingroup AssayBind
    /// @brief `let` through a lens; @p f maps the current field value to its replacement
    template<typename S, typename T, typename F>
    [[nodiscard]] auto let_l(Lens<S, T> lens, F f) {
        auto get = lens.get;
        return Assay::let(lens.set, [get, f = std::move(f)](const S& s) -> T { return std::invoke(f, get(s)); });
    }

    /// @ingroup AssayBind
    /// @brief `let_to` through a lens
    template<typename S, typename T>
    [[nodiscard]] auto let_to_l(Lens<S, T> lens, std::type_identity_t<T> b) {
        return Assay::let_to(lens.set, std::move(b));
    }

    /// @ingroup AssayBind
    /// @brief `ap_s` through a lens
    template<typename S, typename T, typename I>
    [[nodiscard]] auto ap_s_l(Lens<S, T> lens, Decode<I, T> fb) {
        return Assay::ap_s(lens.set, std::move(fb));
    }

} // namespace Assay
