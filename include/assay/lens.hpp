#pragma once


/*
    -------------------------------------
    Assay::Lens - Focus on a single field
    -------------------------------------
    A `Lens<S, T>` is the `{get, set}` capability pair the lens-based
    do-notation operators (`bind_l`, `let_l`, `let_to_l`, `ap_s_l`) consume:

    - `get(s) -> T`     : reads the focused field of `s`
    - `set(s, t) -> S`  : returns a copy of `s` with the field replaced by `t`

    `set` never mutates its argument. `lens_of(&S::member)` builds a lens
    for a data member; `make_lens(get, set)` accepts any pair of callables
*/


#include <functional>
#include <utility>

/// @defgroup AssayLens Lenses
/// @ingroup Assay
/// @brief Get/set capability pairs for one field of a struct

namespace Assay {

    /// @ingroup AssayLens
    /// @brief Getter and copying setter for a field of type `T` inside `S`
    template<typename S, typename T>
    struct Lens {
        std::function<T(const S&)> get;             ///< Reads the field
        std::function<S(const S&, const T&)> set;   ///< Copy of `S` with the field replaced
    };

    /// @ingroup AssayLens
    /// @brief Builds a lens from a getter and a setter
    template<typename S, typename T, typename G, typename St>
    [[nodiscard]] Lens<S, T> make_lens(G get, St set) {
        return Lens<S, T>{ std::move(get), std::move(set) };
    }

    /// @ingroup AssayLens
    /// @brief Builds a lens focusing the data member @p member
    ///
    /// Example:
    /// @code
    /// struct Person { std::string name; int age; };
    /// auto age = Assay::lens_of(&Person::age);
    /// age.set(Person{ "Ada", 36 }, 37).age; // 37
    /// @endcode
    template<typename S, typename T>
    [[nodiscard]] Lens<S, T> lens_of(T S::* member) {
        return Lens<S, T>{
            [member](const S& s) { return s.*member; },
            [member](const S& s, const T& t) {
                S copy = s;
                copy.*member = t;
                return copy;
            }
        };
    }

} // namespace Assay
