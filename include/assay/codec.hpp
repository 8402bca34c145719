#pragma once


/*
    --------------------------------------
    Assay::Type - Validate/encode contract
    --------------------------------------
    A codec pairs a validation from an input type `I` to a value type `A`
    with an encoding from `A` back to an output type `O`. Assay consumes
    codecs only through this contract:

    - `name`                        : type name used as the root context entry
    - `validate(i, ctx) -> Validation<A>`
    - `encode(a) -> O`

    `Type<A, O, I>` is the concrete, type-erased codec. Any other class with
    the same members and the `value_type` / `output_type` / `input_type`
    aliases satisfies the `Codec` concept and can be used in its place

    -------
    Helpers
    -------
    - `make_type(name, v, encode)` : builds a `Type` from a `Validate<I, A>`,
                                     so codecs can be assembled with the
                                     combinators
    - `decoder(codec)`             : `Decode<I, A>` starting at `[{"", name}]`
    - `validator(codec)`           : `Validate<I, A>` honouring the caller's path
*/


#include <concepts>
#include <functional>
#include <string>
#include <utility>

#include "assay/context.hpp"
#include "assay/decode.hpp"
#include "assay/validate.hpp"
#include "assay/validation.hpp"

/// @defgroup AssayCodec Codecs
/// @ingroup Assay
/// @brief The validate/encode contract consumed from concrete codecs

namespace Assay {

    /// @ingroup AssayCodec
    /// @brief Type-erased codec between `I`, `A` and `O`
    template<typename A, typename O, typename I>
    struct Type {
        using value_type = A;
        using output_type = O;
        using input_type = I;

        std::string name;                                               ///< Name of `A`, used in paths
        std::function<Validation<A>(const I&, const Context&)> validate; ///< Input to value
        std::function<O(const A&)> encode;                              ///< Value to output
    };

    /// @ingroup AssayCodec
    /// @brief Satisfied by classes exposing the codec contract
    template<typename C>
    concept Codec = requires(const C& c,
                             const typename C::input_type& i,
                             const typename C::value_type& a,
                             const Context& ctx) {
        { c.name } -> std::convertible_to<std::string>;
        { c.validate(i, ctx) } -> std::convertible_to<Validation<typename C::value_type>>;
        { c.encode(a) } -> std::convertible_to<typename C::output_type>;
    };

    /// @ingroup AssayCodec
    /// @brief Builds a codec whose validation is the located decoder @p v
    template<typename I, typename A, typename E>
        requires std::invocable<const E&, const A&>
    [[nodiscard]] auto make_type(std::string name, Validate<I, A> v, E encode) {
        using O = detail::result_of_t<const E&, const A&>;
        Type<A, O, I> t;
        t.name = std::move(name);
        t.validate = [v = std::move(v)](const I& input, const Context& ctx) {
            return v(Located<I>{ input, ctx });
        };
        t.encode = std::move(encode);
        return t;
    }

    /// @ingroup AssayCodec
    /// @brief A decoder running @p codec from its root context `[{"", name}]`
    template<Codec C>
    [[nodiscard]] Decode<typename C::input_type, typename C::value_type> decoder(C codec) {
        using I = typename C::input_type;
        using A = typename C::value_type;
        return Decode<I, A>{ [codec = std::move(codec)](const I& input) -> Validation<A> {
            return codec.validate(input, Context{ ContextEntry{ "", std::string{ codec.name } } });
        }};
    }

    /// @ingroup AssayCodec
    /// @brief A located decoder running @p codec at the caller's path
    template<Codec C>
    [[nodiscard]] Validate<typename C::input_type, typename C::value_type> validator(C codec) {
        using I = typename C::input_type;
        using A = typename C::value_type;
        return Validate<I, A>{ [codec = std::move(codec)](const Located<I>& in) -> Validation<A> {
            return codec.validate(in.value, in.context);
        }};
    }

} // namespace Assay
