#pragma once


/*
    --------------------------------------------
    Assay sequencing - Decoders over many values
    --------------------------------------------
    Helpers that run several decoders against one input and collect every
    result, with the same error accumulation as `ap`:

    - `sequence_t(d1, ..., dn)`  : `Decode<I, std::tuple<A1, ..., An>>`
    - `sequence_array(ds)`       : `Decode<I, std::vector<A>>`
    - `traverse_array(items, f)` : runs `f(item)` for every item, collecting
                                   a `Decode<I, std::vector<B>>`

    Decoders are evaluated left to right. A failure does not stop the
    remaining decoders; the result fails with the errors of every failing
    decoder, in argument (or element) order
*/


#include <concepts>
#include <functional>
#include <tuple>
#include <utility>
#include <vector>

#include "assay/decode.hpp"

/// @defgroup AssaySequence Sequencing
/// @ingroup Assay
/// @brief Running many decoders against one input

namespace Assay {

    /// @ingroup AssaySequence
    /// @brief Runs every decoder and collects their values into a tuple
    ///
    /// Example:
    /// @code
    /// auto both = Assay::sequence_t(name_decoder, age_decoder);
    /// auto r = both(input); // Validation<std::tuple<std::string, int>>
    /// @endcode
    template<typename I, typename... As>
    [[nodiscard]] Decode<I, std::tuple<As...>> sequence_t(Decode<I, As>... ds) {
        return Decode<I, std::tuple<As...>>{ [ds...](const I& input) -> Validation<std::tuple<As...>> {
            // braced initialisation evaluates left to right
            std::tuple<Validation<As>...> results{ ds(input)... };

            Errors errs;
            std::apply([&errs](const auto&... r) { ((r ? void() : append(errs, r.error())), ...); }, results);
            if (!errs.empty()) return std::unexpected(std::move(errs));

            return std::apply([](auto&... r) { return std::tuple<As...>{ std::move(*r)... }; }, results);
        }};
    }

    /// @ingroup AssaySequence
    /// @brief Runs every decoder in @p ds and collects their values in order
    template<typename I, typename A>
    [[nodiscard]] Decode<I, std::vector<A>> sequence_array(std::vector<Decode<I, A>> ds) {
        return Decode<I, std::vector<A>>{ [ds = std::move(ds)](const I& input) -> Validation<std::vector<A>> {
            std::vector<A> values;
            values.reserve(ds.size());
            Errors errs;
            for (const auto& d : ds) {
                Validation<A> r = d(input);
                if (r) {
                    if (errs.empty()) values.push_back(std::move(*r));
                } else {
                    append(errs, r.error());
                }
            }
            if (!errs.empty()) return std::unexpected(std::move(errs));
            return values;
        }};
    }

    /// @ingroup AssaySequence
    /// @brief Maps every item to a decoder with @p f and sequences the results
    template<typename A, typename F>
        requires std::invocable<const F&, const A&> && DecodeType<std::invoke_result_t<const F&, const A&>>
    [[nodiscard]] auto traverse_array(const std::vector<A>& items, F f) {
        using D = detail::result_of_t<const F&, const A&>;
        std::vector<D> ds;
        ds.reserve(items.size());
        for (const auto& item : items) ds.push_back(std::invoke(f, item));
        return sequence_array(std::move(ds));
    }

} // namespace Assay
