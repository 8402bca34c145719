#pragma once


/*
    -----------------------------------------------------
    Assay - Composable validating decoders for modern C++
    -----------------------------------------------------

    This is the main public header for Assay

    It brings together:
        - Error records and rendering:  `Assay::ValidationError`, `Assay::Errors`,
                                        `Assay::ValidationErrors`
        - Validation paths:             `Assay::Context`, `Assay::ContextEntry`
        - Results:                      `Assay::Validation<A>`
        - Decoders and combinators:     `Assay::Decode<I, A>`, `map`, `chain`,
                                        `chain_left`, `ap`, `alt`
        - Monoids:                      `Assay::Monoid<A>`, `applicative_monoid`,
                                        `alternative_monoid`, `alt_monoid`
        - Sequencing:                   `sequence_t`, `sequence_array`,
                                        `traverse_array`
        - Do-notation:                  `do_`, `bind`, `ap_s`, `let`, lens variants
        - Path-aware validation:        `Assay::Validate<I, A>`, `focus`, `run`
        - Codecs:                       `Assay::Type<A, O, I>`, `decoder`, `validator`
        - Configuration:                `Assay::FormatOptions`

    -------------------
    High-Level Overview
    -------------------
    - Decoding:
        * A `Decode<I, A>` turns an `I` into a `Validation<A>`, which is
          `std::expected<A, Errors>`
        * Nothing is thrown on the normal path; `value_or_throw(...)` is there
          for callers that want an exception
    - Failure reporting:
        * Sequential composition (`chain`, `bind`) stops at the first failure
        * Parallel composition (`ap`, `ap_s`, monoids, `sequence_*`) runs every
          decoder and reports every failure, in order
        * Fallback composition (`alt`, `chain_left`) reports failures only when
          every attempt failed
    - Rendering:
        * Every error renders as `"<path>: <message>"`

    -----
    Usage
    -----
        #include <assay/assay.hpp>

        struct Person { std::string name; int age; };

        int main() {
            using Input = std::map<std::string, std::string>;

            auto field = [](std::string key) {
                return Assay::Decode<Input, std::string>{ [key](const Input& in) {
                    auto it = in.find(key);
                    if (it == in.end()) return Assay::failure_with_message<std::string>({}, key + " is required");
                    return Assay::success(it->second);
                }};
            };

            auto person = Assay::do_<Input>(Person{})
                        | Assay::ap_s_l(Assay::lens_of(&Person::name), field("name"))
                        | Assay::ap_s_l(Assay::lens_of(&Person::age), field("age") | Assay::chain(parse_int));

            auto r = person(Input{});
            if (!r) std::cerr << r.error() << '\n';
        }

    Include this header if you want the full Assay API. For finer-grained
    control or faster build times, you can include individual headers such as
    `decode.hpp`, `validation.hpp`, `error.hpp` and `bind.hpp` directly
*/

/// @defgroup Assay Assay Validation Library
/// @brief Core types and functions for Assay

#include "assay/config.hpp"
#include "assay/options.hpp"
#include "assay/monoid.hpp"
#include "assay/context.hpp"
#include "assay/error.hpp"
#include "assay/validation.hpp"
#include "assay/decode.hpp"
#include "assay/decode_monoid.hpp"
#include "assay/sequence.hpp"
#include "assay/lens.hpp"
#include "assay/bind.hpp"
#include "assay/validate.hpp"
#include "assay/codec.hpp"
