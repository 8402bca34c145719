#pragma once


/*
    ------------------------------------------------------------
    Assay::ValidationError - Structured validation error records
    ------------------------------------------------------------
    `Assay::ValidationError` describes a single failure detected while
    turning an untyped input into a typed value.

    ------
    Fields
    ------
    - `std::any value`:
        * The offending input value, when the detecting code chose to keep it
        * May be empty
    - `Context context`:
        * Path from the root of the input to the offending value
    - `std::string message`:
        * Human-readable description of the failure
        * Intended for display; not stable for programmatic use
    - `std::exception_ptr cause`:
        * Optional lower-level error that triggered this one (e.g. a
          `std::invalid_argument` from a number conversion)
        * Kept for diagnostics only; Assay never rethrows it

    ------
    Errors
    ------
    - `Errors` is an insertion-ordered `std::vector<ValidationError>`
    - Duplicates are allowed and never removed
    - `errors_monoid()` concatenates left entries first and has the empty
      vector as identity; every combinator that accumulates failures uses it

    ---------
    Rendering
    ---------
    - `to_string(error)` yields `"<path>: <message>"`, or just `<message>`
      when the context renders to an empty path
    - `to_string(errors)` renders one error per line (see `FormatOptions`)
    - `ValidationErrors` is a `std::runtime_error` owning an `Errors` list,
      used when a caller wants a failed validation as an exception
*/

#include <any>
#include <cstddef>
#include <exception>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "assay/config.hpp"
#include "assay/context.hpp"
#include "assay/monoid.hpp"
#include "assay/options.hpp"


/// @defgroup AssayError Validation Errors
/// @ingroup Assay
/// @brief Error records accumulated by failed validations
namespace Assay {

    /// @ingroup AssayError
    /// @brief Structured information about one validation failure.
    ///
    /// @details
    /// A `ValidationError` is created at the point where a failure is
    /// detected and is never modified afterwards. Combinators move and copy
    /// whole records between `Errors` lists but do not edit them.
    struct ValidationError {
        std::any value{};             ///< Offending input value, may be empty.
        Context context{};            ///< Path from the root to the value.
        std::string message{};        ///< Human-readable diagnostic message.
        std::exception_ptr cause{};   ///< Optional wrapped lower-level error.

        /// @ingroup AssayError
        /// @brief Constructs a fully-populated `ValidationError`.
        ///
        /// Example:
        /// @code
        /// return Assay::ValidationError::make(input, ctx, "expected a number");
        /// @endcode
        ///
        /// @param v   The offending value (may be an empty `std::any`).
        /// @param ctx Path to the value.
        /// @param m   Human-readable error message.
        /// @param c   Optional wrapped cause.
        /// @return A fully constructed `ValidationError`.
        ASSAY_API static ValidationError make(std::any v, Context ctx, std::string_view m, std::exception_ptr c = nullptr);
    };

    /// @ingroup AssayError
    /// @brief Ordered list of validation failures
    using Errors = std::vector<ValidationError>;

    /// @ingroup AssayError
    /// @brief The monoid used to accumulate failures
    ///
    /// @details
    /// `concat(a, b)` returns the entries of `a` followed by the entries of
    /// `b`; `empty()` is the empty list.
    [[nodiscard]] ASSAY_API const Monoid<Errors>& errors_monoid();

    /// @ingroup AssayError
    /// @brief Appends the entries of @p tail to @p head, preserving order
    ASSAY_API void append(Errors& head, const Errors& tail);

    /// @ingroup AssayError
    /// @brief Renders one error as `"<path>: <message>"`
    [[nodiscard]] ASSAY_API std::string to_string(const ValidationError& err, const FormatOptions& opts = {});

    /// @ingroup AssayError
    /// @brief Renders every error of @p errs, separated by `opts.separator`
    [[nodiscard]] ASSAY_API std::string to_string(const Errors& errs, const FormatOptions& opts = {});

    /// @ingroup AssayError
    /// @brief Collects the messages of @p errs in order
    [[nodiscard]] ASSAY_API std::vector<std::string> messages(const Errors& errs);

    ASSAY_API std::ostream& operator<<(std::ostream& os, const ValidationError& err);
    ASSAY_API std::ostream& operator<<(std::ostream& os, const Errors& errs);

    /// @ingroup AssayError
    /// @brief Exception carrying a complete list of validation failures
    ///
    /// @details
    /// Thrown by `value_or_throw(...)` and used as the error type of
    /// `to_result(...)`. `what()` summarises the count; `errors()` gives the
    /// full list for rendering.
    class ValidationErrors : public std::runtime_error {
    public:
        ASSAY_API explicit ValidationErrors(Errors errs);

        [[nodiscard]] const Errors& errors() const noexcept { return m_Errors; }
        [[nodiscard]] std::size_t size() const noexcept { return m_Errors.size(); }

    private:
        Errors m_Errors;

        static std::string summary(std::size_t count);
    };

} // namespace Assay
