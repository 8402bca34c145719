#pragma once


/*
    -----------------------------
    Assay error rendering options
    -----------------------------
    This header defines the configuration structure that controls how
    validation errors are rendered to text by `Assay::to_string(...)` and
    the `operator<<` overloads in `error.hpp`

    ----------------------------------------
    Rendering Options - Assay::FormatOptions
    ----------------------------------------
    - `bool numbered`:
        * When true, each error line is prefixed with its position, `[0] `,
          `[1] `, ... in the order the errors were accumulated
        * When false (default), lines are written without a prefix
    - `bool include_cause`:
        * When true (default), an error that wraps a lower-level exception is
          suffixed with ` (caused by: <what()>)`
        * When false, causes are omitted
    - `std::string separator`:
        * Text written between two rendered errors, `"\n"` by default

    -----
    Usage
    -----
        std::string text = Assay::to_string(errors, { .numbered = true });

    The structure is a plain aggregate suitable for designated initializers
*/


#include <string>

/// @defgroup AssayOptions Rendering Options
/// @ingroup Assay
/// @brief Configuration objects controlling error rendering

namespace Assay {

    /// @ingroup AssayOptions
    /// @brief Configuration controlling how errors are rendered to text
    ///
    /// Example:
    /// @code
    /// Assay::FormatOptions opts;
    /// opts.numbered = true;
    /// opts.separator = "; ";
    /// std::cerr << Assay::to_string(errs, opts);
    /// @endcode
    struct FormatOptions {
        bool numbered = false;          ///< Prefix each line with `[i] `
        bool include_cause = true;      ///< Append ` (caused by: ...)` for wrapped errors
        std::string separator = "\n";   ///< Text between two rendered errors
    };

} // namespace Assay
