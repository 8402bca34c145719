#pragma once


/*
    ----------------------------------------
    Assay::Context - Path through a document
    ----------------------------------------
    A `Context` records where inside a nested structure a validation attempt
    happened. It is an ordered list of `ContextEntry { key, type }`:

        [{"", "User"}, {"address", "Address"}, {"zipCode", "string"}]

    renders as `User.address.zipCode` (an entry contributes its key, or its
    type name when the key is empty)

    ---------
    Semantics
    ---------
    - Contexts are values. `push(ctx, entry)` returns a new context and never
      mutates the one it was given, so a snapshot stored inside a
      `ValidationError` stays valid however the caller continues
    - Entries are only ever appended; there is no pop
*/


#include <iosfwd>
#include <string>
#include <vector>

#include "assay/config.hpp"

/// @defgroup AssayContext Validation Context
/// @ingroup Assay
/// @brief Path of `{key, type}` entries leading to a validated value

namespace Assay {

    /// @ingroup AssayContext
    /// @brief One segment of a validation path
    struct ContextEntry {
        std::string key;  ///< Field name or index; may be empty
        std::string type; ///< Name of the expected type at this segment

        friend bool operator==(const ContextEntry&, const ContextEntry&) = default;
    };

    /// @ingroup AssayContext
    /// @brief Ordered path from the root to a value
    using Context = std::vector<ContextEntry>;

    /// @ingroup AssayContext
    /// @brief Returns a copy of @p ctx with @p entry appended
    [[nodiscard]] ASSAY_API Context push(const Context& ctx, ContextEntry entry);

    /// @ingroup AssayContext
    /// @brief Renders @p ctx as a dotted path
    ///
    /// @details
    /// Each entry contributes its key, or its type name when the key is
    /// empty. Entries contributing nothing are skipped. An empty context
    /// renders as an empty string.
    [[nodiscard]] ASSAY_API std::string path(const Context& ctx);

    ASSAY_API std::ostream& operator<<(std::ostream& os, const Context& ctx);

} // namespace Assay
