#include "assay/context.hpp"

#include <ostream>
#include <utility>


namespace Assay {

    Context push(const Context& ctx, ContextEntry entry) {
        Context next;
        next.reserve(ctx.size() + 1);
        next.insert(next.end(), ctx.begin(), ctx.end());
        next.emplace_back(std::move(entry));
        return next;
    }

    std::string path(const Context& ctx) {
        std::string out;
        for (const auto& entry : ctx) {
            const std::string& segment = entry.key.empty() ? entry.type : entry.key;
            if (segment.empty()) continue;
            if (!out.empty()) out.push_back('.');
            out += segment;
        }
        return out;
    }

    std::ostream& operator<<(std::ostream& os, const Context& ctx) {
        return os << path(ctx);
    }

} // namespace Assay
