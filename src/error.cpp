#include "assay/error.hpp"

#include <ostream>
#include <sstream>


namespace Assay {

    namespace detail {
        std::string describe(const std::exception_ptr& cause) {
            try {
                std::rethrow_exception(cause);
            } catch (const std::exception& e) {
                return e.what();
            } catch (...) {
                return "non-standard exception";
            }
        }
    } // namespace detail

    ValidationError ValidationError::make(std::any v, Context ctx, std::string_view m, std::exception_ptr c) {
        ValidationError e;
        e.value = std::move(v);
        e.context = std::move(ctx);
        e.message.assign(m.begin(), m.end());
        e.cause = std::move(c);
        return e;
    }

    const Monoid<Errors>& errors_monoid() {
        static const Monoid<Errors> m = make_monoid<Errors>(
            [](const Errors& a, const Errors& b) {
                Errors out;
                out.reserve(a.size() + b.size());
                out.insert(out.end(), a.begin(), a.end());
                out.insert(out.end(), b.begin(), b.end());
                return out;
            },
            Errors{});
        return m;
    }

    void append(Errors& head, const Errors& tail) {
        head.insert(head.end(), tail.begin(), tail.end());
    }

    std::string to_string(const ValidationError& err, const FormatOptions& opts) {
        std::string out;
        std::string where = path(err.context);
        if (!where.empty()) {
            out += where;
            out += ": ";
        }
        out += err.message;
        if (opts.include_cause && err.cause) {
            out += " (caused by: ";
            out += detail::describe(err.cause);
            out += ")";
        }
        return out;
    }

    std::string to_string(const Errors& errs, const FormatOptions& opts) {
        std::ostringstream oss;
        for (std::size_t i = 0; i < errs.size(); i++) {
            if (i > 0) oss << opts.separator;
            if (opts.numbered) oss << '[' << i << "] ";
            oss << to_string(errs[i], opts);
        }
        return oss.str();
    }

    std::vector<std::string> messages(const Errors& errs) {
        std::vector<std::string> out;
        out.reserve(errs.size());
        for (const auto& e : errs) out.push_back(e.message);
        return out;
    }

    std::ostream& operator<<(std::ostream& os, const ValidationError& err) {
        return os << to_string(err);
    }

    std::ostream& operator<<(std::ostream& os, const Errors& errs) {
        return os << to_string(errs);
    }

    ValidationErrors::ValidationErrors(Errors errs)
        : std::runtime_error{ summary(errs.size()) }, m_Errors{ std::move(errs) } {}

    std::string ValidationErrors::summary(std::size_t count) {
        if (count == 0) return "ValidationErrors: no errors";
        if (count == 1) return "ValidationErrors: 1 error";
        return "ValidationErrors: " + std::to_string(count) + " errors";
    }

} // namespace Assay
