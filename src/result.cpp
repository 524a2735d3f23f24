#include "result.hpp"


const char* technique_name(technique method) {
    switch (method) {
    case technique::NONE:           return "none";
    case technique::LINEARITY:      return "linearity";
    case technique::TABLE:          return "table";
    case technique::RATIONAL:       return "rational";
    case technique::BY_PARTS:       return "by-parts";
    case technique::SUBSTITUTION:   return "substitution";
    case technique::TRIGONOMETRIC:  return "trigonometric";
    case technique::RISCH:          return "risch";
    }
    return "unknown";
}


const GiNaC::symbol& integration_dummy() {
    static thread_local GiNaC::realsymbol dummy("t");
    return dummy;
}


/**
 * `Integral(f(t), t, 0, var)`.
 */
static GiNaC::ex unevaluated(const GiNaC::ex& integrand, const GiNaC::symbol& var) {
    const GiNaC::symbol& t = integration_dummy();
    return GiNaC::integral(t, 0, var, integrand.subs(var == t));
}


integration_result integration_result::closed_form(const GiNaC::ex& antiderivative, technique method) {
    integration_result result;
    result.kind   = result_kind::CLOSED_FORM;
    result.method = method;
    result.value  = antiderivative;
    return result;
}


integration_result integration_result::fallback(const GiNaC::ex& integrand, const GiNaC::symbol& var,
                                                bool cancelled) {
    integration_result result;
    result.kind      = result_kind::SYMBOLIC_FALLBACK;
    result.value     = unevaluated(integrand, var);
    result.cancelled = cancelled;
    return result;
}


integration_result integration_result::non_elementary(const GiNaC::ex& integrand, const GiNaC::symbol& var,
                                                      const std::string& reason) {
    integration_result result;
    result.kind   = result_kind::NON_ELEMENTARY;
    result.method = technique::RISCH;
    result.value  = unevaluated(integrand, var);
    result.reason = reason;
    return result;
}


std::ostream& operator<<(std::ostream& out, const integration_result& result) {
    switch (result.kind) {
    case result_kind::CLOSED_FORM:
        out << result.value << "  [" << technique_name(result.method) << "]";
        break;
    case result_kind::NON_ELEMENTARY:
        out << "non-elementary: " << result.reason;
        break;
    case result_kind::SYMBOLIC_FALLBACK:
        out << result.value << (result.cancelled ? "  [cancelled]" : "  [unevaluated]");
        break;
    }
    return out;
}


void integration_trace::record(int depth, technique method, const std::string& message) {
    log.push_back({depth, method, message});
}


bool integration_trace::contains(technique method) const {
    for (auto& entry: log) {
        if (entry.method == method)
            return true;
    }
    return false;
}


std::ostream& operator<<(std::ostream& out, const integration_trace& trace) {
    for (auto& entry: trace.entries())
        out << std::string(2 * entry.depth, ' ') << technique_name(entry.method) << ": " << entry.message << "\n";
    return out;
}
