#ifndef RESULT_HPP
#define RESULT_HPP


/**
 * result.hpp - Outcome of an integration attempt, and the optional trace
 * of the techniques that produced it.
 */


#include <ginac/ginac.h>
#include <string>
#include <vector>


/******    Result kinds    ******/
enum class result_kind {
    CLOSED_FORM,        /* antiderivative found                     */
    SYMBOLIC_FALLBACK,  /* undetermined, returned as unevaluated ∫  */
    NON_ELEMENTARY      /* proven to have no elementary antiderivative */
};

/******     Techniques     ******/
enum class technique {
    NONE,
    LINEARITY,          /* sums, constant factors, constants */
    TABLE,
    RATIONAL,
    BY_PARTS,
    SUBSTITUTION,
    TRIGONOMETRIC,
    RISCH
};


const char* technique_name(technique method);


/**
 * Integration variable of the unevaluated integrals `Integral(f(t), t, 0, x)`
 * returned for undetermined and non-elementary integrands. Their derivative
 * with respect to `x` is `f(x)`; the value is only meaningful where `f` is
 * integrable on the interval from 0 to `x`.
 */
const GiNaC::symbol& integration_dummy();


struct integration_result {
    result_kind     kind      = result_kind::SYMBOLIC_FALLBACK;
    technique       method    = technique::NONE;
    GiNaC::ex       value;      /* antiderivative, or the unevaluated integral */
    std::string     reason;     /* set for NON_ELEMENTARY                      */
    bool            cancelled = false;

    bool is_closed_form() const { return kind == result_kind::CLOSED_FORM; }
    bool is_non_elementary() const { return kind == result_kind::NON_ELEMENTARY; }
    bool is_fallback() const { return kind == result_kind::SYMBOLIC_FALLBACK; }

    static integration_result closed_form(const GiNaC::ex& antiderivative, technique method);
    static integration_result fallback(const GiNaC::ex& integrand, const GiNaC::symbol& var,
                                       bool cancelled = false);
    static integration_result non_elementary(const GiNaC::ex& integrand, const GiNaC::symbol& var,
                                             const std::string& reason);
};


std::ostream& operator<<(std::ostream& out, const integration_result& result);


struct trace_entry {
    int             depth;
    technique       method;
    std::string     message;
};


/**
 * Record of the techniques tried during one top-level call, with their
 * major sub-steps. Never needed for correctness.
 */
class integration_trace {
public:
    void record(int depth, technique method, const std::string& message);

    const std::vector<trace_entry>& entries() const { return log; }
    bool contains(technique method) const;
    void clear() { log.clear(); }
private:
    std::vector<trace_entry> log;
};


std::ostream& operator<<(std::ostream& out, const integration_trace& trace);


#endif // RESULT_HPP
