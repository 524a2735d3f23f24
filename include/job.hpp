#ifndef JOB_HPP
#define JOB_HPP


#include "integrate.hpp"
#include <string>
#include <vector>


/**
 * A batch of integrands read from a YAML job file:
 * 
 *   IntegrationInfo:
 *     Variable: x
 *     Parameters: [a, b]
 *     Integrands:
 *       - x^2
 *       - exp(x)/(exp(x)+1)
 *   IntegrationOption:
 *     MaxDepth: 10
 *     Risch: true
 * 
 * The integration variable and the parameters are real symbols. A malformed
 * job file terminates the program with a message.
 */
class integration_job {
public:
    static integration_job from_yaml(const YAML::Node& node);
    static integration_job from_file(const char* config_path);

    /**
     * Integrate every integrand in order, printing one line per integrand
     * (and its trace when requested) to `out`.
     */
    std::vector<integration_result> run(std::ostream& out) const;

    const GiNaC::symbol&            variable() const { return var; }
    const std::vector<GiNaC::ex>&   integrands() const { return exprs; }
    const integration_options&      options() const { return opts; }

    static void usage();
private:
    GiNaC::symtab           symbols;
    GiNaC::symbol           var;
    std::vector<GiNaC::ex>  exprs;
    integration_options     opts;
};


#endif // JOB_HPP
