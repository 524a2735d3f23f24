#include "job.hpp"
#include "utils.hpp"


integration_job integration_job::from_yaml(const YAML::Node& node) {
    integration_job job;
    if (!has_non_null_key(node, "IntegrationInfo")) {
        std::cerr << "IntegrationJob: missing \"IntegrationInfo\"\n";
        exit(1);
    }

    auto info = node["IntegrationInfo"];
    std::vector<std::string> integrands_;
    try {
        // read integration variable
        if (!has_non_null_key(info, "Variable")) {
            std::cerr << "IntegrationJob: missing integration variable\n";
            exit(1);
        }
        auto variable_ = info["Variable"].as<std::string>();
        add_symbol(variable_, job.symbols);
        job.var = GiNaC::ex_to<GiNaC::symbol>(job.symbols[variable_]);

        // read parameters
        if (has_non_null_key(info, "Parameters")) {
            auto parameters_ = info["Parameters"].as<std::vector<std::string>>();
            for (const std::string& parameter: parameters_)
                add_symbol(parameter, job.symbols);
        }

        // read integrands
        if (has_non_null_key(info, "Integrands"))
            integrands_ = info["Integrands"].as<std::vector<std::string>>();
    } catch (YAML::BadConversion& ex) {
        std::cerr << "IntegrationJob: failed while reading \"IntegrationInfo\"\n";
        exit(1);
    }

    if (integrands_.size() == 0) {
        std::cerr << "IntegrationJob: no input integrands\n";
        exit(1);
    }

    GiNaC::parser pexpr(job.symbols, true);
    for (const std::string& integrand: integrands_) {
        try {
            job.exprs.push_back(pexpr(integrand));
        } catch (GiNaC::parse_error& err) {
            std::cerr << "IntegrationJob: cannot parse integrand \"" << integrand << "\": " << err.what() << "\n";
            exit(1);
        }
    }

    if (has_non_null_key(node, "IntegrationOption"))
        job.opts = integration_options::from_yaml(node["IntegrationOption"]);
    return job;
}


integration_job integration_job::from_file(const char* config_path) {
    YAML::Node config;
    try {
        config = YAML::LoadFile(config_path);
    } catch (YAML::Exception& ex) {
        std::cerr << "IntegrationJob: cannot load " << config_path << ": " << ex.what() << "\n";
        exit(1);
    }
    return from_yaml(config);
}


std::vector<integration_result> integration_job::run(std::ostream& out) const {
    std::vector<integration_result> results;
    for (auto& expr: exprs) {
        integration_trace trace;
        START_TIME(integrate);
        auto result = integrate(expr, var, opts, opts.trace ? &trace : nullptr);
        END_TIME(integrate);

        out << "int(" << expr << ", " << var << ") = " << result << "\n";
        if (opts.trace)
            out << trace;
        PRINT_TIME(integrate);
        results.push_back(result);
    }
    return results;
}


void integration_job::usage() {
    std::cerr << "Usage: symint-cli <config-file>\n";
    std::cerr << "Check examples to see config file format.\n";
    exit(0);
}
