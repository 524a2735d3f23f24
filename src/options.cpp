#include "options.hpp"
#include "utils.hpp"


cancellation_token::cancellation_token(std::chrono::milliseconds timeout)
    : has_deadline(true), deadline(std::chrono::steady_clock::now() + timeout) {}


bool cancellation_token::cancelled() const {
    if (flag.load())
        return true;
    return has_deadline && std::chrono::steady_clock::now() >= deadline;
}


integration_options integration_options::from_yaml(const YAML::Node& node) {
    integration_options options;
    if (!node.IsDefined() || node.IsNull())
        return options;
    if (!node.IsMap()) {
        std::cerr << "IntegrationOption: expected a map of options\n";
        exit(1);
    }

    try {
        if (has_non_null_key(node, "MaxDepth"))
            options.max_depth = node["MaxDepth"].as<int>();
        if (has_non_null_key(node, "MaxDispatches"))
            options.max_dispatches = node["MaxDispatches"].as<int>();
        if (has_non_null_key(node, "Risch"))
            options.risch_enabled = node["Risch"].as<bool>();
        if (has_non_null_key(node, "DeadlineMs"))
            options.deadline_ms = node["DeadlineMs"].as<int>();
        if (has_non_null_key(node, "Verify"))
            options.verify = node["Verify"].as<bool>();
        if (has_non_null_key(node, "Verbose"))
            options.verbose = node["Verbose"].as<bool>();
        if (has_non_null_key(node, "Trace"))
            options.trace = node["Trace"].as<bool>();
    } catch (YAML::BadConversion& ex) {
        std::cerr << "IntegrationOption: failed while reading integration options\n";
        exit(1);
    }

    if (options.max_depth < 0 || options.max_dispatches < 0 || options.deadline_ms < 0) {
        std::cerr << "IntegrationOption: MaxDepth, MaxDispatches and DeadlineMs must be nonnegative\n";
        exit(1);
    }
    return options;
}


recursion_budget::recursion_budget(int max_depth, int max_dispatches)
    : max_depth(max_depth), depth_left(max_depth), dispatches_left(max_dispatches) {}


budget_scope::budget_scope(recursion_budget& budget) : budget(budget) {
    budget.depth_left--;
    budget.dispatches_left--;
}


budget_scope::~budget_scope() {
    budget.depth_left++;
}


void integration_context::note(technique method, const std::string& message) const {
    if (trace != nullptr)
        trace->record(budget.depth(), method, message);
    VERBOSE_LOG(options, technique_name(method) << ": " << message);
}
