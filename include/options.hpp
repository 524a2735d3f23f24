#ifndef OPTIONS_HPP
#define OPTIONS_HPP


/**
 * options.hpp - Options of an integration call, and the per-call state
 * shared by all recursive re-entries of the dispatcher.
 */


#include "result.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <yaml-cpp/yaml.h>


/**
 * Caller-owned cancellation signal. It fires when `cancel()` has been
 * called, or when the optional deadline has passed. Safe to cancel from
 * another thread.
 */
class cancellation_token {
public:
    cancellation_token() = default;
    explicit cancellation_token(std::chrono::milliseconds timeout);

    void cancel() { flag.store(true); }
    bool cancelled() const;
private:
    std::atomic<bool> flag{false};
    bool has_deadline = false;
    std::chrono::steady_clock::time_point deadline;
};


struct integration_options {
    int     max_depth      = 10;    /* nested dispatches along one path */
    int     max_dispatches = 256;   /* nested dispatches in total       */
    bool    risch_enabled  = true;
    int     deadline_ms    = 0;     /* 0: no deadline                   */
    bool    verify         = false; /* check F' = f before accepting F  */
    bool    verbose        = false;
    bool    trace          = false;

    std::shared_ptr<cancellation_token> token;

    /**
     * Read an `IntegrationOption` YAML map. Unknown keys are ignored;
     * malformed values terminate the program with a message.
     */
    static integration_options from_yaml(const YAML::Node& node);
};


/**
 * Depth and dispatch budget of one top-level call. Each nested dispatch
 * takes one unit of depth for its lifetime and one dispatch permanently.
 */
class recursion_budget {
public:
    recursion_budget(int max_depth, int max_dispatches);

    bool exhausted() const { return depth_left <= 0 || dispatches_left <= 0; }
    int  depth() const { return max_depth - depth_left; }
private:
    int max_depth;
    int depth_left;
    int dispatches_left;

    friend class budget_scope;
};


/**
 * Holds one unit of depth while a nested dispatch runs.
 */
class budget_scope {
public:
    explicit budget_scope(recursion_budget& budget);
    ~budget_scope();

    budget_scope(const budget_scope&) = delete;
    budget_scope& operator=(const budget_scope&) = delete;
private:
    recursion_budget& budget;
};


/**
 * Everything a technique needs besides the integrand: the options, the
 * shared budget, the optional trace and the cancellation signal.
 */
struct integration_context {
    const integration_options&  options;
    recursion_budget&           budget;
    integration_trace*          trace;
    const cancellation_token*   token;

    bool cancelled() const { return token != nullptr && token->cancelled(); }

    /**
     * Record `message` in the trace (if any) and log it when verbose.
     */
    void note(technique method, const std::string& message) const;
};


#endif // OPTIONS_HPP
