#pragma once
/*
===============================================================================
CALLBACKS — Barrier progress and solver log interception
===============================================================================

Overview
--------
Gurobi solves the portfolio QPs with its barrier (interior point) method.
This header turns Gurobi's where-based callback into named virtual methods
for the two events worth observing during a frontier sweep:

    * onBarrierIter() — one call per barrier iteration, with the primal and
                         dual objectives, infeasibilities and complementarity
    * onMessage()     — every line Gurobi writes to its log

ProgressLogger is a ready-made subclass that writes both to an std::ostream.

Typical Usage
-------------
    markowitz::ProgressLogger logger(std::clog);
    solver.setProgress(&logger);          // FrontierSolver attaches it per model
    solver.sweep(grid);
    std::cout << logger.iterations() << " barrier iterations\n";

    // Or directly on a model
    model.setCallback(&logger);
    model.optimize();

Callback Points
---------------
| Method          | Gurobi where      | Common Use                     |
|-----------------|-------------------|--------------------------------|
| onBarrierIter() | GRB_CB_BARRIER    | Progress logging, early stop   |
| onMessage()     | GRB_CB_MESSAGE    | Redirecting the solver log     |

Exception Safety
----------------
• Standard exceptions thrown from a handler are rethrown as GRBException
  (GRB_ERROR_CALLBACK); Gurobi then aborts the optimization and the
  exception surfaces from GRBModel::optimize().

===============================================================================
*/

#include <cmath>
#include <cstddef>
#include <format>
#include <ostream>
#include <stdexcept>
#include <string>

#include "gurobi_c++.h"

namespace markowitz {

// =============================================================================
// BARRIER PROGRESS
// =============================================================================

struct BarrierProgress {
    int iteration = 0;
    double primalObj = 0.0;
    double dualObj = 0.0;
    double primalInf = 0.0;
    double dualInf = 0.0;
    double complementarity = 0.0;
    double runtime = 0.0;      ///< Seconds since optimize() started

    /// @brief Relative primal-dual objective gap
    double gap() const noexcept {
        const double denom = std::abs(primalObj) > 1.0 ? std::abs(primalObj) : 1.0;
        return std::abs(primalObj - dualObj) / denom;
    }
};

// =============================================================================
// BARRIER CALLBACK BASE CLASS
// =============================================================================

/**
 * @brief Base class for observing barrier solves
 *
 * @details Override onBarrierIter() and/or onMessage(). Call abort() from a
 *          handler to stop the current solve (the model then reports
 *          GRB_INTERRUPTED).
 */
class BarrierCallback : public GRBCallback {
public:
    virtual ~BarrierCallback() = default;

protected:
    virtual void onBarrierIter(const BarrierProgress& p) {
        (void)p;
    }

    virtual void onMessage(const std::string& msg) {
        (void)msg;
    }

    /// @brief Stop the current optimization at the next opportunity
    void abort() {
        GRBCallback::abort();
    }

private:
    BarrierProgress barrierProgress() {
        BarrierProgress p;
        p.iteration = getIntInfo(GRB_CB_BARRIER_ITRCNT);
        p.primalObj = getDoubleInfo(GRB_CB_BARRIER_PRIMOBJ);
        p.dualObj = getDoubleInfo(GRB_CB_BARRIER_DUALOBJ);
        p.primalInf = getDoubleInfo(GRB_CB_BARRIER_PRIMINF);
        p.dualInf = getDoubleInfo(GRB_CB_BARRIER_DUALINF);
        p.complementarity = getDoubleInfo(GRB_CB_BARRIER_COMPL);
        p.runtime = getDoubleInfo(GRB_CB_RUNTIME);
        return p;
    }

    void callback() override {
        try {
            switch (where) {
                case GRB_CB_BARRIER:
                    onBarrierIter(barrierProgress());
                    break;

                case GRB_CB_MESSAGE:
                    onMessage(getStringInfo(GRB_CB_MSG_STRING));
                    break;

                default:
                    break;
            }
        } catch (GRBException&) {
            throw;
        } catch (std::exception& e) {
            throw GRBException(e.what(), GRB_ERROR_CALLBACK);
        }
    }
};

// =============================================================================
// PROGRESS LOGGER
// =============================================================================

/**
 * @brief Writes barrier iterations (and optionally solver messages) to a stream
 *
 * @details Iteration lines look like
 *          "  barrier   7  primal  1.204531e+00  dual  1.204529e+00  compl 3.1e-09"
 */
class ProgressLogger : public BarrierCallback {
public:
    explicit ProgressLogger(std::ostream& os, bool echoMessages = false)
        : os_(os), echoMessages_(echoMessages)
    {
    }

    /// @brief Barrier iterations seen across every solve this logger observed
    std::size_t iterations() const noexcept { return iterations_; }

    /// @brief Solver log lines seen
    std::size_t messages() const noexcept { return messages_; }

    const BarrierProgress& last() const noexcept { return last_; }

protected:
    void onBarrierIter(const BarrierProgress& p) override {
        ++iterations_;
        last_ = p;
        os_ << std::format("  barrier {:3d}  primal {:13.6e}  dual {:13.6e}  compl {:.1e}\n",
                           p.iteration, p.primalObj, p.dualObj, p.complementarity);
    }

    void onMessage(const std::string& msg) override {
        ++messages_;
        if (echoMessages_) {
            os_ << msg;
        }
    }

private:
    std::ostream& os_;
    bool echoMessages_;
    std::size_t iterations_ = 0;
    std::size_t messages_ = 0;
    BarrierProgress last_;
};

} // namespace markowitz
