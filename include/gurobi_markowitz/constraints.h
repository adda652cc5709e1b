#pragma once
/*
===============================================================================
CONSTRAINTS — Constraint handles and attribute helpers
===============================================================================

OVERVIEW
--------
Creates and keeps the GRBConstr handles of a portfolio model so their
attributes (right-hand side, slack, dual price) can be read after solving.
The long-only budget model has a single constraint, sum(w) = 1, held in one
enum-keyed slot.

KEY COMPONENTS
--------------
• ConstraintGroup   — handle of one named constraint, empty until added
• ConstraintFactory — creates handles from generator lambdas
• ConstraintTable   — enum-keyed registry (see enum_utils.h)
• rhs()/sense()/slack()/dual()/constrName() — attribute helpers

USAGE EXAMPLES
--------------
    auto budget = ConstraintFactory::add(model, "budget",
        [&]() { return sum(W) == 1.0; });

    model.optimize();
    double price = dual(budget.scalar());

EXCEPTION SAFETY
----------------
• scalar(): std::logic_error on an empty handle

===============================================================================
*/

#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "gurobi_c++.h"
#include "naming.h"
#include "enum_utils.h"

namespace markowitz {

    // ============================================================================
    // CONSTRAINT GROUP
    // ============================================================================
    class ConstraintGroup {
        std::optional<GRBConstr> constr_;

    public:
        ConstraintGroup() = default;

        explicit ConstraintGroup(GRBConstr c)
            : constr_(c)
        {
        }

        bool empty() const noexcept { return !constr_.has_value(); }
        int size() const noexcept { return constr_ ? 1 : 0; }

        GRBConstr& scalar() {
            requireConstraint();
            return *constr_;
        }

        const GRBConstr& scalar() const {
            requireConstraint();
            return *constr_;
        }

    private:
        void requireConstraint() const {
            if (!constr_) {
                throw std::logic_error("ConstraintGroup::scalar: no constraint has been added");
            }
        }
    };

    // ============================================================================
    // CONSTRAINT FACTORY
    // ============================================================================
    class ConstraintFactory {
    public:
        /**
         * @brief Add one constraint produced by gen()
         * @param gen Callable returning GRBTempConstr
         */
        template<typename Gen>
            requires std::is_invocable_v<Gen&>
        static ConstraintGroup add(GRBModel& model, const std::string& name, Gen&& gen)
        {
            if constexpr (naming_enabled()) {
                return ConstraintGroup(model.addConstr(gen(), make_name::plain(name)));
            }
            else {
                return ConstraintGroup(model.addConstr(gen()));
            }
        }
    };

    template<typename EnumT>
    using ConstraintTable = EnumTable<EnumT, ConstraintGroup>;

    // ============================================================================
    // ATTRIBUTE HELPERS
    // ============================================================================

    inline double rhs(const GRBConstr& c) { return c.get(GRB_DoubleAttr_RHS); }

    inline void setRHS(GRBConstr& c, double val) { c.set(GRB_DoubleAttr_RHS, val); }

    /// @return GRB_LESS_EQUAL, GRB_GREATER_EQUAL or GRB_EQUAL
    inline char sense(const GRBConstr& c) { return c.get(GRB_CharAttr_Sense); }

    /// @note Requires a solution
    inline double slack(const GRBConstr& c) { return c.get(GRB_DoubleAttr_Slack); }

    /**
     * @brief Dual price (Pi) of a linear constraint
     * @note For the budget constraint this is the marginal objective value of
     *       one more unit of budget. Available for continuous QPs after an
     *       optimal solve.
     */
    inline double dual(const GRBConstr& c) { return c.get(GRB_DoubleAttr_Pi); }

    inline std::string constrName(const GRBConstr& c) {
        return c.get(GRB_StringAttr_ConstrName);
    }

} // namespace markowitz
