#pragma once
/*
===============================================================================
EXPRESSIONS — Linear sums over index domains
===============================================================================

OVERVIEW
--------
sum(domain, f) accumulates f over every index of a domain into a GRBLinExpr.
For a product domain the (s, t) tuple is spread into two arguments, so both
forms below read like the model:

    sum_{t in T} p[t] * b[s,t]      sum(T, [&](int t) { ... })
    sum_{(s,t) in S x T} b[s,t]     sum(S * T, [&](int s, int t) { ... })

f may return a GRBVar, a GRBLinExpr or a plain double. ObjectiveBuilder uses
sum for the recourse cost of a scenario and for the scenario average.

An exception thrown by f leaves the caller's model untouched; the partial
expression is discarded.

===============================================================================
*/

#include <functional>
#include <tuple>
#include <type_traits>

#include "gurobi_c++.h"
#include "indexing.h"

namespace sizing {

    namespace expr_detail {

        /// @brief f(s, t) for a tuple index, f(t) otherwise
        template<typename Func, typename Idx>
        decltype(auto) invoke_on_index(Func& f, const Idx& idx) {
            if constexpr (detail::is_tuple_like_v<Idx>) {
                return std::apply(f, idx);
            }
            else {
                return std::invoke(f, idx);
            }
        }

    } // namespace expr_detail

    /**
     * @brief Sum of f(idx) over a domain
     *
     * @tparam Domain RangeView, ProductView or any range of int or tuples
     *
     * @example
     *     GRBLinExpr bought = sum(T, [&](int t) {
     *         return vars(s, t, ScenarioField::BoughtEnergy);
     *     });
     */
    template<typename Domain, typename Func>
    GRBLinExpr sum(const Domain& domain, Func&& f) {
        GRBLinExpr total;
        for (const auto& idx : domain) {
            total += expr_detail::invoke_on_index(f, idx);
        }
        return total;
    }

} // namespace sizing
