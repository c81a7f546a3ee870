#pragma once
/*
===============================================================================
SCENARIO TABLE — Dense (scenario, timeslot, field) storage
===============================================================================

OVERVIEW
--------
Every operational element of the model exists once per scenario, per
timeslot and per field (six variable fields, five constraint families).
ScenarioTable stores them in one contiguous vector:

    offset(s, t, f) = ((s * T) + t) * FIELDS + f

so the "FIELDS × timeslots × scenarios" shape is a property of the container
rather than of a naming convention, and the fields of one timeslot sit next
to each other in memory.

The element type is a template parameter: ScenarioTable<GRBVar, ScenarioField>
holds the operational variables, ScenarioTable<GRBConstr, ScenarioConstraint>
the constraints.

USAGE
-----
    ScenarioTable<GRBVar, ScenarioField> vars(S, T);
    vars(s, t, ScenarioField::StorageLevel) = model.addVar(...);

    vars.forEach([](GRBVar& v, int s, int t, ScenarioField f) { ... });

EXCEPTION SAFETY
----------------
• at() / operator(): std::out_of_range on invalid scenario, timeslot or field
• construction: std::invalid_argument on negative extents

===============================================================================
*/

#include <cstddef>
#include <format>
#include <stdexcept>
#include <vector>

#include "enum_utils.h"

namespace sizing {

    template<
        typename Element,
        typename FieldEnum,
        std::size_t FIELDS = static_cast<std::size_t>(FieldEnum::COUNT)>
    class ScenarioTable {
    private:
        std::vector<Element> data_;
        int scenarios_ = 0;
        int timeslots_ = 0;

    public:
        ScenarioTable() = default;

        /**
         * @brief Allocate S * T * FIELDS default-constructed elements
         * @throws std::invalid_argument if scenarios or timeslots is negative
         */
        ScenarioTable(int scenarios, int timeslots)
            : scenarios_(scenarios), timeslots_(timeslots)
        {
            if (scenarios < 0 || timeslots < 0) {
                throw std::invalid_argument(
                    std::format("ScenarioTable: negative extent ({} scenarios, {} timeslots)",
                        scenarios, timeslots));
            }
            data_.resize(static_cast<std::size_t>(scenarios)
                * static_cast<std::size_t>(timeslots) * FIELDS);
        }

        [[nodiscard]] int scenarioCount() const noexcept { return scenarios_; }
        [[nodiscard]] int timeslotCount() const noexcept { return timeslots_; }
        [[nodiscard]] static constexpr std::size_t fieldCount() noexcept { return FIELDS; }

        /// @brief Total number of slots (S * T * FIELDS)
        [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
        [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

        Element& at(int scenario, int timeslot, FieldEnum field) {
            return data_[offset(scenario, timeslot, field)];
        }

        const Element& at(int scenario, int timeslot, FieldEnum field) const {
            return data_[offset(scenario, timeslot, field)];
        }

        Element& operator()(int scenario, int timeslot, FieldEnum field) {
            return at(scenario, timeslot, field);
        }

        const Element& operator()(int scenario, int timeslot, FieldEnum field) const {
            return at(scenario, timeslot, field);
        }

        /**
         * @brief Visit every slot in storage order (scenario, timeslot, field)
         * @tparam Fn Callable (Element&, int scenario, int timeslot, FieldEnum)
         */
        template<typename Fn>
        void forEach(Fn&& fn) {
            std::size_t k = 0;
            for (int s = 0; s < scenarios_; ++s)
                for (int t = 0; t < timeslots_; ++t)
                    for (std::size_t f = 0; f < FIELDS; ++f)
                        fn(data_[k++], s, t, static_cast<FieldEnum>(f));
        }

        /// @brief Const version of forEach()
        template<typename Fn>
        void forEach(Fn&& fn) const {
            std::size_t k = 0;
            for (int s = 0; s < scenarios_; ++s)
                for (int t = 0; t < timeslots_; ++t)
                    for (std::size_t f = 0; f < FIELDS; ++f)
                        fn(data_[k++], s, t, static_cast<FieldEnum>(f));
        }

        /// @brief Elements of one field for one scenario, in timeslot order
        [[nodiscard]] std::vector<Element> series(int scenario, FieldEnum field) const {
            std::vector<Element> out;
            out.reserve(static_cast<std::size_t>(timeslots_));
            for (int t = 0; t < timeslots_; ++t) {
                out.push_back(at(scenario, t, field));
            }
            return out;
        }

    private:
        std::size_t offset(int scenario, int timeslot, FieldEnum field) const {
            if (scenario < 0 || scenario >= scenarios_) {
                throw std::out_of_range(
                    std::format("ScenarioTable: scenario {} out of range [0, {})",
                        scenario, scenarios_));
            }
            if (timeslot < 0 || timeslot >= timeslots_) {
                throw std::out_of_range(
                    std::format("ScenarioTable: timeslot {} out of range [0, {})",
                        timeslot, timeslots_));
            }
            const std::size_t f = enum_index(field);
            if (f >= FIELDS) {
                throw std::out_of_range(
                    std::format("ScenarioTable: field {} >= {}", f, FIELDS));
            }
            return (static_cast<std::size_t>(scenario) * static_cast<std::size_t>(timeslots_)
                + static_cast<std::size_t>(timeslot)) * FIELDS + f;
        }
    };

} // namespace sizing
