#pragma once
/*
===============================================================================
INDEXING — Lazy index domains for scenarios and timeslots
===============================================================================

OVERVIEW
--------
The sizing model is indexed by scenario s in [0, S) and timeslot t in [0, T).
Two domain types let loops over those sets read like the model:

• sizing::RangeView / range_view(b, e, step) - lazy half-open range [b, e)
• sizing::ProductView / S * T                - pairs (s, t), scenario-major

Scenario-major order visits every timeslot of a scenario in increasing order
before moving to the next scenario, which is the order the storage recursion
is built in.

USAGE
-----
    auto S = sizing::range_view(0, config.numberOfScenarios);
    auto T = sizing::range_view(0, config.timeslotCount());
    for (auto [s, t] : S * T) { ... }

Both views are small value types; a product copies its operands.

===============================================================================
*/

#include <cstddef>
#include <iterator>
#include <tuple>
#include <type_traits>

namespace sizing {

    // ============================================================================
    // RangeView
    // ============================================================================

    /**
     * @class RangeView
     * @brief Half-open integer range [begin, end) with a positive step
     *
     * @details Iterators walk positions 0 .. size()-1, so ranges that end
     *          near INT_MAX or INT_MIN never compute an out-of-range value.
     */
    class RangeView {
    public:
        class iterator {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = int;
            using difference_type = std::ptrdiff_t;
            using pointer = const int*;
            using reference = int;

            iterator() = default;
            iterator(const RangeView* range, std::size_t pos) : range_(range), pos_(pos) {}

            int operator*() const { return (*range_)[pos_]; }

            iterator& operator++() {
                ++pos_;
                return *this;
            }

            iterator operator++(int) {
                iterator previous = *this;
                ++pos_;
                return previous;
            }

            bool operator==(const iterator& other) const noexcept { return pos_ == other.pos_; }
            bool operator!=(const iterator& other) const noexcept { return pos_ != other.pos_; }

        private:
            const RangeView* range_ = nullptr;
            std::size_t pos_ = 0;
        };

        RangeView() = default;

        /// @brief Empty if step <= 0 or end <= begin
        RangeView(int begin, int end, int step = 1)
            : first_(begin), step_(step), count_(countOf(begin, end, step)) {
        }

        [[nodiscard]] std::size_t size() const noexcept { return count_; }
        [[nodiscard]] bool empty() const noexcept { return count_ == 0; }

        /// @brief i-th element; no range check
        int operator[](std::size_t i) const noexcept {
            return static_cast<int>(first_ + static_cast<long long>(i) * step_);
        }

        iterator begin() const { return iterator(this, 0); }
        iterator end() const { return iterator(this, count_); }

    private:
        long long first_ = 0;
        long long step_ = 1;
        std::size_t count_ = 0;

        static std::size_t countOf(long long begin, long long end, long long step) {
            if (step <= 0 || end <= begin) {
                return 0;
            }
            return static_cast<std::size_t>((end - begin + step - 1) / step);
        }
    };

    inline RangeView range_view(int begin, int end, int step = 1) {
        return RangeView(begin, end, step);
    }

    // ============================================================================
    // ProductView
    // ============================================================================

    /**
     * @class ProductView
     * @brief Lazy product of two ranges yielding std::tuple<int, int>
     *
     * @details The second range varies fastest. The product is empty if
     *          either operand is.
     */
    class ProductView {
    public:
        class iterator {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = std::tuple<int, int>;
            using difference_type = std::ptrdiff_t;
            using pointer = void;
            using reference = value_type;

            iterator() = default;
            iterator(const ProductView* product, std::size_t pos) : product_(product), pos_(pos) {}

            value_type operator*() const {
                const std::size_t inner = product_->inner_.size();
                return { product_->outer_[pos_ / inner], product_->inner_[pos_ % inner] };
            }

            iterator& operator++() {
                ++pos_;
                return *this;
            }

            iterator operator++(int) {
                iterator previous = *this;
                ++pos_;
                return previous;
            }

            bool operator==(const iterator& other) const noexcept { return pos_ == other.pos_; }
            bool operator!=(const iterator& other) const noexcept { return pos_ != other.pos_; }

        private:
            const ProductView* product_ = nullptr;
            std::size_t pos_ = 0;
        };

        ProductView(RangeView outer, RangeView inner) : outer_(outer), inner_(inner) {}

        [[nodiscard]] std::size_t size() const noexcept { return outer_.size() * inner_.size(); }
        [[nodiscard]] bool empty() const noexcept { return size() == 0; }

        iterator begin() const { return iterator(this, 0); }
        iterator end() const { return iterator(this, size()); }

    private:
        RangeView outer_;
        RangeView inner_;
    };

    /// @brief `S * T`
    inline ProductView operator*(const RangeView& outer, const RangeView& inner) {
        return ProductView(outer, inner);
    }

    namespace detail {

        template<typename T, typename = void>
        struct is_tuple_like : std::false_type {};

        template<typename T>
        struct is_tuple_like<T, std::void_t<decltype(std::tuple_size<T>::value)>>
            : std::true_type {
        };

        /// @brief True for tuple, pair and array index types
        template<typename T>
        inline constexpr bool is_tuple_like_v = is_tuple_like<T>::value;

    } // namespace detail

} // namespace sizing
