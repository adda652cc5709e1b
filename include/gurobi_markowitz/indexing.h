#pragma once
/*
===============================================================================
INDEXING — Asset index domains for building sums and quadratic forms
===============================================================================

OVERVIEW
--------
Lazy integer domains over the asset universe. Expressions iterate them to
build linear sums (sum_i mu_i w_i) and quadratic forms (sum_{i,j} S_ij w_i w_j).

KEY COMPONENTS
--------------
• RangeView  — half-open integer range [begin, end) with positive step
• range()    — convenience constructor
• PairView   — pairs (a, b) with a <= b drawn from two ranges, yields
               std::tuple<int,int>
• upperPairs — pairs (i, j) with i <= j < n, for symmetric matrices

USAGE EXAMPLES
--------------
    auto A = markowitz::range(0, n);
    for (int i : A) { ... }

    for (auto [i, j] : markowitz::upperPairs(n)) { ... }   // n(n+1)/2 pairs

NOTES
-----
• PairView stores its ranges by value, so `PairView(range(0, n), range(2, n))`
  is safe to iterate after the temporaries are gone.
• Empty when step <= 0 or end <= begin.

===============================================================================
*/

#include <cstddef>
#include <iterator>
#include <ostream>
#include <tuple>
#include <type_traits>

namespace markowitz {

    // ============================================================================
    // RangeView
    // ============================================================================
    class RangeView {
    public:
        class iterator {
            int current_ = 0;
            int step_ = 1;

        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = int;
            using difference_type = std::ptrdiff_t;
            using pointer = const int*;
            using reference = int;

            iterator() = default;
            iterator(int current, int step) : current_(current), step_(step) {}

            int operator*() const { return current_; }

            iterator& operator++() {
                current_ += step_;
                return *this;
            }

            iterator operator++(int) {
                iterator tmp = *this;
                ++(*this);
                return tmp;
            }

            bool operator==(const iterator& other) const noexcept {
                return current_ == other.current_;
            }
            bool operator!=(const iterator& other) const noexcept {
                return !(*this == other);
            }
        };

    private:
        int         start_ = 0;
        int         step_ = 1;
        std::size_t size_ = 0;

        // long long intermediates keep (end - begin) free of signed overflow
        static std::size_t compute_size(int begin, int end, int step) {
            if (step <= 0 || end <= begin) return 0;
            const long long span = static_cast<long long>(end) - begin;
            return static_cast<std::size_t>((span + step - 1) / step);
        }

    public:
        RangeView() = default;

        RangeView(int begin, int end, int step = 1)
            : start_(begin)
            , step_(step)
            , size_(compute_size(begin, end, step))
        {
        }

        std::size_t size() const noexcept { return size_; }
        bool empty() const noexcept { return size_ == 0; }

        int operator[](std::size_t i) const {
            return static_cast<int>(static_cast<long long>(start_)
                + static_cast<long long>(i) * step_);
        }

        iterator begin() const { return iterator(start_, step_); }
        iterator end() const {
            return iterator(static_cast<int>(start_ + static_cast<long long>(size_) * step_), step_);
        }
    };

    /// @brief Range [begin, end) with positive step
    inline RangeView range(int begin, int end, int step = 1) {
        return RangeView(begin, end, step);
    }

    // ============================================================================
    // PairView
    // ============================================================================
    /**
     * @class PairView
     * @brief Pairs (a, b) with a <= b drawn from two ranges, row-major
     */
    class PairView {
        RangeView rows_;
        RangeView cols_;

    public:
        class iterator {
            const PairView* owner_ = nullptr;
            std::size_t r_ = 0;
            std::size_t c_ = 0;

            void skipLower() {
                while (r_ < owner_->rows_.size() && c_ < owner_->cols_.size()
                       && owner_->cols_[c_] < owner_->rows_[r_]) {
                    ++c_;
                    if (c_ == owner_->cols_.size()) {
                        c_ = 0;
                        ++r_;
                    }
                }
            }

        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = std::tuple<int, int>;
            using difference_type = std::ptrdiff_t;
            using pointer = void;
            using reference = value_type;

            iterator() = default;

            iterator(const PairView* owner, bool isEnd)
                : owner_(owner)
            {
                if (isEnd || owner_->rows_.empty() || owner_->cols_.empty()) {
                    r_ = owner_->rows_.size();
                    c_ = 0;
                    return;
                }
                skipLower();
            }

            value_type operator*() const {
                return { owner_->rows_[r_], owner_->cols_[c_] };
            }

            iterator& operator++() {
                ++c_;
                if (c_ == owner_->cols_.size()) {
                    c_ = 0;
                    ++r_;
                }
                skipLower();
                return *this;
            }

            iterator operator++(int) {
                iterator tmp = *this;
                ++(*this);
                return tmp;
            }

            bool operator==(const iterator& other) const noexcept {
                return r_ == other.r_ && c_ == other.c_;
            }
            bool operator!=(const iterator& other) const noexcept {
                return !(*this == other);
            }
        };

        PairView(RangeView rows, RangeView cols)
            : rows_(rows), cols_(cols)
        {
        }

        iterator begin() const { return iterator(this, false); }
        iterator end() const { return iterator(this, true); }

        /// @brief Number of pairs; walks the view
        std::size_t size() const {
            std::size_t n = 0;
            for (auto it = begin(); it != end(); ++it) ++n;
            return n;
        }

        bool empty() const { return begin() == end(); }
    };

    /// @brief (i, j) with 0 <= i <= j < n
    inline PairView upperPairs(int n) {
        return PairView(range(0, n), range(0, n));
    }

    inline std::ostream& operator<<(std::ostream& os, const RangeView& R) {
        os << "{";
        bool first = true;
        std::size_t printed = 0;
        for (int v : R) {
            if (printed++ >= 10) { os << ", ..."; break; }
            if (!first) os << ", ";
            os << v;
            first = false;
        }
        return os << "}";
    }

    namespace detail {

        template<typename T, typename = void>
        struct is_tuple_like : std::false_type {};

        template<typename T>
        struct is_tuple_like<T, std::void_t<decltype(std::tuple_size<T>::value)>>
            : std::true_type {};

        template<typename T>
        inline constexpr bool is_tuple_like_v = is_tuple_like<T>::value;

    } // namespace detail

} // namespace markowitz
