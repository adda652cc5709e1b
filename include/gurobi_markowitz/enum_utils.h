#pragma once
/*
===============================================================================
ENUM UTILS — Enum-keyed registries for variables and constraints
===============================================================================

OVERVIEW
--------
Declares strongly-typed enumerations with a COUNT sentinel and provides
EnumTable, the fixed-size registry that VariableTable and ConstraintTable are
built on. A model builder names its variable and constraint groups with two
such enums:

    MARKOWITZ_DECLARE_ENUM(PortfolioVars, W);
    MARKOWITZ_DECLARE_ENUM(PortfolioCons, Budget);

    EnumTable<PortfolioVars, WeightVector> vars;
    vars.set(PortfolioVars::W, std::move(w));
    WeightVector& w = vars(PortfolioVars::W);

EXCEPTION SAFETY
----------------
• EnumTable::set/get throw std::out_of_range for keys >= COUNT
• Everything else is noexcept

===============================================================================
*/

#include <array>
#include <cstddef>
#include <format>
#include <stdexcept>
#include <utility>

/**
 * @macro MARKOWITZ_DECLARE_ENUM
 * @brief Declares `enum class Name { ..., COUNT }` and `Name_COUNT`
 *
 * @example
 *     MARKOWITZ_DECLARE_ENUM(Cons, Budget);
 *     // enum class Cons { Budget, COUNT };
 *     // static constexpr std::size_t Cons_COUNT = 1;
 */
#define MARKOWITZ_DECLARE_ENUM(Name, ...)                                    \
    enum class Name { __VA_ARGS__, COUNT };                                  \
    static constexpr std::size_t Name##_COUNT =                              \
        static_cast<std::size_t>(Name::COUNT)

namespace markowitz {

    /// @brief Underlying position of an enum key
    template<typename EnumT>
    [[nodiscard]] constexpr std::size_t enumIndex(EnumT key) noexcept {
        return static_cast<std::size_t>(key);
    }

    /// @brief Number of user enumerators (the COUNT sentinel value)
    template<typename EnumT>
    [[nodiscard]] constexpr std::size_t enumCount() noexcept {
        return static_cast<std::size_t>(EnumT::COUNT);
    }

    /**
     * @class EnumTable
     * @brief Fixed-size array of T indexed by an enum with a COUNT sentinel
     *
     * @tparam EnumT Enum class declared with MARKOWITZ_DECLARE_ENUM
     * @tparam T     Stored element (WeightVector, ConstraintGroup, ...)
     */
    template<typename EnumT, typename T>
    class EnumTable {
    public:
        static constexpr std::size_t MAX = enumCount<EnumT>();

        void set(EnumT key, T&& item) {
            slot(key, "set") = std::move(item);
        }

        void set(EnumT key, const T& item) {
            slot(key, "set") = item;
        }

        T& get(EnumT key) { return slot(key, "get"); }

        const T& get(EnumT key) const {
            const std::size_t idx = enumIndex(key);
            if (idx >= MAX) {
                throw std::out_of_range(
                    std::format("EnumTable::get: key {} >= {}", idx, MAX));
            }
            return table_[idx];
        }

        T& operator()(EnumT key) { return get(key); }
        const T& operator()(EnumT key) const { return get(key); }

        static constexpr std::size_t size() noexcept { return MAX; }

    private:
        std::array<T, MAX> table_{};

        T& slot(EnumT key, const char* op) {
            const std::size_t idx = enumIndex(key);
            if (idx >= MAX) {
                throw std::out_of_range(
                    std::format("EnumTable::{}: key {} >= {}", op, idx, MAX));
            }
            return table_[idx];
        }
    };

} // namespace markowitz
