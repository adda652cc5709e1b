#pragma once
/*
===============================================================================
DATA STORE — Typed key/value storage for parameters, overrides and results
===============================================================================

OVERVIEW
--------
String-keyed storage of type-erased values. A model builder records every
solver parameter it applies under "param:<Name>" and its post-solve metrics
("expected_return", "risk", ...); the example driver collects command-line
overrides in one before turning them into a FrontierConfig.

USAGE EXAMPLES
--------------
    DataStore store;
    store["samples"] = 100;
    store["gamma_min"] = -2.0;

    int samples = store["samples"].get<int>();
    double lo   = store["gamma_min"].get_or(-2.0);

    if (auto v = store["csv"].try_get<std::string>()) {
        std::cout << v->get() << "\n";
    }

EXCEPTION SAFETY
----------------
• get<T>() throws std::bad_any_cast on type mismatch
• get_or<T>(), try_get<T>(), is<T>() never throw

===============================================================================
*/

#include <any>
#include <format>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>

namespace markowitz {

    class Value;

    /// Anything but a Value itself or a C string (stored as std::string instead)
    template <typename T>
    concept StorableValue =
        !std::is_same_v<std::remove_cvref_t<T>, Value> &&
        !std::is_convertible_v<T, const char*>;

    /**
     * @class Value
     * @brief Type-erased value with checked access
     *
     * @note String literals are stored as std::string so that
     *       `store["k"] = "text"` reads back with get<std::string>().
     */
    class Value
    {
        std::any storage_;

    public:
        Value() = default;

        template <typename T>
            requires StorableValue<T>
        Value(T&& v)
            : storage_(std::forward<T>(v))
        {
        }

        Value(const char* s)
            : storage_(std::string(s))
        {
        }

        template <typename T>
            requires StorableValue<T>
        Value& operator=(T&& v)
        {
            storage_ = std::forward<T>(v);
            return *this;
        }

        Value& operator=(const char* s)
        {
            storage_ = std::string(s);
            return *this;
        }

        bool has_value() const noexcept { return storage_.has_value(); }

        const std::type_info& type() const noexcept { return storage_.type(); }

        template <typename T>
        bool is() const noexcept { return storage_.type() == typeid(T); }

        template <typename T>
        T& get() { return std::any_cast<T&>(storage_); }

        template <typename T>
        const T& get() const { return std::any_cast<const T&>(storage_); }

        /// @brief Stored value if it is a T, otherwise default_value
        template <typename T>
        T get_or(const T& default_value) const
        {
            if (is<T>())
                return get<T>();
            return default_value;
        }

        template <typename T>
        std::optional<std::reference_wrapper<const T>> try_get() const noexcept
        {
            if (!is<T>())
                return std::nullopt;
            return std::cref(*std::any_cast<T>(&storage_));
        }

        void reset() noexcept { storage_.reset(); }
    };

    using DataStore = std::unordered_map<std::string, Value>;

    /**
     * @brief Render a stored value for reports
     * @return Text for double, int, bool and std::string values;
     *         "<empty>" or "<type>" otherwise
     */
    inline std::string toString(const Value& v)
    {
        if (!v.has_value()) return "<empty>";
        if (v.is<double>())      return std::format("{:g}", v.get<double>());
        if (v.is<int>())         return std::to_string(v.get<int>());
        if (v.is<bool>())        return v.get<bool>() ? "true" : "false";
        if (v.is<std::string>()) return v.get<std::string>();
        return std::format("<{}>", v.type().name());
    }

} // namespace markowitz
