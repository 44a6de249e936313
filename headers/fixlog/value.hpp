#pragma once

#include <concepts>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "error.hpp"

namespace fixlog {

enum class value_kind { any, unit, boolean, integer, real, string, list };

inline std::string_view kind_name(value_kind k) {
    switch (k) {
    case value_kind::any:
        return "any";
    case value_kind::unit:
        return "unit";
    case value_kind::boolean:
        return "boolean";
    case value_kind::integer:
        return "integer";
    case value_kind::real:
        return "real";
    case value_kind::string:
        return "string";
    case value_kind::list:
        return "list";
    }
    return "?";
}

class value {
  public:
    using list_t = std::vector<value>;

    value() = default;
    value(bool b) : v_(b) {}
    template <std::integral T>
        requires(!std::same_as<T, bool>)
    value(T i) : v_(static_cast<int64_t>(i)) {}
    template <std::floating_point T> value(T d) : v_(static_cast<double>(d)) {}
    value(const char *s) : v_(std::string(s)) {}
    value(std::string s) : v_(std::move(s)) {}
    value(std::string_view s) : v_(std::string(s)) {}
    value(list_t l) : v_(std::make_shared<const list_t>(std::move(l))) {}

    value_kind kind() const {
        switch (v_.index()) {
        case 0:
            return value_kind::unit;
        case 1:
            return value_kind::boolean;
        case 2:
            return value_kind::integer;
        case 3:
            return value_kind::real;
        case 4:
            return value_kind::string;
        default:
            return value_kind::list;
        }
    }

    bool is_unit() const { return v_.index() == 0; }
    bool is_bool() const { return v_.index() == 1; }
    bool is_int() const { return v_.index() == 2; }
    bool is_real() const { return v_.index() == 3; }
    bool is_number() const { return is_int() || is_real(); }
    bool is_string() const { return v_.index() == 4; }
    bool is_list() const { return v_.index() == 5; }

    bool as_bool() const { return get<bool>(); }
    int64_t as_int() const { return get<int64_t>(); }
    double as_real() const { return get<double>(); }
    const std::string &as_string() const { return get<std::string>(); }
    const list_t &as_list() const {
        return *get<std::shared_ptr<const list_t>>();
    }

    // Integers widen to double; everything else is a type fault.
    double to_real() const {
        if (is_int())
            return static_cast<double>(as_int());
        return as_real();
    }

    size_t hash() const {
        size_t seed = v_.index() * 0x9e3779b97f4a7c15ULL;
        auto mix = [&](size_t h) {
            seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        };
        switch (v_.index()) {
        case 1:
            mix(std::hash<bool>{}(as_bool()));
            break;
        case 2:
            mix(std::hash<int64_t>{}(as_int()));
            break;
        case 3: {
            // All NaNs compare equal, as do -0.0 and 0.0.
            double d = as_real();
            if (d == 0)
                d = 0;
            mix(std::isnan(d) ? size_t(0x7ff8) : std::hash<double>{}(d));
            break;
        }
        case 4:
            mix(std::hash<std::string>{}(as_string()));
            break;
        case 5:
            for (auto &e : as_list())
                mix(e.hash());
            break;
        default:
            break;
        }
        return seed;
    }

    // Total order: by kind first, then by content. Lists compare
    // lexicographically. NaN is the greatest real and equal to itself.
    friend int compare(const value &a, const value &b) {
        if (a.v_.index() != b.v_.index())
            return a.v_.index() < b.v_.index() ? -1 : 1;
        auto three = [](const auto &x, const auto &y) {
            return x < y ? -1 : (y < x ? 1 : 0);
        };
        switch (a.v_.index()) {
        case 1:
            return three(a.as_bool(), b.as_bool());
        case 2:
            return three(a.as_int(), b.as_int());
        case 3: {
            bool na = std::isnan(a.as_real()), nb = std::isnan(b.as_real());
            if (na || nb)
                return three(na, nb);
            return three(a.as_real(), b.as_real());
        }
        case 4:
            return a.as_string().compare(b.as_string()) < 0
                       ? -1
                       : (a.as_string() == b.as_string() ? 0 : 1);
        case 5: {
            auto &l = a.as_list();
            auto &r = b.as_list();
            if (&l == &r)
                return 0;
            for (size_t i = 0; i < l.size() && i < r.size(); ++i)
                if (int c = compare(l[i], r[i]))
                    return c;
            return three(l.size(), r.size());
        }
        default:
            return 0;
        }
    }

    friend bool operator==(const value &a, const value &b) {
        return compare(a, b) == 0;
    }
    friend bool operator<(const value &a, const value &b) {
        return compare(a, b) < 0;
    }
    friend bool operator>(const value &a, const value &b) {
        return compare(a, b) > 0;
    }
    friend bool operator<=(const value &a, const value &b) {
        return compare(a, b) <= 0;
    }
    friend bool operator>=(const value &a, const value &b) {
        return compare(a, b) >= 0;
    }

    std::string to_string() const {
        switch (v_.index()) {
        case 1:
            return as_bool() ? "true" : "false";
        case 2:
            return std::to_string(as_int());
        case 3: {
            std::string s = fmt::format("{}", as_real());
            if (s.find_first_of(".eni") == std::string::npos)
                s += ".0";
            return s;
        }
        case 4:
            return "\"" + as_string() + "\"";
        case 5: {
            std::string s = "[";
            for (size_t i = 0; i < as_list().size(); ++i) {
                if (i)
                    s += ", ";
                s += as_list()[i].to_string();
            }
            return s + "]";
        }
        default:
            return "()";
        }
    }

  private:
    template <typename T> const T &get() const {
        if (auto *p = std::get_if<T>(&v_))
            return *p;
        throw evaluation_error("value " + to_string() + " is not of the " +
                               "requested kind");
    }

    std::variant<std::monostate, bool, int64_t, double, std::string,
                 std::shared_ptr<const list_t>>
        v_;
};

using tuple = std::vector<value>;

inline value make_list(std::initializer_list<value> items) {
    return value(value::list_t(items));
}

inline bool kind_matches(value_kind declared, const value &v) {
    return declared == value_kind::any || declared == v.kind();
}

inline size_t hash_values(const value *vs, size_t n) {
    size_t seed = n;
    for (size_t i = 0; i < n; ++i)
        seed ^= vs[i].hash() + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    return seed;
}

struct tuple_hash {
    size_t operator()(const tuple &t) const {
        return hash_values(t.data(), t.size());
    }
};

inline std::string to_string(const tuple &t) {
    std::string s = "(";
    for (size_t i = 0; i < t.size(); ++i) {
        if (i)
            s += ", ";
        s += t[i].to_string();
    }
    return s + ")";
}

} // namespace fixlog

template <> struct std::hash<fixlog::value> {
    size_t operator()(const fixlog::value &v) const { return v.hash(); }
};
