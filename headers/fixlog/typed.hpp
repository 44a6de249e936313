#pragma once

#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "datalog.hpp"
#include "rule.hpp"
#include "value.hpp"

namespace fixlog {

template <typename T> struct value_traits;

template <> struct value_traits<bool> {
    static constexpr value_kind kind = value_kind::boolean;
    static value to(bool b) { return value(b); }
    static bool from(const value &v) { return v.as_bool(); }
};

template <std::integral T>
    requires(!std::same_as<T, bool>)
struct value_traits<T> {
    static constexpr value_kind kind = value_kind::integer;
    static value to(T i) { return value(i); }
    static T from(const value &v) { return static_cast<T>(v.as_int()); }
};

template <std::floating_point T> struct value_traits<T> {
    static constexpr value_kind kind = value_kind::real;
    static value to(T d) { return value(d); }
    static T from(const value &v) { return static_cast<T>(v.to_real()); }
};

template <> struct value_traits<std::string> {
    static constexpr value_kind kind = value_kind::string;
    static value to(const std::string &s) { return value(s); }
    static std::string from(const value &v) { return v.as_string(); }
};

template <typename T> struct value_traits<std::vector<T>> {
    static constexpr value_kind kind = value_kind::list;
    static value to(const std::vector<T> &xs) {
        value::list_t l;
        l.reserve(xs.size());
        for (auto &x : xs)
            l.push_back(value_traits<T>::to(x));
        return value(std::move(l));
    }
    static std::vector<T> from(const value &v) {
        std::vector<T> out;
        for (auto &e : v.as_list())
            out.push_back(value_traits<T>::from(e));
        return out;
    }
};

template <typename T>
concept storable = requires(const T &t, const value &v) {
    { value_traits<T>::kind } -> std::convertible_to<value_kind>;
    { value_traits<T>::to(t) } -> std::convertible_to<value>;
    { value_traits<T>::from(v) } -> std::convertible_to<T>;
};

namespace detail {

template <typename... Ts> tuple pack(const Ts &...xs) {
    return tuple{value_traits<Ts>::to(xs)...};
}

template <typename... Ts, size_t... Is>
std::tuple<Ts...> unpack(const tuple &t, std::index_sequence<Is...>) {
    return std::tuple<Ts...>(value_traits<Ts>::from(t[Is])...);
}

} // namespace detail

// Statically typed handle on a plain relation of a program.
template <storable... Ts> class relation_ref {
  public:
    using row_type = std::tuple<Ts...>;

    relation_ref(program &p, std::string name)
        : p_(&p), name_(std::move(name)) {}

    const std::string &name() const { return name_; }

    bool insert(const Ts &...xs) { return p_->insert(name_, detail::pack(xs...)); }

    bool contains(const Ts &...xs) const {
        return p_->contains(name_, detail::pack(xs...));
    }

    size_t size() const { return p_->relation(name_).size(); }

    // Sorted by the engine's value order.
    std::vector<row_type> facts() const {
        std::vector<row_type> out;
        for (auto &t : p_->facts(name_))
            out.push_back(
                detail::unpack<Ts...>(t, std::index_sequence_for<Ts...>{}));
        return out;
    }

    // A `head` or `match` target with the given terms.
    template <typename... Args> head operator()(Args &&...args) const {
        static_assert(sizeof...(Args) == sizeof...(Ts), "arity mismatch");
        return head{name_, {term(std::forward<Args>(args))...}};
    }

  private:
    program *p_;
    std::string name_;
};

template <storable V, storable... Keys> class lattice_ref {
  public:
    lattice_ref(program &p, std::string name)
        : p_(&p), name_(std::move(name)) {}

    const std::string &name() const { return name_; }

    bool insert(const Keys &...keys, const V &v) {
        return p_->insert(name_, detail::pack(keys..., v));
    }

    std::optional<V> get(const Keys &...keys) const {
        if (auto v = p_->lattice_value(name_, detail::pack(keys...)))
            return value_traits<V>::from(*v);
        return std::nullopt;
    }

    bool contains(const Keys &...keys, const V &v) const {
        return p_->contains(name_, detail::pack(keys..., v));
    }

    size_t size() const { return p_->relation(name_).size(); }

    std::vector<std::tuple<Keys..., V>> facts() const {
        std::vector<std::tuple<Keys..., V>> out;
        for (auto &t : p_->facts(name_))
            out.push_back(detail::unpack<Keys..., V>(
                t, std::index_sequence_for<Keys..., V>{}));
        return out;
    }

    template <typename... Args> head operator()(Args &&...args) const {
        static_assert(sizeof...(Args) == sizeof...(Keys) + 1, "arity mismatch");
        return head{name_, {term(std::forward<Args>(args))...}};
    }

  private:
    program *p_;
    std::string name_;
};

template <storable... Ts>
relation_ref<Ts...> declare(program &p, std::string name) {
    p.add_relation(name, {value_traits<Ts>::kind...});
    return relation_ref<Ts...>(p, std::move(name));
}

template <storable V, storable... Keys>
lattice_ref<V, Keys...> declare_lattice(program &p, std::string name,
                                        join_fn join) {
    p.add_lattice(name, {value_traits<Keys>::kind..., value_traits<V>::kind},
                  std::move(join));
    return lattice_ref<V, Keys...>(p, std::move(name));
}

// Turns a head built by a ref into the equivalent body match.
inline match body(head h) { return match{std::move(h.rel), std::move(h.args)}; }

} // namespace fixlog
