#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "bitset.hpp"
#include "error.hpp"
#include "rule.hpp"
#include "value.hpp"

namespace fixlog {

enum class scope { full, delta };

// Accumulated facts of one relation or lattice plus its delta.
//
// Rows are only ever appended, so a row id is stable for the lifetime of the
// store. A lattice row keeps its key columns and has its last column
// overwritten by joins. Candidates produced during an iteration are staged
// and only become visible at commit(), which also computes the new delta.
class relation_store {
  public:
    static constexpr size_t npos = static_cast<size_t>(-1);

    explicit relation_store(relation_decl decl)
        : decl_(std::move(decl)), table_(std::make_unique<row_table>()),
          keys_(0, key_hash{table_.get()}, key_eq{table_.get()}) {
        table_->key_width = is_lattice() ? arity() - 1 : arity();
    }

    const relation_decl &decl() const { return decl_; }
    const std::string &name() const { return decl_.name; }
    bool is_lattice() const { return decl_.is_lattice(); }
    size_t arity() const { return decl_.arity(); }

    size_t size() const { return table_->rows.size(); }
    const tuple &row(size_t i) const { return table_->rows[i]; }
    auto begin() const { return table_->rows.begin(); }
    auto end() const { return table_->rows.end(); }

    bool contains(const tuple &t) const {
        if (t.size() != arity())
            return false;
        auto it = keys_.find(key_ref{t.data()});
        if (it == keys_.end())
            return false;
        return !is_lattice() || table_->rows[*it].back() == t.back();
    }

    const value *find_value(const tuple &key) const {
        if (key.size() != table_->key_width)
            return nullptr;
        auto it = keys_.find(key_ref{key.data()});
        return it == keys_.end() ? nullptr : &table_->rows[*it].back();
    }

    // Initial state injection. Plain relations insert, lattices join.
    bool insert(tuple t) {
        if (auto msg = check(t))
            throw definition_error(*msg);
        return absorb(std::move(t)) != npos;
    }

    void stage(tuple t) {
        if (auto msg = check(t))
            throw evaluation_error(*msg);
        pending_.push_back(std::move(t));
    }

    size_t pending() const { return pending_.size(); }

    // Folds every staged candidate into the store and makes the rows it
    // changed the new delta. Returns whether anything changed.
    bool commit() {
        if (!is_lattice()) {
            delta_begin_ = table_->rows.size();
            for (auto &t : pending_)
                absorb(std::move(t));
            delta_end_ = table_->rows.size();
            pending_.clear();
            return delta_end_ > delta_begin_;
        }
        delta_mask_.clear();
        delta_rows_.clear();
        for (auto &t : pending_) {
            size_t r = absorb(std::move(t));
            if (r != npos && !delta_mask_.test(r)) {
                delta_mask_.set(r);
                delta_rows_.push_back(r);
            }
        }
        pending_.clear();
        std::sort(delta_rows_.begin(), delta_rows_.end());
        return !delta_rows_.empty();
    }

    // Everything already stored counts as new at the start of a stratum.
    void reset_delta_to_all() {
        delta_begin_ = 0;
        delta_end_ = table_->rows.size();
        delta_mask_.clear();
        delta_rows_.clear();
        if (is_lattice())
            for (size_t r = 0; r < table_->rows.size(); ++r) {
                delta_mask_.set(r);
                delta_rows_.push_back(r);
            }
    }

    void clear_delta() {
        delta_begin_ = delta_end_ = table_->rows.size();
        delta_mask_.clear();
        delta_rows_.clear();
    }

    size_t delta_size() const {
        return is_lattice() ? delta_rows_.size() : delta_end_ - delta_begin_;
    }

    bool in_delta(size_t r) const {
        return is_lattice() ? delta_mask_.test(r)
                            : (r >= delta_begin_ && r < delta_end_);
    }

    template <typename F> void scan(scope s, F &&f) const {
        if (s == scope::full) {
            for (size_t r = 0; r < table_->rows.size(); ++r)
                f(r, table_->rows[r]);
        } else if (is_lattice()) {
            for (size_t r : delta_rows_)
                f(r, table_->rows[r]);
        } else {
            for (size_t r = delta_begin_; r < delta_end_; ++r)
                f(r, table_->rows[r]);
        }
    }

    // Calls f(row_id, row) for every row whose `cols` equal `key`.
    template <typename F>
    void lookup(const std::vector<size_t> &cols, const tuple &key, scope s,
                F &&f) const {
        if (cols.empty()) {
            scan(s, f);
            return;
        }
        auto &idx = index_for(cols);
        auto it = idx.rows.find(key);
        if (it == idx.rows.end())
            return;
        auto &ids = it->second;
        if (s == scope::full) {
            for (size_t r : ids)
                f(r, table_->rows[r]);
        } else if (is_lattice()) {
            for (size_t r : ids)
                if (delta_mask_.test(r))
                    f(r, table_->rows[r]);
        } else {
            auto b = std::lower_bound(ids.begin(), ids.end(), delta_begin_);
            for (; b != ids.end() && *b < delta_end_; ++b)
                f(*b, table_->rows[*b]);
        }
    }

    size_t index_count() const { return indexes_.size(); }

  private:
    // Rows live on the heap so the key set's hasher can refer to them across
    // moves of the store. Keys are row ids: the whole row for a relation,
    // every column but the last for a lattice.
    struct row_table {
        std::vector<tuple> rows;
        size_t key_width = 0;
    };

    struct key_ref {
        const value *data;
    };

    struct key_hash {
        using is_transparent = void;
        const row_table *table;
        size_t operator()(size_t r) const {
            return hash_values(table->rows[r].data(), table->key_width);
        }
        size_t operator()(key_ref k) const {
            return hash_values(k.data, table->key_width);
        }
    };

    struct key_eq {
        using is_transparent = void;
        const row_table *table;
        const value *at(size_t r) const { return table->rows[r].data(); }
        const value *at(key_ref k) const { return k.data; }
        template <typename A, typename B>
        bool operator()(const A &a, const B &b) const {
            return std::equal(at(a), at(a) + table->key_width, at(b));
        }
    };

    struct index {
        std::vector<size_t> cols;
        std::unordered_map<tuple, std::vector<size_t>, tuple_hash> rows;
    };

    static tuple project(const tuple &t, const std::vector<size_t> &cols) {
        tuple k;
        k.reserve(cols.size());
        for (size_t c : cols)
            k.push_back(t[c]);
        return k;
    }

    index &index_for(const std::vector<size_t> &cols) const {
        for (auto &i : indexes_)
            if (i->cols == cols)
                return *i;
        auto i = std::make_unique<index>();
        i->cols = cols;
        for (size_t r = 0; r < table_->rows.size(); ++r)
            i->rows[project(table_->rows[r], cols)].push_back(r);
        indexes_.push_back(std::move(i));
        return *indexes_.back();
    }

    std::optional<std::string> check(const tuple &t) const {
        if (t.size() != arity())
            return "relation '" + name() + "' expects " +
                   std::to_string(arity()) + " columns, got " +
                   std::to_string(t.size());
        for (size_t c = 0; c < t.size(); ++c)
            if (!kind_matches(decl_.columns[c], t[c]))
                return "relation '" + name() + "' column " + std::to_string(c) +
                       " expects " + std::string(kind_name(decl_.columns[c])) +
                       ", got " + t[c].to_string();
        return std::nullopt;
    }

    size_t append(tuple t) {
        size_t r = table_->rows.size();
        table_->rows.push_back(std::move(t));
        keys_.insert(r);
        for (auto &i : indexes_)
            i->rows[project(table_->rows[r], i->cols)].push_back(r);
        return r;
    }

    // Returns the row that changed, or npos. For lattices this is the join
    // step: a new key is inserted, an existing one takes join(new, old) and
    // changes only if that differs from old.
    size_t absorb(tuple t) {
        auto it = keys_.find(key_ref{t.data()});
        if (it == keys_.end())
            return append(std::move(t));
        if (!is_lattice())
            return npos;
        size_t r = *it;
        value &old = table_->rows[r].back();
        value merged = decl_.join(t.back(), old);
        if (merged == old)
            return npos;
        old = std::move(merged);
        return r;
    }

    relation_decl decl_;
    std::unique_ptr<row_table> table_;
    std::unordered_set<size_t, key_hash, key_eq> keys_;
    mutable std::vector<std::unique_ptr<index>> indexes_;
    std::vector<tuple> pending_;
    size_t delta_begin_ = 0;
    size_t delta_end_ = 0;
    std::vector<size_t> delta_rows_;
    row_mask delta_mask_;
};

// Every relation's accumulated state, addressed by declaration order.
class database {
  public:
    size_t add(relation_decl decl) {
        if (decl.name.empty())
            throw definition_error("relation name must not be empty");
        if (by_name_.count(decl.name))
            throw definition_error("relation '" + decl.name +
                                   "' declared twice");
        if (decl.is_lattice() && decl.columns.empty())
            throw definition_error("lattice '" + decl.name +
                                   "' needs at least a value column");
        size_t id = stores_.size();
        by_name_.emplace(decl.name, id);
        stores_.emplace_back(std::move(decl));
        return id;
    }

    std::optional<size_t> find(std::string_view name) const {
        auto it = by_name_.find(std::string(name));
        if (it == by_name_.end())
            return std::nullopt;
        return it->second;
    }

    size_t id(std::string_view name) const {
        if (auto i = find(name))
            return *i;
        throw definition_error("unknown relation '" + std::string(name) + "'");
    }

    relation_store &operator[](size_t i) { return stores_[i]; }
    const relation_store &operator[](size_t i) const { return stores_[i]; }
    relation_store &at(std::string_view name) { return stores_[id(name)]; }
    const relation_store &at(std::string_view name) const {
        return stores_[id(name)];
    }

    size_t size() const { return stores_.size(); }
    auto begin() const { return stores_.begin(); }
    auto end() const { return stores_.end(); }

  private:
    std::vector<relation_store> stores_;
    std::unordered_map<std::string, size_t> by_name_;
};

} // namespace fixlog
