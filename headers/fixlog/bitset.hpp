#pragma once

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace fixlog {

// Growable row-membership mask. Rows are dense indices into a store.
class row_mask {
  public:
    using word_t = uint64_t;

    void set(size_t i) {
        if (i / 64 >= words_.size())
            words_.resize(i / 64 + 1, 0);
        words_[i / 64] |= 1ULL << (i % 64);
    }

    bool test(size_t i) const {
        return i / 64 < words_.size() && (words_[i / 64] & (1ULL << (i % 64)));
    }

    void clear() { std::fill(words_.begin(), words_.end(), 0); }

    bool any() const {
        for (auto w : words_)
            if (w)
                return true;
        return false;
    }

    size_t count() const {
        size_t c = 0;
        for (auto w : words_)
            c += std::popcount(w);
        return c;
    }

  private:
    std::vector<word_t> words_;
};

} // namespace fixlog
