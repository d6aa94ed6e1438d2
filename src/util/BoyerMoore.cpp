#include "util/BoyerMoore.hpp"

namespace tether::util {

BoyerMooreSearch::BoyerMooreSearch(std::string_view pattern)
    : pattern_(pattern) {
    compute_bad_char();
}

void BoyerMooreSearch::compute_bad_char() {
    const size_t m = pattern_.size();
    // All bytes default to maximum shift (pattern length)
    bad_char_.fill(m);
    if (m == 0) return;
    // Bytes in pattern (except last) get actual shift distances
    for (size_t i = 0; i + 1 < m; ++i) {
        bad_char_[static_cast<unsigned char>(pattern_[i])] = m - 1 - i;
    }
}

size_t BoyerMooreSearch::search(std::string_view text, size_t from) const {
    const size_t n = text.size();
    const size_t m = pattern_.size();

    if (m == 0) return from <= n ? from : npos; // empty pattern matches immediately
    if (from > n || m > n - from) return npos;

    size_t i = from;
    while (i <= n - m) {
        size_t j = m;

        // Compare right to left
        while (j > 0 && text[i + j - 1] == pattern_[j - 1]) {
            --j;
        }

        if (j == 0) return i; // match

        // Bad character shift
        size_t shift = bad_char_[static_cast<unsigned char>(text[i + m - 1])];
        i += (shift > 0) ? shift : 1;
    }

    return npos;
}

} // namespace tether::util
