#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace tether::util {

// Boyer-Moore-Horspool literal search.
// O(1) extra space (fixed 256-entry bad character table).
// Average case: O(n/m) sublinear. Worst case: O(n*m).
// Byte-exact: UTF-8 needles match UTF-8 haystacks without decoding.
class BoyerMooreSearch {
public:
    explicit BoyerMooreSearch(std::string_view pattern);

    // Position of the first match at or after `from`, or npos.
    [[nodiscard]] size_t search(std::string_view text, size_t from = 0) const;

    [[nodiscard]] size_t length() const { return pattern_.size(); }

    static constexpr size_t npos = std::string_view::npos;

private:
    static constexpr int ALPHABET_SIZE = 256;

    std::array<size_t, ALPHABET_SIZE> bad_char_{};
    std::string pattern_;

    void compute_bad_char();
};

} // namespace tether::util
