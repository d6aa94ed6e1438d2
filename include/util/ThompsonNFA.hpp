#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tether::util {

// Thompson NFA regex engine over Unicode code points.
// Supports: . [] [^] [a-z] [[:alpha:]] \d \w \s (and negations) * + ? {n,m}
// lazy quantifiers, | () (?:) (?P<name>) ^ $ \A \z \b \B, inline flags
// (?imsU) and (?flags:...), escapes \n \t \r \f \v \a \xHH \x{HHHH}.
// No backreferences or lookaround: every pattern runs in O(nm).
class ThompsonNFA {
public:
    explicit ThompsonNFA(std::string_view pattern);

    // Did the pattern compile successfully? error() says why not.
    [[nodiscard]] bool valid() const { return valid_; }
    [[nodiscard]] const std::string& error() const { return error_; }

    // Capture groups including group 0 (the whole match).
    [[nodiscard]] int group_count() const { return ngroups_; }

    static constexpr int MAX_INSTS  = 4096;
    static constexpr int MAX_REPEAT = 1000;

    enum class Op : uint8_t { CHAR, CLASS, ANY, ANY_NOT_NL, SPLIT, JMP, SAVE, ASSERT, MATCH };

    enum class Assert : uint8_t {
        BEGIN_TEXT, END_TEXT, BEGIN_LINE, END_LINE, WORD_BOUNDARY, NOT_WORD_BOUNDARY,
    };

    struct Inst {
        Op       op;
        Assert   cond{Assert::BEGIN_TEXT};    // ASSERT
        uint32_t ch{0};                       // CHAR: code point
        int      class_idx{-1};               // CLASS: index into classes_
        int      slot{0};                     // SAVE: capture slot
        int      out{-1};                     // next instruction
        int      out1{-1};                    // SPLIT: lower-priority branch
    };

    struct CpRange { uint32_t lo, hi; };

    struct CharClass {
        std::vector<CpRange> ranges;  // sorted, merged
        bool negated{false};

        [[nodiscard]] bool contains(uint32_t cp) const;
    };

    [[nodiscard]] const std::vector<Inst>& program() const { return prog_; }
    [[nodiscard]] const CharClass& char_class(int idx) const { return classes_[idx]; }
    [[nodiscard]] int start() const { return start_; }

private:
    std::vector<Inst>      prog_;
    std::vector<CharClass> classes_;
    int         start_{-1};
    int         ngroups_{1};
    bool        valid_{false};
    std::string error_;

    friend class NfaCompiler;
};

// Incremental leftmost-first simulation (Pike VM) of one ThompsonNFA.
// Code points are fed one at a time. A match is reported once no
// higher-priority thread can still extend it, so greedy quantifiers take
// as much as the input allows. Deciding that may take code points past the
// end of the match; captures() tells the caller where the match ended.
class NfaStream {
public:
    explicit NfaStream(const ThompsonNFA& nfa);

    // Feed the next code point, `len` bytes long in the input.
    // True once the result is decided.
    bool feed(uint32_t cp, size_t len);

    // End of input: settle on the best surviving match.
    void finish();

    [[nodiscard]] bool done() const { return done_; }
    [[nodiscard]] bool matched() const { return matched_; }

    // Byte offsets into the fed input, two per group, -1 for unset groups.
    [[nodiscard]] const std::vector<long>& captures() const { return match_caps_; }

private:
    struct Ctx {
        long    pos;
        int32_t prev;        // -1 at the start of input
        int32_t next;        // -1 at the end of input
        bool    next_known;
    };

    bool expand(const Ctx& c);
    bool add(int pc, const Ctx& c);
    void step(uint32_t cp);
    void settle(bool at_end);
    [[nodiscard]] int check(ThompsonNFA::Assert a, const Ctx& c) const;
    [[nodiscard]] bool consumes(const ThompsonNFA::Inst& in, uint32_t cp) const;

    const ThompsonNFA& nfa_;
    int ncap_;

    // Threads waiting at pos_, not yet followed through epsilon edges
    std::vector<int>  pend_pc_;
    std::vector<long> pend_caps_;
    // The same threads expanded to consuming/MATCH instructions
    std::vector<int>  run_pc_;
    std::vector<long> run_caps_;
    bool run_valid_{false};

    std::vector<uint32_t> mark_;
    uint32_t gen_{0};
    std::vector<long> scratch_;

    long    pos_{0};
    int32_t prev_{-1};
    bool matched_{false};
    bool done_{false};
    std::vector<long> match_caps_;
};

} // namespace tether::util
