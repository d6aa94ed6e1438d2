#include "util/ThompsonNFA.hpp"
#include "util/Utf8.hpp"
#include <algorithm>
#include <iterator>
#include <memory>

namespace tether::util {

// ── Character helpers ──────────────────────────────────────────────────

using CpRange = ThompsonNFA::CpRange;

static constexpr uint32_t kMaxCp = 0x10FFFF;

// Other-case partner for the scripts with a simple one-to-one mapping
// (ASCII, Latin-1, basic Greek and Cyrillic). Returns cp when there is none.
static uint32_t simple_fold(uint32_t cp) {
    if (cp >= 'A' && cp <= 'Z') return cp + 32;
    if (cp >= 'a' && cp <= 'z') return cp - 32;
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 0x20;
    if (cp >= 0xE0 && cp <= 0xFE && cp != 0xF7) return cp - 0x20;
    if (cp >= 0x391 && cp <= 0x3A9 && cp != 0x3A2) return cp + 0x20;
    if (cp >= 0x3B1 && cp <= 0x3C9 && cp != 0x3C2) return cp - 0x20;
    if (cp >= 0x410 && cp <= 0x42F) return cp + 0x20;
    if (cp >= 0x430 && cp <= 0x44F) return cp - 0x20;
    if (cp >= 0x400 && cp <= 0x40F) return cp + 0x50;
    if (cp >= 0x450 && cp <= 0x45F) return cp - 0x50;
    return cp;
}

static bool is_word(int32_t cp) {
    return (cp >= '0' && cp <= '9') || (cp >= 'A' && cp <= 'Z') ||
           (cp >= 'a' && cp <= 'z') || cp == '_';
}

// Sort and merge overlapping or adjacent ranges.
static void normalize(std::vector<CpRange>& ranges) {
    std::sort(ranges.begin(), ranges.end(),
              [](const CpRange& a, const CpRange& b) { return a.lo < b.lo; });
    std::vector<CpRange> merged;
    for (const auto& r : ranges) {
        if (!merged.empty() && r.lo <= merged.back().hi + 1)
            merged.back().hi = std::max(merged.back().hi, r.hi);
        else
            merged.push_back(r);
    }
    ranges.swap(merged);
}

static std::vector<CpRange> complement(std::vector<CpRange> ranges) {
    normalize(ranges);
    std::vector<CpRange> out;
    uint32_t cursor = 0;
    for (const auto& r : ranges) {
        if (r.lo > cursor) out.push_back({cursor, r.lo - 1});
        cursor = r.hi + 1;
    }
    if (cursor <= kMaxCp) out.push_back({cursor, kMaxCp});
    return out;
}

static void add_folds(std::vector<CpRange>& ranges) {
    const size_t n = ranges.size();
    for (size_t i = 0; i < n; ++i) {
        uint32_t hi = std::min(ranges[i].hi, (uint32_t)0x45F);
        for (uint32_t cp = ranges[i].lo; cp <= hi; ++cp) {
            uint32_t f = simple_fold(cp);
            if (f != cp) ranges.push_back({f, f});
        }
    }
    normalize(ranges);
}

// \d \w \s, ASCII only
static bool perl_class(char c, std::vector<CpRange>& out, bool& negated) {
    negated = (c == 'D' || c == 'W' || c == 'S');
    switch (c) {
        case 'd': case 'D':
            out = {{'0', '9'}};
            return true;
        case 'w': case 'W':
            out = {{'0', '9'}, {'A', 'Z'}, {'_', '_'}, {'a', 'z'}};
            return true;
        case 's': case 'S':
            out = {{'\t', '\n'}, {'\f', '\r'}, {' ', ' '}};
            return true;
        default:
            return false;
    }
}

struct PosixClass { std::string_view name; std::vector<CpRange> ranges; };

static const std::vector<PosixClass>& posix_classes() {
    static const std::vector<PosixClass> table = {
        {"alnum",  {{'0', '9'}, {'A', 'Z'}, {'a', 'z'}}},
        {"alpha",  {{'A', 'Z'}, {'a', 'z'}}},
        {"ascii",  {{0x00, 0x7F}}},
        {"blank",  {{'\t', '\t'}, {' ', ' '}}},
        {"cntrl",  {{0x00, 0x1F}, {0x7F, 0x7F}}},
        {"digit",  {{'0', '9'}}},
        {"graph",  {{'!', '~'}}},
        {"lower",  {{'a', 'z'}}},
        {"print",  {{' ', '~'}}},
        {"punct",  {{'!', '/'}, {':', '@'}, {'[', '`'}, {'{', '~'}}},
        {"space",  {{'\t', '\r'}, {' ', ' '}}},
        {"upper",  {{'A', 'Z'}}},
        {"word",   {{'0', '9'}, {'A', 'Z'}, {'_', '_'}, {'a', 'z'}}},
        {"xdigit", {{'0', '9'}, {'A', 'F'}, {'a', 'f'}}},
    };
    return table;
}

bool ThompsonNFA::CharClass::contains(uint32_t cp) const {
    auto it = std::upper_bound(ranges.begin(), ranges.end(), cp,
                               [](uint32_t v, const CpRange& r) { return v < r.lo; });
    bool in = it != ranges.begin() && cp <= std::prev(it)->hi;
    return in != negated;
}

// ── Parser ─────────────────────────────────────────────────────────────

struct Flags {
    bool icase{false};
    bool multiline{false};
    bool dotall{false};
    bool ungreedy{false};
};

struct Node {
    enum class Kind : uint8_t { EMPTY, LITERAL, CLASS, ANY, ASSERT, GROUP, CONCAT, ALTERNATE, REPEAT };

    explicit Node(Kind k) : kind(k) {}

    Kind     kind;
    uint32_t cp{0};                   // LITERAL
    int      class_idx{-1};           // CLASS
    bool     dotall{false};           // ANY
    ThompsonNFA::Assert cond{};       // ASSERT
    int      group{-1};               // GROUP: capture index, -1 = non-capturing
    int      min{0}, max{-1};         // REPEAT: max -1 = unbounded
    bool     greedy{true};            // REPEAT
    bool     flag_only{false};        // EMPTY produced by "(?i)"
    std::vector<std::unique_ptr<Node>> kids;
};

using NodePtr = std::unique_ptr<Node>;

// NFA fragment: a start instruction and the dangling outputs to patch.
struct Frag {
    int start;
    struct Patch { int inst; bool is_out1; };
    std::vector<Patch> outs;
};

class NfaCompiler {
public:
    NfaCompiler(ThompsonNFA& nfa, std::string_view pattern)
        : nfa_(nfa), p_(pattern.data()), end_(pattern.data() + pattern.size()) {}

    bool run();

private:
    static constexpr int MAX_DEPTH = 1000;

    NodePtr parse_alt(Flags flags, int depth);
    NodePtr parse_concat(Flags& flags, int depth);
    NodePtr parse_atom(Flags& flags, int depth);
    NodePtr parse_group(Flags& flags, int depth);
    NodePtr parse_class(const Flags& flags);
    NodePtr parse_escape(const Flags& flags);
    bool parse_class_char(uint32_t& cp);
    bool parse_hex(uint32_t& cp);
    bool try_parse_repeat(int& min, int& max);
    bool next_cp(uint32_t& cp);

    NodePtr literal(uint32_t cp, const Flags& flags);
    NodePtr make_class(std::vector<CpRange> ranges, bool negated, const Flags& flags);
    NodePtr fail(const char* msg);

    int  add_inst(ThompsonNFA::Op op);
    void patch(const std::vector<Frag::Patch>& outs, int target);
    Frag emit(const Node& n);
    Frag emit_concat(std::vector<Frag> parts);
    Frag emit_star(Frag f, bool greedy);
    Frag emit_quest(Frag f, bool greedy);

    ThompsonNFA& nfa_;
    const char* p_;
    const char* end_;
    bool overflow_{false};
};

NodePtr NfaCompiler::fail(const char* msg) {
    if (nfa_.error_.empty()) nfa_.error_ = msg;
    return nullptr;
}

bool NfaCompiler::next_cp(uint32_t& cp) {
    auto d = decode_utf8(p_, (size_t)(end_ - p_));
    if (d.state != Utf8State::Complete) return false;
    cp = d.code_point;
    p_ += d.size;
    return true;
}

NodePtr NfaCompiler::literal(uint32_t cp, const Flags& flags) {
    uint32_t f = flags.icase ? simple_fold(cp) : cp;
    if (f != cp) return make_class({{cp, cp}, {f, f}}, false, Flags{});
    auto n = std::make_unique<Node>(Node::Kind::LITERAL);
    n->cp = cp;
    return n;
}

NodePtr NfaCompiler::make_class(std::vector<CpRange> ranges, bool negated, const Flags& flags) {
    if (flags.icase) add_folds(ranges);
    else normalize(ranges);
    ThompsonNFA::CharClass cls;
    cls.ranges = std::move(ranges);
    cls.negated = negated;
    auto n = std::make_unique<Node>(Node::Kind::CLASS);
    n->class_idx = (int)nfa_.classes_.size();
    nfa_.classes_.push_back(std::move(cls));
    return n;
}

NodePtr NfaCompiler::parse_alt(Flags flags, int depth) {
    if (depth > MAX_DEPTH) return fail("expression nests too deeply");
    std::vector<NodePtr> branches;
    for (;;) {
        auto c = parse_concat(flags, depth);
        if (!c) return nullptr;
        branches.push_back(std::move(c));
        if (p_ < end_ && *p_ == '|') { ++p_; continue; }
        break;
    }
    if (branches.size() == 1) return std::move(branches[0]);
    auto alt = std::make_unique<Node>(Node::Kind::ALTERNATE);
    alt->kids = std::move(branches);
    return alt;
}

NodePtr NfaCompiler::parse_concat(Flags& flags, int depth) {
    auto cat = std::make_unique<Node>(Node::Kind::CONCAT);
    while (p_ < end_ && *p_ != '|' && *p_ != ')') {
        char c = *p_;
        int rmin = 0, rmax = 0;
        if (c == '*' || c == '+' || c == '?') return fail("missing argument to repetition operator");
        if (c == '{' && try_parse_repeat(rmin, rmax)) return fail("missing argument to repetition operator");

        auto atom = parse_atom(flags, depth);
        if (!atom) return nullptr;

        bool quantified = false;
        while (p_ < end_) {
            c = *p_;
            int min = 0, max = -1;
            if (c == '*')      { ++p_; min = 0; max = -1; }
            else if (c == '+') { ++p_; min = 1; max = -1; }
            else if (c == '?') { ++p_; min = 0; max = 1; }
            else if (c == '{') { if (!try_parse_repeat(min, max)) break; }
            else break;

            if (atom->flag_only) return fail("missing argument to repetition operator");
            if (quantified) return fail("invalid nested repetition operator");
            if (!nfa_.error_.empty()) return nullptr;
            bool greedy = !flags.ungreedy;
            if (p_ < end_ && *p_ == '?') { ++p_; greedy = !greedy; }

            auto rep = std::make_unique<Node>(Node::Kind::REPEAT);
            rep->min = min;
            rep->max = max;
            rep->greedy = greedy;
            rep->kids.push_back(std::move(atom));
            atom = std::move(rep);
            quantified = true;
        }
        if (atom->flag_only) continue;
        cat->kids.push_back(std::move(atom));
    }
    if (cat->kids.empty()) return std::make_unique<Node>(Node::Kind::EMPTY);
    if (cat->kids.size() == 1) return std::move(cat->kids[0]);
    return cat;
}

// {n} {n,} {n,m}. Leaves p_ alone when the text is not a repeat, so a
// stray '{' is a literal.
bool NfaCompiler::try_parse_repeat(int& min, int& max) {
    const char* q = p_ + 1;
    auto number = [&](int& v) {
        const char* s = q;
        long acc = 0;
        while (q < end_ && *q >= '0' && *q <= '9') {
            acc = acc * 10 + (*q - '0');
            if (acc > 100000) acc = 100000;
            ++q;
        }
        v = (int)acc;
        return q != s;
    };
    if (!number(min)) return false;
    if (q < end_ && *q == ',') {
        ++q;
        if (q < end_ && *q == '}') max = -1;
        else if (!number(max)) return false;
    } else {
        max = min;
    }
    if (q >= end_ || *q != '}') return false;
    p_ = q + 1;
    if (min > ThompsonNFA::MAX_REPEAT || max > ThompsonNFA::MAX_REPEAT ||
        (max >= 0 && max < min)) {
        fail("invalid repeat count");
    }
    return true;
}

NodePtr NfaCompiler::parse_atom(Flags& flags, int depth) {
    char c = *p_;
    switch (c) {
        case '(':
            return parse_group(flags, depth);
        case '[':
            ++p_;
            return parse_class(flags);
        case '.': {
            ++p_;
            auto n = std::make_unique<Node>(Node::Kind::ANY);
            n->dotall = flags.dotall;
            return n;
        }
        case '^': {
            ++p_;
            auto n = std::make_unique<Node>(Node::Kind::ASSERT);
            n->cond = flags.multiline ? ThompsonNFA::Assert::BEGIN_LINE : ThompsonNFA::Assert::BEGIN_TEXT;
            return n;
        }
        case '$': {
            ++p_;
            auto n = std::make_unique<Node>(Node::Kind::ASSERT);
            n->cond = flags.multiline ? ThompsonNFA::Assert::END_LINE : ThompsonNFA::Assert::END_TEXT;
            return n;
        }
        case '\\':
            ++p_;
            return parse_escape(flags);
        default: {
            uint32_t cp;
            if (!next_cp(cp)) return fail("invalid UTF-8 in pattern");
            return literal(cp, flags);
        }
    }
}

NodePtr NfaCompiler::parse_group(Flags& flags, int depth) {
    ++p_;  // '('
    int capture = -1;
    Flags inner = flags;

    if (p_ < end_ && *p_ == '?') {
        ++p_;
        std::string_view rest(p_, (size_t)(end_ - p_));
        if (rest.starts_with("P<") || (rest.starts_with("<") && !rest.starts_with("<=") && !rest.starts_with("<!"))) {
            p_ += (*p_ == 'P') ? 2 : 1;
            const char* name = p_;
            while (p_ < end_ && is_word((unsigned char)*p_)) ++p_;
            if (p_ == name || p_ >= end_ || *p_ != '>') return fail("invalid named capture");
            ++p_;
            capture = nfa_.ngroups_++;
        } else if (rest.starts_with("=") || rest.starts_with("!") ||
                   rest.starts_with("<=") || rest.starts_with("<!")) {
            return fail("lookaround assertions are not supported");
        } else {
            // Flag group: (?flags) or (?flags:re)
            bool negate = false, any = false;
            for (;;) {
                if (p_ >= end_) return fail("missing closing )");
                char f = *p_++;
                if (f == ':' || f == ')') {
                    if (negate && !any) return fail("invalid flag group");
                    if (f == ')') {
                        if (!any) return fail("invalid flag group");
                        flags = inner;
                        auto n = std::make_unique<Node>(Node::Kind::EMPTY);
                        n->flag_only = true;
                        return n;
                    }
                    break;
                }
                bool on = !negate;
                switch (f) {
                    case 'i': inner.icase = on; any = true; break;
                    case 'm': inner.multiline = on; any = true; break;
                    case 's': inner.dotall = on; any = true; break;
                    case 'U': inner.ungreedy = on; any = true; break;
                    case '-':
                        if (negate) return fail("invalid flag group");
                        negate = true;
                        any = false;
                        break;
                    default:
                        return fail("unsupported inline flag");
                }
            }
        }
    } else {
        capture = nfa_.ngroups_++;
    }

    auto body = parse_alt(inner, depth + 1);
    if (!body) return nullptr;
    if (p_ >= end_ || *p_ != ')') return fail("missing closing )");
    ++p_;

    auto g = std::make_unique<Node>(Node::Kind::GROUP);
    g->group = capture;
    g->kids.push_back(std::move(body));
    return g;
}

bool NfaCompiler::parse_hex(uint32_t& cp) {
    // p_ is just past 'x'
    uint32_t v = 0;
    auto hexval = [](char h) -> int {
        if (h >= '0' && h <= '9') return h - '0';
        if (h >= 'a' && h <= 'f') return h - 'a' + 10;
        if (h >= 'A' && h <= 'F') return h - 'A' + 10;
        return -1;
    };
    if (p_ < end_ && *p_ == '{') {
        ++p_;
        int digits = 0;
        while (p_ < end_ && *p_ != '}') {
            int h = hexval(*p_++);
            if (h < 0 || ++digits > 6) return false;
            v = v * 16 + (uint32_t)h;
        }
        if (p_ >= end_ || digits == 0) return false;
        ++p_;
    } else {
        for (int i = 0; i < 2; ++i) {
            if (p_ >= end_) return false;
            int h = hexval(*p_++);
            if (h < 0) return false;
            v = v * 16 + (uint32_t)h;
        }
    }
    if (v > kMaxCp) return false;
    cp = v;
    return true;
}

NodePtr NfaCompiler::parse_escape(const Flags& flags) {
    if (p_ >= end_) return fail("trailing backslash at end of expression");
    char c = *p_++;

    std::vector<CpRange> ranges;
    bool negated = false;
    if (perl_class(c, ranges, negated)) return make_class(std::move(ranges), negated, Flags{});

    auto assertion = [](ThompsonNFA::Assert a) {
        auto n = std::make_unique<Node>(Node::Kind::ASSERT);
        n->cond = a;
        return n;
    };
    switch (c) {
        case 'b': return assertion(ThompsonNFA::Assert::WORD_BOUNDARY);
        case 'B': return assertion(ThompsonNFA::Assert::NOT_WORD_BOUNDARY);
        case 'A': return assertion(ThompsonNFA::Assert::BEGIN_TEXT);
        case 'z': return assertion(ThompsonNFA::Assert::END_TEXT);
        case 'n': return literal('\n', flags);
        case 't': return literal('\t', flags);
        case 'r': return literal('\r', flags);
        case 'f': return literal('\f', flags);
        case 'v': return literal('\v', flags);
        case 'a': return literal('\a', flags);
        case 'x': {
            uint32_t cp;
            if (!parse_hex(cp)) return fail("invalid hex escape");
            return literal(cp, flags);
        }
        default:
            break;
    }
    if (c >= '1' && c <= '9') return fail("backreferences are not supported");
    auto uc = (unsigned char)c;
    if (uc < 0x80 && !is_word(uc)) return literal(uc, flags);
    return fail("invalid escape sequence");
}

// One class member: a code point, possibly escaped.
bool NfaCompiler::parse_class_char(uint32_t& cp) {
    if (*p_ != '\\') return next_cp(cp);
    ++p_;
    if (p_ >= end_) return false;
    char c = *p_++;
    switch (c) {
        case 'n': cp = '\n'; return true;
        case 't': cp = '\t'; return true;
        case 'r': cp = '\r'; return true;
        case 'f': cp = '\f'; return true;
        case 'v': cp = '\v'; return true;
        case 'a': cp = '\a'; return true;
        case 'x': return parse_hex(cp);
        default: break;
    }
    auto uc = (unsigned char)c;
    if (uc < 0x80 && !is_word(uc)) { cp = uc; return true; }
    return false;
}

NodePtr NfaCompiler::parse_class(const Flags& flags) {
    bool negated = false;
    if (p_ < end_ && *p_ == '^') { negated = true; ++p_; }

    std::vector<CpRange> ranges;
    bool first = true;
    for (;;) {
        if (p_ >= end_) return fail("missing closing ]");
        if (*p_ == ']' && !first) { ++p_; break; }
        first = false;

        std::string_view rest(p_, (size_t)(end_ - p_));
        if (rest.starts_with("[:")) {
            auto close = rest.find(":]", 2);
            if (close == std::string_view::npos) return fail("invalid character class");
            auto name = rest.substr(2, close - 2);
            bool neg = !name.empty() && name[0] == '^';
            if (neg) name.remove_prefix(1);
            const auto& table = posix_classes();
            auto it = std::find_if(table.begin(), table.end(),
                                   [&](const PosixClass& pc) { return pc.name == name; });
            if (it == table.end()) return fail("invalid character class range");
            auto add = neg ? complement(it->ranges) : it->ranges;
            ranges.insert(ranges.end(), add.begin(), add.end());
            p_ += close + 2;
            continue;
        }
        if (*p_ == '\\' && p_ + 1 < end_) {
            std::vector<CpRange> perl;
            bool neg = false;
            if (perl_class(p_[1], perl, neg)) {
                p_ += 2;
                if (neg) perl = complement(std::move(perl));
                ranges.insert(ranges.end(), perl.begin(), perl.end());
                continue;
            }
        }

        uint32_t lo;
        if (!parse_class_char(lo)) return fail("invalid character class");
        uint32_t hi = lo;
        if (p_ + 1 < end_ && *p_ == '-' && p_[1] != ']') {
            ++p_;
            if (!parse_class_char(hi)) return fail("invalid character class");
            if (hi < lo) return fail("invalid character class range");
        }
        ranges.push_back({lo, hi});
    }
    return make_class(std::move(ranges), negated, flags);
}

bool NfaCompiler::run() {
    auto root = parse_alt(Flags{}, 0);
    if (!root) return false;
    if (p_ < end_) {
        fail("unexpected )");
        return false;
    }

    int s0 = add_inst(ThompsonNFA::Op::SAVE);
    nfa_.prog_[s0].slot = 0;
    Frag body = emit(*root);
    int s1 = add_inst(ThompsonNFA::Op::SAVE);
    nfa_.prog_[s1].slot = 1;
    int match = add_inst(ThompsonNFA::Op::MATCH);
    if (overflow_) {
        fail("pattern too large");
        return false;
    }

    nfa_.prog_[s0].out = body.start;
    patch(body.outs, s1);
    nfa_.prog_[s1].out = match;
    nfa_.start_ = s0;
    return true;
}

// ── NFA construction ───────────────────────────────────────────────────

int NfaCompiler::add_inst(ThompsonNFA::Op op) {
    if ((int)nfa_.prog_.size() >= ThompsonNFA::MAX_INSTS) overflow_ = true;
    ThompsonNFA::Inst in{};
    in.op = op;
    nfa_.prog_.push_back(in);
    return (int)nfa_.prog_.size() - 1;
}

void NfaCompiler::patch(const std::vector<Frag::Patch>& outs, int target) {
    for (const auto& p : outs) {
        if (p.is_out1) nfa_.prog_[p.inst].out1 = target;
        else nfa_.prog_[p.inst].out = target;
    }
}

Frag NfaCompiler::emit_concat(std::vector<Frag> parts) {
    for (size_t i = 0; i + 1 < parts.size(); ++i) patch(parts[i].outs, parts[i + 1].start);
    return {parts.front().start, std::move(parts.back().outs)};
}

Frag NfaCompiler::emit_star(Frag f, bool greedy) {
    int sp = add_inst(ThompsonNFA::Op::SPLIT);
    if (greedy) nfa_.prog_[sp].out = f.start;
    else nfa_.prog_[sp].out1 = f.start;
    patch(f.outs, sp);
    return {sp, {{sp, greedy}}};
}

Frag NfaCompiler::emit_quest(Frag f, bool greedy) {
    int sp = add_inst(ThompsonNFA::Op::SPLIT);
    if (greedy) nfa_.prog_[sp].out = f.start;
    else nfa_.prog_[sp].out1 = f.start;
    auto outs = std::move(f.outs);
    outs.push_back({sp, greedy});
    return {sp, std::move(outs)};
}

Frag NfaCompiler::emit(const Node& n) {
    using Op = ThompsonNFA::Op;
    switch (n.kind) {
        case Node::Kind::EMPTY: {
            int j = add_inst(Op::JMP);
            return {j, {{j, false}}};
        }
        case Node::Kind::LITERAL: {
            int s = add_inst(Op::CHAR);
            nfa_.prog_[s].ch = n.cp;
            return {s, {{s, false}}};
        }
        case Node::Kind::CLASS: {
            int s = add_inst(Op::CLASS);
            nfa_.prog_[s].class_idx = n.class_idx;
            return {s, {{s, false}}};
        }
        case Node::Kind::ANY: {
            int s = add_inst(n.dotall ? Op::ANY : Op::ANY_NOT_NL);
            return {s, {{s, false}}};
        }
        case Node::Kind::ASSERT: {
            int s = add_inst(Op::ASSERT);
            nfa_.prog_[s].cond = n.cond;
            return {s, {{s, false}}};
        }
        case Node::Kind::GROUP: {
            if (n.group < 0) return emit(*n.kids[0]);
            int open = add_inst(Op::SAVE);
            nfa_.prog_[open].slot = 2 * n.group;
            Frag body = emit(*n.kids[0]);
            int close = add_inst(Op::SAVE);
            nfa_.prog_[close].slot = 2 * n.group + 1;
            nfa_.prog_[open].out = body.start;
            patch(body.outs, close);
            return {open, {{close, false}}};
        }
        case Node::Kind::CONCAT: {
            std::vector<Frag> parts;
            for (const auto& k : n.kids) {
                parts.push_back(emit(*k));
                if (overflow_) break;
            }
            return emit_concat(std::move(parts));
        }
        case Node::Kind::ALTERNATE: {
            std::vector<Frag> branches;
            for (const auto& k : n.kids) branches.push_back(emit(*k));
            Frag result = std::move(branches.back());
            for (int i = (int)branches.size() - 2; i >= 0; --i) {
                int sp = add_inst(Op::SPLIT);
                nfa_.prog_[sp].out = branches[i].start;
                nfa_.prog_[sp].out1 = result.start;
                auto outs = std::move(branches[i].outs);
                outs.insert(outs.end(), result.outs.begin(), result.outs.end());
                result = {sp, std::move(outs)};
            }
            return result;
        }
        case Node::Kind::REPEAT: {
            const Node& kid = *n.kids[0];
            std::vector<Frag> parts;
            for (int i = 0; i < n.min && !overflow_; ++i) parts.push_back(emit(kid));
            if (n.max < 0) {
                parts.push_back(emit_star(emit(kid), n.greedy));
            } else if (n.max > n.min) {
                // x{2,4} -> xx(x(x)?)?
                Frag opt = emit_quest(emit(kid), n.greedy);
                for (int i = n.min + 1; i < n.max && !overflow_; ++i)
                    opt = emit_quest(emit_concat({emit(kid), std::move(opt)}), n.greedy);
                parts.push_back(std::move(opt));
            }
            if (parts.empty()) return emit(Node(Node::Kind::EMPTY));
            return emit_concat(std::move(parts));
        }
    }
    return emit(Node(Node::Kind::EMPTY));
}

ThompsonNFA::ThompsonNFA(std::string_view pattern) {
    prog_.reserve(64);
    NfaCompiler compiler(*this, pattern);
    valid_ = compiler.run();
    if (!valid_) {
        if (error_.empty()) error_ = "invalid pattern";
        prog_.clear();
        classes_.clear();
    }
}

// ── Simulation ─────────────────────────────────────────────────────────

NfaStream::NfaStream(const ThompsonNFA& nfa)
    : nfa_(nfa), ncap_(2 * nfa.group_count()),
      mark_(nfa.program().size(), 0), scratch_(ncap_, -1), match_caps_(ncap_, -1) {}

// 1 = holds, 0 = fails, -1 = depends on a code point not seen yet
int NfaStream::check(ThompsonNFA::Assert a, const Ctx& c) const {
    using A = ThompsonNFA::Assert;
    switch (a) {
        case A::BEGIN_TEXT: return c.prev < 0;
        case A::BEGIN_LINE: return c.prev < 0 || c.prev == '\n';
        default: break;
    }
    if (!c.next_known) return -1;
    switch (a) {
        case A::END_TEXT:          return c.next < 0;
        case A::END_LINE:          return c.next < 0 || c.next == '\n';
        case A::WORD_BOUNDARY:     return is_word(c.prev) != is_word(c.next);
        case A::NOT_WORD_BOUNDARY: return is_word(c.prev) == is_word(c.next);
        default: return 0;
    }
}

bool NfaStream::consumes(const ThompsonNFA::Inst& in, uint32_t cp) const {
    using Op = ThompsonNFA::Op;
    switch (in.op) {
        case Op::CHAR:       return cp == in.ch;
        case Op::CLASS:      return nfa_.char_class(in.class_idx).contains(cp);
        case Op::ANY:        return true;
        case Op::ANY_NOT_NL: return cp != '\n';
        default:             return false;
    }
}

// Follow epsilon edges from pc in priority order. False when an assertion
// needs the next code point and it is not known yet.
bool NfaStream::add(int pc, const Ctx& c) {
    using Op = ThompsonNFA::Op;
    if (pc < 0 || mark_[pc] == gen_) return true;
    mark_[pc] = gen_;
    const auto& in = nfa_.program()[pc];
    switch (in.op) {
        case Op::JMP:
            return add(in.out, c);
        case Op::SPLIT:
            return add(in.out, c) && add(in.out1, c);
        case Op::SAVE: {
            long old = scratch_[in.slot];
            scratch_[in.slot] = c.pos;
            bool ok = add(in.out, c);
            scratch_[in.slot] = old;
            return ok;
        }
        case Op::ASSERT: {
            int r = check(in.cond, c);
            if (r < 0) return false;
            return r == 0 || add(in.out, c);
        }
        default:
            run_pc_.push_back(pc);
            run_caps_.insert(run_caps_.end(), scratch_.begin(), scratch_.end());
            return true;
    }
}

bool NfaStream::expand(const Ctx& c) {
    if (++gen_ == 0) {
        std::fill(mark_.begin(), mark_.end(), 0);
        gen_ = 1;
    }
    run_pc_.clear();
    run_caps_.clear();
    for (size_t i = 0; i < pend_pc_.size(); ++i) {
        auto first = pend_caps_.begin() + (long)(i * ncap_);
        std::copy(first, first + ncap_, scratch_.begin());
        if (!add(pend_pc_[i], c)) return false;
    }
    // Unanchored search: a new attempt starts here until something matched
    if (!matched_) {
        std::fill(scratch_.begin(), scratch_.end(), -1);
        if (!add(nfa_.start(), c)) return false;
    }
    return true;
}

void NfaStream::step(uint32_t cp) {
    const auto& prog = nfa_.program();
    std::vector<int> next_pc;
    std::vector<long> next_caps;
    for (size_t i = 0; i < run_pc_.size(); ++i) {
        const auto& in = prog[run_pc_[i]];
        const long* caps = run_caps_.data() + i * ncap_;
        if (in.op == ThompsonNFA::Op::MATCH) {
            if (caps[1] == caps[0]) continue;  // empty matches never count
            matched_ = true;
            match_caps_.assign(caps, caps + ncap_);
            break;  // lower-priority threads lose
        }
        if (consumes(in, cp)) {
            next_pc.push_back(in.out);
            next_caps.insert(next_caps.end(), caps, caps + ncap_);
        }
    }
    pend_pc_.swap(next_pc);
    pend_caps_.swap(next_caps);
}

void NfaStream::settle(bool at_end) {
    const auto& prog = nfa_.program();
    for (size_t i = 0; i < run_pc_.size(); ++i) {
        const long* caps = run_caps_.data() + i * ncap_;
        if (prog[run_pc_[i]].op == ThompsonNFA::Op::MATCH) {
            if (caps[1] == caps[0]) continue;
            matched_ = true;
            match_caps_.assign(caps, caps + ncap_);
            done_ = true;
            return;
        }
        // A higher-priority thread still needs input
        if (!at_end) return;
    }
    if (at_end || matched_) done_ = true;
}

bool NfaStream::feed(uint32_t cp, size_t len) {
    if (done_) return true;
    if (!run_valid_) expand({pos_, prev_, (int32_t)cp, true});
    step(cp);
    pos_ += (long)len;
    prev_ = (int32_t)cp;
    run_valid_ = false;

    if (matched_ && pend_pc_.empty()) {
        done_ = true;
        return true;
    }
    // Decide now if the next code point cannot change the outcome
    if (expand({pos_, prev_, 0, false})) {
        run_valid_ = true;
        settle(false);
    }
    return done_;
}

void NfaStream::finish() {
    if (done_) return;
    if (!run_valid_) expand({pos_, prev_, -1, true});
    settle(true);
    done_ = true;
}

} // namespace tether::util
