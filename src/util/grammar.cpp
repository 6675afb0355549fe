#include <versa/grammar.hpp>
#include <array>

namespace versa {

// ---------------------------------------------------------------------------
// Character classes
// ---------------------------------------------------------------------------

static bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

static bool is_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

static bool is_ident_char(char c) {
    return is_digit(c) || is_alpha(c) || c == '-';
}

static char to_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

static bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (to_lower(a[i]) != to_lower(b[i])) return false;
    }
    return true;
}

// Applies `token_ok` to every '.'-separated piece; an empty piece fails.
template<typename Pred>
static bool all_tokens(std::string_view s, Pred token_ok) {
    size_t start = 0;
    while (true) {
        size_t dot = s.find('.', start);
        std::string_view piece = s.substr(start,
            dot == std::string_view::npos ? std::string_view::npos : dot - start);
        if (!token_ok(piece)) return false;
        if (dot == std::string_view::npos) return true;
        start = dot + 1;
    }
}

// ---------------------------------------------------------------------------
// Sub-grammars
// ---------------------------------------------------------------------------

static constexpr std::array<std::string_view, 3> kLabelKeywords = {
    "version", "ver", "v"
};

bool is_label_keyword(std::string_view s) {
    for (auto kw : kLabelKeywords) {
        if (iequals(s, kw)) return true;
    }
    return false;
}

bool is_numeric(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!is_digit(c)) return false;
    }
    return true;
}

bool is_prerelease_token(std::string_view s) {
    if (s.empty()) return false;
    if (s[0] == '0' || !is_ident_char(s[0])) return false;
    for (char c : s.substr(1)) {
        if (!is_ident_char(c)) return false;
    }
    return true;
}

bool is_build_token(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!is_ident_char(c)) return false;
    }
    return true;
}

bool is_prerelease(std::string_view s) {
    return all_tokens(s, [](std::string_view t) { return is_prerelease_token(t); });
}

bool is_build(std::string_view s) {
    return all_tokens(s, [](std::string_view t) { return is_build_token(t); });
}

// ---------------------------------------------------------------------------
// Scanner
// ---------------------------------------------------------------------------

namespace {

struct Cursor {
    std::string_view text;
    size_t pos = 0;

    bool at_end() const { return pos >= text.size(); }
    char peek() const { return text[pos]; }

    bool consume(char c) {
        if (!at_end() && text[pos] == c) {
            ++pos;
            return true;
        }
        return false;
    }

    // Longest run of characters accepted by `pred`
    template<typename Pred>
    std::string_view take_while(Pred pred) {
        size_t start = pos;
        while (!at_end() && pred(text[pos])) ++pos;
        return text.substr(start, pos - start);
    }
};

} // namespace

// major.minor.patch[.hotfix][-prerelease][+build], consuming all of `text`
static bool scan_core(std::string_view text, RawFields& out) {
    Cursor cur{text};

    auto major = cur.take_while(is_digit);
    if (major.empty() || !cur.consume('.')) return false;
    auto minor = cur.take_while(is_digit);
    if (minor.empty() || !cur.consume('.')) return false;
    auto patch = cur.take_while(is_digit);
    if (patch.empty()) return false;

    std::optional<std::string> hotfix;
    if (cur.consume('.')) {
        auto h = cur.take_while(is_digit);
        if (h.empty()) return false;
        hotfix = std::string(h);
    }

    std::optional<std::string> prerelease;
    if (cur.consume('-')) {
        if (cur.at_end() || cur.peek() == '0' || !is_ident_char(cur.peek())) {
            return false;
        }
        auto p = cur.take_while([](char c) { return is_ident_char(c) || c == '.'; });
        prerelease = std::string(p);
    }

    std::optional<std::string> build;
    if (cur.consume('+')) {
        auto b = cur.take_while([](char c) { return is_ident_char(c) || c == '.'; });
        if (b.empty()) return false;
        build = std::string(b);
    }

    if (!cur.at_end()) return false;

    out.major = std::string(major);
    out.minor = std::string(minor);
    out.patch = std::string(patch);
    out.hotfix = std::move(hotfix);
    out.prerelease = std::move(prerelease);
    out.build = std::move(build);
    return true;
}

// [label[ ]]core
static bool scan_tail(std::string_view text, RawFields& out) {
    for (auto kw : kLabelKeywords) {
        if (text.size() < kw.size() || !iequals(text.substr(0, kw.size()), kw)) {
            continue;
        }
        std::string_view rest = text.substr(kw.size());
        bool spaced = !rest.empty() && rest[0] == ' ';
        if (spaced) rest.remove_prefix(1);
        if (scan_core(rest, out)) {
            out.label = std::string(text.substr(0, kw.size()));
            out.spaced_label = spaced;
            return true;
        }
    }

    if (scan_core(text, out)) {
        out.label.reset();
        out.spaced_label = true;
        return true;
    }
    return false;
}

Result<RawFields> extract_fields(std::string_view text) {
    RawFields out;
    if (scan_tail(text, out)) {
        return Result<RawFields>::ok(std::move(out));
    }

    // The branch is everything before a separating space. Split points are
    // tried left to right so the shortest branch wins.
    for (size_t i = 1; i < text.size(); ++i) {
        if (text[i] != ' ') continue;
        if (scan_tail(text.substr(i + 1), out)) {
            out.branch = std::string(text.substr(0, i));
            return Result<RawFields>::ok(std::move(out));
        }
    }

    return VersaError{VersaError::GrammarMismatch,
        "'" + std::string(text) + "' is not a version",
        "expected format: [branch ][label ]major.minor.patch[.hotfix][-prerelease][+build]"};
}

} // namespace versa
