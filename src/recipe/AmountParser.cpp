#include "recipe/AmountParser.hpp"

#include "recipe/TextUtil.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace recipe {

namespace {

struct VulgarFraction {
    char32_t cp;
    int numerator;
    int denominator;
};

// Unicode "Number Forms" vulgar fractions plus the three Latin-1 ones.
const VulgarFraction kVulgarFractions[] = {
    {U'\u00BC', 1, 4},
    {U'\u00BD', 1, 2},
    {U'\u00BE', 3, 4},
    {U'\u2150', 1, 7},
    {U'\u2151', 1, 9},
    {U'\u2152', 1, 10},
    {U'\u2153', 1, 3},
    {U'\u2154', 2, 3},
    {U'\u2155', 1, 5},
    {U'\u2156', 2, 5},
    {U'\u2157', 3, 5},
    {U'\u2158', 4, 5},
    {U'\u2159', 1, 6},
    {U'\u215A', 5, 6},
    {U'\u215B', 1, 8},
    {U'\u215C', 3, 8},
    {U'\u215D', 5, 8},
    {U'\u215E', 7, 8},
    {U'\u2189', 0, 3},
};

const char32_t kFractionSlash = U'\u2044';

// Codepoints of the trimmed span with the byte offset where each starts.
struct Cursor {
    const std::string& text;
    std::vector<char32_t> cps;
    std::vector<size_t> offsets;

    explicit Cursor(const std::string& t) : text(t) {
        size_t i = 0;
        while (i < t.size()) {
            offsets.push_back(i);
            cps.push_back(textutil::next_codepoint(t, i));
        }
        offsets.push_back(t.size());
    }

    size_t size() const { return cps.size(); }
    char32_t at(size_t k) const { return k < cps.size() ? cps[k] : 0; }
    bool digit(size_t k) const { return k < cps.size() && textutil::is_ascii_digit(cps[k]); }
    bool slash(size_t k) const { return at(k) == U'/' || at(k) == kFractionSlash; }
    bool space(size_t k) const { return at(k) == U' ' || at(k) == U'\t' || at(k) == U'\u00A0'; }

    std::string rest_from(size_t k) const {
        return textutil::trim(text.substr(offsets[k < offsets.size() ? k : offsets.size() - 1]));
    }
};

// Scans [k, end) for ASCII digits; returns how many were consumed and their value.
size_t scan_digits(const Cursor& c, size_t k, double& value) {
    size_t n = 0;
    value = 0.0;
    while (c.digit(k + n)) {
        value = value * 10.0 + static_cast<double>(c.at(k + n) - U'0');
        ++n;
    }
    return n;
}

enum class Scan {
    NoNumber,
    Number,
    Malformed
};

struct ScanResult {
    Scan status = Scan::NoNumber;
    double value = 0.0;
    size_t end = 0;          // codepoint index just past the numeric token
    std::string problem;
};

ScanResult malformed(const std::string& problem) {
    ScanResult r;
    r.status = Scan::Malformed;
    r.problem = problem;
    return r;
}

ScanResult number(double value, size_t end) {
    ScanResult r;
    r.status = Scan::Number;
    r.value = value;
    r.end = end;
    return r;
}

// "N/M" starting at k (N already known to be digits); used by both the bare
// and the mixed form.
ScanResult scan_fraction(const Cursor& c, size_t k) {
    double num = 0.0;
    const size_t nlen = scan_digits(c, k, num);
    size_t p = k + nlen;
    if (!c.slash(p)) return malformed("expected '/' in fraction");
    ++p;

    double den = 0.0;
    const size_t dlen = scan_digits(c, p, den);
    if (dlen == 0) return malformed("fraction has no denominator");
    if (den == 0.0) return malformed("fraction has a zero denominator");
    p += dlen;
    if (c.slash(p)) return malformed("fraction has more than one '/'");

    return number(num / den, p);
}

// Fractional digits after the separator at p; `whole` is the integer part.
ScanResult scan_decimal(const Cursor& c, size_t p, double whole) {
    double frac_digits = 0.0;
    const size_t flen = scan_digits(c, p + 1, frac_digits);
    const size_t end = p + 1 + flen;
    if ((c.at(end) == U'.' || c.at(end) == U',') && c.digit(end + 1)) {
        return malformed("number has more than one decimal separator");
    }
    double scale = 1.0;
    for (size_t i = 0; i < flen; ++i) scale *= 10.0;
    return number(whole + frac_digits / scale, end);
}

ScanResult scan_number(const Cursor& c) {
    if (c.size() == 0) return ScanResult{};

    // rule: single vulgar fraction glyph
    if (auto v = vulgar_fraction_value(c.at(0))) return number(*v, 1);

    // rule: decimal without a whole part, ".5"
    if (c.at(0) == U'.' && c.digit(1)) return scan_decimal(c, 0, 0.0);

    double whole = 0.0;
    const size_t wlen = scan_digits(c, 0, whole);
    if (wlen == 0) return ScanResult{};

    size_t p = wlen;

    // "1½" / "1 ½"
    {
        size_t q = p;
        while (c.space(q)) ++q;
        if (auto v = vulgar_fraction_value(c.at(q))) return number(whole + *v, q + 1);
    }

    // rule: mixed number "W N/M"
    if (c.space(p)) {
        size_t q = p;
        while (c.space(q)) ++q;
        if (c.digit(q)) {
            double tmp = 0.0;
            const size_t nlen = scan_digits(c, q, tmp);
            if (c.slash(q + nlen)) {
                ScanResult frac = scan_fraction(c, q);
                if (frac.status != Scan::Number) return frac;
                return number(whole + frac.value, frac.end);
            }
        }
    }

    // rule: bare fraction "N/M"
    if (c.slash(p)) return scan_fraction(c, 0);

    // rule: decimal with one '.' or ',' separator
    if ((c.at(p) == U'.' || c.at(p) == U',') && c.digit(p + 1)) return scan_decimal(c, p, whole);

    // rule: integer
    return number(whole, p);
}

}  // namespace

std::optional<double> vulgar_fraction_value(char32_t cp) {
    for (const auto& vf : kVulgarFractions) {
        if (vf.cp == cp) return static_cast<double>(vf.numerator) / static_cast<double>(vf.denominator);
    }
    return std::nullopt;
}

Amount parse_amount(const std::string& span, Warnings* warnings) {
    Amount a;
    a.original_text = span;

    const std::string t = textutil::trim(span);
    const Cursor c(t);
    const ScanResult r = scan_number(c);

    switch (r.status) {
        case Scan::Number:
            a.quantity = r.value;
            a.unit = c.rest_from(r.end);
            break;
        case Scan::Malformed:
            if (warnings) {
                add_warning(*warnings, WarningKind::AmountParse, "amount_parse_failure",
                            "cannot read amount \"" + t + "\": " + r.problem);
            }
            a.unit = t;
            break;
        case Scan::NoNumber:
            a.unit = t;
            break;
    }

    return a;
}

}  // namespace recipe
