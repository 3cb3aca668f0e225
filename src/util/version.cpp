#include <weave/version.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace weave {

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

static bool is_separator(char c) {
    return c == '.' || c == '-' || c == '_' || c == '+';
}

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](char c) -> char {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return s;
}

Result<Version> Version::parse(const std::string& s) {
    if (s.empty()) {
        return WeaveError{WeaveError::Version, "empty version string"};
    }
    if (s == "unspecified") {
        return Result<Version>::ok(unspecified());
    }

    Version v;
    v.text_ = s;

    std::string current;
    bool current_numeric = false;
    bool expect_part = true;  // a separator was just seen (or at start)

    auto flush = [&]() -> Status {
        if (current.empty()) return ok_status();
        Part part;
        part.numeric = current_numeric;
        if (current_numeric) {
            if (current.size() > 18) {
                return WeaveError{WeaveError::Version,
                    "numeric component too large in version '" + s + "'"};
            }
            part.number = std::stoll(current);
        } else {
            part.label = lowercase(current);
        }
        v.parts_.push_back(std::move(part));
        current.clear();
        return ok_status();
    };

    for (char c : s) {
        if (is_separator(c)) {
            if (expect_part) {
                return WeaveError{WeaveError::Version,
                    "empty component in version '" + s + "'",
                    "components are separated by a single '.', '-', '_' or '+'"};
            }
            WEAVE_TRY(flush());
            expect_part = true;
            continue;
        }
        if (!std::isalnum(static_cast<unsigned char>(c))) {
            return WeaveError{WeaveError::Version,
                "invalid character '" + std::string(1, c) +
                "' in version '" + s + "'"};
        }
        bool digit = std::isdigit(static_cast<unsigned char>(c)) != 0;
        if (!current.empty() && digit != current_numeric) {
            WEAVE_TRY(flush());
        }
        current_numeric = digit;
        current += c;
        expect_part = false;
    }

    if (expect_part) {
        return WeaveError{WeaveError::Version,
            "version '" + s + "' ends with a separator"};
    }
    WEAVE_TRY(flush());

    return Result<Version>::ok(std::move(v));
}

Version Version::unspecified() {
    Version v;
    v.text_ = "unspecified";
    v.unspecified_ = true;
    return v;
}

bool Version::has_label() const {
    return std::any_of(parts_.begin(), parts_.end(),
        [](const Part& p) { return !p.numeric; });
}

static int label_rank(const std::string& label) {
    if (label == "dev") return 0;
    if (label == "rc") return 2;
    if (label == "snapshot") return 3;
    if (label == "final") return 4;
    if (label == "ga") return 5;
    if (label == "release") return 6;
    if (label == "sp") return 7;
    return 1;
}

static int compare_parts(const Version::Part& a, const Version::Part& b) {
    if (a.numeric && b.numeric) {
        if (a.number != b.number) return a.number < b.number ? -1 : 1;
        return 0;
    }
    if (a.numeric != b.numeric) {
        return a.numeric ? 1 : -1;
    }
    int ra = label_rank(a.label);
    int rb = label_rank(b.label);
    if (ra != rb) return ra < rb ? -1 : 1;
    return a.label.compare(b.label) < 0 ? -1 : (a.label == b.label ? 0 : 1);
}

std::optional<int> Version::compare(const Version& a, const Version& b) {
    if (a.unspecified_ || b.unspecified_) {
        if (a.unspecified_ && b.unspecified_) return 0;
        return std::nullopt;
    }

    size_t n = std::min(a.parts_.size(), b.parts_.size());
    for (size_t i = 0; i < n; ++i) {
        int c = compare_parts(a.parts_[i], b.parts_[i]);
        if (c != 0) return c;
    }

    if (a.parts_.size() == b.parts_.size()) return 0;

    // The longer version wins on an extra number, loses on an extra label
    bool a_longer = a.parts_.size() > b.parts_.size();
    const Part& extra = a_longer ? a.parts_[n] : b.parts_[n];
    int longer_sign = extra.numeric ? 1 : -1;
    return a_longer ? longer_sign : -longer_sign;
}

bool Version::operator<(const Version& o) const {
    if (unspecified_ != o.unspecified_) return unspecified_;
    auto c = compare(*this, o);
    if (c && *c != 0) return *c < 0;
    return text_ < o.text_;
}

bool Version::operator==(const Version& o) const {
    return text_ == o.text_ && unspecified_ == o.unspecified_;
}

bool Version::operator!=(const Version& o) const { return !(*this == o); }

// ---------------------------------------------------------------------------
// VersionConstraint
// ---------------------------------------------------------------------------

// Number of leading numeric parts
static size_t numeric_prefix_len(const Version& v) {
    size_t n = 0;
    while (n < v.parts().size() && v.parts()[n].numeric) ++n;
    return n;
}

static bool same_leading_numbers(const Version& v, const Version& req, size_t count) {
    if (numeric_prefix_len(v) < count) return false;
    for (size_t i = 0; i < count; ++i) {
        if (v.parts()[i].number != req.parts()[i].number) return false;
    }
    return true;
}

bool VersionConstraint::matches(const Version& v) const {
    if (op == ConstraintOp::Exact) {
        auto c = Version::compare(v, version);
        return c && *c == 0;
    }

    if (v.is_unspecified()) return false;
    // Qualified versions only satisfy ranges that name a qualifier themselves
    if (v.has_label() && !version.has_label()) return false;

    auto c = Version::compare(v, version);

    switch (op) {
    case ConstraintOp::Exact:
        return false;

    case ConstraintOp::Caret: {
        if (!c || *c < 0) return false;
        size_t len = numeric_prefix_len(version);
        size_t pin = 0;
        while (pin < len && version.parts()[pin].number == 0) ++pin;
        // ^0.0.3 pins every numeric part; ^0.2.1 pins 0.2; ^1.2 pins 1
        size_t count = pin < len ? pin + 1 : len;
        return same_leading_numbers(v, version, count);
    }

    case ConstraintOp::Tilde: {
        if (!c || *c < 0) return false;
        size_t count = std::min<size_t>(2, numeric_prefix_len(version));
        return same_leading_numbers(v, version, count);
    }

    case ConstraintOp::GreaterEq:
        return c && *c >= 0;

    case ConstraintOp::Greater:
        return c && *c > 0;

    case ConstraintOp::LessEq:
        return c && *c <= 0;

    case ConstraintOp::Less:
        return c && *c < 0;

    case ConstraintOp::Prefix: {
        const auto& want = version.parts();
        if (v.parts().size() < want.size()) return false;
        for (size_t i = 0; i < want.size(); ++i) {
            const auto& got = v.parts()[i];
            if (got.numeric != want[i].numeric) return false;
            if (got.numeric ? got.number != want[i].number
                            : got.label != want[i].label) {
                return false;
            }
        }
        return true;
    }
    }
    return false;
}

std::string VersionConstraint::to_string() const {
    switch (op) {
    case ConstraintOp::Exact:     return version.to_string();
    case ConstraintOp::Caret:     return "^" + version.to_string();
    case ConstraintOp::Tilde:     return "~" + version.to_string();
    case ConstraintOp::GreaterEq: return ">=" + version.to_string();
    case ConstraintOp::Greater:   return ">" + version.to_string();
    case ConstraintOp::LessEq:    return "<=" + version.to_string();
    case ConstraintOp::Less:      return "<" + version.to_string();
    case ConstraintOp::Prefix:
        if (version.parts().empty()) return "+";
        return version.to_string() + ".+";
    }
    return version.to_string();
}

// ---------------------------------------------------------------------------
// VersionReq
// ---------------------------------------------------------------------------

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

static Result<VersionConstraint> parse_single_constraint(const std::string& raw) {
    std::string s = trim(raw);
    if (s.empty()) {
        return WeaveError{WeaveError::Version,
            "missing version in constraint '" + raw + "'"};
    }

    VersionConstraint vc;

    if (s == "+") {
        vc.op = ConstraintOp::Prefix;
        return Result<VersionConstraint>::ok(std::move(vc));
    }

    if (s.size() > 2 && s.compare(s.size() - 2, 2, ".+") == 0) {
        auto v = Version::parse(s.substr(0, s.size() - 2));
        if (v.is_err()) return std::move(v).error();
        vc.op = ConstraintOp::Prefix;
        vc.version = std::move(v).value();
        return Result<VersionConstraint>::ok(std::move(vc));
    }

    size_t pos = 0;
    vc.op = ConstraintOp::Exact;
    if (s[0] == '^') {
        vc.op = ConstraintOp::Caret;
        pos = 1;
    } else if (s[0] == '~') {
        vc.op = ConstraintOp::Tilde;
        pos = 1;
    } else if (s[0] == '=') {
        pos = 1;
    } else if (s.compare(0, 2, ">=") == 0) {
        vc.op = ConstraintOp::GreaterEq;
        pos = 2;
    } else if (s[0] == '>') {
        vc.op = ConstraintOp::Greater;
        pos = 1;
    } else if (s.compare(0, 2, "<=") == 0) {
        vc.op = ConstraintOp::LessEq;
        pos = 2;
    } else if (s[0] == '<') {
        vc.op = ConstraintOp::Less;
        pos = 1;
    }

    std::string ver_str = trim(s.substr(pos));
    if (ver_str.empty()) {
        return WeaveError{WeaveError::Version,
            "missing version in constraint '" + raw + "'"};
    }

    auto v = Version::parse(ver_str);
    if (v.is_err()) return std::move(v).error();
    vc.version = std::move(v).value();
    return Result<VersionConstraint>::ok(std::move(vc));
}

// "[1.0,2.0)", "(,2.0]", "[1.0,)", "[1.0]"
static Result<VersionReq> parse_range(const std::string& s) {
    char open = s.front();
    char close = s.back();
    if ((open != '[' && open != '(') || (close != ']' && close != ')')) {
        return WeaveError{WeaveError::Version,
            "unbalanced version range '" + s + "'"};
    }

    std::string inner = s.substr(1, s.size() - 2);
    VersionReq req;
    size_t comma = inner.find(',');

    if (comma == std::string::npos) {
        if (open != '[' || close != ']') {
            return WeaveError{WeaveError::Version,
                "single-version range must be closed: '" + s + "'"};
        }
        auto v = Version::parse(trim(inner));
        if (v.is_err()) return std::move(v).error();
        req.constraints.push_back({ConstraintOp::Exact, std::move(v).value()});
        return Result<VersionReq>::ok(std::move(req));
    }

    std::string lower = trim(inner.substr(0, comma));
    std::string upper = trim(inner.substr(comma + 1));
    if (lower.empty() && upper.empty()) {
        return WeaveError{WeaveError::Version,
            "version range '" + s + "' has no bounds"};
    }

    if (!lower.empty()) {
        auto v = Version::parse(lower);
        if (v.is_err()) return std::move(v).error();
        req.constraints.push_back({open == '[' ? ConstraintOp::GreaterEq
                                               : ConstraintOp::Greater,
                                   std::move(v).value()});
    }
    if (!upper.empty()) {
        auto v = Version::parse(upper);
        if (v.is_err()) return std::move(v).error();
        req.constraints.push_back({close == ']' ? ConstraintOp::LessEq
                                                : ConstraintOp::Less,
                                   std::move(v).value()});
    }
    return Result<VersionReq>::ok(std::move(req));
}

Result<VersionReq> VersionReq::parse(const std::string& raw) {
    std::string s = trim(raw);
    if (s.empty()) {
        return WeaveError{WeaveError::Version, "empty version requirement"};
    }

    if (s.front() == '[' || s.front() == '(') {
        return parse_range(s);
    }

    VersionReq req;
    std::istringstream stream(s);
    std::string token;

    while (std::getline(stream, token, ',')) {
        auto c = parse_single_constraint(token);
        if (c.is_err()) return std::move(c).error();
        req.constraints.push_back(std::move(c).value());
    }

    if (req.constraints.empty()) {
        return WeaveError{WeaveError::Version,
            "no constraints in version requirement '" + s + "'"};
    }

    return Result<VersionReq>::ok(std::move(req));
}

VersionReq VersionReq::any() {
    VersionReq req;
    req.constraints.push_back({ConstraintOp::Prefix, Version{}});
    return req;
}

bool VersionReq::matches(const Version& v) const {
    return std::all_of(constraints.begin(), constraints.end(),
        [&](const VersionConstraint& c) { return c.matches(v); });
}

bool VersionReq::is_exact() const {
    return constraints.size() == 1 && constraints[0].op == ConstraintOp::Exact;
}

std::string VersionReq::to_string() const {
    std::string s;
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (i > 0) s += ", ";
        s += constraints[i].to_string();
    }
    return s;
}

} // namespace weave
