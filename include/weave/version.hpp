#pragma once

#include <weave/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace weave {

// Published module version, compared component by component.
//
// The text is split on '.', '-', '_' and '+' and at every digit/letter
// boundary, so "1.0rc1" has the parts 1, 0, rc, 1. Numeric parts compare
// numerically and rank above labels. Labels rank
//   dev < (any other label, lexically) < rc < snapshot < final < ga < release < sp
// A trailing extra numeric part makes a version higher (1.1 < 1.1.1); a
// trailing extra label makes it lower (1.1-beta < 1.1).
//
// "unspecified" is the version of a project that never declared one. It is
// only ordered against itself.
struct Version {
    struct Part {
        bool numeric = false;
        long long number = 0;
        std::string label;
    };

    static Result<Version> parse(const std::string& s);
    static Version unspecified();

    const std::string& to_string() const { return text_; }
    const std::vector<Part>& parts() const { return parts_; }

    bool is_unspecified() const { return unspecified_; }
    // True if any part is a label (pre-release, qualifier)
    bool has_label() const;

    // <0, 0, >0 like strcmp; nullopt when the two versions have no order
    static std::optional<int> compare(const Version& a, const Version& b);

    // Total order for containers: unspecified sorts first, then compare()
    bool operator<(const Version& o) const;
    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;

private:
    std::string text_;
    std::vector<Part> parts_;
    bool unspecified_ = false;
};

// Requirement operators
enum class ConstraintOp {
    Exact,       // 1.2.3 or =1.2.3
    Caret,       // ^1.2.3 (same first non-zero component)
    Tilde,       // ~1.2.3 (same first two components)
    GreaterEq,   // >=1.2.3
    Greater,     // >1.2.3
    LessEq,      // <=1.2.3
    Less,        // <1.2.3
    Prefix,      // 1.2.+ (or a bare "+")
};

struct VersionConstraint {
    ConstraintOp op;
    Version version;  // for Prefix, the leading parts; empty matches any


    bool matches(const Version& v) const;
    std::string to_string() const;
};

// Compound requirement: ">=1.0, <2.0", "[1.0,2.0)", "1.+", "1.4"
struct VersionReq {
    std::vector<VersionConstraint> constraints;

    static Result<VersionReq> parse(const std::string& s);
    static VersionReq any();

    bool matches(const Version& v) const;
    bool is_exact() const;
    std::string to_string() const;
};

} // namespace weave
