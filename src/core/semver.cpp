#include "lode/semver.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace lode {

namespace {

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

// Split string by delimiter, preserving empty parts
std::vector<std::string> split(const std::string& s, const std::string& delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t pos;
    while ((pos = s.find(delim, start)) != std::string::npos) {
        parts.push_back(s.substr(start, pos - start));
        start = pos + delim.length();
    }
    parts.push_back(s.substr(start));
    return parts;
}

bool is_operator(const std::string& token) {
    return token == "=" || token == "!=" || token == "<" || token == "<=" ||
           token == ">" || token == ">=" || token == "~>";
}

// Split a comparator set into tokens, joining a bare operator with the
// version that follows it ("> 0" -> ">0")
std::vector<std::string> tokenize(const std::string& s) {
    std::string flat = s;
    std::replace(flat.begin(), flat.end(), ',', ' ');

    std::vector<std::string> raw;
    std::istringstream iss(flat);
    std::string token;
    while (iss >> token) {
        raw.push_back(token);
    }

    std::vector<std::string> tokens;
    for (size_t i = 0; i < raw.size(); ++i) {
        if (is_operator(raw[i]) && i + 1 < raw.size()) {
            tokens.push_back(raw[i] + raw[i + 1]);
            ++i;
        } else {
            tokens.push_back(raw[i]);
        }
    }
    return tokens;
}

// Number of dot-separated components in the release part of a version
size_t release_components(const std::string& s) {
    size_t end = s.find_first_of("-+");
    std::string core = s.substr(0, end);
    return static_cast<size_t>(std::count(core.begin(), core.end(), '.')) + 1;
}

// "1" -> "1.0.0", "1.2-rc" -> "1.2.0-rc"
std::string pad_version(const std::string& s) {
    size_t end = s.find_first_of("-+");
    std::string core = s.substr(0, end);
    std::string rest = end == std::string::npos ? "" : s.substr(end);

    size_t components = release_components(s);
    for (size_t i = components; i < 3; ++i) {
        core += ".0";
    }
    return core + rest;
}

// Parse a single constraint like ">=1.0.0", "<2.0.0", "=1.0.0", or "1.0.0".
// A pessimistic constraint expands into two entries appended to `out`.
bool parse_constraint(const std::string& str, ComparatorSet& out) {
    std::string s = trim(str);
    if (s.empty()) return false;

    Comparator op = Comparator::Eq;
    std::string version_str;
    bool pessimistic = false;

    if (s.rfind("~>", 0) == 0) {
        pessimistic = true;
        version_str = s.substr(2);
    } else if (s.rfind(">=", 0) == 0) {
        op = Comparator::Ge;
        version_str = s.substr(2);
    } else if (s.rfind("<=", 0) == 0) {
        op = Comparator::Le;
        version_str = s.substr(2);
    } else if (s.rfind("!=", 0) == 0) {
        op = Comparator::Ne;
        version_str = s.substr(2);
    } else if (s.rfind(">", 0) == 0) {
        op = Comparator::Gt;
        version_str = s.substr(1);
    } else if (s.rfind("<", 0) == 0) {
        op = Comparator::Lt;
        version_str = s.substr(1);
    } else if (s.rfind("=", 0) == 0) {
        op = Comparator::Eq;
        version_str = s.substr(1);
    } else {
        // No operator means exact match
        op = Comparator::Eq;
        version_str = s;
    }

    version_str = trim(version_str);
    if (version_str.empty()) return false;

    auto version = parse_version(version_str);
    if (!version) return false;

    if (!pessimistic) {
        out.push_back(Constraint{op, *version});
        return true;
    }

    // ~> X and ~> X.Y allow anything below the next major;
    // ~> X.Y.Z allows anything below the next minor.
    std::string upper;
    if (release_components(version_str) >= 3) {
        upper = std::to_string(version->major()) + "." +
                std::to_string(version->minor() + 1) + ".0";
    } else {
        upper = std::to_string(version->major() + 1) + ".0.0";
    }
    auto upper_version = parse_version(upper);
    if (!upper_version) return false;

    out.push_back(Constraint{Comparator::Ge, *version});
    out.push_back(Constraint{Comparator::Lt, *upper_version});
    return true;
}

// Parse a comparator set (constraints ANDed together)
std::optional<ComparatorSet> parse_comparator_set(const std::string& str) {
    auto tokens = tokenize(str);
    if (tokens.empty()) return std::nullopt;

    ComparatorSet set;
    for (const auto& token : tokens) {
        if (!parse_constraint(token, set)) return std::nullopt;
    }
    return set;
}

} // namespace

std::optional<Version> VersionRange::min_version() const {
    std::optional<Version> min;

    for (const auto& set : sets) {
        for (const auto& constraint : set) {
            // >=, = and > all bound the range from below
            if (constraint.op == Comparator::Ge || constraint.op == Comparator::Eq ||
                constraint.op == Comparator::Gt) {
                if (!min || constraint.version < *min) {
                    min = constraint.version;
                }
            }
        }
    }

    return min;
}

std::optional<Version> parse_version(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) return std::nullopt;
    if (release_components(s) > 3) return std::nullopt;

    try {
        return semver::version::parse(pad_version(s));
    } catch (const semver::semver_exception&) {
        return std::nullopt;
    }
}

std::optional<VersionRange> parse_range(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) return std::nullopt;

    // Split by || for OR
    auto or_parts = split(s, "||");

    VersionRange range;
    for (const auto& part : or_parts) {
        auto set = parse_comparator_set(trim(part));
        if (!set) return std::nullopt;
        range.sets.push_back(*set);
    }

    if (range.sets.empty()) return std::nullopt;
    return range;
}

bool satisfies(const Version& version, const Constraint& constraint) {
    switch (constraint.op) {
        case Comparator::Eq:
            return version == constraint.version;
        case Comparator::Ne:
            return !(version == constraint.version);
        case Comparator::Lt:
            return version < constraint.version;
        case Comparator::Le:
            return version <= constraint.version;
        case Comparator::Gt:
            return version > constraint.version;
        case Comparator::Ge:
            return version >= constraint.version;
    }
    return false;
}

bool satisfies(const Version& version, const ComparatorSet& set) {
    // All constraints in a set must be satisfied (AND)
    for (const auto& constraint : set) {
        if (!satisfies(version, constraint)) {
            return false;
        }
    }
    return true;
}

bool satisfies(const Version& version, const VersionRange& range) {
    // Any set in the range must be satisfied (OR)
    for (const auto& set : range.sets) {
        if (satisfies(version, set)) {
            return true;
        }
    }
    return false;
}

bool version_satisfies(const std::string& version, const std::string& requirement) {
    auto v = parse_version(version);
    auto r = parse_range(requirement);
    if (!v || !r) return false;
    return satisfies(*v, *r);
}

int compare_versions(const std::string& a, const std::string& b) {
    auto va = parse_version(a);
    auto vb = parse_version(b);
    if (va && vb) {
        if (*va < *vb) return -1;
        if (*vb < *va) return 1;
        return 0;
    }
    if (!va && vb) return -1;
    if (va && !vb) return 1;
    return a.compare(b) < 0 ? -1 : (a == b ? 0 : 1);
}

} // namespace lode
