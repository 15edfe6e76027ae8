#include <algorithm>
#include <cctype>
#include <regex>
#include <supervisor-cpp/core/version.hpp>

namespace supervisor_cpp {

namespace {

// release, separator, modifier, modifier number
const std::regex VERSION_PATTERN(
    R"(^[vV]?(\d+(?:\.\d+)*)(?:[.\-]?(dev|alpha|a|beta|b|rc)(\d*))?$)");

int modifierRank(const std::string& modifier)
{
    if (modifier == "dev")
        return 0;
    if (modifier == "a" || modifier == "alpha")
        return 1;
    if (modifier == "b" || modifier == "beta")
        return 2;
    if (modifier == "rc")
        return 3;
    return 100;
}

std::vector<uint64_t> splitRelease(const std::string& release)
{
    std::vector<uint64_t> parts;
    size_t start = 0;
    while (start <= release.size()) {
        size_t dot = release.find('.', start);
        std::string part = release.substr(start, dot == std::string::npos ? std::string::npos
                                                                           : dot - start);
        parts.push_back(std::stoull(part));
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    return parts;
}

} // namespace

Version::Version(std::string raw) : raw_(std::move(raw))
{
    std::smatch match;
    if (!std::regex_match(raw_, match, VERSION_PATTERN)) {
        return;
    }

    try {
        release_ = splitRelease(match[1].str());
        if (match[2].matched) {
            modifier_rank_ = modifierRank(match[2].str());
            modifier_number_ = match[3].length() > 0 ? std::stoull(match[3].str()) : 0;
        }
        comparable_ = true;
    }
    catch (const std::out_of_range&) {
        // Component too large for uint64_t, keep as an opaque tag
        release_.clear();
        comparable_ = false;
    }
}

std::optional<Version> Version::parse(const std::string& raw)
{
    Version version(raw);
    if (!version.isComparable()) {
        return std::nullopt;
    }
    return version;
}

int Version::compare(const Version& other) const
{
    if (!comparable_ || !other.comparable_) {
        if (comparable_ != other.comparable_) {
            return comparable_ ? -1 : 1;
        }
        return raw_.compare(other.raw_) < 0 ? -1 : (raw_ == other.raw_ ? 0 : 1);
    }

    size_t length = std::max(release_.size(), other.release_.size());
    for (size_t i = 0; i < length; ++i) {
        uint64_t lhs = i < release_.size() ? release_[i] : 0;
        uint64_t rhs = i < other.release_.size() ? other.release_[i] : 0;
        if (lhs != rhs) {
            return lhs < rhs ? -1 : 1;
        }
    }

    if (modifier_rank_ != other.modifier_rank_) {
        return modifier_rank_ < other.modifier_rank_ ? -1 : 1;
    }
    if (modifier_number_ != other.modifier_number_) {
        return modifier_number_ < other.modifier_number_ ? -1 : 1;
    }
    return 0;
}

std::ostream& operator<<(std::ostream& os, const Version& version)
{
    return os << version.string();
}

} // namespace supervisor_cpp
