#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace supervisor_cpp {

// Image tag with an optional comparable form.
//
// Comparable tags: optional leading 'v', a dotted numeric release and an
// optional pre-release modifier ("2024.1.0", "1.2", "v2", "2024.2.0b3",
// "1.0.0rc1", "2023.12.0.dev0"). Anything else ("latest", "stable", "abc")
// keeps its text but is not comparable.
class Version {
public:
    Version() = default;
    explicit Version(std::string raw);

    static std::optional<Version> parse(const std::string& raw);

    const std::string& string() const
    {
        return raw_;
    }

    bool empty() const
    {
        return raw_.empty();
    }

    bool isComparable() const
    {
        return comparable_;
    }

    bool isPreRelease() const
    {
        return comparable_ && modifier_rank_ != FINAL_RANK;
    }

    // Ordering of comparable versions; non-comparable versions order by text
    // after every comparable one.
    int compare(const Version& other) const;

    bool operator==(const Version& other) const
    {
        return compare(other) == 0;
    }
    bool operator!=(const Version& other) const
    {
        return compare(other) != 0;
    }
    bool operator<(const Version& other) const
    {
        return compare(other) < 0;
    }
    bool operator>(const Version& other) const
    {
        return compare(other) > 0;
    }
    bool operator<=(const Version& other) const
    {
        return compare(other) <= 0;
    }
    bool operator>=(const Version& other) const
    {
        return compare(other) >= 0;
    }

private:
    static constexpr int FINAL_RANK = 100;

    std::string raw_;
    bool comparable_ = false;
    std::vector<uint64_t> release_;
    int modifier_rank_ = FINAL_RANK;
    uint64_t modifier_number_ = 0;
};

std::ostream& operator<<(std::ostream& os, const Version& version);

} // namespace supervisor_cpp
