#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace supervisor_cpp {

enum class IssueType : std::uint8_t { DOCKER_RATELIMIT, TRUST, FATAL_ERROR };

enum class ContextType : std::uint8_t { SYSTEM, CORE, PLUGIN, SUPERVISOR };

enum class SuggestionType : std::uint8_t { REGISTRY_LOGIN, EXECUTE_REPAIR, EXECUTE_RESET };

std::string toString(IssueType type);
std::string toString(ContextType context);
std::string toString(SuggestionType type);

struct Suggestion {
    SuggestionType type;
    ContextType context;
    std::optional<std::string> reference;
    std::string uuid;
};

struct Issue {
    IssueType type;
    ContextType context;
    std::optional<std::string> reference;
    std::string uuid;
    std::vector<Suggestion> suggestions;
};

/**
 * @brief Records system issues and the suggested remediation
 *
 * An issue with the same type, context and reference is recorded once.
 */
class ResolutionCenter {
public:
    ResolutionCenter() = default;

    ResolutionCenter(const ResolutionCenter&) = delete;
    ResolutionCenter& operator=(const ResolutionCenter&) = delete;

    Issue createIssue(IssueType type,
                      ContextType context,
                      const std::vector<SuggestionType>& suggestions = {},
                      const std::optional<std::string>& reference = std::nullopt);

    std::vector<Issue> issues() const;
    bool hasIssue(IssueType type, ContextType context) const;
    bool dismissIssue(const std::string& uuid);

private:
    static std::string generateUuid();

    mutable std::mutex mutex_;
    std::vector<Issue> issues_;
};

} // namespace supervisor_cpp
