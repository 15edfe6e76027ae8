#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>
#include <supervisor-cpp/core/logger.hpp>
#include <supervisor-cpp/resolution/resolution.hpp>

namespace supervisor_cpp {

std::string toString(IssueType type)
{
    switch (type) {
        case IssueType::DOCKER_RATELIMIT:
            return "docker_ratelimit";
        case IssueType::TRUST:
            return "trust";
        case IssueType::FATAL_ERROR:
            return "fatal_error";
    }
    return "unknown";
}

std::string toString(ContextType context)
{
    switch (context) {
        case ContextType::SYSTEM:
            return "system";
        case ContextType::CORE:
            return "core";
        case ContextType::PLUGIN:
            return "plugin";
        case ContextType::SUPERVISOR:
            return "supervisor";
    }
    return "unknown";
}

std::string toString(SuggestionType type)
{
    switch (type) {
        case SuggestionType::REGISTRY_LOGIN:
            return "registry_login";
        case SuggestionType::EXECUTE_REPAIR:
            return "execute_repair";
        case SuggestionType::EXECUTE_RESET:
            return "execute_reset";
    }
    return "unknown";
}

Issue ResolutionCenter::createIssue(IssueType type,
                                    ContextType context,
                                    const std::vector<SuggestionType>& suggestions,
                                    const std::optional<std::string>& reference)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = std::find_if(issues_.begin(), issues_.end(), [&](const Issue& issue) {
        return issue.type == type && issue.context == context && issue.reference == reference;
    });
    if (existing != issues_.end()) {
        return *existing;
    }

    Issue issue{type, context, reference, generateUuid(), {}};
    for (auto suggestion : suggestions) {
        issue.suggestions.push_back(Suggestion{suggestion, context, reference, generateUuid()});
    }

    Logger::getInstance("resolution")
        ->info("Create new issue {} - {} / {}", toString(type), toString(context),
               reference.value_or(""));

    issues_.push_back(issue);
    return issue;
}

std::vector<Issue> ResolutionCenter::issues() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return issues_;
}

bool ResolutionCenter::hasIssue(IssueType type, ContextType context) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(issues_.begin(), issues_.end(), [&](const Issue& issue) {
        return issue.type == type && issue.context == context;
    });
}

bool ResolutionCenter::dismissIssue(const std::string& uuid)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(issues_.begin(), issues_.end(),
                           [&](const Issue& issue) { return issue.uuid == uuid; });
    if (it == issues_.end()) {
        return false;
    }
    issues_.erase(it);
    return true;
}

std::string ResolutionCenter::generateUuid()
{
    static thread_local std::mt19937_64 generator{std::random_device{}()};

    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << generator() << std::setw(16)
        << generator();
    return oss.str();
}

} // namespace supervisor_cpp
