/**
 * @file SummarizerBackend.hpp
 * @brief Interface to a remote text summarization / classification service.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace tidyfile::domain {

/**
 * @struct ChatMessage
 * @brief One role-tagged text segment of a request.
 */
struct ChatMessage {
    enum class Role { System, User, Assistant };
    Role role;
    std::string content;

    static std::string RoleToString(Role r) {
        switch (r) {
            case Role::System: return "system";
            case Role::User: return "user";
            case Role::Assistant: return "assistant";
        }
        return "user";
    }
};

/**
 * @class SummarizerBackend
 * @brief Abstract endpoint: ordered role-tagged segments in, a single text out.
 */
class SummarizerBackend {
public:
    virtual ~SummarizerBackend() = default;

    /**
     * @brief Sends the conversation and returns the response text.
     * @return Response text, or nullopt when the backend gave no usable answer.
     * @throws BackendError on transport failures in single-endpoint implementations.
     */
    virtual std::optional<std::string> complete(const std::vector<ChatMessage>& messages) = 0;

    /** @brief Human-readable endpoint name used in log lines. */
    virtual std::string name() const = 0;
};

} // namespace tidyfile::domain
