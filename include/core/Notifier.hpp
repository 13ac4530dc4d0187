#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace podcapture {
namespace core {

// Fire-and-forget outbound message. Implementations log failures and never throw.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const std::string& message) noexcept = 0;
};

class LogNotifier : public Notifier {
public:
    void notify(const std::string& message) noexcept override;
};

// POSTs {"text": message} to a chat/webhook endpoint.
class WebhookNotifier : public Notifier {
public:
    WebhookNotifier(const std::string& webhookUrl, int timeoutSeconds = 10);
    void notify(const std::string& message) noexcept override;

private:
    std::string webhookUrl_;
    int timeoutSeconds_;
};

// Pushes generated artifacts somewhere public. Never throws.
class Publisher {
public:
    virtual ~Publisher() = default;
    virtual void publish() noexcept = 0;
};

class NullPublisher : public Publisher {
public:
    void publish() noexcept override {}
};

// git add / commit / push inside repoDir.
class GitPublisher : public Publisher {
public:
    GitPublisher(const std::filesystem::path& repoDir, const std::string& remote, const std::string& branch,
                 const std::string& commitMessage);
    void publish() noexcept override;

private:
    // Runs a command in repoDir_ and returns its exit status, or -1 if it could not be started.
    int run(const std::vector<std::string>& args, bool quiet) const;

    std::filesystem::path repoDir_;
    std::string remote_;
    std::string branch_;
    std::string commitMessage_;
};

} // namespace core
} // namespace podcapture
