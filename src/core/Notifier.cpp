#include "core/Notifier.hpp"
#include "core/Logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

namespace podcapture {
namespace core {

void LogNotifier::notify(const std::string& message) noexcept {
    Logger::info("Notification: " + message);
}

WebhookNotifier::WebhookNotifier(const std::string& webhookUrl, int timeoutSeconds)
    : webhookUrl_(webhookUrl), timeoutSeconds_(timeoutSeconds) {
}

void WebhookNotifier::notify(const std::string& message) noexcept {
    try {
        nlohmann::json payload;
        payload["text"] = message;

        auto response = cpr::Post(
            cpr::Url{webhookUrl_},
            cpr::Header{{"Content-Type", "application/json"}},
            cpr::Body{payload.dump()},
            cpr::Timeout{timeoutSeconds_ * 1000}
        );

        if (response.status_code < 200 || response.status_code >= 300) {
            std::string error = "Notification failed: HTTP " + std::to_string(response.status_code);
            if (response.error.code != cpr::ErrorCode::OK) {
                error += " (" + response.error.message + ")";
            }
            Logger::warn(error);
        }
    } catch (const std::exception& e) {
        Logger::warn(std::string("Notification failed: ") + e.what());
    }
}

GitPublisher::GitPublisher(const std::filesystem::path& repoDir, const std::string& remote,
                           const std::string& branch, const std::string& commitMessage)
    : repoDir_(repoDir), remote_(remote), branch_(branch), commitMessage_(commitMessage) {
}

void GitPublisher::publish() noexcept {
    try {
        Logger::info("Running git add/commit/push in " + repoDir_.string());

        if (run({"git", "add", "-A"}, false) != 0) {
            Logger::error("git add failed");
            return;
        }
        // Exit status 1 means there was nothing to commit.
        int commitStatus = run({"git", "commit", "-m", commitMessage_}, true);
        if (commitStatus != 0 && commitStatus != 1) {
            Logger::error("git commit failed with status " + std::to_string(commitStatus));
            return;
        }

        if (run({"git", "push", remote_, branch_}, false) != 0) {
            Logger::error("git push to " + remote_ + "/" + branch_ + " failed");
            return;
        }
        Logger::info("Git push complete.");
    } catch (const std::exception& e) {
        Logger::error(std::string("Git push failed: ") + e.what());
    }
}

int GitPublisher::run(const std::vector<std::string>& args, bool quiet) const {
    std::vector<char*> argv;
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        Logger::error("Failed to start " + args.front() + ": " + strerror(errno));
        return -1;
    }

    if (pid == 0) {
        if (chdir(repoDir_.c_str()) != 0) {
            _exit(127);
        }
        if (quiet) {
            int devnull = open("/dev/null", O_WRONLY);
            if (devnull != -1) {
                dup2(devnull, STDOUT_FILENO);
                dup2(devnull, STDERR_FILENO);
                close(devnull);
            }
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

} // namespace core
} // namespace podcapture
