#include "notify/Notifier.hpp"
#include "errors/Error.hpp"
#include "log/Registry.hpp"
#include "util/duration.hpp"

#include <cerrno>
#include <cstring>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

using namespace lsm::types;

namespace lsm::notify {

Notifier::Notifier(config::NotificationsConfig config, std::ostream& err)
    : config_(std::move(config)), err_(err) {}

std::string Notifier::formatMessage(const std::string& key, const SecretMetadata& meta,
                                    const ExpirationStatus status, const TimePoint now) {
    const auto left = std::chrono::duration_cast<std::chrono::seconds>(meta.expires_at - now);
    if (status == ExpirationStatus::Expired)
        return "Warning: Secret '" + key + "' expired " + util::formatRemaining(-left) + " ago";
    return "Warning: Secret '" + key + "' expires in " + util::formatRemaining(left);
}

bool Notifier::notifyExpiration(const std::string& key, const SecretMetadata& meta, const TimePoint now) const {
    if (config_.method == config::NotificationMethod::Silent || meta.empty()) return false;

    std::chrono::seconds threshold;
    try {
        threshold = config_.expiringThreshold();
    } catch (const Error& e) {
        log::Registry::notify()->warn("[Notifier] Invalid expiring threshold '{}': {}",
                                      config_.expiring_threshold, e.what());
        return false;
    }

    const auto status = meta.status(threshold, now);
    if (status == ExpirationStatus::Valid) return false;

    const auto message = formatMessage(key, meta, status, now);

    switch (config_.method) {
    case config::NotificationMethod::Stderr:
        err_ << message << std::endl;
        break;
    case config::NotificationMethod::NativeNotification:
        sendNative(message);
        break;
    case config::NotificationMethod::Silent:
        return false;
    }

    return true;
}

void Notifier::sendNative(const std::string& message) {
    const pid_t pid = fork();
    if (pid < 0) {
        log::Registry::notify()->warn("[Notifier] Failed to fork notify-send: {}", std::strerror(errno));
        return;
    }

    if (pid == 0) {
        std::vector args = {"notify-send", "Locksmith", message.c_str()};
        args.push_back(nullptr);
        execvp("notify-send", const_cast<char* const*>(args.data()));
        _exit(127); // exec failed
    }

    int status = 0;
    if (waitpid(pid, &status, 0) < 0) {
        log::Registry::notify()->warn("[Notifier] Failed to wait for notify-send: {}", std::strerror(errno));
        return;
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0)
        log::Registry::notify()->warn("[Notifier] notify-send exited with status {}", WEXITSTATUS(status));
}

}
