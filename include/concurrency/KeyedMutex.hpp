#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace lsm::concurrency {

// Map of mutexes indexed by secret name. Slots are reference counted and
// dropped once the last Guard for a key releases.
class KeyedMutex {
    struct Slot {
        std::mutex mutex;
        size_t users = 0;
    };

public:
    class Guard {
    public:
        Guard(KeyedMutex& owner, std::string key);
        ~Guard();

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        KeyedMutex& owner_;
        std::string key_;
        std::shared_ptr<Slot> slot_;
    };

    [[nodiscard]] Guard lock(const std::string& key) { return {*this, key}; }

    [[nodiscard]] size_t activeKeys() const;

private:
    mutable std::mutex mapMutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;

    std::shared_ptr<Slot> acquire(const std::string& key);
    void release(const std::string& key);
};

}
