#include "concurrency/KeyedMutex.hpp"

namespace lsm::concurrency {

KeyedMutex::Guard::Guard(KeyedMutex& owner, std::string key)
    : owner_(owner), key_(std::move(key)), slot_(owner_.acquire(key_)) {
    slot_->mutex.lock();
}

KeyedMutex::Guard::~Guard() {
    slot_->mutex.unlock();
    owner_.release(key_);
}

std::shared_ptr<KeyedMutex::Slot> KeyedMutex::acquire(const std::string& key) {
    std::lock_guard lock(mapMutex_);
    auto& slot = slots_[key];
    if (!slot) slot = std::make_shared<Slot>();
    ++slot->users;
    return slot;
}

void KeyedMutex::release(const std::string& key) {
    std::lock_guard lock(mapMutex_);
    const auto it = slots_.find(key);
    if (it == slots_.end()) return;
    if (--it->second->users == 0) slots_.erase(it);
}

size_t KeyedMutex::activeKeys() const {
    std::lock_guard lock(mapMutex_);
    return slots_.size();
}

}
