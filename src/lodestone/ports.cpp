#include "lodestone/ports.h"

#include "lodestone/options.h"

void PortAllocator::reserve(uint32_t port) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ports_.insert(port).second) {
        log_debug("Port " + std::to_string(port) + " reserved twice");
    }
}

void PortAllocator::release(uint32_t port) {
    std::lock_guard<std::mutex> lock(mutex_);
    ports_.erase(port);
}

bool PortAllocator::is_reserved(uint32_t port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ports_.count(port) != 0;
}

std::set<uint32_t> PortAllocator::reserved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ports_;
}
