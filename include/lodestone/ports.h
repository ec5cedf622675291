#pragma once

#include <cstdint>
#include <mutex>
#include <set>

// Tracks which ports are claimed by registered instances. Port selection
// happens upstream; this only records claims.
class PortAllocator {
public:
    void reserve(uint32_t port);
    void release(uint32_t port);
    bool is_reserved(uint32_t port) const;
    std::set<uint32_t> reserved() const;

private:
    mutable std::mutex mutex_;
    std::set<uint32_t> ports_;
};
