#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "lodestone/types.h"

using json = nlohmann::json;

using EventId = uint64_t;

enum class CausedByKind {
    User,
    System
};

struct CausedBy {
    CausedByKind kind = CausedByKind::System;
    std::string user_id;
    std::string user_name;

    static CausedBy user(const std::string& id, const std::string& name);
    static CausedBy system();

    json to_json_object() const;
};

enum class ProgressionKind {
    InstanceCreation,
    InstanceDelete
};

struct ProgressionStartValue {
    ProgressionKind kind = ProgressionKind::InstanceCreation;
    InstanceUuid instance_uuid;
    std::string instance_name;
    uint32_t port = 0;
    std::string flavour;
    std::string game_type;

    static ProgressionStartValue instance_creation(const InstanceUuid& uuid,
                                                   const std::string& name,
                                                   uint32_t port,
                                                   const std::string& flavour,
                                                   const std::string& game_type);
    static ProgressionStartValue instance_delete(const InstanceUuid& uuid);

    json to_json_object() const;
};

struct ProgressionEndValue {
    ProgressionKind kind = ProgressionKind::InstanceCreation;
    // Set for InstanceCreation.
    InstanceInfo info;
    InstanceUuid instance_uuid;

    static ProgressionEndValue instance_creation(const InstanceInfo& info);
    static ProgressionEndValue instance_delete(const InstanceUuid& uuid);

    json to_json_object() const;
};

enum class EventKind {
    ProgressionStart,
    ProgressionEnd
};

struct Event {
    EventKind kind = EventKind::ProgressionStart;
    EventId event_id = 0;
    std::string timestamp;

    // ProgressionStart
    std::string description;
    std::optional<InstanceUuid> instance_uuid;
    std::optional<double> total;
    std::optional<ProgressionStartValue> start_value;
    CausedBy caused_by;

    // ProgressionEnd
    bool success = false;
    std::optional<std::string> message;
    std::optional<ProgressionEndValue> end_value;

    json to_json_object() const;
};

std::pair<Event, EventId> new_progression_start(const std::string& description,
                                                const std::optional<InstanceUuid>& instance_uuid,
                                                std::optional<double> total,
                                                const std::optional<ProgressionStartValue>& value,
                                                const CausedBy& caused_by);

Event new_progression_end(EventId event_id,
                          bool success,
                          const std::optional<std::string>& message,
                          const std::optional<ProgressionEndValue>& value);

// Bounded per-subscriber queue. A full queue drops new events.
class EventSubscriber {
public:
    explicit EventSubscriber(std::size_t capacity) : capacity_(capacity) {}

    bool push(const Event& event);
    std::optional<Event> try_receive();
    std::optional<Event> receive_for(std::chrono::milliseconds timeout);
    std::vector<Event> drain();
    std::size_t dropped() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<Event> queue_;
    std::size_t capacity_;
    std::size_t dropped_ = 0;
};

class EventBroadcaster {
public:
    explicit EventBroadcaster(std::size_t capacity = 256) : capacity_(capacity) {}

    std::shared_ptr<EventSubscriber> subscribe();

    // Never blocks on a subscriber; subscribers that were released are pruned.
    void send(const Event& event);

    std::size_t subscriber_count() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<EventSubscriber>> subscribers_;
    std::size_t capacity_;
};

// Appends one JSON line to the event log at path.
bool record_event(const std::string& path, const Event& event);
