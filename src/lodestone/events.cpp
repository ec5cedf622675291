#include "lodestone/events.h"

#include <algorithm>
#include <atomic>
#include <fstream>

#include "lodestone/filesystem.h"
#include "lodestone/options.h"

namespace {

std::atomic<EventId> g_next_event_id{1};

const char* progression_kind_name(ProgressionKind kind) {
    switch (kind) {
        case ProgressionKind::InstanceCreation:
            return "InstanceCreation";
        case ProgressionKind::InstanceDelete:
            return "InstanceDelete";
    }
    return "InstanceCreation";
}

} // namespace

CausedBy CausedBy::user(const std::string& id, const std::string& name) {
    CausedBy caused_by;
    caused_by.kind = CausedByKind::User;
    caused_by.user_id = id;
    caused_by.user_name = name;
    return caused_by;
}

CausedBy CausedBy::system() {
    return CausedBy{};
}

json CausedBy::to_json_object() const {
    if (kind == CausedByKind::System) {
        return json{{"type", "System"}};
    }
    return json{
            {"type", "User"},
            {"user_id", user_id},
            {"user_name", user_name}
    };
}

ProgressionStartValue ProgressionStartValue::instance_creation(const InstanceUuid& uuid,
                                                               const std::string& name,
                                                               uint32_t port,
                                                               const std::string& flavour,
                                                               const std::string& game_type) {
    ProgressionStartValue value;
    value.kind = ProgressionKind::InstanceCreation;
    value.instance_uuid = uuid;
    value.instance_name = name;
    value.port = port;
    value.flavour = flavour;
    value.game_type = game_type;
    return value;
}

ProgressionStartValue ProgressionStartValue::instance_delete(const InstanceUuid& uuid) {
    ProgressionStartValue value;
    value.kind = ProgressionKind::InstanceDelete;
    value.instance_uuid = uuid;
    return value;
}

json ProgressionStartValue::to_json_object() const {
    json j = {
            {"type", progression_kind_name(kind)},
            {"instance_uuid", instance_uuid.value}
    };
    if (kind == ProgressionKind::InstanceCreation) {
        j["instance_name"] = instance_name;
        j["port"] = port;
        j["flavour"] = flavour;
        j["game_type"] = game_type;
    }
    return j;
}

ProgressionEndValue ProgressionEndValue::instance_creation(const InstanceInfo& info) {
    ProgressionEndValue value;
    value.kind = ProgressionKind::InstanceCreation;
    value.info = info;
    value.instance_uuid = info.uuid;
    return value;
}

ProgressionEndValue ProgressionEndValue::instance_delete(const InstanceUuid& uuid) {
    ProgressionEndValue value;
    value.kind = ProgressionKind::InstanceDelete;
    value.instance_uuid = uuid;
    return value;
}

json ProgressionEndValue::to_json_object() const {
    json j = {{"type", progression_kind_name(kind)}};
    if (kind == ProgressionKind::InstanceCreation) {
        j["instance_info"] = info.to_json_object();
    } else {
        j["instance_uuid"] = instance_uuid.value;
    }
    return j;
}

json Event::to_json_object() const {
    json j = {
            {"event_id", event_id},
            {"timestamp", timestamp}
    };
    if (kind == EventKind::ProgressionStart) {
        j["type"] = "ProgressionStart";
        j["description"] = description;
        j["caused_by"] = caused_by.to_json_object();
        if (instance_uuid) {
            j["instance_uuid"] = instance_uuid->value;
        }
        if (total) {
            j["total"] = *total;
        }
        if (start_value) {
            j["value"] = start_value->to_json_object();
        }
    } else {
        j["type"] = "ProgressionEnd";
        j["success"] = success;
        if (message) {
            j["message"] = *message;
        }
        if (end_value) {
            j["value"] = end_value->to_json_object();
        }
    }
    return j;
}

std::pair<Event, EventId> new_progression_start(const std::string& description,
                                                const std::optional<InstanceUuid>& instance_uuid,
                                                std::optional<double> total,
                                                const std::optional<ProgressionStartValue>& value,
                                                const CausedBy& caused_by) {
    Event event;
    event.kind = EventKind::ProgressionStart;
    event.event_id = g_next_event_id.fetch_add(1);
    event.timestamp = iso8601_now();
    event.description = description;
    event.instance_uuid = instance_uuid;
    event.total = total;
    event.start_value = value;
    event.caused_by = caused_by;
    return {event, event.event_id};
}

Event new_progression_end(EventId event_id,
                          bool success,
                          const std::optional<std::string>& message,
                          const std::optional<ProgressionEndValue>& value) {
    Event event;
    event.kind = EventKind::ProgressionEnd;
    event.event_id = event_id;
    event.timestamp = iso8601_now();
    event.success = success;
    event.message = message;
    event.end_value = value;
    return event;
}

bool EventSubscriber::push(const Event& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= capacity_) {
            ++dropped_;
            return false;
        }
        queue_.push_back(event);
    }
    ready_.notify_one();
    return true;
}

std::optional<Event> EventSubscriber::try_receive() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    Event event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::optional<Event> EventSubscriber::receive_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!ready_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
        return std::nullopt;
    }
    Event event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::vector<Event> EventSubscriber::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Event> events(queue_.begin(), queue_.end());
    queue_.clear();
    return events;
}

std::size_t EventSubscriber::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

std::shared_ptr<EventSubscriber> EventBroadcaster::subscribe() {
    auto subscriber = std::make_shared<EventSubscriber>(capacity_);
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(subscriber);
    return subscriber;
}

void EventBroadcaster::send(const Event& event) {
    std::vector<std::shared_ptr<EventSubscriber>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::remove_if(subscribers_.begin(), subscribers_.end(),
                                 [](const std::weak_ptr<EventSubscriber>& weak) { return weak.expired(); });
        subscribers_.erase(it, subscribers_.end());
        for (const auto& weak : subscribers_) {
            if (auto subscriber = weak.lock()) {
                live.push_back(subscriber);
            }
        }
    }
    for (const auto& subscriber : live) {
        if (!subscriber->push(event)) {
            log_debug("Dropped event " + std::to_string(event.event_id) + " for a full subscriber");
        }
    }
}

std::size_t EventBroadcaster::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& weak : subscribers_) {
        if (!weak.expired()) {
            ++count;
        }
    }
    return count;
}

bool record_event(const std::string& path, const Event& event) {
    if (!ensure_parent_directory(path)) {
        log_error("Failed to prepare event log " + path);
        return false;
    }
    std::ofstream ofs(path, std::ios::app);
    if (!ofs) {
        log_error("Failed to open event log " + path);
        return false;
    }
    ofs << event.to_json_object().dump() << std::endl;
    return true;
}
