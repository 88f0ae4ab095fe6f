/**
 * @file event_queue.cpp
 * @brief EventQueue implementation
 */

#include "crater/events/event_queue.h"
#include "crater/core/log.h"
#include <algorithm>

namespace crater::events {

// ============================================================================
// EventQueue Implementation Details
// ============================================================================

namespace {

struct HandlerInfo {
    EventHandlerId id{INVALID_HANDLER_ID};
    EventHandler handler;
    EventType type{EventType::ObjectDamaged};
    bool all_types{false};
    int order{0};
    std::string name;
};

} // anonymous namespace

struct EventQueue::Impl {
    EventQueueConfig config;
    std::vector<HandlerInfo> handlers;
    EventHandlerId next_handler_id{1};
    std::vector<Event> queue;
    EventStatistics stats;

    EventHandlerId add(HandlerInfo info) {
        EventHandlerId id = next_handler_id++;
        info.id = id;
        handlers.push_back(std::move(info));
        std::stable_sort(handlers.begin(), handlers.end(),
            [](const HandlerInfo& a, const HandlerInfo& b) {
                return a.order < b.order;
            });
        return id;
    }
};

// ============================================================================
// Construction/Destruction
// ============================================================================

EventQueue::EventQueue()
    : impl_(std::make_unique<Impl>()) {
}

EventQueue::EventQueue(const EventQueueConfig& config)
    : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
}

EventQueue::~EventQueue() = default;

EventQueue::EventQueue(EventQueue&&) noexcept = default;
EventQueue& EventQueue::operator=(EventQueue&&) noexcept = default;

// ============================================================================
// Handler Registration
// ============================================================================

EventHandlerId EventQueue::subscribe(EventType type, EventHandler handler,
                                     const std::string& name, int order) {
    if (!handler) {
        return INVALID_HANDLER_ID;
    }
    HandlerInfo info;
    info.handler = std::move(handler);
    info.type = type;
    info.order = order;
    info.name = name;
    return impl_->add(std::move(info));
}

EventHandlerId EventQueue::subscribe_all(EventHandler handler,
                                         const std::string& name, int order) {
    if (!handler) {
        return INVALID_HANDLER_ID;
    }
    HandlerInfo info;
    info.handler = std::move(handler);
    info.all_types = true;
    info.order = order;
    info.name = name;
    return impl_->add(std::move(info));
}

bool EventQueue::unsubscribe(EventHandlerId id) {
    if (id == INVALID_HANDLER_ID) {
        return false;
    }
    auto it = std::find_if(impl_->handlers.begin(), impl_->handlers.end(),
        [id](const HandlerInfo& info) { return info.id == id; });
    if (it == impl_->handlers.end()) {
        return false;
    }
    impl_->handlers.erase(it);
    return true;
}

SizeT EventQueue::handler_count(EventType type) const {
    return static_cast<SizeT>(std::count_if(impl_->handlers.begin(), impl_->handlers.end(),
        [type](const HandlerInfo& h) { return !h.all_types && h.type == type; }));
}

SizeT EventQueue::total_handler_count() const {
    return impl_->handlers.size();
}

// ============================================================================
// Queueing
// ============================================================================

bool EventQueue::push(Event event) {
    if (impl_->queue.size() >= impl_->config.max_queue_size && !is_terminal_event(event.type)) {
        impl_->stats.total_events_dropped++;
        log::get()->warn("Event queue full, dropping {}", get_event_type_name(event.type));
        return false;
    }
    impl_->stats.total_events_queued++;
    auto slot = static_cast<SizeT>(event.type);
    if (slot < impl_->stats.events_by_type.size()) {
        impl_->stats.events_by_type[slot]++;
    }
    impl_->queue.push_back(std::move(event));
    return true;
}

std::vector<Event> EventQueue::drain() {
    std::vector<Event> out;
    out.swap(impl_->queue);
    return out;
}

SizeT EventQueue::flush() {
    SizeT processed = 0;
    for (SizeT pass = 0; pass < impl_->config.max_flush_passes && !impl_->queue.empty(); ++pass) {
        std::vector<Event> batch = drain();
        // Copy so handlers may subscribe or unsubscribe while dispatching
        std::vector<HandlerInfo> handlers = impl_->handlers;
        for (const Event& event : batch) {
            for (const auto& h : handlers) {
                if (h.all_types || h.type == event.type) {
                    h.handler(event);
                    impl_->stats.total_handlers_called++;
                }
            }
            impl_->stats.total_events_dispatched++;
            ++processed;
        }
    }
    if (!impl_->queue.empty()) {
        log::get()->warn("Event flush stopped after {} passes with {} events pending",
                         impl_->config.max_flush_passes, impl_->queue.size());
    }
    return processed;
}

void EventQueue::clear() {
    impl_->queue.clear();
}

SizeT EventQueue::size() const {
    return impl_->queue.size();
}

bool EventQueue::empty() const {
    return impl_->queue.empty();
}

// ============================================================================
// Statistics
// ============================================================================

const EventStatistics& EventQueue::statistics() const {
    return impl_->stats;
}

void EventQueue::reset_statistics() {
    impl_->stats = EventStatistics{};
}

const EventQueueConfig& EventQueue::config() const {
    return impl_->config;
}

} // namespace crater::events
