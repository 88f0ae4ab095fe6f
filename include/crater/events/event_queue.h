#pragma once
/**
 * @file event_queue.h
 * @brief Per-tick event queue with observer subscription
 *
 * Producers push events during a simulation step. Once per tick the host
 * either drains the list or flushes it through subscribed handlers.
 *
 * Usage:
 * @code
 * EventQueue queue;
 * auto id = queue.subscribe(EventType::ObjectDestroyed,
 *     [](const Event& e) {
 *         const auto& data = e.get_data<DestroyedEventData>();
 *         // Remove the object from the scene...
 *     });
 *
 * // ... simulation step pushes events ...
 * queue.flush();
 * queue.unsubscribe(id);
 * @endcode
 */

#include "crater/events/event.h"
#include <array>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace crater::events {

using EventHandler = std::function<void(const Event&)>;
using EventHandlerId = UInt64;
constexpr EventHandlerId INVALID_HANDLER_ID = 0;

/**
 * @brief Configuration for the event queue
 */
struct EventQueueConfig {
    SizeT max_queue_size{10000};           ///< Non-terminal pushes beyond this are dropped
    SizeT max_flush_passes{16};            ///< Bound on handler-triggered re-flushes
};

/**
 * @brief Statistics about queued and dispatched events
 */
struct EventStatistics {
    UInt64 total_events_queued{0};
    UInt64 total_events_dropped{0};
    UInt64 total_events_dispatched{0};
    UInt64 total_handlers_called{0};
    std::array<UInt64, static_cast<SizeT>(EventType::Count)> events_by_type{};
};

class EventQueue {
public:
    EventQueue();
    explicit EventQueue(const EventQueueConfig& config);
    ~EventQueue();

    // Non-copyable
    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    // Movable
    EventQueue(EventQueue&&) noexcept;
    EventQueue& operator=(EventQueue&&) noexcept;

    // ========================================================================
    // Handler Registration
    // ========================================================================

    /**
     * @brief Subscribe to a specific event type
     *
     * @param type Event type to listen for
     * @param handler Callback function
     * @param name Optional debug name
     * @param order Execution order (lower = earlier)
     * @return Handler ID, or INVALID_HANDLER_ID for an empty handler
     */
    EventHandlerId subscribe(EventType type, EventHandler handler,
                             const std::string& name = "", int order = 0);

    /**
     * @brief Subscribe to every event type
     */
    EventHandlerId subscribe_all(EventHandler handler,
                                 const std::string& name = "", int order = 0);

    /**
     * @brief Remove a handler
     * @return true if the handler was found
     */
    bool unsubscribe(EventHandlerId id);

    SizeT handler_count(EventType type) const;
    SizeT total_handler_count() const;

    // ========================================================================
    // Queueing
    // ========================================================================

    /**
     * @brief Append an event
     * @return false if the queue is full and the event was dropped
     */
    bool push(Event event);

    /**
     * @brief Take all queued events in FIFO order without dispatching
     */
    std::vector<Event> drain();

    /**
     * @brief Dispatch queued events to handlers in FIFO order
     *
     * Events pushed by handlers during the flush are dispatched in the
     * same call, up to max_flush_passes rounds.
     *
     * @return Number of events dispatched
     */
    SizeT flush();

    void clear();
    SizeT size() const;
    bool empty() const;

    // ========================================================================
    // Statistics
    // ========================================================================

    const EventStatistics& statistics() const;
    void reset_statistics();
    const EventQueueConfig& config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace crater::events
