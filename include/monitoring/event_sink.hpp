#pragma once

#include <string>
#include <string_view>

namespace ztgate {

/**
 * @brief Abstract interface for event log destinations
 *
 * Sinks are only called from inside CentralMonitor's critical section, so
 * implementations need no internal locking. A multi-process deployment
 * would plug a shared append-only store in here.
 */
class IEventSink {
public:
    virtual ~IEventSink() = default;

    /// Append one serialized event line (including trailing newline). Returns true once durable.
    [[nodiscard]] virtual bool write(std::string_view json_line) = 0;

    /// Flush any buffered data to the underlying storage.
    virtual void flush() = 0;

    /// Graceful shutdown (drain buffers, close handles).
    virtual void shutdown() = 0;

    /// Human-readable sink name for logging (e.g. "file:/var/log/ztgate/events.jsonl")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace ztgate
