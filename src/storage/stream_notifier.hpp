// File: src/storage/stream_notifier.hpp
#pragma once

#include "storage/entity_repository.hpp"
#include <mutex>
#include <ostream>
#include <string>

namespace dedupe {

/// DuplicateNotifier that writes one line per event to a stream
///
/// Line format:
///   duplicate.detected entity=<id> name="<name>" matches=<n>
///     confidence=<0.000> action=<action> top=[<id>:<0.000>, ...]
/// (a single line; wrapped here for readability)
class StreamNotifier : public DuplicateNotifier {
public:
    /// @param os Destination stream (must outlive the notifier)
    explicit StreamNotifier(std::ostream& os);

    void Notify(const DuplicateEvent& event) override;

    /// Render an event as it is written
    static std::string Format(const DuplicateEvent& event);

    size_t GetEventCount() const;

private:
    std::ostream& os_;
    size_t event_count_{0};
    mutable std::mutex mutex_;
};

} // namespace dedupe
