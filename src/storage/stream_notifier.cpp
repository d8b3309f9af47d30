// File: src/storage/stream_notifier.cpp
#include "storage/stream_notifier.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace dedupe {

StreamNotifier::StreamNotifier(std::ostream& os)
    : os_(os) {
}

std::string StreamNotifier::Format(const DuplicateEvent& event) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3)
        << event.event_name
        << " entity=" << event.entity_id
        << " name=\"" << event.entity_name << "\""
        << " matches=" << event.matches_count
        << " confidence=" << event.top_confidence
        << " action=" << ToString(event.suggested_action)
        << " top=[";

    for (size_t i = 0; i < event.matches.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << event.matches[i].matched_entity_id << ":" << event.matches[i].confidence;
    }
    oss << "]";

    return oss.str();
}

void StreamNotifier::Notify(const DuplicateEvent& event) {
    std::string line = Format(event);

    std::lock_guard<std::mutex> lock(mutex_);
    os_ << line << '\n';
    os_.flush();
    if (!os_) {
        throw std::runtime_error("Failed to write notification for " + event.entity_id);
    }
    ++event_count_;
}

size_t StreamNotifier::GetEventCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return event_count_;
}

} // namespace dedupe
