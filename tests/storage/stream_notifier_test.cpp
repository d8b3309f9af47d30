// File: tests/storage/stream_notifier_test.cpp
#include "storage/stream_notifier.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace dedupe {
namespace {

DuplicateEvent CreateEvent() {
    DuplicateEvent event;
    event.entity_id = "deal-1";
    event.entity_name = "Acme Renewal";
    event.matches_count = 4;
    event.top_confidence = 0.97;
    event.suggested_action = SuggestedAction::AUTO_MERGE;
    event.matches = {
        {"deal-7", 0.97, "Same vendor"},
        {"deal-9", 0.9, "Fuzzy match"},
    };
    return event;
}

TEST(StreamNotifierTest, FormatsSingleLine) {
    EXPECT_EQ(
        "duplicate.detected entity=deal-1 name=\"Acme Renewal\" matches=4 "
        "confidence=0.970 action=auto_merge top=[deal-7:0.970, deal-9:0.900]",
        StreamNotifier::Format(CreateEvent()));
}

TEST(StreamNotifierTest, EmptyMatchList) {
    DuplicateEvent event = CreateEvent();
    event.matches.clear();

    std::string line = StreamNotifier::Format(event);
    EXPECT_NE(std::string::npos, line.find("top=[]"));
}

TEST(StreamNotifierTest, NotifyWritesLineAndCounts) {
    std::ostringstream out;
    StreamNotifier notifier(out);

    notifier.Notify(CreateEvent());
    notifier.Notify(CreateEvent());

    EXPECT_EQ(2u, notifier.GetEventCount());
    std::string text = out.str();
    EXPECT_EQ(2, std::count(text.begin(), text.end(), '\n'));
    EXPECT_EQ(0u, text.find("duplicate.detected entity=deal-1"));
}

TEST(StreamNotifierTest, FailedStreamThrows) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    StreamNotifier notifier(out);

    EXPECT_THROW(notifier.Notify(CreateEvent()), std::runtime_error);
    EXPECT_EQ(0u, notifier.GetEventCount());
}

} // namespace
} // namespace dedupe
