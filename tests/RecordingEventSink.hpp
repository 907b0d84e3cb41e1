#ifndef PII_DEFENDER_TESTS_RECORDING_EVENT_SINK_H_
#define PII_DEFENDER_TESTS_RECORDING_EVENT_SINK_H_

#include <mutex>
#include <vector>

#include "PIIEventSink.hpp"

// Keeps every event it sees so tests can look at them afterwards.
class RecordingEventSink : public PIIEventSink {
 public:
  void Record(const PIIEvent& event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
  }

  std::vector<PIIEvent> events() {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

 private:
  std::mutex mutex_;
  std::vector<PIIEvent> events_;
};

#endif  // PII_DEFENDER_TESTS_RECORDING_EVENT_SINK_H_
