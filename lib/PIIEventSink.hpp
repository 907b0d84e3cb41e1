#ifndef PII_DEFENDER_PII_EVENT_SINK_H_
#define PII_DEFENDER_PII_EVENT_SINK_H_

#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

#include "PIICategory.hpp"

enum class PIISeverity {
  kWarning,
  kError,
};

// Something the extractor wants operators to know about. Carries no input
// text, so a suspicious payload never ends up in a log.
struct PIIEvent {
  enum class Kind {
    kSignatureDetected,
    kInputRejected,
  };

  Kind kind;
  PIISeverity severity;
  PIISignature signature;

  static PIIEvent SignatureDetected(PIISignature signature) {
    return PIIEvent{Kind::kSignatureDetected, PIISeverity::kWarning, signature};
  }

  static PIIEvent InputRejected(PIISignature signature) {
    return PIIEvent{Kind::kInputRejected, PIISeverity::kError, signature};
  }
};

inline bool operator==(const PIIEvent& a, const PIIEvent& b) {
  return a.kind == b.kind && a.severity == b.severity &&
         a.signature == b.signature;
}

inline const char* PIIEventKindName(PIIEvent::Kind kind) {
  switch (kind) {
    case PIIEvent::Kind::kSignatureDetected:
      return "signature_detected";
    case PIIEvent::Kind::kInputRejected:
      return "input_rejected";
  }
  return "unknown";
}

// Receives observability events. Implementations may be called from several
// threads at once.
class PIIEventSink {
 public:
  virtual ~PIIEventSink() = default;

  virtual void Record(const PIIEvent& event) = 0;
};

// Default sink, drops everything.
class PIINullEventSink : public PIIEventSink {
 public:
  void Record(const PIIEvent& event) override {}
};

// Forwards events to an spdlog logger, warnings as warn and rejections as
// err. Uses the default logger unless one is supplied.
class PIISpdlogEventSink : public PIIEventSink {
 public:
  PIISpdlogEventSink() : PIISpdlogEventSink(spdlog::default_logger()) {}

  explicit PIISpdlogEventSink(std::shared_ptr<spdlog::logger> logger)
      : logger_(std::move(logger)) {}

  void Record(const PIIEvent& event) override {
    auto level = event.severity == PIISeverity::kError
                     ? spdlog::level::err
                     : spdlog::level::warn;
    logger_->log(level, "{} signature={}", PIIEventKindName(event.kind),
                 PIISignatureName(event.signature));
  }

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

#endif  // PII_DEFENDER_PII_EVENT_SINK_H_
