#pragma once
#include <string>
#include <cstddef>
#include <cstdint>
#include <sys/types.h>

namespace perouter {

// Tag-based event dispatch: no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* CaptureStarted  = "CaptureStarted";
    constexpr const char* CaptureOutput   = "CaptureOutput";
    constexpr const char* CaptureExited   = "CaptureExited";
    constexpr const char* CaptureSignaled = "CaptureSignaled";
    constexpr const char* StopEscalated   = "StopEscalated";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct CaptureStartedEvent : Event {
    static constexpr const char* TAG = event_tags::CaptureStarted;
    std::string call_id;
    std::string command;
    pid_t pid = 0;

    CaptureStartedEvent() { type_tag = TAG; }
};

// A line seen during the observation window
struct CaptureOutputEvent : Event {
    static constexpr const char* TAG = event_tags::CaptureOutput;
    std::string call_id;
    std::string line;

    CaptureOutputEvent() { type_tag = TAG; }
};

struct CaptureExitedEvent : Event {
    static constexpr const char* TAG = event_tags::CaptureExited;
    std::string call_id;
    pid_t pid = 0;
    int status = 0;

    CaptureExitedEvent() { type_tag = TAG; }
};

struct CaptureSignaledEvent : Event {
    static constexpr const char* TAG = event_tags::CaptureSignaled;
    std::string call_id;
    pid_t pid = 0;
    int signal = 0;
    bool delivered = false;

    CaptureSignaledEvent() { type_tag = TAG; }
};

// Stop gave up waiting and is about to force kill `remaining` captures
struct StopEscalatedEvent : Event {
    static constexpr const char* TAG = event_tags::StopEscalated;
    size_t remaining = 0;
    uint32_t timeout_ms = 0;

    StopEscalatedEvent() { type_tag = TAG; }
};

} // namespace perouter
