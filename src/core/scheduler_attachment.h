// src/core/scheduler_attachment.h
#pragma once

#include <functional>

// Per-frame notification source the pacer hooks into. The source calls the
// frame callback once per cycle, from one consistent thread, until detached.
class SchedulerAttachment {
public:
    using FrameCallback = std::function<void()>;

    virtual ~SchedulerAttachment() = default;

    // Returns false when already attached.
    virtual bool attach(FrameCallback on_frame) = 0;
    // Stops frame delivery. Safe to call from inside the frame callback.
    virtual void detach() = 0;
    virtual bool is_attached() const = 0;
};
