// src/host/thread_loop_attachment.h
#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include "../core/scheduler_attachment.h"

// Dedicated loop thread calling the frame callback back to back.
class ThreadLoopAttachment : public SchedulerAttachment {
public:
    ThreadLoopAttachment() = default;
    ~ThreadLoopAttachment() override;

    bool attach(FrameCallback on_frame) override;
    void detach() override;
    bool is_attached() const override;

    // Blocks until the loop thread has exited.
    void join();

    // Called on the loop thread when a frame throws anything; the loop then stops.
    void set_failure_handler(std::function<void(const std::string&)> on_failure);

    uint64_t frames_delivered() const { return m_frames; }

private:
    void frame_loop();
    void stop_on_failure(const std::string& what);

    FrameCallback m_on_frame;
    std::function<void(const std::string&)> m_on_failure;
    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<uint64_t> m_frames{0};
    std::mutex m_join_mtx;
};
