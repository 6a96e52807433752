// src/host/asio_frame_attachment.h
#pragma once

#include <atomic>
#include <cstdint>
#include <boost/asio.hpp>
#include "../core/scheduler_attachment.h"

// Posts one frame at a time onto an io_context; each frame re-posts the next
// one, so timers and signals on the same context run between frames.
class AsioFrameAttachment : public SchedulerAttachment {
public:
    explicit AsioFrameAttachment(boost::asio::io_context& io);

    bool attach(FrameCallback on_frame) override;
    void detach() override;
    bool is_attached() const override;

    uint64_t frames_delivered() const { return m_frames; }

private:
    void post_frame(uint64_t generation);

    boost::asio::io_context& m_io;
    FrameCallback m_on_frame;
    std::atomic<bool> m_attached{false};
    std::atomic<uint64_t> m_generation{0};
    std::atomic<uint64_t> m_frames{0};
};
