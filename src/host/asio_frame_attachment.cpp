// src/host/asio_frame_attachment.cpp
#include "asio_frame_attachment.h"
#include <iostream>

AsioFrameAttachment::AsioFrameAttachment(boost::asio::io_context& io)
    : m_io(io) {}

bool AsioFrameAttachment::attach(FrameCallback on_frame) {
    if (m_attached) {
        std::cerr << "[HOST] io_context frame source already attached." << std::endl;
        return false;
    }
    if (!on_frame) {
        return false;
    }
    m_on_frame = std::move(on_frame);
    m_attached = true;
    post_frame(++m_generation);
    return true;
}

void AsioFrameAttachment::detach() {
    if (m_attached.exchange(false)) {
        std::cout << "[HOST] io_context frame source detached after "
                  << m_frames << " frames." << std::endl;
    }
}

bool AsioFrameAttachment::is_attached() const {
    return m_attached;
}

void AsioFrameAttachment::post_frame(uint64_t generation) {
    // Frame exceptions leave through io_context::run() to the host.
    boost::asio::post(m_io, [this, generation]() {
        if (!m_attached || m_generation != generation) {
            return;
        }
        m_on_frame();
        ++m_frames;
        if (m_attached && m_generation == generation) {
            post_frame(generation);
        }
    });
}
