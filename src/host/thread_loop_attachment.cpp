// src/host/thread_loop_attachment.cpp
#include "thread_loop_attachment.h"
#include <exception>
#include <iostream>

namespace {
// Set on the loop thread so detach() from inside a frame never joins itself.
thread_local const ThreadLoopAttachment* t_current_loop = nullptr;
}

ThreadLoopAttachment::~ThreadLoopAttachment() {
    detach();
    join();
}

bool ThreadLoopAttachment::attach(FrameCallback on_frame) {
    std::lock_guard<std::mutex> lock(m_join_mtx);
    if (m_running || m_thread.joinable()) {
        std::cerr << "[HOST] Frame loop already running." << std::endl;
        return false;
    }
    if (!on_frame) {
        return false;
    }

    m_on_frame = std::move(on_frame);
    m_running = true;
    m_thread = std::thread(&ThreadLoopAttachment::frame_loop, this);
    std::cout << "[HOST] Frame loop thread started." << std::endl;
    return true;
}

void ThreadLoopAttachment::detach() {
    // The loop checks the flag between frames, so detaching from inside a
    // frame just lets the thread run out.
    m_running = false;
    if (t_current_loop != this) {
        join();
    }
}

void ThreadLoopAttachment::set_failure_handler(std::function<void(const std::string&)> on_failure) {
    std::lock_guard<std::mutex> lock(m_join_mtx);
    m_on_failure = std::move(on_failure);
}

bool ThreadLoopAttachment::is_attached() const {
    return m_running;
}

void ThreadLoopAttachment::join() {
    if (t_current_loop == this) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_join_mtx);
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void ThreadLoopAttachment::frame_loop() {
    t_current_loop = this;
    while (m_running) {
        try {
            m_on_frame();
        } catch (const std::exception& e) {
            // No thread above us to propagate to: stop delivering frames.
            stop_on_failure(e.what());
            break;
        } catch (...) {
            stop_on_failure("unknown exception");
            break;
        }
        ++m_frames;
    }
    std::cout << "[HOST] Frame loop thread exited after " << m_frames << " frames." << std::endl;
    t_current_loop = nullptr;
}

void ThreadLoopAttachment::stop_on_failure(const std::string& what) {
    std::cerr << "[HOST] Frame callback failed: " << what
              << ". Stopping frame loop." << std::endl;
    m_running = false;
    if (m_on_failure) {
        m_on_failure(what);
    }
}
