#include "core/cadence_controller.h"
#include "core/pacer_commands.h"
#include "core/pacer_config.h"
#include "core/precision_sleep.h"
#include "core/precision_waiter.h"
#include "core/tick_clock.h"
#include "communication/console_server.h"
#include "host/asio_frame_attachment.h"
#include "host/thread_loop_attachment.h"

#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>

int main(int argc, char** argv) {
    std::string config_file = (argc > 1) ? argv[1] : "pacer.yaml";

    PacerConfig cfg;
    try {
        cfg = load_pacer_config_yaml(config_file);
    } catch (const std::exception& e) {
        std::cerr << "[MAIN] Config " << config_file << " unusable (" << e.what()
                  << ") -> defaults" << std::endl;
        cfg = PacerConfig();
    }

    SteadyTickClock clock;
    std::unique_ptr<PrecisionSleep> sleeper = make_precision_sleep(cfg.sleep);
    PrecisionWaiter waiter(clock, *sleeper, cfg.spin_threshold_ns);
    CadenceController controller(clock, waiter);
    controller.set_stats_log_interval(cfg.stats_log_interval);

    std::cout << "[MAIN] Sleep = " << sleeper->name()
              << ", spin threshold = " << waiter.get_spin_threshold_ns() << "ns"
              << ", driver = " << host_driver_to_string(cfg.driver) << std::endl;

    DiagnosticCommands commands;
    if (!register_pacer_commands(commands, controller)) {
        std::cerr << "[MAIN] Failed to register diagnostic commands." << std::endl;
        return 1;
    }

    std::unique_ptr<ConsoleServer> console;
    if (cfg.console_enabled) {
        console = std::make_unique<ConsoleServer>(commands, controller,
                                                  cfg.console_receive_port,
                                                  cfg.console_reply_ip,
                                                  cfg.console_reply_port);
        if (!console->start()) {
            std::cerr << "[MAIN] Continuing without remote console." << std::endl;
            console.reset();
        }
    }

    // Demo workload: count frames, report the measured rate on the status timer.
    std::atomic<uint64_t> frames{0};
    controller.set_callback([&frames]() { ++frames; });

    boost::asio::io_context io;
    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    boost::asio::steady_timer session_timer(io);
    boost::asio::steady_timer status_timer(io);

    bool session_over = false;
    auto end_session = [&](const std::string& reason) {
        if (session_over) return;
        session_over = true;
        std::cout << "[MAIN] Session end: " << reason << std::endl;
        controller.shutdown();
        signals.cancel();
        session_timer.cancel();
        status_timer.cancel();
    };

    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        end_session("signal " + std::to_string(signo));
    });

    if (cfg.session_seconds > 0) {
        session_timer.expires_after(std::chrono::seconds(cfg.session_seconds));
        session_timer.async_wait([&](const boost::system::error_code& ec) {
            if (ec) return;
            end_session("session time elapsed");
        });
    }

    uint64_t last_frames = 0;
    auto last_report = std::chrono::steady_clock::now();
    std::function<void()> arm_status_timer = [&]() {
        if (cfg.status_interval_ms <= 0) return;
        status_timer.expires_after(std::chrono::milliseconds(cfg.status_interval_ms));
        status_timer.async_wait([&](const boost::system::error_code& ec) {
            if (ec) return;
            auto now = std::chrono::steady_clock::now();
            double seconds = std::chrono::duration<double>(now - last_report).count();
            uint64_t current = frames.load();
            std::cout << "[MAIN] measured " << std::fixed << std::setprecision(2)
                      << (seconds > 0.0 ? static_cast<double>(current - last_frames) / seconds : 0.0)
                      << " Hz (target " << format_refresh_rate(controller.get_target()) << ")"
                      << std::endl;
            last_frames = current;
            last_report = now;
            if (console) console->send_status_update();
            arm_status_timer();
        });
    };
    arm_status_timer();

    AsioFrameAttachment asio_frames(io);
    ThreadLoopAttachment thread_frames;
    thread_frames.set_failure_handler([&](const std::string& what) {
        boost::asio::post(io, [&end_session, what]() { end_session("frame failure: " + what); });
    });
    SchedulerAttachment& frame_source = (cfg.driver == HostDriver::THREAD)
        ? static_cast<SchedulerAttachment&>(thread_frames)
        : static_cast<SchedulerAttachment&>(asio_frames);

    if (!controller.initialize(frame_source, cfg.refresh_rate)) {
        std::cerr << "[MAIN] Failed to attach pacer." << std::endl;
        return 1;
    }

    int exit_code = 0;
    try {
        io.run();
    } catch (const std::exception& e) {
        // Paced work failed on the io_context driver.
        std::cerr << "[MAIN] Frame failed: " << e.what() << std::endl;
        end_session("frame failure");
        exit_code = 1;
    }

    controller.shutdown();
    thread_frames.join();
    if (console) console->stop();

    std::cout << "[MAIN] " << run_pacer_status_command(controller) << std::endl;
    return exit_code;
}
