#pragma once

#include "asr/model_slot.hpp"
#include "config.hpp"
#include "orchestrator.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "service_core.hpp"
#include "storage/history_db.hpp"
#include "text/script_converter.hpp"

#include <atomic>
#include <signal.h>
#include <memory>
#include <vector>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void handle_client(int fd);
    void drop_client(int fd);

    void log(const std::string& msg);

    // Blocked before any member starts a thread so the worker inherits the mask.
    sigset_t signal_mask_;
    Config config_;
    bool verbose_;

    // Declaration order is construction order: core_ borrows everything above it.
    bool script_ready_ = false; // set while constructing converter_
    std::unique_ptr<ScriptConverter> converter_;
    ModelSlot slot_;
    TranscriptionOrchestrator orchestrator_;
    HistoryDb history_db_;
    UnixSocketServer ipc_server_;

    ServiceCore core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;

    std::atomic<bool> running_{false};
};
