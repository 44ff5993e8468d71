#include "platform/linux/linux_event_loop.hpp"

#include "asr/server_backend.hpp"
#include "logging.hpp"
#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <pthread.h>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace {

sigset_t block_shutdown_signals() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &mask, nullptr);
    return mask;
}

// An empty dictionary list means no conversion is wanted.
std::unique_ptr<ScriptConverter> make_converter(const std::vector<std::string>& paths,
                                                bool& ready) {
    if (paths.empty()) {
        ready = true;
        return std::make_unique<IdentityConverter>();
    }

    auto conv = std::make_unique<DictionaryConverter>();
    ready = true;
    for (const auto& path : paths) {
        auto res = conv->load(path);
        if (!res) {
            log_error("script", res.error());
            ready = false;
        }
    }
    if (!ready) {
        log_error("script", std::format("copy STPhrases.txt and STCharacters.txt from OpenCC's "
                                        "data/dictionary into {} or set script.dictionaries",
                                        platform::dictionary_dir()));
    }
    return conv;
}

// Post-processing models are unusable without their conversion tables.
std::vector<ModelSpec> usable_models(const std::vector<ModelSpec>& models, bool script_ready) {
    std::vector<ModelSpec> out;
    for (const auto& spec : models) {
        if (!script_ready && spec.category == BackendCategory::ManualPostProcess) {
            log_error("script", std::format("disabling model {}: conversion dictionaries unavailable",
                                            spec.id));
            continue;
        }
        out.push_back(spec);
    }
    return out;
}

} // namespace

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : signal_mask_(block_shutdown_signals()), config_(std::move(config)), verbose_(verbose),
      converter_(make_converter(config_.script.dictionaries, script_ready_)),
      slot_(usable_models(config_.models, script_ready_),
            [](const ModelSpec& spec) -> std::unique_ptr<ModelBackend> {
                return std::make_unique<ServerBackend>(spec);
            },
            verbose_),
      orchestrator_(slot_, *converter_, config_.audio.max_chunk_samples()),
      core_(config_, verbose_, slot_, orchestrator_, history_db_,
            // ResponseSink
            [this](int client_fd, const nlohmann::json& response) {
                if (!ipc_server_.send_response(client_fd, response)) {
                    log(std::format("Failed to deliver reply to client {}", client_fd));
                }
            },
            // NotifyCallback
            [this]() {
                uint64_t val = 1;
                if (::write(worker_event_fd_, &val, sizeof(val)) < 0) {
                    log_error("loop", std::format("eventfd write failed: {}", std::strerror(errno)));
                }
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
}

bool LinuxEventLoop::init() {
    // History DB (optional)
    if (config_.history.enabled) {
        auto db_path = config_.history.path;
        if (db_path.empty() && !platform::data_dir().empty()) {
            db_path = platform::data_dir() + "/history.db";
        }
        if (db_path.empty() || !history_db_.open(db_path)) {
            log_error("db", "history DB failed to open, history disabled");
        } else {
            log("History at " + db_path);
        }
    }

    // Worker notification eventfd; must exist before any job can be queued
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        log_error("loop", std::format("eventfd failed: {}", std::strerror(errno)));
        return false;
    }

    // IPC socket
    auto ipc_path = config_.server.socket_path;
    if (ipc_path.empty()) ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        log_error("loop", std::format("epoll_create1 failed: {}", std::strerror(errno)));
        return false;
    }

    signal_fd_ = signalfd(-1, &signal_mask_, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        log_error("loop", std::format("signalfd failed: {}", std::strerror(errno)));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) ||
        !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(worker_event_fd_, EPOLLIN)) {
        log_error("loop", std::format("epoll_ctl failed: {}", std::strerror(errno)));
        return false;
    }

    log(std::format("{} models available, default {}",
                    slot_.catalog().size(), config_.default_model));

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            log_error("loop", std::format("epoll_wait error: {}", std::strerror(errno)));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log(std::format("Received signal {}, shutting down", info.ssi_signo));
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                if (::read(worker_event_fd_, &val, sizeof(val)) > 0) {
                    core_.on_jobs_complete();
                }
                continue;
            }

            handle_client(fd);
        }
    }

    // Clean shutdown
    core_.shutdown();
}

void LinuxEventLoop::handle_client(int fd) {
    std::vector<nlohmann::json> cmds;
    bool alive = ipc_server_.read_commands(fd, cmds);

    for (const auto& cmd : cmds) {
        auto response = core_.handle_command(fd, cmd);
        if (response) {
            ipc_server_.send_response(fd, *response);
        }
    }

    if (!alive) drop_client(fd);
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    ipc_server_.close_client(fd);
    core_.client_disconnected(fd);
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    log_info(verbose_, msg);
}
