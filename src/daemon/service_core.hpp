#pragma once

#include "asr/model_slot.hpp"
#include "config.hpp"
#include "orchestrator.hpp"
#include "storage/history_db.hpp"
#include "worker.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>

// Dispatches IPC commands. Transcriptions run on the worker; everything else,
// including history writes, happens on the calling (event loop) thread.
class ServiceCore {
public:
    using ResponseSink = std::function<void(int client_fd, const nlohmann::json&)>;
    using NotifyCallback = std::function<void()>;

    ServiceCore(Config config, bool verbose,
                ModelSlot& slot, TranscriptionOrchestrator& orchestrator,
                HistoryDb& history, ResponseSink sink, NotifyCallback notify);
    ~ServiceCore();

    ServiceCore(const ServiceCore&) = delete;
    ServiceCore& operator=(const ServiceCore&) = delete;

    // nullopt means the reply is deferred until the job completes. Exceptions
    // raised while handling become an "internal" error reply.
    std::optional<nlohmann::json> handle_command(int client_fd, const nlohmann::json& cmd);

    // Call after the notify callback fired: replies to waiting clients.
    void on_jobs_complete();

    void client_disconnected(int client_fd);

    // Stops the worker and flushes every outstanding reply.
    void shutdown();

    // Decode, transcribe and align one job. Runs on the worker thread.
    std::expected<JobResult, Error> process(const TranscriptionJob& job);

private:
    std::optional<nlohmann::json> dispatch(int client_fd, const nlohmann::json& cmd);
    nlohmann::json handle_transcribe(int client_fd, const nlohmann::json& cmd, bool& deferred);
    nlohmann::json handle_compare(const nlohmann::json& cmd);
    nlohmann::json handle_models(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_history_get(const nlohmann::json& cmd);
    nlohmann::json handle_history_delete(const nlohmann::json& cmd);
    nlohmann::json handle_history_clear(const nlohmann::json& cmd);

    nlohmann::json finish(CompletedJob& done);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    ModelSlot& slot_;
    TranscriptionOrchestrator& orchestrator_;
    HistoryDb& history_;
    ResponseSink sink_;

    uint64_t next_ticket_ = 1;
    std::unordered_map<uint64_t, int> waiting_clients_; // ticket -> client fd

    std::unique_ptr<TranscriptionWorker> worker_;
};
