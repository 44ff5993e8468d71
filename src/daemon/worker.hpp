#pragma once

#include "alignment/alignment.hpp"
#include "errors.hpp"
#include "orchestrator.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct TranscriptionJob {
    uint64_t ticket = 0;
    std::string audio_path;
    std::string model;
    std::optional<std::string> reference_text;
};

struct JobResult {
    TranscriptionResult transcription;
    double source_duration_s = 0.0;
    std::optional<std::vector<DiffSegment>> diff;
};

struct CompletedJob {
    TranscriptionJob job;
    std::expected<JobResult, Error> result;
};

// Runs transcription jobs one at a time, in submission order, on a single
// background thread. Results are collected until the owner drains them after
// the notify callback fires. A handler that throws completes its job with an
// Internal error.
class TranscriptionWorker {
public:
    using Handler = std::function<std::expected<JobResult, Error>(const TranscriptionJob&)>;
    using NotifyCallback = std::function<void()>;

    TranscriptionWorker(Handler handler, NotifyCallback notify, size_t max_queue);
    ~TranscriptionWorker();

    TranscriptionWorker(const TranscriptionWorker&) = delete;
    TranscriptionWorker& operator=(const TranscriptionWorker&) = delete;

    // False when the queue is full or the worker is stopped.
    bool submit(TranscriptionJob job);

    std::vector<CompletedJob> take_completed();

    size_t queued() const;
    bool busy() const;

    // Lets the running job finish; queued jobs complete with an error.
    void stop();

private:
    void run(std::stop_token st);

    Handler handler_;
    NotifyCallback notify_;
    size_t max_queue_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<TranscriptionJob> queue_;
    std::vector<CompletedJob> completed_;
    bool busy_ = false;
    bool stopped_ = false;

    std::jthread thread_;
};
