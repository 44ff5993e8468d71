#include "worker.hpp"

#include <exception>
#include <format>
#include <utility>

TranscriptionWorker::TranscriptionWorker(Handler handler, NotifyCallback notify, size_t max_queue)
    : handler_(std::move(handler)), notify_(std::move(notify)), max_queue_(max_queue) {
    thread_ = std::jthread([this](std::stop_token st) { run(st); });
}

TranscriptionWorker::~TranscriptionWorker() {
    stop();
}

bool TranscriptionWorker::submit(TranscriptionJob job) {
    {
        std::lock_guard lock(mutex_);
        if (stopped_ || queue_.size() >= max_queue_) return false;
        queue_.push_back(std::move(job));
    }
    cv_.notify_one();
    return true;
}

std::vector<CompletedJob> TranscriptionWorker::take_completed() {
    std::lock_guard lock(mutex_);
    return std::exchange(completed_, {});
}

size_t TranscriptionWorker::queued() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

bool TranscriptionWorker::busy() const {
    std::lock_guard lock(mutex_);
    return busy_;
}

void TranscriptionWorker::stop() {
    {
        std::lock_guard lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
    }

    thread_.request_stop();
    if (thread_.joinable()) {
        thread_.join();
    }

    bool dropped = false;
    {
        std::lock_guard lock(mutex_);
        while (!queue_.empty()) {
            completed_.push_back({
                .job = std::move(queue_.front()),
                .result = std::unexpected(Error{ErrorKind::BackendUnavailable, "daemon shutting down"}),
            });
            queue_.pop_front();
            dropped = true;
        }
    }
    if (dropped) notify_();
}

void TranscriptionWorker::run(std::stop_token st) {
    while (true) {
        TranscriptionJob job;
        {
            std::unique_lock lock(mutex_);
            bool ready = cv_.wait(lock, st, [this] { return !queue_.empty(); });
            if (!ready || st.stop_requested()) {
                return; // queued jobs are failed by stop()
            }
            job = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        auto result = [&]() -> std::expected<JobResult, Error> {
            try {
                return handler_(job);
            } catch (const std::exception& e) {
                return std::unexpected(Error{ErrorKind::Internal, std::format("job failed: {}", e.what())});
            }
        }();

        {
            std::lock_guard lock(mutex_);
            completed_.push_back({.job = std::move(job), .result = std::move(result)});
            busy_ = false;
        }

        // Notify owner thread
        notify_();
    }
}
