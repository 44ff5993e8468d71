#include "service_core.hpp"

#include "alignment/alignment.hpp"
#include "audio/wav.hpp"
#include "logging.hpp"
#include "protocol.hpp"
#include "text/utf8.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <format>
#include <limits>

using json = nlohmann::json;

namespace {

json invalid(std::string message) {
    return protocol::error_response(Error{ErrorKind::InvalidInput, std::move(message)});
}

json diff_fields(const std::vector<DiffSegment>& segments) {
    return {
        {"diff", protocol::to_json(segments)},
        {"display", protocol::to_json(alignment::collapse_for_display(segments))},
        {"similarity", alignment::similarity(segments)},
    };
}

std::optional<int64_t> integer_field(const json& cmd, const char* field) {
    if (!cmd.contains(field) || !cmd[field].is_number_integer()) return std::nullopt;
    return cmd[field].get<int64_t>();
}

} // namespace

ServiceCore::ServiceCore(Config config, bool verbose,
                         ModelSlot& slot, TranscriptionOrchestrator& orchestrator,
                         HistoryDb& history, ResponseSink sink, NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      slot_(slot), orchestrator_(orchestrator), history_(history),
      sink_(std::move(sink)) {
    worker_ = std::make_unique<TranscriptionWorker>(
        [this](const TranscriptionJob& job) { return process(job); },
        std::move(notify), config_.server.max_queue);
}

ServiceCore::~ServiceCore() = default;

std::optional<json> ServiceCore::handle_command(int client_fd, const json& cmd) {
    try {
        return dispatch(client_fd, cmd);
    } catch (const std::exception& e) {
        log_error("core", std::format("command failed: {}", e.what()));
        return protocol::error_response(Error{ErrorKind::Internal, std::format("command failed: {}", e.what())});
    }
}

std::optional<json> ServiceCore::dispatch(int client_fd, const json& cmd) {
    if (cmd.is_discarded() || !cmd.is_object()) {
        return invalid("malformed request");
    }
    if (!cmd.contains("cmd") || !cmd["cmd"].is_string()) {
        return invalid("missing cmd");
    }

    auto cmd_str = cmd["cmd"].get<std::string>();
    if (cmd_str == "transcribe") {
        bool deferred = false;
        auto resp = handle_transcribe(client_fd, cmd, deferred);
        if (deferred) return std::nullopt;
        return resp;
    }
    if (cmd_str == "compare") return handle_compare(cmd);
    if (cmd_str == "models") return handle_models(cmd);
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "health") return json{{"status", "ok"}};
    if (cmd_str == "history") return handle_history(cmd);
    if (cmd_str == "history_get") return handle_history_get(cmd);
    if (cmd_str == "history_delete") return handle_history_delete(cmd);
    if (cmd_str == "history_clear") return handle_history_clear(cmd);
    return invalid("unknown command: " + cmd_str);
}

json ServiceCore::handle_transcribe(int client_fd, const json& cmd, bool& deferred) {
    auto path = protocol::require_string(cmd, "audio_path");
    if (!path) return protocol::error_response(path.error());

    std::string model = config_.default_model;
    if (cmd.contains("model") && !cmd["model"].is_null()) {
        auto m = protocol::require_string(cmd, "model");
        if (!m) return protocol::error_response(m.error());
        model = *m;
    }
    if (!slot_.find(model)) {
        return protocol::error_response(Error{ErrorKind::InvalidModel, "unknown model: " + model});
    }

    std::optional<std::string> reference;
    if (cmd.contains("reference_text") && !cmd["reference_text"].is_null()) {
        auto r = protocol::require_string(cmd, "reference_text");
        if (!r) return protocol::error_response(r.error());
        reference = *r;
    }

    TranscriptionJob job{
        .ticket = next_ticket_++,
        .audio_path = *path,
        .model = model,
        .reference_text = std::move(reference),
    };
    uint64_t ticket = job.ticket;

    if (!worker_->submit(std::move(job))) {
        return protocol::error_response(Error{ErrorKind::Busy, "transcription queue is full"});
    }

    waiting_clients_[ticket] = client_fd;
    log(std::format("Queued {} with {} (ticket {})", *path, model, ticket));
    deferred = true;
    return {};
}

std::expected<JobResult, Error> ServiceCore::process(const TranscriptionJob& job) {
    auto decoded = wav::decode_file(job.audio_path, SAMPLE_RATE);
    if (!decoded) {
        return std::unexpected(Error{ErrorKind::DecodeFailure, decoded.error()});
    }

    auto start = std::chrono::steady_clock::now();
    auto result = orchestrator_.transcribe(decoded->samples, job.model, start);
    if (!result) return std::unexpected(result.error());

    JobResult out{
        .transcription = std::move(*result),
        .source_duration_s = decoded->duration_s,
        .diff = std::nullopt,
    };

    if (job.reference_text && !utf8::trim(*job.reference_text).empty()) {
        auto segments = alignment::diff(utf8::trim(*job.reference_text),
                                        utf8::trim(out.transcription.text));
        if (!segments) return std::unexpected(segments.error());
        out.diff = std::move(*segments);
    }
    return out;
}

void ServiceCore::on_jobs_complete() {
    for (auto& done : worker_->take_completed()) {
        json response;
        try {
            response = finish(done);
        } catch (const std::exception& e) {
            log_error("core", std::format("finishing ticket {} failed: {}", done.job.ticket, e.what()));
            response = protocol::error_response(Error{ErrorKind::Internal, "failed to build the reply"});
        }

        auto it = waiting_clients_.find(done.job.ticket);
        if (it == waiting_clients_.end()) {
            log(std::format("Client for ticket {} went away, dropping reply", done.job.ticket));
            continue;
        }
        sink_(it->second, response);
        waiting_clients_.erase(it);
    }
}

json ServiceCore::finish(CompletedJob& done) {
    if (!done.result) {
        log(std::format("Transcription failed ({}): {}",
                        to_string(done.result.error().kind), done.result.error().message));
        return protocol::error_response(done.result.error());
    }

    auto& jr = *done.result;
    auto& tr = jr.transcription;
    log(std::format("Transcription complete: {:.1f}s processing, {} chunks, {} bytes",
                    tr.elapsed_s, tr.chunks, tr.text.size()));

    json diff = nullptr;
    if (jr.diff) diff = protocol::to_json(*jr.diff);

    std::optional<int64_t> id;
    if (history_.is_open()) {
        id = history_.insert(HistoryEntry{
            .filename = std::filesystem::path(done.job.audio_path).filename().string(),
            .model_used = tr.model_used,
            .transcription = tr.text,
            .reference_text = done.job.reference_text,
            .duration = tr.elapsed_s,
            .diff_json = jr.diff ? std::optional<std::string>(diff.dump()) : std::nullopt,
        });
        if (!id) log("History insert failed; result not saved");
    }

    json resp = {
        {"status", "ok"},
        {"transcription", tr.text},
        {"duration", tr.elapsed_s},
        {"audio_duration", jr.source_duration_s},
        {"model_used", tr.model_used},
        {"chunks", tr.chunks},
        {"diff", diff},
        {"id", id ? json(*id) : json(nullptr)},
    };
    if (jr.diff) {
        resp["display"] = protocol::to_json(alignment::collapse_for_display(*jr.diff));
        resp["similarity"] = alignment::similarity(*jr.diff);
    }
    return resp;
}

json ServiceCore::handle_compare(const json& cmd) {
    auto reference = protocol::require_string(cmd, "reference_text");
    if (!reference) return protocol::error_response(reference.error());
    auto transcription = protocol::require_string(cmd, "transcription");
    if (!transcription) return protocol::error_response(transcription.error());

    auto segments = alignment::diff(utf8::trim(*reference), utf8::trim(*transcription));
    if (!segments) return protocol::error_response(segments.error());

    json resp = diff_fields(*segments);
    resp["status"] = "ok";
    return resp;
}

json ServiceCore::handle_models(const json& /*cmd*/) {
    json models = json::array();
    for (const auto& spec : slot_.catalog()) {
        models.push_back(protocol::to_json(spec));
    }
    auto resident = slot_.resident();
    return {
        {"status", "ok"},
        {"models", models},
        {"default", config_.default_model},
        {"resident", resident ? json(*resident) : json(nullptr)},
    };
}

json ServiceCore::handle_status(const json& /*cmd*/) {
    auto resident = slot_.resident();
    return {
        {"status", "ok"},
        {"state", worker_->busy() ? "busy" : "idle"},
        {"queued", worker_->queued()},
        {"resident", resident ? json(*resident) : json(nullptr)},
        {"history", history_.is_open()},
    };
}

json ServiceCore::handle_history(const json& cmd) {
    int limit = 20;
    int offset = 0;
    if (cmd.contains("limit")) {
        auto v = integer_field(cmd, "limit");
        if (!v || *v < 1 || *v > 100) return invalid("limit must be an integer in 1..100");
        limit = static_cast<int>(*v);
    }
    if (cmd.contains("offset")) {
        auto v = integer_field(cmd, "offset");
        if (!v || *v < 0 || *v > std::numeric_limits<int>::max()) return invalid("offset must be a non-negative integer");
        offset = static_cast<int>(*v);
    }

    json records = json::array();
    for (const auto& e : history_.recent(limit, offset)) {
        records.push_back(protocol::to_json(e));
    }
    return {{"status", "ok"}, {"total", history_.count()}, {"records", records}};
}

json ServiceCore::handle_history_get(const json& cmd) {
    auto id = integer_field(cmd, "id");
    if (!id) return invalid("id must be an integer");

    auto entry = history_.get(*id);
    if (!entry) {
        return protocol::error_response(Error{ErrorKind::NotFound, "record not found"});
    }

    json record = protocol::to_json(*entry);
    if (!record["diff"].is_null()) {
        auto segments = protocol::diff_from_json(record["diff"]);
        if (segments) {
            record["display"] = protocol::to_json(alignment::collapse_for_display(*segments));
            record["similarity"] = alignment::similarity(*segments);
        }
    }
    return {{"status", "ok"}, {"record", record}};
}

json ServiceCore::handle_history_delete(const json& cmd) {
    auto id = integer_field(cmd, "id");
    if (!id) return invalid("id must be an integer");

    if (!history_.remove(*id)) {
        return protocol::error_response(Error{ErrorKind::NotFound, "record not found"});
    }
    return {{"status", "ok"}, {"deleted", true}};
}

json ServiceCore::handle_history_clear(const json& /*cmd*/) {
    auto count = history_.clear();
    return {{"status", "ok"}, {"count", count}};
}

void ServiceCore::client_disconnected(int client_fd) {
    std::erase_if(waiting_clients_, [client_fd](const auto& kv) { return kv.second == client_fd; });
}

void ServiceCore::shutdown() {
    if (worker_->busy()) {
        log("Waiting for pending transcription to complete...");
    }
    worker_->stop();
    on_jobs_complete();
}

void ServiceCore::log(const std::string& msg) {
    log_info(verbose_, msg);
}
