#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"
#include "render.hpp"

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [--socket PATH] [--json] <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  transcribe FILE [--model ID] [--reference TEXT | --reference-file PATH]");
    std::println(stderr, "  compare REFERENCE TRANSCRIPTION       Diff two texts");
    std::println(stderr, "  models                                List available models");
    std::println(stderr, "  status                                Show daemon status");
    std::println(stderr, "  health                                Check the daemon is up");
    std::println(stderr, "  history [--limit N] [--offset N]      List saved transcriptions");
    std::println(stderr, "  show ID                               Show one saved transcription");
    std::println(stderr, "  delete ID                             Delete one saved transcription");
    std::println(stderr, "  clear                                 Delete all saved transcriptions");
}

static std::optional<int64_t> parse_int(const std::string& s) {
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

static std::optional<std::string> read_text_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return std::nullopt;
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

static void print_diff(const json& resp, bool color) {
    if (!resp.contains("display")) return;
    std::println("Diff:       {}", render::display(resp["display"], color));
    if (resp.contains("similarity")) {
        std::println("Similarity: {}%", resp["similarity"].get<int>());
    }
}

static void print_record(const json& record, bool color) {
    std::println("{}", render::record_summary(record));
    std::println("Transcription: {}", record.value("transcription", ""));
    if (record.contains("reference_text") && record["reference_text"].is_string()) {
        std::println("Reference:     {}", record["reference_text"].get<std::string>());
    }
    print_diff(record, color);
}

int main(int argc, char* argv[]) {
    std::string socket_path;
    bool raw_json = false;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--socket" && i + 1 < argc && args.empty()) {
            socket_path = argv[++i];
        } else if (arg == "--json") {
            raw_json = true;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            args.push_back(std::move(arg));
        }
    }

    if (args.empty()) {
        usage(argv[0]);
        return 1;
    }

    const std::string& command = args[0];
    json cmd;
    // Transcription replies arrive only after inference finishes.
    int timeout_ms = 30000;

    if (command == "transcribe") {
        if (args.size() < 2) {
            std::println(stderr, "transcribe: missing audio file");
            return 1;
        }
        std::error_code ec;
        auto abs = std::filesystem::absolute(args[1], ec);
        if (ec) {
            std::println(stderr, "transcribe: bad path {}: {}", args[1], ec.message());
            return 1;
        }
        cmd = {{"cmd", "transcribe"}, {"audio_path", abs.string()}};

        for (size_t i = 2; i < args.size(); i++) {
            if (args[i] == "--model" && i + 1 < args.size()) {
                cmd["model"] = args[++i];
            } else if (args[i] == "--reference" && i + 1 < args.size()) {
                cmd["reference_text"] = args[++i];
            } else if (args[i] == "--reference-file" && i + 1 < args.size()) {
                auto text = read_text_file(args[++i]);
                if (!text) {
                    std::println(stderr, "transcribe: could not read {}", args[i]);
                    return 1;
                }
                cmd["reference_text"] = *text;
            } else {
                std::println(stderr, "transcribe: unexpected argument {}", args[i]);
                return 1;
            }
        }
        timeout_ms = -1;
    } else if (command == "compare") {
        if (args.size() != 3) {
            std::println(stderr, "compare: expected REFERENCE and TRANSCRIPTION");
            return 1;
        }
        cmd = {{"cmd", "compare"}, {"reference_text", args[1]}, {"transcription", args[2]}};
    } else if (command == "models" || command == "status" || command == "health") {
        cmd = {{"cmd", command}};
    } else if (command == "history") {
        cmd = {{"cmd", "history"}};
        for (size_t i = 1; i < args.size(); i++) {
            std::optional<int64_t> v;
            if ((args[i] == "--limit" || args[i] == "--offset") && i + 1 < args.size()) {
                v = parse_int(args[i + 1]);
            }
            if (!v) {
                std::println(stderr, "history: expected --limit N or --offset N");
                return 1;
            }
            cmd[args[i].substr(2)] = *v;
            i++;
        }
    } else if (command == "show" || command == "delete") {
        auto id = args.size() == 2 ? parse_int(args[1]) : std::nullopt;
        if (!id) {
            std::println(stderr, "{}: expected a record ID", command);
            return 1;
        }
        cmd = {{"cmd", command == "show" ? "history_get" : "history_delete"}, {"id", *id}};
    } else if (command == "clear") {
        cmd = {{"cmd", "history_clear"}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    if (socket_path.empty()) socket_path = platform::ipc_endpoint();

    if (!client.connect(socket_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", socket_path);
        std::println(stderr, "Is voxdiffd running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    if (!client.recv(response, timeout_ms)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    if (raw_json) {
        std::println("{}", response.dump(2, ' ', false, json::error_handler_t::replace));
        return response.value("status", "") == "ok" ? 0 : 1;
    }

    if (response.value("status", "") != "ok") {
        std::println(stderr, "Error: {}", render::error_line(response));
        return 1;
    }

    bool color = ::isatty(STDOUT_FILENO) != 0;

    if (command == "transcribe") {
        std::println("{}", response.value("transcription", ""));
        std::println(stderr, "[{} | {:.1f}s audio | {:.1f}s processing | {} chunks]",
                     response.value("model_used", "?"),
                     response.value("audio_duration", 0.0),
                     response.value("duration", 0.0),
                     response.value("chunks", 0));
        print_diff(response, color);
    } else if (command == "compare") {
        print_diff(response, color);
    } else if (command == "models") {
        auto resident = response.value("resident", json(nullptr));
        for (const auto& m : response["models"]) {
            auto id = m.value("id", "");
            std::println("{}{} {:<20} [{}] {}",
                         id == response.value("default", "") ? "*" : " ",
                         resident.is_string() && resident.get<std::string>() == id ? "+" : " ",
                         id, m.value("category", ""), m.value("description", ""));
        }
    } else if (command == "status") {
        std::println("State:    {}", response.value("state", "unknown"));
        std::println("Queued:   {}", response.value("queued", 0));
        auto resident = response.value("resident", json(nullptr));
        std::println("Resident: {}", resident.is_string() ? resident.get<std::string>() : "none");
        std::println("History:  {}", response.value("history", false) ? "enabled" : "disabled");
    } else if (command == "history") {
        std::println("{} records", response.value("total", 0));
        for (const auto& record : response["records"]) {
            std::println("{}", render::record_summary(record));
            std::println("  {}", record.value("transcription", ""));
        }
    } else if (command == "show") {
        print_record(response["record"], color);
    } else if (command == "clear") {
        std::println("Deleted {} records", response.value("count", 0));
    } else {
        std::println("OK");
    }

    return 0;
}
