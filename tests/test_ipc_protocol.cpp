#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;

namespace {

std::string tmp_socket_path() {
    return "/tmp/vd_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// The server socket is non-blocking, so poll until `count` commands arrived.
std::vector<json> read_until(UnixSocketServer& server, int fd, size_t count) {
    std::vector<json> cmds;
    for (int i = 0; i < 200 && cmds.size() < count; ++i) {
        if (!server.read_commands(fd, cmds)) break;
        if (cmds.size() < count) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return cmds;
}

} // namespace

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(std::filesystem::exists(sock_path));
        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("PathTooLong") {
        UnixSocketServer server;
        REQUIRE_FALSE(server.start("/tmp/" + std::string(200, 'x') + ".sock"));
        REQUIRE(server.server_fd() < 0);
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"cmd", "status"}}));

        auto cmds = read_until(server, client_fd, 1);
        REQUIRE(cmds.size() == 1);
        REQUIRE(cmds[0]["cmd"] == "status");

        REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"state", "idle"}}));

        json resp;
        REQUIRE(client.recv(resp, 1000));
        REQUIRE(resp["state"] == "idle");

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("InvalidUtf8IsReplaced") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(server.send_response(client_fd, {{"status", "error"}, {"message", "HTTP 502: bad \xff gateway"}}));

        json resp;
        REQUIRE(client.recv(resp, 1000));
        REQUIRE(resp["status"] == "error");
        REQUIRE(resp["message"] == "HTTP 502: bad \xEF\xBF\xBD gateway");

        server.close_client(client_fd);
        client.close();
        server.stop();
    }

    SECTION("PipelinedRequests") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        for (int i = 0; i < 5; ++i) {
            REQUIRE(client.send({{"cmd", "health"}, {"seq", i}}));
        }

        auto cmds = read_until(server, client_fd, 5);
        REQUIRE(cmds.size() == 5);
        for (int i = 0; i < 5; ++i) {
            REQUIRE(cmds[i]["seq"] == i);
        }

        // Replies written back to back come out one per recv
        for (int i = 0; i < 5; ++i) {
            REQUIRE(server.send_response(client_fd, {{"seq", i}}));
        }
        for (int i = 0; i < 5; ++i) {
            json resp;
            REQUIRE(client.recv(resp, 1000));
            REQUIRE(resp["seq"] == i);
        }
    }

    SECTION("MalformedLineIsDiscarded") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int raw = ::socket(AF_UNIX, SOCK_STREAM, 0);
        REQUIRE(raw >= 0);
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
        REQUIRE(::connect(raw, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        std::string payload = "not json\n\n{\"cmd\":\"health\"}\r\n";
        REQUIRE(::send(raw, payload.data(), payload.size(), 0) == static_cast<ssize_t>(payload.size()));

        auto cmds = read_until(server, client_fd, 2);
        REQUIRE(cmds.size() == 2);
        REQUIRE(cmds[0].is_discarded());
        REQUIRE(cmds[1]["cmd"] == "health");

        ::close(raw);
    }

    SECTION("OversizedLineDropsClient") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        std::jthread sender([&client] {
            // The send fails once the server hangs up; either outcome is fine.
            (void)client.send({{"cmd", "compare"},
                               {"reference_text", std::string(UnixSocketServer::MAX_LINE_BYTES * 2, 'a')}});
        });

        std::vector<json> cmds;
        bool alive = true;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (alive && std::chrono::steady_clock::now() < deadline) {
            alive = server.read_commands(client_fd, cmds);
        }
        REQUIRE_FALSE(alive);
        REQUIRE(cmds.empty());

        server.close_client(client_fd);
        sender.join();
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        client.close();

        // Server should detect disconnect (read returns false)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        std::vector<json> cmds;
        REQUIRE_FALSE(server.read_commands(client_fd, cmds));

        server.close_client(client_fd);
        server.stop();
    }

    SECTION("ClientTimeout") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        json resp;
        REQUIRE_FALSE(client.recv(resp, 10));
    }

    SECTION("ConnectWithoutServer") {
        UnixSocketClient client;
        REQUIRE_FALSE(client.connect("/tmp/vd_test_nobody_listens.sock"));
        REQUIRE_FALSE(client.send({{"cmd", "health"}}));
    }
}
