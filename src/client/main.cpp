#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  status                              Show daemon status");
    std::println(stderr, "  get [--format json|text]            Show current clipboard content");
    std::println(stderr, "  paste                               Print clipboard text, or staged path of an image");
    std::println(stderr, "  set TEXT | set --file PATH          Replace clipboard content");
    std::println(stderr, "  stage --text TEXT | stage PATH [--kind txt|png|jpeg]");
    std::println(stderr, "                                      Stage content and print its path");
    std::println(stderr, "  root                                Print the staging directory");
    std::println(stderr, "  history [--limit N]                 Show recently staged clips");
}

static std::string absolute_path(const std::string& path) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(path, ec);
    return ec ? path : abs.string();
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string format = "text";
    std::string text;
    std::string file;
    std::string kind;
    bool has_text = false;
    int limit = 10;
    std::vector<std::string> positional;

    // Parse optional args
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--format" && i + 1 < argc) {
            format = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (arg == "--file" && i + 1 < argc) {
            file = argv[++i];
        } else if (arg == "--text" && i + 1 < argc) {
            text = argv[++i];
            has_text = true;
        } else if (arg == "--kind" && i + 1 < argc) {
            kind = argv[++i];
        } else {
            positional.push_back(arg);
        }
    }

    // Build command JSON
    json cmd;
    if (command == "status" || command == "get" || command == "paste" || command == "root") {
        cmd = {{"cmd", command}};
    } else if (command == "set") {
        cmd = {{"cmd", "set"}};
        if (!file.empty()) {
            cmd["file"] = absolute_path(file);
        } else if (has_text) {
            cmd["text"] = text;
        } else if (positional.size() == 1) {
            cmd["text"] = positional[0];
        } else {
            std::println(stderr, "set needs TEXT or --file PATH");
            return 1;
        }
    } else if (command == "stage") {
        cmd = {{"cmd", "stage"}};
        if (has_text) {
            cmd["text"] = text;
        } else if (!file.empty() || positional.size() == 1) {
            cmd["file"] = absolute_path(!file.empty() ? file : positional[0]);
            if (!kind.empty()) cmd["kind"] = kind;
        } else {
            std::println(stderr, "stage needs --text TEXT or a file path");
            return 1;
        }
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", limit}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is clipstaged running?");
        return 1;
    }

    auto reply = client.request(cmd);
    if (!reply) {
        std::println(stderr, "{}", reply.error());
        return 1;
    }
    const json& response = *reply;

    // Display response
    auto status = response.value("status", "");
    if (status != "ok") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (command == "status") {
        std::println("Watching: {}", response.value("watching", false) ? "yes" : "no");
        if (response.contains("tasks")) {
            for (auto& [name, state] : response["tasks"].items()) {
                std::println("  {}: {}", name, state.get<std::string>());
            }
        }
        std::println("Strategy: {}", response.value("strategy", ""));
        std::println("Staging root: {} ({} indexed)", response.value("staging_root", ""),
                     response.value("index_size", 0));
        std::println("Alias directory: {}", response.value("alias_dir", ""));
    } else if (command == "get") {
        if (format == "json") {
            std::println("{}", response.dump(2, ' ', false, json::error_handler_t::replace));
        } else if (response.contains("data")) {
            std::print("{}", response["data"].get<std::string>());
            if (response.value("truncated", false)) {
                std::println(stderr, "\n[truncated, full text in {}]", response.value("file", "?"));
            }
        } else {
            std::println("{} {}x{} {} bytes: {}", response.value("type", ""),
                         response.value("width", 0), response.value("height", 0),
                         response.value("size", 0), response.value("file", ""));
        }
    } else if (command == "paste") {
        if (response.contains("text")) {
            std::print("{}", response["text"].get<std::string>());
        } else {
            std::println("{}", response.value("path", ""));
        }
    } else if (command == "stage") {
        std::println("{}", response["artifact"].value("path", ""));
    } else if (command == "root") {
        std::println("{}", response.value("path", ""));
    } else if (command == "history") {
        if (response.contains("entries")) {
            for (auto& entry : response["entries"]) {
                std::println("[{}] {} {} ({} bytes)", entry.value("timestamp", ""),
                             entry.value("action", ""), entry.value("staged_path", ""),
                             entry.value("size", 0));
                if (entry.contains("alias_path") && !entry["alias_path"].get<std::string>().empty()) {
                    std::println("  Alias: {}", entry["alias_path"].get<std::string>());
                }
            }
        }
    } else {
        std::println("OK");
    }

    return 0;
}
