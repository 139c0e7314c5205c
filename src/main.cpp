#include "cli/cli.hpp"
#include "client/synonym_client.hpp"
#include "config/server_config.hpp"
#include "index/synonym_index.hpp"
#include "server/http_server.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

using namespace syn;

// ============== Helper Functions ==============

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_signal(int) {
    g_stop_requested.store(true);
}

SynonymClient make_client(const Args& args) {
    ServerConfig config = resolve_config(args);
    return SynonymClient(config.client_base_url, config.client_timeout_seconds);
}

std::string join(const std::set<std::string>& words) {
    std::string out;
    for (const auto& w : words) {
        if (!out.empty()) out += ", ";
        out += w;
    }
    return out;
}

} // anonymous namespace

// ============== syn serve ==============
int cmd_serve(const Args& args) {
    ServerConfig config = resolve_config(args);

    SynonymIndex index;
    HttpServer server(index, config);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    server.start();
    std::cout << "Synonym server ready on port " << server.port() << " (Ctrl+C to stop)\n";

    while (!g_stop_requested.load() && server.running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "Shutting down...\n";
    server.stop();

    auto stats = index.compute_statistics();
    std::cout << "Served " << server.requests_served() << " requests, "
              << stats.num_words << " words in " << stats.num_groups << " groups\n";
    return 0;
}

// ============== syn add ==============
int cmd_add(const Args& args) {
    auto words = args.get("words").as_list();
    for (const auto& p : args.positional) {
        words.push_back(p);
    }

    SynonymClient client = make_client(args);
    client.add(words);

    std::cout << "Added " << words.size() << " words as synonyms\n";
    return 0;
}

// ============== syn get ==============
int cmd_get(const Args& args) {
    std::string word = args.require("word");

    SynonymClient client = make_client(args);
    auto synonyms = client.get(word);

    if (synonyms.empty()) {
        std::cout << "No synonyms for '" << word << "'\n";
        return 0;
    }

    std::cout << "Synonyms of '" << word << "' (" << synonyms.size() << "):\n";
    for (const auto& s : synonyms) {
        std::cout << "  " << s << "\n";
    }
    return 0;
}

// ============== syn all ==============
int cmd_all(const Args& args) {
    SynonymClient client = make_client(args);
    auto groups = client.get_all();

    if (args.has("json")) {
        std::cout << nlohmann::json(groups).dump(2) << "\n";
        return 0;
    }

    std::cout << groups.size() << " synonym groups\n";
    for (size_t i = 0; i < groups.size(); ++i) {
        std::cout << "  [" << (i + 1) << "] " << join(groups[i]) << "\n";
    }
    return 0;
}

// ============== syn stats ==============
int cmd_stats(const Args& args) {
    SynonymClient client = make_client(args);
    auto stats = client.statistics();

    std::cout << "Words:          " << stats.value("num_words", 0) << "\n";
    std::cout << "Groups:         " << stats.value("num_groups", 0) << "\n";
    std::cout << "Largest group:  " << stats.value("largest_group", 0) << "\n";
    return 0;
}

// ============== syn clear ==============
int cmd_clear(const Args& args) {
    SynonymClient client = make_client(args);
    client.clear();
    std::cout << "Dictionary cleared\n";
    return 0;
}

// ============== syn config ==============
int cmd_config(const Args& args) {
    std::string output = args.require("output");
    ServerConfig config = resolve_config(args);
    config.to_json_file(output);
    std::cout << "Saved configuration to: " << output << "\n";
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("syn", "1.0.0");

    cli.add_global_option({"config", 'c', "Path to JSON config file"});
    cli.add_global_option({"server", 's', "Server base URL (default: config or SYN_SERVER_URL)"});

    // syn serve
    cli.register_command({
        "serve",
        "Run the synonym HTTP server",
        {
            {"host", 'H', "Address to bind (default: 0.0.0.0)"},
            {"port", 'p', "Port to listen on (default: 8080)"},
            {"workers", 'w', "Number of worker threads (default: 8)"},
            {"quiet", 'q', "Do not log requests", false, true}
        },
        cmd_serve
    });

    // syn add
    cli.register_command({
        "add",
        "Add words as synonyms of each other (each word is linked to the next)",
        {
            {"words", 'w', "Comma-separated words, e.g. big,large,huge", false, false, true}
        },
        cmd_add,
        true
    });

    // syn get
    cli.register_command({
        "get",
        "Print the synonyms of a word",
        {
            {"word", 'w', "Word to look up", true}
        },
        cmd_get
    });

    // syn all
    cli.register_command({
        "all",
        "Print every synonym group",
        {
            {"json", 'j', "Print as JSON", false, true}
        },
        cmd_all
    });

    cli.register_command({"stats", "Print dictionary statistics", {}, cmd_stats});
    cli.register_command({"clear", "Remove every synonym from the dictionary", {}, cmd_clear});

    // syn config
    cli.register_command({
        "config",
        "Write the effective configuration to a JSON file",
        {
            {"output", 'o', "Output JSON file", true}
        },
        cmd_config
    });

    return cli.run(argc, argv);
}
