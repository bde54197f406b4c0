// Basic JsonPipe usage example
// Compile: g++ -std=c++23 -I../include basic_usage.cpp -lfmt -o basic_usage

#include <JsonPipe/jsonpipe.hpp>
#include <iostream>
#include <memory>
#include <string>

using namespace JsonPipe;

int main() {
    const char* json = R"({
        "app_name": "MyApp",
        "servers": [
            {"host": "alpha", "port": 8080, "enabled": true},
            {"host": "beta",  "port": 8081, "enabled": false},
            {"host": "gamma", "port": 8082, "enabled": true}
        ]
    })";

    // Whole document
    auto doc = Parse(json);
    if (!doc) {
        std::cout << "Parse error: " << FailureToString(doc.failure()) << std::endl;
        return 1;
    }
    std::cout << "App: " << doc.value().find("app_name")->as_string() << std::endl;

    // Only the subtree under a path, assembled while the input streams in
    auto hosts = PickValues(std::make_unique<StringSource>(json, 16), "servers");
    if (!hosts) {
        std::cout << "Pick error: " << FailureToString(hosts.failure()) << std::endl;
        return 1;
    }
    std::cout << "Servers: " << Serialize(hosts.values()[0]) << std::endl;

    // Array elements a page at a time, skipping disabled servers
    PaginatorOptions opts;
    opts.pageSize = 1;
    opts.dataPath = "servers";
    opts.filter = [](const Value& v) { return v.find("enabled")->as_bool(); };
    Paginator pages([json] { return std::make_unique<StringSource>(json, 16); }, opts);
    for (std::size_t n = 0;; ++n) {
        auto page = pages.page(n);
        if (!page) {
            std::cout << "Page error: " << FailureToString(page.failure()) << std::endl;
            return 1;
        }
        for (const Value& server : page.page().items) {
            std::cout << "Page " << n << ": " << server.find("host")->as_string()
                      << ":" << server.find("port")->as_number() << std::endl;
        }
        if (!page.page().hasMore) break;
    }

    return 0;
}
