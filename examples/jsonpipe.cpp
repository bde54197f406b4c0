// Streams a JSON document and prints the selected values as JSON lines.

#include <charconv>
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <JsonPipe/jsonpipe.hpp>

using namespace std::literals;
using namespace JsonPipe;

namespace {

enum class Mode {
    document,
    pick,
    array
};

void PrintUsage()
{
    LogError(R"(Usage: jsonpipe <location> <flags...>
 <location>          :: file path, file:// URL, or - for stdin

 -mode <mode>        :: document *default*, pick (one value per -path match), array (paged elements)
 -path <path>        :: dot separated path, selects values (pick) or the array (array)
 -page-size <n>      :: elements per page in array mode (default 20)
 -chunk-size <n>     :: bytes per read

 -log-[level]        :: Set log level (trace, debug, info, warn *default*, error)
)");
}

std::optional<std::size_t> ParseSize(std::string_view text)
{
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

void PrintValue(const Value& v)
{
    std::cout << Serialize(v) << '\n';
}

int Fail(const Failure& failure)
{
    std::cout.flush();
    LogError("{}", FailureToString(failure));
    return 1;
}

} // namespace

int main(int argc, char* argv[])
{
    if (argc < 2) {
        PrintUsage();
        return 2;
    }

    Mode mode = Mode::document;
    std::string path;
    std::size_t page_size = 20;
    std::size_t chunk_size = DefaultChunkSize;
    for (int i = 2; i < argc; ++i) {
        if ("-mode"sv == argv[i]) {
            if (++i >= argc) { LogError("Expected mode after -mode"); return 2; }
            if ("document"sv == argv[i]) mode = Mode::document;
            else if ("pick"sv == argv[i]) mode = Mode::pick;
            else if ("array"sv == argv[i]) mode = Mode::array;
            else { LogError("Unknown mode: {}", argv[i]); PrintUsage(); return 2; }
        }
        else if ("-path"sv == argv[i]) {
            if (++i >= argc) { LogError("Expected path after -path"); return 2; }
            path = argv[i];
        }
        else if ("-page-size"sv == argv[i] || "-chunk-size"sv == argv[i]) {
            const bool is_page = "-page-size"sv == argv[i];
            if (++i >= argc) { LogError("Expected number after {}", argv[i - 1]); return 2; }
            auto n = ParseSize(argv[i]);
            if (!n) { LogError("Not a number: {}", argv[i]); return 2; }
            (is_page ? page_size : chunk_size) = *n;
        }
        // Logging flags
        else if ("-log-trace"sv == argv[i]) log_level = LogLevel::Trace;
        else if ("-log-debug"sv == argv[i]) log_level = LogLevel::Debug;
        else if ("-log-info"sv == argv[i]) log_level = LogLevel::Info;
        else if ("-log-warn"sv == argv[i]) log_level = LogLevel::Warn;
        else if ("-log-error"sv == argv[i]) log_level = LogLevel::Error;
        // Unknown switch
        else {
            LogError("Unknown switch: {}", argv[i]);
            PrintUsage();
            return 2;
        }
    }

    const std::string location = argv[1];
    LogInfo("reading {} ({} per chunk)", location, ByteSizeToString(chunk_size));

    switch (mode) {
    case Mode::document: {
        auto result = ParseDocument(OpenSource(location, chunk_size));
        if (!result) return Fail(result.failure());
        PrintValue(result.value());
        break;
    }
    case Mode::pick: {
        FilterOptions filter;
        if (!path.empty()) {
            filter.filter = path;
        }
        filter.requireMatch = true;
        auto result = PickValues(OpenSource(location, chunk_size), std::move(filter));
        if (!result) return Fail(result.failure());
        for (const Value& v : result.values()) {
            PrintValue(v);
        }
        break;
    }
    case Mode::array: {
        PaginatorOptions opts;
        opts.pageSize = page_size;
        opts.dataPath = path;
        Paginator pages([&] { return OpenSource(location, chunk_size); }, opts);
        for (std::size_t n = 0;; ++n) {
            auto page = pages.page(n);
            if (!page) return Fail(page.failure());
            LogInfo("page {}: {} items", n, page.page().items.size());
            for (const Value& v : page.page().items) {
                PrintValue(v);
            }
            if (!page.page().hasMore) break;
        }
        break;
    }
    }
    return 0;
}
