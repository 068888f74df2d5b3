#include "mcpdoctor/analysis/corrector.hpp"
#include "mcpdoctor/analysis/harness.hpp"
#include "mcpdoctor/cache/tool_call_cache.hpp"
#include "mcpdoctor/client/client.hpp"
#include "mcpdoctor/exceptions.hpp"
#include "mcpdoctor/settings.hpp"
#include "mcpdoctor/util/json.hpp"
#include "mcpdoctor/util/log.hpp"
#include "mcpdoctor/version.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

static int usage(int exit_code = 1)
{
    std::cout << "mcpdoctor " << mcpdoctor::VERSION_STRING << "\n";
    std::cout << "Usage:\n";
    std::cout << "  mcpdoctor --help\n";
    std::cout << "  mcpdoctor version\n";
    std::cout << "  mcpdoctor analyze --target <url|command> [options] [--pretty]\n";
    std::cout << "  mcpdoctor tools   --target <url|command> [options] [--pretty]\n";
    std::cout << "  mcpdoctor call    --target <url|command> --tool <name> [--args <json>] [options] "
                 "[--pretty]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --transport <auto|http|sse|stdio>  Transport selection (default: auto)\n";
    std::cout << "  --timeout <s>                      Per-request timeout\n";
    std::cout << "  --startup-timeout <s>              Launched server readiness timeout\n";
    std::cout << "  --concurrency <n>                  Scenarios executed in parallel (analyze)\n";
    std::cout << "  --token-threshold <n>              Oversized response threshold (analyze)\n";
    std::cout << "  --env-vars <json>                  Environment overrides for launched servers\n";
    std::cout << "  --working-dir <dir>                Working directory for launched servers\n";
    std::cout << "  --port <n>                         Port a launched HTTP server listens on\n";
    std::cout << "  --header <K=V>                     Extra HTTP header (repeatable)\n";
    std::cout << "  --no-env-logging                   Do not log the launch environment\n";
    std::cout << "  --no-correction                    Disable argument correction (analyze)\n";
    std::cout << "  --no-cache                         Do not write the tool call cache (analyze)\n";
    std::cout << "  --cache-dir <dir>                  Tool call cache location\n";
    std::cout << "  --log-level <level>                trace|debug|info|warn|error|off\n";
    std::cout << "\n";
    std::cout << "Exit codes: 0 success, 1 error, 2 tool call failed (call)\n";
    return exit_code;
}

static bool is_flag(const std::string& s)
{
    return !s.empty() && s[0] == '-';
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static long parse_positive(const std::string& flag, const std::string& s)
{
    size_t pos = 0;
    long v = 0;
    try
    {
        v = std::stol(s, &pos, 10);
    }
    catch (const std::exception&)
    {
        pos = 0;
    }
    if (pos == 0 || pos != s.size() || v <= 0)
        throw std::invalid_argument(flag + " expects a positive integer, got '" + s + "'");
    return v;
}

static mcpdoctor::Json parse_json_flag(const std::string& flag, const std::string& s)
{
    auto parsed = mcpdoctor::util::json::try_parse(s);
    if (!parsed || !parsed->is_object())
        throw std::invalid_argument(flag + " expects a JSON object");
    return *parsed;
}

/// Everything the subcommands share, parsed out of the argument list.
struct CommonOptions
{
    std::string target;
    mcpdoctor::Settings settings;
    mcpdoctor::client::ClientOptions client;
    bool pretty = false;
};

static CommonOptions parse_common(std::vector<std::string>& args)
{
    using namespace mcpdoctor;

    CommonOptions out;
    out.settings = Settings::from_env();

    if (auto t = consume_flag_value(args, "--target"))
        out.target = *t;
    if (out.target.empty())
        throw std::invalid_argument("Missing --target");

    out.pretty = consume_flag(args, "--pretty");
    if (auto l = consume_flag_value(args, "--log-level"))
        out.settings.log_level = *l;
    if (auto t = consume_flag_value(args, "--timeout"))
        out.settings.request_timeout = std::chrono::seconds(parse_positive("--timeout", *t));
    if (auto t = consume_flag_value(args, "--startup-timeout"))
        out.settings.startup_timeout =
            std::chrono::seconds(parse_positive("--startup-timeout", *t));
    if (auto c = consume_flag_value(args, "--concurrency"))
        out.settings.concurrency = static_cast<size_t>(parse_positive("--concurrency", *c));
    if (auto n = consume_flag_value(args, "--token-threshold"))
        out.settings.oversized_token_threshold =
            static_cast<size_t>(parse_positive("--token-threshold", *n));
    if (auto d = consume_flag_value(args, "--cache-dir"))
        out.settings.cache_dir = *d;
    if (consume_flag(args, "--no-env-logging"))
        out.settings.log_env_vars = false;
    if (consume_flag(args, "--no-correction"))
        out.settings.correction_enabled = false;
    if (consume_flag(args, "--no-cache"))
        out.settings.cache_enabled = false;

    out.client = client::ClientOptions::from_settings(out.settings);

    if (auto t = consume_flag_value(args, "--transport"))
        out.client.transport = client::parse_transport_kind(*t);
    if (auto d = consume_flag_value(args, "--working-dir"))
        out.client.working_directory = *d;
    if (auto p = consume_flag_value(args, "--port"))
        out.client.port = static_cast<int>(parse_positive("--port", *p));
    if (auto env = consume_flag_value(args, "--env-vars"))
    {
        const auto overrides = parse_json_flag("--env-vars", *env);
        for (const auto& [k, v] : overrides.items())
            out.client.env_overrides[k] = v.is_string() ? v.get<std::string>() : v.dump();
    }
    while (auto h = consume_flag_value(args, "--header"))
    {
        auto eq = h->find('=');
        if (eq == std::string::npos || eq == 0)
            throw std::invalid_argument("--header expects K=V, got '" + *h + "'");
        out.client.transport_options.headers[h->substr(0, eq)] = h->substr(eq + 1);
    }
    return out;
}

static void reject_leftovers(const std::vector<std::string>& rest)
{
    for (const auto& a : rest)
        throw std::invalid_argument((is_flag(a) ? "Unknown option: " : "Unexpected argument: ") +
                                    a);
}

static void print_json(const mcpdoctor::Json& j, bool pretty)
{
    std::cout << (pretty ? mcpdoctor::util::json::dump_pretty(j) : mcpdoctor::util::json::dump(j))
              << "\n";
}

static int run_analyze(CommonOptions opts)
{
    using namespace mcpdoctor;

    client::ProtocolClient client(opts.target, opts.client);

    std::unique_ptr<cache::ToolCallCache> cache;
    std::shared_ptr<analysis::ICorrector> corrector = analysis::make_corrector_from_env();
    if (opts.settings.correction_enabled && !corrector->available())
        spdlog::debug("ANTHROPIC_API_KEY not set; argument correction disabled");

    try
    {
        client.connect();
        if (opts.settings.cache_enabled)
            cache = std::make_unique<cache::ToolCallCache>(client.server_identity(),
                                                           opts.settings.cache_dir);

        analysis::Harness harness(client, analysis::HarnessOptions::from_settings(opts.settings),
                                  corrector, cache.get());
        auto report = harness.run();
        client.close();
        print_json(report.to_json(), opts.pretty);
        return 0;
    }
    catch (const AnalysisAbortedError& e)
    {
        client.close();
        if (e.partial_report)
            print_json(e.partial_report->to_json(), opts.pretty);
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

static int run_tools(CommonOptions opts)
{
    using namespace mcpdoctor;

    client::ProtocolClient client(opts.target, opts.client);
    auto catalog = client.discover();

    Json tools = Json::array();
    for (const auto& op : catalog)
        tools.push_back(op.to_json());
    Json out = {{"server", client.server_identity()},
                {"server_info", client.server_info().to_json()},
                {"tools", tools}};
    client.close();
    print_json(out, opts.pretty);
    return 0;
}

static int run_call(CommonOptions opts, const std::string& tool, const mcpdoctor::Json& args)
{
    using namespace mcpdoctor;

    client::ProtocolClient client(opts.target, opts.client);
    client.connect();
    auto result = client.invoke(tool, args);
    client.close();

    print_json(result.to_json(), opts.pretty);
    try
    {
        result.raise_if_failed();
    }
    catch (const ValidationError& e)
    {
        std::cerr << "Validation error: " << e.what() << "\n";
        return 2;
    }
    catch (const ToolExecutionError& e)
    {
        std::cerr << "Tool error: " << e.what() << "\n";
        return 2;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
        return usage();

    std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h")
        return usage(0);
    if (cmd == "version" || cmd == "--version")
    {
        std::cout << "mcpdoctor " << mcpdoctor::VERSION_STRING << "\n";
        return 0;
    }
    if (cmd != "analyze" && cmd != "tools" && cmd != "call")
        return usage();

    std::vector<std::string> args;
    args.reserve(static_cast<size_t>(argc));
    for (int i = 2; i < argc; ++i)
        args.emplace_back(argv[i]);

    if (consume_flag(args, "--help") || consume_flag(args, "-h"))
        return usage(0);

    try
    {
        auto opts = parse_common(args);
        mcpdoctor::util::log::init(opts.settings.log_level);

        if (cmd == "analyze")
        {
            reject_leftovers(args);
            return run_analyze(std::move(opts));
        }
        if (cmd == "tools")
        {
            reject_leftovers(args);
            return run_tools(std::move(opts));
        }

        auto tool = consume_flag_value(args, "--tool");
        if (!tool)
            throw std::invalid_argument("Missing --tool");
        mcpdoctor::Json call_args = mcpdoctor::Json::object();
        if (auto a = consume_flag_value(args, "--args"))
            call_args = parse_json_flag("--args", *a);
        reject_leftovers(args);
        return run_call(std::move(opts), *tool, call_args);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
