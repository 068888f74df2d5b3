#include "mcpdoctor/client/types.hpp"
#include "mcpdoctor/exceptions.hpp"

#include <cassert>
#include <iostream>
#include <string>

int main()
{
    using namespace mcpdoctor;
    using namespace mcpdoctor::client;

    std::cout << "Test: catalog entry parsing...\n";
    {
        auto op = Operation::from_json(Json{{"name", "search"},
                                            {"description", "Find things"},
                                            {"parameters",
                                             {{"type", "object"},
                                              {"properties", {{"query", {{"type", "string"}}}}},
                                              {"required", Json::array({"query", "query"})}}}});
        assert(op.name == "search");
        assert(op.description && *op.description == "Find things");
        assert(op.declares("query"));
        assert(op.required().size() == 1);

        auto bare = Operation::from_json(Json("ping"));
        assert(bare.name == "ping");
        assert(!bare.description);
        assert(bare.input_schema["type"] == "object");
        assert(bare.properties().is_object() && bare.properties().empty());
        assert(bare.required().empty());

        bool threw = false;
        try
        {
            parse_catalog_page(Json::object());
        }
        catch (const ProtocolError&)
        {
            threw = true;
        }
        assert(threw);
        std::cout << "  [PASS] catalog entry parsing\n";
    }

    std::cout << "Test: token estimate...\n";
    {
        assert(estimate_tokens(Json()) == 0);
        assert(estimate_tokens(Json("")) == 1); // "\"\"" is 2 chars
        std::string text(398, 'a');               // 400 chars once quoted
        assert(estimate_tokens(Json(text)) == 100);
        std::cout << "  [PASS] token estimate\n";
    }

    std::cout << "Test: result classification...\n";
    {
        auto ok = InvocationResult::from_call_result(
            "echo", Json{{"content", Json::array({Json{{"type", "text"}, {"text", "hi"}}})}},
            Seconds(0.25));
        assert(ok.ok());
        assert(ok.status() == InvocationStatus::Success);
        assert(ok.size_bytes() > 0);
        assert(ok.token_estimate() >= 1);
        assert(ok.elapsed().count() == 0.25);
        ok.raise_if_failed();

        auto invalid = InvocationResult::from_rpc_error(
            "search", Json{{"code", -32602}, {"message", "Invalid params"}}, Seconds(0));
        assert(invalid.status() == InvocationStatus::ValidationFailure);
        assert(invalid.error_message() == "Invalid params");

        auto structured = InvocationResult::from_rpc_error(
            "search", Json{{"code", -32000}, {"message", "Bad"}, {"data", {{"field", "limit"}}}},
            Seconds(0));
        assert(structured.status() == InvocationStatus::ValidationFailure);

        auto tool_error = InvocationResult::from_call_result(
            "fail",
            Json{{"isError", true},
                 {"content", Json::array({Json{{"type", "text"}, {"text", "backend down"}}})}},
            Seconds(0));
        assert(tool_error.status() == InvocationStatus::ToolFailure);
        assert(tool_error.error_message() == "backend down");

        auto text_validation = InvocationResult::from_call_result(
            "search",
            Json{{"isError", true},
                 {"content",
                  Json::array({Json{{"type", "text"}, {"text", "Field required: query"}}})}},
            Seconds(0));
        assert(text_validation.status() == InvocationStatus::ValidationFailure);

        bool validation_thrown = false;
        try
        {
            invalid.raise_if_failed();
        }
        catch (const ValidationError&)
        {
            validation_thrown = true;
        }
        assert(validation_thrown);

        bool tool_thrown = false;
        try
        {
            tool_error.raise_if_failed();
        }
        catch (const ToolExecutionError&)
        {
            tool_thrown = true;
        }
        assert(tool_thrown);

        auto j = tool_error.to_json();
        assert(j["status"] == "tool_failure");
        assert(j["error"] == "backend down");
        std::cout << "  [PASS] result classification\n";
    }

    std::cout << "Test: server info...\n";
    {
        auto info = ServerInfo::from_initialize_result(
            Json{{"protocolVersion", "2024-11-05"},
                 {"serverInfo", {{"name", "demo"}, {"version", "1.2.3"}}},
                 {"capabilities", {{"tools", Json::object()}}},
                 {"instructions", "Be nice"}});
        assert(info.name == "demo");
        assert(info.version == "1.2.3");
        assert(info.protocol_version == "2024-11-05");
        assert(info.capabilities.contains("tools"));
        assert(info.instructions && *info.instructions == "Be nice");
        assert(std::string(to_string(SessionState::Ready)) == "ready");
        std::cout << "  [PASS] server info\n";
    }

    std::cout << "Test: mistyped server fields...\n";
    {
        // Non-string message still classifies by code
        auto odd_message = InvocationResult::from_rpc_error(
            "search", Json{{"code", -32602}, {"message", {{"detail", "bad field"}}}}, Seconds(0));
        assert(odd_message.status() == InvocationStatus::ValidationFailure);
        assert(odd_message.error_message() == "Unknown error");

        // Only a boolean true marks a tool error
        auto string_flag =
            InvocationResult::from_call_result("echo", Json{{"isError", "true"}}, Seconds(0));
        assert(string_flag.ok());

        auto odd_blocks = InvocationResult::from_call_result(
            "fail",
            Json{{"isError", true},
                 {"content", Json::array({Json{{"type", 7}, {"text", "x"}},
                                          Json{{"type", "text"}, {"text", 12}}})}},
            Seconds(0));
        assert(odd_blocks.status() == InvocationStatus::ToolFailure);
        assert(odd_blocks.error_message() == "Tool reported an error");

        bool numeric_name = false;
        try
        {
            parse_catalog_page(Json::array({Json{{"name", 42}}}));
        }
        catch (const ProtocolError&)
        {
            numeric_name = true;
        }
        assert(numeric_name);

        bool bad_version = false;
        try
        {
            ServerInfo::from_initialize_result(Json{{"protocolVersion", 20241105}});
        }
        catch (const ProtocolError&)
        {
            bad_version = true;
        }
        assert(bad_version);

        bool bad_server_info = false;
        try
        {
            ServerInfo::from_initialize_result(
                Json{{"protocolVersion", "2024-11-05"}, {"serverInfo", {{"name", Json::array()}}}});
        }
        catch (const ProtocolError&)
        {
            bad_server_info = true;
        }
        assert(bad_server_info);
        std::cout << "  [PASS] mistyped server fields\n";
    }

    std::cout << "\n[OK] client type tests passed\n";
    return 0;
}
