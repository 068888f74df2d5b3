#include "mcpdoctor/analysis/metrics.hpp"

#include <cassert>
#include <iostream>

using namespace mcpdoctor;
using namespace mcpdoctor::analysis;

static Json text_result(const std::string& text)
{
    return Json{{"content", Json::array({Json{{"type", "text"}, {"text", text}}})}};
}

int main()
{
    std::cout << "Test: response view...\n";
    {
        Json structured = {{"structuredContent", {{"items", Json::array()}}},
                           {"content", Json::array()}};
        assert(response_view(structured) == (Json{{"items", Json::array()}}));

        auto parsed = response_view(text_result("[1,2,3]"));
        assert(parsed.is_array() && parsed.size() == 3);

        // Plain prose is not a payload; the result itself is measured
        auto prose = text_result("hello there");
        assert(response_view(prose) == prose);

        // A JSON scalar in a text block does not count either
        auto scalar = text_result("42");
        assert(response_view(scalar) == scalar);
        std::cout << "  [PASS] response view\n";
    }

    std::cout << "Test: verbose identifiers...\n";
    {
        assert(has_verbose_identifiers(Json{{"id", "550e8400-e29b-41d4-a716-446655440000"}}));
        assert(has_verbose_identifiers(Json{{"sha", "d41d8cd98f00b204e9800998ecf8427e"}}));
        assert(has_verbose_identifiers(
            Json::array({Json{{"token", "AKIA4EXAMPLE7Q2ZT9MXY3"}}})));

        assert(!has_verbose_identifiers(Json{{"id", "record-1"}, {"title", "short"}}));
        assert(!has_verbose_identifiers(Json{{"note", "internationalization is long"}}));
        assert(!has_verbose_identifiers(Json{{"n", 12345678901234567890ULL}}));
        assert(!has_verbose_identifiers(Json("550e8400-e29b-41d4-a716-446655440000")));

        Heuristics strict;
        strict.opaque_token_min_length = 6;
        assert(has_verbose_identifiers(Json{{"id", "ab12cd"}}, strict));
        std::cout << "  [PASS] verbose identifiers\n";
    }

    std::cout << "Test: collection shape...\n";
    {
        assert(is_collection_shaped(text_result("[{\"a\":1}]")));
        assert(is_collection_shaped(text_result("{\"results\":[]}")));
        assert(is_collection_shaped(
            Json{{"structuredContent", {{"users", Json::array({Json{{"name", "x"}}})}}}}));

        assert(!is_collection_shaped(Json{{"structuredContent", {{"users", Json::array()}}}}));
        assert(!is_collection_shaped(
            Json{{"structuredContent", {{"tags", Json::array({"a", "b"})}}}}));
        assert(!is_collection_shaped(text_result("{\"name\":\"single\"}")));
        assert(!is_collection_shaped(text_result("no json here")));
        std::cout << "  [PASS] collection shape\n";
    }

    std::cout << "Test: low-value data...\n";
    {
        assert(has_low_value_data(text_result(
            "{\"id\":1,\"created_at\":\"2024-01-01\",\"metadata\":{\"source\":\"x\"}}")));
        Json records = Json::array();
        for (int i = 0; i < 5; ++i)
            records.push_back(Json{{"id", i}, {"title", "t"}, {"body", "b"}, {"author", "a"},
                                   {"created_at", "2024-01-01"}});
        // One distinct low-value name among 25 fields
        assert(!has_low_value_data(Json{{"structuredContent", records}}));
        assert(!has_low_value_data(text_result("created_at")));
        assert(!has_low_value_data(Json{{"structuredContent", Json::object()}}));

        Heuristics loose;
        loose.low_value_ratio = 0.01;
        assert(has_low_value_data(Json{{"structuredContent", records}}, loose));
        std::cout << "  [PASS] low-value data\n";
    }

    std::cout << "Test: truncation markers...\n";
    {
        assert(is_truncated(text_result("{\"items\":[],\"has_more\":true}")));
        assert(is_truncated(Json{{"structuredContent", {{"note", "Output TRUNCATED at 100 rows"}}}}));
        assert(!is_truncated(text_result("{\"items\":[1,2,3]}")));
        assert(!is_truncated(Json("truncated")));

        Heuristics custom;
        custom.truncation_markers = {"clipped"};
        assert(!is_truncated(text_result("{\"has_more\":true}"), custom));
        assert(is_truncated(text_result("{\"state\":\"clipped\"}"), custom));
        std::cout << "  [PASS] truncation markers\n";
    }

    std::cout << "Test: detail-fetching names...\n";
    {
        Heuristics h;
        assert(h.mentions_detail("GetUser"));
        assert(h.mentions_detail("Retrieve account details"));
        assert(!h.mentions_detail("list_items"));
        assert(h.is_format_control_param("Response_Format"));
        assert(!h.is_format_control_param("query"));
        std::cout << "  [PASS] detail-fetching names\n";
    }

    std::cout << "\n[OK] metrics tests passed\n";
    return 0;
}
