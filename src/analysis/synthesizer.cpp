#include "mcpdoctor/analysis/synthesizer.hpp"

#include "mcpdoctor/util/strings.hpp"

#include <algorithm>

namespace mcpdoctor::analysis
{

namespace
{

bool stringish(const std::string& type)
{
    return type.empty() || type == "string";
}

ValueRule by_name(std::string label, std::initializer_list<const char*> words, bool strings_only,
                  Json value)
{
    std::vector<std::string> list(words.begin(), words.end());
    return ValueRule{std::move(label),
                     [list, strings_only](const std::string& lname, const std::string& type,
                                          const Json&)
                     {
                         if (strings_only && !stringish(type))
                             return false;
                         return std::any_of(list.begin(), list.end(), [&](const std::string& w)
                                            { return lname.find(w) != std::string::npos; });
                     },
                     [value](const Json&) { return value; }};
}

Json type_default(const std::string& type)
{
    if (type == "integer")
        return 1;
    if (type == "number")
        return 1.0;
    if (type == "boolean")
        return true;
    if (type == "array")
        return Json::array();
    if (type == "object")
        return Json::object();
    if (type == "null")
        return nullptr;
    return "sample_value";
}

} // namespace

Json Scenario::to_json() const
{
    return Json{{"name", name},
                {"operation", operation},
                {"arguments", arguments},
                {"description", description}};
}

std::string declared_type(const Json& property_schema)
{
    if (!property_schema.is_object() || !property_schema.contains("type"))
        return {};
    const auto& t = property_schema["type"];
    if (t.is_string())
        return util::to_lower(t.get<std::string>());
    if (t.is_array())
    {
        for (const auto& member : t)
            if (member.is_string() && util::to_lower(member.get<std::string>()) != "null")
                return util::to_lower(member.get<std::string>());
        return t.empty() ? std::string() : std::string("null");
    }
    return {};
}

const std::vector<ValueRule>& default_value_rules()
{
    static const std::vector<ValueRule> rules = {
        by_name("url", {"url", "uri", "link", "href"}, false, "https://example.com"),
        ValueRule{"enum",
                  [](const std::string&, const std::string&, const Json& schema)
                  {
                      return schema.is_object() &&
                             ((schema.contains("enum") && schema["enum"].is_array() &&
                               !schema["enum"].empty()) ||
                              schema.contains("const"));
                  },
                  [](const Json& schema)
                  {
                      if (schema.contains("enum") && schema["enum"].is_array() &&
                          !schema["enum"].empty())
                          return schema["enum"].front();
                      return schema["const"];
                  }},
        by_name("email", {"email", "mail"}, true, "test@example.com"),
        by_name("query", {"query", "search", "term", "keyword"}, true, "sample query"),
        by_name("id", {"id", "key"}, true, "sample_id"),
        ValueRule{"type-default",
                  [](const std::string&, const std::string&, const Json&) { return true; },
                  [](const Json& schema) { return type_default(declared_type(schema)); }},
    };
    return rules;
}

ArgumentSynthesizer::ArgumentSynthesizer(Heuristics heuristics)
    : heuristics_(std::move(heuristics))
{
}

Json ArgumentSynthesizer::value_for(const std::string& name, const Json& property_schema) const
{
    const auto lname = util::to_lower(name);
    const auto type = declared_type(property_schema);
    for (const auto& rule : default_value_rules())
        if (rule.matches(lname, type, property_schema))
            return rule.generate(property_schema);
    return "sample_value";
}

Json ArgumentSynthesizer::minimal_arguments(const client::Operation& operation) const
{
    Json args = Json::object();
    const auto& props = operation.properties();
    for (const auto& name : operation.required())
    {
        auto it = props.find(name);
        args[name] = value_for(name, it != props.end() ? *it : Json::object());
    }
    return args;
}

void ArgumentSynthesizer::add_pagination(Json& args, const client::Operation& operation,
                                         int page_size) const
{
    for (const auto& [name, schema] : operation.properties().items())
    {
        const bool as_string = declared_type(schema) == "string";
        auto number = [as_string](int v) { return as_string ? Json(std::to_string(v)) : Json(v); };

        if (heuristics_.is_size_param(name))
            args[name] = number(page_size);
        else if (heuristics_.is_page_param(name))
            args[name] = number(1);
        else if (heuristics_.is_offset_param(name))
            args[name] = number(0);
    }
}

std::vector<Scenario> ArgumentSynthesizer::scenarios(const client::Operation& operation) const
{
    const Json minimal = minimal_arguments(operation);

    Json typical = minimal;
    add_pagination(typical, operation, heuristics_.typical_page_size);
    for (const auto& [name, schema] : operation.properties().items())
        if (heuristics_.is_filter_param(name) && !typical.contains(name))
            typical[name] = value_for(name, schema);

    Json large = minimal;
    add_pagination(large, operation, heuristics_.large_page_size);

    return {
        Scenario{"minimal", operation.name, minimal, "Required parameters only"},
        Scenario{"typical", operation.name, typical, "Typical usage with moderate limits"},
        Scenario{"large", operation.name, large, "Large request to test response size limits"},
    };
}

} // namespace mcpdoctor::analysis
