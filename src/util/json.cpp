#include "mcpdoctor/util/json.hpp"

namespace mcpdoctor::util::json
{

std::optional<json> extract_first_object(const std::string& text)
{
    for (size_t start = text.find('{'); start != std::string::npos;
         start = text.find('{', start + 1))
    {
        int depth = 0;
        bool in_string = false;
        bool escaped = false;
        for (size_t i = start; i < text.size(); ++i)
        {
            char c = text[i];
            if (in_string)
            {
                if (escaped)
                    escaped = false;
                else if (c == '\\')
                    escaped = true;
                else if (c == '"')
                    in_string = false;
                continue;
            }
            if (c == '"')
                in_string = true;
            else if (c == '{')
                ++depth;
            else if (c == '}' && --depth == 0)
            {
                auto parsed = try_parse(text.substr(start, i - start + 1));
                if (parsed && parsed->is_object())
                    return parsed;
                break;
            }
        }
    }
    return std::nullopt;
}

} // namespace mcpdoctor::util::json
