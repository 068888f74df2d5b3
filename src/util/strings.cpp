#include "mcpdoctor/util/strings.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace mcpdoctor::util
{

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s)
{
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool contains_ci(const std::string& haystack, const std::string& needle)
{
    if (needle.empty())
        return true;
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

bool starts_with(const std::string& s, const std::string& prefix)
{
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix)
{
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split(const std::string& s, const std::string& sep)
{
    std::vector<std::string> out;
    if (sep.empty())
    {
        out.push_back(s);
        return out;
    }
    size_t start = 0;
    size_t pos;
    while ((pos = s.find(sep, start)) != std::string::npos)
    {
        out.push_back(s.substr(start, pos - start));
        start = pos + sep.size();
    }
    out.push_back(s.substr(start));
    return out;
}

std::vector<std::string> shell_split(const std::string& command)
{
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;

    enum class Quote
    {
        None,
        Single,
        Double
    } quote = Quote::None;

    for (size_t i = 0; i < command.size(); ++i)
    {
        char c = command[i];
        switch (quote)
        {
        case Quote::Single:
            if (c == '\'')
                quote = Quote::None;
            else
                current.push_back(c);
            break;
        case Quote::Double:
            if (c == '"')
            {
                quote = Quote::None;
            }
            else if (c == '\\' && i + 1 < command.size() &&
                     std::string("\\\"$`").find(command[i + 1]) != std::string::npos)
            {
                current.push_back(command[++i]);
            }
            else
            {
                current.push_back(c);
            }
            break;
        case Quote::None:
            if (std::isspace(static_cast<unsigned char>(c)))
            {
                if (in_word)
                {
                    words.push_back(std::move(current));
                    current.clear();
                    in_word = false;
                }
            }
            else if (c == '\'')
            {
                quote = Quote::Single;
                in_word = true;
            }
            else if (c == '"')
            {
                quote = Quote::Double;
                in_word = true;
            }
            else if (c == '\\' && i + 1 < command.size())
            {
                current.push_back(command[++i]);
                in_word = true;
            }
            else
            {
                current.push_back(c);
                in_word = true;
            }
            break;
        }
    }

    if (quote != Quote::None)
        throw std::invalid_argument("Unterminated quote in command: " + command);
    if (in_word)
        words.push_back(std::move(current));
    return words;
}

std::string join(const std::vector<std::string>& words, const std::string& sep)
{
    std::string out;
    for (size_t i = 0; i < words.size(); ++i)
    {
        if (i > 0)
            out += sep;
        out += words[i];
    }
    return out;
}

} // namespace mcpdoctor::util
