#include "mcpdoctor/client/target.hpp"

#include "mcpdoctor/exceptions.hpp"
#include "mcpdoctor/util/strings.hpp"

#include <cctype>
#include <stdexcept>

namespace mcpdoctor::client
{

namespace
{

bool valid_env_name(const std::string& name)
{
    if (name.empty())
        return false;
    auto first = static_cast<unsigned char>(name[0]);
    if (!std::isalpha(first) && name[0] != '_')
        return false;
    for (unsigned char c : name)
        if (!std::isalnum(c) && c != '_')
            return false;
    return true;
}

/// Split on "&&" outside of quotes.
std::vector<std::string> split_segments(const std::string& command)
{
    std::vector<std::string> segments;
    std::string current;
    char quote = 0;
    for (size_t i = 0; i < command.size(); ++i)
    {
        char c = command[i];
        if (quote)
        {
            if (c == '\\' && quote == '"' && i + 1 < command.size())
            {
                current += c;
                current += command[++i];
                continue;
            }
            if (c == quote)
                quote = 0;
            current += c;
            continue;
        }
        if (c == '\'' || c == '"')
        {
            quote = c;
            current += c;
            continue;
        }
        if (c == '&' && i + 1 < command.size() && command[i + 1] == '&')
        {
            segments.push_back(util::trim(current));
            current.clear();
            ++i;
            continue;
        }
        current += c;
    }
    segments.push_back(util::trim(current));
    return segments;
}

std::vector<std::string> split_words(const std::string& segment, const std::string& descriptor)
{
    try
    {
        return util::shell_split(segment);
    }
    catch (const std::invalid_argument& e)
    {
        throw LaunchError("Cannot parse command '" + descriptor + "': " + e.what());
    }
}

} // namespace

std::string Target::command_line() const
{
    return util::join(argv);
}

bool looks_like_url(const std::string& descriptor)
{
    auto lower = util::to_lower(util::trim(descriptor));
    return util::starts_with(lower, "http://") || util::starts_with(lower, "https://");
}

bool parse_assignment(const std::string& word, std::string& name, std::string& value)
{
    auto eq = word.find('=');
    if (eq == std::string::npos || eq == 0)
        return false;
    auto candidate = word.substr(0, eq);
    if (!valid_env_name(candidate))
        return false;
    name = std::move(candidate);
    value = word.substr(eq + 1);
    return true;
}

Target parse_target(const std::string& descriptor)
{
    Target target;
    target.raw = descriptor;

    if (looks_like_url(descriptor))
    {
        target.kind = Target::Kind::Url;
        target.url = util::trim(descriptor);
        return target;
    }

    target.kind = Target::Kind::Command;
    auto segments = split_segments(descriptor);

    for (size_t i = 0; i + 1 < segments.size(); ++i)
    {
        auto words = split_words(segments[i], descriptor);
        for (const auto& word : words)
        {
            if (word == "export")
                continue;
            std::string name, value;
            if (!parse_assignment(word, name, value))
                throw LaunchError("Unsupported command prefix '" + segments[i] +
                                  "': only environment assignments may precede '&&'");
            target.inline_env[name] = value;
        }
    }

    auto words = split_words(segments.back(), descriptor);
    size_t first = 0;
    if (first < words.size() && words[first] == "export")
        ++first;
    for (; first < words.size(); ++first)
    {
        std::string name, value;
        if (!parse_assignment(words[first], name, value))
            break;
        target.inline_env[name] = value;
    }
    target.argv.assign(words.begin() + static_cast<std::ptrdiff_t>(first), words.end());
    return target;
}

} // namespace mcpdoctor::client
