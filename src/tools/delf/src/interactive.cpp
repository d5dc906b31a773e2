#include "delf/cli/interactive.hpp"

#include <cctype>
#include <cstdlib>
#include <system_error>

namespace delf::cli
{
namespace
{

std::string environmentValue(const std::string &name)
{
    if (name.empty())
        return {};
    const char *value = std::getenv(name.c_str());
    return value ? std::string(value) : std::string();
}

bool isNameChar(char ch)
{
    return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_';
}

} // namespace

std::string expandUserPath(const std::string &input)
{
    std::string source = input;
    if (!source.empty() && source[0] == '~' && (source.size() == 1 || source[1] == '/'))
    {
        const char *home = std::getenv("HOME");
        if (home && home[0] != '\0')
            source = std::string(home) + source.substr(1);
    }

    std::string expanded;
    expanded.reserve(source.size());
    for (std::size_t i = 0; i < source.size(); ++i)
    {
        char ch = source[i];
        if (ch != '$' || i + 1 >= source.size())
        {
            expanded.push_back(ch);
            continue;
        }

        if (source[i + 1] == '{')
        {
            std::size_t close = source.find('}', i + 2);
            if (close == std::string::npos)
            {
                expanded.push_back(ch);
                continue;
            }
            expanded += environmentValue(source.substr(i + 2, close - i - 2));
            i = close;
        }
        else if (isNameChar(source[i + 1]))
        {
            std::size_t end = i + 1;
            while (end < source.size() && isNameChar(source[end]))
                ++end;
            expanded += environmentValue(source.substr(i + 1, end - i - 1));
            i = end - 1;
        }
        else
        {
            expanded.push_back(ch);
        }
    }
    return expanded;
}

std::optional<std::filesystem::path> promptSearchRoot(remove::Prompter &prompter, std::ostream &out, std::ostream &err)
{
    out << "Enter path to search (default: current directory)\n";
    std::string answer = prompter.ask("> ");

    std::error_code ec;
    if (answer.empty())
    {
        out << "Searching in: " << std::filesystem::current_path(ec).string() << '\n';
        return std::filesystem::path(".");
    }

    std::filesystem::path root = expandUserPath(answer);
    if (!std::filesystem::is_directory(root, ec))
    {
        err << "ERROR: Directory '" << root.string() << "' does not exist" << std::endl;
        return std::nullopt;
    }

    out << "Searching in: " << root.string() << "\n\n";
    return root;
}

std::optional<std::string> promptPattern(remove::Prompter &prompter, std::ostream &out, std::ostream &err)
{
    out << "Enter file/folder name or pattern to delete\n";
    std::string pattern = prompter.ask("> ");
    if (pattern.empty())
    {
        err << "ERROR: Pattern cannot be empty" << std::endl;
        return std::nullopt;
    }
    return pattern;
}

} // namespace delf::cli
