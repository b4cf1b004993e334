#include <stdexcept>

#include "util.hpp"


std::vector<std::string> split_posix_shell(std::string_view line)
{
    std::vector<std::string> words;
    std::string word;
    bool in_word = false;

    for (std::size_t i = 0; i < line.size(); i++)
    {
        char const ch = line[i];

        if (ch == '\'') {
            auto const close = line.find('\'', i + 1);
            if (close == std::string_view::npos)
                throw std::invalid_argument("unterminated single quote");

            word.append(line.substr(i + 1, close - i - 1));
            in_word = true;
            i = close;
        }
        else if (ch == '\\') {
            if (i + 1 < line.size())
                word += line[++i];
            in_word = true;
        }
        else if (ch == ' ' || ch == '\t' || ch == '\n') {
            if (in_word) {
                words.push_back(word);
                word.clear();
                in_word = false;
            }
        }
        else {
            word += ch;
            in_word = true;
        }
    }

    if (in_word)
        words.push_back(word);

    return words;
}

std::vector<std::string> split_windows_command_line(std::string_view line)
{
    std::vector<std::string> args;
    std::size_t i = 0;
    auto const n = line.size();
    auto blank = [](char ch) { return ch == ' ' || ch == '\t'; };

    for (;;)
    {
        while (i < n && blank(line[i])) i++;
        if (i >= n)
            break;

        std::string arg;
        bool inquote = false;

        while (i < n)
        {
            std::size_t slashes = 0;
            while (i < n && line[i] == '\\') {
                slashes++;
                i++;
            }

            if (i < n && line[i] == '"') {
                // 2n backslashes + " -> n backslashes, quote toggles
                // 2n+1 backslashes + " -> n backslashes and a literal quote
                arg.append(slashes / 2, '\\');
                if (slashes % 2 == 1) {
                    arg += '"';
                    i++;
                }
                else if (inquote && i + 1 < n && line[i + 1] == '"') {
                    // "" inside quotes is a literal quote, still quoted
                    arg += '"';
                    i += 2;
                }
                else {
                    inquote = !inquote;
                    i++;
                }
                continue;
            }

            arg.append(slashes, '\\');
            if (i >= n || (!inquote && blank(line[i])))
                break;

            arg += line[i++];
        }

        args.push_back(arg);
    }

    return args;
}

std::string unquote_powershell(std::string_view token)
{
    if (token.size() < 2 || token.front() != '\'' || token.back() != '\'')
        throw std::invalid_argument("not a single-quoted PowerShell string");

    auto const inner = token.substr(1, token.size() - 2);
    std::string value;

    for (std::size_t i = 0; i < inner.size(); i++)
    {
        if (inner[i] == '\'') {
            if (i + 1 >= inner.size() || inner[i + 1] != '\'')
                throw std::invalid_argument("unescaped quote inside PowerShell string");
            i++;
        }
        value += inner[i];
    }

    return value;
}
