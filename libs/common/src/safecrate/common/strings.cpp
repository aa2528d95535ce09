/*
 * SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
 *
 * SPDX-License-Identifier: LGPL-3.0-or-later
 */

#include "safecrate/common/strings.h"

#include <algorithm>
#include <cctype>

namespace safecrate::common::strings {

bool stringEqual(std::string_view str1, std::string_view str2, bool caseSensitive) noexcept
{
    if (caseSensitive) {
        return str1 == str2;
    }

    return std::equal(str1.begin(), str1.end(), str2.begin(), str2.end(), [](char ch1, char ch2) {
        return std::tolower(static_cast<unsigned char>(ch1))
          == std::tolower(static_cast<unsigned char>(ch2));
    });
}

std::string trim(std::string_view str, std::string_view chars) noexcept
{
    auto first = str.find_first_not_of(chars);
    if (first == std::string_view::npos) {
        return "";
    }

    auto last = str.find_last_not_of(chars);
    return std::string(str.substr(first, last - first + 1));
}

std::vector<std::string> split(const std::string &str, char delimiter, splitOption option) noexcept
{
    std::vector<std::string> result;
    std::size_t start{ 0 };
    std::size_t end{ 0 };
    auto trimWhitespace = (option & splitOption::TrimWhitespace) != splitOption::None;
    auto skipEmpty = (option & splitOption::SkipEmpty) != splitOption::None;

    auto push = [&](std::string token) {
        if (trimWhitespace) {
            token = trim(token, " \t\r");
        }

        if (!skipEmpty || !token.empty()) {
            result.push_back(std::move(token));
        }
    };

    while ((end = str.find(delimiter, start)) != std::string::npos) {
        push(str.substr(start, end - start));
        start = end + 1;
    }
    push(str.substr(start));

    return result;
}

std::string join(const std::vector<std::string> &strs, char delimiter) noexcept
{
    if (strs.empty()) {
        return "";
    }

    size_t total_len = strs.size() - 1;
    for (const auto &s : strs) {
        total_len += s.size();
    }

    std::string result;
    result.reserve(total_len);
    result.append(strs[0]);
    for (size_t i = 1; i < strs.size(); ++i) {
        result.push_back(delimiter);
        result.append(strs[i]);
    }

    return result;
}

std::string quoteShellArgs(const std::vector<std::string> &args) noexcept
{
    std::vector<std::string> quoted;
    quoted.reserve(args.size());
    for (const auto &arg : args) {
        auto plain = !arg.empty() && std::all_of(arg.begin(), arg.end(), [](char ch) {
            return std::isalnum(static_cast<unsigned char>(ch)) != 0
              || std::string_view{ "-_./:=,@+%" }.find(ch) != std::string_view::npos;
        });
        quoted.push_back(plain ? arg : quoteBashArg(arg));
    }

    return join(quoted, ' ');
}

// Quotes a string for serializing arguments to a bash script.
// Example:
//   Input:  "let's go"
//   Output: "'let'\''s go'"
std::string quoteBashArg(std::string arg) noexcept
{
    const std::string quotePrefix = "'\\";
    for (auto it = arg.begin(); it != arg.end(); it++) {
        if (*it == '\'') {
            it = arg.insert(it, quotePrefix.cbegin(), quotePrefix.cend());
            it = arg.insert(it + quotePrefix.size() + 1, 1, '\'');
        }
    }
    return "'" + arg + "'";
}

} // namespace safecrate::common::strings
