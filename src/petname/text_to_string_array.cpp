/*
 * Copyright (C) Canonical, Ltd.
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; version 3.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

// Build-time tool: turns the word list text files into the header behind the reference catalog.
// A list that would make a broken catalog fails the build here rather than at runtime.

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
void usage(char* argv[])
{
    std::cout << "Usage:\n  ";
    std::cout << argv[0] << " <adjectives> <nouns> <output>\n";
}

bool is_lowercase_word(const std::string& word)
{
    return std::all_of(word.cbegin(), word.cend(), [](char c) { return c >= 'a' && c <= 'z'; });
}

std::vector<std::string> words_in(const std::string& filename)
{
    std::ifstream input_stream(filename);
    if (!input_stream)
        throw std::runtime_error("cannot open " + filename);

    std::string word;
    std::vector<std::string> words;
    std::set<std::string> seen;
    while (std::getline(input_stream, word))
    {
        if (!word.empty() && word.back() == '\r')
            word.pop_back();
        if (word.empty())
            continue;

        if (!is_lowercase_word(word))
            throw std::runtime_error(filename + ": \"" + word + "\" is not a lowercase ASCII word");
        if (!seen.insert(word).second)
            throw std::runtime_error(filename + ": \"" + word + "\" appears more than once");

        words.push_back(word);
    }

    if (words.empty())
        throw std::runtime_error(filename + " has no words");

    return words;
}

class Words
{
public:
    Words(const std::string& filename, std::string var_name) : var_name{std::move(var_name)}, words{words_in(filename)}
    {
    }

    void print_to(std::ostream& out) const
    {
        out << "const char* const " << var_name << "[] =\n{\n";
        for (const auto& w : words)
        {
            out << "    \"" << w << "\",\n";
        }
        out << "};\n\n";
    }

private:
    std::string var_name;
    std::vector<std::string> words;
};
} // namespace

int main(int argc, char* argv[])
try
{
    if (argc != 4)
    {
        usage(argv);
        return EXIT_FAILURE;
    }

    Words adjectives{argv[1], "adjectives"};
    Words nouns{argv[2], "nouns"};

    std::ofstream out(argv[3]);
    if (!out)
        throw std::runtime_error(std::string{"cannot write "} + argv[3]);

    out << "// Auto Generated, any edits will be lost\n\n";
    out << "#pragma once\n\n";
    out << "namespace moniker\n{\n";
    out << "namespace petname\n{\n";

    adjectives.print_to(out);
    nouns.print_to(out);

    out << "} // namespace petname\n";
    out << "} // namespace moniker\n";

    return EXIT_SUCCESS;
}
catch (const std::exception& e)
{
    std::cerr << "Error: " << e.what() << "\n";
    return EXIT_FAILURE;
}
