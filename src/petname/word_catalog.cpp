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

#include <moniker/exceptions/catalog_exceptions.h>
#include <moniker/petname/words.h>
#include <moniker/word_catalog.h>

#include <algorithm>
#include <iterator>
#include <set>
#include <type_traits>

namespace mk = moniker;

namespace
{
constexpr auto num_adjectives = std::extent<decltype(mk::petname::adjectives)>::value;
constexpr auto num_nouns = std::extent<decltype(mk::petname::nouns)>::value;

static_assert(num_adjectives == 62, "adjectives.txt changed size");
static_assert(num_nouns == 58, "nouns.txt changed size");

template <typename Array>
std::vector<std::string_view> views_of(const Array& words)
{
    return {std::begin(words), std::end(words)};
}

bool is_lowercase_word(std::string_view word)
{
    return !word.empty() && std::all_of(word.cbegin(), word.cend(), [](char c) { return c >= 'a' && c <= 'z'; });
}

void check_words(const std::vector<std::string_view>& words, std::string_view kind)
{
    if (words.empty())
        throw mk::EmptyCatalogException("Word catalog needs at least one {}", kind);

    std::set<std::string_view> seen;
    for (const auto& word : words)
    {
        if (!is_lowercase_word(word))
            throw mk::MalformedCatalogException("Invalid {} \"{}\": words must be lowercase ASCII letters",
                                                kind,
                                                word);
        if (!seen.insert(word).second)
            throw mk::MalformedCatalogException("Duplicate {} \"{}\" in word catalog", kind, word);
    }
}

bool contains(const std::vector<std::string_view>& words, std::string_view word)
{
    return std::find(words.cbegin(), words.cend(), word) != words.cend();
}
} // namespace

mk::WordCatalog::WordCatalog(std::vector<std::string_view> adjectives, std::vector<std::string_view> nouns)
    : adjectives{std::move(adjectives)}, nouns{std::move(nouns)}
{
    check_words(this->adjectives, "adjective");
    check_words(this->nouns, "noun");
}

std::size_t mk::WordCatalog::adjective_count() const noexcept
{
    return adjectives.size();
}

std::size_t mk::WordCatalog::noun_count() const noexcept
{
    return nouns.size();
}

std::string_view mk::WordCatalog::adjective_at(std::size_t index) const
{
    if (index >= adjectives.size())
        throw CatalogIndexException("Adjective index {} out of range [0, {})", index, adjectives.size());

    return adjectives[index];
}

std::string_view mk::WordCatalog::noun_at(std::size_t index) const
{
    if (index >= nouns.size())
        throw CatalogIndexException("Noun index {} out of range [0, {})", index, nouns.size());

    return nouns[index];
}

bool mk::WordCatalog::contains_adjective(std::string_view word) const
{
    return contains(adjectives, word);
}

bool mk::WordCatalog::contains_noun(std::string_view word) const
{
    return contains(nouns, word);
}

mk::WordCatalog::SPtr mk::reference_word_catalog()
{
    static const auto catalog =
        std::make_shared<const WordCatalog>(views_of(petname::adjectives), views_of(petname::nouns));
    return catalog;
}
