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

#ifndef MONIKER_WORD_CATALOG_H
#define MONIKER_WORD_CATALOG_H

#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace moniker
{
/**
 * The two word lists names are assembled from.
 *
 * A catalog never changes once built, so one instance can be read from any number of threads.
 * Words are views and must outlive the catalog; the reference catalog points at static storage.
 */
class WordCatalog
{
public:
    using SPtr = std::shared_ptr<const WordCatalog>;

    /// Throws EmptyCatalogException if either list is empty, and MalformedCatalogException if a list
    /// holds an empty word, a character outside [a-z], or the same word twice
    WordCatalog(std::vector<std::string_view> adjectives, std::vector<std::string_view> nouns);

    std::size_t adjective_count() const noexcept;
    std::size_t noun_count() const noexcept;

    /// Throws CatalogIndexException unless index < adjective_count()
    std::string_view adjective_at(std::size_t index) const;
    /// Throws CatalogIndexException unless index < noun_count()
    std::string_view noun_at(std::size_t index) const;

    bool contains_adjective(std::string_view word) const;
    bool contains_noun(std::string_view word) const;

private:
    std::vector<std::string_view> adjectives;
    std::vector<std::string_view> nouns;
};

/// The built-in word lists, created on first use and shared from then on
WordCatalog::SPtr reference_word_catalog();
} // namespace moniker

#endif // MONIKER_WORD_CATALOG_H
