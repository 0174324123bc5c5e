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

#ifndef MONIKER_CATALOG_EXCEPTIONS_H
#define MONIKER_CATALOG_EXCEPTIONS_H

#include <moniker/exceptions/formatted_exception_base.h>

#include <stdexcept>

namespace moniker
{
// A word list came up empty. Only a broken data table can cause this.
struct EmptyCatalogException : public FormattedExceptionBase<std::logic_error>
{
    using FormattedExceptionBase<std::logic_error>::FormattedExceptionBase;
};

// A word list holds something that cannot appear in an "adjective-noun" name, or repeats a word
struct MalformedCatalogException : public FormattedExceptionBase<std::logic_error>
{
    using FormattedExceptionBase<std::logic_error>::FormattedExceptionBase;
};

struct CatalogIndexException : public FormattedExceptionBase<std::out_of_range>
{
    using FormattedExceptionBase<std::out_of_range>::FormattedExceptionBase;
};
} // namespace moniker

#endif // MONIKER_CATALOG_EXCEPTIONS_H
