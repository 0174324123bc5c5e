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

#ifndef MONIKER_CONSTANTS_H
#define MONIKER_CONSTANTS_H

namespace moniker
{
constexpr auto seed_env_var = "MONIKER_SEED"; // fixes the seed of default generators when set
constexpr auto name_separator = '-';
constexpr auto petname_log_category = "petname";
} // namespace moniker

#endif // MONIKER_CONSTANTS_H
