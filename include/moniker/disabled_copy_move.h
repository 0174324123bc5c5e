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

#ifndef MONIKER_DISABLED_COPY_MOVE_H
#define MONIKER_DISABLED_COPY_MOVE_H

namespace moniker
{

/**
 * Base class for types that own state which must never be duplicated or handed over,
 * such as the engine inside a name generator.
 *
 * Inherit privately:
 * @code
 *  class Foo : private DisabledCopyMove {...};
 * @endcode
 */
class DisabledCopyMove
{
public:
    DisabledCopyMove(const DisabledCopyMove&) = delete;
    DisabledCopyMove& operator=(const DisabledCopyMove&) = delete;

protected:
    DisabledCopyMove() = default;
    ~DisabledCopyMove() = default; // non-virtual, but protected - see Core Guidelines C.35
};
} // namespace moniker

#endif // MONIKER_DISABLED_COPY_MOVE_H
