// This is copyrighted software. More information is at the end of this file.
#ifndef AMBIENCE_ERROR_HH
#define AMBIENCE_ERROR_HH

#include <stdexcept>
#include <string>

namespace ambience {

/**
 * @brief Base exception class for ambience runtime errors
 *
 * Thrown when a collaborator misbehaves, such as:
 * - A sound player factory that returns no player
 * - A focus arbiter that is missing
 */
class ambience_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Volume multiplier outside of [0, 1]
 *
 * Thrown by the volume setters of sound_player_manager. The manager state
 * is left untouched when this is thrown.
 */
class invalid_volume_error : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace ambience

#endif

/*
 * Copyright (C) 2025
 *
 * This file is part of ambience.
 *
 * ambience is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * ambience is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with ambience.  If not, see <http://www.gnu.org/licenses/>.
 */
