// This is copyrighted software. More information is at the end of this file.
#include <ambience/sound_player.hh>

namespace ambience {

    const char* to_string(sound_player::state s) {
        switch (s) {
            case sound_player::state::stopped:
                return "stopped";
            case sound_player::state::buffering:
                return "buffering";
            case sound_player::state::playing:
                return "playing";
            case sound_player::state::pausing:
                return "pausing";
            case sound_player::state::paused:
                return "paused";
            case sound_player::state::stopping:
                return "stopping";
        }
        return "unknown";
    }

    std::ostream& operator<<(std::ostream& os, sound_player::state s) {
        return os << to_string(s);
    }
}

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
