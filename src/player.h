// Copyright 2022 Ola Rozenfeld
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SRC_PLAYER_H_
#define SRC_PLAYER_H_

#include <string>

#include "src/game_log.pb.h"
#include "src/script.h"

namespace storyteller {

using std::string;

const int kNoPlayer = -1;  // Used in place of player index.

// One seat at the table.
struct Player {
  string name;
  Character character = CHARACTER_UNSPECIFIED;  // Current, may change.
  Team team = TEAM_UNSPECIFIED;  // True alignment.
  bool alive = true;
  // Only for the Drunk: the Townsfolk they believe they are.
  Character drunk_character = CHARACTER_UNSPECIFIED;
  // Per-day flags.
  bool nominated_today = false;
  bool used_nomination = false;
  // Once per game.
  bool used_ghost_vote = false;
  bool used_counter_ability = false;

  // The alignment other players' abilities see.
  Team ApparentTeam() const {
    if (character == RECLUSE) {
      return EVIL;
    }
    if (character == SPY) {
      return GOOD;
    }
    return team;
  }

  // The character the player was told they are.
  Character BelievedCharacter() const {
    return drunk_character != CHARACTER_UNSPECIFIED ? drunk_character
                                                    : character;
  }

  // Whether the Fortune Teller sees this player as the Demon.
  bool RegistersAsDemon() const {
    return CategoryOf(character) == DEMON || character == RECLUSE;
  }

  // Whether the Virgin treats this player as a Townsfolk.
  bool RegistersAsTownsfolk() const {
    return CategoryOf(character) == TOWNSFOLK || character == SPY;
  }
};

}  // namespace storyteller

#endif  // SRC_PLAYER_H_
