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

#ifndef SRC_SCRIPT_H_
#define SRC_SCRIPT_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "src/config.pb.h"
#include "src/game_log.pb.h"
#include "src/rng.h"

namespace storyteller {

using std::string;
using std::vector;

// Indexed by number of players - 5.
const int kNumTownsfolk[] = {3, 3, 5, 5, 5, 7, 7, 7, 9, 9, 9};
const int kNumOutsiders[] = {0, 1, 0, 1, 2, 0, 1, 2, 0, 1, 2};
const int kNumMinions[] = {1, 1, 1, 1, 1, 2, 2, 2, 3, 3, 3};
const int kMinPlayers = 5;
const int kMaxPlayers = 15;

// Describes a supported character.
struct CharacterMetadata {
  CharacterType type = CHARACTER_TYPE_UNSPECIFIED;
  // Number of night targets the character chooses (0 for none).
  int num_night_targets = 0;
  // Whether the character may choose themselves.
  bool can_target_self = true;
};

const CharacterMetadata kCharacterMetadata[] = {
  {},  // CHARACTER_UNSPECIFIED

  // WASHERWOMAN
  {.type = TOWNSFOLK},
  // LIBRARIAN
  {.type = TOWNSFOLK},
  // INVESTIGATOR
  {.type = TOWNSFOLK},
  // CHEF
  {.type = TOWNSFOLK},
  // EMPATH
  {.type = TOWNSFOLK},
  // FORTUNE_TELLER
  {.type = TOWNSFOLK, .num_night_targets = 2},
  // UNDERTAKER
  {.type = TOWNSFOLK},
  // MONK
  {.type = TOWNSFOLK, .num_night_targets = 1, .can_target_self = false},
  // RAVENKEEPER
  {.type = TOWNSFOLK, .num_night_targets = 1},
  // VIRGIN
  {.type = TOWNSFOLK},
  // SLAYER
  {.type = TOWNSFOLK},
  // SOLDIER
  {.type = TOWNSFOLK},
  // MAYOR
  {.type = TOWNSFOLK},
  // BUTLER
  {.type = OUTSIDER, .num_night_targets = 1, .can_target_self = false},
  // DRUNK
  {.type = OUTSIDER},
  // RECLUSE
  {.type = OUTSIDER},
  // SAINT
  {.type = OUTSIDER},
  // POISONER
  {.type = MINION, .num_night_targets = 1},
  // SPY
  {.type = MINION},
  // SCARLET_WOMAN
  {.type = MINION},
  // BARON
  {.type = MINION},
  // IMP
  {.type = DEMON, .num_night_targets = 1},
};

// The characters of one game variant, grouped by category, together with
// the order in which they wake at night.
struct Script {
  string name;
  vector<Character> townsfolk;
  vector<Character> outsiders;
  vector<Character> minions;
  vector<Character> demons;
  vector<Character> first_night_order;
  vector<Character> other_night_order;

  vector<Character> AllCharacters() const;
  const vector<Character>& OfType(CharacterType type) const;
  bool Contains(Character character) const;
};

const Script& TroubleBrewing();

CharacterType CategoryOf(Character character);
bool IsGoodCharacter(Character character);
bool IsEvilCharacter(Character character);
Team TeamOf(Character character);
// "FORTUNE_TELLER" -> "Fortune Teller".
string CharacterDisplayName(Character character);
string CharacterTypeDisplayName(CharacterType type);

// The standard category counts for a number of players, before any Baron
// adjustment.
absl::StatusOr<CategoryCounts> StandardCounts(int num_players);

// Checks an explicit character list against the script and the distribution
// table: 5-15 players, no duplicates, exactly one Demon, and category counts
// matching the table (with two extra Outsiders when the Baron is in play).
absl::Status ValidateSetup(const Script& script,
                           absl::Span<const Character> characters);

// Draws a character list for the given category counts. The counts need to
// match the standard table; a drawn Baron converts two Townsfolk into
// Outsiders. The result passes ValidateSetup.
absl::StatusOr<vector<Character>> DrawCharacters(
    const Script& script, const CategoryCounts& counts, Rng* rng);

}  // namespace storyteller

#endif  // SRC_SCRIPT_H_
