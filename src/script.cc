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

#include "src/script.h"

#include <algorithm>
#include <cctype>
#include <set>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "ortools/base/logging.h"

namespace storyteller {

vector<Character> Script::AllCharacters() const {
  vector<Character> all;
  for (const auto* group : {&townsfolk, &outsiders, &minions, &demons}) {
    all.insert(all.end(), group->begin(), group->end());
  }
  return all;
}

const vector<Character>& Script::OfType(CharacterType type) const {
  switch (type) {
    case TOWNSFOLK:
      return townsfolk;
    case OUTSIDER:
      return outsiders;
    case MINION:
      return minions;
    case DEMON:
      return demons;
    default:
      CHECK(false) << "Invalid character type: " << CharacterType_Name(type);
  }
  return townsfolk;
}

bool Script::Contains(Character character) const {
  const vector<Character>& group = OfType(CategoryOf(character));
  return std::find(group.begin(), group.end(), character) != group.end();
}

const Script& TroubleBrewing() {
  static const Script* kTroubleBrewing = new Script{
    .name = "Trouble Brewing",
    .townsfolk = {WASHERWOMAN, LIBRARIAN, INVESTIGATOR, CHEF, EMPATH,
                  FORTUNE_TELLER, UNDERTAKER, MONK, RAVENKEEPER, VIRGIN,
                  SLAYER, SOLDIER, MAYOR},
    .outsiders = {BUTLER, DRUNK, RECLUSE, SAINT},
    .minions = {POISONER, SPY, SCARLET_WOMAN, BARON},
    .demons = {IMP},
    .first_night_order = {POISONER, SPY, WASHERWOMAN, LIBRARIAN, INVESTIGATOR,
                          CHEF, EMPATH, FORTUNE_TELLER, BUTLER},
    .other_night_order = {POISONER, MONK, SPY, IMP, RAVENKEEPER, UNDERTAKER,
                          EMPATH, FORTUNE_TELLER, BUTLER},
  };
  return *kTroubleBrewing;
}

CharacterType CategoryOf(Character character) {
  CHECK(Character_IsValid(character)) << "Invalid character " << character;
  return kCharacterMetadata[character].type;
}

bool IsGoodCharacter(Character character) {
  CharacterType t = CategoryOf(character);
  return t == TOWNSFOLK || t == OUTSIDER;
}

bool IsEvilCharacter(Character character) {
  CharacterType t = CategoryOf(character);
  return t == MINION || t == DEMON;
}

Team TeamOf(Character character) {
  return IsGoodCharacter(character) ? GOOD : EVIL;
}

namespace {
string TitleCase(const string& enum_name) {
  vector<string> words = absl::StrSplit(enum_name, '_');
  for (string& word : words) {
    for (int i = 1; i < word.size(); ++i) {
      word[i] = std::tolower(word[i]);
    }
  }
  return absl::StrJoin(words, " ");
}
}  // namespace

string CharacterDisplayName(Character character) {
  return TitleCase(Character_Name(character));
}

string CharacterTypeDisplayName(CharacterType type) {
  return TitleCase(CharacterType_Name(type));
}

absl::StatusOr<CategoryCounts> StandardCounts(int num_players) {
  if (num_players < kMinPlayers || num_players > kMaxPlayers) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Need %d to %d players, got %d", kMinPlayers, kMaxPlayers,
        num_players));
  }
  CategoryCounts counts;
  counts.set_townsfolk(kNumTownsfolk[num_players - kMinPlayers]);
  counts.set_outsiders(kNumOutsiders[num_players - kMinPlayers]);
  counts.set_minions(kNumMinions[num_players - kMinPlayers]);
  counts.set_demons(1);
  return counts;
}

absl::Status ValidateSetup(const Script& script,
                           absl::Span<const Character> characters) {
  const int num_players = characters.size();
  absl::StatusOr<CategoryCounts> expected = StandardCounts(num_players);
  if (!expected.ok()) {
    return expected.status();
  }
  std::set<Character> seen;
  int counts[CharacterType_ARRAYSIZE] = {0};
  for (Character c : characters) {
    if (c == CHARACTER_UNSPECIFIED || !script.Contains(c)) {
      return absl::InvalidArgumentError(absl::StrCat(
          Character_Name(c), " is not on the ", script.name, " script"));
    }
    if (!seen.insert(c).second) {
      return absl::InvalidArgumentError(
          absl::StrCat("Duplicate character: ", Character_Name(c)));
    }
    ++counts[CategoryOf(c)];
  }
  if (counts[DEMON] != 1) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Expected exactly one Demon, got %d", counts[DEMON]));
  }
  int shift = seen.count(BARON) > 0 ? 2 : 0;
  if (counts[TOWNSFOLK] != expected->townsfolk() - shift ||
      counts[OUTSIDER] != expected->outsiders() + shift ||
      counts[MINION] != expected->minions()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Expected %d Townsfolk, %d Outsiders and %d Minions for %d players, "
        "got %d, %d and %d", expected->townsfolk() - shift,
        expected->outsiders() + shift, expected->minions(), num_players,
        counts[TOWNSFOLK], counts[OUTSIDER], counts[MINION]));
  }
  return absl::OkStatus();
}

absl::StatusOr<vector<Character>> DrawCharacters(
    const Script& script, const CategoryCounts& counts, Rng* rng) {
  const int num_players = counts.townsfolk() + counts.outsiders() +
                          counts.minions() + counts.demons();
  absl::StatusOr<CategoryCounts> expected = StandardCounts(num_players);
  if (!expected.ok()) {
    return expected.status();
  }
  if (counts.townsfolk() != expected->townsfolk() ||
      counts.outsiders() != expected->outsiders() ||
      counts.minions() != expected->minions() || counts.demons() != 1) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Category counts %d/%d/%d/%d do not match the %d player distribution",
        counts.townsfolk(), counts.outsiders(), counts.minions(),
        counts.demons(), num_players));
  }
  vector<Character> result = rng->Sample(script.minions, counts.minions());
  const bool has_baron =
      std::find(result.begin(), result.end(), BARON) != result.end();
  const int shift = has_baron ? 2 : 0;
  vector<Character> demons = rng->Sample(script.demons, counts.demons());
  vector<Character> outsiders =
      rng->Sample(script.outsiders, counts.outsiders() + shift);
  vector<Character> townsfolk =
      rng->Sample(script.townsfolk, counts.townsfolk() - shift);
  result.insert(result.end(), demons.begin(), demons.end());
  result.insert(result.end(), outsiders.begin(), outsiders.end());
  result.insert(result.end(), townsfolk.begin(), townsfolk.end());
  absl::Status st = ValidateSetup(script, result);
  if (!st.ok()) {
    return st;
  }
  return result;
}

}  // namespace storyteller
