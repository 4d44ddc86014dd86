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
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "src/rng.h"

namespace storyteller {
namespace {

TEST(Script, TroubleBrewingCategories) {
  const Script& s = TroubleBrewing();
  EXPECT_EQ(s.townsfolk.size(), 13);
  EXPECT_EQ(s.outsiders.size(), 4);
  EXPECT_EQ(s.minions.size(), 4);
  EXPECT_THAT(s.demons, testing::ElementsAre(IMP));
  for (Character c : s.AllCharacters()) {
    EXPECT_TRUE(s.Contains(c));
    EXPECT_THAT(s.OfType(CategoryOf(c)), testing::Contains(c));
  }
  EXPECT_EQ(s.AllCharacters().size(), 22);
}

TEST(Script, NightOrders) {
  const Script& s = TroubleBrewing();
  EXPECT_THAT(s.first_night_order, testing::Not(testing::Contains(IMP)));
  EXPECT_THAT(s.other_night_order, testing::Contains(IMP));
  // Poison takes effect before anyone else acts.
  EXPECT_EQ(s.first_night_order[0], POISONER);
  EXPECT_EQ(s.other_night_order[0], POISONER);
  // The Monk protects before the Imp attacks, the Ravenkeeper wakes after.
  const auto pos = [&s](Character c) {
    return std::find(s.other_night_order.begin(), s.other_night_order.end(),
                     c) - s.other_night_order.begin();
  };
  EXPECT_LT(pos(MONK), pos(IMP));
  EXPECT_LT(pos(IMP), pos(RAVENKEEPER));
}

TEST(Script, Categories) {
  EXPECT_EQ(CategoryOf(WASHERWOMAN), TOWNSFOLK);
  EXPECT_EQ(CategoryOf(SAINT), OUTSIDER);
  EXPECT_EQ(CategoryOf(BARON), MINION);
  EXPECT_EQ(CategoryOf(IMP), DEMON);
  EXPECT_EQ(TeamOf(DRUNK), GOOD);
  EXPECT_EQ(TeamOf(SPY), EVIL);
  EXPECT_TRUE(IsGoodCharacter(MAYOR));
  EXPECT_TRUE(IsEvilCharacter(IMP));
  EXPECT_FALSE(IsEvilCharacter(RECLUSE));
}

TEST(Script, DisplayNames) {
  EXPECT_EQ(CharacterDisplayName(FORTUNE_TELLER), "Fortune Teller");
  EXPECT_EQ(CharacterDisplayName(IMP), "Imp");
  EXPECT_EQ(CharacterTypeDisplayName(TOWNSFOLK), "Townsfolk");
}

TEST(StandardCounts, Table) {
  absl::StatusOr<CategoryCounts> c = StandardCounts(5);
  ASSERT_TRUE(c.ok());
  EXPECT_EQ(c->townsfolk(), 3);
  EXPECT_EQ(c->outsiders(), 0);
  EXPECT_EQ(c->minions(), 1);
  EXPECT_EQ(c->demons(), 1);
  c = StandardCounts(12);
  ASSERT_TRUE(c.ok());
  EXPECT_EQ(c->townsfolk(), 7);
  EXPECT_EQ(c->outsiders(), 2);
  EXPECT_EQ(c->minions(), 2);
  for (int n = kMinPlayers; n <= kMaxPlayers; ++n) {
    c = StandardCounts(n);
    ASSERT_TRUE(c.ok());
    EXPECT_EQ(c->townsfolk() + c->outsiders() + c->minions() + c->demons(),
              n);
  }
  EXPECT_EQ(StandardCounts(4).status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(StandardCounts(16).status().code(),
            absl::StatusCode::kInvalidArgument);
}

TEST(ValidateSetup, ValidSetups) {
  const Script& s = TroubleBrewing();
  EXPECT_TRUE(ValidateSetup(s, {IMP, POISONER, WASHERWOMAN, CHEF, EMPATH})
              .ok());
  EXPECT_TRUE(ValidateSetup(s, {IMP, POISONER, SLAYER, FORTUNE_TELLER,
                                UNDERTAKER, DRUNK}).ok());
  // The Baron converts two Townsfolk into Outsiders.
  EXPECT_TRUE(ValidateSetup(s, {IMP, BARON, CHEF, SAINT, RECLUSE}).ok());
}

TEST(ValidateSetup, InvalidSetups) {
  const Script& s = TroubleBrewing();
  // Too few players.
  EXPECT_FALSE(ValidateSetup(s, {IMP, POISONER, CHEF, EMPATH}).ok());
  // No Demon.
  EXPECT_FALSE(ValidateSetup(s, {SPY, POISONER, WASHERWOMAN, CHEF, EMPATH})
               .ok());
  // Duplicates.
  EXPECT_FALSE(ValidateSetup(s, {IMP, POISONER, CHEF, CHEF, EMPATH}).ok());
  // Wrong counts: an Outsider in a 5 player game.
  EXPECT_FALSE(ValidateSetup(s, {IMP, POISONER, SAINT, CHEF, EMPATH}).ok());
  // A Baron without the extra Outsiders.
  EXPECT_FALSE(ValidateSetup(s, {IMP, BARON, WASHERWOMAN, CHEF, EMPATH})
               .ok());
  EXPECT_FALSE(ValidateSetup(s, {IMP, POISONER, CHARACTER_UNSPECIFIED, CHEF,
                                 EMPATH}).ok());
}

TEST(DrawCharacters, AlwaysValid) {
  const Script& s = TroubleBrewing();
  for (int n = kMinPlayers; n <= kMaxPlayers; ++n) {
    for (uint64_t seed = 1; seed <= 20; ++seed) {
      Rng rng(seed);
      absl::StatusOr<vector<Character>> drawn =
          DrawCharacters(s, *StandardCounts(n), &rng);
      ASSERT_TRUE(drawn.ok()) << drawn.status();
      EXPECT_EQ(drawn->size(), n);
      EXPECT_TRUE(ValidateSetup(s, *drawn).ok());
    }
  }
}

TEST(DrawCharacters, SameSeedSameDraw) {
  Rng a(7), b(7);
  CategoryCounts counts = *StandardCounts(10);
  EXPECT_EQ(*DrawCharacters(TroubleBrewing(), counts, &a),
            *DrawCharacters(TroubleBrewing(), counts, &b));
}

TEST(DrawCharacters, RejectsNonStandardCounts) {
  Rng rng(1);
  CategoryCounts counts;
  counts.set_townsfolk(4);
  counts.set_minions(1);
  counts.set_demons(1);
  EXPECT_EQ(DrawCharacters(TroubleBrewing(), counts, &rng).status().code(),
            absl::StatusCode::kInvalidArgument);
}
}  // namespace
}  // namespace storyteller

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
