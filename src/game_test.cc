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


#include "src/game.h"

#include <map>
#include <set>
#include <string>
#include <vector>

#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "src/decision_provider.h"
#include "src/game_state.h"
#include "src/script.h"
#include "src/status_resolver.h"
#include "src/win_condition.h"

namespace storyteller {
namespace {
using std::map;
using std::pair;
using testing::HasSubstr;

Setup MakeSetup(const vector<Character>& characters,
                Character drunk_belief = CHARACTER_UNSPECIFIED) {
  Setup setup;
  setup.set_seed(42);
  for (int i = 0; i < characters.size(); ++i) {
    Seat* seat = setup.add_seats();
    seat->set_name(absl::StrFormat("P%d", i + 1));
    seat->set_character(characters[i]);
    if (characters[i] == DRUNK) {
      seat->set_drunk_character(drunk_belief);
    }
  }
  return setup;
}

int CountEvents(const GameLog& log, EventKind kind) {
  int count = 0;
  for (const auto& event : log.events()) {
    count += event.kind() == kind;
  }
  return count;
}

bool HasEvent(const GameLog& log, EventKind kind, const string& text) {
  for (const auto& event : log.events()) {
    if (event.kind() == kind &&
        event.description().find(text) != string::npos) {
      return true;
    }
  }
  return false;
}

vector<string> Descriptions(const GameLog& log) {
  vector<string> descriptions;
  for (const auto& event : log.events()) {
    descriptions.push_back(event.description());
  }
  return descriptions;
}

const GameOptions kOpenNominations = {.nominations_open_round = 1};

TEST(Game, StartsWithSetupEvents) {
  ScriptedDecisionProvider provider;
  Game game(TroubleBrewing(),
            MakeSetup({IMP, POISONER, WASHERWOMAN, CHEF, EMPATH}),
            GameOptions(), &provider);
  game.RunNight();
  const GameLog& log = game.log();
  ASSERT_GE(log.events_size(), 3);
  EXPECT_EQ(log.events(0).kind(), GAME_START);
  EXPECT_EQ(log.events(0).metadata().at("seed"), "42");
  EXPECT_EQ(log.events(1).kind(), GAME_SETUP);
  EXPECT_THAT(log.events(1).description(), HasSubstr("P1 (Imp)"));
  EXPECT_EQ(log.events(2).kind(), PHASE_CHANGE);
  EXPECT_EQ(log.setup().seed(), 42);
  EXPECT_EQ(log.setup().script(), "Trouble Brewing");
  EXPECT_EQ(game.state().phase(), NIGHT);
}

TEST(Game, FirstNightEvilInfo) {
  ScriptedDecisionProvider provider;
  Game game(TroubleBrewing(),
            MakeSetup({IMP, POISONER, WASHERWOMAN, CHEF, EMPATH, MONK,
                       SOLDIER}),
            GameOptions(), &provider);
  game.RunNight();
  const vector<string>& demon_info = game.state().PrivateInfo(0);
  ASSERT_FALSE(demon_info.empty());
  EXPECT_THAT(demon_info[0], HasSubstr("Your Minions are: P2."));
  const string bluffs = demon_info[0].substr(
      demon_info[0].find("not in play: ") + 13);
  EXPECT_EQ(vector<string>(absl::StrSplit(bluffs, ", ")).size(), 3);
  for (Character c : {IMP, POISONER, WASHERWOMAN, CHEF, EMPATH, MONK,
                      SOLDIER}) {
    EXPECT_THAT(bluffs, testing::Not(HasSubstr(CharacterDisplayName(c))));
  }
  EXPECT_EQ(game.state().PrivateInfo(1)[0], "The Demon is P1.");
}

TEST(Game, DemonKillsAtNight) {
  ScriptedDecisionProvider provider;
  provider.AddNightTargets("P2", {"P3"})
      .AddNightTargets("P2", {"P3"})
      .AddNightTargets("P1", {"P4"});
  Game game(TroubleBrewing(),
            MakeSetup({IMP, POISONER, WASHERWOMAN, CHEF, EMPATH}),
            GameOptions(), &provider);
  game.RunNight();
  game.RunDay();
  EXPECT_EQ(game.state().NumAlive(), 5);
  game.RunNight();
  EXPECT_EQ(game.state().round(), 2);
  EXPECT_EQ(game.state().NumAlive(), 4);
  EXPECT_FALSE(game.state().IsAlive(3));
  EXPECT_EQ(EvaluateWinCondition(game.state().players()), TEAM_UNSPECIFIED);
  EXPECT_FALSE(game.state().IsGameOver());
  EXPECT_TRUE(HasEvent(game.log(), PHASE_CHANGE,
                       "Dawn breaks. P4 died tonight."));
}

TEST(Game, PoisonEndsWhenThePoisonerBecomesTheImp) {
  ScriptedDecisionProvider provider;
  provider.AddNightTargets("P2", {"P5"})
      .AddNightTargets("P2", {"P4"})
      .AddNightTargets("P1", {"P1"})
      .AddNightTargets("P2", {"P3"});
  Game game(TroubleBrewing(),
            MakeSetup({IMP, POISONER, WASHERWOMAN, CHEF, EMPATH}),
            GameOptions(), &provider);
  game.RunNight();
  game.RunDay();
  game.RunNight();
  ASSERT_EQ(game.state().player(1).character, IMP);
  game.RunDay();
  EXPECT_TRUE(IsImpaired(game.state(), 3));
  game.RunNight();
  EXPECT_FALSE(game.state().IsAlive(2));
  game.RunDay();
  EXPECT_EQ(game.state().round(), 3);
  EXPECT_FALSE(IsImpaired(game.state(), 3));
}

TEST(Game, EveryonePassingEndsTheDay) {
  ScriptedDecisionProvider provider;
  Game game(TroubleBrewing(),
            MakeSetup({IMP, POISONER, WASHERWOMAN, CHEF, EMPATH}),
            GameOptions(), &provider);
  game.RunNight();
  game.RunDay();
  // Two rounds of passes, the check is skipped in the first one.
  EXPECT_EQ(CountEvents(game.log(), PLAYER_PASS), 10);
  EXPECT_FALSE(game.state().nominations_open());
  EXPECT_TRUE(HasEvent(game.log(), PHASE_CHANGE, "Everyone passed"));
  EXPECT_TRUE(HasEvent(game.log(), PHASE_CHANGE, "Nobody is executed today"));
}

TEST(Game, ExecutionAtTheEndOfTheDay) {
  ScriptedDecisionProvider provider;
  provider.AddNominate("P1", "P4").AddVotes({"P1", "P2", "P3"}, YES);
  Game game(TroubleBrewing(),
            MakeSetup({IMP, POISONER, WASHERWOMAN, CHEF, EMPATH}),
            kOpenNominations, &provider);
  game.RunNight();
  game.RunDay();
  EXPECT_FALSE(game.state().IsAlive(3));
  EXPECT_EQ(CountEvents(game.log(), EXECUTION), 1);
  EXPECT_EQ(game.state().tokens().Get(UNDERTAKER_EXECUTED), 3);
  EXPECT_FALSE(game.state().IsGameOver());
}

TEST(Game, TiedVoteMeansNoExecution) {
  ScriptedDecisionProvider provider;
  provider.AddNominate("P1", "P4").AddNominate("P2", "P5");
  provider.AddVotes({"P1", "P2", "P3"}, YES);
  provider.AddVotes({"P1", "P2", "P3"}, YES);
  Game game(TroubleBrewing(),
            MakeSetup({IMP, POISONER, WASHERWOMAN, CHEF, EMPATH}),
            kOpenNominations, &provider);
  game.RunNight();
  game.RunDay();
  EXPECT_EQ(CountEvents(game.log(), NOMINATION), 2);
  EXPECT_EQ(CountEvents(game.log(), EXECUTION), 0);
  EXPECT_EQ(game.state().NumAlive(), 5);
}

TEST(Game, MayorWinsWithThreeAliveAndNoExecution) {
  ScriptedDecisionProvider provider;
  Game game(TroubleBrewing(),
            MakeSetup({IMP, POISONER, MAYOR, CHEF, EMPATH}),
            GameOptions(), &provider);
  game.RunNight();
  game.mutable_state()->KillPlayer(3, "test");
  game.mutable_state()->KillPlayer(4, "test");
  // The ordinary check alone would not end the game.
  EXPECT_EQ(EvaluateWinCondition(game.state().players()), TEAM_UNSPECIFIED);
  game.RunDay();
  EXPECT_TRUE(game.state().IsGameOver());
  EXPECT_EQ(game.state().victory(), GOOD);
  EXPECT_EQ(CountEvents(game.log(), MAYOR_WIN), 1);
}

TEST(Game, PoisonedMayorDoesNotWin) {
  ScriptedDecisionProvider provider;
  provider.AddNightTargets("P2", {"P3"});
  Game game(TroubleBrewing(),
            MakeSetup({IMP, POISONER, MAYOR, CHEF, EMPATH}),
            GameOptions(), &provider);
  game.RunNight();
  game.mutable_state()->KillPlayer(3, "test");
  game.mutable_state()->KillPlayer(4, "test");
  game.RunDay();
  EXPECT_FALSE(game.state().IsGameOver());
}

TEST(Game, VirginEndsTheDay) {
  ScriptedDecisionProvider provider;
  provider.AddNominate("P4", "P3");
  Game game(TroubleBrewing(),
            MakeSetup({IMP, POISONER, VIRGIN, CHEF, EMPATH}),
            kOpenNominations, &provider);
  game.RunNight();
  game.RunDay();
  EXPECT_FALSE(game.state().IsAlive(3));
  EXPECT_EQ(CountEvents(game.log(), EXECUTION), 1);
  EXPECT_EQ(CountEvents(game.log(), NOMINATION), 0);
  EXPECT_EQ(CountEvents(game.log(), VOTING), 0);
  // Nobody acts after the execution.
  const int n = game.log().events_size();
  EXPECT_EQ(game.log().events(n - 2).kind(), EXECUTION);
  EXPECT_EQ(game.log().events(n - 1).kind(), PLAYER_DEATH);
}

TEST(Game, SaintExecutionLosesTheGame) {
  ScriptedDecisionProvider provider;
  provider.AddNominate("P1", "P3").AddVotes({"P1", "P2", "P4"}, YES);
  Game game(TroubleBrewing(),
            MakeSetup({IMP, POISONER, SAINT, CHEF, EMPATH, MONK}),
            kOpenNominations, &provider);
  EXPECT_EQ(game.Run(), EVIL);
  EXPECT_EQ(CountEvents(game.log(), SAINT_LOSS), 1);
  EXPECT_EQ(game.log().victory(), EVIL);
  EXPECT_EQ(game.state().round(), 1);
}

TEST(Game, SlayerKillsTheDemon) {
  ScriptedDecisionProvider provider;
  provider.AddCounterAbility("P3", "P1");
  Game game(TroubleBrewing(),
            MakeSetup({IMP, POISONER, SLAYER, CHEF, EMPATH}),
            GameOptions(), &provider);
  EXPECT_EQ(game.Run(), GOOD);
  EXPECT_FALSE(game.state().IsAlive(0));
  EXPECT_EQ(game.log().events().rbegin()->kind(), GAME_END);
}

TEST(Game, EndsWhenNoNominationCanChangeTheOutcome) {
  ScriptedDecisionProvider provider;
  provider.AddNominate("P5", "P1").AddNominate("P1", "P5");
  Game game(TroubleBrewing(),
            MakeSetup({IMP, POISONER, WASHERWOMAN, CHEF, EMPATH}),
            kOpenNominations, &provider);
  game.RunNight();
  game.mutable_state()->KillPlayer(2, "test");
  game.mutable_state()->KillPlayer(3, "test");
  game.RunDay();
  // Only the two evil players could still nominate each other.
  EXPECT_TRUE(HasEvent(game.log(), PHASE_CHANGE,
                       "No nomination can change the outcome"));
  EXPECT_EQ(CountEvents(game.log(), NOMINATION), 2);
  EXPECT_FALSE(game.state().IsGameOver());
}

TEST(Game, DeadPlayersCannotNominate) {
  ScriptedDecisionProvider provider;
  provider.AddNominate("P5", "P1").AddMessage("P5", {"P3"}, "Trust P3");
  Game game(TroubleBrewing(),
            MakeSetup({IMP, POISONER, WASHERWOMAN, CHEF, EMPATH}),
            kOpenNominations, &provider);
  game.RunNight();
  game.mutable_state()->KillPlayer(4, "test");
  game.RunDay();
  EXPECT_TRUE(HasEvent(game.log(), INVALID_ACTION, "P5 cannot nominate now"));
  EXPECT_FALSE(game.state().player(0).nominated_today);
  EXPECT_THAT(game.state().PrivateInfo(2),
              testing::Contains("Message from P5: Trust P3"));
}

TEST(Game, InvalidDayActionsCountAsPass) {
  ScriptedDecisionProvider provider;
  for (int i = 0; i < 3; ++i) {
    provider.AddNominate("P2", "Nobody");
  }
  Game game(TroubleBrewing(),
            MakeSetup({IMP, POISONER, WASHERWOMAN, CHEF, EMPATH}),
            GameOptions(), &provider);
  game.RunNight();
  game.RunDay();
  EXPECT_TRUE(HasEvent(game.log(), PLAYER_PASS,
                       "P2 passes after invalid actions"));
  // Still a full day of passing.
  EXPECT_TRUE(HasEvent(game.log(), PHASE_CHANGE, "Everyone passed"));
}

TEST(Game, ProviderFailureEndsTheDay) {
  ScriptedDecisionProvider provider;
  for (int i = 0; i < 3; ++i) {
    provider.AddError("P2", DAY_ACTION, "timeout");
  }
  Game game(TroubleBrewing(),
            MakeSetup({IMP, POISONER, WASHERWOMAN, CHEF, EMPATH}),
            GameOptions(), &provider);
  game.RunNight();
  game.RunDay();
  EXPECT_TRUE(HasEvent(game.log(), PHASE_CHANGE,
                       "No decision from P2, the day ends early"));
  EXPECT_FALSE(HasEvent(game.log(), PHASE_CHANGE, "Everyone passed"));
  EXPECT_EQ(game.state().phase(), DAY);
  // The game goes on.
  game.RunNight();
  EXPECT_EQ(game.state().round(), 2);
}

TEST(Game, StopsAtTheRoundLimit) {
  // The Poisoner keeps poisoning the Imp, so nobody dies.
  ScriptedDecisionProvider provider;
  GameOptions options;
  options.max_rounds = 3;
  Game game(TroubleBrewing(),
            MakeSetup({IMP, POISONER, WASHERWOMAN, CHEF, EMPATH}),
            options, &provider);
  EXPECT_EQ(game.Run(), TEAM_UNSPECIFIED);
  EXPECT_EQ(game.state().round(), 3);
  EXPECT_EQ(game.state().NumAlive(), 5);
  EXPECT_EQ(game.log().events().rbegin()->kind(), GAME_END);
  EXPECT_EQ(CountEvents(game.log(), ROUND_START), 2);
}

TEST(Game, ReplayIsDeterministic) {
  GameConfig config;
  config.set_seed(1234);
  config.add_player_names("Alice");
  for (const string& name : {"Bob", "Carol", "Dave", "Eve", "Frank", "Grace",
                             "Heidi", "Ivan"}) {
    config.add_player_names(name);
  }
  Rng rng(config.seed());
  absl::StatusOr<Setup> setup = RandomSetup(TroubleBrewing(), config, &rng);
  ASSERT_TRUE(setup.ok()) << setup.status();

  RandomDecisionProvider random(99);
  Game game(TroubleBrewing(), *setup, GameOptions(), &random);
  const Team winner = game.Run();

  ScriptedDecisionProvider replay =
      ScriptedDecisionProvider::FromLog(game.log(), nullptr);
  Game replayed(TroubleBrewing(), game.log().setup(), GameOptions(), &replay);
  EXPECT_EQ(replayed.Run(), winner);
  EXPECT_EQ(Descriptions(replayed.log()), Descriptions(game.log()));
  EXPECT_EQ(replayed.log().decisions_size(), game.log().decisions_size());
  EXPECT_EQ(replay.Remaining(), 0);
}

TEST(Game, ResumesWithTheFallbackProvider) {
  GameConfig config;
  config.set_seed(77);
  Rng rng(config.seed());
  absl::StatusOr<Setup> setup = RandomSetup(TroubleBrewing(), config, &rng);
  ASSERT_TRUE(setup.ok());
  RandomDecisionProvider random(3);
  Game game(TroubleBrewing(), *setup, GameOptions(), &random);
  game.RunNight();
  game.RunDay();

  RandomDecisionProvider fallback(4);
  ScriptedDecisionProvider replay =
      ScriptedDecisionProvider::FromLog(game.log(), &fallback);
  Game resumed(TroubleBrewing(), game.log().setup(), GameOptions(), &replay);
  resumed.RunNight();
  resumed.RunDay();
  EXPECT_EQ(Descriptions(resumed.log()), Descriptions(game.log()));
  if (!game.state().IsGameOver()) {
    resumed.Run();
    EXPECT_GT(resumed.log().events_size(), game.log().events_size());
  }
}

// Plays many random games and checks the invariants that hold for all of
// them.
TEST(Game, RandomGameProperties) {
  for (uint64_t seed = 1; seed <= 30; ++seed) {
    GameConfig config;
    config.set_seed(seed);
    Rng rng(seed);
    const int num_players = kMinPlayers + seed % (kMaxPlayers - kMinPlayers + 1);
    *config.mutable_counts() = *StandardCounts(num_players);
    absl::StatusOr<Setup> setup = RandomSetup(TroubleBrewing(), config, &rng);
    ASSERT_TRUE(setup.ok()) << setup.status();
    ASSERT_EQ(setup->seats_size(), num_players);

    RandomDecisionProvider random(seed);
    GameOptions options;
    options.max_rounds = 8;
    Game game(TroubleBrewing(), *setup, options, &random);
    const Team winner = game.Run();
    const GameState& g = game.state();

    map<int, int> executions_per_day, demon_kills_per_night;
    int last_round = 0;
    for (const auto& event : game.log().events()) {
      EXPECT_GE(event.round(), last_round);
      last_round = event.round();
      if (event.kind() == EXECUTION) {
        ++executions_per_day[event.round()];
      }
      if (event.kind() == PLAYER_DEATH &&
          event.metadata().at("cause") == "killed by the Demon") {
        ++demon_kills_per_night[event.round()];
      }
    }
    for (const auto& [round, executions] : executions_per_day) {
      EXPECT_LE(executions, 1) << "seed " << seed << " day " << round;
    }
    for (const auto& [round, kills] : demon_kills_per_night) {
      EXPECT_LE(kills, 1) << "seed " << seed << " night " << round;
    }

    int alive_demons = 0;
    for (const Player& p : g.players()) {
      alive_demons += p.alive && CategoryOf(p.character) == DEMON;
    }
    EXPECT_LE(alive_demons, 1);
    if (winner == TEAM_UNSPECIFIED) {
      EXPECT_EQ(alive_demons, 1) << "seed " << seed;
      EXPECT_GT(g.NumAlive(), 2) << "seed " << seed;
    } else if (winner == GOOD && CountEvents(game.log(), MAYOR_WIN) == 0) {
      EXPECT_EQ(alive_demons, 0) << "seed " << seed;
    } else if (winner == EVIL && CountEvents(game.log(), SAINT_LOSS) == 0) {
      EXPECT_LE(g.NumAlive(), 2) << "seed " << seed;
    }
    EXPECT_EQ(CountEvents(game.log(), GAME_END), 1);
  }
}

TEST(RandomSetup, DefaultGame) {
  Rng rng(5);
  absl::StatusOr<Setup> setup = RandomSetup(TroubleBrewing(), GameConfig(),
                                            &rng);
  ASSERT_TRUE(setup.ok()) << setup.status();
  ASSERT_EQ(setup->seats_size(), 6);
  std::set<Character> characters;
  std::set<string> names;
  for (const Seat& seat : setup->seats()) {
    characters.insert(seat.character());
    names.insert(seat.name());
    EXPECT_THAT(DefaultPlayerNames(), testing::Contains(seat.name()));
  }
  for (const Seat& seat : setup->seats()) {
    if (seat.character() == DRUNK) {
      EXPECT_EQ(CategoryOf(seat.drunk_character()), TOWNSFOLK);
      EXPECT_EQ(characters.count(seat.drunk_character()), 0);
    }
  }
  EXPECT_EQ(names.size(), 6);
  EXPECT_THAT(characters, testing::UnorderedElementsAre(
      IMP, POISONER, SLAYER, FORTUNE_TELLER, UNDERTAKER, DRUNK));
  EXPECT_NE(setup->seed(), 0);
  // Play does not reuse the setup stream.
  EXPECT_NE(setup->seed(), 5);
}

TEST(RandomSetup, SameSeedSameSetup) {
  GameConfig config;
  *config.mutable_counts() = *StandardCounts(11);
  Rng a(8), b(8);
  absl::StatusOr<Setup> first = RandomSetup(TroubleBrewing(), config, &a);
  absl::StatusOr<Setup> second = RandomSetup(TroubleBrewing(), config, &b);
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(first->DebugString(), second->DebugString());
}

TEST(RandomSetup, RejectsBadConfigs) {
  Rng rng(1);
  GameConfig config;
  config.add_characters(IMP);
  config.add_characters(POISONER);
  config.add_characters(CHEF);
  config.add_characters(CHEF);
  config.add_characters(EMPATH);
  EXPECT_EQ(RandomSetup(TroubleBrewing(), config, &rng).status().code(),
            absl::StatusCode::kInvalidArgument);

  config.Clear();
  for (const string& name : {"A", "B", "C", "D"}) {
    config.add_player_names(name);
  }
  EXPECT_FALSE(RandomSetup(TroubleBrewing(), config, &rng).ok());

  config.Clear();
  *config.mutable_counts() = *StandardCounts(7);
  config.add_player_names("A");
  config.add_player_names("B");
  EXPECT_FALSE(RandomSetup(TroubleBrewing(), config, &rng).ok());
}

TEST(OptionsFromConfig, Defaults) {
  GameOptions options = OptionsFromConfig(GameConfig());
  EXPECT_EQ(options.max_rounds, 6);
  EXPECT_EQ(options.day_action_rounds, 4);
  EXPECT_EQ(options.nominations_open_round, 3);
  EXPECT_EQ(options.max_retries, 2);
  EXPECT_EQ(options.num_demon_bluffs, 3);
  GameConfig config;
  config.set_max_rounds(10);
  config.set_nominations_open_round(1);
  options = OptionsFromConfig(config);
  EXPECT_EQ(options.max_rounds, 10);
  EXPECT_EQ(options.nominations_open_round, 1);
}
}  // namespace
}  // namespace storyteller

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
