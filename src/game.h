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

#ifndef SRC_GAME_H_
#define SRC_GAME_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "src/ability_resolver.h"
#include "src/config.pb.h"
#include "src/decision_broker.h"
#include "src/decision_provider.h"
#include "src/game_log.pb.h"
#include "src/game_state.h"
#include "src/nomination_engine.h"
#include "src/rng.h"
#include "src/script.h"

namespace storyteller {

using std::string;
using std::vector;

struct GameOptions {
  int max_rounds = 6;
  int day_action_rounds = 4;
  int nominations_open_round = 3;
  int max_retries = 2;
  int num_demon_bluffs = 3;
};

// The config values, with defaults for the unset ones.
GameOptions OptionsFromConfig(const GameConfig& config);

const vector<string>& DefaultPlayerNames();

// Draws names, characters, seating and the Drunk's belief from the config.
// The characters are taken from the config if listed, otherwise drawn for the
// given category counts or number of names, otherwise a default 6 player
// game is played.
absl::StatusOr<Setup> RandomSetup(const Script& script,
                                  const GameConfig& config, Rng* rng);

// Runs a whole game: alternating nights and days until a team wins or the
// round limit is reached. The storyteller randomness is seeded from the setup
// seed, so the setup plus the recorded decisions replay a game exactly.
class Game {
 public:
  Game(const Script& script, const Setup& setup, const GameOptions& options,
       DecisionProvider* provider);

  // Returns the winning team, or TEAM_UNSPECIFIED if the round limit was hit.
  Team Run();

  // Single phases, for tests.
  void RunNight();
  void RunDay();

  const GameState& state() const { return g_; }
  GameState* mutable_state() { return &g_; }
  const GameLog& log() const { return g_.log(); }
  DecisionBroker* broker() { return &broker_; }
  NominationEngine* nominations() { return &nominations_; }

  // The ordinary win check, run after every death and at phase ends.
  // Returns whether the game is over.
  bool CheckWin();

 private:
  enum DayActionResult { kActed, kPassed, kDayAborted, kExecutedByVirgin };

  void AnnounceSetup();
  void FirstNightInfo();
  DayActionContext NewDayActionContext(int player, int action_round) const;
  DayActionResult RunDayAction(int player, int action_round);
  // No further nomination could change today's outcome.
  bool NominationsExhausted() const;
  void EndDay(bool executed_today);

  GameOptions options_;
  Rng rng_;
  GameState g_;
  DecisionBroker broker_;
  AbilityResolver abilities_;
  NominationEngine nominations_;
};

}  // namespace storyteller

#endif  // SRC_GAME_H_
