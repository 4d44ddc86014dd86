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

#include <filesystem>
#include <iostream>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/status/statusor.h"
#include "src/config.pb.h"
#include "src/decision_provider.h"
#include "src/game.h"
#include "src/game_log.pb.h"
#include "src/game_state.h"
#include "src/rng.h"
#include "src/script.h"
#include "src/util.h"

using std::cout;
using std::endl;
using std::filesystem::path;
using std::string;

// All files below are in text proto format.
ABSL_FLAG(string, config, "", "Optional game config file path.");
ABSL_FLAG(uint64_t, seed, 0, "Random seed, overrides the config if set.");
ABSL_FLAG(int, max_rounds, 0, "Round limit, overrides the config if set.");
ABSL_FLAG(string, game_log, "", "Optional game log output file.");
ABSL_FLAG(string, resume_from, "",
          "Optional game log to replay before continuing the game.");

namespace storyteller {

void Run() {
  GameConfig config;
  path config_file = absl::GetFlag(FLAGS_config);
  if (!config_file.empty()) {
    absl::Status st = ReadProtoFromFile(config_file, &config);
    CHECK(st.ok()) << st;
  }
  if (absl::GetFlag(FLAGS_seed) != 0) {
    config.set_seed(absl::GetFlag(FLAGS_seed));
  }
  if (absl::GetFlag(FLAGS_max_rounds) > 0) {
    config.set_max_rounds(absl::GetFlag(FLAGS_max_rounds));
  }
  const GameOptions options = OptionsFromConfig(config);

  Setup setup;
  GameLog recorded;
  path resume_from = absl::GetFlag(FLAGS_resume_from);
  if (!resume_from.empty()) {
    absl::Status st = ReadProtoFromFile(resume_from, &recorded);
    CHECK(st.ok()) << st;
    setup = recorded.setup();
  } else {
    Rng rng(config.seed());
    absl::StatusOr<Setup> drawn = RandomSetup(TroubleBrewing(), config, &rng);
    CHECK(drawn.ok()) << drawn.status();
    setup = *drawn;
  }

  RandomDecisionProvider random(setup.seed() + 1);
  ScriptedDecisionProvider replay =
      ScriptedDecisionProvider::FromLog(recorded, &random);
  Game game(TroubleBrewing(), setup, options, &replay);
  const Team winner = game.Run();

  path game_log = absl::GetFlag(FLAGS_game_log);
  if (!game_log.empty()) {
    absl::Status st = WriteProtoToFile(game.log(), game_log);
    CHECK(st.ok()) << st;
    cout << "Game log written to " << game_log << endl;
  }
  const GameStats stats = ComputeStats(game.log());
  cout << "Winner: "
       << (winner == TEAM_UNSPECIFIED ? "none" : Team_Name(winner)) << "\n"
       << "Rounds: " << stats.rounds << "\n"
       << "Deaths: " << stats.deaths << "\n"
       << "Executions: " << stats.executions << "\n"
       << "Nominations: " << stats.nominations << endl;
}
}  // namespace storyteller

int main(int argc, char** argv) {
  absl::ParseCommandLine(argc, argv);
  storyteller::Run();
  return 0;
}
