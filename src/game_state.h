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

#ifndef SRC_GAME_STATE_H_
#define SRC_GAME_STATE_H_

#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "src/decision.pb.h"
#include "src/game_log.pb.h"
#include "src/player.h"
#include "src/reminder_tokens.h"
#include "src/script.h"

namespace storyteller {

using std::map;
using std::set;
using std::string;
using std::unordered_map;
using std::vector;

namespace internal {
// The pending execution and the vote count that put it there.
struct ChoppingBlock {
  int nominee = kNoPlayer;
  int votes = 0;
};
}  // namespace internal

// Summary numbers of a finished or partial game.
struct GameStats {
  int rounds = 0;
  int deaths = 0;
  int executions = 0;
  int nominations = 0;
  Team victory = TEAM_UNSPECIFIED;
};

GameStats ComputeStats(const GameLog& log);

// The full, true state of a game from the storyteller perspective: the
// roster, the reminder tokens, the poison graph and the chopping block. It
// owns the game log, and every state transition appends an event to it.
class GameState {
 public:
  // Fails a CHECK on an invalid setup: these are configuration bugs.
  GameState(const Script& script, const Setup& setup);

  const Script& script() const { return script_; }
  const GameLog& log() const { return log_; }
  GameLog* mutable_log() { return &log_; }

  // Roster.
  int NumPlayers() const { return players_.size(); }
  const Player& player(int i) const;
  Player* mutable_player(int i);
  const vector<Player>& players() const { return players_; }
  const string& Name(int i) const { return player(i).name; }
  vector<string> Names(absl::Span<const int> players) const;
  absl::StatusOr<int> FindPlayer(const string& name) const;
  int PlayerIndex(const string& name) const;  // Fails a CHECK if not found.
  // The first player currently holding the character, or kNoPlayer.
  int FindCharacter(Character character) const;
  // The first player who believes they are the character (the Drunk believes
  // they are a Townsfolk), or kNoPlayer.
  int FindBeliever(Character character) const;
  int NumAlive() const;
  bool IsAlive(int player) const { return this->player(player).alive; }
  vector<int> AlivePlayers() const;
  // The closest alive players clockwise and counter-clockwise, skipping the
  // dead. Empty if the player is the only one alive.
  vector<int> AliveNeighbors(int player) const;

  // Time.
  int round() const { return round_; }
  Phase phase() const { return phase_; }
  // Advances to the night, starting a new round after a day.
  void StartNight();
  // Resets the per-day flags, the chopping block and one-night tokens.
  void StartDay();

  // Reminder tokens.
  const ReminderTokens& tokens() const { return tokens_; }
  ReminderTokens* mutable_tokens() { return &tokens_; }

  // Poison graph: the players currently poisoning each player. Emptied at
  // the start of every night.
  const set<int>& PoisonersOf(int player) const;
  // The poisoner stops poisoning anyone else; if target is not kNoPlayer,
  // the poisoner now poisons the target.
  void SetPoisonTarget(int poisoner, int target);

  // Chopping block.
  const std::optional<internal::ChoppingBlock>& chopping_block() const {
    return chopping_block_;
  }
  void SetChoppingBlock(int nominee, int votes);
  void ClearChoppingBlock();
  bool nominations_open() const { return nominations_open_; }
  void OpenNominations();

  // Kills a living player and applies the Scarlet Woman rule. Returns false
  // if the player was already dead.
  bool KillPlayer(int player, const string& cause);
  // Executes a player: marks them for the Undertaker, kills them and applies
  // the Saint rule.
  void Execute(int player, const string& reason);

  // Game end. The first victory set stands.
  bool IsGameOver() const { return victory_ != TEAM_UNSPECIFIED; }
  Team victory() const { return victory_; }
  void SetVictory(Team team, EventKind kind, const string& reason);

  // Private storyteller info delivered to one player.
  void Whisper(int player, const string& info);
  const vector<string>& PrivateInfo(int player) const;
  // A private message between players, added to each recipient's history.
  void AddMessage(int sender, absl::Span<const int> recipients,
                  const string& text);

  // Appends an event to the log and writes it to the INFO log.
  void AddEvent(EventKind kind, const string& description,
                absl::Span<const int> participants = {},
                const map<string, string>& metadata = {});

  // Snapshots handed to decision providers.
  PublicState ToPublicState() const;
  PrivateState ToPrivateState(int player) const;

  // The full true state: characters, deaths, poison and tokens. Never
  // fabricated.
  string Grimoire() const;

 private:
  void ScarletWomanCheck(int dead_player);

  const Script& script_;
  vector<Player> players_;
  unordered_map<string, int> player_index_;
  int round_;
  Phase phase_;
  ReminderTokens tokens_;
  vector<set<int>> poisoned_by_;
  std::optional<internal::ChoppingBlock> chopping_block_;
  bool nominations_open_;
  Team victory_;
  vector<vector<string>> private_info_;
  GameLog log_;
};

}  // namespace storyteller

#endif  // SRC_GAME_STATE_H_
