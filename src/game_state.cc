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

#include "src/game_state.h"

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "ortools/base/logging.h"
#include "src/status_resolver.h"

namespace storyteller {

GameStats ComputeStats(const GameLog& log) {
  GameStats stats;
  for (const auto& event : log.events()) {
    stats.rounds = std::max(stats.rounds, event.round());
    switch (event.kind()) {
      case PLAYER_DEATH:
        ++stats.deaths;
        break;
      case EXECUTION:
        ++stats.executions;
        break;
      case NOMINATION:
        ++stats.nominations;
        break;
      default:
        break;
    }
  }
  stats.victory = log.victory();
  return stats;
}

GameState::GameState(const Script& script, const Setup& setup)
    : script_(script), round_(1), phase_(SETUP), nominations_open_(false),
      victory_(TEAM_UNSPECIFIED) {
  vector<Character> characters;
  for (const auto& seat : setup.seats()) {
    characters.push_back(seat.character());
  }
  absl::Status st = ValidateSetup(script_, characters);
  CHECK(st.ok()) << st;
  *log_.mutable_setup() = setup;
  log_.mutable_setup()->set_script(script_.name);
  for (const auto& seat : setup.seats()) {
    CHECK(!seat.name().empty()) << "Player name cannot be empty string";
    CHECK(player_index_.find(seat.name()) == player_index_.end())
        << "Duplicate player name " << seat.name();
    Player p;
    p.name = seat.name();
    p.character = seat.character();
    p.team = TeamOf(seat.character());
    if (seat.character() == DRUNK) {
      const Character believed = seat.drunk_character();
      CHECK_EQ(CategoryOf(believed), TOWNSFOLK)
          << "The Drunk needs to believe they are a Townsfolk";
      CHECK(std::find(characters.begin(), characters.end(), believed) ==
            characters.end())
          << "The Drunk cannot believe they are an in-play character";
      p.drunk_character = believed;
    } else {
      CHECK_EQ(seat.drunk_character(), CHARACTER_UNSPECIFIED)
          << seat.name() << " is not the Drunk";
    }
    player_index_[p.name] = players_.size();
    players_.push_back(p);
  }
  poisoned_by_.resize(players_.size());
  private_info_.resize(players_.size());
  const int drunk = FindCharacter(DRUNK);
  if (drunk != kNoPlayer) {
    tokens_.Set(IS_THE_DRUNK, drunk);
  }
}

const Player& GameState::player(int i) const {
  CHECK_GE(i, 0);
  CHECK_LT(i, players_.size());
  return players_[i];
}

Player* GameState::mutable_player(int i) {
  CHECK_GE(i, 0);
  CHECK_LT(i, players_.size());
  return &players_[i];
}

vector<string> GameState::Names(absl::Span<const int> players) const {
  vector<string> names;
  for (int p : players) {
    names.push_back(Name(p));
  }
  return names;
}

absl::StatusOr<int> GameState::FindPlayer(const string& name) const {
  const auto it = player_index_.find(name);
  if (it == player_index_.end()) {
    return absl::NotFoundError(absl::StrCat("Invalid player name: ", name));
  }
  return it->second;
}

int GameState::PlayerIndex(const string& name) const {
  absl::StatusOr<int> i = FindPlayer(name);
  CHECK(i.ok()) << i.status();
  return *i;
}

int GameState::FindCharacter(Character character) const {
  for (int i = 0; i < players_.size(); ++i) {
    if (players_[i].character == character) {
      return i;
    }
  }
  return kNoPlayer;
}

int GameState::FindBeliever(Character character) const {
  for (int i = 0; i < players_.size(); ++i) {
    if (players_[i].BelievedCharacter() == character) {
      return i;
    }
  }
  return kNoPlayer;
}

int GameState::NumAlive() const {
  return std::count_if(players_.begin(), players_.end(),
                       [](const Player& p) { return p.alive; });
}

vector<int> GameState::AlivePlayers() const {
  vector<int> result;
  for (int i = 0; i < players_.size(); ++i) {
    if (players_[i].alive) {
      result.push_back(i);
    }
  }
  return result;
}

vector<int> GameState::AliveNeighbors(int player) const {
  const int n = players_.size();
  vector<int> result;
  for (int i = 1; i < n; ++i) {
    const int right = (player + i) % n;
    if (players_[right].alive) {
      result.push_back(right);
      break;
    }
  }
  for (int i = 1; i < n; ++i) {
    const int left = (player - i + n) % n;
    if (players_[left].alive) {
      if (result.empty() || result[0] != left) {
        result.push_back(left);
      }
      break;
    }
  }
  return result;
}

void GameState::StartNight() {
  CHECK_NE(phase_, NIGHT) << "Night needs to follow setup or a day";
  if (phase_ == DAY) {
    ++round_;
  }
  phase_ = NIGHT;
  // Poison lasts for a night and the following day.
  for (auto& poisoners : poisoned_by_) {
    poisoners.clear();
  }
  tokens_.ClearScope(TokenScope::kOneDay);
  if (round_ > 1) {
    AddEvent(ROUND_START, absl::StrFormat("Round %d begins", round_));
  }
  AddEvent(PHASE_CHANGE, absl::StrFormat("Night %d falls", round_));
}

void GameState::StartDay() {
  CHECK_EQ(phase_, NIGHT) << "Day needs to follow a night";
  phase_ = DAY;
  for (Player& p : players_) {
    p.nominated_today = false;
    p.used_nomination = false;
  }
  chopping_block_.reset();
  nominations_open_ = false;
  tokens_.ClearScope(TokenScope::kOneNight);
  AddEvent(PHASE_CHANGE, absl::StrFormat("Day %d begins", round_));
}

const set<int>& GameState::PoisonersOf(int player) const {
  CHECK_GE(player, 0);
  CHECK_LT(player, poisoned_by_.size());
  return poisoned_by_[player];
}

void GameState::SetPoisonTarget(int poisoner, int target) {
  for (auto& poisoners : poisoned_by_) {
    poisoners.erase(poisoner);
  }
  if (target != kNoPlayer) {
    CHECK_GE(target, 0);
    CHECK_LT(target, poisoned_by_.size());
    poisoned_by_[target].insert(poisoner);
  }
}

void GameState::SetChoppingBlock(int nominee, int votes) {
  CHECK(IsAlive(nominee)) << Name(nominee) << " is dead";
  chopping_block_ = internal::ChoppingBlock{.nominee = nominee,
                                            .votes = votes};
}

void GameState::ClearChoppingBlock() {
  chopping_block_.reset();
}

void GameState::OpenNominations() {
  CHECK_EQ(phase_, DAY);
  nominations_open_ = true;
  AddEvent(PHASE_CHANGE, "Nominations are now open");
}

bool GameState::KillPlayer(int player, const string& cause) {
  Player* p = mutable_player(player);
  if (!p->alive) {
    return false;
  }
  p->alive = false;
  if (chopping_block_.has_value() && chopping_block_->nominee == player) {
    chopping_block_.reset();
  }
  AddEvent(PLAYER_DEATH, absl::StrFormat("%s died (%s)", p->name, cause),
           {player}, {{"cause", cause}});
  ScarletWomanCheck(player);
  return true;
}

void GameState::ScarletWomanCheck(int dead_player) {
  const Character demon = player(dead_player).character;
  if (CategoryOf(demon) != DEMON) {
    return;
  }
  vector<int> scarlet_women;
  for (int i = 0; i < players_.size(); ++i) {
    if (players_[i].alive && players_[i].character == SCARLET_WOMAN &&
        !IsImpaired(*this, i)) {
      scarlet_women.push_back(i);
    }
  }
  if (scarlet_women.size() != 1 || NumAlive() < 4) {
    return;
  }
  const int sw = scarlet_women[0];
  players_[sw].character = demon;
  AddEvent(SCARLET_WOMAN_TRANSFORM,
           absl::StrFormat("%s (Scarlet Woman) becomes the %s",
                           Name(sw), CharacterDisplayName(demon)),
           {sw, dead_player});
  Whisper(sw, absl::StrFormat(
      "The Demon has died and you have become the new Demon. "
      "You are now the %s.", CharacterDisplayName(demon)));
}

void GameState::Execute(int player, const string& reason) {
  CHECK(IsAlive(player)) << "Cannot execute dead player " << Name(player);
  tokens_.Set(UNDERTAKER_EXECUTED, player);
  AddEvent(EXECUTION, absl::StrFormat("%s is executed: %s", Name(player),
                                      reason), {player});
  KillPlayer(player, "executed");
  if (players_[player].character == SAINT && !IsImpaired(*this, player)) {
    SetVictory(EVIL, SAINT_LOSS,
               absl::StrFormat("%s was the Saint", Name(player)));
  }
}

void GameState::SetVictory(Team team, EventKind kind, const string& reason) {
  CHECK_NE(team, TEAM_UNSPECIFIED);
  if (IsGameOver()) {
    VLOG(1) << "Game already won by " << Team_Name(victory_)
            << ", ignoring " << Team_Name(team) << " victory: " << reason;
    return;
  }
  victory_ = team;
  log_.set_victory(team);
  if (kind != GAME_END) {
    AddEvent(kind, reason);
  }
  AddEvent(GAME_END, absl::StrFormat("%s team wins: %s",
                                     team == GOOD ? "Good" : "Evil", reason),
           {}, {{"winner", Team_Name(team)}});
}

void GameState::Whisper(int player, const string& info) {
  CHECK_GE(player, 0);
  CHECK_LT(player, private_info_.size());
  private_info_[player].push_back(info);
  AddEvent(STORYTELLER_INFO, absl::StrFormat("To %s: %s", Name(player), info),
           {player});
}

const vector<string>& GameState::PrivateInfo(int player) const {
  CHECK_GE(player, 0);
  CHECK_LT(player, private_info_.size());
  return private_info_[player];
}

void GameState::AddMessage(int sender, absl::Span<const int> recipients,
                           const string& text) {
  vector<int> participants = {sender};
  participants.insert(participants.end(), recipients.begin(),
                      recipients.end());
  AddEvent(MESSAGE, absl::StrFormat("%s to %s: %s", Name(sender),
                                    absl::StrJoin(Names(recipients), ", "),
                                    text), participants);
  for (int r : recipients) {
    private_info_[r].push_back(
        absl::StrFormat("Message from %s: %s", Name(sender), text));
  }
}

void GameState::AddEvent(EventKind kind, const string& description,
                         absl::Span<const int> participants,
                         const map<string, string>& metadata) {
  Event* event = log_.add_events();
  event->set_timestamp(
      absl::FormatTime(absl::RFC3339_sec, absl::Now(), absl::UTCTimeZone()));
  event->set_round(round_);
  event->set_phase(phase_);
  event->set_kind(kind);
  event->set_description(description);
  for (int p : participants) {
    event->add_participants(Name(p));
  }
  for (const auto& [key, value] : metadata) {
    (*event->mutable_metadata())[key] = value;
  }
  LOG(INFO) << "[" << round_ << " " << Phase_Name(phase_) << "] "
            << description;
}

PublicState GameState::ToPublicState() const {
  PublicState state;
  for (const Player& p : players_) {
    auto* seat = state.add_seats();
    seat->set_name(p.name);
    seat->set_alive(p.alive);
    seat->set_used_ghost_vote(p.used_ghost_vote);
  }
  state.set_round(round_);
  state.set_phase(phase_);
  if (chopping_block_.has_value()) {
    state.mutable_chopping_block()->set_nominee(
        Name(chopping_block_->nominee));
    state.mutable_chopping_block()->set_votes(chopping_block_->votes);
  }
  state.set_nominations_open(nominations_open_);
  return state;
}

PrivateState GameState::ToPrivateState(int player) const {
  const Player& p = this->player(player);
  PrivateState state;
  state.set_name(p.name);
  state.set_character(p.BelievedCharacter());
  state.set_team(p.team);
  state.set_alive(p.alive);
  state.set_used_nomination(p.used_nomination);
  state.set_used_counter_ability(p.used_counter_ability);
  state.set_used_ghost_vote(p.used_ghost_vote);
  for (const string& info : PrivateInfo(player)) {
    state.add_info(info);
  }
  return state;
}

string GameState::Grimoire() const {
  vector<string> lines;
  for (int i = 0; i < players_.size(); ++i) {
    const Player& p = players_[i];
    string line = absl::StrFormat("%s: %s, %s", p.name,
                                  CharacterDisplayName(p.character),
                                  p.alive ? "alive" : "dead");
    if (p.drunk_character != CHARACTER_UNSPECIFIED) {
      absl::StrAppend(&line, ", believes they are the ",
                      CharacterDisplayName(p.drunk_character));
    }
    if (!poisoned_by_[i].empty()) {
      vector<int> poisoners(poisoned_by_[i].begin(), poisoned_by_[i].end());
      absl::StrAppend(&line, ", poisoned by ",
                      absl::StrJoin(Names(poisoners), ", "));
    }
    lines.push_back(line);
  }
  for (const auto& [token, holder] : tokens_.Active()) {
    lines.push_back(absl::StrFormat("Token %s: %s", ReminderToken_Name(token),
                                    Name(holder)));
  }
  return absl::StrJoin(lines, "\n");
}

}  // namespace storyteller
