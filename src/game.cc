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

#include <algorithm>
#include <numeric>
#include <set>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "ortools/base/logging.h"
#include "src/status_resolver.h"
#include "src/win_condition.h"

namespace storyteller {

GameOptions OptionsFromConfig(const GameConfig& config) {
  GameOptions options;
  if (config.max_rounds() > 0) {
    options.max_rounds = config.max_rounds();
  }
  if (config.day_action_rounds() > 0) {
    options.day_action_rounds = config.day_action_rounds();
  }
  if (config.nominations_open_round() > 0) {
    options.nominations_open_round = config.nominations_open_round();
  }
  if (config.max_retries() > 0) {
    options.max_retries = config.max_retries();
  }
  if (config.num_demon_bluffs() > 0) {
    options.num_demon_bluffs = config.num_demon_bluffs();
  }
  return options;
}

const vector<string>& DefaultPlayerNames() {
  static const vector<string>* const kNames = new vector<string>({
      "Susan", "John", "Emma", "Michael", "Olivia", "James", "Sophia",
      "William", "Ava", "Steve", "Emily", "Daniel", "Isabella", "David",
      "Mia"});
  return *kNames;
}

absl::StatusOr<Setup> RandomSetup(const Script& script,
                                  const GameConfig& config, Rng* rng) {
  vector<Character> characters;
  for (int c : config.characters()) {
    characters.push_back(static_cast<Character>(c));
  }
  if (characters.empty()) {
    CategoryCounts counts = config.counts();
    const int num_counted = counts.townsfolk() + counts.outsiders() +
                            counts.minions() + counts.demons();
    if (num_counted == 0 && config.player_names_size() > 0) {
      absl::StatusOr<CategoryCounts> standard =
          StandardCounts(config.player_names_size());
      if (!standard.ok()) {
        return standard.status();
      }
      counts = *standard;
    }
    if (num_counted > 0 || config.player_names_size() > 0) {
      absl::StatusOr<vector<Character>> drawn =
          DrawCharacters(script, counts, rng);
      if (!drawn.ok()) {
        return drawn.status();
      }
      characters = *drawn;
    } else {
      characters = {IMP, POISONER, SLAYER, FORTUNE_TELLER, UNDERTAKER, DRUNK};
    }
  }
  absl::Status st = ValidateSetup(script, characters);
  if (!st.ok()) {
    return st;
  }

  vector<string> names(config.player_names().begin(),
                       config.player_names().end());
  if (names.empty()) {
    names = DefaultPlayerNames();
  }
  if (std::set<string>(names.begin(), names.end()).size() != names.size()) {
    return absl::InvalidArgumentError("Duplicate player names");
  }
  for (const string& name : names) {
    if (name.empty()) {
      return absl::InvalidArgumentError("Player name cannot be empty");
    }
  }
  if (names.size() < characters.size()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "%d characters but only %d player names", characters.size(),
        names.size()));
  }
  names = rng->Sample(names, characters.size());
  rng->Shuffle(&characters);

  Setup setup;
  // Play continues the setup stream through a seed drawn from it.
  setup.set_seed(rng->NextSeed());
  setup.set_script(script.name);
  for (int i = 0; i < characters.size(); ++i) {
    Seat* seat = setup.add_seats();
    seat->set_name(names[i]);
    seat->set_character(characters[i]);
    if (characters[i] == DRUNK) {
      vector<Character> not_in_play;
      for (Character c : script.townsfolk) {
        if (std::find(characters.begin(), characters.end(), c) ==
            characters.end()) {
          not_in_play.push_back(c);
        }
      }
      seat->set_drunk_character(rng->Choose(not_in_play));
    }
  }
  return setup;
}

Game::Game(const Script& script, const Setup& setup,
           const GameOptions& options, DecisionProvider* provider)
    : options_(options), rng_(setup.seed()), g_(script, setup),
      broker_(&g_, provider, options.max_retries),
      abilities_(&g_, &broker_, &rng_),
      nominations_(&g_, &broker_, &abilities_) {
  CHECK_GT(options_.max_rounds, 0);
  CHECK_GT(options_.day_action_rounds, 0);
  CHECK_GT(options_.nominations_open_round, 0);
  CHECK_GE(options_.max_retries, 0);
  g_.mutable_log()->mutable_setup()->set_seed(rng_.seed());
}

Team Game::Run() {
  while (!g_.IsGameOver()) {
    if (g_.phase() == DAY && g_.round() >= options_.max_rounds) {
      g_.AddEvent(GAME_END, absl::StrFormat(
          "No team won after %d rounds", g_.round()));
      break;
    }
    if (g_.phase() == NIGHT) {
      RunDay();
    } else {
      RunNight();
    }
  }
  return g_.victory();
}

bool Game::CheckWin() {
  if (g_.IsGameOver()) {
    return true;
  }
  const Team winner = EvaluateWinCondition(g_.players());
  if (winner == GOOD) {
    g_.SetVictory(GOOD, GAME_END, "The Demon is dead");
  } else if (winner == EVIL) {
    g_.SetVictory(EVIL, GAME_END,
                  absl::StrFormat("Only %d players are alive", g_.NumAlive()));
  }
  return g_.IsGameOver();
}

void Game::AnnounceSetup() {
  const int n = g_.NumPlayers();
  vector<int> all(n);
  std::iota(all.begin(), all.end(), 0);
  g_.AddEvent(GAME_START, absl::StrFormat(
      "A game of %s begins with %d players: %s", g_.script().name, n,
      absl::StrJoin(g_.Names(all), ", ")), all,
      {{"seed", absl::StrCat(rng_.seed())}});
  vector<string> seating;
  for (const Player& p : g_.players()) {
    string seat = absl::StrFormat("%s (%s", p.name,
                                  CharacterDisplayName(p.character));
    if (p.character == DRUNK) {
      absl::StrAppend(&seat, ", believes ",
                      CharacterDisplayName(p.drunk_character));
    }
    absl::StrAppend(&seat, ")");
    seating.push_back(seat);
  }
  g_.AddEvent(GAME_SETUP, absl::StrCat("Seating: ",
                                       absl::StrJoin(seating, ", ")));
}

void Game::FirstNightInfo() {
  vector<int> demons, minions;
  vector<Character> in_play;
  for (int i = 0; i < g_.NumPlayers(); ++i) {
    const Player& p = g_.player(i);
    in_play.push_back(p.character);
    if (p.drunk_character != CHARACTER_UNSPECIFIED) {
      in_play.push_back(p.drunk_character);
    }
    const CharacterType type = CategoryOf(p.character);
    if (type == DEMON) {
      demons.push_back(i);
    } else if (type == MINION) {
      minions.push_back(i);
    }
  }
  vector<Character> bluffs;
  for (Character c : g_.script().AllCharacters()) {
    if (IsGoodCharacter(c) &&
        std::find(in_play.begin(), in_play.end(), c) == in_play.end()) {
      bluffs.push_back(c);
    }
  }
  bluffs = rng_.Sample(bluffs, options_.num_demon_bluffs);
  vector<string> bluff_names;
  for (Character c : bluffs) {
    bluff_names.push_back(CharacterDisplayName(c));
  }
  const string minion_names = absl::StrJoin(g_.Names(minions), ", ");
  for (int demon : demons) {
    g_.Whisper(demon, absl::StrFormat(
        "Your Minions are: %s. These characters are not in play: %s.",
        minion_names, absl::StrJoin(bluff_names, ", ")));
  }
  const string demon_names = absl::StrJoin(g_.Names(demons), ", ");
  for (int minion : minions) {
    g_.Whisper(minion, absl::StrFormat("The Demon is %s.", demon_names));
  }
}

void Game::RunNight() {
  const bool first_night = g_.phase() == SETUP;
  if (first_night) {
    AnnounceSetup();
  }
  vector<int> alive_at_dusk = g_.AlivePlayers();
  g_.StartNight();
  if (first_night) {
    abilities_.SetupTokens();
    FirstNightInfo();
  }
  const vector<Character>& order = first_night
      ? g_.script().first_night_order : g_.script().other_night_order;
  for (Character character : order) {
    // A Minion who becomes the Demon tonight does not act again as one.
    vector<int> actors;
    for (int i = 0; i < g_.NumPlayers(); ++i) {
      if (g_.player(i).BelievedCharacter() == character) {
        actors.push_back(i);
      }
    }
    for (int actor : actors) {
      abilities_.ResolveNightAbility(actor);
      if (CheckWin()) {
        return;
      }
    }
  }
  if (first_night) {
    return;
  }
  vector<int> died;
  for (int p : alive_at_dusk) {
    if (!g_.IsAlive(p)) {
      died.push_back(p);
    }
  }
  if (died.empty()) {
    g_.AddEvent(PHASE_CHANGE, "Dawn breaks. Nobody died tonight.");
  } else {
    g_.AddEvent(PHASE_CHANGE, absl::StrFormat(
        "Dawn breaks. %s died tonight.", absl::StrJoin(g_.Names(died), ", ")),
        died);
  }
}

DayActionContext Game::NewDayActionContext(int player,
                                           int action_round) const {
  const Player& p = g_.player(player);
  DayActionContext context;
  context.set_action_round(action_round);
  context.set_can_nominate(p.alive && g_.nominations_open() &&
                           !p.used_nomination);
  context.set_can_use_counter_ability(p.alive && !p.used_counter_ability);
  if (context.can_nominate()) {
    for (const Player& nominee : g_.players()) {
      if (nominee.alive && !nominee.nominated_today) {
        context.add_nominatable(nominee.name);
      }
    }
  }
  return context;
}

Game::DayActionResult Game::RunDayAction(int player, int action_round) {
  const string& name = g_.Name(player);
  const DayActionContext context = NewDayActionContext(player, action_round);
  absl::StatusOr<Decision> decision = broker_.RequestDayAction(player,
                                                               context);
  if (!decision.ok()) {
    if (absl::IsInvalidArgument(decision.status())) {
      g_.AddEvent(PLAYER_PASS,
                  absl::StrFormat("%s passes after invalid actions", name),
                  {player});
      return kPassed;
    }
    LOG(ERROR) << "No day action from " << name << ": " << decision.status();
    g_.AddEvent(PHASE_CHANGE, absl::StrFormat(
        "No decision from %s, the day ends early", name), {player});
    return kDayAborted;
  }
  switch (decision->details_case()) {
    case Decision::kSendMessage: {
      vector<int> recipients;
      for (const auto& recipient : decision->send_message().recipients()) {
        recipients.push_back(g_.PlayerIndex(recipient));
      }
      g_.AddMessage(player, recipients, decision->send_message().text());
      return kActed;
    }
    case Decision::kNominate: {
      const Nominate& nominate = decision->nominate();
      const int nominee = g_.PlayerIndex(nominate.nominee());
      if (!context.can_nominate()) {
        g_.AddEvent(INVALID_ACTION, absl::StrFormat(
            "%s cannot nominate now", name), {player, nominee});
        return kActed;
      }
      if (nominations_.RunNomination(player, nominee,
                                     nominate.public_reasoning())) {
        return kExecutedByVirgin;
      }
      return kActed;
    }
    case Decision::kCounterAbility: {
      const int target = g_.PlayerIndex(decision->counter_ability().target());
      if (!context.can_use_counter_ability()) {
        g_.AddEvent(INVALID_ACTION, absl::StrFormat(
            "%s cannot use a counter ability now", name), {player, target});
        return kActed;
      }
      abilities_.ResolveSlayerShot(player, target);
      CheckWin();
      return kActed;
    }
    case Decision::kPass:
      g_.AddEvent(PLAYER_PASS, absl::StrFormat("%s passes", name), {player});
      return kPassed;
    default:
      LOG(FATAL) << "Unexpected day action " << decision->DebugString();
  }
  return kPassed;
}

bool Game::NominationsExhausted() const {
  const auto& block = g_.chopping_block();
  if (block.has_value() && nominations_.NumPotentialVoters() < block->votes) {
    return true;
  }
  for (int i = 0; i < g_.NumPlayers(); ++i) {
    const Player& nominator = g_.player(i);
    if (!nominator.alive || nominator.used_nomination) {
      continue;
    }
    for (int j = 0; j < g_.NumPlayers(); ++j) {
      const Player& nominee = g_.player(j);
      if (j == i || !nominee.alive || nominee.nominated_today) {
        continue;
      }
      if (nominator.team == EVIL && nominee.team == EVIL) {
        continue;
      }
      return false;
    }
  }
  return true;
}

void Game::RunDay() {
  g_.StartDay();
  vector<int> order(g_.NumPlayers());
  std::iota(order.begin(), order.end(), 0);
  bool executed_today = false;
  bool day_over = false;
  for (int r = 1; r <= options_.day_action_rounds && !day_over; ++r) {
    if (r == options_.nominations_open_round) {
      g_.OpenNominations();
    }
    rng_.Shuffle(&order);
    bool everyone_passed = true;
    for (int player : order) {
      if (g_.nominations_open() && NominationsExhausted()) {
        g_.AddEvent(PHASE_CHANGE,
                    "No nomination can change the outcome, the day ends");
        day_over = true;
        break;
      }
      const bool alive = g_.IsAlive(player);
      const DayActionResult result = RunDayAction(player, r);
      if (g_.IsGameOver()) {
        return;
      }
      if (result == kExecutedByVirgin) {
        executed_today = true;
        day_over = true;
        break;
      }
      if (result == kDayAborted) {
        day_over = true;
        break;
      }
      if (alive && result != kPassed) {
        everyone_passed = false;
      }
    }
    if (!day_over && r > 1 && everyone_passed) {
      g_.AddEvent(PHASE_CHANGE, "Everyone passed, the day ends");
      day_over = true;
    }
  }
  EndDay(executed_today);
}

void Game::EndDay(bool executed_today) {
  if (!executed_today) {
    const auto& block = g_.chopping_block();
    if (block.has_value()) {
      g_.Execute(block->nominee,
                 absl::StrFormat("%d votes", block->votes));
    } else {
      g_.AddEvent(PHASE_CHANGE, "Nobody is executed today");
      const int mayor = g_.FindCharacter(MAYOR);
      if (g_.NumAlive() == 3 && mayor != kNoPlayer && g_.IsAlive(mayor) &&
          !IsImpaired(g_, mayor)) {
        g_.SetVictory(GOOD, MAYOR_WIN, absl::StrFormat(
            "%s is the Mayor and 3 players live without an execution",
            g_.Name(mayor)));
      }
    }
  }
  CheckWin();
}

}  // namespace storyteller
