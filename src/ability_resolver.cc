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

#include "src/ability_resolver.h"

#include <algorithm>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "ortools/base/logging.h"
#include "src/status_resolver.h"

namespace storyteller {

AbilityResolver::AbilityResolver(GameState* g, DecisionBroker* broker,
                                 Rng* rng)
    : g_(g), broker_(broker), rng_(rng) {
  CHECK(g_ != nullptr);
  CHECK(broker_ != nullptr);
  CHECK(rng_ != nullptr);
}

void AbilityResolver::AddAbilityEvent(int player, const string& description,
                                      absl::Span<const int> participants) {
  const Player& p = g_->player(player);
  g_->AddEvent(CHARACTER_ABILITY, description, participants,
               {{"character", Character_Name(p.BelievedCharacter())},
                {"impaired", IsImpaired(*g_, player) ? "true" : "false"}});
}

void AbilityResolver::SetupTokens() {
  const int ft = g_->FindBeliever(FORTUNE_TELLER);
  if (ft != kNoPlayer) {
    vector<int> good;
    for (int i = 0; i < g_->NumPlayers(); ++i) {
      if (i != ft && g_->player(i).team == GOOD) {
        good.push_back(i);
      }
    }
    if (!good.empty()) {
      g_->mutable_tokens()->Set(RED_HERRING, rng_->Choose(good));
    }
  }
  SetupPairTokens(WASHERWOMAN, TOWNSFOLK, WASHERWOMAN_TOWNSFOLK,
                  WASHERWOMAN_OTHER);
  SetupPairTokens(LIBRARIAN, OUTSIDER, LIBRARIAN_OUTSIDER, LIBRARIAN_OTHER);
  SetupPairTokens(INVESTIGATOR, MINION, INVESTIGATOR_MINION,
                  INVESTIGATOR_OTHER);
}

void AbilityResolver::SetupPairTokens(
    Character actor, CharacterType type, ReminderToken holder_token,
    ReminderToken other_token) {
  const int player = g_->FindBeliever(actor);
  if (player == kNoPlayer) {
    return;
  }
  vector<int> holders;
  for (int i = 0; i < g_->NumPlayers(); ++i) {
    if (i != player && CategoryOf(g_->player(i).character) == type) {
      holders.push_back(i);
    }
  }
  if (holders.empty()) {
    return;
  }
  const int holder = rng_->Choose(holders);
  vector<int> others;
  for (int i = 0; i < g_->NumPlayers(); ++i) {
    if (i != player && i != holder) {
      others.push_back(i);
    }
  }
  g_->mutable_tokens()->Set(holder_token, holder);
  g_->mutable_tokens()->Set(other_token, rng_->Choose(others));
}

void AbilityResolver::ResolveNightAbility(int player) {
  const Player& p = g_->player(player);
  if (!p.alive && g_->tokens().Get(RAVENKEEPER_WOKEN) != player) {
    VLOG(1) << p.name << " is dead and does not wake";
    return;
  }
  (this->*kNightHandlers[p.BelievedCharacter()])(player);
}

absl::StatusOr<vector<int>> AbilityResolver::ChooseTargets(
    int player, const string& prompt) {
  const Character acting = g_->player(player).BelievedCharacter();
  const CharacterMetadata& metadata = kCharacterMetadata[acting];
  CHECK_GT(metadata.num_night_targets, 0)
      << Character_Name(acting) << " does not choose at night";
  // Information abilities and the Imp may pick dead players.
  const bool dead_allowed =
      acting == FORTUNE_TELLER || acting == RAVENKEEPER || acting == IMP;
  NightTargetsContext context;
  context.set_acting(acting);
  context.set_prompt(prompt);
  context.set_num_targets(metadata.num_night_targets);
  for (int i = 0; i < g_->NumPlayers(); ++i) {
    if ((i == player && !metadata.can_target_self) ||
        (!dead_allowed && !g_->IsAlive(i))) {
      continue;
    }
    context.add_candidates(g_->Name(i));
  }
  absl::StatusOr<vector<int>> targets =
      broker_->RequestNightTargets(player, context);
  if (!targets.ok()) {
    g_->AddEvent(INVALID_ACTION,
                 absl::StrFormat("The %s ability of %s fizzles: %s",
                                 CharacterDisplayName(acting),
                                 g_->Name(player),
                                 targets.status().message()),
                 {player});
  }
  return targets;
}

Character AbilityResolver::OtherCharacter(Character character) {
  vector<Character> others;
  for (Character c : g_->script().AllCharacters()) {
    if (c != character) {
      others.push_back(c);
    }
  }
  return rng_->Choose(others);
}

void AbilityResolver::ResolvePairInfo(int player, CharacterType type,
                                      ReminderToken holder_token,
                                      ReminderToken other_token) {
  int first = g_->tokens().Get(holder_token);
  int second = g_->tokens().Get(other_token);
  Character shown = CHARACTER_UNSPECIFIED;
  if (IsImpaired(*g_, player)) {
    vector<int> others;
    for (int i = 0; i < g_->NumPlayers(); ++i) {
      if (i != player) {
        others.push_back(i);
      }
    }
    vector<int> picked = rng_->Sample(others, 2);
    first = picked[0];
    second = picked[1];
    shown = rng_->Choose(g_->script().OfType(type));
  } else if (first != kNoPlayer) {
    shown = g_->player(first).character;
  }
  if (shown == CHARACTER_UNSPECIFIED) {
    AddAbilityEvent(player, absl::StrFormat(
        "%s learns there are no %ss", g_->Name(player),
        CharacterTypeDisplayName(type)), {player});
    g_->Whisper(player, absl::StrFormat(
        "There are no %ss in play.", CharacterTypeDisplayName(type)));
    return;
  }
  if (first > second) {
    std::swap(first, second);
  }
  AddAbilityEvent(player, absl::StrFormat(
      "%s learns that %s or %s is the %s", g_->Name(player),
      g_->Name(first), g_->Name(second), CharacterDisplayName(shown)),
      {player, first, second});
  g_->Whisper(player, absl::StrFormat(
      "One of %s and %s is the %s.", g_->Name(first), g_->Name(second),
      CharacterDisplayName(shown)));
}

void AbilityResolver::ResolveWasherwoman(int player) {
  ResolvePairInfo(player, TOWNSFOLK, WASHERWOMAN_TOWNSFOLK, WASHERWOMAN_OTHER);
}

void AbilityResolver::ResolveLibrarian(int player) {
  ResolvePairInfo(player, OUTSIDER, LIBRARIAN_OUTSIDER, LIBRARIAN_OTHER);
}

void AbilityResolver::ResolveInvestigator(int player) {
  ResolvePairInfo(player, MINION, INVESTIGATOR_MINION, INVESTIGATOR_OTHER);
}

int AbilityResolver::EvilPairs() const {
  const int n = g_->NumPlayers();
  int pairs = 0;
  for (int i = 0; i < n; ++i) {
    if (g_->player(i).ApparentTeam() == EVIL &&
        g_->player((i + 1) % n).ApparentTeam() == EVIL) {
      ++pairs;
    }
  }
  return pairs;
}

int AbilityResolver::EvilNeighbors(int player) const {
  int evil = 0;
  for (int neighbor : g_->AliveNeighbors(player)) {
    if (g_->player(neighbor).ApparentTeam() == EVIL) {
      ++evil;
    }
  }
  return evil;
}

void AbilityResolver::ResolveChef(int player) {
  int pairs = EvilPairs();
  if (IsImpaired(*g_, player)) {
    pairs = (pairs + 1) % 3;
  }
  AddAbilityEvent(player, absl::StrFormat("%s learns %d evil pairs",
                                          g_->Name(player), pairs), {player});
  g_->Whisper(player, absl::StrFormat(
      "There are %d pairs of evil players sitting next to each other.",
      pairs));
}

void AbilityResolver::ResolveEmpath(int player) {
  int evil = EvilNeighbors(player);
  if (IsImpaired(*g_, player)) {
    evil = (evil + 1) % 3;
  }
  AddAbilityEvent(player, absl::StrFormat("%s learns %d evil neighbors",
                                          g_->Name(player), evil), {player});
  g_->Whisper(player, absl::StrFormat(
      "%d of your alive neighbors are evil.", evil));
}

void AbilityResolver::ResolveFortuneTeller(int player) {
  absl::StatusOr<vector<int>> targets = ChooseTargets(
      player, "Choose two players. You learn if either of them is the Demon.");
  if (!targets.ok()) {
    return;
  }
  const int red_herring = g_->tokens().Get(RED_HERRING);
  bool yes = false;
  for (int target : *targets) {
    yes = yes || g_->player(target).RegistersAsDemon() ||
          target == red_herring;
  }
  if (IsImpaired(*g_, player)) {
    yes = !yes;
  }
  const string& a = g_->Name((*targets)[0]);
  const string& b = g_->Name((*targets)[1]);
  AddAbilityEvent(player, absl::StrFormat(
      "%s checks %s and %s: %s", g_->Name(player), a, b, yes ? "yes" : "no"),
      {player, (*targets)[0], (*targets)[1]});
  g_->Whisper(player, yes
      ? absl::StrFormat("Yes, one of %s and %s is the Demon.", a, b)
      : absl::StrFormat("No, neither %s nor %s is the Demon.", a, b));
}

void AbilityResolver::ResolveUndertaker(int player) {
  if (!g_->tokens().Has(UNDERTAKER_EXECUTED)) {
    return;  // Nobody was executed.
  }
  const int executed = g_->mutable_tokens()->Consume(UNDERTAKER_EXECUTED);
  Character shown = g_->player(executed).character;
  if (IsImpaired(*g_, player)) {
    shown = OtherCharacter(shown);
  }
  AddAbilityEvent(player, absl::StrFormat(
      "%s learns that %s was the %s", g_->Name(player), g_->Name(executed),
      CharacterDisplayName(shown)), {player, executed});
  g_->Whisper(player, absl::StrFormat(
      "The executed player, %s, was the %s.", g_->Name(executed),
      CharacterDisplayName(shown)));
}

void AbilityResolver::ResolveMonk(int player) {
  absl::StatusOr<vector<int>> targets = ChooseTargets(
      player, "Choose a player, other than yourself, to protect tonight.");
  if (!targets.ok()) {
    return;
  }
  const int target = (*targets)[0];
  g_->mutable_tokens()->Set(MONK_PROTECTED, target);
  AddAbilityEvent(player, absl::StrFormat("%s protects %s", g_->Name(player),
                                          g_->Name(target)),
                  {player, target});
}

void AbilityResolver::ResolveRavenkeeper(int player) {
  if (g_->tokens().Get(RAVENKEEPER_WOKEN) != player) {
    return;  // Only wakes on the night of their death.
  }
  g_->mutable_tokens()->Consume(RAVENKEEPER_WOKEN);
  absl::StatusOr<vector<int>> targets = ChooseTargets(
      player, "You died tonight. Choose a player to learn their character.");
  if (!targets.ok()) {
    return;
  }
  const int target = (*targets)[0];
  Character shown = g_->player(target).character;
  if (IsImpaired(*g_, player)) {
    shown = OtherCharacter(shown);
  }
  AddAbilityEvent(player, absl::StrFormat(
      "%s learns that %s is the %s", g_->Name(player), g_->Name(target),
      CharacterDisplayName(shown)), {player, target});
  g_->Whisper(player, absl::StrFormat("%s is the %s.", g_->Name(target),
                                      CharacterDisplayName(shown)));
}

void AbilityResolver::ResolveButler(int player) {
  absl::StatusOr<vector<int>> targets = ChooseTargets(
      player, "Choose your master. Tomorrow, you may only vote yes if they "
      "already voted yes.");
  if (!targets.ok()) {
    return;
  }
  const int master = (*targets)[0];
  g_->mutable_tokens()->Set(BUTLER_MASTER, master);
  AddAbilityEvent(player, absl::StrFormat("%s chooses %s as master",
                                          g_->Name(player), g_->Name(master)),
                  {player, master});
}

void AbilityResolver::ResolvePoisoner(int player) {
  absl::StatusOr<vector<int>> targets = ChooseTargets(
      player, "Choose a player to poison tonight and tomorrow.");
  if (!targets.ok()) {
    return;
  }
  const int target = (*targets)[0];
  AddAbilityEvent(player, absl::StrFormat("%s poisons %s", g_->Name(player),
                                          g_->Name(target)),
                  {player, target});
  if (!IsImpaired(*g_, player)) {
    g_->SetPoisonTarget(player, target);
  }
}

void AbilityResolver::ResolveSpy(int player) {
  AddAbilityEvent(player, absl::StrFormat("%s sees the Grimoire",
                                          g_->Name(player)), {player});
  g_->Whisper(player, absl::StrCat("The Grimoire:\n", g_->Grimoire()));
}

int AbilityResolver::RedirectKill(int victim) {
  const Player& v = g_->player(victim);
  if (v.character != MAYOR || !v.alive || IsImpaired(*g_, victim)) {
    return victim;
  }
  const int n = g_->NumPlayers();
  for (int i = 1; i < n; ++i) {
    const int candidate = (victim + i) % n;
    const Player& c = g_->player(candidate);
    if (c.alive && c.team == GOOD && c.character != MAYOR) {
      return candidate;
    }
  }
  return victim;
}

void AbilityResolver::ResolveImp(int player) {
  absl::StatusOr<vector<int>> targets =
      ChooseTargets(player, "Choose a player to kill.");
  if (!targets.ok()) {
    return;
  }
  const int target = (*targets)[0];
  AddAbilityEvent(player, absl::StrFormat("%s attacks %s", g_->Name(player),
                                          g_->Name(target)),
                  {player, target});
  if (IsImpaired(*g_, player)) {
    g_->Whisper(player, "Nothing happened tonight.");
    return;
  }
  const int victim = RedirectKill(target);
  if (victim != target) {
    g_->AddEvent(CHARACTER_ABILITY, absl::StrFormat(
        "The Mayor %s is attacked, %s dies instead", g_->Name(target),
        g_->Name(victim)), {target, victim});
  }
  const Player& v = g_->player(victim);
  const int monk = g_->FindCharacter(MONK);
  const bool is_protected =
      g_->tokens().Get(MONK_PROTECTED) == victim && monk != kNoPlayer &&
      g_->IsAlive(monk) && !IsImpaired(*g_, monk);
  const bool is_soldier = v.character == SOLDIER && !IsImpaired(*g_, victim);
  if (!v.alive || is_protected || is_soldier) {
    g_->AddEvent(CHARACTER_ABILITY, absl::StrFormat(
        "The attack on %s fails", g_->Name(victim)), {victim});
    g_->Whisper(player, "Nothing happened tonight.");
    return;
  }
  g_->mutable_tokens()->Set(IMP_KILLED, victim);
  if (v.BelievedCharacter() == RAVENKEEPER) {
    g_->mutable_tokens()->Set(RAVENKEEPER_WOKEN, victim);
  }
  g_->KillPlayer(victim, "killed by the Demon");
  if (victim == player) {
    PromoteMinion(player);
  }
}

void AbilityResolver::PromoteMinion(int dead_demon) {
  for (const Player& p : g_->players()) {
    if (p.alive && CategoryOf(p.character) == DEMON) {
      return;  // The Scarlet Woman took over.
    }
  }
  const Character demon = g_->player(dead_demon).character;
  for (int i = 0; i < g_->NumPlayers(); ++i) {
    Player* p = g_->mutable_player(i);
    if (p->alive && CategoryOf(p->character) == MINION) {
      const Character previous = p->character;
      p->character = demon;
      g_->AddEvent(DEMON_PROMOTION, absl::StrFormat(
          "%s (%s) becomes the %s", p->name, CharacterDisplayName(previous),
          CharacterDisplayName(demon)), {i, dead_demon});
      g_->Whisper(i, absl::StrFormat(
          "The Demon has passed their power to you. You are now the %s.",
          CharacterDisplayName(demon)));
      return;
    }
  }
}

bool AbilityResolver::ResolveSlayerShot(int shooter, int target) {
  Player* s = g_->mutable_player(shooter);
  CHECK(!s->used_counter_ability)
      << s->name << " already used the Slayer ability";
  s->used_counter_ability = true;
  g_->AddEvent(CHARACTER_ABILITY, absl::StrFormat(
      "%s claims to be the Slayer and shoots %s", s->name, g_->Name(target)),
      {shooter, target});
  const Player& t = g_->player(target);
  const bool kills = s->character == SLAYER && !IsImpaired(*g_, shooter) &&
                     t.alive && CategoryOf(t.character) == DEMON;
  if (!kills) {
    g_->AddEvent(CHARACTER_ABILITY, "Nothing happens", {shooter, target});
    return false;
  }
  g_->KillPlayer(target, "shot by the Slayer");
  return true;
}

bool AbilityResolver::ResolveVirgin(int nominator, int nominee) {
  const Player& virgin = g_->player(nominee);
  if (virgin.BelievedCharacter() != VIRGIN ||
      g_->tokens().Has(VIRGIN_POWER_USED)) {
    return false;
  }
  g_->mutable_tokens()->Set(VIRGIN_POWER_USED, nominee);
  const bool executes = g_->player(nominator).RegistersAsTownsfolk() &&
                        !IsImpaired(*g_, nominee);
  AddAbilityEvent(nominee, absl::StrFormat(
      "%s nominates the Virgin %s%s", g_->Name(nominator), virgin.name,
      executes ? ": the Virgin's power triggers" : ""),
      {nominator, nominee});
  if (!executes) {
    return false;
  }
  g_->Execute(nominator, absl::StrFormat("nominated the Virgin %s",
                                         virgin.name));
  return true;
}

}  // namespace storyteller
