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

#ifndef SRC_ABILITY_RESOLVER_H_
#define SRC_ABILITY_RESOLVER_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "src/decision_broker.h"
#include "src/game_log.pb.h"
#include "src/game_state.h"
#include "src/rng.h"

namespace storyteller {

using std::string;
using std::vector;

// Resolves character abilities against the game state. Information abilities
// compute the true answer, and replace it with a plausible fabrication when
// the actor is impaired. The result is whispered to the actor only.
class AbilityResolver {
 public:
  AbilityResolver(GameState* g, DecisionBroker* broker, Rng* rng);

  // Places the whole-game setup tokens: the Fortune Teller's red herring and
  // the pairs shown to the Washerwoman, Librarian and Investigator.
  void SetupTokens();

  // The player acts at night as the character they believe they are. Dead
  // players only act when woken by a token (the Ravenkeeper).
  void ResolveNightAbility(int player);

  // Anyone may claim to be the Slayer once per game. Only an unimpaired
  // Slayer shooting the Demon kills. Returns whether the target died.
  bool ResolveSlayerShot(int shooter, int target);

  // The first nomination of the Virgin. If the nominator registers as a
  // Townsfolk and the Virgin is unimpaired, the nominator is executed.
  // Returns whether that happened.
  bool ResolveVirgin(int nominator, int nominee);

  // The Chef and Empath numbers, before any fabrication.
  int EvilPairs() const;
  int EvilNeighbors(int player) const;

 private:
  typedef void (AbilityResolver::*NightHandler)(int player);

  const NightHandler kNightHandlers[Character_ARRAYSIZE] = {
    &AbilityResolver::Noop,  // CHARACTER_UNSPECIFIED
    &AbilityResolver::ResolveWasherwoman,  // WASHERWOMAN
    &AbilityResolver::ResolveLibrarian,  // LIBRARIAN
    &AbilityResolver::ResolveInvestigator,  // INVESTIGATOR
    &AbilityResolver::ResolveChef,  // CHEF
    &AbilityResolver::ResolveEmpath,  // EMPATH
    &AbilityResolver::ResolveFortuneTeller,  // FORTUNE_TELLER
    &AbilityResolver::ResolveUndertaker,  // UNDERTAKER
    &AbilityResolver::ResolveMonk,  // MONK
    &AbilityResolver::ResolveRavenkeeper,  // RAVENKEEPER
    &AbilityResolver::Noop,  // VIRGIN (on nomination)
    &AbilityResolver::Noop,  // SLAYER (day action)
    &AbilityResolver::Noop,  // SOLDIER (handled by the Imp logic)
    &AbilityResolver::Noop,  // MAYOR (handled by the Imp and day logic)
    &AbilityResolver::ResolveButler,  // BUTLER
    &AbilityResolver::Noop,  // DRUNK (acts as the believed Townsfolk)
    &AbilityResolver::Noop,  // RECLUSE (registration only)
    &AbilityResolver::Noop,  // SAINT (on execution)
    &AbilityResolver::ResolvePoisoner,  // POISONER
    &AbilityResolver::ResolveSpy,  // SPY
    &AbilityResolver::Noop,  // SCARLET_WOMAN (on the Demon's death)
    &AbilityResolver::Noop,  // BARON (setup only)
    &AbilityResolver::ResolveImp,  // IMP
  };

  void Noop(int player) {}
  void ResolveWasherwoman(int player);
  void ResolveLibrarian(int player);
  void ResolveInvestigator(int player);
  void ResolveChef(int player);
  void ResolveEmpath(int player);
  void ResolveFortuneTeller(int player);
  void ResolveUndertaker(int player);
  void ResolveMonk(int player);
  void ResolveRavenkeeper(int player);
  void ResolveButler(int player);
  void ResolvePoisoner(int player);
  void ResolveSpy(int player);
  void ResolveImp(int player);

  void SetupPairTokens(Character actor, CharacterType type,
                       ReminderToken holder_token, ReminderToken other_token);
  void ResolvePairInfo(int player, CharacterType type,
                       ReminderToken holder_token, ReminderToken other_token);
  // Asks the player for night targets. Returns an error if the decision
  // failed; the ability then fizzles.
  absl::StatusOr<vector<int>> ChooseTargets(int player, const string& prompt);
  // A random script character other than the given one.
  Character OtherCharacter(Character character);
  // The player the Imp kill lands on after the Mayor bounce.
  int RedirectKill(int victim);
  void PromoteMinion(int dead_demon);
  void AddAbilityEvent(int player, const string& description,
                       absl::Span<const int> participants);

  GameState* g_;  // Not owned.
  DecisionBroker* broker_;  // Not owned.
  Rng* rng_;  // Not owned.
};

}  // namespace storyteller

#endif  // SRC_ABILITY_RESOLVER_H_
