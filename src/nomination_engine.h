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

#ifndef SRC_NOMINATION_ENGINE_H_
#define SRC_NOMINATION_ENGINE_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "src/ability_resolver.h"
#include "src/decision.pb.h"
#include "src/decision_broker.h"
#include "src/game_state.h"

namespace storyteller {

using std::string;
using std::vector;

// Runs a single nomination, from validation through the vote to the
// chopping block update.
class NominationEngine {
 public:
  NominationEngine(GameState* g, DecisionBroker* broker,
                   AbilityResolver* abilities);

  // Returns whether the day ended early, i.e. the Virgin executed the
  // nominator. Invalid nominations are logged and ignored.
  bool RunNomination(int nominator, int nominee,
                     const string& public_reasoning);

  absl::Status ValidateNomination(int nominator, int nominee) const;

  // Yes votes needed to put a nominee on the block: half the living players
  // rounded up, or one more than the current block.
  int RequiredToNominate() const;
  // Yes votes that tie the current block, clearing it. 0 when it is empty.
  int RequiredToTie() const;
  // Players who could still vote yes: the living and ghosts with a vote.
  int NumPotentialVoters() const;

 private:
  // Asks the voter, applying the ghost vote and Butler restrictions.
  VoteRecord CollectVote(int voter, const VoteContext& context,
                         int butler, int master);

  GameState* g_;  // Not owned.
  DecisionBroker* broker_;  // Not owned.
  AbilityResolver* abilities_;  // Not owned.
};

}  // namespace storyteller

#endif  // SRC_NOMINATION_ENGINE_H_
