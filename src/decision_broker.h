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

#ifndef SRC_DECISION_BROKER_H_
#define SRC_DECISION_BROKER_H_

#include <map>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "src/decision.pb.h"
#include "src/decision_provider.h"
#include "src/game_log.pb.h"
#include "src/game_state.h"

namespace storyteller {

using std::map;
using std::vector;

// Asks decision providers on behalf of the engine. Every raw response is
// recorded in the game log, failures included, and validated against the
// roster before the engine sees it. A failed attempt is retried up to
// max_retries more times.
//
// After the last attempt, a validation failure is returned as
// InvalidArgument and a provider failure as Unavailable.
class DecisionBroker {
 public:
  DecisionBroker(GameState* g, DecisionProvider* provider, int max_retries);

  // Overrides the provider for a single player.
  void SetProvider(int player, DecisionProvider* provider);

  absl::StatusOr<Decision> RequestDayAction(int player,
                                            const DayActionContext& context);
  absl::StatusOr<CastVote> RequestVote(int player, const VoteContext& context);
  // Returns the chosen player indices, in the order given.
  absl::StatusOr<vector<int>> RequestNightTargets(
      int player, const NightTargetsContext& context);

 private:
  typedef absl::Status (DecisionBroker::*Validator)(
      const DecisionRequest& request, const Decision& decision) const;

  DecisionRequest NewRequest(int player, DecisionKind kind) const;
  absl::StatusOr<Decision> Request(int player,
                                   const DecisionRequest& request,
                                   Validator validator);
  void Record(const DecisionRequest& request,
              const absl::StatusOr<Decision>& response);

  absl::Status ValidateName(const string& name) const;
  absl::Status ValidateDayAction(const DecisionRequest& request,
                                 const Decision& decision) const;
  absl::Status ValidateVote(const DecisionRequest& request,
                            const Decision& decision) const;
  absl::Status ValidateNightTargets(const DecisionRequest& request,
                                    const Decision& decision) const;

  GameState* g_;  // Not owned.
  DecisionProvider* provider_;  // Not owned.
  map<int, DecisionProvider*> player_providers_;
  int max_retries_;
};

}  // namespace storyteller

#endif  // SRC_DECISION_BROKER_H_
