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

#ifndef SRC_DECISION_PROVIDER_H_
#define SRC_DECISION_PROVIDER_H_

#include <deque>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "src/decision.pb.h"
#include "src/game_log.pb.h"
#include "src/rng.h"

namespace storyteller {

using std::deque;
using std::map;
using std::pair;
using std::string;
using std::vector;

// Chooses what a player does. Implementations may be scripted, random, or
// backed by a remote agent. A non-OK status is a provider failure (error,
// timeout, unparseable payload); the engine retries a bounded number of
// times.
class DecisionProvider {
 public:
  virtual ~DecisionProvider() = default;
  virtual absl::StatusOr<Decision> Decide(const DecisionRequest& request) = 0;
};

// Plays uniformly at random among the allowed actions. Uses its own random
// source, so that replaying recorded decisions does not shift the engine's.
class RandomDecisionProvider : public DecisionProvider {
 public:
  explicit RandomDecisionProvider(uint64_t seed) : rng_(seed) {}

  absl::StatusOr<Decision> Decide(const DecisionRequest& request) override;

 private:
  Decision DecideDayAction(const DecisionRequest& request);
  Decision DecideVote(const DecisionRequest& request);
  Decision DecideNightTargets(const DecisionRequest& request);

  Rng rng_;
};

// Replays queued decisions per player and request kind. When a queue is
// empty, the fallback provider decides; without a fallback, the player
// passes, votes no, or picks the first candidates at night.
class ScriptedDecisionProvider : public DecisionProvider {
 public:
  explicit ScriptedDecisionProvider(DecisionProvider* fallback = nullptr)
      : fallback_(fallback) {}

  // Replays every decision recorded in the log, provider errors included.
  static ScriptedDecisionProvider FromLog(const GameLog& log,
                                          DecisionProvider* fallback);

  void Add(const string& player, DecisionKind kind, const Decision& decision);
  void AddError(const string& player, DecisionKind kind, const string& error);

  // Shortcuts for tests and hand-written scripts.
  ScriptedDecisionProvider& AddPass(const string& player);
  ScriptedDecisionProvider& AddMessage(const string& player,
                                       const vector<string>& recipients,
                                       const string& text);
  ScriptedDecisionProvider& AddNominate(const string& player,
                                        const string& nominee);
  ScriptedDecisionProvider& AddCounterAbility(const string& player,
                                              const string& target);
  ScriptedDecisionProvider& AddVote(const string& player, VoteValue vote);
  ScriptedDecisionProvider& AddVotes(const vector<string>& players,
                                     VoteValue vote);
  ScriptedDecisionProvider& AddNightTargets(const string& player,
                                            const vector<string>& targets);

  absl::StatusOr<Decision> Decide(const DecisionRequest& request) override;

  // Number of queued decisions not yet consumed.
  int Remaining() const;

 private:
  DecisionProvider* fallback_;  // Not owned, may be null.
  map<pair<string, DecisionKind>, deque<absl::StatusOr<Decision>>> queues_;
};

// The decision taken when nothing else is available.
Decision DefaultDecision(const DecisionRequest& request);

}  // namespace storyteller

#endif  // SRC_DECISION_PROVIDER_H_
