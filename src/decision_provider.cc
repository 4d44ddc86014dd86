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

#include "src/decision_provider.h"

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "ortools/base/logging.h"

namespace storyteller {

Decision DefaultDecision(const DecisionRequest& request) {
  Decision d;
  switch (request.kind()) {
    case DAY_ACTION:
      d.mutable_pass();
      break;
    case VOTE:
      d.mutable_vote()->set_vote(NO);
      break;
    case NIGHT_TARGETS: {
      const auto& context = request.night_targets();
      auto* targets = d.mutable_night_targets();
      for (int i = 0; i < context.num_targets() &&
                      i < context.candidates_size(); ++i) {
        targets->add_targets(context.candidates(i));
      }
      break;
    }
    default:
      CHECK(false) << "Invalid decision kind: " << request.kind();
  }
  return d;
}

absl::StatusOr<Decision> RandomDecisionProvider::Decide(
    const DecisionRequest& request) {
  switch (request.kind()) {
    case DAY_ACTION:
      return DecideDayAction(request);
    case VOTE:
      return DecideVote(request);
    case NIGHT_TARGETS:
      return DecideNightTargets(request);
    default:
      return absl::InvalidArgumentError(
          absl::StrCat("Unsupported request kind ", request.kind()));
  }
}

Decision RandomDecisionProvider::DecideDayAction(
    const DecisionRequest& request) {
  const auto& context = request.day_action();
  Decision d;
  if (context.can_nominate() && !context.nominatable().empty() &&
      rng_.UniformInt(0, 2) == 0) {
    vector<string> nominatable(context.nominatable().begin(),
                               context.nominatable().end());
    auto* nominate = d.mutable_nominate();
    nominate->set_nominee(rng_.Choose(nominatable));
    nominate->set_public_reasoning("I have a bad feeling about them.");
    return d;
  }
  vector<string> others;
  for (const auto& seat : request.public_state().seats()) {
    if (seat.name() != request.player()) {
      others.push_back(seat.name());
    }
  }
  if (context.can_use_counter_ability() && !others.empty() &&
      rng_.UniformInt(0, 9) == 0) {
    auto* shot = d.mutable_counter_ability();
    shot->set_target(rng_.Choose(others));
    shot->set_public_reasoning("I claim Slayer.");
    return d;
  }
  if (!others.empty() && rng_.UniformInt(0, 2) == 0) {
    auto* message = d.mutable_send_message();
    message->add_recipients(rng_.Choose(others));
    message->set_text(absl::StrFormat("I am the %s.",
        Character_Name(request.private_state().character())));
    return d;
  }
  d.mutable_pass();
  return d;
}

Decision RandomDecisionProvider::DecideVote(const DecisionRequest& request) {
  Decision d;
  d.mutable_vote()->set_vote(rng_.UniformInt(0, 1) == 0 ? YES : NO);
  return d;
}

Decision RandomDecisionProvider::DecideNightTargets(
    const DecisionRequest& request) {
  const auto& context = request.night_targets();
  vector<string> candidates(context.candidates().begin(),
                            context.candidates().end());
  Decision d;
  auto* targets = d.mutable_night_targets();
  for (const string& name : rng_.Sample(candidates, context.num_targets())) {
    targets->add_targets(name);
  }
  return d;
}

ScriptedDecisionProvider ScriptedDecisionProvider::FromLog(
    const GameLog& log, DecisionProvider* fallback) {
  ScriptedDecisionProvider provider(fallback);
  for (const auto& recorded : log.decisions()) {
    if (recorded.has_decision()) {
      provider.Add(recorded.player(), recorded.kind(), recorded.decision());
    } else {
      provider.AddError(recorded.player(), recorded.kind(), recorded.error());
    }
  }
  return provider;
}

void ScriptedDecisionProvider::Add(const string& player, DecisionKind kind,
                                   const Decision& decision) {
  queues_[{player, kind}].push_back(decision);
}

void ScriptedDecisionProvider::AddError(const string& player,
                                        DecisionKind kind,
                                        const string& error) {
  queues_[{player, kind}].push_back(absl::UnavailableError(error));
}

ScriptedDecisionProvider& ScriptedDecisionProvider::AddPass(
    const string& player) {
  Decision d;
  d.mutable_pass();
  Add(player, DAY_ACTION, d);
  return *this;
}

ScriptedDecisionProvider& ScriptedDecisionProvider::AddMessage(
    const string& player, const vector<string>& recipients,
    const string& text) {
  Decision d;
  auto* message = d.mutable_send_message();
  for (const string& r : recipients) {
    message->add_recipients(r);
  }
  message->set_text(text);
  Add(player, DAY_ACTION, d);
  return *this;
}

ScriptedDecisionProvider& ScriptedDecisionProvider::AddNominate(
    const string& player, const string& nominee) {
  Decision d;
  d.mutable_nominate()->set_nominee(nominee);
  Add(player, DAY_ACTION, d);
  return *this;
}

ScriptedDecisionProvider& ScriptedDecisionProvider::AddCounterAbility(
    const string& player, const string& target) {
  Decision d;
  d.mutable_counter_ability()->set_target(target);
  Add(player, DAY_ACTION, d);
  return *this;
}

ScriptedDecisionProvider& ScriptedDecisionProvider::AddVote(
    const string& player, VoteValue vote) {
  Decision d;
  d.mutable_vote()->set_vote(vote);
  Add(player, VOTE, d);
  return *this;
}

ScriptedDecisionProvider& ScriptedDecisionProvider::AddVotes(
    const vector<string>& players, VoteValue vote) {
  for (const string& player : players) {
    AddVote(player, vote);
  }
  return *this;
}

ScriptedDecisionProvider& ScriptedDecisionProvider::AddNightTargets(
    const string& player, const vector<string>& targets) {
  Decision d;
  auto* night_targets = d.mutable_night_targets();
  for (const string& t : targets) {
    night_targets->add_targets(t);
  }
  Add(player, NIGHT_TARGETS, d);
  return *this;
}

absl::StatusOr<Decision> ScriptedDecisionProvider::Decide(
    const DecisionRequest& request) {
  auto it = queues_.find({request.player(), request.kind()});
  if (it != queues_.end() && !it->second.empty()) {
    absl::StatusOr<Decision> next = it->second.front();
    it->second.pop_front();
    return next;
  }
  if (fallback_ != nullptr) {
    return fallback_->Decide(request);
  }
  return DefaultDecision(request);
}

int ScriptedDecisionProvider::Remaining() const {
  int remaining = 0;
  for (const auto& [key, queue] : queues_) {
    remaining += queue.size();
  }
  return remaining;
}

}  // namespace storyteller
