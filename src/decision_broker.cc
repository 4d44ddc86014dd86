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

#include "src/decision_broker.h"

#include <algorithm>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "ortools/base/logging.h"

namespace storyteller {

DecisionBroker::DecisionBroker(GameState* g, DecisionProvider* provider,
                               int max_retries)
    : g_(g), provider_(provider), max_retries_(max_retries) {
  CHECK(g_ != nullptr);
  CHECK(provider_ != nullptr);
  CHECK_GE(max_retries_, 0);
}

void DecisionBroker::SetProvider(int player, DecisionProvider* provider) {
  CHECK(provider != nullptr);
  player_providers_[player] = provider;
}

DecisionRequest DecisionBroker::NewRequest(int player,
                                           DecisionKind kind) const {
  DecisionRequest request;
  request.set_player(g_->Name(player));
  request.set_kind(kind);
  *request.mutable_public_state() = g_->ToPublicState();
  *request.mutable_private_state() = g_->ToPrivateState(player);
  return request;
}

void DecisionBroker::Record(const DecisionRequest& request,
                            const absl::StatusOr<Decision>& response) {
  RecordedDecision* recorded = g_->mutable_log()->add_decisions();
  recorded->set_player(request.player());
  recorded->set_kind(request.kind());
  recorded->set_round(g_->round());
  recorded->set_phase(g_->phase());
  if (response.ok()) {
    *recorded->mutable_decision() = *response;
  } else {
    recorded->set_error(string(response.status().message()));
  }
}

absl::StatusOr<Decision> DecisionBroker::Request(
    int player, const DecisionRequest& request, Validator validator) {
  const auto it = player_providers_.find(player);
  DecisionProvider* provider =
      it == player_providers_.end() ? provider_ : it->second;
  VLOG(1) << "Request for " << request.player() << ":\n"
          << request.DebugString();
  absl::Status last_error;
  for (int attempt = 0; attempt <= max_retries_; ++attempt) {
    absl::StatusOr<Decision> response = provider->Decide(request);
    Record(request, response);
    if (!response.ok()) {
      VLOG(1) << "Attempt " << attempt + 1 << " for " << request.player()
              << " failed: " << response.status();
      last_error = absl::UnavailableError(
          absl::StrCat("Decision provider failed: ",
                       response.status().message()));
      continue;
    }
    VLOG(1) << "Response from " << request.player() << ":\n"
            << response->DebugString();
    absl::Status st = (this->*validator)(request, *response);
    if (!st.ok()) {
      g_->AddEvent(INVALID_ACTION,
                   absl::StrFormat("Invalid %s from %s: %s",
                                   DecisionKind_Name(request.kind()),
                                   request.player(), st.message()),
                   {player});
      last_error = st;
      continue;
    }
    return response;
  }
  LOG(WARNING) << "Giving up on " << DecisionKind_Name(request.kind())
               << " from " << request.player() << " after "
               << max_retries_ + 1 << " attempts: " << last_error;
  return last_error;
}

absl::StatusOr<Decision> DecisionBroker::RequestDayAction(
    int player, const DayActionContext& context) {
  DecisionRequest request = NewRequest(player, DAY_ACTION);
  *request.mutable_day_action() = context;
  return Request(player, request, &DecisionBroker::ValidateDayAction);
}

absl::StatusOr<CastVote> DecisionBroker::RequestVote(
    int player, const VoteContext& context) {
  DecisionRequest request = NewRequest(player, VOTE);
  *request.mutable_vote() = context;
  absl::StatusOr<Decision> d =
      Request(player, request, &DecisionBroker::ValidateVote);
  if (!d.ok()) {
    return d.status();
  }
  return d->vote();
}

absl::StatusOr<vector<int>> DecisionBroker::RequestNightTargets(
    int player, const NightTargetsContext& context) {
  DecisionRequest request = NewRequest(player, NIGHT_TARGETS);
  *request.mutable_night_targets() = context;
  absl::StatusOr<Decision> d =
      Request(player, request, &DecisionBroker::ValidateNightTargets);
  if (!d.ok()) {
    return d.status();
  }
  vector<int> targets;
  for (const string& name : d->night_targets().targets()) {
    targets.push_back(g_->PlayerIndex(name));
  }
  return targets;
}

absl::Status DecisionBroker::ValidateName(const string& name) const {
  return g_->FindPlayer(name).status();
}

absl::Status DecisionBroker::ValidateDayAction(
    const DecisionRequest& request, const Decision& decision) const {
  switch (decision.details_case()) {
    case Decision::kSendMessage: {
      const auto& recipients = decision.send_message().recipients();
      if (recipients.empty()) {
        return absl::InvalidArgumentError("Message needs recipients");
      }
      for (const string& name : recipients) {
        absl::Status st = ValidateName(name);
        if (!st.ok()) {
          return absl::InvalidArgumentError(st.message());
        }
      }
      return absl::OkStatus();
    }
    case Decision::kNominate: {
      absl::Status st = ValidateName(decision.nominate().nominee());
      return st.ok() ? st : absl::InvalidArgumentError(st.message());
    }
    case Decision::kCounterAbility: {
      absl::Status st = ValidateName(decision.counter_ability().target());
      return st.ok() ? st : absl::InvalidArgumentError(st.message());
    }
    case Decision::kPass:
      return absl::OkStatus();
    default:
      return absl::InvalidArgumentError(absl::StrCat(
          "Expected a day action, got ", decision.ShortDebugString()));
  }
}

absl::Status DecisionBroker::ValidateVote(const DecisionRequest& request,
                                          const Decision& decision) const {
  if (!decision.has_vote() ||
      (decision.vote().vote() != YES && decision.vote().vote() != NO)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Expected a yes or no vote, got ", decision.ShortDebugString()));
  }
  return absl::OkStatus();
}

absl::Status DecisionBroker::ValidateNightTargets(
    const DecisionRequest& request, const Decision& decision) const {
  if (!decision.has_night_targets()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Expected night targets, got ", decision.ShortDebugString()));
  }
  const auto& context = request.night_targets();
  const auto& targets = decision.night_targets().targets();
  if (targets.size() != context.num_targets()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Expected %d night targets, got %d", context.num_targets(),
        targets.size()));
  }
  for (const string& name : targets) {
    absl::Status st = ValidateName(name);
    if (!st.ok()) {
      return absl::InvalidArgumentError(st.message());
    }
    if (std::find(context.candidates().begin(), context.candidates().end(),
                  name) == context.candidates().end()) {
      return absl::InvalidArgumentError(
          absl::StrCat(name, " is not a valid target"));
    }
  }
  if (targets.size() == 2 && targets[0] == targets[1]) {
    return absl::InvalidArgumentError("Night targets need to be distinct");
  }
  return absl::OkStatus();
}

}  // namespace storyteller
