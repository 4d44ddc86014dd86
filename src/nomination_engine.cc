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

#include "src/nomination_engine.h"

#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "ortools/base/logging.h"
#include "src/status_resolver.h"

namespace storyteller {
namespace {
string ChoppingBlockDescription(const GameState& g) {
  const auto& block = g.chopping_block();
  if (!block.has_value()) {
    return "The chopping block is empty.";
  }
  return absl::StrFormat("%s is on the chopping block with %d votes.",
                         g.Name(block->nominee), block->votes);
}
}  // namespace

NominationEngine::NominationEngine(GameState* g, DecisionBroker* broker,
                                   AbilityResolver* abilities)
    : g_(g), broker_(broker), abilities_(abilities) {
  CHECK(g_ != nullptr);
  CHECK(broker_ != nullptr);
  CHECK(abilities_ != nullptr);
}

int NominationEngine::RequiredToNominate() const {
  const auto& block = g_->chopping_block();
  if (block.has_value()) {
    return block->votes + 1;
  }
  return (g_->NumAlive() + 1) / 2;
}

int NominationEngine::RequiredToTie() const {
  const auto& block = g_->chopping_block();
  return block.has_value() ? block->votes : 0;
}

int NominationEngine::NumPotentialVoters() const {
  int voters = 0;
  for (const Player& p : g_->players()) {
    if (p.alive || !p.used_ghost_vote) {
      ++voters;
    }
  }
  return voters;
}

absl::Status NominationEngine::ValidateNomination(int nominator,
                                                  int nominee) const {
  if (!g_->nominations_open()) {
    return absl::FailedPreconditionError("Nominations are not open");
  }
  const Player& from = g_->player(nominator);
  const Player& to = g_->player(nominee);
  if (!from.alive) {
    return absl::FailedPreconditionError(
        absl::StrCat(from.name, " is dead and cannot nominate"));
  }
  if (from.used_nomination) {
    return absl::FailedPreconditionError(
        absl::StrCat(from.name, " already nominated today"));
  }
  if (!to.alive) {
    return absl::FailedPreconditionError(
        absl::StrCat(to.name, " is dead and cannot be nominated"));
  }
  if (to.nominated_today) {
    return absl::FailedPreconditionError(
        absl::StrCat(to.name, " was already nominated today"));
  }
  return absl::OkStatus();
}

VoteRecord NominationEngine::CollectVote(int voter, const VoteContext& context,
                                         int butler, int master) {
  Player* p = g_->mutable_player(voter);
  VoteRecord record;
  record.set_voter(p->name);
  if (!p->alive && p->used_ghost_vote) {
    record.set_vote(CANT_VOTE);
    return record;
  }
  absl::StatusOr<CastVote> cast = broker_->RequestVote(voter, context);
  VoteValue vote = NO;
  if (cast.ok()) {
    vote = cast->vote();
    record.set_public_reasoning(cast->public_reasoning());
  } else {
    LOG(WARNING) << p->name << "'s vote counts as no: " << cast.status();
  }
  if (vote == YES && voter == butler) {
    bool master_voted_yes = false;
    for (const auto& previous : context.previous_votes()) {
      if (previous.voter() == g_->Name(master) && previous.vote() == YES) {
        master_voted_yes = true;
      }
    }
    if (!master_voted_yes) {
      VLOG(1) << p->name << " is the Butler and " << g_->Name(master)
              << " has not voted yes";
      vote = NO;
    }
  }
  if (vote == YES && !p->alive) {
    p->used_ghost_vote = true;
  }
  record.set_vote(vote);
  return record;
}

bool NominationEngine::RunNomination(int nominator, int nominee,
                                     const string& public_reasoning) {
  absl::Status st = ValidateNomination(nominator, nominee);
  if (!st.ok()) {
    g_->AddEvent(INVALID_ACTION,
                 absl::StrFormat("Nomination of %s by %s rejected: %s",
                                 g_->Name(nominee), g_->Name(nominator),
                                 st.message()),
                 {nominator, nominee});
    return false;
  }
  g_->mutable_player(nominator)->used_nomination = true;
  g_->mutable_player(nominee)->nominated_today = true;

  if (abilities_->ResolveVirgin(nominator, nominee)) {
    return true;
  }

  string description = absl::StrFormat("%s nominates %s.", g_->Name(nominator),
                                       g_->Name(nominee));
  if (!public_reasoning.empty()) {
    absl::StrAppend(&description, " \"", public_reasoning, "\"");
  }
  absl::StrAppend(&description, " ", ChoppingBlockDescription(*g_));
  g_->AddEvent(NOMINATION, description, {nominator, nominee},
               {{"reasoning", public_reasoning}});

  VoteContext context;
  context.set_nominator(g_->Name(nominator));
  context.set_nominee(g_->Name(nominee));
  context.set_required_to_nominate(RequiredToNominate());
  context.set_required_to_tie(RequiredToTie());

  // The Butler's restriction holds for the first vote of the day after
  // their choice.
  int butler = g_->FindCharacter(BUTLER);
  const int master = g_->mutable_tokens()->Consume(BUTLER_MASTER);
  if (butler != kNoPlayer && (master == kNoPlayer || !g_->IsAlive(butler) ||
                              IsImpaired(*g_, butler))) {
    butler = kNoPlayer;
  }

  const int n = g_->NumPlayers();
  int yes = 0;
  vector<int> yes_voters;
  for (int i = 0; i < n; ++i) {
    const int voter = (nominee + i) % n;
    VoteRecord record = CollectVote(voter, context, butler, master);
    if (record.vote() == YES) {
      ++yes;
      yes_voters.push_back(voter);
    }
    g_->AddEvent(VOTING, absl::StrFormat(
        "%s votes %s on %s", record.voter(), VoteValue_Name(record.vote()),
        g_->Name(nominee)), {voter},
        {{"vote", VoteValue_Name(record.vote())}});
    *context.add_previous_votes() = record;
  }

  string outcome;
  if (yes >= context.required_to_nominate()) {
    g_->SetChoppingBlock(nominee, yes);
    outcome = absl::StrFormat("%s is now on the chopping block",
                              g_->Name(nominee));
  } else if (context.required_to_tie() > 0 &&
             yes == context.required_to_tie()) {
    g_->ClearChoppingBlock();
    outcome = "The vote is tied, nobody is on the chopping block";
  } else {
    outcome = absl::StrCat("Not enough votes. ",
                           ChoppingBlockDescription(*g_));
  }
  vector<string> record;
  for (const auto& vote : context.previous_votes()) {
    record.push_back(
        absl::StrCat(vote.voter(), ": ", VoteValue_Name(vote.vote())));
  }
  g_->AddEvent(NOMINATION_RESULT, absl::StrFormat(
      "%d votes for %s (%d needed). %s. Votes: %s", yes, g_->Name(nominee),
      context.required_to_nominate(), outcome, absl::StrJoin(record, ", ")),
      yes_voters, {{"yes_votes", absl::StrCat(yes)}});
  return false;
}

}  // namespace storyteller
