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

#include "src/reminder_tokens.h"

#include "ortools/base/logging.h"

namespace storyteller {

TokenScope ScopeOf(ReminderToken token) {
  switch (token) {
    case MONK_PROTECTED:
    case IMP_KILLED:
      return TokenScope::kOneNight;
    case BUTLER_MASTER:
      return TokenScope::kOneDay;
    case RAVENKEEPER_WOKEN:
    case UNDERTAKER_EXECUTED:
      return TokenScope::kUntilConsumed;
    case RED_HERRING:
    case WASHERWOMAN_TOWNSFOLK:
    case WASHERWOMAN_OTHER:
    case LIBRARIAN_OUTSIDER:
    case LIBRARIAN_OTHER:
    case INVESTIGATOR_MINION:
    case INVESTIGATOR_OTHER:
    case IS_THE_DRUNK:
    case VIRGIN_POWER_USED:
      return TokenScope::kWholeGame;
    default:
      CHECK(false) << "Invalid reminder token: " << token;
  }
  return TokenScope::kWholeGame;
}

void ReminderTokens::Set(ReminderToken token, int player) {
  CHECK_NE(token, REMINDER_TOKEN_UNSPECIFIED);
  CHECK_NE(player, kNoPlayer) << "Token " << ReminderToken_Name(token)
                              << " needs a player";
  tokens_[token] = player;
}

bool ReminderTokens::Has(ReminderToken token) const {
  return tokens_.find(token) != tokens_.end();
}

int ReminderTokens::Get(ReminderToken token) const {
  const auto it = tokens_.find(token);
  return it == tokens_.end() ? kNoPlayer : it->second;
}

int ReminderTokens::Consume(ReminderToken token) {
  const int player = Get(token);
  tokens_.erase(token);
  return player;
}

void ReminderTokens::Clear(ReminderToken token) {
  tokens_.erase(token);
}

void ReminderTokens::ClearScope(TokenScope scope) {
  for (auto it = tokens_.begin(); it != tokens_.end();) {
    if (ScopeOf(it->first) == scope) {
      it = tokens_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace storyteller
