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

#ifndef SRC_REMINDER_TOKENS_H_
#define SRC_REMINDER_TOKENS_H_

#include <map>
#include <utility>
#include <vector>

#include "src/game_log.pb.h"
#include "src/player.h"

namespace storyteller {

using std::map;
using std::pair;
using std::vector;

enum class TokenScope {
  kOneNight,  // Cleared at the start of the following day.
  kOneDay,  // Cleared at the start of the following night.
  kUntilConsumed,  // Cleared by the handler that reads it.
  kWholeGame,
};

TokenScope ScopeOf(ReminderToken token);

// Facts that need to outlive the moment they were learned, keyed by token
// kind. Each token kind marks at most one player.
class ReminderTokens {
 public:
  void Set(ReminderToken token, int player);
  bool Has(ReminderToken token) const;
  // Returns kNoPlayer if the token is not placed.
  int Get(ReminderToken token) const;
  // Returns the marked player and removes the token, or kNoPlayer.
  int Consume(ReminderToken token);
  void Clear(ReminderToken token);
  // Removes every token of the given scope.
  void ClearScope(TokenScope scope);

  const map<ReminderToken, int>& Active() const { return tokens_; }

 private:
  map<ReminderToken, int> tokens_;
};

}  // namespace storyteller

#endif  // SRC_REMINDER_TOKENS_H_
