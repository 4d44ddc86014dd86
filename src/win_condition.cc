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

#include "src/win_condition.h"

#include "src/script.h"

namespace storyteller {

Team EvaluateWinCondition(absl::Span<const Player> players) {
  int num_alive = 0, num_alive_demons = 0;
  for (const Player& p : players) {
    if (!p.alive) {
      continue;
    }
    ++num_alive;
    if (CategoryOf(p.character) == DEMON) {
      ++num_alive_demons;
    }
  }
  if (num_alive_demons == 0) {
    return GOOD;
  }
  if (num_alive <= 2) {
    return EVIL;
  }
  return TEAM_UNSPECIFIED;
}

}  // namespace storyteller
