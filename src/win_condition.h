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

#ifndef SRC_WIN_CONDITION_H_
#define SRC_WIN_CONDITION_H_

#include "absl/types/span.h"
#include "src/game_log.pb.h"
#include "src/player.h"

namespace storyteller {

// The ordinary win check: GOOD if no Demon is alive, EVIL if at most two
// players are alive, TEAM_UNSPECIFIED otherwise. The Mayor and Saint
// triggers are raised by the game itself.
Team EvaluateWinCondition(absl::Span<const Player> players);

}  // namespace storyteller

#endif  // SRC_WIN_CONDITION_H_
