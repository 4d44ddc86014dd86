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

#ifndef SRC_STATUS_RESOLVER_H_
#define SRC_STATUS_RESOLVER_H_

#include "src/game_state.h"

namespace storyteller {

// Whether the player's ability is currently impaired: they are the Drunk, or
// some alive player poisoning them is not impaired themselves.
//
// Cyclic poisoning is resolved by depth-first traversal: a player already on
// the current path counts as not impaired. Hence two players poisoning each
// other cancel out, and a player poisoning themselves is impaired.
bool IsImpaired(const GameState& g, int player);

}  // namespace storyteller

#endif  // SRC_STATUS_RESOLVER_H_
