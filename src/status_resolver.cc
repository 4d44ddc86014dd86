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

#include "src/status_resolver.h"

#include <set>

namespace storyteller {
namespace {
bool IsImpairedOnPath(const GameState& g, int player, set<int>* path) {
  if (g.player(player).character == DRUNK) {
    return true;
  }
  if (path->count(player) > 0) {
    return false;
  }
  path->insert(player);
  bool impaired = false;
  for (int poisoner : g.PoisonersOf(player)) {
    if (g.IsAlive(poisoner) && !IsImpairedOnPath(g, poisoner, path)) {
      impaired = true;
      break;
    }
  }
  path->erase(player);
  return impaired;
}
}  // namespace

bool IsImpaired(const GameState& g, int player) {
  set<int> path;
  return IsImpairedOnPath(g, player, &path);
}

}  // namespace storyteller
