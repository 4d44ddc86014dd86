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

#include "src/rng.h"

#include <random>

namespace storyteller {
namespace {
uint64_t SeedFromDevice() {
  std::random_device rd;
  uint64_t seed = (static_cast<uint64_t>(rd()) << 32) | rd();
  return seed == 0 ? 1 : seed;
}
}  // namespace

Rng::Rng(uint64_t seed)
    : seed_(seed == 0 ? SeedFromDevice() : seed), engine_(seed_) {}

int Rng::UniformInt(int a, int b) {
  CHECK_LE(a, b);
  std::uniform_int_distribution<int> dist(a, b);
  return dist(engine_);
}

uint64_t Rng::NextSeed() {
  uint64_t seed = engine_();
  return seed == 0 ? 1 : seed;
}

}  // namespace storyteller
