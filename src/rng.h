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

#ifndef SRC_RNG_H_
#define SRC_RNG_H_

#include <algorithm>
#include <cstdint>
#include <random>
#include <vector>

#include "ortools/base/logging.h"

namespace storyteller {

using std::vector;

// The storyteller's source of randomness. Every random choice of a game
// (setup tokens, fabricated information, action order) is drawn from one
// instance, so the setup plus the recorded decisions replays a game exactly.
// Not thread-safe.
class Rng {
 public:
  // A zero seed draws a seed from the random device.
  explicit Rng(uint64_t seed);

  // The seed actually in use.
  uint64_t seed() const { return seed_; }

  // Uniform integer in [a, b].
  int UniformInt(int a, int b);

  // A non-zero seed for a further Rng, continuing this stream.
  uint64_t NextSeed();

  template<typename T> T Choose(const vector<T>& items) {
    CHECK(!items.empty()) << "Choosing from an empty set";
    return items[UniformInt(0, items.size() - 1)];
  }

  template<typename T> void Shuffle(vector<T>* items) {
    std::shuffle(items->begin(), items->end(), engine_);
  }

  // Up to k distinct elements, in random order.
  template<typename T> vector<T> Sample(const vector<T>& items, int k) {
    vector<T> result = items;
    Shuffle(&result);
    if (k < result.size()) {
      result.resize(k);
    }
    return result;
  }

 private:
  uint64_t seed_;
  std::mt19937_64 engine_;
};

}  // namespace storyteller

#endif  // SRC_RNG_H_
