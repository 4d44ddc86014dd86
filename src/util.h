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

#ifndef SRC_UTIL_H_
#define SRC_UTIL_H_

#include <filesystem>
#include <string>

#include "absl/status/status.h"
#include "google/protobuf/message.h"

namespace storyteller {
using google::protobuf::Message;
using std::filesystem::path;
using std::string;

// Text proto format is used for configs, game logs and decision scripts.
absl::Status ReadProtoFromFile(const path& filename, Message* msg);
absl::Status WriteProtoToFile(const Message& msg, const path& filename);
}  // namespace storyteller

#endif  // SRC_UTIL_H_
