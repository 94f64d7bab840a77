// Copyright 2010-2025 Google LLC
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

// gMock matchers for protocol buffers:
//   EqualsProto(pb)     The argument has the same fields as pb.
//   EqualsProto(text)   The argument has the fields of the text proto.

#ifndef RECTPACK_BASE_MESSAGE_MATCHERS_H_
#define RECTPACK_BASE_MESSAGE_MATCHERS_H_

#include <memory>
#include <ostream>
#include <string>

#include "absl/strings/string_view.h"
#include "gmock/gmock.h"
#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"
#include "google/protobuf/util/message_differencer.h"

namespace testing {
namespace internal {

class ProtoMatcher {
 public:
  using MessageType = ::google::protobuf::Message;

  explicit ProtoMatcher(const MessageType& message)
      : message_(CloneMessage(message)) {}

  explicit ProtoMatcher(absl::string_view text_proto)
      : text_proto_(text_proto) {}

  template <typename T>
  bool MatchAndExplain(const T& m, MatchResultListener* listener) const {
    const MessageType* expected = message_.get();
    std::unique_ptr<MessageType> parsed;
    if (expected == nullptr) {
      parsed.reset(m.New());
      if (!::google::protobuf::TextFormat::ParseFromString(text_proto_,
                                                           parsed.get())) {
        *listener << "the expected text proto does not parse as a "
                  << m.GetTypeName();
        return false;
      }
      expected = parsed.get();
    }
    if (expected->GetDescriptor() != m.GetDescriptor()) {
      *listener << "whose type " << m.GetTypeName() << " differs from "
                << expected->GetTypeName();
      return false;
    }
    std::string differences;
    ::google::protobuf::util::MessageDifferencer differencer;
    differencer.ReportDifferencesToString(&differences);
    if (differencer.Compare(*expected, m)) return true;
    *listener << "with the differences:\n" << differences;
    return false;
  }

  void DescribeTo(std::ostream* os) const {
    *os << "is equal to <" << ExpectedMessageDescription() << ">";
  }

  void DescribeNegationTo(std::ostream* os) const {
    *os << "is not equal to <" << ExpectedMessageDescription() << ">";
  }

 private:
  static std::shared_ptr<MessageType> CloneMessage(const MessageType& message) {
    std::shared_ptr<MessageType> clone(message.New());
    clone->CopyFrom(message);
    return clone;
  }

  std::string ExpectedMessageDescription() const {
    return message_ != nullptr ? message_->ShortDebugString() : text_proto_;
  }

  std::shared_ptr<MessageType> message_;
  std::string text_proto_;
};

}  // namespace internal

inline PolymorphicMatcher<internal::ProtoMatcher> EqualsProto(
    const ::google::protobuf::Message& message) {
  return MakePolymorphicMatcher(internal::ProtoMatcher(message));
}

inline PolymorphicMatcher<internal::ProtoMatcher> EqualsProto(
    absl::string_view text_proto) {
  return MakePolymorphicMatcher(internal::ProtoMatcher(text_proto));
}

}  // namespace testing

#endif  // RECTPACK_BASE_MESSAGE_MATCHERS_H_
