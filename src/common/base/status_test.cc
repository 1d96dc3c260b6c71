/*
 * Copyright 2018- The Pixie Authors.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "src/common/base/status.h"

#include <google/protobuf/util/message_differencer.h>

#include <memory>

#include "src/common/testing/testing.h"

namespace tessera {

using ::tessera::testing::status::StatusIs;
using ::testing::HasSubstr;

TEST(Status, Default) {
  Status status;
  EXPECT_TRUE(status.ok());
  EXPECT_EQ(status, Status::OK());
  EXPECT_EQ(status.code(), statuspb::OK);
  EXPECT_EQ(status.ToString(), "OK");
}

TEST(Status, CopyAndCompare) {
  Status a(statuspb::INVALID_ARGUMENT, "column 'q' not found");
  Status b = a;
  EXPECT_EQ(a, b);

  Status c(statuspb::NOT_FOUND, "column 'q' not found");
  EXPECT_NE(a, c);
}

TEST(Status, MoveLeavesSourceReusable) {
  Status a(statuspb::INTERNAL, "boom");
  Status b = std::move(a);
  EXPECT_EQ(b.code(), statuspb::INTERNAL);
  a = Status::OK();
  EXPECT_TRUE(a.ok());
}

Status ReturnIfErrorFn(const Status& s) {
  TESSERA_RETURN_IF_ERROR(s);
  return Status::OK();
}

TEST(Status, ReturnIfErrorEvaluatesOnce) {
  EXPECT_EQ(Status::OK(), ReturnIfErrorFn(Status::OK()));

  Status err(statuspb::UNKNOWN, "an error");
  EXPECT_EQ(err, ReturnIfErrorFn(err));

  int call_count = 0;
  auto fn = [&]() -> Status {
    call_count++;
    return Status::OK();
  };
  auto test_fn = [&]() -> Status {
    TESSERA_RETURN_IF_ERROR(fn());
    return Status::OK();
  };
  EXPECT_OK(test_fn());
  EXPECT_EQ(1, call_count);
}

TEST(Status, ToStringIncludesCode) {
  Status s(statuspb::FAILED_PRECONDITION, "categories are unknown");
  EXPECT_EQ(s.ToString(), "Failed Precondition : categories are unknown");
}

TEST(Status, ProtoConversion) {
  Status s(statuspb::DEADLINE_EXCEEDED, "too many iterations");
  statuspb::Status pb = s.ToProto();
  EXPECT_EQ(statuspb::DEADLINE_EXCEEDED, pb.err_code());
  EXPECT_EQ("too many iterations", pb.msg());
  EXPECT_EQ(s, Status(pb));

  statuspb::Status ok_pb;
  Status::OK().ToProto(&ok_pb);
  EXPECT_EQ(statuspb::OK, ok_pb.err_code());
  EXPECT_TRUE(Status(ok_pb).ok());
}

std::unique_ptr<google::protobuf::Message> MakeContext() {
  auto cause = std::make_unique<statuspb::Status>();
  cause->set_err_code(statuspb::NOT_FOUND);
  cause->set_msg("fragment part.0 missing");
  return cause;
}

TEST(Status, ContextSurvivesCopyAndProto) {
  Status s1(statuspb::UNKNOWN, "read failed", MakeContext());
  ASSERT_TRUE(s1.has_context());
  Status s2 = s1;
  EXPECT_TRUE(s2.has_context());
  EXPECT_EQ(s1, s2);

  Status s3 = StatusAdapter(s1.ToProto());
  EXPECT_TRUE(google::protobuf::util::MessageDifferencer::Equals(s1.ToProto(), s3.ToProto()));

  statuspb::Status unpacked;
  ASSERT_TRUE(s3.context()->UnpackTo(&unpacked));
  EXPECT_EQ(unpacked.msg(), "fragment part.0 missing");
}

TEST(Status, ContextMakesStatusesDiffer) {
  Status with_ctx(statuspb::UNKNOWN, "read failed", MakeContext());
  Status without_ctx(with_ctx.code(), with_ctx.msg());
  EXPECT_NE(with_ctx, without_ctx);
  EXPECT_EQ(without_ctx.context(), nullptr);
  EXPECT_THAT(with_ctx, StatusIs(statuspb::UNKNOWN, HasSubstr("read failed")));
}

}  // namespace tessera
