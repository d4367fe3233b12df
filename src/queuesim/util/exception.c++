// Copyright (c) 2017-2022 Cloudflare, Inc.
// Licensed under the Apache 2.0 license found in the LICENSE file or at:
//     https://opensource.org/licenses/Apache-2.0

#include "exception.h"

namespace queuesim {

kj::Exception httpStatusError(uint status, kj::String message) {
  kj::Exception exception(kj::Exception::Type::FAILED, __FILE__, __LINE__, kj::mv(message));
  auto detail = kj::heapArray<kj::byte>(2);
  detail[0] = (status >> 8) & 0xff;
  detail[1] = status & 0xff;
  exception.setDetail(HTTP_STATUS_DETAIL_ID, kj::mv(detail));
  return exception;
}

kj::Maybe<uint> getHttpStatus(const kj::Exception& exception) {
  KJ_IF_SOME(detail, exception.getDetail(HTTP_STATUS_DETAIL_ID)) {
    if (detail.size() == 2) {
      return (uint(detail[0]) << 8) | detail[1];
    }
  }
  return kj::none;
}

}  // namespace queuesim
