// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.
// +-------------------------------------------------------------------------

#ifndef XFER_CLIENT_TRANSFERERROR_H_
#define XFER_CLIENT_TRANSFERERROR_H_

#include <string>

#include "client/ClientError.hpp"

namespace XF {

namespace Client {

struct TransferError {
  enum Value {
    UNKNOWN,
    GOOD,

    // rejected before any store request
    INVALID_CONFIGURATION,
    INVALID_PARTITION,  // e.g. zero length or too many parts

    // local filesystem
    LOCAL_FILE_ACCESS_FAILED,  // missing, not a regular file, no permission
    LOCAL_FILE_READ_FAILED,
    LOCAL_FILE_WRITE_FAILED,  // e.g. disk full

    // remote store
    STORE_REQUEST_FAILED,       // request sent but got no response
    STORE_NOT_FOUND,            // no such bucket or object
    STORE_ACCESS_DENIED,
    STORE_NO_SUCH_UPLOAD,       // multipart session unknown to the store
    STORE_UNEXPECTED_RESPONSE,
    STORE_INCOMPLETE_BODY,      // response body shorter than asked for

    // another part failed first and this one was stopped
    CANCELLED
  };
};

// Which side of the transfer an error comes from
struct TransferErrorCategory {
  enum Value { None, Configuration, LocalIO, Store, Cancelled };
};

TransferError::Value StringToTransferError(const std::string &errorCode);
std::string TransferErrorToString(TransferError::Value err);

TransferErrorCategory::Value GetTransferErrorCategory(TransferError::Value err);
std::string TransferErrorCategoryToString(
    TransferErrorCategory::Value category);

std::string GetMessageForTransferError(
    const ClientError<TransferError::Value> &error);
bool IsGoodTransferError(const ClientError<TransferError::Value> &error);
bool IsCancelledTransferError(const ClientError<TransferError::Value> &error);

}  // namespace Client
}  // namespace XF

#endif  // XFER_CLIENT_TRANSFERERROR_H_
