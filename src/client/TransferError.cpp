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

#include "client/TransferError.h"

#include <string>
#include <utility>

namespace XF {

namespace Client {

using std::make_pair;
using std::pair;
using std::string;

namespace {

// keep in enum order, so the enum value is the index
const pair<TransferError::Value, const char *> errorNames[] = {
    make_pair(TransferError::UNKNOWN, "Unknown"),
    make_pair(TransferError::GOOD, "Good"),
    make_pair(TransferError::INVALID_CONFIGURATION, "InvalidConfiguration"),
    make_pair(TransferError::INVALID_PARTITION, "InvalidPartition"),
    make_pair(TransferError::LOCAL_FILE_ACCESS_FAILED, "LocalFileAccessFailed"),
    make_pair(TransferError::LOCAL_FILE_READ_FAILED, "LocalFileReadFailed"),
    make_pair(TransferError::LOCAL_FILE_WRITE_FAILED, "LocalFileWriteFailed"),
    make_pair(TransferError::STORE_REQUEST_FAILED, "StoreRequestFailed"),
    make_pair(TransferError::STORE_NOT_FOUND, "StoreNotFound"),
    make_pair(TransferError::STORE_ACCESS_DENIED, "StoreAccessDenied"),
    make_pair(TransferError::STORE_NO_SUCH_UPLOAD, "StoreNoSuchUpload"),
    make_pair(TransferError::STORE_UNEXPECTED_RESPONSE,
              "StoreUnexpectedResponse"),
    make_pair(TransferError::STORE_INCOMPLETE_BODY, "StoreIncompleteBody"),
    make_pair(TransferError::CANCELLED, "Cancelled"),
};

const int errorCount = sizeof(errorNames) / sizeof(errorNames[0]);

}  // namespace

// --------------------------------------------------------------------------
TransferError::Value StringToTransferError(const string &errorCode) {
  for (int i = 0; i < errorCount; ++i) {
    if (errorCode == errorNames[i].second) {
      return errorNames[i].first;
    }
  }
  return TransferError::UNKNOWN;
}

// --------------------------------------------------------------------------
string TransferErrorToString(TransferError::Value err) {
  int index = static_cast<int>(err);
  return (index >= 0 && index < errorCount) ? errorNames[index].second
                                            : "Unknown";
}

// --------------------------------------------------------------------------
TransferErrorCategory::Value GetTransferErrorCategory(
    TransferError::Value err) {
  switch (err) {
    case TransferError::GOOD:
      return TransferErrorCategory::None;
    case TransferError::INVALID_CONFIGURATION:
    case TransferError::INVALID_PARTITION:
      return TransferErrorCategory::Configuration;
    case TransferError::LOCAL_FILE_ACCESS_FAILED:
    case TransferError::LOCAL_FILE_READ_FAILED:
    case TransferError::LOCAL_FILE_WRITE_FAILED:
      return TransferErrorCategory::LocalIO;
    case TransferError::CANCELLED:
      return TransferErrorCategory::Cancelled;
    default:
      // unknown errors come from store implementations
      return TransferErrorCategory::Store;
  }
}

// --------------------------------------------------------------------------
string TransferErrorCategoryToString(TransferErrorCategory::Value category) {
  switch (category) {
    case TransferErrorCategory::None:
      return "None";
    case TransferErrorCategory::Configuration:
      return "Configuration";
    case TransferErrorCategory::LocalIO:
      return "LocalIO";
    case TransferErrorCategory::Store:
      return "Store";
    case TransferErrorCategory::Cancelled:
      return "Cancelled";
    default:
      return "Unknown";
  }
}

// --------------------------------------------------------------------------
string GetMessageForTransferError(
    const ClientError<TransferError::Value> &error) {
  return TransferErrorCategoryToString(
             GetTransferErrorCategory(error.GetError())) +
         " error " + TransferErrorToString(error.GetError()) + ", " +
         error.GetExceptionName() + ":" + error.GetMessage();
}

// --------------------------------------------------------------------------
bool IsGoodTransferError(const ClientError<TransferError::Value> &error) {
  return error.GetError() == TransferError::GOOD;
}

// --------------------------------------------------------------------------
bool IsCancelledTransferError(const ClientError<TransferError::Value> &error) {
  return error.GetError() == TransferError::CANCELLED;
}

}  // namespace Client
}  // namespace XF
