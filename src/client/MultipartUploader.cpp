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

#include "client/MultipartUploader.h"

#include <exception>
#include <string>
#include <utility>
#include <vector>

#include "boost/bind.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/make_shared.hpp"
#include "boost/scope_exit.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/thread.hpp"
#include "boost/thread/thread_time.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "base/ThreadPool.h"
#include "client/ObjectStore.h"
#include "client/TransferHandle.h"
#include "client/Utils.h"
#include "configure/Default.h"
#include "data/FileChunkReader.h"

namespace XF {

namespace Client {

using boost::bind;
using boost::shared_ptr;
using boost::to_string;
using XF::Client::Utils::CalculatePartCount;
using XF::Client::Utils::CalculatePartSize;
using XF::Configure::Default::GetMaxPartCount;
using XF::Data::FileChunkReader;
using XF::StringUtils::FormatObject;
using XF::Threading::ThreadPool;
using std::make_pair;
using std::pair;
using std::string;
using std::vector;

typedef ClientError<TransferError::Value> TransferClientError;

// --------------------------------------------------------------------------
struct ReceivedHandlerUploadPart {
  shared_ptr<TransferHandle> handle;
  shared_ptr<Part> part;

  ReceivedHandlerUploadPart(const shared_ptr<TransferHandle> &handle_,
                            const shared_ptr<Part> &part_)
      : handle(handle_), part(part_) {}

  void operator()(const pair<TransferClientError, string> &outcome) {
    const TransferClientError &err = outcome.first;
    if (IsGoodTransferError(err)) {
      part->OnCompleted(handle);
      handle->ChangePartToCompleted(part, outcome.second);
      DebugInfo("Uploaded part " << part->ToString() << " of "
                                 << FormatObject(handle->GetBucket(),
                                                 handle->GetObjectKey()));
      return;
    }

    handle->SetError(err);
    if (!IsCancelledTransferError(err)) {
      Error("Fail to upload part " << part->GetPartId() << " of "
                                   << FormatObject(handle->GetBucket(),
                                                   handle->GetObjectKey())
                                   << ", " << GetMessageForTransferError(err));
      // stop all the other parts
      handle->Cancel();
    }
    handle->ChangePartToFailed(part);
  }
};

// --------------------------------------------------------------------------
MultipartUploader::MultipartUploader(const shared_ptr<ObjectStore> &store,
                                     const TransferPolicy &policy,
                                     const shared_ptr<ThreadPool> &executor)
    : m_store(store), m_policy(policy), m_executor(executor) {}

// --------------------------------------------------------------------------
void MultipartUploader::Upload(const shared_ptr<TransferHandle> &handle,
                               uint64_t fileSize) {
  handle->SetIsMultipart(true);
  handle->SetBytesTotalSize(fileSize);
  handle->UpdateStatus(TransferStatus::InProgress);

  if (!PrepareParts(handle, fileSize) || !CreateSession(handle)) {
    handle->UpdateStatus(IsCancelledTransferError(handle->GetError())
                             ? TransferStatus::Cancelled
                             : TransferStatus::Failed);
    return;
  }

  bool completed = false;
  MultipartUploader *const uploader = this;
  BOOST_SCOPE_EXIT((&completed)(uploader)(&handle)) {
    if (!completed) {
      uploader->AbortSession(handle);
    }
  }
  BOOST_SCOPE_EXIT_END

  DispatchParts(handle);
  handle->WaitUntilPartsDrained();

  TransferClientError err = handle->GetError();
  if (!handle->ShouldContinue() || handle->HasFailedParts()) {
    if (IsGoodTransferError(err) || IsCancelledTransferError(err)) {
      handle->SetError(TransferClientError(TransferError::CANCELLED,
                                           "MultipartUpload",
                                           "upload cancelled", false));
      handle->UpdateStatus(TransferStatus::Cancelled);
    } else {
      handle->UpdateStatus(TransferStatus::Failed);
    }
    return;
  }

  err = CompleteSession(handle);
  if (IsGoodTransferError(err)) {
    completed = true;
    handle->UpdateStatus(TransferStatus::Completed);
  } else {
    handle->SetError(err);
    Error("Fail to complete multipart upload "
          << FormatObject(handle->GetBucket(), handle->GetObjectKey())
          << ", " << GetMessageForTransferError(err));
    handle->UpdateStatus(TransferStatus::Failed);
  }
}

// --------------------------------------------------------------------------
bool MultipartUploader::PrepareParts(const shared_ptr<TransferHandle> &handle,
                                     uint64_t fileSize) {
  uint64_t partSize = m_policy.GetPartSize();
  uint64_t partCount = CalculatePartCount(fileSize, partSize);
  if (partCount == 0 || partCount > GetMaxPartCount()) {
    string msg = "[file size: " + to_string(fileSize) +
                 ", part size: " + to_string(partSize) +
                 ", part count: " + to_string(partCount) +
                 ", max part count: " + to_string(GetMaxPartCount()) + "]";
    handle->SetError(TransferClientError(TransferError::INVALID_PARTITION,
                                         "MultipartUpload", msg, false));
    Error("Unable to split " << handle->GetTargetFilePath()
                             << " into parts " << msg);
    return false;
  }

  for (uint64_t i = 1; i <= partCount; ++i) {
    // part id, size, range begin
    handle->AddQueuePart(boost::make_shared<Part>(
        static_cast<uint32_t>(i), CalculatePartSize(fileSize, partSize, i),
        (i - 1) * partSize));
  }
  return true;
}

// --------------------------------------------------------------------------
bool MultipartUploader::CreateSession(
    const shared_ptr<TransferHandle> &handle) {
  string uploadId;
  TransferClientError err = m_policy.GetRetryStrategy().Run(
      bind(boost::type<TransferClientError>(),
           &MultipartUploader::CreateSessionOnce, this, handle, &uploadId),
      handle);
  if (!IsGoodTransferError(err)) {
    handle->SetError(err);
    Error("Fail to initiate multipart upload "
          << FormatObject(handle->GetBucket(), handle->GetObjectKey())
          << ", " << GetMessageForTransferError(err));
    return false;
  }

  handle->SetMultipartId(uploadId);
  Info("Initiated multipart upload " << uploadId << " for "
                                     << FormatObject(handle->GetBucket(),
                                                     handle->GetObjectKey()));
  return true;
}

// --------------------------------------------------------------------------
void MultipartUploader::DispatchParts(
    const shared_ptr<TransferHandle> &handle) {
  PartIdToPartMap queuedParts = handle->GetQueuedParts();
  PartIdToPartMapIterator ipart = queuedParts.begin();
  for (; ipart != queuedParts.end() && handle->ShouldContinue(); ++ipart) {
    const shared_ptr<Part> &part = ipart->second;
    handle->AddPendingPart(part);
    ReceivedHandlerUploadPart receivedHandler(handle, part);
    m_executor->SubmitAsync(
        bind(boost::type<void>(), receivedHandler, _1),
        bind(boost::type<pair<TransferClientError, string> >(),
             &MultipartUploader::UploadPartWrapper, this, _1, _2),
        handle, part);
  }

  // cancelled before these parts got their turn
  for (; ipart != queuedParts.end(); ++ipart) {
    handle->ChangePartToFailed(ipart->second);
  }
}

// --------------------------------------------------------------------------
TransferClientError MultipartUploader::CompleteSession(
    const shared_ptr<TransferHandle> &handle) {
  // parts map is ordered by part id
  vector<CompletedPart> parts;
  BOOST_FOREACH(const PartIdToPartMap::value_type &p,
                handle->GetCompletedParts()) {
    parts.push_back(CompletedPart(p.second->GetPartId(), p.second->GetETag()));
  }

  TransferClientError err = m_policy.GetRetryStrategy().Run(
      bind(boost::type<TransferClientError>(),
           &MultipartUploader::CompleteSessionOnce, this, handle, parts),
      handle);
  InfoIf(IsGoodTransferError(err),
         "Completed multipart upload " << handle->GetMultipartId() << " for "
                                       << FormatObject(handle->GetBucket(),
                                                       handle->GetObjectKey())
                                       << " with " << parts.size()
                                       << " parts");
  return err;
}

// --------------------------------------------------------------------------
void MultipartUploader::AbortSession(const shared_ptr<TransferHandle> &handle) {
  // the transfer is cancelled by now, so retry here without the handle
  RetryStrategy retryStrategy = m_policy.GetRetryStrategy();
  TransferClientError err;
  for (uint16_t attempted = 0;; ++attempted) {
    try {
      err = m_store->AbortMultipartUpload(
          handle->GetBucket(), handle->GetObjectKey(),
          handle->GetMultipartId());
    } catch (const std::exception &e) {
      err = TransferClientError(TransferError::STORE_REQUEST_FAILED,
                                "AbortMultipartUpload", e.what(), true);
    }
    if (IsGoodTransferError(err) ||
        !retryStrategy.ShouldRetry(err, attempted)) {
      break;
    }
    boost::this_thread::sleep(boost::posix_time::milliseconds(
        retryStrategy.CalculateDelayBeforeNextRetry(attempted + 1)));
  }

  if (IsGoodTransferError(err)) {
    handle->UpdateStatus(TransferStatus::Aborted);
    Info("Aborted multipart upload " << handle->GetMultipartId() << " for "
                                     << FormatObject(handle->GetBucket(),
                                                     handle->GetObjectKey()));
  } else {
    handle->SetError(err);
    Error("Fail to abort multipart upload "
          << handle->GetMultipartId() << " for "
          << FormatObject(handle->GetBucket(), handle->GetObjectKey()) << ", "
          << GetMessageForTransferError(err));
  }
}

// --------------------------------------------------------------------------
TransferClientError MultipartUploader::CreateSessionOnce(
    const shared_ptr<TransferHandle> &handle, string *uploadId) {
  CreateMultipartUploadOutcome outcome;
  try {
    outcome = m_store->CreateMultipartUpload(
        handle->GetBucket(), handle->GetObjectKey(), handle->GetExtraArgs());
  } catch (const std::exception &e) {
    return TransferClientError(TransferError::STORE_REQUEST_FAILED,
                               "CreateMultipartUpload", e.what(), true);
  }
  if (!outcome.IsSuccess()) {
    return outcome.GetError();
  }
  if (outcome.GetResult().empty()) {
    return TransferClientError(TransferError::STORE_UNEXPECTED_RESPONSE,
                               "CreateMultipartUpload", "empty upload id",
                               false);
  }
  *uploadId = outcome.GetResult();
  return TransferClientError(TransferError::GOOD, false);
}

// --------------------------------------------------------------------------
TransferClientError MultipartUploader::CompleteSessionOnce(
    const shared_ptr<TransferHandle> &handle,
    const vector<CompletedPart> &parts) {
  try {
    return m_store->CompleteMultipartUpload(handle->GetBucket(),
                                            handle->GetObjectKey(),
                                            handle->GetMultipartId(), parts);
  } catch (const std::exception &e) {
    return TransferClientError(TransferError::STORE_REQUEST_FAILED,
                               "CompleteMultipartUpload", e.what(), true);
  }
}

// --------------------------------------------------------------------------
pair<TransferClientError, string> MultipartUploader::UploadPartWrapper(
    const shared_ptr<TransferHandle> &handle, const shared_ptr<Part> &part) {
  // never throws, the received handler must see every part
  string eTag;
  TransferClientError err = m_policy.GetRetryStrategy().Run(
      bind(boost::type<TransferClientError>(),
           &MultipartUploader::UploadPartOnce, this, handle, part, &eTag),
      handle);
  return make_pair(err, eTag);
}

// --------------------------------------------------------------------------
TransferClientError MultipartUploader::UploadPartOnce(
    const shared_ptr<TransferHandle> &handle, const shared_ptr<Part> &part,
    string *eTag) {
  part->Reset();
  shared_ptr<FileChunkReader> body = boost::make_shared<FileChunkReader>(
      handle->GetTargetFilePath(), part->GetRangeBegin(), part->GetSize(),
      PartProgressReporter(part, handle));
  pair<bool, string> res = body->Open();
  if (!res.first) {
    return TransferClientError(TransferError::LOCAL_FILE_ACCESS_FAILED,
                               "UploadPart", res.second, false);
  }
  if (body->GetLength() != part->GetSize()) {
    return TransferClientError(
        TransferError::LOCAL_FILE_READ_FAILED, "UploadPart",
        "file shrank since upload started " + part->ToString(), false);
  }

  UploadPartOutcome outcome;
  try {
    outcome = m_store->UploadPart(handle->GetBucket(), handle->GetObjectKey(),
                                  handle->GetMultipartId(), part->GetPartId(),
                                  body);
  } catch (const std::exception &e) {
    return TransferClientError(TransferError::STORE_REQUEST_FAILED,
                               "UploadPart", e.what(), true);
  }
  if (body->Bad()) {
    return TransferClientError(TransferError::LOCAL_FILE_READ_FAILED,
                               "UploadPart",
                               "fail to read " + body->GetFilePath(), false);
  }
  if (!outcome.IsSuccess()) {
    return outcome.GetError();
  }
  *eTag = outcome.GetResult();
  return TransferClientError(TransferError::GOOD, false);
}

}  // namespace Client
}  // namespace XF
