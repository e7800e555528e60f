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

#include "client/TransferManager.h"

#include <exception>
#include <string>
#include <utility>

#include "boost/bind.hpp"
#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "base/ThreadPool.h"
#include "base/Utils.h"
#include "client/MultipartDownloader.h"
#include "client/MultipartUploader.h"
#include "client/TransferHandle.h"
#include "configure/Default.h"
#include "data/ConcurrentFileWriter.h"
#include "data/FileChunkReader.h"

namespace XF {

namespace Client {

using boost::bind;
using boost::shared_ptr;
using XF::Configure::Default::GetSingleDownloadBufferSize;
using XF::Data::ConcurrentFileWriter;
using XF::Data::FileChunkReader;
using XF::Data::ProgressCallback;
using XF::Exception::XFException;
using XF::StringUtils::FormatByteSize;
using XF::StringUtils::FormatObject;
using XF::Threading::ThreadPool;
using std::pair;
using std::string;

typedef ClientError<TransferError::Value> TransferClientError;

namespace {

TransferStatus::Value StatusOfFailure(const TransferClientError &err) {
  return IsCancelledTransferError(err) ? TransferStatus::Cancelled
                                       : TransferStatus::Failed;
}

}  // namespace

// --------------------------------------------------------------------------
TransferManager::TransferManager(const shared_ptr<ObjectStore> &store,
                                 const TransferPolicy &policy)
    : m_store(store), m_policy(policy) {
  if (!m_store) {
    throw XFException("Null object store for transfer manager");
  }
  m_executor = shared_ptr<ThreadPool>(
      new ThreadPool(m_policy.GetMaxConcurrency()));
  m_uploader.reset(new MultipartUploader(m_store, m_policy, m_executor));
  m_downloader.reset(new MultipartDownloader(m_store, m_policy, m_executor));
  DebugInfo("Transfer manager created with policy " << m_policy.ToString());
}

// --------------------------------------------------------------------------
TransferManager::~TransferManager() {}

// --------------------------------------------------------------------------
shared_ptr<TransferHandle> TransferManager::UploadFile(
    const string &filePath, const string &bucket, const string &objKey,
    const ExtraArgs &extraArgs, const ProgressCallback &callback) {
  shared_ptr<TransferHandle> handle =
      CreateUploadHandle(filePath, bucket, objKey, extraArgs, callback);
  Transfer(handle);
  return handle;
}

// --------------------------------------------------------------------------
shared_ptr<TransferHandle> TransferManager::DownloadFile(
    const string &bucket, const string &objKey, const string &filePath,
    const ProgressCallback &callback) {
  shared_ptr<TransferHandle> handle =
      CreateDownloadHandle(bucket, objKey, filePath, callback);
  Transfer(handle);
  return handle;
}

// --------------------------------------------------------------------------
shared_ptr<TransferHandle> TransferManager::CreateUploadHandle(
    const string &filePath, const string &bucket, const string &objKey,
    const ExtraArgs &extraArgs, const ProgressCallback &callback) const {
  shared_ptr<TransferHandle> handle = boost::make_shared<TransferHandle>(
      bucket, objKey, TransferDirection::Upload, filePath, callback);
  handle->SetExtraArgs(extraArgs);
  return handle;
}

// --------------------------------------------------------------------------
shared_ptr<TransferHandle> TransferManager::CreateDownloadHandle(
    const string &bucket, const string &objKey, const string &filePath,
    const ProgressCallback &callback) const {
  return boost::make_shared<TransferHandle>(
      bucket, objKey, TransferDirection::Download, filePath, callback);
}

// --------------------------------------------------------------------------
void TransferManager::Transfer(const shared_ptr<TransferHandle> &handle) {
  if (!handle) {
    DebugWarning("Null transfer handle");
    return;
  }
  if (handle->GetStatus() != TransferStatus::NotStarted) {
    Warning("Transfer of "
            << FormatObject(handle->GetBucket(), handle->GetObjectKey())
            << " is " << TransferStatusToString(handle->GetStatus())
            << ", unable to start it again");
    return;
  }
  if (!handle->ShouldContinue()) {
    handle->SetError(TransferClientError(TransferError::CANCELLED, "Transfer",
                                         "cancelled before start", false));
    handle->UpdateStatus(TransferStatus::Cancelled);
    return;
  }

  if (handle->GetDirection() == TransferDirection::Upload) {
    DoUpload(handle);
  } else {
    DoDownload(handle);
  }

  string object = FormatObject(handle->GetBucket(), handle->GetObjectKey());
  if (handle->IsSucceeded()) {
    Info((handle->GetDirection() == TransferDirection::Upload
              ? "Uploaded "
              : "Downloaded ")
         << handle->GetTargetFilePath() << " "
         << (handle->GetDirection() == TransferDirection::Upload ? "to "
                                                                  : "from ")
         << object << ", " << handle->GetBytesTransferred() << " bytes");
  } else {
    Warning("Transfer of " << handle->GetTargetFilePath() << " " << object
                           << " ended with status "
                           << TransferStatusToString(handle->GetStatus())
                           << ", "
                           << GetMessageForTransferError(handle->GetError()));
  }
}

// --------------------------------------------------------------------------
void TransferManager::DoUpload(const shared_ptr<TransferHandle> &handle) {
  pair<uint64_t, string> res =
      XF::Utils::GetFileSize(handle->GetTargetFilePath());
  if (!res.second.empty()) {
    handle->SetError(TransferClientError(
        TransferError::LOCAL_FILE_ACCESS_FAILED, "UploadFile", res.second,
        false));
    Error("Unable to upload " << handle->GetTargetFilePath() << ", "
                              << res.second);
    handle->UpdateStatus(TransferStatus::Failed);
    return;
  }

  uint64_t fileSize = res.first;
  bool multipart = m_policy.UseMultipart(fileSize);
  Info("Start " << (multipart ? "multipart" : "single") << " upload of "
                << handle->GetTargetFilePath() << " ["
                << FormatByteSize(fileSize) << "] to "
                << FormatObject(handle->GetBucket(), handle->GetObjectKey()));
  if (multipart) {
    m_uploader->Upload(handle, fileSize);
  } else {
    DoSinglePartUpload(handle, fileSize);
  }
}

// --------------------------------------------------------------------------
void TransferManager::DoDownload(const shared_ptr<TransferHandle> &handle) {
  uint64_t objectSize = 0;
  TransferClientError err = m_policy.GetRetryStrategy().Run(
      bind(boost::type<TransferClientError>(),
           &TransferManager::HeadObjectOnce, this, handle, &objectSize),
      handle);
  if (!IsGoodTransferError(err)) {
    handle->SetError(err);
    ErrorIf(!IsCancelledTransferError(err),
            "Unable to get size of "
                << FormatObject(handle->GetBucket(), handle->GetObjectKey())
                << ", " << GetMessageForTransferError(err));
    handle->UpdateStatus(StatusOfFailure(err));
    return;
  }

  bool multipart = m_policy.UseMultipart(objectSize);
  Info("Start " << (multipart ? "multipart" : "single") << " download of "
                << FormatObject(handle->GetBucket(), handle->GetObjectKey())
                << " [" << FormatByteSize(objectSize) << "] to "
                << handle->GetTargetFilePath());
  if (multipart) {
    m_downloader->Download(handle, objectSize);
  } else {
    DoSinglePartDownload(handle, objectSize);
  }
}

// --------------------------------------------------------------------------
void TransferManager::DoSinglePartUpload(
    const shared_ptr<TransferHandle> &handle, uint64_t fileSize) {
  handle->SetIsMultipart(false);
  handle->SetBytesTotalSize(fileSize);
  handle->UpdateStatus(TransferStatus::InProgress);

  // part id, size, range begin
  shared_ptr<Part> part = boost::make_shared<Part>(1, fileSize, 0);
  handle->AddQueuePart(part);
  handle->AddPendingPart(part);

  TransferClientError err = m_policy.GetRetryStrategy().Run(
      bind(boost::type<TransferClientError>(), &TransferManager::PutObjectOnce,
           this, handle, part),
      handle);
  FinishSinglePart(handle, part, err);
}

// --------------------------------------------------------------------------
void TransferManager::DoSinglePartDownload(
    const shared_ptr<TransferHandle> &handle, uint64_t objectSize) {
  handle->SetIsMultipart(false);
  handle->SetBytesTotalSize(objectSize);
  handle->UpdateStatus(TransferStatus::InProgress);

  shared_ptr<ConcurrentFileWriter> writer =
      boost::make_shared<ConcurrentFileWriter>(handle->GetTargetFilePath());
  pair<bool, string> res = writer->Open();
  if (!res.first) {
    handle->SetError(TransferClientError(
        TransferError::LOCAL_FILE_ACCESS_FAILED, "DownloadFile", res.second,
        false));
    Error("Unable to open " << handle->GetTargetFilePath() << " for writing, "
                            << res.second);
    handle->UpdateStatus(TransferStatus::Failed);
    return;
  }

  // the whole body is read, it must hold exactly objectSize bytes
  shared_ptr<Part> part = boost::make_shared<Part>(1, objectSize, 0, true);
  handle->AddQueuePart(part);
  handle->AddPendingPart(part);

  TransferClientError err = m_policy.GetRetryStrategy().Run(
      bind(boost::type<TransferClientError>(), &TransferManager::GetObjectOnce,
           this, handle, part, writer),
      handle);
  res = writer->Close();
  if (IsGoodTransferError(err) && !res.first) {
    err = TransferClientError(TransferError::LOCAL_FILE_WRITE_FAILED,
                              "DownloadFile", res.second, false);
  }
  FinishSinglePart(handle, part, err);

  if (!handle->IsSucceeded()) {
    bool removed = XF::Utils::RemoveFileIfExists(handle->GetTargetFilePath());
    WarningIf(!removed, "Unable to remove incomplete download "
                            << handle->GetTargetFilePath());
  }
}

// --------------------------------------------------------------------------
void TransferManager::FinishSinglePart(const shared_ptr<TransferHandle> &handle,
                                       const shared_ptr<Part> &part,
                                       const TransferClientError &err) {
  if (IsGoodTransferError(err)) {
    part->OnCompleted(handle);
    handle->ChangePartToCompleted(part);
    // the progress callback may have thrown on the last bytes
    handle->UpdateStatus(IsGoodTransferError(handle->GetError())
                             ? TransferStatus::Completed
                             : TransferStatus::Failed);
    return;
  }

  handle->SetError(err);
  handle->ChangePartToFailed(part);
  ErrorIf(!IsCancelledTransferError(err),
          "Fail to " << (handle->GetDirection() == TransferDirection::Upload
                             ? "put "
                             : "get ")
                     << FormatObject(handle->GetBucket(),
                                     handle->GetObjectKey())
                     << ", " << GetMessageForTransferError(err));
  // the root cause outlives the cancellation it caused
  handle->UpdateStatus(StatusOfFailure(handle->GetError()));
}

// --------------------------------------------------------------------------
TransferClientError TransferManager::HeadObjectOnce(
    const shared_ptr<TransferHandle> &handle, uint64_t *objectSize) {
  HeadObjectOutcome outcome;
  try {
    outcome = m_store->HeadObject(handle->GetBucket(), handle->GetObjectKey());
  } catch (const std::exception &e) {
    return TransferClientError(TransferError::STORE_REQUEST_FAILED,
                               "HeadObject", e.what(), true);
  }
  if (!outcome.IsSuccess()) {
    return outcome.GetError();
  }
  *objectSize = outcome.GetResult();
  return TransferClientError(TransferError::GOOD, false);
}

// --------------------------------------------------------------------------
TransferClientError TransferManager::PutObjectOnce(
    const shared_ptr<TransferHandle> &handle, const shared_ptr<Part> &part) {
  part->Reset();
  shared_ptr<FileChunkReader> body = boost::make_shared<FileChunkReader>(
      handle->GetTargetFilePath(), 0, part->GetSize(),
      PartProgressReporter(part, handle));
  pair<bool, string> res = body->Open();
  if (!res.first) {
    return TransferClientError(TransferError::LOCAL_FILE_ACCESS_FAILED,
                               "PutObject", res.second, false);
  }
  if (body->GetLength() != part->GetSize()) {
    return TransferClientError(TransferError::LOCAL_FILE_READ_FAILED,
                               "PutObject",
                               "file shrank since upload started", false);
  }

  TransferClientError err;
  try {
    err = m_store->PutObject(handle->GetBucket(), handle->GetObjectKey(), body,
                             handle->GetExtraArgs());
  } catch (const std::exception &e) {
    return TransferClientError(TransferError::STORE_REQUEST_FAILED,
                               "PutObject", e.what(), true);
  }
  if (body->Bad()) {
    return TransferClientError(TransferError::LOCAL_FILE_READ_FAILED,
                               "PutObject",
                               "fail to read " + body->GetFilePath(), false);
  }
  return err;
}

// --------------------------------------------------------------------------
TransferClientError TransferManager::GetObjectOnce(
    const shared_ptr<TransferHandle> &handle, const shared_ptr<Part> &part,
    const shared_ptr<ConcurrentFileWriter> &writer) {
  part->Reset();
  GetObjectOutcome outcome;
  try {
    outcome = m_store->GetObject(handle->GetBucket(), handle->GetObjectKey(),
                                 string());
  } catch (const std::exception &e) {
    return TransferClientError(TransferError::STORE_REQUEST_FAILED,
                               "GetObject", e.what(), true);
  }
  if (!outcome.IsSuccess()) {
    return outcome.GetError();
  }
  if (!outcome.GetResult()) {
    return TransferClientError(TransferError::STORE_UNEXPECTED_RESPONSE,
                               "GetObject", "no body", false);
  }

  try {
    return WriteBodyToFile(outcome.GetResult(), writer.get(), 0,
                           part->GetSize(), part->IsOpenEnded(),
                           PartProgressReporter(part, handle), handle,
                           GetSingleDownloadBufferSize());
  } catch (const std::exception &e) {
    return TransferClientError(TransferError::STORE_REQUEST_FAILED,
                               "GetObject",
                               string("fail to read body, ") + e.what(), true);
  }
}

}  // namespace Client
}  // namespace XF
