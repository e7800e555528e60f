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

#include "client/MultipartDownloader.h"

#include <algorithm>
#include <exception>
#include <istream>
#include <string>
#include <utility>
#include <vector>

#include "boost/bind.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "base/ThreadPool.h"
#include "base/Utils.h"
#include "client/ObjectStore.h"
#include "client/TransferHandle.h"
#include "client/Utils.h"
#include "configure/Default.h"
#include "data/ConcurrentFileWriter.h"
#include "data/ProgressStream.h"

namespace XF {

namespace Client {

using boost::bind;
using boost::shared_ptr;
using boost::to_string;
using XF::Client::Utils::BuildRequestRange;
using XF::Client::Utils::BuildRequestRangeStart;
using XF::Client::Utils::CalculatePartCount;
using XF::Client::Utils::CalculatePartSize;
using XF::Configure::Default::GetRangeDownloadBufferSize;
using XF::Data::ConcurrentFileWriter;
using XF::Data::ProgressCallback;
using XF::Data::ProgressStream;
using XF::StringUtils::FormatObject;
using XF::Threading::ThreadPool;
using std::istream;
using std::pair;
using std::string;
using std::vector;

typedef ClientError<TransferError::Value> TransferClientError;

// --------------------------------------------------------------------------
struct ReceivedHandlerDownloadRange {
  shared_ptr<TransferHandle> handle;
  shared_ptr<Part> part;

  ReceivedHandlerDownloadRange(const shared_ptr<TransferHandle> &handle_,
                               const shared_ptr<Part> &part_)
      : handle(handle_), part(part_) {}

  void operator()(const TransferClientError &err) {
    if (IsGoodTransferError(err)) {
      part->OnCompleted(handle);
      handle->ChangePartToCompleted(part);
      DebugInfo("Downloaded range " << part->ToString() << " of "
                                    << FormatObject(handle->GetBucket(),
                                                    handle->GetObjectKey()));
      return;
    }

    handle->SetError(err);
    if (!IsCancelledTransferError(err)) {
      Error("Fail to download range " << part->ToString() << " of "
                                      << FormatObject(handle->GetBucket(),
                                                      handle->GetObjectKey())
                                      << ", "
                                      << GetMessageForTransferError(err));
      // stop all the other ranges
      handle->Cancel();
    }
    handle->ChangePartToFailed(part);
  }
};

// --------------------------------------------------------------------------
MultipartDownloader::MultipartDownloader(
    const shared_ptr<ObjectStore> &store, const TransferPolicy &policy,
    const shared_ptr<ThreadPool> &executor)
    : m_store(store), m_policy(policy), m_executor(executor) {}

// --------------------------------------------------------------------------
void MultipartDownloader::Download(const shared_ptr<TransferHandle> &handle,
                                   uint64_t objectSize) {
  handle->SetIsMultipart(true);
  handle->SetBytesTotalSize(objectSize);
  handle->UpdateStatus(TransferStatus::InProgress);

  shared_ptr<ConcurrentFileWriter> writer =
      boost::make_shared<ConcurrentFileWriter>(handle->GetTargetFilePath());
  pair<bool, string> res = writer->Open();
  if (!res.first) {
    handle->SetError(
        TransferClientError(TransferError::LOCAL_FILE_ACCESS_FAILED,
                            "MultipartDownload", res.second, false));
    Error("Unable to open " << handle->GetTargetFilePath() << " for writing, "
                            << res.second);
    handle->UpdateStatus(TransferStatus::Failed);
    return;
  }

  PrepareRanges(handle, objectSize);
  DispatchRanges(handle, writer);
  handle->WaitUntilPartsDrained();
  res = writer->Close();

  TransferClientError err = handle->GetError();
  if (!handle->ShouldContinue() || handle->HasFailedParts()) {
    if (IsGoodTransferError(err) || IsCancelledTransferError(err)) {
      handle->SetError(TransferClientError(TransferError::CANCELLED,
                                           "MultipartDownload",
                                           "download cancelled", false));
      handle->UpdateStatus(TransferStatus::Cancelled);
    } else {
      handle->UpdateStatus(TransferStatus::Failed);
    }
  } else if (!res.first) {
    handle->SetError(
        TransferClientError(TransferError::LOCAL_FILE_WRITE_FAILED,
                            "MultipartDownload", res.second, false));
    Error("Fail to flush " << handle->GetTargetFilePath() << ", "
                           << res.second);
    handle->UpdateStatus(TransferStatus::Failed);
  } else {
    handle->UpdateStatus(TransferStatus::Completed);
    return;
  }

  bool removed = XF::Utils::RemoveFileIfExists(handle->GetTargetFilePath());
  WarningIf(!removed, "Unable to remove incomplete download "
                          << handle->GetTargetFilePath());
}

// --------------------------------------------------------------------------
void MultipartDownloader::PrepareRanges(
    const shared_ptr<TransferHandle> &handle, uint64_t objectSize) {
  uint64_t partSize = m_policy.GetPartSize();
  uint64_t partCount = CalculatePartCount(objectSize, partSize);
  for (uint64_t i = 1; i <= partCount; ++i) {
    // part id, size, range begin, open ended
    handle->AddQueuePart(boost::make_shared<Part>(
        static_cast<uint32_t>(i), CalculatePartSize(objectSize, partSize, i),
        (i - 1) * partSize, i == partCount));
  }
  DebugInfo("Split " << FormatObject(handle->GetBucket(),
                                     handle->GetObjectKey())
                     << " into " << partCount << " ranges");
}

// --------------------------------------------------------------------------
void MultipartDownloader::DispatchRanges(
    const shared_ptr<TransferHandle> &handle,
    const shared_ptr<ConcurrentFileWriter> &writer) {
  PartIdToPartMap queuedParts = handle->GetQueuedParts();
  PartIdToPartMapIterator ipart = queuedParts.begin();
  for (; ipart != queuedParts.end() && handle->ShouldContinue(); ++ipart) {
    const shared_ptr<Part> &part = ipart->second;
    handle->AddPendingPart(part);
    ReceivedHandlerDownloadRange receivedHandler(handle, part);
    m_executor->SubmitAsync(
        bind(boost::type<void>(), receivedHandler, _1),
        bind(boost::type<TransferClientError>(),
             &MultipartDownloader::DownloadRangeWrapper, this, _1, _2, _3),
        handle, part, writer);
  }

  // cancelled before these ranges got their turn
  for (; ipart != queuedParts.end(); ++ipart) {
    handle->ChangePartToFailed(ipart->second);
  }
}

// --------------------------------------------------------------------------
TransferClientError MultipartDownloader::DownloadRangeWrapper(
    const shared_ptr<TransferHandle> &handle, const shared_ptr<Part> &part,
    const shared_ptr<ConcurrentFileWriter> &writer) {
  // never throws, the received handler must see every range
  return m_policy.GetRetryStrategy().Run(
      bind(boost::type<TransferClientError>(),
           &MultipartDownloader::DownloadRangeOnce, this, handle, part,
           writer),
      handle);
}

// --------------------------------------------------------------------------
TransferClientError MultipartDownloader::DownloadRangeOnce(
    const shared_ptr<TransferHandle> &handle, const shared_ptr<Part> &part,
    const shared_ptr<ConcurrentFileWriter> &writer) {
  part->Reset();
  string range =
      part->IsOpenEnded()
          ? BuildRequestRangeStart(part->GetRangeBegin())
          : BuildRequestRange(part->GetRangeBegin(), part->GetSize());
  GetObjectOutcome outcome;
  try {
    outcome =
        m_store->GetObject(handle->GetBucket(), handle->GetObjectKey(), range);
  } catch (const std::exception &e) {
    return TransferClientError(TransferError::STORE_REQUEST_FAILED,
                               "GetObject", e.what(), true);
  }
  if (!outcome.IsSuccess()) {
    return outcome.GetError();
  }
  if (!outcome.GetResult()) {
    return TransferClientError(TransferError::STORE_UNEXPECTED_RESPONSE,
                               "GetObject", "no body for range " + range,
                               false);
  }

  try {
    return WriteBodyToFile(outcome.GetResult(), writer.get(),
                           part->GetRangeBegin(), part->GetSize(),
                           part->IsOpenEnded(),
                           PartProgressReporter(part, handle), handle,
                           GetRangeDownloadBufferSize());
  } catch (const std::exception &e) {
    return TransferClientError(TransferError::STORE_REQUEST_FAILED,
                               "GetObject",
                               "fail to read body of range " + range + ", " +
                                   e.what(),
                               true);
  }
}

// --------------------------------------------------------------------------
TransferClientError WriteBodyToFile(const shared_ptr<istream> &body,
                                    ConcurrentFileWriter *writer,
                                    uint64_t offset, uint64_t expectedSize,
                                    bool openEnded,
                                    const ProgressCallback &callback,
                                    const shared_ptr<TransferHandle> &handle,
                                    size_t bufferSize) {
  ProgressStream stream(body, callback);
  vector<char> buf(std::max(bufferSize, static_cast<size_t>(1)));
  uint64_t written = 0;
  while (handle->ShouldContinue()) {
    uint64_t remaining = expectedSize - written;
    // one byte more for an open ended range, to tell a longer body
    uint64_t limit = openEnded ? remaining + 1 : remaining;
    if (limit == 0) {
      break;
    }
    size_t toRead = static_cast<size_t>(
        std::min(static_cast<uint64_t>(buf.size()), limit));
    size_t readSize = stream.Read(&buf[0], toRead);
    if (readSize == 0) {
      break;
    }
    if (readSize > remaining) {
      return TransferClientError(
          TransferError::STORE_UNEXPECTED_RESPONSE, "GetObject",
          "body is longer than " + to_string(expectedSize) + " bytes", false);
    }
    pair<bool, string> res = writer->WriteAt(&buf[0], readSize,
                                             offset + written);
    if (!res.first) {
      return TransferClientError(TransferError::LOCAL_FILE_WRITE_FAILED,
                                 "GetObject", res.second, false);
    }
    written += readSize;
  }

  if (!handle->ShouldContinue()) {
    return TransferClientError(TransferError::CANCELLED, "GetObject",
                               "transfer cancelled", false);
  }
  if (stream.Bad()) {
    return TransferClientError(TransferError::STORE_REQUEST_FAILED,
                               "GetObject", "body stream broken", true);
  }
  if (written < expectedSize) {
    return TransferClientError(
        TransferError::STORE_INCOMPLETE_BODY, "GetObject",
        "got " + to_string(written) + " of " + to_string(expectedSize) +
            " bytes at offset " + to_string(offset),
        true);
  }
  return TransferClientError(TransferError::GOOD, false);
}

}  // namespace Client
}  // namespace XF
