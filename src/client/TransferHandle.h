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

#ifndef XFER_CLIENT_TRANSFERHANDLE_H_
#define XFER_CLIENT_TRANSFERHANDLE_H_

#include <stddef.h>  // for size_t
#include <stdint.h>  // for uint32_t uint64_t

#include <map>
#include <string>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

#include "client/ObjectStore.h"
#include "client/TransferError.h"
#include "data/ProgressCallback.h"

namespace XF {

namespace Client {

class MultipartDownloader;
class MultipartUploader;
class TransferHandle;
class TransferManager;
class Part;
struct PartProgressReporter;
struct ReceivedHandlerDownloadRange;
struct ReceivedHandlerUploadPart;

typedef std::map<uint32_t, boost::shared_ptr<Part> > PartIdToPartMap;
typedef PartIdToPartMap::iterator PartIdToPartMapIterator;

//
// Part
//
// One byte window of a transfer. Part ids start from 1; for a download the
// range index is part id - 1.
//
class Part {
 public:
  Part(uint32_t partId = 0, uint64_t sizeInBytes = 0, uint64_t rangeBegin = 0,
       bool openEnded = false);

  ~Part() {}

 public:
  std::string ToString() const;
  // accessor
  uint32_t GetPartId() const { return m_partId; }
  const std::string &GetETag() const { return m_eTag; }
  uint64_t GetBestProgress() const { return m_bestProgress; }
  uint64_t GetSize() const { return m_size; }
  uint64_t GetRangeBegin() const { return m_rangeBegin; }
  // Last download range asks for "bytes=begin-" and takes what the store
  // returns, size is only the expected length then
  bool IsOpenEnded() const { return m_openEnded; }

 private:
  // Start over from the window begin, e.g. before a retry
  void Reset() { m_currentProgress = 0; }

  // Only bytes beyond the best progress so far are reported, so a retried
  // part never counts the same byte twice
  void OnDataTransferred(uint64_t amount,
                         const boost::shared_ptr<TransferHandle> &handle);
  // Count the bytes of the part the store accepted without reading them
  // through our reader
  void OnCompleted(const boost::shared_ptr<TransferHandle> &handle);
  void SetETag(const std::string &etag) { m_eTag = etag; }

 private:
  uint32_t m_partId;
  std::string m_eTag;          // upload only
  uint64_t m_currentProgress;  // in bytes, of the running attempt
  uint64_t m_bestProgress;     // in bytes, over all attempts
  uint64_t m_size;             // in bytes
  uint64_t m_rangeBegin;
  bool m_openEnded;

  friend class TransferHandle;
  friend class MultipartUploader;
  friend class MultipartDownloader;
  friend class TransferManager;
  friend struct PartProgressReporter;
  friend struct ReceivedHandlerUploadPart;
  friend struct ReceivedHandlerDownloadRange;
};

// Progress callback handed to the reader or stream of one part
struct PartProgressReporter {
  boost::shared_ptr<Part> part;
  boost::shared_ptr<TransferHandle> handle;

  PartProgressReporter(const boost::shared_ptr<Part> &part_,
                       const boost::shared_ptr<TransferHandle> &handle_)
      : part(part_), handle(handle_) {}

  void operator()(size_t amount) { part->OnDataTransferred(amount, handle); }
};

struct TransferStatus {
  enum Value {
    NotStarted,  // operation is still queued and has not been processing
    InProgress,  // operation is now running
    Cancelled,   // operation is cancelled by caller
    Failed,      // operation failed
    Completed,   // operation was sucessful
    Aborted      // multipart upload failed or cancelled and its session has
                 // been dropped from the store
  };
};

std::string TransferStatusToString(TransferStatus::Value status);

struct TransferDirection {
  enum Value { Upload, Download };
};

//
// TransferHandle
//
// State of one upload or download call, shared by the caller and all
// workers of the transfer. It aggregates progress of all parts and holds
// the cancellation flag every worker checks before doing more work.
//
class TransferHandle : private boost::noncopyable {
 public:
  TransferHandle(const std::string &bucket, const std::string &objKey,
                 TransferDirection::Value direction,
                 const std::string &targetFilePath,
                 const XF::Data::ProgressCallback &callback =
                     XF::Data::ProgressCallback());

  ~TransferHandle() {}

 public:
  bool IsMultipart() const { return m_isMultipart; }
  const std::string &GetMultipartId() const { return m_multipartId; }
  PartIdToPartMap GetQueuedParts() const;
  PartIdToPartMap GetCompletedParts() const;
  bool HasPendingParts() const;
  bool HasFailedParts() const;

  uint64_t GetBytesTransferred() const {
    boost::lock_guard<boost::mutex> locker(m_bytesTransferredLock);
    return m_bytesTransferred;
  }
  uint64_t GetBytesTotalSize() const {
    boost::lock_guard<boost::mutex> locker(m_bytesTotalSizeLock);
    return m_bytesTotalSize;
  }
  TransferDirection::Value GetDirection() const { return m_direction; }
  bool ShouldContinue() const {
    boost::lock_guard<boost::mutex> locker(m_cancelLock);
    return !m_cancel;
  }
  TransferStatus::Value GetStatus() const {
    boost::lock_guard<boost::mutex> locker(m_statusLock);
    return m_status;
  }
  bool IsSucceeded() const { return GetStatus() == TransferStatus::Completed; }

  const std::string &GetTargetFilePath() const { return m_targetFilePath; }
  const std::string &GetBucket() const { return m_bucket; }
  const std::string &GetObjectKey() const { return m_objectKey; }
  const ExtraArgs &GetExtraArgs() const { return m_extraArgs; }

  // First error which made the transfer fail, GOOD if none
  ClientError<TransferError::Value> GetError() const {
    boost::lock_guard<boost::mutex> locker(m_errorLock);
    return m_error;
  }

 public:
  // Stop the transfer. Workers notice it before their next part, read or
  // retry; the blocked upload or download call then returns.
  void Cancel();

  // Block until the transfer reached a finished status. A failed multipart
  // upload may still move on to Aborted afterwards.
  void WaitUntilFinished() const;
  bool DoneTransfer() const;

  // Sleep before a retry, waking up early on Cancel
  //
  // @param  : milliseconds
  // @return : ShouldContinue()
  bool WaitForRetry(uint32_t milliseconds) const;

 private:
  void SetIsMultipart(bool isMultipart) { m_isMultipart = isMultipart; }
  void SetMultipartId(const std::string &multipartId) {
    m_multipartId = multipartId;
  }
  void SetExtraArgs(const ExtraArgs &extraArgs) { m_extraArgs = extraArgs; }
  void SetBytesTotalSize(uint64_t totalSize) {
    boost::lock_guard<boost::mutex> locker(m_bytesTotalSizeLock);
    m_bytesTotalSize = totalSize;
  }

  void AddQueuePart(const boost::shared_ptr<Part> &part);
  void AddPendingPart(const boost::shared_ptr<Part> &part);
  void ChangePartToFailed(const boost::shared_ptr<Part> &part);
  void ChangePartToCompleted(const boost::shared_ptr<Part> &part,
                             const std::string &eTag = std::string());

  // Block until no part is queued or pending
  void WaitUntilPartsDrained() const;

  // Add to the total and forward to the caller's callback. An exception
  // from the callback fails the transfer with UNKNOWN and cancels it.
  void UpdateBytesTransferred(uint64_t amount);
  void UpdateStatus(TransferStatus::Value status);
  void SetError(const ClientError<TransferError::Value> &error);

  // Internal use only
  bool Predicate() const;
  bool IsCancelled() const { return m_cancel; }

 private:
  bool m_isMultipart;
  std::string m_multipartId;  // mulitpart upload id
  PartIdToPartMap m_queuedParts;
  PartIdToPartMap m_pendingParts;
  PartIdToPartMap m_failedParts;
  PartIdToPartMap m_completedParts;
  mutable boost::mutex m_partsLock;
  mutable boost::condition_variable m_partsDrainedSignal;

  mutable boost::mutex m_bytesTransferredLock;
  uint64_t m_bytesTransferred;  // size have been transferred
  XF::Data::ProgressCallback m_progressCallback;

  mutable boost::mutex m_bytesTotalSizeLock;
  uint64_t m_bytesTotalSize;  // the total size need to be transferred

  TransferDirection::Value m_direction;

  mutable boost::mutex m_cancelLock;
  mutable boost::condition_variable m_cancelSignal;
  bool m_cancel;

  mutable boost::mutex m_statusLock;
  TransferStatus::Value m_status;
  mutable boost::condition_variable m_waitUntilFinishSignal;

  // location of the local file being uploaded from, or downloaded to
  std::string m_targetFilePath;
  std::string m_bucket;
  std::string m_objectKey;
  ExtraArgs m_extraArgs;

  mutable boost::mutex m_errorLock;
  ClientError<TransferError::Value> m_error;

  friend class Part;
  friend class TransferManager;
  friend class MultipartUploader;
  friend class MultipartDownloader;
  friend struct ReceivedHandlerUploadPart;
  friend struct ReceivedHandlerDownloadRange;
};

}  // namespace Client
}  // namespace XF

#endif  // XFER_CLIENT_TRANSFERHANDLE_H_
