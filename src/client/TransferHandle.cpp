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

#include "client/TransferHandle.h"

#include <exception>
#include <string>
#include <utility>

#include "boost/bind.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/thread/thread_time.hpp"

#include "base/LogMacros.h"

namespace XF {

namespace Client {

using boost::lock_guard;
using boost::mutex;
using boost::shared_ptr;
using boost::to_string;
using boost::unique_lock;
using std::make_pair;
using std::pair;
using std::string;

namespace {

bool IsFinishedStatus(TransferStatus::Value status) {
  return !(status == TransferStatus::NotStarted ||
           status == TransferStatus::InProgress);
}

bool AllowTransition(TransferStatus::Value current,
                     TransferStatus::Value next) {
  if (IsFinishedStatus(current) && IsFinishedStatus(next)) {
    return (current == TransferStatus::Cancelled ||
            current == TransferStatus::Failed) &&
           next == TransferStatus::Aborted;
  }
  return true;
}

}  // namespace

// --------------------------------------------------------------------------
string TransferStatusToString(TransferStatus::Value status) {
  switch (status) {
    case TransferStatus::NotStarted:
      return "NotStarted";
    case TransferStatus::InProgress:
      return "InProgress";
    case TransferStatus::Cancelled:
      return "Cancelled";
    case TransferStatus::Failed:
      return "Failed";
    case TransferStatus::Completed:
      return "Completed";
    case TransferStatus::Aborted:
      return "Aborted";
    default:
      return "Unknown";
  }
}

// --------------------------------------------------------------------------
Part::Part(uint32_t partId, uint64_t sizeInBytes, uint64_t rangeBegin,
           bool openEnded)
    : m_partId(partId),
      m_eTag(),
      m_currentProgress(0),
      m_bestProgress(0),
      m_size(sizeInBytes),
      m_rangeBegin(rangeBegin),
      m_openEnded(openEnded) {}

// --------------------------------------------------------------------------
string Part::ToString() const {
  return "[part id: " + to_string(m_partId) + ", etag: " + m_eTag +
         ", current progress(bytes): " + to_string(m_currentProgress) +
         ", best progress(bytes): " + to_string(m_bestProgress) +
         ", size(bytes): " + to_string(m_size) +
         ", range begin: " + to_string(m_rangeBegin) +
         (m_openEnded ? ", open ended]" : "]");
}

// --------------------------------------------------------------------------
void Part::OnDataTransferred(uint64_t amount,
                             const shared_ptr<TransferHandle> &handle) {
  m_currentProgress += amount;
  if (m_currentProgress > m_bestProgress) {
    handle->UpdateBytesTransferred(m_currentProgress - m_bestProgress);
    m_bestProgress = m_currentProgress;
  }
}

// --------------------------------------------------------------------------
void Part::OnCompleted(const shared_ptr<TransferHandle> &handle) {
  if (m_bestProgress < m_size) {
    handle->UpdateBytesTransferred(m_size - m_bestProgress);
    m_bestProgress = m_size;
  }
  m_currentProgress = m_bestProgress;
}

// --------------------------------------------------------------------------
TransferHandle::TransferHandle(const string &bucket, const string &objKey,
                               TransferDirection::Value direction,
                               const string &targetFilePath,
                               const XF::Data::ProgressCallback &callback)
    : m_isMultipart(false),
      m_multipartId(),
      m_bytesTransferred(0),
      m_progressCallback(callback),
      m_bytesTotalSize(0),
      m_direction(direction),
      m_cancel(false),
      m_status(TransferStatus::NotStarted),
      m_targetFilePath(targetFilePath),
      m_bucket(bucket),
      m_objectKey(objKey),
      m_error(TransferError::GOOD, false) {}

// --------------------------------------------------------------------------
PartIdToPartMap TransferHandle::GetQueuedParts() const {
  lock_guard<mutex> lock(m_partsLock);
  return m_queuedParts;
}

// --------------------------------------------------------------------------
PartIdToPartMap TransferHandle::GetCompletedParts() const {
  lock_guard<mutex> lock(m_partsLock);
  return m_completedParts;
}

// --------------------------------------------------------------------------
bool TransferHandle::HasPendingParts() const {
  lock_guard<mutex> lock(m_partsLock);
  return !m_pendingParts.empty();
}

// --------------------------------------------------------------------------
bool TransferHandle::HasFailedParts() const {
  lock_guard<mutex> lock(m_partsLock);
  return !m_failedParts.empty();
}

// --------------------------------------------------------------------------
void TransferHandle::Cancel() {
  {
    lock_guard<mutex> locker(m_cancelLock);
    m_cancel = true;
  }
  m_cancelSignal.notify_all();
}

// --------------------------------------------------------------------------
bool TransferHandle::DoneTransfer() const {
  return GetBytesTransferred() == GetBytesTotalSize();
}

// --------------------------------------------------------------------------
void TransferHandle::AddQueuePart(const shared_ptr<Part> &part) {
  lock_guard<mutex> lock(m_partsLock);
  part->Reset();
  m_failedParts.erase(part->GetPartId());
  pair<PartIdToPartMapIterator, bool> res =
      m_queuedParts.insert(make_pair(part->GetPartId(), part));
  DebugWarningIf(!res.second,
                 "Fail to add to queue parts with part " << part->ToString());
}

// --------------------------------------------------------------------------
void TransferHandle::AddPendingPart(const shared_ptr<Part> &part) {
  lock_guard<mutex> lock(m_partsLock);
  m_queuedParts.erase(part->GetPartId());
  pair<PartIdToPartMapIterator, bool> res =
      m_pendingParts.insert(make_pair(part->GetPartId(), part));
  DebugWarningIf(!res.second,
                 "Fail to add to pending parts with part " << part->ToString());
}

// --------------------------------------------------------------------------
void TransferHandle::ChangePartToFailed(const shared_ptr<Part> &part) {
  uint32_t partId = part->GetPartId();
  lock_guard<mutex> lock(m_partsLock);
  m_queuedParts.erase(partId);
  m_pendingParts.erase(partId);
  pair<PartIdToPartMapIterator, bool> res =
      m_failedParts.insert(make_pair(partId, part));
  DebugWarningIf(!res.second, "Fail to change part state to failed with part "
                                  << part->ToString());
  if (m_queuedParts.empty() && m_pendingParts.empty()) {
    m_partsDrainedSignal.notify_all();
  }
}

// --------------------------------------------------------------------------
void TransferHandle::ChangePartToCompleted(const shared_ptr<Part> &part,
                                           const string &eTag) {
  uint32_t partId = part->GetPartId();
  lock_guard<mutex> lock(m_partsLock);
  if (m_pendingParts.erase(partId) == 0) {
    m_failedParts.erase(partId);
  }
  if (!eTag.empty()) {
    part->SetETag(eTag);
  }
  pair<PartIdToPartMapIterator, bool> res =
      m_completedParts.insert(make_pair(partId, part));
  DebugWarningIf(!res.second,
                 "Fail to change part state to completed with part "
                     << part->ToString());
  if (m_queuedParts.empty() && m_pendingParts.empty()) {
    m_partsDrainedSignal.notify_all();
  }
}

// --------------------------------------------------------------------------
void TransferHandle::WaitUntilPartsDrained() const {
  unique_lock<mutex> lock(m_partsLock);
  while (!m_queuedParts.empty() || !m_pendingParts.empty()) {
    m_partsDrainedSignal.wait(lock);
  }
}

// --------------------------------------------------------------------------
bool TransferHandle::WaitForRetry(uint32_t milliseconds) const {
  unique_lock<mutex> lock(m_cancelLock);
  if (milliseconds > 0) {
    m_cancelSignal.timed_wait(
        lock, boost::posix_time::milliseconds(milliseconds),
        boost::bind(boost::type<bool>(), &TransferHandle::IsCancelled, this));
  }
  return !m_cancel;
}

// --------------------------------------------------------------------------
void TransferHandle::UpdateBytesTransferred(uint64_t amount) {
  {
    lock_guard<mutex> locker(m_bytesTransferredLock);
    m_bytesTransferred += amount;
  }
  // callback is not serialized here, see ProgressCallback
  if (!m_progressCallback) {
    return;
  }
  try {
    m_progressCallback(static_cast<size_t>(amount));
  } catch (const std::exception &e) {
    Error("Progress callback of " << m_objectKey << " threw: " << e.what());
    SetError(ClientError<TransferError::Value>(
        TransferError::UNKNOWN, "ProgressCallback", e.what(), false));
    Cancel();
  }
}

// --------------------------------------------------------------------------
void TransferHandle::UpdateStatus(TransferStatus::Value newStatus) {
  unique_lock<mutex> lock(m_statusLock);
  if (AllowTransition(m_status, newStatus)) {
    m_status = newStatus;
    if (IsFinishedStatus(newStatus)) {
      lock.unlock();
      m_waitUntilFinishSignal.notify_all();
    }
  }
}

// --------------------------------------------------------------------------
void TransferHandle::SetError(const ClientError<TransferError::Value> &error) {
  lock_guard<mutex> locker(m_errorLock);
  // keep the root cause, parts stopped after it only report cancellation
  if (IsGoodTransferError(m_error) ||
      (IsCancelledTransferError(m_error) && !IsCancelledTransferError(error))) {
    m_error = error;
  }
}

// --------------------------------------------------------------------------
void TransferHandle::WaitUntilFinished() const {
  unique_lock<mutex> lock(m_statusLock);
  m_waitUntilFinishSignal.wait(
      lock, boost::bind(boost::type<bool>(), &TransferHandle::Predicate, this));
}

// --------------------------------------------------------------------------
bool TransferHandle::Predicate() const {
  return IsFinishedStatus(m_status) && !HasPendingParts();
}

}  // namespace Client
}  // namespace XF
