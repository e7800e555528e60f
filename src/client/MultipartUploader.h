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

#ifndef XFER_CLIENT_MULTIPARTUPLOADER_H_
#define XFER_CLIENT_MULTIPARTUPLOADER_H_

#include <stdint.h>

#include <string>
#include <utility>
#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"

#include "client/TransferError.h"
#include "client/TransferPolicy.h"

namespace XF {

namespace Threading {
class ThreadPool;
}  // namespace Threading

namespace Client {

class ObjectStore;
class Part;
struct CompletedPart;
class TransferHandle;

//
// MultipartUploader
//
// Uploads one local file as a multipart session. Parts are uploaded by the
// workers of the executor; the calling thread waits for all of them and
// then completes the session with the parts sorted by part number.
//
// Whatever ends the upload other than a successful completion, the session
// is aborted before Upload returns, so no orphan parts are left behind.
//
class MultipartUploader : private boost::noncopyable {
 public:
  MultipartUploader(
      const boost::shared_ptr<ObjectStore> &store, const TransferPolicy &policy,
      const boost::shared_ptr<XF::Threading::ThreadPool> &executor);

  ~MultipartUploader() {}

 public:
  // Upload the handle's target file
  //
  // @param  : handle, file size
  // @return : void
  //
  // Blocks until the session is completed or aborted, the outcome is left
  // in the handle's status and error.
  void Upload(const boost::shared_ptr<TransferHandle> &handle,
              uint64_t fileSize);

 private:
  bool PrepareParts(const boost::shared_ptr<TransferHandle> &handle,
                    uint64_t fileSize);
  bool CreateSession(const boost::shared_ptr<TransferHandle> &handle);
  void DispatchParts(const boost::shared_ptr<TransferHandle> &handle);
  ClientError<TransferError::Value> CompleteSession(
      const boost::shared_ptr<TransferHandle> &handle);
  void AbortSession(const boost::shared_ptr<TransferHandle> &handle);

  // Internal use only
  ClientError<TransferError::Value> CreateSessionOnce(
      const boost::shared_ptr<TransferHandle> &handle, std::string *uploadId);
  ClientError<TransferError::Value> CompleteSessionOnce(
      const boost::shared_ptr<TransferHandle> &handle,
      const std::vector<CompletedPart> &parts);
  std::pair<ClientError<TransferError::Value>, std::string> UploadPartWrapper(
      const boost::shared_ptr<TransferHandle> &handle,
      const boost::shared_ptr<Part> &part);
  ClientError<TransferError::Value> UploadPartOnce(
      const boost::shared_ptr<TransferHandle> &handle,
      const boost::shared_ptr<Part> &part, std::string *eTag);

 private:
  boost::shared_ptr<ObjectStore> m_store;
  TransferPolicy m_policy;
  boost::shared_ptr<XF::Threading::ThreadPool> m_executor;
};

}  // namespace Client
}  // namespace XF

#endif  // XFER_CLIENT_MULTIPARTUPLOADER_H_
