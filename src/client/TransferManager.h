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

#ifndef XFER_CLIENT_TRANSFERMANAGER_H_
#define XFER_CLIENT_TRANSFERMANAGER_H_

#include <stdint.h>

#include <string>

#include "boost/noncopyable.hpp"
#include "boost/scoped_ptr.hpp"
#include "boost/shared_ptr.hpp"

#include "client/ObjectStore.h"
#include "client/TransferError.h"
#include "client/TransferPolicy.h"
#include "data/ProgressCallback.h"

namespace XF {

namespace Data {
class ConcurrentFileWriter;
}  // namespace Data

namespace Threading {
class ThreadPool;
}  // namespace Threading

namespace Client {

class MultipartDownloader;
class MultipartUploader;
class Part;
class TransferHandle;

//
// TransferManager
//
// Entry point for moving files between local disk and an object store.
// Files smaller than the policy's multipart threshold go in a single
// request, larger ones in parts spread over a pool of
// policy.GetMaxConcurrency() worker threads.
//
// Upload and download calls block until the transfer ends; the result is
// found in the returned handle. A transfer can be cancelled from another
// thread by creating its handle first and running it with Transfer.
//
// The progress callback may be invoked from several workers at once, it
// must be thread safe. The sum of all amounts it receives for one
// transfer is the file size.
//
class TransferManager : private boost::noncopyable {
 public:
  // @exception : XFException if store is null
  explicit TransferManager(const boost::shared_ptr<ObjectStore> &store,
                           const TransferPolicy &policy = TransferPolicy());

  ~TransferManager();

 public:
  // Upload a local file
  //
  // @param  : file path, bucket, object key, extra args, progress callback
  // @return : transfer handle
  boost::shared_ptr<TransferHandle> UploadFile(
      const std::string &filePath, const std::string &bucket,
      const std::string &objKey, const ExtraArgs &extraArgs = ExtraArgs(),
      const XF::Data::ProgressCallback &callback =
          XF::Data::ProgressCallback());

  // Download an object into a local file
  //
  // @param  : bucket, object key, file path, progress callback
  // @return : transfer handle
  //
  // The local file is created or truncated, and removed again if the
  // download does not complete.
  boost::shared_ptr<TransferHandle> DownloadFile(
      const std::string &bucket, const std::string &objKey,
      const std::string &filePath,
      const XF::Data::ProgressCallback &callback =
          XF::Data::ProgressCallback());

  // Make a handle for an upload without starting it
  boost::shared_ptr<TransferHandle> CreateUploadHandle(
      const std::string &filePath, const std::string &bucket,
      const std::string &objKey, const ExtraArgs &extraArgs = ExtraArgs(),
      const XF::Data::ProgressCallback &callback =
          XF::Data::ProgressCallback()) const;

  // Make a handle for a download without starting it
  boost::shared_ptr<TransferHandle> CreateDownloadHandle(
      const std::string &bucket, const std::string &objKey,
      const std::string &filePath,
      const XF::Data::ProgressCallback &callback =
          XF::Data::ProgressCallback()) const;

  // Run a transfer made by CreateUploadHandle or CreateDownloadHandle
  //
  // @param  : handle
  // @return : void
  //
  // A handle runs once only, handles which have been started are ignored.
  void Transfer(const boost::shared_ptr<TransferHandle> &handle);

  const TransferPolicy &GetPolicy() const { return m_policy; }

 private:
  void DoUpload(const boost::shared_ptr<TransferHandle> &handle);
  void DoDownload(const boost::shared_ptr<TransferHandle> &handle);
  void DoSinglePartUpload(const boost::shared_ptr<TransferHandle> &handle,
                          uint64_t fileSize);
  void DoSinglePartDownload(const boost::shared_ptr<TransferHandle> &handle,
                            uint64_t objectSize);

  // Set status of a direct transfer which ended with err
  void FinishSinglePart(const boost::shared_ptr<TransferHandle> &handle,
                        const boost::shared_ptr<Part> &part,
                        const ClientError<TransferError::Value> &err);

 private:
  // Internal use only
  ClientError<TransferError::Value> HeadObjectOnce(
      const boost::shared_ptr<TransferHandle> &handle, uint64_t *objectSize);
  ClientError<TransferError::Value> PutObjectOnce(
      const boost::shared_ptr<TransferHandle> &handle,
      const boost::shared_ptr<Part> &part);
  ClientError<TransferError::Value> GetObjectOnce(
      const boost::shared_ptr<TransferHandle> &handle,
      const boost::shared_ptr<Part> &part,
      const boost::shared_ptr<XF::Data::ConcurrentFileWriter> &writer);

 private:
  boost::shared_ptr<ObjectStore> m_store;
  TransferPolicy m_policy;
  boost::shared_ptr<XF::Threading::ThreadPool> m_executor;
  boost::scoped_ptr<MultipartUploader> m_uploader;
  boost::scoped_ptr<MultipartDownloader> m_downloader;
};

}  // namespace Client
}  // namespace XF

#endif  // XFER_CLIENT_TRANSFERMANAGER_H_
