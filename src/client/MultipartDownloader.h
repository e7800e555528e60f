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

#ifndef XFER_CLIENT_MULTIPARTDOWNLOADER_H_
#define XFER_CLIENT_MULTIPARTDOWNLOADER_H_

#include <stddef.h>
#include <stdint.h>

#include <istream>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"

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

class ObjectStore;
class Part;
class TransferHandle;

//
// MultipartDownloader
//
// Downloads one object as byte ranges of the policy's part size, fetched
// concurrently by the executor's workers and written at their offsets into
// one local file. The last range is open ended.
//
class MultipartDownloader : private boost::noncopyable {
 public:
  MultipartDownloader(
      const boost::shared_ptr<ObjectStore> &store, const TransferPolicy &policy,
      const boost::shared_ptr<XF::Threading::ThreadPool> &executor);

  ~MultipartDownloader() {}

 public:
  // Download the object into the handle's target file
  //
  // @param  : handle, object size
  // @return : void
  //
  // Blocks until all ranges are written or the download stopped. The
  // target file is truncated first and removed again on failure.
  void Download(const boost::shared_ptr<TransferHandle> &handle,
                uint64_t objectSize);

 private:
  void PrepareRanges(const boost::shared_ptr<TransferHandle> &handle,
                     uint64_t objectSize);
  void DispatchRanges(
      const boost::shared_ptr<TransferHandle> &handle,
      const boost::shared_ptr<XF::Data::ConcurrentFileWriter> &writer);

  // Internal use only
  ClientError<TransferError::Value> DownloadRangeWrapper(
      const boost::shared_ptr<TransferHandle> &handle,
      const boost::shared_ptr<Part> &part,
      const boost::shared_ptr<XF::Data::ConcurrentFileWriter> &writer);
  ClientError<TransferError::Value> DownloadRangeOnce(
      const boost::shared_ptr<TransferHandle> &handle,
      const boost::shared_ptr<Part> &part,
      const boost::shared_ptr<XF::Data::ConcurrentFileWriter> &writer);

 private:
  boost::shared_ptr<ObjectStore> m_store;
  TransferPolicy m_policy;
  boost::shared_ptr<XF::Threading::ThreadPool> m_executor;
};

// Copy a response body into a file
//
// @param  : body, writer, file offset of the first byte, expected size,
//           whether the body may be read to its end, progress callback,
//           handle to check for cancellation, read buffer size
// @return : ClientError
//
// A closed range never reads more than expected size. An open ended range
// reads to the end of the body, which must then hold exactly expected
// size bytes. A short body is reported as STORE_INCOMPLETE_BODY.
ClientError<TransferError::Value> WriteBodyToFile(
    const boost::shared_ptr<std::istream> &body,
    XF::Data::ConcurrentFileWriter *writer, uint64_t offset,
    uint64_t expectedSize, bool openEnded,
    const XF::Data::ProgressCallback &callback,
    const boost::shared_ptr<TransferHandle> &handle, size_t bufferSize);

}  // namespace Client
}  // namespace XF

#endif  // XFER_CLIENT_MULTIPARTDOWNLOADER_H_
