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

#ifndef XFER_CLIENT_OBJECTSTORE_H_
#define XFER_CLIENT_OBJECTSTORE_H_

#include <stdint.h>

#include <istream>
#include <map>
#include <string>
#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"

#include "client/ClientError.hpp"
#include "client/Outcome.hpp"
#include "client/TransferError.h"

namespace XF {

namespace Data {
class FileChunkReader;
}  // namespace Data

namespace Client {

// Options passed through untouched to the store, such as content type,
// acl or user metadata
typedef std::map<std::string, std::string> ExtraArgs;

struct CompletedPart {
  uint32_t m_partNumber;
  std::string m_eTag;

  CompletedPart(uint32_t partNumber, const std::string &eTag)
      : m_partNumber(partNumber), m_eTag(eTag) {}
};

typedef Outcome<uint64_t, ClientError<TransferError::Value> >
    HeadObjectOutcome;  // content length
typedef Outcome<boost::shared_ptr<std::istream>,
                ClientError<TransferError::Value> >
    GetObjectOutcome;  // response body
typedef Outcome<std::string, ClientError<TransferError::Value> >
    CreateMultipartUploadOutcome;  // upload id
typedef Outcome<std::string, ClientError<TransferError::Value> >
    UploadPartOutcome;  // etag

//
// ObjectStore
//
// Remote blob store requests used by the transfer manager. Implementations
// own the wire protocol, authentication and transport level retries, and
// must accept calls from several worker threads at once.
//
// Errors returned should carry a STORE_* code and be flagged retryable
// when repeating the same request may succeed.
//
class ObjectStore : private boost::noncopyable {
 public:
  virtual ~ObjectStore() {}

 public:
  // Get object metadata
  //
  // @param  : bucket, object key
  // @return : content length or error
  virtual HeadObjectOutcome HeadObject(const std::string &bucket,
                                       const std::string &key) = 0;

  // Put a whole object in one request
  //
  // @param  : bucket, object key, body, extra args
  // @return : ClientError
  virtual ClientError<TransferError::Value> PutObject(
      const std::string &bucket, const std::string &key,
      const boost::shared_ptr<XF::Data::FileChunkReader> &body,
      const ExtraArgs &extraArgs) = 0;

  // Get object bytes
  //
  // @param  : bucket, object key, range, empty range for the whole object
  // @return : body stream or error
  //
  // Range has format of "bytes=start-stop" or "bytes=start-".
  virtual GetObjectOutcome GetObject(const std::string &bucket,
                                     const std::string &key,
                                     const std::string &range) = 0;

  // Open a multipart session
  //
  // @param  : bucket, object key, extra args
  // @return : upload id or error
  virtual CreateMultipartUploadOutcome CreateMultipartUpload(
      const std::string &bucket, const std::string &key,
      const ExtraArgs &extraArgs) = 0;

  // Upload one part of a multipart session
  //
  // @param  : bucket, object key, upload id, part number from 1, body
  // @return : etag or error
  virtual UploadPartOutcome UploadPart(
      const std::string &bucket, const std::string &key,
      const std::string &uploadId, uint32_t partNumber,
      const boost::shared_ptr<XF::Data::FileChunkReader> &body) = 0;

  // Finish a multipart session
  //
  // @param  : bucket, object key, upload id, parts sorted by part number
  // @return : ClientError
  virtual ClientError<TransferError::Value> CompleteMultipartUpload(
      const std::string &bucket, const std::string &key,
      const std::string &uploadId, const std::vector<CompletedPart> &parts) = 0;

  // Drop a multipart session and the parts uploaded so far
  //
  // @param  : bucket, object key, upload id
  // @return : ClientError
  virtual ClientError<TransferError::Value> AbortMultipartUpload(
      const std::string &bucket, const std::string &key,
      const std::string &uploadId) = 0;
};

}  // namespace Client
}  // namespace XF

#endif  // XFER_CLIENT_OBJECTSTORE_H_
