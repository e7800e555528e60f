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

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <fstream>
#include <istream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "boost/bind.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/thread/thread.hpp"
#include "boost/tuple/tuple.hpp"

#include "base/Exception.h"
#include "base/Utils.h"
#include "client/ClientError.hpp"
#include "client/ObjectStore.h"
#include "client/TransferError.h"
#include "client/TransferHandle.h"
#include "client/TransferManager.h"
#include "client/TransferPolicy.h"
#include "client/Utils.h"
#include "data/FileChunkReader.h"
#include "data/ProgressTracker.h"

namespace XF {
namespace Client {

using boost::lock_guard;
using boost::mutex;
using boost::shared_ptr;
using boost::to_string;
using XF::Data::FileChunkReader;
using XF::Data::ProgressTracker;
using XF::Exception::XFException;
using std::map;
using std::string;
using std::vector;
using ::testing::Test;

typedef ClientError<TransferError::Value> TransferClientError;

static const char *testDir = "/tmp/xfer.test.transfer/";
static const char *bucket = "test-bucket";

namespace {

string MakeContent(size_t size) {
  string content;
  content.reserve(size);
  for (size_t i = 0; i < size; ++i) {
    content.push_back(static_cast<char>('a' + (i * 7 + i / 26) % 26));
  }
  return content;
}

void WriteLocalFile(const string &path, const string &content) {
  std::ofstream out(path.c_str(), std::ios_base::binary | std::ios_base::trunc);
  out.write(content.data(), content.size());
}

string ReadLocalFile(const string &path) {
  std::ifstream in(path.c_str(), std::ios_base::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

string ReadAll(const shared_ptr<FileChunkReader> &body) {
  string data;
  char buf[4096];
  size_t n = 0;
  while ((n = body->Read(buf, sizeof(buf))) > 0) {
    data.append(buf, n);
  }
  return data;
}

void Sleep(uint32_t milliseconds) {
  boost::this_thread::sleep(boost::posix_time::milliseconds(milliseconds));
}

TransferClientError Good() {
  return TransferClientError(TransferError::GOOD, false);
}

void ThrowingProgress(size_t amount) {
  throw std::runtime_error("progress sink closed");
}

}  // namespace

//
// In memory store recording every request. Failures and delays are
// injected through its public members before a transfer starts.
//
class FakeObjectStore : public ObjectStore {
 public:
  FakeObjectStore()
      : headCalls(0),
        putCalls(0),
        getCalls(0),
        createCalls(0),
        uploadPartCalls(0),
        completeCalls(0),
        abortCalls(0),
        putTransientFailures(0),
        getTransientFailures(0),
        failPartNumber(0),
        failRangeStart(-1),
        shortBody(false),
        throwingBody(false),
        firstPartDelay(0),
        partDelay(0),
        m_nextUploadId(0) {}

 public:
  HeadObjectOutcome HeadObject(const string &bucket, const string &key) {
    lock_guard<mutex> locker(m_lock);
    ++headCalls;
    map<string, string>::const_iterator it = objects.find(key);
    if (it == objects.end()) {
      return HeadObjectOutcome(TransferClientError(
          TransferError::STORE_NOT_FOUND, "HeadObject", key, false));
    }
    return HeadObjectOutcome(static_cast<uint64_t>(it->second.size()));
  }

  TransferClientError PutObject(const string &bucket, const string &key,
                                const shared_ptr<FileChunkReader> &body,
                                const ExtraArgs &extraArgs) {
    string data = ReadAll(body);
    lock_guard<mutex> locker(m_lock);
    ++putCalls;
    if (putTransientFailures > 0) {
      --putTransientFailures;
      return TransferClientError(TransferError::STORE_REQUEST_FAILED,
                                 "PutObject", "connection reset", true);
    }
    objects[key] = data;
    lastExtraArgs = extraArgs;
    return Good();
  }

  GetObjectOutcome GetObject(const string &bucket, const string &key,
                             const string &range) {
    lock_guard<mutex> locker(m_lock);
    ++getCalls;
    ranges.push_back(range);
    if (getTransientFailures > 0) {
      --getTransientFailures;
      return GetObjectOutcome(
          TransferClientError(TransferError::STORE_REQUEST_FAILED,
                              "GetObject", "connection reset", true));
    }
    map<string, string>::const_iterator it = objects.find(key);
    if (it == objects.end()) {
      return GetObjectOutcome(TransferClientError(
          TransferError::STORE_NOT_FOUND, "GetObject", key, false));
    }

    const string &data = it->second;
    size_t start = 0;
    size_t stop = data.empty() ? 0 : data.size() - 1;
    if (!range.empty()) {
      boost::tuple<bool, int64_t, int64_t> res =
          XF::Client::Utils::ParseRequestRange(range);
      if (!boost::get<0>(res)) {
        return GetObjectOutcome(
            TransferClientError(TransferError::STORE_UNEXPECTED_RESPONSE,
                                "GetObject", "bad range " + range, false));
      }
      start = static_cast<size_t>(boost::get<1>(res));
      if (boost::get<2>(res) >= 0) {
        stop = std::min(static_cast<size_t>(boost::get<2>(res)), stop);
      }
      if (static_cast<int64_t>(start) == failRangeStart) {
        return GetObjectOutcome(TransferClientError(
            TransferError::STORE_ACCESS_DENIED, "GetObject", range, false));
      }
    }

    string body;
    if (start < data.size()) {
      body = data.substr(start, stop - start + 1);
    }
    if (shortBody && !body.empty()) {
      body.erase(body.size() - 1);
    }
    std::istringstream *stream = new std::istringstream(body);
    if (throwingBody) {
      // reading up to the end of the body throws
      stream->exceptions(std::ios_base::badbit | std::ios_base::failbit |
                         std::ios_base::eofbit);
    }
    return GetObjectOutcome(shared_ptr<std::istream>(stream));
  }

  CreateMultipartUploadOutcome CreateMultipartUpload(
      const string &bucket, const string &key, const ExtraArgs &extraArgs) {
    lock_guard<mutex> locker(m_lock);
    ++createCalls;
    string uploadId = "upload-" + to_string(++m_nextUploadId);
    uploads[uploadId];
    lastExtraArgs = extraArgs;
    return CreateMultipartUploadOutcome(uploadId);
  }

  UploadPartOutcome UploadPart(const string &bucket, const string &key,
                               const string &uploadId, uint32_t partNumber,
                               const shared_ptr<FileChunkReader> &body) {
    if (partNumber == 1 && firstPartDelay > 0) {
      Sleep(firstPartDelay);
    }
    if (partDelay > 0) {
      Sleep(partDelay);
    }
    string data = ReadAll(body);

    lock_guard<mutex> locker(m_lock);
    ++uploadPartCalls;
    if (partNumber == failPartNumber) {
      return UploadPartOutcome(TransferClientError(
          TransferError::STORE_ACCESS_DENIED, "UploadPart", "denied", false));
    }
    if (partTransientFailures[partNumber] > 0) {
      --partTransientFailures[partNumber];
      return UploadPartOutcome(
          TransferClientError(TransferError::STORE_REQUEST_FAILED,
                              "UploadPart", "connection reset", true));
    }
    map<string, map<uint32_t, string> >::iterator it = uploads.find(uploadId);
    if (it == uploads.end()) {
      return UploadPartOutcome(TransferClientError(
          TransferError::STORE_NO_SUCH_UPLOAD, "UploadPart", uploadId, false));
    }
    it->second[partNumber] = data;
    partCompletionOrder.push_back(partNumber);
    return UploadPartOutcome("etag-" + to_string(partNumber));
  }

  TransferClientError CompleteMultipartUpload(
      const string &bucket, const string &key, const string &uploadId,
      const vector<CompletedPart> &parts) {
    lock_guard<mutex> locker(m_lock);
    ++completeCalls;
    map<string, map<uint32_t, string> >::iterator it = uploads.find(uploadId);
    if (it == uploads.end()) {
      return TransferClientError(TransferError::STORE_NO_SUCH_UPLOAD,
                                 "CompleteMultipartUpload", uploadId, false);
    }
    string data;
    for (size_t i = 0; i < parts.size(); ++i) {
      completedPartNumbers.push_back(parts[i].m_partNumber);
      if (parts[i].m_eTag != "etag-" + to_string(parts[i].m_partNumber)) {
        return TransferClientError(TransferError::STORE_UNEXPECTED_RESPONSE,
                                   "CompleteMultipartUpload",
                                   "bad etag " + parts[i].m_eTag, false);
      }
      data += it->second[parts[i].m_partNumber];
    }
    objects[key] = data;
    uploads.erase(it);
    return Good();
  }

  TransferClientError AbortMultipartUpload(const string &bucket,
                                           const string &key,
                                           const string &uploadId) {
    lock_guard<mutex> locker(m_lock);
    ++abortCalls;
    abortedUploadIds.push_back(uploadId);
    uploads.erase(uploadId);
    return Good();
  }

  int TotalCalls() const {
    lock_guard<mutex> locker(m_lock);
    return headCalls + putCalls + getCalls + createCalls + uploadPartCalls +
           completeCalls + abortCalls;
  }

  vector<string> SortedRanges() const {
    lock_guard<mutex> locker(m_lock);
    vector<string> sorted(ranges);
    std::sort(sorted.begin(), sorted.end());
    return sorted;
  }

 public:
  int headCalls;
  int putCalls;
  int getCalls;
  int createCalls;
  int uploadPartCalls;
  int completeCalls;
  int abortCalls;

  int putTransientFailures;
  int getTransientFailures;
  map<uint32_t, int> partTransientFailures;  // part number to failure count
  uint32_t failPartNumber;   // always fails, not retryable
  int64_t failRangeStart;    // range starting here is denied
  bool shortBody;            // get returns one byte less than asked
  bool throwingBody;         // get returns a body throwing at its end
  uint32_t firstPartDelay;   // in milliseconds
  uint32_t partDelay;        // in milliseconds, for every part

  map<string, string> objects;
  map<string, map<uint32_t, string> > uploads;
  vector<string> ranges;
  vector<uint32_t> partCompletionOrder;
  vector<uint32_t> completedPartNumbers;
  vector<string> abortedUploadIds;
  ExtraArgs lastExtraArgs;

 private:
  uint64_t m_nextUploadId;
  mutable mutex m_lock;
};

class TransferManagerTest : public Test {
 protected:
  static void SetUpTestCase() {
    ASSERT_TRUE(XF::Utils::CreateDirectoryIfNotExists(testDir));
  }

  void SetUp() {
    m_store = boost::make_shared<FakeObjectStore>();
    m_localPath = string(testDir) + "local_file";
    XF::Utils::RemoveFileIfExists(m_localPath);
  }

  void TearDown() { XF::Utils::RemoveFileIfExists(m_localPath); }

  // Upload content from the local test file
  shared_ptr<TransferHandle> Upload(TransferManager *manager,
                                    const string &content,
                                    const string &key,
                                    ProgressTracker *tracker = NULL) {
    WriteLocalFile(m_localPath, content);
    if (tracker == NULL) {
      return manager->UploadFile(m_localPath, bucket, key);
    }
    return manager->UploadFile(
        m_localPath, bucket, key, ExtraArgs(),
        boost::bind(&ProgressTracker::OnProgress, tracker, _1));
  }

 protected:
  shared_ptr<FakeObjectStore> m_store;
  string m_localPath;
};

TEST_F(TransferManagerTest, NullStore) {
  EXPECT_THROW({ TransferManager manager((shared_ptr<ObjectStore>())); },
               XFException);
}

TEST_F(TransferManagerTest, SmallFileUsesSinglePut) {
  TransferManager manager(m_store, TransferPolicy(8000000, 8000000, 4));
  string content = MakeContent(100);
  ExtraArgs extraArgs;
  extraArgs["ContentType"] = "text/plain";
  WriteLocalFile(m_localPath, content);
  ProgressTracker tracker("small", content.size());

  shared_ptr<TransferHandle> handle = manager.UploadFile(
      m_localPath, bucket, "small", extraArgs,
      boost::bind(&ProgressTracker::OnProgress, &tracker, _1));

  EXPECT_EQ(handle->GetStatus(), TransferStatus::Completed);
  EXPECT_FALSE(handle->IsMultipart());
  EXPECT_EQ(m_store->putCalls, 1);
  EXPECT_EQ(m_store->createCalls, 0);
  EXPECT_EQ(m_store->uploadPartCalls, 0);
  EXPECT_EQ(m_store->objects["small"], content);
  EXPECT_EQ(m_store->lastExtraArgs["ContentType"], "text/plain");
  EXPECT_EQ(handle->GetBytesTransferred(), 100u);
  EXPECT_EQ(tracker.GetBytesSeen(), 100u);
}

TEST_F(TransferManagerTest, EmptyFileUsesSinglePut) {
  TransferManager manager(m_store);
  shared_ptr<TransferHandle> handle = Upload(&manager, "", "empty");
  EXPECT_EQ(handle->GetStatus(), TransferStatus::Completed);
  EXPECT_EQ(m_store->putCalls, 1);
  ASSERT_EQ(m_store->objects.count("empty"), 1u);
  EXPECT_TRUE(m_store->objects["empty"].empty());
}

TEST_F(TransferManagerTest, ThresholdBoundary) {
  TransferManager manager(m_store, TransferPolicy(64, 16, 4));

  shared_ptr<TransferHandle> below = Upload(&manager, MakeContent(63), "below");
  EXPECT_EQ(below->GetStatus(), TransferStatus::Completed);
  EXPECT_FALSE(below->IsMultipart());
  EXPECT_EQ(m_store->putCalls, 1);
  EXPECT_EQ(m_store->createCalls, 0);

  string content = MakeContent(64);
  shared_ptr<TransferHandle> at = Upload(&manager, content, "at");
  EXPECT_EQ(at->GetStatus(), TransferStatus::Completed);
  EXPECT_TRUE(at->IsMultipart());
  EXPECT_EQ(m_store->putCalls, 1);
  EXPECT_EQ(m_store->createCalls, 1);
  EXPECT_EQ(m_store->uploadPartCalls, 4);
  EXPECT_EQ(m_store->objects["at"], content);
}

TEST_F(TransferManagerTest, MultipartUploadCompletesInPartOrder) {
  // same shape as a 20M file with 8M parts
  TransferManager manager(m_store, TransferPolicy(20, 8, 3));
  m_store->firstPartDelay = 200;
  string content = MakeContent(20);
  ProgressTracker tracker("multipart", content.size());

  shared_ptr<TransferHandle> handle =
      Upload(&manager, content, "multipart", &tracker);

  EXPECT_EQ(handle->GetStatus(), TransferStatus::Completed);
  EXPECT_TRUE(handle->IsMultipart());
  EXPECT_EQ(handle->GetMultipartId(), "upload-1");
  EXPECT_EQ(m_store->uploadPartCalls, 3);
  EXPECT_EQ(m_store->completeCalls, 1);
  EXPECT_EQ(m_store->abortCalls, 0);

  // part 1 is the last one the store got, it still leads the list
  ASSERT_EQ(m_store->partCompletionOrder.size(), 3u);
  EXPECT_EQ(m_store->partCompletionOrder.back(), 1u);
  ASSERT_EQ(m_store->completedPartNumbers.size(), 3u);
  EXPECT_EQ(m_store->completedPartNumbers[0], 1u);
  EXPECT_EQ(m_store->completedPartNumbers[1], 2u);
  EXPECT_EQ(m_store->completedPartNumbers[2], 3u);

  EXPECT_EQ(m_store->objects["multipart"], content);
  EXPECT_EQ(handle->GetBytesTransferred(), 20u);
  EXPECT_EQ(tracker.GetBytesSeen(), 20u);
  EXPECT_DOUBLE_EQ(tracker.GetPercentage(), 100.0);

  PartIdToPartMap parts = handle->GetCompletedParts();
  ASSERT_EQ(parts.size(), 3u);
  EXPECT_EQ(parts[1]->GetSize(), 8u);
  EXPECT_EQ(parts[2]->GetSize(), 8u);
  EXPECT_EQ(parts[3]->GetSize(), 4u);
  EXPECT_EQ(parts[3]->GetRangeBegin(), 16u);
  EXPECT_EQ(parts[2]->GetETag(), "etag-2");
}

TEST_F(TransferManagerTest, PartFailureAbortsSession) {
  TransferManager manager(m_store, TransferPolicy(20, 8, 3));
  m_store->failPartNumber = 2;

  shared_ptr<TransferHandle> handle =
      Upload(&manager, MakeContent(20), "aborted");

  EXPECT_EQ(handle->GetStatus(), TransferStatus::Aborted);
  EXPECT_EQ(handle->GetError().GetError(), TransferError::STORE_ACCESS_DENIED);
  EXPECT_EQ(m_store->completeCalls, 0);
  EXPECT_EQ(m_store->abortCalls, 1);
  ASSERT_EQ(m_store->abortedUploadIds.size(), 1u);
  EXPECT_EQ(m_store->abortedUploadIds[0], handle->GetMultipartId());
  EXPECT_EQ(m_store->objects.count("aborted"), 0u);
  EXPECT_TRUE(m_store->uploads.empty());
  EXPECT_TRUE(handle->HasFailedParts());
}

TEST_F(TransferManagerTest, TransientPartFailureIsRetried) {
  TransferManager manager(m_store, TransferPolicy(20, 8, 3, 3, 1));
  m_store->partTransientFailures[2] = 2;
  string content = MakeContent(20);
  ProgressTracker tracker("retried", content.size());

  shared_ptr<TransferHandle> handle =
      Upload(&manager, content, "retried", &tracker);

  EXPECT_EQ(handle->GetStatus(), TransferStatus::Completed);
  EXPECT_EQ(m_store->uploadPartCalls, 5);
  EXPECT_EQ(m_store->objects["retried"], content);
  // bytes read again on retry are not counted twice
  EXPECT_EQ(handle->GetBytesTransferred(), 20u);
  EXPECT_EQ(tracker.GetBytesSeen(), 20u);
}

TEST_F(TransferManagerTest, PartRetriesExhausted) {
  TransferManager manager(m_store, TransferPolicy(20, 8, 3, 2, 1));
  m_store->partTransientFailures[1] = 10;

  shared_ptr<TransferHandle> handle =
      Upload(&manager, MakeContent(20), "exhausted");

  EXPECT_EQ(handle->GetStatus(), TransferStatus::Aborted);
  EXPECT_EQ(handle->GetError().GetError(),
            TransferError::STORE_REQUEST_FAILED);
  EXPECT_EQ(m_store->completeCalls, 0);
  EXPECT_EQ(m_store->abortCalls, 1);
}

TEST_F(TransferManagerTest, TransientPutFailureIsRetried) {
  TransferManager manager(m_store, TransferPolicy(1000, 100, 2, 3, 1));
  m_store->putTransientFailures = 1;
  string content = MakeContent(50);

  shared_ptr<TransferHandle> handle = Upload(&manager, content, "put");

  EXPECT_EQ(handle->GetStatus(), TransferStatus::Completed);
  EXPECT_EQ(m_store->putCalls, 2);
  EXPECT_EQ(m_store->objects["put"], content);
  EXPECT_EQ(handle->GetBytesTransferred(), 50u);
}

TEST_F(TransferManagerTest, MissingLocalFile) {
  TransferManager manager(m_store);
  shared_ptr<TransferHandle> handle = manager.UploadFile(
      string(testDir) + "no_such_file", bucket, "missing");

  EXPECT_EQ(handle->GetStatus(), TransferStatus::Failed);
  EXPECT_EQ(handle->GetError().GetError(),
            TransferError::LOCAL_FILE_ACCESS_FAILED);
  EXPECT_EQ(GetTransferErrorCategory(handle->GetError().GetError()),
            TransferErrorCategory::LocalIO);
  EXPECT_EQ(m_store->TotalCalls(), 0);
}

TEST_F(TransferManagerTest, EmptyFileCannotBeSplit) {
  TransferManager manager(m_store, TransferPolicy(0, 8, 2));
  shared_ptr<TransferHandle> handle = Upload(&manager, "", "empty");

  EXPECT_EQ(handle->GetStatus(), TransferStatus::Failed);
  EXPECT_EQ(handle->GetError().GetError(), TransferError::INVALID_PARTITION);
  EXPECT_EQ(GetTransferErrorCategory(handle->GetError().GetError()),
            TransferErrorCategory::Configuration);
  EXPECT_EQ(m_store->createCalls, 0);
}

TEST_F(TransferManagerTest, SmallObjectUsesSingleGet) {
  TransferManager manager(m_store, TransferPolicy(1000, 100, 2));
  string content = MakeContent(100);
  m_store->objects["small"] = content;
  ProgressTracker tracker("small", content.size());

  shared_ptr<TransferHandle> handle = manager.DownloadFile(
      bucket, "small", m_localPath,
      boost::bind(&ProgressTracker::OnProgress, &tracker, _1));

  EXPECT_EQ(handle->GetStatus(), TransferStatus::Completed);
  EXPECT_FALSE(handle->IsMultipart());
  EXPECT_EQ(m_store->headCalls, 1);
  EXPECT_EQ(m_store->getCalls, 1);
  ASSERT_EQ(m_store->ranges.size(), 1u);
  EXPECT_TRUE(m_store->ranges[0].empty());
  EXPECT_EQ(ReadLocalFile(m_localPath), content);
  EXPECT_EQ(handle->GetBytesTransferred(), 100u);
  EXPECT_EQ(tracker.GetBytesSeen(), 100u);
}

TEST_F(TransferManagerTest, MultipartDownloadRanges) {
  TransferManager manager(m_store, TransferPolicy(10, 10, 2));
  string content = MakeContent(17);
  m_store->objects["ranged"] = content;

  shared_ptr<TransferHandle> handle =
      manager.DownloadFile(bucket, "ranged", m_localPath);

  EXPECT_EQ(handle->GetStatus(), TransferStatus::Completed);
  EXPECT_TRUE(handle->IsMultipart());
  vector<string> ranges = m_store->SortedRanges();
  ASSERT_EQ(ranges.size(), 2u);
  EXPECT_EQ(ranges[0], "bytes=0-9");
  EXPECT_EQ(ranges[1], "bytes=10-");

  string local = ReadLocalFile(m_localPath);
  EXPECT_EQ(local.size(), 17u);
  EXPECT_EQ(local, content);
}

TEST_F(TransferManagerTest, MultipartDownloadContent) {
  TransferManager manager(m_store, TransferPolicy(100, 64, 4, 3, 1));
  string content = MakeContent(1000);
  m_store->objects["large"] = content;
  m_store->getTransientFailures = 2;
  ProgressTracker tracker("large", content.size());

  shared_ptr<TransferHandle> handle = manager.DownloadFile(
      bucket, "large", m_localPath,
      boost::bind(&ProgressTracker::OnProgress, &tracker, _1));

  EXPECT_EQ(handle->GetStatus(), TransferStatus::Completed);
  EXPECT_EQ(m_store->getCalls, 16 + 2);
  EXPECT_EQ(ReadLocalFile(m_localPath), content);
  EXPECT_EQ(handle->GetBytesTransferred(), 1000u);
  EXPECT_EQ(tracker.GetBytesSeen(), 1000u);
}

TEST_F(TransferManagerTest, MissingObject) {
  TransferManager manager(m_store);
  shared_ptr<TransferHandle> handle =
      manager.DownloadFile(bucket, "missing", m_localPath);

  EXPECT_EQ(handle->GetStatus(), TransferStatus::Failed);
  EXPECT_EQ(handle->GetError().GetError(), TransferError::STORE_NOT_FOUND);
  EXPECT_EQ(m_store->getCalls, 0);
  EXPECT_FALSE(XF::Utils::FileExists(m_localPath));
}

TEST_F(TransferManagerTest, FailedSingleGetRemovesFile) {
  TransferManager manager(m_store, TransferPolicy(1000, 100, 2, 2, 1));
  m_store->objects["short"] = MakeContent(100);
  m_store->shortBody = true;
  WriteLocalFile(m_localPath, "previous content");

  shared_ptr<TransferHandle> handle =
      manager.DownloadFile(bucket, "short", m_localPath);

  EXPECT_EQ(handle->GetStatus(), TransferStatus::Failed);
  EXPECT_EQ(handle->GetError().GetError(),
            TransferError::STORE_INCOMPLETE_BODY);
  EXPECT_EQ(m_store->getCalls, 3);
  EXPECT_FALSE(XF::Utils::FileExists(m_localPath));
}

TEST_F(TransferManagerTest, FailedRangeRemovesFile) {
  TransferManager manager(m_store, TransferPolicy(10, 10, 2));
  m_store->objects["ranged"] = MakeContent(17);
  m_store->failRangeStart = 10;

  shared_ptr<TransferHandle> handle =
      manager.DownloadFile(bucket, "ranged", m_localPath);

  EXPECT_EQ(handle->GetStatus(), TransferStatus::Failed);
  EXPECT_EQ(handle->GetError().GetError(), TransferError::STORE_ACCESS_DENIED);
  EXPECT_FALSE(XF::Utils::FileExists(m_localPath));
}

TEST_F(TransferManagerTest, ThrowingRangeBodyFailsDownload) {
  TransferManager manager(m_store, TransferPolicy(10, 50, 2, 2, 1));
  m_store->objects["throwing"] = MakeContent(100);
  m_store->throwingBody = true;

  // the open ended last range reads to the end of its body
  shared_ptr<TransferHandle> handle =
      manager.DownloadFile(bucket, "throwing", m_localPath);

  EXPECT_EQ(handle->GetStatus(), TransferStatus::Failed);
  EXPECT_TRUE(handle->IsMultipart());
  EXPECT_EQ(handle->GetError().GetError(),
            TransferError::STORE_REQUEST_FAILED);
  EXPECT_TRUE(handle->HasFailedParts());
  EXPECT_FALSE(handle->HasPendingParts());
  EXPECT_FALSE(XF::Utils::FileExists(m_localPath));
}

TEST_F(TransferManagerTest, ThrowingBodyFailsSingleGet) {
  TransferManager manager(m_store, TransferPolicy(1000, 100, 2, 2, 1));
  m_store->objects["throwing"] = MakeContent(100);
  m_store->throwingBody = true;
  WriteLocalFile(m_localPath, "previous content");

  shared_ptr<TransferHandle> handle =
      manager.DownloadFile(bucket, "throwing", m_localPath);

  EXPECT_EQ(handle->GetStatus(), TransferStatus::Failed);
  EXPECT_FALSE(handle->IsMultipart());
  EXPECT_EQ(handle->GetError().GetError(),
            TransferError::STORE_REQUEST_FAILED);
  EXPECT_TRUE(handle->GetError().ShouldRetry());
  EXPECT_EQ(m_store->getCalls, 3);
  EXPECT_FALSE(XF::Utils::FileExists(m_localPath));
}

TEST_F(TransferManagerTest, ThrowingProgressCallbackFailsDownload) {
  TransferManager manager(m_store, TransferPolicy(1000, 100, 2));
  m_store->objects["callback"] = MakeContent(100);

  shared_ptr<TransferHandle> handle = manager.DownloadFile(
      bucket, "callback", m_localPath, &ThrowingProgress);

  EXPECT_EQ(handle->GetStatus(), TransferStatus::Failed);
  EXPECT_EQ(handle->GetError().GetError(), TransferError::UNKNOWN);
  EXPECT_EQ(handle->GetError().GetMessage(), "progress sink closed");
  EXPECT_FALSE(XF::Utils::FileExists(m_localPath));
}

TEST_F(TransferManagerTest, ThrowingProgressCallbackAbortsUpload) {
  TransferManager manager(m_store, TransferPolicy(20, 8, 3));
  WriteLocalFile(m_localPath, MakeContent(20));

  shared_ptr<TransferHandle> handle =
      manager.UploadFile(m_localPath, bucket, "callback", ExtraArgs(),
                         &ThrowingProgress);

  EXPECT_EQ(handle->GetStatus(), TransferStatus::Aborted);
  EXPECT_EQ(handle->GetError().GetError(), TransferError::UNKNOWN);
  EXPECT_EQ(m_store->completeCalls, 0);
  EXPECT_EQ(m_store->abortCalls, 1);
  EXPECT_EQ(m_store->objects.count("callback"), 0u);
}

TEST_F(TransferManagerTest, CancelBeforeStart) {
  TransferManager manager(m_store);
  WriteLocalFile(m_localPath, MakeContent(10));
  shared_ptr<TransferHandle> handle =
      manager.CreateUploadHandle(m_localPath, bucket, "cancelled");
  EXPECT_EQ(handle->GetStatus(), TransferStatus::NotStarted);

  handle->Cancel();
  manager.Transfer(handle);
  EXPECT_EQ(handle->GetStatus(), TransferStatus::Cancelled);
  EXPECT_TRUE(IsCancelledTransferError(handle->GetError()));
  EXPECT_TRUE(handle->DoneTransfer());

  // a handle runs once only
  manager.Transfer(handle);
  EXPECT_EQ(handle->GetStatus(), TransferStatus::Cancelled);
  EXPECT_EQ(m_store->TotalCalls(), 0);
}

TEST_F(TransferManagerTest, CancelDuringMultipartUpload) {
  TransferManager manager(m_store, TransferPolicy(20, 8, 1));
  m_store->partDelay = 100;
  WriteLocalFile(m_localPath, MakeContent(20));
  shared_ptr<TransferHandle> handle =
      manager.CreateUploadHandle(m_localPath, bucket, "cancelled");

  boost::thread worker(boost::bind(&TransferManager::Transfer, &manager,
                                   handle));
  Sleep(30);
  handle->Cancel();
  worker.join();

  EXPECT_EQ(handle->GetStatus(), TransferStatus::Aborted);
  EXPECT_TRUE(IsCancelledTransferError(handle->GetError()));
  EXPECT_LT(m_store->uploadPartCalls, 3);
  EXPECT_EQ(m_store->completeCalls, 0);
  EXPECT_EQ(m_store->abortCalls, 1);
  EXPECT_EQ(m_store->objects.count("cancelled"), 0u);
}

TEST_F(TransferManagerTest, WaitUntilFinishedOnAnotherThread) {
  TransferManager manager(m_store, TransferPolicy(10, 10, 2));
  m_store->objects["waited"] = MakeContent(25);
  shared_ptr<TransferHandle> handle =
      manager.CreateDownloadHandle(bucket, "waited", m_localPath);

  boost::thread worker(boost::bind(&TransferManager::Transfer, &manager,
                                   handle));
  handle->WaitUntilFinished();
  EXPECT_EQ(handle->GetStatus(), TransferStatus::Completed);
  EXPECT_FALSE(handle->HasPendingParts());
  EXPECT_EQ(handle->GetBytesTransferred(), 25u);
  worker.join();

  EXPECT_EQ(ReadLocalFile(m_localPath), m_store->objects["waited"]);
}

TEST_F(TransferManagerTest, ConcurrentTransfersShareManager) {
  TransferManager manager(m_store, TransferPolicy(16, 8, 2));
  string first = MakeContent(40);
  string second = MakeContent(33);
  string firstPath = string(testDir) + "concurrent_first";
  string secondPath = string(testDir) + "concurrent_second";
  WriteLocalFile(firstPath, first);
  WriteLocalFile(secondPath, second);

  shared_ptr<TransferHandle> h1 =
      manager.CreateUploadHandle(firstPath, bucket, "first");
  shared_ptr<TransferHandle> h2 =
      manager.CreateUploadHandle(secondPath, bucket, "second");
  boost::thread t1(boost::bind(&TransferManager::Transfer, &manager, h1));
  boost::thread t2(boost::bind(&TransferManager::Transfer, &manager, h2));
  t1.join();
  t2.join();

  EXPECT_EQ(h1->GetStatus(), TransferStatus::Completed);
  EXPECT_EQ(h2->GetStatus(), TransferStatus::Completed);
  EXPECT_EQ(m_store->objects["first"], first);
  EXPECT_EQ(m_store->objects["second"], second);
  EXPECT_EQ(m_store->completeCalls, 2);

  XF::Utils::RemoveFileIfExists(firstPath);
  XF::Utils::RemoveFileIfExists(secondPath);
}

}  // namespace Client
}  // namespace XF

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
