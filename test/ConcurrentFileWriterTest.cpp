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
#include <iterator>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "boost/bind.hpp"
#include "boost/thread/thread.hpp"

#include "base/Utils.h"
#include "data/ConcurrentFileWriter.h"

namespace XF {

namespace Data {

using std::string;
using std::vector;
using ::testing::Test;

static const char *testDir = "/tmp/xfer.test.files/";

string ReadWholeFile(const string &path) {
  std::ifstream in(path.c_str(), std::ios_base::binary);
  return string(std::istreambuf_iterator<char>(in),
                std::istreambuf_iterator<char>());
}

// Byte at offset i of the reference content
char ReferenceByte(uint64_t i) { return static_cast<char>('a' + i % 26); }

// Write blocks [first, last) of blockSize bytes, in reverse order
void WriteBlocks(ConcurrentFileWriter *writer, size_t first, size_t last,
                 size_t blockSize, bool *success) {
  *success = true;
  for (size_t block = last; block > first; --block) {
    uint64_t offset = (block - 1) * blockSize;
    vector<char> data(blockSize);
    for (size_t i = 0; i < blockSize; ++i) {
      data[i] = ReferenceByte(offset + i);
    }
    if (!writer->WriteAt(&data[0], data.size(), offset).first) {
      *success = false;
    }
  }
}

class ConcurrentFileWriterTest : public Test {
 protected:
  static void SetUpTestCase() {
    ASSERT_TRUE(XF::Utils::CreateDirectoryIfNotExists(testDir));
  }

  void SetUp() { m_filePath = string(testDir) + "concurrent_writer_output"; }

  void TearDown() { XF::Utils::RemoveFileIfExists(m_filePath); }

 protected:
  string m_filePath;
};

TEST_F(ConcurrentFileWriterTest, WriteOutOfOrder) {
  ConcurrentFileWriter writer(m_filePath);
  ASSERT_TRUE(writer.Open().first);
  EXPECT_TRUE(writer.IsOpen());
  ASSERT_TRUE(writer.WriteAt("world", 5, 6).first);
  ASSERT_TRUE(writer.WriteAt("hello ", 6, 0).first);
  ASSERT_TRUE(writer.Close().first);
  EXPECT_FALSE(writer.IsOpen());

  EXPECT_EQ(ReadWholeFile(m_filePath), "hello world");
}

TEST_F(ConcurrentFileWriterTest, OpenTruncatesExistingFile) {
  {
    std::ofstream out(m_filePath.c_str());
    out << "a much longer previous content";
  }
  ConcurrentFileWriter writer(m_filePath);
  ASSERT_TRUE(writer.Open().first);
  ASSERT_TRUE(writer.WriteAt("new", 3, 0).first);
  ASSERT_TRUE(writer.Close().first);
  EXPECT_EQ(ReadWholeFile(m_filePath), "new");
}

TEST_F(ConcurrentFileWriterTest, WriteBeforeOpen) {
  ConcurrentFileWriter writer(m_filePath);
  EXPECT_FALSE(writer.WriteAt("x", 1, 0).first);
  // closing a writer never opened is fine
  EXPECT_TRUE(writer.Close().first);
}

TEST_F(ConcurrentFileWriterTest, OpenInMissingDirectory) {
  ConcurrentFileWriter writer(string(testDir) + "no/such/dir/file");
  std::pair<bool, string> res = writer.Open();
  EXPECT_FALSE(res.first);
  EXPECT_FALSE(res.second.empty());
}

TEST_F(ConcurrentFileWriterTest, ConcurrentDisjointWrites) {
  const size_t workers = 8;
  const size_t blocksPerWorker = 16;
  const size_t blockSize = 1000;

  ConcurrentFileWriter writer(m_filePath);
  ASSERT_TRUE(writer.Open().first);

  bool results[workers];
  boost::thread_group group;
  for (size_t w = 0; w < workers; ++w) {
    group.create_thread(boost::bind(WriteBlocks, &writer, w * blocksPerWorker,
                                    (w + 1) * blocksPerWorker, blockSize,
                                    &results[w]));
  }
  group.join_all();
  ASSERT_TRUE(writer.Close().first);

  for (size_t w = 0; w < workers; ++w) {
    EXPECT_TRUE(results[w]);
  }

  string reference(workers * blocksPerWorker * blockSize, '\0');
  for (size_t i = 0; i < reference.size(); ++i) {
    reference[i] = ReferenceByte(i);
  }
  string content = ReadWholeFile(m_filePath);
  ASSERT_EQ(content.size(), reference.size());
  EXPECT_TRUE(content == reference);
}

}  // namespace Data
}  // namespace XF

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}
