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

#ifndef XFER_DATA_CONCURRENTFILEWRITER_H_
#define XFER_DATA_CONCURRENTFILEWRITER_H_

#include <stddef.h>  // for size_t
#include <stdint.h>  // for uint64_t

#include <fstream>
#include <string>
#include <utility>

#include "boost/noncopyable.hpp"
#include "boost/thread/mutex.hpp"

namespace XF {

namespace Data {

//
// ConcurrentFileWriter
//
// Owns the single output handle of one download. The handle has one
// cursor, so seek and write happen under one lock, otherwise a seek from
// one worker could be followed by a write from another.
//
class ConcurrentFileWriter : private boost::noncopyable {
 public:
  explicit ConcurrentFileWriter(const std::string &filePath);

  ~ConcurrentFileWriter();

 public:
  // Create or truncate the file
  //
  // @param  : void
  // @return : a pair of {true, ""} or {false, message}
  std::pair<bool, std::string> Open();

  // Write data at an absolute file offset
  //
  // @param  : data, size, offset
  // @return : a pair of {true, ""} or {false, message}
  std::pair<bool, std::string> WriteAt(const char *data, size_t size,
                                       uint64_t offset);

  // Flush and close
  std::pair<bool, std::string> Close();

  const std::string &GetFilePath() const { return m_filePath; }
  bool IsOpen() const;

 private:
  std::string m_filePath;
  std::ofstream m_file;
  mutable boost::mutex m_fileLock;
};

}  // namespace Data
}  // namespace XF

#endif  // XFER_DATA_CONCURRENTFILEWRITER_H_
