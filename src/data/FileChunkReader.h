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

#ifndef XFER_DATA_FILECHUNKREADER_H_
#define XFER_DATA_FILECHUNKREADER_H_

#include <stddef.h>  // for size_t
#include <stdint.h>  // for uint64_t

#include <fstream>
#include <string>
#include <utility>

#include "boost/noncopyable.hpp"

#include "data/ProgressCallback.h"

namespace XF {

namespace Data {

//
// FileChunkReader
//
// Read only window [start, start + length) over a local file. The length
// is clamped to the file size found at Open, so a reader never hands out
// bytes beyond its window even if the file is longer. Each instance owns
// its own file handle.
//
class FileChunkReader : private boost::noncopyable {
 public:
  FileChunkReader(const std::string &filePath, uint64_t start, uint64_t size,
                  const ProgressCallback &callback = ProgressCallback());

  ~FileChunkReader();

 public:
  // Open file and fix the window length
  //
  // @param  : void
  // @return : a pair of {true, ""} or {false, message}
  std::pair<bool, std::string> Open();

  // Read from current position
  //
  // @param  : buffer, max count of bytes to read
  // @return : count of bytes read, 0 at end of window
  //
  // Never reads past the window and never throws. Progress callback is
  // invoked with every non-zero count.
  size_t Read(char *buf, size_t size);

  // Reposition within the window
  //
  // @param  : offset relative to window start, clamped to window length
  // @return : bool
  bool Seek(uint64_t where);

  uint64_t Tell() const { return m_position; }
  uint64_t GetLength() const { return m_length; }
  uint64_t GetStart() const { return m_start; }
  uint64_t GetRemaining() const { return m_length - m_position; }
  const std::string &GetFilePath() const { return m_filePath; }
  bool IsOpen() const { return m_file.is_open(); }

  // Whether the last read hit an I/O error rather than the window end
  bool Bad() const { return m_bad; }

 private:
  std::string m_filePath;
  uint64_t m_start;
  uint64_t m_length;    // window size
  uint64_t m_position;  // relative to m_start
  bool m_bad;
  ProgressCallback m_callback;
  std::ifstream m_file;
};

}  // namespace Data
}  // namespace XF

#endif  // XFER_DATA_FILECHUNKREADER_H_
