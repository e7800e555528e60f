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

#ifndef XFER_DATA_PROGRESSCALLBACK_H_
#define XFER_DATA_PROGRESSCALLBACK_H_

#include <stddef.h>  // for size_t

#include "boost/function.hpp"

namespace XF {

namespace Data {

// Invoked with the count of bytes just moved, never with zero.
// May be called from several workers at once. Throwing from it fails
// the transfer.
typedef boost::function<void(size_t)> ProgressCallback;

}  // namespace Data
}  // namespace XF

#endif  // XFER_DATA_PROGRESSCALLBACK_H_
