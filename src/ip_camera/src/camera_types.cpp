// Copyright 2025 Team766
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#include "ip_camera/camera_types.hpp"

namespace ip_camera
{

const char * frameFormatName(FrameFormat format)
{
  switch (format) {
    case FrameFormat::kMjpeg:
      return "MJPEG";
    case FrameFormat::kYuyv:
      return "YUYV";
    case FrameFormat::kNv12:
      return "NV12";
    case FrameFormat::kGray:
      return "GRAY";
    case FrameFormat::kRawRgb:
      return "RAWRGB";
  }
  return "UNKNOWN";
}

}  // namespace ip_camera
