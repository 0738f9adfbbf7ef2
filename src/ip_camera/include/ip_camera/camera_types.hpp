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

#ifndef IP_CAMERA__CAMERA_TYPES_HPP_
#define IP_CAMERA__CAMERA_TYPES_HPP_

#include <cstdint>
#include <string>
#include <tuple>

namespace ip_camera
{

struct Resolution
{
  uint32_t width = 0;
  uint32_t height = 0;

  bool operator==(const Resolution & other) const
  {
    return width == other.width && height == other.height;
  }
  bool operator!=(const Resolution & other) const {return !(*this == other);}
  bool operator<(const Resolution & other) const
  {
    return std::tie(width, height) < std::tie(other.width, other.height);
  }
};

/**
 * @brief Pixel layout of the frames a device delivers
 *
 * Network cameras always hand out decoded frames, so kRawRgb is the only
 * format they report.
 */
enum class FrameFormat
{
  kMjpeg,
  kYuyv,
  kNv12,
  kGray,
  kRawRgb,
};

struct CameraFormat
{
  Resolution resolution;
  FrameFormat format = FrameFormat::kRawRgb;
  uint32_t frame_rate = 0;

  bool operator==(const CameraFormat & other) const
  {
    return resolution == other.resolution && format == other.format &&
           frame_rate == other.frame_rate;
  }
};

enum class ApiBackend
{
  kAuto,
  kOpenCv,
};

struct CameraInfo
{
  std::string human_name;
  std::string description;
  std::string misc;
  std::string index;
};

enum class KnownCameraControl
{
  kBrightness,
  kContrast,
  kHue,
  kSaturation,
  kSharpness,
  kGamma,
  kWhiteBalance,
  kBacklightComp,
  kGain,
  kPan,
  kTilt,
  kZoom,
  kExposure,
  kIris,
  kFocus,
};

struct ControlValue
{
  double value = 0.0;
};

struct CameraControl
{
  KnownCameraControl control;
  std::string name;
  ControlValue value;
  bool active = false;
};

const char * frameFormatName(FrameFormat format);

}  // namespace ip_camera

#endif  // IP_CAMERA__CAMERA_TYPES_HPP_
