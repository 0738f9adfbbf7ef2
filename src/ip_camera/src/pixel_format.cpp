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


#include "ip_camera/pixel_format.hpp"

#include <cstring>
#include <stdexcept>
#include <string>

namespace ip_camera
{

namespace
{

void requireRgb8(const cv::Mat & frame, const char * what)
{
  if (frame.type() != CV_8UC3) {
    throw std::invalid_argument(
      std::string(what) + " expects an 8-bit 3-channel frame, got type " +
      std::to_string(frame.type()));
  }
}

}  // namespace

cv::Mat bgrToRgb(const cv::Mat & bgr)
{
  if (bgr.empty()) {
    return cv::Mat();
  }
  requireRgb8(bgr, "bgrToRgb");
  cv::Mat rgb;
  cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
  return rgb;
}

cv::Mat rgbToRgba(const cv::Mat & rgb)
{
  if (rgb.empty()) {
    return cv::Mat();
  }
  requireRgb8(rgb, "rgbToRgba");
  // cvtColor fills the added alpha channel with 255
  cv::Mat rgba;
  cv::cvtColor(rgb, rgba, cv::COLOR_RGB2RGBA);
  return rgba;
}

std::vector<uint8_t> frameBytes(const cv::Mat & frame)
{
  if (frame.empty()) {
    return {};
  }
  const std::size_t row_bytes = frame.cols * frame.elemSize();
  std::vector<uint8_t> bytes(row_bytes * frame.rows);
  if (frame.isContinuous()) {
    std::memcpy(bytes.data(), frame.data, bytes.size());
    return bytes;
  }
  for (int row = 0; row < frame.rows; ++row) {
    std::memcpy(bytes.data() + row * row_bytes, frame.ptr<uint8_t>(row), row_bytes);
  }
  return bytes;
}

}  // namespace ip_camera
