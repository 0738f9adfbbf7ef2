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


#ifndef IP_CAMERA__PIXEL_FORMAT_HPP_
#define IP_CAMERA__PIXEL_FORMAT_HPP_

#include <opencv2/opencv.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ip_camera
{

constexpr int kRgbChannels = 3;
constexpr int kRgbaChannels = 4;

/**
 * @brief Reorder an OpenCV BGR frame into RGB
 * @param bgr CV_8UC3 frame as returned by cv::VideoCapture
 * @return Continuous CV_8UC3 RGB frame; empty if the input is empty
 * @throws std::invalid_argument if the input is not CV_8UC3
 */
cv::Mat bgrToRgb(const cv::Mat & bgr);

/**
 * @brief Expand an RGB frame to RGBA with a fully opaque alpha channel
 * @param rgb CV_8UC3 frame
 * @return Continuous CV_8UC4 frame of the same size; empty if the input is empty
 * @throws std::invalid_argument if the input is not CV_8UC3
 */
cv::Mat rgbToRgba(const cv::Mat & rgb);

/**
 * @brief Copy the pixels of a frame into a tightly packed byte vector
 */
std::vector<uint8_t> frameBytes(const cv::Mat & frame);

/**
 * @brief Bytes needed to hold a width x height frame
 */
constexpr std::size_t frameByteSize(uint32_t width, uint32_t height, bool rgba)
{
  return static_cast<std::size_t>(width) * height * (rgba ? kRgbaChannels : kRgbChannels);
}

}  // namespace ip_camera

#endif  // IP_CAMERA__PIXEL_FORMAT_HPP_
