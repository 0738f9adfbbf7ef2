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

#ifndef IP_CAMERA__OPENCV_CAPTURE_DEVICE_HPP_
#define IP_CAMERA__OPENCV_CAPTURE_DEVICE_HPP_

#include <opencv2/opencv.hpp>

#include <string>

#include "ip_camera/capture_device_interface.hpp"

namespace ip_camera
{

/**
 * @brief Network stream capture using OpenCV VideoCapture
 *
 * Connection, demuxing and decoding are all done by whichever OpenCV backend
 * (FFmpeg, GStreamer) the api preference selects.
 */
class OpenCVCaptureDevice : public CaptureDeviceInterface
{
public:
  OpenCVCaptureDevice() = default;
  ~OpenCVCaptureDevice() override;

  bool open(const std::string & address, int api_preference) override;
  bool isOpened() const override;
  bool openStream() override;
  bool stopStream() override;
  bool isStreaming() const override;
  bool read(cv::Mat & frame) override;
  bool set(int prop_id, double value) override;
  double get(int prop_id) const override;
  Resolution resolution() const override;
  void release() override;

private:
  cv::VideoCapture cap_;
  std::string address_;
  int api_preference_ = cv::CAP_ANY;
  bool streaming_ = false;
};

}  // namespace ip_camera

#endif  // IP_CAMERA__OPENCV_CAPTURE_DEVICE_HPP_
