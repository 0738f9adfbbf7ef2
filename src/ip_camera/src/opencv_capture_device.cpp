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


#include "ip_camera/opencv_capture_device.hpp"

#include <rclcpp/rclcpp.hpp>

namespace ip_camera
{

OpenCVCaptureDevice::~OpenCVCaptureDevice()
{
  release();
}

bool OpenCVCaptureDevice::open(const std::string & address, int api_preference)
{
  address_ = address;
  api_preference_ = api_preference;
  streaming_ = false;
  return cap_.open(address_, api_preference_);
}

bool OpenCVCaptureDevice::isOpened() const
{
  return cap_.isOpened();
}

bool OpenCVCaptureDevice::openStream()
{
  // stopStream() drops the connection, so a restart has to dial again
  if (!cap_.isOpened()) {
    if (address_.empty() || !cap_.open(address_, api_preference_)) {
      return false;
    }
  }
  // Keep only the newest decoded frame queued
  if (!cap_.set(cv::CAP_PROP_BUFFERSIZE, 1)) {
    RCLCPP_DEBUG(rclcpp::get_logger("ip_camera.opencv_capture_device"),
                 "Backend ignores CAP_PROP_BUFFERSIZE - continuing anyway");
  }
  streaming_ = true;
  return true;
}

bool OpenCVCaptureDevice::stopStream()
{
  streaming_ = false;
  release();
  return true;
}

bool OpenCVCaptureDevice::isStreaming() const
{
  return streaming_ && cap_.isOpened();
}

bool OpenCVCaptureDevice::read(cv::Mat & frame)
{
  if (!isStreaming()) {
    return false;
  }
  // Some backends throw on a corrupt packet or a dropped connection
  try {
    return cap_.read(frame);
  } catch (const cv::Exception & e) {
    RCLCPP_WARN(rclcpp::get_logger("ip_camera.opencv_capture_device"),
                "VideoCapture::read threw: %s", e.what());
    return false;
  }
}

bool OpenCVCaptureDevice::set(int prop_id, double value)
{
  return cap_.set(prop_id, value);
}

double OpenCVCaptureDevice::get(int prop_id) const
{
  return cap_.get(prop_id);
}

Resolution OpenCVCaptureDevice::resolution() const
{
  double width = cap_.get(cv::CAP_PROP_FRAME_WIDTH);
  double height = cap_.get(cv::CAP_PROP_FRAME_HEIGHT);
  Resolution res;
  res.width = width > 0.0 ? static_cast<uint32_t>(width) : 0;
  res.height = height > 0.0 ? static_cast<uint32_t>(height) : 0;
  return res;
}

void OpenCVCaptureDevice::release()
{
  if (cap_.isOpened()) {
    cap_.release();
  }
}

}  // namespace ip_camera
