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

#ifndef IP_CAMERA__CAPTURE_DEVICE_INTERFACE_HPP_
#define IP_CAMERA__CAPTURE_DEVICE_INTERFACE_HPP_

#include <opencv2/opencv.hpp>

#include <functional>
#include <memory>
#include <string>

#include "ip_camera/camera_types.hpp"

namespace ip_camera
{

/**
 * @brief Abstract interface for a stream-backed capture device
 *
 * Connection handling and decoding live behind this interface so that
 * NetworkCamera can be driven by OpenCV in production and by a mock in tests.
 */
class CaptureDeviceInterface
{
public:
  virtual ~CaptureDeviceInterface() = default;

  /**
   * @brief Connect to a stream
   * @param address Stream URL (e.g., "rtsp://10.0.0.5:554/stream1")
   * @param api_preference OpenCV capture API preference (e.g., cv::CAP_FFMPEG)
   * @return true if the connection was established, false otherwise
   */
  virtual bool open(const std::string & address, int api_preference) = 0;

  /**
   * @brief Check if the device holds a live connection
   */
  virtual bool isOpened() const = 0;

  /**
   * @brief Begin frame delivery, reconnecting to the last address if needed
   * @return true if frames can now be read, false otherwise
   */
  virtual bool openStream() = 0;

  /**
   * @brief End frame delivery and drop the connection
   *
   * Calling this when no stream is active is not an error.
   * @return true on success, false if the backend failed to stop
   */
  virtual bool stopStream() = 0;

  /**
   * @brief Check if frame delivery is active
   */
  virtual bool isStreaming() const = 0;

  /**
   * @brief Read the most recent decoded frame
   * @param frame Output frame in OpenCV's native BGR channel order
   * @return true if a frame was read, false otherwise
   */
  virtual bool read(cv::Mat & frame) = 0;

  /**
   * @brief Set a capture property
   * @param prop_id OpenCV property ID (e.g., cv::CAP_PROP_FPS)
   * @param value Property value to set
   * @return true if the backend accepted the value, false otherwise
   */
  virtual bool set(int prop_id, double value) = 0;

  /**
   * @brief Get a capture property value
   * @param prop_id OpenCV property ID (e.g., cv::CAP_PROP_FRAME_WIDTH)
   * @return Current property value, 0 if unknown
   */
  virtual double get(int prop_id) const = 0;

  /**
   * @brief Current frame size as reported by the backend
   */
  virtual Resolution resolution() const = 0;

  /**
   * @brief Release device resources
   */
  virtual void release() = 0;
};

using CaptureDeviceFactory = std::function<std::unique_ptr<CaptureDeviceInterface>()>;

}  // namespace ip_camera

#endif  // IP_CAMERA__CAPTURE_DEVICE_INTERFACE_HPP_
