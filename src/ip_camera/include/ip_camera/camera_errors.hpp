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

#ifndef IP_CAMERA__CAMERA_ERRORS_HPP_
#define IP_CAMERA__CAMERA_ERRORS_HPP_

#include <cstddef>
#include <stdexcept>
#include <string>

namespace ip_camera
{

/**
 * @brief Base class for every error raised by the network camera stack
 */
class CameraError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief The address is malformed or the capture backend could not connect to it
 */
class ConnectionError : public CameraError
{
public:
  using CameraError::CameraError;
};

/**
 * @brief Starting or stopping frame delivery failed
 */
class StreamError : public CameraError
{
public:
  using CameraError::CameraError;
};

/**
 * @brief No frame could be read or decoded (stream not open, device busy, ...)
 */
class CaptureError : public CameraError
{
public:
  using CameraError::CameraError;
};

/**
 * @brief Caller-supplied storage is smaller than the frame to be written
 *
 * Raised before any byte of the destination is touched.
 */
class BufferTooSmallError : public CaptureError
{
public:
  BufferTooSmallError(std::size_t required, std::size_t provided)
  : CaptureError(
      "Destination buffer too small: need " + std::to_string(required) +
      " bytes, got " + std::to_string(provided)),
    required_(required),
    provided_(provided)
  {
  }

  std::size_t required() const {return required_;}
  std::size_t provided() const {return provided_;}

private:
  std::size_t required_;
  std::size_t provided_;
};

/**
 * @brief A frame could not be turned into a GPU texture
 */
class UploadError : public CameraError
{
public:
  using CameraError::CameraError;
};

/**
 * @brief The requested capability is not available on a network camera
 */
class UnsupportedOperationError : public CameraError
{
public:
  explicit UnsupportedOperationError(const std::string & operation)
  : CameraError("Operation not supported by network cameras: " + operation)
  {
  }
};

}  // namespace ip_camera

#endif  // IP_CAMERA__CAMERA_ERRORS_HPP_
