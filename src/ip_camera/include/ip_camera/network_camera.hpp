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


#ifndef IP_CAMERA__NETWORK_CAMERA_HPP_
#define IP_CAMERA__NETWORK_CAMERA_HPP_

#include <opencv2/opencv.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "ip_camera/camera_types.hpp"
#include "ip_camera/capture_device_interface.hpp"
#include "ip_camera/gpu_surface.hpp"

namespace ip_camera
{

/**
 * @brief An IP camera exposed as a capture device
 *
 * Owns exactly one capture device connected to address(). All calls are
 * synchronous and may block on the network. There is no internal locking: a
 * NetworkCamera must be used from one thread at a time.
 *
 * Failures are reported with the exceptions in ip_camera/camera_errors.hpp.
 */
class NetworkCamera
{
public:
  /**
   * @brief Connect to a camera through OpenCV
   * @param address Stream URL, e.g. "rtsp://10.0.0.5:554/stream1"
   * @param api_preference OpenCV capture API preference
   * @throws ConnectionError if the address is malformed or cannot be opened
   */
  explicit NetworkCamera(const std::string & address, int api_preference = cv::CAP_ANY);

  /**
   * @brief Connect using devices produced by @p factory (for testing)
   */
  NetworkCamera(
    const std::string & address, CaptureDeviceFactory factory,
    int api_preference = cv::CAP_ANY);

  /**
   * @brief Stops the stream; a failure to stop is logged, never thrown
   */
  ~NetworkCamera();

  NetworkCamera(const NetworkCamera &) = delete;
  NetworkCamera & operator=(const NetworkCamera &) = delete;

  const std::string & address() const {return address_;}

  /**
   * @brief Reconnect to a different camera
   *
   * The new device is opened before the old one is dropped, so on failure the
   * camera keeps its previous address and connection. If the stream was open
   * it is reopened on the new device.
   *
   * @throws ConnectionError if the new address is malformed or cannot be opened
   * @throws StreamError if the stream could not be restarted after the switch
   */
  void setAddress(const std::string & address);

  /**
   * @brief Start frame delivery; must precede frame()
   * @throws StreamError
   */
  void openStream();

  /**
   * @brief Stop frame delivery; calling it again, or before openStream(), is fine
   * @throws StreamError if the device fails to stop
   */
  void stopStream();

  bool isStreamOpen() const;

  /**
   * @brief Grab and decode the most recent frame
   * @return Continuous CV_8UC3 frame in RGB order
   * @throws CaptureError if the stream is not open or no frame is available
   */
  cv::Mat frame();

  /**
   * @brief frame() as tightly packed RGB bytes
   */
  std::vector<uint8_t> frameRaw();

  /**
   * @brief Bytes needed by frameToBuffer() at the current resolution
   * @param rgba true for RGBA (4 bytes per pixel), false for RGB (3)
   */
  std::size_t minBufferSize(bool rgba) const;

  /**
   * @brief Grab a frame and copy it into caller storage
   * @param buffer Destination, at least minBufferSize(convert_rgba) bytes
   * @param convert_rgba Write RGBA instead of RGB
   * @return Number of bytes written
   * @throws BufferTooSmallError if @p buffer cannot hold the frame; nothing is written
   * @throws CaptureError as frame()
   */
  std::size_t frameToBuffer(std::span<uint8_t> buffer, bool convert_rgba);

  /**
   * @brief Grab a frame and upload it as an RGBA texture
   * @throws CaptureError as frame()
   * @throws UploadError if the frame has a zero dimension or the upload fails
   */
  std::unique_ptr<Texture> frameTexture(
    GpuSurfaceInterface & surface, const std::string & label = "");

  // Capture device capabilities

  CameraFormat init();
  ApiBackend backend() const {return ApiBackend::kOpenCv;}
  const CameraInfo & cameraInfo() const {return info_;}
  void refreshCameraFormat();
  const CameraFormat & cameraFormat() const {return format_;}
  void setCameraFormat(const CameraFormat & format);
  Resolution resolution() const;
  void setResolution(const Resolution & resolution);
  uint32_t frameRate() const;
  void setFrameRate(uint32_t frame_rate);
  FrameFormat frameFormat() const {return FrameFormat::kRawRgb;}
  void setFrameFormat(FrameFormat format);

  // Not available on network streams; these always throw UnsupportedOperationError

  std::map<Resolution, std::vector<uint32_t>> compatibleListByResolution(FrameFormat format);
  std::vector<FrameFormat> compatibleFourcc();
  CameraControl cameraControl(KnownCameraControl control) const;
  std::vector<CameraControl> cameraControls() const;
  void setCameraControl(KnownCameraControl control, const ControlValue & value);

private:
  std::unique_ptr<CaptureDeviceInterface> connect(const std::string & address) const;
  static CameraInfo makeCameraInfo(const std::string & address);

  std::string address_;
  CaptureDeviceFactory factory_;
  int api_preference_;
  std::unique_ptr<CaptureDeviceInterface> device_;
  CameraInfo info_;
  CameraFormat format_;
};

}  // namespace ip_camera

#endif  // IP_CAMERA__NETWORK_CAMERA_HPP_
