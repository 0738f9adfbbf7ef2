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


#include "ip_camera/network_camera.hpp"

#include <rclcpp/rclcpp.hpp>

#include <algorithm>
#include <utility>

#include "ip_camera/camera_address.hpp"
#include "ip_camera/camera_errors.hpp"
#include "ip_camera/opencv_capture_device.hpp"
#include "ip_camera/pixel_format.hpp"

namespace ip_camera
{

namespace
{

rclcpp::Logger logger()
{
  return rclcpp::get_logger("ip_camera.network_camera");
}

}  // namespace

NetworkCamera::NetworkCamera(const std::string & address, int api_preference)
: NetworkCamera(
    address,
    [] {return std::make_unique<OpenCVCaptureDevice>();},
    api_preference)
{
}

NetworkCamera::NetworkCamera(
  const std::string & address, CaptureDeviceFactory factory, int api_preference)
: factory_(std::move(factory)), api_preference_(api_preference)
{
  device_ = connect(address);
  address_ = address;
  info_ = makeCameraInfo(address_);
  refreshCameraFormat();
}

NetworkCamera::~NetworkCamera()
{
  try {
    stopStream();
  } catch (const std::exception & e) {
    RCLCPP_WARN(logger(), "Failed to stop stream of %s during teardown: %s",
                info_.misc.c_str(), e.what());
  }
}

std::unique_ptr<CaptureDeviceInterface> NetworkCamera::connect(const std::string & address) const
{
  if (!isValidCameraAddress(address)) {
    throw ConnectionError("Invalid network camera address: " + redactCameraAddress(address));
  }
  if (!factory_) {
    throw ConnectionError("No capture device factory configured");
  }

  auto device = factory_();
  if (!device) {
    throw ConnectionError("Capture device factory returned no device");
  }

  std::string redacted = redactCameraAddress(address);
  RCLCPP_INFO(logger(), "Connecting to %s", redacted.c_str());
  if (!device->open(address, api_preference_) || !device->isOpened()) {
    RCLCPP_ERROR(logger(), "Could not open %s", redacted.c_str());
    throw ConnectionError("Failed to open network camera at " + redacted);
  }
  return device;
}

CameraInfo NetworkCamera::makeCameraInfo(const std::string & address)
{
  CameraInfo info;
  info.human_name = "IP Camera";
  info.description = "Network camera via OpenCV";
  info.misc = redactCameraAddress(address);
  info.index = address;
  return info;
}

void NetworkCamera::setAddress(const std::string & address)
{
  auto device = connect(address);
  const bool was_streaming = device_ && device_->isStreaming();

  // Dropping the old device releases its connection
  device_ = std::move(device);
  address_ = address;
  info_ = makeCameraInfo(address_);
  refreshCameraFormat();

  if (was_streaming) {
    RCLCPP_INFO(logger(), "Restarting stream on %s", info_.misc.c_str());
    openStream();
  }
}

void NetworkCamera::openStream()
{
  if (!device_->openStream()) {
    throw StreamError("Failed to open stream on " + info_.misc);
  }
  RCLCPP_DEBUG(logger(), "Stream open on %s", info_.misc.c_str());
}

void NetworkCamera::stopStream()
{
  if (!device_) {
    return;
  }
  if (!device_->stopStream()) {
    throw StreamError("Failed to stop stream on " + info_.misc);
  }
}

bool NetworkCamera::isStreamOpen() const
{
  return device_->isStreaming();
}

cv::Mat NetworkCamera::frame()
{
  if (!device_->isStreaming()) {
    throw CaptureError("Stream is not open; call openStream() first");
  }

  cv::Mat bgr;
  bool ok = false;
  try {
    ok = device_->read(bgr);
  } catch (const cv::Exception & e) {
    throw CaptureError("Capture backend failed reading " + info_.misc + ": " + e.what());
  }
  if (!ok) {
    throw CaptureError("Failed to read frame from " + info_.misc);
  }
  if (bgr.empty()) {
    throw CaptureError("Captured empty frame from " + info_.misc);
  }
  if (bgr.type() != CV_8UC3) {
    throw CaptureError(
      "Unexpected frame type " + std::to_string(bgr.type()) + " from " + info_.misc);
  }
  return bgrToRgb(bgr);
}

std::vector<uint8_t> NetworkCamera::frameRaw()
{
  return frameBytes(frame());
}

std::size_t NetworkCamera::minBufferSize(bool rgba) const
{
  Resolution res = device_->resolution();
  return frameByteSize(res.width, res.height, rgba);
}

std::size_t NetworkCamera::frameToBuffer(std::span<uint8_t> buffer, bool convert_rgba)
{
  cv::Mat rgb = frame();
  std::vector<uint8_t> bytes = frameBytes(convert_rgba ? rgbToRgba(rgb) : rgb);
  if (buffer.size() < bytes.size()) {
    throw BufferTooSmallError(bytes.size(), buffer.size());
  }
  std::copy(bytes.begin(), bytes.end(), buffer.begin());
  return bytes.size();
}

std::unique_ptr<Texture> NetworkCamera::frameTexture(
  GpuSurfaceInterface & surface, const std::string & label)
{
  return uploadFrameAsTexture(frame(), surface, label);
}

CameraFormat NetworkCamera::init()
{
  refreshCameraFormat();
  return format_;
}

void NetworkCamera::refreshCameraFormat()
{
  format_.resolution = device_->resolution();
  format_.frame_rate = frameRate();
  format_.format = FrameFormat::kRawRgb;
}

void NetworkCamera::setCameraFormat(const CameraFormat & format)
{
  setFrameFormat(format.format);
  setResolution(format.resolution);
  setFrameRate(format.frame_rate);
}

Resolution NetworkCamera::resolution() const
{
  return device_->resolution();
}

void NetworkCamera::setResolution(const Resolution & resolution)
{
  if (resolution == device_->resolution()) {
    return;
  }
  if (!device_->set(cv::CAP_PROP_FRAME_WIDTH, resolution.width) ||
    !device_->set(cv::CAP_PROP_FRAME_HEIGHT, resolution.height))
  {
    refreshCameraFormat();
    throw UnsupportedOperationError(
      "setResolution(" + std::to_string(resolution.width) + "x" +
      std::to_string(resolution.height) + ")");
  }
  refreshCameraFormat();
}

uint32_t NetworkCamera::frameRate() const
{
  double fps = device_->get(cv::CAP_PROP_FPS);
  return fps > 0.0 ? static_cast<uint32_t>(fps + 0.5) : 0;
}

void NetworkCamera::setFrameRate(uint32_t frame_rate)
{
  if (frame_rate == frameRate()) {
    return;
  }
  if (!device_->set(cv::CAP_PROP_FPS, frame_rate)) {
    throw UnsupportedOperationError("setFrameRate(" + std::to_string(frame_rate) + ")");
  }
  refreshCameraFormat();
}

void NetworkCamera::setFrameFormat(FrameFormat format)
{
  if (format != FrameFormat::kRawRgb) {
    throw UnsupportedOperationError(
      std::string("setFrameFormat(") + frameFormatName(format) + ")");
  }
}

std::map<Resolution, std::vector<uint32_t>> NetworkCamera::compatibleListByResolution(
  FrameFormat format)
{
  throw UnsupportedOperationError(
    std::string("compatibleListByResolution(") + frameFormatName(format) + ")");
}

std::vector<FrameFormat> NetworkCamera::compatibleFourcc()
{
  throw UnsupportedOperationError("compatibleFourcc");
}

CameraControl NetworkCamera::cameraControl(KnownCameraControl /*control*/) const
{
  throw UnsupportedOperationError("cameraControl");
}

std::vector<CameraControl> NetworkCamera::cameraControls() const
{
  throw UnsupportedOperationError("cameraControls");
}

void NetworkCamera::setCameraControl(
  KnownCameraControl /*control*/, const ControlValue & /*value*/)
{
  throw UnsupportedOperationError("setCameraControl");
}

}  // namespace ip_camera
