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


#include "ip_camera/network_camera_publisher.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <utility>

#include "ip_camera/camera_errors.hpp"

namespace ip_camera {

NetworkCameraPublisher::NetworkCameraPublisher() : Node("network_camera_publisher") {
  this->declare_parameter<std::string>("camera_name", "front_gate");
  camera_name_ = this->get_parameter("camera_name").as_string();

  this->declare_parameter<std::string>("frame_id", "camera_frame");
  frame_id_ = this->get_parameter("frame_id").as_string();

  auto config_opt = ConfigLoader::getCameraConfig(camera_name_);
  if (!config_opt.has_value()) {
    RCLCPP_ERROR(this->get_logger(), "No config found for camera: %s", camera_name_.c_str());
    throw std::runtime_error("Network camera configuration not found: " + camera_name_);
  }
  config_ = config_opt.value();
  RCLCPP_INFO(this->get_logger(), "Loaded config for camera: %s", camera_name_.c_str());

  int api_preference = ConfigLoader::apiStringToCode(config_.api_preference);
  camera_ = std::make_unique<NetworkCamera>(config_.address, api_preference);
  camera_->openStream();

  RCLCPP_INFO(this->get_logger(), "API Preference: %s", config_.api_preference.c_str());
  logCameraFormat();

  last_fps_time_ = this->now();
}

NetworkCameraPublisher::NetworkCameraPublisher(std::unique_ptr<NetworkCamera> camera,
                                               const NetworkCameraConfig& config)
    : Node("network_camera_publisher"), camera_(std::move(camera)), config_(config) {
  this->declare_parameter<std::string>("camera_name", "TEST_CAMERA");
  this->declare_parameter<std::string>("frame_id", "camera_frame");
  camera_name_ = this->get_parameter("camera_name").as_string();
  frame_id_ = this->get_parameter("frame_id").as_string();

  if (!camera_) {
    throw std::invalid_argument("NetworkCameraPublisher requires a camera");
  }
  if (!camera_->isStreamOpen()) {
    camera_->openStream();
  }

  RCLCPP_INFO(this->get_logger(), "Network camera publisher initialized with injected camera");
  logCameraFormat();

  last_fps_time_ = this->now();
}

void NetworkCameraPublisher::init() {
  // This can't be in the constructor because of the call to shared_from_this.
  it_ = std::make_shared<image_transport::ImageTransport>(shared_from_this());

  auto qos = rclcpp::QoS(1)              // Queue depth of 1 for low latency
                 .best_effort()          // Use best effort for lower latency
                 .durability_volatile();  // No need to store messages

  publisher_ = it_->advertise(config_.topic_name, qos.get_rmw_qos_profile());

  // Poll at twice the stream rate so a new frame is picked up promptly
  const int64_t frame_rate = std::max(config_.frame_rate, 1);
  auto period = std::chrono::microseconds(std::max<int64_t>(1, 1000000 / (2 * frame_rate)));
  timer_ = this->create_wall_timer(period,
                                   std::bind(&NetworkCameraPublisher::timerCallback, this));

  RCLCPP_INFO(this->get_logger(), "Publishing on Topic: '%s'", config_.topic_name.c_str());
}

void NetworkCameraPublisher::timerCallback() {
  cv::Mat frame;
  try {
    frame = camera_->frame();
  } catch (const CaptureError& e) {
    consecutive_read_failures_++;
    RCLCPP_WARN_THROTTLE(this->get_logger(), *this->get_clock(), 1000,
                         "Failed to capture frame from %s: %s",
                         camera_->cameraInfo().misc.c_str(), e.what());
    if (consecutive_read_failures_ ==
        static_cast<size_t>(config_.max_consecutive_failures)) {
      RCLCPP_ERROR(this->get_logger(), "%zu consecutive capture failures on %s",
                   consecutive_read_failures_, camera_->cameraInfo().misc.c_str());
    }
    return;
  }
  consecutive_read_failures_ = 0;

  // Timestamp immediately after frame capture
  rclcpp::Time capture_time = this->now();

  auto msg = cv_bridge::CvImage(std_msgs::msg::Header(), "rgb8", frame).toImageMsg();
  msg->header.stamp = capture_time;
  msg->header.frame_id = frame_id_;

  frame_count_++;
  if (frame_count_ % 100 == 0) {
    auto current_time = this->now();
    double fps = 100.0 / (current_time - last_fps_time_).seconds();
    RCLCPP_DEBUG(this->get_logger(), "Camera stats - FPS: %.1f", fps);
    last_fps_time_ = current_time;
  }

  publisher_.publish(msg);
}

void NetworkCameraPublisher::logCameraFormat() {
  CameraFormat format = camera_->init();
  RCLCPP_INFO(this->get_logger(), "Camera: %s (%s)", camera_->cameraInfo().human_name.c_str(),
              camera_->cameraInfo().misc.c_str());
  RCLCPP_INFO(this->get_logger(), "Actual: %ux%u @ %u fps, Format: %s",
              format.resolution.width, format.resolution.height, format.frame_rate,
              frameFormatName(format.format));
  if (format.frame_rate != 0 && format.frame_rate != static_cast<uint32_t>(config_.frame_rate)) {
    RCLCPP_WARN(this->get_logger(), "Camera FPS differs: configured %d, stream %u",
                config_.frame_rate, format.frame_rate);
  }
}

}  // namespace ip_camera
