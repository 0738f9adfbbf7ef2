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


#ifndef IP_CAMERA__NETWORK_CAMERA_PUBLISHER_HPP_
#define IP_CAMERA__NETWORK_CAMERA_PUBLISHER_HPP_

#include <cv_bridge/cv_bridge.h>

#include <image_transport/image_transport.hpp>
#include <memory>
#include <rclcpp/rclcpp.hpp>
#include <sensor_msgs/msg/image.hpp>
#include <string>

#include "ip_camera/config_loader.hpp"
#include "ip_camera/network_camera.hpp"

namespace ip_camera {

class NetworkCameraPublisher : public rclcpp::Node {
 public:
  // Constructor for production use (connects to the configured camera)
  NetworkCameraPublisher();

  // Constructor for testing (accepts an injected camera)
  NetworkCameraPublisher(std::unique_ptr<NetworkCamera> camera,
                         const NetworkCameraConfig& config);

  ~NetworkCameraPublisher() override = default;

  void init();

  size_t consecutiveFailures() const { return consecutive_read_failures_; }

 private:
  void timerCallback();
  void logCameraFormat();

  std::unique_ptr<NetworkCamera> camera_;
  NetworkCameraConfig config_;
  rclcpp::TimerBase::SharedPtr timer_;

  std::shared_ptr<image_transport::ImageTransport> it_;
  image_transport::Publisher publisher_;

  std::string camera_name_;
  std::string frame_id_;
  size_t consecutive_read_failures_ = 0;

  // Performance monitoring
  int frame_count_ = 0;
  rclcpp::Time last_fps_time_;
};

}  // namespace ip_camera

#endif  // IP_CAMERA__NETWORK_CAMERA_PUBLISHER_HPP_
