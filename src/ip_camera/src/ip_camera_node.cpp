#include <rclcpp/rclcpp.hpp>
#include "ip_camera/network_camera_publisher.hpp"

int main(int argc, char *argv[]) {
  rclcpp::init(argc, argv);
  auto node = std::make_shared<ip_camera::NetworkCameraPublisher>();
  node->init();
  rclcpp::spin(node);
  rclcpp::shutdown();
  return 0;
}
