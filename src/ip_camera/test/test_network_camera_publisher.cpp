#include <gtest/gtest.h>
#include <rclcpp/rclcpp.hpp>
#include <sensor_msgs/msg/image.hpp>
#include <cv_bridge/cv_bridge.h>
#include <opencv2/opencv.hpp>
#include <chrono>
#include <limits>
#include <memory>
#include <set>

#include "ip_camera/camera_errors.hpp"
#include "ip_camera/network_camera_publisher.hpp"
#include "mock_capture_device.hpp"

using ip_camera::NetworkCamera;
using ip_camera::NetworkCameraPublisher;

class NetworkCameraPublisherTest : public ::testing::Test {
 protected:
  void SetUp() override {
    rclcpp::init(0, nullptr);
    config_.address = "rtsp://10.7.66.20:554/stream1";
    config_.topic_name = "camera/image_raw";
    config_.frame_rate = 50;
    config_.max_consecutive_failures = 5;
  }

  void TearDown() override {
    rclcpp::shutdown();
  }

  // Helper function to create a BGR test frame with a filled circle
  cv::Mat createTestFrame(const cv::Scalar& bgr_color, int width = 320, int height = 240) {
    cv::Mat frame = cv::Mat::zeros(height, width, CV_8UC3);
    cv::circle(frame, cv::Point(width / 2, height / 2), 40, bgr_color, -1);
    return frame;
  }

  std::unique_ptr<NetworkCamera> createCamera() {
    return std::make_unique<NetworkCamera>(config_.address, factory_.factory());
  }

  rclcpp::QoS createMatchingQoS(size_t depth = 1) {
    return rclcpp::QoS(depth).best_effort().durability_volatile();
  }

  MockDeviceFactory factory_;
  ip_camera::NetworkCameraConfig config_;
};

/**
 * The publisher opens the stream of an injected camera that is not yet
 * streaming.
 */
TEST_F(NetworkCameraPublisherTest, ConstructorOpensStream) {
  auto camera = createCamera();
  auto* device = factory_.latest();

  auto publisher = std::make_shared<NetworkCameraPublisher>(std::move(camera), config_);
  publisher->init();

  EXPECT_EQ(device->getOpenStreamCallCount(), 1);
  EXPECT_TRUE(device->isStreaming());
}

TEST_F(NetworkCameraPublisherTest, StreamOpenFailureThrows) {
  auto camera = createCamera();
  factory_.latest()->setOpenStreamFailure(true);

  EXPECT_THROW({
    auto publisher = std::make_shared<NetworkCameraPublisher>(std::move(camera), config_);
  }, ip_camera::StreamError);
}

/**
 * Frames are published as rgb8 with the channel order fixed up.
 */
TEST_F(NetworkCameraPublisherTest, PublishesRgbFrames) {
  // Blue in BGR
  factory_.setDefaultFrame(createTestFrame(cv::Scalar(255, 0, 0)));
  auto publisher = std::make_shared<NetworkCameraPublisher>(createCamera(), config_);
  publisher->init();

  sensor_msgs::msg::Image::SharedPtr received_msg;
  auto subscription = publisher->create_subscription<sensor_msgs::msg::Image>(
      config_.topic_name, createMatchingQoS(),
      [&received_msg](const sensor_msgs::msg::Image::SharedPtr msg) {
        received_msg = msg;
      });

  auto executor = rclcpp::executors::SingleThreadedExecutor();
  executor.add_node(publisher);

  auto start_time = std::chrono::steady_clock::now();
  while (!received_msg &&
         std::chrono::steady_clock::now() - start_time < std::chrono::seconds(2)) {
    executor.spin_some(std::chrono::milliseconds(10));
  }

  ASSERT_NE(received_msg, nullptr);
  EXPECT_EQ(received_msg->encoding, "rgb8");
  EXPECT_EQ(received_msg->width, 320u);
  EXPECT_EQ(received_msg->height, 240u);
  EXPECT_EQ(received_msg->header.frame_id, "camera_frame");

  cv::Mat received_frame = cv_bridge::toCvCopy(received_msg, "rgb8")->image;
  cv::Vec3b center_pixel = received_frame.at<cv::Vec3b>(120, 160);
  EXPECT_LT(center_pixel[0], 50);   // Red channel should be low
  EXPECT_LT(center_pixel[1], 50);   // Green channel should be low
  EXPECT_GT(center_pixel[2], 200);  // Blue channel should be high
  EXPECT_EQ(publisher->consecutiveFailures(), 0u);
}

/**
 * Read failures are counted and nothing is published.
 */
TEST_F(NetworkCameraPublisherTest, HandleReadFailure) {
  auto camera = createCamera();
  auto* device = factory_.latest();
  device->setReadFailure(true);

  auto publisher = std::make_shared<NetworkCameraPublisher>(std::move(camera), config_);
  publisher->init();

  sensor_msgs::msg::Image::SharedPtr received_msg;
  auto subscription = publisher->create_subscription<sensor_msgs::msg::Image>(
      config_.topic_name, createMatchingQoS(),
      [&received_msg](const sensor_msgs::msg::Image::SharedPtr msg) {
        received_msg = msg;
      });

  auto executor = rclcpp::executors::SingleThreadedExecutor();
  executor.add_node(publisher);

  auto start_time = std::chrono::steady_clock::now();
  while (std::chrono::steady_clock::now() - start_time < std::chrono::milliseconds(500)) {
    executor.spin_some(std::chrono::milliseconds(10));
  }

  EXPECT_EQ(received_msg, nullptr);
  EXPECT_GT(device->getReadCallCount(), 10);
  EXPECT_GT(publisher->consecutiveFailures(), 10u);

  // Recovery resets the failure streak
  device->setReadFailure(false);
  start_time = std::chrono::steady_clock::now();
  while (!received_msg &&
         std::chrono::steady_clock::now() - start_time < std::chrono::seconds(2)) {
    executor.spin_some(std::chrono::milliseconds(10));
  }
  ASSERT_NE(received_msg, nullptr);
  EXPECT_EQ(publisher->consecutiveFailures(), 0u);
}

/**
 * A backend that throws instead of returning false is treated like any other
 * read failure and the node keeps running.
 */
TEST_F(NetworkCameraPublisherTest, BackendExceptionCountsAsReadFailure) {
  auto camera = createCamera();
  auto* device = factory_.latest();
  device->setSyntheticFrame(createTestFrame(cv::Scalar(0, 0, 255)));
  device->setReadThrows(true);

  auto publisher = std::make_shared<NetworkCameraPublisher>(std::move(camera), config_);
  publisher->init();

  sensor_msgs::msg::Image::SharedPtr received_msg;
  auto subscription = publisher->create_subscription<sensor_msgs::msg::Image>(
      config_.topic_name, createMatchingQoS(),
      [&received_msg](const sensor_msgs::msg::Image::SharedPtr msg) {
        received_msg = msg;
      });

  auto executor = rclcpp::executors::SingleThreadedExecutor();
  executor.add_node(publisher);

  auto start_time = std::chrono::steady_clock::now();
  while (std::chrono::steady_clock::now() - start_time < std::chrono::milliseconds(200)) {
    EXPECT_NO_THROW(executor.spin_some(std::chrono::milliseconds(10)));
  }
  EXPECT_EQ(received_msg, nullptr);
  EXPECT_GT(publisher->consecutiveFailures(), 0u);

  device->setReadThrows(false);
  start_time = std::chrono::steady_clock::now();
  while (!received_msg &&
         std::chrono::steady_clock::now() - start_time < std::chrono::seconds(2)) {
    executor.spin_some(std::chrono::milliseconds(10));
  }
  ASSERT_NE(received_msg, nullptr);
  EXPECT_EQ(publisher->consecutiveFailures(), 0u);
}

/**
 * Frame rates too high for a whole-microsecond half period still get a
 * running timer.
 */
TEST_F(NetworkCameraPublisherTest, ExtremeFrameRateStillPolls) {
  config_.frame_rate = std::numeric_limits<int>::max();
  auto camera = createCamera();
  auto* device = factory_.latest();

  auto publisher = std::make_shared<NetworkCameraPublisher>(std::move(camera), config_);
  ASSERT_NO_THROW(publisher->init());

  auto executor = rclcpp::executors::SingleThreadedExecutor();
  executor.add_node(publisher);

  int reads_before = device->getReadCallCount();
  auto start_time = std::chrono::steady_clock::now();
  while (device->getReadCallCount() == reads_before &&
         std::chrono::steady_clock::now() - start_time < std::chrono::seconds(2)) {
    executor.spin_some(std::chrono::milliseconds(10));
  }
  EXPECT_GT(device->getReadCallCount(), reads_before);
}

/**
 * Test that a sequence of frames is published in order.
 */
TEST_F(NetworkCameraPublisherTest, MultipleFrameSequence) {
  auto camera = createCamera();
  std::vector<cv::Mat> frame_sequence;
  frame_sequence.push_back(createTestFrame(cv::Scalar(255, 0, 0)));  // Blue
  frame_sequence.push_back(createTestFrame(cv::Scalar(0, 255, 0)));  // Green
  frame_sequence.push_back(createTestFrame(cv::Scalar(0, 0, 255)));  // Red
  factory_.latest()->setSyntheticFrames(frame_sequence);

  auto publisher = std::make_shared<NetworkCameraPublisher>(std::move(camera), config_);

  std::set<std::string> unique_colors_seen;
  auto subscription = publisher->create_subscription<sensor_msgs::msg::Image>(
      config_.topic_name, createMatchingQoS(10),
      [&unique_colors_seen](const sensor_msgs::msg::Image::SharedPtr msg) {
        cv::Mat frame = cv_bridge::toCvCopy(msg, "rgb8")->image;
        cv::Vec3b center_pixel = frame.at<cv::Vec3b>(120, 160);

        if (center_pixel[2] > 200 && center_pixel[0] < 50 && center_pixel[1] < 50) {
          unique_colors_seen.insert("blue");
        } else if (center_pixel[1] > 200 && center_pixel[0] < 50 && center_pixel[2] < 50) {
          unique_colors_seen.insert("green");
        } else if (center_pixel[0] > 200 && center_pixel[1] < 50 && center_pixel[2] < 50) {
          unique_colors_seen.insert("red");
        }
      });

  publisher->init();

  auto executor = rclcpp::executors::SingleThreadedExecutor();
  executor.add_node(publisher);

  auto start_time = std::chrono::steady_clock::now();
  while (unique_colors_seen.size() < 3 &&
         std::chrono::steady_clock::now() - start_time < std::chrono::seconds(2)) {
    executor.spin_some(std::chrono::milliseconds(5));
  }

  EXPECT_EQ(unique_colors_seen.size(), 3u);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
