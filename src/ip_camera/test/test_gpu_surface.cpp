#include <gtest/gtest.h>
#include <opencv2/opencv.hpp>
#include <memory>

#include "ip_camera/camera_errors.hpp"
#include "ip_camera/gpu_surface.hpp"
#include "ip_camera/network_camera.hpp"
#include "mock_capture_device.hpp"
#include "mock_gpu_surface.hpp"

using namespace ip_camera;

class GpuSurfaceTest : public ::testing::Test {
 protected:
  cv::Mat createTestFrame(int width, int height) {
    cv::Mat frame(height, width, CV_8UC3, cv::Scalar(10, 20, 30));
    return frame;
  }

  MockGpuSurface surface_;
};

TEST_F(GpuSurfaceTest, UploadCreatesMatchingTexture) {
  auto texture = uploadFrameAsTexture(createTestFrame(64, 48), surface_, "front_gate");

  ASSERT_NE(texture, nullptr);
  EXPECT_EQ(texture->width(), 64u);
  EXPECT_EQ(texture->height(), 48u);
  EXPECT_EQ(surface_.getCreateCallCount(), 1);
  EXPECT_EQ(surface_.getWriteCallCount(), 1);

  const auto& desc = surface_.getLastDescriptor();
  EXPECT_EQ(desc.label, "front_gate");
  EXPECT_EQ(desc.size.depth_or_array_layers, 1u);
  EXPECT_EQ(desc.mip_level_count, 1u);
  EXPECT_EQ(desc.sample_count, 1u);
  EXPECT_EQ(desc.dimension, TextureDimension::k2D);
  EXPECT_EQ(desc.format, TextureFormat::kRgba8UnormSrgb);
  EXPECT_EQ(desc.usage, static_cast<uint32_t>(kTextureBinding | kCopyDst));
}

TEST_F(GpuSurfaceTest, UploadWritesRgbaRows) {
  auto texture = uploadFrameAsTexture(createTestFrame(5, 3), surface_);

  EXPECT_EQ(surface_.getLastLayout().offset, 0u);
  EXPECT_EQ(surface_.getLastLayout().bytes_per_row, 20u);
  EXPECT_EQ(surface_.getLastLayout().rows_per_image, 3u);
  EXPECT_EQ(surface_.getLastSize().width, 5u);
  EXPECT_EQ(surface_.getLastSize().height, 3u);

  const auto& contents = dynamic_cast<MockTexture&>(*texture).contents;
  ASSERT_EQ(contents.size(), 60u);
  EXPECT_EQ(contents[0], 10);
  EXPECT_EQ(contents[1], 20);
  EXPECT_EQ(contents[2], 30);
  EXPECT_EQ(contents[3], 255);
}

/**
 * Zero-sized frames fail validation before the surface is touched.
 */
TEST_F(GpuSurfaceTest, ZeroDimensionIsRejectedBeforeAllocation) {
  EXPECT_THROW(uploadFrameAsTexture(cv::Mat(), surface_), UploadError);
  EXPECT_THROW(uploadFrameAsTexture(cv::Mat(0, 16, CV_8UC3), surface_), UploadError);
  EXPECT_THROW(uploadFrameAsTexture(cv::Mat(16, 0, CV_8UC3), surface_), UploadError);

  EXPECT_EQ(surface_.getCreateCallCount(), 0);
  EXPECT_EQ(surface_.getWriteCallCount(), 0);
}

TEST_F(GpuSurfaceTest, NonRgbFrameIsRejected) {
  cv::Mat gray = cv::Mat::zeros(4, 4, CV_8UC1);

  EXPECT_THROW(uploadFrameAsTexture(gray, surface_), UploadError);
  EXPECT_EQ(surface_.getCreateCallCount(), 0);
}

TEST_F(GpuSurfaceTest, CameraFrameTexture) {
  MockDeviceFactory factory;
  factory.setDefaultFrame(createTestFrame(8, 6));
  NetworkCamera camera("rtsp://10.7.66.20/stream1", factory.factory());
  camera.openStream();

  auto texture = camera.frameTexture(surface_, "cam");

  EXPECT_EQ(texture->width(), 8u);
  EXPECT_EQ(texture->height(), 6u);
  // The device delivers BGR (10, 20, 30), so the texture holds RGB (30, 20, 10)
  const auto& contents = dynamic_cast<MockTexture&>(*texture).contents;
  ASSERT_EQ(contents.size(), 8u * 6u * 4u);
  EXPECT_EQ(contents[0], 30);
  EXPECT_EQ(contents[1], 20);
  EXPECT_EQ(contents[2], 10);
  EXPECT_EQ(contents[3], 255);
}

TEST_F(GpuSurfaceTest, CameraFrameTextureNeedsOpenStream) {
  MockDeviceFactory factory;
  NetworkCamera camera("rtsp://10.7.66.20/stream1", factory.factory());

  EXPECT_THROW(camera.frameTexture(surface_), CaptureError);
  EXPECT_EQ(surface_.getCreateCallCount(), 0);
}
