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


#ifndef IP_CAMERA__GPU_SURFACE_HPP_
#define IP_CAMERA__GPU_SURFACE_HPP_

#include <opencv2/opencv.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace ip_camera
{

struct Extent3d
{
  uint32_t width = 0;
  uint32_t height = 0;
  uint32_t depth_or_array_layers = 1;
};

enum class TextureDimension
{
  k1D,
  k2D,
  k3D,
};

enum class TextureFormat
{
  // 8 bits per channel RGBA, sampled with sRGB to linear conversion
  kRgba8UnormSrgb,
};

enum TextureUsage : uint32_t
{
  kCopySrc = 1u << 0,
  kCopyDst = 1u << 1,
  kTextureBinding = 1u << 2,
};

struct TextureDescriptor
{
  std::string label;
  Extent3d size;
  uint32_t mip_level_count = 1;
  uint32_t sample_count = 1;
  TextureDimension dimension = TextureDimension::k2D;
  TextureFormat format = TextureFormat::kRgba8UnormSrgb;
  uint32_t usage = kTextureBinding | kCopyDst;
};

/**
 * @brief Layout of host pixel data handed to writeTexture()
 */
struct TextureDataLayout
{
  uint64_t offset = 0;
  uint32_t bytes_per_row = 0;
  uint32_t rows_per_image = 0;
};

/**
 * @brief A device-side image owned by the caller
 */
class Texture
{
public:
  virtual ~Texture() = default;

  virtual const TextureDescriptor & descriptor() const = 0;

  uint32_t width() const {return descriptor().size.width;}
  uint32_t height() const {return descriptor().size.height;}
};

/**
 * @brief Abstract interface over a GPU device and its upload queue
 */
class GpuSurfaceInterface
{
public:
  virtual ~GpuSurfaceInterface() = default;

  /**
   * @brief Allocate an uninitialized texture
   * @throws UploadError if the device rejects the descriptor
   */
  virtual std::unique_ptr<Texture> createTexture(const TextureDescriptor & descriptor) = 0;

  /**
   * @brief Copy host pixels into a region of a texture starting at its origin
   * @throws UploadError if the device reports a failure
   */
  virtual void writeTexture(
    Texture & texture, std::span<const uint8_t> data,
    const TextureDataLayout & layout, const Extent3d & size) = 0;
};

/**
 * @brief Convert an RGB frame to RGBA and upload it into a new texture
 *
 * The texture is 2D, single mip level, single sample, kRgba8UnormSrgb, and usable
 * as a sampling source and copy destination. Rows are written with a stride of
 * 4 * width bytes.
 *
 * @param rgb CV_8UC3 frame
 * @param surface Device to allocate on
 * @param label Debug label attached to the texture
 * @throws UploadError if width or height is zero; no texture is created then
 */
std::unique_ptr<Texture> uploadFrameAsTexture(
  const cv::Mat & rgb, GpuSurfaceInterface & surface, const std::string & label = "");

}  // namespace ip_camera

#endif  // IP_CAMERA__GPU_SURFACE_HPP_
