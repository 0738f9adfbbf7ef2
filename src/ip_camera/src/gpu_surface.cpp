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


#include "ip_camera/gpu_surface.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "ip_camera/camera_errors.hpp"
#include "ip_camera/pixel_format.hpp"

namespace ip_camera
{

std::unique_ptr<Texture> uploadFrameAsTexture(
  const cv::Mat & rgb, GpuSurfaceInterface & surface, const std::string & label)
{
  // Validate before any call reaches the device
  if (rgb.cols <= 0 || rgb.rows <= 0) {
    throw UploadError(
      "Cannot upload a frame with a zero dimension (" + std::to_string(rgb.cols) + "x" +
      std::to_string(rgb.rows) + ")");
  }
  const uint64_t bytes_per_row = static_cast<uint64_t>(rgb.cols) * kRgbaChannels;
  if (bytes_per_row > std::numeric_limits<uint32_t>::max()) {
    throw UploadError("Frame row of " + std::to_string(bytes_per_row) + " bytes is too wide");
  }

  cv::Mat rgba;
  try {
    rgba = rgbToRgba(rgb);
  } catch (const std::invalid_argument & e) {
    throw UploadError(e.what());
  }
  std::vector<uint8_t> pixels = frameBytes(rgba);

  TextureDescriptor descriptor;
  descriptor.label = label;
  descriptor.size.width = static_cast<uint32_t>(rgba.cols);
  descriptor.size.height = static_cast<uint32_t>(rgba.rows);
  descriptor.size.depth_or_array_layers = 1;
  descriptor.mip_level_count = 1;
  descriptor.sample_count = 1;
  descriptor.dimension = TextureDimension::k2D;
  descriptor.format = TextureFormat::kRgba8UnormSrgb;
  descriptor.usage = kTextureBinding | kCopyDst;

  auto texture = surface.createTexture(descriptor);

  TextureDataLayout layout;
  layout.offset = 0;
  layout.bytes_per_row = static_cast<uint32_t>(bytes_per_row);
  layout.rows_per_image = descriptor.size.height;

  surface.writeTexture(*texture, pixels, layout, descriptor.size);
  return texture;
}

}  // namespace ip_camera
