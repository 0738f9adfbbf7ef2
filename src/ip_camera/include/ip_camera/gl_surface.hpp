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


#ifndef IP_CAMERA__GL_SURFACE_HPP_
#define IP_CAMERA__GL_SURFACE_HPP_

#include <GL/gl.h>

#include <memory>
#include <span>

#include "ip_camera/gpu_surface.hpp"

namespace ip_camera
{

/**
 * @brief Texture backed by an OpenGL texture name
 *
 * The name is deleted when the object is destroyed, so the context it was
 * created in must still be current at that point.
 */
class GlTexture : public Texture
{
public:
  GlTexture(GLuint name, TextureDescriptor descriptor);
  ~GlTexture() override;

  GlTexture(const GlTexture &) = delete;
  GlTexture & operator=(const GlTexture &) = delete;

  const TextureDescriptor & descriptor() const override {return descriptor_;}
  GLuint name() const {return name_;}

private:
  GLuint name_;
  TextureDescriptor descriptor_;
};

/**
 * @brief GpuSurfaceInterface on the OpenGL context current on the calling thread
 *
 * Only 2D, single-sample, single-mip kRgba8UnormSrgb textures are supported.
 */
class GlSurface : public GpuSurfaceInterface
{
public:
  GlSurface() = default;
  ~GlSurface() override = default;

  std::unique_ptr<Texture> createTexture(const TextureDescriptor & descriptor) override;
  void writeTexture(
    Texture & texture, std::span<const uint8_t> data,
    const TextureDataLayout & layout, const Extent3d & size) override;
};

}  // namespace ip_camera

#endif  // IP_CAMERA__GL_SURFACE_HPP_
