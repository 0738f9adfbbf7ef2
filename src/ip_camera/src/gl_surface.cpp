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


#include "ip_camera/gl_surface.hpp"

#include <GL/glext.h>

#include <string>
#include <utility>

#include "ip_camera/camera_errors.hpp"

namespace ip_camera
{

namespace
{

void checkGlError(const char * what)
{
  GLenum err = glGetError();
  if (err != GL_NO_ERROR) {
    throw UploadError(std::string(what) + " failed with GL error " + std::to_string(err));
  }
}

}  // namespace

GlTexture::GlTexture(GLuint name, TextureDescriptor descriptor)
: name_(name), descriptor_(std::move(descriptor))
{
}

GlTexture::~GlTexture()
{
  if (name_ != 0) {
    glDeleteTextures(1, &name_);
  }
}

std::unique_ptr<Texture> GlSurface::createTexture(const TextureDescriptor & descriptor)
{
  if (descriptor.dimension != TextureDimension::k2D ||
    descriptor.size.depth_or_array_layers != 1)
  {
    throw UploadError("GlSurface only creates single-layer 2D textures");
  }
  if (descriptor.mip_level_count != 1 || descriptor.sample_count != 1) {
    throw UploadError("GlSurface only creates single-mip, single-sample textures");
  }
  if (descriptor.size.width == 0 || descriptor.size.height == 0) {
    throw UploadError("Texture dimensions must be non-zero");
  }

  // Clear stale errors so checkGlError() reports ours
  while (glGetError() != GL_NO_ERROR) {
  }

  GLuint name = 0;
  glGenTextures(1, &name);
  checkGlError("glGenTextures");
  auto texture = std::make_unique<GlTexture>(name, descriptor);

  glBindTexture(GL_TEXTURE_2D, name);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAX_LEVEL, 0);
  glTexImage2D(
    GL_TEXTURE_2D, 0, GL_SRGB8_ALPHA8,
    static_cast<GLsizei>(descriptor.size.width),
    static_cast<GLsizei>(descriptor.size.height),
    0, GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
  glBindTexture(GL_TEXTURE_2D, 0);
  checkGlError("glTexImage2D");

  return texture;
}

void GlSurface::writeTexture(
  Texture & texture, std::span<const uint8_t> data,
  const TextureDataLayout & layout, const Extent3d & size)
{
  auto * gl_texture = dynamic_cast<GlTexture *>(&texture);
  if (gl_texture == nullptr) {
    throw UploadError("Texture was not created by a GlSurface");
  }
  if (layout.bytes_per_row == 0 || layout.bytes_per_row % 4 != 0) {
    throw UploadError("bytes_per_row must be a non-zero multiple of 4");
  }
  const uint64_t row_bytes = static_cast<uint64_t>(size.width) * 4;
  if (row_bytes > layout.bytes_per_row) {
    throw UploadError(
      "bytes_per_row " + std::to_string(layout.bytes_per_row) + " is shorter than a " +
      std::to_string(size.width) + " pixel row");
  }
  if (size.width == 0 || size.height == 0) {
    throw UploadError("Write region must be non-empty");
  }
  // The last row only needs its pixels, not a full stride
  const uint64_t needed = layout.offset +
    static_cast<uint64_t>(layout.bytes_per_row) * (size.height - 1) + row_bytes;
  if (data.size() < needed) {
    throw UploadError(
      "Texture data holds " + std::to_string(data.size()) + " bytes, region needs " +
      std::to_string(needed));
  }
  if (size.width > texture.width() || size.height > texture.height()) {
    throw UploadError("Write region exceeds texture bounds");
  }

  while (glGetError() != GL_NO_ERROR) {
  }

  glBindTexture(GL_TEXTURE_2D, gl_texture->name());
  glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
  glPixelStorei(GL_UNPACK_ROW_LENGTH, static_cast<GLint>(layout.bytes_per_row / 4));
  glTexSubImage2D(
    GL_TEXTURE_2D, 0, 0, 0,
    static_cast<GLsizei>(size.width), static_cast<GLsizei>(size.height),
    GL_RGBA, GL_UNSIGNED_BYTE, data.data() + layout.offset);
  glPixelStorei(GL_UNPACK_ROW_LENGTH, 0);
  glPixelStorei(GL_UNPACK_ALIGNMENT, 4);
  glBindTexture(GL_TEXTURE_2D, 0);
  checkGlError("glTexSubImage2D");
}

}  // namespace ip_camera
