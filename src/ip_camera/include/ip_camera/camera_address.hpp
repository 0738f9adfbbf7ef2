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


#ifndef IP_CAMERA__CAMERA_ADDRESS_HPP_
#define IP_CAMERA__CAMERA_ADDRESS_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace ip_camera
{

/**
 * @brief Components of a network camera stream URL
 *
 * scheme://[user[:password]@]host[:port][/path]
 *
 * The user-info part may be empty ("udp://@239.0.0.1:1234" is the multicast
 * listen form), but a password always needs a user.
 */
struct CameraAddress
{
  std::string scheme;
  bool has_user_info = false;
  std::string user;
  std::optional<std::string> password;
  std::string host;
  std::optional<uint16_t> port;
  std::string path;
};

/**
 * @brief Split a stream URL into its components
 * @param address Text such as "rtsp://admin:pw@10.0.0.5:554/stream1"
 * @return Parsed address, or std::nullopt if the text is not a usable camera URL
 */
std::optional<CameraAddress> parseCameraAddress(const std::string & address);

bool isValidCameraAddress(const std::string & address);

/**
 * @brief Copy of the address with any password replaced by "***"
 *
 * Text that does not parse is returned as "<invalid address>" so that
 * malformed input containing credentials is never echoed.
 */
std::string redactCameraAddress(const std::string & address);

}  // namespace ip_camera

#endif  // IP_CAMERA__CAMERA_ADDRESS_HPP_
