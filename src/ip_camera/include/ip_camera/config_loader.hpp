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


#ifndef IP_CAMERA__CONFIG_LOADER_HPP_
#define IP_CAMERA__CONFIG_LOADER_HPP_

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ip_camera
{

// Upper bound applied to frame_rate when loading
constexpr int kMaxFrameRate = 1000;

/**
 * @brief Network camera configuration parameters
 */
struct NetworkCameraConfig
{
  std::string address;
  std::string api_preference;
  std::string topic_name;
  int frame_rate;
  int max_consecutive_failures;

  // Default constructor with sensible defaults
  NetworkCameraConfig()
  : api_preference("FFMPEG"),
    topic_name("camera/image_raw"),
    frame_rate(30),
    max_consecutive_failures(30)
  {
  }
};

/**
 * @brief Configuration loader for network cameras
 *
 * Loads camera definitions from config/network_cameras.json in the ip_camera
 * package share directory. The file is parsed once and cached.
 */
class ConfigLoader
{
public:
  /**
   * @brief Get camera configuration by name
   * @param camera_name Key under "network_cameras"
   * @return Camera configuration if found, std::nullopt otherwise
   */
  static std::optional<NetworkCameraConfig> getCameraConfig(const std::string & camera_name);

  /**
   * @brief Names of every valid camera entry, sorted
   */
  static std::vector<std::string> getCameraNames();

  /**
   * @brief Convert API preference string to OpenCV API code
   * @param api_str API preference string (e.g., "FFMPEG", "GSTREAMER", "ANY")
   * @return OpenCV API preference code, cv::CAP_FFMPEG for unknown strings
   */
  static int apiStringToCode(const std::string & api_str);

  /**
   * @brief Force reload of configuration (useful for testing)
   */
  static void reloadConfig();

  /**
   * @brief Set custom config file path (for testing)
   */
  static void setConfigFilePath(const std::string & path);

private:
  static bool loadConfig();
  static std::string getConfigFilePath();

  static bool config_loaded_;
  static std::map<std::string, NetworkCameraConfig> camera_configs_;
  static std::string custom_config_path_;
};

}  // namespace ip_camera

#endif  // IP_CAMERA__CONFIG_LOADER_HPP_
