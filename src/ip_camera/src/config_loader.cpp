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


#include "ip_camera/config_loader.hpp"

#include <ament_index_cpp/get_package_share_directory.hpp>
#include <nlohmann/json.hpp>
#include <opencv2/videoio.hpp>

#include <cstdint>
#include <fstream>
#include <iostream>

#include "ip_camera/camera_address.hpp"

using json = nlohmann::json;

namespace ip_camera
{

bool ConfigLoader::config_loaded_ = false;
std::map<std::string, NetworkCameraConfig> ConfigLoader::camera_configs_;
std::string ConfigLoader::custom_config_path_ = "";

std::string ConfigLoader::getConfigFilePath()
{
  if (!custom_config_path_.empty()) {
    return custom_config_path_;
  }

  try {
    std::string package_share_directory =
      ament_index_cpp::get_package_share_directory("ip_camera");
    return package_share_directory + "/config/network_cameras.json";
  } catch (const std::exception & e) {
    std::cerr << "Error finding ip_camera package: " << e.what() << std::endl;
    return "";
  }
}

bool ConfigLoader::loadConfig()
{
  if (config_loaded_) {
    return true;
  }

  std::string config_path = getConfigFilePath();
  if (config_path.empty()) {
    std::cerr << "Could not find network camera config file path" << std::endl;
    return false;
  }

  std::ifstream file(config_path);
  if (!file.is_open()) {
    std::cerr << "Could not open network camera config file: " << config_path << std::endl;
    return false;
  }

  json root;
  try {
    file >> root;
  } catch (const json::parse_error & e) {
    std::cerr << "JSON parse error: " << e.what() << std::endl;
    return false;
  }

  if (root.contains("network_cameras") && root["network_cameras"].is_object()) {
    for (const auto & [name, camera_obj] : root["network_cameras"].items()) {
      if (!camera_obj.is_object()) {
        continue;
      }

      bool has_required =
        camera_obj.contains("address") && camera_obj["address"].is_string() &&
        camera_obj.contains("api_preference") && camera_obj["api_preference"].is_string();
      if (!has_required) {
        std::cerr << "Skipping camera '" << name << "': missing address or api_preference"
                  << std::endl;
        continue;
      }

      NetworkCameraConfig config;
      config.address = camera_obj["address"];
      config.api_preference = camera_obj["api_preference"];
      if (!isValidCameraAddress(config.address)) {
        std::cerr << "Skipping camera '" << name << "': invalid address "
                  << redactCameraAddress(config.address) << std::endl;
        continue;
      }

      if (camera_obj.contains("topic_name") && camera_obj["topic_name"].is_string()) {
        config.topic_name = camera_obj["topic_name"];
      }
      if (camera_obj.contains("frame_rate") && camera_obj["frame_rate"].is_number_integer() &&
        camera_obj["frame_rate"].get<int64_t>() > 0)
      {
        int64_t frame_rate = camera_obj["frame_rate"].get<int64_t>();
        if (frame_rate > kMaxFrameRate) {
          std::cerr << "Camera '" << name << "': frame_rate " << frame_rate
                    << " clamped to " << kMaxFrameRate << std::endl;
          frame_rate = kMaxFrameRate;
        }
        config.frame_rate = static_cast<int>(frame_rate);
      }
      if (camera_obj.contains("max_consecutive_failures") &&
        camera_obj["max_consecutive_failures"].is_number_integer() &&
        camera_obj["max_consecutive_failures"].get<int>() > 0)
      {
        config.max_consecutive_failures = camera_obj["max_consecutive_failures"];
      }

      camera_configs_[name] = config;
    }
  }

  config_loaded_ = true;
  return true;
}

std::optional<NetworkCameraConfig> ConfigLoader::getCameraConfig(const std::string & camera_name)
{
  if (!loadConfig()) {
    return std::nullopt;
  }

  auto it = camera_configs_.find(camera_name);
  if (it != camera_configs_.end()) {
    return it->second;
  }

  return std::nullopt;
}

std::vector<std::string> ConfigLoader::getCameraNames()
{
  std::vector<std::string> names;
  if (!loadConfig()) {
    return names;
  }
  for (const auto & [name, config] : camera_configs_) {
    names.push_back(name);
  }
  return names;
}

int ConfigLoader::apiStringToCode(const std::string & api_str)
{
  if (api_str == "ANY") {
    return cv::CAP_ANY;
  } else if (api_str == "GSTREAMER") {
    return cv::CAP_GSTREAMER;
  } else if (api_str == "FFMPEG") {
    return cv::CAP_FFMPEG;
  }

  // Network streams decode best through FFmpeg
  return cv::CAP_FFMPEG;
}

void ConfigLoader::reloadConfig()
{
  config_loaded_ = false;
  camera_configs_.clear();
}

void ConfigLoader::setConfigFilePath(const std::string & path)
{
  custom_config_path_ = path;
  reloadConfig();
}

}  // namespace ip_camera
