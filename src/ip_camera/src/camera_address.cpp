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


#include "ip_camera/camera_address.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace ip_camera
{

namespace
{

constexpr std::array<std::string_view, 7> kSupportedSchemes = {
  "rtsp", "rtsps", "rtmp", "http", "https", "udp", "tcp"};

std::string toLower(std::string_view text)
{
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
    [](unsigned char c) {return static_cast<char>(std::tolower(c));});
  return out;
}

std::optional<uint16_t> parsePort(std::string_view text)
{
  if (text.empty() || text.size() > 5) {
    return std::nullopt;
  }
  uint32_t value = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
    value = value * 10 + static_cast<uint32_t>(c - '0');
  }
  if (value == 0 || value > 65535) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(value);
}

}  // namespace

std::optional<CameraAddress> parseCameraAddress(const std::string & address)
{
  if (address.empty()) {
    return std::nullopt;
  }
  for (char c : address) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (std::isspace(uc) || std::iscntrl(uc)) {
      return std::nullopt;
    }
  }

  std::string_view text(address);
  auto scheme_end = text.find("://");
  if (scheme_end == std::string_view::npos || scheme_end == 0) {
    return std::nullopt;
  }

  CameraAddress result;
  result.scheme = toLower(text.substr(0, scheme_end));
  if (std::find(kSupportedSchemes.begin(), kSupportedSchemes.end(), result.scheme) ==
    kSupportedSchemes.end())
  {
    return std::nullopt;
  }

  std::string_view rest = text.substr(scheme_end + 3);
  auto path_start = rest.find_first_of("/?");
  std::string_view authority = rest.substr(0, path_start);
  if (path_start != std::string_view::npos) {
    result.path = std::string(rest.substr(path_start));
  }

  // Passwords may contain '@', so the host starts after the last one
  auto at = authority.rfind('@');
  if (at != std::string_view::npos) {
    std::string_view user_info = authority.substr(0, at);
    authority = authority.substr(at + 1);
    result.has_user_info = true;
    auto colon = user_info.find(':');
    if (colon == std::string_view::npos) {
      result.user = std::string(user_info);
    } else {
      result.user = std::string(user_info.substr(0, colon));
      result.password = std::string(user_info.substr(colon + 1));
    }
    if (result.user.empty() && result.password) {
      return std::nullopt;
    }
  }

  std::string_view port_text;
  if (!authority.empty() && authority.front() == '[') {
    auto close = authority.find(']');
    if (close == std::string_view::npos || close == 1) {
      return std::nullopt;
    }
    result.host = std::string(authority.substr(1, close - 1));
    std::string_view after = authority.substr(close + 1);
    if (!after.empty()) {
      if (after.front() != ':') {
        return std::nullopt;
      }
      port_text = after.substr(1);
      if (port_text.empty()) {
        return std::nullopt;
      }
    }
  } else {
    auto colon = authority.find(':');
    if (colon == std::string_view::npos) {
      result.host = std::string(authority);
    } else {
      result.host = std::string(authority.substr(0, colon));
      port_text = authority.substr(colon + 1);
      if (port_text.empty()) {
        return std::nullopt;
      }
    }
  }

  if (result.host.empty()) {
    return std::nullopt;
  }
  if (!port_text.empty()) {
    result.port = parsePort(port_text);
    if (!result.port) {
      return std::nullopt;
    }
  }
  return result;
}

bool isValidCameraAddress(const std::string & address)
{
  return parseCameraAddress(address).has_value();
}

std::string redactCameraAddress(const std::string & address)
{
  auto parsed = parseCameraAddress(address);
  if (!parsed) {
    return "<invalid address>";
  }

  std::string out = parsed->scheme + "://";
  if (parsed->has_user_info) {
    out += parsed->user;
    if (parsed->password) {
      out += ":***";
    }
    out += "@";
  }
  if (parsed->host.find(':') != std::string::npos) {
    out += "[" + parsed->host + "]";
  } else {
    out += parsed->host;
  }
  if (parsed->port) {
    out += ":" + std::to_string(*parsed->port);
  }
  out += parsed->path;
  return out;
}

}  // namespace ip_camera
