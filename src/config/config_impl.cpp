// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */
#include "config/config_impl.hpp"

#include <absl/flags/flag.h>
#include <stdint.h>

#include "config/config_core.hpp"
#include "config/config_export.hpp"
#include "config/config_impl_local.hpp"
#include "core/logging.hpp"
#include "crypto/crypter_export.hpp"

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace config {

namespace {

template <typename T>
std::string to_masked_string(T value, bool is_masked);

template <>
std::string to_masked_string(std::string value, bool is_masked) {
  if (value.empty()) {
    value = "(nil)"s;
  }
  std::string mask_value = value;
  if (is_masked) {
    mask_value = std::string(mask_value.size(), '*');
  }
  return mask_value;
}

template <>
std::string to_masked_string(std::string_view value, bool is_masked) {
  if (value.empty()) {
    value = "(nil)"sv;
  }
  std::string mask_value = std::string(value);
  if (is_masked) {
    mask_value = std::string(mask_value.size(), '*');
  }
  return mask_value;
}

template <>
std::string to_masked_string(bool value, bool is_masked) {
  std::string mask_value = value ? "true"s : "false"s;
  if (is_masked) {
    mask_value = std::string(mask_value.size(), '*');
  }
  return mask_value;
}

template <typename T>
std::string to_masked_string(T value, bool is_masked) {
  std::string mask_value = std::to_string(value);
  if (is_masked) {
    mask_value = std::string(mask_value.size(), '*');
  }
  return mask_value;
}

}  // namespace

std::string g_configfile;

const char kDefaultConfigFile[] = "~/.saea/config.json";

ConfigImpl::~ConfigImpl() = default;

std::unique_ptr<ConfigImpl> ConfigImpl::Create() {
  if (!g_configfile.empty()) {
    VLOG(1) << "using option from file: " << g_configfile;
    auto config = std::make_unique<ConfigImplLocal>(g_configfile);
    config->SetEnforceRead();
    return config;
  }
  VLOG(1) << "using option from file: " << kDefaultConfigFile;
  return std::make_unique<ConfigImplLocal>(kDefaultConfigFile);
}

bool ConfigImpl::Open(bool dontread) {
  bool ret = OpenImpl(dontread);
  if (!ret) {
    LOG(WARNING) << "failed to open config";
  } else {
    VLOG(2) << "opened config";
  }
  return ret;
}

bool ConfigImpl::Close() {
  bool ret = CloseImpl();
  if (!ret) {
    LOG(WARNING) << "failed to close/sync config";
  } else {
    VLOG(2) << "closed config";
  }
  return ret;
}

template <>
bool ConfigImpl::HasKey<std::string>(const std::string& key) {
  return HasKeyStringImpl(key);
}

template <>
bool ConfigImpl::HasKey<bool>(const std::string& key) {
  return HasKeyBoolImpl(key);
}

template <>
bool ConfigImpl::HasKey<uint32_t>(const std::string& key) {
  return HasKeyUint32Impl(key);
}

template <>
bool ConfigImpl::HasKey<uint64_t>(const std::string& key) {
  return HasKeyUint64Impl(key);
}

template <>
bool ConfigImpl::HasKey<int32_t>(const std::string& key) {
  return HasKeyInt32Impl(key);
}

template <>
bool ConfigImpl::HasKey<int64_t>(const std::string& key) {
  return HasKeyInt64Impl(key);
}

template <typename T>
bool ConfigImpl::Read(const std::string& key, absl::Flag<T>* value, bool is_masked) {
  T real_value;
  if (!ReadImpl(key, &real_value)) {
    LOG(WARNING) << "failed to load option " << key;
    return false;
  }
  absl::SetFlag(value, real_value);
  VLOG(1) << "loaded option " << key << ": " << to_masked_string(real_value, is_masked);
  return true;
}

template bool ConfigImpl::Read(const std::string& key, absl::Flag<std::string>* value, bool is_masked);

template <>
bool ConfigImpl::Read(const std::string& key, absl::Flag<CipherMethodFlag>* value, bool is_masked) {
  std::string real_value;
  if (!ReadImpl(key, &real_value)) {
    LOG(WARNING) << "failed to load option " << key;
    return false;
  }
  std::string err;
  CipherMethodFlag method;
  if (!AbslParseFlag(real_value, &method, &err)) {
    LOG(WARNING) << "invalid value for key: " << key << " value: " << to_masked_string(real_value, is_masked);
    return false;
  }
  absl::SetFlag(value, method);
  VLOG(1) << "loaded option " << key << ": " << to_masked_string(real_value, is_masked);
  return true;
}

// Accepts either a plain number of bytes or a string with a k or m suffix.
template <>
bool ConfigImpl::Read(const std::string& key, absl::Flag<ChunkSizeFlag>* value, bool is_masked) {
  std::string real_value;
  if (HasKey<uint32_t>(key)) {
    uint32_t number;
    if (!ReadImpl(key, &number)) {
      LOG(WARNING) << "failed to load option " << key;
      return false;
    }
    real_value = std::to_string(number);
  } else if (!ReadImpl(key, &real_value)) {
    LOG(WARNING) << "failed to load option " << key;
    return false;
  }
  std::string err;
  ChunkSizeFlag chunk_size;
  if (!AbslParseFlag(real_value, &chunk_size, &err)) {
    LOG(WARNING) << "invalid value for key: " << key << " value: " << to_masked_string(real_value, is_masked);
    return false;
  }
  absl::SetFlag(value, chunk_size);
  VLOG(1) << "loaded option " << key << ": " << to_masked_string(real_value, is_masked);
  return true;
}

template <>
bool ConfigImpl::Read(const std::string& key, absl::Flag<bool>* value, bool is_masked) {
  bool real_value;
  if (!ReadImpl(key, &real_value)) {
    LOG(WARNING) << "failed to load option " << key;
    return false;
  }
  absl::SetFlag(value, real_value);
  VLOG(1) << "loaded option " << key << ": " << to_masked_string(real_value, is_masked);
  return true;
}

template bool ConfigImpl::Read(const std::string& key, absl::Flag<uint32_t>* value, bool is_masked);

template bool ConfigImpl::Read(const std::string& key, absl::Flag<int32_t>* value, bool is_masked);

template bool ConfigImpl::Read(const std::string& key, absl::Flag<uint64_t>* value, bool is_masked);

template bool ConfigImpl::Read(const std::string& key, absl::Flag<int64_t>* value, bool is_masked);

template <typename T>
bool ConfigImpl::Write(const std::string& key, const absl::Flag<T>& value, bool is_masked) {
  T real_value = absl::GetFlag(value);
  if (!WriteImpl(key, real_value)) {
    LOG(WARNING) << "failed to saved option " << key << ": " << to_masked_string(real_value, is_masked);
    return false;
  }
  VLOG(1) << "saved option " << key << ": " << to_masked_string(real_value, is_masked);
  return true;
}

template bool ConfigImpl::Write(const std::string& key, const absl::Flag<std::string>& value, bool is_masked);

template <>
bool ConfigImpl::Write(const std::string& key, const absl::Flag<CipherMethodFlag>& value, bool is_masked) {
  std::string_view real_value = absl::GetFlag(value);
  if (!WriteImpl(key, absl::string_view(real_value.data(), real_value.size()))) {
    LOG(WARNING) << "failed to saved option " << key << ": " << to_masked_string(real_value, is_masked);
    return false;
  }
  VLOG(1) << "saved option " << key << ": " << to_masked_string(real_value, is_masked);
  return true;
}

template <>
bool ConfigImpl::Write(const std::string& key, const absl::Flag<ChunkSizeFlag>& value, bool is_masked) {
  uint32_t real_value = absl::GetFlag(value);
  if (!WriteImpl(key, real_value)) {
    LOG(WARNING) << "failed to saved option " << key << ": " << to_masked_string(real_value, is_masked);
    return false;
  }
  VLOG(1) << "saved option " << key << ": " << to_masked_string(real_value, is_masked);
  return true;
}

template <>
bool ConfigImpl::Write(const std::string& key, const absl::Flag<bool>& value, bool is_masked) {
  bool real_value = absl::GetFlag(value);
  if (!WriteImpl(key, real_value)) {
    LOG(WARNING) << "failed to saved option " << key << ": " << to_masked_string(real_value, is_masked);
    return false;
  }
  VLOG(1) << "saved option " << key << ": " << to_masked_string(real_value, is_masked);
  return true;
}

template bool ConfigImpl::Write(const std::string& key, const absl::Flag<uint32_t>& value, bool is_masked);

template bool ConfigImpl::Write(const std::string& key, const absl::Flag<int32_t>& value, bool is_masked);

template bool ConfigImpl::Write(const std::string& key, const absl::Flag<uint64_t>& value, bool is_masked);

template bool ConfigImpl::Write(const std::string& key, const absl::Flag<int64_t>& value, bool is_masked);

bool ConfigImpl::Delete(const std::string& key) {
  if (DeleteImpl(key)) {
    VLOG(1) << "deleted option " << key;
    return true;
  }
  return false;
}

}  // namespace config
