// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#ifndef H_CONFIG_CONFIG_IMPL_LOCAL
#define H_CONFIG_CONFIG_IMPL_LOCAL

#include "config/config_impl.hpp"

#include <json/json.h>
#include <sys/types.h>

#include <memory>
#include <string>
#include <string_view>

#include "core/logging.hpp"
#include "core/utils.hpp"
#include "core/utils_fs.hpp"

namespace config {

static constexpr const size_t kReadBufferSize = 32768u;

// Keeps the configuration as a JSON object in a local file.
class ConfigImplLocal : public ConfigImpl {
 public:
  explicit ConfigImplLocal(std::string_view path) : path_(saea::ExpandUser(path)) {}
  ~ConfigImplLocal() override {}

 protected:
  bool OpenImpl(bool dontread) override {
    if (path_.empty()) {
      LOG(WARNING) << "configure file opened with empty path";
      return false;
    }
    dontread_ = dontread;

    do {
      auto buffer = std::make_unique<uint8_t[]>(kReadBufferSize);

      ssize_t ret = saea::ReadFileToBuffer(path_, absl::MakeSpan(buffer.get(), kReadBufferSize));
      if (ret <= 0) {
        VLOG(1) << "configure file failed to read: " << path_;
        break;
      }
      if (ret == static_cast<ssize_t>(kReadBufferSize)) {
        LOG(WARNING) << "configure file is too large: " << path_;
        break;
      }
      const char* json_begin = reinterpret_cast<const char*>(buffer.get());
      Json::CharReaderBuilder builder;
      builder["collectComments"] = false;
      Json::String err;
      const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
      if (!reader->parse(json_begin, json_begin + ret, &root_, &err)) {
        LOG(WARNING) << "bad config file: " << path_ << " err: " << err;
        break;
      }
      if (!root_.isObject()) {
        LOG(WARNING) << "bad config file: " << path_ << " is not an object";
        break;
      }
      VLOG(1) << "loaded from config file: " << path_;
      return true;
    } while (false);

    if (!dontread) {
      return false;
    }

    root_ = Json::objectValue;

    return true;
  }

  bool CloseImpl() override {
    if (path_.empty() || !dontread_) {
      return true;
    }

    auto dir_ref = saea::Dirname(path_);
    std::string dir(dir_ref.data(), dir_ref.size());
    if (!saea::CreateDirectories(dir)) {
      LOG(WARNING) << "configure dir could not create: " << dir;
      return false;
    }
    Json::StreamWriterBuilder builder;
    builder["commentStyle"] = "None";
    builder["indentation"] = "    ";
    const std::string json_content = Json::writeString(builder, root_);
    if (static_cast<ssize_t>(json_content.size()) != saea::WriteFileWithBuffer(path_, json_content)) {
      LOG(WARNING) << "failed to write to path: " << path_;
      return false;
    }

    VLOG(1) << "written config file at " << path_;

    path_.clear();
    return true;
  }

  bool HasKeyStringImpl(const std::string& key) override { return root_.isMember(key) && root_[key].isString(); }

  bool HasKeyBoolImpl(const std::string& key) override { return root_.isMember(key) && root_[key].isBool(); }

  bool HasKeyUint32Impl(const std::string& key) override { return root_.isMember(key) && root_[key].isUInt(); }

  bool HasKeyUint64Impl(const std::string& key) override { return root_.isMember(key) && root_[key].isUInt64(); }

  bool HasKeyInt32Impl(const std::string& key) override { return root_.isMember(key) && root_[key].isInt(); }

  bool HasKeyInt64Impl(const std::string& key) override { return root_.isMember(key) && root_[key].isInt64(); }

  bool ReadImpl(const std::string& key, std::string* value) override {
    if (root_.isMember(key) && root_[key].isString()) {
      *value = root_[key].asString();
      return true;
    }
    VLOG(1) << "bad field: " << key;
    return false;
  }

  bool ReadImpl(const std::string& key, bool* value) override {
    if (root_.isMember(key) && root_[key].isBool()) {
      *value = root_[key].asBool();
      return true;
    }
    VLOG(1) << "bad field: " << key;
    return false;
  }

  bool ReadImpl(const std::string& key, uint32_t* value) override {
    if (root_.isMember(key) && root_[key].isUInt()) {
      *value = root_[key].asUInt();
      return true;
    }
    VLOG(1) << "bad field: " << key;
    return false;
  }

  bool ReadImpl(const std::string& key, int32_t* value) override {
    if (root_.isMember(key) && root_[key].isInt()) {
      *value = root_[key].asInt();
      return true;
    }
    VLOG(1) << "bad field: " << key;
    return false;
  }

  bool ReadImpl(const std::string& key, uint64_t* value) override {
    if (root_.isMember(key) && root_[key].isUInt64()) {
      *value = root_[key].asUInt64();
      return true;
    }
    VLOG(1) << "bad field: " << key;
    return false;
  }

  bool ReadImpl(const std::string& key, int64_t* value) override {
    if (root_.isMember(key) && root_[key].isInt64()) {
      *value = root_[key].asInt64();
      return true;
    }
    VLOG(1) << "bad field: " << key;
    return false;
  }

  bool WriteImpl(const std::string& key, absl::string_view value) override {
    root_[key] = std::string(value.data(), value.size());
    return true;
  }

  bool WriteImpl(const std::string& key, bool value) override {
    root_[key] = value;
    return true;
  }

  bool WriteImpl(const std::string& key, uint32_t value) override {
    root_[key] = value;
    return true;
  }

  bool WriteImpl(const std::string& key, int32_t value) override {
    root_[key] = value;
    return true;
  }

  bool WriteImpl(const std::string& key, uint64_t value) override {
    root_[key] = static_cast<Json::UInt64>(value);
    return true;
  }

  bool WriteImpl(const std::string& key, int64_t value) override {
    root_[key] = static_cast<Json::Int64>(value);
    return true;
  }

  bool DeleteImpl(const std::string& key) override {
    Json::Value got;
    return root_.removeMember(key, &got);
  }

 private:
  std::string path_;
  Json::Value root_;
};

}  // namespace config

#endif  // H_CONFIG_CONFIG_IMPL_LOCAL
