// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2022-2024 Chilledheart  */

#include "core/logging.hpp"

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/time.h>
#include <time.h>
#include <unistd.h>

#include <iomanip>

#include <absl/debugging/stacktrace.h>
#include <absl/debugging/symbolize.h>
#include <absl/flags/flag.h>
#include <absl/strings/str_format.h>
#include <absl/synchronization/mutex.h>

#ifndef NDEBUG
#define DEFAULT_VERBOSE_LEVEL 1
#else
#define DEFAULT_VERBOSE_LEVEL 0
#endif

ABSL_FLAG(int32_t, v, DEFAULT_VERBOSE_LEVEL, "verboselevel");
ABSL_FLAG(int32_t,
          minloglevel,
          0,
          "Messages logged at a lower level than this don't "
          "actually get logged anywhere");
// By default, errors (including fatal errors) get logged to stderr as
// well as the file.
ABSL_FLAG(int32_t,
          stderrthreshold,
          saea::LOGGING_ERROR,
          "log messages at or above this level are copied to stderr in "
          "addition to the log file");
ABSL_FLAG(bool, log_prefix, true, "Prepend the log prefix to the start of each log line");
ABSL_FLAG(std::string,
          log_file,
          "",
          "If specified, log messages are appended to this file instead of "
          "stderr");

namespace saea {

namespace {

const char* const log_severity_names[LOGGING_NUM_SEVERITIES] = {"INFO", "WARNING", "ERROR", "FATAL"};

absl::Mutex log_mutex;
FILE* log_file ABSL_GUARDED_BY(log_mutex) = nullptr;
std::string log_file_path ABSL_GUARDED_BY(log_mutex);

const char* const_basename(const char* filepath) {
  const char* base = strrchr(filepath, '/');
  return base ? (base + 1) : filepath;
}

// Returns nullptr if logging to file is disabled, reopens the file if
// --log_file changed since the last message.
FILE* GetLogFileLocked() ABSL_EXCLUSIVE_LOCKS_REQUIRED(log_mutex) {
  const std::string path = absl::GetFlag(FLAGS_log_file);
  if (path != log_file_path) {
    if (log_file) {
      fclose(log_file);
      log_file = nullptr;
    }
    log_file_path = path;
    if (!path.empty()) {
      log_file = fopen(path.c_str(), "a");
      if (!log_file) {
        fprintf(stderr, "Could not open log file %s: %s\n", path.c_str(), SystemErrorCodeToString(errno).c_str());
      }
    }
  }
  return log_file;
}

void DumpStackTraceToStderr() {
  void* stack[32];
  int depth = absl::GetStackTrace(stack, 32, 2);
  for (int i = 0; i < depth; ++i) {
    char symbol[1024];
    const char* name = "(unknown)";
    if (absl::Symbolize(stack[i], symbol, sizeof(symbol))) {
      name = symbol;
    }
    fprintf(stderr, "    @ %p  %s\n", stack[i], name);
  }
}

}  // namespace

const char* log_severity_name(LogSeverity severity) {
  if (severity >= 0 && severity < LOGGING_NUM_SEVERITIES) {
    return log_severity_names[severity];
  }
  return "UNKNOWN";
}

int GetMinLogLevel() {
  return absl::GetFlag(FLAGS_minloglevel);
}

int GetVlogVerbosity() {
  return absl::GetFlag(FLAGS_v);
}

void CloseLogFile() {
  absl::MutexLock lock(&log_mutex);
  if (log_file) {
    fclose(log_file);
    log_file = nullptr;
  }
  log_file_path.clear();
}

std::string SystemErrorCodeToString(int error_code) {
  char buf[256];
  buf[0] = '\0';
  // GNU strerror_r may return a static string instead of filling |buf|.
#if defined(__GLIBC__) && defined(_GNU_SOURCE)
  const char* msg = strerror_r(error_code, buf, sizeof(buf));
#else
  const char* msg = strerror_r(error_code, buf, sizeof(buf)) == 0 ? buf : "Unknown error";
#endif
  return absl::StrFormat("%s (%d)", msg, error_code);
}

LogMessage::LogMessage(const char* file, int line, LogSeverity severity) : severity_(severity) {
  Init(file, line);
}

LogMessage::LogMessage(const char* file, int line, std::string* result) : severity_(LOGGING_FATAL) {
  Init(file, line);
  stream_ << "Check failed: " << *result;
  delete result;
}

LogMessage::~LogMessage() {
  Flush();
  if (severity_ == LOGGING_FATAL) {
    DumpStackTraceToStderr();
    abort();
  }
}

// If specified, prepend a prefix to each line.  For example:
//    [1018/160715.123456:ERROR:stream_decryptor.cpp(153)]
//    (month, date, time, log level, file basename, line)
void LogMessage::Init(const char* file, int line) {
  if (absl::GetFlag(FLAGS_log_prefix)) {
    timeval tv;
    gettimeofday(&tv, nullptr);
    time_t t = tv.tv_sec;
    struct tm local_time;
    localtime_r(&t, &local_time);
    stream_ << '[' << std::setfill('0') << std::setw(2) << 1 + local_time.tm_mon << std::setw(2) << local_time.tm_mday
            << '/' << std::setw(2) << local_time.tm_hour << std::setw(2) << local_time.tm_min << std::setw(2)
            << local_time.tm_sec << '.' << std::setw(6) << tv.tv_usec << ':' << std::setfill(' ');
    if (severity_ >= 0) {
      stream_ << log_severity_name(severity_);
    } else {
      stream_ << "VERBOSE" << -severity_;
    }
    stream_ << ":" << const_basename(file) << "(" << line << ")] ";
  }
}

void LogMessage::Flush() {
  if (severity_ >= 0 && severity_ < GetMinLogLevel() && severity_ != LOGGING_FATAL) {
    return;
  }
  std::string message = stream_.str();
  if (message.empty() || message.back() != '\n') {
    message.push_back('\n');
  }

  absl::MutexLock lock(&log_mutex);
  FILE* file = GetLogFileLocked();
  if (file) {
    fwrite(message.data(), 1, message.size(), file);
    fflush(file);
  }
  if (!file || severity_ >= absl::GetFlag(FLAGS_stderrthreshold)) {
    fwrite(message.data(), 1, message.size(), stderr);
    fflush(stderr);
  }
}

ErrnoLogMessage::ErrnoLogMessage(const char* file, int line, LogSeverity severity, int err)
    : LogMessage(file, line, severity), err_(err) {}

ErrnoLogMessage::~ErrnoLogMessage() {
  stream() << ": " << SystemErrorCodeToString(err_);
}

}  // namespace saea
