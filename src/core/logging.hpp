// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */
#ifndef H_CORE_LOGGING
#define H_CORE_LOGGING

#include <stddef.h>
#include <stdint.h>

#include <ostream>
#include <sstream>
#include <string>

#include <absl/flags/declare.h>

ABSL_DECLARE_FLAG(int32_t, v);
ABSL_DECLARE_FLAG(int32_t, minloglevel);
ABSL_DECLARE_FLAG(int32_t, stderrthreshold);
ABSL_DECLARE_FLAG(bool, log_prefix);
ABSL_DECLARE_FLAG(std::string, log_file);

namespace saea {

// Severities, verbose messages are logged with negative severities
// (VLOG(n) == -n).
typedef int LogSeverity;
constexpr LogSeverity LOGGING_VERBOSE = -1;
constexpr LogSeverity LOGGING_INFO = 0;
constexpr LogSeverity LOGGING_WARNING = 1;
constexpr LogSeverity LOGGING_ERROR = 2;
constexpr LogSeverity LOGGING_FATAL = 3;
constexpr LogSeverity LOGGING_NUM_SEVERITIES = 4;

#ifdef NDEBUG
constexpr LogSeverity LOGGING_DFATAL = LOGGING_ERROR;
#define DCHECK_IS_ON() false
#else
constexpr LogSeverity LOGGING_DFATAL = LOGGING_FATAL;
#define DCHECK_IS_ON() true
#endif

const char* log_severity_name(LogSeverity severity);

int GetMinLogLevel();
int GetVlogVerbosity();

// Close the log file opened by --log_file, if any.
void CloseLogFile();

// Returns a human readable description of |error_code| (errno).
std::string SystemErrorCodeToString(int error_code);

class LogMessage {
 public:
  LogMessage(const char* file, int line, LogSeverity severity);

  // Used for CHECK_op(). Takes ownership of |result|.
  LogMessage(const char* file, int line, std::string* result);

  LogMessage(const LogMessage&) = delete;
  LogMessage& operator=(const LogMessage&) = delete;
  virtual ~LogMessage();

  std::ostream& stream() { return stream_; }

  LogSeverity severity() const { return severity_; }

 private:
  void Init(const char* file, int line);
  void Flush();

  LogSeverity severity_;
  std::ostringstream stream_;
};

// Appends a formatted system message of errno to the message.
class ErrnoLogMessage : public LogMessage {
 public:
  ErrnoLogMessage(const char* file, int line, LogSeverity severity, int err);
  ~ErrnoLogMessage() override;

 private:
  int err_;
};

// This class is used to explicitly ignore values in the conditional
// logging macros.  This avoids compiler warnings like "value computed
// is not used" and "statement has no effect".
class LogMessageVoidify {
 public:
  LogMessageVoidify() = default;
  // This has to be an operator with a precedence lower than << but
  // higher than ?:
  void operator&(std::ostream&) {}
};

// Build the error message string for CHECK_op(). Specify no inlining
// for code size.
template <typename T1, typename T2>
std::string* MakeCheckOpString(const T1& v1, const T2& v2, const char* names) {
  std::ostringstream ss;
  ss << names << " (" << v1 << " vs. " << v2 << ")";
  return new std::string(ss.str());
}

#define DEFINE_CHECK_OP_IMPL(name, op)                                             \
  template <typename T1, typename T2>                                              \
  inline std::string* Check##name##Impl(const T1& v1, const T2& v2,                \
                                        const char* names) {                      \
    if (v1 op v2)                                                                  \
      return nullptr;                                                              \
    return MakeCheckOpString(v1, v2, names);                                       \
  }                                                                                \
  inline std::string* Check##name##Impl(int v1, int v2, const char* names) {       \
    if (v1 op v2)                                                                  \
      return nullptr;                                                              \
    return MakeCheckOpString(v1, v2, names);                                       \
  }
DEFINE_CHECK_OP_IMPL(EQ, ==)
DEFINE_CHECK_OP_IMPL(NE, !=)
DEFINE_CHECK_OP_IMPL(LE, <=)
DEFINE_CHECK_OP_IMPL(LT, <)
DEFINE_CHECK_OP_IMPL(GE, >=)
DEFINE_CHECK_OP_IMPL(GT, >)
#undef DEFINE_CHECK_OP_IMPL

}  // namespace saea

#define LOG_IS_ON(severity) \
  (::saea::LOGGING_##severity >= ::saea::GetMinLogLevel() || ::saea::LOGGING_##severity >= ::saea::LOGGING_FATAL)

#define VLOG_IS_ON(verboselevel) ((verboselevel) <= ::saea::GetVlogVerbosity())

// Helper macro which avoids evaluating the arguments to a stream if
// the condition doesn't hold.
#define LAZY_STREAM(stream, condition) !(condition) ? (void)0 : ::saea::LogMessageVoidify() & (stream)

#define LOG_STREAM(severity) ::saea::LogMessage(__FILE__, __LINE__, ::saea::LOGGING_##severity).stream()

#define LOG(severity) LAZY_STREAM(LOG_STREAM(severity), LOG_IS_ON(severity))
#define LOG_IF(severity, condition) LAZY_STREAM(LOG_STREAM(severity), LOG_IS_ON(severity) && (condition))

#define VLOG_STREAM(verbose_level) ::saea::LogMessage(__FILE__, __LINE__, -(verbose_level)).stream()

#define VLOG(verbose_level) LAZY_STREAM(VLOG_STREAM(verbose_level), VLOG_IS_ON(verbose_level))

#define PLOG_STREAM(severity) \
  ::saea::ErrnoLogMessage(__FILE__, __LINE__, ::saea::LOGGING_##severity, errno).stream()

#define PLOG(severity) LAZY_STREAM(PLOG_STREAM(severity), LOG_IS_ON(severity))

#define CHECK(condition) \
  LAZY_STREAM(LOG_STREAM(FATAL), !(condition)) << "Check failed: " #condition ". "

#define PCHECK(condition) \
  LAZY_STREAM(PLOG_STREAM(FATAL), !(condition)) << "Check failed: " #condition ". "

#define CHECK_OP(name, op, val1, val2)                                                          \
  while (std::string* _result = ::saea::Check##name##Impl((val1), (val2), #val1 " " #op " " #val2)) \
  ::saea::LogMessage(__FILE__, __LINE__, _result).stream()

#define CHECK_EQ(val1, val2) CHECK_OP(EQ, ==, val1, val2)
#define CHECK_NE(val1, val2) CHECK_OP(NE, !=, val1, val2)
#define CHECK_LE(val1, val2) CHECK_OP(LE, <=, val1, val2)
#define CHECK_LT(val1, val2) CHECK_OP(LT, <, val1, val2)
#define CHECK_GE(val1, val2) CHECK_OP(GE, >=, val1, val2)
#define CHECK_GT(val1, val2) CHECK_OP(GT, >, val1, val2)

#define DLOG(severity) LAZY_STREAM(LOG_STREAM(severity), DCHECK_IS_ON() && LOG_IS_ON(severity))
#define DVLOG(verbose_level) LAZY_STREAM(VLOG_STREAM(verbose_level), DCHECK_IS_ON() && VLOG_IS_ON(verbose_level))

#if DCHECK_IS_ON()

#define DCHECK(condition) CHECK(condition)
#define DCHECK_EQ(val1, val2) CHECK_EQ(val1, val2)
#define DCHECK_NE(val1, val2) CHECK_NE(val1, val2)
#define DCHECK_LE(val1, val2) CHECK_LE(val1, val2)
#define DCHECK_LT(val1, val2) CHECK_LT(val1, val2)
#define DCHECK_GE(val1, val2) CHECK_GE(val1, val2)
#define DCHECK_GT(val1, val2) CHECK_GT(val1, val2)

#else  // DCHECK_IS_ON()

#define DCHECK(condition) \
  while (false)           \
  CHECK(condition)
#define DCHECK_EQ(val1, val2) \
  while (false)               \
  CHECK_EQ(val1, val2)
#define DCHECK_NE(val1, val2) \
  while (false)               \
  CHECK_NE(val1, val2)
#define DCHECK_LE(val1, val2) \
  while (false)               \
  CHECK_LE(val1, val2)
#define DCHECK_LT(val1, val2) \
  while (false)               \
  CHECK_LT(val1, val2)
#define DCHECK_GE(val1, val2) \
  while (false)               \
  CHECK_GE(val1, val2)
#define DCHECK_GT(val1, val2) \
  while (false)               \
  CHECK_GT(val1, val2)

#endif  // DCHECK_IS_ON()

#define NOTREACHED() DCHECK(false)

#endif  //  H_CORE_LOGGING
