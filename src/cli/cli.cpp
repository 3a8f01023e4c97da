// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#include "cli/key_loader.hpp"
#include "config/config.hpp"
#include "crypto/crypter_export.hpp"

#include <absl/debugging/failure_signal_handler.h>
#include <absl/debugging/symbolize.h>
#include <absl/flags/flag.h>
#include <absl/flags/usage.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <locale.h>
#include <openssl/crypto.h>
#include <openssl/mem.h>
#include <signal.h>
#include <iostream>

#include "core/logging.hpp"
#include "core/utils.hpp"
#include "stream/file_session.hpp"
#include "stream/session_pool.hpp"
#include "stream/stream_errors.hpp"
#include "version.h"

using namespace cli;

static constexpr const char kEncryptedSuffix[] = ".saea";

// FILE.saea for encryption, FILE without .saea for decryption. Returns an
// empty string when no name can be derived.
static std::string DeriveOutputPath(saea::FileJob::Direction direction,
                                    const std::string& input_path,
                                    const std::string& output_dir) {
  if (input_path == saea::kStdioPath) {
    return saea::kStdioPath;
  }
  std::string name;
  if (direction == saea::FileJob::ENCRYPT) {
    name = absl::StrCat(input_path, kEncryptedSuffix);
  } else if (absl::EndsWith(input_path, kEncryptedSuffix) && input_path.size() > sizeof(kEncryptedSuffix) - 1) {
    name = input_path.substr(0, input_path.size() - (sizeof(kEncryptedSuffix) - 1));
  } else {
    return std::string();
  }
  if (output_dir.empty()) {
    return name;
  }
  std::string_view base = saea::Basename(name);
  return absl::StrCat(saea::ExpandUser(output_dir), "/", std::string(base));
}

static void ReportFailure(const saea::FileJob& job, int result) {
  if (result == saea::OK) {
    VLOG(1) << "finished " << job.input_path << " -> " << job.output_path;
    return;
  }
  std::cerr << job.input_path << ": " << saea::ErrorToPublicString(result) << std::endl;
}

int main(int argc, const char* argv[]) {
  std::string exec_path = argv[0];

  setlocale(LC_ALL, "");

  // Major routine
  // - Read config from config file and command line
  // - Load the key
  // - Run one session per input file
  absl::InitializeSymbolizer(exec_path.c_str());
  absl::FailureSignalHandlerOptions failure_handle_options;
  absl::InstallFailureSignalHandler(failure_handle_options);

  config::SetUsageMessage(exec_path);
  std::vector<std::string> args = config::ReadConfigFileAndArguments(argc, argv);

  if (args.size() < 2) {
    std::cerr << absl::ProgramUsageMessage() << std::endl;
    return -1;
  }

  saea::FileJob::Direction direction;
  if (args[0] == "encrypt") {
    direction = saea::FileJob::ENCRYPT;
  } else if (args[0] == "decrypt") {
    direction = saea::FileJob::DECRYPT;
  } else {
    std::cerr << "Unknown command: " << args[0] << std::endl << absl::ProgramUsageMessage() << std::endl;
    return -1;
  }
  std::vector<std::string> inputs(args.begin() + 1, args.end());

  auto err_msg = config::ValidateConfig();
  if (!err_msg.empty()) {
    std::cerr << "Invalid config: " << err_msg << std::endl;
    return -1;
  }
  std::string output = absl::GetFlag(FLAGS_output);
  if (!output.empty() && inputs.size() > 1) {
    std::cerr << "--output only applies to a single input file" << std::endl;
    return -1;
  }

  CRYPTO_library_init();

  std::string key;
  std::string key_err;
  if (!LoadKey(absl::GetFlag(FLAGS_key_file), &key, &key_err)) {
    std::cerr << key_err << std::endl;
    return -1;
  }

#ifdef SIGPIPE
  signal(SIGPIPE, SIG_IGN);
#endif

  uint32_t chunk_size = absl::GetFlag(FLAGS_chunk_size);
  enum cipher_method method = absl::GetFlag(FLAGS_method);
  std::string output_dir = absl::GetFlag(FLAGS_output_dir);

  std::vector<saea::FileJob> jobs;
  for (const auto& input : inputs) {
    saea::FileJob job;
    job.direction = direction;
    job.input_path = input;
    job.output_path = output.empty() ? DeriveOutputPath(direction, input, output_dir) : output;
    if (job.output_path.empty()) {
      std::cerr << input << ": cannot derive output name, expected a " << kEncryptedSuffix << " suffix" << std::endl;
      OPENSSL_cleanse(&key[0], key.size());
      return -1;
    }
    if (job.output_path == saea::kStdioPath && inputs.size() > 1) {
      std::cerr << "stdin can only be used with a single input file" << std::endl;
      OPENSSL_cleanse(&key[0], key.size());
      return -1;
    }
    jobs.push_back(std::move(job));
  }

  int failures = 0;
  if (jobs.size() == 1) {
    const saea::FileJob& job = jobs.front();
    int ret;
    if (direction == saea::FileJob::ENCRYPT) {
      ret = saea::EncryptFile(job.input_path, job.output_path, reinterpret_cast<const uint8_t*>(key.data()),
                              key.size(), chunk_size, method);
    } else {
      ret = saea::DecryptFile(job.input_path, job.output_path, reinterpret_cast<const uint8_t*>(key.data()),
                              key.size());
    }
    ReportFailure(job, ret);
    failures += ret != saea::OK;
  } else {
    int parallel_max = static_cast<int>(absl::GetFlag(FLAGS_parallel_max));
    saea::SessionPool pool(parallel_max, key, chunk_size, method);
    pool.set_job_callback(ReportFailure);
    for (int ret : pool.Run(jobs)) {
      failures += ret != saea::OK;
    }
  }
  OPENSSL_cleanse(&key[0], key.size());

  VLOG(1) << "Application exiting with " << failures << " failure(s)";
  return failures ? 1 : 0;
}
