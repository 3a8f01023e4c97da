// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#include "config/config.hpp"

#include <absl/flags/flag.h>
#include <absl/flags/internal/program_name.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <stdlib.h>
#include <iostream>
#include <sstream>

#include "config/config_impl.hpp"
#include "core/logging.hpp"
#include "core/utils.hpp"
#include "core/utils_fs.hpp"
#include "stream/chunk_framer.hpp"
#include "version.h"

namespace config {

bool ReadConfig() {
  if (g_configfile.empty() && !saea::IsFile(saea::ExpandUser(kDefaultConfigFile))) {
    VLOG(1) << "no config file at " << kDefaultConfigFile;
    return true;
  }
  auto config_impl = config::ConfigImpl::Create();

  if (!config_impl->Open(false)) {
    return !config_impl->GetEnforceRead();
  }

  /* optional fields */
  if (config_impl->HasKey<std::string>("method")) {
    config_impl->Read("method", &FLAGS_method);
  }
  if (config_impl->HasKey<uint32_t>("chunk_size") || config_impl->HasKey<std::string>("chunk_size")) {
    config_impl->Read("chunk_size", &FLAGS_chunk_size);
  }
  if (config_impl->HasKey<std::string>("key_file")) {
    config_impl->Read("key_file", &FLAGS_key_file);
  }
  if (config_impl->HasKey<uint32_t>("parallel_max")) {
    config_impl->Read("parallel_max", &FLAGS_parallel_max);
  }
  if (config_impl->HasKey<std::string>("output_dir")) {
    config_impl->Read("output_dir", &FLAGS_output_dir);
  }

  /* close fields */
  return config_impl->Close();
}

bool SaveConfig() {
  auto config_impl = config::ConfigImpl::Create();
  bool all_fields_written = true;

  if (!config_impl->Open(true)) {
    return false;
  }

  all_fields_written &= config_impl->Write("method", FLAGS_method);
  all_fields_written &= config_impl->Write("chunk_size", FLAGS_chunk_size);
  all_fields_written &= config_impl->Write("key_file", FLAGS_key_file);
  all_fields_written &= config_impl->Write("parallel_max", FLAGS_parallel_max);
  all_fields_written &= config_impl->Write("output_dir", FLAGS_output_dir);
  /* the output path names a single file and is never persisted */
  static_cast<void>(config_impl->Delete("output"));

  all_fields_written &= config_impl->Close();

  return all_fields_written;
}

std::string ValidateConfig() {
  std::ostringstream err_msg;

  auto method = absl::GetFlag(FLAGS_method);
  uint32_t chunk_size = absl::GetFlag(FLAGS_chunk_size);
  auto parallel_max = absl::GetFlag(FLAGS_parallel_max);
  auto output = absl::GetFlag(FLAGS_output);
  auto output_dir = absl::GetFlag(FLAGS_output_dir);

  if (method.method == CRYPTO_INVALID) {
    err_msg << ",Invalid Cipher: " << to_cipher_method_str(method.method);
  }

  if (chunk_size == 0 || chunk_size > saea::kMaxChunkSize) {
    err_msg << ",Invalid Chunk Size: " << chunk_size;
  }

  if (parallel_max == 0) {
    err_msg << ",Invalid Parallel Max: " << parallel_max;
  }

  if (!output.empty() && !output_dir.empty()) {
    err_msg << ",Conflicting Output Dir: " << output_dir;
  }

  if (!output_dir.empty() && !saea::IsDirectory(saea::ExpandUser(output_dir))) {
    err_msg << ",Invalid Output Dir: " << output_dir;
  }

  auto ret = err_msg.str();
  if (ret.empty()) {
    return ret;
  } else {
    return ret.substr(1);
  }
}

static void ParseConfigFileOption(int argc, const char** argv) {
  int pos = 1;
  while (pos < argc) {
    std::string arg = argv[pos];
    if (pos + 1 < argc && (arg == "-c" || arg == "--configfile")) {
      g_configfile = argv[pos + 1];
      argv[pos] = "";
      argv[pos + 1] = "";
      pos += 2;
      continue;
    } else if (absl::StartsWith(arg, "--configfile=")) {
      g_configfile = arg.substr(sizeof("--configfile=") - 1);
      argv[pos] = "";
      pos += 1;
      continue;
    } else if (arg == "-version" || arg == "--version") {
      std::cout << absl::flags_internal::ShortProgramInvocationName() << " " << SAEA_APP_TAG << std::endl;
#ifndef NDEBUG
      std::cout << "Debug build (NDEBUG not #defined)" << std::endl;
#endif
      exit(0);
    }
    ++pos;
  }
}

std::vector<std::string> ReadConfigFileAndArguments(int argc, const char** argv) {
  ParseConfigFileOption(argc, argv);
  if (!config::ReadConfig()) {
    std::cerr << "failed to read config file: " << g_configfile << std::endl;
    exit(-1);
  }
  std::vector<std::string> positional;
  if (argc) {
    std::vector<char*> args = absl::ParseCommandLine(argc, const_cast<char**>(argv));
    // skip the program name and the consumed config file options
    for (size_t i = 1; i < args.size(); ++i) {
      if (args[i][0] != '\0') {
        positional.emplace_back(args[i]);
      }
    }
  }

  // first line of logging
  VLOG(1) << "Application starting: " << SAEA_APP_TAG;
#ifndef NDEBUG
  VLOG(1) << "Debug build (NDEBUG not #defined)";
#endif
  return positional;
}

void SetUsageMessage(std::string_view exec_path) {
  absl::SetProgramUsageMessage(absl::StrCat("Usage: ", std::string(saea::Basename(exec_path)),
                                            " encrypt|decrypt [options ...] FILE...\n", R"(
  -c, --configfile <file> Read config from a file
  --version Print saea version
  --key_file <file> Read the 256-bit key (64 hex characters) from a file, defaults to $SAEA_KEY
  --method <method> Specify the algorithm of new streams
  --chunk_size <size> Plaintext bytes per chunk of new streams. Unit can be (none), k, m.
  --parallel_max <n> Maximum number of files processed in parallel
  --output <file> Output path when a single file is given, - for stdout
  --output_dir <dir> Directory for output files
  FILE may be - for stdin.
)"));
}

}  // namespace config
