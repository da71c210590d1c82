/*
 *  (c) 2025, wilddolphin2022
 *  For WebRTCsays.ai project
 *  https://github.com/wilddolphin2022
 *
 *  Use of this source code is governed by a BSD-style license
 *  that can be found in the LICENSE file in the root of the source
 *  tree. An additional intellectual property rights grant can be found
 *  in the file PATENTS.  All contributing project authors may
 *  be found in the AUTHORS file in the root of the source tree.
 */

#include <cerrno>      // For errno used with strtol
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <unordered_set>

#include <json/json.h>

#include "rtc_base/crypto_random.h"
#include "rtc_base/logging.h"

#include "option.h"

// String split
std::vector<std::string> stringSplit(std::string input, std::string delimiter);

namespace {

// Utility to remove surrounding single or double quotes from a string.
std::string stripQuotes(const std::string& s) {
    if (s.size() >= 2) {
        if ((s.front() == '"' && s.back() == '"') || (s.front() == '\'' && s.back() == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

// Helper function to expand ${HOME} in paths
std::string expandHomePath(const std::string& path) {
    if (path.rfind("${HOME}", 0) == 0) {
        const char* home_dir = std::getenv("HOME");
        if (home_dir) {
            std::string expanded_path = home_dir;
            if (path.length() > 7 && path[7] != '/') {
                expanded_path += "/";
            }
            expanded_path += path.substr(7);
            RTC_LOG(LS_INFO) << "Expanded path: " << expanded_path;
            return expanded_path;
        }
        RTC_LOG(LS_WARNING) << "HOME environment variable not set, cannot expand path: " << path;
    }
    return path;
}

// strtoll based conversion, no exceptions.
bool parseInt64(const std::string& text, int64_t* value) {
    const char* start_ptr = text.c_str();
    char* end_ptr = nullptr;
    errno = 0;
    long long parsed = strtoll(start_ptr, &end_ptr, 10);
    if (errno != 0 || end_ptr == start_ptr || *end_ptr != '\0') {
        RTC_LOG(LS_ERROR) << "Invalid number: " << text;
        return false;
    }
    *value = static_cast<int64_t>(parsed);
    return true;
}

bool parsePositiveInt(const std::string& key, const std::string& text, int* value) {
    int64_t parsed = 0;
    if (!parseInt64(text, &parsed) || parsed <= 0 || parsed > INT32_MAX) {
        RTC_LOG(LS_WARNING) << "Ignoring " << key << "=" << text << " (expects a positive integer)";
        return false;
    }
    *value = static_cast<int>(parsed);
    return true;
}

bool parsePositiveSize(const std::string& key, const std::string& text, uint64_t* value) {
    int64_t parsed = 0;
    if (!parseInt64(text, &parsed) || parsed <= 0) {
        RTC_LOG(LS_WARNING) << "Ignoring " << key << "=" << text << " (expects a positive size)";
        return false;
    }
    *value = static_cast<uint64_t>(parsed);
    return true;
}

// Integer tunables shared by the config file and the command line.
bool applyIntOption(Options& opts, const std::string& key, const std::string& text) {
    if (key == "ice_grace_period_ms") return parsePositiveInt(key, text, &opts.ice_grace_period_ms);
    if (key == "max_reconnect_attempts") return parsePositiveInt(key, text, &opts.max_reconnect_attempts);
    if (key == "connecting_timeout_ms") return parsePositiveInt(key, text, &opts.connecting_timeout_ms);
    if (key == "max_group_members") return parsePositiveInt(key, text, &opts.max_group_members);
    if (key == "chunk_size") return parsePositiveInt(key, text, &opts.chunk_size);
    if (key == "checkpoint_interval_chunks") return parsePositiveInt(key, text, &opts.checkpoint_interval_chunks);
    if (key == "stall_timeout_ms") return parsePositiveInt(key, text, &opts.stall_timeout_ms);
    if (key == "transfer_connect_timeout_ms") return parsePositiveInt(key, text, &opts.transfer_connect_timeout_ms);
    if (key == "max_concurrent_transfers") return parsePositiveInt(key, text, &opts.max_concurrent_transfers);
    if (key == "max_send_retries") return parsePositiveInt(key, text, &opts.max_send_retries);
    if (key == "high_water_mark") return parsePositiveSize(key, text, &opts.high_water_mark);
    if (key == "low_water_mark") return parsePositiveSize(key, text, &opts.low_water_mark);
    if (key == "max_hash_file_size") return parsePositiveSize(key, text, &opts.max_hash_file_size);
    if (key == "max_file_size") return parsePositiveSize(key, text, &opts.max_file_size);
    return false;
}

// String options shared by the config file and the command line.
bool applyStringOption(Options& opts, const std::string& key, const std::string& value) {
    if (key == "mode") opts.mode = value;
    else if (key == "server") opts.server = value;
    else if (key == "user_name") opts.user_name = value;
    else if (key == "target_name") opts.target_name = value;
    else if (key == "group_name") opts.group_name = value;
    else if (key == "file") opts.file = expandHomePath(value);
    else if (key == "turns") opts.turns = value;
    else if (key == "state_path") opts.state_path = expandHomePath(value);
    else if (key == "download_dir") opts.download_dir = expandHomePath(value);
    else if (key == "capability") opts.capability = value;
    else if (key == "log_level") opts.log_level = value;
    else return false;
    return true;
}

const char* const kIntKeys[] = {
    "ice_grace_period_ms", "max_reconnect_attempts", "connecting_timeout_ms",
    "max_group_members", "chunk_size", "checkpoint_interval_chunks",
    "stall_timeout_ms", "transfer_connect_timeout_ms", "max_concurrent_transfers",
    "max_send_retries", "high_water_mark", "low_water_mark", "max_hash_file_size",
    "max_file_size",
};

const char* const kStringKeys[] = {
    "mode", "server", "user_name", "target_name", "group_name", "file", "turns",
    "state_path", "download_dir", "capability", "log_level",
};

void loadConfigFile(Options& opts) {
    // Use C-style file I/O, same as the rest of the tooling
    FILE* fp = fopen(opts.config_path.c_str(), "rb");
    if (!fp) {
        RTC_LOG(LS_ERROR) << "Could not open config file: " << opts.config_path;
        return;
    }
    std::string contents;
    fseek(fp, 0, SEEK_END);
    long length = ftell(fp);
    rewind(fp);
    if (length > 0) {
        contents.resize(static_cast<size_t>(length));
        size_t bytes_read = fread(&contents[0], 1, contents.size(), fp);
        contents.resize(bytes_read);
    }
    fclose(fp);
    RTC_LOG(LS_VERBOSE) << "Config: read " << contents.size() << " bytes from " << opts.config_path;

    Json::Value config_json;
    Json::CharReaderBuilder reader_builder;
    std::string errs;
    std::unique_ptr<Json::CharReader> reader(reader_builder.newCharReader());
    if (!reader->parse(contents.data(), contents.data() + contents.size(), &config_json, &errs)) {
        RTC_LOG(LS_ERROR) << "Failed to parse config file " << opts.config_path << ": " << errs;
        return;
    }
    if (!config_json.isObject()) {
        RTC_LOG(LS_ERROR) << "Config file root must be an object";
        return;
    }

    for (const char* key : kStringKeys) {
        if (config_json.isMember(key) && config_json[key].isString()) {
            RTC_LOG(LS_INFO) << "Config " << key << ": " << config_json[key].asString();
            applyStringOption(opts, key, config_json[key].asString());
        }
    }
    for (const char* key : kIntKeys) {
        if (config_json.isMember(key) && config_json[key].isIntegral()) {
            RTC_LOG(LS_INFO) << "Config " << key << ": " << config_json[key].asInt64();
            applyIntOption(opts, key, std::to_string(config_json[key].asInt64()));
        }
    }
    if (config_json.isMember("video") && config_json["video"].isBool()) {
        opts.video = config_json["video"].asBool();
    }
    if (config_json.isMember("encryption") && config_json["encryption"].isBool()) {
        opts.encryption = config_json["encryption"].asBool();
    }
    if (config_json.isMember("turns") && config_json["turns"].isArray()) {
        // Expect [ uri, username, password ]
        const Json::Value& t = config_json["turns"];
        if (t.size() == 3 && t[0].isString() && t[1].isString() && t[2].isString()) {
            opts.turns = t[0].asString() + "," + t[1].asString() + "," + t[2].asString();
            RTC_LOG(LS_INFO) << "Config turns array joined";
        } else {
            RTC_LOG(LS_WARNING) << "`turns` array has unexpected structure; expecting 3 strings (uri, user, pass). Ignored.";
        }
    }
}

}  // namespace

// Function to parse IP address and port from a string in the format "IP:PORT"
bool ParseIpAndPort(const std::string& ip_port, std::string& ip, int& port) {
  size_t colon_pos = ip_port.rfind(':');
  if (colon_pos == std::string::npos) {
    RTC_LOG(LS_ERROR) << "Invalid IP:PORT format: " << ip_port;
    return false;
  }

  ip = ip_port.substr(0, colon_pos);
  int64_t port_val = 0;
  if (!parseInt64(ip_port.substr(colon_pos + 1), &port_val)) {
    return false;
  }

  // Check port range
  if (port_val <= 0 || port_val > 65535) {
    RTC_LOG(LS_ERROR) << "Invalid port range: " << port_val;
    return false;
  }

  port = static_cast<int>(port_val);
  return true;
}

// Basic split that honours quotes, only used for cmd-line string variant.
std::vector<std::string> stringSplit(std::string input, std::string delimiter)
{
    if (delimiter != " ") {
        std::vector<std::string> tokens;
        size_t pos = 0;
        while((pos = input.find(delimiter)) != std::string::npos){
            tokens.push_back(input.substr(0, pos));
            input.erase(0, pos + delimiter.size());
        }
        tokens.push_back(input);
        return tokens;
    }

    std::vector<std::string> tokens;
    std::string current;
    bool in_quotes = false;
    for (char c : input) {
        if (c == '"') {
            in_quotes = !in_quotes;
            continue; // drop the quote char itself
        }
        if (c == ' ' && !in_quotes) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) tokens.push_back(current);
    return tokens;
}

PEERCALL_API Options parseOptions(const char* argString) {
  std::vector<std::string> args = stringSplit(argString, " ");
  return parseOptions(args);
}

// Function to parse command line string to above options
Options parseOptions(const std::vector<std::string>& args) {
  Options opts;
  opts.help_string =
      "Usage:\n"
      "peercall [options] server:port [options]\n\n"
      "Options:\n"
      "  --config <path>                    Load options from JSON config file.\n"
      "                                     Command-line options override config file.\n"
      "  --mode=<call|answer|group|send|receive>  Operation mode (default: answer)\n"
      "  --user_name=<name>                 Your user name for registration\n"
      "  --target_name=<name>               Peer to call or send a file to\n"
      "  --group_name=<name>                Group call to join (group mode)\n"
      "  --file=<path>                      File to send (send mode)\n"
      "  --video, --no-video                Enable/disable video (default: disabled)\n"
      "  --encryption, --no-encryption      wss:// or ws:// signaling (default: wss)\n"
      "  --turns=<uri,username,password>    TURN server, e.g. \n"
      "   'turns:global.relay.metered.ca:443?transport=tcp,<username>,<password>'\n"
      "  --state_path=<path>                Transfer checkpoint file (default: peercall_state.json)\n"
      "  --download_dir=<path>              Where received files are written (default: .)\n"
      "  --capability=<memory|disk>         Receive into memory or stream to disk (default: memory)\n"
      "  --max_file_size=<bytes>            Override the receivable size cap\n"
      "  --ice_grace_period_ms=<ms>         Wait before restarting a disconnected link (default: 5000)\n"
      "  --max_reconnect_attempts=<n>       ICE restarts before a link fails (default: 3)\n"
      "  --connecting_timeout_ms=<ms>       Give up on a call that never connects (default: 60000)\n"
      "  --max_group_members=<n>            Group call size cap (default: 6)\n"
      "  --chunk_size=<bytes>               Transfer chunk size, at most 262144 (default: 16384)\n"
      "  --high_water_mark=<bytes>          Pause sending above this buffered amount (default: 4194304)\n"
      "  --low_water_mark=<bytes>           Resume sending below this buffered amount (default: 2097152)\n"
      "  --checkpoint_interval_chunks=<n>   Persist progress every n chunks (default: 200)\n"
      "  --stall_timeout_ms=<ms>            Fail a transfer without progress (default: 30000)\n"
      "  --transfer_connect_timeout_ms=<ms> Fail a transfer that never connects (default: 60000)\n"
      "  --max_concurrent_transfers=<n>     Parallel outgoing transfers (default: 3)\n"
      "  --max_hash_file_size=<bytes>       Largest file that gets a SHA-256 check (default: 524288000)\n"
      "  --max_send_retries=<n>             Chunk send retries (default: 3)\n"
      "  --log_level=<verbose|info|warning|error|none>  Logging level (default: info)\n"
      "  --help                             Show this help message\n\n"
      "Examples:\n"
      "  peercall --config settings.json\n"
      "  peercall --mode=answer --user_name=bob signal.example.com:443\n"
      "  peercall --mode=call --user_name=alice --target_name=bob --video signal.example.com:443\n"
      "  peercall --mode=group --user_name=carol --group_name=standup signal.example.com:443\n"
      "  peercall --mode=send --user_name=alice --target_name=bob --file=${HOME}/movie.mkv signal.example.com:443\n"
      "  peercall --mode=receive --user_name=bob --capability=disk --download_dir=/tmp signal.example.com:443\n"
      ;

  // Set of known options (with and without =)
  const std::unordered_set<std::string> known_flags = {
    "--config", "--video", "--no-video", "--encryption", "--no-encryption", "--help"
  };

  // Helper function to check if string is an address
  auto isAddress = [](const std::string& str) {
    return str.rfind("--", 0) != 0 && str.find(':') != std::string::npos;
  };

  // --- First pass: check for --config ---
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--config" && i + 1 < args.size()) {
      opts.config_path = args[i + 1];
      break;
    } else if (arg.find("--config=") == 0) {
      opts.config_path = arg.substr(9);
      break;
    } else if (arg == "--help") {
      opts.help = true;
      return opts;
    }
  }

  if (!opts.config_path.empty()) {
    loadConfigFile(opts);
  }

  // --- Second pass: command line overrides the config file ---
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--config") {
      ++i;  // value consumed in the first pass
      continue;
    }
    if (arg == "--help") {
      opts.help = true;
    } else if (arg == "--video") {
      opts.video = true;
    } else if (arg == "--no-video") {
      opts.video = false;
    } else if (arg == "--encryption") {
      opts.encryption = true;
    } else if (arg == "--no-encryption") {
      opts.encryption = false;
    } else if (arg.rfind("--", 0) == 0 && arg.find('=') != std::string::npos) {
      size_t eq = arg.find('=');
      std::string key = arg.substr(2, eq - 2);
      std::string value = stripQuotes(arg.substr(eq + 1));
      if (key == "config") {
        continue;
      }
      if (!applyStringOption(opts, key, value) && !applyIntOption(opts, key, value)) {
        RTC_LOG(LS_WARNING) << "Unknown or invalid option: " << arg;
      }
    } else if (isAddress(arg)) {
      opts.server = arg;
    } else if (known_flags.count(arg) == 0) {
      RTC_LOG(LS_WARNING) << "Unknown option: " << arg;
    }
  }

  // Load environment variables if not provided
  if (opts.server.empty()) {
    if (const char* env_server = std::getenv("PEERCALL_SERVER")) {
      opts.server = env_server;
    }
  }
  if (opts.user_name.empty()) {
    if (const char* env_user = std::getenv("PEERCALL_USER")) {
      opts.user_name = env_user;
    }
  }
  if (const char* env_dir = std::getenv("PEERCALL_DOWNLOAD_DIR")) {
    if (opts.download_dir == ".") {
      opts.download_dir = env_dir;
    }
  }
  if (const char* env_level = std::getenv("PEERCALL_LOG_LEVEL")) {
    if (opts.log_level == "info") {
      opts.log_level = env_level;
    }
  }

  if (opts.low_water_mark >= opts.high_water_mark) {
    RTC_LOG(LS_WARNING) << "low_water_mark must be below high_water_mark, using half of it";
    opts.low_water_mark = opts.high_water_mark / 2;
  }
  if (opts.chunk_size > static_cast<int>(kMaxChunkSize)) {
    RTC_LOG(LS_WARNING) << "chunk_size " << opts.chunk_size << " is above the limit, using "
                        << kMaxChunkSize;
    opts.chunk_size = static_cast<int>(kMaxChunkSize);
  }

  return opts;
}

std::string getUsage(const Options& opts) {
  std::stringstream usage;

  usage << "\nMode: " << opts.mode << "\n";
  usage << "Server: " << opts.server << (opts.encryption ? " (wss)" : " (ws)") << "\n";
  usage << "User: " << opts.user_name << "\n";
  if (!opts.target_name.empty()) usage << "Target: " << opts.target_name << "\n";
  if (!opts.group_name.empty()) usage << "Group: " << opts.group_name << "\n";
  if (!opts.file.empty()) usage << "File: " << opts.file << "\n";
  usage << "Video: " << (opts.video ? "enabled" : "disabled") << "\n";
  usage << "Capability: " << opts.capability << " (download dir " << opts.download_dir << ")\n";
  usage << "State file: " << opts.state_path << "\n";
  usage << "ICE grace period: " << opts.ice_grace_period_ms << " ms, reconnect attempts: "
        << opts.max_reconnect_attempts << "\n";
  usage << "Connecting timeout: " << opts.connecting_timeout_ms << " ms\n";
  usage << "Chunk size: " << opts.chunk_size << ", water marks: " << opts.low_water_mark
        << "/" << opts.high_water_mark << "\n";
  usage << "Log level: " << opts.log_level << "\n";

  return usage.str();
}

bool LoggingSeverityFromString(const std::string& name, LoggingSeverity* level) {
  if (name == "verbose") *level = LS_VERBOSE;
  else if (name == "info") *level = LS_INFO;
  else if (name == "warning") *level = LS_WARNING;
  else if (name == "error") *level = LS_ERROR;
  else if (name == "none") *level = LS_NONE;
  else return false;
  return true;
}

void SetLoggingLevel(LoggingSeverity level) {
  rtc::LogMessage::LogToDebug(static_cast<rtc::LoggingSeverity>(level));
  rtc::LogMessage::LogTimestamps();
  rtc::LogMessage::LogThreads();
}

CallConfig CallConfigFromOptions(const Options& opts) {
  CallConfig config;
  config.link.ice_grace_period_ms = opts.ice_grace_period_ms;
  config.link.max_reconnect_attempts = opts.max_reconnect_attempts;
  config.connecting_timeout_ms = opts.connecting_timeout_ms;
  config.max_group_members = opts.max_group_members;
  return config;
}

TransferConfig TransferConfigFromOptions(const Options& opts) {
  TransferConfig config;
  config.chunk_size = static_cast<uint32_t>(opts.chunk_size);
  config.high_water_mark = opts.high_water_mark;
  config.low_water_mark = opts.low_water_mark;
  config.checkpoint_interval_chunks = opts.checkpoint_interval_chunks;
  config.stall_timeout_ms = opts.stall_timeout_ms;
  config.connect_timeout_ms = opts.transfer_connect_timeout_ms;
  config.max_concurrent_transfers = opts.max_concurrent_transfers;
  config.max_hash_file_size = opts.max_hash_file_size;
  config.max_send_retries = opts.max_send_retries;
  return config;
}

CapabilityDescriptor CapabilityFromOptions(const Options& opts) {
  CapabilityDescriptor capability = opts.capability == "disk"
      ? CapabilityDescriptor::StreamingDisk(opts.download_dir)
      : CapabilityDescriptor::MemoryBuffered();
  if (opts.capability != "disk" && opts.capability != "memory") {
    RTC_LOG(LS_WARNING) << "Unknown capability '" << opts.capability << "', using memory";
  }
  if (opts.max_file_size > 0) {
    capability.max_file_size = opts.max_file_size;
  }
  return capability;
}

std::string CreateRandomUuid() {
  return rtc::CreateRandomUuid();
}
