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

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "rtc_base/logging.h"

#include "config.h"

#ifndef PEERCALL_EXPORT_H
#define PEERCALL_EXPORT_H

#if defined(__GNUC__)
    #define PEERCALL_EXPORT __attribute__((visibility("default")))
#else
    #define PEERCALL_EXPORT
#endif

#define PEERCALL_API PEERCALL_EXPORT

enum LoggingSeverity {
  LS_VERBOSE,
  LS_INFO,
  LS_WARNING,
  LS_ERROR,
  LS_NONE,
};

#define AS_VERBOSE LS_VERBOSE
#define AS_INFO LS_INFO
#define AS_WARNING LS_WARNING
#define AS_ERROR LS_ERROR
#define AS_NONE LS_NONE
#define APP_LOG(x) RTC_LOG(x)

#endif // PEERCALL_EXPORT_H

// Command line options
struct Options {
    std::string mode = "answer";  // call | answer | group | send | receive
    bool encryption = true;       // wss:// to the signaling server
    bool video = false;
    bool help = false;
    std::string help_string;
    std::string config_path = "";  // Path to JSON config file
    std::string server = "";       // host:port of the signaling server
    std::string user_name;
    std::string target_name;
    std::string group_name;
    std::string file;
    std::string turns = "";
    std::string state_path = "peercall_state.json";
    std::string download_dir = ".";
    std::string capability = "memory";  // memory | disk
    uint64_t max_file_size = 0;         // 0: default for the capability

    // Call tuning
    int ice_grace_period_ms = 5000;
    int max_reconnect_attempts = 3;
    int connecting_timeout_ms = 60000;
    int max_group_members = 6;

    // Transfer tuning
    int chunk_size = 16384;
    uint64_t high_water_mark = 4 * kMiB;
    uint64_t low_water_mark = 2 * kMiB;
    int checkpoint_interval_chunks = 200;
    int stall_timeout_ms = 30000;
    int transfer_connect_timeout_ms = 60000;
    int max_concurrent_transfers = 3;
    uint64_t max_hash_file_size = 500 * kMiB;
    int max_send_retries = 3;

    std::string log_level = "info";
};

// Function to parse command line string to above options
PEERCALL_API Options parseOptions(const char* argString);
Options parseOptions(const std::vector<std::string>& args);

bool ParseIpAndPort(const std::string& ip_port, std::string& ip, int& port);

// Function to get command line options to a string, to print
PEERCALL_API std::string getUsage(const Options& opts);

PEERCALL_API bool LoggingSeverityFromString(const std::string& name,
                                            LoggingSeverity* level);
PEERCALL_API void SetLoggingLevel(LoggingSeverity level);

PEERCALL_API CallConfig CallConfigFromOptions(const Options& opts);
PEERCALL_API TransferConfig TransferConfigFromOptions(const Options& opts);
PEERCALL_API CapabilityDescriptor CapabilityFromOptions(const Options& opts);

PEERCALL_API std::string CreateRandomUuid();
