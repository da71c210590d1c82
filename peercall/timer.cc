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

#include <utility>

#include "timer.h"

void OneShotTimer::Start(webrtc::TimeDelta delay, std::function<void()> task) {
  Stop();
  flag_ = webrtc::PendingTaskSafetyFlag::CreateDetached();
  loop_->PostDelayedTask(
      webrtc::SafeTask(flag_,
                       [this, task = std::move(task)]() {
                         // Cleared first so the task may re-arm this timer.
                         flag_ = nullptr;
                         task();
                       }),
      delay);
}

void OneShotTimer::Stop() {
  if (flag_) {
    flag_->SetNotAlive();
    flag_ = nullptr;
  }
}
