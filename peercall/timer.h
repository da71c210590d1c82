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

#ifndef PEERCALL_TIMER_H_
#define PEERCALL_TIMER_H_

#include <functional>

#include "api/scoped_refptr.h"
#include "api/task_queue/pending_task_safety_flag.h"
#include "api/task_queue/task_queue_base.h"
#include "api/units/time_delta.h"

// Delayed task on the event loop that can be cancelled or re-armed. A
// stopped (or destroyed) timer never runs its task.
class OneShotTimer {
 public:
  explicit OneShotTimer(webrtc::TaskQueueBase* loop) : loop_(loop) {}
  ~OneShotTimer() { Stop(); }

  OneShotTimer(const OneShotTimer&) = delete;
  OneShotTimer& operator=(const OneShotTimer&) = delete;

  void Start(webrtc::TimeDelta delay, std::function<void()> task);
  void Stop();
  bool IsRunning() const { return flag_ != nullptr; }

 private:
  webrtc::TaskQueueBase* loop_;
  rtc::scoped_refptr<webrtc::PendingTaskSafetyFlag> flag_;
};

#endif  // PEERCALL_TIMER_H_
