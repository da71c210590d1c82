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

#ifndef PEERCALL_BYTE_TRANSPORT_H_
#define PEERCALL_BYTE_TRANSPORT_H_

#include <cstdint>
#include <memory>
#include <string>

#include <json/json.h>

// Events from a byte transport, delivered on the owner's event loop.
class ByteTransportObserver {
 public:
  virtual ~ByteTransportObserver() = default;

  virtual void OnTransportOpen() = 0;
  // `error` distinguishes a failure from an orderly close.
  virtual void OnTransportClosed(bool error) = 0;
  // Buffered amount fell to or below the low-water mark.
  virtual void OnTransportDrained() = 0;
  virtual void OnTransportMessage(const uint8_t* data, size_t size) = 0;
};

// Ordered, reliable binary channel to one peer for one transfer.
class ByteTransport {
 public:
  virtual ~ByteTransport() = default;

  // Starts connecting. The initiating side produces the first offer.
  virtual void Open() = 0;
  // Queues one frame. False when the channel refused it.
  virtual bool Send(const uint8_t* data, size_t size) = 0;
  virtual uint64_t buffered_amount() const = 0;
  virtual void SetLowWaterMark(uint64_t bytes) = 0;
  virtual bool is_open() const = 0;
  // Re-runs connectivity establishment, keeping the observer.
  virtual void Restart() = 0;
  virtual void Close() = 0;

  // Payload of a transfer.signal message for this transport.
  virtual void HandleSignal(const Json::Value& payload) = 0;
};

class ByteTransportFactory {
 public:
  virtual ~ByteTransportFactory() = default;

  virtual std::unique_ptr<ByteTransport> Create(const std::string& peer_id,
                                                const std::string& transfer_id,
                                                bool initiator,
                                                ByteTransportObserver* observer) = 0;
};

#endif  // PEERCALL_BYTE_TRANSPORT_H_
