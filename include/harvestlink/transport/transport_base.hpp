#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal, engine-agnostic link interface the fetch controller talks through.
 *
 * Header-only on purpose. The engine never opens, pairs, or reconnects a link;
 * it only asks "is it up?" and "send these bytes". The host loop uses
 * recv_frame() to pull notifications and feeds them to the engine.
 */

#include <cstddef>
#include <cstdint>
#include <vector>

namespace harvestlink::transport {

// Return codes kept simple; the engine maps them onto FetchError.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };

// Common link settings; concrete links derive their own (see SerialConfig).
struct Config {
  uint16_t mtu{244};   // BLE ATT payload after MTU exchange
};

/**
 * @brief Link trait every transport can rely on.
 *
 * Contract:
 *  - begin(cfg) opens the underlying device; false if it cannot.
 *  - is_open() is true between a successful begin() and end()/hangup.
 *  - recv_frame(out, timeout_ms) waits up to timeout_ms for ONE whole
 *    notification frame. None = timeout, Error = link lost (caller treats
 *    it as a disconnect).
 *  - send(buf,len) writes one whole frame; never loops forever (Busy if the
 *    driver would block).
 *  - name() is a short identifier for logs/diagnostics.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual bool      begin(const Config& cfg) = 0;
  virtual void      end() = 0;
  virtual bool      is_open() const = 0;
  virtual RxResult  recv_frame(std::vector<uint8_t>& out, int timeout_ms) = 0;
  virtual TxResult  send(const uint8_t* data, std::size_t len) = 0;
  virtual const char* name() const = 0;
  virtual std::size_t mtu() const = 0;
};

} // namespace harvestlink::transport
