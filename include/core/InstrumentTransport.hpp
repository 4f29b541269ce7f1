#pragma once
/** @file  InstrumentTransport.hpp
 *  @brief Primitive SMU operations the sequencing engine consumes.
 *
 *  © 2025 The ivseq Authors — MIT-licensed.
 */

#include <vector>

#include "protocols/Response.hpp"
#include "protocols/TspScript.hpp"

namespace ivseq::core {

  /**
 * @class InstrumentTransport
 * @brief Abstract single-channel source-measure unit.
 *
 *  * Every call either succeeds or throws `core::TransportError`.
 *  * `forceZero()` is best-effort and idempotent: level 0 V, output off.
 *  * Implementations need not be thread-safe; the SequenceController
 *    serialises access.
 */
  class InstrumentTransport {
  public:
    virtual ~InstrumentTransport() = default;

    virtual void applyVoltage(double volts) = 0;
    virtual double readCurrent() = 0; ///< amps
    virtual void setCompliance(double microAmps) = 0;

    virtual bool supportsScripts() const = 0;
    virtual void runScript(const protocols::DeviceScript& script) = 0; ///< blocks until done
    virtual std::vector<protocols::BufferPoint> fetchBuffer() = 0;

    virtual void forceZero() = 0;
  };

} // namespace ivseq::core
