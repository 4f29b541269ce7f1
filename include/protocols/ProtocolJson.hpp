#pragma once
/** @file  ProtocolJson.hpp
 *  @brief JSON mapping for protocol files (`"kind": "standard" | "custom" | "wrer"`).
 *
 *  © 2025 The ivseq Authors — MIT-licensed.
 */

#include <nlohmann/json_fwd.hpp>

#include "protocols/Protocol.hpp"

namespace ivseq {
  namespace protocols {

    void from_json(const nlohmann::json& j, StandardSweep& p);
    void from_json(const nlohmann::json& j, CustomSegment& s);
    void from_json(const nlohmann::json& j, CustomSequence& p);
    void from_json(const nlohmann::json& j, Wrer& p);

    /// Dispatches on "kind". Unknown kinds and mistyped fields throw
    /// core::SequenceError(InvalidProtocolParameters).
    Protocol protocolFromJson(const nlohmann::json& j);

  } // namespace protocols
} // namespace ivseq
