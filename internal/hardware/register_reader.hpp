#pragma once

#include <cstdint>
#include <optional>

#include "register_snapshot.hpp"

namespace brewmon::hardware {

/*
  Hardware status source.

  Read() is a pure query: no caching, no side effects on the machine.
  Throws util::HardwareUnavailable when the group cannot be read.

  Implementations:
    simulated      → in-process register bank (tests, bench setups)
    register_file  → text register map written by a fieldbus bridge
*/
class RegisterReader {
 public:
  virtual ~RegisterReader() = default;

  virtual RegisterSnapshot Read(std::uint32_t group_id) = 0;

  // Number of groups the machine reports, if known. May throw
  // util::HardwareUnavailable.
  virtual std::optional<std::uint32_t> GroupCount() = 0;

  // Bracket one poll cycle. Between the two calls every Read() and
  // GroupCount() answers from the same source state.
  virtual void BeginCycle() {}
  virtual void EndCycle() {}
};

} // namespace brewmon::hardware
