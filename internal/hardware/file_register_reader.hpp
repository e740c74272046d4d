#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>

#include "register_reader.hpp"

namespace brewmon::hardware {

/*
  Reads the register map a fieldbus bridge process keeps on disk.

  Format, one entry per line:

      # comment
      groups=3
      group=1 status=0x0000
      group=2 status=4

  Numbers accept decimal or 0x-prefixed hex. Outside a cycle the file is
  re-read on every call; inside BeginCycle()/EndCycle() it is loaded once
  and every group comes from that version. Missing, unparsable or stale
  (older than max_age) files raise util::HardwareUnavailable; so does a
  group with no line.
*/
class FileRegisterReader final : public RegisterReader {
 public:
  // max_age of zero disables the staleness check.
  FileRegisterReader(std::filesystem::path path, std::chrono::milliseconds max_age);

  RegisterSnapshot             Read(std::uint32_t group_id) override;
  std::optional<std::uint32_t> GroupCount() override;

  void BeginCycle() override;
  void EndCycle() override;

 private:
  struct RegisterMap {
    std::optional<std::uint32_t>           group_count;
    std::map<std::uint32_t, std::uint16_t> words;
  };

  RegisterMap Load() const;
  RegisterMap Current();

  std::filesystem::path     path_;
  std::chrono::milliseconds max_age_;

  std::mutex                 mutex_;
  bool                       in_cycle_ = false;
  std::optional<RegisterMap> cycle_map_;
  std::optional<std::string> cycle_error_;
};

} // namespace brewmon::hardware
