#include "file_register_reader.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

#include "internal/util/errors.hpp"

namespace brewmon::hardware {

namespace {

std::uint64_t ParseNumber(const std::string& text, const std::string& context, std::uint64_t max) {
  if (text.empty() || text.front() == '-' || text.front() == '+') {
    throw util::HardwareUnavailable("register map: bad number in " + context + ": '" + text + "'");
  }
  try {
    std::size_t consumed = 0;
    auto        value    = std::stoull(text, &consumed, 0);
    if (consumed != text.size()) {
      throw util::HardwareUnavailable("register map: trailing characters in " + context);
    }
    if (value > max) {
      throw util::HardwareUnavailable("register map: value out of range in " + context + ": '" + text + "'");
    }
    return value;
  } catch (const std::logic_error&) {
    throw util::HardwareUnavailable("register map: bad number in " + context + ": '" + text + "'");
  }
}

} // namespace

FileRegisterReader::FileRegisterReader(std::filesystem::path path, std::chrono::milliseconds max_age)
    : path_(std::move(path)), max_age_(max_age) {
}

FileRegisterReader::RegisterMap FileRegisterReader::Load() const {
  std::error_code ec;
  auto            modified = std::filesystem::last_write_time(path_, ec);
  if (ec) {
    throw util::HardwareUnavailable("register map " + path_.string() + ": " + ec.message());
  }

  if (max_age_.count() > 0) {
    auto age = std::filesystem::file_time_type::clock::now() - modified;
    if (age > max_age_) {
      throw util::HardwareUnavailable("register map " + path_.string() + " is stale");
    }
  }

  std::ifstream in(path_);
  if (!in) {
    throw util::HardwareUnavailable("register map " + path_.string() + ": cannot open");
  }

  RegisterMap map;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (auto hash = line.find('#'); hash != std::string::npos) line.erase(hash);

    std::istringstream           tokens(line);
    std::string                  token;
    std::optional<std::uint32_t> group;
    std::optional<std::uint16_t> status;
    const auto                   context = "line " + std::to_string(line_no);

    while (tokens >> token) {
      auto eq = token.find('=');
      if (eq == std::string::npos) {
        throw util::HardwareUnavailable("register map: expected key=value at " + context);
      }
      auto key   = token.substr(0, eq);
      auto value = token.substr(eq + 1);

      if (key == "groups") {
        map.group_count = static_cast<std::uint32_t>(ParseNumber(value, "groups at " + context, UINT32_MAX));
      } else if (key == "group") {
        group = static_cast<std::uint32_t>(ParseNumber(value, "group at " + context, UINT32_MAX));
      } else if (key == "status") {
        status = static_cast<std::uint16_t>(ParseNumber(value, "status at " + context, UINT16_MAX));
      } else {
        throw util::HardwareUnavailable("register map: unknown key '" + key + "' at " + context);
      }
    }

    if (group.has_value() != status.has_value()) {
      throw util::HardwareUnavailable("register map: group and status must appear together at " + context);
    }
    if (group) {
      map.words[*group] = *status;
    }
  }

  return map;
}

FileRegisterReader::RegisterMap FileRegisterReader::Current() {
  std::lock_guard lock(mutex_);
  if (!in_cycle_) {
    return Load();
  }

  if (!cycle_map_ && !cycle_error_) {
    try {
      cycle_map_ = Load();
    } catch (const util::HardwareUnavailable& e) {
      cycle_error_ = e.what();
    }
  }
  if (cycle_error_) {
    throw util::HardwareUnavailable(*cycle_error_);
  }
  return *cycle_map_;
}

void FileRegisterReader::BeginCycle() {
  std::lock_guard lock(mutex_);
  in_cycle_ = true;
  cycle_map_.reset();
  cycle_error_.reset();
}

void FileRegisterReader::EndCycle() {
  std::lock_guard lock(mutex_);
  in_cycle_ = false;
  cycle_map_.reset();
  cycle_error_.reset();
}

RegisterSnapshot FileRegisterReader::Read(std::uint32_t group_id) {
  auto map = Current();
  auto it  = map.words.find(group_id);
  if (it == map.words.end()) {
    throw util::HardwareUnavailable("register map has no entry for group " + std::to_string(group_id));
  }
  return DecodeStatusWord(group_id, it->second, util::Now());
}

std::optional<std::uint32_t> FileRegisterReader::GroupCount() {
  return Current().group_count;
}

} // namespace brewmon::hardware
