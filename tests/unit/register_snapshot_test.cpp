#include "internal/hardware/register_snapshot.hpp"
#include "internal/hardware/simulated_register_reader.hpp"
#include "internal/util/errors.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using namespace brewmon::hardware;

void TestIdleWordDecodesWithoutHint() {
  const auto at       = brewmon::util::TimePoint{std::chrono::milliseconds(42)};
  const auto snapshot = DecodeStatusWord(2, 0x0000, at);

  assert(snapshot.group_id == 2);
  assert(!snapshot.IsActive());
  assert(!snapshot.coffee_type_hint.has_value());
  assert(snapshot.timestamp == at);
}

void TestDoseBitsMapToCoffeeTypes() {
  assert(CoffeeTypeFromStatusWord(status_bits::kSingleShort) == "single_short");
  assert(CoffeeTypeFromStatusWord(status_bits::kDoubleMedium) == "double_medium");
  assert(CoffeeTypeFromStatusWord(status_bits::kPurge) == kPurgeCoffeeType);

  // lowest set bit wins
  assert(CoffeeTypeFromStatusWord(status_bits::kSingleLong | status_bits::kDoubleLong) == "single_long");
}

void TestBitsOutsideActivityMaskAreIgnored() {
  const auto snapshot = DecodeStatusWord(1, 0xff80, brewmon::util::Now());
  assert(!snapshot.IsActive());
  assert(!snapshot.coffee_type_hint.has_value());

  const auto active = DecodeStatusWord(1, 0xff80 | status_bits::kDoubleShort, brewmon::util::Now());
  assert(active.IsActive());
  assert(active.coffee_type_hint == "double_short");
}

void TestStatusWordForCoffeeTypeInvertsDecode() {
  assert(StatusWordForCoffeeType("double_long") == status_bits::kDoubleLong);
  assert(StatusWordForCoffeeType("purge") == status_bits::kPurge);
  assert(StatusWordForCoffeeType("latte") == 0);
}

void TestSimulatedReaderReportsUnavailableGroups() {
  SimulatedRegisterReader reader(3);
  reader.SetDelivering(1, "single_medium");

  auto snapshot = reader.Read(1);
  assert(snapshot.IsActive());
  assert(snapshot.coffee_type_hint == "single_medium");

  // never set reads idle
  assert(!reader.Read(3).IsActive());

  reader.SetGroupAvailable(2, false);
  bool threw = false;
  try {
    (void)reader.Read(2);
  } catch (const brewmon::util::HardwareUnavailable&) {
    threw = true;
  }
  assert(threw);
  assert(reader.Read(1).IsActive());

  reader.SetAvailable(false);
  threw = false;
  try {
    (void)reader.GroupCount();
  } catch (const brewmon::util::HardwareUnavailable&) {
    threw = true;
  }
  assert(threw);
  assert(reader.ReadCount() == 4);
}

void TestSimulatedReaderUsesInjectedClock() {
  const auto              fixed = brewmon::util::TimePoint{std::chrono::seconds(1'700'000'000)};
  SimulatedRegisterReader reader(std::nullopt, [fixed] { return fixed; });

  assert(!reader.GroupCount().has_value());
  assert(reader.Read(1).timestamp == fixed);
}

} // namespace

int main() {
  TestIdleWordDecodesWithoutHint();
  TestDoseBitsMapToCoffeeTypes();
  TestBitsOutsideActivityMaskAreIgnored();
  TestStatusWordForCoffeeTypeInvertsDecode();
  TestSimulatedReaderReportsUnavailableGroups();
  TestSimulatedReaderUsesInjectedClock();

  std::cout << "brewmon_unit_register_snapshot: pass\n";
  return 0;
}
