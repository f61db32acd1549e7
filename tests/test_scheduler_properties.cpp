#include "settlesim/core/scheduler.h"
#include "settlesim/core/storage_ledger.h"
#include "settlesim/util/hash_rng.h"
#include "settlesim/util/time.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <array>
#include <map>

using namespace settlesim;

namespace {

constexpr Millis kDayStart = 1772323200000LL; // 2026-03-01T00:00:00Z

std::map<Phase, int> count_fires(WallClockScheduler& sched, Millis from, Millis to, Millis step) {
  std::map<Phase, int> fires;
  for (Millis t = from; t < to; t += step) {
    for (Phase p : sched.due_phases(t)) ++fires[p];
  }
  return fires;
}

} // namespace

TEST_CASE("Default schedule fires the expected number of times per day") {
  WallClockScheduler sched;
  const auto fires = count_fires(sched, kDayStart, kDayStart + 24 * kMsPerHour, 250);

  CHECK(fires.at(Phase::Production) == 24);
  CHECK(fires.at(Phase::Population) == 24);
  CHECK(fires.at(Phase::PassiveRepair) == 24);
  CHECK(fires.at(Phase::DisasterCheck) == 96);
  CHECK(fires.at(Phase::DisasterProgress) == 144);
}

TEST_CASE("Fire counts do not depend on the polling interval") {
  for (Millis step : {1000LL, 333LL, 97LL}) {
    WallClockScheduler sched;
    const auto fires = count_fires(sched, kDayStart, kDayStart + 6 * kMsPerHour, step);
    CHECK(fires.at(Phase::Production) == 6);
    CHECK(fires.at(Phase::DisasterCheck) == 24);
    CHECK(fires.at(Phase::DisasterProgress) == 36);
  }
}

TEST_CASE("Schedulers started at different moments agree on due phases") {
  WallClockScheduler early;
  WallClockScheduler late;
  // The late scheduler only starts polling at 07:13:21.
  (void)count_fires(early, kDayStart, kDayStart + 7 * kMsPerHour + 13 * kMsPerMinute + 21 * kMsPerSecond, 1000);

  const Millis from = kDayStart + 7 * kMsPerHour + 13 * kMsPerMinute + 21 * kMsPerSecond;
  for (Millis t = from; t < from + 2 * kMsPerHour; t += kMsPerSecond) {
    REQUIRE(early.due_phases(t) == late.due_phases(t));
  }
}

TEST_CASE("next_due points at the next second with a due phase") {
  const WallClockScheduler sched;
  Millis t = kDayStart + 17 * kMsPerSecond + 450;
  for (int i = 0; i < 20; ++i) {
    const Millis next = sched.next_due(t);
    REQUIRE(next > t);
    REQUIRE(next % kMsPerSecond == 0);
    REQUIRE_FALSE(sched.peek_due(next).empty());
    for (Millis s = (epoch_seconds(t) + 1) * kMsPerSecond; s < next; s += kMsPerSecond) {
      REQUIRE(sched.peek_due(s).empty());
    }
    t = next;
  }
}

TEST_CASE("Ledger keeps every amount within capacity and accounts for waste") {
  util::HashRng rng(0xC0FFEEULL);
  Storage storage;
  for (Resource r : kAllResources) storage[r].capacity = 500.0;

  for (int step = 0; step < 500; ++step) {
    ResourceDelta delta;
    for (Resource r : kAllResources) delta[r] = (rng.next_u01() - 0.45) * 400.0;

    const LedgerResult res = apply_delta(storage, delta);
    for (Resource r : kAllResources) {
      const double raw = storage[r].amount + delta[r];
      REQUIRE(res.storage[r].amount >= 0.0);
      REQUIRE(res.storage[r].amount <= res.storage[r].capacity);
      REQUIRE(res.waste[r] >= 0.0);
      if (raw > 500.0) {
        CHECK(res.storage[r].amount + res.waste[r] == Catch::Approx(raw));
      } else {
        CHECK(res.waste[r] == 0.0);
      }
    }
    storage = res.storage;
  }
}
