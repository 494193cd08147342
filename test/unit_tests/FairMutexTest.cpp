#include "FairMutex.hpp"

#include "TestHeaders.hpp"

using namespace tt;

namespace {
void waitForContention(FairMutex<vector<int>>* fm, uint64_t expected) {
  while (fm->contention() < expected) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
}
}  // namespace

TEST_CASE("Guard gives exclusive access to the value", "[FairMutex]") {
  FairMutex<vector<int>> fm(3, 7);
  {
    auto guard = fm.lock();
    REQUIRE(guard->size() == 3);
    (*guard)[0] = 1;
    REQUIRE(fm.contention() == 1);
  }
  REQUIRE(fm.contention() == 0);
  auto guard = fm.lock();
  REQUIRE((*guard)[0] == 1);
  REQUIRE((*guard)[1] == 7);
}

TEST_CASE("Waiters are served in arrival order", "[FairMutex]") {
  FairMutex<vector<int>> fm;
  vector<thread> waiters;
  {
    auto guard = fm.lock();
    for (int a = 0; a < 5; a++) {
      waiters.emplace_back([&fm, a]() {
        auto g = fm.lock();
        g->push_back(a);
      });
      // Make sure waiter a holds its ticket before the next one starts
      waitForContention(&fm, uint64_t(a) + 2);
    }
  }
  for (auto& t : waiters) {
    t.join();
  }
  auto guard = fm.lock();
  REQUIRE(*guard == vector<int>{0, 1, 2, 3, 4});
}

TEST_CASE("A busy writer cannot starve another thread", "[FairMutex]") {
  FairMutex<vector<int>> fm;
  std::atomic<bool> done(false);
  thread writer([&fm, &done]() {
    while (!done) {
      auto g = fm.lock();
      g->push_back(1);
      if (g->size() > 1000) {
        g->clear();
      }
    }
  });

  for (int a = 0; a < 200; a++) {
    auto g = fm.lock();
    g->push_back(2);
  }
  done = true;
  writer.join();
  REQUIRE(fm.contention() == 0);
}
