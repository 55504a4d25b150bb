#include <catch2/catch_all.hpp>

#include "ThreadPool.h"

#include <atomic>
#include <chrono>
#include <thread>

namespace scope {

TEST_CASE("thread pool runs queued tasks", "[ThreadPool]")
{
   std::atomic<int> count(0);
   {
      ThreadPool pool(4);
      CHECK(pool.GetSize() == 4);
      for (int i = 0; i < 100; ++i)
         REQUIRE(pool.Execute([&count] { ++count; }));

      const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
      while (count < 100 && std::chrono::steady_clock::now() < deadline)
         std::this_thread::sleep_for(std::chrono::milliseconds(1));
   }
   CHECK(count == 100);
}

TEST_CASE("thread pool has at least one thread", "[ThreadPool]")
{
   ThreadPool pool(0);
   CHECK(pool.GetSize() == 1);
}

TEST_CASE("thread pool refuses tasks after shutdown", "[ThreadPool]")
{
   ThreadPool pool(2);
   pool.Shutdown();
   pool.Shutdown();
   CHECK_FALSE(pool.Execute([] {}));
   CHECK(pool.GetQueuedCount() == 0);
}

TEST_CASE("thread pool refuses empty tasks", "[ThreadPool]")
{
   ThreadPool pool(1);
   CHECK_FALSE(pool.Execute(ThreadPool::Task()));
}

TEST_CASE("thread pool shutdown waits for running tasks", "[ThreadPool]")
{
   std::atomic<bool> started(false);
   std::atomic<bool> finished(false);
   ThreadPool pool(1);
   REQUIRE(pool.Execute([&] {
      started = true;
      std::this_thread::sleep_for(std::chrono::milliseconds(30));
      finished = true;
   }));
   while (!started)
      std::this_thread::sleep_for(std::chrono::milliseconds(1));

   pool.Shutdown();
   CHECK(finished);
}

} // namespace scope
