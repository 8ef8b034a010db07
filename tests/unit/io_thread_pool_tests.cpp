#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include "common/utils/io_thread_pool.h"

namespace nodelink::tests {

TEST(IoThreadPoolTest, DefaultConstruction) {
  utils::IoThreadPool pool;
  EXPECT_TRUE(pool.is_running());
  EXPECT_GT(pool.num_threads(), 0U);
}

TEST(IoThreadPoolTest, CustomThreadCount) {
  utils::IoThreadPool pool(4);
  EXPECT_EQ(pool.num_threads(), 4U);
}

TEST(IoThreadPoolTest, RunsPostedHandlers) {
  utils::IoThreadPool pool(2);
  std::promise<int> result;
  boost::asio::post(pool.executor(), [&result] { result.set_value(42); });
  EXPECT_EQ(result.get_future().get(), 42);
}

TEST(IoThreadPoolTest, SpreadsWorkAcrossThreads) {
  utils::IoThreadPool pool(4);
  std::mutex mutex;
  std::set<std::thread::id> threads;
  std::atomic<int> remaining{64};
  std::promise<void> done;

  for (int i = 0; i < 64; ++i) {
    boost::asio::post(pool.executor(), [&] {
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
      {
        std::lock_guard<std::mutex> lock(mutex);
        threads.insert(std::this_thread::get_id());
      }
      if (remaining.fetch_sub(1) == 1) {
        done.set_value();
      }
    });
  }

  done.get_future().wait();
  EXPECT_GT(threads.size(), 1U);
}

TEST(IoThreadPoolTest, StrandSerializesHandlers) {
  utils::IoThreadPool pool(4);
  auto strand = boost::asio::make_strand(pool.executor());
  std::atomic<int> inside{0};
  std::atomic<bool> overlapped{false};
  std::atomic<int> remaining{100};
  std::promise<void> done;

  for (int i = 0; i < 100; ++i) {
    boost::asio::post(strand, [&] {
      if (inside.fetch_add(1) != 0) {
        overlapped = true;
      }
      std::this_thread::yield();
      inside.fetch_sub(1);
      if (remaining.fetch_sub(1) == 1) {
        done.set_value();
      }
    });
  }

  done.get_future().wait();
  EXPECT_FALSE(overlapped.load());
}

TEST(IoThreadPoolTest, WorkerSurvivesThrowingHandler) {
  utils::IoThreadPool pool(1);
  boost::asio::post(pool.executor(), [] { throw std::runtime_error("handler failure"); });

  std::promise<bool> after;
  boost::asio::post(pool.executor(), [&after] { after.set_value(true); });
  auto future = after.get_future();
  ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_TRUE(future.get());
}

TEST(IoThreadPoolTest, ReleaseLetsWorkersDrain) {
  utils::IoThreadPool pool(2);
  std::atomic<int> counter{0};
  for (int i = 0; i < 10; ++i) {
    boost::asio::post(pool.executor(), [&counter] { counter.fetch_add(1); });
  }
  pool.release();
  pool.join();
  EXPECT_EQ(counter.load(), 10);
}

TEST(IoThreadPoolTest, StopIsIdempotent) {
  utils::IoThreadPool pool(2);
  pool.stop();
  EXPECT_FALSE(pool.is_running());
  pool.stop();
  pool.join();
  EXPECT_FALSE(pool.is_running());
}

}  // namespace nodelink::tests
