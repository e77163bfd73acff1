#include "test_support.hpp"

#include "../include/concurrent/lockfree_queue.hpp"
#include "../include/concurrent/request_processor.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace cinema;
using namespace cinema::test;

using ConcurrencyTest = LedgerTest;

TEST_F(ConcurrencyTest, ConcurrentReservesForOneSeat) {
  ScheduleView schedule = makeSchedule();
  const int num_callers = 32;
  std::vector<Id> accounts;
  for (int i = 0; i < num_callers; ++i) {
    accounts.push_back(makeAccount("caller" + std::to_string(i)).id);
  }

  std::atomic<int> succeeded{0};
  std::atomic<int> seat_taken{0};
  std::atomic<int> other{0};
  std::atomic<bool> go{false};

  std::vector<std::thread> threads;
  for (int i = 0; i < num_callers; ++i) {
    threads.emplace_back([&, i]() {
      while (!go.load()) {
        std::this_thread::yield();
      }
      try {
        reservations_.Reserve(schedule.schedule.id, accounts[i], "A1");
        succeeded.fetch_add(1);
      } catch (const BookingError& e) {
        if (e.kind() == ErrorKind::SEAT_TAKEN) {
          seat_taken.fetch_add(1);
        } else {
          other.fetch_add(1);
        }
      }
    });
  }
  go = true;
  for (auto& t : threads) t.join();

  EXPECT_EQ(succeeded.load(), 1);
  EXPECT_EQ(seat_taken.load(), num_callers - 1);
  EXPECT_EQ(other.load(), 0);
  EXPECT_EQ(reservations_.List().size(), 1u);
  EXPECT_EQ(metrics_.counterValue(observability::metric::kSeatConflicts),
            static_cast<double>(num_callers - 1));
}

TEST_F(ConcurrencyTest, ConcurrentSuccessPaymentsForOneBooking) {
  ScheduleView schedule = makeSchedule();
  AccountView payer = makeAccount("johndoe");
  BookingView booking = reservations_.Reserve(schedule.schedule.id, payer.id, "A1");

  const int num_callers = 16;
  std::atomic<int> succeeded{0};
  std::atomic<int> already_paid{0};
  std::atomic<bool> go{false};

  std::vector<std::thread> threads;
  for (int i = 0; i < num_callers; ++i) {
    threads.emplace_back([&]() {
      while (!go.load()) {
        std::this_thread::yield();
      }
      try {
        payments_.Record(paymentFor(booking, PaymentStatus::SUCCESS));
        succeeded.fetch_add(1);
      } catch (const BookingError& e) {
        if (e.kind() == ErrorKind::ALREADY_PAID) {
          already_paid.fetch_add(1);
        }
      }
    });
  }
  go = true;
  for (auto& t : threads) t.join();

  EXPECT_EQ(succeeded.load(), 1);
  EXPECT_EQ(already_paid.load(), num_callers - 1);
  EXPECT_EQ(payments_.ByBooking(booking.booking.id).size(), 1u);
}

TEST_F(ConcurrencyTest, CancelRacingWithPayment) {
  ScheduleView schedule = makeSchedule();
  AccountView payer = makeAccount("janesmith");

  for (int round = 0; round < 20; ++round) {
    BookingView booking = reservations_.Reserve(schedule.schedule.id, payer.id,
                                                "R" + std::to_string(round));
    std::thread canceller([&]() { reservations_.Cancel(booking.booking.id); });
    bool paid = false;
    try {
      payments_.Record(paymentFor(booking, PaymentStatus::SUCCESS));
      paid = true;
    } catch (const BookingError& e) {
      EXPECT_EQ(e.kind(), ErrorKind::CONFLICT);
    }
    canceller.join();

    // Either the payment landed while the booking was active, or nothing did.
    EXPECT_EQ(payments_.ByBooking(booking.booking.id).size(), paid ? 1u : 0u);
    EXPECT_EQ(reservations_.Get(booking.booking.id).booking.status, BookingStatus::CANCELLED);
  }
}

TEST_F(ConcurrencyTest, ReservesThroughRequestProcessor) {
  ScheduleView schedule = makeSchedule();
  const int num_callers = 24;
  std::vector<Id> accounts;
  for (int i = 0; i < num_callers; ++i) {
    accounts.push_back(makeAccount("queued" + std::to_string(i)).id);
  }

  concurrent::RequestProcessor processor(4, &metrics_);
  ASSERT_TRUE(processor.start());

  std::vector<std::future<BookingView>> futures;
  for (int i = 0; i < num_callers; ++i) {
    Id account = accounts[i];
    futures.push_back(processor.submit([this, &schedule, account]() {
      return reservations_.Reserve(schedule.schedule.id, account, "B7");
    }));
  }

  int succeeded = 0;
  int seat_taken = 0;
  for (auto& future : futures) {
    try {
      future.get();
      ++succeeded;
    } catch (const BookingError& e) {
      EXPECT_EQ(e.kind(), ErrorKind::SEAT_TAKEN);
      ++seat_taken;
    }
  }
  processor.stop();

  EXPECT_EQ(succeeded, 1);
  EXPECT_EQ(seat_taken, num_callers - 1);

  auto stats = processor.getStats();
  EXPECT_EQ(stats.requests_processed, static_cast<std::size_t>(num_callers));
  EXPECT_EQ(stats.requests_queued, 0u);
  EXPECT_EQ(metrics_.gaugeValue(observability::metric::kQueuedRequests), 0.0);
}

TEST(RequestProcessorTest, SubmitRequiresRunningProcessor) {
  concurrent::RequestProcessor processor(2);
  EXPECT_FALSE(processor.isRunning());
  EXPECT_THROW(processor.submit([]() { return 1; }), std::runtime_error);

  processor.start();
  EXPECT_EQ(processor.submit([]() { return 6 * 7; }).get(), 42);
  processor.stop();
  EXPECT_FALSE(processor.isRunning());
}

TEST(RequestProcessorTest, StopDrainsAcceptedWork) {
  concurrent::RequestProcessor processor(2);
  processor.start();

  std::atomic<int> ran{0};
  std::vector<std::future<void>> futures;
  for (int i = 0; i < 200; ++i) {
    futures.push_back(processor.submit([&ran]() { ran.fetch_add(1); }));
  }
  processor.stop();

  EXPECT_EQ(ran.load(), 200);
  for (auto& future : futures) {
    EXPECT_NO_THROW(future.get());
  }
}

TEST(RequestProcessorTest, SubmitRacingStopNeverStrandsWork) {
  for (int round = 0; round < 300; ++round) {
    concurrent::RequestProcessor processor(1);
    processor.start();

    std::vector<std::future<int>> accepted;
    std::thread submitter([&]() {
      while (true) {
        try {
          accepted.push_back(processor.submit([round]() { return round; }));
        } catch (const std::runtime_error&) {
          break;
        }
      }
    });

    std::this_thread::sleep_for(std::chrono::microseconds(round % 50));
    processor.stop();
    submitter.join();

    // Every submission that was not refused has already produced its value.
    for (auto& future : accepted) {
      ASSERT_EQ(future.wait_for(std::chrono::seconds(0)), std::future_status::ready)
          << "round " << round;
      EXPECT_EQ(future.get(), round);
    }
  }
}

// Lock-free queue tests
TEST(LockFreeQueueTest, BasicOperations) {
  concurrent::LockFreeQueue<int> queue;
  EXPECT_TRUE(queue.empty());

  queue.enqueue(42);
  queue.enqueue(24);
  EXPECT_EQ(queue.size(), 2u);

  auto result1 = queue.dequeue();
  ASSERT_TRUE(result1.has_value());
  EXPECT_EQ(*result1, 42);

  auto result2 = queue.dequeue();
  ASSERT_TRUE(result2.has_value());
  EXPECT_EQ(*result2, 24);

  // Queue should be empty
  EXPECT_FALSE(queue.dequeue().has_value());
  EXPECT_TRUE(queue.empty());
}

TEST(LockFreeQueueTest, ManyProducersOneConsumer) {
  concurrent::LockFreeQueue<int> queue;
  const int num_producers = 4;
  const int items_per_producer = 1000;
  const int total = num_producers * items_per_producer;

  std::vector<std::thread> producers;
  for (int p = 0; p < num_producers; ++p) {
    producers.emplace_back([&queue, p]() {
      for (int i = 0; i < items_per_producer; ++i) {
        queue.enqueue(p * items_per_producer + i);
      }
    });
  }

  // Per-producer order must survive.
  std::vector<int> last_seen(num_producers, -1);
  int consumed = 0;
  while (consumed < total) {
    if (auto item = queue.dequeue()) {
      int producer = *item / items_per_producer;
      EXPECT_GT(*item, last_seen[producer]);
      last_seen[producer] = *item;
      ++consumed;
    } else {
      std::this_thread::yield();
    }
  }

  for (auto& t : producers) t.join();
  EXPECT_EQ(consumed, total);
  EXPECT_TRUE(queue.empty());
}
