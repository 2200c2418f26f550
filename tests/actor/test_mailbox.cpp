#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>
#include "quote_ngin/actor/mailbox.hpp"

using namespace quote_ngin;

class MailboxTest : public ::testing::Test {};

TEST_F(MailboxTest, DeliversInFifoOrder) {
    Mailbox mailbox(8);
    std::vector<int> order;

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(mailbox.post([&order, i]() { order.push_back(i); }).is_ok());
    }
    EXPECT_EQ(mailbox.size(), 3u);

    Task task;
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(mailbox.pop(task));
        task();
    }
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
}

TEST_F(MailboxTest, RejectsWhenFull) {
    Mailbox mailbox(2);
    ASSERT_TRUE(mailbox.post([]() {}).is_ok());
    ASSERT_TRUE(mailbox.post([]() {}).is_ok());

    auto result = mailbox.post([]() {});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::MAILBOX_FULL);
}

TEST_F(MailboxTest, ZeroCapacityHoldsOneTask) {
    Mailbox mailbox(0);
    EXPECT_EQ(mailbox.capacity(), 1u);
    EXPECT_TRUE(mailbox.post([]() {}).is_ok());
    EXPECT_TRUE(mailbox.post([]() {}).is_error());
}

TEST_F(MailboxTest, DrainsAfterClose) {
    Mailbox mailbox;
    int ran = 0;
    ASSERT_TRUE(mailbox.post([&ran]() { ++ran; }).is_ok());
    ASSERT_TRUE(mailbox.post([&ran]() { ++ran; }).is_ok());
    mailbox.close();

    auto rejected = mailbox.post([&ran]() { ++ran; });
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error()->code(), ErrorCode::MAILBOX_CLOSED);

    Task task;
    while (mailbox.pop(task)) {
        task();
    }
    EXPECT_EQ(ran, 2);
    EXPECT_TRUE(mailbox.is_closed());
}

TEST_F(MailboxTest, CloseWakesBlockedConsumer) {
    Mailbox mailbox;
    std::atomic<bool> returned{false};

    std::thread consumer([&]() {
        Task task;
        EXPECT_FALSE(mailbox.pop(task));
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(returned);
    mailbox.close();
    consumer.join();
    EXPECT_TRUE(returned);
}

TEST_F(MailboxTest, ConcurrentProducers) {
    Mailbox mailbox(10000);
    std::atomic<int> sum{0};

    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&mailbox, &sum]() {
            for (int i = 0; i < 250; ++i) {
                EXPECT_TRUE(mailbox.post([&sum]() { sum++; }).is_ok());
            }
        });
    }
    for (auto& t : producers) {
        t.join();
    }
    mailbox.close();

    Task task;
    while (mailbox.pop(task)) {
        task();
    }
    EXPECT_EQ(sum, 1000);
}
