/**
 * @file mailbox_test.cpp
 * @brief Mailbox FIFO, bounded policies, suspension, cancellation, close
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "messaging/mailbox.hpp"

namespace {

using namespace agora::messaging;
using namespace std::chrono_literals;

class MailboxTest : public ::testing::Test {
protected:
    Message make(const std::string& content, Performative performative = Performative::INFORM) {
        return Message(sender_, receiver_, performative, content);
    }

    AgentId sender_ = new_agent_id();
    AgentId receiver_ = new_agent_id();
};

TEST_F(MailboxTest, StartsEmpty) {
    Mailbox mailbox;
    EXPECT_TRUE(mailbox.is_empty());
    EXPECT_EQ(mailbox.size(), 0u);
    EXPECT_FALSE(mailbox.try_receive().has_value());
}

TEST_F(MailboxTest, ReceivesInSendOrder) {
    Mailbox mailbox;
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(mailbox.send(make(std::to_string(i))).ok());
    }
    EXPECT_EQ(mailbox.size(), 10u);

    for (int i = 0; i < 10; ++i) {
        auto result = mailbox.receive(WaitOptions::within(100ms));
        ASSERT_TRUE(result.ok());
        EXPECT_EQ(result.message->content(), std::to_string(i));
    }
    EXPECT_TRUE(mailbox.is_empty());
}

TEST_F(MailboxTest, ReceiveTimesOutWhenEmpty) {
    Mailbox mailbox;
    auto start = std::chrono::steady_clock::now();
    auto result = mailbox.receive(WaitOptions::within(50ms));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.status, DeliveryStatus::TIMED_OUT);
    EXPECT_FALSE(result.message.has_value());
    EXPECT_GE(elapsed, 50ms);
    EXPECT_LT(elapsed, 2s);
}

TEST_F(MailboxTest, BlockedReceiveWakesOnSend) {
    Mailbox mailbox;
    ReceiveResult result;

    std::thread consumer([&]() { result = mailbox.receive(WaitOptions::within(5s)); });
    std::this_thread::sleep_for(20ms);
    ASSERT_TRUE(mailbox.send(make("wake")).ok());
    consumer.join();

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.message->content(), "wake");
}

TEST_F(MailboxTest, CancelWakesBlockedReceiverWithoutConsuming) {
    Mailbox mailbox;
    CancellationSource source;
    ReceiveResult result;

    std::thread consumer([&]() {
        result = mailbox.receive(WaitOptions::forever().with_cancel(source.token()));
    });
    std::this_thread::sleep_for(20ms);
    source.cancel();
    consumer.join();

    EXPECT_EQ(result.status, DeliveryStatus::CANCELLED);
    EXPECT_FALSE(result.message.has_value());

    ASSERT_TRUE(mailbox.send(make("later")).ok());
    EXPECT_EQ(mailbox.size(), 1u);
}

TEST_F(MailboxTest, AlreadyCancelledTokenStillDeliversQueuedMessage) {
    Mailbox mailbox;
    CancellationSource source;
    source.cancel();

    auto empty = mailbox.receive(WaitOptions::forever().with_cancel(source.token()));
    EXPECT_EQ(empty.status, DeliveryStatus::CANCELLED);

    ASSERT_TRUE(mailbox.send(make("ready")).ok());
    auto ready = mailbox.receive(WaitOptions::forever().with_cancel(source.token()));
    ASSERT_TRUE(ready.ok());
    EXPECT_EQ(ready.message->content(), "ready");
}

TEST_F(MailboxTest, RejectPolicyFailsWhenFull) {
    Mailbox mailbox(MailboxOptions{2, OverflowPolicy::REJECT});
    EXPECT_TRUE(mailbox.send(make("a")).ok());
    EXPECT_TRUE(mailbox.send(make("b")).ok());
    EXPECT_EQ(mailbox.send(make("c")).status, DeliveryStatus::MAILBOX_FULL);
    EXPECT_EQ(mailbox.size(), 2u);

    mailbox.try_receive();
    EXPECT_TRUE(mailbox.send(make("d")).ok());
}

TEST_F(MailboxTest, DropOldestPolicyEvictsHead) {
    Mailbox mailbox(MailboxOptions{2, OverflowPolicy::DROP_OLDEST});
    mailbox.send(make("a"));
    mailbox.send(make("b"));
    EXPECT_TRUE(mailbox.send(make("c")).ok());

    EXPECT_EQ(mailbox.dropped_count(), 1u);
    auto drained = mailbox.drain();
    ASSERT_EQ(drained.size(), 2u);
    EXPECT_EQ(drained[0].content(), "b");
    EXPECT_EQ(drained[1].content(), "c");
}

TEST_F(MailboxTest, BlockPolicyTimesOutAsFull) {
    Mailbox mailbox(MailboxOptions{1, OverflowPolicy::BLOCK});
    ASSERT_TRUE(mailbox.send(make("a")).ok());

    auto result = mailbox.send(make("b"), WaitOptions::within(30ms));
    EXPECT_EQ(result.status, DeliveryStatus::MAILBOX_FULL);
    EXPECT_EQ(mailbox.size(), 1u);
}

TEST_F(MailboxTest, BlockPolicyResumesSenderWhenSpaceFrees) {
    Mailbox mailbox(MailboxOptions{1, OverflowPolicy::BLOCK});
    ASSERT_TRUE(mailbox.send(make("a")).ok());

    SendResult result{DeliveryStatus::TIMED_OUT};
    std::thread producer([&]() { result = mailbox.send(make("b"), WaitOptions::within(5s)); });
    std::this_thread::sleep_for(20ms);

    auto first = mailbox.try_receive();
    producer.join();

    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->content(), "a");
    EXPECT_TRUE(result.ok());
    auto second = mailbox.try_receive();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->content(), "b");
}

TEST_F(MailboxTest, BlockedSenderCanBeCancelled) {
    Mailbox mailbox(MailboxOptions{1, OverflowPolicy::BLOCK});
    ASSERT_TRUE(mailbox.send(make("a")).ok());
    CancellationSource source;

    SendResult result;
    std::thread producer([&]() {
        result = mailbox.send(make("b"), WaitOptions::forever().with_cancel(source.token()));
    });
    std::this_thread::sleep_for(20ms);
    source.cancel();
    producer.join();

    EXPECT_EQ(result.status, DeliveryStatus::CANCELLED);
    EXPECT_EQ(mailbox.size(), 1u);
}

TEST_F(MailboxTest, ReceiveMatchingLeavesOthersInOrder) {
    Mailbox mailbox;
    mailbox.send(make("one"));
    mailbox.send(make("question", Performative::QUERY));
    mailbox.send(make("two"));

    auto result = mailbox.receive_matching(
        [](const Message& m) { return m.performative() == Performative::QUERY; },
        WaitOptions::within(100ms));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.message->content(), "question");

    auto rest = mailbox.drain();
    ASSERT_EQ(rest.size(), 2u);
    EXPECT_EQ(rest[0].content(), "one");
    EXPECT_EQ(rest[1].content(), "two");
}

TEST_F(MailboxTest, ReceiveMatchingWaitsPastUnrelatedTraffic) {
    Mailbox mailbox;
    ReceiveResult result;

    std::thread waiter([&]() {
        result = mailbox.receive_matching(
            [](const Message& m) { return m.content() == "target"; },
            WaitOptions::within(5s));
    });
    std::this_thread::sleep_for(10ms);
    mailbox.send(make("noise-1"));
    mailbox.send(make("noise-2"));
    std::this_thread::sleep_for(10ms);
    mailbox.send(make("target"));
    waiter.join();

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.message->content(), "target");
    EXPECT_EQ(mailbox.size(), 2u);
}

TEST_F(MailboxTest, CloseWakesReceiverAndRejectsSends) {
    Mailbox mailbox;
    ReceiveResult result;

    std::thread consumer([&]() { result = mailbox.receive(); });
    std::this_thread::sleep_for(20ms);
    mailbox.close();
    consumer.join();

    EXPECT_EQ(result.status, DeliveryStatus::CLOSED);
    EXPECT_TRUE(mailbox.is_closed());
    EXPECT_EQ(mailbox.send(make("late")).status, DeliveryStatus::CLOSED);
}

TEST_F(MailboxTest, ClosedMailboxStillHandsOutQueuedMessages) {
    Mailbox mailbox;
    mailbox.send(make("queued"));
    mailbox.close();

    auto first = mailbox.receive(WaitOptions::within(100ms));
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.message->content(), "queued");
    EXPECT_EQ(mailbox.receive(WaitOptions::within(100ms)).status, DeliveryStatus::CLOSED);
}

TEST_F(MailboxTest, ConcurrentProducersAndConsumersNoLossNoDuplication) {
    constexpr int kProducers = 4;
    constexpr int kConsumers = 4;
    constexpr int kPerProducer = 500;

    Mailbox mailbox(MailboxOptions{64, OverflowPolicy::BLOCK});
    std::mutex seen_mutex;
    std::multiset<uint64_t> seen;
    std::vector<std::vector<std::string>> per_producer(kProducers);
    std::atomic<int> received{0};

    std::vector<std::thread> consumers;
    for (int c = 0; c < kConsumers; ++c) {
        consumers.emplace_back([&]() {
            while (true) {
                auto result = mailbox.receive(WaitOptions::within(2s));
                if (!result.ok()) {
                    return;
                }
                std::lock_guard<std::mutex> lock(seen_mutex);
                seen.insert(result.message->id().value());
                received++;
            }
        });
    }

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&, p]() {
            for (int i = 0; i < kPerProducer; ++i) {
                ASSERT_TRUE(mailbox.send(make(std::to_string(p) + ":" + std::to_string(i))).ok());
            }
        });
    }
    for (auto& t : producers) t.join();

    while (received.load() < kProducers * kPerProducer) {
        std::this_thread::sleep_for(1ms);
    }
    mailbox.close();
    for (auto& t : consumers) t.join();

    EXPECT_EQ(seen.size(), static_cast<size_t>(kProducers * kPerProducer));
    std::set<uint64_t> unique(seen.begin(), seen.end());
    EXPECT_EQ(unique.size(), seen.size());
}

TEST_F(MailboxTest, SingleProducerOrderSurvivesConcurrentConsumer) {
    Mailbox mailbox;
    std::vector<std::string> received;

    std::thread consumer([&]() {
        for (int i = 0; i < 1000; ++i) {
            auto result = mailbox.receive(WaitOptions::within(5s));
            if (!result.ok()) return;
            received.push_back(result.message->content());
        }
    });
    for (int i = 0; i < 1000; ++i) {
        mailbox.send(make(std::to_string(i)));
    }
    consumer.join();

    ASSERT_EQ(received.size(), 1000u);
    for (int i = 0; i < 1000; ++i) {
        EXPECT_EQ(received[i], std::to_string(i));
    }
}

TEST(OverflowPolicyTest, ParsesNames) {
    EXPECT_EQ(overflow_policy_from_string("Reject"), OverflowPolicy::REJECT);
    EXPECT_EQ(overflow_policy_from_string("drop_oldest"), OverflowPolicy::DROP_OLDEST);
    EXPECT_EQ(overflow_policy_from_string("drop-oldest"), OverflowPolicy::DROP_OLDEST);
    EXPECT_FALSE(overflow_policy_from_string("spill").has_value());
    EXPECT_STREQ(overflow_policy_to_string(OverflowPolicy::BLOCK), "block");
}

} // namespace
