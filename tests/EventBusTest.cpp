#include "EventBus.h"
#include "TestUtil.h"

#include <atomic>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <gtest/gtest.h>

namespace EdgeSync {

namespace {

Event TransferEvent(EventType t, unsigned job)
{
    Event e(t, 1, "D1");
    e.JobId = job;
    return e;
}

};                                      // end anonymous namespace

TEST(EventBusTest, DeliversEventsInPublishOrder)
{
    EventBus bus;
    EdgeSync::Test::EventRecorder recorder(bus);

    for (unsigned i = 1; i <= 100; ++i)
        bus.Publish(TransferEvent(EV_TRANSFER_PROGRESS, i));

    std::vector<Event> events = recorder.Events();
    ASSERT_EQ(100u, events.size());
    for (unsigned i = 0; i < events.size(); ++i)
        EXPECT_EQ(i + 1, events[i].JobId);
}

TEST(EventBusTest, SubscribersOnlySeeLaterEvents)
{
    EventBus bus;
    EdgeSync::Test::EventRecorder first(bus);
    bus.Publish(TransferEvent(EV_TRANSFER_QUEUED, 1));
    EdgeSync::Test::EventRecorder second(bus);
    bus.Publish(TransferEvent(EV_TRANSFER_COMPLETE, 1));

    EXPECT_EQ(2u, first.Events().size());
    std::vector<Event> late = second.Events();
    ASSERT_EQ(1u, late.size());
    EXPECT_EQ(EV_TRANSFER_COMPLETE, late[0].Type);
}

TEST(EventBusTest, UnsubscribedHandlerIsNotCalled)
{
    EventBus bus;
    std::atomic<unsigned> calls(0);
    unsigned id = bus.Subscribe([&calls](const Event &) { calls++; });

    bus.Publish(TransferEvent(EV_TRANSFER_QUEUED, 1));
    bus.WaitIdle();
    bus.Unsubscribe(id);
    bus.Publish(TransferEvent(EV_TRANSFER_QUEUED, 2));
    bus.WaitIdle();
    EXPECT_EQ(1u, calls.load());
}

TEST(EventBusTest, ThrowingHandlerDoesNotStopDelivery)
{
    std::ostringstream log;
    EventBus bus(&log);
    bus.Subscribe([](const Event &) { throw std::runtime_error("handler broke"); });
    EdgeSync::Test::EventRecorder recorder(bus);

    bus.Publish(TransferEvent(EV_TRANSFER_QUEUED, 1));
    bus.Publish(TransferEvent(EV_TRANSFER_COMPLETE, 1));

    EXPECT_EQ(2u, recorder.Events().size());
    EXPECT_NE(std::string::npos, log.str().find("handler broke"));
}

TEST(EventBusTest, HandlerCanUnsubscribeItself)
{
    EventBus bus;
    std::atomic<unsigned> calls(0);
    unsigned id = 0;
    id = bus.Subscribe([&](const Event &) {
            calls++;
            bus.Unsubscribe(id);
        });
    bus.Publish(TransferEvent(EV_TRANSFER_QUEUED, 1));
    bus.Publish(TransferEvent(EV_TRANSFER_QUEUED, 2));
    bus.WaitIdle();
    EXPECT_EQ(1u, calls.load());
}

TEST(EventBusTest, SlowHandlerDoesNotBlockPublishers)
{
    EventBus bus;
    std::atomic<unsigned> calls(0);
    bus.Subscribe([&calls](const Event &) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            calls++;
        });

    auto start = std::chrono::steady_clock::now();
    for (unsigned i = 0; i < 10; ++i)
        bus.Publish(TransferEvent(EV_TRANSFER_PROGRESS, i));
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_LT(elapsed, std::chrono::milliseconds(100));

    bus.WaitIdle();
    EXPECT_EQ(10u, calls.load());
}

TEST(EventBusTest, EventsPublishedFromSeveralThreadsAllArrive)
{
    EventBus bus;
    EdgeSync::Test::EventRecorder recorder(bus);

    std::vector<std::thread> publishers;
    for (unsigned t = 0; t < 4; ++t) {
        publishers.push_back(std::thread([&bus, t]() {
                    for (unsigned i = 0; i < 50; ++i)
                        bus.Publish(TransferEvent(EV_TRANSFER_PROGRESS, t * 1000 + i));
                }));
    }
    for (auto i = publishers.begin(); i != publishers.end(); ++i)
        i->join();

    std::vector<Event> events = recorder.Events();
    ASSERT_EQ(200u, events.size());

    // Each publisher's events arrive in the order it published them
    std::vector<int> last(4, -1);
    for (auto e = events.begin(); e != events.end(); ++e) {
        unsigned t = e->JobId / 1000;
        int i = e->JobId % 1000;
        EXPECT_GT(i, last[t]);
        last[t] = i;
    }
}

TEST(EventBusTest, EventsAreDescribedForLogging)
{
    Event e(EV_STATE_CHANGED, 3, "AA:BB:CC:DD:EE:FF");
    e.State = SS_READY;
    std::ostringstream o;
    o << e;
    EXPECT_EQ("StateChanged session 3 (AA:BB:CC:DD:EE:FF): Ready", o.str());
}

};                                      // end namespace EdgeSync
