#include <QtTest/QtTest>

#include <QThread>

#include <memory>
#include <vector>

#include "core/trigger_channel.hpp"

using auditray::TriggerChannel;
using auditray::TriggerEvent;

class TriggerChannelTests : public QObject
{
    Q_OBJECT
private slots:
    void testReceiveInSendOrder();
    void testDrainDiscardsQueuedEvents();
    void testTryReceiveOnEmptyChannel();
    void testCloseWakesBlockedReceiver();
    void testSendAfterCloseIsIgnored();
    void testConcurrentProducersLoseNothing();
};

void TriggerChannelTests::testReceiveInSendOrder()
{
    TriggerChannel channel;
    channel.send(TriggerEvent::FileChanged);
    channel.send(TriggerEvent::UserClick);
    channel.send(TriggerEvent::Startup);

    QCOMPARE(channel.pending(), static_cast<size_t>(3));
    QCOMPARE(*channel.receive(), TriggerEvent::FileChanged);
    QCOMPARE(*channel.receive(), TriggerEvent::UserClick);
    QCOMPARE(*channel.receive(), TriggerEvent::Startup);
    QCOMPARE(channel.pending(), static_cast<size_t>(0));
}

void TriggerChannelTests::testDrainDiscardsQueuedEvents()
{
    TriggerChannel channel;
    QCOMPARE(channel.drain(), static_cast<size_t>(0));

    channel.send(TriggerEvent::FileChanged);
    channel.send(TriggerEvent::FileChanged);
    channel.send(TriggerEvent::UserClick);

    QCOMPARE(channel.drain(), static_cast<size_t>(3));
    QCOMPARE(channel.pending(), static_cast<size_t>(0));
    QVERIFY(!channel.tryReceive().has_value());
}

void TriggerChannelTests::testTryReceiveOnEmptyChannel()
{
    TriggerChannel channel;
    QVERIFY(!channel.tryReceive().has_value());

    channel.send(TriggerEvent::UserClick);
    const auto event = channel.tryReceive();
    QVERIFY(event.has_value());
    QCOMPARE(*event, TriggerEvent::UserClick);
}

void TriggerChannelTests::testCloseWakesBlockedReceiver()
{
    TriggerChannel channel;
    bool gotNothing = false;

    std::unique_ptr<QThread> consumer(QThread::create([&channel, &gotNothing]() {
        gotNothing = !channel.receive().has_value();
    }));
    consumer->start();

    QTest::qWait(50);
    QVERIFY(consumer->isRunning());

    channel.close();
    QVERIFY(consumer->wait(5000));
    QVERIFY(gotNothing);
    QVERIFY(channel.isClosed());
}

void TriggerChannelTests::testSendAfterCloseIsIgnored()
{
    TriggerChannel channel;
    channel.close();
    channel.send(TriggerEvent::FileChanged);

    QCOMPARE(channel.pending(), static_cast<size_t>(0));
    QVERIFY(!channel.receive().has_value());
}

void TriggerChannelTests::testConcurrentProducersLoseNothing()
{
    TriggerChannel channel;
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 500;

    std::vector<std::unique_ptr<QThread>> producers;
    for (int p = 0; p < kProducers; ++p) {
        const TriggerEvent kind =
            (p % 2 == 0) ? TriggerEvent::FileChanged : TriggerEvent::UserClick;
        producers.emplace_back(QThread::create([&channel, kind]() {
            for (int i = 0; i < kPerProducer; ++i) {
                channel.send(kind);
            }
        }));
        producers.back()->start();
    }

    int received = 0;
    while (received < kProducers * kPerProducer) {
        QVERIFY(channel.receive().has_value());
        ++received;
    }

    for (auto &producer : producers) {
        QVERIFY(producer->wait(5000));
    }
    QCOMPARE(channel.pending(), static_cast<size_t>(0));
}

QTEST_MAIN(TriggerChannelTests)
#include "test_trigger_channel.moc"
