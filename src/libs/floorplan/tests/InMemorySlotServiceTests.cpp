// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "floorplan/service/InMemorySlotService.hpp"
#include "floorplan/service/SampleVenue.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QElapsedTimer>

#include <functional>

using namespace FloorPlan;
using Service::InMemorySlotService;
using Service::SlotOperation;

namespace {

QCoreApplication* ensureCoreApp()
{
    if (auto* existing = QCoreApplication::instance())
        return existing;

    static int argc = 1;
    static char appName[] = "FloorPlanTests";
    static char* argv[] = {appName, nullptr};
    static QCoreApplication app(argc, argv);
    return &app;
}

bool waitUntil(const std::function<bool()>& done, int timeoutMs = 2000)
{
    QElapsedTimer timer;
    timer.start();
    while (!done() && timer.elapsed() < timeoutMs)
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
    return done();
}

const QString kVenue = QStringLiteral("venue-1");

Slot makeSlot(const QString& id, const QString& zone)
{
    Slot slot;
    slot.id = SlotId(id);
    slot.label = id;
    slot.zone = zone;
    slot.width = 40.0;
    slot.height = 40.0;
    return slot;
}

} // namespace

TEST(InMemorySlotServiceTests, RepliesAreAsynchronous)
{
    ensureCoreApp();
    InMemorySlotService service;
    service.setLatencyMs(0);
    service.seedSlots(kVenue, {makeSlot(QStringLiteral("a"), QStringLiteral("Main"))});

    std::optional<Api::ListSlotsReply> reply;
    service.listSlots(kVenue, SlotFilters{}, [&reply](Api::ListSlotsReply r) { reply = std::move(r); });
    EXPECT_FALSE(reply.has_value());

    ASSERT_TRUE(waitUntil([&reply] { return reply.has_value(); }));
    ASSERT_TRUE(reply->ok());
    EXPECT_EQ(reply->value().size(), 1);
}

TEST(InMemorySlotServiceTests, ListFiltersByZone)
{
    ensureCoreApp();
    InMemorySlotService service;
    service.setLatencyMs(0);
    service.seedSlots(kVenue, {makeSlot(QStringLiteral("a"), QStringLiteral("Main")),
                               makeSlot(QStringLiteral("b"), QStringLiteral("Patio")),
                               makeSlot(QStringLiteral("c"), QStringLiteral("Main"))});

    std::optional<Api::ListSlotsReply> main;
    std::optional<Api::ListSlotsReply> all;
    service.listSlots(kVenue, SlotFilters{QStringLiteral("Main")}, [&main](Api::ListSlotsReply r) { main = std::move(r); });
    service.listSlots(kVenue, SlotFilters{QStringLiteral("__ALL__")}, [&all](Api::ListSlotsReply r) { all = std::move(r); });

    ASSERT_TRUE(waitUntil([&] { return main.has_value() && all.has_value(); }));
    EXPECT_EQ(main->value().size(), 2);
    EXPECT_EQ(all->value().size(), 3);
    EXPECT_EQ(service.requestCount(SlotOperation::List), 2);
}

TEST(InMemorySlotServiceTests, CreateAssignsIdAndStores)
{
    ensureCoreApp();
    InMemorySlotService service;
    service.setLatencyMs(0);

    SlotDraft draft;
    draft.label = QStringLiteral("T1");
    draft.zone = QStringLiteral("Main");
    draft.width = 80.0;
    draft.height = 80.0;

    std::optional<Api::SlotReply> reply;
    service.createSlot(kVenue, draft, [&reply](Api::SlotReply r) { reply = std::move(r); });
    ASSERT_TRUE(waitUntil([&reply] { return reply.has_value(); }));
    ASSERT_TRUE(reply->ok());

    const Slot created = reply->value();
    EXPECT_TRUE(created.id.isValid());
    EXPECT_EQ(created.label, QStringLiteral("T1"));
    ASSERT_NE(service.storedSlot(kVenue, created.id), nullptr);
}

TEST(InMemorySlotServiceTests, UpdateValidatesAndReportsUnknownIds)
{
    ensureCoreApp();
    InMemorySlotService service;
    service.setLatencyMs(0);
    service.seedSlots(kVenue, {makeSlot(QStringLiteral("a"), QStringLiteral("Main"))});

    SlotPatch bad;
    bad.width = -1.0;

    std::optional<Api::SlotReply> invalid;
    std::optional<Api::SlotReply> missing;
    std::optional<Api::SlotReply> good;
    service.updateSlot(kVenue, SlotId(QStringLiteral("a")), bad, [&invalid](Api::SlotReply r) { invalid = std::move(r); });
    service.updateSlot(kVenue, SlotId(QStringLiteral("zzz")), SlotPatch::moveTo(QPointF(1, 1)),
                       [&missing](Api::SlotReply r) { missing = std::move(r); });
    service.updateSlot(kVenue, SlotId(QStringLiteral("a")), SlotPatch::moveTo(QPointF(7, 8)),
                       [&good](Api::SlotReply r) { good = std::move(r); });

    ASSERT_TRUE(waitUntil([&] { return invalid && missing && good; }));
    EXPECT_EQ(invalid->error().code(), Api::SlotServiceErrorCode::Validation);
    EXPECT_EQ(missing->error().code(), Api::SlotServiceErrorCode::NotFound);
    ASSERT_TRUE(good->ok());
    EXPECT_EQ(good->value().topLeft(), QPointF(7, 8));
    EXPECT_EQ(service.receivedUpdates().size(), 3);
}

TEST(InMemorySlotServiceTests, InjectedFailuresAreConsumedInOrder)
{
    ensureCoreApp();
    InMemorySlotService service;
    service.setLatencyMs(0);
    service.seedSlots(kVenue, {makeSlot(QStringLiteral("a"), QStringLiteral("Main"))});
    service.failNext(SlotOperation::Delete,
                     Api::SlotServiceError(Api::SlotServiceErrorCode::Transport, QStringLiteral("offline")));

    std::optional<Api::SlotServiceError> first;
    std::optional<Api::SlotServiceError> second;
    service.deleteSlot(kVenue, SlotId(QStringLiteral("a")), [&first](Api::SlotServiceError e) { first = e; });
    service.deleteSlot(kVenue, SlotId(QStringLiteral("a")), [&second](Api::SlotServiceError e) { second = e; });

    ASSERT_TRUE(waitUntil([&] { return first && second; }));
    EXPECT_EQ(first->code(), Api::SlotServiceErrorCode::Transport);
    EXPECT_EQ(first->message(), QStringLiteral("offline"));
    EXPECT_TRUE(second->ok());
    EXPECT_TRUE(service.storedSlots(kVenue).isEmpty());
}

TEST(InMemorySlotServiceTests, SeedingAssignsMissingIds)
{
    InMemorySlotService service;
    service.seedSlots(kVenue, Service::sampleVenueSlots());

    const SlotList stored = service.storedSlots(kVenue);
    ASSERT_FALSE(stored.isEmpty());
    SlotIdSet ids;
    for (const Slot& slot : stored) {
        EXPECT_TRUE(slot.id.isValid());
        ids.insert(slot.id);
    }
    EXPECT_EQ(ids.size(), stored.size());
}
