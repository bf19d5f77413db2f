// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "floorplan/document/SlotStore.hpp"

using namespace FloorPlan;

namespace {

Slot makeSlot(const QString& id, double x = 0.0, double y = 0.0)
{
    Slot slot;
    slot.id = SlotId(id);
    slot.label = id.toUpper();
    slot.x = x;
    slot.y = y;
    slot.width = 10.0;
    slot.height = 10.0;
    return slot;
}

SlotId sid(const char* id)
{
    return SlotId(QString::fromLatin1(id));
}

} // namespace

TEST(SlotStoreTests, ResetPrunesSelection)
{
    SlotStore store;
    store.resetSlots({makeSlot(QStringLiteral("a")), makeSlot(QStringLiteral("b"))});
    store.setSelection(SlotIdSet{sid("a"), sid("b"), sid("ghost")});
    EXPECT_EQ(store.selectedIds(), (SlotIdSet{sid("a"), sid("b")}));

    store.resetSlots({makeSlot(QStringLiteral("b"))});
    EXPECT_EQ(store.selectedIds(), SlotIdSet{sid("b")});
    EXPECT_EQ(store.selection().selectedSlot(), sid("b"));
}

TEST(SlotStoreTests, ApplyPatchChangesOneSlot)
{
    SlotStore store;
    store.resetSlots({makeSlot(QStringLiteral("a"), 1, 1), makeSlot(QStringLiteral("b"), 2, 2)});

    QVector<SlotId> changed;
    QObject::connect(&store, &SlotStore::slotChanged, &store,
                     [&changed](const SlotId& id) { changed.push_back(id); });

    EXPECT_TRUE(store.applyPatch(sid("b"), SlotPatch::moveTo(QPointF(20, 30))));
    EXPECT_EQ(store.findSlot(sid("b"))->topLeft(), QPointF(20, 30));
    EXPECT_EQ(store.findSlot(sid("a"))->topLeft(), QPointF(1, 1));
    EXPECT_EQ(changed, QVector<SlotId>{sid("b")});

    EXPECT_FALSE(store.applyPatch(sid("missing"), SlotPatch::moveTo(QPointF())));
}

TEST(SlotStoreTests, RemoveAndRestoreKeepIndexAndSelection)
{
    SlotStore store;
    store.resetSlots({makeSlot(QStringLiteral("a")), makeSlot(QStringLiteral("b")), makeSlot(QStringLiteral("c"))});
    store.setSelection(SlotIdSet{sid("b")});

    const std::optional<RemovedSlot> removed = store.removeSlot(sid("b"));
    ASSERT_TRUE(removed.has_value());
    EXPECT_TRUE(removed->wasSelected);
    EXPECT_FALSE(store.contains(sid("b")));
    EXPECT_TRUE(store.selectedIds().isEmpty());

    store.restoreSlot(*removed);
    EXPECT_EQ(store.indexOf(sid("b")), 1);
    EXPECT_EQ(store.selectedIds(), SlotIdSet{sid("b")});
    EXPECT_EQ(*store.findSlot(sid("b")), removed->slot);
}

TEST(SlotStoreTests, AppendAddsAtEndAndExistingReplaces)
{
    SlotStore store;
    store.resetSlots({makeSlot(QStringLiteral("a"))});

    store.appendSlot(makeSlot(QStringLiteral("b")));
    EXPECT_EQ(store.indexOf(sid("b")), 1);

    store.appendSlot(makeSlot(QStringLiteral("b"), 9, 9));
    EXPECT_EQ(store.size(), 2);
    EXPECT_EQ(store.indexOf(sid("b")), 1);
    EXPECT_EQ(store.findSlot(sid("b"))->topLeft(), QPointF(9, 9));

    store.appendSlot(Slot{});
    EXPECT_EQ(store.size(), 2);
}

TEST(SlotStoreTests, RestoresReturnToOriginalOrderInAnySequence)
{
    const SlotList original{makeSlot(QStringLiteral("a")), makeSlot(QStringLiteral("b")),
                            makeSlot(QStringLiteral("c")), makeSlot(QStringLiteral("d"))};

    SlotStore store;
    store.resetSlots(original);
    const RemovedSlot b = *store.removeSlot(sid("b"));
    const RemovedSlot c = *store.removeSlot(sid("c"));
    store.restoreSlot(b);
    store.restoreSlot(c);
    EXPECT_EQ(store.slots(), original);

    store.resetSlots(original);
    const RemovedSlot a = *store.removeSlot(sid("a"));
    const RemovedSlot b2 = *store.removeSlot(sid("b"));
    store.restoreSlot(a);
    EXPECT_EQ(store.indexOf(sid("a")), 0);
    store.restoreSlot(b2);
    EXPECT_EQ(store.slots(), original);
}

TEST(SlotStoreTests, RestoreAfterNeighbourIsGoneKeepsRelativeOrder)
{
    SlotStore store;
    store.resetSlots({makeSlot(QStringLiteral("a")), makeSlot(QStringLiteral("b")), makeSlot(QStringLiteral("c"))});

    const RemovedSlot b = *store.removeSlot(sid("b"));
    ASSERT_TRUE(store.removeSlot(sid("a")).has_value());
    store.appendSlot(makeSlot(QStringLiteral("e")));

    store.restoreSlot(b);
    ASSERT_EQ(store.size(), 3);
    EXPECT_EQ(store.indexOf(sid("b")), 0);
    EXPECT_EQ(store.indexOf(sid("c")), 1);
    EXPECT_EQ(store.indexOf(sid("e")), 2);
}

TEST(SlotStoreTests, SelectionModelSignalsSingleSelection)
{
    SlotStore store;
    store.resetSlots({makeSlot(QStringLiteral("a")), makeSlot(QStringLiteral("b"))});

    QVector<SlotId> primary;
    QObject::connect(&store.selection(), &SlotSelectionModel::selectedSlotChanged, &store,
                     [&primary](const SlotId& id) { primary.push_back(id); });

    store.selection().setSelectedSlot(sid("a"));
    store.selection().addSelectedSlot(sid("b"));
    EXPECT_FALSE(store.selection().selectedSlot().isValid());
    store.selection().clearSelectedSlots();

    ASSERT_EQ(primary.size(), 2);
    EXPECT_EQ(primary.at(0), sid("a"));
    EXPECT_FALSE(primary.at(1).isValid());
}
