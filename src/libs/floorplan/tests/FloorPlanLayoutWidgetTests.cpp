// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "floorplan/controllers/FloorPlanLayoutController.hpp"
#include "floorplan/document/SlotStore.hpp"
#include "floorplan/persistence/SlotPersistenceManager.hpp"
#include "floorplan/service/InMemorySlotService.hpp"
#include "floorplan/widgets/FloorPlanLayoutWidget.hpp"
#include "floorplan/widgets/SlotInspectorPanel.hpp"

#include <utils/ui/ConfirmationDialog.hpp>

#include <QtCore/QElapsedTimer>
#include <QtCore/QTimer>
#include <QtWidgets/QApplication>
#include <QtWidgets/QLabel>
#include <QtWidgets/QPushButton>

#include <functional>

using namespace FloorPlan;
using Service::InMemorySlotService;
using Service::SlotOperation;

namespace {

QApplication* ensureApp()
{
    if (auto* existing = qobject_cast<QApplication*>(QCoreApplication::instance()))
        return existing;

    static int argc = 1;
    static char appName[] = "FloorPlanWidgetTests";
    static char* argv[] = {appName, nullptr};
    static QApplication app(argc, argv);
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

void whenDialogShown(const std::function<void(Utils::ConfirmationDialog*)>& act)
{
    auto* timer = new QTimer(qApp);
    timer->setInterval(10);
    QObject::connect(timer, &QTimer::timeout, timer, [timer, act]() {
        for (QWidget* w : QApplication::topLevelWidgets()) {
            auto* dialog = qobject_cast<Utils::ConfirmationDialog*>(w);
            if (dialog && dialog->isVisible()) {
                timer->stop();
                timer->deleteLater();
                act(dialog);
                return;
            }
        }
    });
    timer->start();
}

const QString kVenue = QStringLiteral("venue-1");

SlotId sid(const char* id)
{
    return SlotId(QString::fromLatin1(id));
}

Slot makeSlot(const QString& id, double x)
{
    Slot slot;
    slot.id = SlotId(id);
    slot.label = id.toUpper();
    slot.zone = QStringLiteral("Main");
    slot.x = x;
    slot.y = 10.0;
    slot.width = 40.0;
    slot.height = 40.0;
    return slot;
}

struct Harness {
    InMemorySlotService service;
    FloorPlanLayoutController controller{&service};
    FloorPlanLayoutWidget widget{&controller};

    Harness()
    {
        ensureApp();
        service.setLatencyMs(0);
        service.seedSlots(kVenue, {makeSlot(QStringLiteral("t1"), 10), makeSlot(QStringLiteral("t2"), 100)});
        controller.setVenueId(kVenue);
    }

    bool ready()
    {
        return waitUntil([this] { return controller.loadState() == LoadState::Ready; });
    }

    bool settle()
    {
        return waitUntil([this] { return controller.persistence().isIdle(); });
    }
};

} // namespace

TEST(FloorPlanLayoutWidgetTests, CancelledDeleteKeepsSlot)
{
    ensureApp();
    Harness h;
    ASSERT_TRUE(h.ready());
    EXPECT_TRUE(h.widget.confirmDeletes());

    QString asked;
    whenDialogShown([&asked](Utils::ConfirmationDialog* dialog) {
        asked = dialog->message();
        dialog->cancelButton()->click();
    });
    emit h.widget.inspector()->deleteRequested(sid("t1"));

    EXPECT_EQ(asked, QStringLiteral("Are you sure you want to delete slot T1?"));
    EXPECT_TRUE(h.controller.store().contains(sid("t1")));
    EXPECT_EQ(h.service.requestCount(SlotOperation::Delete), 0);
}

TEST(FloorPlanLayoutWidgetTests, ConfirmedDeleteRemovesSlot)
{
    ensureApp();
    Harness h;
    ASSERT_TRUE(h.ready());

    whenDialogShown([](Utils::ConfirmationDialog* dialog) {
        EXPECT_TRUE(dialog->isDestructive());
        dialog->confirmButton()->click();
    });
    emit h.widget.inspector()->deleteRequested(sid("t1"));

    EXPECT_FALSE(h.controller.store().contains(sid("t1")));
    ASSERT_TRUE(h.settle());
    EXPECT_EQ(h.service.storedSlot(kVenue, sid("t1")), nullptr);

    auto* status = h.widget.findChild<QLabel*>(QStringLiteral("FloorPlanStatusMessage"));
    ASSERT_NE(status, nullptr);
    EXPECT_EQ(status->text(), QStringLiteral("Slot \"T1\" deleted successfully."));
    EXPECT_FALSE(status->isHidden());
}

TEST(FloorPlanLayoutWidgetTests, DisabledConfirmationDeletesImmediately)
{
    ensureApp();
    Harness h;
    ASSERT_TRUE(h.ready());

    h.widget.setConfirmDeletes(false);
    emit h.widget.inspector()->deleteRequested(sid("t2"));

    EXPECT_FALSE(h.controller.store().contains(sid("t2")));
    EXPECT_EQ(h.service.requestCount(SlotOperation::Delete), 1);
    ASSERT_TRUE(h.settle());
    EXPECT_EQ(h.controller.store().size(), 1);
}
