// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "floorplan/widgets/FloorPlanLayoutWidget.hpp"

#include "floorplan/FloorPlanConstants.hpp"
#include "floorplan/controllers/FloorPlanLayoutController.hpp"
#include "floorplan/document/SlotStore.hpp"
#include "floorplan/persistence/SlotPersistenceManager.hpp"
#include "floorplan/widgets/FloorPlanView.hpp"
#include "floorplan/widgets/SlotInspectorPanel.hpp"

#include <utils/ui/ConfirmationDialog.hpp>

#include <QtWidgets/QComboBox>
#include <QtWidgets/QHBoxLayout>
#include <QtWidgets/QLabel>
#include <QtWidgets/QPushButton>
#include <QtWidgets/QSplitter>
#include <QtWidgets/QStackedWidget>
#include <QtWidgets/QVBoxLayout>

#include <algorithm>

namespace FloorPlan {

namespace {

QString zoneDisplayName(const QString& zone)
{
    return isAllZones(zone) ? QObject::tr("All Zones") : zone;
}

} // namespace

FloorPlanLayoutWidget::FloorPlanLayoutWidget(FloorPlanLayoutController* controller, QWidget* parent)
    : QWidget(parent)
    , m_controller(controller)
    , m_viewportPadding(Constants::kDefaultViewportPadding)
{
    setObjectName(QStringLiteral("FloorPlanLayoutWidget"));
    buildUi();
    wireController();

    syncZones();
    syncSlots();
    syncSelection();
    syncLoadState();
    syncActionError();
    syncStatusMessage();
}

FloorPlanLayoutWidget::~FloorPlanLayoutWidget() = default;

void FloorPlanLayoutWidget::buildUi()
{
    auto* root = new QVBoxLayout(this);
    root->setContentsMargins(0, 0, 0, 0);
    root->setSpacing(0);

    auto* toolbar = new QHBoxLayout();
    toolbar->setContentsMargins(8, 8, 8, 8);
    toolbar->setSpacing(8);
    toolbar->addWidget(new QLabel(tr("Zone"), this));
    m_zonePicker = new QComboBox(this);
    m_zonePicker->setMinimumContentsLength(16);
    toolbar->addWidget(m_zonePicker);
    toolbar->addStretch(1);
    m_addSlot = new QPushButton(tr("Add Slot"), this);
    toolbar->addWidget(m_addSlot);
    root->addLayout(toolbar);

    m_actionError = new QLabel(this);
    m_actionError->setWordWrap(true);
    m_actionError->setContentsMargins(8, 4, 8, 4);
    m_actionError->setStyleSheet(QStringLiteral("background: #fee2e2; color: #991b1b;"));
    m_actionError->setVisible(false);
    root->addWidget(m_actionError);

    m_statusMessage = new QLabel(this);
    m_statusMessage->setObjectName(QStringLiteral("FloorPlanStatusMessage"));
    m_statusMessage->setWordWrap(true);
    m_statusMessage->setContentsMargins(8, 4, 8, 4);
    m_statusMessage->setStyleSheet(QStringLiteral("background: #dcfce7; color: #166534;"));
    m_statusMessage->setVisible(false);
    root->addWidget(m_statusMessage);

    m_stack = new QStackedWidget(this);

    m_loadingLabel = new QLabel(tr("Loading slots..."), m_stack);
    m_loadingLabel->setAlignment(Qt::AlignCenter);
    m_stack->addWidget(m_loadingLabel);

    m_errorPage = new QWidget(m_stack);
    auto* errorLayout = new QVBoxLayout(m_errorPage);
    errorLayout->addStretch(1);
    m_errorLabel = new QLabel(m_errorPage);
    m_errorLabel->setAlignment(Qt::AlignCenter);
    m_errorLabel->setWordWrap(true);
    errorLayout->addWidget(m_errorLabel);
    m_retry = new QPushButton(tr("Retry"), m_errorPage);
    errorLayout->addWidget(m_retry, 0, Qt::AlignHCenter);
    errorLayout->addStretch(1);
    m_stack->addWidget(m_errorPage);

    auto* splitter = new QSplitter(Qt::Horizontal, m_stack);
    m_view = new FloorPlanView(splitter);
    m_inspector = new SlotInspectorPanel(splitter);
    splitter->addWidget(m_view);
    splitter->addWidget(m_inspector);
    splitter->setStretchFactor(0, 1);
    splitter->setStretchFactor(1, 0);
    m_editorPage = splitter;
    m_stack->addWidget(m_editorPage);

    root->addWidget(m_stack, 1);
}

void FloorPlanLayoutWidget::wireController()
{
    if (!m_controller)
        return;

    FloorPlanLayoutController* c = m_controller;
    SlotStore* store = &c->store();

    connect(c, &FloorPlanLayoutController::loadStateChanged, this, &FloorPlanLayoutWidget::syncLoadState);
    connect(c, &FloorPlanLayoutController::zonesChanged, this, &FloorPlanLayoutWidget::syncZones);
    connect(c, &FloorPlanLayoutController::zoneFilterChanged, this, &FloorPlanLayoutWidget::syncZones);
    connect(c, &FloorPlanLayoutController::actionErrorChanged, this, &FloorPlanLayoutWidget::syncActionError);
    connect(c, &FloorPlanLayoutController::statusMessageChanged, this, &FloorPlanLayoutWidget::syncStatusMessage);
    connect(c, &FloorPlanLayoutController::previewChanged, this, &FloorPlanLayoutWidget::syncSlots);
    connect(c, &FloorPlanLayoutController::slotsLoaded, this, [this]() { m_fitPending = true; syncSlots(); });
    connect(store, &SlotStore::slotsChanged, this, &FloorPlanLayoutWidget::syncSlots);
    connect(store, &SlotStore::selectionChanged, this, &FloorPlanLayoutWidget::syncSelection);
    connect(&c->persistence(), &SlotPersistenceManager::busyChanged, m_inspector, &SlotInspectorPanel::setBusy);

    connect(m_view, &FloorPlanView::selectSlotRequested, c, &FloorPlanLayoutController::selectSlot);
    connect(m_view, &FloorPlanView::itemMoved, c, &FloorPlanLayoutController::moveSlot);
    connect(m_view, &FloorPlanView::itemTransformed, c, &FloorPlanLayoutController::transformSlot);

    connect(m_inspector, &SlotInspectorPanel::previewRequested, c, &FloorPlanLayoutController::previewSlotFields);
    connect(m_inspector, &SlotInspectorPanel::previewCleared, c, &FloorPlanLayoutController::clearPreview);
    connect(m_inspector, &SlotInspectorPanel::saveRequested, this, [this](const SlotId& id, const SlotPatch& patch) {
        if (m_controller)
            m_controller->saveSlotFields(id, patch);
    });
    connect(m_inspector, &SlotInspectorPanel::deleteRequested, this, [this](const SlotId& id) {
        if (!m_controller)
            return;
        const Slot* slot = m_controller->store().findSlot(id);
        const QString name = slot ? slot->displayName() : id.value();
        if (!m_confirmDeletes || confirmDelete(name))
            m_controller->deleteSlot(id);
    });

    connect(m_addSlot, &QPushButton::clicked, this, [this]() {
        if (m_controller)
            m_controller->addSlot();
    });
    connect(m_retry, &QPushButton::clicked, c, &FloorPlanLayoutController::reload);
    connect(m_zonePicker, &QComboBox::activated, this, [this](int index) {
        if (m_controller)
            m_controller->setZoneFilter(m_zonePicker->itemData(index).toString());
    });
}

void FloorPlanLayoutWidget::syncLoadState()
{
    if (!m_controller)
        return;

    switch (m_controller->loadState()) {
        case LoadState::Idle:
        case LoadState::Ready:
            m_stack->setCurrentWidget(m_editorPage);
            break;
        case LoadState::Loading:
            // Keep the canvas up during refetches once something is shown.
            if (m_controller->store().isEmpty())
                m_stack->setCurrentWidget(m_loadingLabel);
            break;
        case LoadState::Failed:
            m_errorLabel->setText(m_controller->loadError());
            m_stack->setCurrentWidget(m_errorPage);
            break;
    }
    m_addSlot->setEnabled(m_controller->loadState() == LoadState::Ready);
}

void FloorPlanLayoutWidget::syncZones()
{
    if (!m_controller)
        return;

    const QStringList zones = m_controller->zones();
    const QString filter = m_controller->zoneFilter();

    m_zonePicker->clear();
    for (const QString& zone : zones)
        m_zonePicker->addItem(zoneDisplayName(zone), zone);

    const QString key = filter.isEmpty() ? QString::fromLatin1(Constants::kAllZones) : filter;
    m_zonePicker->setCurrentIndex(std::max(0, m_zonePicker->findData(key)));
    m_inspector->setZones(zones);
}

void FloorPlanLayoutWidget::syncSlots()
{
    if (!m_controller)
        return;

    m_view->setSlots(m_controller->displayedSlots());
    if (m_fitPending && m_controller->loadState() == LoadState::Ready) {
        m_view->fitToSlots(m_viewportPadding);
        m_fitPending = false;
    }
    m_inspector->setSlot(m_controller->primarySelectedSlot());
}

void FloorPlanLayoutWidget::syncSelection()
{
    if (!m_controller)
        return;

    m_view->setSelectedSlotIds(m_controller->store().selectedIds());
    m_inspector->setSlot(m_controller->primarySelectedSlot());
}

void FloorPlanLayoutWidget::syncActionError()
{
    if (!m_controller)
        return;
    const QString& message = m_controller->actionError();
    m_actionError->setText(message);
    m_actionError->setVisible(!message.isEmpty());
}

void FloorPlanLayoutWidget::syncStatusMessage()
{
    if (!m_controller)
        return;
    const QString& message = m_controller->statusMessage();
    m_statusMessage->setText(message);
    m_statusMessage->setVisible(!message.isEmpty());
}

bool FloorPlanLayoutWidget::confirmDelete(const QString& slotName)
{
    Utils::ConfirmationDialogConfig cfg;
    cfg.title = tr("Delete Slot");
    cfg.message = tr("Are you sure you want to delete slot %1?").arg(slotName);
    cfg.confirmText = tr("Delete");
    cfg.cancelText = tr("Cancel");
    cfg.destructive = true;
    return Utils::ConfirmationDialog::confirm(this, cfg);
}

} // namespace FloorPlan
