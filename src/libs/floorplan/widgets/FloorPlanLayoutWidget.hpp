// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "floorplan/FloorPlanGlobal.hpp"

#include <QtCore/QPointer>
#include <QtWidgets/QWidget>

QT_BEGIN_NAMESPACE
class QComboBox;
class QLabel;
class QPushButton;
class QStackedWidget;
QT_END_NAMESPACE

namespace FloorPlan {

class FloorPlanLayoutController;
class FloorPlanView;
class SlotInspectorPanel;

// Zone picker and add button on top, canvas and inspector below. Replaced by
// a retry page when the initial fetch fails.
class FLOORPLAN_EXPORT FloorPlanLayoutWidget final : public QWidget
{
    Q_OBJECT

public:
    explicit FloorPlanLayoutWidget(FloorPlanLayoutController* controller, QWidget* parent = nullptr);
    ~FloorPlanLayoutWidget() override;

    FloorPlanView* view() const noexcept { return m_view; }
    SlotInspectorPanel* inspector() const noexcept { return m_inspector; }

    void setViewportPadding(double padding) { m_viewportPadding = padding; }

    // Ask before an inspector delete reaches the controller. On by default.
    bool confirmDeletes() const noexcept { return m_confirmDeletes; }
    void setConfirmDeletes(bool enabled) { m_confirmDeletes = enabled; }

private:
    void buildUi();
    void wireController();
    void syncLoadState();
    void syncZones();
    void syncSlots();
    void syncSelection();
    void syncActionError();
    void syncStatusMessage();
    bool confirmDelete(const QString& slotName);

    QPointer<FloorPlanLayoutController> m_controller;
    double m_viewportPadding = 0.0;
    bool m_fitPending = true;
    bool m_confirmDeletes = true;

    QComboBox* m_zonePicker = nullptr;
    QPushButton* m_addSlot = nullptr;
    QLabel* m_actionError = nullptr;
    QLabel* m_statusMessage = nullptr;
    QStackedWidget* m_stack = nullptr;
    QLabel* m_loadingLabel = nullptr;
    QWidget* m_errorPage = nullptr;
    QLabel* m_errorLabel = nullptr;
    QPushButton* m_retry = nullptr;
    QWidget* m_editorPage = nullptr;
    FloorPlanView* m_view = nullptr;
    SlotInspectorPanel* m_inspector = nullptr;
};

} // namespace FloorPlan
